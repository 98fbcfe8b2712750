#include "paraclient/bytes.hpp"

#include <sodium.h>

#include "paraclient/errors.hpp"

namespace ParaClient {

    std::string to_hex(const uint8_t* data, size_t size) {
        std::string out(size * 2 + 1, '\0');
        sodium_bin2hex(&out[0], out.size(), data, size);
        out.resize(size * 2);
        return out;
    }

    std::string to_hex(const byte_vector& data) {
        return to_hex(data.data(), data.size());
    }

    byte_vector from_hex(const std::string& hex) {
        if (hex.size() % 2 != 0) {
            throw InvalidArgument("Hex string has an odd number of characters.");
        }
        byte_vector out(hex.size() / 2);
        size_t bin_len = 0;
        const char* end = nullptr;
        if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr, &bin_len, &end) != 0 ||
            bin_len != out.size() || end != hex.data() + hex.size()) {
            throw InvalidArgument("Malformed hex string.");
        }
        return out;
    }

    std::string to_base64(const byte_vector& data) {
        const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
        std::string out(encoded_len, '\0');
        sodium_bin2base64(&out[0], encoded_len, data.data(), data.size(), sodium_base64_VARIANT_ORIGINAL);
        out.resize(encoded_len - 1);  // Drop the terminating NUL
        return out;
    }

    byte_vector from_base64(const std::string& text) {
        byte_vector out(text.size() / 4 * 3 + 3);
        size_t bin_len = 0;
        const char* end = nullptr;
        if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(), nullptr, &bin_len, &end,
                              sodium_base64_VARIANT_ORIGINAL) != 0 ||
            end != text.data() + text.size()) {
            throw InvalidArgument("Malformed base64 string.");
        }
        out.resize(bin_len);
        return out;
    }

    void secure_wipe(uint8_t* data, size_t size) {
        if (data != nullptr && size > 0) {
            sodium_memzero(data, size);
        }
    }

} // namespace ParaClient
