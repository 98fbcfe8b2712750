#ifndef PARACLIENT_BYTES_HPP
#define PARACLIENT_BYTES_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace ParaClient {

    // Using a simple vector of bytes for data representation.
    using byte_vector = std::vector<uint8_t>;

    /**
     * @brief Encodes bytes as lower-case hex.
     */
    std::string to_hex(const uint8_t* data, size_t size);
    std::string to_hex(const byte_vector& data);

    template <size_t N>
    std::string to_hex(const std::array<uint8_t, N>& data) {
        return to_hex(data.data(), N);
    }

    /**
     * @brief Decodes a hex string (either case, no separators).
     * @throws ParaClient::InvalidArgument if the input is not valid hex.
     */
    byte_vector from_hex(const std::string& hex);

    /**
     * @brief Encodes bytes as standard padded Base64.
     */
    std::string to_base64(const byte_vector& data);

    /**
     * @brief Decodes standard padded Base64.
     * @throws ParaClient::InvalidArgument if the input is not valid Base64.
     */
    byte_vector from_base64(const std::string& text);

    inline byte_vector to_bytes(const std::string& s) {
        return byte_vector(s.begin(), s.end());
    }

    // Concatenates any number of byte ranges.
    inline void append(byte_vector& out, const byte_vector& part) {
        out.insert(out.end(), part.begin(), part.end());
    }

    inline void append(byte_vector& out, const std::string& part) {
        out.insert(out.end(), part.begin(), part.end());
    }

    template <size_t N>
    inline void append(byte_vector& out, const std::array<uint8_t, N>& part) {
        out.insert(out.end(), part.begin(), part.end());
    }

    // Big-endian fixed-width encoding.
    inline std::array<uint8_t, 8> encode_be64(uint64_t value) {
        std::array<uint8_t, 8> out{};
        for (int i = 7; i >= 0; --i) {
            out[i] = static_cast<uint8_t>(value & 0xff);
            value >>= 8;
        }
        return out;
    }

    // Little-endian fixed-width encoding.
    inline std::array<uint8_t, 4> encode_le32(uint32_t value) {
        return {static_cast<uint8_t>(value), static_cast<uint8_t>(value >> 8),
                static_cast<uint8_t>(value >> 16), static_cast<uint8_t>(value >> 24)};
    }

    /**
     * @brief Overwrites the buffer with zeros in a way the compiler may not elide.
     */
    void secure_wipe(uint8_t* data, size_t size);

    inline void secure_wipe(byte_vector& data) {
        secure_wipe(data.data(), data.size());
    }

    template <size_t N>
    inline void secure_wipe(std::array<uint8_t, N>& data) {
        secure_wipe(data.data(), N);
    }

} // namespace ParaClient

#endif // PARACLIENT_BYTES_HPP
