#include "bech32.hpp"

#include <array>
#include <cctype>

#include "paraclient/errors.hpp"

namespace ParaClient {
namespace detail {

    namespace {

        constexpr char CHARSET[] = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";
        constexpr uint32_t BECH32_CONSTANT = 1;
        constexpr size_t CHECKSUM_SIZE = 6;
        constexpr size_t MAX_LENGTH = 90;

        constexpr std::array<int8_t, 128> make_decode_map() {
            std::array<int8_t, 128> map{};
            for (auto& v : map) {
                v = -1;
            }
            for (size_t i = 0; i < 32; ++i) {
                map[static_cast<unsigned char>(CHARSET[i])] = static_cast<int8_t>(i);
            }
            return map;
        }

        constexpr auto DECODE_MAP = make_decode_map();

        uint32_t polymod(const byte_vector& values) {
            uint32_t chk = 1;
            for (uint8_t v : values) {
                const uint8_t top = static_cast<uint8_t>(chk >> 25);
                chk = ((chk & 0x1ffffff) << 5) ^ v;
                if (top & 0x01) chk ^= 0x3b6a57b2;
                if (top & 0x02) chk ^= 0x26508e6d;
                if (top & 0x04) chk ^= 0x1ea119fa;
                if (top & 0x08) chk ^= 0x3d4233dd;
                if (top & 0x10) chk ^= 0x2a1462b3;
            }
            return chk;
        }

        byte_vector hrp_expand(const std::string& hrp) {
            byte_vector out;
            out.reserve(hrp.size() * 2 + 1);
            for (char c : hrp) {
                out.push_back(static_cast<uint8_t>(static_cast<unsigned char>(c) >> 5));
            }
            out.push_back(0);
            for (char c : hrp) {
                out.push_back(static_cast<uint8_t>(static_cast<unsigned char>(c) & 0x1f));
            }
            return out;
        }

        bool convert_bits(byte_vector& out, int from_bits, int to_bits, bool pad, const byte_vector& data) {
            uint32_t acc = 0;
            int bits = 0;
            const uint32_t maxv = (1u << to_bits) - 1;
            for (uint8_t value : data) {
                if (value >> from_bits) {
                    return false;
                }
                acc = (acc << from_bits) | value;
                bits += from_bits;
                while (bits >= to_bits) {
                    bits -= to_bits;
                    out.push_back(static_cast<uint8_t>((acc >> bits) & maxv));
                }
            }
            if (pad) {
                if (bits) {
                    out.push_back(static_cast<uint8_t>((acc << (to_bits - bits)) & maxv));
                }
            } else if (bits >= from_bits || ((acc << (to_bits - bits)) & maxv)) {
                return false;
            }
            return true;
        }

    } // namespace

    std::string bech32_encode(const std::string& hrp, const byte_vector& data) {
        byte_vector values;
        convert_bits(values, 8, 5, true, data);

        byte_vector checksum_input = hrp_expand(hrp);
        append(checksum_input, values);
        checksum_input.insert(checksum_input.end(), CHECKSUM_SIZE, 0);
        const uint32_t mod = polymod(checksum_input) ^ BECH32_CONSTANT;

        std::string out = hrp + '1';
        for (uint8_t v : values) {
            out.push_back(CHARSET[v]);
        }
        for (size_t i = 0; i < CHECKSUM_SIZE; ++i) {
            out.push_back(CHARSET[(mod >> (5 * (5 - i))) & 31]);
        }
        return out;
    }

    byte_vector bech32_decode(const std::string& text, const std::string& expected_hrp) {
        if (text.size() < 8 || text.size() > MAX_LENGTH) {
            throw AddressError("Malformed bech32 address: invalid length.");
        }
        bool lower = false;
        bool upper = false;
        for (char c : text) {
            const auto uc = static_cast<unsigned char>(c);
            if (uc < 33 || uc > 126) {
                throw AddressError("Malformed bech32 address: invalid character.");
            }
            if (std::islower(uc)) lower = true;
            if (std::isupper(uc)) upper = true;
        }
        if (lower && upper) {
            throw AddressError("Malformed bech32 address: mixed case.");
        }

        std::string normalized;
        normalized.reserve(text.size());
        for (char c : text) {
            normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }

        const auto pos = normalized.rfind('1');
        if (pos == std::string::npos || pos == 0 || pos + 1 + CHECKSUM_SIZE > normalized.size()) {
            throw AddressError("Malformed bech32 address: missing separator.");
        }
        const std::string hrp = normalized.substr(0, pos);
        if (hrp != expected_hrp) {
            throw AddressError("Malformed bech32 address: unexpected human readable part '" + hrp + "'.");
        }

        byte_vector values;
        values.reserve(normalized.size() - pos - 1);
        for (size_t i = pos + 1; i < normalized.size(); ++i) {
            const auto uc = static_cast<unsigned char>(normalized[i]);
            const int8_t v = uc < DECODE_MAP.size() ? DECODE_MAP[uc] : -1;
            if (v < 0) {
                throw AddressError("Malformed bech32 address: invalid character.");
            }
            values.push_back(static_cast<uint8_t>(v));
        }

        byte_vector checksum_input = hrp_expand(hrp);
        append(checksum_input, values);
        if (polymod(checksum_input) != BECH32_CONSTANT) {
            throw AddressError("Malformed bech32 address: invalid checksum.");
        }
        values.resize(values.size() - CHECKSUM_SIZE);

        byte_vector out;
        if (!convert_bits(out, 5, 8, false, values)) {
            throw AddressError("Malformed bech32 address: invalid padding.");
        }
        return out;
    }

} // namespace detail
} // namespace ParaClient
