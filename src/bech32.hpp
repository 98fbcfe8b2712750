#ifndef PARACLIENT_SRC_BECH32_HPP
#define PARACLIENT_SRC_BECH32_HPP

#include <string>

#include "paraclient/bytes.hpp"

namespace ParaClient {
namespace detail {

    // Classic BIP-173 bech32 over 8-bit data, without a witness version.
    std::string bech32_encode(const std::string& hrp, const byte_vector& data);

    // Throws AddressError on malformed input or an HRP other than the expected one.
    byte_vector bech32_decode(const std::string& text, const std::string& expected_hrp);

} // namespace detail
} // namespace ParaClient

#endif // PARACLIENT_SRC_BECH32_HPP
