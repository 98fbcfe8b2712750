#ifndef PARACLIENT_SRC_KECCAK_HPP
#define PARACLIENT_SRC_KECCAK_HPP

#include <array>
#include <cstdint>

namespace ParaClient {
namespace detail {

    // Keccak-f[1600] over the 200-byte state, lanes read little-endian.
    void keccak_f1600(std::array<uint8_t, 200>& state);

} // namespace detail
} // namespace ParaClient

#endif // PARACLIENT_SRC_KECCAK_HPP
