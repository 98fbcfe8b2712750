#include "keccak.hpp"

namespace ParaClient {
namespace detail {

    namespace {

        constexpr uint64_t ROUND_CONSTANTS[24] = {
            0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL, 0x8000000080008000ULL,
            0x000000000000808bULL, 0x0000000080000001ULL, 0x8000000080008081ULL, 0x8000000000008009ULL,
            0x000000000000008aULL, 0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
            0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL, 0x8000000000008003ULL,
            0x8000000000008002ULL, 0x8000000000000080ULL, 0x000000000000800aULL, 0x800000008000000aULL,
            0x8000000080008081ULL, 0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL};

        constexpr int ROTATIONS[24] = {1,  3,  6,  10, 15, 21, 28, 36, 45, 55, 2,  14,
                                       27, 41, 56, 8,  25, 43, 62, 18, 39, 61, 20, 44};

        constexpr int PI_LANES[24] = {10, 7,  11, 17, 18, 3, 5,  16, 8,  21, 24, 4,
                                      15, 23, 19, 13, 12, 2, 20, 14, 22, 9,  6,  1};

        inline uint64_t rotl64(uint64_t x, int n) {
            return (x << n) | (x >> (64 - n));
        }

    } // namespace

    void keccak_f1600(std::array<uint8_t, 200>& state) {
        uint64_t lanes[25];
        for (int i = 0; i < 25; ++i) {
            uint64_t v = 0;
            for (int b = 7; b >= 0; --b) {
                v = (v << 8) | state[i * 8 + b];
            }
            lanes[i] = v;
        }

        uint64_t bc[5];
        for (int round = 0; round < 24; ++round) {
            // Theta
            for (int i = 0; i < 5; ++i) {
                bc[i] = lanes[i] ^ lanes[i + 5] ^ lanes[i + 10] ^ lanes[i + 15] ^ lanes[i + 20];
            }
            for (int i = 0; i < 5; ++i) {
                uint64_t t = bc[(i + 4) % 5] ^ rotl64(bc[(i + 1) % 5], 1);
                for (int j = 0; j < 25; j += 5) {
                    lanes[j + i] ^= t;
                }
            }

            // Rho and pi
            uint64_t t = lanes[1];
            for (int i = 0; i < 24; ++i) {
                int j = PI_LANES[i];
                uint64_t tmp = lanes[j];
                lanes[j] = rotl64(t, ROTATIONS[i]);
                t = tmp;
            }

            // Chi
            for (int j = 0; j < 25; j += 5) {
                for (int i = 0; i < 5; ++i) {
                    bc[i] = lanes[j + i];
                }
                for (int i = 0; i < 5; ++i) {
                    lanes[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
                }
            }

            // Iota
            lanes[0] ^= ROUND_CONSTANTS[round];
        }

        for (int i = 0; i < 25; ++i) {
            uint64_t v = lanes[i];
            for (int b = 0; b < 8; ++b) {
                state[i * 8 + b] = static_cast<uint8_t>(v);
                v >>= 8;
            }
        }
    }

} // namespace detail
} // namespace ParaClient
