#include "paraclient/deoxysii.hpp"

#include <algorithm>

#include <sodium.h>

#include "paraclient/errors.hpp"

namespace ParaClient {

    namespace {

        constexpr uint8_t PREFIX_AD_BLOCK = 0x2;
        constexpr uint8_t PREFIX_AD_FINAL = 0x6;
        constexpr uint8_t PREFIX_MSG_BLOCK = 0x0;
        constexpr uint8_t PREFIX_MSG_FINAL = 0x4;
        constexpr uint8_t PREFIX_TAG = 0x1;

        constexpr uint8_t RCON[17] = {0x2f, 0x5e, 0xbc, 0x63, 0xc6, 0x97, 0x35, 0x6a, 0xd4,
                                      0xb3, 0x7d, 0xfa, 0xef, 0xc5, 0x91, 0x39, 0x72};

        // Tweakey byte permutation h: out[i] = in[H[i]].
        constexpr uint8_t H_PERMUTATION[16] = {1, 6, 11, 12, 5, 10, 15, 0, 9, 14, 3, 4, 13, 2, 7, 8};

        using Block = std::array<uint8_t, 16>;

        inline uint8_t rotl8(uint8_t x, int n) {
            return static_cast<uint8_t>((x << n) | (x >> (8 - n)));
        }

        struct SBox {
            uint8_t table[256];

            SBox() {
                uint8_t p = 1;
                uint8_t q = 1;
                do {
                    // p *= 3 in GF(2^8)
                    p = static_cast<uint8_t>(p ^ static_cast<uint8_t>(p << 1) ^ ((p & 0x80) ? 0x1b : 0));
                    // q /= 3
                    q = static_cast<uint8_t>(q ^ (q << 1));
                    q = static_cast<uint8_t>(q ^ (q << 2));
                    q = static_cast<uint8_t>(q ^ (q << 4));
                    if (q & 0x80) {
                        q ^= 0x09;
                    }
                    const uint8_t x = static_cast<uint8_t>(q ^ rotl8(q, 1) ^ rotl8(q, 2) ^ rotl8(q, 3) ^ rotl8(q, 4));
                    table[p] = static_cast<uint8_t>(x ^ 0x63);
                } while (p != 1);
                table[0] = 0x63;
            }
        };

        const SBox& sbox() {
            static const SBox box;
            return box;
        }

        inline uint8_t xtime(uint8_t x) {
            return static_cast<uint8_t>((x << 1) ^ ((x >> 7) * 0x1b));
        }

        void permute_h(Block& tk) {
            Block tmp;
            for (size_t i = 0; i < 16; ++i) {
                tmp[i] = tk[H_PERMUTATION[i]];
            }
            tk = tmp;
        }

        void lfsr2(Block& tk) {
            for (auto& x : tk) {
                x = static_cast<uint8_t>((x << 1) | (((x >> 7) ^ (x >> 5)) & 1));
            }
        }

        void lfsr3(Block& tk) {
            for (auto& x : tk) {
                x = static_cast<uint8_t>((x >> 1) | (((x << 7) ^ (x << 1)) & 0x80));
            }
        }

        void xor_round_constant(Block& out, const Block& tk2, const Block& tk3, size_t round) {
            const uint8_t rc[16] = {1, 2, 4, 8, RCON[round], RCON[round], RCON[round], RCON[round],
                                    0, 0, 0, 0, 0, 0, 0, 0};
            for (size_t i = 0; i < 16; ++i) {
                out[i] = static_cast<uint8_t>(tk2[i] ^ tk3[i] ^ rc[i]);
            }
        }

        // SubBytes, ShiftRows, MixColumns and AddRoundKey on a column-major state.
        void aes_round(Block& state, const Block& round_key) {
            const SBox& box = sbox();
            Block t;
            for (size_t c = 0; c < 4; ++c) {
                for (size_t r = 0; r < 4; ++r) {
                    t[4 * c + r] = box.table[state[4 * ((c + r) % 4) + r]];
                }
            }
            for (size_t c = 0; c < 4; ++c) {
                const uint8_t a0 = t[4 * c];
                const uint8_t a1 = t[4 * c + 1];
                const uint8_t a2 = t[4 * c + 2];
                const uint8_t a3 = t[4 * c + 3];
                const uint8_t all = static_cast<uint8_t>(a0 ^ a1 ^ a2 ^ a3);
                state[4 * c] = static_cast<uint8_t>(a0 ^ all ^ xtime(static_cast<uint8_t>(a0 ^ a1)));
                state[4 * c + 1] = static_cast<uint8_t>(a1 ^ all ^ xtime(static_cast<uint8_t>(a1 ^ a2)));
                state[4 * c + 2] = static_cast<uint8_t>(a2 ^ all ^ xtime(static_cast<uint8_t>(a2 ^ a3)));
                state[4 * c + 3] = static_cast<uint8_t>(a3 ^ all ^ xtime(static_cast<uint8_t>(a3 ^ a0)));
            }
            for (size_t i = 0; i < 16; ++i) {
                state[i] ^= round_key[i];
            }
        }

        Block tag_tweak(uint8_t prefix, uint64_t block_nr) {
            Block tweak{};
            tweak[0] = static_cast<uint8_t>(prefix << 4);
            for (int i = 15; i >= 8; --i) {
                tweak[i] = static_cast<uint8_t>(block_nr);
                block_nr >>= 8;
            }
            return tweak;
        }

        void xor_into(Block& acc, const Block& value) {
            for (size_t i = 0; i < 16; ++i) {
                acc[i] ^= value[i];
            }
        }

    } // namespace

    DeoxysII::DeoxysII(const byte_vector& key) {
        if (key.size() != KEY_SIZE) {
            throw InvalidArgument("Invalid key size for Deoxys-II.");
        }
        Block tk2;
        Block tk3;
        std::copy(key.begin() + 16, key.begin() + 32, tk2.begin());
        std::copy(key.begin(), key.begin() + 16, tk3.begin());

        xor_round_constant(derived_keys_[0], tk2, tk3, 0);
        for (size_t i = 1; i <= ROUNDS; ++i) {
            lfsr2(tk2);
            permute_h(tk2);
            lfsr3(tk3);
            permute_h(tk3);
            xor_round_constant(derived_keys_[i], tk2, tk3, i);
        }
        sodium_memzero(tk2.data(), tk2.size());
        sodium_memzero(tk3.data(), tk3.size());
    }

    DeoxysII::~DeoxysII() {
        for (auto& k : derived_keys_) {
            sodium_memzero(k.data(), k.size());
        }
    }

    void DeoxysII::encrypt_block(const Block& tweak, const Block& in, Block& out) const {
        Block tk1 = tweak;
        Block stk;
        for (size_t i = 0; i < 16; ++i) {
            stk[i] = static_cast<uint8_t>(derived_keys_[0][i] ^ tk1[i]);
        }
        Block state;
        for (size_t i = 0; i < 16; ++i) {
            state[i] = static_cast<uint8_t>(in[i] ^ stk[i]);
        }
        for (size_t round = 1; round <= ROUNDS; ++round) {
            permute_h(tk1);
            for (size_t i = 0; i < 16; ++i) {
                stk[i] = static_cast<uint8_t>(derived_keys_[round][i] ^ tk1[i]);
            }
            aes_round(state, stk);
        }
        out = state;
    }

    DeoxysII::Block DeoxysII::authenticate(const byte_vector& associated_data, const uint8_t* message,
                                           size_t size) const {
        Block auth{};
        Block enc;

        const size_t ad_full = associated_data.size() / BLOCK_SIZE;
        for (size_t i = 0; i < ad_full; ++i) {
            Block in;
            std::copy(associated_data.begin() + i * BLOCK_SIZE, associated_data.begin() + (i + 1) * BLOCK_SIZE,
                      in.begin());
            encrypt_block(tag_tweak(PREFIX_AD_BLOCK, i), in, enc);
            xor_into(auth, enc);
        }
        const size_t ad_rem = associated_data.size() % BLOCK_SIZE;
        if (ad_rem > 0) {
            Block in{};
            std::copy(associated_data.begin() + ad_full * BLOCK_SIZE, associated_data.end(), in.begin());
            in[ad_rem] = 0x80;
            encrypt_block(tag_tweak(PREFIX_AD_FINAL, ad_full), in, enc);
            xor_into(auth, enc);
        }

        const size_t msg_full = size / BLOCK_SIZE;
        for (size_t i = 0; i < msg_full; ++i) {
            Block in;
            std::copy(message + i * BLOCK_SIZE, message + (i + 1) * BLOCK_SIZE, in.begin());
            encrypt_block(tag_tweak(PREFIX_MSG_BLOCK, i), in, enc);
            xor_into(auth, enc);
        }
        const size_t msg_rem = size % BLOCK_SIZE;
        if (msg_rem > 0) {
            Block in{};
            std::copy(message + msg_full * BLOCK_SIZE, message + size, in.begin());
            in[msg_rem] = 0x80;
            encrypt_block(tag_tweak(PREFIX_MSG_FINAL, msg_full), in, enc);
            xor_into(auth, enc);
        }
        return auth;
    }

    DeoxysII::Block DeoxysII::compute_tag(const Nonce& nonce, const Block& auth) const {
        Block tweak{};
        tweak[0] = static_cast<uint8_t>(PREFIX_TAG << 4);
        std::copy(nonce.begin(), nonce.end(), tweak.begin() + 1);
        Block tag;
        encrypt_block(tweak, auth, tag);
        return tag;
    }

    void DeoxysII::apply_keystream(const Nonce& nonce, const Block& tag, const uint8_t* in, size_t size,
                                   uint8_t* out) const {
        Block nonce_block{};
        std::copy(nonce.begin(), nonce.end(), nonce_block.begin() + 1);

        Block keystream;
        for (size_t offset = 0, block_nr = 0; offset < size; offset += BLOCK_SIZE, ++block_nr) {
            Block tweak = tag;
            tweak[0] |= 0x80;
            uint64_t counter = block_nr;
            for (int i = 15; i >= 8; --i) {
                tweak[i] ^= static_cast<uint8_t>(counter);
                counter >>= 8;
            }
            encrypt_block(tweak, nonce_block, keystream);
            const size_t n = std::min(BLOCK_SIZE, size - offset);
            for (size_t i = 0; i < n; ++i) {
                out[offset + i] = static_cast<uint8_t>(in[offset + i] ^ keystream[i]);
            }
        }
        sodium_memzero(keystream.data(), keystream.size());
    }

    byte_vector DeoxysII::seal(const Nonce& nonce, const byte_vector& plaintext,
                               const byte_vector& associated_data) const {
        const Block auth = authenticate(associated_data, plaintext.data(), plaintext.size());
        const Block tag = compute_tag(nonce, auth);

        byte_vector out(plaintext.size() + TAG_SIZE);
        apply_keystream(nonce, tag, plaintext.data(), plaintext.size(), out.data());
        std::copy(tag.begin(), tag.end(), out.begin() + plaintext.size());
        return out;
    }

    byte_vector DeoxysII::open(const Nonce& nonce, const byte_vector& ciphertext,
                               const byte_vector& associated_data) const {
        if (ciphertext.size() < TAG_SIZE) {
            throw CodecError("Deoxys-II ciphertext is shorter than the tag.");
        }
        const size_t size = ciphertext.size() - TAG_SIZE;
        Block tag;
        std::copy(ciphertext.begin() + size, ciphertext.end(), tag.begin());

        byte_vector plaintext(size);
        apply_keystream(nonce, tag, ciphertext.data(), size, plaintext.data());

        const Block auth = authenticate(associated_data, plaintext.data(), plaintext.size());
        const Block expected = compute_tag(nonce, auth);
        if (sodium_memcmp(expected.data(), tag.data(), TAG_SIZE) != 0) {
            sodium_memzero(plaintext.data(), plaintext.size());
            throw CodecError("Deoxys-II authentication failed.");
        }
        return plaintext;
    }

} // namespace ParaClient
