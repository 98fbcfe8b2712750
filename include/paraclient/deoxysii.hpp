#ifndef PARACLIENT_DEOXYSII_HPP
#define PARACLIENT_DEOXYSII_HPP

#include <array>

#include "bytes.hpp"

namespace ParaClient {

    /**
     * @brief Deoxys-II-256-128, the nonce-misuse resistant AEAD used for call data.
     */
    class DeoxysII {
    public:
        static constexpr size_t KEY_SIZE = 32;
        static constexpr size_t NONCE_SIZE = 15;
        static constexpr size_t TAG_SIZE = 16;

        using Nonce = std::array<uint8_t, NONCE_SIZE>;

        /**
         * @brief Prepares the key schedule for a 256-bit key.
         * @throws ParaClient::InvalidArgument if the key is not KEY_SIZE bytes.
         */
        explicit DeoxysII(const byte_vector& key);
        ~DeoxysII();

        DeoxysII(const DeoxysII&) = delete;
        DeoxysII& operator=(const DeoxysII&) = delete;

        /**
         * @brief Encrypts and authenticates.
         * @return Ciphertext followed by the TAG_SIZE-byte tag.
         */
        byte_vector seal(const Nonce& nonce, const byte_vector& plaintext, const byte_vector& associated_data) const;

        /**
         * @brief Verifies and decrypts.
         * @return The plaintext.
         * @throws ParaClient::CodecError if authentication fails. No plaintext is released.
         */
        byte_vector open(const Nonce& nonce, const byte_vector& ciphertext, const byte_vector& associated_data) const;

    private:
        static constexpr size_t ROUNDS = 16;
        static constexpr size_t BLOCK_SIZE = 16;
        using Block = std::array<uint8_t, BLOCK_SIZE>;

        void encrypt_block(const Block& tweak, const Block& in, Block& out) const;
        Block authenticate(const byte_vector& associated_data, const uint8_t* message, size_t size) const;
        Block compute_tag(const Nonce& nonce, const Block& auth) const;
        void apply_keystream(const Nonce& nonce, const Block& tag, const uint8_t* in, size_t size,
                             uint8_t* out) const;

        // Key-dependent part of each sub-tweakey: TK2 ^ TK3 ^ RC.
        std::array<Block, ROUNDS + 1> derived_keys_{};
    };

} // namespace ParaClient

#endif // PARACLIENT_DEOXYSII_HPP
