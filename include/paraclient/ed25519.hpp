#ifndef PARACLIENT_ED25519_HPP
#define PARACLIENT_ED25519_HPP

#include <string>

#include "bytes.hpp"
#include "context.hpp"

namespace ParaClient {

    /**
     * @brief An Ed25519 verification key.
     *
     * Messages are domain separated by signing SHA-512/256(context || message).
     */
    class Ed25519PublicKey {
    public:
        static constexpr size_t SIZE = 32;
        static constexpr size_t SIGNATURE_SIZE = 64;

        /**
         * @throws ParaClient::InvalidArgument if the key is not SIZE bytes.
         */
        explicit Ed25519PublicKey(const byte_vector& bytes);

        static Ed25519PublicKey from_base64(const std::string& text);

        /**
         * @brief Verifies a signature over the context and message.
         * @return True if the signature is valid. Malformed input yields false.
         */
        bool verify(const Context& context, const byte_vector& message, const byte_vector& signature) const;

        const byte_vector& bytes() const { return data_; }
        std::string to_base64() const;

        bool operator==(const Ed25519PublicKey& other) const { return data_ == other.data_; }
        bool operator!=(const Ed25519PublicKey& other) const { return data_ != other.data_; }

    private:
        byte_vector data_;
    };

    /**
     * @brief An in-memory Ed25519 signer.
     */
    class Ed25519Signer {
    public:
        static constexpr size_t SEED_SIZE = 32;

        static Ed25519Signer generate();

        /**
         * @brief Derives the key pair from a 32-byte seed.
         * @throws ParaClient::InvalidArgument if the seed has the wrong size.
         */
        static Ed25519Signer from_seed(const byte_vector& seed);

        ~Ed25519Signer();
        Ed25519Signer(Ed25519Signer&&) noexcept = default;
        Ed25519Signer& operator=(Ed25519Signer&& other) noexcept;
        Ed25519Signer(const Ed25519Signer&) = delete;
        Ed25519Signer& operator=(const Ed25519Signer&) = delete;

        const Ed25519PublicKey& public_key() const { return public_key_; }

        /**
         * @brief Signs the message under a domain separation context.
         * @return A 64-byte signature.
         * @throws ParaClient::SignatureError if the signer was reset or the context is empty.
         */
        byte_vector context_sign(const Context& context, const byte_vector& message) const;

        /**
         * @brief Erases the key material. Subsequent signing fails.
         */
        void reset();

        bool is_reset() const { return secret_.empty(); }

    private:
        Ed25519Signer(byte_vector secret, Ed25519PublicKey public_key);

        byte_vector secret_;  // libsodium seed || public key form
        Ed25519PublicKey public_key_;
    };

} // namespace ParaClient

#endif // PARACLIENT_ED25519_HPP
