#ifndef PARACLIENT_SECP256K1_HPP
#define PARACLIENT_SECP256K1_HPP

#include <array>
#include <string>

#include "bytes.hpp"
#include "context.hpp"

namespace ParaClient {

    /**
     * @brief A secp256k1 ECDSA verification key, held in compressed form.
     *
     * Signatures are DER-encoded ECDSA over the digest SHA-512/256(context || message).
     */
    class Secp256k1PublicKey {
    public:
        static constexpr size_t COMPRESSED_SIZE = 33;
        static constexpr size_t UNCOMPRESSED_SIZE = 65;

        /**
         * @param bytes A compressed (33 bytes) or uncompressed (65 bytes) point.
         * @throws ParaClient::InvalidArgument if the point does not parse.
         */
        explicit Secp256k1PublicKey(const byte_vector& bytes);

        static Secp256k1PublicKey from_base64(const std::string& text);

        /**
         * @brief Verifies a DER signature over the context and message.
         * @return True if the signature is valid. Malformed input yields false.
         */
        bool verify(const Context& context, const byte_vector& message, const byte_vector& signature) const;

        // Compressed SEC1 encoding.
        const byte_vector& bytes() const { return data_; }

        // Uncompressed SEC1 encoding (0x04 || X || Y).
        byte_vector uncompressed() const;

        // Ethereum address: last 20 bytes of Keccak-256(X || Y).
        std::array<uint8_t, 20> eth_address() const;

        std::string to_base64() const;

        bool operator==(const Secp256k1PublicKey& other) const { return data_ == other.data_; }
        bool operator!=(const Secp256k1PublicKey& other) const { return data_ != other.data_; }

    private:
        byte_vector data_;
    };

    /**
     * @brief An in-memory secp256k1 signer producing RFC 6979 low-S signatures.
     */
    class Secp256k1Signer {
    public:
        static constexpr size_t PRIVATE_KEY_SIZE = 32;

        static Secp256k1Signer generate();

        /**
         * @throws ParaClient::InvalidArgument if the key is not a valid scalar.
         */
        static Secp256k1Signer from_private_key(const byte_vector& private_key);

        ~Secp256k1Signer();
        Secp256k1Signer(Secp256k1Signer&&) noexcept = default;
        Secp256k1Signer& operator=(Secp256k1Signer&& other) noexcept;
        Secp256k1Signer(const Secp256k1Signer&) = delete;
        Secp256k1Signer& operator=(const Secp256k1Signer&) = delete;

        const Secp256k1PublicKey& public_key() const { return public_key_; }

        /**
         * @brief Signs the message under a domain separation context.
         * @return A DER-encoded signature.
         * @throws ParaClient::SignatureError if the signer was reset or signing fails.
         */
        byte_vector context_sign(const Context& context, const byte_vector& message) const;

        void reset();

        bool is_reset() const { return secret_.empty(); }

    private:
        Secp256k1Signer(byte_vector secret, Secp256k1PublicKey public_key);

        byte_vector secret_;
        Secp256k1PublicKey public_key_;
    };

} // namespace ParaClient

#endif // PARACLIENT_SECP256K1_HPP
