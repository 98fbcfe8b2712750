#ifndef PARACLIENT_CRYPTO_HPP
#define PARACLIENT_CRYPTO_HPP

#include "bytes.hpp"
#include "deoxysii.hpp"
#include "keys.hpp"

namespace ParaClient {

    // Tweak for deriving the call data box key from the X25519 shared secret.
    constexpr char BOX_KDF_TWEAK[] = "MRAE_Box_Deoxys-II-256-128";

    class Crypto {
    public:
        /**
         * @brief Initializes the cryptographic library. Must be called once.
         * @return 0 on success, -1 on error.
         */
        static int init();

        /**
         * @brief Fills a buffer from the secure random source.
         * @param size Number of bytes to generate.
         */
        static byte_vector random_bytes(size_t size);

        /**
         * @brief Generates a fresh random nonce for Deoxys-II.
         */
        static DeoxysII::Nonce random_nonce();

        /**
         * @brief Generates an ephemeral key pair for the key exchange.
         * @return An X25519KeyPair object.
         */
        static X25519KeyPair generate_x25519_keypair();

        /**
         * @brief Rebuilds a key pair from an existing private key.
         * @param private_key The X25519 scalar; it is clamped by the scalar multiplication.
         */
        static X25519KeyPair x25519_keypair_from_private(const X25519PrivateKey& private_key);

        /**
         * @brief Derives the symmetric box key shared with a peer.
         *
         * The key is HMAC-SHA512/256 keyed with BOX_KDF_TWEAK over the X25519
         * shared secret.
         *
         * @param peer_public_key The peer's X25519 public key.
         * @param private_key Our X25519 private key.
         * @return The 32-byte Deoxys-II key.
         * @throws ParaClient::CodecError if the shared secret is degenerate.
         */
        static byte_vector derive_symmetric_key(const X25519PublicKey& peer_public_key,
                                                const X25519PrivateKey& private_key);

        /**
         * @brief Seals data for a peer under the derived box key.
         * @return Ciphertext with the authentication tag appended.
         */
        static byte_vector box_seal(const DeoxysII::Nonce& nonce,
                                    const byte_vector& plaintext,
                                    const byte_vector& associated_data,
                                    const X25519PublicKey& peer_public_key,
                                    const X25519PrivateKey& private_key);

        /**
         * @brief Opens data sealed by a peer under the derived box key.
         * @return The plaintext.
         * @throws ParaClient::CodecError if authentication fails.
         */
        static byte_vector box_open(const DeoxysII::Nonce& nonce,
                                    const byte_vector& ciphertext,
                                    const byte_vector& associated_data,
                                    const X25519PublicKey& peer_public_key,
                                    const X25519PrivateKey& private_key);
    };

} // namespace ParaClient

#endif // PARACLIENT_CRYPTO_HPP
