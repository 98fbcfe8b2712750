#ifndef PARACLIENT_SR25519_HPP
#define PARACLIENT_SR25519_HPP

#include <string>

#include "bytes.hpp"
#include "context.hpp"

namespace ParaClient {

    namespace detail {
        class Transcript;
    } // namespace detail

    /**
     * @brief A schnorrkel (sr25519) verification key, a compressed ristretto255 point.
     *
     * Domain separation uses the signing context transcript natively: the
     * context labels the transcript and SHA-512/256(message) is appended as
     * "sign-256". Contexts are never hashed together with the message.
     */
    class Sr25519PublicKey {
    public:
        static constexpr size_t SIZE = 32;
        static constexpr size_t SIGNATURE_SIZE = 64;

        /**
         * @throws ParaClient::InvalidArgument if the bytes are not a valid ristretto255 point.
         */
        explicit Sr25519PublicKey(const byte_vector& bytes);

        static Sr25519PublicKey from_base64(const std::string& text);

        bool verify(const Context& context, const byte_vector& message, const byte_vector& signature) const;

        /**
         * @brief Verifies a signature over the message bytes themselves ("sign-bytes"),
         *        as produced by substrate tooling. Not used for transactions.
         */
        bool verify_raw(const Context& context, const byte_vector& message, const byte_vector& signature) const;

        const byte_vector& bytes() const { return data_; }
        std::string to_base64() const;

        bool operator==(const Sr25519PublicKey& other) const { return data_ == other.data_; }
        bool operator!=(const Sr25519PublicKey& other) const { return data_ != other.data_; }

    private:
        bool verify_transcript(detail::Transcript& t, const byte_vector& signature) const;

        byte_vector data_;
    };

    /**
     * @brief An in-memory sr25519 signer.
     */
    class Sr25519Signer {
    public:
        static constexpr size_t MINI_SECRET_SIZE = 32;

        static Sr25519Signer generate();

        /**
         * @brief Expands a 32-byte mini secret key (Ed25519 expansion mode).
         */
        static Sr25519Signer from_seed(const byte_vector& mini_secret);

        ~Sr25519Signer();
        Sr25519Signer(Sr25519Signer&&) noexcept = default;
        Sr25519Signer& operator=(Sr25519Signer&& other) noexcept;
        Sr25519Signer(const Sr25519Signer&) = delete;
        Sr25519Signer& operator=(const Sr25519Signer&) = delete;

        const Sr25519PublicKey& public_key() const { return public_key_; }

        /**
         * @brief Signs the message under a signing context.
         * @throws ParaClient::SignatureError if the signer was reset or the context is empty.
         */
        byte_vector context_sign(const Context& context, const byte_vector& message) const;

        void reset();

        bool is_reset() const { return key_.empty(); }

    private:
        Sr25519Signer(byte_vector key, Sr25519PublicKey public_key);

        byte_vector key_;  // 32-byte scalar
        Sr25519PublicKey public_key_;
    };

} // namespace ParaClient

#endif // PARACLIENT_SR25519_HPP
