#ifndef PARACLIENT_PUBLIC_KEY_HPP
#define PARACLIENT_PUBLIC_KEY_HPP

#include <string>
#include <variant>

#include "bytes.hpp"
#include "cbor.hpp"
#include "context.hpp"
#include "ed25519.hpp"
#include "secp256k1.hpp"
#include "sr25519.hpp"

namespace ParaClient {

    enum class SignatureAlgorithm {
        Ed25519,
        Secp256k1,
        Sr25519
    };

    // Wire name of the algorithm, also used as the CBOR map key.
    std::string to_string(SignatureAlgorithm algorithm);

    /**
     * @brief An algorithm-tagged verification key.
     *
     * Two keys compare equal only when both the algorithm and the key bytes
     * match.
     */
    class PublicKey {
    public:
        using Variant = std::variant<Ed25519PublicKey, Secp256k1PublicKey, Sr25519PublicKey>;

        PublicKey(Ed25519PublicKey key) : key_(std::move(key)) {}
        PublicKey(Secp256k1PublicKey key) : key_(std::move(key)) {}
        PublicKey(Sr25519PublicKey key) : key_(std::move(key)) {}

        /**
         * @brief Builds a key of the given algorithm from its raw encoding.
         * @throws ParaClient::InvalidArgument if the bytes are malformed for that algorithm.
         */
        static PublicKey from_bytes(SignatureAlgorithm algorithm, const byte_vector& bytes);

        static PublicKey from_base64(SignatureAlgorithm algorithm, const std::string& text);

        /**
         * @brief Parses the `{ed25519|secp256k1|sr25519: bytes}` form.
         * @throws ParaClient::CodecError if the map does not hold exactly one known algorithm.
         */
        static PublicKey from_cbor(const CborValue& value);

        SignatureAlgorithm algorithm() const;

        /**
         * @brief Verifies a signature with the algorithm's own domain separation.
         * @return false for any malformed or invalid signature.
         */
        bool verify(const Context& context, const byte_vector& message, const byte_vector& signature) const;

        const byte_vector& bytes() const;
        std::string to_base64() const;

        CborValue to_cbor() const;

        template <typename T>
        const T* get_if() const {
            return std::get_if<T>(&key_);
        }

        const Variant& variant() const { return key_; }

        bool operator==(const PublicKey& other) const { return key_ == other.key_; }
        bool operator!=(const PublicKey& other) const { return !(*this == other); }

    private:
        Variant key_;
    };

} // namespace ParaClient

#endif // PARACLIENT_PUBLIC_KEY_HPP
