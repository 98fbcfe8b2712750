#ifndef PARACLIENT_SIGNER_HPP
#define PARACLIENT_SIGNER_HPP

#include <variant>

#include "bytes.hpp"
#include "context.hpp"
#include "device_signer.hpp"
#include "ed25519.hpp"
#include "public_key.hpp"
#include "secp256k1.hpp"
#include "sr25519.hpp"

namespace ParaClient {

    /**
     * @brief A private key capable of producing signatures.
     *
     * A closed set of in-memory signers plus the device-backed signer, whose
     * context_sign() may block on I/O.
     */
    class Signer {
    public:
        using Variant = std::variant<Ed25519Signer, Secp256k1Signer, Sr25519Signer, DeviceSigner>;

        Signer(Ed25519Signer signer) : signer_(std::move(signer)) {}
        Signer(Secp256k1Signer signer) : signer_(std::move(signer)) {}
        Signer(Sr25519Signer signer) : signer_(std::move(signer)) {}
        Signer(DeviceSigner signer) : signer_(std::move(signer)) {}

        PublicKey public_key() const;

        SignatureAlgorithm algorithm() const { return public_key().algorithm(); }

        /**
         * @brief Signs the message under the given domain separation context.
         * @param context The signing context, e.g. Context::for_transactions().
         * @param message The message bytes.
         * @return The algorithm-specific signature encoding.
         * @throws ParaClient::SignatureError if the signer was reset or cannot sign with this context.
         */
        byte_vector context_sign(const Context& context, const byte_vector& message) const;

        /**
         * @brief Erases the key material. Every later context_sign() call fails.
         */
        void reset();

        bool is_reset() const;

    private:
        Variant signer_;
    };

} // namespace ParaClient

#endif // PARACLIENT_SIGNER_HPP
