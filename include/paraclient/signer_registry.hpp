#ifndef PARACLIENT_SIGNER_REGISTRY_HPP
#define PARACLIENT_SIGNER_REGISTRY_HPP

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "bytes.hpp"
#include "signer.hpp"

namespace ParaClient {

    /**
     * @brief Creates signers of one kind from serialized key material.
     */
    class SignerFactory {
    public:
        virtual ~SignerFactory() = default;

        // Unique kind name, e.g. "ed25519-raw".
        virtual std::string kind() const = 0;

        virtual std::string description() const = 0;

        /**
         * @throws ParaClient::SignatureError or ParaClient::InvalidArgument on bad key material.
         */
        virtual Signer create(const byte_vector& key) const = 0;
    };

    /**
     * @brief Maps kind names to signer factories.
     *
     * Registration is expected to happen during start-up; lookups are not
     * synchronized with concurrent registration.
     */
    class SignerRegistry {
    public:
        /**
         * @throws ParaClient::InvalidArgument if the factory is null.
         * @throws ParaClient::LogicError if the kind is already registered.
         */
        void register_factory(std::shared_ptr<SignerFactory> factory);

        // Null when the kind is unknown.
        std::shared_ptr<SignerFactory> find(const std::string& kind) const;

        /**
         * @throws ParaClient::LogicError if the kind is unknown.
         */
        Signer create(const std::string& kind, const byte_vector& key) const;

        std::vector<std::string> kinds() const;

        // Registry holding the "ed25519-raw", "secp256k1-raw" and "sr25519-raw" factories.
        static SignerRegistry with_builtin_factories();

    private:
        std::map<std::string, std::shared_ptr<SignerFactory>> factories_;
    };

} // namespace ParaClient

#endif // PARACLIENT_SIGNER_REGISTRY_HPP
