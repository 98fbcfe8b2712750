#include "paraclient/signer_registry.hpp"

#include "paraclient/errors.hpp"
#include "paraclient/log.hpp"

namespace ParaClient {

    namespace {

    Logger logger() {
        static Logger log = create_logger("signer");
        return log;
    }

    class Ed25519RawFactory : public SignerFactory {
    public:
        std::string kind() const override { return "ed25519-raw"; }
        std::string description() const override { return "Ed25519 signer from a 32-byte seed"; }
        Signer create(const byte_vector& key) const override { return Ed25519Signer::from_seed(key); }
    };

    class Secp256k1RawFactory : public SignerFactory {
    public:
        std::string kind() const override { return "secp256k1-raw"; }
        std::string description() const override { return "Secp256k1 signer from a 32-byte private key"; }
        Signer create(const byte_vector& key) const override { return Secp256k1Signer::from_private_key(key); }
    };

    class Sr25519RawFactory : public SignerFactory {
    public:
        std::string kind() const override { return "sr25519-raw"; }
        std::string description() const override { return "Sr25519 signer from a 32-byte mini secret"; }
        Signer create(const byte_vector& key) const override { return Sr25519Signer::from_seed(key); }
    };

    } // namespace

    void SignerRegistry::register_factory(std::shared_ptr<SignerFactory> factory) {
        if (!factory) {
            throw InvalidArgument("Signer factory must not be null.");
        }
        const std::string kind = factory->kind();
        if (factories_.count(kind) != 0) {
            throw LogicError("Signer kind '" + kind + "' is already registered.");
        }
        factories_.emplace(kind, std::move(factory));
        logger()->debug("Registered signer kind {}", kind);
    }

    std::shared_ptr<SignerFactory> SignerRegistry::find(const std::string& kind) const {
        auto it = factories_.find(kind);
        return it == factories_.end() ? nullptr : it->second;
    }

    Signer SignerRegistry::create(const std::string& kind, const byte_vector& key) const {
        auto factory = find(kind);
        if (!factory) {
            throw LogicError("Unknown signer kind '" + kind + "'.");
        }
        return factory->create(key);
    }

    std::vector<std::string> SignerRegistry::kinds() const {
        std::vector<std::string> out;
        out.reserve(factories_.size());
        for (const auto& entry : factories_) {
            out.push_back(entry.first);
        }
        return out;
    }

    SignerRegistry SignerRegistry::with_builtin_factories() {
        SignerRegistry registry;
        registry.register_factory(std::make_shared<Ed25519RawFactory>());
        registry.register_factory(std::make_shared<Secp256k1RawFactory>());
        registry.register_factory(std::make_shared<Sr25519RawFactory>());
        return registry;
    }

} // namespace ParaClient
