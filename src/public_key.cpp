#include "paraclient/public_key.hpp"

#include "paraclient/errors.hpp"

namespace ParaClient {

    namespace {

        template <class... Ts>
        struct overloaded : Ts... {
            using Ts::operator()...;
        };
        template <class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;

        const SignatureAlgorithm ALL_ALGORITHMS[] = {
            SignatureAlgorithm::Ed25519,
            SignatureAlgorithm::Secp256k1,
            SignatureAlgorithm::Sr25519,
        };

    } // namespace

    std::string to_string(SignatureAlgorithm algorithm) {
        switch (algorithm) {
            case SignatureAlgorithm::Ed25519:
                return "ed25519";
            case SignatureAlgorithm::Secp256k1:
                return "secp256k1";
            case SignatureAlgorithm::Sr25519:
                return "sr25519";
        }
        throw LogicError("Unknown signature algorithm.");
    }

    PublicKey PublicKey::from_bytes(SignatureAlgorithm algorithm, const byte_vector& bytes) {
        switch (algorithm) {
            case SignatureAlgorithm::Ed25519:
                return PublicKey(Ed25519PublicKey(bytes));
            case SignatureAlgorithm::Secp256k1:
                return PublicKey(Secp256k1PublicKey(bytes));
            case SignatureAlgorithm::Sr25519:
                return PublicKey(Sr25519PublicKey(bytes));
        }
        throw LogicError("Unknown signature algorithm.");
    }

    PublicKey PublicKey::from_base64(SignatureAlgorithm algorithm, const std::string& text) {
        return from_bytes(algorithm, ParaClient::from_base64(text));
    }

    PublicKey PublicKey::from_cbor(const CborValue& value) {
        const auto& entries = value.as_map();
        if (entries.size() != 1) {
            throw CodecError("Public key must have exactly one algorithm tag.");
        }
        const std::string& tag = entries[0].first.as_text();
        for (SignatureAlgorithm algorithm : ALL_ALGORITHMS) {
            if (tag == to_string(algorithm)) {
                try {
                    return from_bytes(algorithm, entries[0].second.as_bytes());
                } catch (const InvalidArgument& e) {
                    throw CodecError(std::string("Malformed public key: ") + e.what());
                }
            }
        }
        throw CodecError("Unsupported public key algorithm: " + tag);
    }

    SignatureAlgorithm PublicKey::algorithm() const {
        return std::visit(overloaded{
                              [](const Ed25519PublicKey&) { return SignatureAlgorithm::Ed25519; },
                              [](const Secp256k1PublicKey&) { return SignatureAlgorithm::Secp256k1; },
                              [](const Sr25519PublicKey&) { return SignatureAlgorithm::Sr25519; },
                          },
                          key_);
    }

    bool PublicKey::verify(const Context& context, const byte_vector& message, const byte_vector& signature) const {
        return std::visit([&](const auto& key) { return key.verify(context, message, signature); }, key_);
    }

    const byte_vector& PublicKey::bytes() const {
        return std::visit([](const auto& key) -> const byte_vector& { return key.bytes(); }, key_);
    }

    std::string PublicKey::to_base64() const {
        return ParaClient::to_base64(bytes());
    }

    CborValue PublicKey::to_cbor() const {
        CborValue out = CborValue::map();
        out.set(to_string(algorithm()), CborValue::bytes(bytes()));
        return out;
    }

} // namespace ParaClient
