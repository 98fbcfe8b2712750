#include "paraclient/signer.hpp"

namespace ParaClient {

    PublicKey Signer::public_key() const {
        return std::visit([](const auto& signer) { return PublicKey(signer.public_key()); }, signer_);
    }

    byte_vector Signer::context_sign(const Context& context, const byte_vector& message) const {
        return std::visit([&](const auto& signer) { return signer.context_sign(context, message); }, signer_);
    }

    void Signer::reset() {
        std::visit([](auto& signer) { signer.reset(); }, signer_);
    }

    bool Signer::is_reset() const {
        return std::visit([](const auto& signer) { return signer.is_reset(); }, signer_);
    }

} // namespace ParaClient
