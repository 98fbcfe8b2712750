#include "paraclient/ed25519.hpp"

#include <sodium.h>

#include "paraclient/errors.hpp"
#include "paraclient/hash.hpp"

namespace ParaClient {

    namespace {

        Hash prepare_signer_message(const Context& context, const byte_vector& message) {
            return sha512_256(context.bytes(), message);
        }

    } // namespace

    Ed25519PublicKey::Ed25519PublicKey(const byte_vector& bytes) : data_(bytes) {
        if (data_.size() != SIZE) {
            throw InvalidArgument("Invalid Ed25519 public key size.");
        }
    }

    Ed25519PublicKey Ed25519PublicKey::from_base64(const std::string& text) {
        return Ed25519PublicKey(ParaClient::from_base64(text));
    }

    bool Ed25519PublicKey::verify(const Context& context, const byte_vector& message,
                                  const byte_vector& signature) const {
        if (signature.size() != SIGNATURE_SIZE || context.empty()) {
            return false;
        }
        const Hash digest = prepare_signer_message(context, message);
        return crypto_sign_verify_detached(signature.data(), digest.data(), digest.size(), data_.data()) == 0;
    }

    std::string Ed25519PublicKey::to_base64() const {
        return ParaClient::to_base64(data_);
    }

    Ed25519Signer::Ed25519Signer(byte_vector secret, Ed25519PublicKey public_key)
        : secret_(std::move(secret)), public_key_(std::move(public_key)) {}

    Ed25519Signer::~Ed25519Signer() {
        secure_wipe(secret_);
    }

    Ed25519Signer& Ed25519Signer::operator=(Ed25519Signer&& other) noexcept {
        if (this != &other) {
            secure_wipe(secret_);
            secret_ = std::move(other.secret_);
            public_key_ = std::move(other.public_key_);
        }
        return *this;
    }

    Ed25519Signer Ed25519Signer::generate() {
        byte_vector seed(SEED_SIZE);
        randombytes_buf(seed.data(), seed.size());
        Ed25519Signer signer = from_seed(seed);
        sodium_memzero(seed.data(), seed.size());
        return signer;
    }

    Ed25519Signer Ed25519Signer::from_seed(const byte_vector& seed) {
        if (seed.size() != SEED_SIZE) {
            throw InvalidArgument("Invalid Ed25519 seed size.");
        }
        byte_vector pk(crypto_sign_PUBLICKEYBYTES);
        byte_vector sk(crypto_sign_SECRETKEYBYTES);
        crypto_sign_seed_keypair(pk.data(), sk.data(), seed.data());
        return Ed25519Signer(std::move(sk), Ed25519PublicKey(pk));
    }

    byte_vector Ed25519Signer::context_sign(const Context& context, const byte_vector& message) const {
        if (is_reset()) {
            throw SignatureError("Ed25519 signer has been reset.");
        }
        if (context.empty()) {
            throw SignatureError("Ed25519 signing requires a non-empty context.");
        }
        const Hash digest = prepare_signer_message(context, message);
        byte_vector sig(crypto_sign_BYTES);
        crypto_sign_detached(sig.data(), nullptr, digest.data(), digest.size(), secret_.data());
        return sig;
    }

    void Ed25519Signer::reset() {
        secure_wipe(secret_);
        secret_.clear();
        secret_.shrink_to_fit();
    }

} // namespace ParaClient
