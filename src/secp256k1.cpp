#include "paraclient/secp256k1.hpp"

#include <algorithm>
#include <memory>

#include <secp256k1.h>
#include <sodium.h>

#include "paraclient/errors.hpp"
#include "paraclient/hash.hpp"
#include "secp256k1_context.hpp"

namespace ParaClient {

    namespace detail {

        const secp256k1_context* secp256k1_ctx() {
            static const std::unique_ptr<secp256k1_context, decltype(&secp256k1_context_destroy)> context(
                secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY),
                secp256k1_context_destroy);
            return context.get();
        }

    } // namespace detail

    namespace {

        Hash prepare_signer_message(const Context& context, const byte_vector& message) {
            return sha512_256(context.bytes(), message);
        }

        secp256k1_pubkey parse_public_key(const byte_vector& bytes) {
            secp256k1_pubkey pubkey;
            if (secp256k1_ec_pubkey_parse(detail::secp256k1_ctx(), &pubkey, bytes.data(), bytes.size()) != 1) {
                throw InvalidArgument("Malformed secp256k1 public key.");
            }
            return pubkey;
        }

        byte_vector serialize_public_key(const secp256k1_pubkey& pubkey, unsigned int flags, size_t size) {
            byte_vector out(size);
            size_t out_len = out.size();
            if (secp256k1_ec_pubkey_serialize(detail::secp256k1_ctx(), out.data(), &out_len, &pubkey, flags) != 1 ||
                out_len != size) {
                throw RuntimeError("Failed to serialize secp256k1 public key.");
            }
            return out;
        }

    } // namespace

    Secp256k1PublicKey::Secp256k1PublicKey(const byte_vector& bytes) {
        if (bytes.size() != COMPRESSED_SIZE && bytes.size() != UNCOMPRESSED_SIZE) {
            throw InvalidArgument("Invalid secp256k1 public key size.");
        }
        data_ = serialize_public_key(parse_public_key(bytes), SECP256K1_EC_COMPRESSED, COMPRESSED_SIZE);
    }

    Secp256k1PublicKey Secp256k1PublicKey::from_base64(const std::string& text) {
        return Secp256k1PublicKey(ParaClient::from_base64(text));
    }

    bool Secp256k1PublicKey::verify(const Context& context, const byte_vector& message,
                                    const byte_vector& signature) const {
        const secp256k1_context* ctx = detail::secp256k1_ctx();
        secp256k1_ecdsa_signature sig;
        if (signature.empty() || secp256k1_ecdsa_signature_parse_der(ctx, &sig, signature.data(), signature.size()) != 1) {
            return false;
        }
        // Accept high-S encodings the way the reference verifier does.
        secp256k1_ecdsa_signature_normalize(ctx, &sig, &sig);

        secp256k1_pubkey pubkey;
        if (secp256k1_ec_pubkey_parse(ctx, &pubkey, data_.data(), data_.size()) != 1) {
            return false;
        }
        const Hash digest = prepare_signer_message(context, message);
        return secp256k1_ecdsa_verify(ctx, &sig, digest.data(), &pubkey) == 1;
    }

    byte_vector Secp256k1PublicKey::uncompressed() const {
        return serialize_public_key(parse_public_key(data_), SECP256K1_EC_UNCOMPRESSED, UNCOMPRESSED_SIZE);
    }

    std::array<uint8_t, 20> Secp256k1PublicKey::eth_address() const {
        const byte_vector full = uncompressed();
        const Hash h = keccak256(byte_vector(full.begin() + 1, full.end()));
        std::array<uint8_t, 20> out{};
        std::copy(h.begin() + 12, h.end(), out.begin());
        return out;
    }

    std::string Secp256k1PublicKey::to_base64() const {
        return ParaClient::to_base64(data_);
    }

    Secp256k1Signer::Secp256k1Signer(byte_vector secret, Secp256k1PublicKey public_key)
        : secret_(std::move(secret)), public_key_(std::move(public_key)) {}

    Secp256k1Signer::~Secp256k1Signer() {
        secure_wipe(secret_);
    }

    Secp256k1Signer& Secp256k1Signer::operator=(Secp256k1Signer&& other) noexcept {
        if (this != &other) {
            secure_wipe(secret_);
            secret_ = std::move(other.secret_);
            public_key_ = std::move(other.public_key_);
        }
        return *this;
    }

    Secp256k1Signer Secp256k1Signer::generate() {
        byte_vector key(PRIVATE_KEY_SIZE);
        do {
            randombytes_buf(key.data(), key.size());
        } while (secp256k1_ec_seckey_verify(detail::secp256k1_ctx(), key.data()) != 1);
        Secp256k1Signer signer = from_private_key(key);
        sodium_memzero(key.data(), key.size());
        return signer;
    }

    Secp256k1Signer Secp256k1Signer::from_private_key(const byte_vector& private_key) {
        const secp256k1_context* ctx = detail::secp256k1_ctx();
        if (private_key.size() != PRIVATE_KEY_SIZE || secp256k1_ec_seckey_verify(ctx, private_key.data()) != 1) {
            throw InvalidArgument("Invalid secp256k1 private key.");
        }
        secp256k1_pubkey pubkey;
        if (secp256k1_ec_pubkey_create(ctx, &pubkey, private_key.data()) != 1) {
            throw InvalidArgument("Invalid secp256k1 private key.");
        }
        Secp256k1PublicKey public_key(serialize_public_key(pubkey, SECP256K1_EC_COMPRESSED,
                                                           Secp256k1PublicKey::COMPRESSED_SIZE));
        return Secp256k1Signer(private_key, std::move(public_key));
    }

    byte_vector Secp256k1Signer::context_sign(const Context& context, const byte_vector& message) const {
        if (is_reset()) {
            throw SignatureError("Secp256k1 signer has been reset.");
        }
        const secp256k1_context* ctx = detail::secp256k1_ctx();
        const Hash digest = prepare_signer_message(context, message);

        secp256k1_ecdsa_signature sig;
        if (secp256k1_ecdsa_sign(ctx, &sig, digest.data(), secret_.data(), secp256k1_nonce_function_rfc6979,
                                 nullptr) != 1) {
            throw SignatureError("Secp256k1 signing failed.");
        }
        byte_vector der(72);
        size_t der_len = der.size();
        if (secp256k1_ecdsa_signature_serialize_der(ctx, der.data(), &der_len, &sig) != 1) {
            throw SignatureError("Failed to serialize secp256k1 signature.");
        }
        der.resize(der_len);
        return der;
    }

    void Secp256k1Signer::reset() {
        secure_wipe(secret_);
        secret_.clear();
        secret_.shrink_to_fit();
    }

} // namespace ParaClient
