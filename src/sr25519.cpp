#include "paraclient/sr25519.hpp"

#include <sodium.h>

#include <algorithm>
#include <array>

#include "paraclient/errors.hpp"
#include "paraclient/hash.hpp"
#include "transcript.hpp"

namespace ParaClient {

    namespace {

        using Scalar = std::array<uint8_t, crypto_core_ristretto255_SCALARBYTES>;
        using Point = std::array<uint8_t, crypto_core_ristretto255_BYTES>;

        detail::Transcript signing_transcript(const Context& context, const byte_vector& message) {
            detail::Transcript t("SigningContext");
            t.append_message("", context.bytes());
            const Hash digest = sha512_256(message);
            t.append_message("sign-256", digest.data(), digest.size());
            return t;
        }

        Scalar challenge_scalar(detail::Transcript& t, const byte_vector& public_key, const uint8_t* r) {
            t.append_message("proto-name", to_bytes("Schnorr-sig"));
            t.append_message("sign:pk", public_key);
            t.append_message("sign:R", r, crypto_core_ristretto255_BYTES);

            uint8_t wide[crypto_core_ristretto255_NONREDUCEDSCALARBYTES];
            t.challenge_bytes("sign:c", wide, sizeof(wide));
            Scalar k;
            crypto_core_ristretto255_scalar_reduce(k.data(), wide);
            return k;
        }

        bool is_canonical_scalar(const uint8_t* s) {
            uint8_t wide[crypto_core_ristretto255_NONREDUCEDSCALARBYTES] = {0};
            std::copy(s, s + crypto_core_ristretto255_SCALARBYTES, wide);
            Scalar reduced;
            crypto_core_ristretto255_scalar_reduce(reduced.data(), wide);
            return sodium_memcmp(reduced.data(), s, reduced.size()) == 0;
        }

    } // namespace

    Sr25519PublicKey::Sr25519PublicKey(const byte_vector& bytes) : data_(bytes) {
        if (data_.size() != SIZE || crypto_core_ristretto255_is_valid_point(data_.data()) != 1) {
            throw InvalidArgument("Invalid sr25519 public key.");
        }
    }

    Sr25519PublicKey Sr25519PublicKey::from_base64(const std::string& text) {
        return Sr25519PublicKey(ParaClient::from_base64(text));
    }

    bool Sr25519PublicKey::verify(const Context& context, const byte_vector& message,
                                  const byte_vector& signature) const {
        if (context.empty()) {
            return false;
        }
        detail::Transcript t = signing_transcript(context, message);
        return verify_transcript(t, signature);
    }

    bool Sr25519PublicKey::verify_raw(const Context& context, const byte_vector& message,
                                      const byte_vector& signature) const {
        detail::Transcript t("SigningContext");
        t.append_message("", context.bytes());
        t.append_message("sign-bytes", message);
        return verify_transcript(t, signature);
    }

    bool Sr25519PublicKey::verify_transcript(detail::Transcript& t, const byte_vector& signature) const {
        if (signature.size() != SIGNATURE_SIZE) {
            return false;
        }
        // Schnorrkel marks its signatures by setting the top bit of s.
        if ((signature[63] & 0x80) == 0) {
            return false;
        }
        Scalar s;
        std::copy(signature.begin() + 32, signature.end(), s.begin());
        s[31] &= 0x7f;
        if (!is_canonical_scalar(s.data())) {
            return false;
        }

        Scalar k = challenge_scalar(t, data_, signature.data());

        // R' = s*B - k*A
        Point s_b;
        Point k_a;
        Point expected;
        if (crypto_scalarmult_ristretto255_base(s_b.data(), s.data()) != 0) {
            return false;
        }
        if (crypto_scalarmult_ristretto255(k_a.data(), k.data(), data_.data()) != 0) {
            return false;
        }
        if (crypto_core_ristretto255_sub(expected.data(), s_b.data(), k_a.data()) != 0) {
            return false;
        }
        return sodium_memcmp(expected.data(), signature.data(), expected.size()) == 0;
    }

    std::string Sr25519PublicKey::to_base64() const {
        return ParaClient::to_base64(data_);
    }

    Sr25519Signer::Sr25519Signer(byte_vector key, Sr25519PublicKey public_key)
        : key_(std::move(key)), public_key_(std::move(public_key)) {}

    Sr25519Signer::~Sr25519Signer() {
        secure_wipe(key_);
    }

    Sr25519Signer& Sr25519Signer::operator=(Sr25519Signer&& other) noexcept {
        if (this != &other) {
            secure_wipe(key_);
            key_ = std::move(other.key_);
            public_key_ = std::move(other.public_key_);
        }
        return *this;
    }

    Sr25519Signer Sr25519Signer::generate() {
        byte_vector seed(MINI_SECRET_SIZE);
        randombytes_buf(seed.data(), seed.size());
        Sr25519Signer signer = from_seed(seed);
        sodium_memzero(seed.data(), seed.size());
        return signer;
    }

    Sr25519Signer Sr25519Signer::from_seed(const byte_vector& mini_secret) {
        if (mini_secret.size() != MINI_SECRET_SIZE) {
            throw InvalidArgument("Invalid sr25519 mini secret key size.");
        }
        auto h = sha512(mini_secret);

        byte_vector key(h.begin(), h.begin() + 32);
        key[0] &= 248;
        key[31] &= 63;
        key[31] |= 64;
        // Divide by the cofactor so the scalar works on the ristretto group.
        uint8_t low = 0;
        for (int i = 31; i >= 0; --i) {
            const uint8_t b = key[i];
            key[i] = static_cast<uint8_t>((b >> 3) | (low << 5));
            low = b & 0x07;
        }
        sodium_memzero(h.data(), h.size());

        byte_vector pk(crypto_core_ristretto255_BYTES);
        if (crypto_scalarmult_ristretto255_base(pk.data(), key.data()) != 0) {
            secure_wipe(key);
            throw InvalidArgument("Degenerate sr25519 secret key.");
        }
        return Sr25519Signer(std::move(key), Sr25519PublicKey(pk));
    }

    byte_vector Sr25519Signer::context_sign(const Context& context, const byte_vector& message) const {
        if (is_reset()) {
            throw SignatureError("Sr25519 signer has been reset.");
        }
        if (context.empty()) {
            throw SignatureError("Sr25519 signing requires a non-empty context.");
        }

        Scalar r;
        crypto_core_ristretto255_scalar_random(r.data());
        Point big_r;
        if (crypto_scalarmult_ristretto255_base(big_r.data(), r.data()) != 0) {
            sodium_memzero(r.data(), r.size());
            throw SignatureError("Sr25519 nonce commitment failed.");
        }

        detail::Transcript t = signing_transcript(context, message);
        Scalar k = challenge_scalar(t, public_key_.bytes(), big_r.data());

        // s = k*key + r
        Scalar s;
        crypto_core_ristretto255_scalar_mul(s.data(), k.data(), key_.data());
        crypto_core_ristretto255_scalar_add(s.data(), s.data(), r.data());
        sodium_memzero(r.data(), r.size());

        byte_vector sig(Sr25519PublicKey::SIGNATURE_SIZE);
        std::copy(big_r.begin(), big_r.end(), sig.begin());
        std::copy(s.begin(), s.end(), sig.begin() + 32);
        sig[63] |= 0x80;
        return sig;
    }

    void Sr25519Signer::reset() {
        secure_wipe(key_);
        key_.clear();
        key_.shrink_to_fit();
    }

} // namespace ParaClient
