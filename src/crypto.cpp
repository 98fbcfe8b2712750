#include "paraclient/crypto.hpp"

#include <sodium.h>

#include <atomic>

#include "paraclient/errors.hpp"
#include "paraclient/hash.hpp"

namespace ParaClient {

    static std::atomic<bool> g_sodium_initialized{false};

    int Crypto::init() {
        if (g_sodium_initialized) {
            return 0;  // Already successfully initialized
        }

        if (sodium_init() < 0) {
            return -1;  // Initialization failed
        }

        g_sodium_initialized = true;
        return 0;
    }

    byte_vector Crypto::random_bytes(size_t size) {
        byte_vector out(size);
        randombytes_buf(out.data(), out.size());
        return out;
    }

    DeoxysII::Nonce Crypto::random_nonce() {
        DeoxysII::Nonce nonce;
        randombytes_buf(nonce.data(), nonce.size());
        return nonce;
    }

    X25519KeyPair Crypto::generate_x25519_keypair() {
        X25519KeyPair kp;
        crypto_box_keypair(kp.publicKey.data.data(), kp.privateKey.data.data());
        return kp;
    }

    X25519KeyPair Crypto::x25519_keypair_from_private(const X25519PrivateKey& private_key) {
        X25519KeyPair kp;
        kp.privateKey = private_key;
        if (crypto_scalarmult_base(kp.publicKey.data.data(), kp.privateKey.data.data()) != 0) {
            throw InvalidArgument("Invalid X25519 private key.");
        }
        return kp;
    }

    byte_vector Crypto::derive_symmetric_key(const X25519PublicKey& peer_public_key,
                                             const X25519PrivateKey& private_key) {
        byte_vector shared(crypto_scalarmult_BYTES);
        if (crypto_scalarmult(shared.data(), private_key.data.data(), peer_public_key.data.data()) != 0) {
            sodium_memzero(shared.data(), shared.size());
            throw CodecError("Failed to compute X25519 shared secret.");
        }

        const byte_vector tweak(BOX_KDF_TWEAK, BOX_KDF_TWEAK + sizeof(BOX_KDF_TWEAK) - 1);
        Hash derived = hmac_sha512_256(tweak, shared);
        sodium_memzero(shared.data(), shared.size());

        byte_vector key(derived.begin(), derived.end());
        sodium_memzero(derived.data(), derived.size());
        return key;
    }

    byte_vector Crypto::box_seal(const DeoxysII::Nonce& nonce,
                                 const byte_vector& plaintext,
                                 const byte_vector& associated_data,
                                 const X25519PublicKey& peer_public_key,
                                 const X25519PrivateKey& private_key) {
        byte_vector key = derive_symmetric_key(peer_public_key, private_key);
        DeoxysII aead(key);
        sodium_memzero(key.data(), key.size());
        return aead.seal(nonce, plaintext, associated_data);
    }

    byte_vector Crypto::box_open(const DeoxysII::Nonce& nonce,
                                 const byte_vector& ciphertext,
                                 const byte_vector& associated_data,
                                 const X25519PublicKey& peer_public_key,
                                 const X25519PrivateKey& private_key) {
        byte_vector key = derive_symmetric_key(peer_public_key, private_key);
        DeoxysII aead(key);
        sodium_memzero(key.data(), key.size());
        return aead.open(nonce, ciphertext, associated_data);
    }

} // namespace ParaClient
