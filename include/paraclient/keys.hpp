#ifndef PARACLIENT_KEYS_HPP
#define PARACLIENT_KEYS_HPP

#include <array>
#include <cstdint>

namespace ParaClient {

    // An X25519 public key, used for call data key exchange.
    struct X25519PublicKey {
        std::array<uint8_t, 32> data{};

        bool operator==(const X25519PublicKey& other) const { return data == other.data; }
        bool operator!=(const X25519PublicKey& other) const { return data != other.data; }
    };

    // An X25519 private key.
    struct X25519PrivateKey {
        std::array<uint8_t, 32> data{};
    };

    // A key pair consisting of a public and a private key.
    struct X25519KeyPair {
        X25519PublicKey publicKey;
        X25519PrivateKey privateKey;
    };

} // namespace ParaClient

#endif // PARACLIENT_KEYS_HPP
