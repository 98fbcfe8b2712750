#ifndef PARACLIENT_SIGNED_PUBLIC_KEY_HPP
#define PARACLIENT_SIGNED_PUBLIC_KEY_HPP

#include <cstdint>
#include <optional>

#include "bytes.hpp"
#include "callformat.hpp"
#include "cbor.hpp"
#include "keys.hpp"

namespace ParaClient {

    // Runtime call data public key as published by the key manager.
    struct SignedPublicKey {
        X25519PublicKey key;
        byte_vector checksum;
        byte_vector signature;              // Key manager signature
        std::optional<uint64_t> expiration; // Epoch after which the key is no longer valid

        CborValue to_cbor() const;
        static SignedPublicKey from_cbor(const CborValue& value);
    };

    // Response of the core.CallDataPublicKey query.
    struct CallDataPublicKeyResponse {
        SignedPublicKey public_key;
        uint64_t epoch = 0;

        // Encoding configuration for calls sealed to this key.
        EncodeConfig encode_config() const { return EncodeConfig{public_key.key, epoch}; }

        CborValue to_cbor() const;
        byte_vector encode() const { return to_cbor().encode(); }

        /**
         * @throws ParaClient::CodecError on malformed input.
         */
        static CallDataPublicKeyResponse from_cbor(const CborValue& value);
        static CallDataPublicKeyResponse decode(const byte_vector& data) { return from_cbor(CborValue::decode(data)); }
    };

} // namespace ParaClient

#endif // PARACLIENT_SIGNED_PUBLIC_KEY_HPP
