#include "paraclient/signed_public_key.hpp"

#include <algorithm>

#include "paraclient/errors.hpp"

namespace ParaClient {

    // SignedPublicKey

    CborValue SignedPublicKey::to_cbor() const {
        CborValue out = CborValue::map();
        out.set("key", CborValue::bytes(byte_vector(key.data.begin(), key.data.end())));
        out.set("checksum", CborValue::bytes(checksum));
        out.set("signature", CborValue::bytes(signature));
        if (expiration) {
            out.set("expiration", CborValue::uint64(*expiration));
        }
        return out;
    }

    SignedPublicKey SignedPublicKey::from_cbor(const CborValue& value) {
        SignedPublicKey spk;
        const byte_vector& key = value.at("key").as_bytes();
        if (key.size() != spk.key.data.size()) {
            throw CodecError("Invalid SignedPublicKey data: bad key length.");
        }
        std::copy(key.begin(), key.end(), spk.key.data.begin());
        spk.checksum = value.at("checksum").as_bytes();
        spk.signature = value.at("signature").as_bytes();
        if (const CborValue* expiration = value.find("expiration")) {
            spk.expiration = expiration->as_uint();
        }
        return spk;
    }

    // CallDataPublicKeyResponse

    CborValue CallDataPublicKeyResponse::to_cbor() const {
        CborValue out = CborValue::map();
        out.set("public_key", public_key.to_cbor());
        if (epoch != 0) {
            out.set("epoch", CborValue::uint64(epoch));
        }
        return out;
    }

    CallDataPublicKeyResponse CallDataPublicKeyResponse::from_cbor(const CborValue& value) {
        CallDataPublicKeyResponse response;
        response.public_key = SignedPublicKey::from_cbor(value.at("public_key"));
        if (const CborValue* epoch = value.find("epoch")) {
            response.epoch = epoch->as_uint();
        }
        return response;
    }

} // namespace ParaClient
