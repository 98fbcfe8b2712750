#include "paraclient/callformat.hpp"

#include <gtest/gtest.h>

#include <string>

#include "paraclient/bytes.hpp"
#include "paraclient/crypto.hpp"
#include "paraclient/errors.hpp"
#include "paraclient/hash.hpp"
#include "paraclient/signed_public_key.hpp"

namespace {

    ParaClient::X25519KeyPair keypair_from_label(const std::string& label) {
        auto digest = ParaClient::sha512_256(ParaClient::to_bytes(label));
        ParaClient::X25519PrivateKey sk;
        sk.data = digest;
        return ParaClient::Crypto::x25519_keypair_from_private(sk);
    }

    const std::string PLAIN_CALL_HEX = "a264626f6479f6666d6574686f64646d6f636b";
    const std::string ENCRYPTED_CALL_HEX =
        "a264626f6479a462706b5820eedc75d3c500fc1b2d321757c383e276ab705c5a02013b3f1966e9caf73cdb0264646174615823c4635f"
        "2f9496a033a578e3f1e007be5d6cfa9631fb2fe2c8c76d26b322b6afb2fa5cdf6565706f636801656e6f6e63654f0000000000000000"
        "0000000000000066666f726d617401";
    const std::string RESULT_HEX = "a1626f6bf6";
    template <typename F>
    void expect_decryption_failure(F&& decode, const std::string& where) {
        try {
            decode();
            ADD_FAILURE() << "decoding succeeded after flipping " << where;
        } catch (const ParaClient::CodecError& e) {
            EXPECT_STREQ(e.what(), "call data decryption failed") << where;
        }
    }

    const std::string ENCRYPTED_RESULT_HEX =
        "a167756e6b6e6f776ea264646174615528d1c5eedc5e54e1ef140ba905e84e0bea8daf60af656e6f6e63654f000000000000000000"
        "000000000000";

} // namespace

class CallFormatTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(ParaClient::Crypto::init(), 0);
        client_ = keypair_from_label("callformat test client");
        runtime_ = keypair_from_label("callformat test runtime");
        config_.public_key = runtime_.publicKey;
        config_.epoch = 1;
        call_.method = "mock";
    }

    ParaClient::X25519KeyPair client_;
    ParaClient::X25519KeyPair runtime_;
    ParaClient::EncodeConfig config_;
    ParaClient::Call call_;
};

TEST_F(CallFormatTest, InteropFixture) {
    // 1. Plain call encoding
    ASSERT_EQ(ParaClient::to_hex(call_.encode()), PLAIN_CALL_HEX);

    // 2. Encrypt with fixed keys and an all-zero nonce
    ParaClient::DeoxysII::Nonce nonce{};
    auto encoded = ParaClient::encode_call_with_keys(call_, client_, nonce, config_);
    ASSERT_EQ(ParaClient::to_hex(encoded.call.encode()), ENCRYPTED_CALL_HEX);
    ASSERT_NE(encoded.metadata, nullptr);

    // 3. Decode the runtime's sealed result
    auto sealed = ParaClient::CallResult::decode(ParaClient::from_hex(ENCRYPTED_RESULT_HEX));
    ASSERT_TRUE(sealed.is_unknown());
    auto result = ParaClient::decode_result(sealed, encoded.metadata.get());
    ASSERT_EQ(result, ParaClient::CallResult::decode(ParaClient::from_hex(RESULT_HEX)));
    ASSERT_EQ(result.kind(), ParaClient::CallResult::Kind::Ok);
    ASSERT_EQ(ParaClient::to_hex(result.value()), "f6");
}

TEST_F(CallFormatTest, FixtureResultInOkSlot) {
    ParaClient::DeoxysII::Nonce nonce{};
    auto encoded = ParaClient::encode_call_with_keys(call_, client_, nonce, config_);

    // The same envelope delivered as a successful result opens as well
    auto sealed = ParaClient::CallResult::decode(ParaClient::from_hex(ENCRYPTED_RESULT_HEX));
    auto as_ok = ParaClient::CallResult::ok(sealed.value());
    auto result = ParaClient::decode_result(as_ok, encoded.metadata.get());
    ASSERT_EQ(ParaClient::to_hex(result.encode()), RESULT_HEX);
}

TEST_F(CallFormatTest, RuntimeSideMatchesFixture) {
    ParaClient::DeoxysII::Nonce nonce{};
    auto encoded = ParaClient::encode_call_with_keys(call_, client_, nonce, config_);

    // 1. The runtime opens the call
    auto decoded = ParaClient::decode_call(encoded.call, runtime_.privateKey);
    ASSERT_EQ(decoded.call, call_);
    ASSERT_TRUE(decoded.caller_public_key.has_value());
    ASSERT_EQ(*decoded.caller_public_key, client_.publicKey);

    // 2. Result of round 0, index 0 reproduces the sealed fixture
    auto sealed = ParaClient::encode_result(ParaClient::CallResult::decode(ParaClient::from_hex(RESULT_HEX)),
                                            decoded, runtime_.privateKey, 0, 0);
    ASSERT_EQ(ParaClient::to_hex(sealed.encode()), ENCRYPTED_RESULT_HEX);
}

TEST_F(CallFormatTest, RandomizedRoundTrip) {
    // 1. Encode with fresh ephemeral keys
    call_.body = ParaClient::CborValue::text("secret arguments").encode();
    call_.read_only = true;
    auto encoded = ParaClient::encode_call(call_, ParaClient::CallFormat::EncryptedX25519DeoxysII, config_);
    ASSERT_EQ(encoded.call.format, ParaClient::CallFormat::EncryptedX25519DeoxysII);
    ASSERT_TRUE(encoded.call.method.empty());
    ASSERT_TRUE(encoded.call.read_only);

    // 2. Two encodings of the same call differ
    auto again = ParaClient::encode_call(call_, ParaClient::CallFormat::EncryptedX25519DeoxysII, config_);
    ASSERT_NE(encoded.call.body, again.call.body);

    // 3. Runtime decodes and answers at round 7, index 3
    auto decoded = ParaClient::decode_call(encoded.call, runtime_.privateKey);
    ASSERT_EQ(decoded.call, call_);
    auto answer = ParaClient::CallResult::ok(ParaClient::CborValue::uint64(42).encode());
    auto sealed = ParaClient::encode_result(answer, decoded, runtime_.privateKey, 7, 3);

    auto envelope = ParaClient::ResultEnvelope::from_cbor(ParaClient::CborValue::decode(sealed.value()));
    ASSERT_EQ(ParaClient::to_hex(envelope.nonce), "000000000000000700000003000000");

    // 4. Client opens the answer
    ASSERT_EQ(ParaClient::decode_result(sealed, encoded.metadata.get()), answer);
}

TEST_F(CallFormatTest, PlainFormatPassesThrough) {
    auto encoded = ParaClient::encode_call(call_, ParaClient::CallFormat::Plain, {});
    ASSERT_EQ(encoded.call, call_);
    ASSERT_EQ(encoded.metadata, nullptr);

    auto result = ParaClient::CallResult::ok(ParaClient::from_hex("f6"));
    ASSERT_EQ(ParaClient::decode_result(result, nullptr), result);

    auto decoded = ParaClient::decode_call(call_, runtime_.privateKey);
    ASSERT_FALSE(decoded.caller_public_key.has_value());
    ASSERT_EQ(ParaClient::encode_result(result, decoded, runtime_.privateKey, 1, 1), result);
}

TEST_F(CallFormatTest, FailedResultPassesThrough) {
    ParaClient::DeoxysII::Nonce nonce{};
    auto encoded = ParaClient::encode_call_with_keys(call_, client_, nonce, config_);

    auto failed = ParaClient::CallResult::failed({"core", 3, "out of gas"});
    auto decoded = ParaClient::decode_result(failed, encoded.metadata.get());
    ASSERT_EQ(decoded, failed);
    ASSERT_EQ(decoded.failure().module, "core");
    ASSERT_THROW(decoded.value(), ParaClient::LogicError);
}

TEST_F(CallFormatTest, DecryptionFailure) {
    ParaClient::DeoxysII::Nonce nonce{};
    auto encoded = ParaClient::encode_call_with_keys(call_, client_, nonce, config_);

    // 1. A result sealed for another caller
    auto other = ParaClient::Crypto::generate_x25519_keypair();
    ParaClient::CallMetadata wrong(other.privateKey, runtime_.publicKey);
    auto sealed = ParaClient::CallResult::decode(ParaClient::from_hex(ENCRYPTED_RESULT_HEX));
    try {
        ParaClient::decode_result(sealed, &wrong);
        FAIL() << "decryption should fail";
    } catch (const ParaClient::CodecError& e) {
        ASSERT_STREQ(e.what(), "call data decryption failed");
    }

    // 2. A payload that is not an envelope
    auto garbage = ParaClient::CallResult::unknown(ParaClient::CborValue::text("nope").encode());
    ASSERT_THROW(ParaClient::decode_result(garbage, encoded.metadata.get()), ParaClient::CodecError);

    // 3. The runtime refuses an encrypted call with an outer method
    auto tampered = encoded.call;
    tampered.method = "mock";
    ASSERT_THROW(ParaClient::decode_call(tampered, runtime_.privateKey), ParaClient::CodecError);
}

TEST_F(CallFormatTest, SingleByteFlipsAreRejected) {
    ParaClient::DeoxysII::Nonce zero{};
    auto encoded = ParaClient::encode_call_with_keys(call_, client_, zero, config_);
    const auto envelope = ParaClient::CallEnvelope::from_cbor(ParaClient::CborValue::decode(encoded.call.body));

    auto call_with = [&](const ParaClient::CallEnvelope& changed) {
        ParaClient::Call call = encoded.call;
        call.body = changed.to_cbor().encode();
        return call;
    };

    // 1. Call envelope: ciphertext, nonce and ephemeral key
    for (size_t i = 0; i < envelope.data.size(); ++i) {
        auto changed = envelope;
        changed.data[i] ^= 0x01;
        expect_decryption_failure([&] { ParaClient::decode_call(call_with(changed), runtime_.privateKey); },
                                  "call data byte " + std::to_string(i));
    }
    for (size_t i = 0; i < envelope.nonce.size(); ++i) {
        auto changed = envelope;
        changed.nonce[i] ^= 0x01;
        expect_decryption_failure([&] { ParaClient::decode_call(call_with(changed), runtime_.privateKey); },
                                  "call nonce byte " + std::to_string(i));
    }
    for (size_t i = 0; i < envelope.pk.data.size(); ++i) {
        auto changed = envelope;
        changed.pk.data[i] ^= 0x01;
        expect_decryption_failure([&] { ParaClient::decode_call(call_with(changed), runtime_.privateKey); },
                                  "call public key byte " + std::to_string(i));
    }

    // 2. Result envelope: ciphertext, nonce and the runtime key used to open it
    auto sealed = ParaClient::CallResult::decode(ParaClient::from_hex(ENCRYPTED_RESULT_HEX));
    const auto result_envelope = ParaClient::ResultEnvelope::from_cbor(ParaClient::CborValue::decode(sealed.value()));
    auto result_with = [](const ParaClient::ResultEnvelope& changed) {
        return ParaClient::CallResult::unknown(changed.to_cbor().encode());
    };

    for (size_t i = 0; i < result_envelope.data.size(); ++i) {
        auto changed = result_envelope;
        changed.data[i] ^= 0x01;
        expect_decryption_failure([&] { ParaClient::decode_result(result_with(changed), encoded.metadata.get()); },
                                  "result data byte " + std::to_string(i));
    }
    for (size_t i = 0; i < result_envelope.nonce.size(); ++i) {
        auto changed = result_envelope;
        changed.nonce[i] ^= 0x01;
        expect_decryption_failure([&] { ParaClient::decode_result(result_with(changed), encoded.metadata.get()); },
                                  "result nonce byte " + std::to_string(i));
    }
    for (size_t i = 0; i < runtime_.publicKey.data.size(); ++i) {
        auto runtime_pk = runtime_.publicKey;
        runtime_pk.data[i] ^= 0x01;
        ParaClient::CallMetadata changed(client_.privateKey, runtime_pk);
        expect_decryption_failure([&] { ParaClient::decode_result(sealed, &changed); },
                                  "runtime public key byte " + std::to_string(i));
    }
}

TEST_F(CallFormatTest, MissingRuntimeKey) {
    ASSERT_THROW(ParaClient::encode_call(call_, ParaClient::CallFormat::EncryptedX25519DeoxysII, {}),
                 ParaClient::CodecError);
}

TEST_F(CallFormatTest, CallCodec) {
    // Unknown formats are rejected.
    ParaClient::CborValue raw = ParaClient::CborValue::map();
    raw.set("format", ParaClient::CborValue::uint64(9));
    raw.set("method", ParaClient::CborValue::text("x"));
    raw.set("body", ParaClient::CborValue::null());
    ASSERT_THROW(ParaClient::Call::from_cbor(raw), ParaClient::CodecError);

    // Read-only flag is carried as "ro".
    call_.read_only = true;
    auto encoded = call_.to_cbor();
    ASSERT_TRUE(encoded.at("ro").as_bool());
    ASSERT_EQ(ParaClient::Call::decode(call_.encode()), call_);
    ASSERT_EQ(ParaClient::to_string(ParaClient::CallFormat::EncryptedX25519DeoxysII), "encrypted/x25519-deoxysii");
}

TEST_F(CallFormatTest, CallDataPublicKeyResponse) {
    ParaClient::CallDataPublicKeyResponse response;
    response.public_key.key = runtime_.publicKey;
    response.public_key.checksum = ParaClient::byte_vector(32, 0xaa);
    response.public_key.signature = ParaClient::byte_vector(64, 0xbb);
    response.public_key.expiration = 10;
    response.epoch = 5;

    auto decoded = ParaClient::CallDataPublicKeyResponse::decode(response.encode());
    ASSERT_EQ(decoded.public_key.key, runtime_.publicKey);
    ASSERT_EQ(decoded.public_key.checksum, response.public_key.checksum);
    ASSERT_EQ(decoded.public_key.expiration, std::optional<uint64_t>(10));
    ASSERT_EQ(decoded.epoch, 5u);

    auto config = decoded.encode_config();
    ASSERT_EQ(*config.public_key, runtime_.publicKey);
    ASSERT_EQ(config.epoch, 5u);
}
