#include "paraclient/callformat.hpp"

#include <algorithm>

#include "paraclient/crypto.hpp"
#include "paraclient/errors.hpp"
#include "paraclient/log.hpp"

namespace ParaClient {

    namespace {

    Logger logger() {
        static Logger log = create_logger("callformat");
        return log;
    }

    template <size_t N>
    std::array<uint8_t, N> fixed_bytes(const CborValue& value, const char* what) {
        const byte_vector& bytes = value.as_bytes();
        if (bytes.size() != N) {
            throw CodecError(std::string("Malformed ") + what + ": unexpected length.");
        }
        std::array<uint8_t, N> out;
        std::copy(bytes.begin(), bytes.end(), out.begin());
        return out;
    }

    // An empty payload stands for CBOR null.
    byte_vector normalized_payload(const byte_vector& value) {
        return value.empty() ? byte_vector{0xf6} : value;
    }

    CallFormat parse_format(uint64_t value) {
        switch (value) {
            case static_cast<uint64_t>(CallFormat::Plain):
                return CallFormat::Plain;
            case static_cast<uint64_t>(CallFormat::EncryptedX25519DeoxysII):
                return CallFormat::EncryptedX25519DeoxysII;
            default:
                throw CodecError("Unsupported call format: " + std::to_string(value));
        }
    }

    } // namespace

    std::string to_string(CallFormat format) {
        switch (format) {
            case CallFormat::Plain:
                return "plain";
            case CallFormat::EncryptedX25519DeoxysII:
                return "encrypted/x25519-deoxysii";
        }
        return "[unknown]";
    }

    // --- Call ---

    CborValue Call::to_cbor() const {
        CborValue out = CborValue::map();
        if (format != CallFormat::Plain) {
            out.set("format", CborValue::uint64(static_cast<uint64_t>(format)));
        }
        if (!method.empty()) {
            out.set("method", CborValue::text(method));
        }
        out.set("body", CborValue::raw(body));
        if (read_only) {
            out.set("ro", CborValue::boolean(true));
        }
        return out;
    }

    Call Call::from_cbor(const CborValue& value) {
        Call call;
        if (const CborValue* format = value.find("format")) {
            call.format = parse_format(format->as_uint());
        }
        if (const CborValue* method = value.find("method")) {
            call.method = method->as_text();
        }
        if (const CborValue* body = value.find("body")) {
            if (!body->is_null()) {
                call.body = body->encode();
            }
        }
        if (const CborValue* ro = value.find("ro")) {
            call.read_only = ro->as_bool();
        }
        return call;
    }

    bool Call::operator==(const Call& other) const {
        return format == other.format && method == other.method && read_only == other.read_only &&
               normalized_payload(body) == normalized_payload(other.body);
    }

    // --- Results ---

    std::string FailedCallResult::to_string() const {
        return "module: " + module + " code: " + std::to_string(code) + " message: " + message;
    }

    CallResult CallResult::ok(byte_vector value) {
        return CallResult(Kind::Ok, std::move(value), {});
    }

    CallResult CallResult::failed(FailedCallResult failure) {
        return CallResult(Kind::Failed, {}, std::move(failure));
    }

    CallResult CallResult::unknown(byte_vector value) {
        return CallResult(Kind::Unknown, std::move(value), {});
    }

    const byte_vector& CallResult::value() const {
        if (kind_ == Kind::Failed) {
            throw LogicError("Failed call result has no value.");
        }
        return value_;
    }

    const FailedCallResult& CallResult::failure() const {
        if (kind_ != Kind::Failed) {
            throw LogicError("Call result is not a failure.");
        }
        return failure_;
    }

    CborValue CallResult::to_cbor() const {
        CborValue out = CborValue::map();
        switch (kind_) {
            case Kind::Ok:
                out.set("ok", CborValue::raw(value_));
                break;
            case Kind::Unknown:
                out.set("unknown", CborValue::raw(value_));
                break;
            case Kind::Failed: {
                CborValue fail = CborValue::map();
                fail.set("module", CborValue::text(failure_.module));
                fail.set("code", CborValue::uint64(failure_.code));
                if (!failure_.message.empty()) {
                    fail.set("message", CborValue::text(failure_.message));
                }
                out.set("fail", std::move(fail));
                break;
            }
        }
        return out;
    }

    CallResult CallResult::from_cbor(const CborValue& value) {
        if (value.as_map().size() != 1) {
            throw CodecError("Call result must have exactly one variant.");
        }
        if (const CborValue* ok = value.find("ok")) {
            return CallResult::ok(ok->encode());
        }
        if (const CborValue* unknown = value.find("unknown")) {
            return CallResult::unknown(unknown->encode());
        }
        if (const CborValue* fail = value.find("fail")) {
            FailedCallResult failure;
            failure.module = fail->at("module").as_text();
            const uint64_t code = fail->at("code").as_uint();
            if (code > UINT32_MAX) {
                throw CodecError("Call result error code out of range.");
            }
            failure.code = static_cast<uint32_t>(code);
            if (const CborValue* message = fail->find("message")) {
                failure.message = message->as_text();
            }
            return CallResult::failed(std::move(failure));
        }
        throw CodecError("Malformed call result.");
    }

    bool CallResult::operator==(const CallResult& other) const {
        if (kind_ != other.kind_) {
            return false;
        }
        if (kind_ == Kind::Failed) {
            return failure_ == other.failure_;
        }
        return normalized_payload(value_) == normalized_payload(other.value_);
    }

    // --- Envelopes ---

    CborValue CallEnvelope::to_cbor() const {
        CborValue out = CborValue::map();
        out.set("pk", CborValue::bytes(byte_vector(pk.data.begin(), pk.data.end())));
        out.set("nonce", CborValue::bytes(byte_vector(nonce.begin(), nonce.end())));
        if (epoch != 0) {
            out.set("epoch", CborValue::uint64(epoch));
        }
        out.set("data", CborValue::bytes(data));
        return out;
    }

    CallEnvelope CallEnvelope::from_cbor(const CborValue& value) {
        CallEnvelope envelope;
        envelope.pk.data = fixed_bytes<32>(value.at("pk"), "call envelope public key");
        envelope.nonce = fixed_bytes<DeoxysII::NONCE_SIZE>(value.at("nonce"), "call envelope nonce");
        if (const CborValue* epoch = value.find("epoch")) {
            envelope.epoch = epoch->as_uint();
        }
        envelope.data = value.at("data").as_bytes();
        return envelope;
    }

    CborValue ResultEnvelope::to_cbor() const {
        CborValue out = CborValue::map();
        out.set("nonce", CborValue::bytes(byte_vector(nonce.begin(), nonce.end())));
        out.set("data", CborValue::bytes(data));
        return out;
    }

    ResultEnvelope ResultEnvelope::from_cbor(const CborValue& value) {
        ResultEnvelope envelope;
        envelope.nonce = fixed_bytes<DeoxysII::NONCE_SIZE>(value.at("nonce"), "result envelope nonce");
        envelope.data = value.at("data").as_bytes();
        return envelope;
    }

    // --- Caller side ---

    CallMetadata::~CallMetadata() {
        secure_wipe(secret_.data);
    }

    EncodedCall encode_call(const Call& call, CallFormat format, const EncodeConfig& config) {
        switch (format) {
            case CallFormat::Plain:
                return EncodedCall{call, nullptr};
            case CallFormat::EncryptedX25519DeoxysII: {
                if (!config.public_key) {
                    throw CodecError("Runtime call data public key not set.");
                }
                X25519KeyPair ephemeral = Crypto::generate_x25519_keypair();
                EncodedCall encoded = encode_call_with_keys(call, ephemeral, Crypto::random_nonce(), config);
                secure_wipe(ephemeral.privateKey.data);
                return encoded;
            }
        }
        throw CodecError("Unsupported call format: " + to_string(format));
    }

    EncodedCall encode_call_with_keys(const Call& call,
                                      const X25519KeyPair& ephemeral,
                                      const DeoxysII::Nonce& nonce,
                                      const EncodeConfig& config) {
        if (!config.public_key) {
            throw CodecError("Runtime call data public key not set.");
        }

        CallEnvelope envelope;
        envelope.pk = ephemeral.publicKey;
        envelope.nonce = nonce;
        envelope.epoch = config.epoch;
        envelope.data = Crypto::box_seal(nonce, call.encode(), {}, *config.public_key, ephemeral.privateKey);

        EncodedCall encoded;
        encoded.call.format = CallFormat::EncryptedX25519DeoxysII;
        encoded.call.body = envelope.to_cbor().encode();
        encoded.call.read_only = call.read_only;
        encoded.metadata = std::make_unique<CallMetadata>(ephemeral.privateKey, *config.public_key);

        logger()->debug("Encoded call as {} (epoch {}, {} sealed bytes)",
                        to_string(encoded.call.format), envelope.epoch, envelope.data.size());
        return encoded;
    }

    CallResult decode_result(const CallResult& result, const CallMetadata* metadata) {
        if (metadata == nullptr) {
            return result;
        }
        if (result.kind() == CallResult::Kind::Failed) {
            // Submission may fail before call format processing, leaving the result plain.
            logger()->debug("Passing through failed result: {}", result.failure().to_string());
            return result;
        }

        ResultEnvelope envelope;
        try {
            envelope = ResultEnvelope::from_cbor(CborValue::decode(result.value()));
        } catch (const CodecError& e) {
            throw CodecError(std::string("Malformed result envelope: ") + e.what());
        }

        byte_vector plaintext;
        try {
            plaintext = Crypto::box_open(envelope.nonce, envelope.data, {}, metadata->runtime_public_key(),
                                         metadata->secret());
        } catch (const CodecError&) {
            logger()->debug("Result envelope failed to open");
            throw CodecError("call data decryption failed");
        }

        CallResult output = CallResult::decode(plaintext);
        secure_wipe(plaintext);
        return output;
    }

    // --- Runtime side ---

    DecodedCall decode_call(const Call& call, const X25519PrivateKey& runtime_secret) {
        if (call.format == CallFormat::Plain) {
            return DecodedCall{call, std::nullopt};
        }
        if (!call.method.empty()) {
            throw CodecError("Encrypted call must have an empty method.");
        }

        CallEnvelope envelope;
        try {
            envelope = CallEnvelope::from_cbor(CborValue::decode(call.body));
        } catch (const CodecError& e) {
            throw CodecError(std::string("Malformed call envelope: ") + e.what());
        }

        byte_vector plaintext;
        try {
            plaintext = Crypto::box_open(envelope.nonce, envelope.data, {}, envelope.pk, runtime_secret);
        } catch (const CodecError&) {
            throw CodecError("call data decryption failed");
        }
        return DecodedCall{Call::decode(plaintext), envelope.pk};
    }

    CallResult encode_result(const CallResult& result,
                             const DecodedCall& call,
                             const X25519PrivateKey& runtime_secret,
                             uint64_t round,
                             uint32_t index) {
        if (!call.caller_public_key) {
            return result;
        }

        ResultEnvelope envelope;
        const auto round_be = encode_be64(round);
        std::copy(round_be.begin(), round_be.end(), envelope.nonce.begin());
        for (int i = 0; i < 4; ++i) {
            envelope.nonce[8 + i] = static_cast<uint8_t>(index >> (24 - 8 * i));
        }
        envelope.data = Crypto::box_seal(envelope.nonce, result.encode(), {}, *call.caller_public_key, runtime_secret);
        return CallResult::unknown(envelope.to_cbor().encode());
    }

} // namespace ParaClient
