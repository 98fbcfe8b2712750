#ifndef PARACLIENT_CALLFORMAT_HPP
#define PARACLIENT_CALLFORMAT_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "bytes.hpp"
#include "cbor.hpp"
#include "deoxysii.hpp"
#include "keys.hpp"

namespace ParaClient {

    enum class CallFormat : uint8_t {
        Plain = 0,
        EncryptedX25519DeoxysII = 1
    };

    std::string to_string(CallFormat format);

    /**
     * @brief A method call.
     *
     * `body` holds the CBOR encoding of the call arguments. An empty body
     * is carried as CBOR null on the wire.
     */
    struct Call {
        CallFormat format = CallFormat::Plain;
        std::string method;
        byte_vector body;
        bool read_only = false;

        CborValue to_cbor() const;
        byte_vector encode() const { return to_cbor().encode(); }

        /**
         * @throws ParaClient::CodecError on malformed input or an unsupported format.
         */
        static Call from_cbor(const CborValue& value);
        static Call decode(const byte_vector& data) { return from_cbor(CborValue::decode(data)); }

        bool operator==(const Call& other) const;
        bool operator!=(const Call& other) const { return !(*this == other); }
    };

    struct FailedCallResult {
        std::string module;
        uint32_t code = 0;
        std::string message;

        std::string to_string() const;

        bool operator==(const FailedCallResult& other) const {
            return module == other.module && code == other.code && message == other.message;
        }
    };

    /**
     * @brief Outcome of a call: `ok`, `fail` or `unknown`.
     *
     * The ok and unknown payloads are kept as raw CBOR.
     */
    class CallResult {
    public:
        enum class Kind {
            Ok,
            Failed,
            Unknown
        };

        static CallResult ok(byte_vector value);
        static CallResult failed(FailedCallResult failure);
        static CallResult unknown(byte_vector value);

        Kind kind() const { return kind_; }
        bool is_success() const { return kind_ != Kind::Failed; }
        bool is_unknown() const { return kind_ == Kind::Unknown; }

        /**
         * @brief Raw CBOR of the ok or unknown payload.
         * @throws ParaClient::LogicError for a failed result.
         */
        const byte_vector& value() const;

        /**
         * @throws ParaClient::LogicError unless the result is a failure.
         */
        const FailedCallResult& failure() const;

        CborValue to_cbor() const;
        byte_vector encode() const { return to_cbor().encode(); }

        static CallResult from_cbor(const CborValue& value);
        static CallResult decode(const byte_vector& data) { return from_cbor(CborValue::decode(data)); }

        bool operator==(const CallResult& other) const;
        bool operator!=(const CallResult& other) const { return !(*this == other); }

    private:
        CallResult(Kind kind, byte_vector value, FailedCallResult failure)
            : kind_(kind), value_(std::move(value)), failure_(std::move(failure)) {}

        Kind kind_;
        byte_vector value_;
        FailedCallResult failure_;
    };

    // Encrypted call body.
    struct CallEnvelope {
        X25519PublicKey pk;
        DeoxysII::Nonce nonce{};
        uint64_t epoch = 0;
        byte_vector data;

        CborValue to_cbor() const;
        static CallEnvelope from_cbor(const CborValue& value);
    };

    // Encrypted result payload.
    struct ResultEnvelope {
        DeoxysII::Nonce nonce{};
        byte_vector data;

        CborValue to_cbor() const;
        static ResultEnvelope from_cbor(const CborValue& value);
    };

    struct EncodeConfig {
        // Runtime call data public key, required by encrypted formats.
        std::optional<X25519PublicKey> public_key;
        // Epoch of that key.
        uint64_t epoch = 0;
    };

    /**
     * @brief State needed to decode the result of one encrypted call.
     *
     * Holds the ephemeral secret; it is wiped on destruction. Owned by a
     * single call and not meant to be shared across threads.
     */
    class CallMetadata {
    public:
        CallMetadata(const X25519PrivateKey& ephemeral_secret, const X25519PublicKey& runtime_public_key)
            : secret_(ephemeral_secret), runtime_public_key_(runtime_public_key) {}
        ~CallMetadata();

        CallMetadata(const CallMetadata&) = delete;
        CallMetadata& operator=(const CallMetadata&) = delete;

        const X25519PrivateKey& secret() const { return secret_; }
        const X25519PublicKey& runtime_public_key() const { return runtime_public_key_; }

    private:
        X25519PrivateKey secret_;
        X25519PublicKey runtime_public_key_;
    };

    struct EncodedCall {
        Call call;
        // Null for the plain format.
        std::unique_ptr<CallMetadata> metadata;
    };

    /**
     * @brief Encodes a call in the requested format.
     *
     * Encrypted formats generate a fresh ephemeral X25519 key pair and a random
     * nonce, seal the CBOR of the plain call and replace the body with a
     * CallEnvelope.
     *
     * @param call The plain call.
     * @param format Target call format.
     * @param config Runtime call data key and its epoch.
     * @return The encoded call and the metadata needed by decode_result().
     * @throws ParaClient::CodecError if the format is unsupported or the runtime key is missing.
     */
    EncodedCall encode_call(const Call& call, CallFormat format, const EncodeConfig& config);

    /**
     * @brief Encrypted encoding with caller-provided ephemeral key pair and nonce.
     *
     * The pair must never be reused across calls.
     *
     * @throws ParaClient::CodecError if the runtime key is missing.
     */
    EncodedCall encode_call_with_keys(const Call& call,
                                      const X25519KeyPair& ephemeral,
                                      const DeoxysII::Nonce& nonce,
                                      const EncodeConfig& config);

    /**
     * @brief Decodes a call result using the metadata returned by encode_call().
     *
     * Results of plain calls and failed results are returned unchanged. For
     * encrypted calls the envelope is accepted in either the unknown or the ok
     * slot.
     *
     * @throws ParaClient::CodecError on a malformed envelope or when decryption fails.
     */
    CallResult decode_result(const CallResult& result, const CallMetadata* metadata);

    // Runtime side of the call format.
    struct DecodedCall {
        Call call;
        // Caller ephemeral key for encrypted calls.
        std::optional<X25519PublicKey> caller_public_key;
    };

    /**
     * @brief Opens a call as the runtime does.
     * @throws ParaClient::CodecError on a non-empty method, bad envelope or failed decryption.
     */
    DecodedCall decode_call(const Call& call, const X25519PrivateKey& runtime_secret);

    /**
     * @brief Seals a result for the caller of an encrypted call.
     *
     * The nonce is round (8 bytes BE) || index (4 bytes BE) || 3 zero bytes and
     * the envelope is placed in the unknown slot. Plain calls pass through.
     */
    CallResult encode_result(const CallResult& result,
                             const DecodedCall& call,
                             const X25519PrivateKey& runtime_secret,
                             uint64_t round,
                             uint32_t index);

} // namespace ParaClient

#endif // PARACLIENT_CALLFORMAT_HPP
