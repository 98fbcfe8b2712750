#ifndef PARACLIENT_TRANSACTION_HPP
#define PARACLIENT_TRANSACTION_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "address.hpp"
#include "bytes.hpp"
#include "callformat.hpp"
#include "cbor.hpp"
#include "context.hpp"
#include "hash.hpp"
#include "multisig.hpp"
#include "signer.hpp"
#include "version.hpp"

namespace ParaClient {

    /**
     * @brief Arbitrary precision unsigned integer, stored as minimal big-endian bytes.
     */
    class Quantity {
    public:
        Quantity() = default;
        explicit Quantity(uint64_t value);

        // Leading zero bytes are dropped.
        static Quantity from_bytes(const byte_vector& bytes);

        const byte_vector& bytes() const { return bytes_; }
        bool is_zero() const { return bytes_.empty(); }

        // Value as uint64, or std::nullopt when it does not fit.
        std::optional<uint64_t> to_uint64() const;

        /**
         * @brief Integer division.
         * @throws ParaClient::InvalidArgument on division by zero.
         */
        Quantity divide(uint64_t divisor, uint64_t* remainder = nullptr) const;

        // Decimal representation.
        std::string to_string() const;

        bool operator==(const Quantity& other) const { return bytes_ == other.bytes_; }
        bool operator!=(const Quantity& other) const { return bytes_ != other.bytes_; }

    private:
        byte_vector bytes_;
    };

    // Token denomination name; empty for the native token.
    using Denomination = std::string;

    constexpr size_t MAX_DENOMINATION_SIZE = 32;

    // Token amount of a given denomination, in base units.
    struct BaseUnits {
        Quantity amount;
        Denomination denomination;

        CborValue to_cbor() const;
        static BaseUnits from_cbor(const CborValue& value);

        bool operator==(const BaseUnits& other) const {
            return amount == other.amount && denomination == other.denomination;
        }
    };

    struct FeeProxy {
        std::string module;
        byte_vector id;
    };

    struct Fee {
        BaseUnits amount;
        uint64_t gas = 0;
        uint32_t consensus_messages = 0;
        std::optional<FeeProxy> proxy;

        // Amount divided by gas, zero when either is zero.
        Quantity gas_price() const;

        CborValue to_cbor() const;
        static Fee from_cbor(const CborValue& value);
    };

    struct SignerInfo {
        AddressSpec address_spec;
        uint64_t nonce = 0;

        CborValue to_cbor() const;
        static SignerInfo from_cbor(const CborValue& value);
    };

    struct AuthInfo {
        std::vector<SignerInfo> signer_info;
        Fee fee;
        std::optional<uint64_t> not_before;
        std::optional<uint64_t> not_after;

        CborValue to_cbor() const;
        static AuthInfo from_cbor(const CborValue& value);
    };

    /**
     * @brief Data authenticating one signer info entry.
     *
     * Exactly one field is expected to be set in a complete proof.
     */
    struct AuthProof {
        std::optional<byte_vector> signature;
        std::optional<std::vector<std::optional<byte_vector>>> multisig;
        // Module-controlled decoding scheme name.
        std::string module;

        CborValue to_cbor() const;
        static AuthProof from_cbor(const CborValue& value);
    };

    /**
     * @brief Checks that an address spec and a proof belong together.
     * @return Keys and signatures still to be verified.
     * @throws ParaClient::TransactionError on a mismatched pair.
     * @throws ParaClient::MultisigError if the multisig proof is not acceptable.
     */
    SignatureBatch batch(const AddressSpec& spec, const AuthProof& proof);

    class TransactionSigner;

    struct Transaction {
        TransactionVersion version = LATEST_TRANSACTION_VERSION;
        Call call;
        AuthInfo auth_info;

        Transaction() = default;

        // A plain call of the method with the given CBOR body and a zero native fee.
        Transaction(const std::string& method, byte_vector body);

        /**
         * @throws ParaClient::TransactionError on an unsupported version or missing signers.
         */
        void validate_basic() const;

        void append_signer_info(AddressSpec spec, uint64_t nonce);
        void append_auth_signature(SignatureAddressSpec spec, uint64_t nonce);
        void append_auth_multisig(MultisigConfig config, uint64_t nonce);

        // Freezes the encoded body and returns a signer collecting proofs for it.
        TransactionSigner prepare_for_signing() const;

        CborValue to_cbor() const;
        byte_vector encode() const { return to_cbor().encode(); }
        static Transaction from_cbor(const CborValue& value);
        static Transaction decode(const byte_vector& data) { return from_cbor(CborValue::decode(data)); }
    };

    /**
     * @brief Encoded transaction body with its authentication proofs, as submitted.
     */
    struct UnverifiedTransaction {
        byte_vector body;
        std::vector<AuthProof> auth_proofs;

        // SHA-512/256 of the CBOR encoding.
        Hash hash() const;

        /**
         * @brief Decodes the body and verifies every signature under the context.
         * @param context Transaction signing context, see Context::for_transactions().
         * @return The authenticated transaction.
         * @throws ParaClient::TransactionError if any check fails.
         */
        Transaction verify(const Context& context) const;

        CborValue to_cbor() const;
        byte_vector encode() const { return to_cbor().encode(); }
        static UnverifiedTransaction from_cbor(const CborValue& value);
        static UnverifiedTransaction decode(const byte_vector& data) { return from_cbor(CborValue::decode(data)); }
    };

    class TransactionSigner {
    public:
        explicit TransactionSigner(Transaction tx);

        /**
         * @brief Signs the body with every signer info slot matching the signer's key.
         * @param context Transaction signing context.
         * @param signer The signer.
         * @throws ParaClient::TransactionError if the key is not listed in the auth info.
         * @throws ParaClient::SignatureError if signing fails.
         */
        void append_sign(const Context& context, const Signer& signer);

        const Transaction& transaction() const { return tx_; }
        const UnverifiedTransaction& unverified_transaction() const { return ut_; }

    private:
        void allocate_proofs();

        Transaction tx_;
        UnverifiedTransaction ut_;
    };

} // namespace ParaClient

#endif // PARACLIENT_TRANSACTION_HPP
