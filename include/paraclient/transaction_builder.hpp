#ifndef PARACLIENT_TRANSACTION_BUILDER_HPP
#define PARACLIENT_TRANSACTION_BUILDER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "callformat.hpp"
#include "errors.hpp"
#include "runtime_client.hpp"
#include "signer.hpp"
#include "transaction.hpp"

namespace ParaClient {

    /**
     * @brief Raised when the runtime reports a failed call.
     */
    class CallFailedError : public TransactionError {
    public:
        explicit CallFailedError(FailedCallResult failure)
            : TransactionError(failure.to_string()), failure_(std::move(failure)) {}

        const FailedCallResult& failure() const noexcept { return failure_; }

    private:
        FailedCallResult failure_;
    };

    /**
     * @brief Helper for building, signing and submitting one transaction.
     *
     * The builder keeps the decode state of an encrypted call, so the result of
     * the submitted transaction has to be decoded through the same builder.
     */
    class TransactionBuilder {
    public:
        /**
         * @brief Starts a plain call of the method with the given CBOR body.
         * @param client Connection to the target runtime; must outlive the builder.
         */
        TransactionBuilder(RuntimeClient& client, const std::string& method, byte_vector body);

        // Setters throw ParaClient::LogicError once the transaction has been signed.
        TransactionBuilder& set_fee_amount(BaseUnits amount);
        TransactionBuilder& set_fee_gas(uint64_t gas);
        TransactionBuilder& set_fee_consensus_messages(uint32_t messages);
        TransactionBuilder& set_not_before(uint64_t round);
        TransactionBuilder& set_not_after(uint64_t round);
        TransactionBuilder& read_only();

        TransactionBuilder& append_auth_signature(SignatureAddressSpec spec, uint64_t nonce);
        TransactionBuilder& append_auth_multisig(MultisigConfig config, uint64_t nonce);

        /**
         * @brief Changes the call format, querying the runtime's call data key when needed.
         * @throws ParaClient::LogicError unless the call is still plain and unsigned.
         * @throws ParaClient::CodecError if the call cannot be encoded.
         */
        void set_call_format(CallFormat format);

        /**
         * @brief Asks the runtime for the gas the transaction would use.
         * @throws ParaClient::LogicError if the call is encrypted.
         */
        uint64_t estimate_gas();

        /**
         * @brief Signs the transaction under the runtime's transaction signing context.
         *
         * The body is frozen on the first call; the setters are rejected from
         * then on.
         *
         * @throws ParaClient::TransactionError if the signer is not listed in the auth info.
         */
        void append_sign(const Signer& signer);

        const Transaction& transaction() const { return tx_; }

        // Null until the first append_sign().
        const UnverifiedTransaction* signed_transaction() const;

        /**
         * @brief Decodes a result of the transaction built here.
         * @return Raw CBOR of the successful result.
         * @throws ParaClient::CallFailedError if the call failed.
         * @throws ParaClient::TransactionError on an unexpected unknown result.
         * @throws ParaClient::CodecError if decryption fails.
         */
        byte_vector decode_result(const CallResult& result) const;

        /**
         * @brief Submits the signed transaction and waits for the decoded result.
         * @throws ParaClient::TransactionError if the transaction was not signed.
         * @throws ParaClient::CallFailedError if the call failed.
         */
        byte_vector submit_tx();

        /**
         * @throws ParaClient::TransactionError if the transaction was not signed.
         */
        void submit_tx_no_wait();

    private:
        void ensure_unsigned() const;

        RuntimeClient& client_;
        Transaction tx_;
        std::optional<TransactionSigner> signer_;
        std::unique_ptr<CallMetadata> call_meta_;
    };

} // namespace ParaClient

#endif // PARACLIENT_TRANSACTION_BUILDER_HPP
