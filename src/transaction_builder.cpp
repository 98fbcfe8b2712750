#include "paraclient/transaction_builder.hpp"

#include "paraclient/log.hpp"

namespace ParaClient {

    namespace {

    Logger logger() {
        static Logger log = create_logger("transaction");
        return log;
    }

    } // namespace

    TransactionBuilder::TransactionBuilder(RuntimeClient& client, const std::string& method, byte_vector body)
        : client_(client), tx_(method, std::move(body)) {}

    TransactionBuilder& TransactionBuilder::set_fee_amount(BaseUnits amount) {
        ensure_unsigned();
        tx_.auth_info.fee.amount = std::move(amount);
        return *this;
    }

    TransactionBuilder& TransactionBuilder::set_fee_gas(uint64_t gas) {
        ensure_unsigned();
        tx_.auth_info.fee.gas = gas;
        return *this;
    }

    TransactionBuilder& TransactionBuilder::set_fee_consensus_messages(uint32_t messages) {
        ensure_unsigned();
        tx_.auth_info.fee.consensus_messages = messages;
        return *this;
    }

    TransactionBuilder& TransactionBuilder::set_not_before(uint64_t round) {
        ensure_unsigned();
        tx_.auth_info.not_before = round;
        return *this;
    }

    TransactionBuilder& TransactionBuilder::set_not_after(uint64_t round) {
        ensure_unsigned();
        tx_.auth_info.not_after = round;
        return *this;
    }

    TransactionBuilder& TransactionBuilder::read_only() {
        ensure_unsigned();
        tx_.call.read_only = true;
        return *this;
    }

    TransactionBuilder& TransactionBuilder::append_auth_signature(SignatureAddressSpec spec, uint64_t nonce) {
        ensure_unsigned();
        tx_.append_auth_signature(std::move(spec), nonce);
        return *this;
    }

    TransactionBuilder& TransactionBuilder::append_auth_multisig(MultisigConfig config, uint64_t nonce) {
        ensure_unsigned();
        tx_.append_auth_multisig(std::move(config), nonce);
        return *this;
    }

    void TransactionBuilder::ensure_unsigned() const {
        if (signer_) {
            throw LogicError("transaction already signed");
        }
    }

    void TransactionBuilder::set_call_format(CallFormat format) {
        ensure_unsigned();
        if (tx_.call.format != CallFormat::Plain || call_meta_) {
            throw LogicError("can only change call format from plain");
        }

        EncodeConfig config;
        if (format != CallFormat::Plain) {
            config = client_.call_data_public_key().encode_config();
        }

        EncodedCall encoded = encode_call(tx_.call, format, config);
        tx_.call = std::move(encoded.call);
        call_meta_ = std::move(encoded.metadata);
    }

    uint64_t TransactionBuilder::estimate_gas() {
        if (tx_.call.format != CallFormat::Plain) {
            throw LogicError("gas estimation requires a plain call");
        }
        return client_.estimate_gas(tx_);
    }

    void TransactionBuilder::append_sign(const Signer& signer) {
        const RuntimeInfo info = client_.get_info();
        const Context context = Context::for_transactions(info.id, info.chain_context);
        if (signer_) {
            signer_->append_sign(context, signer);
            return;
        }

        // The builder only locks once a first signature was produced.
        TransactionSigner first = tx_.prepare_for_signing();
        first.append_sign(context, signer);
        signer_.emplace(std::move(first));
    }

    const UnverifiedTransaction* TransactionBuilder::signed_transaction() const {
        if (!signer_) {
            return nullptr;
        }
        return &signer_->unverified_transaction();
    }

    byte_vector TransactionBuilder::decode_result(const CallResult& result) const {
        const CallResult decoded = ParaClient::decode_result(result, call_meta_.get());
        switch (decoded.kind()) {
        case CallResult::Kind::Unknown:
            // The inner result of a decoded call is never unknown.
            throw TransactionError("got unknown result: " + to_hex(decoded.value()));
        case CallResult::Kind::Ok:
            return decoded.value();
        case CallResult::Kind::Failed:
        default:
            logger()->debug("Call failed: {}", decoded.failure().to_string());
            throw CallFailedError(decoded.failure());
        }
    }

    byte_vector TransactionBuilder::submit_tx() {
        if (!signer_) {
            throw TransactionError("unable to submit unsigned transaction");
        }
        return decode_result(client_.submit_tx(signer_->unverified_transaction()));
    }

    void TransactionBuilder::submit_tx_no_wait() {
        if (!signer_) {
            throw TransactionError("unable to submit unsigned transaction");
        }
        client_.submit_tx_no_wait(signer_->unverified_transaction());
    }

} // namespace ParaClient
