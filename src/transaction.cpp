#include "paraclient/transaction.hpp"

#include <algorithm>

#include "paraclient/errors.hpp"
#include "paraclient/log.hpp"

namespace ParaClient {

    namespace {

    Logger logger() {
        static Logger log = create_logger("transaction");
        return log;
    }

    std::optional<uint64_t> optional_uint(const CborValue& value, const std::string& key) {
        if (const CborValue* found = value.find(key)) {
            return found->as_uint();
        }
        return std::nullopt;
    }

    } // namespace

    // --- Quantity ---

    Quantity::Quantity(uint64_t value) {
        const auto be = encode_be64(value);
        *this = from_bytes(byte_vector(be.begin(), be.end()));
    }

    Quantity Quantity::from_bytes(const byte_vector& bytes) {
        Quantity q;
        auto first = std::find_if(bytes.begin(), bytes.end(), [](uint8_t b) { return b != 0; });
        q.bytes_.assign(first, bytes.end());
        return q;
    }

    std::optional<uint64_t> Quantity::to_uint64() const {
        if (bytes_.size() > 8) {
            return std::nullopt;
        }
        uint64_t value = 0;
        for (uint8_t b : bytes_) {
            value = (value << 8) | b;
        }
        return value;
    }

    Quantity Quantity::divide(uint64_t divisor, uint64_t* remainder) const {
        if (divisor == 0) {
            throw InvalidArgument("Quantity division by zero.");
        }
        // Bitwise long division; the remainder always stays below the divisor.
        byte_vector quotient(bytes_.size(), 0);
        uint64_t rem = 0;
        for (size_t i = 0; i < bytes_.size(); ++i) {
            for (int bit = 7; bit >= 0; --bit) {
                const bool carry = (rem >> 63) != 0;
                rem = (rem << 1) | ((bytes_[i] >> bit) & 1);
                if (carry || rem >= divisor) {
                    rem -= divisor;
                    quotient[i] |= static_cast<uint8_t>(1 << bit);
                }
            }
        }
        if (remainder != nullptr) {
            *remainder = rem;
        }
        return from_bytes(quotient);
    }

    std::string Quantity::to_string() const {
        if (is_zero()) {
            return "0";
        }
        std::string digits;
        Quantity q = *this;
        while (!q.is_zero()) {
            uint64_t digit = 0;
            q = q.divide(10, &digit);
            digits.push_back(static_cast<char>('0' + digit));
        }
        std::reverse(digits.begin(), digits.end());
        return digits;
    }

    // --- Fee ---

    CborValue BaseUnits::to_cbor() const {
        return CborValue::array({CborValue::bytes(amount.bytes()), CborValue::bytes(to_bytes(denomination))});
    }

    BaseUnits BaseUnits::from_cbor(const CborValue& value) {
        const auto& items = value.as_array();
        if (items.size() != 2) {
            throw CodecError("Malformed base units.");
        }
        const byte_vector& denomination = items[1].as_bytes();
        if (denomination.size() > MAX_DENOMINATION_SIZE) {
            throw CodecError("Malformed denomination.");
        }
        return BaseUnits{Quantity::from_bytes(items[0].as_bytes()), Denomination(denomination.begin(), denomination.end())};
    }

    Quantity Fee::gas_price() const {
        if (amount.amount.is_zero() || gas == 0) {
            return Quantity();
        }
        return amount.amount.divide(gas);
    }

    CborValue Fee::to_cbor() const {
        CborValue out = CborValue::map();
        out.set("amount", amount.to_cbor());
        if (gas != 0) {
            out.set("gas", CborValue::uint64(gas));
        }
        if (consensus_messages != 0) {
            out.set("consensus_messages", CborValue::uint64(consensus_messages));
        }
        if (proxy) {
            CborValue p = CborValue::map();
            p.set("module", CborValue::text(proxy->module));
            p.set("id", CborValue::bytes(proxy->id));
            out.set("proxy", std::move(p));
        }
        return out;
    }

    Fee Fee::from_cbor(const CborValue& value) {
        Fee fee;
        fee.amount = BaseUnits::from_cbor(value.at("amount"));
        fee.gas = optional_uint(value, "gas").value_or(0);
        const uint64_t messages = optional_uint(value, "consensus_messages").value_or(0);
        if (messages > UINT32_MAX) {
            throw CodecError("Consensus message limit out of range.");
        }
        fee.consensus_messages = static_cast<uint32_t>(messages);
        if (const CborValue* p = value.find("proxy")) {
            fee.proxy = FeeProxy{p->at("module").as_text(), p->at("id").as_bytes()};
        }
        return fee;
    }

    // --- Auth info ---

    CborValue SignerInfo::to_cbor() const {
        CborValue out = CborValue::map();
        out.set("address_spec", address_spec.to_cbor());
        out.set("nonce", CborValue::uint64(nonce));
        return out;
    }

    SignerInfo SignerInfo::from_cbor(const CborValue& value) {
        return SignerInfo{AddressSpec::from_cbor(value.at("address_spec")), value.at("nonce").as_uint()};
    }

    CborValue AuthInfo::to_cbor() const {
        CborValue si = CborValue::array();
        for (const auto& info : signer_info) {
            si.push(info.to_cbor());
        }
        CborValue out = CborValue::map();
        out.set("si", std::move(si));
        out.set("fee", fee.to_cbor());
        if (not_before) {
            out.set("not_before", CborValue::uint64(*not_before));
        }
        if (not_after) {
            out.set("not_after", CborValue::uint64(*not_after));
        }
        return out;
    }

    AuthInfo AuthInfo::from_cbor(const CborValue& value) {
        AuthInfo info;
        if (const CborValue* si = value.find("si")) {
            if (!si->is_null()) {
                for (const auto& item : si->as_array()) {
                    info.signer_info.push_back(SignerInfo::from_cbor(item));
                }
            }
        }
        info.fee = Fee::from_cbor(value.at("fee"));
        info.not_before = optional_uint(value, "not_before");
        info.not_after = optional_uint(value, "not_after");
        return info;
    }

    CborValue AuthProof::to_cbor() const {
        CborValue out = CborValue::map();
        if (signature) {
            out.set("signature", CborValue::bytes(*signature));
        }
        if (multisig) {
            CborValue list = CborValue::array();
            for (const auto& sig : *multisig) {
                list.push(sig ? CborValue::bytes(*sig) : CborValue::null());
            }
            out.set("multisig", std::move(list));
        }
        if (!module.empty()) {
            out.set("module", CborValue::text(module));
        }
        return out;
    }

    AuthProof AuthProof::from_cbor(const CborValue& value) {
        AuthProof proof;
        if (const CborValue* sig = value.find("signature")) {
            proof.signature = sig->as_bytes();
        }
        if (const CborValue* list = value.find("multisig")) {
            std::vector<std::optional<byte_vector>> sigs;
            for (const auto& item : list->as_array()) {
                if (item.is_null()) {
                    sigs.emplace_back(std::nullopt);
                } else {
                    sigs.emplace_back(item.as_bytes());
                }
            }
            proof.multisig = std::move(sigs);
        }
        if (const CborValue* module = value.find("module")) {
            proof.module = module->as_text();
        }
        return proof;
    }

    SignatureBatch batch(const AddressSpec& spec, const AuthProof& proof) {
        if (spec.signature() && proof.signature) {
            SignatureBatch out;
            out.public_keys.push_back(spec.signature()->public_key());
            out.signatures.push_back(*proof.signature);
            return out;
        }
        if (spec.multisig() && proof.multisig) {
            return spec.multisig()->batch(*proof.multisig);
        }
        throw TransactionError("malformed AddressSpec and AuthProof pair");
    }

    // --- Transaction ---

    Transaction::Transaction(const std::string& method, byte_vector body) {
        call.format = CallFormat::Plain;
        call.method = method;
        call.body = std::move(body);
    }

    void Transaction::validate_basic() const {
        if (!is_supported_transaction_version(version)) {
            throw TransactionError("transaction: unsupported version");
        }
        if (auth_info.signer_info.empty()) {
            throw TransactionError("transaction: malformed transaction");
        }
    }

    void Transaction::append_signer_info(AddressSpec spec, uint64_t nonce) {
        auth_info.signer_info.push_back(SignerInfo{std::move(spec), nonce});
    }

    void Transaction::append_auth_signature(SignatureAddressSpec spec, uint64_t nonce) {
        append_signer_info(AddressSpec(std::move(spec)), nonce);
    }

    void Transaction::append_auth_multisig(MultisigConfig config, uint64_t nonce) {
        append_signer_info(AddressSpec(std::move(config)), nonce);
    }

    TransactionSigner Transaction::prepare_for_signing() const {
        return TransactionSigner(*this);
    }

    CborValue Transaction::to_cbor() const {
        CborValue out = CborValue::map();
        out.set("v", CborValue::uint64(version));
        out.set("call", call.to_cbor());
        out.set("ai", auth_info.to_cbor());
        return out;
    }

    Transaction Transaction::from_cbor(const CborValue& value) {
        Transaction tx;
        const uint64_t version = value.at("v").as_uint();
        if (version > UINT16_MAX) {
            throw CodecError("Transaction version out of range.");
        }
        tx.version = static_cast<TransactionVersion>(version);
        tx.call = Call::from_cbor(value.at("call"));
        tx.auth_info = AuthInfo::from_cbor(value.at("ai"));
        return tx;
    }

    // --- UnverifiedTransaction ---

    Hash UnverifiedTransaction::hash() const {
        return sha512_256(encode());
    }

    Transaction UnverifiedTransaction::verify(const Context& context) const {
        if (auth_proofs.size() == 1 && !auth_proofs[0].module.empty()) {
            throw TransactionError("module-controlled decoding (scheme \"" + auth_proofs[0].module +
                                   "\") not supported");
        }

        Transaction tx;
        try {
            tx = Transaction::decode(body);
        } catch (const CodecError& e) {
            throw TransactionError(std::string("transaction: malformed transaction body: ") + e.what());
        }
        tx.validate_basic();

        if (auth_proofs.size() != tx.auth_info.signer_info.size()) {
            throw TransactionError("transaction: inconsistent number of auth proofs");
        }

        SignatureBatch all;
        for (size_t i = 0; i < auth_proofs.size(); ++i) {
            try {
                SignatureBatch b = batch(tx.auth_info.signer_info[i].address_spec, auth_proofs[i]);
                all.public_keys.insert(all.public_keys.end(), b.public_keys.begin(), b.public_keys.end());
                all.signatures.insert(all.signatures.end(), b.signatures.begin(), b.signatures.end());
            } catch (const RuntimeError& e) {
                throw TransactionError("transaction: auth proof " + std::to_string(i) + " batch: " + e.what());
            }
        }

        // Signature numbering counts the signatures inside multisig proofs too.
        for (size_t i = 0; i < all.public_keys.size(); ++i) {
            if (!all.public_keys[i].verify(context, body, all.signatures[i])) {
                logger()->debug("Signature {} failed verification", i);
                throw TransactionError("transaction: signature " + std::to_string(i) + " verification failed");
            }
        }
        return tx;
    }

    CborValue UnverifiedTransaction::to_cbor() const {
        CborValue proofs = CborValue::array();
        for (const auto& proof : auth_proofs) {
            proofs.push(proof.to_cbor());
        }
        return CborValue::array({CborValue::bytes(body), std::move(proofs)});
    }

    UnverifiedTransaction UnverifiedTransaction::from_cbor(const CborValue& value) {
        const auto& items = value.as_array();
        if (items.size() != 2) {
            throw CodecError("Malformed unverified transaction.");
        }
        UnverifiedTransaction ut;
        ut.body = items[0].as_bytes();
        if (!items[1].is_null()) {
            for (const auto& proof : items[1].as_array()) {
                ut.auth_proofs.push_back(AuthProof::from_cbor(proof));
            }
        }
        return ut;
    }

    // --- TransactionSigner ---

    TransactionSigner::TransactionSigner(Transaction tx) : tx_(std::move(tx)) {
        ut_.body = tx_.encode();
    }

    void TransactionSigner::allocate_proofs() {
        if (!ut_.auth_proofs.empty()) {
            return;
        }
        ut_.auth_proofs.resize(tx_.auth_info.signer_info.size());
        for (size_t i = 0; i < tx_.auth_info.signer_info.size(); ++i) {
            if (const MultisigConfig* config = tx_.auth_info.signer_info[i].address_spec.multisig()) {
                ut_.auth_proofs[i].multisig = std::vector<std::optional<byte_vector>>(config->signers.size());
            }
        }
    }

    void TransactionSigner::append_sign(const Context& context, const Signer& signer) {
        const PublicKey pk = signer.public_key();
        bool found = false;

        for (size_t i = 0; i < tx_.auth_info.signer_info.size(); ++i) {
            const AddressSpec& spec = tx_.auth_info.signer_info[i].address_spec;
            if (const SignatureAddressSpec* sig_spec = spec.signature()) {
                if (sig_spec->public_key() != pk) {
                    continue;
                }
                found = true;
                allocate_proofs();
                ut_.auth_proofs[i].signature = signer.context_sign(context, ut_.body);
            } else if (const MultisigConfig* config = spec.multisig()) {
                for (size_t j = 0; j < config->signers.size(); ++j) {
                    if (config->signers[j].public_key != pk) {
                        continue;
                    }
                    found = true;
                    allocate_proofs();
                    (*ut_.auth_proofs[i].multisig)[j] = signer.context_sign(context, ut_.body);
                }
            }
        }

        if (!found) {
            logger()->warn("Signer {} key not found in auth info", to_string(pk.algorithm()));
            throw TransactionError("transaction: signer not found in AuthInfo");
        }
    }

} // namespace ParaClient
