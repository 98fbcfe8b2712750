#include "paraclient/multisig.hpp"

#include <string>

#include "paraclient/errors.hpp"

namespace ParaClient {

    void MultisigConfig::validate_basic() const {
        if (threshold == 0) {
            throw MultisigError(MultisigError::Kind::ZeroThreshold, "zero threshold");
        }
        uint64_t total = 0;
        for (size_t i = 0; i < signers.size(); ++i) {
            for (size_t j = 0; j < i; ++j) {
                if (signers[j].public_key == signers[i].public_key) {
                    throw MultisigError(MultisigError::Kind::DuplicateSigner,
                                        "signer " + std::to_string(i) + " duplicated", i);
                }
            }
            if (signers[i].weight == 0) {
                throw MultisigError(MultisigError::Kind::ZeroWeight,
                                    "signer " + std::to_string(i) + " zero weight", i);
            }
            if (total > UINT64_MAX - signers[i].weight) {
                throw MultisigError(MultisigError::Kind::WeightOverflow, "weight overflow", i);
            }
            total += signers[i].weight;
        }
        if (total < threshold) {
            throw MultisigError(MultisigError::Kind::ImpossibleThreshold, "impossible threshold");
        }
    }

    SignatureBatch MultisigConfig::batch(const std::vector<std::optional<byte_vector>>& signature_set) const {
        validate_basic();
        if (signature_set.size() != signers.size()) {
            throw MultisigError(MultisigError::Kind::MismatchedSignatureSet, "mismatched signature set length");
        }
        SignatureBatch out;
        uint64_t total = 0;
        for (size_t i = 0; i < signers.size(); ++i) {
            if (!signature_set[i]) {
                continue;
            }
            // validate_basic() guarantees the sum of all weights fits.
            total += signers[i].weight;
            out.public_keys.push_back(signers[i].public_key);
            out.signatures.push_back(*signature_set[i]);
        }
        if (total < threshold) {
            throw MultisigError(MultisigError::Kind::InsufficientWeight, "insufficient weight");
        }
        return out;
    }

    CborValue MultisigConfig::to_cbor() const {
        CborValue list = CborValue::array();
        for (const auto& signer : signers) {
            CborValue entry = CborValue::map();
            entry.set("public_key", signer.public_key.to_cbor());
            entry.set("weight", CborValue::uint64(signer.weight));
            list.push(std::move(entry));
        }
        CborValue out = CborValue::map();
        out.set("signers", std::move(list));
        out.set("threshold", CborValue::uint64(threshold));
        return out;
    }

    MultisigConfig MultisigConfig::from_cbor(const CborValue& value) {
        MultisigConfig config;
        for (const auto& entry : value.at("signers").as_array()) {
            config.signers.push_back(
                MultisigSigner{PublicKey::from_cbor(entry.at("public_key")), entry.at("weight").as_uint()});
        }
        config.threshold = value.at("threshold").as_uint();
        return config;
    }

    MultisigAuthenticator::MultisigAuthenticator(MultisigConfig config) : config_(std::move(config)) {
        config_.validate_basic();
    }

    void MultisigAuthenticator::verify(const Context& context,
                                       const byte_vector& message,
                                       const std::vector<IndexedSignature>& signatures) const {
        const auto& signers = config_.signers;
        std::vector<bool> seen(signers.size(), false);
        uint64_t total = 0;

        for (const auto& item : signatures) {
            const size_t index = item.first;
            if (index >= signers.size()) {
                throw MultisigError(MultisigError::Kind::IndexOutOfRange,
                                    "signer index " + std::to_string(index) + " out of range", index);
            }
            if (seen[index]) {
                throw MultisigError(MultisigError::Kind::DuplicateIndex,
                                    "signer index " + std::to_string(index) + " repeated", index);
            }
            seen[index] = true;

            if (!signers[index].public_key.verify(context, message, item.second)) {
                throw MultisigError(MultisigError::Kind::InvalidSignatureAt,
                                    "invalid signature from signer " + std::to_string(index), index);
            }
            total += signers[index].weight;
        }

        if (total < config_.threshold) {
            throw MultisigError(MultisigError::Kind::InsufficientWeight, "insufficient weight");
        }
    }

    bool MultisigAuthenticator::is_satisfied(const Context& context,
                                             const byte_vector& message,
                                             const std::vector<IndexedSignature>& signatures) const {
        try {
            verify(context, message, signatures);
            return true;
        } catch (const MultisigError&) {
            return false;
        }
    }

} // namespace ParaClient
