#ifndef PARACLIENT_MULTISIG_HPP
#define PARACLIENT_MULTISIG_HPP

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "bytes.hpp"
#include "cbor.hpp"
#include "context.hpp"
#include "public_key.hpp"

namespace ParaClient {

    struct MultisigSigner {
        PublicKey public_key;
        uint64_t weight;

        bool operator==(const MultisigSigner& other) const {
            return public_key == other.public_key && weight == other.weight;
        }
        bool operator!=(const MultisigSigner& other) const { return !(*this == other); }
    };

    // Public keys and the signatures to check against them, position by position.
    struct SignatureBatch {
        std::vector<PublicKey> public_keys;
        std::vector<byte_vector> signatures;
    };

    /**
     * @brief A weighted threshold policy.
     *
     * A set of signers whose total weight reaches the threshold can
     * authenticate for the configuration.
     */
    struct MultisigConfig {
        std::vector<MultisigSigner> signers;
        uint64_t threshold = 0;

        /**
         * @brief Checks the configuration itself, without any signature.
         * @throws ParaClient::MultisigError with kind ZeroThreshold, DuplicateSigner,
         *         ZeroWeight, WeightOverflow or ImpossibleThreshold.
         */
        void validate_basic() const;

        /**
         * @brief Checks the dense signature set used on the wire.
         *
         * The set holds one entry per signer, empty where that signer did not
         * sign. No signature is verified here.
         *
         * @param signature_set Per-signer signature, or std::nullopt.
         * @return The keys and signatures to verify.
         * @throws ParaClient::MultisigError if the config is invalid, the set length
         *         differs from the signer count or the present weight is insufficient.
         */
        SignatureBatch batch(const std::vector<std::optional<byte_vector>>& signature_set) const;

        CborValue to_cbor() const;
        static MultisigConfig from_cbor(const CborValue& value);

        bool operator==(const MultisigConfig& other) const {
            return signers == other.signers && threshold == other.threshold;
        }
        bool operator!=(const MultisigConfig& other) const { return !(*this == other); }
    };

    /**
     * @brief Verifies sparse (signer index, signature) sets against a config.
     */
    class MultisigAuthenticator {
    public:
        using IndexedSignature = std::pair<size_t, byte_vector>;

        /**
         * @throws ParaClient::MultisigError if the config fails validate_basic().
         */
        explicit MultisigAuthenticator(MultisigConfig config);

        /**
         * @brief Verifies every provided signature and checks the accumulated weight.
         * @param context The signing context.
         * @param message The signed message.
         * @param signatures Pairs of signer position and signature.
         * @throws ParaClient::MultisigError with kind IndexOutOfRange, DuplicateIndex,
         *         InvalidSignatureAt or InsufficientWeight.
         */
        void verify(const Context& context,
                    const byte_vector& message,
                    const std::vector<IndexedSignature>& signatures) const;

        // Same as verify(), reporting the outcome as a bool.
        bool is_satisfied(const Context& context,
                          const byte_vector& message,
                          const std::vector<IndexedSignature>& signatures) const;

        const MultisigConfig& config() const { return config_; }

    private:
        MultisigConfig config_;
    };

} // namespace ParaClient

#endif // PARACLIENT_MULTISIG_HPP
