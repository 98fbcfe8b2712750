#ifndef PARACLIENT_ADDRESS_HPP
#define PARACLIENT_ADDRESS_HPP

#include <array>
#include <string>
#include <variant>

#include "bytes.hpp"
#include "cbor.hpp"
#include "ed25519.hpp"
#include "multisig.hpp"
#include "public_key.hpp"
#include "secp256k1.hpp"
#include "sr25519.hpp"

namespace ParaClient {

    constexpr uint8_t ADDRESS_V0_VERSION = 0;
    constexpr char ADDRESS_BECH32_HRP[] = "oasis";

    constexpr char ADDRESS_V0_ED25519_CONTEXT[] = "oasis-core/address: staking";
    constexpr char ADDRESS_V0_SECP256K1_CONTEXT[] = "oasis-runtime-sdk/address: secp256k1";
    constexpr char ADDRESS_V0_SECP256K1ETH_CONTEXT[] = "oasis-runtime-sdk/address: secp256k1eth";
    constexpr char ADDRESS_V0_SR25519_CONTEXT[] = "oasis-runtime-sdk/address: sr25519";
    constexpr char ADDRESS_V0_MULTISIG_CONTEXT[] = "oasis-runtime-sdk/address: multisig";
    constexpr char ADDRESS_V0_MODULE_CONTEXT[] = "oasis-runtime-sdk/address: module";

    /**
     * @brief Describes which key and algorithm authenticate an address.
     */
    class SignatureAddressSpec {
    public:
        enum class Kind {
            Ed25519,
            Secp256k1Eth,
            Sr25519
        };

        static SignatureAddressSpec ed25519(Ed25519PublicKey key);
        static SignatureAddressSpec secp256k1eth(Secp256k1PublicKey key);
        static SignatureAddressSpec sr25519(Sr25519PublicKey key);

        // Secp256k1 keys map to the Ethereum-compatible kind.
        static SignatureAddressSpec from_public_key(const PublicKey& key);

        /**
         * @brief Parses the `{ed25519|secp256k1eth|sr25519: bytes}` form.
         * @throws ParaClient::CodecError on a missing, repeated or unknown kind.
         */
        static SignatureAddressSpec from_cbor(const CborValue& value);

        Kind kind() const { return kind_; }
        const PublicKey& public_key() const { return public_key_; }

        CborValue to_cbor() const;

        bool operator==(const SignatureAddressSpec& other) const {
            return kind_ == other.kind_ && public_key_ == other.public_key_;
        }
        bool operator!=(const SignatureAddressSpec& other) const { return !(*this == other); }

    private:
        SignatureAddressSpec(Kind kind, PublicKey public_key) : kind_(kind), public_key_(std::move(public_key)) {}

        Kind kind_;
        PublicKey public_key_;
    };

    /**
     * @brief Either a single signature spec or a multisig policy.
     */
    class AddressSpec {
    public:
        AddressSpec(SignatureAddressSpec spec) : spec_(std::move(spec)) {}
        AddressSpec(MultisigConfig config) : spec_(std::move(config)) {}

        const SignatureAddressSpec* signature() const { return std::get_if<SignatureAddressSpec>(&spec_); }
        const MultisigConfig* multisig() const { return std::get_if<MultisigConfig>(&spec_); }

        CborValue to_cbor() const;
        static AddressSpec from_cbor(const CborValue& value);

        bool operator==(const AddressSpec& other) const { return spec_ == other.spec_; }
        bool operator!=(const AddressSpec& other) const { return !(*this == other); }

    private:
        std::variant<SignatureAddressSpec, MultisigConfig> spec_;
    };

    /**
     * @brief A 21-byte account address: version byte followed by a truncated hash.
     */
    class Address {
    public:
        static constexpr size_t SIZE = 21;
        static constexpr size_t DATA_SIZE = 20;
        static constexpr size_t ETH_ADDRESS_SIZE = 20;

        using Bytes = std::array<uint8_t, SIZE>;

        Address() = default;

        /**
         * @throws ParaClient::AddressError if the input is not exactly 21 bytes.
         */
        static Address from_bytes(const byte_vector& bytes);

        /**
         * @brief Derives `version || H(context || version || data)[0..20]`.
         */
        static Address from_raw(const std::string& context, uint8_t version, const byte_vector& data);

        // Native address of a key: staking context for Ed25519, compressed key for Secp256k1.
        static Address from_public_key(const PublicKey& key);

        static Address from_spec(const SignatureAddressSpec& spec);
        static Address from_multisig(const MultisigConfig& config);
        static Address from_address_spec(const AddressSpec& spec);

        /**
         * @brief Pseudo-address of a module-owned account, derived from `module.kind`.
         */
        static Address for_module(const std::string& module, const byte_vector& kind);
        static Address for_module(const std::string& module, const std::string& kind);

        /**
         * @throws ParaClient::AddressError if the input is not 20 bytes.
         */
        static Address from_eth(const byte_vector& eth_address);

        /**
         * @throws ParaClient::AddressError on bad checksum, case mixing, wrong HRP or length.
         */
        static Address from_bech32(const std::string& text);

        std::string to_bech32() const;

        const Bytes& bytes() const { return data_; }

        CborValue to_cbor() const { return CborValue::bytes(byte_vector(data_.begin(), data_.end())); }

        bool operator==(const Address& other) const { return data_ == other.data_; }
        bool operator!=(const Address& other) const { return data_ != other.data_; }
        bool operator<(const Address& other) const { return data_ < other.data_; }

    private:
        Bytes data_{};
    };

    // Accounts module pool receiving transaction fees.
    const Address& fee_accumulator_address();

    // Accounts module common pool.
    const Address& common_pool_address();

} // namespace ParaClient

#endif // PARACLIENT_ADDRESS_HPP
