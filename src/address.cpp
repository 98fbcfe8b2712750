#include "paraclient/address.hpp"

#include <algorithm>

#include "bech32.hpp"
#include "paraclient/errors.hpp"
#include "paraclient/hash.hpp"

namespace ParaClient {

    namespace {

        constexpr char ACCOUNTS_MODULE[] = "accounts";

        const char* kind_name(SignatureAddressSpec::Kind kind) {
            switch (kind) {
                case SignatureAddressSpec::Kind::Ed25519:
                    return "ed25519";
                case SignatureAddressSpec::Kind::Secp256k1Eth:
                    return "secp256k1eth";
                case SignatureAddressSpec::Kind::Sr25519:
                    return "sr25519";
            }
            throw LogicError("Unknown signature address spec kind.");
        }

    } // namespace

    SignatureAddressSpec SignatureAddressSpec::ed25519(Ed25519PublicKey key) {
        return SignatureAddressSpec(Kind::Ed25519, PublicKey(std::move(key)));
    }

    SignatureAddressSpec SignatureAddressSpec::secp256k1eth(Secp256k1PublicKey key) {
        return SignatureAddressSpec(Kind::Secp256k1Eth, PublicKey(std::move(key)));
    }

    SignatureAddressSpec SignatureAddressSpec::sr25519(Sr25519PublicKey key) {
        return SignatureAddressSpec(Kind::Sr25519, PublicKey(std::move(key)));
    }

    SignatureAddressSpec SignatureAddressSpec::from_public_key(const PublicKey& key) {
        switch (key.algorithm()) {
            case SignatureAlgorithm::Ed25519:
                return SignatureAddressSpec(Kind::Ed25519, key);
            case SignatureAlgorithm::Secp256k1:
                return SignatureAddressSpec(Kind::Secp256k1Eth, key);
            case SignatureAlgorithm::Sr25519:
                return SignatureAddressSpec(Kind::Sr25519, key);
        }
        throw LogicError("Unknown signature algorithm.");
    }

    SignatureAddressSpec SignatureAddressSpec::from_cbor(const CborValue& value) {
        const auto& entries = value.as_map();
        if (entries.size() != 1) {
            throw CodecError("Signature address spec must have exactly one kind.");
        }
        const std::string& tag = entries[0].first.as_text();
        const byte_vector& bytes = entries[0].second.as_bytes();
        try {
            if (tag == kind_name(Kind::Ed25519)) {
                return ed25519(Ed25519PublicKey(bytes));
            }
            if (tag == kind_name(Kind::Secp256k1Eth)) {
                return secp256k1eth(Secp256k1PublicKey(bytes));
            }
            if (tag == kind_name(Kind::Sr25519)) {
                return sr25519(Sr25519PublicKey(bytes));
            }
        } catch (const InvalidArgument& e) {
            throw CodecError(std::string("Malformed signature address spec key: ") + e.what());
        }
        throw CodecError("Unsupported signature address spec kind: " + tag);
    }

    CborValue SignatureAddressSpec::to_cbor() const {
        CborValue out = CborValue::map();
        out.set(kind_name(kind_), CborValue::bytes(public_key_.bytes()));
        return out;
    }

    CborValue AddressSpec::to_cbor() const {
        CborValue out = CborValue::map();
        if (const auto* spec = signature()) {
            out.set("signature", spec->to_cbor());
        } else {
            out.set("multisig", multisig()->to_cbor());
        }
        return out;
    }

    AddressSpec AddressSpec::from_cbor(const CborValue& value) {
        if (value.as_map().size() != 1) {
            throw CodecError("Address spec must have exactly one variant.");
        }
        if (const CborValue* spec = value.find("signature")) {
            return AddressSpec(SignatureAddressSpec::from_cbor(*spec));
        }
        if (const CborValue* config = value.find("multisig")) {
            return AddressSpec(MultisigConfig::from_cbor(*config));
        }
        throw CodecError("Malformed address spec.");
    }

    Address Address::from_bytes(const byte_vector& bytes) {
        if (bytes.size() != SIZE) {
            throw AddressError("Malformed address: expected 21 bytes.");
        }
        Address out;
        std::copy(bytes.begin(), bytes.end(), out.data_.begin());
        return out;
    }

    Address Address::from_raw(const std::string& context, uint8_t version, const byte_vector& data) {
        const Hash h = Sha512_256().update(context).update(&version, 1).update(data).finalize();
        Address out;
        out.data_[0] = version;
        std::copy(h.begin(), h.begin() + DATA_SIZE, out.data_.begin() + 1);
        return out;
    }

    Address Address::from_public_key(const PublicKey& key) {
        switch (key.algorithm()) {
            case SignatureAlgorithm::Ed25519:
                return from_raw(ADDRESS_V0_ED25519_CONTEXT, ADDRESS_V0_VERSION, key.bytes());
            case SignatureAlgorithm::Secp256k1:
                return from_raw(ADDRESS_V0_SECP256K1_CONTEXT, ADDRESS_V0_VERSION, key.bytes());
            case SignatureAlgorithm::Sr25519:
                return from_raw(ADDRESS_V0_SR25519_CONTEXT, ADDRESS_V0_VERSION, key.bytes());
        }
        throw LogicError("Unknown signature algorithm.");
    }

    Address Address::from_spec(const SignatureAddressSpec& spec) {
        switch (spec.kind()) {
            case SignatureAddressSpec::Kind::Ed25519:
                return from_raw(ADDRESS_V0_ED25519_CONTEXT, ADDRESS_V0_VERSION, spec.public_key().bytes());
            case SignatureAddressSpec::Kind::Secp256k1Eth: {
                const auto eth = spec.public_key().get_if<Secp256k1PublicKey>()->eth_address();
                return from_raw(ADDRESS_V0_SECP256K1ETH_CONTEXT, ADDRESS_V0_VERSION,
                                byte_vector(eth.begin(), eth.end()));
            }
            case SignatureAddressSpec::Kind::Sr25519:
                return from_raw(ADDRESS_V0_SR25519_CONTEXT, ADDRESS_V0_VERSION, spec.public_key().bytes());
        }
        throw LogicError("Unknown signature address spec kind.");
    }

    Address Address::from_multisig(const MultisigConfig& config) {
        return from_raw(ADDRESS_V0_MULTISIG_CONTEXT, ADDRESS_V0_VERSION, config.to_cbor().encode());
    }

    Address Address::from_address_spec(const AddressSpec& spec) {
        if (const auto* signature = spec.signature()) {
            return from_spec(*signature);
        }
        return from_multisig(*spec.multisig());
    }

    Address Address::for_module(const std::string& module, const byte_vector& kind) {
        byte_vector data = to_bytes(module + ".");
        append(data, kind);
        return from_raw(ADDRESS_V0_MODULE_CONTEXT, ADDRESS_V0_VERSION, data);
    }

    Address Address::for_module(const std::string& module, const std::string& kind) {
        return for_module(module, to_bytes(kind));
    }

    Address Address::from_eth(const byte_vector& eth_address) {
        if (eth_address.size() != ETH_ADDRESS_SIZE) {
            throw AddressError("Malformed Ethereum address: expected 20 bytes.");
        }
        return from_raw(ADDRESS_V0_SECP256K1ETH_CONTEXT, ADDRESS_V0_VERSION, eth_address);
    }

    Address Address::from_bech32(const std::string& text) {
        return from_bytes(detail::bech32_decode(text, ADDRESS_BECH32_HRP));
    }

    std::string Address::to_bech32() const {
        return detail::bech32_encode(ADDRESS_BECH32_HRP, byte_vector(data_.begin(), data_.end()));
    }

    const Address& fee_accumulator_address() {
        static const Address address = Address::for_module(ACCOUNTS_MODULE, "fee-accumulator");
        return address;
    }

    const Address& common_pool_address() {
        static const Address address = Address::for_module(ACCOUNTS_MODULE, "common-pool");
        return address;
    }

} // namespace ParaClient
