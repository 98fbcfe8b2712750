#include "paraclient/transaction.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "paraclient/crypto.hpp"
#include "paraclient/errors.hpp"

namespace {

    const std::string RUNTIME_ID = "8000000000000000000000000000000000000000000000000000000000000000";
    const std::string CHAIN_CONTEXT = "0000000000000000000000000000000000000000000000000000000000000001";

    ParaClient::Context signing_context() {
        return ParaClient::Context::for_transactions(ParaClient::Namespace::from_hex(RUNTIME_ID), CHAIN_CONTEXT);
    }

    ParaClient::SignatureAddressSpec dummy_spec() {
        return ParaClient::SignatureAddressSpec::ed25519(
            ParaClient::Ed25519PublicKey::from_base64("NcPzNW3YU2T+ugNUtUWtoQnRvbOL9dYSaBfbjHLP1pE="));
    }

} // namespace

TEST(QuantityTest, Conversions) {
    ASSERT_TRUE(ParaClient::Quantity().is_zero());
    ASSERT_TRUE(ParaClient::Quantity(0).is_zero());
    ASSERT_EQ(ParaClient::Quantity(0).to_string(), "0");

    ParaClient::Quantity q(1000);
    ASSERT_EQ(ParaClient::to_hex(q.bytes()), "03e8");
    ASSERT_EQ(q.to_uint64(), std::optional<uint64_t>(1000));
    ASSERT_EQ(q.to_string(), "1000");

    // Leading zeros are not significant.
    ASSERT_EQ(ParaClient::Quantity::from_bytes(ParaClient::from_hex("000003e8")), q);

    // Values beyond 64 bits
    auto big = ParaClient::Quantity::from_bytes(ParaClient::from_hex("010000000000000000"));
    ASSERT_FALSE(big.to_uint64().has_value());
    ASSERT_EQ(big.to_string(), "18446744073709551616");
}

TEST(QuantityTest, Division) {
    // 0.2 TEST with 18 decimals over 1000 gas
    auto amount = ParaClient::Quantity::from_bytes(ParaClient::from_hex("02c68af0bb140000"));
    ASSERT_EQ(amount.to_string(), "200000000000000000");

    uint64_t remainder = 1;
    auto price = amount.divide(1000, &remainder);
    ASSERT_EQ(price.to_string(), "200000000000000");
    ASSERT_EQ(remainder, 0u);

    ParaClient::Quantity(7).divide(2, &remainder);
    ASSERT_EQ(remainder, 1u);
    ASSERT_THROW(amount.divide(0), ParaClient::InvalidArgument);
}

TEST(FeeTest, GasPrice) {
    ParaClient::Fee fee;
    ASSERT_TRUE(fee.gas_price().is_zero());

    fee.amount = ParaClient::BaseUnits{ParaClient::Quantity(1000), ""};
    ASSERT_TRUE(fee.gas_price().is_zero());

    fee.gas = 100;
    ASSERT_EQ(fee.gas_price(), ParaClient::Quantity(10));
}

TEST(FeeTest, Cbor) {
    ParaClient::Fee fee;
    fee.amount = ParaClient::BaseUnits{ParaClient::Quantity(5), "TEST"};

    // Zero gas and consensus messages are omitted.
    auto encoded = fee.to_cbor();
    ASSERT_EQ(encoded.find("gas"), nullptr);
    ASSERT_EQ(encoded.find("consensus_messages"), nullptr);
    ASSERT_EQ(ParaClient::to_hex(encoded.at("amount").encode()), "82410544" + ParaClient::to_hex(ParaClient::to_bytes("TEST")));

    fee.gas = 1000;
    fee.consensus_messages = 1;
    fee.proxy = ParaClient::FeeProxy{"evm", ParaClient::byte_vector{1, 2}};
    auto decoded = ParaClient::Fee::from_cbor(ParaClient::CborValue::decode(fee.to_cbor().encode()));
    ASSERT_EQ(decoded.amount, fee.amount);
    ASSERT_EQ(decoded.gas, 1000u);
    ASSERT_EQ(decoded.consensus_messages, 1u);
    ASSERT_TRUE(decoded.proxy.has_value());
    ASSERT_EQ(decoded.proxy->module, "evm");

    // Denominations are limited to 32 bytes.
    auto too_long = ParaClient::CborValue::array(
        {ParaClient::CborValue::bytes({}), ParaClient::CborValue::bytes(ParaClient::byte_vector(33, 'A'))});
    ASSERT_THROW(ParaClient::BaseUnits::from_cbor(too_long), ParaClient::CodecError);
}

TEST(TransactionTest, BasicValidation) {
    ParaClient::Transaction unversioned;
    unversioned.version = 0;
    ASSERT_THROW(unversioned.validate_basic(), ParaClient::TransactionError);

    ParaClient::Transaction future;
    future.version = 42;
    future.append_auth_signature(dummy_spec(), 0);
    ASSERT_THROW(future.validate_basic(), ParaClient::TransactionError);

    ParaClient::Transaction no_signers;
    ASSERT_THROW(no_signers.validate_basic(), ParaClient::TransactionError);

    ParaClient::Transaction valid;
    valid.append_auth_signature(dummy_spec(), 0);
    ASSERT_NO_THROW(valid.validate_basic());

    ParaClient::Transaction call("hello.World", {});
    ASSERT_THROW(call.validate_basic(), ParaClient::TransactionError);
}

TEST(TransactionTest, CborEncoding) {
    ParaClient::Transaction tx("accounts.Transfer", ParaClient::CborValue::map().encode());
    tx.append_auth_signature(dummy_spec(), 7);
    tx.auth_info.fee.amount = ParaClient::BaseUnits{ParaClient::Quantity(100), ""};
    tx.auth_info.fee.gas = 2000;
    tx.auth_info.not_after = 10;

    auto encoded = tx.to_cbor();
    ASSERT_EQ(encoded.at("v").as_uint(), ParaClient::LATEST_TRANSACTION_VERSION);
    ASSERT_EQ(encoded.at("call").at("method").as_text(), "accounts.Transfer");
    const auto& si = encoded.at("ai").at("si").as_array();
    ASSERT_EQ(si.size(), 1u);
    ASSERT_EQ(si[0].at("nonce").as_uint(), 7u);
    ASSERT_NE(si[0].at("address_spec").find("signature"), nullptr);
    ASSERT_EQ(encoded.at("ai").find("not_before"), nullptr);

    auto decoded = ParaClient::Transaction::decode(tx.encode());
    ASSERT_EQ(decoded.version, tx.version);
    ASSERT_EQ(decoded.call, tx.call);
    ASSERT_EQ(decoded.auth_info.signer_info[0].address_spec, tx.auth_info.signer_info[0].address_spec);
    ASSERT_EQ(decoded.auth_info.fee.amount, tx.auth_info.fee.amount);
    ASSERT_EQ(decoded.auth_info.not_after, std::optional<uint64_t>(10));
    ASSERT_EQ(decoded.encode(), tx.encode());
}

class TransactionSigningTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(ParaClient::Crypto::init(), 0);
        signer_ = std::make_unique<ParaClient::Signer>(ParaClient::Ed25519Signer::generate());
        signer2_ = std::make_unique<ParaClient::Signer>(ParaClient::Ed25519Signer::generate());
    }

    // Two single-signature signers followed by a 2-of-2 multisig of the same keys.
    ParaClient::Transaction build() const {
        ParaClient::Transaction tx("hello.World", {});
        const auto pk = signer_->public_key();
        const auto pk2 = signer2_->public_key();
        tx.append_auth_signature(ParaClient::SignatureAddressSpec::from_public_key(pk), 42);
        tx.append_auth_signature(ParaClient::SignatureAddressSpec::from_public_key(pk2), 43);
        tx.append_auth_multisig(ParaClient::MultisigConfig{{{pk, 1}, {pk2, 1}}, 2}, 44);
        return tx;
    }

    std::unique_ptr<ParaClient::Signer> signer_;
    std::unique_ptr<ParaClient::Signer> signer2_;
};

TEST_F(TransactionSigningTest, SignAndVerify) {
    // 1. Build and validate
    auto tx = build();
    ASSERT_NO_THROW(tx.validate_basic());

    // 2. Sign with both keys
    auto ctx = signing_context();
    auto ts = tx.prepare_for_signing();
    ASSERT_NO_THROW(ts.append_sign(ctx, *signer_));
    ASSERT_NO_THROW(ts.append_sign(ctx, *signer2_));

    // 3. Every slot is filled
    const auto& ut = ts.unverified_transaction();
    ASSERT_EQ(ut.auth_proofs.size(), 3u);
    ASSERT_TRUE(ut.auth_proofs[0].signature.has_value());
    ASSERT_TRUE(ut.auth_proofs[1].signature.has_value());
    ASSERT_TRUE(ut.auth_proofs[2].multisig.has_value());
    ASSERT_EQ(ut.auth_proofs[2].multisig->size(), 2u);

    // 4. Verify after a trip through the wire format
    auto received = ParaClient::UnverifiedTransaction::decode(ut.encode());
    ASSERT_EQ(received.hash(), ut.hash());
    ParaClient::Transaction verified;
    ASSERT_NO_THROW({ verified = received.verify(ctx); });
    ASSERT_NO_THROW(verified.validate_basic());
    ASSERT_EQ(verified.auth_info.signer_info.size(), 3u);
    ASSERT_EQ(verified.auth_info.signer_info[2].nonce, 44u);

    // 5. Another chain does not accept it
    auto other = ParaClient::Context::for_transactions(
        ParaClient::Namespace::from_hex(RUNTIME_ID),
        "0000000000000000000000000000000000000000000000000000000000000002");
    ASSERT_THROW(received.verify(other), ParaClient::TransactionError);
}

TEST_F(TransactionSigningTest, PartialSignatures) {
    auto ctx = signing_context();
    auto ts = build().prepare_for_signing();
    ts.append_sign(ctx, *signer_);

    // The second single-signature slot is still empty.
    ASSERT_THROW(ts.unverified_transaction().verify(ctx), ParaClient::TransactionError);
}

TEST_F(TransactionSigningTest, SignerNotFound) {
    auto ts = build().prepare_for_signing();
    ParaClient::Signer stranger(ParaClient::Sr25519Signer::generate());
    ASSERT_THROW(ts.append_sign(signing_context(), stranger), ParaClient::TransactionError);
}

TEST_F(TransactionSigningTest, MixedAlgorithms) {
    auto ctx = signing_context();
    ParaClient::Signer secp(ParaClient::Secp256k1Signer::generate());
    ParaClient::Signer sr(ParaClient::Sr25519Signer::generate());

    ParaClient::Transaction tx("hello.World", {});
    tx.append_auth_signature(ParaClient::SignatureAddressSpec::from_public_key(secp.public_key()), 1);
    tx.append_auth_signature(ParaClient::SignatureAddressSpec::from_public_key(sr.public_key()), 2);

    auto ts = tx.prepare_for_signing();
    ts.append_sign(ctx, secp);
    ts.append_sign(ctx, sr);
    ASSERT_NO_THROW(ts.unverified_transaction().verify(ctx));
}

TEST_F(TransactionSigningTest, MalformedProofs) {
    auto ctx = signing_context();
    auto ts = build().prepare_for_signing();
    ts.append_sign(ctx, *signer_);
    ts.append_sign(ctx, *signer2_);
    const auto& signed_tx = ts.unverified_transaction();

    // 1. Too few proofs
    auto missing = signed_tx;
    missing.auth_proofs.pop_back();
    ASSERT_THROW(missing.verify(ctx), ParaClient::TransactionError);

    // 2. Signature proof paired with a multisig spec
    auto swapped = signed_tx;
    swapped.auth_proofs[2] = swapped.auth_proofs[0];
    try {
        swapped.verify(ctx);
        FAIL() << "mismatched pair should be rejected";
    } catch (const ParaClient::TransactionError& e) {
        ASSERT_NE(std::string(e.what()).find("malformed AddressSpec and AuthProof pair"), std::string::npos);
    }

    // 3. Tampered body
    auto tampered = signed_tx;
    tampered.body.back() ^= 0x01;
    ASSERT_THROW(tampered.verify(ctx), ParaClient::TransactionError);

    // 4. Module-controlled proof
    ParaClient::UnverifiedTransaction module_tx;
    module_tx.body = signed_tx.body;
    module_tx.auth_proofs.resize(1);
    module_tx.auth_proofs[0].module = "evm.ethereum.v0";
    ASSERT_THROW(module_tx.verify(ctx), ParaClient::TransactionError);
}

TEST_F(TransactionSigningTest, MultisigBelowThreshold) {
    auto ctx = signing_context();
    auto pk = signer_->public_key();
    auto pk2 = signer2_->public_key();

    ParaClient::Transaction tx("hello.World", {});
    tx.append_auth_multisig(ParaClient::MultisigConfig{{{pk, 1}, {pk2, 1}}, 2}, 0);
    auto ts = tx.prepare_for_signing();
    ts.append_sign(ctx, *signer_);

    ASSERT_THROW(ts.unverified_transaction().verify(ctx), ParaClient::TransactionError);

    ts.append_sign(ctx, *signer2_);
    ASSERT_NO_THROW(ts.unverified_transaction().verify(ctx));
}
