#include "paraclient/multisig.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <vector>

#include "paraclient/crypto.hpp"
#include "paraclient/ed25519.hpp"
#include "paraclient/errors.hpp"

namespace {

    ParaClient::PublicKey dummy_key(const char* b64) {
        return ParaClient::Ed25519PublicKey::from_base64(b64);
    }

    const ParaClient::PublicKey PK_A = dummy_key("CgAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA=");
    const ParaClient::PublicKey PK_B = dummy_key("CwAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA=");
    const ParaClient::PublicKey PK_C = dummy_key("DAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA=");

    ParaClient::MultisigError::Kind validation_error(const ParaClient::MultisigConfig& config) {
        try {
            config.validate_basic();
        } catch (const ParaClient::MultisigError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "validate_basic() should have thrown";
        return ParaClient::MultisigError::Kind::ZeroThreshold;
    }

} // namespace

TEST(MultisigTest, ValidateBasic) {
    using Kind = ParaClient::MultisigError::Kind;

    ParaClient::MultisigConfig config{{{PK_A, 0}}, 0};
    ASSERT_EQ(validation_error(config), Kind::ZeroThreshold);

    config = ParaClient::MultisigConfig{{{PK_A, 1}, {PK_A, 1}}, 1};
    ASSERT_EQ(validation_error(config), Kind::DuplicateSigner);

    config = ParaClient::MultisigConfig{{{PK_A, 1}, {PK_B, 0}}, 1};
    ASSERT_EQ(validation_error(config), Kind::ZeroWeight);

    config = ParaClient::MultisigConfig{{{PK_A, 1}, {PK_B, UINT64_MAX}}, 1};
    ASSERT_EQ(validation_error(config), Kind::WeightOverflow);

    config = ParaClient::MultisigConfig{{{PK_A, 1}, {PK_B, 1}}, 3};
    ASSERT_EQ(validation_error(config), Kind::ImpossibleThreshold);

    config = ParaClient::MultisigConfig{{{PK_A, 1}, {PK_B, 1}}, 2};
    ASSERT_NO_THROW(config.validate_basic());
}

TEST(MultisigTest, ValidateBasicReportsIndex) {
    ParaClient::MultisigConfig config{{{PK_A, 1}, {PK_B, 1}, {PK_A, 1}}, 1};
    try {
        config.validate_basic();
        FAIL() << "duplicate signer should be rejected";
    } catch (const ParaClient::MultisigError& e) {
        ASSERT_EQ(e.kind(), ParaClient::MultisigError::Kind::DuplicateSigner);
        ASSERT_EQ(e.index(), 2u);
    }
}

TEST(MultisigTest, Batch) {
    ParaClient::MultisigConfig config{{{PK_A, 1}, {PK_B, 1}, {PK_C, 2}}, 2};
    const ParaClient::byte_vector sig_a = {'a'};
    const ParaClient::byte_vector sig_b = {'b'};
    const ParaClient::byte_vector sig_c = {'c'};
    const std::optional<ParaClient::byte_vector> none;

    // 1. Insufficient weight
    ASSERT_THROW(config.batch({sig_a, none, none}), ParaClient::MultisigError);

    // 2. Two light signers
    auto batch = config.batch({sig_a, sig_b, none});
    ASSERT_EQ(batch.public_keys, (std::vector<ParaClient::PublicKey>{PK_A, PK_B}));
    ASSERT_EQ(batch.signatures, (std::vector<ParaClient::byte_vector>{sig_a, sig_b}));

    // 3. One heavy signer
    batch = config.batch({none, none, sig_c});
    ASSERT_EQ(batch.public_keys, (std::vector<ParaClient::PublicKey>{PK_C}));
    ASSERT_EQ(batch.signatures, (std::vector<ParaClient::byte_vector>{sig_c}));

    // 4. Everyone
    batch = config.batch({sig_a, sig_b, sig_c});
    ASSERT_EQ(batch.public_keys.size(), 3u);

    // 5. Wrong slot counts
    try {
        config.batch({sig_a, sig_b});
        FAIL() << "too few signature slots";
    } catch (const ParaClient::MultisigError& e) {
        ASSERT_EQ(e.kind(), ParaClient::MultisigError::Kind::MismatchedSignatureSet);
    }
    ASSERT_THROW(config.batch({sig_a, sig_b, none, none}), ParaClient::MultisigError);
}

TEST(MultisigTest, ConfigCbor) {
    ParaClient::MultisigConfig config{{{PK_A, 1}, {PK_B, 2}}, 2};
    auto decoded = ParaClient::MultisigConfig::from_cbor(ParaClient::CborValue::decode(config.to_cbor().encode()));
    ASSERT_EQ(decoded, config);
}

class MultisigAuthenticatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(ParaClient::Crypto::init(), 0);
        signers_.push_back(ParaClient::Ed25519Signer::generate());
        signers_.push_back(ParaClient::Ed25519Signer::generate());
        signers_.push_back(ParaClient::Ed25519Signer::generate());

        // Weights 1, 1, 2 with threshold 2.
        config_.signers = {{signers_[0].public_key(), 1}, {signers_[1].public_key(), 1}, {signers_[2].public_key(), 2}};
        config_.threshold = 2;
    }

    ParaClient::byte_vector sign(size_t i) const { return signers_[i].context_sign(ctx_, msg_); }

    std::vector<ParaClient::Ed25519Signer> signers_;
    ParaClient::MultisigConfig config_;
    ParaClient::Context ctx_ = ParaClient::Context::raw("oasis-runtime-sdk/test: multisig");
    ParaClient::byte_vector msg_ = ParaClient::to_bytes("transfer 10 units");
};

TEST_F(MultisigAuthenticatorTest, ThresholdReached) {
    ParaClient::MultisigAuthenticator auth(config_);

    ASSERT_NO_THROW(auth.verify(ctx_, msg_, {{0, sign(0)}, {1, sign(1)}}));
    ASSERT_NO_THROW(auth.verify(ctx_, msg_, {{2, sign(2)}}));
    ASSERT_TRUE(auth.is_satisfied(ctx_, msg_, {{1, sign(1)}, {2, sign(2)}}));
}

TEST_F(MultisigAuthenticatorTest, Failures) {
    using Kind = ParaClient::MultisigError::Kind;
    ParaClient::MultisigAuthenticator auth(config_);

    auto kind_of = [&](const std::vector<ParaClient::MultisigAuthenticator::IndexedSignature>& sigs) {
        try {
            auth.verify(ctx_, msg_, sigs);
        } catch (const ParaClient::MultisigError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "verify() should have thrown";
        return Kind::ZeroThreshold;
    };

    ASSERT_EQ(kind_of({{0, sign(0)}}), Kind::InsufficientWeight);
    ASSERT_EQ(kind_of({}), Kind::InsufficientWeight);
    ASSERT_EQ(kind_of({{0, sign(0)}, {0, sign(0)}}), Kind::DuplicateIndex);
    ASSERT_EQ(kind_of({{3, sign(0)}}), Kind::IndexOutOfRange);
    ASSERT_EQ(kind_of({{0, sign(1)}, {1, sign(1)}}), Kind::InvalidSignatureAt);
    ASSERT_FALSE(auth.is_satisfied(ctx_, msg_, {{0, sign(0)}}));
}

TEST_F(MultisigAuthenticatorTest, RejectsInvalidConfig) {
    config_.threshold = 5;
    ASSERT_THROW(ParaClient::MultisigAuthenticator auth(config_), ParaClient::MultisigError);
}
