#include "paraclient/context.hpp"

#include <gtest/gtest.h>

#include <string>

#include "paraclient/errors.hpp"

namespace {
    const std::string RUNTIME_ID = "8000000000000000000000000000000000000000000000000000000000000000";
    const std::string CONSENSUS_CHAIN_CONTEXT = "643fb06848be7e970af3b5b2d772eb8cfb30499c8162bc18ac03df2f5e22520e";
    const std::string DERIVED = "ca4842870b97a6d5c0d025adce0b6a0dec94d2ba192ede70f96349cfbe3628b9";
} // namespace

TEST(ContextTest, DeriveChainContext) {
    // 1. Parse the runtime identifier
    auto runtime_id = ParaClient::Namespace::from_hex(RUNTIME_ID);
    ASSERT_EQ(runtime_id.bytes()[0], 0x80);
    ASSERT_EQ(runtime_id.to_hex(), RUNTIME_ID);

    // 2. Derive the chain context
    ASSERT_EQ(ParaClient::derive_chain_context(runtime_id, CONSENSUS_CHAIN_CONTEXT), DERIVED);

    // 3. Build the transaction signing context
    auto ctx = ParaClient::Context::for_transactions(runtime_id, CONSENSUS_CHAIN_CONTEXT);
    ASSERT_EQ(ctx.str(), "oasis-runtime-sdk/tx: v0 for chain " + DERIVED);
    ASSERT_EQ(ctx, ParaClient::Context::derive(ParaClient::TRANSACTION_SIGNATURE_CONTEXT_BASE, DERIVED));
    ASSERT_EQ(ctx, ParaClient::Context::for_runtime("oasis-runtime-sdk/tx: v0", runtime_id, CONSENSUS_CHAIN_CONTEXT));
}

TEST(ContextTest, DifferentRuntimesGetDifferentContexts) {
    auto a = ParaClient::Namespace::from_hex(RUNTIME_ID);
    auto b = ParaClient::Namespace::from_hex("8000000000000000000000000000000000000000000000000000000000000001");
    ASSERT_NE(a, b);
    ASSERT_NE(ParaClient::derive_chain_context(a, CONSENSUS_CHAIN_CONTEXT),
              ParaClient::derive_chain_context(b, CONSENSUS_CHAIN_CONTEXT));
}

TEST(ContextTest, RawContext) {
    auto ctx = ParaClient::Context::raw("oasis-core/consensus: tx");
    ASSERT_EQ(ctx.str(), "oasis-core/consensus: tx");
    ASSERT_FALSE(ctx.empty());
    ASSERT_TRUE(ParaClient::Context::raw("").empty());
}

TEST(ContextTest, MalformedInputs) {
    ASSERT_THROW(ParaClient::Namespace::from_hex("80"), ParaClient::AddressError);
    ASSERT_THROW(ParaClient::Namespace::from_hex(std::string(64, 'z')), ParaClient::AddressError);
    ASSERT_THROW(ParaClient::Namespace(ParaClient::byte_vector(31, 0)), ParaClient::AddressError);
    ASSERT_THROW(ParaClient::derive_chain_context(ParaClient::Namespace(), ""), ParaClient::AddressError);
}
