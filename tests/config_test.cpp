#include "paraclient/config.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "paraclient/errors.hpp"

namespace {

    ParaClient::ParaTime test_paratime() {
        ParaClient::ParaTime p;
        p.description = "Test ParaTime.";
        p.id = "000000000000000000000000000000000000000000000000f80306c9858e7279";
        p.denominations[ParaClient::NATIVE_DENOMINATION_KEY] = {"FOO", 18};
        p.denominations["BAR"] = {"BARfoo", 9};
        p.denominations["low"] = {"LOWfoo", 9};
        return p;
    }

    const char* NETWORKS_JSON = R"({
        "default": "localnet",
        "localnet": {
            "description": "Local test network",
            "chain_context": "643fb06848be7e970af3b5b2d772eb8cfb30499c8162bc18ac03df2f5e22520e",
            "rpc": "unix:/tmp/node/internal.sock",
            "denomination": { "symbol": "TEST", "decimals": "9" },
            "paratimes": {
                "default": "sapphire",
                "sapphire": {
                    "id": "8000000000000000000000000000000000000000000000000000000000000000",
                    "denominations": { "_": { "symbol": "TEST", "decimals": "18" } }
                }
            }
        }
    })";

} // namespace

TEST(ConfigTest, ParaTimeValidation) {
    auto p = test_paratime();
    ASSERT_NO_THROW(p.validate());

    // 1. Consensus denominations must resolve
    p.consensus_denomination = ParaClient::NATIVE_DENOMINATION_KEY;
    ASSERT_NO_THROW(p.validate());
    p.consensus_denomination = "BAR";
    ASSERT_NO_THROW(p.validate());
    p.consensus_denomination = "LOW";
    ASSERT_NO_THROW(p.validate());

    auto invalid = p;
    invalid.consensus_denomination = "invalid";
    ASSERT_THROW(invalid.validate(), ParaClient::ConfigError);

    // 2. The identifier must be a namespace
    invalid = p;
    invalid.id = "invalid";
    ASSERT_THROW(invalid.validate(), ParaClient::ConfigError);
    ASSERT_THROW(invalid.namespace_id(), ParaClient::ConfigError);

    // 3. Denominations need a symbol
    invalid = p;
    invalid.denominations["EMPTY"] = {"", 9};
    ASSERT_THROW(invalid.validate(), ParaClient::ConfigError);
}

TEST(ConfigTest, DenominationInfo) {
    auto p = test_paratime();

    auto native = p.get_denomination_info("");
    ASSERT_EQ(native.symbol, "FOO");
    ASSERT_EQ(native.decimals, 18);

    auto bar = p.get_denomination_info("BAR");
    ASSERT_EQ(bar.symbol, "BARfoo");
    ASSERT_EQ(bar.decimals, 9);

    // Falls back to the lower-case name
    auto low = p.get_denomination_info("LOW");
    ASSERT_EQ(low.symbol, "LOWfoo");

    // Unknown denominations get defaults
    auto unknown = p.get_denomination_info("DEFAULT");
    ASSERT_EQ(unknown.symbol, "DEFAULT");
    ASSERT_EQ(unknown.decimals, ParaClient::DEFAULT_DENOMINATION_DECIMALS);
}

TEST(ConfigTest, DefaultNetworks) {
    const auto& networks = ParaClient::default_networks();
    ASSERT_NO_THROW(networks.validate());
    ASSERT_EQ(networks.default_name, "mainnet");

    const auto& mainnet = networks.get("mainnet");
    ASSERT_EQ(mainnet.denomination.symbol, "ROSE");
    ASSERT_EQ(mainnet.paratimes.default_name, "emerald");
    ASSERT_EQ(mainnet.paratimes.get("emerald").get_denomination_info("").decimals, 18);
    ASSERT_FALSE(mainnet.is_local_rpc());

    const auto& testnet = networks.get("testnet");
    ASSERT_EQ(testnet.paratimes.get("cipher").namespace_id(), ParaClient::Namespace());
    ASSERT_THROW(networks.get("devnet"), ParaClient::ConfigError);
}

TEST(ConfigTest, SigningContext) {
    ParaClient::Network network;
    network.chain_context = "643fb06848be7e970af3b5b2d772eb8cfb30499c8162bc18ac03df2f5e22520e";
    ParaClient::ParaTime paratime;
    paratime.id = "8000000000000000000000000000000000000000000000000000000000000000";

    ASSERT_EQ(network.signing_context(paratime).str(),
              "oasis-runtime-sdk/tx: v0 for chain ca4842870b97a6d5c0d025adce0b6a0dec94d2ba192ede70f96349cfbe3628b9");
}

TEST(ConfigTest, NetworksManagement) {
    ParaClient::Networks networks;
    auto network = ParaClient::default_networks().get("testnet");

    // 1. The first network becomes the default
    networks.add("testnet", network);
    ASSERT_EQ(networks.default_name, "testnet");
    networks.add("testnet2", network);
    ASSERT_EQ(networks.default_name, "testnet");

    // 2. Duplicates and malformed names
    ASSERT_THROW(networks.add("testnet", network), ParaClient::ConfigError);
    ASSERT_THROW(networks.add("bad name", network), ParaClient::ConfigError);
    ASSERT_THROW(networks.add("", network), ParaClient::ConfigError);

    // 3. Invalid networks are rejected
    auto broken = network;
    broken.chain_context = "abcd";
    ASSERT_THROW(networks.add("broken", broken), ParaClient::ConfigError);

    // 4. Default handling
    networks.set_default("testnet2");
    ASSERT_EQ(networks.default_name, "testnet2");
    ASSERT_THROW(networks.set_default("missing"), ParaClient::ConfigError);
    networks.remove("testnet2");
    ASSERT_TRUE(networks.default_name.empty());
    ASSERT_THROW(networks.remove("testnet2"), ParaClient::ConfigError);
    ASSERT_NO_THROW(networks.validate());
}

TEST(ConfigTest, ParaTimesManagement) {
    ParaClient::ParaTimes paratimes;
    paratimes.add("test", test_paratime());
    ASSERT_EQ(paratimes.default_name, "test");
    ASSERT_THROW(paratimes.add("test", test_paratime()), ParaClient::ConfigError);

    paratimes.default_name = "missing";
    ASSERT_THROW(paratimes.validate(), ParaClient::ConfigError);

    paratimes.remove("test");
    ASSERT_TRUE(paratimes.all.empty());
}

TEST(ConfigTest, LoadFromJson) {
    // 1. Parse
    std::istringstream input(NETWORKS_JSON);
    auto networks = ParaClient::Networks::from_json(input);
    ASSERT_EQ(networks.default_name, "localnet");

    const auto& localnet = networks.get("localnet");
    ASSERT_TRUE(localnet.is_local_rpc());
    ASSERT_EQ(localnet.description, "Local test network");
    const auto& sapphire = localnet.paratimes.get("sapphire");
    ASSERT_EQ(sapphire.get_denomination_info("").decimals, 18);

    // 2. Write and read back
    std::stringstream stored;
    networks.to_json(stored);
    auto reloaded = ParaClient::Networks::from_json(stored);
    ASSERT_EQ(reloaded.default_name, "localnet");
    ASSERT_EQ(reloaded.get("localnet").chain_context, localnet.chain_context);
    ASSERT_EQ(reloaded.get("localnet").paratimes.default_name, "sapphire");
}

TEST(ConfigTest, LoadErrors) {
    std::istringstream garbage("{ not json");
    ASSERT_THROW(ParaClient::Networks::from_json(garbage), ParaClient::ConfigError);

    // Missing chain context
    std::istringstream incomplete(R"({ "net": { "rpc": "x", "denomination": { "symbol": "A" } } })");
    ASSERT_THROW(ParaClient::Networks::from_json(incomplete), ParaClient::ConfigError);

    ASSERT_THROW(ParaClient::Networks::load("/nonexistent/paraclient/networks.json"), ParaClient::ConfigError);
}
