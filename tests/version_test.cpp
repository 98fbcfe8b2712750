#include "paraclient/version.hpp"

#include <gtest/gtest.h>

TEST(VersionTest, SupportedTransactionVersions) {
    ASSERT_TRUE(ParaClient::is_supported_transaction_version(ParaClient::LATEST_TRANSACTION_VERSION));
    ASSERT_TRUE(ParaClient::is_supported_transaction_version(1));
    ASSERT_FALSE(ParaClient::is_supported_transaction_version(0));
    ASSERT_FALSE(ParaClient::is_supported_transaction_version(2));
    ASSERT_EQ(ParaClient::SUPPORTED_TRANSACTION_VERSIONS.front(), ParaClient::LATEST_TRANSACTION_VERSION);
}

TEST(VersionTest, SdkVersionString) {
    ParaClient::SdkVersion version = {2, 10, 3};
    ASSERT_EQ(version.to_string(), "2.10.3");
    ASSERT_EQ(ParaClient::SDK_VERSION.to_string(), "0.1.0");
}
