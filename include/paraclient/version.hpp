#ifndef PARACLIENT_VERSION_HPP
#define PARACLIENT_VERSION_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace ParaClient {

    // Transaction format version, carried in the `v` field.
    using TransactionVersion = uint16_t;

    constexpr TransactionVersion LATEST_TRANSACTION_VERSION = 1;

    // Transaction versions accepted by validate_basic(), newest first.
    const std::vector<TransactionVersion> SUPPORTED_TRANSACTION_VERSIONS = {LATEST_TRANSACTION_VERSION};

    struct SdkVersion {
        uint16_t major;
        uint16_t minor;
        uint16_t patch;

        std::string to_string() const;
    };

    constexpr SdkVersion SDK_VERSION = {0, 1, 0};

    /**
     * @brief Checks whether a transaction format version can be processed.
     * @param version The version found in a transaction.
     * @return true if the version is listed in SUPPORTED_TRANSACTION_VERSIONS.
     */
    bool is_supported_transaction_version(TransactionVersion version);

} // namespace ParaClient

#endif // PARACLIENT_VERSION_HPP
