#include "paraclient/version.hpp"

namespace ParaClient {

    std::string SdkVersion::to_string() const {
        return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }

    bool is_supported_transaction_version(TransactionVersion version) {
        for (const auto& supported : SUPPORTED_TRANSACTION_VERSIONS) {
            if (supported == version) {
                return true;
            }
        }
        return false;
    }

} // namespace ParaClient
