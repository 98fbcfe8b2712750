#ifndef PARACLIENT_RUNTIME_CLIENT_HPP
#define PARACLIENT_RUNTIME_CLIENT_HPP

#include <cstdint>
#include <map>
#include <string>

#include "address.hpp"
#include "callformat.hpp"
#include "context.hpp"
#include "signed_public_key.hpp"
#include "transaction.hpp"

namespace ParaClient {

    struct RuntimeInfo {
        Namespace id;
        // Consensus chain context of the network hosting the runtime.
        std::string chain_context;
    };

    /**
     * @brief Connection to a single runtime.
     *
     * The library ships no transport. Applications provide an implementation
     * over their node connection; every method may block on network I/O and
     * report transport failures with a ParaClient::RuntimeError.
     */
    class RuntimeClient {
    public:
        virtual ~RuntimeClient() = default;

        virtual RuntimeInfo get_info() = 0;

        // The runtime's current call data public key.
        virtual CallDataPublicKeyResponse call_data_public_key() = 0;

        virtual uint64_t estimate_gas(const Transaction& tx) = 0;

        // Minimum gas price per denomination.
        virtual std::map<Denomination, Quantity> min_gas_price() = 0;

        /**
         * @brief Submits a transaction and waits for its execution result.
         * @return The raw result, possibly still sealed for the caller.
         */
        virtual CallResult submit_tx(const UnverifiedTransaction& tx) = 0;

        // Submits a transaction without waiting for it to be executed.
        virtual void submit_tx_no_wait(const UnverifiedTransaction& tx) = 0;

        virtual uint64_t get_nonce(const Address& address) = 0;
    };

} // namespace ParaClient

#endif // PARACLIENT_RUNTIME_CLIENT_HPP
