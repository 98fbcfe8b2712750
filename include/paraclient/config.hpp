#ifndef PARACLIENT_CONFIG_HPP
#define PARACLIENT_CONFIG_HPP

#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>

#include "context.hpp"

namespace ParaClient {

    // Denomination key standing for the ParaTime's native token.
    constexpr char NATIVE_DENOMINATION_KEY[] = "_";

    constexpr uint8_t DEFAULT_DENOMINATION_DECIMALS = 9;

    struct DenominationInfo {
        std::string symbol;
        uint8_t decimals = DEFAULT_DENOMINATION_DECIMALS;

        // Throws ConfigError on an empty symbol.
        void validate() const;

        bool operator==(const DenominationInfo& other) const {
            return symbol == other.symbol && decimals == other.decimals;
        }
    };

    /**
     * @brief Checks a network or ParaTime name.
     *
     * Names are non-empty and made of ASCII letters, digits, '-' and '_'.
     *
     * @throws ParaClient::ConfigError on a malformed name.
     */
    void validate_identifier(const std::string& name);

    struct ParaTime {
        std::string description;
        // Runtime identifier, 64 hex characters.
        std::string id;
        std::map<std::string, DenominationInfo> denominations;
        // Denomination mapped to the consensus layer one; empty when consensus transfers are unsupported.
        std::string consensus_denomination;

        /**
         * @throws ParaClient::ConfigError on a bad identifier or denomination.
         */
        void validate() const;

        /**
         * @throws ParaClient::ConfigError if the identifier does not parse.
         */
        Namespace namespace_id() const;

        /**
         * @brief Looks up a denomination, falling back to a default description.
         *
         * The empty name stands for the native denomination. Names are also
         * tried in lower case. Unknown denominations get their own name as
         * symbol and the default number of decimals.
         */
        DenominationInfo get_denomination_info(const std::string& denomination) const;

    private:
        const DenominationInfo* find_denomination(const std::string& denomination) const;
    };

    struct ParaTimes {
        std::string default_name;
        std::map<std::string, ParaTime> all;

        void validate() const;

        // The first ParaTime added becomes the default.
        void add(const std::string& name, ParaTime paratime);
        void remove(const std::string& name);
        void set_default(const std::string& name);

        /**
         * @throws ParaClient::ConfigError if there is no such ParaTime.
         */
        const ParaTime& get(const std::string& name) const;
    };

    struct Network {
        std::string description;
        // Consensus chain context, 64 hex characters.
        std::string chain_context;
        std::string rpc;
        DenominationInfo denomination;
        ParaTimes paratimes;

        /**
         * @throws ParaClient::ConfigError on a malformed chain context, an empty
         *         RPC endpoint or an invalid ParaTime.
         */
        void validate() const;

        // Whether the RPC endpoint is a local UNIX socket.
        bool is_local_rpc() const;

        /**
         * @brief Signing context for a ParaTime of this network.
         * @param paratime A ParaTime of this network.
         * @param base Context base, transactions by default.
         */
        Context signing_context(const ParaTime& paratime,
                                const std::string& base = TRANSACTION_SIGNATURE_CONTEXT_BASE) const;
    };

    /**
     * @brief A set of named networks, as stored in the client configuration file.
     *
     * The JSON form has a "default" entry naming the default network and one
     * object per network name. ParaTimes are nested the same way.
     */
    struct Networks {
        std::string default_name;
        std::map<std::string, Network> all;

        void validate() const;

        // The first network added becomes the default.
        void add(const std::string& name, Network network);
        void remove(const std::string& name);
        void set_default(const std::string& name);

        /**
         * @throws ParaClient::ConfigError if there is no such network.
         */
        const Network& get(const std::string& name) const;

        /**
         * @brief Parses and validates networks from JSON.
         * @throws ParaClient::ConfigError on a parse error or invalid content.
         */
        static Networks from_json(std::istream& input);
        static Networks load(const std::string& path);

        void to_json(std::ostream& output) const;
        void save(const std::string& path) const;
    };

    // Built-in mainnet and testnet definitions.
    const Networks& default_networks();

} // namespace ParaClient

#endif // PARACLIENT_CONFIG_HPP
