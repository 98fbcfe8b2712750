#include "paraclient/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "paraclient/errors.hpp"
#include "paraclient/log.hpp"

namespace pt = boost::property_tree;

namespace ParaClient {

    namespace {

    constexpr char DEFAULT_KEY[] = "default";

    Logger logger() {
        static Logger log = create_logger("config");
        return log;
    }

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    void validate_hex_hash(const std::string& hex) {
        if (hex.size() != 64) {
            throw ConfigError("malformed chain context: expected 64 hex characters");
        }
        for (char c : hex) {
            if (!std::isxdigit(static_cast<unsigned char>(c))) {
                throw ConfigError("malformed chain context: invalid hex character");
            }
        }
    }

    // Children are appended with push_back so that names are never parsed as paths.
    void add_child(pt::ptree& tree, const std::string& key, const pt::ptree& child) {
        tree.push_back(pt::ptree::value_type(key, child));
    }

    DenominationInfo read_denomination(const pt::ptree& tree) {
        DenominationInfo info;
        info.symbol = tree.get<std::string>("symbol");
        const unsigned decimals = tree.get<unsigned>("decimals", DEFAULT_DENOMINATION_DECIMALS);
        if (decimals > UINT8_MAX) {
            throw ConfigError("denomination decimals out of range");
        }
        info.decimals = static_cast<uint8_t>(decimals);
        return info;
    }

    pt::ptree write_denomination(const DenominationInfo& info) {
        pt::ptree tree;
        tree.put("symbol", info.symbol);
        tree.put("decimals", static_cast<unsigned>(info.decimals));
        return tree;
    }

    ParaTime read_paratime(const pt::ptree& tree) {
        ParaTime paratime;
        paratime.description = tree.get<std::string>("description", "");
        paratime.id = tree.get<std::string>("id");
        paratime.consensus_denomination = tree.get<std::string>("consensus_denomination", "");
        if (auto denominations = tree.get_child_optional("denominations")) {
            for (const auto& entry : *denominations) {
                paratime.denominations[entry.first] = read_denomination(entry.second);
            }
        }
        return paratime;
    }

    pt::ptree write_paratime(const ParaTime& paratime) {
        pt::ptree tree;
        tree.put("description", paratime.description);
        tree.put("id", paratime.id);
        if (!paratime.denominations.empty()) {
            pt::ptree denominations;
            for (const auto& entry : paratime.denominations) {
                add_child(denominations, entry.first, write_denomination(entry.second));
            }
            add_child(tree, "denominations", denominations);
        }
        if (!paratime.consensus_denomination.empty()) {
            tree.put("consensus_denomination", paratime.consensus_denomination);
        }
        return tree;
    }

    Network read_network(const pt::ptree& tree) {
        Network network;
        network.description = tree.get<std::string>("description", "");
        network.chain_context = tree.get<std::string>("chain_context");
        network.rpc = tree.get<std::string>("rpc");
        network.denomination = read_denomination(tree.get_child("denomination"));
        if (auto paratimes = tree.get_child_optional("paratimes")) {
            for (const auto& entry : *paratimes) {
                if (entry.first == DEFAULT_KEY) {
                    network.paratimes.default_name = entry.second.data();
                } else {
                    network.paratimes.all[entry.first] = read_paratime(entry.second);
                }
            }
        }
        return network;
    }

    pt::ptree write_network(const Network& network) {
        pt::ptree tree;
        tree.put("description", network.description);
        tree.put("chain_context", network.chain_context);
        tree.put("rpc", network.rpc);
        add_child(tree, "denomination", write_denomination(network.denomination));

        pt::ptree paratimes;
        paratimes.put(DEFAULT_KEY, network.paratimes.default_name);
        for (const auto& entry : network.paratimes.all) {
            add_child(paratimes, entry.first, write_paratime(entry.second));
        }
        add_child(tree, "paratimes", paratimes);
        return tree;
    }

    } // namespace

    void DenominationInfo::validate() const {
        if (symbol.empty()) {
            throw ConfigError("denomination symbol cannot be empty");
        }
    }

    void validate_identifier(const std::string& name) {
        if (name.empty()) {
            throw ConfigError("identifier cannot be empty");
        }
        for (char c : name) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
                throw ConfigError("malformed identifier '" + name + "'");
            }
        }
    }

    // --- ParaTime ---

    void ParaTime::validate() const {
        namespace_id();

        for (const auto& entry : denominations) {
            if (entry.first.empty()) {
                throw ConfigError("malformed denomination name ''");
            }
            try {
                entry.second.validate();
            } catch (const ConfigError& e) {
                throw ConfigError("denomination '" + entry.first + "': " + e.what());
            }
        }

        if (!consensus_denomination.empty() && find_denomination(consensus_denomination) == nullptr) {
            throw ConfigError("invalid consensus denomination '" + consensus_denomination + "'");
        }
    }

    Namespace ParaTime::namespace_id() const {
        try {
            return Namespace::from_hex(id);
        } catch (const AddressError& e) {
            throw ConfigError(std::string("bad paratime identifier: ") + e.what());
        }
    }

    DenominationInfo ParaTime::get_denomination_info(const std::string& denomination) const {
        if (const DenominationInfo* info = find_denomination(denomination)) {
            return *info;
        }
        return DenominationInfo{denomination, DEFAULT_DENOMINATION_DECIMALS};
    }

    const DenominationInfo* ParaTime::find_denomination(const std::string& denomination) const {
        const std::string key = denomination.empty() ? NATIVE_DENOMINATION_KEY : denomination;
        auto it = denominations.find(key);
        if (it == denominations.end()) {
            it = denominations.find(to_lower(key));
        }
        return it == denominations.end() ? nullptr : &it->second;
    }

    // --- ParaTimes ---

    void ParaTimes::validate() const {
        if (!default_name.empty() && all.count(default_name) == 0) {
            throw ConfigError("default paratime '" + default_name + "' does not exist");
        }
        for (const auto& entry : all) {
            try {
                validate_identifier(entry.first);
                entry.second.validate();
            } catch (const ConfigError& e) {
                throw ConfigError("paratime '" + entry.first + "': " + e.what());
            }
        }
    }

    void ParaTimes::add(const std::string& name, ParaTime paratime) {
        if (all.count(name) != 0) {
            throw ConfigError("paratime '" + name + "' already exists");
        }
        validate_identifier(name);
        paratime.validate();

        all.emplace(name, std::move(paratime));
        if (default_name.empty()) {
            default_name = name;
        }
    }

    void ParaTimes::remove(const std::string& name) {
        if (all.erase(name) == 0) {
            throw ConfigError("paratime '" + name + "' does not exist");
        }
        if (default_name == name) {
            default_name.clear();
        }
    }

    void ParaTimes::set_default(const std::string& name) {
        get(name);
        default_name = name;
    }

    const ParaTime& ParaTimes::get(const std::string& name) const {
        auto it = all.find(name);
        if (it == all.end()) {
            throw ConfigError("paratime '" + name + "' does not exist");
        }
        return it->second;
    }

    // --- Network ---

    void Network::validate() const {
        validate_hex_hash(chain_context);
        if (rpc.empty()) {
            throw ConfigError("malformed RPC endpoint: empty");
        }
        denomination.validate();
        paratimes.validate();
    }

    bool Network::is_local_rpc() const {
        return rpc.compare(0, 5, "unix:") == 0;
    }

    Context Network::signing_context(const ParaTime& paratime, const std::string& base) const {
        return Context::for_runtime(base, paratime.namespace_id(), chain_context);
    }

    // --- Networks ---

    void Networks::validate() const {
        if (!default_name.empty() && all.count(default_name) == 0) {
            throw ConfigError("default network '" + default_name + "' does not exist");
        }
        for (const auto& entry : all) {
            try {
                validate_identifier(entry.first);
                entry.second.validate();
            } catch (const ConfigError& e) {
                throw ConfigError("network '" + entry.first + "': " + e.what());
            }
        }
    }

    void Networks::add(const std::string& name, Network network) {
        if (all.count(name) != 0) {
            throw ConfigError("network '" + name + "' already exists");
        }
        validate_identifier(name);
        network.validate();

        all.emplace(name, std::move(network));
        if (default_name.empty()) {
            default_name = name;
        }
    }

    void Networks::remove(const std::string& name) {
        if (all.erase(name) == 0) {
            throw ConfigError("network '" + name + "' does not exist");
        }
        if (default_name == name) {
            default_name.clear();
        }
    }

    void Networks::set_default(const std::string& name) {
        get(name);
        default_name = name;
    }

    const Network& Networks::get(const std::string& name) const {
        auto it = all.find(name);
        if (it == all.end()) {
            throw ConfigError("network '" + name + "' does not exist");
        }
        return it->second;
    }

    Networks Networks::from_json(std::istream& input) {
        Networks networks;
        try {
            pt::ptree tree;
            pt::read_json(input, tree);
            for (const auto& entry : tree) {
                if (entry.first == DEFAULT_KEY) {
                    networks.default_name = entry.second.data();
                } else {
                    networks.all[entry.first] = read_network(entry.second);
                }
            }
        } catch (const pt::ptree_error& e) {
            logger()->error("Failed to read network configuration: {}", e.what());
            throw ConfigError(std::string("failed to read network configuration: ") + e.what());
        }
        networks.validate();
        return networks;
    }

    Networks Networks::load(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            logger()->error("Cannot open configuration file {}", path);
            throw ConfigError("cannot open configuration file " + path);
        }
        return from_json(file);
    }

    void Networks::to_json(std::ostream& output) const {
        pt::ptree tree;
        tree.put(DEFAULT_KEY, default_name);
        for (const auto& entry : all) {
            add_child(tree, entry.first, write_network(entry.second));
        }
        pt::write_json(output, tree);
    }

    void Networks::save(const std::string& path) const {
        std::ofstream file(path);
        if (!file) {
            throw ConfigError("cannot write configuration file " + path);
        }
        to_json(file);
    }

    const Networks& default_networks() {
        static const Networks networks = [] {
            auto paratime = [](const std::string& id, const std::string& symbol, uint8_t decimals) {
                ParaTime p;
                p.id = id;
                p.denominations[NATIVE_DENOMINATION_KEY] = DenominationInfo{symbol, decimals};
                return p;
            };

            Networks n;
            n.default_name = "mainnet";

            Network mainnet;
            mainnet.chain_context = "53852332637bacb61b91b6411ab4095168ba02a50be4c3f82448438826f23898";
            mainnet.rpc = "grpc.oasis.dev:443";
            mainnet.denomination = DenominationInfo{"ROSE", 9};
            mainnet.paratimes.default_name = "emerald";
            mainnet.paratimes.all["cipher"] =
                paratime("000000000000000000000000000000000000000000000000e199119c992377cb", "ROSE", 9);
            mainnet.paratimes.all["emerald"] =
                paratime("000000000000000000000000000000000000000000000000e2eaa99fc008f87f", "ROSE", 18);
            n.all["mainnet"] = std::move(mainnet);

            Network testnet;
            testnet.chain_context = "5ba68bc5e01e06f755c4c044dd11ec508e4c17f1faf40c0e67874388437a9e55";
            testnet.rpc = "testnet.grpc.oasis.dev:443";
            testnet.denomination = DenominationInfo{"TEST", 9};
            testnet.paratimes.default_name = "emerald";
            testnet.paratimes.all["cipher"] =
                paratime("0000000000000000000000000000000000000000000000000000000000000000", "TEST", 9);
            testnet.paratimes.all["emerald"] =
                paratime("00000000000000000000000000000000000000000000000072c8215e60d5bca7", "TEST", 18);
            n.all["testnet"] = std::move(testnet);

            return n;
        }();
        return networks;
    }

} // namespace ParaClient
