#pragma once

#include "logging.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>

namespace v3lp
{

    struct NetworkConfig
    {
        std::string name;
        std::string rpc_url;
        uint64_t chain_id{0}; // 0 = ask the endpoint
        std::string price_url; // token price service endpoint
        std::string position_manager;
        std::string factory;
    };

    // Parameters used when `add` is run without arguments
    struct PositionDefaults
    {
        std::string token_a;
        std::string token_b;
        int fee{3000};
        double notional{0.0};
        std::string reference; // token the notional is expressed in
        PriceRange range{0.95, 1.05};
    };

    struct ExecutionConfig
    {
        double gas_multiplier{1.0};
        double slippage_tolerance{0.7}; // minimum accepted fraction of the desired amounts
        uint64_t deadline_window_s{3600};
        uint64_t receipt_timeout_s{300};
        uint64_t receipt_poll_ms{2000};
    };

    struct DiscoveryConfig
    {
        uint64_t from_block{0};
        uint64_t block_chunk{0}; // 0 = scan the whole range in one eth_getLogs call
    };

    struct AppConfig
    {
        std::string default_network;
        std::string abi_dir = "config/abi";
        std::map<std::string, NetworkConfig> networks;
        std::map<std::string, std::map<std::string, std::string>> tokens; // network -> symbol -> address
        PositionDefaults position;
        ExecutionConfig execution;
        DiscoveryConfig discovery;
        LogConfig log;

        // Throws ConfigError for an unknown network
        const NetworkConfig &network(const std::string &name) const;

        // Accepts a configured symbol or a literal address
        std::string resolve_token(const std::string &network, const std::string &symbol_or_address) const;

        // Configured symbol for an address, or the checksummed address itself
        std::string token_label(const std::string &network, const std::string &address) const;
    };

    AppConfig parse_config(const nlohmann::json &j);

    // Throws ConfigError when the file is missing or malformed
    AppConfig load_config(const std::string &path);

    // Exports KEY=VALUE lines of a .env file into the process environment
    void load_env_file(const std::string &path);

} // namespace v3lp
