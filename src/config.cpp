#include "config.hpp"
#include "encoding.hpp"
#include "errors.hpp"
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace v3lp
{

    namespace
    {
        std::string checked_address(const std::string &value, const std::string &what)
        {
            try
            {
                return normalize_address(value);
            }
            catch (const std::invalid_argument &)
            {
                throw ConfigError(what + " is not an address: '" + value + "'");
            }
        }

        NetworkConfig parse_network(const std::string &name, const json &j)
        {
            NetworkConfig net;
            net.name = name;
            net.rpc_url = j.at("rpc_url").get<std::string>();
            net.chain_id = j.value("chain_id", uint64_t{0});
            net.price_url = j.value("price_url", std::string());
            net.position_manager = checked_address(j.at("position_manager").get<std::string>(),
                                                   name + ".position_manager");
            net.factory = checked_address(j.at("factory").get<std::string>(), name + ".factory");
            return net;
        }
    } // namespace

    const NetworkConfig &AppConfig::network(const std::string &name) const
    {
        auto it = networks.find(name);
        if (it == networks.end())
        {
            throw ConfigError("network unavailable: " + name);
        }
        return it->second;
    }

    std::string AppConfig::resolve_token(const std::string &network, const std::string &symbol_or_address) const
    {
        auto net_it = tokens.find(network);
        if (net_it != tokens.end())
        {
            auto it = net_it->second.find(symbol_or_address);
            if (it != net_it->second.end())
            {
                return it->second;
            }
        }
        try
        {
            return normalize_address(symbol_or_address);
        }
        catch (const std::invalid_argument &)
        {
            throw ConfigError("unknown token '" + symbol_or_address + "' on " + network);
        }
    }

    std::string AppConfig::token_label(const std::string &network, const std::string &address) const
    {
        auto net_it = tokens.find(network);
        if (net_it != tokens.end())
        {
            std::string wanted = normalize_address(address);
            for (const auto &[symbol, token] : net_it->second)
            {
                if (token == wanted)
                {
                    return symbol;
                }
            }
        }
        return to_checksum_address(address);
    }

    AppConfig parse_config(const json &j)
    {
        AppConfig config;
        try
        {
            for (const auto &[name, net] : j.at("networks").items())
            {
                config.networks[name] = parse_network(name, net);
            }
            if (config.networks.empty())
            {
                throw ConfigError("no networks configured");
            }
            config.default_network = j.value("default_network", config.networks.begin()->first);
            config.network(config.default_network);
            config.abi_dir = j.value("abi_dir", config.abi_dir);

            if (j.contains("tokens"))
            {
                for (const auto &[network, symbols] : j["tokens"].items())
                {
                    for (const auto &[symbol, address] : symbols.items())
                    {
                        config.tokens[network][symbol] =
                            checked_address(address.get<std::string>(), "tokens." + network + "." + symbol);
                    }
                }
            }

            if (j.contains("position"))
            {
                const auto &p = j["position"];
                config.position.token_a = p.value("token_a", std::string());
                config.position.token_b = p.value("token_b", std::string());
                config.position.fee = p.value("fee", config.position.fee);
                config.position.notional = p.value("notional", config.position.notional);
                config.position.reference = p.value("reference", config.position.token_b);
                if (p.contains("range"))
                {
                    const auto &range = p["range"];
                    if (!range.is_array() || range.size() != 2)
                    {
                        throw ConfigError("position.range must be [lower, upper]");
                    }
                    config.position.range.lower_factor = range[0].get<double>();
                    config.position.range.upper_factor = range[1].get<double>();
                }
            }

            if (j.contains("execution"))
            {
                const auto &e = j["execution"];
                auto &exec = config.execution;
                exec.gas_multiplier = e.value("gas_multiplier", exec.gas_multiplier);
                exec.slippage_tolerance = e.value("slippage_tolerance", exec.slippage_tolerance);
                exec.deadline_window_s = e.value("deadline_window_s", exec.deadline_window_s);
                exec.receipt_timeout_s = e.value("receipt_timeout_s", exec.receipt_timeout_s);
                exec.receipt_poll_ms = e.value("receipt_poll_ms", exec.receipt_poll_ms);
                if (exec.gas_multiplier <= 0.0)
                {
                    throw ConfigError("execution.gas_multiplier must be positive");
                }
                if (exec.slippage_tolerance <= 0.0 || exec.slippage_tolerance > 1.0)
                {
                    throw ConfigError("execution.slippage_tolerance must be in (0, 1]");
                }
            }

            if (j.contains("discovery"))
            {
                const auto &d = j["discovery"];
                config.discovery.from_block = d.value("from_block", config.discovery.from_block);
                config.discovery.block_chunk = d.value("block_chunk", config.discovery.block_chunk);
            }

            if (j.contains("log"))
            {
                const auto &l = j["log"];
                config.log.dir = l.value("dir", config.log.dir);
                config.log.file = l.value("file", config.log.file);
                config.log.level = l.value("level", config.log.level);
                config.log.max_size = l.value("max_size", config.log.max_size);
                config.log.backups = l.value("backups", config.log.backups);
            }
        }
        catch (const json::exception &e)
        {
            throw ConfigError(std::string("invalid configuration: ") + e.what());
        }
        return config;
    }

    AppConfig load_config(const std::string &path)
    {
        std::ifstream file(path);
        if (!file)
        {
            throw ConfigError("cannot open configuration file " + path);
        }
        json j;
        try
        {
            j = json::parse(file);
        }
        catch (const json::parse_error &e)
        {
            throw ConfigError("malformed configuration file " + path + ": " + e.what());
        }
        return parse_config(j);
    }

    void load_env_file(const std::string &path)
    {
        std::ifstream file(path);
        std::string line;
        while (std::getline(file, line))
        {
            // Skip comments and empty lines
            if (line.empty() || line[0] == '#')
                continue;

            auto pos = line.find('=');
            if (pos == std::string::npos)
                continue;

            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);

            // Remove trailing comments
            auto comment_pos = value.find('#');
            if (comment_pos != std::string::npos)
            {
                value = value.substr(0, comment_pos);
            }

            // Trim whitespace
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r'))
                value.pop_back();

            setenv(key.c_str(), value.c_str(), 1);
        }
    }

} // namespace v3lp
