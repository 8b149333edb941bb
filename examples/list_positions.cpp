#include "config.hpp"
#include "contract_gateway.hpp"
#include "http_client.hpp"
#include "logging.hpp"
#include "position_registry.hpp"
#include "rpc_client.hpp"
#include <cstdlib>
#include <iostream>

int main(int argc, char *argv[])
{
    using namespace v3lp;

    std::string config_path = argc > 1 ? argv[1] : "config/v3lp.json";

    try
    {
        load_env_file(".env");

        http_global_init();

        std::string wallet = std::getenv("WALLET_ADDRESS") ? std::getenv("WALLET_ADDRESS") : "";
        if (wallet.empty())
        {
            std::cerr << "WALLET_ADDRESS not set in .env\n";
            return 1;
        }

        auto config = load_config(config_path);
        const auto &network = config.network(config.default_network);

        // Console only
        LogConfig log_config = config.log;
        log_config.file.clear();
        auto logger = make_logger(log_config, "list_positions");

        JsonRpcClient rpc{network.rpc_url};
        GatewayConfig gateway_config;
        gateway_config.position_manager = network.position_manager;
        gateway_config.factory = network.factory;
        ContractGateway gateway{rpc, AbiSet::load_dir(config.abi_dir), gateway_config, logger};
        PositionRegistry registry{gateway, config.discovery, logger};

        std::cout << "Positions of " << wallet << " on " << network.name << "\n\n";

        // Recipient history, in log order
        std::cout << "=== Received Position Ids ===\n";
        auto ids = registry.list_position_ids(wallet);
        while (auto id = ids.next())
        {
            std::cout << "  " << *id << "\n";
        }

        std::cout << "\n=== Active Positions ===\n\n";
        auto active = registry.get_active_positions(wallet);
        for (const auto &[id, pos] : active)
        {
            std::cout << "Position #" << id << "\n";
            std::cout << "  Pair: " << config.token_label(network.name, pos.token0) << " / "
                      << config.token_label(network.name, pos.token1) << "\n";
            std::cout << "  Fee: " << pos.fee << "\n";
            std::cout << "  Ticks: [" << pos.tick_lower << ", " << pos.tick_upper << "]\n";
            std::cout << "  Liquidity: " << pos.liquidity.to_dec() << "\n";
            std::cout << "  In range: " << (registry.is_in_range(pos) ? "Yes" : "No") << "\n\n";
        }

        http_global_cleanup();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
