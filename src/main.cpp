#include "balance_oracle.hpp"
#include "config.hpp"
#include "contract_gateway.hpp"
#include "encoding.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "liquidity_orchestrator.hpp"
#include "logging.hpp"
#include "position_registry.hpp"
#include "price_oracle.hpp"
#include "rpc_client.hpp"
#include "signer.hpp"
#include "tick_math.hpp"
#include "transaction_executor.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace v3lp;

// Raised by SIGINT/SIGTERM; stops receipt waits
std::atomic<bool> g_cancel{false};

void signal_handler(int)
{
    g_cancel.store(true);
}

void print_usage()
{
    std::cout << "v3lp - concentrated liquidity position manager\n\n"
              << "Usage: v3lp [options] COMMAND [ARGS]\n\n"
              << "Options:\n"
              << "  --config FILE   Configuration file (default: config/v3lp.json)\n"
              << "  --network NAME  Network from the configuration (default: default_network)\n"
              << "  --env FILE      Environment file to load (default: .env)\n"
              << "  --help          Show this help message\n"
              << "\nCommands:\n"
              << "  address                       Wallet address and native balance\n"
              << "  balance                       Configured token balances with USD value\n"
              << "  ids                           Position ids currently owned by the wallet\n"
              << "  positions                     Every position received by the wallet\n"
              << "  active                        Positions with liquidity\n"
              << "  in-range                      Active positions and whether they earn fees\n"
              << "  add [TOKEN_A TOKEN_B FEE NOTIONAL REFERENCE LOWER UPPER]\n"
              << "                                Open a position (defaults from the configuration)\n"
              << "  increase TOKEN_ID NOTIONAL REFERENCE\n"
              << "                                Add liquidity to a position\n"
              << "  close TOKEN_ID                Withdraw, collect and burn a position\n"
              << "\nEnvironment variables:\n"
              << "  PRIVATE_KEY     - Wallet private key (required for address/add/increase/close)\n"
              << "  WALLET_ADDRESS  - Wallet address (checked against the key when both are set)\n"
              << std::endl;
}

namespace
{
    // Components for one invocation
    struct App
    {
        AppConfig config;
        NetworkConfig network;
        std::shared_ptr<spdlog::logger> logger;
        std::unique_ptr<JsonRpcClient> rpc;
        std::unique_ptr<ContractGateway> gateway;
        std::unique_ptr<BalanceOracle> balances;
        std::unique_ptr<LocalKeySigner> signer;
        std::string wallet;
        std::map<std::string, int> decimals;

        int decimals_of(const std::string &token)
        {
            auto it = decimals.find(token);
            if (it != decimals.end())
                return it->second;
            int d = balances->decimals_of(token);
            decimals[token] = d;
            return d;
        }

        std::string label(const std::string &token) const
        {
            return config.token_label(network.name, token);
        }

        LocalKeySigner &require_signer()
        {
            if (!signer)
            {
                throw ConfigError("PRIVATE_KEY is required for this command");
            }
            return *signer;
        }
    };

    void print_position(App &app, const Position &p)
    {
        int d0 = app.decimals_of(p.token0);
        int d1 = app.decimals_of(p.token1);
        std::cout << "  #" << p.token_id << "  " << app.label(p.token0) << "/" << app.label(p.token1)
                  << "  fee " << p.fee << "  ticks [" << p.tick_lower << ", " << p.tick_upper << "]"
                  << "  price " << std::setprecision(8) << tick_to_price(p.tick_lower, d0, d1) << " - "
                  << tick_to_price(p.tick_upper, d0, d1) << "  liquidity " << p.liquidity.to_dec();
        if (p.has_owed_fees())
        {
            std::cout << "  owed " << format_units(p.tokens_owed0, d0) << " / " << format_units(p.tokens_owed1, d1);
        }
        std::cout << std::endl;
    }

    int cmd_address(App &app)
    {
        auto native = app.rpc->native_balance(app.wallet);
        std::cout << "[Wallet] " << to_checksum_address(app.wallet) << std::endl;
        std::cout << "[Wallet] Native balance on " << app.network.name << ": " << format_units(native, 18)
                  << std::endl;
        return 0;
    }

    int cmd_balance(App &app)
    {
        CoinGeckoPriceOracle prices({{app.network.name, app.network.price_url}}, app.logger);

        std::cout << "[Balance] " << to_checksum_address(app.wallet) << " on " << app.network.name << std::endl;
        auto tokens_it = app.config.tokens.find(app.network.name);
        if (tokens_it == app.config.tokens.end())
        {
            std::cout << "  (no tokens configured)" << std::endl;
            return 0;
        }

        double total_usd = 0.0;
        for (const auto &[symbol, token] : tokens_it->second)
        {
            int d = app.decimals_of(token);
            double amount = app.balances->balance_of(app.wallet, token, d);
            std::cout << "  " << std::left << std::setw(8) << symbol << std::right << " " << std::fixed
                      << std::setprecision(6) << amount << std::defaultfloat;
            try
            {
                double usd = amount * prices.price_usd(app.network.name, token);
                total_usd += usd;
                std::cout << "  ($" << std::fixed << std::setprecision(2) << usd << ")" << std::defaultfloat;
            }
            catch (const PriceUnavailable &e)
            {
                app.logger->warn("{}", e.what());
                std::cout << "  ($ n/a)";
            }
            std::cout << std::endl;
        }
        std::cout << "  Total: $" << std::fixed << std::setprecision(2) << total_usd << std::defaultfloat
                  << std::endl;
        return 0;
    }

    int cmd_ids(App &app)
    {
        PositionRegistry registry(*app.gateway, app.config.discovery, app.logger);
        auto ids = registry.owned_position_ids(app.wallet);
        std::cout << "[Positions] " << ids.size() << " owned by " << to_checksum_address(app.wallet) << std::endl;
        for (auto id : ids)
        {
            std::cout << "  " << id << std::endl;
        }
        return 0;
    }

    int cmd_positions(App &app, bool active_only)
    {
        PositionRegistry registry(*app.gateway, app.config.discovery, app.logger);
        auto positions = active_only ? registry.get_active_positions(app.wallet) : registry.get_positions(app.wallet);
        std::cout << "[Positions] " << positions.size() << (active_only ? " active" : "") << std::endl;
        for (const auto &[id, position] : positions)
        {
            print_position(app, position);
        }
        return 0;
    }

    int cmd_in_range(App &app)
    {
        PositionRegistry registry(*app.gateway, app.config.discovery, app.logger);
        auto positions = registry.get_active_positions(app.wallet);
        for (const auto &[id, position] : positions)
        {
            auto tick = registry.pool_tick(position);
            bool earning = tick && tick_in_range(*tick, position.tick_lower, position.tick_upper);
            std::cout << (earning ? "[Earning] " : "[Idle]    ") << "tick "
                      << (tick ? std::to_string(*tick) : std::string("?")) << std::endl;
            print_position(app, position);
        }
        return 0;
    }

    LiquidityOrchestrator make_orchestrator(App &app, TransactionExecutor &executor)
    {
        OrchestratorConfig oc;
        oc.slippage_tolerance = app.config.execution.slippage_tolerance;
        oc.deadline_window_s = app.config.execution.deadline_window_s;
        return LiquidityOrchestrator(*app.gateway, *app.balances, executor, oc, app.logger);
    }

    ExecutorConfig executor_config(const App &app)
    {
        ExecutorConfig ec;
        ec.chain_id = app.network.chain_id;
        ec.receipt_timeout = std::chrono::seconds(app.config.execution.receipt_timeout_s);
        ec.poll_interval = std::chrono::milliseconds(app.config.execution.receipt_poll_ms);
        return ec;
    }

    int cmd_add(App &app, const std::vector<std::string> &args)
    {
        const auto &defaults = app.config.position;
        AddLiquidityRequest request;
        std::string reference;
        if (args.empty())
        {
            request.token_a = app.config.resolve_token(app.network.name, defaults.token_a);
            request.token_b = app.config.resolve_token(app.network.name, defaults.token_b);
            request.fee = defaults.fee;
            request.notional = defaults.notional;
            reference = defaults.reference;
            request.range = defaults.range;
        }
        else if (args.size() == 7)
        {
            request.token_a = app.config.resolve_token(app.network.name, args[0]);
            request.token_b = app.config.resolve_token(app.network.name, args[1]);
            request.fee = std::stoi(args[2]);
            request.notional = std::stod(args[3]);
            reference = args[4];
            request.range.lower_factor = std::stod(args[5]);
            request.range.upper_factor = std::stod(args[6]);
        }
        else
        {
            print_usage();
            return 1;
        }
        request.reference = app.config.resolve_token(app.network.name, reference);

        TransactionExecutor executor(*app.rpc, app.require_signer(), executor_config(app), app.logger);
        auto orchestrator = make_orchestrator(app, executor);
        auto result = orchestrator.add_liquidity(request, &g_cancel);

        std::cout << "[Add] Pool " << to_checksum_address(result.quote.pool) << " price " << result.quote.price
                  << std::endl;
        std::cout << "[Add] Ticks [" << result.ticks.lower << ", " << result.ticks.upper << "]" << std::endl;
        std::cout << "[Add] Deposited up to " << format_units(result.desired[0], result.quote.decimals0) << " "
                  << app.label(result.quote.token0) << " and "
                  << format_units(result.desired[1], result.quote.decimals1) << " "
                  << app.label(result.quote.token1) << std::endl;
        std::cout << "[Add] Mint tx " << result.mint_receipt.tx_hash << " in block "
                  << result.mint_receipt.block_number << std::endl;
        if (result.token_id)
        {
            std::cout << "[Add] Position #" << *result.token_id << std::endl;
        }
        return 0;
    }

    int cmd_increase(App &app, const std::vector<std::string> &args)
    {
        if (args.size() != 3)
        {
            print_usage();
            return 1;
        }
        uint64_t token_id = std::stoull(args[0]);
        double notional = std::stod(args[1]);
        std::string reference = app.config.resolve_token(app.network.name, args[2]);

        TransactionExecutor executor(*app.rpc, app.require_signer(), executor_config(app), app.logger);
        auto orchestrator = make_orchestrator(app, executor);
        auto result = orchestrator.increase_liquidity(token_id, notional, reference, &g_cancel);

        std::cout << "[Increase] Position #" << token_id << " tx " << result.receipt.tx_hash << " in block "
                  << result.receipt.block_number << std::endl;
        return 0;
    }

    int cmd_close(App &app, const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            print_usage();
            return 1;
        }
        uint64_t token_id = std::stoull(args[0]);

        TransactionExecutor executor(*app.rpc, app.require_signer(), executor_config(app), app.logger);
        auto orchestrator = make_orchestrator(app, executor);
        auto result = orchestrator.close_position(token_id, &g_cancel);

        if (result.decreased)
            std::cout << "[Close] Decrease tx " << result.decrease_tx << std::endl;
        std::cout << "[Close] Collect tx " << result.collect_tx << std::endl;
        std::cout << "[Close] Burn tx " << result.burn_tx << std::endl;
        return 0;
    }
} // namespace

int main(int argc, char *argv[])
{
    std::string config_path = "config/v3lp.json";
    std::string network_name;
    std::string env_path = ".env";
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help")
        {
            print_usage();
            return 0;
        }
        else if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg == "--network" && i + 1 < argc)
        {
            network_name = argv[++i];
        }
        else if (arg == "--env" && i + 1 < argc)
        {
            env_path = argv[++i];
        }
        else
        {
            positional.push_back(arg);
        }
    }

    if (positional.empty())
    {
        print_usage();
        return 1;
    }
    std::string command = positional.front();
    std::vector<std::string> args(positional.begin() + 1, positional.end());

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    load_env_file(env_path);
    http_global_init();

    int rc = 1;
    App app;
    try
    {
        app.config = load_config(config_path);
        app.network = app.config.network(network_name.empty() ? app.config.default_network : network_name);
        app.logger = make_logger(app.config.log);
        app.logger->info("Network {} ({})", app.network.name, app.network.rpc_url);

        app.rpc = std::make_unique<JsonRpcClient>(app.network.rpc_url);

        GatewayConfig gc;
        gc.position_manager = app.network.position_manager;
        gc.factory = app.network.factory;
        gc.gas_multiplier = app.config.execution.gas_multiplier;
        app.gateway = std::make_unique<ContractGateway>(*app.rpc, AbiSet::load_dir(app.config.abi_dir), gc,
                                                        app.logger);
        app.balances = std::make_unique<BalanceOracle>(*app.gateway, app.logger);

        // Wallet bootstrap: key when present, otherwise a watch-only address
        const char *private_key = std::getenv("PRIVATE_KEY");
        const char *wallet_address = std::getenv("WALLET_ADDRESS");
        if (private_key && *private_key)
        {
            app.signer = std::make_unique<LocalKeySigner>(private_key);
            app.wallet = normalize_address(app.signer->address());
            if (wallet_address && *wallet_address && normalize_address(wallet_address) != app.wallet)
            {
                throw ConfigError("WALLET_ADDRESS does not match the address of PRIVATE_KEY");
            }
        }
        else if (wallet_address && *wallet_address)
        {
            app.wallet = normalize_address(wallet_address);
        }
        else
        {
            throw ConfigError("set PRIVATE_KEY (or WALLET_ADDRESS for read-only commands)");
        }

        if (command == "address")
        {
            app.require_signer();
            rc = cmd_address(app);
        }
        else if (command == "balance")
            rc = cmd_balance(app);
        else if (command == "ids")
            rc = cmd_ids(app);
        else if (command == "positions")
            rc = cmd_positions(app, false);
        else if (command == "active")
            rc = cmd_positions(app, true);
        else if (command == "in-range")
            rc = cmd_in_range(app);
        else if (command == "add")
            rc = cmd_add(app, args);
        else if (command == "increase")
            rc = cmd_increase(app, args);
        else if (command == "close")
            rc = cmd_close(app, args);
        else
        {
            std::cerr << "[Error] Unknown command: " << command << std::endl;
            print_usage();
        }
    }
    catch (const WorkflowError &e)
    {
        std::cerr << "[Error] " << e.what() << std::endl;
        std::cerr << "[Error] " << e.workflow() << " reached state " << e.reached_state() << " (kind "
                  << to_string(e.kind()) << ")" << std::endl;
        if (!e.tx_hash().empty())
        {
            std::cerr << "[Error] Check transaction " << e.tx_hash() << " before retrying" << std::endl;
        }
    }
    catch (const Error &e)
    {
        std::cerr << "[Error] " << to_string(e.kind()) << ": " << e.what() << std::endl;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[Error] " << e.what() << std::endl;
    }

    if (app.logger)
    {
        app.logger->flush();
    }
    http_global_cleanup();
    return rc;
}
