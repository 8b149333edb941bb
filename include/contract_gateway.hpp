#pragma once

#include "abi.hpp"
#include "rpc_client.hpp"
#include "types.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace v3lp
{

    // Fixed, conservative gas limits per operation
    constexpr uint64_t GAS_LIMIT_APPROVE = 100000;
    constexpr uint64_t GAS_LIMIT_MINT = 600000;
    constexpr uint64_t GAS_LIMIT_INCREASE_LIQUIDITY = 450000;
    constexpr uint64_t GAS_LIMIT_DECREASE_LIQUIDITY = 350000;
    constexpr uint64_t GAS_LIMIT_COLLECT = 250000;
    constexpr uint64_t GAS_LIMIT_BURN = 150000;

    struct GatewayConfig
    {
        std::string position_manager;
        std::string factory;
        double gas_multiplier{1.0}; // applied to the live gas price unless a call overrides it
    };

    struct MintParams
    {
        std::string token0;
        std::string token1;
        int fee{0};
        int32_t tick_lower{0};
        int32_t tick_upper{0};
        Uint256 amount0_desired;
        Uint256 amount1_desired;
        Uint256 amount0_min;
        Uint256 amount1_min;
        std::string recipient;
        uint64_t deadline{0};
    };

    struct IncreaseLiquidityParams
    {
        uint64_t token_id{0};
        Uint256 amount0_desired;
        Uint256 amount1_desired;
        Uint256 amount0_min;
        Uint256 amount1_min;
        uint64_t deadline{0};
    };

    struct DecreaseLiquidityParams
    {
        uint64_t token_id{0};
        Uint256 liquidity;
        Uint256 amount0_min;
        Uint256 amount1_min;
        uint64_t deadline{0};
    };

    struct CollectParams
    {
        uint64_t token_id{0};
        std::string recipient;
        Uint256 amount0_max;
        Uint256 amount1_max;
    };

    // Typed access to the position manager, factory, pools and ERC-20 tokens.
    // Reads throw ContractCallError (with the call as context) on transport
    // failure, revert or undecodable data; they never fall back to defaults.
    // Writes only build unsigned intents; signing and sending happen elsewhere.
    class ContractGateway
    {
    public:
        ContractGateway(RpcTransport &rpc, AbiSet abis, const GatewayConfig &config,
                        std::shared_ptr<spdlog::logger> logger = nullptr);

        const std::string &position_manager() const { return config_.position_manager; }
        const AbiSet &abis() const { return abis_; }

        // Reads

        // Throws PositionNotFound for an id the manager does not know
        Position get_position(uint64_t token_id);

        // Zero address when no pool exists for the triple
        std::string get_pool(const std::string &token0, const std::string &token1, int fee);
        Slot0 get_slot0(const std::string &pool);
        int get_token_decimals(const std::string &token);
        Uint256 get_token_balance(const std::string &owner, const std::string &token);
        Uint256 get_allowance(const std::string &owner, const std::string &spender, const std::string &token);
        std::string owner_of(uint64_t token_id);
        uint64_t latest_block_number();
        uint64_t latest_block_timestamp();

        // Position-token Transfer events whose recipient is `owner`, in log order
        std::vector<LogEntry> transfer_logs_to(const std::string &owner, uint64_t from_block, uint64_t to_block);
        uint64_t transfer_token_id(const LogEntry &log) const;

        // Token id minted to `recipient` in a mint receipt, if the receipt carries it
        std::optional<uint64_t> minted_token_id(const TxReceipt &receipt, const std::string &recipient) const;

        // Write intents (gas price read live, nonce filled in by the executor)
        TransactionIntent build_mint(const MintParams &params, std::optional<double> gas_multiplier = std::nullopt);
        TransactionIntent build_increase_liquidity(const IncreaseLiquidityParams &params,
                                                   std::optional<double> gas_multiplier = std::nullopt);
        TransactionIntent build_decrease_liquidity(const DecreaseLiquidityParams &params,
                                                   std::optional<double> gas_multiplier = std::nullopt);
        TransactionIntent build_collect(const CollectParams &params, std::optional<double> gas_multiplier = std::nullopt);
        TransactionIntent build_burn(uint64_t token_id, std::optional<double> gas_multiplier = std::nullopt);
        TransactionIntent build_approve(const std::string &token, const std::string &spender, const Uint256 &amount,
                                        std::optional<double> gas_multiplier = std::nullopt);

    private:
        RpcTransport &rpc_;
        AbiSet abis_;
        GatewayConfig config_;
        std::shared_ptr<spdlog::logger> logger_;

        AbiValues read(const std::string &context, const ContractAbi &abi, const std::string &to,
                       const std::string &function, const AbiValues &args);

        TransactionIntent make_intent(const std::string &to, const ContractAbi &abi, const std::string &function,
                                      const AbiValues &args, uint64_t gas_limit, std::optional<double> gas_multiplier);
    };

} // namespace v3lp
