#pragma once

#include "balance_oracle.hpp"
#include "contract_gateway.hpp"
#include "transaction_executor.hpp"
#include "types.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace v3lp
{

    // Last state each workflow completed. `Started` means nothing was done yet.
    enum class AddLiquidityState
    {
        Started,
        PriceDiscovered,
        RangeComputed,
        BalanceVerified,
        Approved,
        Minted
    };

    enum class IncreaseLiquidityState
    {
        Started,
        PriceDiscovered,
        BalanceVerified,
        Approved,
        Increased
    };

    enum class CloseState
    {
        Started,
        LiquidityQueried,
        LiquidityDecreased,
        FeesCollected,
        Burned
    };

    const char *to_string(AddLiquidityState state);
    const char *to_string(IncreaseLiquidityState state);
    const char *to_string(CloseState state);

    struct AddLiquidityRequest
    {
        std::string token_a;
        std::string token_b;
        int fee{3000};
        double notional{0.0};  // in units of `reference`
        std::string reference; // token_a or token_b
        PriceRange range{0.95, 1.05};
    };

    // Pool state read at the start of a workflow
    struct PoolQuote
    {
        std::string pool;
        std::string token0;
        std::string token1;
        int decimals0{0};
        int decimals1{0};
        double price{0.0}; // token1 per token0
        int32_t tick{0};
    };

    struct AddLiquidityResult
    {
        AddLiquidityState state{AddLiquidityState::Started};
        PoolQuote quote;
        TickRange ticks;
        std::array<Uint256, 2> desired; // indexed like token0/token1
        std::array<Uint256, 2> minimum;
        std::vector<std::string> approval_hashes;
        TxReceipt mint_receipt;
        std::optional<uint64_t> token_id; // from the mint receipt's Transfer event
    };

    struct IncreaseLiquidityResult
    {
        IncreaseLiquidityState state{IncreaseLiquidityState::Started};
        uint64_t token_id{0};
        PoolQuote quote;
        std::array<Uint256, 2> desired;
        std::array<Uint256, 2> minimum;
        std::vector<std::string> approval_hashes;
        TxReceipt receipt;
    };

    struct ClosePositionResult
    {
        CloseState state{CloseState::Started};
        uint64_t token_id{0};
        bool decreased{false}; // false when the position had no liquidity left
        std::string decrease_tx;
        std::string collect_tx;
        std::string burn_tx;
    };

    struct OrchestratorConfig
    {
        double slippage_tolerance{0.7}; // minimum amounts = desired * tolerance
        uint64_t deadline_window_s{3600};
    };

    // Mutating workflows for one wallet. Each step that sends a transaction
    // waits for its receipt before the next one starts. Nothing is retried:
    // a failing step throws WorkflowError naming the last state reached, and
    // what earlier steps did on chain stays in place.
    class LiquidityOrchestrator
    {
    public:
        LiquidityOrchestrator(ContractGateway &gateway, BalanceOracle &balances, TransactionExecutor &executor,
                              const OrchestratorConfig &config, std::shared_ptr<spdlog::logger> logger = nullptr);

        // Balance check -> approve -> mint
        AddLiquidityResult add_liquidity(const AddLiquidityRequest &request,
                                         const std::atomic<bool> *cancel = nullptr);

        // Adds `notional` (in `reference` units) to an existing position
        IncreaseLiquidityResult increase_liquidity(uint64_t token_id, double notional, const std::string &reference,
                                                   const std::atomic<bool> *cancel = nullptr);

        // Decrease (when liquidity > 0) -> collect -> burn
        ClosePositionResult close_position(uint64_t token_id, const std::atomic<bool> *cancel = nullptr);

        PoolQuote quote_pool(const std::string &token_a, const std::string &token_b, int fee);

        // Desired raw amounts for a notional, half held in each token
        std::array<Uint256, 2> split_notional(const PoolQuote &quote, double notional,
                                              const std::string &reference) const;

        Uint256 min_amount(const Uint256 &desired) const;

    private:
        ContractGateway &gateway_;
        BalanceOracle &balances_;
        TransactionExecutor &executor_;
        OrchestratorConfig config_;
        std::shared_ptr<spdlog::logger> logger_;

        void verify_balances(const PoolQuote &quote, const std::array<Uint256, 2> &amounts);

        std::vector<std::string> approve_if_needed(const PoolQuote &quote, const std::array<Uint256, 2> &amounts,
                                                   std::string &pending_tx, const std::atomic<bool> *cancel);

        uint64_t deadline();
    };

} // namespace v3lp
