#include "liquidity_orchestrator.hpp"
#include "encoding.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "tick_math.hpp"
#include <cmath>
#include <stdexcept>

namespace v3lp
{

    namespace
    {
        void check_cancelled(const std::atomic<bool> *cancel, const std::string &step)
        {
            if (cancel && cancel->load())
            {
                throw PreconditionFailed("cancelled before " + step);
            }
        }

        std::string checked_token(const std::string &token)
        {
            try
            {
                return normalize_address(token);
            }
            catch (const std::invalid_argument &)
            {
                throw PreconditionFailed("token is not an address: '" + token + "'");
            }
        }
    } // namespace

    const char *to_string(AddLiquidityState state)
    {
        switch (state)
        {
        case AddLiquidityState::Started:
            return "Started";
        case AddLiquidityState::PriceDiscovered:
            return "PriceDiscovered";
        case AddLiquidityState::RangeComputed:
            return "RangeComputed";
        case AddLiquidityState::BalanceVerified:
            return "BalanceVerified";
        case AddLiquidityState::Approved:
            return "Approved";
        case AddLiquidityState::Minted:
            return "Minted";
        }
        return "Unknown";
    }

    const char *to_string(IncreaseLiquidityState state)
    {
        switch (state)
        {
        case IncreaseLiquidityState::Started:
            return "Started";
        case IncreaseLiquidityState::PriceDiscovered:
            return "PriceDiscovered";
        case IncreaseLiquidityState::BalanceVerified:
            return "BalanceVerified";
        case IncreaseLiquidityState::Approved:
            return "Approved";
        case IncreaseLiquidityState::Increased:
            return "Increased";
        }
        return "Unknown";
    }

    const char *to_string(CloseState state)
    {
        switch (state)
        {
        case CloseState::Started:
            return "Started";
        case CloseState::LiquidityQueried:
            return "LiquidityQueried";
        case CloseState::LiquidityDecreased:
            return "LiquidityDecreased";
        case CloseState::FeesCollected:
            return "FeesCollected";
        case CloseState::Burned:
            return "Burned";
        }
        return "Unknown";
    }

    LiquidityOrchestrator::LiquidityOrchestrator(ContractGateway &gateway, BalanceOracle &balances,
                                                 TransactionExecutor &executor, const OrchestratorConfig &config,
                                                 std::shared_ptr<spdlog::logger> logger)
        : gateway_(gateway), balances_(balances), executor_(executor), config_(config),
          logger_(or_null(std::move(logger)))
    {
        if (!(config_.slippage_tolerance > 0.0) || config_.slippage_tolerance > 1.0)
        {
            throw ConfigError("slippage tolerance must be in (0, 1]");
        }
    }

    PoolQuote LiquidityOrchestrator::quote_pool(const std::string &token_a, const std::string &token_b, int fee)
    {
        tick_spacing(fee);

        std::string a = checked_token(token_a);
        std::string b = checked_token(token_b);
        if (a == b)
        {
            throw PreconditionFailed("a pool needs two different tokens, got " + a + " twice");
        }

        PoolQuote quote;
        quote.token0 = address_less(a, b) ? a : b;
        quote.token1 = address_less(a, b) ? b : a;
        quote.pool = gateway_.get_pool(quote.token0, quote.token1, fee);
        if (is_zero_address(quote.pool))
        {
            throw PreconditionFailed("no pool for " + quote.token0 + "/" + quote.token1 + " fee " +
                                     std::to_string(fee));
        }

        auto slot = gateway_.get_slot0(quote.pool);
        quote.decimals0 = balances_.decimals_of(quote.token0);
        quote.decimals1 = balances_.decimals_of(quote.token1);
        quote.price = sqrt_price_x96_to_price(slot.sqrt_price_x96, quote.decimals0, quote.decimals1);
        quote.tick = slot.tick;

        logger_->info("Pool {}: price {} (tick {})", quote.pool, quote.price, quote.tick);
        return quote;
    }

    std::array<Uint256, 2> LiquidityOrchestrator::split_notional(const PoolQuote &quote, double notional,
                                                                 const std::string &reference) const
    {
        if (!(notional > 0.0) || !std::isfinite(notional))
        {
            throw PreconditionFailed("notional must be a positive amount");
        }
        if (!(quote.price > 0.0) || !std::isfinite(quote.price))
        {
            throw InvalidPrice("pool price is not usable: " + std::to_string(quote.price));
        }

        std::string ref;
        try
        {
            ref = normalize_address(reference);
        }
        catch (const std::invalid_argument &)
        {
            throw PreconditionFailed("reference token is not an address: " + reference);
        }

        double half = notional / 2.0;
        double amount0 = 0.0;
        double amount1 = 0.0;
        if (ref == quote.token0)
        {
            amount0 = half;
            amount1 = half * quote.price;
        }
        else if (ref == quote.token1)
        {
            amount1 = half;
            amount0 = half / quote.price;
        }
        else
        {
            throw PreconditionFailed("reference token " + ref + " is not part of pool " + quote.pool);
        }

        try
        {
            return {parse_units(amount0, quote.decimals0), parse_units(amount1, quote.decimals1)};
        }
        catch (const std::exception &e)
        {
            throw PreconditionFailed(std::string("notional cannot be converted to token amounts: ") + e.what());
        }
    }

    Uint256 LiquidityOrchestrator::min_amount(const Uint256 &desired) const
    {
        auto bps = static_cast<uint64_t>(std::llround(config_.slippage_tolerance * 10000.0));
        return desired.mul_div(Uint256(bps), Uint256(10000));
    }

    uint64_t LiquidityOrchestrator::deadline()
    {
        return gateway_.latest_block_timestamp() + config_.deadline_window_s;
    }

    void LiquidityOrchestrator::verify_balances(const PoolQuote &quote, const std::array<Uint256, 2> &amounts)
    {
        std::string wallet = executor_.wallet();
        const std::array<std::string, 2> tokens{quote.token0, quote.token1};
        const std::array<int, 2> decimals{quote.decimals0, quote.decimals1};

        for (size_t i = 0; i < tokens.size(); ++i)
        {
            auto available = balances_.raw_balance_of(wallet, tokens[i]);
            logger_->info("Balance of {}: {} (need {})", tokens[i], format_units(available, decimals[i]),
                          format_units(amounts[i], decimals[i]));
            if (available < amounts[i])
            {
                throw InsufficientBalance(tokens[i], format_units(amounts[i], decimals[i]),
                                          format_units(available, decimals[i]));
            }
        }
    }

    std::vector<std::string> LiquidityOrchestrator::approve_if_needed(const PoolQuote &quote,
                                                                      const std::array<Uint256, 2> &amounts,
                                                                      std::string &pending_tx,
                                                                      const std::atomic<bool> *cancel)
    {
        std::string wallet = executor_.wallet();
        const std::string &spender = gateway_.position_manager();
        const std::array<std::string, 2> tokens{quote.token0, quote.token1};

        std::vector<std::string> hashes;
        for (size_t i = 0; i < tokens.size(); ++i)
        {
            if (amounts[i].is_zero())
            {
                continue;
            }
            auto allowance = gateway_.get_allowance(wallet, spender, tokens[i]);
            if (allowance >= amounts[i])
            {
                logger_->debug("Allowance for {} already covers {}", tokens[i], amounts[i].to_dec());
                continue;
            }

            check_cancelled(cancel, "approve " + tokens[i]);
            pending_tx.clear();
            executor_.execute(gateway_.build_approve(tokens[i], spender, amounts[i]), pending_tx, cancel);
            hashes.push_back(pending_tx);
            pending_tx.clear();
        }
        return hashes;
    }

    AddLiquidityResult LiquidityOrchestrator::add_liquidity(const AddLiquidityRequest &request,
                                                            const std::atomic<bool> *cancel)
    {
        AddLiquidityResult result;
        std::string step = "discover price";
        std::string pending_tx;

        auto advance = [&](AddLiquidityState next)
        {
            result.state = next;
            logger_->info("add-liquidity: {}", to_string(next));
        };

        try
        {
            result.quote = quote_pool(request.token_a, request.token_b, request.fee);
            advance(AddLiquidityState::PriceDiscovered);

            step = "compute range";
            result.ticks = compute_range(result.quote.price, request.range, result.quote.decimals0,
                                         result.quote.decimals1, request.fee);
            logger_->info("Tick range [{}, {}] (prices {} - {})", result.ticks.lower, result.ticks.upper,
                          tick_to_price(result.ticks.lower, result.quote.decimals0, result.quote.decimals1),
                          tick_to_price(result.ticks.upper, result.quote.decimals0, result.quote.decimals1));
            advance(AddLiquidityState::RangeComputed);

            step = "verify balances";
            result.desired = split_notional(result.quote, request.notional, request.reference);
            verify_balances(result.quote, result.desired);
            advance(AddLiquidityState::BalanceVerified);

            step = "approve";
            result.approval_hashes = approve_if_needed(result.quote, result.desired, pending_tx, cancel);
            advance(AddLiquidityState::Approved);

            step = "mint";
            check_cancelled(cancel, step);
            std::string wallet = executor_.wallet();
            result.minimum = {min_amount(result.desired[0]), min_amount(result.desired[1])};

            MintParams params;
            params.token0 = result.quote.token0;
            params.token1 = result.quote.token1;
            params.fee = request.fee;
            params.tick_lower = result.ticks.lower;
            params.tick_upper = result.ticks.upper;
            params.amount0_desired = result.desired[0];
            params.amount1_desired = result.desired[1];
            params.amount0_min = result.minimum[0];
            params.amount1_min = result.minimum[1];
            params.recipient = wallet;
            params.deadline = deadline();

            result.mint_receipt = executor_.execute(gateway_.build_mint(params), pending_tx, cancel);
            try
            {
                result.token_id = gateway_.minted_token_id(result.mint_receipt, wallet);
            }
            catch (const ContractCallError &e)
            {
                logger_->warn("Cannot read the minted token id from {}: {}", pending_tx, e.what());
            }
            if (result.token_id)
            {
                logger_->info("Minted position {}", *result.token_id);
            }
            advance(AddLiquidityState::Minted);
        }
        catch (const UnconfirmedTransaction &e)
        {
            throw WorkflowError("add-liquidity", to_string(result.state), step, e, e.tx_hash());
        }
        catch (const Error &e)
        {
            logger_->error("add-liquidity stopped after {} at '{}': {}", to_string(result.state), step, e.what());
            throw WorkflowError("add-liquidity", to_string(result.state), step, e, pending_tx);
        }
        return result;
    }

    IncreaseLiquidityResult LiquidityOrchestrator::increase_liquidity(uint64_t token_id, double notional,
                                                                      const std::string &reference,
                                                                      const std::atomic<bool> *cancel)
    {
        IncreaseLiquidityResult result;
        result.token_id = token_id;
        std::string step = "fetch position";
        std::string pending_tx;

        auto advance = [&](IncreaseLiquidityState next)
        {
            result.state = next;
            logger_->info("increase-liquidity {}: {}", token_id, to_string(next));
        };

        try
        {
            auto position = gateway_.get_position(token_id);

            step = "discover price";
            result.quote = quote_pool(position.token0, position.token1, position.fee);
            advance(IncreaseLiquidityState::PriceDiscovered);

            step = "verify balances";
            result.desired = split_notional(result.quote, notional, reference);
            verify_balances(result.quote, result.desired);
            advance(IncreaseLiquidityState::BalanceVerified);

            step = "approve";
            result.approval_hashes = approve_if_needed(result.quote, result.desired, pending_tx, cancel);
            advance(IncreaseLiquidityState::Approved);

            step = "increase liquidity";
            check_cancelled(cancel, step);
            result.minimum = {min_amount(result.desired[0]), min_amount(result.desired[1])};

            IncreaseLiquidityParams params;
            params.token_id = token_id;
            params.amount0_desired = result.desired[0];
            params.amount1_desired = result.desired[1];
            params.amount0_min = result.minimum[0];
            params.amount1_min = result.minimum[1];
            params.deadline = deadline();

            result.receipt = executor_.execute(gateway_.build_increase_liquidity(params), pending_tx, cancel);
            advance(IncreaseLiquidityState::Increased);
        }
        catch (const UnconfirmedTransaction &e)
        {
            throw WorkflowError("increase-liquidity", to_string(result.state), step, e, e.tx_hash());
        }
        catch (const Error &e)
        {
            logger_->error("increase-liquidity {} stopped after {} at '{}': {}", token_id, to_string(result.state),
                           step, e.what());
            throw WorkflowError("increase-liquidity", to_string(result.state), step, e, pending_tx);
        }
        return result;
    }

    ClosePositionResult LiquidityOrchestrator::close_position(uint64_t token_id, const std::atomic<bool> *cancel)
    {
        ClosePositionResult result;
        result.token_id = token_id;
        std::string step = "fetch position";
        std::string pending_tx;

        auto advance = [&](CloseState next)
        {
            result.state = next;
            logger_->info("close {}: {}", token_id, to_string(next));
        };

        try
        {
            auto position = gateway_.get_position(token_id);
            advance(CloseState::LiquidityQueried);

            std::string wallet = executor_.wallet();

            if (position.is_open())
            {
                step = "decrease liquidity";
                check_cancelled(cancel, step);
                DecreaseLiquidityParams params;
                params.token_id = token_id;
                params.liquidity = position.liquidity;
                params.amount0_min = Uint256(0);
                params.amount1_min = Uint256(0);
                params.deadline = deadline();

                executor_.execute(gateway_.build_decrease_liquidity(params), pending_tx, cancel);
                result.decrease_tx = pending_tx;
                result.decreased = true;
                pending_tx.clear();
                advance(CloseState::LiquidityDecreased);
            }
            else
            {
                logger_->info("Position {} has no liquidity, skipping decrease", token_id);
            }

            step = "collect";
            check_cancelled(cancel, step);
            CollectParams collect;
            collect.token_id = token_id;
            collect.recipient = wallet;
            collect.amount0_max = Uint256::max_uint128();
            collect.amount1_max = Uint256::max_uint128();

            executor_.execute(gateway_.build_collect(collect), pending_tx, cancel);
            result.collect_tx = pending_tx;
            pending_tx.clear();
            advance(CloseState::FeesCollected);

            step = "burn";
            auto remaining = gateway_.get_position(token_id);
            if (remaining.is_open() || remaining.has_owed_fees())
            {
                throw PreconditionFailed("position " + std::to_string(token_id) +
                                         " still holds liquidity or uncollected tokens, not burning");
            }
            check_cancelled(cancel, step);
            executor_.execute(gateway_.build_burn(token_id), pending_tx, cancel);
            result.burn_tx = pending_tx;
            advance(CloseState::Burned);
        }
        catch (const UnconfirmedTransaction &e)
        {
            throw WorkflowError("close-position", to_string(result.state), step, e, e.tx_hash());
        }
        catch (const Error &e)
        {
            logger_->error("close {} stopped after {} at '{}': {}", token_id, to_string(result.state), step,
                           e.what());
            throw WorkflowError("close-position", to_string(result.state), step, e, pending_tx);
        }
        return result;
    }

} // namespace v3lp
