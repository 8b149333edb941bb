#include "contract_gateway.hpp"
#include "encoding.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <cmath>
#include <stdexcept>

namespace v3lp
{

    namespace
    {
        // Runs a read and turns any transport, revert or decoding failure into
        // a ContractCallError naming the call. Library errors pass through.
        template <typename F>
        auto with_context(const std::string &context, F &&fn) -> decltype(fn())
        {
            try
            {
                return fn();
            }
            catch (const RpcError &e)
            {
                throw ContractCallError(context, e.what());
            }
            catch (const Error &)
            {
                throw;
            }
            catch (const std::exception &e)
            {
                throw ContractCallError(context, e.what());
            }
        }

        std::string token_id_arg(uint64_t token_id)
        {
            return std::to_string(token_id);
        }
    } // namespace

    ContractGateway::ContractGateway(RpcTransport &rpc, AbiSet abis, const GatewayConfig &config,
                                     std::shared_ptr<spdlog::logger> logger)
        : rpc_(rpc), abis_(std::move(abis)), config_(config), logger_(or_null(std::move(logger)))
    {
        config_.position_manager = normalize_address(config_.position_manager);
        config_.factory = normalize_address(config_.factory);
    }

    AbiValues ContractGateway::read(const std::string &context, const ContractAbi &abi, const std::string &to,
                                    const std::string &function, const AbiValues &args)
    {
        logger_->debug("eth_call {} on {}", context, to);
        auto data = abi.encode_call(function, args);
        auto result = rpc_.call(to, data);
        return abi.decode_result(function, result);
    }

    Position ContractGateway::get_position(uint64_t token_id)
    {
        std::string context = "positions(" + std::to_string(token_id) + ")";
        try
        {
            return with_context(context, [&]
                                {
                auto v = read(context, abis_.position_manager, config_.position_manager, "positions",
                              {token_id_arg(token_id)});

                Position position;
                position.token_id = token_id;
                position.operator_address = v[1];
                position.token0 = v[2];
                position.token1 = v[3];
                position.fee = std::stoi(v[4]);
                position.tick_lower = std::stoi(v[5]);
                position.tick_upper = std::stoi(v[6]);
                position.liquidity = Uint256::from_dec(v[7]);
                position.fee_growth_inside0_last_x128 = Uint256::from_dec(v[8]);
                position.fee_growth_inside1_last_x128 = Uint256::from_dec(v[9]);
                position.tokens_owed0 = Uint256::from_dec(v[10]);
                position.tokens_owed1 = Uint256::from_dec(v[11]);

                if (is_zero_address(position.token0))
                {
                    throw PositionNotFound(token_id);
                }
                return position; });
        }
        catch (const ContractCallError &e)
        {
            // The manager reverts with "Invalid token ID" for burned or never-minted ids
            if (std::string(e.what()).find("Invalid token ID") != std::string::npos)
            {
                throw PositionNotFound(token_id);
            }
            throw;
        }
    }

    std::string ContractGateway::get_pool(const std::string &token0, const std::string &token1, int fee)
    {
        std::string context = "getPool(" + token0 + ", " + token1 + ", " + std::to_string(fee) + ")";
        return with_context(context, [&]
                            { return read(context, abis_.factory, config_.factory, "getPool",
                                          {token0, token1, std::to_string(fee)})[0]; });
    }

    Slot0 ContractGateway::get_slot0(const std::string &pool)
    {
        std::string context = "slot0() on pool " + pool;
        return with_context(context, [&]
                            {
            auto v = read(context, abis_.pool, normalize_address(pool), "slot0", {});
            Slot0 slot;
            slot.sqrt_price_x96 = Uint256::from_dec(v[0]);
            slot.tick = std::stoi(v[1]);
            return slot; });
    }

    int ContractGateway::get_token_decimals(const std::string &token)
    {
        std::string context = "decimals() on " + token;
        return with_context(context, [&]
                            { return std::stoi(read(context, abis_.erc20, normalize_address(token), "decimals", {})[0]); });
    }

    Uint256 ContractGateway::get_token_balance(const std::string &owner, const std::string &token)
    {
        std::string context = "balanceOf(" + owner + ") on " + token;
        return with_context(context, [&]
                            { return Uint256::from_dec(
                                  read(context, abis_.erc20, normalize_address(token), "balanceOf", {owner})[0]); });
    }

    Uint256 ContractGateway::get_allowance(const std::string &owner, const std::string &spender,
                                           const std::string &token)
    {
        std::string context = "allowance(" + owner + ", " + spender + ") on " + token;
        return with_context(context, [&]
                            { return Uint256::from_dec(
                                  read(context, abis_.erc20, normalize_address(token), "allowance",
                                       {owner, spender})[0]); });
    }

    std::string ContractGateway::owner_of(uint64_t token_id)
    {
        std::string context = "ownerOf(" + std::to_string(token_id) + ")";
        return with_context(context, [&]
                            { return read(context, abis_.position_manager, config_.position_manager, "ownerOf",
                                          {token_id_arg(token_id)})[0]; });
    }

    uint64_t ContractGateway::latest_block_number()
    {
        return with_context("eth_blockNumber", [&]
                            { return rpc_.block_number(); });
    }

    uint64_t ContractGateway::latest_block_timestamp()
    {
        return with_context("latest block timestamp", [&]
                            { return rpc_.latest_block_timestamp(); });
    }

    std::vector<LogEntry> ContractGateway::transfer_logs_to(const std::string &owner, uint64_t from_block,
                                                            uint64_t to_block)
    {
        std::string context = "Transfer logs to " + owner + " in blocks [" + std::to_string(from_block) + ", " +
                              std::to_string(to_block) + "]";
        return with_context(context, [&]
                            {
            LogFilter filter;
            filter.address = config_.position_manager;
            filter.topics = {abis_.position_manager.event("Transfer").topic, std::nullopt, address_topic(owner)};
            filter.from_block = from_block;
            filter.to_block = to_block;
            return rpc_.get_logs(filter); });
    }

    uint64_t ContractGateway::transfer_token_id(const LogEntry &log) const
    {
        return with_context("decode Transfer log " + log.tx_hash, [&]
                            {
            auto values = abis_.position_manager.decode_event("Transfer", log);
            return Uint256::from_dec(values[2]).to_u64(); });
    }

    std::optional<uint64_t> ContractGateway::minted_token_id(const TxReceipt &receipt,
                                                             const std::string &recipient) const
    {
        return with_context("minted token id in " + receipt.tx_hash, [&]() -> std::optional<uint64_t>
                            {
            const auto &transfer = abis_.position_manager.event("Transfer");
            std::string wanted = normalize_address(recipient);
            for (const auto &log : receipt.logs)
            {
                if (log.topics.size() != 4 || log.topics[0] != transfer.topic ||
                    normalize_address(log.address) != config_.position_manager)
                {
                    continue;
                }
                auto values = abis_.position_manager.decode_event("Transfer", log);
                if (is_zero_address(values[0]) && normalize_address(values[1]) == wanted)
                {
                    return Uint256::from_dec(values[2]).to_u64();
                }
            }
            return std::nullopt; });
    }

    TransactionIntent ContractGateway::make_intent(const std::string &to, const ContractAbi &abi,
                                                   const std::string &function, const AbiValues &args,
                                                   uint64_t gas_limit, std::optional<double> gas_multiplier)
    {
        double multiplier = gas_multiplier.value_or(config_.gas_multiplier);
        if (!(multiplier > 0.0) || !std::isfinite(multiplier))
        {
            throw PreconditionFailed("gas multiplier must be a positive number");
        }

        TransactionIntent intent;
        intent.to = normalize_address(to);
        intent.method = function;
        intent.gas_limit = gas_limit;
        intent.data = with_context("encode " + function, [&]
                                   { return abi.encode_call(function, args); });

        Uint256 live = with_context("eth_gasPrice", [&]
                                    { return rpc_.gas_price(); });
        intent.gas_price = multiplier == 1.0
                               ? live
                               : live.mul_div(Uint256(static_cast<uint64_t>(std::llround(multiplier * 10000.0))),
                                              Uint256(10000));
        return intent;
    }

    TransactionIntent ContractGateway::build_mint(const MintParams &p, std::optional<double> gas_multiplier)
    {
        return make_intent(config_.position_manager, abis_.position_manager, "mint",
                           {p.token0, p.token1, std::to_string(p.fee), std::to_string(p.tick_lower),
                            std::to_string(p.tick_upper), p.amount0_desired.to_dec(), p.amount1_desired.to_dec(),
                            p.amount0_min.to_dec(), p.amount1_min.to_dec(), p.recipient, std::to_string(p.deadline)},
                           GAS_LIMIT_MINT, gas_multiplier);
    }

    TransactionIntent ContractGateway::build_increase_liquidity(const IncreaseLiquidityParams &p,
                                                                std::optional<double> gas_multiplier)
    {
        return make_intent(config_.position_manager, abis_.position_manager, "increaseLiquidity",
                           {token_id_arg(p.token_id), p.amount0_desired.to_dec(), p.amount1_desired.to_dec(),
                            p.amount0_min.to_dec(), p.amount1_min.to_dec(), std::to_string(p.deadline)},
                           GAS_LIMIT_INCREASE_LIQUIDITY, gas_multiplier);
    }

    TransactionIntent ContractGateway::build_decrease_liquidity(const DecreaseLiquidityParams &p,
                                                                std::optional<double> gas_multiplier)
    {
        return make_intent(config_.position_manager, abis_.position_manager, "decreaseLiquidity",
                           {token_id_arg(p.token_id), p.liquidity.to_dec(), p.amount0_min.to_dec(),
                            p.amount1_min.to_dec(), std::to_string(p.deadline)},
                           GAS_LIMIT_DECREASE_LIQUIDITY, gas_multiplier);
    }

    TransactionIntent ContractGateway::build_collect(const CollectParams &p, std::optional<double> gas_multiplier)
    {
        return make_intent(config_.position_manager, abis_.position_manager, "collect",
                           {token_id_arg(p.token_id), p.recipient, p.amount0_max.to_dec(), p.amount1_max.to_dec()},
                           GAS_LIMIT_COLLECT, gas_multiplier);
    }

    TransactionIntent ContractGateway::build_burn(uint64_t token_id, std::optional<double> gas_multiplier)
    {
        return make_intent(config_.position_manager, abis_.position_manager, "burn", {token_id_arg(token_id)},
                           GAS_LIMIT_BURN, gas_multiplier);
    }

    TransactionIntent ContractGateway::build_approve(const std::string &token, const std::string &spender,
                                                     const Uint256 &amount, std::optional<double> gas_multiplier)
    {
        return make_intent(token, abis_.erc20, "approve", {spender, amount.to_dec()}, GAS_LIMIT_APPROVE,
                           gas_multiplier);
    }

} // namespace v3lp
