#pragma once

#include "uint256.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace v3lp
{

    // Liquidity position as reported by the position manager's positions(tokenId)
    struct Position
    {
        uint64_t token_id{0};
        std::string operator_address;
        std::string token0;
        std::string token1;
        int fee{0};
        int32_t tick_lower{0};
        int32_t tick_upper{0};
        Uint256 liquidity;
        Uint256 fee_growth_inside0_last_x128;
        Uint256 fee_growth_inside1_last_x128;
        Uint256 tokens_owed0;
        Uint256 tokens_owed1;

        // Liquidity still deposited (zero means withdrawn but not burned)
        bool is_open() const { return !liquidity.is_zero(); }

        bool has_owed_fees() const { return !tokens_owed0.is_zero() || !tokens_owed1.is_zero(); }
    };

    // Pool price slot
    struct Slot0
    {
        Uint256 sqrt_price_x96;
        int32_t tick{0};
    };

    // Multiplicative factors applied to the current price; lower < 1 < upper expected
    struct PriceRange
    {
        double lower_factor{0.0};
        double upper_factor{0.0};
    };

    struct TickRange
    {
        int32_t lower{0};
        int32_t upper{0};
    };

    // Unsigned transaction for one workflow step
    struct TransactionIntent
    {
        std::string to;
        std::string method; // contract method name, for logs and errors
        std::string data;   // 0x-prefixed calldata
        Uint256 value;
        uint64_t gas_limit{0};
        Uint256 gas_price;
        uint64_t nonce{0};
    };

    struct LogEntry
    {
        std::string address;
        std::vector<std::string> topics;
        std::string data;
        uint64_t block_number{0};
        uint64_t transaction_index{0};
        uint64_t log_index{0};
        std::string tx_hash;
    };

    // eth_getLogs filter; an empty optional topic matches anything
    struct LogFilter
    {
        std::string address;
        std::vector<std::optional<std::string>> topics;
        uint64_t from_block{0};
        uint64_t to_block{0};
    };

    struct TxReceipt
    {
        std::string tx_hash;
        uint64_t block_number{0};
        bool status{false};
        uint64_t gas_used{0};
        std::vector<LogEntry> logs;
    };

} // namespace v3lp
