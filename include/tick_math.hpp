#pragma once

#include "types.hpp"
#include <cstdint>

namespace v3lp
{

    constexpr int32_t MIN_TICK = -887272;
    constexpr int32_t MAX_TICK = 887272;

    // Tick spacing for a fee tier (100, 500, 3000, 10000); throws UnknownFeeTier
    int32_t tick_spacing(int fee);

    // floor(log_1.0001(price * 10^(decimals1 - decimals0))).
    // Works in log space so extreme prices and decimal gaps never overflow.
    // Throws InvalidPrice for non-positive, non-finite or out-of-domain prices.
    int32_t price_to_tick(double price, int decimals0, int decimals1);

    // Human price (token1 per token0) at a tick; inverse of price_to_tick
    double tick_to_price(int32_t tick, int decimals0, int decimals1);

    // Human price from a pool's Q64.96 square-root price
    double sqrt_price_x96_to_price(const Uint256 &sqrt_price_x96, int decimals0, int decimals1);

    // Rounds toward negative infinity to a multiple of the fee tier's spacing
    int32_t align_to_spacing(int32_t tick, int fee);

    // Applies the range factors to the current price and aligns both bounds.
    // Throws InvalidRange when the aligned bounds do not satisfy lower < upper.
    TickRange compute_range(double current_price, const PriceRange &range, int decimals0, int decimals1, int fee);

    // Inclusive on both ends
    inline bool tick_in_range(int32_t tick, int32_t tick_lower, int32_t tick_upper)
    {
        return tick_lower <= tick && tick <= tick_upper;
    }

} // namespace v3lp
