#include "tick_math.hpp"
#include "errors.hpp"
#include <cmath>
#include <map>
#include <sstream>

namespace v3lp
{

    namespace
    {
        const std::map<int, int32_t> kFeeTierTickSpacing = {
            {100, 1},
            {500, 10},
            {3000, 60},
            {10000, 200},
        };

        // ln(1.0001)
        const long double kLnTickBase = std::log1p(static_cast<long double>(0.0001L));
        const long double kLn10 = std::log(static_cast<long double>(10.0L));
        const long double kLn2 = std::log(static_cast<long double>(2.0L));

        // Distance below which a log ratio is treated as landing exactly on a tick
        constexpr long double kTickSnap = 1e-9L;

        std::string describe(double value)
        {
            std::ostringstream oss;
            oss.precision(17);
            oss << value;
            return oss.str();
        }
    } // namespace

    int32_t tick_spacing(int fee)
    {
        auto it = kFeeTierTickSpacing.find(fee);
        if (it == kFeeTierTickSpacing.end())
        {
            throw UnknownFeeTier(fee);
        }
        return it->second;
    }

    int32_t price_to_tick(double price, int decimals0, int decimals1)
    {
        if (!(price > 0.0) || !std::isfinite(price))
        {
            throw InvalidPrice(describe(price) + " must be a positive finite number");
        }

        long double ln_adjusted = std::log(static_cast<long double>(price)) +
                                  static_cast<long double>(decimals1 - decimals0) * kLn10;
        long double x = ln_adjusted / kLnTickBase;

        long double nearest = std::round(x);
        long double tick = std::fabs(x - nearest) < kTickSnap ? nearest : std::floor(x);

        if (tick < MIN_TICK || tick > MAX_TICK)
        {
            throw InvalidPrice(describe(price) + " maps to tick " + describe(static_cast<double>(tick)) +
                               " outside [" + std::to_string(MIN_TICK) + ", " + std::to_string(MAX_TICK) + "]");
        }
        return static_cast<int32_t>(tick);
    }

    double tick_to_price(int32_t tick, int decimals0, int decimals1)
    {
        long double ln_price = static_cast<long double>(tick) * kLnTickBase -
                               static_cast<long double>(decimals1 - decimals0) * kLn10;
        return static_cast<double>(std::exp(ln_price));
    }

    double sqrt_price_x96_to_price(const Uint256 &sqrt_price_x96, int decimals0, int decimals1)
    {
        if (sqrt_price_x96.is_zero())
        {
            throw InvalidPrice("pool sqrtPriceX96 is zero (uninitialized pool)");
        }
        long double sqrt_price = static_cast<long double>(sqrt_price_x96.to_double());
        long double ln_raw = 2.0L * (std::log(sqrt_price) - 96.0L * kLn2);
        long double ln_price = ln_raw + static_cast<long double>(decimals0 - decimals1) * kLn10;
        return static_cast<double>(std::exp(ln_price));
    }

    int32_t align_to_spacing(int32_t tick, int fee)
    {
        int32_t spacing = tick_spacing(fee);
        int32_t quotient = tick / spacing;
        if (tick % spacing != 0 && tick < 0)
        {
            --quotient;
        }
        return quotient * spacing;
    }

    TickRange compute_range(double current_price, const PriceRange &range, int decimals0, int decimals1, int fee)
    {
        double price_lower = current_price * range.lower_factor;
        double price_upper = current_price * range.upper_factor;

        TickRange ticks;
        ticks.lower = align_to_spacing(price_to_tick(price_lower, decimals0, decimals1), fee);
        ticks.upper = align_to_spacing(price_to_tick(price_upper, decimals0, decimals1), fee);

        if (ticks.lower >= ticks.upper)
        {
            throw InvalidRange(ticks.lower, ticks.upper);
        }
        // Flooring can push a bound past the usable tick domain
        if (ticks.lower < MIN_TICK || ticks.upper > MAX_TICK)
        {
            throw InvalidRange("[" + std::to_string(ticks.lower) + ", " + std::to_string(ticks.upper) +
                               "] leaves [" + std::to_string(MIN_TICK) + ", " + std::to_string(MAX_TICK) +
                               "] after alignment");
        }
        return ticks;
    }

} // namespace v3lp
