#include "balance_oracle.hpp"
#include "logging.hpp"

namespace v3lp
{

    BalanceOracle::BalanceOracle(ContractGateway &gateway, std::shared_ptr<spdlog::logger> logger)
        : gateway_(gateway), logger_(or_null(std::move(logger)))
    {
    }

    int BalanceOracle::decimals_of(const std::string &token)
    {
        return gateway_.get_token_decimals(token);
    }

    double BalanceOracle::balance_of(const std::string &owner, const std::string &token, int decimals)
    {
        auto raw = raw_balance_of(owner, token);
        double amount = to_units(raw, decimals);
        logger_->debug("Balance of {} in {}: {}", owner, token, format_units(raw, decimals));
        return amount;
    }

    Uint256 BalanceOracle::raw_balance_of(const std::string &owner, const std::string &token)
    {
        return gateway_.get_token_balance(owner, token);
    }

} // namespace v3lp
