#pragma once

#include "contract_gateway.hpp"
#include "uint256.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace v3lp
{

    // ERC-20 balance and decimals lookups used for pre-flight checks.
    // Every call reads through to the chain; failures propagate as ContractCallError.
    class BalanceOracle
    {
    public:
        explicit BalanceOracle(ContractGateway &gateway, std::shared_ptr<spdlog::logger> logger = nullptr);

        int decimals_of(const std::string &token);

        // Raw balance / 10^decimals
        double balance_of(const std::string &owner, const std::string &token, int decimals);

        Uint256 raw_balance_of(const std::string &owner, const std::string &token);

    private:
        ContractGateway &gateway_;
        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace v3lp
