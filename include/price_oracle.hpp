#pragma once

#include "http_client.hpp"
#include <spdlog/spdlog.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace v3lp
{

    // Fiat price lookup collaborator
    class PriceOracle
    {
    public:
        virtual ~PriceOracle() = default;

        // USD price of one whole token; throws PriceUnavailable
        virtual double price_usd(const std::string &network, const std::string &token) = 0;
    };

    // CoinGecko "simple/token_price" endpoint, one URL per network
    class CoinGeckoPriceOracle : public PriceOracle
    {
    public:
        CoinGeckoPriceOracle(std::map<std::string, std::string> price_urls,
                             std::shared_ptr<spdlog::logger> logger = nullptr, long timeout_ms = 10000);

        double price_usd(const std::string &network, const std::string &token) override;

    private:
        std::map<std::string, std::string> price_urls_;
        std::shared_ptr<spdlog::logger> logger_;
        HttpClient http_;
        std::mutex http_mutex_;
    };

} // namespace v3lp
