#include "price_oracle.hpp"
#include "encoding.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace v3lp
{

    CoinGeckoPriceOracle::CoinGeckoPriceOracle(std::map<std::string, std::string> price_urls,
                                               std::shared_ptr<spdlog::logger> logger, long timeout_ms)
        : price_urls_(std::move(price_urls)), logger_(or_null(std::move(logger)))
    {
        http_.set_timeout_ms(timeout_ms);
        http_.set_user_agent("v3lp/0.1");
    }

    double CoinGeckoPriceOracle::price_usd(const std::string &network, const std::string &token)
    {
        auto it = price_urls_.find(network);
        if (it == price_urls_.end() || it->second.empty())
        {
            throw PriceUnavailable(network, token, "no price service configured for the network");
        }

        // The service keys its answer by the lowercase contract address
        std::string address;
        try
        {
            address = normalize_address(token);
        }
        catch (const std::invalid_argument &e)
        {
            throw PriceUnavailable(network, token, e.what());
        }

        std::string url = it->second + "?contract_addresses=" + address + "&vs_currencies=usd";
        HttpResponse response;
        {
            std::lock_guard<std::mutex> lock(http_mutex_);
            response = http_.get(url);
        }

        if (!response.error.empty())
        {
            throw PriceUnavailable(network, token, response.error);
        }
        if (!response.ok())
        {
            throw PriceUnavailable(network, token, "HTTP " + std::to_string(response.status_code));
        }

        try
        {
            auto data = json::parse(response.body);
            if (!data.contains(address) || !data[address].contains("usd"))
            {
                throw PriceUnavailable(network, token, "token not listed by the price service");
            }
            double price = data[address]["usd"].get<double>();
            logger_->debug("USD price of {} on {}: {}", address, network, price);
            return price;
        }
        catch (const json::exception &e)
        {
            throw PriceUnavailable(network, token, std::string("malformed price response: ") + e.what());
        }
    }

} // namespace v3lp
