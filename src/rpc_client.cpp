#include "rpc_client.hpp"
#include "errors.hpp"
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace v3lp
{

    JsonRpcClient::JsonRpcClient(const std::string &rpc_url, long timeout_ms)
        : rpc_url_(rpc_url), next_id_(1)
    {
        http_.set_timeout_ms(timeout_ms);
    }

    json JsonRpcClient::request(const std::string &method, const json &params)
    {
        json payload = {
            {"jsonrpc", "2.0"},
            {"id", next_id_.fetch_add(1)},
            {"method", method},
            {"params", params},
        };

        HttpResponse response;
        {
            std::lock_guard<std::mutex> lock(http_mutex_);
            response = http_.post(rpc_url_, payload.dump());
        }

        if (!response.error.empty())
        {
            throw RpcError(0, method + " transport error: " + response.error);
        }
        if (!response.ok())
        {
            throw RpcError(response.status_code, method + " HTTP " + std::to_string(response.status_code) +
                                                     ": " + response.body);
        }

        json body;
        try
        {
            body = json::parse(response.body);
        }
        catch (const json::parse_error &e)
        {
            throw RpcError(0, method + " returned malformed JSON: " + e.what());
        }

        if (body.contains("error") && !body["error"].is_null())
        {
            const auto &err = body["error"];
            long code = err.value("code", 0L);
            std::string message = err.value("message", std::string("unknown error"));
            if (err.contains("data") && err["data"].is_string())
            {
                message += " (" + err["data"].get<std::string>() + ")";
            }
            throw RpcError(code, method + ": " + message);
        }
        if (!body.contains("result"))
        {
            throw RpcError(0, method + " response has no result");
        }
        return body["result"];
    }

    uint64_t JsonRpcClient::parse_quantity(const json &value)
    {
        if (value.is_number_unsigned())
        {
            return value.get<uint64_t>();
        }
        if (!value.is_string())
        {
            throw RpcError(0, "expected hex quantity, got " + value.dump());
        }
        try
        {
            return Uint256::from_hex(value.get<std::string>()).to_u64();
        }
        catch (const std::exception &e)
        {
            throw RpcError(0, "bad hex quantity " + value.dump() + ": " + e.what());
        }
    }

    std::string JsonRpcClient::to_quantity(uint64_t value)
    {
        std::ostringstream oss;
        oss << "0x" << std::hex << value;
        return oss.str();
    }

    LogEntry JsonRpcClient::parse_log(const json &j)
    {
        LogEntry log;
        log.address = j.value("address", std::string());
        for (const auto &topic : j.value("topics", json::array()))
        {
            log.topics.push_back(topic.get<std::string>());
        }
        log.data = j.value("data", std::string("0x"));
        log.block_number = parse_quantity(j.value("blockNumber", json("0x0")));
        log.transaction_index = parse_quantity(j.value("transactionIndex", json("0x0")));
        log.log_index = parse_quantity(j.value("logIndex", json("0x0")));
        log.tx_hash = j.value("transactionHash", std::string());
        return log;
    }

    std::string JsonRpcClient::call(const std::string &to, const std::string &data)
    {
        json tx = {{"to", to}, {"data", data}};
        return request("eth_call", json::array({tx, "latest"})).get<std::string>();
    }

    uint64_t JsonRpcClient::block_number()
    {
        return parse_quantity(request("eth_blockNumber", json::array()));
    }

    uint64_t JsonRpcClient::latest_block_timestamp()
    {
        auto block = request("eth_getBlockByNumber", json::array({"latest", false}));
        if (block.is_null())
        {
            throw RpcError(0, "eth_getBlockByNumber returned no latest block");
        }
        return parse_quantity(block.at("timestamp"));
    }

    std::vector<LogEntry> JsonRpcClient::get_logs(const LogFilter &filter)
    {
        json topics = json::array();
        for (const auto &topic : filter.topics)
        {
            topics.push_back(topic ? json(*topic) : json(nullptr));
        }
        json params = {
            {"fromBlock", to_quantity(filter.from_block)},
            {"toBlock", to_quantity(filter.to_block)},
            {"address", filter.address},
            {"topics", topics},
        };

        std::vector<LogEntry> logs;
        for (const auto &entry : request("eth_getLogs", json::array({params})))
        {
            logs.push_back(parse_log(entry));
        }
        return logs;
    }

    Uint256 JsonRpcClient::gas_price()
    {
        return Uint256::from_hex(request("eth_gasPrice", json::array()).get<std::string>());
    }

    uint64_t JsonRpcClient::transaction_count(const std::string &address)
    {
        return parse_quantity(request("eth_getTransactionCount", json::array({address, "pending"})));
    }

    std::string JsonRpcClient::send_raw_transaction(const std::string &raw_tx)
    {
        return request("eth_sendRawTransaction", json::array({raw_tx})).get<std::string>();
    }

    std::optional<TxReceipt> JsonRpcClient::transaction_receipt(const std::string &tx_hash)
    {
        auto result = request("eth_getTransactionReceipt", json::array({tx_hash}));
        if (result.is_null())
        {
            return std::nullopt;
        }

        TxReceipt receipt;
        receipt.tx_hash = result.value("transactionHash", tx_hash);
        receipt.block_number = parse_quantity(result.at("blockNumber"));
        receipt.status = parse_quantity(result.value("status", json("0x1"))) == 1;
        receipt.gas_used = parse_quantity(result.value("gasUsed", json("0x0")));
        for (const auto &entry : result.value("logs", json::array()))
        {
            receipt.logs.push_back(parse_log(entry));
        }
        return receipt;
    }

    uint64_t JsonRpcClient::chain_id()
    {
        return parse_quantity(request("eth_chainId", json::array()));
    }

    Uint256 JsonRpcClient::native_balance(const std::string &address)
    {
        return Uint256::from_hex(request("eth_getBalance", json::array({address, "latest"})).get<std::string>());
    }

} // namespace v3lp
