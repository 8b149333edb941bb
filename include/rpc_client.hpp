#pragma once

#include "http_client.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace v3lp
{

    // Chain endpoint collaborator. Every method throws RpcError on transport
    // failure or a JSON-RPC error object (which includes contract reverts).
    class RpcTransport
    {
    public:
        virtual ~RpcTransport() = default;

        // eth_call against the latest block; returns 0x-prefixed return data
        virtual std::string call(const std::string &to, const std::string &data) = 0;

        virtual uint64_t block_number() = 0;
        virtual uint64_t latest_block_timestamp() = 0;
        virtual std::vector<LogEntry> get_logs(const LogFilter &filter) = 0;
        virtual Uint256 gas_price() = 0;

        // Pending nonce of an account
        virtual uint64_t transaction_count(const std::string &address) = 0;

        // Returns the transaction hash
        virtual std::string send_raw_transaction(const std::string &raw_tx) = 0;

        // Empty until the transaction is mined
        virtual std::optional<TxReceipt> transaction_receipt(const std::string &tx_hash) = 0;

        virtual uint64_t chain_id() = 0;
        virtual Uint256 native_balance(const std::string &address) = 0;
    };

    // JSON-RPC 2.0 over HTTP(S)
    class JsonRpcClient : public RpcTransport
    {
    public:
        explicit JsonRpcClient(const std::string &rpc_url, long timeout_ms = 15000);

        std::string call(const std::string &to, const std::string &data) override;
        uint64_t block_number() override;
        uint64_t latest_block_timestamp() override;
        std::vector<LogEntry> get_logs(const LogFilter &filter) override;
        Uint256 gas_price() override;
        uint64_t transaction_count(const std::string &address) override;
        std::string send_raw_transaction(const std::string &raw_tx) override;
        std::optional<TxReceipt> transaction_receipt(const std::string &tx_hash) override;
        uint64_t chain_id() override;
        Uint256 native_balance(const std::string &address) override;

        // Raw request; returns the "result" member
        nlohmann::json request(const std::string &method, const nlohmann::json &params);

        static uint64_t parse_quantity(const nlohmann::json &value);
        static std::string to_quantity(uint64_t value);
        static LogEntry parse_log(const nlohmann::json &j);

    private:
        HttpClient http_;
        std::string rpc_url_;
        std::atomic<uint64_t> next_id_;
        std::mutex http_mutex_; // one curl handle, one request at a time
    };

} // namespace v3lp
