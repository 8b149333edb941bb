#pragma once

#include "rpc_client.hpp"
#include "signer.hpp"
#include "types.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace v3lp
{

    struct ExecutorConfig
    {
        uint64_t chain_id{0}; // 0 = ask the endpoint once
        std::chrono::milliseconds receipt_timeout{std::chrono::seconds(300)};
        std::chrono::milliseconds poll_interval{std::chrono::seconds(2)};
    };

    // Sends one intent at a time for the signer's wallet: fresh nonce, sign,
    // send, wait for the receipt. Executors of the same wallet share a lock
    // around that sequence so concurrent workflows never reuse a nonce.
    class TransactionExecutor
    {
    public:
        TransactionExecutor(RpcTransport &rpc, Signer &signer, const ExecutorConfig &config,
                            std::shared_ptr<spdlog::logger> logger = nullptr);

        std::string wallet() const { return signer_.address(); }

        // Returns the mined receipt. `tx_hash` is set as soon as the node accepts
        // the transaction. Throws UnconfirmedTransaction when no receipt arrives
        // before the timeout or `cancel` is raised, ContractCallError when the
        // send fails or the transaction reverts.
        TxReceipt execute(TransactionIntent intent, std::string &tx_hash,
                          const std::atomic<bool> *cancel = nullptr);

    private:
        RpcTransport &rpc_;
        Signer &signer_;
        ExecutorConfig config_;
        std::shared_ptr<spdlog::logger> logger_;

        uint64_t chain_id();
        TxReceipt wait_receipt(const std::string &tx_hash, const std::string &method,
                               const std::atomic<bool> *cancel);
    };

} // namespace v3lp
