#include "transaction_executor.hpp"
#include "encoding.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>
#include <map>
#include <mutex>
#include <thread>

namespace v3lp
{

    namespace
    {
        // One mutex per wallet address for the lifetime of the process
        std::mutex &wallet_mutex(const std::string &address)
        {
            static std::mutex registry_mutex;
            static std::map<std::string, std::unique_ptr<std::mutex>> registry;

            std::lock_guard<std::mutex> lock(registry_mutex);
            auto &slot = registry[normalize_address(address)];
            if (!slot)
            {
                slot = std::make_unique<std::mutex>();
            }
            return *slot;
        }
    } // namespace

    TransactionExecutor::TransactionExecutor(RpcTransport &rpc, Signer &signer, const ExecutorConfig &config,
                                             std::shared_ptr<spdlog::logger> logger)
        : rpc_(rpc), signer_(signer), config_(config), logger_(or_null(std::move(logger)))
    {
    }

    uint64_t TransactionExecutor::chain_id()
    {
        if (config_.chain_id == 0)
        {
            try
            {
                config_.chain_id = rpc_.chain_id();
            }
            catch (const RpcError &e)
            {
                throw ContractCallError("eth_chainId", e.what());
            }
        }
        return config_.chain_id;
    }

    TxReceipt TransactionExecutor::execute(TransactionIntent intent, std::string &tx_hash,
                                           const std::atomic<bool> *cancel)
    {
        std::string context = intent.method + " on " + intent.to;
        std::string address = signer_.address();

        std::lock_guard<std::mutex> lock(wallet_mutex(address));

        try
        {
            intent.nonce = rpc_.transaction_count(address);
        }
        catch (const RpcError &e)
        {
            throw ContractCallError("nonce for " + address, e.what());
        }

        std::string raw = signer_.sign(intent, chain_id());

        try
        {
            tx_hash = rpc_.send_raw_transaction(raw);
        }
        catch (const RpcError &e)
        {
            throw ContractCallError(context, e.what());
        }
        logger_->info("Sent {} (nonce {}): {}", intent.method, intent.nonce, tx_hash);

        auto receipt = wait_receipt(tx_hash, intent.method, cancel);
        if (!receipt.status)
        {
            throw ContractCallError(context, "transaction " + tx_hash + " reverted in block " +
                                                 std::to_string(receipt.block_number));
        }
        logger_->info("{} mined in block {} (gas used {})", intent.method, receipt.block_number, receipt.gas_used);
        return receipt;
    }

    TxReceipt TransactionExecutor::wait_receipt(const std::string &tx_hash, const std::string &method,
                                                const std::atomic<bool> *cancel)
    {
        using clock = std::chrono::steady_clock;
        auto deadline = clock::now() + config_.receipt_timeout;

        while (true)
        {
            if (cancel && cancel->load())
            {
                logger_->warn("Stopped waiting for {} ({}): cancelled", tx_hash, method);
                throw UnconfirmedTransaction(tx_hash, method);
            }

            try
            {
                if (auto receipt = rpc_.transaction_receipt(tx_hash))
                {
                    return *receipt;
                }
            }
            catch (const RpcError &e)
            {
                logger_->warn("Receipt query for {} failed: {}", tx_hash, e.what());
            }

            auto now = clock::now();
            if (now >= deadline)
            {
                logger_->warn("No receipt for {} ({}) before timeout", tx_hash, method);
                throw UnconfirmedTransaction(tx_hash, method);
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(std::min(config_.poll_interval, remaining));
        }
    }

} // namespace v3lp
