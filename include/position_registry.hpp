#pragma once

#include "config.hpp"
#include "contract_gateway.hpp"
#include "types.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace v3lp
{

    // Token ids received by one owner, read from the position manager's
    // Transfer log on demand. Ids come out in log order and may repeat when
    // a token left the wallet and came back. The sequence is consumed once.
    class PositionIdSequence
    {
    public:
        PositionIdSequence(ContractGateway &gateway, const std::string &owner, uint64_t from_block,
                           uint64_t block_chunk, std::shared_ptr<spdlog::logger> logger);

        PositionIdSequence(PositionIdSequence &&) = default;
        PositionIdSequence &operator=(PositionIdSequence &&) = default;
        PositionIdSequence(const PositionIdSequence &) = delete;
        PositionIdSequence &operator=(const PositionIdSequence &) = delete;

        // Next id, or nullopt once the scan reached the latest block.
        // Throws ContractCallError when a log query fails.
        std::optional<uint64_t> next();

        // Remaining ids
        std::vector<uint64_t> drain();

    private:
        ContractGateway *gateway_;
        std::string owner_;
        uint64_t from_block_;
        uint64_t block_chunk_;
        std::shared_ptr<spdlog::logger> logger_;

        bool started_{false};
        bool exhausted_{false};
        uint64_t cursor_{0};
        uint64_t to_block_{0};
        std::deque<uint64_t> pending_;

        void fetch_next_range();
    };

    // Read-only discovery and classification of a wallet's positions
    class PositionRegistry
    {
    public:
        PositionRegistry(ContractGateway &gateway, const DiscoveryConfig &config,
                         std::shared_ptr<spdlog::logger> logger = nullptr);

        PositionIdSequence list_position_ids(const std::string &owner);

        // One entry per token id; ids whose details cannot be read are logged and skipped
        std::map<uint64_t, Position> get_positions(const std::string &owner);

        // get_positions() restricted to liquidity > 0
        std::map<uint64_t, Position> get_active_positions(const std::string &owner);

        // tick_lower <= pool tick <= tick_upper. False when the pool cannot be read.
        bool is_in_range(const Position &position);

        // Current tick of the position's pool; nullopt (and a warning) on any read failure
        std::optional<int32_t> pool_tick(const Position &position);

        // Recipient history de-duplicated and filtered by ownerOf(id) == owner
        std::vector<uint64_t> owned_position_ids(const std::string &owner);

    private:
        ContractGateway &gateway_;
        DiscoveryConfig config_;
        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace v3lp
