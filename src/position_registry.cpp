#include "position_registry.hpp"
#include "encoding.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "tick_math.hpp"
#include <algorithm>
#include <set>

namespace v3lp
{

    PositionIdSequence::PositionIdSequence(ContractGateway &gateway, const std::string &owner, uint64_t from_block,
                                           uint64_t block_chunk, std::shared_ptr<spdlog::logger> logger)
        : gateway_(&gateway), owner_(normalize_address(owner)), from_block_(from_block), block_chunk_(block_chunk),
          logger_(or_null(std::move(logger)))
    {
    }

    std::optional<uint64_t> PositionIdSequence::next()
    {
        if (!started_)
        {
            started_ = true;
            to_block_ = gateway_->latest_block_number();
            cursor_ = from_block_;
            exhausted_ = cursor_ > to_block_;
            logger_->debug("Scanning Transfer logs to {} in blocks [{}, {}]", owner_, from_block_, to_block_);
        }

        while (pending_.empty() && !exhausted_)
        {
            fetch_next_range();
        }

        if (pending_.empty())
        {
            return std::nullopt;
        }
        uint64_t id = pending_.front();
        pending_.pop_front();
        return id;
    }

    std::vector<uint64_t> PositionIdSequence::drain()
    {
        std::vector<uint64_t> ids;
        while (auto id = next())
        {
            ids.push_back(*id);
        }
        return ids;
    }

    void PositionIdSequence::fetch_next_range()
    {
        uint64_t end = to_block_;
        if (block_chunk_ > 0 && to_block_ - cursor_ >= block_chunk_)
        {
            end = cursor_ + block_chunk_ - 1;
        }

        auto logs = gateway_->transfer_logs_to(owner_, cursor_, end);
        for (const auto &log : logs)
        {
            pending_.push_back(gateway_->transfer_token_id(log));
        }
        exhausted_ = end == to_block_;
        cursor_ = end + 1;
    }

    PositionRegistry::PositionRegistry(ContractGateway &gateway, const DiscoveryConfig &config,
                                       std::shared_ptr<spdlog::logger> logger)
        : gateway_(gateway), config_(config), logger_(or_null(std::move(logger)))
    {
    }

    PositionIdSequence PositionRegistry::list_position_ids(const std::string &owner)
    {
        return PositionIdSequence(gateway_, owner, config_.from_block, config_.block_chunk, logger_);
    }

    std::map<uint64_t, Position> PositionRegistry::get_positions(const std::string &owner)
    {
        std::map<uint64_t, Position> positions;
        std::set<uint64_t> failed;
        auto ids = list_position_ids(owner);
        while (auto id = ids.next())
        {
            if (positions.count(*id) || failed.count(*id))
            {
                continue;
            }
            try
            {
                positions.emplace(*id, gateway_.get_position(*id));
            }
            catch (const PositionNotFound &)
            {
                logger_->info("Position {} no longer exists (burned)", *id);
                failed.insert(*id);
            }
            catch (const Error &e)
            {
                logger_->warn("Skipping position {}: {}", *id, e.what());
                failed.insert(*id);
            }
        }
        logger_->info("Found {} positions for {}", positions.size(), owner);
        return positions;
    }

    std::map<uint64_t, Position> PositionRegistry::get_active_positions(const std::string &owner)
    {
        auto positions = get_positions(owner);
        for (auto it = positions.begin(); it != positions.end();)
        {
            if (it->second.is_open())
                ++it;
            else
                it = positions.erase(it);
        }
        logger_->info("{} active positions for {}", positions.size(), owner);
        return positions;
    }

    std::optional<int32_t> PositionRegistry::pool_tick(const Position &position)
    {
        try
        {
            auto pool = gateway_.get_pool(position.token0, position.token1, position.fee);
            if (is_zero_address(pool))
            {
                logger_->warn("No pool for position {} ({}/{} fee {})", position.token_id, position.token0,
                              position.token1, position.fee);
                return std::nullopt;
            }
            return gateway_.get_slot0(pool).tick;
        }
        catch (const Error &e)
        {
            logger_->warn("Cannot read pool tick for position {}: {}", position.token_id, e.what());
            return std::nullopt;
        }
    }

    bool PositionRegistry::is_in_range(const Position &position)
    {
        auto tick = pool_tick(position);
        if (!tick)
        {
            return false;
        }
        return tick_in_range(*tick, position.tick_lower, position.tick_upper);
    }

    std::vector<uint64_t> PositionRegistry::owned_position_ids(const std::string &owner)
    {
        std::string wanted = normalize_address(owner);
        std::vector<uint64_t> owned;
        std::set<uint64_t> seen;

        auto ids = list_position_ids(owner);
        while (auto id = ids.next())
        {
            if (!seen.insert(*id).second)
            {
                continue;
            }
            try
            {
                if (normalize_address(gateway_.owner_of(*id)) == wanted)
                {
                    owned.push_back(*id);
                }
            }
            catch (const ContractCallError &e)
            {
                // ownerOf reverts for burned tokens
                logger_->debug("ownerOf({}) failed: {}", *id, e.what());
            }
        }
        return owned;
    }

} // namespace v3lp
