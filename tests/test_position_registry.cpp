#include <catch2/catch_test_macros.hpp>
#include "contract_gateway.hpp"
#include "errors.hpp"
#include "fake_chain.hpp"
#include "position_registry.hpp"

using namespace v3lp;
using namespace v3lp_test;

namespace
{
    GatewayConfig gateway_config()
    {
        GatewayConfig config;
        config.position_manager = MANAGER;
        config.factory = FACTORY;
        return config;
    }
}

TEST_CASE("Gateway reads", "[gateway]")
{
    FakeChain chain;
    ContractGateway gateway(chain, abis(), gateway_config());
    chain.add_position(5, -600, 600, Uint256(12345));
    chain.decimals[TOKEN0] = 18;
    chain.balances[{TOKEN0, WALLET}] = Uint256(777);

    SECTION("Position fields")
    {
        auto p = gateway.get_position(5);
        REQUIRE(p.token_id == 5);
        REQUIRE(p.token0 == TOKEN0);
        REQUIRE(p.token1 == TOKEN1);
        REQUIRE(p.fee == 3000);
        REQUIRE(p.tick_lower == -600);
        REQUIRE(p.tick_upper == 600);
        REQUIRE(p.liquidity == Uint256(12345));
    }

    SECTION("Unknown id is PositionNotFound")
    {
        REQUIRE_THROWS_AS(gateway.get_position(99), PositionNotFound);
    }

    SECTION("Other failures carry the call as context")
    {
        chain.failing_positions.insert(5);
        try
        {
            gateway.get_position(5);
            FAIL("expected ContractCallError");
        }
        catch (const ContractCallError &e)
        {
            REQUIRE(e.context() == "positions(5)");
            REQUIRE(e.kind() == ErrorKind::ContractCall);
        }
    }

    SECTION("Token reads")
    {
        REQUIRE(gateway.get_token_decimals(TOKEN0) == 18);
        REQUIRE(gateway.get_token_balance(WALLET, TOKEN0) == Uint256(777));
        REQUIRE(gateway.get_allowance(WALLET, MANAGER, TOKEN0).is_zero());
        REQUIRE_THROWS_AS(gateway.get_token_decimals(TOKEN1), ContractCallError);
    }

    SECTION("Missing pool is the zero address")
    {
        REQUIRE(is_zero_address(gateway.get_pool(TOKEN0, TOKEN1, 500)));
    }
}

TEST_CASE("Gateway write intents", "[gateway]")
{
    FakeChain chain;
    GatewayConfig config = gateway_config();
    config.gas_multiplier = 1.5;
    ContractGateway gateway(chain, abis(), config);

    auto approve = gateway.build_approve(TOKEN0, MANAGER, Uint256(1000));
    REQUIRE(approve.to == TOKEN0);
    REQUIRE(approve.method == "approve");
    REQUIRE(approve.gas_limit == GAS_LIMIT_APPROVE);
    REQUIRE(approve.gas_price == Uint256(45000000000ULL));

    auto burn = gateway.build_burn(5, 1.0);
    REQUIRE(burn.to == MANAGER);
    REQUIRE(burn.gas_price == Uint256(30000000000ULL));
    REQUIRE(GAS_LIMIT_MINT > GAS_LIMIT_APPROVE);

    REQUIRE_THROWS_AS(gateway.build_burn(5, 0.0), PreconditionFailed);
}

TEST_CASE("Minted token id from a mint receipt", "[gateway]")
{
    FakeChain chain;
    ContractGateway gateway(chain, abis(), gateway_config());

    LogEntry log;
    log.address = MANAGER;
    log.topics = {abis().position_manager.event("Transfer").topic, address_topic(ZERO_ADDRESS),
                  address_topic(WALLET), to_hex(Uint256(42).to_word())};
    log.data = "0x";

    TxReceipt receipt;
    receipt.tx_hash = "0x01";
    receipt.status = true;
    receipt.logs.push_back(log);

    SECTION("Transfer from zero to the recipient")
    {
        REQUIRE(gateway.minted_token_id(receipt, WALLET) == std::optional<uint64_t>(42));
        REQUIRE_FALSE(gateway.minted_token_id(receipt, OTHER).has_value());
    }

    SECTION("Undecodable id is a contract call error")
    {
        receipt.logs[0].topics[3] = to_hex(Uint256::max_uint256().to_word());
        try
        {
            gateway.minted_token_id(receipt, WALLET);
            FAIL("expected ContractCallError");
        }
        catch (const ContractCallError &e)
        {
            REQUIRE(e.context() == "minted token id in 0x01");
        }
    }
}

TEST_CASE("Position id discovery", "[registry]")
{
    FakeChain chain;
    ContractGateway gateway(chain, abis(), gateway_config());

    chain.add_position(5, -600, 600, Uint256(100));
    chain.add_position(7, -600, 600, Uint256(0));
    chain.add_transfer(5, ZERO_ADDRESS, WALLET, 10);
    chain.add_transfer(7, ZERO_ADDRESS, WALLET, 20);
    chain.add_transfer(8, ZERO_ADDRESS, OTHER, 25);
    chain.add_transfer(5, WALLET, OTHER, 28);
    chain.add_transfer(5, OTHER, WALLET, 30);

    SECTION("Ids follow log order and keep repeats")
    {
        PositionRegistry registry(gateway, DiscoveryConfig{});
        auto ids = registry.list_position_ids(WALLET).drain();
        REQUIRE(ids == std::vector<uint64_t>{5, 7, 5});
    }

    SECTION("Nothing is read until the first id is requested")
    {
        PositionRegistry registry(gateway, DiscoveryConfig{});
        auto ids = registry.list_position_ids(WALLET);
        REQUIRE(chain.log_queries.empty());
        REQUIRE(ids.next() == std::optional<uint64_t>(5));
        REQUIRE(chain.log_queries.size() == 1);
        REQUIRE(chain.log_queries[0] == std::pair<uint64_t, uint64_t>(0, 1000));
    }

    SECTION("Chunked scan keeps ascending order")
    {
        DiscoveryConfig discovery;
        discovery.block_chunk = 400;
        PositionRegistry registry(gateway, discovery);
        auto ids = registry.list_position_ids(WALLET).drain();
        REQUIRE(ids == std::vector<uint64_t>{5, 7, 5});

        std::vector<std::pair<uint64_t, uint64_t>> expected{{0, 399}, {400, 799}, {800, 1000}};
        REQUIRE(chain.log_queries == expected);
    }

    SECTION("Scan starts at the configured block")
    {
        DiscoveryConfig discovery;
        discovery.from_block = 15;
        PositionRegistry registry(gateway, discovery);
        REQUIRE(registry.list_position_ids(WALLET).drain() == std::vector<uint64_t>{7, 5});
    }

    SECTION("One entry per token id")
    {
        PositionRegistry registry(gateway, DiscoveryConfig{});
        auto positions = registry.get_positions(WALLET);
        REQUIRE(positions.size() == 2);
        REQUIRE(positions.count(5) == 1);
        REQUIRE(positions.count(7) == 1);
    }

    SECTION("Failed lookups are skipped")
    {
        chain.failing_positions.insert(7);
        PositionRegistry registry(gateway, DiscoveryConfig{});
        auto positions = registry.get_positions(WALLET);
        REQUIRE(positions.size() == 1);
        REQUIRE(positions.count(5) == 1);
    }

    SECTION("Active positions have liquidity")
    {
        PositionRegistry registry(gateway, DiscoveryConfig{});
        auto active = registry.get_active_positions(WALLET);
        REQUIRE(active.size() == 1);
        REQUIRE(active.begin()->first == 5);
    }

    SECTION("Current ownership")
    {
        chain.owners[7] = OTHER;
        PositionRegistry registry(gateway, DiscoveryConfig{});
        REQUIRE(registry.owned_position_ids(WALLET) == std::vector<uint64_t>{5});
    }
}

TEST_CASE("In range check", "[registry]")
{
    FakeChain chain;
    ContractGateway gateway(chain, abis(), gateway_config());
    PositionRegistry registry(gateway, DiscoveryConfig{});
    auto position = chain.add_position(5, -60, 60, Uint256(100));

    SECTION("Inclusive at both bounds")
    {
        for (int32_t tick : {-60, 0, 60})
        {
            chain.add_pool(TOKEN0, TOKEN1, 3000, POOL, tick, q96());
            REQUIRE(registry.is_in_range(position));
        }
        for (int32_t tick : {-61, 61})
        {
            chain.add_pool(TOKEN0, TOKEN1, 3000, POOL, tick, q96());
            REQUIRE_FALSE(registry.is_in_range(position));
        }
    }

    SECTION("Unreadable pool fails closed")
    {
        chain.add_pool(TOKEN0, TOKEN1, 3000, POOL, 0, q96());
        chain.broken_pools.insert(POOL);
        REQUIRE_FALSE(registry.is_in_range(position));
        REQUIRE_FALSE(registry.pool_tick(position).has_value());
    }

    SECTION("Missing pool fails closed")
    {
        REQUIRE_FALSE(registry.is_in_range(position));
    }
}
