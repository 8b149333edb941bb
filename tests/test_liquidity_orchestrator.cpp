#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "balance_oracle.hpp"
#include "contract_gateway.hpp"
#include "errors.hpp"
#include "fake_chain.hpp"
#include "liquidity_orchestrator.hpp"
#include "transaction_executor.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace v3lp;
using namespace v3lp_test;
using Catch::Approx;

namespace
{
    GatewayConfig gateway_config()
    {
        GatewayConfig config;
        config.position_manager = MANAGER;
        config.factory = FACTORY;
        return config;
    }

    ExecutorConfig executor_config()
    {
        ExecutorConfig config;
        config.chain_id = 137;
        config.receipt_timeout = std::chrono::milliseconds(50);
        config.poll_interval = std::chrono::milliseconds(5);
        return config;
    }

    // Pool TOKEN0/TOKEN1 at price 1.0, both 18 decimals, wallet holding 1000 of each
    struct Fixture
    {
        FakeChain chain;
        FakeSigner signer;
        ContractGateway gateway{chain, abis(), gateway_config()};
        BalanceOracle balances{gateway};
        TransactionExecutor executor{chain, signer, executor_config()};
        LiquidityOrchestrator orchestrator{gateway, balances, executor, OrchestratorConfig{}};

        Fixture()
        {
            chain.add_pool(TOKEN0, TOKEN1, 3000, POOL, 0, q96());
            chain.decimals[TOKEN0] = 18;
            chain.decimals[TOKEN1] = 18;
            chain.balances[{TOKEN0, WALLET}] = units(1000, 18);
            chain.balances[{TOKEN1, WALLET}] = units(1000, 18);
        }

        AddLiquidityRequest request() const
        {
            AddLiquidityRequest r;
            r.token_a = TOKEN1; // deliberately not in protocol order
            r.token_b = TOKEN0;
            r.fee = 3000;
            r.notional = 100.0;
            r.reference = TOKEN1;
            r.range = PriceRange{0.95, 1.05};
            return r;
        }

        AbiValues sent_args(size_t index, std::string &method)
        {
            const auto &tx = chain.sent_txs.at(index);
            std::string to = tx["to"].get<std::string>();
            const ContractAbi &abi = to == MANAGER ? abis().position_manager : abis().erc20;
            return abi.decode_call(tx["data"].get<std::string>(), method);
        }
    };

    using Methods = std::vector<std::string>;
}

TEST_CASE("Balance oracle", "[balances]")
{
    Fixture f;
    f.chain.decimals[TOKEN1] = 6;
    f.chain.balances[{TOKEN1, WALLET}] = Uint256(2500000);

    REQUIRE(f.balances.decimals_of(TOKEN1) == 6);
    REQUIRE(f.balances.balance_of(WALLET, TOKEN1, 6) == Approx(2.5));
    REQUIRE(f.balances.raw_balance_of(WALLET, TOKEN1) == Uint256(2500000));
}

TEST_CASE("Add liquidity", "[orchestrator]")
{
    Fixture f;

    SECTION("Approves both tokens and mints in protocol order")
    {
        auto result = f.orchestrator.add_liquidity(f.request());

        REQUIRE(result.state == AddLiquidityState::Minted);
        REQUIRE(result.quote.token0 == TOKEN0);
        REQUIRE(result.quote.token1 == TOKEN1);
        REQUIRE(result.quote.price == Approx(1.0));
        REQUIRE(result.ticks.lower == -540);
        REQUIRE(result.ticks.upper == 480);
        REQUIRE(result.desired[0] == units(50, 18));
        REQUIRE(result.desired[1] == units(50, 18));
        REQUIRE(result.minimum[0] == units(35, 18));
        REQUIRE(result.approval_hashes.size() == 2);
        REQUIRE(result.token_id == std::optional<uint64_t>(1000));
        REQUIRE(f.chain.sent_methods == Methods{"approve", "approve", "mint"});
        REQUIRE(f.chain.positions.count(1000) == 1);

        for (size_t i = 0; i < f.chain.sent_txs.size(); ++i)
        {
            REQUIRE(f.chain.sent_txs[i]["nonce"].get<uint64_t>() == i);
            REQUIRE(f.chain.sent_txs[i]["chain_id"].get<uint64_t>() == 137);
        }

        std::string method;
        auto mint = f.sent_args(2, method);
        REQUIRE(method == "mint");
        REQUIRE(mint[0] == TOKEN0);
        REQUIRE(mint[1] == TOKEN1);
        REQUIRE(mint[3] == "-540");
        REQUIRE(mint[4] == "480");
        REQUIRE(mint[5] == "50000000000000000000");
        REQUIRE(mint[7] == "35000000000000000000");
        REQUIRE(mint[9] == WALLET);
        REQUIRE(mint[10] == std::to_string(1700000000 + 3600));

        auto approve = f.sent_args(0, method);
        REQUIRE(method == "approve");
        REQUIRE(approve[0] == MANAGER);
        REQUIRE(approve[1] == "50000000000000000000");
    }

    SECTION("Skips approval when the allowance covers the amount")
    {
        f.chain.allowances[{TOKEN0, WALLET, MANAGER}] = units(100, 18);
        auto result = f.orchestrator.add_liquidity(f.request());

        REQUIRE(result.approval_hashes.size() == 1);
        REQUIRE(f.chain.sent_methods == Methods{"approve", "mint"});
        REQUIRE(f.chain.sent_txs[0]["to"].get<std::string>() == TOKEN1);
    }

    SECTION("Insufficient balance sends nothing")
    {
        f.chain.balances[{TOKEN1, WALLET}] = units(10, 18);
        try
        {
            f.orchestrator.add_liquidity(f.request());
            FAIL("expected WorkflowError");
        }
        catch (const WorkflowError &e)
        {
            REQUIRE(e.kind() == ErrorKind::InsufficientBalance);
            REQUIRE(e.reached_state() == "RangeComputed");
            REQUIRE(e.step() == "verify balances");
            REQUIRE(e.tx_hash().empty());
        }
        REQUIRE(f.chain.sent_methods.empty());
        REQUIRE(f.chain.count("approve") == 0);
        REQUIRE(f.chain.count("mint") == 0);
    }

    SECTION("Amounts are matched to tokens by index")
    {
        // TOKEN1 has 6 decimals and the pool prices TOKEN0 at 2 TOKEN1
        f.chain.decimals[TOKEN1] = 6;
        f.chain.add_pool(TOKEN0, TOKEN1, 3000, POOL, 6931, Uint256::from_dec("112045541949572279837463"));
        f.chain.balances[{TOKEN0, WALLET}] = units(30, 18);
        f.chain.balances[{TOKEN1, WALLET}] = units(60, 6);

        auto result = f.orchestrator.add_liquidity(f.request());
        REQUIRE(result.quote.price == Approx(2.0));
        REQUIRE(result.desired[1] == units(50, 6));
        REQUIRE(to_units(result.desired[0], 18) == Approx(25.0));

        f.chain.balances[{TOKEN1, WALLET}] = units(40, 6);
        try
        {
            f.orchestrator.add_liquidity(f.request());
            FAIL("expected WorkflowError");
        }
        catch (const WorkflowError &e)
        {
            REQUIRE(e.kind() == ErrorKind::InsufficientBalance);
            REQUIRE(std::string(e.what()).find(TOKEN1) != std::string::npos);
        }
    }

    SECTION("Unknown fee tier stops before any read")
    {
        auto request = f.request();
        request.fee = 2500;
        try
        {
            f.orchestrator.add_liquidity(request);
            FAIL("expected WorkflowError");
        }
        catch (const WorkflowError &e)
        {
            REQUIRE(e.kind() == ErrorKind::UnknownFeeTier);
            REQUIRE(e.reached_state() == "Started");
        }
    }

    SECTION("Missing pool")
    {
        auto request = f.request();
        request.fee = 500;
        REQUIRE_THROWS_AS(f.orchestrator.add_liquidity(request), WorkflowError);
        REQUIRE(f.chain.sent_methods.empty());
    }

    SECTION("Collapsed range")
    {
        auto request = f.request();
        request.range = PriceRange{1.0, 1.001};
        try
        {
            f.orchestrator.add_liquidity(request);
            FAIL("expected WorkflowError");
        }
        catch (const WorkflowError &e)
        {
            REQUIRE(e.kind() == ErrorKind::InvalidRange);
            REQUIRE(e.reached_state() == "PriceDiscovered");
        }
        REQUIRE(f.chain.sent_methods.empty());
    }

    SECTION("Reference token outside the pool")
    {
        auto request = f.request();
        request.reference = OTHER;
        try
        {
            f.orchestrator.add_liquidity(request);
            FAIL("expected WorkflowError");
        }
        catch (const WorkflowError &e)
        {
            REQUIRE(e.kind() == ErrorKind::PreconditionFailed);
            REQUIRE(e.reached_state() == "RangeComputed");
        }
    }

    SECTION("Receipt timeout is reported as unconfirmed")
    {
        f.chain.mine = false;
        try
        {
            f.orchestrator.add_liquidity(f.request());
            FAIL("expected WorkflowError");
        }
        catch (const WorkflowError &e)
        {
            REQUIRE(e.kind() == ErrorKind::UnconfirmedTransaction);
            REQUIRE(e.reached_state() == "BalanceVerified");
            REQUIRE(e.step() == "approve");
            REQUIRE_FALSE(e.tx_hash().empty());
        }
        REQUIRE(f.chain.sent_methods == Methods{"approve"});
    }

    SECTION("Reverted mint keeps the approvals and names the transaction")
    {
        f.chain.reverting_methods.insert("mint");
        try
        {
            f.orchestrator.add_liquidity(f.request());
            FAIL("expected WorkflowError");
        }
        catch (const WorkflowError &e)
        {
            REQUIRE(e.kind() == ErrorKind::ContractCall);
            REQUIRE(e.reached_state() == "Approved");
            REQUIRE(e.step() == "mint");
            REQUIRE_FALSE(e.tx_hash().empty());
        }
        REQUIRE(f.chain.allowances.size() == 2);
    }

    SECTION("Malformed token address halts before any read")
    {
        auto request = f.request();
        request.token_a = "not-an-address";
        try
        {
            f.orchestrator.add_liquidity(request);
            FAIL("expected WorkflowError");
        }
        catch (const WorkflowError &e)
        {
            REQUIRE(e.kind() == ErrorKind::PreconditionFailed);
            REQUIRE(e.reached_state() == "Started");
            REQUIRE(e.step() == "discover price");
        }
        REQUIRE(f.chain.sent_methods.empty());
    }

    SECTION("Unreadable minted id still returns the mined receipt")
    {
        f.chain.oversized_minted_id = true;
        auto result = f.orchestrator.add_liquidity(f.request());
        REQUIRE(result.state == AddLiquidityState::Minted);
        REQUIRE_FALSE(result.token_id.has_value());
        REQUIRE(result.mint_receipt.status);
        REQUIRE_FALSE(result.mint_receipt.tx_hash.empty());
    }

    SECTION("Cancelled before sending")
    {
        std::atomic<bool> cancel{true};
        REQUIRE_THROWS_AS(f.orchestrator.add_liquidity(f.request(), &cancel), WorkflowError);
        REQUIRE(f.chain.sent_methods.empty());
    }
}

TEST_CASE("Increase liquidity", "[orchestrator]")
{
    Fixture f;
    f.chain.add_position(42, -600, 600, Uint256(5000));

    auto result = f.orchestrator.increase_liquidity(42, 20.0, TOKEN0);
    REQUIRE(result.state == IncreaseLiquidityState::Increased);
    REQUIRE(result.desired[0] == units(10, 18));
    REQUIRE(result.desired[1] == units(10, 18));
    REQUIRE(f.chain.sent_methods == Methods{"approve", "approve", "increaseLiquidity"});
    REQUIRE(f.chain.positions.at(42).liquidity == Uint256(5500));

    std::string method;
    auto args = f.sent_args(2, method);
    REQUIRE(args[0] == "42");
    REQUIRE(args[3] == "7000000000000000000");

    SECTION("Unknown position")
    {
        try
        {
            f.orchestrator.increase_liquidity(43, 20.0, TOKEN0);
            FAIL("expected WorkflowError");
        }
        catch (const WorkflowError &e)
        {
            REQUIRE(e.kind() == ErrorKind::PositionNotFound);
        }
    }
}

TEST_CASE("Close position", "[orchestrator]")
{
    Fixture f;

    SECTION("Decrease, collect and burn")
    {
        f.chain.add_position(42, -600, 600, Uint256(5000));
        auto result = f.orchestrator.close_position(42);

        REQUIRE(result.state == CloseState::Burned);
        REQUIRE(result.decreased);
        REQUIRE_FALSE(result.burn_tx.empty());
        REQUIRE(f.chain.sent_methods == Methods{"decreaseLiquidity", "collect", "burn"});
        REQUIRE(f.chain.positions.count(42) == 0);

        std::string method;
        auto decrease = f.sent_args(0, method);
        REQUIRE(decrease[1] == "5000");
        REQUIRE(decrease[2] == "0");
        REQUIRE(decrease[3] == "0");

        auto collect = f.sent_args(1, method);
        REQUIRE(collect[1] == WALLET);
        REQUIRE(collect[2] == Uint256::max_uint128().to_dec());
        REQUIRE(collect[3] == Uint256::max_uint128().to_dec());
    }

    SECTION("Zero liquidity skips the decrease")
    {
        auto &p = f.chain.add_position(42, -600, 600, Uint256(0));
        p.tokens_owed0 = Uint256(3);
        auto result = f.orchestrator.close_position(42);

        REQUIRE(result.state == CloseState::Burned);
        REQUIRE_FALSE(result.decreased);
        REQUIRE(result.decrease_tx.empty());
        REQUIRE(f.chain.count("decreaseLiquidity") == 0);
        REQUIRE(f.chain.sent_methods == Methods{"collect", "burn"});
    }

    SECTION("Unknown position")
    {
        try
        {
            f.orchestrator.close_position(99);
            FAIL("expected WorkflowError");
        }
        catch (const WorkflowError &e)
        {
            REQUIRE(e.kind() == ErrorKind::PositionNotFound);
            REQUIRE(e.reached_state() == "Started");
            REQUIRE(e.workflow() == "close-position");
        }
        REQUIRE(f.chain.sent_methods.empty());
    }

    SECTION("Burn waits for owed tokens to be collected")
    {
        f.chain.add_position(42, -600, 600, Uint256(5000));
        f.chain.collect_clears_owed = false;
        try
        {
            f.orchestrator.close_position(42);
            FAIL("expected WorkflowError");
        }
        catch (const WorkflowError &e)
        {
            REQUIRE(e.kind() == ErrorKind::PreconditionFailed);
            REQUIRE(e.reached_state() == "FeesCollected");
            REQUIRE(e.step() == "burn");
        }
        REQUIRE(f.chain.count("burn") == 0);
        REQUIRE(f.chain.positions.count(42) == 1);
    }

    SECTION("Failed decrease stops the workflow")
    {
        f.chain.add_position(42, -600, 600, Uint256(5000));
        f.chain.reverting_methods.insert("decreaseLiquidity");
        try
        {
            f.orchestrator.close_position(42);
            FAIL("expected WorkflowError");
        }
        catch (const WorkflowError &e)
        {
            REQUIRE(e.kind() == ErrorKind::ContractCall);
            REQUIRE(e.reached_state() == "LiquidityQueried");
        }
        REQUIRE(f.chain.sent_methods == Methods{"decreaseLiquidity"});
    }
}

TEST_CASE("Sends from one wallet are serialised", "[executor]")
{
    FakeChain chain;
    FakeSigner signer;
    ContractGateway gateway(chain, abis(), gateway_config());
    chain.receipt_delay = std::chrono::milliseconds(30);

    ExecutorConfig config = executor_config();
    config.receipt_timeout = std::chrono::seconds(5);

    auto intent = gateway.build_approve(TOKEN0, MANAGER, Uint256(1));

    // Separate executors share nothing but the wallet address
    std::vector<std::string> hashes(2);
    bool mined[2] = {false, false};
    std::vector<std::thread> workers;
    for (size_t i = 0; i < 2; ++i)
    {
        workers.emplace_back([&, i]
                             {
            TransactionExecutor executor(chain, signer, config);
            try
            {
                mined[i] = executor.execute(intent, hashes[i]).status;
            }
            catch (const Error &)
            {
                mined[i] = false;
            } });
    }
    for (auto &worker : workers)
    {
        worker.join();
    }

    REQUIRE(mined[0]);
    REQUIRE(mined[1]);
    REQUIRE(hashes[0] != hashes[1]);
    REQUIRE_FALSE(chain.overlapping_sends);
    REQUIRE(chain.sent_txs.size() == 2);
    REQUIRE(chain.sent_txs[0]["nonce"].get<uint64_t>() == 0);
    REQUIRE(chain.sent_txs[1]["nonce"].get<uint64_t>() == 1);
}

TEST_CASE("Workflow state names", "[orchestrator]")
{
    REQUIRE(std::string(to_string(AddLiquidityState::BalanceVerified)) == "BalanceVerified");
    REQUIRE(std::string(to_string(CloseState::LiquidityDecreased)) == "LiquidityDecreased");
    REQUIRE(std::string(to_string(IncreaseLiquidityState::Increased)) == "Increased");
}
