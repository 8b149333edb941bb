#include <catch2/catch_test_macros.hpp>
#include "errors.hpp"
#include "rpc_client.hpp"
#include <nlohmann/json.hpp>

using namespace v3lp;
using json = nlohmann::json;

TEST_CASE("Hex quantities", "[rpc]")
{
    REQUIRE(JsonRpcClient::parse_quantity(json("0x0")) == 0);
    REQUIRE(JsonRpcClient::parse_quantity(json("0x1b4")) == 436);
    REQUIRE(JsonRpcClient::parse_quantity(json::parse("137")) == 137);

    REQUIRE(JsonRpcClient::to_quantity(0) == "0x0");
    REQUIRE(JsonRpcClient::to_quantity(30000000) == "0x1c9c380");

    REQUIRE_THROWS_AS(JsonRpcClient::parse_quantity(json(nullptr)), RpcError);
    REQUIRE_THROWS_AS(JsonRpcClient::parse_quantity(json("0xzz")), RpcError);
}

TEST_CASE("Log entries", "[rpc]")
{
    json j = {
        {"address", "0xc36442b4a4522e871399cd717abdd847ab11fe88"},
        {"topics",
         {"0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef",
          "0x0000000000000000000000000000000000000000000000000000000000000000",
          "0x0000000000000000000000009d8a62f656a8d1615c1294fd71e9cfb3e4855a4f",
          "0x00000000000000000000000000000000000000000000000000000000000003e8"}},
        {"data", "0x"},
        {"blockNumber", "0x2a"},
        {"transactionIndex", "0x3"},
        {"logIndex", "0x7"},
        {"transactionHash", "0xabc"},
    };

    auto log = JsonRpcClient::parse_log(j);
    REQUIRE(log.address == "0xc36442b4a4522e871399cd717abdd847ab11fe88");
    REQUIRE(log.topics.size() == 4);
    REQUIRE(log.block_number == 42);
    REQUIRE(log.transaction_index == 3);
    REQUIRE(log.log_index == 7);
    REQUIRE(log.tx_hash == "0xabc");

    SECTION("Missing position fields default to zero")
    {
        auto bare = JsonRpcClient::parse_log({{"address", "0x01"}});
        REQUIRE(bare.topics.empty());
        REQUIRE(bare.data == "0x");
        REQUIRE(bare.block_number == 0);
    }
}

TEST_CASE("Unreachable endpoint is a transport error", "[rpc]")
{
    JsonRpcClient rpc("http://127.0.0.1:1", 2000);
    REQUIRE_THROWS_AS(rpc.block_number(), RpcError);
}
