#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace v3lp;
using Catch::Approx;
using json = nlohmann::json;

namespace
{
    json sample_config()
    {
        return json::parse(R"({
            "default_network": "polygon",
            "networks": {
                "polygon": {
                    "rpc_url": "https://polygon-rpc.com",
                    "chain_id": 137,
                    "price_url": "https://api.coingecko.com/api/v3/simple/token_price/polygon-pos",
                    "position_manager": "0xC36442b4a4522E871399CD717aBDD847Ab11FE88",
                    "factory": "0x1F98431c8aD98523631AE4a59f267346ea31F984"
                }
            },
            "tokens": {
                "polygon": {
                    "USDC": "0x2791Bca1f2de4661ED88A30C99A7a9449Aa84174",
                    "WMATIC": "0x0d500B1d8E8eF31E21C99d1Db9A6444d3ADf1270"
                }
            },
            "position": {
                "token_a": "WMATIC",
                "token_b": "USDC",
                "fee": 500,
                "notional": 25.5,
                "reference": "USDC",
                "range": [0.9, 1.1]
            },
            "execution": {"gas_multiplier": 1.5, "slippage_tolerance": 0.8},
            "discovery": {"from_block": 12000000, "block_chunk": 50000},
            "log": {"level": "debug", "backups": 3}
        })");
    }
}

TEST_CASE("Configuration parsing", "[config]")
{
    auto config = parse_config(sample_config());

    SECTION("Networks")
    {
        const auto &net = config.network("polygon");
        REQUIRE(net.chain_id == 137);
        REQUIRE(net.position_manager == "0xc36442b4a4522e871399cd717abdd847ab11fe88");
        REQUIRE(config.default_network == "polygon");
        REQUIRE_THROWS_AS(config.network("solana"), ConfigError);
    }

    SECTION("Sections override defaults")
    {
        REQUIRE(config.position.fee == 500);
        REQUIRE(config.position.notional == Approx(25.5));
        REQUIRE(config.position.range.lower_factor == Approx(0.9));
        REQUIRE(config.position.range.upper_factor == Approx(1.1));
        REQUIRE(config.execution.gas_multiplier == Approx(1.5));
        REQUIRE(config.execution.slippage_tolerance == Approx(0.8));
        REQUIRE(config.execution.deadline_window_s == 3600);
        REQUIRE(config.discovery.from_block == 12000000);
        REQUIRE(config.discovery.block_chunk == 50000);
        REQUIRE(config.log.level == "debug");
        REQUIRE(config.log.backups == 3);
        REQUIRE(config.log.max_size == 1048576);
        REQUIRE(config.abi_dir == "config/abi");
    }

    SECTION("Token symbols and addresses")
    {
        REQUIRE(config.resolve_token("polygon", "USDC") == "0x2791bca1f2de4661ed88a30c99a7a9449aa84174");
        REQUIRE(config.resolve_token("polygon", "0x7ceB23fD6bC0adD59E62ac25578270cFf1b9f619") ==
                "0x7ceb23fd6bc0add59e62ac25578270cff1b9f619");
        REQUIRE_THROWS_AS(config.resolve_token("polygon", "DOGE"), ConfigError);
        REQUIRE(config.token_label("polygon", "0x0D500B1D8E8EF31E21C99D1DB9A6444D3ADF1270") == "WMATIC");
        REQUIRE(config.token_label("polygon", "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed") ==
                "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed");
    }
}

TEST_CASE("Configuration errors", "[config]")
{
    SECTION("Missing networks")
    {
        REQUIRE_THROWS_AS(parse_config(json::object()), ConfigError);
    }

    SECTION("Bad address")
    {
        auto j = sample_config();
        j["networks"]["polygon"]["factory"] = "0x1234";
        REQUIRE_THROWS_AS(parse_config(j), ConfigError);
    }

    SECTION("Slippage tolerance outside (0, 1]")
    {
        auto j = sample_config();
        j["execution"]["slippage_tolerance"] = 1.5;
        REQUIRE_THROWS_AS(parse_config(j), ConfigError);
    }

    SECTION("Unknown default network")
    {
        auto j = sample_config();
        j["default_network"] = "mainnet";
        REQUIRE_THROWS_AS(parse_config(j), ConfigError);
    }

    SECTION("Missing file")
    {
        REQUIRE_THROWS_AS(load_config("does/not/exist.json"), ConfigError);
    }
}

TEST_CASE("Environment file", "[config]")
{
    const char *path = "v3lp_test.env";
    {
        std::ofstream out(path);
        out << "# wallet\n"
            << "V3LP_TEST_KEY=abc123  # inline comment\n"
            << "\n"
            << "V3LP_TEST_ADDR=0x9d8A62f656a8d1615C1294fd71e9CFb3E4855A4F\r\n";
    }
    load_env_file(path);
    std::remove(path);

    REQUIRE(std::string(std::getenv("V3LP_TEST_KEY")) == "abc123");
    REQUIRE(std::string(std::getenv("V3LP_TEST_ADDR")) == "0x9d8A62f656a8d1615C1294fd71e9CFb3E4855A4F");
}

TEST_CASE("Logger construction", "[config]")
{
    LogConfig config;
    config.file.clear();
    config.level = "warn";
    auto logger = make_logger(config, "config_test");
    REQUIRE(logger->level() == spdlog::level::warn);

    config.level = "loud";
    REQUIRE_THROWS_AS(make_logger(config, "config_test_bad"), ConfigError);

    REQUIRE(or_null(nullptr) == null_logger());
}
