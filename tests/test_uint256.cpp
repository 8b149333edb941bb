#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "uint256.hpp"
#include <stdexcept>

using namespace v3lp;
using Catch::Approx;

TEST_CASE("Uint256 parsing and printing", "[uint256]")
{
    SECTION("Decimal and hex agree")
    {
        auto a = Uint256::from_dec("1000000000000000000");
        auto b = Uint256::from_hex("0xde0b6b3a7640000");
        REQUIRE(a == b);
        REQUIRE(a.to_hex() == "0xde0b6b3a7640000");
        REQUIRE(b.to_dec() == "1000000000000000000");
    }

    SECTION("Zero")
    {
        Uint256 zero;
        REQUIRE(zero.is_zero());
        REQUIRE(zero.to_hex() == "0x0");
        REQUIRE(zero.to_dec() == "0");
    }

    SECTION("Limits")
    {
        REQUIRE(Uint256::max_uint128().to_hex() == "0xffffffffffffffffffffffffffffffff");
        REQUIRE(Uint256::max_uint256().bits() == 256);
        REQUIRE_THROWS_AS(Uint256::max_uint256() + Uint256(1), std::out_of_range);
    }

    SECTION("Rejects malformed input")
    {
        REQUIRE_THROWS_AS(Uint256::from_dec("12a"), std::invalid_argument);
        REQUIRE_THROWS_AS(Uint256::from_dec(""), std::invalid_argument);
        REQUIRE_THROWS_AS(Uint256::from_dec("-5"), std::invalid_argument);
    }

    SECTION("32-byte word is big-endian")
    {
        auto word = Uint256(0x0102).to_word();
        REQUIRE(word[30] == 0x01);
        REQUIRE(word[31] == 0x02);
        REQUIRE(word[0] == 0x00);
    }
}

TEST_CASE("Uint256 arithmetic", "[uint256]")
{
    Uint256 a(1000);
    Uint256 b(7);

    REQUIRE((a + b).to_u64() == 1007);
    REQUIRE((a - b).to_u64() == 993);
    REQUIRE((a * b).to_u64() == 7000);
    REQUIRE((a / b).to_u64() == 142);
    REQUIRE_THROWS_AS(b - a, std::out_of_range);

    SECTION("mul_div keeps full precision")
    {
        // 50e18 * 0.7 as basis points
        auto desired = Uint256::from_dec("50000000000000000000");
        REQUIRE(desired.mul_div(Uint256(7000), Uint256(10000)).to_dec() == "35000000000000000000");

        auto big = Uint256::max_uint128();
        REQUIRE(big.mul_div(big, big) == big);
    }

    SECTION("Comparison")
    {
        REQUIRE(b < a);
        REQUIRE(a >= a);
        REQUIRE(a != b);
    }

    SECTION("to_u64 refuses wide values")
    {
        REQUIRE_THROWS_AS(Uint256::max_uint128().to_u64(), std::out_of_range);
    }
}

TEST_CASE("Unit conversion", "[uint256]")
{
    SECTION("format_units trims trailing zeros")
    {
        REQUIRE(format_units(Uint256::from_dec("1500000"), 6) == "1.5");
        REQUIRE(format_units(Uint256::from_dec("1000000000000000000"), 18) == "1");
        REQUIRE(format_units(Uint256(5), 6) == "0.000005");
        REQUIRE(format_units(Uint256(0), 18) == "0");
        REQUIRE(format_units(Uint256(42), 0) == "42");
    }

    SECTION("to_units")
    {
        REQUIRE(to_units(Uint256::from_dec("2500000"), 6) == Approx(2.5));
    }

    SECTION("parse_units rounds down")
    {
        REQUIRE(parse_units(1.5, 6).to_dec() == "1500000");
        REQUIRE(parse_units(3.03, 6).to_dec() == "3030000");
        REQUIRE(parse_units(0.0000019, 6).to_dec() == "1");
        REQUIRE(parse_units(50.0, 18).to_dec() == "50000000000000000000");
        REQUIRE_THROWS_AS(parse_units(-1.0, 18), std::invalid_argument);
    }
}
