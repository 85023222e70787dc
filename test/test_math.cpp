// SharePool - 256-bit math, amount and address formatting tests

#include <catch2/catch_test_macros.hpp>
#include "test_helpers.hpp"

#include <stdexcept>

using namespace sharepool;
using namespace sharepool::testing;

TEST_CASE("mul_u128 produces the full 256-bit product", "[math]") {
    SECTION("Small operands stay in the low limb") {
        wide::U256 p = wide::mul_u128(1000, 300);
        REQUIRE(p.hi == 0_u);
        REQUIRE(p.lo == 300000_u);
    }

    SECTION("2^64 * 2^64 carries into the high limb") {
        U128 two64 = U128(1) << 64;
        wide::U256 p = wide::mul_u128(two64, two64);
        REQUIRE(p.lo == 0_u);
        REQUIRE(p.hi == 1_u);
    }

    SECTION("MAX * MAX") {
        // (2^128 - 1)^2 = 2^256 - 2^129 + 1
        wide::U256 p = wide::mul_u128(U128_MAX, U128_MAX);
        REQUIRE(p.lo == 1_u);
        REQUIRE(p.hi == U128_MAX - 1);
    }
}

TEST_CASE("div_u256_u128 floors and reports overflow", "[math]") {
    SECTION("Narrow numerator") {
        auto r = wide::div_u256_u128(wide::U256(1001), 10);
        REQUIRE(r.quotient == 100_u);
        REQUIRE(r.remainder == 1_u);
        REQUIRE_FALSE(r.overflow);
    }

    SECTION("Wide numerator divides back to an operand") {
        U128 a = (U128(1) << 100) + 12345;
        U128 b = (U128(1) << 90) + 777;
        auto r = wide::div_u256_u128(wide::mul_u128(a, b), b);
        REQUIRE(r.quotient == a);
        REQUIRE(r.remainder == 0_u);
        REQUIRE_FALSE(r.overflow);
    }

    SECTION("Divisor with the top bit set") {
        U128 d = U128_MAX - 5;
        auto r = wide::div_u256_u128(wide::mul_u128(d, 3), d);
        REQUIRE(r.quotient == 3_u);
        REQUIRE(r.remainder == 0_u);
    }

    SECTION("Quotient wider than 128 bits") {
        auto r = wide::div_u256_u128(wide::mul_u128(U128_MAX, U128_MAX), 2);
        REQUIRE(r.overflow);
    }
}

TEST_CASE("checked_mul_div", "[math]") {
    REQUIRE(checked_mul_div(300, PRECISION, 3000).value() == PRECISION / 10);
    REQUIRE(checked_mul_div(7, 3, 2).value() == 10_u);
    REQUIRE_FALSE(checked_mul_div(1, 1, 0).has_value());
    REQUIRE_FALSE(checked_mul_div(U128_MAX, PRECISION, 1).has_value());

    // Intermediate exceeds 128 bits but the result fits
    U128 big = U128(1) << 120;
    REQUIRE(checked_mul_div(big, PRECISION, PRECISION).value() == big);
}

TEST_CASE("checked_add", "[math]") {
    REQUIRE(checked_add(1, 2).value() == 3_u);
    REQUIRE(checked_add(U128_MAX - 1, 1).value() == U128_MAX);
    REQUIRE_FALSE(checked_add(U128_MAX, 1).has_value());
}

TEST_CASE("U128 decimal formatting", "[math]") {
    REQUIRE(to_string(0) == "0");
    REQUIRE(to_string(PRECISION) == "1000000000000000000");
    REQUIRE(to_string(U128_MAX) == "340282366920938463463374607431768211455");

    REQUIRE(parse_u128("0") == 0_u);
    REQUIRE(parse_u128("1000000000000000000") == PRECISION);
    REQUIRE(parse_u128("340282366920938463463374607431768211455") == U128_MAX);

    REQUIRE_THROWS_AS(parse_u128(""), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_u128("12a"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_u128("-1"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_u128("340282366920938463463374607431768211456"), std::out_of_range);
}

TEST_CASE("Address hex encoding", "[types]") {
    Address a = addresses::from_u64(0xABCD);
    REQUIRE(addresses::to_hex(a) == "0x000000000000000000000000000000000000abcd");
    REQUIRE(addresses::from_hex("0x000000000000000000000000000000000000ABCD") == a);
    REQUIRE(addresses::from_hex("000000000000000000000000000000000000abcd") == a);

    REQUIRE(is_zero_address(ZERO_ADDRESS));
    REQUIRE_FALSE(is_zero_address(a));

    REQUIRE_THROWS_AS(addresses::from_hex("0x1234"), std::invalid_argument);
    REQUIRE_THROWS_AS(addresses::from_hex("0xzz0000000000000000000000000000000000abcd"),
                      std::invalid_argument);
}

TEST_CASE("Error names", "[types]") {
    REQUIRE(std::string(errors::message(errors::OK)) == "OK");
    REQUIRE(std::string(errors::message(errors::ZERO_AMOUNT)) == "ZeroAmount");
    REQUIRE(std::string(errors::message(errors::TRANSFER_FAILED)) == "TransferFailed");
    REQUIRE(std::string(errors::message(12345)) == "Unknown");
}
