// vperp - Fixed-Point Math Tests

#include <catch2/catch_test_macros.hpp>
#include <stdexcept>

#include "fixture.hpp"

using namespace vperp;
using namespace vperp::test;

TEST_CASE("mul_div rounding", "[math]") {
    SECTION("Exact") {
        REQUIRE(mul_div(6, 7, 3) == 14);
        REQUIRE(mul_div_up(6, 7, 3) == 14);
    }

    SECTION("Truncates toward zero") {
        REQUIRE(mul_div(7, 1, 2) == 3);
        REQUIRE(mul_div(-7, 1, 2) == -3);
    }

    SECTION("Rounds magnitude up") {
        REQUIRE(mul_div_up(7, 1, 2) == 4);
        REQUIRE(mul_div_up(-7, 1, 2) == -4);
    }

    SECTION("Zero denominator") {
        REQUIRE_THROWS_AS(mul_div(1, 1, 0), std::invalid_argument);
    }
}

TEST_CASE("mul_div wide intermediate", "[math]") {
    // 1e30 * 1e30 does not fit in 128 bits
    I128 big = x18::from_int(1000000000000);

    SECTION("Product wider than 128 bits") {
        REQUIRE(mul_div(big, big, big) == big);
        REQUIRE(mul_div(big, -big, big) == -big);
    }

    SECTION("Quotient overflow throws") {
        REQUIRE_THROWS_AS(mul_div(big, big, 1), std::overflow_error);
    }
}

TEST_CASE("X18 decimal strings", "[math]") {
    I128 v = 0;

    SECTION("Parse") {
        REQUIRE(x18::parse("2000", v));
        REQUIRE(v == x18::from_int(2000));

        REQUIRE(x18::parse("2000.5", v));
        REQUIRE(v == x18::from_int(2000) + X18_ONE / 2);

        REQUIRE(x18::parse("-0.000000000000000001", v));
        REQUIRE(v == -1);
    }

    SECTION("Reject malformed") {
        REQUIRE_FALSE(x18::parse("", v));
        REQUIRE_FALSE(x18::parse("abc", v));
        REQUIRE_FALSE(x18::parse("1.2.3", v));
        REQUIRE_FALSE(x18::parse("1.0000000000000000001", v));
    }

    SECTION("Format") {
        REQUIRE(x18::to_string(x18::from_int(2000)) == "2000");
        REQUIRE(x18::to_string(dec("2000.25")) == "2000.25");
        REQUIRE(x18::to_string(-dec("0.5")) == "-0.5");
        REQUIRE(int_to_string(-123) == "-123");
    }
}

TEST_CASE("Basis points and token conversion", "[math]") {
    SECTION("bps") {
        REQUIRE(bps_of(x18::from_int(2000), 250) == x18::from_int(50));
        REQUIRE(bps_of(101, 5000) == 50);
        REQUIRE(bps_of_up(101, 5000) == 51);
    }

    SECTION("Collect rounds up, pay out rounds down") {
        I128 unit = pow10(6);
        I128 amount = dec("1.0000005");
        REQUIRE(to_token_down(amount, unit) == 1000000);
        REQUIRE(to_token_up(amount, unit) == 1000001);
        REQUIRE(from_token(1000000, unit) == X18_ONE);
    }

    SECTION("pow10") {
        REQUIRE(pow10(0) == 1);
        REQUIRE(pow10(6) == 1000000);
        REQUIRE_THROWS_AS(pow10(40), std::overflow_error);
    }
}
