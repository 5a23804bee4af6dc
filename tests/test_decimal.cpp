#include "costbook/decimal.hpp"

#include <catch2/catch.hpp>

#include <cstdint>
#include <stdexcept>

using costbook::Decimal;
using costbook::Rounding;

TEST_CASE("Decimal parses signs, separators and fractions") {
    CHECK(Decimal::parse("1,234.50").to_string(2) == "1234.50");
    CHECK(Decimal::parse("-0.125").to_string() == "-0.125");
    CHECK(Decimal::parse("+7").to_string() == "7");
    CHECK(Decimal::parse(" 42 ") == Decimal(42));
    CHECK(Decimal::parse("0.123456789").to_string() == "0.12345679");
}

TEST_CASE("Decimal rejects malformed text") {
    CHECK_THROWS_AS(Decimal::parse(""), std::invalid_argument);
    CHECK_THROWS_AS(Decimal::parse("abc"), std::invalid_argument);
    CHECK_THROWS_AS(Decimal::parse("1.2.3"), std::invalid_argument);
    CHECK_THROWS_AS(Decimal::parse("12 34"), std::invalid_argument);
}

TEST_CASE("Decimal addition is exact and overflow checked") {
    Decimal total;
    for (int i = 0; i < 10; ++i) {
        total += Decimal::parse("0.1");
    }
    CHECK(total == Decimal(1));
    CHECK((Decimal(5) - Decimal::parse("7.25")).to_string(2) == "-2.25");

    Decimal big = Decimal::from_raw(INT64_MAX);
    CHECK_THROWS_AS(big += Decimal::from_raw(1), std::overflow_error);
}

TEST_CASE("quotient rounds half-up or half-even at the requested precision") {
    const auto two = Decimal(2);
    CHECK(Decimal::quotient(Decimal::parse("0.05"), two, 2, Rounding::HalfUp).to_string(2) == "0.03");
    CHECK(Decimal::quotient(Decimal::parse("0.05"), two, 2, Rounding::HalfEven).to_string(2) == "0.02");
    CHECK(Decimal::quotient(Decimal::parse("-0.05"), two, 2, Rounding::HalfUp).to_string(2) == "-0.03");
    CHECK(Decimal::quotient(Decimal(100), Decimal::parse("1.2345"), 2, Rounding::HalfUp).to_string(2) == "81.00");
    CHECK_THROWS_AS(Decimal::quotient(Decimal(1), Decimal{}, 2, Rounding::HalfUp), std::domain_error);
}

TEST_CASE("mul_div does not round the intermediate product") {
    // 333.33 * 1 / 3 = 111.11
    CHECK(Decimal::mul_div(Decimal::parse("333.33"), Decimal(1), Decimal(3), 2, Rounding::HalfEven)
              .to_string(2) == "111.11");
    // 0.25 * 1 / 10 = 0.025 -> 0.02 half-even
    CHECK(Decimal::mul_div(Decimal::parse("0.25"), Decimal(1), Decimal(10), 2, Rounding::HalfEven)
              .to_string(2) == "0.02");
    CHECK(Decimal::mul_div(Decimal(400), Decimal(5), Decimal(10), 2, Rounding::HalfEven) == Decimal(200));
}

TEST_CASE("Wide intermediates stay exact and narrowing is checked") {
    // 50,000,000 * 1,000 overflows 64-bit raw units before the division.
    CHECK(Decimal::mul_div(Decimal(50000000), Decimal(1000), Decimal(1000), 2, Rounding::HalfEven) ==
          Decimal(50000000));
    CHECK(Decimal::product(Decimal(3000000), Decimal(3000), 2, Rounding::HalfUp) == Decimal(9000000000LL));
    CHECK_THROWS_AS(Decimal(100000000000LL), std::overflow_error);
    CHECK_THROWS_AS(Decimal::product(Decimal(100000000), Decimal(1000), 2, Rounding::HalfUp),
                    std::overflow_error);
}

TEST_CASE("to_string pads and trims") {
    CHECK(Decimal::parse("3").to_string(2) == "3.00");
    CHECK(Decimal::parse("3.10").to_string() == "3.1");
    CHECK(Decimal::parse("2.345").to_string(2) == "2.35");
    CHECK(Decimal{}.to_string() == "0");
    CHECK(Decimal::parse("-0.004").to_string(2) == "0.00");
}
