#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>

namespace costbook {

enum class Rounding { HalfUp, HalfEven };

// Signed fixed-point number with 8 fractional digits held in a scaled
// 64-bit integer. Addition and subtraction are exact; anything that divides
// takes an explicit result precision and rounding mode.
class Decimal {
public:
    static constexpr int kPlaces = 8;
    static constexpr int64_t kScale = 100000000;

    constexpr Decimal() = default;
    explicit Decimal(long long whole);

    static Decimal from_raw(int64_t raw);

    // Accepts an optional sign, thousands separators and a fractional part.
    // Digits beyond the 8th fractional place are rounded half-up.
    // Throws std::invalid_argument on anything else.
    static Decimal parse(const std::string& text);

    // num / den rounded to `places` fractional digits.
    static Decimal quotient(const Decimal& num, const Decimal& den, int places, Rounding mode);

    // a * b / c rounded to `places` fractional digits, without intermediate rounding.
    static Decimal mul_div(const Decimal& a, const Decimal& b, const Decimal& c,
                           int places, Rounding mode);

    // a * b rounded to `places` fractional digits.
    static Decimal product(const Decimal& a, const Decimal& b, int places, Rounding mode);

    [[nodiscard]] Decimal rounded(int places, Rounding mode) const;
    [[nodiscard]] Decimal abs() const;

    [[nodiscard]] int64_t raw() const noexcept { return raw_; }
    [[nodiscard]] bool is_zero() const noexcept { return raw_ == 0; }
    [[nodiscard]] bool is_negative() const noexcept { return raw_ < 0; }
    [[nodiscard]] bool is_positive() const noexcept { return raw_ > 0; }

    // Fixed number of fractional digits, rounded half-up.
    [[nodiscard]] std::string to_string(int places) const;
    // Shortest form without trailing zeros.
    [[nodiscard]] std::string to_string() const;

    Decimal operator-() const;
    Decimal& operator+=(const Decimal& other);
    Decimal& operator-=(const Decimal& other);

    friend Decimal operator+(Decimal lhs, const Decimal& rhs) { return lhs += rhs; }
    friend Decimal operator-(Decimal lhs, const Decimal& rhs) { return lhs -= rhs; }

    friend bool operator==(const Decimal& a, const Decimal& b) { return a.raw_ == b.raw_; }
    friend bool operator!=(const Decimal& a, const Decimal& b) { return a.raw_ != b.raw_; }
    friend bool operator<(const Decimal& a, const Decimal& b) { return a.raw_ < b.raw_; }
    friend bool operator>(const Decimal& a, const Decimal& b) { return a.raw_ > b.raw_; }
    friend bool operator<=(const Decimal& a, const Decimal& b) { return a.raw_ <= b.raw_; }
    friend bool operator>=(const Decimal& a, const Decimal& b) { return a.raw_ >= b.raw_; }

private:
    int64_t raw_ = 0;
};

std::ostream& operator<<(std::ostream& os, const Decimal& value);

} // namespace costbook
