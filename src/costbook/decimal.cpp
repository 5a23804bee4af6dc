#include "costbook/decimal.hpp"

#include <cctype>
#include <limits>
#include <ostream>
#include <stdexcept>

namespace costbook {

namespace {

// GCC and Clang 128-bit integer; products of two raw values need the headroom.
__extension__ typedef __int128 wide_int;

constexpr int64_t kPow10[] = {
    1LL,
    10LL,
    100LL,
    1000LL,
    10000LL,
    100000LL,
    1000000LL,
    10000000LL,
    100000000LL,
};

int64_t pow10(int places) {
    if (places < 0 || places > Decimal::kPlaces) {
        throw std::invalid_argument("Decimal precision out of range: " + std::to_string(places));
    }
    return kPow10[places];
}

int64_t narrow(wide_int value) {
    if (value > std::numeric_limits<int64_t>::max() ||
        value < std::numeric_limits<int64_t>::min()) {
        throw std::overflow_error("Decimal overflow");
    }
    return static_cast<int64_t>(value);
}

wide_int checked_mul(wide_int lhs, wide_int rhs) {
    wide_int result = 0;
    if (__builtin_mul_overflow(lhs, rhs, &result)) {
        throw std::overflow_error("Decimal overflow");
    }
    return result;
}

// Integer division with the remainder resolved by the rounding mode.
wide_int round_div(wide_int num, wide_int den, Rounding mode) {
    if (den == 0) {
        throw std::domain_error("Decimal division by zero");
    }
    if (den < 0) {
        num = -num;
        den = -den;
    }

    wide_int quotient = num / den;
    const wide_int remainder = num % den;
    if (remainder == 0) {
        return quotient;
    }

    const wide_int twice = (remainder < 0 ? -remainder : remainder) * 2;
    bool away = twice > den;
    if (twice == den) {
        away = mode == Rounding::HalfUp || (quotient % 2 != 0);
    }
    if (away) {
        quotient += num < 0 ? -1 : 1;
    }
    return quotient;
}

} // namespace

Decimal::Decimal(long long whole)
    : raw_(narrow(checked_mul(whole, kScale))) {}

Decimal Decimal::from_raw(int64_t raw) {
    Decimal value;
    value.raw_ = raw;
    return value;
}

Decimal Decimal::parse(const std::string& text) {
    std::size_t pos = 0;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }

    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    wide_int integer_part = 0;
    wide_int fraction = 0;
    int fraction_digits = 0;
    bool round_up = false;
    bool seen_digit = false;
    bool in_fraction = false;

    for (; pos < text.size(); ++pos) {
        const char c = text[pos];
        if (c == ',' && !in_fraction) {
            continue;
        }
        if (c == '.' && !in_fraction) {
            in_fraction = true;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            break;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Invalid decimal: '" + text + "'");
        }

        seen_digit = true;
        const int digit = c - '0';
        if (!in_fraction) {
            integer_part = integer_part * 10 + digit;
            if (integer_part > std::numeric_limits<int64_t>::max() / kScale) {
                throw std::overflow_error("Decimal overflow: '" + text + "'");
            }
        } else if (fraction_digits < kPlaces) {
            fraction = fraction * 10 + digit;
            ++fraction_digits;
        } else if (fraction_digits == kPlaces) {
            round_up = digit >= 5;
            ++fraction_digits;
        }
    }

    for (; pos < text.size(); ++pos) {
        if (!std::isspace(static_cast<unsigned char>(text[pos]))) {
            throw std::invalid_argument("Invalid decimal: '" + text + "'");
        }
    }

    if (!seen_digit) {
        throw std::invalid_argument("Invalid decimal: '" + text + "'");
    }

    const int used = fraction_digits > kPlaces ? kPlaces : fraction_digits;
    wide_int raw = integer_part * kScale + fraction * kPow10[kPlaces - used];
    if (round_up) {
        raw += 1;
    }
    return from_raw(narrow(negative ? -raw : raw));
}

Decimal Decimal::quotient(const Decimal& num, const Decimal& den, int places, Rounding mode) {
    const wide_int scaled = checked_mul(num.raw_, pow10(places));
    const wide_int result = round_div(scaled, den.raw_, mode);
    return from_raw(narrow(checked_mul(result, pow10(kPlaces - places))));
}

Decimal Decimal::mul_div(const Decimal& a, const Decimal& b, const Decimal& c,
                         int places, Rounding mode) {
    const wide_int numerator = checked_mul(checked_mul(a.raw_, b.raw_), pow10(places));
    const wide_int denominator = checked_mul(c.raw_, kScale);
    const wide_int result = round_div(numerator, denominator, mode);
    return from_raw(narrow(checked_mul(result, pow10(kPlaces - places))));
}

Decimal Decimal::product(const Decimal& a, const Decimal& b, int places, Rounding mode) {
    const wide_int numerator = checked_mul(a.raw_, b.raw_);
    const wide_int denominator = static_cast<wide_int>(kScale) * pow10(kPlaces - places);
    const wide_int result = round_div(numerator, denominator, mode);
    return from_raw(narrow(checked_mul(result, pow10(kPlaces - places))));
}

Decimal Decimal::rounded(int places, Rounding mode) const {
    const int64_t step = pow10(kPlaces - places);
    return from_raw(narrow(checked_mul(round_div(raw_, step, mode), step)));
}

Decimal Decimal::abs() const {
    return raw_ < 0 ? -*this : *this;
}

std::string Decimal::to_string(int places) const {
    const int64_t value = rounded(places, Rounding::HalfUp).raw_;
    const uint64_t magnitude = value < 0
        ? static_cast<uint64_t>(-(value + 1)) + 1
        : static_cast<uint64_t>(value);

    std::string result = value < 0 ? "-" : "";
    result += std::to_string(magnitude / kScale);
    if (places > 0) {
        std::string digits = std::to_string((magnitude % kScale) / static_cast<uint64_t>(pow10(kPlaces - places)));
        result += '.';
        result += std::string(static_cast<std::size_t>(places) - digits.size(), '0');
        result += digits;
    }
    return result;
}

std::string Decimal::to_string() const {
    std::string text = to_string(kPlaces);
    while (!text.empty() && text.back() == '0') {
        text.pop_back();
    }
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return text;
}

Decimal Decimal::operator-() const {
    if (raw_ == std::numeric_limits<int64_t>::min()) {
        throw std::overflow_error("Decimal overflow");
    }
    return from_raw(-raw_);
}

Decimal& Decimal::operator+=(const Decimal& other) {
    if ((other.raw_ > 0 && raw_ > std::numeric_limits<int64_t>::max() - other.raw_) ||
        (other.raw_ < 0 && raw_ < std::numeric_limits<int64_t>::min() - other.raw_)) {
        throw std::overflow_error("Decimal overflow");
    }
    raw_ += other.raw_;
    return *this;
}

Decimal& Decimal::operator-=(const Decimal& other) {
    return *this += -other;
}

std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.to_string();
}

} // namespace costbook
