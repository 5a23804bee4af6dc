#pragma once

#include <optional>
#include <string>
#include <tuple>

namespace costbook {

// Calendar month; the key of the exchange-rate table.
struct Period {
    int year = 0;
    int month = 0;

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const Period& a, const Period& b) {
        return a.year == b.year && a.month == b.month;
    }
    friend bool operator!=(const Period& a, const Period& b) { return !(a == b); }
    friend bool operator<(const Period& a, const Period& b) {
        return std::tie(a.year, a.month) < std::tie(b.year, b.month);
    }
};

struct Date {
    int year = 0;
    int month = 0;
    int day = 0;

    [[nodiscard]] Period period() const { return Period{year, month}; }
    [[nodiscard]] std::string to_string() const;  // YYYY-MM-DD

    friend bool operator==(const Date& a, const Date& b) {
        return a.year == b.year && a.month == b.month && a.day == b.day;
    }
    friend bool operator!=(const Date& a, const Date& b) { return !(a == b); }
    friend bool operator<(const Date& a, const Date& b) {
        return std::tie(a.year, a.month, a.day) < std::tie(b.year, b.month, b.day);
    }
    friend bool operator>(const Date& a, const Date& b) { return b < a; }
    friend bool operator<=(const Date& a, const Date& b) { return !(b < a); }
    friend bool operator>=(const Date& a, const Date& b) { return !(a < b); }
};

// Accepts YYYY-MM-DD, YYYYMMDD, DD-MM-YYYY and MM/DD/YYYY. A time-of-day
// suffix after ';', ' ' or ',' is ignored.
std::optional<Date> parse_date(const std::string& text);

bool is_valid_date(int year, int month, int day);

} // namespace costbook
