#include "costbook/calendar.hpp"

#include "costbook/util.hpp"

#include <cctype>
#include <cstdio>

namespace costbook {

namespace {

bool all_digits(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    for (unsigned char c : value) {
        if (!std::isdigit(c)) {
            return false;
        }
    }
    return true;
}

std::optional<Date> make_date(int year, int month, int day) {
    if (!is_valid_date(year, month, day)) {
        return std::nullopt;
    }
    return Date{year, month, day};
}

} // namespace

std::string Period::to_string() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d", year, month);
    return buffer;
}

std::string Date::to_string() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return buffer;
}

bool is_valid_date(int year, int month, int day) {
    if (year < 1900 || year > 9999 || month < 1 || month > 12 || day < 1) {
        return false;
    }
    static constexpr int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int limit = kDaysInMonth[month - 1];
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (month == 2 && leap) {
        limit = 29;
    }
    return day <= limit;
}

std::optional<Date> parse_date(const std::string& text) {
    std::string value = trim(text);
    const auto cut = value.find_first_of("; ,");
    if (cut != std::string::npos) {
        value = value.substr(0, cut);
    }

    // YYYYMMDD
    if (value.size() == 8 && all_digits(value)) {
        return make_date(std::stoi(value.substr(0, 4)),
                         std::stoi(value.substr(4, 2)),
                         std::stoi(value.substr(6, 2)));
    }

    if (value.size() != 10) {
        return std::nullopt;
    }

    // YYYY-MM-DD
    if (value[4] == '-' && value[7] == '-') {
        const auto y = value.substr(0, 4);
        const auto m = value.substr(5, 2);
        const auto d = value.substr(8, 2);
        if (all_digits(y) && all_digits(m) && all_digits(d)) {
            return make_date(std::stoi(y), std::stoi(m), std::stoi(d));
        }
        return std::nullopt;
    }

    // DD-MM-YYYY
    if (value[2] == '-' && value[5] == '-') {
        const auto d = value.substr(0, 2);
        const auto m = value.substr(3, 2);
        const auto y = value.substr(6, 4);
        if (all_digits(y) && all_digits(m) && all_digits(d)) {
            return make_date(std::stoi(y), std::stoi(m), std::stoi(d));
        }
        return std::nullopt;
    }

    // MM/DD/YYYY
    if (value[2] == '/' && value[5] == '/') {
        const auto m = value.substr(0, 2);
        const auto d = value.substr(3, 2);
        const auto y = value.substr(6, 4);
        if (all_digits(y) && all_digits(m) && all_digits(d)) {
            return make_date(std::stoi(y), std::stoi(m), std::stoi(d));
        }
    }

    return std::nullopt;
}

} // namespace costbook
