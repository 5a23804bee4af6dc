#pragma once

#include "costbook/calendar.hpp"
#include "costbook/decimal.hpp"
#include "costbook/journal.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace costbook {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct AppConfig {
    std::string reporting_currency = "GBP";
    std::string primary_foreign_currency = "USD";
    std::string rate_url;                      // empty selects the HMRC template
    std::filesystem::path rate_directory;      // non-empty switches to offline rates
    long http_timeout_ms = 30000;
    CostPolicy cost_policy = CostPolicy::Capitalise;
    std::optional<Date> period_end;
    std::filesystem::path owner_loan_file;
    std::filesystem::path output_directory = "output";
    Decimal balance_tolerance = Decimal::parse("0.01");
};

// KEY=VALUE lines, '#' comments, optional double quotes. Existing variables
// are overwritten. A missing file is not an error.
void load_env_file(const std::string& path);

// Reads COSTBOOK_* variables on top of the defaults. Throws ConfigError.
AppConfig load_config_from_env();

// Throws ConfigError when the text is not a date.
Date parse_period_end(const std::string& text);

} // namespace costbook
