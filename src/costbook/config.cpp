#include "costbook/config.hpp"

#include "costbook/util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace costbook {

namespace {

std::optional<std::string> env_value(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    auto text = trim(value);
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

std::string currency_code(const char* name, const std::string& text) {
    const auto code = to_upper_copy(text);
    if (code.size() != 3) {
        throw ConfigError(std::string(name) + " must be a three-letter currency code, got '" + text + "'");
    }
    return code;
}

} // namespace

void load_env_file(const std::string& path) {
    std::ifstream env_file(path);
    if (!env_file.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(env_file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        const auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        auto key = trim(line.substr(0, pos));
        auto value = trim(line.substr(pos + 1));

        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (!key.empty()) {
            setenv(key.c_str(), value.c_str(), 1);
        }
    }
}

Date parse_period_end(const std::string& text) {
    const auto date = parse_date(text);
    if (!date) {
        throw ConfigError("Invalid period end '" + text + "'");
    }
    return *date;
}

AppConfig load_config_from_env() {
    AppConfig config;

    if (const auto value = env_value("COSTBOOK_REPORTING_CURRENCY")) {
        config.reporting_currency = currency_code("COSTBOOK_REPORTING_CURRENCY", *value);
    }
    if (const auto value = env_value("COSTBOOK_PRIMARY_FOREIGN_CURRENCY")) {
        config.primary_foreign_currency = currency_code("COSTBOOK_PRIMARY_FOREIGN_CURRENCY", *value);
    }
    if (config.primary_foreign_currency == config.reporting_currency) {
        throw ConfigError("Primary foreign currency must differ from the reporting currency");
    }

    if (const auto value = env_value("COSTBOOK_RATE_URL")) {
        config.rate_url = *value;
    }
    if (const auto value = env_value("COSTBOOK_RATE_DIR")) {
        config.rate_directory = *value;
    }

    if (const auto value = env_value("COSTBOOK_HTTP_TIMEOUT_MS")) {
        char* end = nullptr;
        const long timeout = std::strtol(value->c_str(), &end, 10);
        if (end == value->c_str() || *end != '\0' || timeout <= 0) {
            throw ConfigError("COSTBOOK_HTTP_TIMEOUT_MS must be a positive integer, got '" + *value + "'");
        }
        config.http_timeout_ms = timeout;
    }

    if (const auto value = env_value("COSTBOOK_COST_POLICY")) {
        const auto policy = parse_cost_policy(*value);
        if (!policy) {
            throw ConfigError("COSTBOOK_COST_POLICY must be 'capitalise' or 'expense', got '" + *value + "'");
        }
        config.cost_policy = *policy;
    }

    if (const auto value = env_value("COSTBOOK_PERIOD_END")) {
        config.period_end = parse_period_end(*value);
    }
    if (const auto value = env_value("COSTBOOK_OWNER_LOAN")) {
        config.owner_loan_file = *value;
    }
    if (const auto value = env_value("COSTBOOK_OUTPUT_DIR")) {
        config.output_directory = *value;
    }

    if (const auto value = env_value("COSTBOOK_BALANCE_TOLERANCE")) {
        try {
            config.balance_tolerance = Decimal::parse(*value);
        } catch (const std::exception& ex) {
            throw ConfigError("COSTBOOK_BALANCE_TOLERANCE is not a number: " + std::string(ex.what()));
        }
        if (config.balance_tolerance.is_negative()) {
            throw ConfigError("COSTBOOK_BALANCE_TOLERANCE must not be negative");
        }
    }

    std::cout << "[Config] Reporting " << config.reporting_currency
              << ", primary foreign " << config.primary_foreign_currency
              << ", cost policy " << to_string(config.cost_policy)
              << ", period end " << (config.period_end ? config.period_end->to_string() : "none")
              << std::endl;

    return config;
}

} // namespace costbook
