#include "rates/rate_source.hpp"

#include "costbook/util.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace rates {

namespace {

int find_column(const std::vector<std::string>& header,
                const std::vector<std::string>& exact,
                const std::string& prefix) {
    for (std::size_t i = 0; i < header.size(); ++i) {
        const auto name = costbook::to_lower_copy(header[i]);
        for (const auto& candidate : exact) {
            if (name == costbook::to_lower_copy(candidate)) {
                return static_cast<int>(i);
            }
        }
        if (!prefix.empty() && name.rfind(costbook::to_lower_copy(prefix), 0) == 0) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

} // namespace

RateTable parse_monthly_rates(const std::string& csv_text) {
    std::istringstream input(costbook::strip_bom(csv_text));
    std::string line;

    std::vector<std::string> header;
    while (std::getline(input, line)) {
        if (!costbook::trim(line).empty()) {
            header = costbook::split_csv_line(line);
            break;
        }
    }

    const int code_col = find_column(header, {"Currency Code", "currency_code"}, "");
    const int rate_col = find_column(header, {"rate"}, "Currency Units per");
    if (code_col < 0 || rate_col < 0) {
        throw std::runtime_error("Rate file has no currency code / rate columns");
    }

    RateTable table;
    while (std::getline(input, line)) {
        if (costbook::trim(line).empty()) {
            continue;
        }
        const auto fields = costbook::split_csv_line(line);
        if (static_cast<int>(fields.size()) <= std::max(code_col, rate_col)) {
            continue;
        }

        const auto code = costbook::to_upper_copy(fields[static_cast<std::size_t>(code_col)]);
        const auto& rate_text = fields[static_cast<std::size_t>(rate_col)];
        if (code.empty() || rate_text.empty()) {
            continue;
        }

        try {
            table[code] = costbook::Decimal::parse(rate_text);
        } catch (const std::invalid_argument&) {
            std::cerr << "[Rates] Ignoring unparseable rate '" << rate_text
                      << "' for " << code << std::endl;
        }
    }
    return table;
}

std::string monthly_file_name(const costbook::Period& period) {
    return "monthly_csv_" + std::to_string(period.year) + "-" + std::to_string(period.month) + ".csv";
}

HttpRateSource::HttpRateSource(std::string url_template, long timeout_ms)
    : url_template_(std::move(url_template)),
      http_client_(timeout_ms),
      last_timings_{} {}

std::string HttpRateSource::url_for(const costbook::Period& period) const {
    return costbook::expand_template(url_template_, {
        {"year", std::to_string(period.year)},
        {"month", std::to_string(period.month)}
    });
}

RateTable HttpRateSource::fetch_month(const costbook::Period& period) const {
    const auto url = url_for(period);
    auto response = http_client_.get(url, {{"Accept", "text/csv"}});
    {
        std::lock_guard<std::mutex> lock(request_mutex_);
        last_timings_ = response.timings;
    }
    std::cout << "[Rates] Fetched " << period.to_string() << " from " << url
              << " total=" << response.timings.total_ms << " ms" << std::endl;
    return parse_monthly_rates(response.body);
}

std::string HttpRateSource::describe() const {
    return url_template_;
}

RequestTimings HttpRateSource::last_request_timings() const {
    std::lock_guard<std::mutex> lock(request_mutex_);
    return last_timings_;
}

DirectoryRateSource::DirectoryRateSource(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

RateTable DirectoryRateSource::fetch_month(const costbook::Period& period) const {
    const auto path = directory_ / monthly_file_name(period);
    std::ifstream input(path);
    if (!input.good()) {
        throw std::runtime_error("Rate file not found: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parse_monthly_rates(buffer.str());
}

std::string DirectoryRateSource::describe() const {
    return directory_.string();
}

} // namespace rates
