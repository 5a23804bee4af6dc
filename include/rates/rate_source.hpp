#pragma once

#include "costbook/calendar.hpp"
#include "costbook/decimal.hpp"
#include "rates/http_client.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace rates {

// Currency code -> foreign units per one reporting-currency unit.
using RateTable = std::map<std::string, costbook::Decimal>;

inline constexpr const char* kDefaultRateUrl =
    "https://www.trade-tariff.service.gov.uk/uk/api/exchange_rates/files/monthly_csv_{year}-{month}.csv";

// Upstream supplier of one month's rate table.
class RateSource {
public:
    virtual ~RateSource() = default;

    // Throws on any failure to obtain the month; never returns a partial table.
    virtual RateTable fetch_month(const costbook::Period& period) const = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};

// Parses an HMRC-style monthly CSV ("Currency Code", "Currency Units per £1").
RateTable parse_monthly_rates(const std::string& csv_text);

// "monthly_csv_2025-4.csv"; month is not zero padded.
std::string monthly_file_name(const costbook::Period& period);

class HttpRateSource : public RateSource {
public:
    explicit HttpRateSource(std::string url_template = kDefaultRateUrl,
                            long timeout_ms = 30000);

    RateTable fetch_month(const costbook::Period& period) const override;
    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] std::string url_for(const costbook::Period& period) const;
    [[nodiscard]] RequestTimings last_request_timings() const;

private:
    std::string url_template_;
    HttpClient http_client_;
    mutable RequestTimings last_timings_;
    mutable std::mutex request_mutex_;
};

// Reads monthly CSV files saved under a local directory.
class DirectoryRateSource : public RateSource {
public:
    explicit DirectoryRateSource(std::filesystem::path directory);

    RateTable fetch_month(const costbook::Period& period) const override;
    [[nodiscard]] std::string describe() const override;

private:
    std::filesystem::path directory_;
};

} // namespace rates
