#pragma once

#include "costbook/calendar.hpp"
#include "costbook/decimal.hpp"
#include "rates/rate_source.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace rates {

class RateUnavailable : public std::runtime_error {
public:
    RateUnavailable(std::string currency, costbook::Period period, const std::string& reason);

    [[nodiscard]] const std::string& currency() const noexcept { return currency_; }
    [[nodiscard]] const costbook::Period& period() const noexcept { return period_; }

private:
    std::string currency_;
    costbook::Period period_;
};

// Resolves (currency, month) to a rate and converts amounts into the
// reporting currency. One upstream fetch per month for the life of the
// provider; a failed month is not retried.
class RateProvider {
public:
    static constexpr int kReportingPlaces = 2;

    RateProvider(std::shared_ptr<const RateSource> source, std::string reporting_currency = "GBP");

    RateProvider(const RateProvider&) = delete;
    RateProvider& operator=(const RateProvider&) = delete;

    // Foreign units per one reporting unit. Throws RateUnavailable.
    costbook::Decimal rate(const std::string& currency, const costbook::Date& date) const;

    // amount / rate, rounded half-up to the reporting precision.
    costbook::Decimal to_reporting(const costbook::Decimal& amount,
                                   const std::string& currency,
                                   const costbook::Date& date) const;

    // amount * rate, rounded half-up to the reporting precision.
    costbook::Decimal from_reporting(const costbook::Decimal& amount,
                                     const std::string& currency,
                                     const costbook::Date& date) const;

    [[nodiscard]] const std::string& reporting_currency() const noexcept { return reporting_currency_; }
    [[nodiscard]] std::size_t fetch_count() const;

private:
    const RateTable& month_table(const costbook::Period& period, const std::string& currency) const;

    std::shared_ptr<const RateSource> source_;
    std::string reporting_currency_;
    mutable std::map<costbook::Period, RateTable> cache_;
    mutable std::map<costbook::Period, std::string> failed_;
    mutable std::size_t fetch_count_ = 0;
    mutable std::mutex cache_mutex_;
};

} // namespace rates
