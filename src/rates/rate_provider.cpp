#include "rates/rate_provider.hpp"

#include "costbook/util.hpp"

#include <iostream>
#include <utility>

namespace rates {

RateUnavailable::RateUnavailable(std::string currency, costbook::Period period, const std::string& reason)
    : std::runtime_error("No rate for " + currency + " in " + period.to_string() + ": " + reason),
      currency_(std::move(currency)),
      period_(period) {}

RateProvider::RateProvider(std::shared_ptr<const RateSource> source, std::string reporting_currency)
    : source_(std::move(source)),
      reporting_currency_(costbook::to_upper_copy(std::move(reporting_currency))) {
    if (!source_) {
        throw std::invalid_argument("RateProvider requires a rate source");
    }
}

const RateTable& RateProvider::month_table(const costbook::Period& period, const std::string& currency) const {
    const auto cached = cache_.find(period);
    if (cached != cache_.end()) {
        return cached->second;
    }

    const auto failed = failed_.find(period);
    if (failed != failed_.end()) {
        throw RateUnavailable(currency, period, failed->second);
    }

    ++fetch_count_;
    try {
        auto table = source_->fetch_month(period);
        return cache_.emplace(period, std::move(table)).first->second;
    } catch (const std::exception& ex) {
        std::cerr << "[Rates] Failed to load " << period.to_string()
                  << " from " << source_->describe() << ": " << ex.what() << std::endl;
        failed_.emplace(period, ex.what());
        throw RateUnavailable(currency, period, ex.what());
    }
}

costbook::Decimal RateProvider::rate(const std::string& currency, const costbook::Date& date) const {
    const auto code = costbook::to_upper_copy(currency);
    if (code == reporting_currency_) {
        return costbook::Decimal(1);
    }

    std::lock_guard<std::mutex> lock(cache_mutex_);
    const auto& table = month_table(date.period(), code);
    const auto entry = table.find(code);
    if (entry == table.end()) {
        throw RateUnavailable(code, date.period(), "currency not published for month");
    }
    if (!entry->second.is_positive()) {
        throw RateUnavailable(code, date.period(), "non-positive rate " + entry->second.to_string());
    }
    return entry->second;
}

costbook::Decimal RateProvider::to_reporting(const costbook::Decimal& amount,
                                             const std::string& currency,
                                             const costbook::Date& date) const {
    return costbook::Decimal::quotient(amount, rate(currency, date),
                                       kReportingPlaces, costbook::Rounding::HalfUp);
}

costbook::Decimal RateProvider::from_reporting(const costbook::Decimal& amount,
                                               const std::string& currency,
                                               const costbook::Date& date) const {
    return costbook::Decimal::product(amount, rate(currency, date),
                                      kReportingPlaces, costbook::Rounding::HalfUp);
}

std::size_t RateProvider::fetch_count() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return fetch_count_;
}

} // namespace rates
