#pragma once

#include "costbook/calendar.hpp"
#include "costbook/decimal.hpp"
#include "costbook/transaction.hpp"
#include "rates/rate_source.hpp"

#include <atomic>
#include <map>
#include <stdexcept>
#include <string>

namespace costbook::testing {

// In-memory month tables. Months that were never added fail like an
// unreachable upstream.
class FakeRateSource : public rates::RateSource {
public:
    FakeRateSource& add(int year, int month, const std::string& currency, const std::string& rate) {
        months_[Period{year, month}][currency] = Decimal::parse(rate);
        return *this;
    }

    rates::RateTable fetch_month(const Period& period) const override {
        ++calls_;
        const auto it = months_.find(period);
        if (it == months_.end()) {
            throw std::runtime_error("no rates published for " + period.to_string());
        }
        return it->second;
    }

    [[nodiscard]] std::string describe() const override { return "fake"; }

    [[nodiscard]] int calls() const { return calls_.load(); }

private:
    std::map<Period, rates::RateTable> months_;
    mutable std::atomic<int> calls_{0};
};

inline Trade make_trade(const std::string& date,
                        const std::string& symbol,
                        Direction direction,
                        const std::string& quantity,
                        const std::string& gross,
                        const std::string& commission = "0",
                        const std::string& currency = "GBP",
                        InstrumentClass instrument_class = InstrumentClass::Equity) {
    Trade trade;
    trade.date = *parse_date(date);
    trade.symbol = symbol;
    trade.instrument_class = instrument_class;
    trade.direction = direction;
    trade.quantity = Decimal::parse(quantity);
    trade.gross = Decimal::parse(gross);
    trade.transaction_cost = Decimal::parse(commission);
    trade.currency = currency;
    trade.source = SourceRef{"TRNT", 0};
    return trade;
}

inline Trade buy(const std::string& date, const std::string& symbol, const std::string& quantity,
                 const std::string& gross, const std::string& commission = "0",
                 const std::string& currency = "GBP",
                 InstrumentClass instrument_class = InstrumentClass::Equity) {
    return make_trade(date, symbol, Direction::Acquisition, quantity, gross, commission, currency,
                      instrument_class);
}

inline Trade sell(const std::string& date, const std::string& symbol, const std::string& quantity,
                  const std::string& gross, const std::string& commission = "0",
                  const std::string& currency = "GBP",
                  InstrumentClass instrument_class = InstrumentClass::Equity) {
    return make_trade(date, symbol, Direction::Disposal, quantity, gross, commission, currency,
                      instrument_class);
}

inline CashMovement make_cash(const std::string& date, const std::string& type,
                              const std::string& amount, const std::string& currency = "GBP") {
    CashMovement movement;
    movement.date = *parse_date(date);
    movement.type = type;
    movement.kind = classify_cash_type(type);
    movement.amount = Decimal::parse(amount);
    movement.currency = currency;
    movement.source = SourceRef{"CTRN", 0};
    return movement;
}

inline Decimal dec(const std::string& text) {
    return Decimal::parse(text);
}

} // namespace costbook::testing
