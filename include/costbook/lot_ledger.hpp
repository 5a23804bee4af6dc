#pragma once

#include "costbook/calendar.hpp"
#include "costbook/decimal.hpp"
#include "costbook/transaction.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <string>
#include <tuple>
#include <vector>

namespace costbook {

struct LotKey {
    std::string symbol;
    InstrumentClass instrument_class = InstrumentClass::Equity;

    friend bool operator<(const LotKey& a, const LotKey& b) {
        return std::tie(a.symbol, a.instrument_class) < std::tie(b.symbol, b.instrument_class);
    }
};

struct Lot {
    std::string symbol;
    InstrumentClass instrument_class = InstrumentClass::Equity;
    Date acquired;
    Decimal quantity;   // remaining
    Decimal cost;       // remaining, reporting currency
    SourceRef origin;
};

// Disposed quantity not backed by any open lot; matched at zero cost.
struct Shortfall {
    std::string symbol;
    InstrumentClass instrument_class = InstrumentClass::Equity;
    Date date;
    Decimal quantity;
    SourceRef source;
};

struct DisposalResult {
    Decimal cost;                // cost of lots consumed, reporting currency
    Decimal matched_quantity;
    Decimal shortfall_quantity;
    std::size_t lots_consumed = 0;

    [[nodiscard]] bool has_shortfall() const { return shortfall_quantity.is_positive(); }
};

// FIFO queues of open acquisition lots, one per (symbol, instrument class).
// Lots are never shared between keys, so a roll from one instrument into
// another leaves an open lot on the first key and an unbacked disposal on
// the second.
class LotLedger {
public:
    static constexpr int kCostPlaces = 2;

    void acquire(const Trade& trade, const Decimal& cost);
    DisposalResult dispose(const Trade& trade);

    // Non-empty lots, ordered by key then acquisition order.
    [[nodiscard]] std::vector<Lot> open_lots() const;
    [[nodiscard]] Decimal open_quantity(const LotKey& key) const;
    [[nodiscard]] const std::vector<Shortfall>& shortfalls() const noexcept { return shortfalls_; }

private:
    std::map<LotKey, std::deque<Lot>> queues_;
    std::vector<Shortfall> shortfalls_;
};

} // namespace costbook
