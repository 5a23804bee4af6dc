#include "costbook/lot_ledger.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace costbook {

void LotLedger::acquire(const Trade& trade, const Decimal& cost) {
    if (!trade.is_acquisition()) {
        throw std::invalid_argument("LotLedger::acquire called with a disposal");
    }
    if (!trade.quantity.is_positive()) {
        throw std::invalid_argument("Lot quantity must be positive");
    }

    Lot lot;
    lot.symbol = trade.symbol;
    lot.instrument_class = trade.instrument_class;
    lot.acquired = trade.date;
    lot.quantity = trade.quantity;
    lot.cost = cost;
    lot.origin = trade.source;
    queues_[LotKey{trade.symbol, trade.instrument_class}].push_back(std::move(lot));
}

DisposalResult LotLedger::dispose(const Trade& trade) {
    if (trade.is_acquisition()) {
        throw std::invalid_argument("LotLedger::dispose called with an acquisition");
    }

    DisposalResult result;
    Decimal remaining = trade.quantity;
    auto& queue = queues_[LotKey{trade.symbol, trade.instrument_class}];

    while (remaining.is_positive() && !queue.empty()) {
        Lot& lot = queue.front();
        if (lot.quantity <= remaining) {
            result.cost += lot.cost;
            result.matched_quantity += lot.quantity;
            remaining -= lot.quantity;
            queue.pop_front();
        } else {
            const Decimal consumed = Decimal::mul_div(lot.cost, remaining, lot.quantity,
                                                      kCostPlaces, Rounding::HalfEven);
            result.cost += consumed;
            result.matched_quantity += remaining;
            lot.cost -= consumed;
            lot.quantity -= remaining;
            remaining = Decimal{};
        }
        ++result.lots_consumed;
    }

    if (remaining.is_positive()) {
        result.shortfall_quantity = remaining;
        shortfalls_.push_back(Shortfall{trade.symbol, trade.instrument_class, trade.date,
                                        remaining, trade.source});
        std::cerr << "[Ledger] Shortfall: " << trade.symbol << " (" << to_string(trade.instrument_class)
                  << ") disposed " << trade.quantity << " on " << trade.date.to_string()
                  << ", " << remaining << " had no open lot and is matched at zero cost" << std::endl;
    }

    return result;
}

std::vector<Lot> LotLedger::open_lots() const {
    std::vector<Lot> lots;
    for (const auto& [key, queue] : queues_) {
        for (const auto& lot : queue) {
            if (lot.quantity.is_positive()) {
                lots.push_back(lot);
            }
        }
    }
    return lots;
}

Decimal LotLedger::open_quantity(const LotKey& key) const {
    Decimal total;
    const auto it = queues_.find(key);
    if (it == queues_.end()) {
        return total;
    }
    for (const auto& lot : it->second) {
        total += lot.quantity;
    }
    return total;
}

} // namespace costbook
