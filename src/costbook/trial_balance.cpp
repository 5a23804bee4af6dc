#include "costbook/trial_balance.hpp"

#include <iostream>
#include <set>
#include <stdexcept>

namespace costbook {

TrialBalance::TrialBalance(const ChartOfAccounts& chart, Decimal tolerance)
    : chart_(chart),
      tolerance_(tolerance) {
    if (tolerance_.is_negative()) {
        throw std::invalid_argument("Balance tolerance must not be negative");
    }
    for (const auto& info : chart_.accounts()) {
        balances_.emplace(info.account, AccountBalance{info, Decimal{}, Decimal{}});
    }
}

void TrialBalance::add(const JournalEntry& entry) {
    for (const auto& posting : entry.postings) {
        const auto it = balances_.find(posting.account);
        if (it == balances_.end()) {
            throw std::out_of_range("Posting to account outside the chart: " +
                                    std::to_string(code(posting.account)));
        }
        if (posting.side == Side::Debit) {
            it->second.debit += posting.amount;
        } else {
            it->second.credit += posting.amount;
        }
    }
}

void TrialBalance::add(const std::vector<JournalEntry>& entries) {
    for (const auto& entry : entries) {
        add(entry);
    }
}

std::vector<AccountBalance> TrialBalance::accounts() const {
    std::vector<AccountBalance> result;
    result.reserve(balances_.size());
    for (const auto& info : chart_.accounts()) {
        result.push_back(balances_.at(info.account));
    }
    return result;
}

Decimal TrialBalance::balance_of(Account account) const {
    return balances_.at(account).balance();
}

Decimal TrialBalance::total_debits() const {
    Decimal total;
    for (const auto& [account, balance] : balances_) {
        total += balance.debit;
    }
    return total;
}

Decimal TrialBalance::total_credits() const {
    Decimal total;
    for (const auto& [account, balance] : balances_) {
        total += balance.credit;
    }
    return total;
}

bool TrialBalance::balanced() const {
    return difference().abs() <= tolerance_;
}

Decimal TrialBalance::profit_for_period() const {
    Decimal profit;
    for (const auto& [account, balance] : balances_) {
        if (balance.info.type == AccountType::Income || balance.info.type == AccountType::Expense) {
            profit -= balance.balance();
        }
    }
    return profit;
}

HoldingsSchedule TrialBalance::build_holdings(const LotLedger& ledger,
                                              const InstrumentPolicyTable& policies,
                                              const std::vector<PositionSnapshot>& broker_positions) {
    HoldingsSchedule schedule;

    std::set<std::string> shortfall_symbols;
    for (const auto& shortfall : ledger.shortfalls()) {
        shortfall_symbols.insert(shortfall.symbol);
    }

    std::map<std::string, Decimal> broker_quantities;
    for (const auto& position : broker_positions) {
        broker_quantities[position.symbol] += position.quantity;
    }

    std::map<std::string, Holding> by_symbol;
    for (const auto& lot : ledger.open_lots()) {
        if (!policies.policy(lot.instrument_class).in_holdings_schedule) {
            schedule.excluded_lot_cost += lot.cost;
            continue;
        }
        auto [it, inserted] = by_symbol.try_emplace(lot.symbol);
        auto& holding = it->second;
        if (inserted) {
            holding.symbol = lot.symbol;
            holding.instrument_class = lot.instrument_class;
        }
        holding.quantity += lot.quantity;
        holding.cost += lot.cost;
        ++holding.lots;
    }

    for (auto& [symbol, holding] : by_symbol) {
        holding.average_cost = Decimal::quotient(holding.cost, holding.quantity,
                                                 kAverageCostPlaces, Rounding::HalfUp);
        holding.shortfall_history = shortfall_symbols.count(symbol) != 0;

        if (!broker_positions.empty()) {
            const auto broker = broker_quantities.find(symbol);
            if (broker == broker_quantities.end()) {
                holding.broker_mismatch = true;
            } else {
                holding.broker_quantity = broker->second;
                holding.broker_mismatch = broker->second != holding.quantity;
            }
        }

        if (holding.shortfall_history || holding.broker_mismatch) {
            std::cerr << "[TrialBalance] Flagged holding " << symbol << ": qty " << holding.quantity
                      << (holding.shortfall_history ? ", had zero-cost disposals" : "")
                      << (holding.broker_mismatch ? ", differs from broker position" : "")
                      << std::endl;
        }

        schedule.total_cost += holding.cost;
        schedule.holdings.push_back(holding);
    }

    for (const auto& position : broker_positions) {
        if (by_symbol.count(position.symbol) != 0) {
            continue;
        }
        if (position.instrument_class &&
            !policies.policy(*position.instrument_class).in_holdings_schedule) {
            continue;
        }
        schedule.unmatched_positions.push_back(position);
    }

    return schedule;
}

} // namespace costbook
