#pragma once

#include "costbook/chart_of_accounts.hpp"
#include "costbook/decimal.hpp"
#include "costbook/instrument_policy.hpp"
#include "costbook/journal.hpp"
#include "costbook/lot_ledger.hpp"
#include "costbook/transaction.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace costbook {

struct AccountBalance {
    AccountInfo info;
    Decimal debit;    // sum of debit postings
    Decimal credit;   // sum of credit postings

    [[nodiscard]] Decimal balance() const { return debit - credit; }
    [[nodiscard]] bool active() const { return !debit.is_zero() || !credit.is_zero(); }
};

struct Holding {
    std::string symbol;
    InstrumentClass instrument_class = InstrumentClass::Equity;
    Decimal quantity;
    Decimal cost;
    Decimal average_cost;                   // 4 dp
    std::size_t lots = 0;
    bool shortfall_history = false;         // zero-cost disposal seen; possible roll
    bool broker_mismatch = false;
    std::optional<Decimal> broker_quantity;
};

struct HoldingsSchedule {
    std::vector<Holding> holdings;
    std::vector<PositionSnapshot> unmatched_positions;   // broker positions with no open lot
    Decimal total_cost;
    Decimal excluded_lot_cost;   // open lots of classes kept off the schedule
};

// Sums postings per account. Performs no period close: income and expense
// accounts keep their natural balances.
class TrialBalance {
public:
    static constexpr int kAverageCostPlaces = 4;

    TrialBalance(const ChartOfAccounts& chart, Decimal tolerance);

    void add(const JournalEntry& entry);
    void add(const std::vector<JournalEntry>& entries);

    // Every account of the chart, in chart order.
    [[nodiscard]] std::vector<AccountBalance> accounts() const;
    [[nodiscard]] Decimal balance_of(Account account) const;

    [[nodiscard]] Decimal total_debits() const;
    [[nodiscard]] Decimal total_credits() const;
    [[nodiscard]] Decimal difference() const { return total_debits() - total_credits(); }
    [[nodiscard]] bool balanced() const;
    [[nodiscard]] const Decimal& tolerance() const noexcept { return tolerance_; }

    // Income less expenses. Reported only, never posted.
    [[nodiscard]] Decimal profit_for_period() const;

    static HoldingsSchedule build_holdings(const LotLedger& ledger,
                                           const InstrumentPolicyTable& policies,
                                           const std::vector<PositionSnapshot>& broker_positions);

private:
    const ChartOfAccounts& chart_;
    Decimal tolerance_;
    std::map<Account, AccountBalance> balances_;
};

} // namespace costbook
