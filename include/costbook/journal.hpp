#pragma once

#include "costbook/calendar.hpp"
#include "costbook/chart_of_accounts.hpp"
#include "costbook/decimal.hpp"
#include "costbook/instrument_policy.hpp"
#include "costbook/lot_ledger.hpp"
#include "costbook/transaction.hpp"
#include "rates/rate_provider.hpp"

#include <optional>
#include <string>
#include <vector>

namespace costbook {

// Treatment of commissions on trades.
//   Capitalise: added to acquisition cost, netted from disposal proceeds.
//   Expense:    posted to Broker Commissions as incurred.
enum class CostPolicy { Capitalise, Expense };

std::string to_string(CostPolicy policy);
std::optional<CostPolicy> parse_cost_policy(const std::string& text);

struct Posting {
    Account account;
    Side side;
    Decimal amount;   // reporting currency, never negative
};

struct JournalEntry {
    Date date;
    std::string memo;
    SourceRef source;
    std::vector<Posting> postings;

    [[nodiscard]] Decimal total(Side side) const;
    [[nodiscard]] bool balanced() const { return total(Side::Debit) == total(Side::Credit); }
};

// Turns each economic event into one balanced entry. Trades also move lots
// in the ledger; the ledger must be fed in matching order.
class Journal {
public:
    Journal(const ChartOfAccounts& chart,
            const InstrumentPolicyTable& policies,
            const rates::RateProvider& rates,
            LotLedger& ledger,
            CostPolicy cost_policy = CostPolicy::Capitalise);

    void post_trade(const Trade& trade);
    void post_cash_movement(const CashMovement& movement);
    void post_owner_loan(const OwnerLoanMovement& movement);

    [[nodiscard]] const std::vector<JournalEntry>& entries() const noexcept { return entries_; }
    [[nodiscard]] CostPolicy cost_policy() const noexcept { return cost_policy_; }

private:
    void post_acquisition(const Trade& trade);
    void post_disposal(const Trade& trade);
    void append(JournalEntry entry);

    // Negative amounts flip side; zero amounts are dropped.
    static void add_posting(JournalEntry& entry, Account account, Side side, const Decimal& amount);

    const ChartOfAccounts& chart_;
    const InstrumentPolicyTable& policies_;
    const rates::RateProvider& rates_;
    LotLedger& ledger_;
    CostPolicy cost_policy_;
    std::vector<JournalEntry> entries_;
};

} // namespace costbook
