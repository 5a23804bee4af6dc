#pragma once

#include "costbook/config.hpp"
#include "costbook/flex_parser.hpp"
#include "costbook/instrument_policy.hpp"
#include "costbook/journal.hpp"
#include "costbook/lot_ledger.hpp"
#include "costbook/trial_balance.hpp"
#include "rates/rate_source.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace costbook {

enum class RunStatus { Balanced, Unbalanced };

std::string to_string(RunStatus status);

// 0 balanced, 2 unbalanced. Aborted runs exit 1 from main.
int exit_code(RunStatus status);

struct PeriodFilter {
    std::size_t trades = 0;
    std::size_t cash_movements = 0;
    std::size_t owner_loan_movements = 0;

    [[nodiscard]] std::size_t total() const { return trades + cash_movements + owner_loan_movements; }
};

struct RunResult {
    RunStatus status = RunStatus::Balanced;
    std::string reporting_currency;
    CostPolicy cost_policy = CostPolicy::Capitalise;
    std::optional<Date> period_end;

    IngestResult ingest;              // after the period-end cut-off
    PeriodFilter excluded;
    std::size_t owner_loan_movements = 0;

    std::vector<JournalEntry> journal;
    std::vector<AccountBalance> balances;
    Decimal total_debits;
    Decimal total_credits;
    Decimal difference;
    Decimal tolerance;
    Decimal profit_for_period;
    Decimal investments_balance;      // account 1200

    HoldingsSchedule holdings;
    std::vector<Shortfall> shortfalls;
    std::size_t rate_fetches = 0;
};

// Chooses the offline directory when configured, HTTP otherwise.
std::shared_ptr<const rates::RateSource> make_rate_source(const AppConfig& config);

// One single-pass run: cut-off, ordering, lot matching and posting, then
// aggregation. Rate and posting failures propagate and abort the run.
class Engine {
public:
    Engine(AppConfig config,
           std::shared_ptr<const rates::RateSource> rate_source,
           InstrumentPolicyTable policies = InstrumentPolicyTable{});

    RunResult run(IngestResult ingest, std::vector<OwnerLoanMovement> owner_loan = {}) const;

    [[nodiscard]] const AppConfig& config() const noexcept { return config_; }

private:
    void apply_period_end(IngestResult& ingest,
                          std::vector<OwnerLoanMovement>& owner_loan,
                          PeriodFilter& excluded) const;

    AppConfig config_;
    std::shared_ptr<const rates::RateSource> rate_source_;
    InstrumentPolicyTable policies_;
};

} // namespace costbook
