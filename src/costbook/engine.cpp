#include "costbook/engine.hpp"

#include "rates/rate_provider.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace costbook {

namespace {

template <typename Record>
std::size_t drop_after(std::vector<Record>& records, const Date& period_end) {
    const auto before = records.size();
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [&](const Record& record) { return record.date > period_end; }),
                  records.end());
    return before - records.size();
}

} // namespace

std::string to_string(RunStatus status) {
    return status == RunStatus::Balanced ? "BALANCED" : "UNBALANCED";
}

int exit_code(RunStatus status) {
    return status == RunStatus::Balanced ? 0 : 2;
}

std::shared_ptr<const rates::RateSource> make_rate_source(const AppConfig& config) {
    if (!config.rate_directory.empty()) {
        return std::make_shared<rates::DirectoryRateSource>(config.rate_directory);
    }
    const std::string url = config.rate_url.empty() ? rates::kDefaultRateUrl : config.rate_url;
    return std::make_shared<rates::HttpRateSource>(url, config.http_timeout_ms);
}

Engine::Engine(AppConfig config,
               std::shared_ptr<const rates::RateSource> rate_source,
               InstrumentPolicyTable policies)
    : config_(std::move(config)),
      rate_source_(std::move(rate_source)),
      policies_(std::move(policies)) {
    if (!rate_source_) {
        throw std::invalid_argument("Engine requires a rate source");
    }
}

void Engine::apply_period_end(IngestResult& ingest,
                              std::vector<OwnerLoanMovement>& owner_loan,
                              PeriodFilter& excluded) const {
    if (!config_.period_end) {
        return;
    }
    const auto& end = *config_.period_end;
    excluded.trades = drop_after(ingest.trades, end);
    excluded.cash_movements = drop_after(ingest.cash_movements, end);
    excluded.owner_loan_movements = drop_after(owner_loan, end);
    if (excluded.total() > 0) {
        std::cout << "[Engine] Period end " << end.to_string() << ": excluded "
                  << excluded.trades << " trades, " << excluded.cash_movements << " cash movements, "
                  << excluded.owner_loan_movements << " owner's loan movements" << std::endl;
    }
}

RunResult Engine::run(IngestResult ingest, std::vector<OwnerLoanMovement> owner_loan) const {
    RunResult result;
    result.reporting_currency = config_.reporting_currency;
    result.cost_policy = config_.cost_policy;
    result.period_end = config_.period_end;

    apply_period_end(ingest, owner_loan, result.excluded);
    ingest.trades = order_for_matching(std::move(ingest.trades));
    ingest.cash_movements = order_by_date(std::move(ingest.cash_movements));
    std::stable_sort(owner_loan.begin(), owner_loan.end(),
                     [](const OwnerLoanMovement& a, const OwnerLoanMovement& b) { return a.date < b.date; });

    const ChartOfAccounts chart{config_.reporting_currency, config_.primary_foreign_currency};
    const rates::RateProvider rate_provider{rate_source_, config_.reporting_currency};
    LotLedger ledger;
    Journal journal{chart, policies_, rate_provider, ledger, config_.cost_policy};

    std::cout << "[Engine] Posting " << ingest.trades.size() << " trades, "
              << ingest.cash_movements.size() << " cash movements, "
              << owner_loan.size() << " owner's loan movements using rates from "
              << rate_source_->describe() << std::endl;

    for (const auto& trade : ingest.trades) {
        journal.post_trade(trade);
    }
    for (const auto& movement : ingest.cash_movements) {
        journal.post_cash_movement(movement);
    }
    for (const auto& movement : owner_loan) {
        journal.post_owner_loan(movement);
    }

    TrialBalance trial_balance{chart, config_.balance_tolerance};
    trial_balance.add(journal.entries());

    result.status = trial_balance.balanced() ? RunStatus::Balanced : RunStatus::Unbalanced;
    result.balances = trial_balance.accounts();
    result.total_debits = trial_balance.total_debits();
    result.total_credits = trial_balance.total_credits();
    result.difference = trial_balance.difference();
    result.tolerance = trial_balance.tolerance();
    result.profit_for_period = trial_balance.profit_for_period();
    result.investments_balance = trial_balance.balance_of(Account::InvestmentsAtCost);

    result.holdings = TrialBalance::build_holdings(ledger, policies_, ingest.positions);
    result.shortfalls = ledger.shortfalls();
    result.rate_fetches = rate_provider.fetch_count();
    result.journal = journal.entries();
    result.owner_loan_movements = owner_loan.size();
    result.ingest = std::move(ingest);

    if (!result.ingest.corporate_actions.empty()) {
        std::cerr << "[Engine] " << result.ingest.corporate_actions.size()
                  << " corporate actions were not posted; review them manually" << std::endl;
    }

    std::cout << "[Engine] " << result.journal.size() << " journal entries, "
              << result.rate_fetches << " rate fetches, status " << to_string(result.status)
              << std::endl;
    if (result.status == RunStatus::Unbalanced) {
        std::cerr << "[Engine] Trial balance does not balance: difference "
                  << result.difference.to_string(2) << std::endl;
    }

    return result;
}

} // namespace costbook
