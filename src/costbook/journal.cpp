#include "costbook/journal.hpp"

#include "costbook/util.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace costbook {

namespace {

Side opposite(Side side) {
    return side == Side::Debit ? Side::Credit : Side::Debit;
}

std::string describe_cash(const CashMovement& movement) {
    std::string memo = movement.type.empty() ? to_string(movement.kind) : movement.type;
    if (!movement.symbol.empty()) {
        memo += " " + movement.symbol;
    }
    if (!movement.description.empty()) {
        memo += ": " + movement.description;
    }
    return memo;
}

} // namespace

std::string to_string(CostPolicy policy) {
    return policy == CostPolicy::Capitalise ? "capitalise" : "expense";
}

std::optional<CostPolicy> parse_cost_policy(const std::string& text) {
    const auto value = to_lower_copy(trim(text));
    if (value == "capitalise" || value == "capitalize") {
        return CostPolicy::Capitalise;
    }
    if (value == "expense") {
        return CostPolicy::Expense;
    }
    return std::nullopt;
}

Decimal JournalEntry::total(Side side) const {
    Decimal sum;
    for (const auto& posting : postings) {
        if (posting.side == side) {
            sum += posting.amount;
        }
    }
    return sum;
}

Journal::Journal(const ChartOfAccounts& chart,
                 const InstrumentPolicyTable& policies,
                 const rates::RateProvider& rates,
                 LotLedger& ledger,
                 CostPolicy cost_policy)
    : chart_(chart),
      policies_(policies),
      rates_(rates),
      ledger_(ledger),
      cost_policy_(cost_policy) {}

void Journal::add_posting(JournalEntry& entry, Account account, Side side, const Decimal& amount) {
    if (amount.is_zero()) {
        return;
    }
    if (amount.is_negative()) {
        entry.postings.push_back(Posting{account, opposite(side), amount.abs()});
        return;
    }
    entry.postings.push_back(Posting{account, side, amount});
}

void Journal::append(JournalEntry entry) {
    if (entry.postings.empty()) {
        return;
    }
    if (!entry.balanced()) {
        throw std::logic_error("Unbalanced journal entry for " + entry.source.to_string() +
                               ": DR " + entry.total(Side::Debit).to_string(2) +
                               " CR " + entry.total(Side::Credit).to_string(2));
    }
    entries_.push_back(std::move(entry));
}

void Journal::post_trade(const Trade& trade) {
    if (trade.is_acquisition()) {
        post_acquisition(trade);
    } else {
        post_disposal(trade);
    }
}

void Journal::post_acquisition(const Trade& trade) {
    const auto cash = chart_.cash_account_for(trade.currency);

    JournalEntry entry;
    entry.date = trade.date;
    entry.memo = "Buy " + trade.quantity.to_string() + " " + trade.symbol;
    entry.source = trade.source;

    if (cost_policy_ == CostPolicy::Capitalise) {
        const auto cost = rates_.to_reporting(trade.gross + trade.transaction_cost, trade.currency, trade.date);
        ledger_.acquire(trade, cost);
        add_posting(entry, Account::InvestmentsAtCost, Side::Debit, cost);
        add_posting(entry, cash, Side::Credit, cost);
    } else {
        const auto cost = rates_.to_reporting(trade.gross, trade.currency, trade.date);
        const auto commission = rates_.to_reporting(trade.transaction_cost, trade.currency, trade.date);
        ledger_.acquire(trade, cost);
        add_posting(entry, Account::InvestmentsAtCost, Side::Debit, cost);
        add_posting(entry, Account::BrokerCommissions, Side::Debit, commission);
        add_posting(entry, cash, Side::Credit, cost + commission);
    }

    append(std::move(entry));
}

void Journal::post_disposal(const Trade& trade) {
    const auto cash = chart_.cash_account_for(trade.currency);
    const auto& policy = policies_.policy(trade.instrument_class);

    // Convert before touching the ledger so a missing rate leaves lots intact.
    Decimal proceeds;
    Decimal commission;
    if (cost_policy_ == CostPolicy::Capitalise) {
        proceeds = rates_.to_reporting(trade.gross - trade.transaction_cost, trade.currency, trade.date);
    } else {
        proceeds = rates_.to_reporting(trade.gross, trade.currency, trade.date);
        commission = rates_.to_reporting(trade.transaction_cost, trade.currency, trade.date);
    }

    const auto disposal = ledger_.dispose(trade);

    JournalEntry entry;
    entry.date = trade.date;
    entry.memo = "Sell " + trade.quantity.to_string() + " " + trade.symbol;
    if (disposal.has_shortfall()) {
        entry.memo += " (" + disposal.shortfall_quantity.to_string() + " unmatched, zero cost)";
    }
    entry.source = trade.source;

    add_posting(entry, cash, Side::Debit, proceeds - commission);
    add_posting(entry, Account::BrokerCommissions, Side::Debit, commission);
    add_posting(entry, Account::InvestmentsAtCost, Side::Credit, disposal.cost);

    const auto gain = proceeds - disposal.cost;
    if (gain.is_positive()) {
        add_posting(entry, policy.gain_account, Side::Credit, gain);
    } else if (gain.is_negative()) {
        add_posting(entry, policy.loss_account, Side::Debit, gain.abs());
    }

    append(std::move(entry));
}

void Journal::post_cash_movement(const CashMovement& movement) {
    const auto cash = chart_.cash_account_for(movement.currency);
    const auto amount = rates_.to_reporting(movement.amount.abs(), movement.currency, movement.date);
    const bool received = movement.is_receipt();

    Account counter = Account::BrokerFees;
    switch (movement.kind) {
        case CashKind::Dividend:
            counter = Account::DividendIncome;
            break;
        case CashKind::WithholdingTax:
            counter = Account::WithholdingTax;
            break;
        case CashKind::Interest:
            counter = received ? Account::InterestReceived : Account::InterestPaid;
            break;
        case CashKind::Fee:
            counter = Account::BrokerFees;
            break;
        case CashKind::CapitalMovement:
            counter = Account::ShareCapital;
            break;
        case CashKind::Other:
            counter = received ? Account::InterestReceived : Account::BrokerFees;
            std::cerr << "[Journal] Unclassified cash type '" << movement.type << "' at "
                      << movement.source.to_string() << " posted to "
                      << code(counter) << std::endl;
            break;
    }

    JournalEntry entry;
    entry.date = movement.date;
    entry.memo = describe_cash(movement);
    entry.source = movement.source;
    if (received) {
        add_posting(entry, cash, Side::Debit, amount);
        add_posting(entry, counter, Side::Credit, amount);
    } else {
        add_posting(entry, counter, Side::Debit, amount);
        add_posting(entry, cash, Side::Credit, amount);
    }
    append(std::move(entry));
}

void Journal::post_owner_loan(const OwnerLoanMovement& movement) {
    const auto amount = movement.amount.abs().rounded(rates::RateProvider::kReportingPlaces, Rounding::HalfUp);

    JournalEntry entry;
    entry.date = movement.date;
    entry.source = movement.source;
    if (movement.direction == LoanDirection::Received) {
        entry.memo = "Owner's loan in";
        add_posting(entry, Account::CashOther, Side::Debit, amount);
        add_posting(entry, Account::OwnersLoan, Side::Credit, amount);
    } else {
        entry.memo = "Owner's loan out";
        add_posting(entry, Account::OwnersLoan, Side::Debit, amount);
        add_posting(entry, Account::CashOther, Side::Credit, amount);
    }
    append(std::move(entry));
}

} // namespace costbook
