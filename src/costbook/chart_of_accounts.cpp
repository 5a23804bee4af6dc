#include "costbook/chart_of_accounts.hpp"

#include "costbook/util.hpp"

#include <stdexcept>
#include <utility>

namespace costbook {

std::string to_string(Side side) {
    return side == Side::Debit ? "DR" : "CR";
}

ChartOfAccounts::ChartOfAccounts(std::string reporting_currency, std::string primary_foreign_currency)
    : reporting_currency_(to_upper_copy(std::move(reporting_currency))),
      primary_foreign_currency_(to_upper_copy(std::move(primary_foreign_currency))) {
    if (reporting_currency_ == primary_foreign_currency_) {
        throw std::invalid_argument("Primary foreign currency must differ from the reporting currency");
    }

    accounts_ = {
        {Account::CashReporting, "Cash at Bank - " + reporting_currency_, AccountType::Asset, Side::Debit},
        {Account::CashPrimaryForeign, "Cash at Bank - " + primary_foreign_currency_, AccountType::Asset, Side::Debit},
        {Account::CashOtherCurrency, "Cash at Bank - Other CCY", AccountType::Asset, Side::Debit},
        {Account::CashOther, "Cash at Bank - Other", AccountType::Asset, Side::Debit},
        {Account::InvestmentsAtCost, "Listed Investments at Cost", AccountType::Asset, Side::Debit},
        {Account::OwnersLoan, "Director's / Owner's Loan", AccountType::Liability, Side::Credit},
        {Account::ShareCapital, "Share Capital", AccountType::Equity, Side::Credit},
        {Account::RetainedEarnings, "Retained Earnings B/F", AccountType::Equity, Side::Credit},
        {Account::DividendIncome, "Dividend Income (Gross)", AccountType::Income, Side::Credit},
        {Account::InterestReceived, "Interest Received", AccountType::Income, Side::Credit},
        {Account::RealizedGains, "Realized Gains on Investments", AccountType::Income, Side::Credit},
        {Account::FxGains, "Foreign Exchange Gains", AccountType::Income, Side::Credit},
        {Account::WithholdingTax, "Foreign Withholding Tax", AccountType::Expense, Side::Debit},
        {Account::BrokerCommissions, "Broker Commissions", AccountType::Expense, Side::Debit},
        {Account::BrokerFees, "Broker Fees", AccountType::Expense, Side::Debit},
        {Account::RealizedLosses, "Realized Losses on Investments", AccountType::Expense, Side::Debit},
        {Account::FxLosses, "Foreign Exchange Losses", AccountType::Expense, Side::Debit},
        {Account::InterestPaid, "Interest Paid", AccountType::Expense, Side::Debit},
    };
}

const AccountInfo& ChartOfAccounts::info(Account account) const {
    for (const auto& entry : accounts_) {
        if (entry.account == account) {
            return entry;
        }
    }
    throw std::out_of_range("Account not in chart: " + std::to_string(code(account)));
}

Account ChartOfAccounts::cash_account_for(const std::string& currency) const {
    const auto value = to_upper_copy(currency);
    if (value == reporting_currency_) {
        return Account::CashReporting;
    }
    if (value == primary_foreign_currency_) {
        return Account::CashPrimaryForeign;
    }
    return Account::CashOtherCurrency;
}

} // namespace costbook
