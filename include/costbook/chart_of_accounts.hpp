#pragma once

#include <string>
#include <vector>

namespace costbook {

enum class Account : int {
    CashReporting = 1100,
    CashPrimaryForeign = 1101,
    CashOtherCurrency = 1102,
    CashOther = 1103,
    InvestmentsAtCost = 1200,
    OwnersLoan = 2101,
    ShareCapital = 3000,
    RetainedEarnings = 3100,
    DividendIncome = 4000,
    InterestReceived = 4100,
    RealizedGains = 4200,
    FxGains = 4300,
    WithholdingTax = 5000,
    BrokerCommissions = 5100,
    BrokerFees = 5200,
    RealizedLosses = 5400,
    FxLosses = 5500,
    InterestPaid = 5600,
};

enum class Side { Debit, Credit };

enum class AccountType { Asset, Liability, Equity, Income, Expense };

struct AccountInfo {
    Account account;
    std::string name;
    AccountType type;
    Side normal_side;
};

[[nodiscard]] inline int code(Account account) { return static_cast<int>(account); }

std::string to_string(Side side);

// Fixed chart for an investment-holding company. Cash accounts are split by
// currency: reporting currency, one primary foreign currency, everything else.
class ChartOfAccounts {
public:
    ChartOfAccounts(std::string reporting_currency, std::string primary_foreign_currency);

    [[nodiscard]] const std::vector<AccountInfo>& accounts() const noexcept { return accounts_; }
    [[nodiscard]] const AccountInfo& info(Account account) const;
    [[nodiscard]] Account cash_account_for(const std::string& currency) const;

private:
    std::string reporting_currency_;
    std::string primary_foreign_currency_;
    std::vector<AccountInfo> accounts_;
};

} // namespace costbook
