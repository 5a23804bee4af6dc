#pragma once

#include "costbook/chart_of_accounts.hpp"
#include "costbook/transaction.hpp"

#include <map>

namespace costbook {

// How a class of instrument is accounted for. Adding a class means adding a
// row here; the journal and the holdings schedule only read the table.
struct InstrumentPolicy {
    Account gain_account;
    Account loss_account;
    bool in_holdings_schedule;
};

class InstrumentPolicyTable {
public:
    InstrumentPolicyTable();
    explicit InstrumentPolicyTable(std::map<InstrumentClass, InstrumentPolicy> policies);

    // Throws std::out_of_range for a class with no row.
    [[nodiscard]] const InstrumentPolicy& policy(InstrumentClass instrument_class) const;

private:
    std::map<InstrumentClass, InstrumentPolicy> policies_;
};

} // namespace costbook
