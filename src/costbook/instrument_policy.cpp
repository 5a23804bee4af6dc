#include "costbook/instrument_policy.hpp"

#include <stdexcept>
#include <utility>

namespace costbook {

InstrumentPolicyTable::InstrumentPolicyTable()
    : policies_{
          {InstrumentClass::Equity, {Account::RealizedGains, Account::RealizedLosses, true}},
          {InstrumentClass::Option, {Account::RealizedGains, Account::RealizedLosses, true}},
          // FX conversions are tracked for gain/loss only.
          {InstrumentClass::CurrencyConversion, {Account::FxGains, Account::FxLosses, false}},
          // Custodied off-broker; not a listed investment.
          {InstrumentClass::DigitalAsset, {Account::RealizedGains, Account::RealizedLosses, false}},
      } {}

InstrumentPolicyTable::InstrumentPolicyTable(std::map<InstrumentClass, InstrumentPolicy> policies)
    : policies_(std::move(policies)) {}

const InstrumentPolicy& InstrumentPolicyTable::policy(InstrumentClass instrument_class) const {
    const auto it = policies_.find(instrument_class);
    if (it == policies_.end()) {
        throw std::out_of_range("No accounting policy for instrument class " + to_string(instrument_class));
    }
    return it->second;
}

} // namespace costbook
