#include "costbook/transaction.hpp"

#include "costbook/util.hpp"

namespace costbook {

std::string to_string(InstrumentClass value) {
    switch (value) {
        case InstrumentClass::Equity: return "STK";
        case InstrumentClass::Option: return "OPT";
        case InstrumentClass::CurrencyConversion: return "CASH";
        case InstrumentClass::DigitalAsset: return "CRYPTO";
    }
    return "UNKNOWN";
}

std::string to_string(Direction value) {
    return value == Direction::Acquisition ? "BUY" : "SELL";
}

std::string to_string(CashKind value) {
    switch (value) {
        case CashKind::Dividend: return "dividend";
        case CashKind::WithholdingTax: return "withholding_tax";
        case CashKind::Interest: return "interest";
        case CashKind::Fee: return "fee";
        case CashKind::CapitalMovement: return "capital_movement";
        case CashKind::Other: return "other";
    }
    return "other";
}

std::string to_string(LoanDirection value) {
    return value == LoanDirection::Received ? "in" : "out";
}

std::optional<InstrumentClass> parse_instrument_class(const std::string& tag) {
    const auto value = to_upper_copy(trim(tag));
    if (value == "STK") {
        return InstrumentClass::Equity;
    }
    if (value == "OPT") {
        return InstrumentClass::Option;
    }
    if (value == "CASH") {
        return InstrumentClass::CurrencyConversion;
    }
    if (value == "CRYPTO") {
        return InstrumentClass::DigitalAsset;
    }
    return std::nullopt;
}

std::optional<Direction> parse_direction(const std::string& text) {
    const auto value = to_upper_copy(trim(text));
    if (value == "BUY" || value == "BOT") {
        return Direction::Acquisition;
    }
    if (value == "SELL" || value == "SLD") {
        return Direction::Disposal;
    }
    return std::nullopt;
}

CashKind classify_cash_type(const std::string& type) {
    const auto value = to_lower_copy(type);
    if (contains(value, "dividend") && !contains(value, "withhold")) {
        return CashKind::Dividend;
    }
    if (contains(value, "withhold") || contains(value, "tax")) {
        return CashKind::WithholdingTax;
    }
    if (contains(value, "interest")) {
        return CashKind::Interest;
    }
    if (contains(value, "fee") || contains(value, "commission")) {
        return CashKind::Fee;
    }
    if (contains(value, "deposit") || contains(value, "withdraw") || contains(value, "transfer")) {
        return CashKind::CapitalMovement;
    }
    return CashKind::Other;
}

} // namespace costbook
