#pragma once

#include "costbook/calendar.hpp"
#include "costbook/decimal.hpp"

#include <optional>
#include <string>

namespace costbook {

enum class InstrumentClass { Equity, Option, CurrencyConversion, DigitalAsset };

enum class Direction { Acquisition, Disposal };

enum class CashKind { Dividend, WithholdingTax, Interest, Fee, CapitalMovement, Other };

enum class LoanDirection { Received, Returned };

// Points a derived record back at the input row it came from.
struct SourceRef {
    std::string section;   // section code as declared in the export, e.g. "TRNT"
    long line = 0;         // 1-based line number in the export

    [[nodiscard]] std::string to_string() const { return section + ":" + std::to_string(line); }
};

struct Trade {
    Date date;
    std::string symbol;
    std::string description;
    InstrumentClass instrument_class = InstrumentClass::Equity;
    Direction direction = Direction::Acquisition;
    Decimal quantity;          // magnitude, never zero
    Decimal gross;             // consideration, transaction currency, >= 0
    Decimal transaction_cost;  // commission, transaction currency, >= 0
    std::string currency;
    SourceRef source;

    [[nodiscard]] bool is_acquisition() const { return direction == Direction::Acquisition; }
};

struct CashMovement {
    Date date;
    CashKind kind = CashKind::Other;
    std::string type;          // broker's own label, kept for memos
    std::string symbol;
    std::string description;
    Decimal amount;            // positive = received
    std::string currency;
    SourceRef source;

    [[nodiscard]] bool is_receipt() const { return amount.is_positive(); }
};

struct PositionSnapshot {
    std::string symbol;
    std::optional<InstrumentClass> instrument_class;
    Decimal quantity;
    Decimal cost_basis;
    std::string currency;
    SourceRef source;
};

struct CorporateAction {
    Date date;
    std::string symbol;
    std::string description;
    Decimal quantity;
    Decimal amount;
    std::string currency;
    SourceRef source;
};

// Secondary-ledger movement, already in the reporting currency.
struct OwnerLoanMovement {
    Date date;
    Decimal amount;
    LoanDirection direction = LoanDirection::Received;
    SourceRef source;
};

std::string to_string(InstrumentClass value);
std::string to_string(Direction value);
std::string to_string(CashKind value);
std::string to_string(LoanDirection value);

// Closed mapping of broker asset-class tags (STK, OPT, CASH, CRYPTO).
std::optional<InstrumentClass> parse_instrument_class(const std::string& tag);

// BUY/BOT and SELL/SLD; anything else is unresolved.
std::optional<Direction> parse_direction(const std::string& text);

// Keyword classification of a cash-transaction type label.
CashKind classify_cash_type(const std::string& type);

} // namespace costbook
