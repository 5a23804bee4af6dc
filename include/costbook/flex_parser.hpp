#pragma once

#include "costbook/transaction.hpp"

#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <iosfwd>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace costbook {

// Every section code maps to exactly one of these. Unrecognized sections are
// reported and dropped, never routed to a neighbouring handler.
enum class SectionKind { Trades, CashTransactions, OpenPositions, CorporateActions, Unrecognized };

SectionKind section_kind(const std::string& section_code);

std::string to_string(SectionKind kind);

class IngestError : public std::runtime_error {
public:
    IngestError(const std::string& message, long line)
        : std::runtime_error(line > 0 ? "line " + std::to_string(line) + ": " + message : message),
          line_(line) {}

    [[nodiscard]] long line() const noexcept { return line_; }

private:
    long line_;
};

struct IngestResult {
    std::vector<Trade> trades;
    std::vector<CashMovement> cash_movements;
    std::vector<PositionSnapshot> positions;
    std::vector<CorporateAction> corporate_actions;
    std::vector<std::string> unrecognized_sections;
    std::size_t skipped_rows = 0;

    [[nodiscard]] std::map<InstrumentClass, std::size_t> trade_counts() const;
};

// Reads a sectioned activity export:
//   "HEADER","TRNT","TradeDate","Symbol",...
//   "DATA","TRNT","2025-04-01","AAPL",...
class FlexParser {
public:
    IngestResult parse_file(const std::filesystem::path& path) const;
    IngestResult parse(std::istream& input) const;

private:
    struct SectionHeader {
        std::string code;
        std::map<std::string, std::size_t> columns;
    };

    class Row {
    public:
        Row(const SectionHeader& header, const std::vector<std::string>& fields, long line);

        // First non-empty value among the candidate column names.
        [[nodiscard]] std::string get(std::initializer_list<const char*> names) const;
        [[nodiscard]] SourceRef source() const { return SourceRef{header_.code, line_}; }
        [[nodiscard]] long line() const noexcept { return line_; }

    private:
        const SectionHeader& header_;
        const std::vector<std::string>& fields_;
        long line_;
    };

    static std::optional<Trade> parse_trade(const Row& row);
    static std::optional<CashMovement> parse_cash_movement(const Row& row);
    static std::optional<PositionSnapshot> parse_position(const Row& row);
    static std::optional<CorporateAction> parse_corporate_action(const Row& row);

    static void dispatch(SectionKind kind, const Row& row, IngestResult& result);
};

// Global matching order: by date, acquisitions before disposals on the same
// date, otherwise input order.
std::vector<Trade> order_for_matching(std::vector<Trade> trades);

// By date, otherwise input order.
std::vector<CashMovement> order_by_date(std::vector<CashMovement> movements);

} // namespace costbook
