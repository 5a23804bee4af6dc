#include "costbook/flex_parser.hpp"

#include "costbook/util.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <set>

namespace costbook {

namespace {

const std::set<std::string> kEnvelopeMarkers = {"BOF", "EOF", "BOA", "EOA", "BOS", "EOS"};

// Empty and "--" mean zero in the export.
Decimal parse_amount(const std::string& text) {
    const auto value = trim(text);
    if (value.empty() || value == "--") {
        return Decimal{};
    }
    return Decimal::parse(value);
}

void warn_skip(const char* what, long line, const std::string& reason) {
    std::cerr << "[Ingest] Skipping " << what << " at line " << line << ": " << reason << std::endl;
}

} // namespace

SectionKind section_kind(const std::string& section_code) {
    if (section_code == "TRNT" || section_code == "Trades") {
        return SectionKind::Trades;
    }
    if (section_code == "CTRN" || section_code == "CashTransactions") {
        return SectionKind::CashTransactions;
    }
    if (section_code == "POST" || section_code == "OpenPositions") {
        return SectionKind::OpenPositions;
    }
    if (section_code == "CORP" || section_code == "CorporateActions") {
        return SectionKind::CorporateActions;
    }
    return SectionKind::Unrecognized;
}

std::string to_string(SectionKind kind) {
    switch (kind) {
        case SectionKind::Trades: return "trades";
        case SectionKind::CashTransactions: return "cash transactions";
        case SectionKind::OpenPositions: return "open positions";
        case SectionKind::CorporateActions: return "corporate actions";
        case SectionKind::Unrecognized: return "unrecognized";
    }
    return "unrecognized";
}

std::map<InstrumentClass, std::size_t> IngestResult::trade_counts() const {
    std::map<InstrumentClass, std::size_t> counts;
    for (const auto& trade : trades) {
        ++counts[trade.instrument_class];
    }
    return counts;
}

FlexParser::Row::Row(const SectionHeader& header, const std::vector<std::string>& fields, long line)
    : header_(header), fields_(fields), line_(line) {}

std::string FlexParser::Row::get(std::initializer_list<const char*> names) const {
    for (const char* name : names) {
        const auto it = header_.columns.find(name);
        if (it == header_.columns.end() || it->second >= fields_.size()) {
            continue;
        }
        if (!fields_[it->second].empty()) {
            return fields_[it->second];
        }
    }
    return {};
}

IngestResult FlexParser::parse_file(const std::filesystem::path& path) const {
    std::ifstream input(path);
    if (!input.good()) {
        throw IngestError("Cannot open activity export " + path.string(), 0);
    }
    return parse(input);
}

IngestResult FlexParser::parse(std::istream& input) const {
    IngestResult result;
    std::map<std::string, SectionHeader> headers;
    std::set<std::string> reported_sections;

    std::string line;
    long line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        if (line_number == 1) {
            line = strip_bom(line);
        }
        if (trim(line).empty()) {
            continue;
        }

        const auto fields = split_csv_line(line);
        const auto marker = to_upper_copy(fields[0]);
        if (kEnvelopeMarkers.count(marker) != 0) {
            continue;
        }
        if (marker != "HEADER" && marker != "DATA") {
            throw IngestError("Unknown row marker '" + fields[0] + "'", line_number);
        }
        if (fields.size() < 2 || fields[1].empty()) {
            throw IngestError("Row has no section code", line_number);
        }

        const auto& code = fields[1];
        const auto kind = section_kind(code);

        if (kind == SectionKind::Unrecognized) {
            if (reported_sections.insert(code).second) {
                std::cerr << "[Ingest] Dropping unrecognized section '" << code << "'" << std::endl;
                result.unrecognized_sections.push_back(code);
            }
            if (marker == "DATA") {
                ++result.skipped_rows;
            }
            continue;
        }

        if (marker == "HEADER") {
            SectionHeader header;
            header.code = code;
            for (std::size_t i = 2; i < fields.size(); ++i) {
                header.columns.emplace(fields[i], i);
            }
            headers[code] = std::move(header);
            continue;
        }

        const auto header = headers.find(code);
        if (header == headers.end()) {
            throw IngestError("DATA row for section '" + code + "' before its HEADER", line_number);
        }

        const Row row(header->second, fields, line_number);
        try {
            dispatch(kind, row, result);
        } catch (const std::invalid_argument& ex) {
            warn_skip("row", line_number, ex.what());
            ++result.skipped_rows;
        } catch (const std::overflow_error& ex) {
            warn_skip("row", line_number, ex.what());
            ++result.skipped_rows;
        }
    }

    const bool has_trades = std::any_of(headers.begin(), headers.end(), [](const auto& entry) {
        return section_kind(entry.first) == SectionKind::Trades;
    });
    if (!has_trades) {
        throw IngestError("Export has no trades section header", 0);
    }

    std::cout << "[Ingest] Parsed " << result.trades.size() << " trades, "
              << result.cash_movements.size() << " cash transactions, "
              << result.positions.size() << " positions, "
              << result.corporate_actions.size() << " corporate actions ("
              << result.skipped_rows << " rows skipped)" << std::endl;
    return result;
}

void FlexParser::dispatch(SectionKind kind, const Row& row, IngestResult& result) {
    switch (kind) {
        case SectionKind::Trades:
            if (auto trade = parse_trade(row)) {
                result.trades.push_back(std::move(*trade));
            } else {
                ++result.skipped_rows;
            }
            return;
        case SectionKind::CashTransactions:
            if (auto movement = parse_cash_movement(row)) {
                result.cash_movements.push_back(std::move(*movement));
            } else {
                ++result.skipped_rows;
            }
            return;
        case SectionKind::OpenPositions:
            if (auto position = parse_position(row)) {
                result.positions.push_back(std::move(*position));
            } else {
                ++result.skipped_rows;
            }
            return;
        case SectionKind::CorporateActions:
            if (auto action = parse_corporate_action(row)) {
                result.corporate_actions.push_back(std::move(*action));
            } else {
                ++result.skipped_rows;
            }
            return;
        case SectionKind::Unrecognized:
            ++result.skipped_rows;
            return;
    }
}

std::optional<Trade> FlexParser::parse_trade(const Row& row) {
    const auto date_text = row.get({"TradeDate", "Trade Date", "DateTime", "Date/Time", "Date"});
    const auto date = parse_date(date_text);
    if (!date) {
        warn_skip("trade", row.line(), "unparseable date '" + date_text + "'");
        return std::nullopt;
    }

    Trade trade;
    trade.date = *date;
    trade.symbol = row.get({"Symbol", "symbol"});
    if (trade.symbol.empty()) {
        warn_skip("trade", row.line(), "no symbol");
        return std::nullopt;
    }

    const auto class_tag = row.get({"AssetClass", "assetClass"});
    const auto instrument_class = parse_instrument_class(class_tag);
    if (!instrument_class) {
        warn_skip("trade", row.line(), class_tag.empty()
                                           ? "no asset class tag"
                                           : "unsupported asset class '" + class_tag + "'");
        return std::nullopt;
    }
    trade.instrument_class = *instrument_class;

    const auto side = row.get({"Buy/Sell", "BuySell", "Side"});
    const auto direction = parse_direction(side);
    if (!direction) {
        warn_skip("trade", row.line(), "unresolved buy/sell '" + side + "'");
        return std::nullopt;
    }
    trade.direction = *direction;

    trade.quantity = parse_amount(row.get({"Quantity", "quantity"})).abs();
    if (trade.quantity.is_zero()) {
        warn_skip("trade", row.line(), "zero quantity");
        return std::nullopt;
    }

    trade.description = row.get({"Description", "description"});
    trade.gross = parse_amount(row.get({"Proceeds", "proceeds"})).abs();
    trade.transaction_cost = parse_amount(row.get({"IBCommission", "Commission", "commission"})).abs();
    trade.currency = to_upper_copy(row.get({"CurrencyPrimary", "Currency", "currency"}));
    if (trade.currency.empty()) {
        warn_skip("trade", row.line(), "no currency");
        return std::nullopt;
    }
    trade.source = row.source();
    return trade;
}

std::optional<CashMovement> FlexParser::parse_cash_movement(const Row& row) {
    const auto date_text = row.get({"Date", "DateTime", "Date/Time", "SettleDate", "ReportDate"});
    const auto date = parse_date(date_text);
    if (!date) {
        warn_skip("cash transaction", row.line(), "unparseable date '" + date_text + "'");
        return std::nullopt;
    }

    CashMovement movement;
    movement.date = *date;
    movement.amount = parse_amount(row.get({"Amount", "amount"}));
    if (movement.amount.is_zero()) {
        warn_skip("cash transaction", row.line(), "zero amount");
        return std::nullopt;
    }

    movement.type = row.get({"Type", "type"});
    movement.kind = classify_cash_type(movement.type);
    movement.symbol = row.get({"Symbol", "symbol"});
    movement.description = row.get({"Description", "description"});
    movement.currency = to_upper_copy(row.get({"CurrencyPrimary", "Currency", "currency"}));
    if (movement.currency.empty()) {
        warn_skip("cash transaction", row.line(), "no currency");
        return std::nullopt;
    }
    movement.source = row.source();
    return movement;
}

std::optional<PositionSnapshot> FlexParser::parse_position(const Row& row) {
    PositionSnapshot position;
    position.symbol = row.get({"Symbol", "symbol"});
    position.quantity = parse_amount(row.get({"Quantity", "Position"}));
    if (position.symbol.empty() || position.quantity.is_zero()) {
        warn_skip("position", row.line(), "no symbol or zero quantity");
        return std::nullopt;
    }
    position.instrument_class = parse_instrument_class(row.get({"AssetClass", "assetClass"}));
    position.cost_basis = parse_amount(row.get({"CostBasisMoney", "CostBasis"}));
    position.currency = to_upper_copy(row.get({"CurrencyPrimary", "Currency"}));
    position.source = row.source();
    return position;
}

std::optional<CorporateAction> FlexParser::parse_corporate_action(const Row& row) {
    const auto date_text = row.get({"Date/Time", "DateTime", "ReportDate", "Date"});
    const auto date = parse_date(date_text);
    if (!date) {
        warn_skip("corporate action", row.line(), "unparseable date '" + date_text + "'");
        return std::nullopt;
    }

    CorporateAction action;
    action.date = *date;
    action.symbol = row.get({"Symbol", "symbol"});
    action.description = row.get({"Description", "ActionDescription"});
    action.quantity = parse_amount(row.get({"Quantity", "quantity"}));
    action.amount = parse_amount(row.get({"Amount", "Proceeds"}));
    action.currency = to_upper_copy(row.get({"CurrencyPrimary", "Currency"}));
    action.source = row.source();
    return action;
}

std::vector<Trade> order_for_matching(std::vector<Trade> trades) {
    std::stable_sort(trades.begin(), trades.end(), [](const Trade& a, const Trade& b) {
        if (a.date != b.date) {
            return a.date < b.date;
        }
        return a.is_acquisition() && !b.is_acquisition();
    });
    return trades;
}

std::vector<CashMovement> order_by_date(std::vector<CashMovement> movements) {
    std::stable_sort(movements.begin(), movements.end(), [](const CashMovement& a, const CashMovement& b) {
        return a.date < b.date;
    });
    return movements;
}

} // namespace costbook
