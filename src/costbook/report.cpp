#include "costbook/report.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace costbook {

namespace {

constexpr int kMoneyPlaces = 2;

std::string money(const Decimal& value) {
    return value.to_string(kMoneyPlaces);
}

std::string account_type_name(AccountType type) {
    switch (type) {
        case AccountType::Asset: return "asset";
        case AccountType::Liability: return "liability";
        case AccountType::Equity: return "equity";
        case AccountType::Income: return "income";
        case AccountType::Expense: return "expense";
    }
    return "asset";
}

std::string sha256_hex(const std::vector<std::string>& lines) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialise SHA-256 digest");
    }
    for (const auto& line : lines) {
        if (EVP_DigestUpdate(ctx.get(), line.data(), line.size()) != 1 ||
            EVP_DigestUpdate(ctx.get(), "\n", 1) != 1) {
            throw std::runtime_error("Failed to update SHA-256 digest");
        }
    }

    unsigned char buffer[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), buffer, &len) != 1) {
        throw std::runtime_error("Failed to finalise SHA-256 digest");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(buffer[i]);
    }
    return oss.str();
}

std::vector<std::string> canonical_lines(const std::vector<JournalEntry>& entries) {
    std::vector<std::string> lines;
    lines.reserve(entries.size());
    for (const auto& entry : entries) {
        lines.push_back(to_json(entry).dump());
    }
    return lines;
}

} // namespace

nlohmann::json to_json(const JournalEntry& entry) {
    nlohmann::json json;
    json["date"] = entry.date.to_string();
    json["memo"] = entry.memo;
    json["source"] = entry.source.to_string();

    nlohmann::json postings = nlohmann::json::array();
    for (const auto& posting : entry.postings) {
        nlohmann::json line;
        line["account"] = code(posting.account);
        line["side"] = to_string(posting.side);
        line["amount"] = money(posting.amount);
        postings.push_back(std::move(line));
    }
    json["postings"] = std::move(postings);
    return json;
}

std::string journal_digest(const std::vector<JournalEntry>& entries) {
    return sha256_hex(canonical_lines(entries));
}

nlohmann::json to_json(const RunResult& result, const std::string& journal_digest) {
    nlohmann::json json;
    json["status"] = to_string(result.status);
    json["reporting_currency"] = result.reporting_currency;
    json["cost_policy"] = to_string(result.cost_policy);
    json["period_end"] = result.period_end ? nlohmann::json(result.period_end->to_string()) : nlohmann::json();

    json["total_debits"] = money(result.total_debits);
    json["total_credits"] = money(result.total_credits);
    json["difference"] = money(result.difference);
    json["tolerance"] = money(result.tolerance);
    json["profit_for_period"] = money(result.profit_for_period);

    nlohmann::json accounts = nlohmann::json::array();
    for (const auto& balance : result.balances) {
        if (!balance.active()) {
            continue;
        }
        nlohmann::json row;
        row["code"] = code(balance.info.account);
        row["name"] = balance.info.name;
        row["type"] = account_type_name(balance.info.type);
        row["debit"] = money(balance.debit);
        row["credit"] = money(balance.credit);
        row["balance"] = money(balance.balance());
        accounts.push_back(std::move(row));
    }
    json["accounts"] = std::move(accounts);

    nlohmann::json holdings = nlohmann::json::array();
    for (const auto& holding : result.holdings.holdings) {
        nlohmann::json row;
        row["symbol"] = holding.symbol;
        row["class"] = to_string(holding.instrument_class);
        row["quantity"] = holding.quantity.to_string();
        row["cost"] = money(holding.cost);
        row["average_cost"] = holding.average_cost.to_string(TrialBalance::kAverageCostPlaces);
        row["lots"] = holding.lots;
        row["shortfall_history"] = holding.shortfall_history;
        row["broker_mismatch"] = holding.broker_mismatch;
        row["broker_quantity"] = holding.broker_quantity
                                 ? nlohmann::json(holding.broker_quantity->to_string())
                                 : nlohmann::json();
        holdings.push_back(std::move(row));
    }

    nlohmann::json unmatched = nlohmann::json::array();
    for (const auto& position : result.holdings.unmatched_positions) {
        unmatched.push_back({
            {"symbol", position.symbol},
            {"quantity", position.quantity.to_string()},
            {"cost_basis", money(position.cost_basis)},
            {"currency", position.currency},
            {"source", position.source.to_string()},
        });
    }

    json["holdings"] = {
        {"positions", std::move(holdings)},
        {"total_cost", money(result.holdings.total_cost)},
        {"excluded_lot_cost", money(result.holdings.excluded_lot_cost)},
        {"investments_balance", money(result.investments_balance)},
        {"unmatched_positions", std::move(unmatched)},
    };

    nlohmann::json shortfalls = nlohmann::json::array();
    for (const auto& shortfall : result.shortfalls) {
        shortfalls.push_back({
            {"symbol", shortfall.symbol},
            {"class", to_string(shortfall.instrument_class)},
            {"date", shortfall.date.to_string()},
            {"quantity", shortfall.quantity.to_string()},
            {"source", shortfall.source.to_string()},
        });
    }
    json["shortfalls"] = std::move(shortfalls);

    nlohmann::json corporate_actions = nlohmann::json::array();
    for (const auto& action : result.ingest.corporate_actions) {
        corporate_actions.push_back({
            {"date", action.date.to_string()},
            {"symbol", action.symbol},
            {"description", action.description},
            {"quantity", action.quantity.to_string()},
            {"amount", money(action.amount)},
            {"currency", action.currency},
            {"source", action.source.to_string()},
        });
    }
    json["unposted_corporate_actions"] = std::move(corporate_actions);

    nlohmann::json trade_counts = nlohmann::json::object();
    for (const auto& [instrument_class, count] : result.ingest.trade_counts()) {
        trade_counts[to_string(instrument_class)] = count;
    }
    json["ingestion"] = {
        {"trades", trade_counts},
        {"cash_movements", result.ingest.cash_movements.size()},
        {"positions", result.ingest.positions.size()},
        {"corporate_actions", result.ingest.corporate_actions.size()},
        {"owner_loan_movements", result.owner_loan_movements},
        {"skipped_rows", result.ingest.skipped_rows},
        {"unrecognized_sections", result.ingest.unrecognized_sections},
        {"excluded_after_period_end", result.excluded.total()},
        {"rate_fetches", result.rate_fetches},
    };

    json["journal_entries"] = result.journal.size();
    json["journal_digest"] = journal_digest;
    return json;
}

ReportWriter::ReportWriter(std::filesystem::path output_directory)
    : output_directory_(std::move(output_directory)) {
    if (output_directory_.empty()) {
        throw std::invalid_argument("ReportWriter output directory not set");
    }
}

void ReportWriter::ensure_directory() const {
    if (!std::filesystem::exists(output_directory_)) {
        std::filesystem::create_directories(output_directory_);
    }
}

ReportPaths ReportWriter::write(const RunResult& result) const {
    ensure_directory();

    ReportPaths paths;
    paths.trial_balance = output_directory_ / "trial_balance.json";
    paths.journal = output_directory_ / "journal.jsonl";

    const auto lines = canonical_lines(result.journal);
    paths.journal_digest = sha256_hex(lines);

    std::ofstream journal(paths.journal, std::ios::trunc);
    if (!journal.good()) {
        throw std::runtime_error("Failed to write journal at " + paths.journal.string());
    }
    for (const auto& line : lines) {
        journal << line << '\n';
    }

    std::ofstream report(paths.trial_balance, std::ios::trunc);
    if (!report.good()) {
        throw std::runtime_error("Failed to write trial balance at " + paths.trial_balance.string());
    }
    report << to_json(result, paths.journal_digest).dump(2) << '\n';

    std::cout << "[Report] Wrote " << paths.trial_balance.string() << " and "
              << paths.journal.string() << " (digest " << paths.journal_digest << ")" << std::endl;
    return paths;
}

void print_summary(std::ostream& os, const RunResult& result) {
    const std::string rule(78, '=');
    os << rule << '\n'
       << "TRIAL BALANCE (" << result.reporting_currency << ", historical cost)";
    if (result.period_end) {
        os << " to " << result.period_end->to_string();
    }
    os << '\n' << rule << '\n';
    os << std::left << std::setw(6) << "Code" << std::setw(30) << "Account"
       << std::right << std::setw(14) << "DR" << std::setw(14) << "CR"
       << std::setw(14) << "Balance" << '\n';
    os << std::string(78, '-') << '\n';

    // Gross postings per account, so the columns foot to the journal totals.
    for (const auto& balance : result.balances) {
        if (!balance.active()) {
            continue;
        }
        os << std::left << std::setw(6) << code(balance.info.account)
           << std::setw(30) << balance.info.name.substr(0, 29)
           << std::right << std::setw(14) << money(balance.debit)
           << std::setw(14) << money(balance.credit)
           << std::setw(14) << money(balance.balance()) << '\n';
    }

    os << std::string(78, '-') << '\n';
    os << std::left << std::setw(36) << "TOTAL"
       << std::right << std::setw(14) << money(result.total_debits)
       << std::setw(14) << money(result.total_credits)
       << std::setw(14) << money(result.difference) << '\n';
    os << "Difference: " << money(result.difference) << "  Status: " << to_string(result.status) << '\n';
    os << "Profit for period (not posted): " << money(result.profit_for_period) << '\n';
    os << "Investments at cost: " << money(result.investments_balance)
       << " = holdings " << money(result.holdings.total_cost)
       << " + excluded classes " << money(result.holdings.excluded_lot_cost) << '\n';

    if (!result.shortfalls.empty()) {
        os << "Zero-cost shortfall disposals: " << result.shortfalls.size() << '\n';
    }
    if (!result.holdings.unmatched_positions.empty()) {
        os << "Broker positions without open lots: " << result.holdings.unmatched_positions.size() << '\n';
    }
    os << rule << std::endl;
}

} // namespace costbook
