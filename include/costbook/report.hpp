#pragma once

#include "costbook/engine.hpp"
#include "costbook/journal.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace costbook {

// Canonical single-line form of an entry; one line of journal.jsonl.
nlohmann::json to_json(const JournalEntry& entry);

nlohmann::json to_json(const RunResult& result, const std::string& journal_digest);

// Hex SHA-256 over the canonical journal lines, each followed by '\n'.
std::string journal_digest(const std::vector<JournalEntry>& entries);

struct ReportPaths {
    std::filesystem::path trial_balance;
    std::filesystem::path journal;
    std::string journal_digest;
};

class ReportWriter {
public:
    explicit ReportWriter(std::filesystem::path output_directory);

    // Writes trial_balance.json and journal.jsonl, replacing earlier runs.
    ReportPaths write(const RunResult& result) const;

private:
    void ensure_directory() const;

    std::filesystem::path output_directory_;
};

// Fixed-width trial balance table for the console.
void print_summary(std::ostream& os, const RunResult& result);

} // namespace costbook
