#pragma once

#include "costbook/transaction.hpp"

#include <filesystem>
#include <iosfwd>
#include <vector>

namespace costbook {

// Pre-classified secondary ledger, one movement per line:
//   date,amount,direction
//   2025-04-03,1500.00,in
// A header line is optional. Malformed lines throw IngestError.
class OwnerLoanReader {
public:
    static constexpr const char* kSection = "LOAN";

    std::vector<OwnerLoanMovement> read_file(const std::filesystem::path& path) const;
    std::vector<OwnerLoanMovement> read(std::istream& input) const;
};

} // namespace costbook
