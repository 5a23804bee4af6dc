#include "costbook/owner_loan.hpp"

#include "costbook/flex_parser.hpp"
#include "costbook/util.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace costbook {

std::vector<OwnerLoanMovement> OwnerLoanReader::read_file(const std::filesystem::path& path) const {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw IngestError("Cannot open owner's loan ledger " + path.string(), 0);
    }
    auto movements = read(input);
    std::cout << "[Ingest] Owner's loan: " << movements.size() << " movements from "
              << path.string() << std::endl;
    return movements;
}

std::vector<OwnerLoanMovement> OwnerLoanReader::read(std::istream& input) const {
    std::vector<OwnerLoanMovement> movements;
    std::string line;
    long line_number = 0;

    while (std::getline(input, line)) {
        ++line_number;
        if (line_number == 1) {
            line = strip_bom(line);
        }
        if (trim(line).empty() || trim(line)[0] == '#') {
            continue;
        }

        const auto fields = split_csv_line(line);
        if (fields.size() < 3) {
            throw IngestError("Owner's loan line needs date,amount,direction", line_number);
        }

        const auto date = parse_date(fields[0]);
        if (!date) {
            if (movements.empty() && to_lower_copy(fields[0]) == "date") {
                continue;   // header
            }
            throw IngestError("Invalid owner's loan date '" + fields[0] + "'", line_number);
        }

        OwnerLoanMovement movement;
        movement.date = *date;
        movement.source = SourceRef{kSection, line_number};

        try {
            movement.amount = Decimal::parse(fields[1]).abs();
        } catch (const std::exception& ex) {
            throw IngestError("Invalid owner's loan amount '" + fields[1] + "': " + ex.what(), line_number);
        }

        const auto direction = to_lower_copy(fields[2]);
        if (direction == "in" || direction == "received") {
            movement.direction = LoanDirection::Received;
        } else if (direction == "out" || direction == "returned") {
            movement.direction = LoanDirection::Returned;
        } else {
            throw IngestError("Owner's loan direction must be 'in' or 'out', got '" + fields[2] + "'",
                              line_number);
        }

        if (movement.amount.is_zero()) {
            std::cerr << "[Ingest] Skipping zero owner's loan movement at line " << line_number << std::endl;
            continue;
        }
        movements.push_back(std::move(movement));
    }

    return movements;
}

} // namespace costbook
