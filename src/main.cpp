#include "costbook/config.hpp"
#include "costbook/engine.hpp"
#include "costbook/flex_parser.hpp"
#include "costbook/owner_loan.hpp"
#include "costbook/report.hpp"
#include "rates/rate_provider.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr int kExitAborted = 1;

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <flex_query.csv> [period-end]" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        print_usage(argv[0]);
        return kExitAborted;
    }

    try {
        costbook::load_env_file(".env");
        auto config = costbook::load_config_from_env();
        if (argc == 3) {
            config.period_end = costbook::parse_period_end(argv[2]);
        }

        const costbook::FlexParser parser;
        auto ingest = parser.parse_file(argv[1]);

        std::vector<costbook::OwnerLoanMovement> owner_loan;
        if (!config.owner_loan_file.empty()) {
            owner_loan = costbook::OwnerLoanReader{}.read_file(config.owner_loan_file);
        }

        const auto rate_source = costbook::make_rate_source(config);
        const costbook::Engine engine{config, rate_source};
        const auto result = engine.run(std::move(ingest), std::move(owner_loan));

        costbook::print_summary(std::cout, result);
        costbook::ReportWriter{config.output_directory}.write(result);

        return costbook::exit_code(result.status);
    } catch (const rates::RateUnavailable& ex) {
        std::cerr << "[Engine] Aborted, no exchange rate: " << ex.what() << std::endl;
    } catch (const costbook::IngestError& ex) {
        std::cerr << "[Engine] Aborted, cannot read input: " << ex.what() << std::endl;
    } catch (const costbook::ConfigError& ex) {
        std::cerr << "[Engine] Aborted, bad configuration: " << ex.what() << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "[Engine] Aborted: " << ex.what() << std::endl;
    }
    return kExitAborted;
}
