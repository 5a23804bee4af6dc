#include "rates/rate_source.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using costbook::Decimal;
using costbook::Period;

namespace {

const char* kHmrcSample =
    "\xEF\xBB\xBF" "Country/Territories,Currency,Currency Code,Currency Units per \xC2\xA3" "1,Start date,End date\n"
    "United States,Dollar,USD,1.2604,01/04/2025,30/04/2025\n"
    "Eurozone,Euro,EUR,1.1954,01/04/2025,30/04/2025\n"
    "Nowhere,Nothing,XXX,,01/04/2025,30/04/2025\n"
    "Broken,Broken,BRK,n/a,01/04/2025,30/04/2025\n";

} // namespace

TEST_CASE("parse_monthly_rates reads the HMRC monthly layout") {
    const auto table = rates::parse_monthly_rates(kHmrcSample);
    REQUIRE(table.size() == 2);
    CHECK(table.at("USD") == Decimal::parse("1.2604"));
    CHECK(table.at("EUR") == Decimal::parse("1.1954"));
    CHECK(table.count("XXX") == 0);
    CHECK(table.count("BRK") == 0);
}

TEST_CASE("parse_monthly_rates accepts lower-case column names") {
    const auto table = rates::parse_monthly_rates("currency_code,rate\nusd,1.25\n");
    REQUIRE(table.size() == 1);
    CHECK(table.at("USD") == Decimal::parse("1.25"));
}

TEST_CASE("parse_monthly_rates rejects files without rate columns") {
    CHECK_THROWS_AS(rates::parse_monthly_rates("Country,Currency\nUS,Dollar\n"), std::runtime_error);
}

TEST_CASE("HttpRateSource expands the month without zero padding") {
    const rates::HttpRateSource source;
    CHECK(source.url_for(Period{2025, 4}) ==
          "https://www.trade-tariff.service.gov.uk/uk/api/exchange_rates/files/monthly_csv_2025-4.csv");
    CHECK(rates::monthly_file_name(Period{2024, 11}) == "monthly_csv_2024-11.csv");
}

TEST_CASE("DirectoryRateSource reads saved monthly files") {
    const auto dir = std::filesystem::temp_directory_path() / "costbook_rate_source_test";
    std::filesystem::create_directories(dir);
    {
        std::ofstream file(dir / rates::monthly_file_name(Period{2025, 4}));
        file << kHmrcSample;
    }

    const rates::DirectoryRateSource source{dir};
    const auto table = source.fetch_month(Period{2025, 4});
    CHECK(table.at("USD") == Decimal::parse("1.2604"));
    CHECK_THROWS(source.fetch_month(Period{2025, 5}));

    std::filesystem::remove_all(dir);
}
