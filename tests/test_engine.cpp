#include "costbook/engine.hpp"

#include "costbook/report.hpp"
#include "support/fake_rate_source.hpp"

#include <catch2/catch.hpp>

#include <memory>
#include <sstream>

using namespace costbook;
using costbook::testing::FakeRateSource;
using costbook::testing::dec;

namespace {

const char* kActivity =
    "\"HEADER\",\"TRNT\",\"AssetClass\",\"Symbol\",\"TradeDate\",\"Buy/Sell\",\"Quantity\",\"Proceeds\",\"IBCommission\",\"CurrencyPrimary\"\n"
    "\"DATA\",\"TRNT\",\"STK\",\"AAPL\",\"20250402\",\"BUY\",\"10\",\"-1000\",\"-1\",\"USD\"\n"
    "\"DATA\",\"TRNT\",\"STK\",\"AAPL\",\"20250410\",\"SELL\",\"-4\",\"500\",\"-1\",\"USD\"\n"
    "\"DATA\",\"TRNT\",\"STK\",\"DAY\",\"20250411\",\"SELL\",\"-5\",\"80\",\"0\",\"GBP\"\n"
    "\"DATA\",\"TRNT\",\"STK\",\"DAY\",\"20250411\",\"BUY\",\"5\",\"-50\",\"0\",\"GBP\"\n"
    "\"DATA\",\"TRNT\",\"CASH\",\"GBP.USD\",\"20250412\",\"BUY\",\"1000\",\"-1250\",\"0\",\"USD\"\n"
    "\"DATA\",\"TRNT\",\"OPT\",\"AAPL 250620C200\",\"20250414\",\"SELL\",\"-1\",\"120\",\"-0.65\",\"USD\"\n"
    "\"DATA\",\"TRNT\",\"STK\",\"LATE\",\"20250520\",\"BUY\",\"1\",\"-10\",\"0\",\"GBP\"\n"
    "\"HEADER\",\"CTRN\",\"Type\",\"Symbol\",\"Date\",\"Amount\",\"CurrencyPrimary\"\n"
    "\"DATA\",\"CTRN\",\"Deposits/Withdrawals\",\"\",\"20250401\",\"10000\",\"GBP\"\n"
    "\"DATA\",\"CTRN\",\"Dividends\",\"AAPL\",\"20250425\",\"2.50\",\"USD\"\n"
    "\"DATA\",\"CTRN\",\"Withholding Tax\",\"AAPL\",\"20250425\",\"-0.38\",\"USD\"\n"
    "\"HEADER\",\"POST\",\"AssetClass\",\"Symbol\",\"Quantity\"\n"
    "\"DATA\",\"POST\",\"STK\",\"AAPL\",\"6\"\n"
    "\"DATA\",\"POST\",\"CASH\",\"GBP.USD\",\"1000\"\n";

IngestResult ingest(const char* text = kActivity) {
    std::istringstream input(text);
    return FlexParser{}.parse(input);
}

std::shared_ptr<FakeRateSource> april_rates() {
    auto source = std::make_shared<FakeRateSource>();
    source->add(2025, 4, "USD", "1.25");
    return source;
}

AppConfig config_to_april() {
    AppConfig config;
    config.period_end = Date{2025, 4, 30};
    return config;
}

} // namespace

TEST_CASE("A complete run balances and reconciles investments") {
    const auto source = april_rates();
    const Engine engine{config_to_april(), source};

    std::vector<OwnerLoanMovement> loan(1);
    loan[0].date = Date{2025, 4, 5};
    loan[0].amount = dec("250");

    const auto result = engine.run(ingest(), loan);

    CHECK(result.status == RunStatus::Balanced);
    CHECK(exit_code(result.status) == 0);
    CHECK(result.total_debits == result.total_credits);
    CHECK(result.difference.is_zero());
    CHECK(result.excluded.trades == 1);
    CHECK(result.owner_loan_movements == 1);
    CHECK(source->calls() == 1);
    CHECK(result.rate_fetches == 1);

    Decimal sum;
    for (const auto& balance : result.balances) {
        sum += balance.balance();
    }
    CHECK(sum.is_zero());

    CHECK(result.investments_balance == result.holdings.total_cost + result.holdings.excluded_lot_cost);
    CHECK(result.holdings.excluded_lot_cost == dec("1000"));
}

TEST_CASE("Currency conversion lots never reach the holdings schedule") {
    const Engine engine{config_to_april(), april_rates()};
    const auto result = engine.run(ingest());

    for (const auto& holding : result.holdings.holdings) {
        CHECK(holding.instrument_class != InstrumentClass::CurrencyConversion);
        CHECK(holding.symbol != "GBP.USD");
    }
    REQUIRE(result.holdings.holdings.size() == 1);
    CHECK(result.holdings.holdings[0].symbol == "AAPL");
    CHECK(result.holdings.holdings[0].quantity == dec("6"));
    CHECK_FALSE(result.holdings.holdings[0].broker_mismatch);
    CHECK(result.holdings.unmatched_positions.empty());
}

TEST_CASE("Same-day round trip and option shortfall are reported") {
    const Engine engine{config_to_april(), april_rates()};
    const auto result = engine.run(ingest());

    REQUIRE(result.shortfalls.size() == 1);
    CHECK(result.shortfalls[0].symbol == "AAPL 250620C200");
    CHECK(result.shortfalls[0].instrument_class == InstrumentClass::Option);
    for (const auto& shortfall : result.shortfalls) {
        CHECK(shortfall.symbol != "DAY");
    }
}

TEST_CASE("Identical input gives identical journal and balances") {
    const Engine engine{config_to_april(), april_rates()};
    const auto first = engine.run(ingest());
    const auto second = engine.run(ingest());

    CHECK(journal_digest(first.journal) == journal_digest(second.journal));
    REQUIRE(first.balances.size() == second.balances.size());
    for (std::size_t i = 0; i < first.balances.size(); ++i) {
        CHECK(first.balances[i].debit == second.balances[i].debit);
        CHECK(first.balances[i].credit == second.balances[i].credit);
    }
}

TEST_CASE("Without a period end later months need rates") {
    AppConfig config;
    const Engine engine{config, april_rates()};
    CHECK_NOTHROW(engine.run(ingest()));

    const char* may_usd =
        "\"HEADER\",\"TRNT\",\"AssetClass\",\"Symbol\",\"TradeDate\",\"Buy/Sell\",\"Quantity\",\"Proceeds\",\"CurrencyPrimary\"\n"
        "\"DATA\",\"TRNT\",\"STK\",\"MSFT\",\"20250502\",\"BUY\",\"1\",\"-400\",\"USD\"\n";
    CHECK_THROWS_AS(engine.run(ingest(may_usd)), rates::RateUnavailable);
}

TEST_CASE("Run status maps to exit codes") {
    CHECK(exit_code(RunStatus::Balanced) == 0);
    CHECK(exit_code(RunStatus::Unbalanced) == 2);
    CHECK(to_string(RunStatus::Unbalanced) == "UNBALANCED");
}
