#include "costbook/flex_parser.hpp"

#include "support/fake_rate_source.hpp"

#include <catch2/catch.hpp>

#include <sstream>
#include <string>

using namespace costbook;
using costbook::testing::buy;
using costbook::testing::dec;
using costbook::testing::sell;

namespace {

IngestResult parse_text(const std::string& text) {
    std::istringstream input(text);
    return FlexParser{}.parse(input);
}

const char* kExport =
    "\xEF\xBB\xBF\"BOF\",\"U1234567\",\"Activity\"\n"
    "\"HEADER\",\"TRNT\",\"AssetClass\",\"Symbol\",\"Description\",\"TradeDate\",\"Buy/Sell\",\"Quantity\",\"Proceeds\",\"IBCommission\",\"CurrencyPrimary\"\n"
    "\"DATA\",\"TRNT\",\"STK\",\"AAPL\",\"APPLE INC\",\"20250403\",\"BUY\",\"10\",\"-1,500.00\",\"-1.00\",\"USD\"\n"
    "\"DATA\",\"TRNT\",\"OPT\",\"AAPL 250620C200\",\"AAPL CALL\",\"20250404\",\"SELL\",\"-1\",\"250\",\"-0.65\",\"USD\"\n"
    "\"DATA\",\"TRNT\",\"CASH\",\"GBP.USD\",\"FX\",\"20250405\",\"BOT\",\"1000\",\"-1260.40\",\"\",\"USD\"\n"
    "\"DATA\",\"TRNT\",\"\",\"MSFT\",\"NO CLASS\",\"20250406\",\"BUY\",\"1\",\"-400\",\"0\",\"USD\"\n"
    "\"DATA\",\"TRNT\",\"BOND\",\"T 4 28\",\"UNSUPPORTED\",\"20250406\",\"BUY\",\"1\",\"-990\",\"0\",\"USD\"\n"
    "\"DATA\",\"TRNT\",\"STK\",\"VOD\",\"BAD SIDE\",\"20250406\",\"HOLD\",\"1\",\"-1\",\"0\",\"GBP\"\n"
    "\"DATA\",\"TRNT\",\"STK\",\"VOD\",\"BAD DATE\",\"notadate\",\"BUY\",\"1\",\"-1\",\"0\",\"GBP\"\n"
    "\"HEADER\",\"CTRN\",\"Type\",\"Symbol\",\"Description\",\"Date/Time\",\"Amount\",\"CurrencyPrimary\"\n"
    "\"DATA\",\"CTRN\",\"Dividends\",\"AAPL\",\"AAPL CASH DIVIDEND\",\"20250415;000000\",\"2.50\",\"USD\"\n"
    "\"DATA\",\"CTRN\",\"Withholding Tax\",\"AAPL\",\"US TAX\",\"20250415\",\"-0.38\",\"USD\"\n"
    "\"DATA\",\"CTRN\",\"Broker Interest Received\",\"\",\"CREDIT INT\",\"20250430\",\"1.10\",\"GBP\"\n"
    "\"DATA\",\"CTRN\",\"Deposits/Withdrawals\",\"\",\"DEPOSIT\",\"20250401\",\"5000\",\"GBP\"\n"
    "\"DATA\",\"CTRN\",\"Bonus Credit\",\"\",\"PROMO\",\"20250402\",\"3\",\"GBP\"\n"
    "\"DATA\",\"CTRN\",\"Other Fees\",\"\",\"ZERO\",\"20250402\",\"0\",\"GBP\"\n"
    "\"HEADER\",\"POST\",\"AssetClass\",\"Symbol\",\"Quantity\",\"CostBasisMoney\",\"CurrencyPrimary\"\n"
    "\"DATA\",\"POST\",\"STK\",\"AAPL\",\"10\",\"1501\",\"USD\"\n"
    "\"HEADER\",\"CORP\",\"Symbol\",\"Description\",\"Date/Time\",\"Quantity\",\"Amount\",\"CurrencyPrimary\"\n"
    "\"DATA\",\"CORP\",\"XYZ\",\"XYZ SPLIT 2 FOR 1\",\"20250420\",\"10\",\"0\",\"USD\"\n"
    "\"HEADER\",\"STFU\",\"Whatever\"\n"
    "\"DATA\",\"STFU\",\"1\"\n"
    "\"DATA\",\"STFU\",\"2\"\n"
    "\"EOF\",\"U1234567\"\n";

} // namespace

TEST_CASE("FlexParser routes rows by their own section code") {
    const auto result = parse_text(kExport);

    REQUIRE(result.trades.size() == 3);
    const auto& stock = result.trades[0];
    CHECK(stock.symbol == "AAPL");
    CHECK(stock.instrument_class == InstrumentClass::Equity);
    CHECK(stock.direction == Direction::Acquisition);
    CHECK(stock.date == Date{2025, 4, 3});
    CHECK(stock.quantity == dec("10"));
    CHECK(stock.gross == dec("1500"));
    CHECK(stock.transaction_cost == dec("1"));
    CHECK(stock.currency == "USD");
    CHECK(stock.source.section == "TRNT");
    CHECK(stock.source.line == 3);

    const auto& option = result.trades[1];
    CHECK(option.instrument_class == InstrumentClass::Option);
    CHECK(option.direction == Direction::Disposal);
    CHECK(option.quantity == dec("1"));

    const auto& fx = result.trades[2];
    CHECK(fx.instrument_class == InstrumentClass::CurrencyConversion);
    CHECK(fx.direction == Direction::Acquisition);
    CHECK(fx.transaction_cost.is_zero());

    REQUIRE(result.cash_movements.size() == 5);
    CHECK(result.cash_movements[0].kind == CashKind::Dividend);
    CHECK(result.cash_movements[0].date == Date{2025, 4, 15});
    CHECK(result.cash_movements[1].kind == CashKind::WithholdingTax);
    CHECK(result.cash_movements[1].amount == dec("-0.38"));
    CHECK(result.cash_movements[2].kind == CashKind::Interest);
    CHECK(result.cash_movements[3].kind == CashKind::CapitalMovement);
    CHECK(result.cash_movements[4].kind == CashKind::Other);

    REQUIRE(result.positions.size() == 1);
    CHECK(result.positions[0].instrument_class == InstrumentClass::Equity);
    REQUIRE(result.corporate_actions.size() == 1);
    CHECK(result.corporate_actions[0].symbol == "XYZ");
}

TEST_CASE("FlexParser skips bad rows and drops unrecognized sections") {
    const auto result = parse_text(kExport);

    // no class, unsupported class, bad side, bad date, zero cash, two STFU rows
    CHECK(result.skipped_rows == 7);
    REQUIRE(result.unrecognized_sections.size() == 1);
    CHECK(result.unrecognized_sections[0] == "STFU");

    const auto counts = result.trade_counts();
    CHECK(counts.at(InstrumentClass::Equity) == 1);
    CHECK(counts.at(InstrumentClass::Option) == 1);
    CHECK(counts.at(InstrumentClass::CurrencyConversion) == 1);
}

TEST_CASE("FlexParser treats structural problems as fatal") {
    SECTION("data before header") {
        CHECK_THROWS_AS(parse_text("\"DATA\",\"TRNT\",\"STK\"\n"), IngestError);
    }
    SECTION("unknown row marker") {
        CHECK_THROWS_AS(parse_text("\"HEADER\",\"TRNT\",\"Symbol\"\n\"ROW\",\"TRNT\",\"X\"\n"), IngestError);
    }
    SECTION("missing section code") {
        CHECK_THROWS_AS(parse_text("\"HEADER\"\n"), IngestError);
    }
    SECTION("no trades section") {
        CHECK_THROWS_AS(parse_text("\"HEADER\",\"CTRN\",\"Type\"\n"), IngestError);
    }
    SECTION("error carries the line number") {
        try {
            parse_text("\"HEADER\",\"TRNT\",\"Symbol\"\n\n\"DATA\",\"CTRN\",\"x\"\n");
            FAIL("expected IngestError");
        } catch (const IngestError& ex) {
            CHECK(ex.line() == 3);
        }
    }
}

TEST_CASE("Section codes map to a closed set") {
    CHECK(section_kind("TRNT") == SectionKind::Trades);
    CHECK(section_kind("Trades") == SectionKind::Trades);
    CHECK(section_kind("CTRN") == SectionKind::CashTransactions);
    CHECK(section_kind("POST") == SectionKind::OpenPositions);
    CHECK(section_kind("CORP") == SectionKind::CorporateActions);
    CHECK(section_kind("TRNTX") == SectionKind::Unrecognized);
    CHECK(section_kind("trnt") == SectionKind::Unrecognized);
}

TEST_CASE("Cash types are classified by keyword in priority order") {
    CHECK(classify_cash_type("Withholding Tax") == CashKind::WithholdingTax);
    CHECK(classify_cash_type("Withholding Tax on Dividends") == CashKind::WithholdingTax);
    CHECK(classify_cash_type("Foreign Tax") == CashKind::WithholdingTax);
    CHECK(classify_cash_type("Dividend Tax Reclaim") == CashKind::Dividend);
    CHECK(classify_cash_type("Dividends (Tax Exempt)") == CashKind::Dividend);
    CHECK(classify_cash_type("Payment In Lieu Of Dividends") == CashKind::Dividend);
    CHECK(classify_cash_type("Broker Interest Paid") == CashKind::Interest);
    CHECK(classify_cash_type("Other Fees") == CashKind::Fee);
    CHECK(classify_cash_type("Commission Adjustments") == CashKind::Fee);
    CHECK(classify_cash_type("Deposits/Withdrawals") == CashKind::CapitalMovement);
    CHECK(classify_cash_type("Internal Transfer") == CashKind::CapitalMovement);
    CHECK(classify_cash_type("Bonus") == CashKind::Other);
}

TEST_CASE("Matching order puts same-day acquisitions before disposals") {
    std::vector<Trade> trades = {
        sell("2025-04-02", "AAPL", "5", "600"),
        buy("2025-04-02", "AAPL", "5", "500"),
        buy("2025-04-01", "MSFT", "1", "300"),
        sell("2025-04-02", "MSFT", "1", "310"),
        buy("2025-04-02", "TSLA", "2", "400"),
    };
    trades[0].source.line = 1;
    trades[1].source.line = 2;
    trades[2].source.line = 3;
    trades[3].source.line = 4;
    trades[4].source.line = 5;

    const auto ordered = order_for_matching(trades);
    REQUIRE(ordered.size() == 5);
    CHECK(ordered[0].source.line == 3);
    CHECK(ordered[1].source.line == 2);
    CHECK(ordered[2].source.line == 5);
    CHECK(ordered[3].source.line == 1);
    CHECK(ordered[4].source.line == 4);
}
