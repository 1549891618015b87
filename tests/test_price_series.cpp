/**
 * @file test_price_series.cpp
 * @brief Unit tests for PriceSeries and identifier parsing
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "data/identifier.hpp"
#include "data/price_series.hpp"

#include <stdexcept>
#include <vector>

using namespace fundscope::data;
using Catch::Matchers::WithinAbs;

namespace
{
    DailyRecord record(const std::string &date, double price, double dividend = 0.0,
                       double capital_gain = 0.0, bool adjusted = false)
    {
        DailyRecord rec;
        rec.date = date;
        rec.price = price;
        rec.dividend = dividend;
        rec.capital_gain = capital_gain;
        rec.is_adjusted = adjusted;
        return rec;
    }
}

TEST_CASE("PriceSeries construction", "[PriceSeries]") {
    SECTION("Records are sorted by date") {
        PriceSeries series({record("2021-01-06", 102.0),
                            record("2021-01-04", 100.0),
                            record("2021-01-05", 101.0)},
                           "Yahoo Finance (ticker)", "2021-01-07T00:00:00Z");

        REQUIRE(series.size() == 3);
        REQUIRE(series.dates() == std::vector<std::string>{"2021-01-04", "2021-01-05", "2021-01-06"});
        REQUIRE(series.prices() == std::vector<double>{100.0, 101.0, 102.0});
        REQUIRE(series.source_name() == "Yahoo Finance (ticker)");
        REQUIRE(series.fetched_at() == "2021-01-07T00:00:00Z");
    }

    SECTION("Duplicate dates keep the last record") {
        PriceSeries series({record("2021-01-04", 100.0),
                            record("2021-01-05", 101.0),
                            record("2021-01-05", 101.5)});

        REQUIRE(series.size() == 2);
        REQUIRE(series.back().price == 101.5);
    }

    SECTION("Empty series") {
        PriceSeries series;
        REQUIRE(series.empty());
        REQUIRE_FALSE(series.is_adjusted());
        REQUIRE_THROWS_AS(series.price_return_ratio(), std::runtime_error);
    }
}

TEST_CASE("PriceSeries rejects malformed records", "[PriceSeries]") {
    SECTION("Bad date") {
        REQUIRE_THROWS_AS(PriceSeries({record("2021-02-30", 100.0)}), std::invalid_argument);
    }

    SECTION("Non-positive price") {
        REQUIRE_THROWS_AS(PriceSeries({record("2021-01-04", 0.0)}), std::invalid_argument);
        REQUIRE_THROWS_AS(PriceSeries({record("2021-01-04", -5.0)}), std::invalid_argument);
    }

    SECTION("Negative distribution") {
        REQUIRE_THROWS_AS(PriceSeries({record("2021-01-04", 100.0, -0.5)}), std::invalid_argument);
    }

    SECTION("Mixed adjustment flags") {
        REQUIRE_THROWS_AS(PriceSeries({record("2021-01-04", 100.0, 0.0, 0.0, true),
                                       record("2021-01-05", 101.0, 0.0, 0.0, false)}),
                          std::invalid_argument);
    }

    SECTION("Adjusted record with a distribution") {
        REQUIRE_THROWS_AS(PriceSeries({record("2021-01-04", 100.0, 0.5, 0.0, true)}), std::invalid_argument);
    }
}

TEST_CASE("PriceSeries distributions and adjustment", "[PriceSeries]") {
    PriceSeries series({record("2021-01-04", 100.0),
                        record("2021-01-05", 98.0, 1.5, 0.5),
                        record("2021-01-06", 99.0)});

    REQUIRE_FALSE(series.is_adjusted());
    REQUIRE(series.has_distributions());
    REQUIRE_THAT(series.total_distributions(), WithinAbs(2.0, 1e-12));
    REQUIRE_THAT(series.price_return_ratio(), WithinAbs(0.99, 1e-12));

    SECTION("mark_adjusted drops distributions") {
        series.mark_adjusted();
        REQUIRE(series.is_adjusted());
        REQUIRE_FALSE(series.has_distributions());
        for (const auto &rec : series.records()) {
            REQUIRE(rec.is_adjusted);
            REQUIRE(rec.distribution() == 0.0);
        }
    }
}

TEST_CASE("PriceSeries slicing", "[PriceSeries]") {
    PriceSeries series({record("2021-01-04", 100.0),
                        record("2021-01-05", 101.0),
                        record("2021-01-06", 102.0),
                        record("2021-01-07", 103.0)},
                       "EOD Historical Data");

    SECTION("Inclusive bounds") {
        auto sliced = series.filter_by_date("2021-01-05", "2021-01-06");
        REQUIRE(sliced.size() == 2);
        REQUIRE(sliced.front().date == "2021-01-05");
        REQUIRE(sliced.back().date == "2021-01-06");
        REQUIRE(sliced.source_name() == "EOD Historical Data");
    }

    SECTION("Open end") {
        REQUIRE(series.filter_by_date("2021-01-06").size() == 2);
        REQUIRE(series.filter_by_date("", "2021-01-04").size() == 1);
    }

    SECTION("Index lookup") {
        REQUIRE(series.index_of("2021-01-06") == std::optional<size_t>(2));
        REQUIRE_FALSE(series.index_of("2021-01-09").has_value());
    }
}

TEST_CASE("Identifier parsing", "[Identifier]") {
    SECTION("ISIN") {
        auto id = InstrumentId::parse("  ie00b4l5y983 ");
        REQUIRE(id.value == "IE00B4L5Y983");
        REQUIRE(id.is_isin());
        REQUIRE(id.country_code() == "IE");
    }

    SECTION("Ticker") {
        auto id = InstrumentId::parse("prhsx");
        REQUIRE(id.value == "PRHSX");
        REQUIRE(id.is_ticker());
        REQUIRE(id.country_code().empty());
    }

    SECTION("Neither shape") {
        REQUIRE(InstrumentId::parse("BRK.B").kind == IdentifierKind::UNKNOWN);
        REQUIRE(InstrumentId::parse("TOOLONG").kind == IdentifierKind::UNKNOWN);
        REQUIRE(InstrumentId::parse("").kind == IdentifierKind::UNKNOWN);
        REQUIRE(InstrumentId::parse("1234567890AB").kind == IdentifierKind::UNKNOWN);
    }

    SECTION("Kind names") {
        REQUIRE(to_string(IdentifierKind::ISIN) == "isin");
        REQUIRE(to_string(IdentifierKind::TICKER) == "ticker");
        REQUIRE(to_string(IdentifierKind::UNKNOWN) == "unknown");
    }
}
