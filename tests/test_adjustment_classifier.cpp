/**
 * @file test_adjustment_classifier.cpp
 * @brief Unit tests for instrument classification and price adjustment
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "adjustment/adjustment_classifier.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

using namespace fundscope::adjustment;
using Catch::Matchers::WithinAbs;

namespace
{
    const double NaN = std::numeric_limits<double>::quiet_NaN();
}

TEST_CASE("Instrument classification", "[AdjustmentClassifier]") {
    SECTION("Domestic fund ISIN with fund ticker") {
        auto cls = classify_instrument("US87281Y1029", std::string("PRHSX"));
        REQUIRE(is_domestic_adjusted(cls));
        REQUIRE(std::get<DomesticAdjustedFund>(cls).ticker == "PRHSX");
    }

    SECTION("Bare fund ticker counts as domestic") {
        REQUIRE(is_domestic_adjusted(classify_instrument("prhsx", std::nullopt)));
    }

    SECTION("Domestic ISIN without a ticker") {
        REQUIRE_FALSE(is_domestic_adjusted(classify_instrument("US87281Y1029", std::nullopt)));
    }

    SECTION("Foreign ISIN with fund-shaped ticker") {
        REQUIRE_FALSE(is_domestic_adjusted(classify_instrument("LU0274208692", std::string("ABCDX"))));
    }

    SECTION("ETF and equity tickers") {
        REQUIRE_FALSE(is_domestic_adjusted(classify_instrument("IE00B4L5Y983", std::string("IWDA"))));
        REQUIRE_FALSE(is_domestic_adjusted(classify_instrument("SPY", std::nullopt)));
        REQUIRE_FALSE(is_domestic_adjusted(classify_instrument("VTSAY", std::nullopt)));
    }

    SECTION("Custom market convention") {
        nlohmann::json j = {{"home_country", "IT"}, {"fund_ticker_length", 4}, {"fund_ticker_suffix", "F"}};
        MarketConvention convention = MarketConvention::from_json(j);

        REQUIRE(convention.is_fund_ticker("abcf"));
        REQUIRE_FALSE(convention.is_fund_ticker("PRHSX"));
        REQUIRE(is_domestic_adjusted(classify_instrument("IT0000000001", std::string("ABCF"), convention)));
        REQUIRE_FALSE(is_domestic_adjusted(classify_instrument("US87281Y1029", std::string("PRHSX"), convention)));
    }

    SECTION("Suffix must be one letter") {
        REQUIRE_THROWS_AS(MarketConvention::from_json({{"fund_ticker_suffix", "XX"}}), std::invalid_argument);
    }
}

TEST_CASE("Adjusted vendor names", "[AdjustmentClassifier]") {
    REQUIRE(source_reports_adjusted_prices("EOD Historical Data"));
    REQUIRE(source_reports_adjusted_prices("Alpha Vantage (PRHSX)"));
    REQUIRE(source_reports_adjusted_prices("Financial Modeling Prep"));
    REQUIRE_FALSE(source_reports_adjusted_prices("Yahoo Finance (ticker)"));
    REQUIRE_FALSE(source_reports_adjusted_prices("Morningstar"));
}

TEST_CASE("RawQuoteHistory columns", "[AdjustmentClassifier]") {
    RawQuoteHistory raw;
    raw.add("2021-01-04", 100.0, NaN);
    REQUIRE_FALSE(raw.has_adjusted_close());

    raw.add("2021-01-05", 101.0, 100.5, 0.25);
    REQUIRE(raw.has_adjusted_close());
    REQUIRE(raw.adjusted_close.size() == 2);
    REQUIRE(std::isnan(raw.adjusted_close[0]));
    REQUIRE(raw.adjusted_close[1] == 100.5);
    REQUIRE(raw.dividends[1] == 0.25);
    REQUIRE_NOTHROW(raw.validate());

    raw.close.push_back(102.0);
    REQUIRE_THROWS_AS(raw.validate(), std::invalid_argument);
}

TEST_CASE("Applying the adjustment rules", "[AdjustmentClassifier]") {
    AdjustmentClassifier classifier;

    RawQuoteHistory raw;
    raw.add("2021-01-04", 100.0, 90.0);
    raw.add("2021-01-05", NaN, NaN);
    raw.add("2021-01-06", 98.0, 90.0, 2.0);
    raw.add("2021-01-07", 99.0, 91.0);

    SECTION("Foreign instrument stays raw with distributions") {
        auto series = classifier.apply(raw, classifier.classify("IE00B4L5Y983", std::nullopt),
                                       VendorAdjustment::RAW_WITH_DISTRIBUTIONS);

        REQUIRE_FALSE(series.is_adjusted());
        REQUIRE(series.size() == 3); // null close dropped
        REQUIRE(series[1].date == "2021-01-06");
        REQUIRE(series[1].price == 98.0);
        REQUIRE(series[1].dividend == 2.0);
    }

    SECTION("Domestic fund uses the native adjusted close") {
        auto series = classifier.apply(raw, classifier.classify("US87281Y1029", std::string("PRHSX")),
                                       VendorAdjustment::RAW_WITH_DISTRIBUTIONS);

        REQUIRE(series.is_adjusted());
        REQUIRE(series.size() == 3);
        REQUIRE(series.prices() == std::vector<double>{90.0, 90.0, 91.0});
        REQUIRE_FALSE(series.has_distributions());
    }

    SECTION("Always-adjusted vendor overrides a foreign classification") {
        auto series = classifier.apply(raw, classifier.classify("IE00B4L5Y983", std::nullopt),
                                       VendorAdjustment::ALWAYS_ADJUSTED);

        REQUIRE(series.is_adjusted());
        REQUIRE(series.front().price == 90.0);
        REQUIRE_FALSE(series.has_distributions());
    }

    SECTION("Domestic fund without adjusted close is reconstructed") {
        RawQuoteHistory plain;
        plain.add("2021-01-04", 100.0, NaN);
        plain.add("2021-01-05", 98.0, NaN, 2.0);  // -2%: ex-distribution day
        plain.add("2021-01-06", 99.0, NaN, 0.5);  // +1%: distribution already in price

        auto series = classifier.apply(plain, DomesticAdjustedFund{"PRHSX", "PRHSX"},
                                       VendorAdjustment::RAW_WITH_DISTRIBUTIONS);

        REQUIRE(series.is_adjusted());
        REQUIRE_THAT(series[0].price, WithinAbs(100.0, 1e-12));
        REQUIRE_THAT(series[1].price, WithinAbs(100.0, 1e-12));
        REQUIRE_THAT(series[2].price, WithinAbs(100.0 * 99.0 / 98.0, 1e-9));
    }
}
