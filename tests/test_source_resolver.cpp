/**
 * @file test_source_resolver.cpp
 * @brief Unit tests for SourceResolver and the default source chain
 */

#include <catch2/catch_test_macros.hpp>
#include "sources/source_resolver.hpp"
#include "test_helpers.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fundscope;
using namespace fundscope::sources;
using testing::ScriptedSource;
using Outcome = testing::ScriptedSource::Outcome;

namespace
{
    const data::DateRange RANGE{"2021-01-01", "2021-12-31"};

    FetchedQuotes quotes_with(size_t n, const std::string &symbol = "")
    {
        std::vector<double> prices;
        for (size_t i = 0; i < n; ++i)
        {
            prices.push_back(100.0 + static_cast<double>(i));
        }
        auto series = testing::business_day_series("2021-01-04", prices);
        return testing::quotes_from_series(series, adjustment::VendorAdjustment::RAW_WITH_DISTRIBUTIONS, symbol);
    }
}

TEST_CASE("Fallback to the first source with data", "[SourceResolver]") {
    auto s1 = std::make_shared<ScriptedSource>("Source 1", Outcome::NO_DATA);
    auto s2 = std::make_shared<ScriptedSource>("Source 2", Outcome::THROWS);
    auto s3 = std::make_shared<ScriptedSource>("Source 3", Outcome::NO_DATA);
    auto s4 = std::make_shared<ScriptedSource>("Source 4", Outcome::THROWS);
    auto s5 = std::make_shared<ScriptedSource>("Source 5", Outcome::QUOTES, quotes_with(15));
    auto s6 = std::make_shared<ScriptedSource>("Source 6", Outcome::QUOTES, quotes_with(30));

    SourceResolver resolver({s1, s2, s3, s4, s5, s6});

    std::optional<ResolvedSeries> resolved;
    REQUIRE_NOTHROW(resolved = resolver.resolve({"ie00b4l5y983 ", std::nullopt}, RANGE));
    REQUIRE(resolved.has_value());
    REQUIRE(resolved->source_name == "Source 5");
    REQUIRE(resolved->series.source_name() == "Source 5");
    REQUIRE(resolved->series.size() == 15);
    REQUIRE_FALSE(resolved->series.fetched_at().empty());

    REQUIRE(s1->calls == 1);
    REQUIRE(s4->calls == 1);
    REQUIRE(s6->calls == 0);
    REQUIRE(s5->last_request.identifier == "IE00B4L5Y983");
}

TEST_CASE("Exhausted sources", "[SourceResolver]") {
    SECTION("Every source fails") {
        SourceResolver resolver({
            std::make_shared<ScriptedSource>("A", Outcome::THROWS),
            std::make_shared<ScriptedSource>("B", Outcome::NO_DATA),
        });
        REQUIRE_FALSE(resolver.resolve({"IE00B4L5Y983", std::nullopt}, RANGE).has_value());
    }

    SECTION("Ten records are not enough") {
        auto few = std::make_shared<ScriptedSource>("Few", Outcome::QUOTES, quotes_with(10));
        auto enough = std::make_shared<ScriptedSource>("Enough", Outcome::QUOTES, quotes_with(11));
        SourceResolver resolver({few, enough});

        auto resolved = resolver.resolve({"IE00B4L5Y983", std::nullopt}, RANGE);
        REQUIRE(resolved->source_name == "Enough");
        REQUIRE(resolved->series.size() == 11);
    }

    SECTION("Custom minimum") {
        SourceResolver resolver({std::make_shared<ScriptedSource>("Few", Outcome::QUOTES, quotes_with(6))},
                                adjustment::AdjustmentClassifier{}, 5);
        REQUIRE(resolver.resolve({"IE00B4L5Y983", std::nullopt}, RANGE).has_value());
    }
}

TEST_CASE("Disabled sources are skipped", "[SourceResolver]") {
    auto keyed = std::make_shared<ScriptedSource>("Keyed", Outcome::QUOTES, quotes_with(20), false);
    auto open = std::make_shared<ScriptedSource>("Open", Outcome::QUOTES, quotes_with(20));
    SourceResolver resolver({keyed, open});

    REQUIRE(resolver.active_source_names() == std::vector<std::string>{"Open"});
    REQUIRE(resolver.resolve({"SPY", std::nullopt}, RANGE)->source_name == "Open");
    REQUIRE(keyed->calls == 0);
}

TEST_CASE("Resolver rejects null sources", "[SourceResolver]") {
    REQUIRE_THROWS_AS(SourceResolver({nullptr}), std::invalid_argument);
}

TEST_CASE("Classification of resolved series", "[SourceResolver]") {
    SECTION("Foreign fund stays raw") {
        auto series = testing::business_day_series("2021-01-04", std::vector<double>(12, 50.0));
        std::vector<data::DailyRecord> records = series.records();
        records[6].price = 49.0;
        records[6].dividend = 1.0;
        auto source = std::make_shared<ScriptedSource>(
            "Raw", Outcome::QUOTES, testing::quotes_from_series(data::PriceSeries(records), adjustment::VendorAdjustment::RAW_WITH_DISTRIBUTIONS, "IE00B4L5Y983.L"));

        auto resolved = SourceResolver({source}).resolve({"IE00B4L5Y983", std::nullopt}, RANGE);
        REQUIRE_FALSE(resolved->series.is_adjusted());
        REQUIRE(resolved->series.has_distributions());
        REQUIRE(resolved->symbol == "IE00B4L5Y983.L");
    }

    SECTION("Answering symbol identifies a domestic fund") {
        auto source = std::make_shared<ScriptedSource>("Ticker", Outcome::QUOTES, quotes_with(12, "PRHSX"));
        auto resolved = SourceResolver({source}).resolve({"US87281Y1029", std::nullopt}, RANGE);
        REQUIRE(resolved->series.is_adjusted());
    }

    SECTION("Caller's ticker is normalized") {
        auto source = std::make_shared<ScriptedSource>("Ticker", Outcome::QUOTES, quotes_with(12));
        auto resolved = SourceResolver({source}).resolve({"US87281Y1029", std::string(" prhsx")}, RANGE);
        REQUIRE(source->last_request.ticker == std::optional<std::string>("PRHSX"));
        REQUIRE(resolved->series.is_adjusted());
    }
}

TEST_CASE("Default source chain", "[SourceResolver]") {
    testing::FakeHttpClient http;
    auto limiter = testing::instant_limiter();
    data::AnalysisConfig config;

    auto sources = build_default_sources(config, http, *limiter);
    REQUIRE(sources.size() == 10);
    REQUIRE(sources[0]->name() == "EOD Historical Data");
    REQUIRE(sources[3]->name() == "Yahoo Finance (ticker)");
    REQUIRE(sources[9]->name() == "JustETF");

    SECTION("Keyed vendors are inactive without keys") {
        SourceResolver resolver(sources);
        auto names = resolver.active_source_names();
        REQUIRE(names.size() == 7);
        REQUIRE(names.front() == "Yahoo Finance (ticker)");
    }

    SECTION("Configured keys activate vendors") {
        config.fmp_api_key = "demo";
        SourceResolver resolver(build_default_sources(config, http, *limiter));
        REQUIRE(resolver.active_source_names().front() == "Financial Modeling Prep");
    }
}
