/**
 * @file test_fund_pipeline.cpp
 * @brief End-to-end tests of FundPipeline over canned sources
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "cache/cache_store.hpp"
#include "data/data_loader.hpp"
#include "pipeline/fund_pipeline.hpp"
#include "validation/data_validator.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

using namespace fundscope;
using namespace fundscope::pipeline;
using Catch::Matchers::WithinAbs;

namespace
{
    /** Source answering from a per-identifier table. */
    class MapSource : public sources::PriceSource
    {
    public:
        std::string name() const override { return "Canned quotes"; }

        std::optional<sources::FetchedQuotes> fetch(const sources::InstrumentRequest &request,
                                                    const data::DateRange &) override
        {
            ++calls;
            auto it = quotes.find(request.identifier);
            if (it == quotes.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::map<std::string, sources::FetchedQuotes> quotes;
        int calls = 0;
    };

    const std::string FUND_A = "IE00B4L5Y983";
    const std::string FUND_B = "LU0274208692";
    const std::string MISSING = "US9999999999";

    data::PriceSeries adjusted_fund()
    {
        data::SyntheticSeriesSpec spec;
        spec.start_date = "2022-01-03";
        spec.num_days = 504;
        spec.annual_drift = 0.10;
        spec.daily_volatility = 0.005;
        spec.seed = 3;
        spec.is_adjusted = true;
        return data::DataLoader::generate_synthetic_series(spec);
    }

    data::PriceSeries distributing_fund()
    {
        data::SyntheticSeriesSpec spec;
        spec.start_date = "2022-01-03";
        spec.num_days = 504;
        spec.annual_drift = 0.08;
        spec.distribution_yield = 0.005;
        spec.distribution_interval = 63;
        spec.ex_date_move = -0.01;
        return data::DataLoader::generate_synthetic_series(spec);
    }

    data::PriceSeries benchmark_index()
    {
        data::SyntheticSeriesSpec spec;
        spec.start_date = "2022-01-03";
        spec.num_days = 504;
        spec.annual_drift = 0.06;
        spec.daily_volatility = 0.008;
        spec.seed = 11;
        spec.is_adjusted = true;
        return data::DataLoader::generate_synthetic_series(spec);
    }

    double price_ratio(const data::PriceSeries &s)
    {
        return s.back().price / s.front().price;
    }

    double value_ratio(const analytics::TotalReturnSeries &s)
    {
        return s.values.back() / s.values.front();
    }

    struct Fixture
    {
        std::shared_ptr<MapSource> source = std::make_shared<MapSource>();
        std::shared_ptr<cache::InMemoryCacheStore> store = std::make_shared<cache::InMemoryCacheStore>();
        std::shared_ptr<cache::CacheManager> cache = std::make_shared<cache::CacheManager>(store);
        std::shared_ptr<sources::SourceResolver> resolver;
        data::AnalysisConfig config;
        std::vector<data::InstrumentSpec> instruments;

        Fixture()
        {
            source->quotes[FUND_A] = testing::quotes_from_series(
                adjusted_fund(), adjustment::VendorAdjustment::ALWAYS_ADJUSTED, FUND_A);
            source->quotes[FUND_B] = testing::quotes_from_series(
                distributing_fund(), adjustment::VendorAdjustment::RAW_WITH_DISTRIBUTIONS, FUND_B);
            source->quotes["EZU"] = testing::quotes_from_series(
                benchmark_index(), adjustment::VendorAdjustment::ALWAYS_ADJUSTED, "EZU");

            resolver = std::make_shared<sources::SourceResolver>(
                std::vector<std::shared_ptr<sources::PriceSource>>{source});

            config.years_back = 2;
            config.end_date = "2023-12-29";

            instruments.push_back({FUND_A, std::nullopt, std::string("Fund A")});
            instruments.push_back({FUND_B, std::nullopt, std::nullopt});
            instruments.push_back({MISSING, std::nullopt, std::nullopt});
        }
    };
}

TEST_CASE("Adjusted and distributing funds side by side", "[FundPipeline]") {
    Fixture f;
    FundPipeline pipeline(f.config, f.resolver, f.cache);

    BatchResult batch = pipeline.run(f.instruments);

    REQUIRE(batch.instruments.size() == 3);
    REQUIRE(batch.succeeded() == 2);
    REQUIRE(batch.failed() == 1);

    const InstrumentResult &a = batch.instruments[0];
    const InstrumentResult &b = batch.instruments[1];

    SECTION("Adjusted fund: total return equals price return") {
        REQUIRE(a.ok());
        REQUIRE(a.series->is_adjusted());
        REQUIRE(a.source == "Canned quotes");
        REQUIRE_FALSE(a.from_cache);
        REQUIRE(a.validation->is_valid());
        REQUIRE_THAT(value_ratio(*a.total_return) / price_ratio(*a.series), WithinAbs(1.0, 0.001));
        REQUIRE(a.label() == "Fund A");
    }

    SECTION("Distributing fund: total return exceeds price return") {
        REQUIRE(b.ok());
        REQUIRE_FALSE(b.series->is_adjusted());
        REQUIRE(b.series->has_distributions());
        REQUIRE(b.validation->is_valid());

        double pr = price_ratio(*b.series);
        double tr = value_ratio(*b.total_return);
        REQUIRE(tr > pr);
        // Seven quarterly distributions of 0.5% reinvested
        REQUIRE_THAT(tr / pr, WithinAbs(1.0 / std::pow(0.995, 7), 1e-6));
    }

    SECTION("Missing instrument is recorded, not fatal") {
        const InstrumentResult &missing = batch.instruments[2];
        REQUIRE_FALSE(missing.ok());
        REQUIRE(missing.error == std::optional<std::string>("no data available"));
    }

    SECTION("Comparison table and metrics") {
        REQUIRE(batch.table.common_start_date() == "2022-01-03");
        REQUIRE(batch.table.num_instruments() == 2);
        REQUIRE(batch.table.value("2022-01-03", FUND_A) == 100.0);
        REQUIRE(batch.table.value("2022-01-03", FUND_B) == 100.0);

        REQUIRE(batch.metrics.size() == 2);
        for (const auto &m : batch.metrics)
        {
            REQUIRE(m.beta.has_value());
            REQUIRE(m.benchmark == std::optional<std::string>("Euro Stoxx 50"));
            REQUIRE(m.volatility.has_value());
            REQUIRE(m.alpha.has_value());
            REQUIRE(m.correlation.has_value());
            REQUIRE(*m.correlation >= -1.0);
            REQUIRE(*m.correlation <= 1.0);
            REQUIRE(*m.tracking_error > 0.0);
        }
    }

    SECTION("Metrics document") {
        nlohmann::json doc = batch.metrics_json();
        REQUIRE(doc["common_start_date"] == "2022-01-03");
        REQUIRE(doc["base_value"].get<double>() == 100.0);
        REQUIRE(doc["instruments"].size() == 2);
        REQUIRE(doc["instruments"][0]["identifier"] == FUND_A);
        REQUIRE(doc["instruments"][0]["name"] == "Fund A");
        REQUIRE(doc["instruments"][0]["is_adjusted"] == true);
        REQUIRE(doc["instruments"][1]["is_adjusted"] == false);
        REQUIRE(doc["instruments"][1]["validation"]["total_return"]["valid"] == true);
        REQUIRE(doc["instruments"][0]["beta"].is_number());
        REQUIRE(doc["instruments"][0]["alpha"].is_number());
        REQUIRE_FALSE(doc["instruments"][0].contains("composition"));
        REQUIRE(doc["failed"].size() == 1);
        REQUIRE(doc["failed"][0]["identifier"] == MISSING);

        std::string path = (std::filesystem::temp_directory_path() / "fundscope_test_metrics.json").string();
        batch.export_metrics_json(path);
        REQUIRE(data::DataLoader::load_json(path) == doc);
        std::remove(path.c_str());
    }
}

TEST_CASE("Second run is served from cache", "[FundPipeline]") {
    Fixture f;
    FundPipeline first(f.config, f.resolver, f.cache);
    first.run(f.instruments);

    // Both funds plus the benchmark and the failed lookup
    REQUIRE(f.source->calls == 4);
    REQUIRE(f.store->size() == 3);

    FundPipeline second(f.config, f.resolver, f.cache);
    BatchResult batch = second.run(f.instruments);

    // Only the instrument without data is looked up again
    REQUIRE(f.source->calls == 5);
    REQUIRE(batch.instruments[0].from_cache);
    REQUIRE(batch.instruments[1].from_cache);
    REQUIRE(batch.instruments[1].series->has_distributions());
    REQUIRE(batch.instruments[1].validation->is_valid());
    REQUIRE(batch.succeeded() == 2);
    REQUIRE(batch.metrics[0].beta.has_value());
}

TEST_CASE("Repeated identifiers are processed once", "[FundPipeline]") {
    Fixture f;
    FundPipeline pipeline(f.config, f.resolver, f.cache);

    BatchResult batch;
    REQUIRE_NOTHROW(batch = pipeline.run({f.instruments[0], f.instruments[1], {"ie00b4l5y983 ", std::nullopt, std::nullopt}}));

    REQUIRE(batch.instruments.size() == 2);
    REQUIRE(batch.succeeded() == 2);
    REQUIRE(batch.table.num_instruments() == 2);
    REQUIRE(batch.metrics.size() == 2);
    REQUIRE(batch.metrics_json()["instruments"].size() == 2);
}

TEST_CASE("Cached validation follows the analysis window", "[FundPipeline]") {
    Fixture f;
    FundPipeline pipeline(f.config, f.resolver, f.cache);

    // 30% jump on the second day, then a quiet path
    std::vector<double> prices = {100.0};
    for (int i = 1; i < 40; ++i)
    {
        prices.push_back(130.0 + 0.1 * i);
    }
    data::PriceSeries full = testing::business_day_series("2021-01-04", prices);
    validation::DataValidator validator;
    REQUIRE_FALSE(validator.validate(full).is_valid());
    f.cache->put_series("FR0010315770", cache::CacheKind::HISTORICAL, full, validator.validate(full).to_json());

    data::InstrumentSpec instrument{"FR0010315770", std::nullopt, std::nullopt};

    SECTION("Whole cached history: stored report is reused") {
        InstrumentResult r = pipeline.load_instrument(instrument, {"2021-01-01", "2021-12-31"});
        REQUIRE(r.from_cache);
        REQUIRE(r.series->size() == 40);
        REQUIRE_FALSE(r.validation->is_valid());
    }

    SECTION("Trimmed history is revalidated") {
        InstrumentResult r = pipeline.load_instrument(instrument, {"2021-01-11", "2021-12-31"});
        REQUIRE(r.from_cache);
        REQUIRE(r.series->size() == 35);
        REQUIRE(r.validation->is_valid());
    }

    REQUIRE(f.source->calls == 0);
}

TEST_CASE("Composition is attached when requested", "[FundPipeline]") {
    Fixture f;
    testing::FakeHttpClient http;
    auto limiter = testing::instant_limiter();
    http.respond("quoteSummary/IWDA", 200,
                 R"({"quoteSummary": {"result": [{"topHoldings": {
                     "holdings": [{"symbol": "AAPL", "holdingName": "Apple Inc", "holdingPercent": {"raw": 0.05}}],
                     "sectorWeightings": [{"technology": {"raw": 0.25}}]}}]}})");
    auto compositions = std::make_shared<sources::CompositionFetcher>(http, *limiter, *f.cache);

    FundPipeline pipeline(f.config, f.resolver, f.cache, nullptr, compositions);
    BatchResult batch = pipeline.run({{FUND_A, std::string("IWDA"), std::nullopt}, f.instruments[1]});

    REQUIRE(batch.instruments[0].composition.has_value());
    REQUIRE(batch.instruments[0].composition->top_holdings.size() == 1);
    REQUIRE_FALSE(batch.instruments[1].composition.has_value());
    REQUIRE(batch.succeeded() == 2);

    nlohmann::json doc = batch.metrics_json();
    REQUIRE_THAT(doc["instruments"][0]["composition"]["sectors"]["technology"].get<double>(), WithinAbs(25.0, 1e-9));
    REQUIRE_FALSE(doc["instruments"][1].contains("composition"));
}

TEST_CASE("Explicit comparison start", "[FundPipeline]") {
    Fixture f;
    f.config.common_start_date = "2022-06-01";
    FundPipeline pipeline(f.config, f.resolver, f.cache);

    BatchResult batch = pipeline.run({f.instruments[0], f.instruments[1]});
    REQUIRE(batch.table.common_start_date() == "2022-06-01");
    REQUIRE(batch.table.value("2022-06-01", FUND_B) == 100.0);
}

TEST_CASE("Pipeline dependencies", "[FundPipeline]") {
    Fixture f;
    REQUIRE_THROWS_AS(FundPipeline(f.config, nullptr, f.cache), std::invalid_argument);
    REQUIRE_THROWS_AS(FundPipeline(f.config, f.resolver, nullptr), std::invalid_argument);
}

TEST_CASE("Empty batch", "[FundPipeline]") {
    Fixture f;
    FundPipeline pipeline(f.config, f.resolver, f.cache);
    BatchResult batch = pipeline.run({});

    REQUIRE(batch.instruments.empty());
    REQUIRE(batch.table.empty());
    REQUIRE(batch.metrics.empty());
}
