/**
 * @file test_data_loader.cpp
 * @brief Unit tests for DataLoader and AnalysisConfig
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "data/data_loader.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace fundscope;
using namespace fundscope::data;
using Catch::Matchers::WithinAbs;

namespace
{
    std::string write_temp(const std::string &name, const std::string &content)
    {
        std::string path = (std::filesystem::temp_directory_path() / name).string();
        std::ofstream file(path);
        file << content;
        return path;
    }
}

TEST_CASE("Configuration defaults", "[AnalysisConfig]") {
    AnalysisConfig config = AnalysisConfig::from_json(nlohmann::json::object());

    REQUIRE(config.years_back == 5);
    REQUIRE(config.base_value == 100.0);
    REQUIRE_FALSE(config.common_start_date.has_value());
    REQUIRE_FALSE(config.end_date.has_value());
    REQUIRE(config.trading_days_per_year == 252);
    REQUIRE(config.cache_dir == "cache");
    REQUIRE(config.rate_limit_seconds == 1.0);
    REQUIRE(config.exchange_suffixes.size() == 11);
    REQUIRE(config.exchange_suffixes.front() == "L");
    REQUIRE(config.market.home_country == "US");
    REQUIRE(config.ex_distribution_threshold == -0.01);
    REQUIRE(config.validation.max_gap_days == 5);
    REQUIRE_FALSE(config.eod_api_key.has_value());
}

TEST_CASE("Configuration sections", "[AnalysisConfig]") {
    nlohmann::json j = {
        {"analysis", {{"years_back", 3}, {"base_value", 1000.0}, {"end_date", "2024-06-28"},
                      {"common_start_date", "2022-01-03"}, {"risk_free_rate", 0.02}}},
        {"cache", {{"directory", "/var/cache/fundscope"}}},
        {"sources", {{"eod_api_key", ""}, {"fmp_api_key", "key"}, {"exchange_suffixes", {"L", "MI"}},
                     {"rate_limit_seconds", 0.5}}},
        {"market", {{"home_country", "GB"}}},
        {"adjustment", {{"ex_distribution_threshold", -0.02}}},
        {"validation", {{"max_gap_days", 7}}},
    };
    AnalysisConfig config = AnalysisConfig::from_json(j);

    REQUIRE(config.years_back == 3);
    REQUIRE(config.base_value == 1000.0);
    REQUIRE(config.common_start_date == std::optional<std::string>("2022-01-03"));
    REQUIRE(config.risk_free_rate == 0.02);
    REQUIRE(config.cache_dir == "/var/cache/fundscope");
    REQUIRE(config.output_dir == "output");
    REQUIRE_FALSE(config.eod_api_key.has_value());
    REQUIRE(config.fmp_api_key == std::optional<std::string>("key"));
    REQUIRE(config.exchange_suffixes == std::vector<std::string>{"L", "MI"});
    REQUIRE(config.rate_limit_seconds == 0.5);
    REQUIRE(config.market.home_country == "GB");
    REQUIRE(config.ex_distribution_threshold == -0.02);
    REQUIRE(config.validation.max_gap_days == 7);

    SECTION("Analysis range ends at the configured date") {
        DateRange range = config.analysis_range();
        REQUIRE(range.end == "2024-06-28");
        REQUIRE(range.start == add_days("2024-06-28", -3 * 365));
    }
}

TEST_CASE("Invalid configuration values", "[AnalysisConfig]") {
    REQUIRE_THROWS_AS(AnalysisConfig::from_json({{"analysis", {{"years_back", 0}}}}), std::invalid_argument);
    REQUIRE_THROWS_AS(AnalysisConfig::from_json({{"analysis", {{"base_value", -1.0}}}}), std::invalid_argument);
    REQUIRE_THROWS_AS(AnalysisConfig::from_json({{"analysis", {{"end_date", "2024-13-01"}}}}), std::invalid_argument);
    REQUIRE_THROWS_AS(AnalysisConfig::from_json({{"sources", {{"rate_limit_seconds", -1.0}}}}), std::invalid_argument);
    REQUIRE_THROWS_AS(AnalysisConfig::from_json({{"adjustment", {{"ex_distribution_threshold", 0.5}}}}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(AnalysisConfig::from_json({{"adjustment", {{"ex_distribution_threshold", -1.0}}}}),
                      std::invalid_argument);
}

TEST_CASE("API keys from the environment", "[AnalysisConfig]") {
    setenv("FMP_API_KEY", "env-key", 1);
    setenv("EOD_API_KEY", "env-eod", 1);
    unsetenv("ALPHA_VANTAGE_API_KEY");

    AnalysisConfig config;
    config.eod_api_key = "file-key";
    DataLoader::apply_environment(config);

    REQUIRE(config.fmp_api_key == std::optional<std::string>("env-key"));
    REQUIRE(config.eod_api_key == std::optional<std::string>("file-key"));
    REQUIRE_FALSE(config.alpha_vantage_api_key.has_value());

    unsetenv("FMP_API_KEY");
    unsetenv("EOD_API_KEY");
}

TEST_CASE("Loading configuration files", "[DataLoader]") {
    std::string path = write_temp("fundscope_test_config.json", R"({"analysis": {"years_back": 2}})");
    REQUIRE(DataLoader::load_config(path).years_back == 2);
    std::remove(path.c_str());

    std::string broken = write_temp("fundscope_test_broken.json", "{ \"analysis\": ");
    REQUIRE_THROWS_AS(DataLoader::load_json(broken), std::runtime_error);
    std::remove(broken.c_str());

    REQUIRE_THROWS_AS(DataLoader::load_json("/nonexistent/config.json"), std::runtime_error);
}

TEST_CASE("Instrument lists", "[DataLoader]") {
    SECTION("Plain text") {
        std::string path = write_temp("fundscope_test_instruments.txt",
                                      "# funds to compare\n"
                                      "IE00B4L5Y983\n"
                                      "\n"
                                      "us87281y1029, prhsx ,T. Rowe Price Health\n"
                                      "not-an-id!\n"
                                      "SPY\n");
        auto instruments = DataLoader::load_instruments(path);
        std::remove(path.c_str());

        REQUIRE(instruments.size() == 3);
        REQUIRE(instruments[0].identifier == "IE00B4L5Y983");
        REQUIRE_FALSE(instruments[0].ticker.has_value());
        REQUIRE(instruments[1].identifier == "US87281Y1029");
        REQUIRE(instruments[1].ticker == std::optional<std::string>("PRHSX"));
        REQUIRE(instruments[1].name_short == std::optional<std::string>("T. Rowe Price Health"));
        REQUIRE(instruments[2].identifier == "SPY");
    }

    SECTION("JSON document") {
        std::string path = write_temp("fundscope_test_instruments.json", R"({"instruments": [
            {"isin": "ie00b4l5y983", "name_short": "World"},
            {"identifier": "SPY", "ticker": "SPY"},
            "LU0274208692",
            {"name_short": "No identifier"}
        ]})");
        auto instruments = DataLoader::load_instruments(path);
        std::remove(path.c_str());

        REQUIRE(instruments.size() == 3);
        REQUIRE(instruments[0].identifier == "IE00B4L5Y983");
        REQUIRE(instruments[0].name_short == std::optional<std::string>("World"));
        REQUIRE(instruments[1].ticker == std::optional<std::string>("SPY"));
        REQUIRE(instruments[2].identifier == "LU0274208692");
    }

    SECTION("Bare array") {
        auto instruments = DataLoader::instruments_from_json(nlohmann::json::array({"PRHSX", "VTSAX"}));
        REQUIRE(instruments.size() == 2);
        REQUIRE_THROWS(DataLoader::instruments_from_json({{"instruments", "SPY"}}));
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(DataLoader::load_instruments("/nonexistent/instruments.txt"), std::runtime_error);
    }
}

TEST_CASE("Synthetic series", "[DataLoader]") {
    SyntheticSeriesSpec spec;
    spec.start_date = "2022-01-01"; // Saturday
    spec.num_days = 10;
    spec.annual_drift = 0.0;

    SECTION("Business days from the first weekday") {
        PriceSeries series = DataLoader::generate_synthetic_series(spec);
        REQUIRE(series.size() == 10);
        REQUIRE(series.front().date == "2022-01-03");
        REQUIRE(series[5].date == "2022-01-10");
        REQUIRE(series.source_name() == "synthetic");
        REQUIRE(series.back().price == 100.0);
    }

    SECTION("Raw distributions") {
        spec.distribution_yield = 0.01;
        spec.distribution_interval = 5;
        PriceSeries series = DataLoader::generate_synthetic_series(spec);

        REQUIRE_THAT(series[5].dividend, WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(series[5].price, WithinAbs(99.0, 1e-12));
        REQUIRE(series[4].dividend == 0.0);
        REQUIRE_FALSE(series.is_adjusted());
    }

    SECTION("Adjusted series carry no distributions") {
        spec.distribution_yield = 0.01;
        spec.distribution_interval = 5;
        spec.ex_date_move = -0.02;
        spec.is_adjusted = true;
        PriceSeries series = DataLoader::generate_synthetic_series(spec);

        REQUIRE(series.is_adjusted());
        REQUIRE_FALSE(series.has_distributions());
        REQUIRE_THAT(series[5].price, WithinAbs(98.0, 1e-12));
    }

    SECTION("Reproducible noise") {
        spec.daily_volatility = 0.01;
        auto a = DataLoader::generate_synthetic_series(spec);
        auto b = DataLoader::generate_synthetic_series(spec);
        spec.seed = 7;
        auto c = DataLoader::generate_synthetic_series(spec);

        REQUIRE(a.back().price == b.back().price);
        REQUIRE(a.back().price != c.back().price);
    }

    SECTION("Invalid parameters") {
        spec.start_price = 0.0;
        REQUIRE_THROWS_AS(DataLoader::generate_synthetic_series(spec), std::invalid_argument);
        spec.start_price = 100.0;
        spec.distribution_yield = 1.0;
        REQUIRE_THROWS_AS(DataLoader::generate_synthetic_series(spec), std::invalid_argument);
    }
}
