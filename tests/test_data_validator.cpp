/**
 * @file test_data_validator.cpp
 * @brief Unit tests for DataValidator
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "validation/data_validator.hpp"
#include "test_helpers.hpp"

#include <stdexcept>
#include <vector>

using namespace fundscope;
using namespace fundscope::validation;
using Catch::Matchers::WithinAbs;

namespace
{
    std::vector<double> flat_with_jump(double jump)
    {
        std::vector<double> prices(30, 100.0);
        for (size_t i = 15; i < prices.size(); ++i)
        {
            prices[i] = 100.0 * (1.0 + jump);
        }
        return prices;
    }
}

TEST_CASE("Single large jump fails consistency only", "[DataValidator]") {
    DataValidator validator;
    auto series = testing::business_day_series("2021-01-04", flat_with_jump(0.25));

    auto report = validator.validate(series);

    REQUIRE(report.completeness.passed);
    REQUIRE_FALSE(report.consistency.passed);
    REQUIRE(report.total_return.passed);
    REQUIRE_FALSE(report.is_valid());

    auto failures = report.failures();
    REQUIRE(failures.size() == 1);
    REQUIRE(failures[0].rfind("consistency:", 0) == 0);
}

TEST_CASE("Daily change bands", "[DataValidator]") {
    DataValidator validator;

    SECTION("25% move is a hard failure") {
        auto result = validator.check_consistency(testing::business_day_series("2021-01-04", flat_with_jump(0.25)));
        REQUIRE_FALSE(result.passed);
        REQUIRE(result.message.find("25.00%") != std::string::npos);
    }

    SECTION("12% move is a warning") {
        auto result = validator.check_consistency(testing::business_day_series("2021-01-04", flat_with_jump(0.12)));
        REQUIRE(result.passed);
        REQUIRE(result.warnings.size() == 1);
    }

    SECTION("5% move is clean") {
        auto result = validator.check_consistency(testing::business_day_series("2021-01-04", flat_with_jump(0.05)));
        REQUIRE(result.passed);
        REQUIRE(result.warnings.empty());
    }

    SECTION("Drops count as well as jumps") {
        auto result = validator.check_consistency(testing::business_day_series("2021-01-04", flat_with_jump(-0.30)));
        REQUIRE_FALSE(result.passed);
    }

    SECTION("Custom thresholds") {
        ValidationThresholds loose;
        loose.max_daily_change = 0.50;
        loose.suspicious_daily_change = 0.30;
        DataValidator relaxed(loose);
        auto result = relaxed.check_consistency(testing::business_day_series("2021-01-04", flat_with_jump(0.25)));
        REQUIRE(result.passed);
        REQUIRE(result.warnings.empty());
    }
}

TEST_CASE("Completeness gaps", "[DataValidator]") {
    DataValidator validator;

    SECTION("Weekends are within the limit") {
        auto series = testing::business_day_series("2021-01-04", std::vector<double>(20, 100.0));
        REQUIRE(validator.check_completeness(series).passed);
    }

    SECTION("Two missing weeks fail") {
        std::vector<data::DailyRecord> records;
        records.push_back({"2021-01-04", 100.0, 0.0, 0.0, false});
        records.push_back({"2021-01-05", 100.0, 0.0, 0.0, false});
        records.push_back({"2021-01-19", 100.0, 0.0, 0.0, false});
        auto result = validator.check_completeness(data::PriceSeries(records));

        REQUIRE_FALSE(result.passed);
        REQUIRE(result.message.find("14 days") != std::string::npos);
    }

    SECTION("Empty series fails") {
        REQUIRE_FALSE(validator.check_completeness(data::PriceSeries()).passed);
    }
}

TEST_CASE("Total return check", "[DataValidator]") {
    DataValidator validator;

    SECTION("Adjusted series passes trivially") {
        auto series = testing::business_day_series("2021-01-04", {100.0, 90.0, 95.0}, true);
        REQUIRE(validator.check_total_return(series).passed);
    }

    SECTION("Raw series with an ex-date distribution") {
        std::vector<data::DailyRecord> records;
        records.push_back({"2021-01-04", 100.0, 0.0, 0.0, false});
        records.push_back({"2021-01-05", 97.0, 2.5, 0.0, false});
        records.push_back({"2021-01-06", 98.0, 0.0, 0.0, false});
        REQUIRE(validator.check_total_return(data::PriceSeries(records)).passed);
    }

    SECTION("Single observation fails") {
        auto series = testing::business_day_series("2021-01-04", {100.0});
        REQUIRE_FALSE(validator.check_total_return(series).passed);
    }
}

TEST_CASE("Validation report serialization", "[DataValidator]") {
    DataValidator validator;
    auto report = validator.validate(testing::business_day_series("2021-01-04", flat_with_jump(0.12)));

    nlohmann::json j = report.to_json();
    REQUIRE(j["consistency"]["valid"] == true);
    REQUIRE(j["consistency"]["warnings"].size() == 1);

    auto restored = ValidationReport::from_json(j);
    REQUIRE(restored.is_valid() == report.is_valid());
    REQUIRE(restored.consistency.warnings == report.consistency.warnings);
    REQUIRE(restored.completeness.message == report.completeness.message);

    REQUIRE_THROWS(ValidationReport::from_json(nlohmann::json::object()));
}

TEST_CASE("Validation thresholds from JSON", "[DataValidator]") {
    auto t = ValidationThresholds::from_json({{"max_daily_change", 0.3}, {"max_gap_days", 7}});
    REQUIRE(t.max_daily_change == 0.3);
    REQUIRE(t.suspicious_daily_change == 0.10);
    REQUIRE(t.max_gap_days == 7);

    REQUIRE_THROWS_AS(ValidationThresholds::from_json({{"suspicious_daily_change", 0.5}}), std::invalid_argument);
    REQUIRE_THROWS_AS(ValidationThresholds::from_json({{"max_gap_days", 0}}), std::invalid_argument);
}

TEST_CASE("Comparing two sources", "[DataValidator]") {
    auto a = testing::business_day_series("2021-01-04", {100.0, 101.0, 102.0, 103.0});
    auto b = testing::business_day_series("2021-01-05", {101.0, 102.0, 103.0, 104.0});

    auto cmp = DataValidator::compare_sources(a, b);
    REQUIRE(cmp.has_value());
    REQUIRE(cmp->common_dates == 3);
    REQUIRE(cmp->first_common_date == "2021-01-05");
    REQUIRE_THAT(cmp->max_abs_diff, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(cmp->correlation, WithinAbs(1.0, 1e-12));

    auto disjoint = testing::business_day_series("2022-01-03", {100.0});
    REQUIRE_FALSE(DataValidator::compare_sources(a, disjoint).has_value());
}
