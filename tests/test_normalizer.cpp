/**
 * @file test_normalizer.cpp
 * @brief Unit tests for SeriesNormalizer and ComparisonTable
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "analytics/normalizer.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace fundscope;
using namespace fundscope::analytics;
using Catch::Matchers::WithinAbs;

TEST_CASE("Common start is the latest first date", "[Normalizer]") {
    std::vector<TotalReturnSeries> series = {
        testing::daily_values("FUND_A", "2021-01-01", std::vector<double>(120, 10.0)),
        testing::daily_values("FUND_B", "2021-03-15", std::vector<double>(60, 250.0)),
        testing::daily_values("FUND_C", "2021-02-01", std::vector<double>(100, 42.0)),
    };
    // Give every series some movement after its first date
    for (auto &s : series)
    {
        for (size_t i = 0; i < s.size(); ++i)
        {
            s.values[i] *= 1.0 + 0.001 * static_cast<double>(i);
        }
    }

    REQUIRE(SeriesNormalizer::derive_common_start_date(series) == "2021-03-15");

    SeriesNormalizer normalizer;
    ComparisonTable table = normalizer.build(series);

    REQUIRE(table.common_start_date() == "2021-03-15");
    REQUIRE(table.num_instruments() == 3);
    REQUIRE(table.dates().front() == "2021-03-15");
    REQUIRE(table.value("2021-03-15", "FUND_A") == 100.0);
    REQUIRE(table.value("2021-03-15", "FUND_B") == 100.0);
    REQUIRE(table.value("2021-03-15", "FUND_C") == 100.0);

    SECTION("Later values keep each series' own growth") {
        // FUND_B day 10 relative to day 0
        double expected = 100.0 * (1.0 + 0.001 * 10.0);
        REQUIRE_THAT(table.value("2021-03-25", "FUND_B"), WithinAbs(expected, 1e-9));
    }
}

TEST_CASE("Explicit start override", "[Normalizer]") {
    std::vector<TotalReturnSeries> series = {
        testing::daily_values("A", "2021-01-01", {100.0, 110.0, 121.0, 133.1}),
        testing::daily_values("B", "2021-01-01", {50.0, 50.0}),
    };
    SeriesNormalizer normalizer(1000.0);

    SECTION("Instruments without data after the override are excluded") {
        ComparisonTable table = normalizer.build(series, std::string("2021-01-03"));

        REQUIRE(table.common_start_date() == "2021-01-03");
        REQUIRE(table.instruments() == std::vector<std::string>{"A"});
        REQUIRE_FALSE(table.contains("B"));
        REQUIRE(table.value("2021-01-03", "A") == 1000.0);
        REQUIRE_THAT(table.value("2021-01-04", "A"), WithinAbs(1100.0, 1e-9));
    }

    SECTION("Malformed override") {
        REQUIRE_THROWS_AS(normalizer.build(series, std::string("03/01/2021")), std::invalid_argument);
    }
}

TEST_CASE("Forward fill of missing dates", "[Normalizer]") {
    TotalReturnSeries a = testing::daily_values("A", "2021-01-01", {100.0, 101.0, 102.0, 103.0});
    TotalReturnSeries b;
    b.instrument = "B";
    b.dates = {"2021-01-01", "2021-01-03", "2021-01-04"};
    b.values = {20.0, 22.0, 21.0};

    ComparisonTable table = SeriesNormalizer().build({a, b});

    REQUIRE(table.num_dates() == 4);
    REQUIRE(table.value("2021-01-02", "B") == 100.0);
    REQUIRE_THAT(table.value("2021-01-03", "B"), WithinAbs(110.0, 1e-9));

    SECTION("Column keeps filled rows") {
        auto column = table.column("B");
        REQUIRE(column.size() == 4);
        REQUIRE(column.dates.front() == "2021-01-01");
    }
}

TEST_CASE("Comparison table access", "[Normalizer]") {
    TotalReturnSeries a = testing::daily_values("A", "2021-01-02", {10.0, 11.0});
    TotalReturnSeries b = testing::daily_values("B", "2021-01-01", {5.0, 5.5, 6.0});

    ComparisonTable table = SeriesNormalizer().build({a, b});

    SECTION("Dates before the start are not in the table") {
        REQUIRE(std::isnan(table.value("2021-01-01", "B")));
        REQUIRE(table.num_dates() == 2);
    }

    SECTION("Unknown instrument") {
        REQUIRE_THROWS_AS(table.value("2021-01-02", "Z"), std::out_of_range);
        REQUIRE_THROWS_AS(table.column("Z"), std::out_of_range);
    }

    SECTION("CSV export") {
        std::string path = (std::filesystem::temp_directory_path() / "fundscope_test_table.csv").string();
        table.to_csv(path);

        std::ifstream file(path);
        std::string header;
        std::string first_row;
        std::getline(file, header);
        std::getline(file, first_row);
        REQUIRE(header == "date,A,B");
        REQUIRE(first_row == "2021-01-02,100.000000,100.000000");
        file.close();
        std::remove(path.c_str());
    }

    SECTION("Shape mismatch is rejected") {
        REQUIRE_THROWS_AS(ComparisonTable({"2021-01-01"}, {"A", "B"}, Eigen::MatrixXd::Zero(1, 1), "2021-01-01", 100.0),
                          std::invalid_argument);
    }
}

TEST_CASE("Normalizer input checks", "[Normalizer]") {
    REQUIRE_THROWS_AS(SeriesNormalizer(0.0), std::invalid_argument);

    TotalReturnSeries a = testing::daily_values("A", "2021-01-01", {1.0, 2.0});
    REQUIRE_THROWS_AS(SeriesNormalizer().build({a, a}), std::invalid_argument);

    SECTION("Empty input gives an empty table") {
        REQUIRE(SeriesNormalizer().build({}).empty());
    }
}

TEST_CASE("Single series normalization", "[Normalizer]") {
    TotalReturnSeries s = testing::daily_values("A", "2021-01-01", {std::nan(""), 40.0, 44.0});
    auto out = SeriesNormalizer(100.0).normalize(s);

    REQUIRE(std::isnan(out.values[0]));
    REQUIRE(out.values[1] == 100.0);
    REQUIRE_THAT(out.values[2], WithinAbs(110.0, 1e-9));
}
