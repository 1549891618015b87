/**
 * @file data_validator.hpp
 * @brief Advisory sanity checks over a fetched price series.
 *
 * Three independent checks annotate a series without gating its use:
 *  - total_return: total return must not fall below price-only return when
 *    distributions are present (trivially passes for adjusted series);
 *  - consistency: day-over-day moves above max_daily_change fail, moves above
 *    suspicious_daily_change are recorded as warnings;
 *  - completeness: no gap between observations longer than max_gap_days.
 */

#ifndef FUNDSCOPE_VALIDATION_DATA_VALIDATOR_HPP
#define FUNDSCOPE_VALIDATION_DATA_VALIDATOR_HPP

#include "analytics/total_return.hpp"
#include "data/price_series.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace fundscope
{
    namespace validation
    {

        /**
         * @struct ValidationThresholds
         * @brief Limits used by the consistency and completeness checks.
         */
        struct ValidationThresholds
        {
            double max_daily_change = 0.20;        ///< Larger moves are hard failures
            double suspicious_daily_change = 0.10; ///< Larger moves are warnings
            int max_gap_days = 5;                  ///< Longest allowed gap in calendar days

            static ValidationThresholds from_json(const nlohmann::json &j);
        };

        /**
         * @struct CheckResult
         * @brief Outcome of one check.
         */
        struct CheckResult
        {
            bool passed = true;
            std::string message;
            std::vector<std::string> warnings; ///< Soft findings that do not fail the check

            nlohmann::json to_json() const;
            static CheckResult from_json(const nlohmann::json &j);
        };

        /**
         * @struct ValidationReport
         * @brief The three named checks for one series.
         */
        struct ValidationReport
        {
            CheckResult total_return;
            CheckResult consistency;
            CheckResult completeness;

            /** @brief Conjunction of the three checks. */
            bool is_valid() const;

            /** @brief "name: message" for every failed check. */
            std::vector<std::string> failures() const;

            /**
             * @brief JSON object keyed by check name, each {valid, message, warnings}.
             */
            nlohmann::json to_json() const;

            /**
             * @brief Parse the form written by to_json().
             * @throws nlohmann::json::exception on a malformed document.
             */
            static ValidationReport from_json(const nlohmann::json &j);
        };

        /**
         * @struct SourceComparison
         * @brief Agreement of two series of one instrument on their common dates.
         */
        struct SourceComparison
        {
            size_t common_dates = 0;
            std::string first_common_date;
            std::string last_common_date;
            double max_abs_diff = 0.0;
            double mean_abs_diff = 0.0;
            double max_rel_diff_pct = 0.0;  ///< Relative to the first series, in percent
            double mean_rel_diff_pct = 0.0;
            double correlation = 0.0;       ///< Pearson correlation of prices

            nlohmann::json to_json() const;
        };

        /**
         * @class DataValidator
         * @brief Runs the three checks.
         *
         * Usage:
         * @code
         *   DataValidator validator;
         *   auto report = validator.validate(series);
         *   if (!report.is_valid()) validator.log_report("IE00B4L5Y983", report);
         * @endcode
         */
        class DataValidator
        {
        public:
            explicit DataValidator(ValidationThresholds thresholds = ValidationThresholds{},
                                   double ex_distribution_threshold =
                                       analytics::TotalReturnCalculator::DEFAULT_EX_DISTRIBUTION_THRESHOLD);

            /** @brief Run all three checks. */
            ValidationReport validate(const data::PriceSeries &series) const;

            CheckResult check_total_return(const data::PriceSeries &series) const;
            CheckResult check_consistency(const data::PriceSeries &series) const;
            CheckResult check_completeness(const data::PriceSeries &series) const;

            /**
             * @brief Print failed checks and warnings to std::cerr.
             */
            void log_report(const std::string &identifier, const ValidationReport &report) const;

            /**
             * @brief Compare the prices of two series on their common dates.
             * @return std::nullopt if the series share no date.
             */
            static std::optional<SourceComparison> compare_sources(const data::PriceSeries &a,
                                                                   const data::PriceSeries &b);

            const ValidationThresholds &thresholds() const { return thresholds_; }

        private:
            ValidationThresholds thresholds_;
            analytics::TotalReturnCalculator calculator_;
        };

    } // namespace validation
} // namespace fundscope

#endif // FUNDSCOPE_VALIDATION_DATA_VALIDATOR_HPP
