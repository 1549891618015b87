/**
 * @file data_validator.cpp
 * @brief Implementation of DataValidator.
 */

#include "validation/data_validator.hpp"
#include "data/calendar.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fundscope
{
    namespace validation
    {

        namespace
        {
            std::string percent(double fraction, int precision = 2)
            {
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(precision) << fraction * 100.0 << "%";
                return oss.str();
            }
        } // anonymous namespace

        // ===================================================================
        // Serialization
        // ===================================================================

        ValidationThresholds ValidationThresholds::from_json(const nlohmann::json &j)
        {
            ValidationThresholds t;
            t.max_daily_change = j.value("max_daily_change", 0.20);
            t.suspicious_daily_change = j.value("suspicious_daily_change", 0.10);
            t.max_gap_days = j.value("max_gap_days", 5);
            if (t.suspicious_daily_change > t.max_daily_change)
            {
                throw std::invalid_argument("suspicious_daily_change must not exceed max_daily_change");
            }
            if (t.max_gap_days < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'max_gap_days', got: " + std::to_string(t.max_gap_days));
            }
            return t;
        }

        nlohmann::json CheckResult::to_json() const
        {
            return {{"valid", passed}, {"message", message}, {"warnings", warnings}};
        }

        CheckResult CheckResult::from_json(const nlohmann::json &j)
        {
            CheckResult r;
            r.passed = j.at("valid").get<bool>();
            r.message = j.value("message", std::string());
            r.warnings = j.value("warnings", std::vector<std::string>{});
            return r;
        }

        bool ValidationReport::is_valid() const
        {
            return total_return.passed && consistency.passed && completeness.passed;
        }

        std::vector<std::string> ValidationReport::failures() const
        {
            std::vector<std::string> out;
            if (!total_return.passed)
                out.push_back("total_return: " + total_return.message);
            if (!consistency.passed)
                out.push_back("consistency: " + consistency.message);
            if (!completeness.passed)
                out.push_back("completeness: " + completeness.message);
            return out;
        }

        nlohmann::json ValidationReport::to_json() const
        {
            return {{"total_return", total_return.to_json()},
                    {"consistency", consistency.to_json()},
                    {"completeness", completeness.to_json()}};
        }

        ValidationReport ValidationReport::from_json(const nlohmann::json &j)
        {
            ValidationReport report;
            report.total_return = CheckResult::from_json(j.at("total_return"));
            report.consistency = CheckResult::from_json(j.at("consistency"));
            report.completeness = CheckResult::from_json(j.at("completeness"));
            return report;
        }

        nlohmann::json SourceComparison::to_json() const
        {
            return {{"common_dates", common_dates},
                    {"date_range", {first_common_date, last_common_date}},
                    {"max_abs_diff", max_abs_diff},
                    {"mean_abs_diff", mean_abs_diff},
                    {"max_rel_diff_pct", max_rel_diff_pct},
                    {"mean_rel_diff_pct", mean_rel_diff_pct},
                    {"correlation", correlation}};
        }

        // ===================================================================
        // DataValidator
        // ===================================================================

        DataValidator::DataValidator(ValidationThresholds thresholds, double ex_distribution_threshold)
            : thresholds_(thresholds), calculator_(ex_distribution_threshold)
        {
        }

        ValidationReport DataValidator::validate(const data::PriceSeries &series) const
        {
            ValidationReport report;
            report.total_return = check_total_return(series);
            report.consistency = check_consistency(series);
            report.completeness = check_completeness(series);
            return report;
        }

        CheckResult DataValidator::check_total_return(const data::PriceSeries &series) const
        {
            CheckResult result;
            if (series.size() < 2)
            {
                result.passed = false;
                result.message = "Not enough observations (" + std::to_string(series.size()) + ")";
                return result;
            }

            double price_return = series.price_return_ratio() - 1.0;

            if (series.is_adjusted())
            {
                result.message = "Adjusted prices already include distributions (price return " +
                                 percent(price_return) + ")";
                return result;
            }
            if (!series.has_distributions())
            {
                result.message = "No distributions; total return equals price return (" +
                                 percent(price_return) + ")";
                return result;
            }

            double total_return = calculator_.compute(series, "").ratio() - 1.0;
            result.passed = total_return >= price_return;
            result.message = "Total return " + percent(total_return) +
                             (result.passed ? " >= " : " < ") + "price return " + percent(price_return);
            return result;
        }

        CheckResult DataValidator::check_consistency(const data::PriceSeries &series) const
        {
            CheckResult result;
            if (series.size() < 2)
            {
                result.message = "Not enough observations to measure daily changes";
                return result;
            }

            double max_change = 0.0;
            std::string max_date;
            int hard_failures = 0;

            for (size_t t = 1; t < series.size(); ++t)
            {
                double change = series[t].price / series[t - 1].price - 1.0;
                double magnitude = std::abs(change);

                if (magnitude > max_change)
                {
                    max_change = magnitude;
                    max_date = series[t].date;
                }

                if (magnitude > thresholds_.max_daily_change)
                {
                    ++hard_failures;
                }
                else if (magnitude > thresholds_.suspicious_daily_change)
                {
                    result.warnings.push_back("Suspicious change of " + percent(change) + " on " + series[t].date);
                }
            }

            if (hard_failures > 0)
            {
                result.passed = false;
                result.message = std::to_string(hard_failures) + " daily change(s) above " +
                                 percent(thresholds_.max_daily_change, 0) + ", largest " + percent(max_change) +
                                 " on " + max_date;
            }
            else if (!result.warnings.empty())
            {
                result.message = "OK with " + std::to_string(result.warnings.size()) +
                                 " suspicious change(s), largest " + percent(max_change) + " on " + max_date;
            }
            else
            {
                result.message = "OK - largest daily change " + percent(max_change);
            }
            return result;
        }

        CheckResult DataValidator::check_completeness(const data::PriceSeries &series) const
        {
            CheckResult result;
            if (series.empty())
            {
                result.passed = false;
                result.message = "No observations";
                return result;
            }

            int64_t max_gap = 0;
            std::string gap_start;
            for (size_t t = 1; t < series.size(); ++t)
            {
                int64_t gap = data::days_between(series[t - 1].date, series[t].date);
                if (gap > max_gap)
                {
                    max_gap = gap;
                    gap_start = series[t - 1].date;
                }
            }

            std::string span = series.front().date + " to " + series.back().date;
            if (max_gap > thresholds_.max_gap_days)
            {
                result.passed = false;
                result.message = "Gap of " + std::to_string(max_gap) + " days after " + gap_start +
                                 " (limit " + std::to_string(thresholds_.max_gap_days) + "), " + span;
            }
            else
            {
                result.message = "OK - " + std::to_string(series.size()) + " observations, " + span +
                                 ", largest gap " + std::to_string(max_gap) + " days";
            }
            return result;
        }

        void DataValidator::log_report(const std::string &identifier, const ValidationReport &report) const
        {
            for (const auto &failure : report.failures())
            {
                std::cerr << "Warning: " << identifier << " failed validation - " << failure << std::endl;
            }
            for (const auto &warning : report.consistency.warnings)
            {
                std::cerr << "Warning: " << identifier << " - " << warning << std::endl;
            }
        }

        std::optional<SourceComparison> DataValidator::compare_sources(const data::PriceSeries &a,
                                                                       const data::PriceSeries &b)
        {
            std::vector<double> pa;
            std::vector<double> pb;
            SourceComparison cmp;

            for (const auto &rec : a.records())
            {
                auto j = b.index_of(rec.date);
                if (!j)
                {
                    continue;
                }
                if (pa.empty())
                {
                    cmp.first_common_date = rec.date;
                }
                cmp.last_common_date = rec.date;
                pa.push_back(rec.price);
                pb.push_back(b[*j].price);
            }

            if (pa.empty())
            {
                return std::nullopt;
            }

            Eigen::Map<const Eigen::VectorXd> va(pa.data(), static_cast<Eigen::Index>(pa.size()));
            Eigen::Map<const Eigen::VectorXd> vb(pb.data(), static_cast<Eigen::Index>(pb.size()));

            Eigen::ArrayXd abs_diff = (va - vb).array().abs();
            Eigen::ArrayXd rel_diff = abs_diff / va.array() * 100.0;

            cmp.common_dates = pa.size();
            cmp.max_abs_diff = abs_diff.maxCoeff();
            cmp.mean_abs_diff = abs_diff.mean();
            cmp.max_rel_diff_pct = rel_diff.maxCoeff();
            cmp.mean_rel_diff_pct = rel_diff.mean();

            if (pa.size() > 1)
            {
                Eigen::ArrayXd da = va.array() - va.mean();
                Eigen::ArrayXd db = vb.array() - vb.mean();
                double denom = std::sqrt((da * da).sum() * (db * db).sum());
                cmp.correlation = denom > 0.0 ? (da * db).sum() / denom : 0.0;
            }

            return cmp;
        }

    } // namespace validation
} // namespace fundscope
