/**
 * @file performance_metrics.cpp
 * @brief Implementation of the PerformanceMetrics class.
 *
 * Annualized return compounds over calendar years (days / 365.25);
 * volatility scales the daily population standard deviation by
 * sqrt(trading_days_per_year).
 */

#include "analytics/performance_metrics.hpp"
#include "data/calendar.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace fundscope
{
    namespace analytics
    {

        namespace
        {
            nlohmann::json optional_json(const std::optional<double> &value)
            {
                return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
            }
        } // anonymous namespace

        // ===================================================================
        // MetricsBundle
        // ===================================================================

        nlohmann::json MetricsBundle::to_json() const
        {
            nlohmann::json j;
            j["total_return"] = optional_json(total_return);
            j["annualized_return"] = optional_json(annualized_return);
            j["volatility"] = optional_json(volatility);
            j["sharpe_ratio"] = optional_json(sharpe_ratio);
            j["sortino_ratio"] = optional_json(sortino_ratio);
            j["max_drawdown"] = optional_json(max_drawdown);
            j["beta"] = optional_json(beta);
            j["alpha"] = optional_json(alpha);
            j["correlation"] = optional_json(correlation);
            j["tracking_error"] = optional_json(tracking_error);
            j["benchmark"] = benchmark ? nlohmann::json(*benchmark) : nlohmann::json(nullptr);
            return j;
        }

        // ===================================================================
        // Constructor
        // ===================================================================

        PerformanceMetrics::PerformanceMetrics(const TotalReturnSeries &series,
                                               double risk_free_rate,
                                               int trading_days_per_year)
            : series_(series), risk_free_rate_(risk_free_rate), trading_days_per_year_(trading_days_per_year)
        {
            if (series_.empty())
            {
                throw std::invalid_argument("Series '" + series_.instrument + "' is empty");
            }
            if (series_.dates.size() != series_.values.size())
            {
                throw std::invalid_argument(
                    "Dates size (" + std::to_string(series_.dates.size()) + ") must match values size (" +
                    std::to_string(series_.values.size()) + ")");
            }
            if (trading_days_per_year <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'trading_days_per_year', got: " +
                    std::to_string(trading_days_per_year));
            }
            for (double v : series_.values)
            {
                if (!(v > 0.0) || !std::isfinite(v))
                {
                    throw std::invalid_argument("Series '" + series_.instrument + "' contains a non-positive value");
                }
            }

            returns_.reserve(series_.size() - 1);
            for (size_t t = 1; t < series_.size(); ++t)
            {
                returns_.push_back(series_.values[t] / series_.values[t - 1] - 1.0);
            }
        }

        // ===================================================================
        // Return Metrics
        // ===================================================================

        double PerformanceMetrics::total_return() const
        {
            return (series_.values.back() / series_.values.front() - 1.0) * 100.0;
        }

        std::optional<double> PerformanceMetrics::annualized_return() const
        {
            if (series_.size() < 2)
            {
                return std::nullopt;
            }
            double days = static_cast<double>(data::days_between(series_.dates.front(), series_.dates.back()));
            double years = days / 365.25;
            if (years <= 0.0)
            {
                return std::nullopt;
            }
            return (std::pow(series_.values.back() / series_.values.front(), 1.0 / years) - 1.0) * 100.0;
        }

        // ===================================================================
        // Risk Metrics
        // ===================================================================

        std::optional<double> PerformanceMetrics::volatility() const
        {
            if (returns_.empty())
            {
                return std::nullopt;
            }

            double n = static_cast<double>(returns_.size());
            double mean = std::accumulate(returns_.begin(), returns_.end(), 0.0) / n;

            double sum_sq = 0.0;
            for (double r : returns_)
            {
                double diff = r - mean;
                sum_sq += diff * diff;
            }
            return std::sqrt(sum_sq / n) * std::sqrt(static_cast<double>(trading_days_per_year_)) * 100.0;
        }

        std::optional<double> PerformanceMetrics::downside_deviation() const
        {
            if (returns_.empty())
            {
                return std::nullopt;
            }

            double sum_sq = 0.0;
            for (double r : returns_)
            {
                if (r < 0.0)
                {
                    sum_sq += r * r;
                }
            }
            double daily = std::sqrt(sum_sq / static_cast<double>(returns_.size()));
            return daily * std::sqrt(static_cast<double>(trading_days_per_year_)) * 100.0;
        }

        std::vector<double> PerformanceMetrics::drawdown_series() const
        {
            std::vector<double> drawdowns(series_.size());
            double peak = series_.values.front();
            for (size_t t = 0; t < series_.size(); ++t)
            {
                peak = std::max(peak, series_.values[t]);
                drawdowns[t] = (series_.values[t] - peak) / peak * 100.0;
            }
            return drawdowns;
        }

        double PerformanceMetrics::max_drawdown() const
        {
            auto drawdowns = drawdown_series();
            return *std::min_element(drawdowns.begin(), drawdowns.end());
        }

        // ===================================================================
        // Risk-Adjusted Metrics
        // ===================================================================

        std::optional<double> PerformanceMetrics::sharpe_ratio() const
        {
            auto ann = annualized_return();
            auto vol = volatility();
            if (!ann || !vol || *vol <= 0.0)
            {
                return std::nullopt;
            }
            return (*ann - risk_free_rate_ * 100.0) / *vol;
        }

        std::optional<double> PerformanceMetrics::sortino_ratio() const
        {
            auto ann = annualized_return();
            auto dd = downside_deviation();
            if (!ann || !dd || *dd <= 0.0)
            {
                return std::nullopt;
            }
            return (*ann - risk_free_rate_ * 100.0) / *dd;
        }

        // ===================================================================
        // Export
        // ===================================================================

        MetricsBundle PerformanceMetrics::bundle() const
        {
            MetricsBundle b;
            b.instrument = series_.instrument;
            b.total_return = total_return();
            b.annualized_return = annualized_return();
            b.volatility = volatility();
            b.sharpe_ratio = sharpe_ratio();
            b.sortino_ratio = sortino_ratio();
            b.max_drawdown = max_drawdown();
            return b;
        }

        std::string PerformanceMetrics::summary() const
        {
            auto fmt = [](const std::optional<double> &v, const char *unit)
            {
                std::ostringstream oss;
                if (v)
                {
                    oss << std::fixed << std::setprecision(2) << *v << unit;
                }
                else
                {
                    oss << "n/a";
                }
                return oss.str();
            };

            std::ostringstream oss;
            oss << "Performance: " << series_.instrument << "\n";
            oss << "  Period:             " << series_.dates.front() << " to " << series_.dates.back() << "\n";
            oss << "  Total Return:       " << fmt(total_return(), "%") << "\n";
            oss << "  Annualized Return:  " << fmt(annualized_return(), "%") << "\n";
            oss << "  Volatility:         " << fmt(volatility(), "%") << "\n";
            oss << "  Sharpe Ratio:       " << fmt(sharpe_ratio(), "") << "\n";
            oss << "  Sortino Ratio:      " << fmt(sortino_ratio(), "") << "\n";
            oss << "  Max Drawdown:       " << fmt(max_drawdown(), "%") << "\n";
            return oss.str();
        }

    } // namespace analytics
} // namespace fundscope
