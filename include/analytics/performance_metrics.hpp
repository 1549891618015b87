/**
 * @file performance_metrics.hpp
 * @brief Performance metrics of a normalized total-return series.
 *
 * All outputs are percentages except the ratios:
 *  - total_return       = (v[-1] / v[0] - 1) * 100
 *  - annualized_return  = ((v[-1] / v[0])^(1 / years) - 1) * 100,
 *                         years = calendar days / 365.25
 *  - volatility         = population std-dev of daily returns * sqrt(252) * 100
 *  - sharpe_ratio       = (annualized_return - risk_free) / volatility
 *  - max_drawdown       = min over t of (v[t] - max(v[..t])) / max(v[..t]) * 100
 */

#ifndef FUNDSCOPE_ANALYTICS_PERFORMANCE_METRICS_HPP
#define FUNDSCOPE_ANALYTICS_PERFORMANCE_METRICS_HPP

#include "analytics/total_return.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace fundscope
{
    namespace analytics
    {

        /**
         * @struct MetricsBundle
         * @brief Per-instrument metrics handed to report renderers.
         *
         * Values are std::nullopt where the series is too short to define them.
         */
        struct MetricsBundle
        {
            std::string instrument;
            std::optional<double> total_return;      ///< Percent
            std::optional<double> annualized_return; ///< Percent
            std::optional<double> volatility;        ///< Percent, annualized
            std::optional<double> sharpe_ratio;
            std::optional<double> sortino_ratio;
            std::optional<double> max_drawdown;      ///< Percent, <= 0
            std::optional<double> beta;
            std::optional<double> alpha;             ///< Percent, annualized regression intercept
            std::optional<double> correlation;       ///< Of daily returns with the benchmark
            std::optional<double> tracking_error;    ///< Percent, annualized
            std::optional<std::string> benchmark;    ///< Benchmark display name

            /** @brief JSON object; absent values are written as null. */
            nlohmann::json to_json() const;
        };

        /**
         * @class PerformanceMetrics
         * @brief Return, risk and risk-adjusted metrics of one value series.
         *
         * Usage:
         * @code
         *   PerformanceMetrics metrics(normalized);
         *   auto bundle = metrics.bundle();
         * @endcode
         */
        class PerformanceMetrics
        {
        public:
            /**
             * @brief Constructor.
             * @param series Value series (dates ascending, values positive).
             * @param risk_free_rate Annualized risk-free rate as a fraction (default 0).
             * @param trading_days_per_year Annualization factor for volatility (default 252).
             * @throws std::invalid_argument if the series is empty, sizes differ,
             *         or a value is not positive.
             */
            explicit PerformanceMetrics(const TotalReturnSeries &series,
                                        double risk_free_rate = 0.0,
                                        int trading_days_per_year = 252);

            ~PerformanceMetrics() = default;

            // ---------------------------------------------------------------
            // Return Metrics
            // ---------------------------------------------------------------

            /** @brief Total return in percent. */
            double total_return() const;

            /**
             * @brief Compound annual return in percent.
             * @return std::nullopt if the series spans zero calendar days.
             */
            std::optional<double> annualized_return() const;

            /** @brief Daily simple returns (size n - 1). */
            const std::vector<double> &daily_returns() const { return returns_; }

            // ---------------------------------------------------------------
            // Risk Metrics
            // ---------------------------------------------------------------

            /**
             * @brief Annualized volatility in percent.
             * @return std::nullopt with fewer than two values.
             */
            std::optional<double> volatility() const;

            /**
             * @brief Annualized downside deviation below zero, in percent.
             */
            std::optional<double> downside_deviation() const;

            /** @brief Most negative drawdown in percent (0 if never below a peak). */
            double max_drawdown() const;

            /** @brief Drawdown at every point in percent (non-positive). */
            std::vector<double> drawdown_series() const;

            // ---------------------------------------------------------------
            // Risk-Adjusted Metrics
            // ---------------------------------------------------------------

            /**
             * @brief (annualized_return - risk_free) / volatility.
             * @return std::nullopt if either input is undefined or volatility is zero.
             */
            std::optional<double> sharpe_ratio() const;

            /**
             * @brief (annualized_return - risk_free) / downside_deviation.
             */
            std::optional<double> sortino_ratio() const;

            // ---------------------------------------------------------------
            // Export
            // ---------------------------------------------------------------

            /** @brief All metrics for this series (beta and benchmark unset). */
            MetricsBundle bundle() const;

            /** @brief Multi-line human-readable summary. */
            std::string summary() const;

        private:
            TotalReturnSeries series_;
            std::vector<double> returns_;
            double risk_free_rate_;
            int trading_days_per_year_;
        };

    } // namespace analytics
} // namespace fundscope

#endif // FUNDSCOPE_ANALYTICS_PERFORMANCE_METRICS_HPP
