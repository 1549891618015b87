/**
 * @file benchmark_analysis.hpp
 * @brief Benchmark selection and beta against a benchmark series.
 *
 * The benchmark is picked from the identifier's country code: the domestic
 * index for home-market identifiers, a broad regional index for European
 * ones, the domestic index when the identifier is ambiguous.
 *
 * Beta is estimated by the regression
 *   R_i = alpha + beta * R_b + epsilon
 * on daily simple returns of date-aligned series, so
 *   beta = Cov(R_i, R_b) / Var(R_b).
 */

#ifndef FUNDSCOPE_ANALYTICS_BENCHMARK_ANALYSIS_HPP
#define FUNDSCOPE_ANALYTICS_BENCHMARK_ANALYSIS_HPP

#include "analytics/total_return.hpp"

#include <Eigen/Dense>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace fundscope
{
    namespace analytics
    {

        /**
         * @struct BenchmarkChoice
         * @brief Benchmark ticker and display name.
         */
        struct BenchmarkChoice
        {
            std::string ticker; ///< e.g. "SPY"
            std::string name;   ///< e.g. "S&P 500"
        };

        /**
         * @brief Benchmark for an identifier.
         *
         * "US" ISINs and short alphabetic tickers map to SPY (S&P 500);
         * ISINs from LU IE FR DE IT ES NL GB BE AT CH SE NO DK FI map to
         * EZU (Euro Stoxx 50); anything else defaults to SPY.
         */
        BenchmarkChoice select_benchmark(const std::string &identifier);

        /**
         * @struct AlignedReturns
         * @brief Daily simple returns of two series on their common dates.
         */
        struct AlignedReturns
        {
            std::vector<std::string> dates; ///< Date of each return (the later day)
            Eigen::VectorXd instrument;
            Eigen::VectorXd benchmark;
            size_t aligned_prices = 0;      ///< Common dates before differencing
        };

        /**
         * @brief Inner-join two series on date and difference them into returns.
         */
        AlignedReturns align_returns(const TotalReturnSeries &instrument,
                                     const TotalReturnSeries &benchmark);

        /**
         * @struct RegressionResult
         * @brief Results of the single-factor regression.
         */
        struct RegressionResult
        {
            double alpha = 0.0;         ///< Annualized intercept
            double alpha_daily = 0.0;   ///< Raw intercept
            double beta = 0.0;          ///< Slope (benchmark sensitivity)
            double r_squared = 0.0;     ///< Coefficient of determination
            double correlation = 0.0;   ///< Pearson correlation of returns
            int num_observations = 0;   ///< Returns in the regression
        };

        /**
         * @class BenchmarkAnalysis
         * @brief Relative statistics of an instrument against its benchmark.
         *
         * Usage:
         * @code
         *   BenchmarkAnalysis bench(fund_tr, spy_tr);
         *   double beta = bench.beta();
         * @endcode
         */
        class BenchmarkAnalysis
        {
        public:
            /** @brief Minimum aligned observations for a reliable beta. */
            static constexpr int MIN_OBSERVATIONS = 30;

            /**
             * @brief Construct from two total-return (or price) series.
             * @throws std::invalid_argument if fewer than @p min_observations
             *         aligned prices or returns exist, or the benchmark has zero variance.
             */
            BenchmarkAnalysis(const TotalReturnSeries &instrument,
                              const TotalReturnSeries &benchmark,
                              int min_observations = MIN_OBSERVATIONS,
                              int trading_days_per_year = 252);

            ~BenchmarkAnalysis() = default;

            double beta() const { return regression_.beta; }
            double alpha() const { return regression_.alpha; }
            double r_squared() const { return regression_.r_squared; }
            const RegressionResult &regression() const { return regression_; }

            /**
             * @brief Annualized standard deviation of instrument minus benchmark returns.
             */
            double tracking_error() const { return tracking_error_; }

            nlohmann::json to_json() const;

        private:
            void run_regression();

            AlignedReturns returns_;
            int trading_days_per_year_;
            RegressionResult regression_;
            double tracking_error_ = 0.0;
        };

        /**
         * @brief Beta of @p instrument against @p benchmark, if computable.
         *
         * Shorthand for BenchmarkAnalysis(...).beta() that maps the
         * not-computable cases to std::nullopt.
         *
         * @return std::nullopt when fewer than @p min_observations aligned
         *         observations exist or the benchmark return variance is zero.
         */
        std::optional<double> compute_beta(const TotalReturnSeries &instrument,
                                           const TotalReturnSeries &benchmark,
                                           int min_observations = BenchmarkAnalysis::MIN_OBSERVATIONS);

    } // namespace analytics
} // namespace fundscope

#endif // FUNDSCOPE_ANALYTICS_BENCHMARK_ANALYSIS_HPP
