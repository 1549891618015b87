/**
 * @file benchmark_analysis.cpp
 * @brief Implementation of benchmark selection and BenchmarkAnalysis.
 *
 * Beta uses sample (n - 1) covariance and variance; the ratio is the same
 * as with population moments.
 */

#include "analytics/benchmark_analysis.hpp"
#include "data/identifier.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <stdexcept>

namespace fundscope
{
    namespace analytics
    {

        // ===================================================================
        // Benchmark selection
        // ===================================================================

        BenchmarkChoice select_benchmark(const std::string &identifier)
        {
            static const BenchmarkChoice domestic{"SPY", "S&P 500"};
            static const BenchmarkChoice europe{"EZU", "Euro Stoxx 50"};
            static const std::set<std::string> european_codes = {
                "LU", "IE", "FR", "DE", "IT", "ES", "NL", "GB", "BE", "AT", "CH", "SE", "NO", "DK", "FI"};

            auto id = data::InstrumentId::parse(identifier);
            if (id.is_isin())
            {
                if (id.country_code() == "US")
                {
                    return domestic;
                }
                if (european_codes.count(id.country_code()) > 0)
                {
                    return europe;
                }
            }
            return domestic;
        }

        // ===================================================================
        // Alignment
        // ===================================================================

        AlignedReturns align_returns(const TotalReturnSeries &instrument,
                                     const TotalReturnSeries &benchmark)
        {
            std::map<std::string, double> bench_by_date;
            for (size_t i = 0; i < benchmark.size(); ++i)
            {
                if (std::isfinite(benchmark.values[i]))
                {
                    bench_by_date[benchmark.dates[i]] = benchmark.values[i];
                }
            }

            std::vector<std::string> dates;
            std::vector<double> a;
            std::vector<double> b;
            for (size_t i = 0; i < instrument.size(); ++i)
            {
                auto it = bench_by_date.find(instrument.dates[i]);
                if (it != bench_by_date.end() && std::isfinite(instrument.values[i]))
                {
                    dates.push_back(instrument.dates[i]);
                    a.push_back(instrument.values[i]);
                    b.push_back(it->second);
                }
            }

            AlignedReturns out;
            out.aligned_prices = dates.size();

            std::vector<double> ra;
            std::vector<double> rb;
            for (size_t t = 1; t < dates.size(); ++t)
            {
                if (a[t - 1] == 0.0 || b[t - 1] == 0.0)
                {
                    continue;
                }
                out.dates.push_back(dates[t]);
                ra.push_back(a[t] / a[t - 1] - 1.0);
                rb.push_back(b[t] / b[t - 1] - 1.0);
            }

            out.instrument = Eigen::Map<Eigen::VectorXd>(ra.data(), static_cast<Eigen::Index>(ra.size()));
            out.benchmark = Eigen::Map<Eigen::VectorXd>(rb.data(), static_cast<Eigen::Index>(rb.size()));
            return out;
        }

        // ===================================================================
        // BenchmarkAnalysis
        // ===================================================================

        BenchmarkAnalysis::BenchmarkAnalysis(const TotalReturnSeries &instrument,
                                             const TotalReturnSeries &benchmark,
                                             int min_observations,
                                             int trading_days_per_year)
            : returns_(align_returns(instrument, benchmark)), trading_days_per_year_(trading_days_per_year)
        {
            if (trading_days_per_year <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'trading_days_per_year', got: " +
                    std::to_string(trading_days_per_year));
            }
            if (static_cast<int>(returns_.aligned_prices) < min_observations ||
                returns_.instrument.size() < min_observations)
            {
                throw std::invalid_argument(
                    "At least " + std::to_string(min_observations) + " aligned observations are required, got: " +
                    std::to_string(returns_.instrument.size()));
            }

            run_regression();

            Eigen::VectorXd excess = returns_.instrument - returns_.benchmark;
            double n = static_cast<double>(excess.size());
            double daily_te = std::sqrt((excess.array() - excess.mean()).square().sum() / (n - 1.0));
            tracking_error_ = daily_te * std::sqrt(static_cast<double>(trading_days_per_year_));
        }

        void BenchmarkAnalysis::run_regression()
        {
            const Eigen::VectorXd &x = returns_.benchmark;
            const Eigen::VectorXd &y = returns_.instrument;
            double n = static_cast<double>(x.size());

            Eigen::ArrayXd dx = x.array() - x.mean();
            Eigen::ArrayXd dy = y.array() - y.mean();

            double var_x = dx.square().sum() / (n - 1.0);
            double var_y = dy.square().sum() / (n - 1.0);
            double cov_xy = (dx * dy).sum() / (n - 1.0);

            if (!(var_x > 0.0))
            {
                throw std::invalid_argument("Benchmark returns have zero variance; beta is undefined");
            }

            regression_.beta = cov_xy / var_x;
            if (!std::isfinite(regression_.beta))
            {
                throw std::invalid_argument("Beta is not finite");
            }
            regression_.alpha_daily = y.mean() - regression_.beta * x.mean();
            regression_.alpha = regression_.alpha_daily * static_cast<double>(trading_days_per_year_);
            regression_.correlation = var_y > 0.0 ? cov_xy / std::sqrt(var_x * var_y) : 0.0;
            regression_.r_squared = regression_.correlation * regression_.correlation;
            regression_.num_observations = static_cast<int>(x.size());
        }

        nlohmann::json BenchmarkAnalysis::to_json() const
        {
            nlohmann::json j;
            j["beta"] = regression_.beta;
            j["alpha"] = regression_.alpha;
            j["r_squared"] = regression_.r_squared;
            j["correlation"] = regression_.correlation;
            j["num_observations"] = regression_.num_observations;
            j["tracking_error"] = tracking_error_;
            return j;
        }

        std::optional<double> compute_beta(const TotalReturnSeries &instrument,
                                           const TotalReturnSeries &benchmark,
                                           int min_observations)
        {
            try
            {
                return BenchmarkAnalysis(instrument, benchmark, min_observations).beta();
            }
            catch (const std::invalid_argument &)
            {
                // Too few aligned observations or a flat benchmark
                return std::nullopt;
            }
        }

    } // namespace analytics
} // namespace fundscope
