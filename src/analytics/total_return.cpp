/**
 * @file total_return.cpp
 * @brief Implementation of TotalReturnCalculator.
 */

#include "analytics/total_return.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace fundscope
{
    namespace analytics
    {

        namespace
        {
            bool usable(double price)
            {
                return std::isfinite(price) && price > 0.0;
            }
        } // anonymous namespace

        double TotalReturnSeries::ratio() const
        {
            if (values.empty())
            {
                throw std::runtime_error("Total return series for '" + instrument + "' is empty");
            }
            return values.back() / values.front();
        }

        TotalReturnCalculator::TotalReturnCalculator(double ex_distribution_threshold)
            : threshold_(ex_distribution_threshold)
        {
        }

        double TotalReturnCalculator::daily_multiplier(double prev, double curr, double distribution) const
        {
            if (!usable(prev) || !usable(curr))
            {
                return std::numeric_limits<double>::quiet_NaN();
            }

            double change = curr / prev - 1.0;
            if (distribution > 0.0 && change < threshold_)
            {
                return (curr + distribution) / prev;
            }
            return curr / prev;
        }

        TotalReturnSeries TotalReturnCalculator::compute(const data::PriceSeries &series,
                                                         const std::string &instrument) const
        {
            TotalReturnSeries result;
            result.instrument = instrument;
            if (series.empty())
            {
                return result;
            }

            result.dates = series.dates();
            result.values.resize(series.size());
            result.values[0] = series[0].price;

            for (size_t t = 1; t < series.size(); ++t)
            {
                double prev = series[t - 1].price;
                double curr = series[t].price;
                double multiplier = series.is_adjusted()
                                        ? curr / prev
                                        : daily_multiplier(prev, curr, series[t].distribution());
                result.values[t] = result.values[t - 1] * multiplier;
            }

            if (!series.is_adjusted() && series.has_distributions())
            {
                double tr = result.ratio();
                double pr = series.price_return_ratio();
                if (tr < pr)
                {
                    std::cerr << "Warning: total return below price return for " << instrument
                              << " (" << tr << " < " << pr << ")" << std::endl;
                }
            }

            return result;
        }

        std::vector<double> TotalReturnCalculator::reconstruct_adjusted_prices(
            const std::vector<double> &close,
            const std::vector<double> &dividends,
            const std::vector<double> &capital_gains) const
        {
            if (close.size() != dividends.size() || close.size() != capital_gains.size())
            {
                throw std::invalid_argument(
                    "Close (" + std::to_string(close.size()) + "), dividend (" + std::to_string(dividends.size()) +
                    ") and capital gain (" + std::to_string(capital_gains.size()) + ") columns must have equal size");
            }

            const double nan = std::numeric_limits<double>::quiet_NaN();
            std::vector<double> adjusted(close.size(), nan);

            size_t start = 0;
            while (start < close.size() && !usable(close[start]))
            {
                ++start;
            }
            if (start == close.size())
            {
                return adjusted;
            }

            adjusted[start] = close[start];
            for (size_t t = start + 1; t < close.size(); ++t)
            {
                double dist = (std::isfinite(dividends[t]) ? dividends[t] : 0.0) +
                              (std::isfinite(capital_gains[t]) ? capital_gains[t] : 0.0);
                double multiplier = daily_multiplier(close[t - 1], close[t], dist);
                adjusted[t] = std::isnan(multiplier) ? adjusted[t - 1] : adjusted[t - 1] * multiplier;
            }

            return adjusted;
        }

    } // namespace analytics
} // namespace fundscope
