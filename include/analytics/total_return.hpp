/**
 * @file total_return.hpp
 * @brief Cumulative total-return series without double-counted distributions.
 *
 * Three cases are handled:
 *  - adjusted prices: cumulative product of price ratios, no distribution terms;
 *  - raw prices, reconstructed adjusted column: daily multiplier rule below;
 *  - raw prices, direct total return: same multiplier rule, returned as a
 *    TotalReturnSeries.
 *
 * Daily multiplier for prev = p[t-1], curr = p[t], dist = dividend + capital gain:
 *   dist == 0                              -> curr / prev
 *   dist > 0 and curr / prev - 1 < thresh  -> (curr + dist) / prev
 *   dist > 0 otherwise                     -> curr / prev
 *
 * thresh defaults to -1%: a price drop below it marks an ex-distribution
 * day, anything else is treated as already reflecting the distribution.
 */

#ifndef FUNDSCOPE_ANALYTICS_TOTAL_RETURN_HPP
#define FUNDSCOPE_ANALYTICS_TOTAL_RETURN_HPP

#include "data/price_series.hpp"

#include <string>
#include <vector>

namespace fundscope
{
    namespace analytics
    {

        /**
         * @struct TotalReturnSeries
         * @brief Cumulative total-return values for one instrument, one per date.
         */
        struct TotalReturnSeries
        {
            std::string instrument;         ///< Identifier of the instrument
            std::vector<std::string> dates; ///< Ascending dates
            std::vector<double> values;     ///< Cumulative value seeded at the first price

            size_t size() const { return values.size(); }
            bool empty() const { return values.empty(); }

            /**
             * @brief values.back() / values.front().
             * @throws std::runtime_error if empty.
             */
            double ratio() const;
        };

        /**
         * @class TotalReturnCalculator
         * @brief Computes total-return series and reconstructed adjusted prices.
         */
        class TotalReturnCalculator
        {
        public:
            /** @brief Default ex-distribution drop threshold (-1%). */
            static constexpr double DEFAULT_EX_DISTRIBUTION_THRESHOLD = -0.01;

            /**
             * @brief Constructor.
             * @param ex_distribution_threshold Day-over-day change below which a
             *        distribution day counts as an ex-distribution day.
             */
            explicit TotalReturnCalculator(double ex_distribution_threshold = DEFAULT_EX_DISTRIBUTION_THRESHOLD);

            /**
             * @brief Daily multiplier for one step.
             * @return Multiplier, or NaN when @p prev or @p curr is not a usable price.
             */
            double daily_multiplier(double prev, double curr, double distribution) const;

            /**
             * @brief Total-return series of a price series.
             *
             * Adjusted series compound price ratios only. Raw series apply the
             * multiplier rule. Logs a warning when a raw series with positive
             * distributions ends below its price-only return.
             *
             * @param series Input series (may be empty).
             * @param instrument Identifier stored in the result.
             */
            TotalReturnSeries compute(const data::PriceSeries &series, const std::string &instrument) const;

            /**
             * @brief Reconstruct an adjusted close column from raw closes and distributions.
             *
             * Seeded at the first usable price. A step with an unusable price
             * carries the previous adjusted value forward. Leading unusable
             * prices stay NaN.
             *
             * @throws std::invalid_argument if the three vectors differ in size.
             */
            std::vector<double> reconstruct_adjusted_prices(const std::vector<double> &close,
                                                            const std::vector<double> &dividends,
                                                            const std::vector<double> &capital_gains) const;

            double ex_distribution_threshold() const { return threshold_; }

        private:
            double threshold_;
        };

    } // namespace analytics
} // namespace fundscope

#endif // FUNDSCOPE_ANALYTICS_TOTAL_RETURN_HPP
