/**
 * @file adjustment_classifier.hpp
 * @brief Decides whether fetched prices are raw or total-return adjusted.
 *
 * Domestic mutual funds (identifier country equal to the home market and a
 * fund-shaped ticker such as PRHSX) are quoted by market-data providers with
 * a native adjusted close that already contains reinvested distributions.
 * Everything else is kept raw, with distributions as separate fields for
 * the total return calculator. Vendors that only ever deliver an adjusted
 * close override the heuristic.
 */

#ifndef FUNDSCOPE_ADJUSTMENT_ADJUSTMENT_CLASSIFIER_HPP
#define FUNDSCOPE_ADJUSTMENT_ADJUSTMENT_CLASSIFIER_HPP

#include "analytics/total_return.hpp"
#include "data/price_series.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fundscope
{
    namespace adjustment
    {

        /**
         * @struct MarketConvention
         * @brief Fund-ticker convention of the home market.
         */
        struct MarketConvention
        {
            std::string home_country = "US"; ///< ISIN country code of the home market
            size_t fund_ticker_length = 5;   ///< Length of a fund ticker
            char fund_ticker_suffix = 'X';   ///< Terminal letter of a fund ticker

            static MarketConvention from_json(const nlohmann::json &j);

            /** @brief True if @p ticker has the home market's fund shape. */
            bool is_fund_ticker(const std::string &ticker) const;
        };

        /** @brief Home-market fund quoted with a native adjusted close. */
        struct DomesticAdjustedFund
        {
            std::string identifier;
            std::string ticker;
        };

        /** @brief ETF, equity, index or non-domestic fund: raw close plus distributions. */
        struct ForeignOrEquityOrETF
        {
            std::string identifier;
        };

        using InstrumentClass = std::variant<DomesticAdjustedFund, ForeignOrEquityOrETF>;

        /**
         * @brief Classify an instrument from its identifier and ticker.
         *
         * A fund-shaped ticker is required. With an ISIN, its country code must
         * also be the home country. A bare fund-shaped ticker with no ISIN
         * counts as domestic.
         *
         * @param identifier ISIN or ticker.
         * @param ticker Ticker the instrument trades under, if known.
         */
        InstrumentClass classify_instrument(const std::string &identifier,
                                            const std::optional<std::string> &ticker,
                                            const MarketConvention &convention = MarketConvention{});

        /** @brief True for DomesticAdjustedFund. */
        bool is_domestic_adjusted(const InstrumentClass &cls);

        /**
         * @enum VendorAdjustment
         * @brief What a vendor is known to deliver.
         */
        enum class VendorAdjustment
        {
            RAW_WITH_DISTRIBUTIONS, ///< Close plus separate dividend/capital gain events
            ALWAYS_ADJUSTED         ///< Only an adjusted close; no distribution events
        };

        /**
         * @brief Vendors whose price column is always total-return adjusted.
         */
        const std::vector<std::string> &adjusted_vendor_names();

        /**
         * @brief True if @p source_name mentions an adjusted vendor ("Alpha Vantage (PRHSX)" matches).
         */
        bool source_reports_adjusted_prices(const std::string &source_name);

        /**
         * @struct RawQuoteHistory
         * @brief Columns as returned by a source, before classification.
         *
         * adjusted_close is empty when the source has no such field. Entries
         * may be NaN where the provider reported null.
         */
        struct RawQuoteHistory
        {
            std::vector<std::string> dates;
            std::vector<double> close;
            std::vector<double> adjusted_close;
            std::vector<double> dividends;
            std::vector<double> capital_gains;

            size_t size() const { return dates.size(); }
            bool empty() const { return dates.empty(); }
            bool has_adjusted_close() const { return !adjusted_close.empty(); }

            /**
             * @brief Append one row.
             * @param adjusted NaN when the source supplies no adjusted close.
             */
            void add(const std::string &date, double close_price, double adjusted,
                     double dividend = 0.0, double capital_gain = 0.0);

            /**
             * @brief Check column sizes.
             * @throws std::invalid_argument when columns disagree in length.
             */
            void validate() const;
        };

        /**
         * @class AdjustmentClassifier
         * @brief Applies the adjustment rules to a fetched history.
         */
        class AdjustmentClassifier
        {
        public:
            explicit AdjustmentClassifier(MarketConvention convention = MarketConvention{},
                                          double ex_distribution_threshold =
                                              analytics::TotalReturnCalculator::DEFAULT_EX_DISTRIBUTION_THRESHOLD);

            InstrumentClass classify(const std::string &identifier,
                                     const std::optional<std::string> &ticker) const;

            /**
             * @brief Build the canonical series.
             *
             * An always-adjusted vendor or a domestic fund yields an adjusted
             * series: the native adjusted close where present, otherwise a
             * reconstruction from close and distributions. Everything else
             * yields a raw series that keeps its distributions.
             * Rows without a usable price are dropped.
             */
            data::PriceSeries apply(const RawQuoteHistory &raw,
                                    const InstrumentClass &cls,
                                    VendorAdjustment vendor) const;

            const MarketConvention &convention() const { return convention_; }

        private:
            MarketConvention convention_;
            analytics::TotalReturnCalculator calculator_;
        };

    } // namespace adjustment
} // namespace fundscope

#endif // FUNDSCOPE_ADJUSTMENT_ADJUSTMENT_CLASSIFIER_HPP
