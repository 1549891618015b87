/**
 * @file price_series.hpp
 * @brief Canonical per-day record and the date-ordered series built from it.
 *
 * Every source, the cache, the validator and the total return calculator
 * exchange data as a PriceSeries. A series is ordered by date, holds one
 * record per date, and carries a single adjustment flag for all records.
 */

#ifndef FUNDSCOPE_DATA_PRICE_SERIES_HPP
#define FUNDSCOPE_DATA_PRICE_SERIES_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fundscope
{
    namespace data
    {

        /**
         * @struct DailyRecord
         * @brief One calendar day of one instrument.
         *
         * When is_adjusted is true the price already embeds reinvested
         * distributions and both distribution fields are zero.
         */
        struct DailyRecord
        {
            std::string date;          ///< Calendar date (YYYY-MM-DD)
            double price = 0.0;        ///< Close, raw or adjusted
            double dividend = 0.0;     ///< Cash distribution paid that day
            double capital_gain = 0.0; ///< Realized-gain distribution paid that day
            bool is_adjusted = false;  ///< Price already includes distributions

            /** @brief dividend + capital_gain. */
            double distribution() const { return dividend + capital_gain; }
        };

        /**
         * @class PriceSeries
         * @brief Date-ordered, date-unique sequence of DailyRecord with provenance.
         *
         * The constructor sorts records by date and keeps the last record seen
         * for a duplicated date. Apart from mark_adjusted(), a series is not
         * modified after construction; a refetch replaces it wholesale.
         *
         * @note The adjustment flag is a property of the whole series; mixing
         *       adjusted and raw records is rejected.
         */
        class PriceSeries
        {
        public:
            /** @brief Empty series. */
            PriceSeries() = default;

            /**
             * @brief Construct from records.
             * @param records Daily records in any order.
             * @param source_name Name of the source that produced the data.
             * @param fetched_at ISO-8601 timestamp of the fetch.
             * @throws std::invalid_argument on a malformed date, a non-positive or
             *         non-finite price, a negative distribution, mixed adjustment
             *         flags, or an adjusted record that carries distributions.
             */
            explicit PriceSeries(std::vector<DailyRecord> records,
                                 std::string source_name = "",
                                 std::string fetched_at = "");

            ~PriceSeries() = default;

            // ---------------------------------------------------------------
            // Access
            // ---------------------------------------------------------------

            const std::vector<DailyRecord> &records() const { return records_; }
            const DailyRecord &operator[](size_t i) const { return records_[i]; }
            const DailyRecord &front() const { return records_.front(); }
            const DailyRecord &back() const { return records_.back(); }
            size_t size() const { return records_.size(); }
            bool empty() const { return records_.empty(); }

            /** @brief Dates in order. */
            std::vector<std::string> dates() const;

            /** @brief Prices in date order. */
            std::vector<double> prices() const;

            /** @brief Index of @p date, if present. */
            std::optional<size_t> index_of(const std::string &date) const;

            // ---------------------------------------------------------------
            // Adjustment
            // ---------------------------------------------------------------

            /** @brief True when every record has is_adjusted set (false for an empty series). */
            bool is_adjusted() const { return is_adjusted_; }

            /**
             * @brief Flag every record as adjusted and zero its distributions.
             *
             * The distributions are dropped because an adjusted price already
             * contains them.
             */
            void mark_adjusted();

            /** @brief True if any record has a positive dividend or capital gain. */
            bool has_distributions() const;

            /** @brief Sum of all distributions in the series. */
            double total_distributions() const;

            /**
             * @brief Price-only return ratio, last price / first price.
             * @throws std::runtime_error if the series is empty.
             */
            double price_return_ratio() const;

            // ---------------------------------------------------------------
            // Slicing
            // ---------------------------------------------------------------

            /**
             * @brief Records with start <= date <= end. Empty bounds are open.
             */
            PriceSeries filter_by_date(const std::string &start, const std::string &end = "") const;

            // ---------------------------------------------------------------
            // Provenance
            // ---------------------------------------------------------------

            const std::string &source_name() const { return source_name_; }
            void set_source_name(const std::string &name) { source_name_ = name; }

            const std::string &fetched_at() const { return fetched_at_; }
            void set_fetched_at(const std::string &timestamp) { fetched_at_ = timestamp; }

        private:
            std::vector<DailyRecord> records_;
            std::string source_name_;
            std::string fetched_at_;
            bool is_adjusted_ = false;
        };

    } // namespace data
} // namespace fundscope

#endif // FUNDSCOPE_DATA_PRICE_SERIES_HPP
