/**
 * @file normalizer.hpp
 * @brief Cross-instrument alignment onto a common base-100 scale.
 *
 * The comparison starts at the latest of the instruments' first available
 * dates, so every included instrument has real data from the first row.
 * Each column is rescaled by its first valid observation at or after that
 * date, pinned to exactly the base value there, and forward-filled.
 */

#ifndef FUNDSCOPE_ANALYTICS_NORMALIZER_HPP
#define FUNDSCOPE_ANALYTICS_NORMALIZER_HPP

#include "analytics/total_return.hpp"

#include <Eigen/Dense>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fundscope
{
    namespace analytics
    {

        /**
         * @class ComparisonTable
         * @brief Dates x instruments matrix of rebased values.
         *
         * Missing observations (before an instrument's first valid value) are NaN.
         */
        class ComparisonTable
        {
        public:
            ComparisonTable() = default;

            /**
             * @brief Constructor.
             * @throws std::invalid_argument if the matrix shape does not match
             *         the dates and instruments.
             */
            ComparisonTable(std::vector<std::string> dates,
                            std::vector<std::string> instruments,
                            Eigen::MatrixXd values,
                            std::string common_start_date,
                            double base_value);

            const std::vector<std::string> &dates() const { return dates_; }
            const std::vector<std::string> &instruments() const { return instruments_; }
            const Eigen::MatrixXd &values() const { return values_; }
            const std::string &common_start_date() const { return common_start_date_; }
            double base_value() const { return base_value_; }

            size_t num_dates() const { return dates_.size(); }
            size_t num_instruments() const { return instruments_.size(); }
            bool empty() const { return instruments_.empty(); }

            bool contains(const std::string &instrument) const;

            /**
             * @brief Value of @p instrument on @p date, NaN if absent.
             * @throws std::out_of_range for an unknown instrument.
             */
            double value(const std::string &date, const std::string &instrument) const;

            /**
             * @brief Column of @p instrument as a TotalReturnSeries (NaN rows dropped).
             * @throws std::out_of_range for an unknown instrument.
             */
            TotalReturnSeries column(const std::string &instrument) const;

            /**
             * @brief Write "date,<instrument>,..." CSV; NaN cells are left empty.
             * @throws std::runtime_error if the file cannot be opened.
             */
            void to_csv(const std::string &filepath) const;

        private:
            size_t column_index(const std::string &instrument) const;

            std::vector<std::string> dates_;
            std::vector<std::string> instruments_;
            Eigen::MatrixXd values_;
            std::string common_start_date_;
            double base_value_ = 100.0;
            std::map<std::string, size_t> date_index_;
            std::map<std::string, size_t> instrument_index_;
        };

        /**
         * @class SeriesNormalizer
         * @brief Builds ComparisonTables and per-instrument base-value series.
         */
        class SeriesNormalizer
        {
        public:
            explicit SeriesNormalizer(double base_value = 100.0);

            /**
             * @brief Align and rebase many series.
             *
             * Series that are empty or have no observation on or after the
             * common start date are left out with a warning.
             *
             * @param series One total-return series per instrument.
             * @param common_start_override Explicit start date (YYYY-MM-DD).
             * @throws std::invalid_argument for duplicate instrument names or a
             *         malformed override date.
             */
            ComparisonTable build(const std::vector<TotalReturnSeries> &series,
                                  const std::optional<std::string> &common_start_override = std::nullopt) const;

            /**
             * @brief Latest first-available date among non-empty series.
             * @return Empty string when every series is empty.
             */
            static std::string derive_common_start_date(const std::vector<TotalReturnSeries> &series);

            /**
             * @brief Rebase one series to the base value at its first valid observation.
             */
            TotalReturnSeries normalize(const TotalReturnSeries &series) const;

            double base_value() const { return base_value_; }

        private:
            double base_value_;
        };

    } // namespace analytics
} // namespace fundscope

#endif // FUNDSCOPE_ANALYTICS_NORMALIZER_HPP
