/**
 * @file normalizer.cpp
 * @brief Implementation of ComparisonTable and SeriesNormalizer.
 */

#include "analytics/normalizer.hpp"
#include "data/calendar.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <set>
#include <stdexcept>
#include <utility>

namespace fundscope
{
    namespace analytics
    {

        // ===================================================================
        // ComparisonTable
        // ===================================================================

        ComparisonTable::ComparisonTable(std::vector<std::string> dates,
                                         std::vector<std::string> instruments,
                                         Eigen::MatrixXd values,
                                         std::string common_start_date,
                                         double base_value)
            : dates_(std::move(dates)), instruments_(std::move(instruments)), values_(std::move(values)),
              common_start_date_(std::move(common_start_date)), base_value_(base_value)
        {
            if (static_cast<size_t>(values_.rows()) != dates_.size() ||
                static_cast<size_t>(values_.cols()) != instruments_.size())
            {
                throw std::invalid_argument(
                    "Value matrix is " + std::to_string(values_.rows()) + "x" + std::to_string(values_.cols()) +
                    " but table has " + std::to_string(dates_.size()) + " dates and " +
                    std::to_string(instruments_.size()) + " instruments");
            }

            for (size_t i = 0; i < dates_.size(); ++i)
            {
                date_index_[dates_[i]] = i;
            }
            for (size_t j = 0; j < instruments_.size(); ++j)
            {
                instrument_index_[instruments_[j]] = j;
            }
        }

        bool ComparisonTable::contains(const std::string &instrument) const
        {
            return instrument_index_.count(instrument) > 0;
        }

        size_t ComparisonTable::column_index(const std::string &instrument) const
        {
            auto it = instrument_index_.find(instrument);
            if (it == instrument_index_.end())
            {
                throw std::out_of_range("Instrument not in comparison table: " + instrument);
            }
            return it->second;
        }

        double ComparisonTable::value(const std::string &date, const std::string &instrument) const
        {
            size_t col = column_index(instrument);
            auto it = date_index_.find(date);
            if (it == date_index_.end())
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            return values_(static_cast<Eigen::Index>(it->second), static_cast<Eigen::Index>(col));
        }

        TotalReturnSeries ComparisonTable::column(const std::string &instrument) const
        {
            size_t col = column_index(instrument);
            TotalReturnSeries out;
            out.instrument = instrument;
            for (size_t i = 0; i < dates_.size(); ++i)
            {
                double v = values_(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(col));
                if (!std::isnan(v))
                {
                    out.dates.push_back(dates_[i]);
                    out.values.push_back(v);
                }
            }
            return out;
        }

        void ComparisonTable::to_csv(const std::string &filepath) const
        {
            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }

            file << "date";
            for (const auto &name : instruments_)
            {
                file << "," << name;
            }
            file << "\n";

            file << std::fixed << std::setprecision(6);
            for (size_t i = 0; i < dates_.size(); ++i)
            {
                file << dates_[i];
                for (size_t j = 0; j < instruments_.size(); ++j)
                {
                    double v = values_(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j));
                    file << ",";
                    if (!std::isnan(v))
                    {
                        file << v;
                    }
                }
                file << "\n";
            }
        }

        // ===================================================================
        // SeriesNormalizer
        // ===================================================================

        SeriesNormalizer::SeriesNormalizer(double base_value)
            : base_value_(base_value)
        {
            if (!(base_value > 0.0))
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'base_value', got: " + std::to_string(base_value));
            }
        }

        std::string SeriesNormalizer::derive_common_start_date(const std::vector<TotalReturnSeries> &series)
        {
            std::string latest;
            for (const auto &s : series)
            {
                for (size_t i = 0; i < s.size(); ++i)
                {
                    if (!std::isnan(s.values[i]))
                    {
                        if (s.dates[i] > latest)
                        {
                            latest = s.dates[i];
                        }
                        break;
                    }
                }
            }
            return latest;
        }

        ComparisonTable SeriesNormalizer::build(const std::vector<TotalReturnSeries> &series,
                                                const std::optional<std::string> &common_start_override) const
        {
            std::set<std::string> seen;
            for (const auto &s : series)
            {
                if (s.dates.size() != s.values.size())
                {
                    throw std::invalid_argument("Series '" + s.instrument + "' has mismatched dates and values");
                }
                if (!seen.insert(s.instrument).second)
                {
                    throw std::invalid_argument("Duplicate instrument in comparison: " + s.instrument);
                }
            }

            // (a)-(b) common start date
            std::string start;
            if (common_start_override)
            {
                if (!data::is_valid_date(*common_start_override))
                {
                    throw std::invalid_argument("Invalid common start date: '" + *common_start_override + "'");
                }
                start = *common_start_override;
            }
            else
            {
                start = derive_common_start_date(series);
            }

            // (c) truncate, keeping only instruments with data on or after the start
            std::vector<const TotalReturnSeries *> included;
            std::set<std::string> all_dates;
            for (const auto &s : series)
            {
                bool has_data = false;
                for (size_t i = 0; i < s.size(); ++i)
                {
                    if (s.dates[i] >= start && !std::isnan(s.values[i]))
                    {
                        has_data = true;
                        all_dates.insert(s.dates[i]);
                    }
                }
                if (has_data)
                {
                    included.push_back(&s);
                }
                else
                {
                    std::cerr << "Warning: " << s.instrument << " has no data on or after " << start
                              << ", excluded from comparison" << std::endl;
                }
            }

            std::vector<std::string> dates(all_dates.begin(), all_dates.end());
            std::vector<std::string> names;
            Eigen::MatrixXd values = Eigen::MatrixXd::Constant(static_cast<Eigen::Index>(dates.size()),
                                                               static_cast<Eigen::Index>(included.size()),
                                                               std::numeric_limits<double>::quiet_NaN());

            std::map<std::string, Eigen::Index> row_of;
            for (size_t i = 0; i < dates.size(); ++i)
            {
                row_of[dates[i]] = static_cast<Eigen::Index>(i);
            }

            for (size_t j = 0; j < included.size(); ++j)
            {
                const auto &s = *included[j];
                names.push_back(s.instrument);
                auto col = static_cast<Eigen::Index>(j);

                for (size_t i = 0; i < s.size(); ++i)
                {
                    if (s.dates[i] >= start && !std::isnan(s.values[i]))
                    {
                        values(row_of[s.dates[i]], col) = s.values[i];
                    }
                }

                // (d) rescale by the first valid observation, (e) pin it to the base value
                Eigen::Index first = 0;
                while (std::isnan(values(first, col)))
                {
                    ++first;
                }
                double scale = base_value_ / values(first, col);
                values.col(col) *= scale;
                values(first, col) = base_value_;

                // (f) forward fill
                for (Eigen::Index i = first + 1; i < values.rows(); ++i)
                {
                    if (std::isnan(values(i, col)))
                    {
                        values(i, col) = values(i - 1, col);
                    }
                }
            }

            return ComparisonTable(std::move(dates), std::move(names), std::move(values), start, base_value_);
        }

        TotalReturnSeries SeriesNormalizer::normalize(const TotalReturnSeries &series) const
        {
            TotalReturnSeries out = series;
            size_t first = 0;
            while (first < out.size() && std::isnan(out.values[first]))
            {
                ++first;
            }
            if (first == out.size())
            {
                return out;
            }

            double scale = base_value_ / out.values[first];
            for (auto &v : out.values)
            {
                v *= scale;
            }
            out.values[first] = base_value_;
            return out;
        }

    } // namespace analytics
} // namespace fundscope
