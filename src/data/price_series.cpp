/**
 * @file price_series.cpp
 * @brief Implementation of PriceSeries.
 */

#include "data/price_series.hpp"
#include "data/calendar.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace fundscope
{
    namespace data
    {

        PriceSeries::PriceSeries(std::vector<DailyRecord> records,
                                 std::string source_name,
                                 std::string fetched_at)
            : source_name_(std::move(source_name)), fetched_at_(std::move(fetched_at))
        {
            for (const auto &rec : records)
            {
                if (!is_valid_date(rec.date))
                {
                    throw std::invalid_argument("Invalid record date: '" + rec.date + "'");
                }
                if (!std::isfinite(rec.price) || rec.price <= 0.0)
                {
                    throw std::invalid_argument(
                        "Expected positive price on " + rec.date + ", got: " + std::to_string(rec.price));
                }
                if (rec.dividend < 0.0 || rec.capital_gain < 0.0 ||
                    !std::isfinite(rec.dividend) || !std::isfinite(rec.capital_gain))
                {
                    throw std::invalid_argument("Negative or non-finite distribution on " + rec.date);
                }
                if (rec.is_adjusted != records.front().is_adjusted)
                {
                    throw std::invalid_argument("Mixed adjustment flags within one series");
                }
                if (rec.is_adjusted && rec.distribution() != 0.0)
                {
                    throw std::invalid_argument(
                        "Adjusted record on " + rec.date + " carries a distribution");
                }
            }

            std::stable_sort(records.begin(), records.end(),
                             [](const DailyRecord &a, const DailyRecord &b)
                             { return a.date < b.date; });

            // Keep the last record seen for a duplicated date
            for (auto &rec : records)
            {
                if (!records_.empty() && records_.back().date == rec.date)
                {
                    records_.back() = std::move(rec);
                }
                else
                {
                    records_.push_back(std::move(rec));
                }
            }

            is_adjusted_ = !records_.empty() && records_.front().is_adjusted;
        }

        std::vector<std::string> PriceSeries::dates() const
        {
            std::vector<std::string> out;
            out.reserve(records_.size());
            for (const auto &rec : records_)
            {
                out.push_back(rec.date);
            }
            return out;
        }

        std::vector<double> PriceSeries::prices() const
        {
            std::vector<double> out;
            out.reserve(records_.size());
            for (const auto &rec : records_)
            {
                out.push_back(rec.price);
            }
            return out;
        }

        std::optional<size_t> PriceSeries::index_of(const std::string &date) const
        {
            auto it = std::lower_bound(records_.begin(), records_.end(), date,
                                       [](const DailyRecord &rec, const std::string &d)
                                       { return rec.date < d; });
            if (it == records_.end() || it->date != date)
            {
                return std::nullopt;
            }
            return static_cast<size_t>(std::distance(records_.begin(), it));
        }

        void PriceSeries::mark_adjusted()
        {
            for (auto &rec : records_)
            {
                rec.is_adjusted = true;
                rec.dividend = 0.0;
                rec.capital_gain = 0.0;
            }
            is_adjusted_ = !records_.empty();
        }

        bool PriceSeries::has_distributions() const
        {
            return std::any_of(records_.begin(), records_.end(),
                               [](const DailyRecord &rec)
                               { return rec.distribution() > 0.0; });
        }

        double PriceSeries::total_distributions() const
        {
            double total = 0.0;
            for (const auto &rec : records_)
            {
                total += rec.distribution();
            }
            return total;
        }

        double PriceSeries::price_return_ratio() const
        {
            if (records_.empty())
            {
                throw std::runtime_error("Cannot compute price return of an empty series");
            }
            return records_.back().price / records_.front().price;
        }

        PriceSeries PriceSeries::filter_by_date(const std::string &start, const std::string &end) const
        {
            std::vector<DailyRecord> kept;
            for (const auto &rec : records_)
            {
                if (!start.empty() && rec.date < start)
                {
                    continue;
                }
                if (!end.empty() && rec.date > end)
                {
                    continue;
                }
                kept.push_back(rec);
            }
            return PriceSeries(std::move(kept), source_name_, fetched_at_);
        }

    } // namespace data
} // namespace fundscope
