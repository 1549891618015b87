/**
 * @file adjustment_classifier.cpp
 * @brief Implementation of the adjustment rules.
 */

#include "adjustment/adjustment_classifier.hpp"
#include "data/identifier.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace fundscope
{
    namespace adjustment
    {

        namespace
        {
            bool usable(double price)
            {
                return std::isfinite(price) && price > 0.0;
            }

            double non_negative(double value)
            {
                return std::isfinite(value) && value > 0.0 ? value : 0.0;
            }
        } // anonymous namespace

        // ===================================================================
        // MarketConvention
        // ===================================================================

        MarketConvention MarketConvention::from_json(const nlohmann::json &j)
        {
            MarketConvention convention;
            convention.home_country = j.value("home_country", std::string("US"));
            convention.fund_ticker_length = j.value("fund_ticker_length", static_cast<size_t>(5));

            std::string suffix = j.value("fund_ticker_suffix", std::string("X"));
            if (suffix.size() != 1)
            {
                throw std::invalid_argument("fund_ticker_suffix must be a single letter, got: '" + suffix + "'");
            }
            convention.fund_ticker_suffix = suffix[0];
            return convention;
        }

        bool MarketConvention::is_fund_ticker(const std::string &ticker) const
        {
            std::string t = data::normalize_identifier(ticker);
            return t.size() == fund_ticker_length && data::looks_like_ticker(t) &&
                   t.back() == fund_ticker_suffix;
        }

        // ===================================================================
        // Classification
        // ===================================================================

        InstrumentClass classify_instrument(const std::string &identifier,
                                            const std::optional<std::string> &ticker,
                                            const MarketConvention &convention)
        {
            auto id = data::InstrumentId::parse(identifier);

            std::string effective_ticker;
            if (ticker && !ticker->empty())
            {
                effective_ticker = data::normalize_identifier(*ticker);
            }
            else if (id.is_ticker())
            {
                effective_ticker = id.value;
            }

            if (!convention.is_fund_ticker(effective_ticker))
            {
                return ForeignOrEquityOrETF{id.value};
            }

            if (id.is_isin() && id.country_code() != convention.home_country)
            {
                return ForeignOrEquityOrETF{id.value};
            }

            return DomesticAdjustedFund{id.value, effective_ticker};
        }

        bool is_domestic_adjusted(const InstrumentClass &cls)
        {
            return std::holds_alternative<DomesticAdjustedFund>(cls);
        }

        const std::vector<std::string> &adjusted_vendor_names()
        {
            static const std::vector<std::string> names = {
                "EOD Historical Data",
                "Alpha Vantage",
                "Financial Modeling Prep"};
            return names;
        }

        bool source_reports_adjusted_prices(const std::string &source_name)
        {
            const auto &names = adjusted_vendor_names();
            return std::any_of(names.begin(), names.end(),
                               [&](const std::string &name)
                               { return source_name.find(name) != std::string::npos; });
        }

        // ===================================================================
        // RawQuoteHistory
        // ===================================================================

        void RawQuoteHistory::add(const std::string &date, double close_price, double adjusted,
                                  double dividend, double capital_gain)
        {
            dates.push_back(date);
            close.push_back(close_price);
            dividends.push_back(dividend);
            capital_gains.push_back(capital_gain);

            if (!std::isnan(adjusted) && adjusted_close.empty())
            {
                adjusted_close.assign(dates.size() - 1, std::numeric_limits<double>::quiet_NaN());
            }
            if (!adjusted_close.empty())
            {
                adjusted_close.push_back(adjusted);
            }
        }

        void RawQuoteHistory::validate() const
        {
            size_t n = dates.size();
            if (close.size() != n || dividends.size() != n || capital_gains.size() != n ||
                (!adjusted_close.empty() && adjusted_close.size() != n))
            {
                throw std::invalid_argument(
                    "Quote history columns disagree in length (dates: " + std::to_string(n) + ")");
            }
        }

        // ===================================================================
        // AdjustmentClassifier
        // ===================================================================

        AdjustmentClassifier::AdjustmentClassifier(MarketConvention convention,
                                                   double ex_distribution_threshold)
            : convention_(std::move(convention)), calculator_(ex_distribution_threshold)
        {
        }

        InstrumentClass AdjustmentClassifier::classify(const std::string &identifier,
                                                       const std::optional<std::string> &ticker) const
        {
            return classify_instrument(identifier, ticker, convention_);
        }

        data::PriceSeries AdjustmentClassifier::apply(const RawQuoteHistory &raw,
                                                      const InstrumentClass &cls,
                                                      VendorAdjustment vendor) const
        {
            raw.validate();

            bool adjusted = vendor == VendorAdjustment::ALWAYS_ADJUSTED || is_domestic_adjusted(cls);

            std::vector<data::DailyRecord> records;
            records.reserve(raw.size());

            if (!adjusted)
            {
                for (size_t i = 0; i < raw.size(); ++i)
                {
                    if (!usable(raw.close[i]))
                    {
                        continue;
                    }
                    data::DailyRecord rec;
                    rec.date = raw.dates[i];
                    rec.price = raw.close[i];
                    rec.dividend = non_negative(raw.dividends[i]);
                    rec.capital_gain = non_negative(raw.capital_gains[i]);
                    records.push_back(rec);
                }
                return data::PriceSeries(std::move(records));
            }

            bool native = raw.has_adjusted_close() &&
                          std::any_of(raw.adjusted_close.begin(), raw.adjusted_close.end(), usable);

            std::vector<double> prices = native
                                             ? raw.adjusted_close
                                             : calculator_.reconstruct_adjusted_prices(raw.close, raw.dividends,
                                                                                       raw.capital_gains);

            for (size_t i = 0; i < raw.size(); ++i)
            {
                if (!usable(prices[i]))
                {
                    continue;
                }
                data::DailyRecord rec;
                rec.date = raw.dates[i];
                rec.price = prices[i];
                rec.is_adjusted = true;
                records.push_back(rec);
            }
            return data::PriceSeries(std::move(records));
        }

    } // namespace adjustment
} // namespace fundscope
