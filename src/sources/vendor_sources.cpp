/**
 * @file vendor_sources.cpp
 * @brief EOD Historical Data, Financial Modeling Prep and Alpha Vantage.
 */

#include "sources/vendor_sources.hpp"
#include "data/identifier.hpp"
#include "sources/yahoo_source.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

namespace fundscope
{
    namespace sources
    {

        namespace
        {

            const double NaN = std::numeric_limits<double>::quiet_NaN();

            /**
             * @brief Read a numeric field that vendors send either as number or string.
             */
            double field_value(const nlohmann::json &obj, const char *key)
            {
                if (!obj.contains(key))
                {
                    return NaN;
                }
                const auto &v = obj.at(key);
                if (v.is_number())
                {
                    return v.get<double>();
                }
                if (v.is_string())
                {
                    try
                    {
                        return std::stod(v.get<std::string>());
                    }
                    catch (const std::exception &)
                    {
                        return NaN;
                    }
                }
                return NaN;
            }

            struct Row
            {
                std::string date;
                double close;
                double adjusted;
            };

            /**
             * @brief Turn vendor rows into quotes; ALWAYS_ADJUSTED when any row has an adjusted value.
             */
            std::optional<FetchedQuotes> to_quotes(std::vector<Row> rows, const std::string &symbol)
            {
                if (rows.empty())
                {
                    return std::nullopt;
                }
                std::sort(rows.begin(), rows.end(),
                          [](const Row &a, const Row &b)
                          { return a.date < b.date; });

                bool has_adjusted = false;
                for (const auto &row : rows)
                {
                    if (std::isfinite(row.adjusted))
                    {
                        has_adjusted = true;
                        break;
                    }
                }

                FetchedQuotes quotes;
                quotes.symbol = symbol;
                quotes.adjustment = has_adjusted ? adjustment::VendorAdjustment::ALWAYS_ADJUSTED
                                                 : adjustment::VendorAdjustment::RAW_WITH_DISTRIBUTIONS;
                for (const auto &row : rows)
                {
                    quotes.history.add(row.date, row.close, has_adjusted ? row.adjusted : NaN);
                }
                return quotes;
            }

        } // anonymous namespace

        // ===================================================================
        // KeyedVendorSource
        // ===================================================================

        KeyedVendorSource::KeyedVendorSource(HttpClient &http, RateLimiter &limiter,
                                             std::optional<std::string> api_key)
            : http_(http), limiter_(limiter), api_key_(std::move(api_key))
        {
        }

        std::optional<std::string> KeyedVendorSource::get_body(const std::string &provider, const std::string &url)
        {
            limiter_.acquire(provider);
            HttpResponse response = http_.get(url);
            if (response.status == 404)
            {
                return std::nullopt;
            }
            if (!response.ok())
            {
                throw std::runtime_error(name() + " returned HTTP " + std::to_string(response.status));
            }
            return response.body;
        }

        // ===================================================================
        // EOD Historical Data
        // ===================================================================

        EodHistoricalSource::EodHistoricalSource(HttpClient &http, RateLimiter &limiter,
                                                 std::optional<std::string> api_key)
            : KeyedVendorSource(http, limiter, std::move(api_key))
        {
        }

        std::optional<FetchedQuotes> EodHistoricalSource::fetch(const InstrumentRequest &request,
                                                                const data::DateRange &range)
        {
            std::string url = "https://eodhistoricaldata.com/api/eod/" + url_encode(request.identifier) +
                              "?api_token=" + url_encode(api_key()) +
                              "&from=" + range.start + "&to=" + range.end + "&period=d&fmt=json";
            auto body = get_body("eod", url);
            if (!body)
            {
                return std::nullopt;
            }
            auto quotes = parse(*body);
            if (quotes)
            {
                quotes->symbol = request.identifier;
            }
            return quotes;
        }

        std::optional<FetchedQuotes> EodHistoricalSource::parse(const std::string &body)
        {
            auto doc = nlohmann::json::parse(body);
            if (!doc.is_array())
            {
                return std::nullopt;
            }

            std::vector<Row> rows;
            for (const auto &item : doc)
            {
                if (!item.contains("date"))
                {
                    continue;
                }
                rows.push_back({item.at("date").get<std::string>(),
                                field_value(item, "close"),
                                field_value(item, "adjusted_close")});
            }
            return to_quotes(std::move(rows), "");
        }

        // ===================================================================
        // Financial Modeling Prep
        // ===================================================================

        FmpSource::FmpSource(HttpClient &http, RateLimiter &limiter, std::optional<std::string> api_key)
            : KeyedVendorSource(http, limiter, std::move(api_key))
        {
        }

        std::optional<FetchedQuotes> FmpSource::fetch(const InstrumentRequest &request,
                                                      const data::DateRange &range)
        {
            std::string url = "https://financialmodelingprep.com/api/v3/historical-price-full/" +
                              url_encode(request.identifier) + "?apikey=" + url_encode(api_key()) +
                              "&from=" + range.start + "&to=" + range.end;
            auto body = get_body("fmp", url);
            if (!body)
            {
                return std::nullopt;
            }
            auto quotes = parse(*body);
            if (quotes)
            {
                quotes->symbol = request.identifier;
            }
            return quotes;
        }

        std::optional<FetchedQuotes> FmpSource::parse(const std::string &body)
        {
            auto doc = nlohmann::json::parse(body);
            if (!doc.is_object() || !doc.contains("historical") || !doc.at("historical").is_array())
            {
                return std::nullopt;
            }

            std::vector<Row> rows;
            for (const auto &item : doc.at("historical"))
            {
                if (!item.contains("date"))
                {
                    continue;
                }
                rows.push_back({item.at("date").get<std::string>(),
                                field_value(item, "close"),
                                field_value(item, "adjClose")});
            }
            return to_quotes(std::move(rows), "");
        }

        // ===================================================================
        // Alpha Vantage
        // ===================================================================

        AlphaVantageSource::AlphaVantageSource(HttpClient &http, RateLimiter &limiter,
                                               std::optional<std::string> api_key)
            : KeyedVendorSource(http, limiter, std::move(api_key))
        {
        }

        std::optional<FetchedQuotes> AlphaVantageSource::fetch(const InstrumentRequest &request,
                                                               const data::DateRange &range)
        {
            std::string symbol;
            if (request.ticker && !request.ticker->empty())
            {
                symbol = data::normalize_identifier(*request.ticker);
            }
            else if (auto it = known_tickers().find(request.identifier); it != known_tickers().end())
            {
                symbol = it->second;
            }
            else if (data::looks_like_ticker(request.identifier))
            {
                symbol = request.identifier;
            }
            else
            {
                return std::nullopt;
            }

            std::string url = "https://www.alphavantage.co/query?function=TIME_SERIES_DAILY_ADJUSTED&symbol=" +
                              url_encode(symbol) + "&outputsize=full&apikey=" + url_encode(api_key());
            auto body = get_body("alphavantage", url);
            if (!body)
            {
                return std::nullopt;
            }
            auto quotes = parse(*body, range);
            if (quotes)
            {
                quotes->symbol = symbol;
            }
            return quotes;
        }

        std::optional<FetchedQuotes> AlphaVantageSource::parse(const std::string &body, const data::DateRange &range)
        {
            auto doc = nlohmann::json::parse(body);
            if (doc.contains("Note") || doc.contains("Information"))
            {
                throw std::runtime_error("Alpha Vantage rate limit reached");
            }
            if (doc.contains("Error Message") || !doc.contains("Time Series (Daily)"))
            {
                return std::nullopt;
            }

            std::vector<Row> rows;
            for (const auto &[date, values] : doc.at("Time Series (Daily)").items())
            {
                if (date < range.start || date > range.end)
                {
                    continue;
                }
                rows.push_back({date, field_value(values, "4. close"), field_value(values, "5. adjusted close")});
            }
            return to_quotes(std::move(rows), "");
        }

    } // namespace sources
} // namespace fundscope
