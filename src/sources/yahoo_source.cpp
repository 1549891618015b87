/**
 * @file yahoo_source.cpp
 * @brief Chart API client and the Yahoo-backed resolver steps.
 */

#include "sources/yahoo_source.hpp"
#include "data/identifier.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <limits>
#include <map>
#include <stdexcept>
#include <utility>

namespace fundscope
{
    namespace sources
    {

        namespace
        {

            const double NaN = std::numeric_limits<double>::quiet_NaN();

            double number_or_nan(const nlohmann::json &value)
            {
                return value.is_number() ? value.get<double>() : NaN;
            }

            /**
             * @brief Sum event amounts by local date.
             */
            std::map<std::string, double> events_by_date(const nlohmann::json &events, const char *kind,
                                                         int64_t gmt_offset)
            {
                std::map<std::string, double> out;
                if (!events.is_object() || !events.contains(kind))
                {
                    return out;
                }
                for (const auto &[key, event] : events.at(kind).items())
                {
                    int64_t ts = event.contains("date") ? event.at("date").get<int64_t>() : std::stoll(key);
                    double amount = number_or_nan(event.value("amount", nlohmann::json()));
                    if (std::isfinite(amount) && amount > 0.0)
                    {
                        out[data::date_from_epoch_seconds(ts + gmt_offset)] += amount;
                    }
                }
                return out;
            }

            /**
             * @brief Book each event on the first row dated on or after it.
             */
            void book_events(const std::map<std::string, double> &events,
                             const std::vector<std::string> &dates,
                             std::vector<double> &column)
            {
                for (const auto &[date, amount] : events)
                {
                    auto it = std::lower_bound(dates.begin(), dates.end(), date);
                    if (it != dates.end())
                    {
                        column[static_cast<size_t>(std::distance(dates.begin(), it))] += amount;
                    }
                }
            }

        } // anonymous namespace

        // ===================================================================
        // YahooChartClient
        // ===================================================================

        YahooChartClient::YahooChartClient(HttpClient &http, RateLimiter &limiter)
            : http_(http), limiter_(limiter)
        {
        }

        std::string YahooChartClient::chart_url(const std::string &symbol, const data::DateRange &range)
        {
            return "https://query1.finance.yahoo.com/v8/finance/chart/" + url_encode(symbol) +
                   "?period1=" + std::to_string(data::to_epoch_seconds(range.start)) +
                   "&period2=" + std::to_string(data::to_epoch_seconds(range.end) + 86400) +
                   "&interval=1d&events=div%7CcapitalGain%7Csplit&includeAdjustedClose=true";
        }

        std::optional<adjustment::RawQuoteHistory> YahooChartClient::history(const std::string &symbol,
                                                                             const data::DateRange &range)
        {
            limiter_.acquire(PROVIDER);
            HttpResponse response = http_.get(chart_url(symbol, range));
            if (response.status == 404)
            {
                return std::nullopt;
            }
            if (!response.ok())
            {
                throw std::runtime_error("Chart request for " + symbol + " returned HTTP " +
                                         std::to_string(response.status));
            }
            return parse_chart(response.body);
        }

        std::optional<adjustment::RawQuoteHistory> YahooChartClient::parse_chart(const std::string &body)
        {
            auto doc = nlohmann::json::parse(body);
            const auto &chart = doc.at("chart");
            if (chart.contains("error") && !chart.at("error").is_null())
            {
                return std::nullopt;
            }
            const auto &results = chart.at("result");
            if (!results.is_array() || results.empty())
            {
                return std::nullopt;
            }

            const auto &result = results.at(0);
            if (!result.contains("timestamp") || !result.at("timestamp").is_array())
            {
                return std::nullopt;
            }

            int64_t gmt_offset = 0;
            if (result.contains("meta"))
            {
                gmt_offset = result.at("meta").value("gmtoffset", static_cast<int64_t>(0));
            }

            const auto &timestamps = result.at("timestamp");
            const auto &quote = result.at("indicators").at("quote").at(0);
            const auto &closes = quote.at("close");

            const nlohmann::json *adjcloses = nullptr;
            const auto &indicators = result.at("indicators");
            if (indicators.contains("adjclose") && !indicators.at("adjclose").empty())
            {
                adjcloses = &indicators.at("adjclose").at(0).at("adjclose");
            }

            adjustment::RawQuoteHistory history;
            for (size_t i = 0; i < timestamps.size(); ++i)
            {
                std::string date = data::date_from_epoch_seconds(timestamps.at(i).get<int64_t>() + gmt_offset);
                double close = i < closes.size() ? number_or_nan(closes.at(i)) : NaN;
                double adj = (adjcloses != nullptr && i < adjcloses->size()) ? number_or_nan(adjcloses->at(i)) : NaN;

                // Intraday and daily bars can share a date on the last row
                if (!history.dates.empty() && history.dates.back() == date)
                {
                    history.close.back() = close;
                    if (history.has_adjusted_close())
                    {
                        history.adjusted_close.back() = adj;
                    }
                    continue;
                }
                history.add(date, close, adj);
            }

            nlohmann::json events = result.value("events", nlohmann::json::object());
            book_events(events_by_date(events, "dividends", gmt_offset), history.dates, history.dividends);
            book_events(events_by_date(events, "capitalGains", gmt_offset), history.dates, history.capital_gains);

            return history;
        }

        std::optional<std::string> YahooChartClient::profile_summary(const std::string &symbol)
        {
            auto body = quote_summary(symbol, "assetProfile,fundProfile");
            if (!body)
            {
                return std::nullopt;
            }
            return parse_profile(*body);
        }

        std::optional<std::string> YahooChartClient::quote_summary(const std::string &symbol,
                                                                   const std::string &modules)
        {
            limiter_.acquire(PROVIDER);
            HttpResponse response = http_.get("https://query2.finance.yahoo.com/v10/finance/quoteSummary/" +
                                              url_encode(symbol) + "?modules=" + url_encode(modules));
            if (!response.ok())
            {
                return std::nullopt;
            }
            return response.body;
        }

        std::optional<std::string> YahooChartClient::parse_profile(const std::string &body)
        {
            auto doc = nlohmann::json::parse(body);
            const auto &results = doc.at("quoteSummary").at("result");
            if (!results.is_array() || results.empty())
            {
                return std::nullopt;
            }

            const auto &result = results.at(0);
            for (const char *module : {"assetProfile", "fundProfile"})
            {
                if (result.contains(module) && result.at(module).contains("longBusinessSummary"))
                {
                    const auto &text = result.at(module).at("longBusinessSummary");
                    if (text.is_string() && !text.get<std::string>().empty())
                    {
                        return text.get<std::string>();
                    }
                }
            }
            return std::nullopt;
        }

        // ===================================================================
        // Symbol lookups
        // ===================================================================

        const std::map<std::string, std::string> &known_tickers()
        {
            static const std::map<std::string, std::string> map = {
                {"US87281Y1029", "PRHSX"}, // T. Rowe Price Health Sciences
            };
            return map;
        }

        std::optional<std::string> profile_symbol(const std::string &identifier,
                                                  const std::optional<std::string> &ticker)
        {
            if (ticker)
            {
                return data::normalize_identifier(*ticker);
            }
            auto it = known_tickers().find(identifier);
            if (it != known_tickers().end())
            {
                return it->second;
            }
            if (data::looks_like_ticker(identifier))
            {
                return identifier;
            }
            return std::nullopt;
        }

        YahooSymbolSource::YahooSymbolSource(std::shared_ptr<YahooChartClient> client,
                                             YahooLookup lookup,
                                             std::vector<std::string> exchange_suffixes,
                                             size_t min_records)
            : client_(std::move(client)), lookup_(lookup), exchange_suffixes_(std::move(exchange_suffixes)),
              min_records_(min_records)
        {
        }

        std::string YahooSymbolSource::name() const
        {
            switch (lookup_)
            {
            case YahooLookup::TICKER:
                return "Yahoo Finance (ticker)";
            case YahooLookup::EXCHANGE_SUFFIXES:
                return "Yahoo Finance (exchange suffix)";
            case YahooLookup::IDENTIFIER:
                return "Yahoo Finance (identifier)";
            case YahooLookup::NATIONAL_SUFFIX:
                return "Yahoo Finance (national suffix)";
            }
            return "Yahoo Finance";
        }

        std::vector<std::string> YahooSymbolSource::candidates(const InstrumentRequest &request) const
        {
            auto id = data::InstrumentId::parse(request.identifier);
            std::vector<std::string> out;

            switch (lookup_)
            {
            case YahooLookup::TICKER:
            {
                if (request.ticker && !request.ticker->empty())
                {
                    out.push_back(data::normalize_identifier(*request.ticker));
                }
                else if (auto it = known_tickers().find(id.value); it != known_tickers().end())
                {
                    out.push_back(it->second);
                }
                else if (id.is_ticker())
                {
                    out.push_back(id.value);
                }
                break;
            }
            case YahooLookup::EXCHANGE_SUFFIXES:
                if (id.is_isin())
                {
                    for (const auto &suffix : exchange_suffixes_)
                    {
                        out.push_back(id.value + "." + suffix);
                    }
                }
                break;
            case YahooLookup::IDENTIFIER:
                if (!id.value.empty())
                {
                    out.push_back(id.value);
                }
                break;
            case YahooLookup::NATIONAL_SUFFIX:
            {
                static const std::map<std::string, std::string> national = {{"IE", "IR"}};
                auto it = national.find(id.country_code());
                if (it != national.end())
                {
                    out.push_back(id.value + "." + it->second);
                }
                break;
            }
            }
            return out;
        }

        std::optional<FetchedQuotes> YahooSymbolSource::fetch(const InstrumentRequest &request,
                                                              const data::DateRange &range)
        {
            auto symbols = candidates(request);
            for (const auto &symbol : symbols)
            {
                std::optional<adjustment::RawQuoteHistory> history;
                try
                {
                    history = client_->history(symbol, range);
                }
                catch (const std::exception &e)
                {
                    if (symbols.size() == 1)
                    {
                        throw;
                    }
                    std::cerr << "  " << symbol << ": " << e.what() << std::endl;
                    continue;
                }

                if (history && history->size() > min_records_)
                {
                    FetchedQuotes quotes;
                    quotes.history = std::move(*history);
                    quotes.symbol = symbol;
                    return quotes;
                }
            }
            return std::nullopt;
        }

    } // namespace sources
} // namespace fundscope
