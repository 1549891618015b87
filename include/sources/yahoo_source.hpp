/**
 * @file yahoo_source.hpp
 * @brief Market-data provider access through the Yahoo Finance chart API.
 *
 * One chart request returns closes, the provider's adjusted close and
 * dividend / capital-gain events:
 * @code
 *   GET https://query1.finance.yahoo.com/v8/finance/chart/{symbol}
 *       ?period1={epoch}&period2={epoch}&interval=1d
 *       &events=div%7CcapitalGain%7Csplit&includeAdjustedClose=true
 * @endcode
 * Several resolver steps query the same endpoint with different symbols,
 * so each step is a YahooSymbolSource configured with a lookup strategy.
 */

#ifndef FUNDSCOPE_SOURCES_YAHOO_SOURCE_HPP
#define FUNDSCOPE_SOURCES_YAHOO_SOURCE_HPP

#include "sources/http_client.hpp"
#include "sources/price_source.hpp"
#include "sources/rate_limiter.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fundscope
{
    namespace sources
    {

        /**
         * @class YahooChartClient
         * @brief Fetches and parses chart and quoteSummary documents.
         */
        class YahooChartClient
        {
        public:
            /** @brief Rate-limit key shared by all Yahoo requests. */
            static constexpr const char *PROVIDER = "yahoo";

            YahooChartClient(HttpClient &http, RateLimiter &limiter);

            /**
             * @brief Daily history of @p symbol.
             * @return std::nullopt if the provider reports no data for the symbol.
             * @throws HttpError on transport failure.
             * @throws std::runtime_error on a non-2xx status other than 404.
             */
            std::optional<adjustment::RawQuoteHistory> history(const std::string &symbol,
                                                               const data::DateRange &range);

            /**
             * @brief Business summary text of @p symbol, if the provider has one.
             */
            std::optional<std::string> profile_summary(const std::string &symbol);

            /**
             * @brief quoteSummary document of @p symbol with the given modules.
             * @param modules Comma-separated module names, e.g. "topHoldings".
             * @return std::nullopt on a non-2xx status.
             * @throws HttpError on transport failure.
             */
            std::optional<std::string> quote_summary(const std::string &symbol, const std::string &modules);

            /**
             * @brief Parse a chart API document.
             *
             * Rows with a null close are kept as NaN. Event timestamps are
             * mapped to dates with the exchange's GMT offset; an event on a
             * non-trading date is booked on the next row.
             *
             * @return std::nullopt when the document carries an error or no result.
             * @throws nlohmann::json::exception on a malformed document.
             */
            static std::optional<adjustment::RawQuoteHistory> parse_chart(const std::string &body);

            /**
             * @brief Extract the summary text from a quoteSummary document.
             */
            static std::optional<std::string> parse_profile(const std::string &body);

            /** @brief Chart URL for @p symbol over @p range. */
            static std::string chart_url(const std::string &symbol, const data::DateRange &range);

        private:
            HttpClient &http_;
            RateLimiter &limiter_;
        };

        /**
         * @enum YahooLookup
         * @brief Which symbols a YahooSymbolSource tries.
         */
        enum class YahooLookup
        {
            TICKER,            ///< Caller's ticker, else a known ISIN-to-ticker mapping, else a ticker-shaped identifier
            EXCHANGE_SUFFIXES, ///< "<ISIN>.<suffix>" over the configured exchange suffixes
            IDENTIFIER,        ///< The identifier itself
            NATIONAL_SUFFIX    ///< "<ISIN>.<suffix>" chosen from the ISIN's country (IE -> IR)
        };

        /**
         * @brief Known ISIN-to-ticker mappings for instruments the provider only lists by ticker.
         */
        const std::map<std::string, std::string> &known_tickers();

        /**
         * @brief Symbol to query profile data with: the caller's ticker, else a
         *        known mapping, else a ticker-shaped identifier.
         */
        std::optional<std::string> profile_symbol(const std::string &identifier,
                                                  const std::optional<std::string> &ticker);

        /**
         * @class YahooSymbolSource
         * @brief PriceSource over the chart API with one lookup strategy.
         *
         * Candidates are tried in order; the first returning more than
         * min_records rows wins.
         */
        class YahooSymbolSource : public PriceSource
        {
        public:
            YahooSymbolSource(std::shared_ptr<YahooChartClient> client,
                              YahooLookup lookup,
                              std::vector<std::string> exchange_suffixes = {},
                              size_t min_records = 10);

            std::string name() const override;

            std::optional<FetchedQuotes> fetch(const InstrumentRequest &request,
                                               const data::DateRange &range) override;

            /** @brief Symbols this source would query for @p request. */
            std::vector<std::string> candidates(const InstrumentRequest &request) const;

        private:
            std::shared_ptr<YahooChartClient> client_;
            YahooLookup lookup_;
            std::vector<std::string> exchange_suffixes_;
            size_t min_records_;
        };

    } // namespace sources
} // namespace fundscope

#endif // FUNDSCOPE_SOURCES_YAHOO_SOURCE_HPP
