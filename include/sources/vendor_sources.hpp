/**
 * @file vendor_sources.hpp
 * @brief Keyed data vendors that deliver an adjusted close.
 *
 * Each vendor is active only when its API key is configured. A response
 * carrying the vendor's adjusted field is reported as ALWAYS_ADJUSTED; a
 * response with only a plain close is passed on raw (without distributions).
 */

#ifndef FUNDSCOPE_SOURCES_VENDOR_SOURCES_HPP
#define FUNDSCOPE_SOURCES_VENDOR_SOURCES_HPP

#include "sources/http_client.hpp"
#include "sources/price_source.hpp"
#include "sources/rate_limiter.hpp"

#include <optional>
#include <string>

namespace fundscope
{
    namespace sources
    {

        /**
         * @class KeyedVendorSource
         * @brief Shared plumbing for API-key vendors.
         */
        class KeyedVendorSource : public PriceSource
        {
        public:
            bool enabled() const override { return api_key_.has_value() && !api_key_->empty(); }

        protected:
            KeyedVendorSource(HttpClient &http, RateLimiter &limiter, std::optional<std::string> api_key);

            /**
             * @brief Rate-limited GET.
             * @return Body of a 2xx response, std::nullopt on 404.
             * @throws std::runtime_error on other statuses.
             */
            std::optional<std::string> get_body(const std::string &provider, const std::string &url);

            const std::string &api_key() const { return *api_key_; }

        private:
            HttpClient &http_;
            RateLimiter &limiter_;
            std::optional<std::string> api_key_;
        };

        /**
         * @class EodHistoricalSource
         * @brief EOD Historical Data end-of-day prices, queried by identifier.
         */
        class EodHistoricalSource : public KeyedVendorSource
        {
        public:
            EodHistoricalSource(HttpClient &http, RateLimiter &limiter, std::optional<std::string> api_key);

            std::string name() const override { return "EOD Historical Data"; }

            std::optional<FetchedQuotes> fetch(const InstrumentRequest &request,
                                               const data::DateRange &range) override;

            /** @brief Parse an /api/eod JSON array. */
            static std::optional<FetchedQuotes> parse(const std::string &body);
        };

        /**
         * @class FmpSource
         * @brief Financial Modeling Prep historical-price-full, queried by identifier.
         */
        class FmpSource : public KeyedVendorSource
        {
        public:
            FmpSource(HttpClient &http, RateLimiter &limiter, std::optional<std::string> api_key);

            std::string name() const override { return "Financial Modeling Prep"; }

            std::optional<FetchedQuotes> fetch(const InstrumentRequest &request,
                                               const data::DateRange &range) override;

            static std::optional<FetchedQuotes> parse(const std::string &body);
        };

        /**
         * @class AlphaVantageSource
         * @brief Alpha Vantage TIME_SERIES_DAILY_ADJUSTED, queried by ticker.
         *
         * Instruments without a known ticker are skipped.
         */
        class AlphaVantageSource : public KeyedVendorSource
        {
        public:
            AlphaVantageSource(HttpClient &http, RateLimiter &limiter, std::optional<std::string> api_key);

            std::string name() const override { return "Alpha Vantage"; }

            std::optional<FetchedQuotes> fetch(const InstrumentRequest &request,
                                               const data::DateRange &range) override;

            /**
             * @brief Parse a daily time-series document, keeping dates within @p range.
             * @throws std::runtime_error on a rate-limit notice ("Note" / "Information").
             * @return std::nullopt on "Error Message" (symbol not supported).
             */
            static std::optional<FetchedQuotes> parse(const std::string &body, const data::DateRange &range);
        };

    } // namespace sources
} // namespace fundscope

#endif // FUNDSCOPE_SOURCES_VENDOR_SOURCES_HPP
