/**
 * @file composition_fetcher.hpp
 * @brief Best-effort fund composition (sector weights and top holdings).
 *
 * Read from the provider's quoteSummary "topHoldings" module:
 * @code
 *   {"topHoldings": {
 *      "holdings": [{"symbol": "AAPL", "holdingName": "Apple Inc",
 *                    "holdingPercent": {"raw": 0.0712}}],
 *      "sectorWeightings": [{"technology": {"raw": 0.28}}, ...]}}
 * @endcode
 * and cached under CacheKind::COMPOSITION.
 */

#ifndef FUNDSCOPE_SOURCES_COMPOSITION_FETCHER_HPP
#define FUNDSCOPE_SOURCES_COMPOSITION_FETCHER_HPP

#include "cache/cache_manager.hpp"
#include "sources/http_client.hpp"
#include "sources/rate_limiter.hpp"
#include "sources/yahoo_source.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fundscope
{
    namespace sources
    {

        /**
         * @struct Holding
         * @brief One position of a fund.
         */
        struct Holding
        {
            std::string symbol;
            std::string name;
            double weight = 0.0; ///< Percent of net assets
        };

        /**
         * @struct Composition
         * @brief Sector weights and largest holdings, in percent.
         */
        struct Composition
        {
            std::map<std::string, double> sectors;
            std::vector<Holding> top_holdings;
            std::string source;

            bool empty() const { return sectors.empty() && top_holdings.empty(); }

            nlohmann::json to_json() const;

            /** @throws nlohmann::json::exception on a malformed document. */
            static Composition from_json(const nlohmann::json &j);
        };

        /**
         * @class CompositionFetcher
         * @brief Cached provider lookup of a fund's composition.
         *
         * A missing composition is not an error; fetch() returns std::nullopt
         * and nothing is cached.
         */
        class CompositionFetcher
        {
        public:
            CompositionFetcher(HttpClient &http, RateLimiter &limiter, cache::CacheManager &cache);

            /**
             * @brief Composition of an instrument.
             * @param identifier ISIN or ticker (cache key).
             * @param ticker Provider symbol, if known.
             */
            std::optional<Composition> fetch(const std::string &identifier,
                                             const std::optional<std::string> &ticker);

            /**
             * @brief Extract sectors and holdings from a quoteSummary document.
             * @return std::nullopt when the module is absent or lists nothing.
             * @throws nlohmann::json::exception on a malformed document.
             */
            static std::optional<Composition> parse_top_holdings(const std::string &body);

        private:
            cache::CacheManager &cache_;
            YahooChartClient yahoo_;
        };

    } // namespace sources
} // namespace fundscope

#endif // FUNDSCOPE_SOURCES_COMPOSITION_FETCHER_HPP
