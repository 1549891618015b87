/**
 * @file description_fetcher.hpp
 * @brief Best-effort instrument descriptions, cached for a week.
 */

#ifndef FUNDSCOPE_SOURCES_DESCRIPTION_FETCHER_HPP
#define FUNDSCOPE_SOURCES_DESCRIPTION_FETCHER_HPP

#include "cache/cache_manager.hpp"
#include "sources/http_client.hpp"
#include "sources/rate_limiter.hpp"
#include "sources/yahoo_source.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fundscope
{
    namespace sources
    {

        /**
         * @struct Description
         * @brief Text and the source it came from.
         */
        struct Description
        {
            std::string text;
            std::string source;
        };

        /**
         * @class DescriptionFetcher
         * @brief Provider profile summary first, then the Wikipedia page summary.
         *
         * A missing description is not an error; fetch() returns std::nullopt.
         */
        class DescriptionFetcher
        {
        public:
            /** @brief Summaries longer than this are cut at a sentence or word boundary. */
            static constexpr size_t MAX_LENGTH = 1000;

            DescriptionFetcher(HttpClient &http, RateLimiter &limiter, cache::CacheManager &cache,
                               std::vector<std::string> wikipedia_languages = {"it", "en"});

            /**
             * @brief Description of an instrument.
             * @param identifier ISIN or ticker (cache key).
             * @param ticker Provider symbol, if known.
             * @param name Display name used as the Wikipedia title, if known.
             */
            std::optional<Description> fetch(const std::string &identifier,
                                             const std::optional<std::string> &ticker,
                                             const std::optional<std::string> &name);

            /** @brief Extract "extract" from a page summary document. */
            static std::optional<std::string> parse_wikipedia_summary(const std::string &body);

            /**
             * @brief Shorten @p text to about MAX_LENGTH characters.
             *
             * Cuts after the last full stop past 700 characters, else at the last
             * space past 900 characters with "...", else hard at MAX_LENGTH with "...".
             */
            static std::string truncate_summary(const std::string &text);

        private:
            std::optional<Description> fetch_uncached(const std::string &identifier,
                                                      const std::optional<std::string> &ticker,
                                                      const std::optional<std::string> &name);

            std::optional<std::string> wikipedia_summary(const std::string &title);

            HttpClient &http_;
            RateLimiter &limiter_;
            cache::CacheManager &cache_;
            YahooChartClient yahoo_;
            std::vector<std::string> wikipedia_languages_;
        };

    } // namespace sources
} // namespace fundscope

#endif // FUNDSCOPE_SOURCES_DESCRIPTION_FETCHER_HPP
