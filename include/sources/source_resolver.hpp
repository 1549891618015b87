/**
 * @file source_resolver.hpp
 * @brief Ordered fallback over price sources.
 *
 * Sources are tried in priority order:
 *  1. keyed adjusted vendors (EOD Historical Data, Financial Modeling Prep,
 *     Alpha Vantage), each only when configured;
 *  2. market-data provider by ticker;
 *  3. identifier plus exchange suffixes;
 *  4. identifier as a symbol;
 *  5. identifier plus a national suffix;
 *  6. fund portals (best effort).
 * The first source yielding more than min_records usable rows wins. Source
 * failures are logged and never propagated.
 */

#ifndef FUNDSCOPE_SOURCES_SOURCE_RESOLVER_HPP
#define FUNDSCOPE_SOURCES_SOURCE_RESOLVER_HPP

#include "adjustment/adjustment_classifier.hpp"
#include "data/data_loader.hpp"
#include "data/price_series.hpp"
#include "sources/http_client.hpp"
#include "sources/price_source.hpp"
#include "sources/rate_limiter.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fundscope
{
    namespace sources
    {

        /**
         * @struct ResolvedSeries
         * @brief Canonical series plus where it came from.
         */
        struct ResolvedSeries
        {
            data::PriceSeries series;
            std::string source_name;
            std::string symbol;
        };

        /**
         * @class SourceResolver
         * @brief Tries each source until one yields enough data.
         */
        class SourceResolver
        {
        public:
            /**
             * @brief Constructor.
             * @param sources Sources in priority order.
             * @param classifier Applied to every fetched history.
             * @param min_records A result must have strictly more rows than this.
             */
            SourceResolver(std::vector<std::shared_ptr<PriceSource>> sources,
                           adjustment::AdjustmentClassifier classifier = adjustment::AdjustmentClassifier{},
                           size_t min_records = 10);

            /**
             * @brief Resolve a daily series for @p request within @p range.
             * @return std::nullopt when every source is exhausted.
             */
            std::optional<ResolvedSeries> resolve(const InstrumentRequest &request,
                                                  const data::DateRange &range) const;

            /** @brief Names of the sources that will be tried, in order. */
            std::vector<std::string> active_source_names() const;

            const adjustment::AdjustmentClassifier &classifier() const { return classifier_; }

        private:
            std::optional<ResolvedSeries> try_source(PriceSource &source,
                                                     const InstrumentRequest &request,
                                                     const data::DateRange &range) const;

            std::vector<std::shared_ptr<PriceSource>> sources_;
            adjustment::AdjustmentClassifier classifier_;
            size_t min_records_;
        };

        /**
         * @brief Build the production chain from configuration.
         *
         * @p http and @p limiter must outlive the returned sources.
         */
        std::vector<std::shared_ptr<PriceSource>> build_default_sources(const data::AnalysisConfig &config,
                                                                        HttpClient &http,
                                                                        RateLimiter &limiter);

    } // namespace sources
} // namespace fundscope

#endif // FUNDSCOPE_SOURCES_SOURCE_RESOLVER_HPP
