/**
 * @file fund_pipeline.hpp
 * @brief Batch orchestration: fetch, classify, validate, cache, compare.
 *
 * For each instrument the pipeline reads the historical cache, resolves a
 * fresh series on a miss, validates it, stores it with its validation
 * report and converts it to a total-return series. A repeated identifier is
 * processed once. The surviving series are
 * aligned into a ComparisonTable and a MetricsBundle (with beta against the
 * instrument's benchmark) is computed per column. One instrument failing
 * never stops the batch.
 */

#ifndef FUNDSCOPE_PIPELINE_FUND_PIPELINE_HPP
#define FUNDSCOPE_PIPELINE_FUND_PIPELINE_HPP

#include "analytics/benchmark_analysis.hpp"
#include "analytics/normalizer.hpp"
#include "analytics/performance_metrics.hpp"
#include "analytics/total_return.hpp"
#include "cache/cache_manager.hpp"
#include "data/data_loader.hpp"
#include "data/price_series.hpp"
#include "sources/composition_fetcher.hpp"
#include "sources/description_fetcher.hpp"
#include "sources/source_resolver.hpp"
#include "validation/data_validator.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fundscope
{
    namespace pipeline
    {

        /**
         * @struct InstrumentResult
         * @brief Outcome for one instrument.
         */
        struct InstrumentResult
        {
            data::InstrumentSpec instrument;
            std::optional<data::PriceSeries> series;              ///< Absent when no source had data
            std::string source;                                  ///< Source that produced the series
            bool from_cache = false;
            std::optional<validation::ValidationReport> validation;
            std::optional<analytics::TotalReturnSeries> total_return;
            std::optional<sources::Description> description;
            std::optional<sources::Composition> composition;
            std::optional<std::string> error;                    ///< Why the instrument was dropped

            bool ok() const { return total_return.has_value(); }

            /** @brief Column label: short name if given, else the identifier. */
            std::string label() const;
        };

        /**
         * @struct BatchResult
         * @brief Everything handed to report renderers.
         */
        struct BatchResult
        {
            std::vector<InstrumentResult> instruments;
            analytics::ComparisonTable table;
            std::vector<analytics::MetricsBundle> metrics;

            size_t succeeded() const;
            size_t failed() const;

            /**
             * @brief Metrics document: common start date, base value and one
             *        entry per instrument (with source and validation status).
             */
            nlohmann::json metrics_json() const;

            /** @brief Write metrics_json() to @p filepath. */
            void export_metrics_json(const std::string &filepath) const;
        };

        /**
         * @class FundPipeline
         * @brief Runs the per-instrument steps and the cross-instrument comparison.
         *
         * Usage:
         * @code
         *   sources::CurlHttpClient http(config.http_timeout_seconds);
         *   sources::RateLimiter limiter(...);
         *   auto resolver = std::make_shared<sources::SourceResolver>(
         *       sources::build_default_sources(config, http, limiter), classifier);
         *   FundPipeline pipeline(config, resolver, cache);
         *   BatchResult result = pipeline.run(instruments);
         * @endcode
         */
        class FundPipeline
        {
        public:
            /**
             * @brief Constructor.
             * @param config Run configuration (copied).
             * @param resolver Source chain (must not be null).
             * @param cache Cache manager (must not be null).
             * @param descriptions Optional description fetcher.
             * @param compositions Optional composition fetcher.
             * @throws std::invalid_argument if @p resolver or @p cache is null.
             */
            FundPipeline(const data::AnalysisConfig &config,
                         std::shared_ptr<sources::SourceResolver> resolver,
                         std::shared_ptr<cache::CacheManager> cache,
                         std::shared_ptr<sources::DescriptionFetcher> descriptions = nullptr,
                         std::shared_ptr<sources::CompositionFetcher> compositions = nullptr);

            ~FundPipeline() = default;

            /**
             * @brief Process a batch over the configured analysis range.
             */
            BatchResult run(const std::vector<data::InstrumentSpec> &instruments);

            /**
             * @brief Cached or freshly resolved series of one instrument.
             *
             * Never throws for source failures; those leave the result without a
             * series. Cache write failures are logged.
             */
            InstrumentResult load_instrument(const data::InstrumentSpec &instrument,
                                             const data::DateRange &range);

            /**
             * @brief Total-return series of a benchmark, cached under BENCHMARK.
             */
            std::optional<analytics::TotalReturnSeries> load_benchmark(const analytics::BenchmarkChoice &choice,
                                                                       const data::DateRange &range);

            /**
             * @brief Align results into a table and compute per-instrument metrics.
             */
            void compare(BatchResult &batch, const data::DateRange &range);

            const data::AnalysisConfig &config() const { return config_; }

            void set_verbose(bool verbose) { verbose_ = verbose; }

        private:
            data::AnalysisConfig config_;
            std::shared_ptr<sources::SourceResolver> resolver_;
            std::shared_ptr<cache::CacheManager> cache_;
            std::shared_ptr<sources::DescriptionFetcher> descriptions_;
            std::shared_ptr<sources::CompositionFetcher> compositions_;
            validation::DataValidator validator_;
            analytics::TotalReturnCalculator calculator_;
            std::map<std::string, std::optional<analytics::TotalReturnSeries>> benchmarks_;
            bool verbose_ = false;
        };

    } // namespace pipeline
} // namespace fundscope

#endif // FUNDSCOPE_PIPELINE_FUND_PIPELINE_HPP
