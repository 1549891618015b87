/**
 * @file fund_pipeline.cpp
 * @brief Implementation of FundPipeline and BatchResult.
 */

#include "pipeline/fund_pipeline.hpp"
#include "data/identifier.hpp"

#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <set>
#include <stdexcept>
#include <utility>

namespace fundscope
{
    namespace pipeline
    {

        namespace
        {

            /** @brief Results with fewer rows are treated as unusable, as in the resolver. */
            constexpr size_t MIN_RECORDS = 10;

        } // anonymous namespace

        // ===================================================================
        // InstrumentResult / BatchResult
        // ===================================================================

        std::string InstrumentResult::label() const
        {
            return instrument.name_short ? *instrument.name_short : instrument.identifier;
        }

        size_t BatchResult::succeeded() const
        {
            size_t n = 0;
            for (const auto &r : instruments)
            {
                if (r.ok())
                    ++n;
            }
            return n;
        }

        size_t BatchResult::failed() const
        {
            return instruments.size() - succeeded();
        }

        nlohmann::json BatchResult::metrics_json() const
        {
            nlohmann::json doc;
            doc["common_start_date"] = table.common_start_date();
            doc["base_value"] = table.base_value();

            std::map<std::string, const analytics::MetricsBundle *> by_instrument;
            for (const auto &m : metrics)
            {
                by_instrument[m.instrument] = &m;
            }

            nlohmann::json entries = nlohmann::json::array();
            nlohmann::json failures = nlohmann::json::array();
            for (const auto &r : instruments)
            {
                auto it = by_instrument.find(r.instrument.identifier);
                if (it == by_instrument.end())
                {
                    failures.push_back({{"identifier", r.instrument.identifier},
                                        {"error", r.error ? *r.error : std::string("excluded from comparison")}});
                    continue;
                }

                nlohmann::json entry = it->second->to_json();
                entry["identifier"] = r.instrument.identifier;
                entry["name"] = r.label();
                entry["source"] = r.source;
                entry["from_cache"] = r.from_cache;
                if (r.series)
                {
                    entry["is_adjusted"] = r.series->is_adjusted();
                }
                if (r.validation)
                {
                    entry["validation"] = r.validation->to_json();
                }
                if (r.description)
                {
                    entry["description"] = r.description->text;
                    entry["description_source"] = r.description->source;
                }
                if (r.composition)
                {
                    entry["composition"] = r.composition->to_json();
                }
                entries.push_back(entry);
            }

            doc["instruments"] = entries;
            doc["failed"] = failures;
            return doc;
        }

        void BatchResult::export_metrics_json(const std::string &filepath) const
        {
            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }
            file << std::setw(2) << metrics_json() << std::endl;
        }

        // ===================================================================
        // FundPipeline
        // ===================================================================

        FundPipeline::FundPipeline(const data::AnalysisConfig &config,
                                   std::shared_ptr<sources::SourceResolver> resolver,
                                   std::shared_ptr<cache::CacheManager> cache,
                                   std::shared_ptr<sources::DescriptionFetcher> descriptions,
                                   std::shared_ptr<sources::CompositionFetcher> compositions)
            : config_(config),
              resolver_(std::move(resolver)),
              cache_(std::move(cache)),
              descriptions_(std::move(descriptions)),
              compositions_(std::move(compositions)),
              validator_(config.validation, config.ex_distribution_threshold),
              calculator_(config.ex_distribution_threshold)
        {
            if (!resolver_)
            {
                throw std::invalid_argument("FundPipeline: resolver must not be null");
            }
            if (!cache_)
            {
                throw std::invalid_argument("FundPipeline: cache must not be null");
            }
        }

        BatchResult FundPipeline::run(const std::vector<data::InstrumentSpec> &instruments)
        {
            data::DateRange range = config_.analysis_range();
            BatchResult batch;

            std::cout << "Processing " << instruments.size() << " instrument(s) from "
                      << range.start << " to " << range.end << std::endl;

            std::set<std::string> seen;
            for (size_t i = 0; i < instruments.size(); ++i)
            {
                const auto &instrument = instruments[i];
                std::cout << "[" << (i + 1) << "/" << instruments.size() << "] "
                          << instrument.identifier << std::endl;

                if (!seen.insert(data::normalize_identifier(instrument.identifier)).second)
                {
                    std::cerr << "Warning: skipping repeated instrument " << instrument.identifier << std::endl;
                    continue;
                }

                InstrumentResult result;
                try
                {
                    result = load_instrument(instrument, range);
                }
                catch (const std::exception &e)
                {
                    result = InstrumentResult{};
                    result.instrument = instrument;
                    result.error = e.what();
                    std::cerr << "Error: processing " << instrument.identifier << " failed: " << e.what() << std::endl;
                }
                batch.instruments.push_back(std::move(result));
            }

            try
            {
                compare(batch, range);
            }
            catch (const std::exception &e)
            {
                std::cerr << "Error: comparison failed: " << e.what() << std::endl;
                batch.table = analytics::ComparisonTable();
                batch.metrics.clear();
            }

            std::cout << "Completed: " << batch.succeeded() << " succeeded, "
                      << batch.failed() << " failed" << std::endl;
            return batch;
        }

        InstrumentResult FundPipeline::load_instrument(const data::InstrumentSpec &instrument,
                                                       const data::DateRange &range)
        {
            InstrumentResult result;
            result.instrument = instrument;
            const std::string &id = instrument.identifier;

            if (auto cached = cache_->get_series(id, cache::CacheKind::HISTORICAL))
            {
                data::PriceSeries series = cached->series.filter_by_date(range.start, range.end);
                if (series.size() > MIN_RECORDS)
                {
                    bool trimmed = series.size() < cached->series.size();
                    result.series = std::move(series);
                    result.source = cached->source;
                    result.from_cache = true;
                    // A stored report describes the full cached history
                    if (cached->validation && !trimmed)
                    {
                        try
                        {
                            result.validation = validation::ValidationReport::from_json(*cached->validation);
                        }
                        catch (const std::exception &e)
                        {
                            std::cerr << "Warning: revalidating " << id << ", stored report unreadable: "
                                      << e.what() << std::endl;
                        }
                    }
                    if (verbose_)
                    {
                        std::cout << "  " << id << ": " << result.series->size() << " records from cache ("
                                  << result.source << ")" << std::endl;
                    }
                }
            }

            if (!result.series)
            {
                auto resolved = resolver_->resolve({id, instrument.ticker}, range);
                if (!resolved)
                {
                    result.error = "no data available";
                    return result;
                }

                result.source = resolved->source_name;
                result.series = std::move(resolved->series);
                result.validation = validator_.validate(*result.series);

                try
                {
                    cache_->put_series(id, cache::CacheKind::HISTORICAL, *result.series, result.validation->to_json());
                }
                catch (const std::exception &e)
                {
                    std::cerr << "Warning: could not cache " << id << ": " << e.what() << std::endl;
                }
            }

            if (!result.validation)
            {
                result.validation = validator_.validate(*result.series);
            }
            if (!result.validation->is_valid() || verbose_)
            {
                validator_.log_report(id, *result.validation);
            }

            result.total_return = calculator_.compute(*result.series, id);

            if (descriptions_)
            {
                try
                {
                    result.description = descriptions_->fetch(id, instrument.ticker, instrument.name_short);
                }
                catch (const std::exception &e)
                {
                    std::cerr << "Warning: description unavailable for " << id << ": " << e.what() << std::endl;
                }
            }

            if (compositions_)
            {
                try
                {
                    result.composition = compositions_->fetch(id, instrument.ticker);
                }
                catch (const std::exception &e)
                {
                    std::cerr << "Warning: composition unavailable for " << id << ": " << e.what() << std::endl;
                }
            }

            return result;
        }

        std::optional<analytics::TotalReturnSeries> FundPipeline::load_benchmark(const analytics::BenchmarkChoice &choice,
                                                                                 const data::DateRange &range)
        {
            auto memo = benchmarks_.find(choice.ticker);
            if (memo != benchmarks_.end())
            {
                return memo->second;
            }

            std::optional<data::PriceSeries> series;
            if (auto cached = cache_->get_series(choice.ticker, cache::CacheKind::BENCHMARK))
            {
                data::PriceSeries filtered = cached->series.filter_by_date(range.start, range.end);
                if (filtered.size() > MIN_RECORDS)
                {
                    series = std::move(filtered);
                }
            }

            if (!series)
            {
                auto resolved = resolver_->resolve({choice.ticker, choice.ticker}, range);
                if (resolved)
                {
                    series = std::move(resolved->series);
                    try
                    {
                        cache_->put_series(choice.ticker, cache::CacheKind::BENCHMARK, *series);
                    }
                    catch (const std::exception &e)
                    {
                        std::cerr << "Warning: could not cache benchmark " << choice.ticker << ": " << e.what()
                                  << std::endl;
                    }
                }
            }

            std::optional<analytics::TotalReturnSeries> tr;
            if (series)
            {
                tr = calculator_.compute(*series, choice.ticker);
            }
            benchmarks_[choice.ticker] = tr;
            return tr;
        }

        void FundPipeline::compare(BatchResult &batch, const data::DateRange &range)
        {
            std::vector<analytics::TotalReturnSeries> series;
            for (const auto &r : batch.instruments)
            {
                if (r.ok())
                {
                    series.push_back(*r.total_return);
                }
            }
            if (series.empty())
            {
                std::cerr << "Warning: no instrument has data, nothing to compare" << std::endl;
                return;
            }

            analytics::SeriesNormalizer normalizer(config_.base_value);
            batch.table = normalizer.build(series, config_.common_start_date);
            std::cout << "Comparison starts " << batch.table.common_start_date() << " ("
                      << batch.table.num_instruments() << " instrument(s), "
                      << batch.table.num_dates() << " dates)" << std::endl;

            for (const auto &name : batch.table.instruments())
            {
                analytics::TotalReturnSeries column = batch.table.column(name);
                analytics::PerformanceMetrics metrics(column, config_.risk_free_rate, config_.trading_days_per_year);
                analytics::MetricsBundle bundle = metrics.bundle();
                bundle.instrument = name;

                analytics::BenchmarkChoice choice = analytics::select_benchmark(name);
                std::optional<analytics::TotalReturnSeries> benchmark;
                try
                {
                    benchmark = load_benchmark(choice, range);
                }
                catch (const std::exception &e)
                {
                    std::cerr << "Warning: benchmark " << choice.ticker << " unavailable for " << name << ": "
                              << e.what() << std::endl;
                }

                if (benchmark)
                {
                    try
                    {
                        analytics::BenchmarkAnalysis relative(column, *benchmark,
                                                              analytics::BenchmarkAnalysis::MIN_OBSERVATIONS,
                                                              config_.trading_days_per_year);
                        bundle.beta = relative.beta();
                        bundle.alpha = relative.alpha() * 100.0;
                        bundle.correlation = relative.regression().correlation;
                        bundle.tracking_error = relative.tracking_error() * 100.0;
                    }
                    catch (const std::invalid_argument &e)
                    {
                        if (verbose_)
                        {
                            std::cout << "  " << name << ": beta unavailable against " << choice.ticker << ": "
                                      << e.what() << std::endl;
                        }
                    }
                }

                if (bundle.beta)
                {
                    bundle.benchmark = choice.name;
                }

                if (verbose_)
                {
                    std::cout << metrics.summary() << std::endl;
                }
                batch.metrics.push_back(bundle);
            }
        }

    } // namespace pipeline
} // namespace fundscope
