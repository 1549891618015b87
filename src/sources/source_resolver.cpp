/**
 * @file source_resolver.cpp
 * @brief Implementation of SourceResolver and the default source chain.
 */

#include "sources/source_resolver.hpp"
#include "data/calendar.hpp"
#include "data/identifier.hpp"
#include "sources/scrape_sources.hpp"
#include "sources/vendor_sources.hpp"
#include "sources/yahoo_source.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>
#include <iostream>
#include <utility>

namespace fundscope
{
    namespace sources
    {

        SourceResolver::SourceResolver(std::vector<std::shared_ptr<PriceSource>> sources,
                                       adjustment::AdjustmentClassifier classifier,
                                       size_t min_records)
            : sources_(std::move(sources)), classifier_(std::move(classifier)), min_records_(min_records)
        {
            for (const auto &source : sources_)
            {
                if (!source)
                {
                    throw std::invalid_argument("SourceResolver: null source");
                }
            }
        }

        std::vector<std::string> SourceResolver::active_source_names() const
        {
            std::vector<std::string> names;
            for (const auto &source : sources_)
            {
                if (source->enabled())
                {
                    names.push_back(source->name());
                }
            }
            return names;
        }

        std::optional<ResolvedSeries> SourceResolver::resolve(const InstrumentRequest &request,
                                                              const data::DateRange &range) const
        {
            InstrumentRequest normalized = request;
            normalized.identifier = data::normalize_identifier(request.identifier);
            if (normalized.ticker)
            {
                normalized.ticker = data::normalize_identifier(*normalized.ticker);
                if (normalized.ticker->empty())
                {
                    normalized.ticker.reset();
                }
            }

            for (const auto &source : sources_)
            {
                if (!source->enabled())
                {
                    continue;
                }

                try
                {
                    auto resolved = try_source(*source, normalized, range);
                    if (resolved)
                    {
                        std::cout << "  " << normalized.identifier << ": " << resolved->series.size()
                                  << " records from " << resolved->source_name;
                        if (!resolved->symbol.empty() && resolved->symbol != normalized.identifier)
                        {
                            std::cout << " (" << resolved->symbol << ")";
                        }
                        std::cout << std::endl;
                        return resolved;
                    }
                }
                catch (const std::exception &e)
                {
                    std::cerr << "Warning: " << source->name() << " failed for "
                              << normalized.identifier << ": " << e.what() << std::endl;
                }
            }

            std::cerr << "Warning: no data available for " << normalized.identifier << std::endl;
            return std::nullopt;
        }

        std::optional<ResolvedSeries> SourceResolver::try_source(PriceSource &source,
                                                                 const InstrumentRequest &request,
                                                                 const data::DateRange &range) const
        {
            auto fetched = source.fetch(request, range);
            if (!fetched || fetched->history.size() <= min_records_)
            {
                return std::nullopt;
            }
            fetched->history.validate();

            // Ticker used for classification: caller's hint, else the symbol that answered
            std::optional<std::string> ticker = request.ticker;
            if (!ticker && data::looks_like_ticker(fetched->symbol))
            {
                ticker = fetched->symbol;
            }

            auto cls = classifier_.classify(request.identifier, ticker);
            data::PriceSeries series = classifier_.apply(fetched->history, cls, fetched->adjustment);
            if (series.size() <= min_records_)
            {
                return std::nullopt;
            }

            series.set_source_name(source.name());
            series.set_fetched_at(data::format_timestamp(std::chrono::system_clock::now()));

            ResolvedSeries resolved;
            resolved.source_name = source.name();
            resolved.symbol = fetched->symbol;
            resolved.series = std::move(series);
            return resolved;
        }

        // ===================================================================
        // Default chain
        // ===================================================================

        std::vector<std::shared_ptr<PriceSource>> build_default_sources(const data::AnalysisConfig &config,
                                                                        HttpClient &http,
                                                                        RateLimiter &limiter)
        {
            std::vector<std::shared_ptr<PriceSource>> sources;

            sources.push_back(std::make_shared<EodHistoricalSource>(http, limiter, config.eod_api_key));
            sources.push_back(std::make_shared<FmpSource>(http, limiter, config.fmp_api_key));
            sources.push_back(std::make_shared<AlphaVantageSource>(http, limiter, config.alpha_vantage_api_key));

            auto yahoo = std::make_shared<YahooChartClient>(http, limiter);
            sources.push_back(std::make_shared<YahooSymbolSource>(yahoo, YahooLookup::TICKER));
            sources.push_back(std::make_shared<YahooSymbolSource>(yahoo, YahooLookup::EXCHANGE_SUFFIXES,
                                                                  config.exchange_suffixes));
            sources.push_back(std::make_shared<YahooSymbolSource>(yahoo, YahooLookup::IDENTIFIER));
            sources.push_back(std::make_shared<YahooSymbolSource>(yahoo, YahooLookup::NATIONAL_SUFFIX));

            for (auto &portal : default_portals())
            {
                sources.push_back(std::make_shared<PortalScrapeSource>(http, limiter, std::move(portal)));
            }

            return sources;
        }

    } // namespace sources
} // namespace fundscope
