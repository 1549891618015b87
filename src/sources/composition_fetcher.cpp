/**
 * @file composition_fetcher.cpp
 * @brief Implementation of CompositionFetcher.
 */

#include "sources/composition_fetcher.hpp"
#include "data/identifier.hpp"

#include <exception>
#include <iostream>

namespace fundscope
{
    namespace sources
    {

        namespace
        {

            /** @brief Percent from a {"raw": fraction} value, or a bare number. */
            std::optional<double> percent(const nlohmann::json &value)
            {
                const nlohmann::json *number = &value;
                if (value.is_object())
                {
                    if (!value.contains("raw"))
                    {
                        return std::nullopt;
                    }
                    number = &value.at("raw");
                }
                if (!number->is_number())
                {
                    return std::nullopt;
                }
                return number->get<double>() * 100.0;
            }

        } // anonymous namespace

        // ===================================================================
        // Composition
        // ===================================================================

        nlohmann::json Composition::to_json() const
        {
            nlohmann::json holdings = nlohmann::json::array();
            for (const auto &h : top_holdings)
            {
                holdings.push_back({{"symbol", h.symbol}, {"name", h.name}, {"weight", h.weight}});
            }
            return {{"sectors", sectors}, {"top_holdings", holdings}, {"data_source", source}};
        }

        Composition Composition::from_json(const nlohmann::json &j)
        {
            Composition c;
            c.sectors = j.at("sectors").get<std::map<std::string, double>>();
            for (const auto &h : j.at("top_holdings"))
            {
                c.top_holdings.push_back({h.value("symbol", std::string()), h.value("name", std::string()),
                                          h.at("weight").get<double>()});
            }
            c.source = j.value("data_source", std::string());
            return c;
        }

        // ===================================================================
        // CompositionFetcher
        // ===================================================================

        CompositionFetcher::CompositionFetcher(HttpClient &http, RateLimiter &limiter, cache::CacheManager &cache)
            : cache_(cache), yahoo_(http, limiter)
        {
        }

        std::optional<Composition> CompositionFetcher::fetch(const std::string &identifier,
                                                             const std::optional<std::string> &ticker)
        {
            std::string id = data::normalize_identifier(identifier);

            if (auto entry = cache_.get(id, cache::CacheKind::COMPOSITION))
            {
                try
                {
                    return Composition::from_json(entry->data);
                }
                catch (const nlohmann::json::exception &e)
                {
                    std::cerr << "Warning: refetching composition of " << id << ", cached entry unreadable: "
                              << e.what() << std::endl;
                }
            }

            auto symbol = profile_symbol(id, ticker);
            if (!symbol)
            {
                return std::nullopt;
            }

            std::optional<Composition> composition;
            try
            {
                if (auto body = yahoo_.quote_summary(*symbol, "topHoldings"))
                {
                    composition = parse_top_holdings(*body);
                }
            }
            catch (const std::exception &e)
            {
                std::cerr << "Warning: holdings lookup failed for " << *symbol << ": " << e.what() << std::endl;
                return std::nullopt;
            }

            if (composition)
            {
                cache_.put(id, cache::CacheKind::COMPOSITION, composition->to_json(), composition->source);
            }
            return composition;
        }

        std::optional<Composition> CompositionFetcher::parse_top_holdings(const std::string &body)
        {
            auto doc = nlohmann::json::parse(body);
            const auto &results = doc.at("quoteSummary").at("result");
            if (!results.is_array() || results.empty() || !results.at(0).contains("topHoldings"))
            {
                return std::nullopt;
            }
            const auto &module = results.at(0).at("topHoldings");

            Composition c;
            c.source = "Yahoo Finance";

            if (module.contains("sectorWeightings") && module.at("sectorWeightings").is_array())
            {
                // Each element is a single-key object: {"technology": {"raw": 0.28}}
                for (const auto &entry : module.at("sectorWeightings"))
                {
                    for (auto it = entry.begin(); it != entry.end(); ++it)
                    {
                        auto weight = percent(it.value());
                        if (weight && *weight > 0.0)
                        {
                            c.sectors[it.key()] = *weight;
                        }
                    }
                }
            }

            if (module.contains("holdings") && module.at("holdings").is_array())
            {
                for (const auto &h : module.at("holdings"))
                {
                    Holding holding;
                    holding.symbol = h.value("symbol", std::string());
                    holding.name = h.value("holdingName", std::string());
                    if (h.contains("holdingPercent"))
                    {
                        holding.weight = percent(h.at("holdingPercent")).value_or(0.0);
                    }
                    if (!holding.symbol.empty() || !holding.name.empty())
                    {
                        c.top_holdings.push_back(holding);
                    }
                }
            }

            if (c.empty())
            {
                return std::nullopt;
            }
            return c;
        }

    } // namespace sources
} // namespace fundscope
