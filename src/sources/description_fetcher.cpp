/**
 * @file description_fetcher.cpp
 * @brief Implementation of DescriptionFetcher.
 */

#include "sources/description_fetcher.hpp"
#include "data/identifier.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <utility>

namespace fundscope
{
    namespace sources
    {

        DescriptionFetcher::DescriptionFetcher(HttpClient &http, RateLimiter &limiter, cache::CacheManager &cache,
                                               std::vector<std::string> wikipedia_languages)
            : http_(http), limiter_(limiter), cache_(cache), yahoo_(http, limiter),
              wikipedia_languages_(std::move(wikipedia_languages))
        {
        }

        std::optional<Description> DescriptionFetcher::fetch(const std::string &identifier,
                                                             const std::optional<std::string> &ticker,
                                                             const std::optional<std::string> &name)
        {
            std::string id = data::normalize_identifier(identifier);

            if (auto entry = cache_.get(id, cache::CacheKind::DESCRIPTION))
            {
                if (entry->data.is_string())
                {
                    return Description{entry->data.get<std::string>(), entry->source};
                }
            }

            auto description = fetch_uncached(id, ticker, name);
            if (description)
            {
                cache_.put_description(id, description->text, description->source);
            }
            return description;
        }

        std::optional<Description> DescriptionFetcher::fetch_uncached(const std::string &identifier,
                                                                      const std::optional<std::string> &ticker,
                                                                      const std::optional<std::string> &name)
        {
            std::optional<std::string> symbol = profile_symbol(identifier, ticker);

            if (symbol)
            {
                try
                {
                    if (auto text = yahoo_.profile_summary(*symbol))
                    {
                        return Description{truncate_summary(*text), "Yahoo Finance"};
                    }
                }
                catch (const std::exception &e)
                {
                    std::cerr << "Warning: profile lookup failed for " << *symbol << ": " << e.what() << std::endl;
                }
            }

            std::string title = name ? *name : (symbol ? *symbol : identifier);
            try
            {
                if (auto text = wikipedia_summary(title))
                {
                    return Description{truncate_summary(*text), "Wikipedia"};
                }
            }
            catch (const std::exception &e)
            {
                std::cerr << "Warning: Wikipedia lookup failed for " << title << ": " << e.what() << std::endl;
            }

            return std::nullopt;
        }

        std::optional<std::string> DescriptionFetcher::wikipedia_summary(const std::string &title)
        {
            std::string encoded = title;
            for (auto &c : encoded)
            {
                if (c == ' ')
                {
                    c = '_';
                }
            }
            encoded = url_encode(encoded);

            for (const auto &lang : wikipedia_languages_)
            {
                limiter_.acquire("wikipedia");
                HttpResponse response = http_.get("https://" + lang + ".wikipedia.org/api/rest_v1/page/summary/" +
                                                  encoded + "?redirect=true",
                                                  {{"Accept", "application/json"}});
                if (!response.ok())
                {
                    continue;
                }
                if (auto text = parse_wikipedia_summary(response.body))
                {
                    return text;
                }
            }
            return std::nullopt;
        }

        std::optional<std::string> DescriptionFetcher::parse_wikipedia_summary(const std::string &body)
        {
            auto doc = nlohmann::json::parse(body);
            // Disambiguation pages list candidates rather than describe the instrument
            if (doc.value("type", std::string()) == "disambiguation")
            {
                return std::nullopt;
            }
            std::string extract = doc.value("extract", std::string());
            if (extract.empty())
            {
                return std::nullopt;
            }
            return extract;
        }

        std::string DescriptionFetcher::truncate_summary(const std::string &text)
        {
            size_t first = text.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
            {
                return "";
            }
            size_t last = text.find_last_not_of(" \t\r\n");
            std::string summary = text.substr(first, last - first + 1);
            if (summary.size() <= MAX_LENGTH)
            {
                return summary;
            }

            std::string head = summary.substr(0, MAX_LENGTH);
            size_t period = head.rfind('.');
            if (period != std::string::npos && period > 700)
            {
                return summary.substr(0, period + 1);
            }
            size_t space = head.rfind(' ');
            if (space != std::string::npos && space > 900)
            {
                return summary.substr(0, space) + "...";
            }
            return head + "...";
        }

    } // namespace sources
} // namespace fundscope
