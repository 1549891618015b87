/**
 * @file scrape_sources.cpp
 * @brief Implementation of PortalScrapeSource.
 */

#include "sources/scrape_sources.hpp"
#include "data/identifier.hpp"

#include <iostream>
#include <utility>

namespace fundscope
{
    namespace sources
    {

        std::vector<PortalDescriptor> default_portals()
        {
            return {
                {"Morningstar", "https://www.morningstar.it/it/funds/snapshot/snapshot.aspx?id=",
                 "it-IT,it;q=0.9,en-US;q=0.8,en;q=0.7", "Nessun risultato"},
                {"Finanzen.net", "https://www.finanzen.net/fonds/",
                 "de-DE,de;q=0.9,en-US;q=0.8,en;q=0.7", "Seite nicht gefunden"},
                {"JustETF", "https://www.justetf.com/it/etf-profile.html?isin=",
                 "it-IT,it;q=0.9,en-US;q=0.8,en;q=0.7", "ETF non trovato"},
            };
        }

        PortalScrapeSource::PortalScrapeSource(HttpClient &http, RateLimiter &limiter, PortalDescriptor portal)
            : http_(http), limiter_(limiter), portal_(std::move(portal))
        {
        }

        std::optional<FetchedQuotes> PortalScrapeSource::fetch(const InstrumentRequest &request,
                                                               const data::DateRange &)
        {
            last_page_found_ = false;
            if (!data::looks_like_isin(request.identifier))
            {
                return std::nullopt;
            }

            limiter_.acquire(portal_.name);
            HttpResponse response = http_.get(portal_.url_prefix + url_encode(request.identifier),
                                              {{"Accept", "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8"},
                                               {"Accept-Language", portal_.language}});

            last_page_found_ = response.ok() &&
                               (portal_.not_found.empty() || response.body.find(portal_.not_found) == std::string::npos);
            if (last_page_found_)
            {
                std::cout << "  " << portal_.name << " lists " << request.identifier
                          << " but publishes no machine-readable history" << std::endl;
            }
            return std::nullopt;
        }

    } // namespace sources
} // namespace fundscope
