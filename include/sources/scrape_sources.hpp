/**
 * @file scrape_sources.hpp
 * @brief Last-resort fund portal lookups.
 *
 * The portals render their price charts client-side, so the fetched pages
 * carry no parseable history. The sources confirm whether the portal knows
 * the identifier and always report "no data".
 */

#ifndef FUNDSCOPE_SOURCES_SCRAPE_SOURCES_HPP
#define FUNDSCOPE_SOURCES_SCRAPE_SOURCES_HPP

#include "sources/http_client.hpp"
#include "sources/price_source.hpp"
#include "sources/rate_limiter.hpp"

#include <string>
#include <vector>

namespace fundscope
{
    namespace sources
    {

        /**
         * @struct PortalDescriptor
         * @brief Where a portal lists an identifier and how to address it.
         */
        struct PortalDescriptor
        {
            std::string name;        ///< Provenance tag, e.g. "Morningstar"
            std::string url_prefix;  ///< Identifier is appended to this
            std::string language;    ///< Accept-Language header
            std::string not_found;   ///< Marker text of the portal's "unknown instrument" page
        };

        /** @brief Morningstar, Finanzen.net and JustETF, in fallback order. */
        std::vector<PortalDescriptor> default_portals();

        /**
         * @class PortalScrapeSource
         * @brief Queries one portal's instrument page.
         */
        class PortalScrapeSource : public PriceSource
        {
        public:
            PortalScrapeSource(HttpClient &http, RateLimiter &limiter, PortalDescriptor portal);

            std::string name() const override { return portal_.name; }

            /** @brief Only ISINs are listed by the portals. */
            std::optional<FetchedQuotes> fetch(const InstrumentRequest &request,
                                               const data::DateRange &range) override;

            /** @brief True if the portal returned an instrument page for the last request. */
            bool last_page_found() const { return last_page_found_; }

        private:
            HttpClient &http_;
            RateLimiter &limiter_;
            PortalDescriptor portal_;
            bool last_page_found_ = false;
        };

    } // namespace sources
} // namespace fundscope

#endif // FUNDSCOPE_SOURCES_SCRAPE_SOURCES_HPP
