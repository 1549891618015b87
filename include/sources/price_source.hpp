/**
 * @file price_source.hpp
 * @brief Common interface of all historical price sources.
 */

#ifndef FUNDSCOPE_SOURCES_PRICE_SOURCE_HPP
#define FUNDSCOPE_SOURCES_PRICE_SOURCE_HPP

#include "adjustment/adjustment_classifier.hpp"
#include "data/calendar.hpp"

#include <optional>
#include <string>

namespace fundscope
{
    namespace sources
    {

        /**
         * @struct InstrumentRequest
         * @brief What the caller knows about the instrument.
         */
        struct InstrumentRequest
        {
            std::string identifier;            ///< ISIN or ticker, normalized
            std::optional<std::string> ticker; ///< Known trading symbol, if any
        };

        /**
         * @struct FetchedQuotes
         * @brief Raw history returned by one source.
         */
        struct FetchedQuotes
        {
            adjustment::RawQuoteHistory history;
            adjustment::VendorAdjustment adjustment = adjustment::VendorAdjustment::RAW_WITH_DISTRIBUTIONS;
            std::string symbol; ///< Symbol actually queried (e.g. "IE00B4L5Y983.L")
        };

        /**
         * @class PriceSource
         * @brief One way of obtaining a daily history.
         *
         * fetch() returns std::nullopt when the source has nothing for the
         * instrument and may throw on transport or payload errors; the
         * resolver treats both as "try the next source".
         */
        class PriceSource
        {
        public:
            virtual ~PriceSource() = default;

            /** @brief Provenance tag attached to series from this source. */
            virtual std::string name() const = 0;

            /** @brief False when the source lacks configuration (e.g. an API key). */
            virtual bool enabled() const { return true; }

            /**
             * @brief Fetch daily history for @p request within @p range.
             */
            virtual std::optional<FetchedQuotes> fetch(const InstrumentRequest &request,
                                                       const data::DateRange &range) = 0;
        };

    } // namespace sources
} // namespace fundscope

#endif // FUNDSCOPE_SOURCES_PRICE_SOURCE_HPP
