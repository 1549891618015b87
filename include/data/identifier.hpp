/**
 * @file identifier.hpp
 * @brief Instrument identifier parsing (ISIN or ticker).
 *
 * Callers pass identifiers without saying what they are. An ISIN-like
 * string has at least 12 alphanumeric characters and starts with a
 * two-letter country code; a ticker is a short alphabetic code of up to
 * five characters.
 */

#ifndef FUNDSCOPE_DATA_IDENTIFIER_HPP
#define FUNDSCOPE_DATA_IDENTIFIER_HPP

#include <string>

namespace fundscope
{
    namespace data
    {

        /**
         * @enum IdentifierKind
         * @brief Shape of an instrument identifier.
         */
        enum class IdentifierKind
        {
            ISIN,   ///< Country-prefixed identifier of 12+ characters
            TICKER, ///< Alphabetic symbol of up to 5 characters
            UNKNOWN ///< Neither shape
        };

        /**
         * @brief Upper-case, whitespace-trimmed form of an identifier.
         */
        std::string normalize_identifier(const std::string &raw);

        /** @brief ISIN-like: 12+ alphanumeric characters, first two letters. */
        bool looks_like_isin(const std::string &id);

        /** @brief Ticker-like: 1 to 5 letters. */
        bool looks_like_ticker(const std::string &id);

        /**
         * @struct InstrumentId
         * @brief Parsed identifier.
         */
        struct InstrumentId
        {
            std::string value;                           ///< Normalized identifier
            IdentifierKind kind = IdentifierKind::UNKNOWN;

            /**
             * @brief Parse and classify a raw identifier.
             */
            static InstrumentId parse(const std::string &raw);

            bool is_isin() const { return kind == IdentifierKind::ISIN; }
            bool is_ticker() const { return kind == IdentifierKind::TICKER; }

            /**
             * @brief Two-letter country code of an ISIN, empty for other kinds.
             */
            std::string country_code() const;
        };

        /** @brief Lower-case name of an IdentifierKind ("isin", "ticker", "unknown"). */
        std::string to_string(IdentifierKind kind);

    } // namespace data
} // namespace fundscope

#endif // FUNDSCOPE_DATA_IDENTIFIER_HPP
