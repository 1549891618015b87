/**
 * @file identifier.cpp
 * @brief Implementation of identifier parsing.
 */

#include "data/identifier.hpp"

#include <algorithm>
#include <cctype>

namespace fundscope
{
    namespace data
    {

        std::string normalize_identifier(const std::string &raw)
        {
            size_t first = raw.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
            {
                return "";
            }
            size_t last = raw.find_last_not_of(" \t\r\n");
            std::string out = raw.substr(first, last - first + 1);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::toupper(c)); });
            return out;
        }

        bool looks_like_isin(const std::string &id)
        {
            if (id.size() < 12)
            {
                return false;
            }
            if (!std::isalpha(static_cast<unsigned char>(id[0])) || !std::isalpha(static_cast<unsigned char>(id[1])))
            {
                return false;
            }
            return std::all_of(id.begin(), id.end(),
                               [](unsigned char c)
                               { return std::isalnum(c) != 0; });
        }

        bool looks_like_ticker(const std::string &id)
        {
            if (id.empty() || id.size() > 5)
            {
                return false;
            }
            return std::all_of(id.begin(), id.end(),
                               [](unsigned char c)
                               { return std::isalpha(c) != 0; });
        }

        InstrumentId InstrumentId::parse(const std::string &raw)
        {
            InstrumentId id;
            id.value = normalize_identifier(raw);
            if (looks_like_isin(id.value))
            {
                id.kind = IdentifierKind::ISIN;
            }
            else if (looks_like_ticker(id.value))
            {
                id.kind = IdentifierKind::TICKER;
            }
            return id;
        }

        std::string InstrumentId::country_code() const
        {
            return is_isin() ? value.substr(0, 2) : std::string();
        }

        std::string to_string(IdentifierKind kind)
        {
            switch (kind)
            {
            case IdentifierKind::ISIN:
                return "isin";
            case IdentifierKind::TICKER:
                return "ticker";
            default:
                return "unknown";
            }
        }

    } // namespace data
} // namespace fundscope
