/**
 * @file calendar.hpp
 * @brief Calendar date helpers for YYYY-MM-DD date strings.
 *
 * Dates travel through the library as ISO strings ("2021-03-15"), the same
 * representation the CSV and JSON layers use. These helpers convert them to
 * a day count so gaps, offsets and epoch timestamps can be computed without
 * touching the local time zone.
 */

#ifndef FUNDSCOPE_DATA_CALENDAR_HPP
#define FUNDSCOPE_DATA_CALENDAR_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace fundscope
{
    namespace data
    {

        /**
         * @struct DateRange
         * @brief Inclusive range of calendar dates.
         */
        struct DateRange
        {
            std::string start; ///< First date (YYYY-MM-DD)
            std::string end;   ///< Last date (YYYY-MM-DD)

            /**
             * @brief Range covering the last @p years years up to @p end_date.
             * @param end_date Last date of the range.
             * @param years Number of 365-day years to go back.
             */
            static DateRange trailing_years(const std::string &end_date, int years);
        };

        /**
         * @brief Check for a well-formed YYYY-MM-DD date (month and day ranges included).
         */
        bool is_valid_date(const std::string &date);

        /**
         * @brief Days since 1970-01-01 for a YYYY-MM-DD date.
         * @throws std::invalid_argument if the date is malformed.
         */
        int64_t to_day_number(const std::string &date);

        /**
         * @brief Inverse of to_day_number().
         */
        std::string from_day_number(int64_t days);

        /**
         * @brief Add a (possibly negative) number of calendar days.
         */
        std::string add_days(const std::string &date, int64_t days);

        /**
         * @brief Calendar days from @p from to @p to (negative if @p to is earlier).
         */
        int64_t days_between(const std::string &from, const std::string &to);

        /**
         * @brief Day of week, 0 = Sunday ... 6 = Saturday.
         */
        int weekday(const std::string &date);

        /**
         * @brief Seconds since the Unix epoch at 00:00 UTC of @p date.
         */
        int64_t to_epoch_seconds(const std::string &date);

        /**
         * @brief UTC calendar date of a Unix timestamp.
         */
        std::string date_from_epoch_seconds(int64_t seconds);

        /**
         * @brief Format a time point as an ISO-8601 UTC timestamp ("2024-05-01T08:30:00Z").
         */
        std::string format_timestamp(std::chrono::system_clock::time_point tp);

        /**
         * @brief Parse a timestamp written by format_timestamp().
         *
         * Also accepts the forms without the trailing 'Z' and with fractional
         * seconds, which older cache files contain.
         *
         * @throws std::invalid_argument if the string cannot be parsed.
         */
        std::chrono::system_clock::time_point parse_timestamp(const std::string &text);

        /**
         * @brief Today's UTC date.
         */
        std::string today();

    } // namespace data
} // namespace fundscope

#endif // FUNDSCOPE_DATA_CALENDAR_HPP
