/**
 * @file calendar.cpp
 * @brief Implementation of the calendar helpers.
 *
 * Day numbers use the proleptic Gregorian civil-from-days algorithm, so no
 * call depends on mktime() or the process time zone.
 */

#include "data/calendar.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace fundscope
{
    namespace data
    {

        namespace
        {

            int64_t days_from_civil(int64_t y, unsigned m, unsigned d)
            {
                y -= m <= 2;
                const int64_t era = (y >= 0 ? y : y - 399) / 400;
                const unsigned yoe = static_cast<unsigned>(y - era * 400);
                const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
                const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
                return era * 146097 + static_cast<int64_t>(doe) - 719468;
            }

            void civil_from_days(int64_t z, int64_t &y, unsigned &m, unsigned &d)
            {
                z += 719468;
                const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
                const unsigned doe = static_cast<unsigned>(z - era * 146097);
                const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
                y = static_cast<int64_t>(yoe) + era * 400;
                const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
                const unsigned mp = (5 * doy + 2) / 153;
                d = doy - (153 * mp + 2) / 5 + 1;
                m = mp < 10 ? mp + 3 : mp - 9;
                y += m <= 2;
            }

            bool is_leap(int64_t y)
            {
                return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
            }

            unsigned days_in_month(int64_t y, unsigned m)
            {
                static const unsigned table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
                if (m == 2 && is_leap(y))
                {
                    return 29;
                }
                return table[m - 1];
            }

            bool parse_digits(const std::string &s, size_t pos, size_t len, int &out)
            {
                out = 0;
                for (size_t i = pos; i < pos + len; ++i)
                {
                    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i])))
                    {
                        return false;
                    }
                    out = out * 10 + (s[i] - '0');
                }
                return true;
            }

        } // anonymous namespace

        DateRange DateRange::trailing_years(const std::string &end_date, int years)
        {
            DateRange range;
            range.end = end_date;
            range.start = add_days(end_date, -static_cast<int64_t>(years) * 365);
            return range;
        }

        bool is_valid_date(const std::string &date)
        {
            if (date.size() != 10 || date[4] != '-' || date[7] != '-')
            {
                return false;
            }

            int y = 0;
            int m = 0;
            int d = 0;
            if (!parse_digits(date, 0, 4, y) || !parse_digits(date, 5, 2, m) || !parse_digits(date, 8, 2, d))
            {
                return false;
            }
            if (m < 1 || m > 12 || d < 1)
            {
                return false;
            }
            return static_cast<unsigned>(d) <= days_in_month(y, static_cast<unsigned>(m));
        }

        int64_t to_day_number(const std::string &date)
        {
            if (!is_valid_date(date))
            {
                throw std::invalid_argument("Invalid date (expected YYYY-MM-DD): '" + date + "'");
            }
            int y = 0;
            int m = 0;
            int d = 0;
            parse_digits(date, 0, 4, y);
            parse_digits(date, 5, 2, m);
            parse_digits(date, 8, 2, d);
            return days_from_civil(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
        }

        std::string from_day_number(int64_t days)
        {
            int64_t y = 0;
            unsigned m = 0;
            unsigned d = 0;
            civil_from_days(days, y, m, d);

            char buffer[16];
            std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u", static_cast<long long>(y), m, d);
            return std::string(buffer);
        }

        std::string add_days(const std::string &date, int64_t days)
        {
            return from_day_number(to_day_number(date) + days);
        }

        int64_t days_between(const std::string &from, const std::string &to)
        {
            return to_day_number(to) - to_day_number(from);
        }

        int weekday(const std::string &date)
        {
            // 1970-01-01 was a Thursday
            int64_t z = to_day_number(date);
            return static_cast<int>(z >= -4 ? (z + 4) % 7 : (z + 5) % 7 + 6);
        }

        int64_t to_epoch_seconds(const std::string &date)
        {
            return to_day_number(date) * 86400;
        }

        std::string date_from_epoch_seconds(int64_t seconds)
        {
            int64_t days = seconds / 86400;
            if (seconds < 0 && seconds % 86400 != 0)
            {
                --days;
            }
            return from_day_number(days);
        }

        std::string format_timestamp(std::chrono::system_clock::time_point tp)
        {
            int64_t secs = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
            int64_t days = secs / 86400;
            int64_t rem = secs % 86400;
            if (rem < 0)
            {
                rem += 86400;
                --days;
            }

            char buffer[32];
            std::snprintf(buffer, sizeof(buffer), "%sT%02d:%02d:%02dZ",
                          from_day_number(days).c_str(),
                          static_cast<int>(rem / 3600),
                          static_cast<int>((rem % 3600) / 60),
                          static_cast<int>(rem % 60));
            return std::string(buffer);
        }

        std::chrono::system_clock::time_point parse_timestamp(const std::string &text)
        {
            if (text.size() < 19 || text[10] != 'T' || text[13] != ':' || text[16] != ':')
            {
                throw std::invalid_argument("Invalid timestamp: '" + text + "'");
            }

            int hh = 0;
            int mm = 0;
            int ss = 0;
            if (!parse_digits(text, 11, 2, hh) || !parse_digits(text, 14, 2, mm) || !parse_digits(text, 17, 2, ss) ||
                hh > 23 || mm > 59 || ss > 60)
            {
                throw std::invalid_argument("Invalid timestamp: '" + text + "'");
            }

            int64_t secs = to_day_number(text.substr(0, 10)) * 86400 + hh * 3600 + mm * 60 + ss;
            return std::chrono::system_clock::time_point(std::chrono::seconds(secs));
        }

        std::string today()
        {
            return format_timestamp(std::chrono::system_clock::now()).substr(0, 10);
        }

    } // namespace data
} // namespace fundscope
