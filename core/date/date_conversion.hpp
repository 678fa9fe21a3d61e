#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace timestamp {
namespace date {

/**
 * @brief Result of a successful conversion
 *
 * unix_seconds: seconds since 1970-01-01T00:00:00Z
 * utc:          RFC 2822 rendering in UTC, e.g. "Sun, 25 Dec 2016 00:00:00 +0000"
 */
struct Conversion {
    int64_t unix_seconds = 0;
    std::string utc;
};

/**
 * @brief The only failure a conversion can produce
 */
enum class DateError { INVALID_DATE };

inline const char *date_error_to_string(DateError error) {
    switch (error) {
        case DateError::INVALID_DATE:
            return "Invalid Date";
        default:
            return "Invalid Date";
    }
}

/**
 * @brief Tagged conversion result: either a Conversion or a DateError.
 */
using ConversionResult = std::variant<Conversion, DateError>;

// Proleptic Gregorian calendar date
struct CivilDate {
    int64_t year = 1970;
    unsigned month = 1;  // 1..12
    unsigned day = 1;    // 1..31
};

// FOUR_DIGIT: exactly "YYYY". EXTENDED also accepts a signed year of four or
// more digits ("+10000", "-0001"), the rendering of years outside 0..9999.
enum class YearFormat { FOUR_DIGIT, EXTENDED };

using Clock = std::function<std::chrono::system_clock::time_point()>;

bool is_leap_year(int64_t year);
unsigned days_in_month(int64_t year, unsigned month);

// Days since 1970-01-01 for the given civil date
int64_t days_from_civil(const CivilDate &date);

// Civil date for the given number of days since 1970-01-01
CivilDate civil_from_days(int64_t days);

/**
 * @brief Parse a base-10 signed 64-bit integer
 *
 * Accepts an optional leading '+' or '-'. Rejects empty input, whitespace,
 * trailing characters and values that overflow int64_t.
 */
std::optional<int64_t> parse_unix_timestamp(std::string_view text);

/**
 * @brief Render the UTC calendar date containing a Unix timestamp as YYYY-MM-DD
 *
 * Years outside 0..9999 are written signed with at least four digits,
 * e.g. "+10000-01-01" or "-0001-12-31".
 */
std::string timestamp_to_calendar_date(int64_t unix_seconds);

/**
 * @brief Strict YYYY-MM-DD parser
 *
 * Four year digits (or a signed year with YearFormat::EXTENDED), one or two
 * month digits (1-12) and one or two day digits valid for that month.
 * Any other content fails.
 */
std::optional<CivilDate> parse_calendar_date(std::string_view text, YearFormat format = YearFormat::FOUR_DIGIT);

// "Www, DD Mmm YYYY HH:MM:SS +0000"
std::string format_rfc2822(int64_t unix_seconds);

Conversion make_conversion(int64_t unix_seconds);

/**
 * @brief Convert a path token to midnight UTC of the date it names
 *
 * A token that parses as an integer is taken as a Unix timestamp and first
 * rewritten to the calendar date containing it, so the time of day is always
 * dropped. Text taken from the path must be a strict YYYY-MM-DD date; a
 * rewritten timestamp may carry a signed year. Otherwise, or when midnight of
 * the date overflows int64_t seconds, DateError::INVALID_DATE is returned.
 */
ConversionResult convert_date(const std::string &text);

// Current time, truncated to whole seconds
Conversion convert_now(const Clock &clock);

}  // namespace date
}  // namespace timestamp
