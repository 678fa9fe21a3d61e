#include "date_conversion.hpp"

#include <cstdio>
#include <limits>

#include "../logging/logger.hpp"

namespace timestamp {
namespace date {

namespace {
constexpr int64_t kSecondsPerDay = 86400;
constexpr int64_t kMinFourDigitYear = 0;
constexpr int64_t kMaxFourDigitYear = 9999;
constexpr size_t kMaxExtendedYearDigits = 18;

constexpr const char *kShortWeekdays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
constexpr const char *kShortMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                        "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

bool is_digit(char c) { return c >= '0' && c <= '9'; }

// Floor division for possibly negative numerators
int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

// Reads 1..max_digits decimal digits starting at pos; advances pos
std::optional<unsigned> read_number(std::string_view text, size_t &pos, size_t min_digits, size_t max_digits) {
    size_t start = pos;
    unsigned value = 0;
    while (pos < text.size() && is_digit(text[pos]) && (pos - start) < max_digits) {
        value = value * 10 + static_cast<unsigned>(text[pos] - '0');
        ++pos;
    }
    if (pos - start < min_digits) {
        return std::nullopt;
    }
    return value;
}

// Sign followed by 4..18 digits, e.g. "+10000" or "-0001"
std::optional<int64_t> read_signed_year(std::string_view text, size_t &pos) {
    if (pos >= text.size() || (text[pos] != '+' && text[pos] != '-')) {
        return std::nullopt;
    }
    const bool negative = text[pos] == '-';
    ++pos;

    const size_t start = pos;
    int64_t value = 0;
    while (pos < text.size() && is_digit(text[pos]) && (pos - start) < kMaxExtendedYearDigits) {
        value = value * 10 + (text[pos] - '0');
        ++pos;
    }
    if (pos - start < 4) {
        return std::nullopt;
    }
    return negative ? -value : value;
}

// Midnight of the given day, if it fits in int64_t seconds
std::optional<int64_t> midnight_seconds(int64_t days) {
    if (days < std::numeric_limits<int64_t>::min() / kSecondsPerDay ||
        days > std::numeric_limits<int64_t>::max() / kSecondsPerDay) {
        return std::nullopt;
    }
    return days * kSecondsPerDay;
}
}  // namespace

bool is_leap_year(int64_t year) { return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0; }

unsigned days_in_month(int64_t year, unsigned month) {
    static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[month - 1];
}

// Era-based algorithms over 400-year cycles (146097 days)
int64_t days_from_civil(const CivilDate &date) {
    const int64_t y = static_cast<int64_t>(date.year) - (date.month <= 2 ? 1 : 0);
    const int64_t era = floor_div(y, 400);
    const int64_t yoe = y - era * 400;
    const int64_t mp = (static_cast<int64_t>(date.month) + 9) % 12;
    const int64_t doy = (153 * mp + 2) / 5 + static_cast<int64_t>(date.day) - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilDate civil_from_days(int64_t days) {
    const int64_t z = days + 719468;
    const int64_t era = floor_div(z, 146097);
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;

    CivilDate date;
    date.day = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
    date.month = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
    date.year = yoe + era * 400 + (date.month <= 2 ? 1 : 0);
    return date;
}

std::optional<int64_t> parse_unix_timestamp(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }

    size_t pos = 0;
    bool negative = false;
    if (text[0] == '+' || text[0] == '-') {
        negative = text[0] == '-';
        pos = 1;
    }
    if (pos == text.size()) {
        return std::nullopt;
    }

    // Accumulate as a negative number so INT64_MIN is representable
    const int64_t min = std::numeric_limits<int64_t>::min();
    int64_t value = 0;
    for (; pos < text.size(); ++pos) {
        if (!is_digit(text[pos])) {
            return std::nullopt;
        }
        const int64_t digit = text[pos] - '0';
        if (value < (min + digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 - digit;
    }

    if (!negative) {
        if (value == min) {
            return std::nullopt;
        }
        value = -value;
    }
    return value;
}

std::string timestamp_to_calendar_date(int64_t unix_seconds) {
    const CivilDate date = civil_from_days(floor_div(unix_seconds, kSecondsPerDay));

    char buffer[40];
    if (date.year >= kMinFourDigitYear && date.year <= kMaxFourDigitYear) {
        std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u", static_cast<long long>(date.year), date.month,
                      date.day);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%+05lld-%02u-%02u", static_cast<long long>(date.year), date.month,
                      date.day);
    }
    return std::string(buffer);
}

std::optional<CivilDate> parse_calendar_date(std::string_view text, YearFormat format) {
    size_t pos = 0;

    std::optional<int64_t> year;
    if (format == YearFormat::EXTENDED && !text.empty() && (text[0] == '+' || text[0] == '-')) {
        year = read_signed_year(text, pos);
    } else if (auto digits = read_number(text, pos, 4, 4)) {
        year = *digits;
    }
    if (!year || pos >= text.size() || text[pos] != '-') {
        return std::nullopt;
    }
    ++pos;

    auto month = read_number(text, pos, 1, 2);
    if (!month || pos >= text.size() || text[pos] != '-') {
        return std::nullopt;
    }
    ++pos;

    auto day = read_number(text, pos, 1, 2);
    if (!day || pos != text.size()) {
        return std::nullopt;
    }

    if (*month < 1 || *month > 12) {
        return std::nullopt;
    }
    if (*day < 1 || *day > days_in_month(*year, *month)) {
        return std::nullopt;
    }

    CivilDate date;
    date.year = *year;
    date.month = *month;
    date.day = *day;
    return date;
}

std::string format_rfc2822(int64_t unix_seconds) {
    const int64_t days = floor_div(unix_seconds, kSecondsPerDay);
    const int64_t secs_of_day = unix_seconds - days * kSecondsPerDay;
    const CivilDate date = civil_from_days(days);

    // 1970-01-01 was a Thursday
    const int64_t weekday = ((days % 7) + 7 + 4) % 7;

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%s, %02u %s %04lld %02d:%02d:%02d +0000", kShortWeekdays[weekday],
                  date.day, kShortMonths[date.month - 1], static_cast<long long>(date.year),
                  static_cast<int>(secs_of_day / 3600), static_cast<int>((secs_of_day % 3600) / 60),
                  static_cast<int>(secs_of_day % 60));
    return std::string(buffer);
}

Conversion make_conversion(int64_t unix_seconds) {
    Conversion conversion;
    conversion.unix_seconds = unix_seconds;
    conversion.utc = format_rfc2822(unix_seconds);
    return conversion;
}

ConversionResult convert_date(const std::string &text) {
    LOG_INFO("[Date] Provided date is " << text);

    std::string working = text;
    YearFormat format = YearFormat::FOUR_DIGIT;
    if (auto timestamp = parse_unix_timestamp(text)) {
        working = timestamp_to_calendar_date(*timestamp);
        format = YearFormat::EXTENDED;
        LOG_DEBUG("[Date] Converted timestamp " << *timestamp << " to date " << working);
    }

    auto civil = parse_calendar_date(working, format);
    if (!civil) {
        LOG_WARN("[Date] Failed to parse '" << working << "' as YYYY-MM-DD");
        return DateError::INVALID_DATE;
    }

    auto midnight = midnight_seconds(days_from_civil(*civil));
    if (!midnight) {
        LOG_WARN("[Date] Midnight of " << working << " is not representable in 64-bit seconds");
        return DateError::INVALID_DATE;
    }

    Conversion conversion = make_conversion(*midnight);
    LOG_DEBUG("[Date] Converted date is " << conversion.utc);
    return conversion;
}

Conversion convert_now(const Clock &clock) {
    const auto now = clock ? clock() : std::chrono::system_clock::now();
    const auto seconds = std::chrono::floor<std::chrono::seconds>(now.time_since_epoch()).count();
    return make_conversion(static_cast<int64_t>(seconds));
}

}  // namespace date
}  // namespace timestamp
