/**
 * @file Duration.hpp
 * @brief Duration and period values used by configuration settings
 *
 * Three semantic time types appear in resolved configurations:
 * - Minutes: whole minutes, from an integer setting (e.g. conn-max-age = 60)
 * - Days: whole days, from an integer setting
 * - Period: a calendar-style period written as unit groups, e.g. "14d",
 *   "1d12h", "90m", "500ms" (units d, h, m, s, ms, each at most once, in
 *   that order)
 */

#ifndef CONFRES_DURATION_HPP
#define CONFRES_DURATION_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <ratio>
#include <string>

namespace confres {

using Minutes = std::chrono::minutes;
using Days = std::chrono::duration<std::int64_t, std::ratio<86400>>;

/**
 * @brief A period made of day, hour, minute, second and millisecond fields
 *
 * Fields are kept as written ("48h" stays 48 hours, it is not folded into
 * days); comparisons of length use standard 24-hour days.
 */
struct Period {
    std::int64_t days = 0;
    std::int64_t hours = 0;
    std::int64_t minutes = 0;
    std::int64_t seconds = 0;
    std::int64_t millis = 0;

    static Period of_days(std::int64_t n) { Period p; p.days = n; return p; }
    static Period of_hours(std::int64_t n) { Period p; p.hours = n; return p; }
    static Period of_minutes(std::int64_t n) { Period p; p.minutes = n; return p; }

    /**
     * @brief Standard length of the period
     *
     * Saturates at the int64 millisecond range; parse_period() never
     * produces a period outside it.
     */
    std::chrono::milliseconds to_standard() const noexcept;

    bool operator==(const Period& o) const noexcept {
        return days == o.days && hours == o.hours && minutes == o.minutes &&
               seconds == o.seconds && millis == o.millis;
    }
    bool operator!=(const Period& o) const noexcept { return !(*this == o); }
};

/**
 * @brief Parse a period string
 *
 * @param text Unit groups such as "14d" or "1d12h"; surrounding whitespace
 *        is ignored
 * @return The period, or nullopt if @p text is not a valid period or its
 *         standard length does not fit in int64 milliseconds
 */
std::optional<Period> parse_period(const std::string& text);

/**
 * @brief Canonical text of a period, parseable by parse_period()
 *
 * Zero fields are omitted; the empty period is "0s".
 */
std::string format_period(const Period& period);

/**
 * @brief ISO-8601 rendering of a period (e.g. "P14D", "PT1H30M", "PT0S")
 */
std::string iso8601(const Period& period);

/**
 * @brief Whether @p a is strictly longer than @p b
 */
bool period_longer(const Period& a, const Period& b) noexcept;

} // namespace confres

#endif // CONFRES_DURATION_HPP
