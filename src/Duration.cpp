/**
 * @file Duration.cpp
 * @brief Implementation of period parsing and formatting
 */

#include "confres/Duration.hpp"

#include <cctype>
#include <limits>
#include <sstream>

namespace confres {

namespace {

// Units in the order they must appear.
enum Unit { Day = 0, Hour, Minute, Second, Milli, UnitCount };

std::int64_t* field(Period& p, int unit) {
    switch (unit) {
        case Day: return &p.days;
        case Hour: return &p.hours;
        case Minute: return &p.minutes;
        case Second: return &p.seconds;
        default: return &p.millis;
    }
}

std::int64_t field(const Period& p, int unit) {
    return *field(const_cast<Period&>(p), unit);
}

constexpr std::int64_t MILLIS_PER_UNIT[UnitCount] = {86400000, 3600000, 60000, 1000, 1};

/**
 * @brief Standard length in milliseconds, clamped to the int64 range
 * @return false if the length had to be clamped
 */
bool standard_millis(const Period& p, std::int64_t& out) noexcept {
    constexpr std::int64_t max = std::numeric_limits<std::int64_t>::max();
    constexpr std::int64_t min = std::numeric_limits<std::int64_t>::min();

    std::int64_t total = 0;
    for (int unit = Day; unit < UnitCount; ++unit) {
        const std::int64_t n = field(p, unit);
        const std::int64_t factor = MILLIS_PER_UNIT[unit];
        if (n > max / factor || n < min / factor) {
            out = n > 0 ? max : min;
            return false;
        }
        const std::int64_t part = n * factor;
        if ((part > 0 && total > max - part) || (part < 0 && total < min - part)) {
            out = part > 0 ? max : min;
            return false;
        }
        total += part;
    }
    out = total;
    return true;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // anonymous namespace

std::chrono::milliseconds Period::to_standard() const noexcept {
    std::int64_t total = 0;
    standard_millis(*this, total);
    return std::chrono::milliseconds(total);
}

std::optional<Period> parse_period(const std::string& input) {
    const std::string text = trim(input);
    if (text.empty()) return std::nullopt;

    Period period;
    int last_unit = -1;
    size_t pos = 0;

    while (pos < text.size()) {
        if (!std::isdigit(static_cast<unsigned char>(text[pos]))) return std::nullopt;

        std::int64_t count = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            const int digit = text[pos] - '0';
            if (count > (std::numeric_limits<std::int64_t>::max() - digit) / 10) {
                return std::nullopt;
            }
            count = count * 10 + digit;
            ++pos;
        }

        int unit;
        if (text.compare(pos, 2, "ms") == 0) {
            unit = Milli;
            pos += 2;
        } else if (pos < text.size()) {
            switch (text[pos]) {
                case 'd': unit = Day; break;
                case 'h': unit = Hour; break;
                case 'm': unit = Minute; break;
                case 's': unit = Second; break;
                default: return std::nullopt;
            }
            ++pos;
        } else {
            // bare number without a unit
            return std::nullopt;
        }

        if (unit <= last_unit) return std::nullopt;
        last_unit = unit;
        *field(period, unit) = count;
    }

    std::int64_t total = 0;
    if (!standard_millis(period, total)) return std::nullopt;
    return period;
}

std::string format_period(const Period& period) {
    static const char* const suffix[UnitCount] = {"d", "h", "m", "s", "ms"};
    std::ostringstream oss;
    for (int unit = Day; unit < UnitCount; ++unit) {
        const std::int64_t n = field(period, unit);
        if (n != 0) oss << n << suffix[unit];
    }
    const std::string out = oss.str();
    return out.empty() ? "0s" : out;
}

std::string iso8601(const Period& period) {
    std::ostringstream oss;
    oss << 'P';
    if (period.days != 0) oss << period.days << 'D';
    if (period.hours != 0 || period.minutes != 0 || period.seconds != 0 || period.millis != 0) {
        oss << 'T';
        if (period.hours != 0) oss << period.hours << 'H';
        if (period.minutes != 0) oss << period.minutes << 'M';
        if (period.seconds != 0 || period.millis != 0) {
            oss << period.seconds + period.millis / 1000;
            if (period.millis % 1000 != 0) {
                std::ostringstream frac;
                frac.width(3);
                frac.fill('0');
                frac << period.millis % 1000;
                oss << '.' << frac.str();
            }
            oss << 'S';
        }
    }
    const std::string out = oss.str();
    return out == "P" ? "PT0S" : out;
}

bool period_longer(const Period& a, const Period& b) noexcept {
    return a.to_standard() > b.to_standard();
}

} // namespace confres
