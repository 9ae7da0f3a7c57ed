#include "progviz/render/time_format.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

namespace progviz {
namespace render {

namespace {

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t MINUTES_PER_HOUR = 60;
constexpr int64_t HOURS_PER_DAY = 24;
constexpr int64_t DAYS_PER_WEEK = 7;
constexpr int64_t WEEKS_PER_MONTH = 4;
constexpr int64_t MONTHS_PER_YEAR = 12;

constexpr double MAX_DISPLAY_SECONDS = 9.0e15;

}

DurationBreakdown breakDown(int64_t total_seconds) {
    DurationBreakdown result;
    if (total_seconds <= 0) {
        return result;
    }

    int64_t minutes = total_seconds / SECONDS_PER_MINUTE;
    result.seconds = total_seconds % SECONDS_PER_MINUTE;

    int64_t hours = minutes / MINUTES_PER_HOUR;
    result.minutes = minutes % MINUTES_PER_HOUR;

    int64_t days = hours / HOURS_PER_DAY;
    result.hours = hours % HOURS_PER_DAY;

    int64_t weeks = days / DAYS_PER_WEEK;
    result.days = days % DAYS_PER_WEEK;

    int64_t months = weeks / WEEKS_PER_MONTH;
    result.weeks = weeks % WEEKS_PER_MONTH;

    result.years = months / MONTHS_PER_YEAR;
    result.months = months % MONTHS_PER_YEAR;

    return result;
}

std::string formatDuration(double seconds) {
    int64_t whole = 0;
    if (std::isfinite(seconds) && seconds > 0) {
        whole = static_cast<int64_t>(std::floor(std::min(seconds, MAX_DISPLAY_SECONDS)));
    }

    DurationBreakdown parts = breakDown(whole);

    const std::array<std::pair<int64_t, const char*>, 7> units = {{
        {parts.years, "y"},
        {parts.months, "mo"},
        {parts.weeks, "w"},
        {parts.days, "d"},
        {parts.hours, "h"},
        {parts.minutes, "m"},
        {parts.seconds, "s"}
    }};

    size_t first = units.size() - 1;
    for (size_t i = 0; i < units.size(); ++i) {
        if (units[i].first != 0) {
            first = i;
            break;
        }
    }

    std::string result;
    for (size_t i = first; i < units.size(); ++i) {
        if (!result.empty()) {
            result += ' ';
        }
        result += std::to_string(units[i].first) + units[i].second;
    }
    return result;
}

std::string formatDuration(std::chrono::duration<double> duration) {
    return formatDuration(duration.count());
}

}}
