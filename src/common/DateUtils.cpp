#include "common/DateUtils.h"

#include <algorithm>
#include <chrono>
#include <cstdio>

namespace revscan {
namespace utils {

namespace {
constexpr std::time_t kSecondsPerDay = 24 * 60 * 60;

std::tm toUtc(std::time_t t) {
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    return tm_utc;
}
}

std::string nowIsoUtc() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    const std::tm tm_utc = toUtc(now);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return buffer;
}

std::string todayUtc() {
    return formatDate(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

std::string formatDate(std::time_t epoch_seconds) {
    const std::tm tm_utc = toUtc(epoch_seconds);
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm_utc);
    return buffer;
}

std::time_t parseDate(const std::string& date) {
    int year = 0;
    int month = 0;
    int day = 0;
    if (date.size() < 10 || std::sscanf(date.c_str(), "%4d-%2d-%2d", &year, &month, &day) != 3) {
        return -1;
    }
    std::tm tm_utc{};
    tm_utc.tm_year = year - 1900;
    tm_utc.tm_mon = month - 1;
    tm_utc.tm_mday = day;
    return timegm(&tm_utc);
}

bool isSameDay(const std::string& iso_timestamp, const std::string& day) {
    return iso_timestamp.size() >= 10 && day.size() >= 10 &&
           iso_timestamp.compare(0, 10, day, 0, 10) == 0;
}

std::vector<std::string> businessDaysEnding(const std::string& end_date, int n) {
    std::vector<std::string> dates;
    std::time_t cursor = parseDate(end_date);
    if (cursor < 0 || n <= 0) {
        return dates;
    }

    dates.reserve(static_cast<size_t>(n));
    while (static_cast<int>(dates.size()) < n) {
        const std::tm tm_utc = toUtc(cursor);
        if (tm_utc.tm_wday != 0 && tm_utc.tm_wday != 6) {
            dates.push_back(formatDate(cursor));
        }
        cursor -= kSecondsPerDay;
    }
    std::reverse(dates.begin(), dates.end());
    return dates;
}

} // namespace utils
} // namespace revscan
