#pragma once

#include <ctime>
#include <string>
#include <vector>

namespace revscan {
namespace utils {

// "YYYY-MM-DDTHH:MM:SSZ"
std::string nowIsoUtc();

// "YYYY-MM-DD"
std::string todayUtc();

std::string formatDate(std::time_t epoch_seconds);

// Seconds since epoch at 00:00 UTC, or -1 when the text is not YYYY-MM-DD.
std::time_t parseDate(const std::string& date);

// True when an ISO timestamp falls on the given UTC calendar day.
bool isSameDay(const std::string& iso_timestamp, const std::string& day);

// n Monday-Friday dates ending at (or before) end_date, oldest first.
std::vector<std::string> businessDaysEnding(const std::string& end_date, int n);

} // namespace utils
} // namespace revscan
