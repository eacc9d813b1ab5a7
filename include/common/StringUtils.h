#pragma once

#include <string>

namespace revscan {
namespace utils {

// Strips spaces, tabs, CR and LF from both ends
std::string trim(const std::string& text);

std::string toLower(std::string text);
std::string toUpper(std::string text);

} // namespace utils
} // namespace revscan
