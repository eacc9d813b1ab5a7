#pragma once

#include <string>
#include <filesystem>

namespace revscan {
namespace utils {

class PathUtils {
public:
    // Directory of the running executable (falls back to the cwd)
    static std::filesystem::path getExecutableDir();

    // Absolute paths pass through; relative ones resolve against getExecutableDir()
    static std::filesystem::path resolveRelativePath(const std::string& path);
};

} // namespace utils
} // namespace revscan
