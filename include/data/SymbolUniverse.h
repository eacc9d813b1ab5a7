#pragma once

#include <string>
#include <vector>

namespace revscan {
namespace data {

// symbols.txt: one ticker per line, '#' comments and blank lines ignored
class SymbolUniverse {
public:
    // Upper-cased, first occurrence order, duplicates dropped.
    // Throws std::runtime_error when the file cannot be opened.
    static std::vector<std::string> readFile(const std::string& path);

    static std::vector<std::string> parse(const std::string& content);
};

} // namespace data
} // namespace revscan
