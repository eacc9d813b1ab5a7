#include "data/SymbolUniverse.h"
#include "common/StringUtils.h"
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace revscan {
namespace data {

std::vector<std::string> SymbolUniverse::parse(const std::string& content) {
    std::vector<std::string> symbols;
    std::set<std::string> seen;

    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        const std::string ticker = utils::toUpper(utils::trim(line));
        if (ticker.empty() || ticker[0] == '#') {
            continue;
        }
        if (seen.insert(ticker).second) {
            symbols.push_back(ticker);
        }
    }
    return symbols;
}

std::vector<std::string> SymbolUniverse::readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open symbols file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

} // namespace data
} // namespace revscan
