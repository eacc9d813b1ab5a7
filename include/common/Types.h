#pragma once

#include <string>
#include <vector>
#include <optional>

namespace revscan {

using SymbolId = long long;
using ScanId = long long;

// Plain value handed to the per-symbol pipeline (no store handle).
struct SymbolRef {
    SymbolId id = 0;
    std::string symbol;

    SymbolRef() = default;
    SymbolRef(SymbolId i, std::string s) : id(i), symbol(std::move(s)) {}
};

// One daily close. date is "YYYY-MM-DD" so string order == calendar order.
struct PriceBar {
    std::string date;
    double close;

    PriceBar() : close(0) {}
    PriceBar(std::string d, double c) : date(std::move(d)), close(c) {}
};

// Unknown fields stay empty, never zero.
struct FundamentalSnapshot {
    std::string symbol;
    std::optional<std::string> name;
    std::optional<double> cmp;
    std::optional<double> pe;
    std::optional<double> roce;
    std::optional<double> bv;
    std::optional<double> debt;
    std::optional<std::string> industry;
};

enum class ScanStatus { RUNNING, COMPLETED, FAILED };
enum class ScanLogStatus { SKIPPED, IGNORED, ERROR };

std::string toString(ScanStatus status);
ScanStatus scanStatusFromString(const std::string& value);
std::string toString(ScanLogStatus status);
ScanLogStatus scanLogStatusFromString(const std::string& value);

std::vector<double> extractCloses(const std::vector<PriceBar>& bars);

} // namespace revscan
