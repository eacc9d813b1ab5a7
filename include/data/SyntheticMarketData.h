#pragma once

#include "common/Types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace revscan {
namespace data {

// Offline stand-in for the live sources. Every result is a pure function of
// its arguments: the random walk is seeded from the symbol, so repeated calls
// are identical. NMDC and WIPRO carry a decline-then-bounce shape that the
// reversal detector picks up.
class SyntheticMarketData {
public:
    static FundamentalSnapshot fundamentals(const std::string& symbol);

    // max(months * 22, 60) weekday closes ending at end_date (YYYY-MM-DD)
    static std::vector<PriceBar> priceHistory(const std::string& symbol, int months,
                                              const std::string& end_date);

    // Same, ending today (UTC)
    static std::vector<PriceBar> priceHistory(const std::string& symbol, int months);

    // First 8 bytes of SHA-256("<symbol>:<salt>"), big-endian
    static uint64_t seedFor(const std::string& symbol, const std::string& salt);

    static bool hasReversalProfile(const std::string& symbol);
};

} // namespace data
} // namespace revscan
