#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace revscan {
namespace core {

// Two-call acquisition contract shared by the live fallback chain, the
// synthetic generator and test doubles. Ordinary network failure must never
// escape: implementations degrade to substitute data instead.
class IMarketDataSource {
public:
    virtual ~IMarketDataSource() = default;

    virtual FundamentalSnapshot fetchFundamentals(const std::string& symbol) = 0;

    // Oldest first, strictly increasing dates
    virtual std::vector<PriceBar> fetchPriceHistory(const std::string& symbol, int months) = 0;
};

} // namespace core
} // namespace revscan
