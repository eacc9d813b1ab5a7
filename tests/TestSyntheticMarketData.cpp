#include "analytics/SignalDetector.h"
#include "common/DateUtils.h"
#include "data/SyntheticMarketData.h"

#include <iostream>
#include <string>

using revscan::PriceBar;
using revscan::analytics::SignalDetector;
using revscan::data::SyntheticMarketData;

#define EXPECT(cond, msg)                                                        \
    do {                                                                         \
        if (!(cond)) {                                                           \
            std::cerr << "[TEST] " << msg << " (line " << __LINE__ << ")\n";     \
            return 1;                                                            \
        }                                                                        \
    } while (0)

namespace {
int checkRecommended(const std::string& symbol) {
    const auto bars = SyntheticMarketData::priceHistory(symbol, 9, "2024-06-14");
    const auto closes = revscan::extractCloses(bars);
    SignalDetector detector(5);
    const auto series = SignalDetector::computeIndicators(closes);
    const auto signals = detector.detect(closes, series);
    const auto result = SignalDetector::score(signals);

    EXPECT(signals.rsi_oversold, symbol << " should be oversold");
    EXPECT(signals.rsi_rising_3d, symbol << " rsi should be rising into the bounce");
    EXPECT(result.recommended, symbol << " should be recommended");
    EXPECT(result.score >= 1.0, symbol << " score " << result.score);
    return 0;
}
}

int main() {
    std::cout << "[TEST] Starting SyntheticMarketData Test..." << std::endl;

    // Seeds are the first 8 bytes of SHA-256, big-endian
    EXPECT(SyntheticMarketData::seedFor("NMDC", "prices") == 1614438917127477595ULL, "NMDC seed");
    EXPECT(SyntheticMarketData::seedFor("TCS", "prices") == 14470640930926182533ULL, "TCS seed");

    // Deterministic for the same arguments
    {
        const auto a = SyntheticMarketData::priceHistory("TCS", 9, "2024-06-14");
        const auto b = SyntheticMarketData::priceHistory("TCS", 9, "2024-06-14");
        EXPECT(a.size() == 198, "9 months -> 198 bars, got " << a.size());
        EXPECT(a.size() == b.size(), "same length");
        for (size_t i = 0; i < a.size(); ++i) {
            EXPECT(a[i].date == b[i].date && a[i].close == b[i].close, "bar " << i << " differs");
        }
        EXPECT(a.back().date == "2024-06-14", "ends at the end date");
        EXPECT(a.front().close > 3500.0 && a.front().close < 3560.0, "starts at 92% of cmp");

        const auto infy = SyntheticMarketData::priceHistory("INFY", 9, "2024-06-14");
        EXPECT(infy.front().close != a.front().close || infy[10].close != a[10].close,
               "different symbols walk differently");
    }

    // Length floor and weekday calendar
    {
        const auto bars = SyntheticMarketData::priceHistory("ACME", 1, "2024-06-16");
        EXPECT(bars.size() == 60, "floor of 60 bars, got " << bars.size());
        EXPECT(bars.back().date == "2024-06-14", "weekend end date rolls back to Friday");
        for (size_t i = 1; i < bars.size(); ++i) {
            EXPECT(bars[i - 1].date < bars[i].date, "dates strictly ascending");
        }
        for (const auto& bar : bars) {
            EXPECT(bar.close > 0.0, "positive closes");
        }
    }

    // Fundamentals table and the default template
    {
        const auto tcs = SyntheticMarketData::fundamentals("TCS");
        EXPECT(tcs.name && *tcs.name == "Tata Consultancy Services", "known name");
        EXPECT(tcs.cmp && *tcs.cmp == 3852.40, "known cmp");
        EXPECT(tcs.industry && *tcs.industry == "IT Services", "known industry");

        const auto other = SyntheticMarketData::fundamentals("ACME");
        EXPECT(other.name && *other.name == "ACME (mock)", "mock name");
        EXPECT(other.cmp && other.pe && other.roce && other.bv && other.debt, "template fills every ratio");
    }

    // The two reversal profiles are picked up by the detector
    EXPECT(SyntheticMarketData::hasReversalProfile("nmdc"), "case-insensitive profile lookup");
    EXPECT(!SyntheticMarketData::hasReversalProfile("TCS"), "TCS has no reversal profile");
    if (checkRecommended("NMDC") != 0) return 1;
    if (checkRecommended("WIPRO") != 0) return 1;

    std::cout << "[TEST] SyntheticMarketData PASSED" << std::endl;
    return 0;
}
