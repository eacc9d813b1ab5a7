#include "analytics/TechnicalIndicators.h"

#include <cmath>
#include <iostream>
#include <random>
#include <vector>

using revscan::analytics::Series;
using revscan::analytics::TechnicalIndicators;

#define EXPECT(cond, msg)                                                        \
    do {                                                                         \
        if (!(cond)) {                                                           \
            std::cerr << "[TEST] " << msg << " (line " << __LINE__ << ")\n";     \
            return 1;                                                            \
        }                                                                        \
    } while (0)

namespace {
bool near(const std::optional<double>& value, double expected, double tol = 1e-9) {
    return value && std::fabs(*value - expected) < tol;
}

// Seeded random walk with occasional flat stretches
std::vector<double> randomWalk(std::mt19937& rng, size_t n) {
    std::normal_distribution<double> step(0.0, 1.5);
    std::uniform_int_distribution<int> flat(0, 9);
    std::vector<double> closes{100.0};
    while (closes.size() < n) {
        const double next = flat(rng) == 0 ? closes.back() : closes.back() + step(rng);
        closes.push_back(next > 1.0 ? next : 1.0);
    }
    return closes;
}

size_t firstDefined(const Series& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i]) return i;
    }
    return s.size();
}
}

int main() {
    std::cout << "[TEST] Starting TechnicalIndicators Test..." << std::endl;

    // SMA / EMA warm-up and values
    {
        const std::vector<double> closes{1, 2, 3, 4, 5};
        const auto sma = TechnicalIndicators::sma(closes, 3);
        EXPECT(sma.size() == closes.size(), "sma length");
        EXPECT(!sma[0] && !sma[1], "sma warm-up should be empty");
        EXPECT(near(sma[2], 2.0) && near(sma[3], 3.0) && near(sma[4], 4.0), "sma values");

        const auto ema = TechnicalIndicators::ema(closes, 3);
        EXPECT(!ema[1], "ema warm-up should be empty");
        EXPECT(near(ema[2], 2.0), "ema seeded with sma");
        EXPECT(near(ema[3], 3.0) && near(ema[4], 4.0), "ema values with k=0.5");

        const auto too_short = TechnicalIndicators::sma(closes, 6);
        EXPECT(too_short.size() == closes.size() && firstDefined(too_short) == closes.size(),
               "sma with too few closes should be all empty");
    }

    // RSI: balanced moves give 50, then Wilder smoothing
    {
        std::vector<double> closes{10.0};
        for (int i = 0; i < 14; ++i) {
            closes.push_back(closes.back() + (i % 2 == 0 ? 1.0 : -1.0));
        }
        auto rsi = TechnicalIndicators::rsi(closes, 14);
        EXPECT(firstDefined(rsi) == 14, "rsi first value at index 14");
        EXPECT(near(rsi[14], 50.0), "balanced gains and losses read 50");

        closes.push_back(closes.back() + 1.0);
        rsi = TechnicalIndicators::rsi(closes, 14);
        const double avg_gain = (0.5 * 13 + 1.0) / 14;
        const double avg_loss = (0.5 * 13) / 14;
        const double expected = 100.0 - 100.0 / (1.0 + avg_gain / avg_loss);
        EXPECT(near(rsi[15], expected, 1e-9), "wilder smoothing step");

        std::vector<double> rising;
        for (int i = 0; i < 20; ++i) rising.push_back(100.0 + i);
        EXPECT(near(TechnicalIndicators::rsi(rising, 14).back(), 100.0), "no losses reads 100");

        const std::vector<double> short_closes(14, 100.0);
        EXPECT(firstDefined(TechnicalIndicators::rsi(short_closes, 14)) == short_closes.size(),
               "rsi needs period+1 closes");
    }

    // MACD alignment on a flat series
    {
        const std::vector<double> flat(40, 50.0);
        const auto macd = TechnicalIndicators::macd(flat);
        EXPECT(macd.macd_line.size() == 40 && macd.signal_line.size() == 40 && macd.histogram.size() == 40,
               "macd series lengths");
        EXPECT(firstDefined(macd.macd_line) == 25, "macd first defined at slow-1");
        EXPECT(firstDefined(macd.signal_line) == 33, "signal first defined after 9 macd values");
        EXPECT(firstDefined(macd.histogram) == 33, "histogram defined where both are");
        EXPECT(near(macd.macd_line.back(), 0.0) && near(macd.signal_line.back(), 0.0), "flat series macd is 0");
    }

    // Signal line tracks macd after a trend change
    {
        std::vector<double> closes;
        for (int i = 0; i < 60; ++i) closes.push_back(100.0 + i);
        const auto macd = TechnicalIndicators::macd(closes);
        EXPECT(macd.macd_line.back() && *macd.macd_line.back() > 0, "uptrend macd positive");
        EXPECT(macd.histogram.back() &&
               std::fabs(*macd.histogram.back() - (*macd.macd_line.back() - *macd.signal_line.back())) < 1e-12,
               "histogram is macd - signal");
    }

    // latest() rounding and empty handling
    {
        const Series s{std::nullopt, 1.23456, std::nullopt};
        EXPECT(near(TechnicalIndicators::latest(s, 2), 1.23, 1e-12), "latest skips trailing gaps and rounds");
        EXPECT(!TechnicalIndicators::latest(Series(3), 2), "latest of empty series");
        EXPECT(near(TechnicalIndicators::latestSMA({1, 2, 3}, 3), 2.0), "latestSMA");
        EXPECT(std::fabs(TechnicalIndicators::round(2.34567, 4) - 2.3457) < 1e-12, "round to 4");
    }

    // Properties over seeded random walks
    {
        std::mt19937 rng(20240614);
        for (int walk = 0; walk < 25; ++walk) {
            const auto closes = randomWalk(rng, 60 + walk * 11);

            // SMA equals the plain mean of each trailing window
            for (int period : {1, 5, 20}) {
                const auto sma = TechnicalIndicators::sma(closes, period);
                for (size_t i = 0; i < closes.size(); ++i) {
                    if (i + 1 < static_cast<size_t>(period)) {
                        EXPECT(!sma[i], "sma warm-up at " << i);
                        continue;
                    }
                    double sum = 0.0;
                    for (size_t k = i + 1 - period; k <= i; ++k) sum += closes[k];
                    EXPECT(near(sma[i], sum / period, 1e-8), "sma(" << period << ") at " << i << " walk " << walk);
                }
            }

            // RSI stays in [0, 100]
            const auto rsi = TechnicalIndicators::rsi(closes, 14);
            for (size_t i = 0; i < rsi.size(); ++i) {
                if (rsi[i]) {
                    EXPECT(*rsi[i] >= 0.0 && *rsi[i] <= 100.0, "rsi out of range: " << *rsi[i]);
                }
            }

            // Same input, bit-identical output
            EXPECT(TechnicalIndicators::rsi(closes, 14) == rsi, "rsi not repeatable");
            EXPECT(TechnicalIndicators::sma(closes, 20) == TechnicalIndicators::sma(closes, 20), "sma not repeatable");
            const auto m1 = TechnicalIndicators::macd(closes);
            const auto m2 = TechnicalIndicators::macd(closes);
            EXPECT(m1.macd_line == m2.macd_line && m1.signal_line == m2.signal_line &&
                       m1.histogram == m2.histogram,
                   "macd not repeatable");
        }
    }

    std::cout << "[TEST] TechnicalIndicators PASSED" << std::endl;
    return 0;
}
