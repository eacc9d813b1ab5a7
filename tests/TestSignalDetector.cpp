#include "analytics/SignalDetector.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

using revscan::analytics::IndicatorSeries;
using revscan::analytics::Series;
using revscan::analytics::SignalDetector;
using revscan::analytics::SignalSet;

#define EXPECT(cond, msg)                                                        \
    do {                                                                         \
        if (!(cond)) {                                                           \
            std::cerr << "[TEST] " << msg << " (line " << __LINE__ << ")\n";     \
            return 1;                                                            \
        }                                                                        \
    } while (0)

namespace {
// 60 flat sessions, then 45 sessions of two -0.8 days and one +0.6 day,
// then +0.5 and -2.0. RSI bottoms near 25 inside the last five sessions and
// MACD crosses its signal line on the second-to-last session.
std::vector<double> oversoldWithMacdCross() {
    std::vector<double> closes(60, 100.0);
    for (int i = 0; i < 45; ++i) {
        const double step = (i % 3 == 2) ? 0.6 : -0.8;
        closes.push_back(std::round((closes.back() + step) * 100.0) / 100.0);
    }
    closes.push_back(std::round((closes.back() + 0.5) * 100.0) / 100.0);
    closes.push_back(std::round((closes.back() - 2.0) * 100.0) / 100.0);
    return closes;
}

// 60 flat sessions, a 21-session zig-zag slide (-1, -1, +0.5), then the two
// five-session windows the divergence check compares
std::vector<double> slideThen(const std::vector<double>& prior, const std::vector<double>& recent) {
    std::vector<double> closes(60, 100.0);
    auto step = [&closes](double delta) {
        closes.push_back(std::round((closes.back() + delta) * 100.0) / 100.0);
    };
    for (int i = 0; i < 21; ++i) step(i % 3 == 2 ? 0.5 : -1.0);
    for (double d : prior) step(d);
    for (double d : recent) step(d);
    return closes;
}

// Hand-built indicator pair over 40 sessions: prior window [30, 35), recent [35, 40)
IndicatorSeries windowSeries(double prior_rsi_low, double recent_rsi_low) {
    const size_t n = 40;
    IndicatorSeries series;
    series.rsi = Series(n);
    series.macd.macd_line = Series(n);
    series.macd.signal_line = Series(n);
    series.macd.histogram = Series(n);
    series.sma20 = Series(n);
    for (size_t i = 14; i < n; ++i) series.rsi[i] = 35.0;
    series.rsi[32] = prior_rsi_low;
    series.rsi[37] = recent_rsi_low;
    return series;
}

std::vector<double> lowerLowCloses() {
    std::vector<double> closes(40, 100.0);
    closes[32] = 90.0;
    closes[37] = 88.0;
    return closes;
}
}

int main() {
    std::cout << "[TEST] Starting SignalDetector Test..." << std::endl;
    SignalDetector detector(5);

    // Hand-built series: window minimum 25, MACD crosses at n-2
    {
        const size_t n = 40;
        const std::vector<double> closes(n, 100.0);
        IndicatorSeries series;
        series.rsi = Series(n);
        for (size_t i = 14; i < n - 5; ++i) series.rsi[i] = 40.0;
        const double tail[] = {28.0, 27.0, 26.0, 25.5, 25.0};
        for (size_t k = 0; k < 5; ++k) series.rsi[n - 5 + k] = tail[k];

        series.macd.macd_line = Series(n);
        series.macd.signal_line = Series(n);
        series.macd.histogram = Series(n);
        for (size_t i = 33; i < n; ++i) {
            series.macd.macd_line[i] = (i >= n - 2) ? -0.5 : -1.0;
            series.macd.signal_line[i] = -0.8;
        }
        series.sma20 = Series(n);

        const SignalSet signals = detector.detect(closes, series);
        EXPECT(signals.rsi_oversold, "oversold should fire");
        EXPECT(signals.macd_crossover, "macd crossover should fire");
        EXPECT(!signals.sma20_cross, "no sma series, no cross");
        EXPECT(!signals.rsi_rising_3d, "falling rsi tail");
        EXPECT(!signals.rsi_divergence && !signals.macd_divergence, "flat closes cannot diverge");

        const auto result = SignalDetector::score(signals);
        EXPECT(result.recommended, "should be recommended");
        EXPECT(std::fabs(result.score - 8.0) < 1e-9, "3 + bonus 5 = 8, got " << result.score);
        EXPECT(result.reason == "RSI(14)=25.0 (oversold) + bullish MACD crossover",
               "reason was '" << result.reason << "'");
    }

    // Engineered closes through the real indicator pipeline
    {
        const auto closes = oversoldWithMacdCross();
        const auto series = SignalDetector::computeIndicators(closes);
        const auto signals = detector.detect(closes, series);

        double window_min = 100.0;
        for (size_t i = closes.size() - 5; i < closes.size(); ++i) {
            if (series.rsi[i]) window_min = std::min(window_min, *series.rsi[i]);
        }
        EXPECT(window_min > 24.0 && window_min < 26.0, "window rsi minimum near 25, got " << window_min);
        EXPECT(signals.rsi_oversold, "oversold should fire on engineered closes");
        EXPECT(signals.macd_crossover, "macd crossover should fire on engineered closes");
        EXPECT(signals.latest_rsi.has_value(), "latest rsi present");

        const auto result = SignalDetector::score(signals);
        const double bonus = std::min(30.0 - *signals.latest_rsi, 5.0);
        EXPECT(result.recommended, "engineered closes should be recommended");
        EXPECT(result.score >= 3.0 + std::max(bonus, 0.0) - 1e-9, "score floor, got " << result.score);
        EXPECT(result.reason.rfind("RSI(14)=", 0) == 0, "reason starts with the oscillator value");
    }

    // Lower low in price, higher low in both oscillators
    {
        const auto closes = slideThen({-3, -3, -3, -3, -3}, {6, 1, 1, -1, -8});
        EXPECT(closes.size() == 91 && closes.back() == 73.5, "diverging closes, last " << closes.back());
        const auto series = SignalDetector::computeIndicators(closes);
        const auto signals = detector.detect(closes, series);
        EXPECT(signals.rsi_divergence, "rsi divergence should fire");
        EXPECT(signals.macd_divergence, "macd divergence should fire");
        EXPECT(signals.rsi_oversold && !signals.macd_crossover && !signals.sma20_cross && !signals.rsi_rising_3d,
               "only the divergences confirm");

        const auto result = SignalDetector::score(signals);
        EXPECT(std::fabs(result.score - 8.0) < 1e-9, "1 + 2 + bonus 5 = 8, got " << result.score);
        EXPECT(result.reason == "RSI(14)=24.93 (oversold) + bullish RSI divergence + bullish MACD divergence",
               "reason was '" << result.reason << "'");

        // Idempotent
        EXPECT(detector.detect(closes, SignalDetector::computeIndicators(closes)).toJson() == signals.toJson(),
               "second detection differs");
    }

    // Mirror cases: oscillators keep falling, or price holds above the prior low
    {
        const auto falling = slideThen({-3, -3, -3, -3, -3}, {-3, -3, -3, -3, -3});
        const auto s1 = detector.detect(falling, SignalDetector::computeIndicators(falling));
        EXPECT(!s1.rsi_divergence && !s1.macd_divergence, "lower oscillator lows are not divergence");

        const auto holding = slideThen({-3, -3, -3, -3, -3}, {6, 1, 1, -1, -1});
        const auto s2 = detector.detect(holding, SignalDetector::computeIndicators(holding));
        EXPECT(!s2.rsi_divergence && !s2.macd_divergence, "higher price low is not divergence");
    }

    // Hand-built window pair
    {
        const auto closes = lowerLowCloses();
        EXPECT(detector.detect(closes, windowSeries(20.0, 25.0)).rsi_divergence, "higher rsi low diverges");
        EXPECT(!detector.detect(closes, windowSeries(25.0, 20.0)).rsi_divergence, "lower rsi low does not");

        std::vector<double> higher_low = closes;
        higher_low[37] = 95.0;
        EXPECT(!detector.detect(higher_low, windowSeries(20.0, 25.0)).rsi_divergence, "price must make a lower low");
    }

    // Close reclaims SMA20 after a steady slide
    {
        std::vector<double> closes(60, 100.0);
        for (int i = 0; i < 30; ++i) {
            closes.push_back(std::round((closes.back() - 0.7) * 100.0) / 100.0);
        }
        closes.push_back(closes.back() + 12.0);
        const auto series = SignalDetector::computeIndicators(closes);
        const auto signals = detector.detect(closes, series);
        EXPECT(*series.sma20[closes.size() - 2] >= closes[closes.size() - 2], "below SMA20 the day before");
        EXPECT(signals.sma20_cross, "sma20 reclaim should fire");
        EXPECT(signals.rsi_oversold, "slide leaves the window oversold");
    }

    // Reading printed with at most two decimals, no padding
    {
        SignalSet signals;
        signals.rsi_oversold = true;
        signals.rsi_rising_3d = true;
        signals.latest_rsi = 24.5;
        EXPECT(SignalDetector::score(signals).reason == "RSI(14)=24.5 (oversold) + RSI rising 3 consecutive days",
               "one decimal kept");
        signals.latest_rsi = 7.0;
        EXPECT(SignalDetector::score(signals).reason.rfind("RSI(14)=7.0 ", 0) == 0, "whole value keeps .0");
    }

    // Not oversold: nothing scores
    {
        std::vector<double> rising;
        for (int i = 0; i < 80; ++i) rising.push_back(100.0 + i * 0.5);
        const auto series = SignalDetector::computeIndicators(rising);
        const auto signals = detector.detect(rising, series);
        EXPECT(!signals.rsi_oversold, "uptrend is not oversold");
        const auto result = SignalDetector::score(signals);
        EXPECT(!result.recommended && result.score == 0.0 && result.reason.empty(), "no recommendation");
    }

    // Oversold without confirmation is not recommended
    {
        SignalSet signals;
        signals.rsi_oversold = true;
        signals.latest_rsi = 20.0;
        const auto result = SignalDetector::score(signals);
        EXPECT(!result.recommended && result.score == 0.0, "confirmation required");

        signals.sma20_cross = true;
        signals.rsi_rising_3d = true;
        signals.macd_divergence = true;
        const auto confirmed = SignalDetector::score(signals);
        EXPECT(confirmed.recommended, "confirmed should recommend");
        EXPECT(std::fabs(confirmed.score - (2.0 + 1.0 + 2.0 + 5.0)) < 1e-9, "weights + capped bonus");
        EXPECT(confirmed.reason ==
                   "RSI(14)=20.0 (oversold) + close crossed above SMA20 + RSI rising 3 consecutive days"
                   " + bullish MACD divergence",
               "reason order, got '" << confirmed.reason << "'");
    }

    // Bonus only when positive
    {
        SignalSet signals;
        signals.rsi_oversold = true;
        signals.macd_crossover = true;
        signals.latest_rsi = 31.0;
        EXPECT(std::fabs(SignalDetector::score(signals).score - 3.0) < 1e-9, "negative bonus ignored");
    }

    // Persisted form keeps flags and latest readings
    {
        SignalSet signals;
        signals.rsi_oversold = true;
        signals.rsi_divergence = true;
        signals.latest_rsi = 22.5;
        const auto j = signals.toJson();
        EXPECT(j["rsi_oversold"] == true && j["latest_macd"].is_null(), "json shape");
        const auto back = SignalSet::fromJson(j);
        EXPECT(back.rsi_divergence && back.latest_rsi && *back.latest_rsi == 22.5 && !back.latest_macd,
               "fromJson restores fields");
    }

    // Too-short history: no rsi yet
    {
        const std::vector<double> closes(10, 50.0);
        const auto signals = detector.detect(closes, SignalDetector::computeIndicators(closes));
        EXPECT(!signals.rsi_oversold && !signals.latest_rsi, "no rsi with 10 closes");
        EXPECT(signals.latest_close && *signals.latest_close == 50.0, "latest close still reported");
    }

    std::cout << "[TEST] SignalDetector PASSED" << std::endl;
    return 0;
}
