#pragma once

#include "analytics/TechnicalIndicators.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace revscan {
namespace analytics {

// Which reversal conditions fired, plus the latest indicator readings
struct SignalSet {
    bool rsi_oversold = false;
    bool macd_crossover = false;
    bool sma20_cross = false;
    bool rsi_rising_3d = false;
    bool rsi_divergence = false;
    bool macd_divergence = false;

    std::optional<double> latest_rsi;
    std::optional<double> latest_macd;
    std::optional<double> latest_signal;
    std::optional<double> latest_sma20;
    std::optional<double> latest_close;

    nlohmann::json toJson() const;
    static SignalSet fromJson(const nlohmann::json& j);
};

struct ScoreResult {
    double score = 0.0;
    bool recommended = false;
    std::string reason;
};

// The three derived series, aligned 1:1 with the closes
struct IndicatorSeries {
    Series rsi;
    TechnicalIndicators::MACDResult macd;
    Series sma20;
};

class SignalDetector {
public:
    static constexpr double kOversoldThreshold = 30.0;
    static constexpr double kMaxBonus = 5.0;

    static constexpr double kWeightMacdCrossover = 3.0;
    static constexpr double kWeightSmaCross = 2.0;
    static constexpr double kWeightRsiRising = 1.0;
    static constexpr double kWeightRsiDivergence = 1.0;
    static constexpr double kWeightMacdDivergence = 2.0;

    explicit SignalDetector(int lookback = 5);

    // RSI(14), MACD(12,26,9), SMA(20)
    static IndicatorSeries computeIndicators(const std::vector<double>& closes);

    SignalSet detect(const std::vector<double>& closes, const IndicatorSeries& series) const;

    // Oversold plus at least one confirmation, otherwise score 0 and no reason
    static ScoreResult score(const SignalSet& signals);

    int lookback() const { return lookback_; }

private:
    // Lower low in price against a higher low in the indicator, comparing the
    // latest window with the one right before it
    bool bullishDivergence(const std::vector<double>& closes, const Series& indicator) const;

    int lookback_;
};

} // namespace analytics
} // namespace revscan
