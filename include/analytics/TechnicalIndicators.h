#pragma once

#include <optional>
#include <utility>
#include <vector>

namespace revscan {
namespace analytics {

// Same length as the input closes; empty entries sit in the warm-up region.
using Series = std::vector<std::optional<double>>;

// Indicator library over oldest-first daily closes. Pure functions only.
class TechnicalIndicators {
public:
    // SMA: first value at index period-1, running-sum update
    static Series sma(const std::vector<double>& closes, int period);

    // EMA seeded with the SMA of the first `period` closes, k = 2/(period+1)
    static Series ema(const std::vector<double>& closes, int period);

    // RSI with Wilder smoothing. First value at index `period` since it is
    // built from day-over-day differences. Zero average loss reads 100.
    // 70 이상: 과매수, 30 이하: 과매도
    static Series rsi(const std::vector<double>& closes, int period = 14);

    struct MACDResult {
        Series macd_line;   // fast EMA - slow EMA
        Series signal_line; // EMA over the defined MACD values only
        Series histogram;   // MACD - Signal
    };
    static MACDResult macd(const std::vector<double>& closes,
                           int fast = 12, int slow = 26, int signal_period = 9);

    // Last defined value rounded to `decimals`, empty if none
    static std::optional<double> latest(const Series& series, int decimals);

    static std::optional<double> latestRSI(const std::vector<double>& closes, int period = 14);
    static std::optional<double> latestSMA(const std::vector<double>& closes, int period = 20);
    static std::pair<std::optional<double>, std::optional<double>> latestMACD(
        const std::vector<double>& closes);

    static double round(double value, int decimals);
};

} // namespace analytics
} // namespace revscan
