#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <numeric>

namespace revscan {
namespace analytics {

Series TechnicalIndicators::sma(const std::vector<double>& closes, int period) {
    Series result(closes.size());
    if (period <= 0 || closes.size() < static_cast<size_t>(period)) {
        return result;
    }

    double window_sum = std::accumulate(closes.begin(), closes.begin() + period, 0.0);
    result[period - 1] = window_sum / period;

    for (size_t i = period; i < closes.size(); ++i) {
        window_sum += closes[i] - closes[i - period];
        result[i] = window_sum / period;
    }
    return result;
}

Series TechnicalIndicators::ema(const std::vector<double>& closes, int period) {
    Series result(closes.size());
    if (period <= 0 || closes.size() < static_cast<size_t>(period)) {
        return result;
    }

    const double k = 2.0 / (period + 1);
    double prev = std::accumulate(closes.begin(), closes.begin() + period, 0.0) / period;
    result[period - 1] = prev;

    for (size_t i = period; i < closes.size(); ++i) {
        prev = closes[i] * k + prev * (1.0 - k);
        result[i] = prev;
    }
    return result;
}

// RSI (Wilder's Smoothing)
Series TechnicalIndicators::rsi(const std::vector<double>& closes, int period) {
    Series result(closes.size());
    if (period <= 0 || closes.size() <= static_cast<size_t>(period)) {
        return result;
    }

    std::vector<double> gains;
    std::vector<double> losses;
    gains.reserve(closes.size() - 1);
    losses.reserve(closes.size() - 1);
    for (size_t i = 1; i < closes.size(); ++i) {
        const double diff = closes[i] - closes[i - 1];
        gains.push_back(diff > 0 ? diff : 0.0);
        losses.push_back(diff < 0 ? -diff : 0.0);
    }

    auto toRsi = [](double avg_gain, double avg_loss) {
        if (avg_loss == 0.0) {
            return 100.0;
        }
        const double rs = avg_gain / avg_loss;
        return 100.0 - 100.0 / (1.0 + rs);
    };

    double avg_gain = std::accumulate(gains.begin(), gains.begin() + period, 0.0) / period;
    double avg_loss = std::accumulate(losses.begin(), losses.begin() + period, 0.0) / period;
    result[period] = toRsi(avg_gain, avg_loss);

    for (size_t i = period; i < gains.size(); ++i) {
        avg_gain = (avg_gain * (period - 1) + gains[i]) / period;
        avg_loss = (avg_loss * (period - 1) + losses[i]) / period;
        result[i + 1] = toRsi(avg_gain, avg_loss);
    }
    return result;
}

TechnicalIndicators::MACDResult TechnicalIndicators::macd(
    const std::vector<double>& closes,
    int fast,
    int slow,
    int signal_period
) {
    const size_t n = closes.size();
    MACDResult result;
    result.macd_line.resize(n);
    result.signal_line.resize(n);
    result.histogram.resize(n);

    const Series fast_ema = ema(closes, fast);
    const Series slow_ema = ema(closes, slow);

    // Positions of the defined MACD values; the signal EMA walks only these
    std::vector<size_t> defined;
    for (size_t i = 0; i < n; ++i) {
        if (fast_ema[i] && slow_ema[i]) {
            result.macd_line[i] = *fast_ema[i] - *slow_ema[i];
            defined.push_back(i);
        }
    }

    if (signal_period > 0 && defined.size() >= static_cast<size_t>(signal_period)) {
        const double k = 2.0 / (signal_period + 1);
        double seed = 0.0;
        for (int j = 0; j < signal_period; ++j) {
            seed += *result.macd_line[defined[j]];
        }
        seed /= signal_period;
        result.signal_line[defined[signal_period - 1]] = seed;

        double prev = seed;
        for (size_t j = signal_period; j < defined.size(); ++j) {
            const size_t idx = defined[j];
            prev = *result.macd_line[idx] * k + prev * (1.0 - k);
            result.signal_line[idx] = prev;
        }
    }

    for (size_t i = 0; i < n; ++i) {
        if (result.macd_line[i] && result.signal_line[i]) {
            result.histogram[i] = *result.macd_line[i] - *result.signal_line[i];
        }
    }
    return result;
}

double TechnicalIndicators::round(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

std::optional<double> TechnicalIndicators::latest(const Series& series, int decimals) {
    for (auto it = series.rbegin(); it != series.rend(); ++it) {
        if (*it) {
            return round(**it, decimals);
        }
    }
    return std::nullopt;
}

std::optional<double> TechnicalIndicators::latestRSI(const std::vector<double>& closes, int period) {
    return latest(rsi(closes, period), 2);
}

std::optional<double> TechnicalIndicators::latestSMA(const std::vector<double>& closes, int period) {
    return latest(sma(closes, period), 2);
}

std::pair<std::optional<double>, std::optional<double>> TechnicalIndicators::latestMACD(
    const std::vector<double>& closes
) {
    const auto result = macd(closes);
    return {latest(result.macd_line, 4), latest(result.signal_line, 4)};
}

} // namespace analytics
} // namespace revscan
