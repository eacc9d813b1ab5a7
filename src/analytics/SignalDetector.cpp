#include "analytics/SignalDetector.h"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <limits>

namespace revscan {
namespace analytics {

namespace {
nlohmann::json optionalToJson(const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<double> optionalFromJson(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_number()) {
        return std::nullopt;
    }
    return j[key].get<double>();
}

// Two-decimal value without padding zeros beyond the first: 25.0, 24.5, 24.94
std::string formatReading(double value) {
    std::string text = fmt::format("{:.2f}", value);
    while (text.size() > 1 && text.back() == '0' && text[text.size() - 2] != '.') {
        text.pop_back();
    }
    return text;
}

// Minimum of the defined entries in [begin, end)
std::optional<double> minDefined(const Series& series, size_t begin, size_t end) {
    std::optional<double> result;
    for (size_t i = begin; i < end && i < series.size(); ++i) {
        if (series[i] && (!result || *series[i] < *result)) {
            result = series[i];
        }
    }
    return result;
}
}

nlohmann::json SignalSet::toJson() const {
    nlohmann::json j;
    j["rsi_oversold"] = rsi_oversold;
    j["macd_crossover"] = macd_crossover;
    j["sma20_cross"] = sma20_cross;
    j["rsi_rising_3d"] = rsi_rising_3d;
    j["rsi_divergence"] = rsi_divergence;
    j["macd_divergence"] = macd_divergence;
    j["latest_rsi"] = optionalToJson(latest_rsi);
    j["latest_macd"] = optionalToJson(latest_macd);
    j["latest_signal"] = optionalToJson(latest_signal);
    j["latest_sma20"] = optionalToJson(latest_sma20);
    j["latest_close"] = optionalToJson(latest_close);
    return j;
}

SignalSet SignalSet::fromJson(const nlohmann::json& j) {
    SignalSet s;
    if (!j.is_object()) {
        return s;
    }
    s.rsi_oversold = j.value("rsi_oversold", false);
    s.macd_crossover = j.value("macd_crossover", false);
    s.sma20_cross = j.value("sma20_cross", false);
    s.rsi_rising_3d = j.value("rsi_rising_3d", false);
    s.rsi_divergence = j.value("rsi_divergence", false);
    s.macd_divergence = j.value("macd_divergence", false);
    s.latest_rsi = optionalFromJson(j, "latest_rsi");
    s.latest_macd = optionalFromJson(j, "latest_macd");
    s.latest_signal = optionalFromJson(j, "latest_signal");
    s.latest_sma20 = optionalFromJson(j, "latest_sma20");
    s.latest_close = optionalFromJson(j, "latest_close");
    return s;
}

SignalDetector::SignalDetector(int lookback)
    : lookback_(lookback < 1 ? 1 : lookback) {}

IndicatorSeries SignalDetector::computeIndicators(const std::vector<double>& closes) {
    IndicatorSeries series;
    series.rsi = TechnicalIndicators::rsi(closes, 14);
    series.macd = TechnicalIndicators::macd(closes, 12, 26, 9);
    series.sma20 = TechnicalIndicators::sma(closes, 20);
    return series;
}

SignalSet SignalDetector::detect(const std::vector<double>& closes, const IndicatorSeries& series) const {
    SignalSet signals;
    const size_t n = closes.size();
    if (n == 0) {
        return signals;
    }

    signals.latest_close = closes.back();
    signals.latest_rsi = TechnicalIndicators::latest(series.rsi, 2);
    signals.latest_macd = TechnicalIndicators::latest(series.macd.macd_line, 4);
    signals.latest_signal = TechnicalIndicators::latest(series.macd.signal_line, 4);
    signals.latest_sma20 = TechnicalIndicators::latest(series.sma20, 2);

    if (!signals.latest_rsi) {
        return signals;
    }

    const size_t lookback = static_cast<size_t>(lookback_);
    const size_t window_start = n > lookback ? n - lookback : 0;

    // 1. Oversold anywhere in the window
    auto window_min = minDefined(series.rsi, window_start, n);
    signals.rsi_oversold = window_min && *window_min < kOversoldThreshold;

    // 2a. MACD moves from at-or-below to above its signal line
    const auto& ml = series.macd.macd_line;
    const auto& sl = series.macd.signal_line;
    for (size_t i = std::max<size_t>(1, window_start); i < n; ++i) {
        if (ml[i] && sl[i] && ml[i - 1] && sl[i - 1] &&
            *ml[i - 1] <= *sl[i - 1] && *ml[i] > *sl[i]) {
            signals.macd_crossover = true;
            break;
        }
    }

    // 2b. Close moves from at-or-below to above SMA20
    const auto& sma = series.sma20;
    for (size_t i = std::max<size_t>(1, window_start); i < n; ++i) {
        if (sma[i] && sma[i - 1] &&
            closes[i - 1] <= *sma[i - 1] && closes[i] > *sma[i]) {
            signals.sma20_cross = true;
            break;
        }
    }

    // 2c. Last three RSI readings strictly increasing
    std::vector<double> tail;
    for (auto it = series.rsi.rbegin(); it != series.rsi.rend() && tail.size() < 3; ++it) {
        if (*it) {
            tail.push_back(**it);
        }
    }
    if (tail.size() == 3) {
        signals.rsi_rising_3d = tail[2] < tail[1] && tail[1] < tail[0];
    }

    // 2d/2e. Bullish divergences
    signals.rsi_divergence = bullishDivergence(closes, series.rsi);
    signals.macd_divergence = bullishDivergence(closes, series.macd.macd_line);

    return signals;
}

bool SignalDetector::bullishDivergence(const std::vector<double>& closes, const Series& indicator) const {
    const size_t n = closes.size();
    const size_t window = static_cast<size_t>(lookback_);
    if (n < window * 2 || indicator.size() != n) {
        return false;
    }

    const size_t recent_begin = n - window;
    const size_t prior_begin = n - window * 2;

    const double recent_low = *std::min_element(closes.begin() + recent_begin, closes.end());
    const double prior_low = *std::min_element(closes.begin() + prior_begin, closes.begin() + recent_begin);

    const auto recent_ind = minDefined(indicator, recent_begin, n);
    const auto prior_ind = minDefined(indicator, prior_begin, recent_begin);
    if (!recent_ind || !prior_ind) {
        return false;
    }

    return recent_low < prior_low && *recent_ind > *prior_ind;
}

ScoreResult SignalDetector::score(const SignalSet& signals) {
    ScoreResult result;
    if (!signals.rsi_oversold) {
        return result;
    }

    const bool confirmed = signals.macd_crossover || signals.sma20_cross || signals.rsi_rising_3d ||
                           signals.rsi_divergence || signals.macd_divergence;
    if (!confirmed) {
        return result;
    }

    double score = 0.0;
    std::vector<std::string> reasons;
    if (signals.latest_rsi) {
        reasons.push_back(fmt::format("RSI(14)={} (oversold)", formatReading(*signals.latest_rsi)));
    } else {
        reasons.push_back("RSI(14) oversold");
    }

    if (signals.macd_crossover) {
        score += kWeightMacdCrossover;
        reasons.push_back("bullish MACD crossover");
    }
    if (signals.sma20_cross) {
        score += kWeightSmaCross;
        reasons.push_back("close crossed above SMA20");
    }
    if (signals.rsi_rising_3d) {
        score += kWeightRsiRising;
        reasons.push_back("RSI rising 3 consecutive days");
    }
    if (signals.rsi_divergence) {
        score += kWeightRsiDivergence;
        reasons.push_back("bullish RSI divergence");
    }
    if (signals.macd_divergence) {
        score += kWeightMacdDivergence;
        reasons.push_back("bullish MACD divergence");
    }

    if (signals.latest_rsi) {
        const double bonus = std::min(kOversoldThreshold - *signals.latest_rsi, kMaxBonus);
        if (bonus > 0) {
            score += bonus;
        }
    }

    std::string reason;
    for (size_t i = 0; i < reasons.size(); ++i) {
        if (i > 0) reason += " + ";
        reason += reasons[i];
    }

    result.score = TechnicalIndicators::round(score, 2);
    result.recommended = true;
    result.reason = std::move(reason);
    return result;
}

} // namespace analytics
} // namespace revscan
