#include "data/YahooChartSource.h"
#include "common/DateUtils.h"
#include "common/Logger.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <stdexcept>

namespace revscan {
namespace data {

YahooChartSource::YahooChartSource(std::shared_ptr<network::IHttpClient> http, SourceConfig config)
    : http_(std::move(http))
    , config_(std::move(config))
{
    if (!http_) {
        throw std::invalid_argument("YahooChartSource requires an HTTP client");
    }
}

std::string YahooChartSource::chartUrl(const std::string& ticker, std::time_t period1, std::time_t period2) const {
    return config_.secondary_base_url + "/v8/finance/chart/" + network::encodeUrlComponent(ticker) +
           "?period1=" + std::to_string(static_cast<long long>(period1)) +
           "&period2=" + std::to_string(static_cast<long long>(period2)) +
           "&interval=1d";
}

std::vector<PriceBar> YahooChartSource::parseChart(const std::string& body) {
    std::vector<PriceBar> bars;
    const auto j = nlohmann::json::parse(body);

    const auto& result = j.at("chart").at("result");
    if (!result.is_array() || result.empty()) {
        return bars;
    }
    const auto& series = result[0];
    if (!series.contains("timestamp") || !series["timestamp"].is_array()) {
        return bars;
    }
    const auto& timestamps = series["timestamp"];
    const auto& closes = series.at("indicators").at("quote").at(0).at("close");

    const size_t count = std::min(timestamps.size(), closes.size());
    for (size_t i = 0; i < count; ++i) {
        if (!closes[i].is_number() || !timestamps[i].is_number()) {
            continue;
        }
        const auto ts = static_cast<std::time_t>(timestamps[i].get<long long>());
        bars.emplace_back(utils::formatDate(ts), closes[i].get<double>());
    }
    return bars;
}

std::vector<PriceBar> YahooChartSource::fetchPriceHistory(const std::string& symbol, int months) {
    const std::time_t period2 = std::time(nullptr);
    const std::time_t period1 = period2 - static_cast<std::time_t>(months) * 30 * 86400;

    for (const auto& suffix : config_.secondary_suffixes) {
        const std::string ticker = symbol + suffix;
        const std::string url = chartUrl(ticker, period1, period2);
        LOG_DEBUG("[{}] secondary: trying {} ({} -> {})", symbol, ticker,
                  utils::formatDate(period1), utils::formatDate(period2));
        try {
            auto response = http_->get(url, config_.request_timeout_seconds, network::defaultBrowserHeaders());
            if (!response.isOk()) {
                LOG_DEBUG("[{}] secondary '{}' -> HTTP {}", symbol, ticker, response.status_code);
                continue;
            }

            auto bars = parseChart(response.body);
            if (bars.size() >= config_.secondary_min_rows) {
                LOG_INFO("[{}] Secondary source: {} bars for '{}'", symbol, bars.size(), ticker);
                return bars;
            }
            LOG_DEBUG("[{}] secondary '{}' -> only {} rows (need >= {})",
                      symbol, ticker, bars.size(), config_.secondary_min_rows);
        } catch (const std::exception& e) {
            LOG_WARN("[{}] secondary '{}' failed: {}", symbol, ticker, e.what());
        }
    }

    LOG_ERROR("[{}] Secondary source failed for every suffix", symbol);
    return {};
}

} // namespace data
} // namespace revscan
