#include "data/MarketDataService.h"
#include "data/SyntheticMarketData.h"
#include "common/Logger.h"
#include <algorithm>

namespace revscan {
namespace data {

MarketDataService::MarketDataService(std::shared_ptr<network::IHttpClient> http,
                                     SourceConfig config,
                                     std::shared_ptr<NetworkProbe> probe)
    : config_(config)
    , probe_(probe ? std::move(probe) : std::make_shared<NetworkProbe>(http, config))
    , primary_(http, config)
    , secondary_(http, config)
    , secondary_pool_(static_cast<size_t>(std::max(1, config.secondary_workers)))
{
}

std::vector<PriceBar> MarketDataService::normalize(std::vector<PriceBar> bars) {
    std::stable_sort(bars.begin(), bars.end(),
                     [](const PriceBar& a, const PriceBar& b) { return a.date < b.date; });
    auto last = std::unique(bars.begin(), bars.end(),
                            [](const PriceBar& a, const PriceBar& b) { return a.date == b.date; });
    bars.erase(last, bars.end());
    return bars;
}

FundamentalSnapshot MarketDataService::fetchFundamentals(const std::string& symbol) {
    if (!probe_->isAvailable()) {
        LOG_INFO("[{}] Network unavailable, synthetic fundamentals", symbol);
        return SyntheticMarketData::fundamentals(symbol);
    }

    auto snapshot = primary_.fetchFundamentals(symbol);
    if (snapshot) {
        return *snapshot;
    }
    LOG_WARN("[{}] Primary source exhausted, synthetic fundamentals", symbol);
    return SyntheticMarketData::fundamentals(symbol);
}

std::vector<PriceBar> MarketDataService::fetchPriceHistory(const std::string& symbol, int months) {
    if (!probe_->isAvailable()) {
        LOG_INFO("[{}] Network unavailable, synthetic price history", symbol);
        return SyntheticMarketData::priceHistory(symbol, months);
    }

    auto primary = primary_.fetchPriceHistory(symbol);
    const size_t primary_count = primary ? primary->size() : 0;
    if (primary && primary_count >= config_.primary_min_bars) {
        LOG_INFO("[{}] Using primary history: {} bars", symbol, primary_count);
        return normalize(std::move(*primary));
    }

    LOG_INFO("[{}] Primary history insufficient ({} bars < {}), trying secondary source",
             symbol, primary_count, config_.primary_min_bars);

    std::vector<PriceBar> bars;
    try {
        auto pending = secondary_pool_.submit([this, symbol, months]() {
            return secondary_.fetchPriceHistory(symbol, months);
        });
        bars = pending.get();
    } catch (const std::exception& e) {
        LOG_WARN("[{}] Secondary source dispatch failed: {}", symbol, e.what());
        bars.clear();
    }

    if (!bars.empty()) {
        bars = normalize(std::move(bars));
        LOG_INFO("[{}] Secondary history: {} bars, last close {:.2f}",
                 symbol, bars.size(), bars.back().close);
        return bars;
    }

    LOG_WARN("[{}] Both live sources failed, synthetic price history", symbol);
    return SyntheticMarketData::priceHistory(symbol, months);
}

} // namespace data
} // namespace revscan
