#include "engine/SymbolPipeline.h"
#include "common/Logger.h"
#include <stdexcept>

namespace revscan {
namespace engine {

namespace {
double orZero(const std::optional<double>& value) {
    return value.value_or(0.0);
}
}

const SymbolRef& outcomeSymbol(const SymbolOutcome& outcome) {
    return std::visit([](const auto& o) -> const SymbolRef& { return o.symbol; }, outcome);
}

SymbolPipeline::SymbolPipeline(std::shared_ptr<core::IMarketDataSource> source,
                               WorkerPool& fetch_pool,
                               ScanConfig config)
    : source_(std::move(source))
    , fetch_pool_(fetch_pool)
    , config_(config)
    , detector_(config.lookback)
{
    if (!source_) {
        throw std::invalid_argument("SymbolPipeline requires a market data source");
    }
}

std::string SymbolPipeline::insufficientDataMessage(size_t bars, int min_bars) {
    return "Insufficient price data (" + std::to_string(bars) + " bars, need \xE2\x89\xA5" +
           std::to_string(min_bars) + ")";
}

SymbolOutcome SymbolPipeline::run(const SymbolRef& symbol) const {
    LOG_INFO("---- Processing {} (id={}) ----", symbol.symbol, symbol.id);

    try {
        auto pending_fundamentals = fetch_pool_.submit(
            [source = source_, ticker = symbol.symbol]() { return source->fetchFundamentals(ticker); });
        std::vector<PriceBar> bars = source_->fetchPriceHistory(symbol.symbol, config_.history_months);
        FundamentalSnapshot fundamentals = pending_fundamentals.get();

        LOG_INFO("[{}] Data fetched: name={} price_bars={}",
                 symbol.symbol, fundamentals.name.value_or("N/A"), bars.size());

        if (bars.size() < static_cast<size_t>(config_.min_bars)) {
            std::string reason = insufficientDataMessage(bars.size(), config_.min_bars);
            LOG_WARN("[{}] {}", symbol.symbol, reason);
            return SymbolIgnored{symbol, std::move(fundamentals), std::move(bars), std::move(reason)};
        }

        SymbolOk ok;
        ok.symbol = symbol;
        ok.fundamentals = std::move(fundamentals);
        ok.bars = std::move(bars);

        const std::vector<double> closes = extractCloses(ok.bars);
        ok.series = analytics::SignalDetector::computeIndicators(closes);
        ok.signals = detector_.detect(closes, ok.series);
        ok.score = analytics::SignalDetector::score(ok.signals);

        LOG_INFO("[{}] RSI={:.2f} MACD={:.4f} Signal={:.4f} SMA20={:.2f} Close={:.2f}",
                 symbol.symbol, orZero(ok.signals.latest_rsi), orZero(ok.signals.latest_macd),
                 orZero(ok.signals.latest_signal), orZero(ok.signals.latest_sma20),
                 orZero(ok.signals.latest_close));
        LOG_DEBUG("[{}] oversold={} macd_cross={} sma20_cross={} rsi_rising={} rsi_div={} macd_div={}",
                  symbol.symbol, ok.signals.rsi_oversold, ok.signals.macd_crossover,
                  ok.signals.sma20_cross, ok.signals.rsi_rising_3d,
                  ok.signals.rsi_divergence, ok.signals.macd_divergence);
        if (ok.score.recommended) {
            LOG_INFO("[{}] RECOMMENDED score={:.2f} reason='{}'", symbol.symbol, ok.score.score, ok.score.reason);
        } else {
            LOG_INFO("[{}] Not recommended", symbol.symbol);
        }
        return ok;

    } catch (const std::exception& e) {
        LOG_ERROR("[{}] Processing failed: {}", symbol.symbol, e.what());
        return SymbolError{symbol, e.what()};
    }
}

} // namespace engine
} // namespace revscan
