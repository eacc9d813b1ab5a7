#pragma once

#include "analytics/SignalDetector.h"
#include "common/Types.h"
#include "common/WorkerPool.h"
#include "core/contracts/IMarketDataSource.h"
#include "engine/ScanConfig.h"
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace revscan {
namespace engine {

struct SymbolOk {
    SymbolRef symbol;
    FundamentalSnapshot fundamentals;
    std::vector<PriceBar> bars;
    analytics::IndicatorSeries series;
    analytics::SignalSet signals;
    analytics::ScoreResult score;
};

// Too little history to compute indicators
struct SymbolIgnored {
    SymbolRef symbol;
    FundamentalSnapshot fundamentals;
    std::vector<PriceBar> bars;
    std::string reason;
};

struct SymbolError {
    SymbolRef symbol;
    std::string message;
};

using SymbolOutcome = std::variant<SymbolOk, SymbolIgnored, SymbolError>;

const SymbolRef& outcomeSymbol(const SymbolOutcome& outcome);

// fetch -> indicators -> detect -> score for one symbol. Never throws:
// faults come back as SymbolError.
class SymbolPipeline {
public:
    // fundamentals are fetched on `fetch_pool` while the price history is
    // fetched on the calling thread
    SymbolPipeline(std::shared_ptr<core::IMarketDataSource> source,
                   WorkerPool& fetch_pool,
                   ScanConfig config);

    SymbolOutcome run(const SymbolRef& symbol) const;

    static std::string insufficientDataMessage(size_t bars, int min_bars);

private:
    std::shared_ptr<core::IMarketDataSource> source_;
    WorkerPool& fetch_pool_;
    ScanConfig config_;
    analytics::SignalDetector detector_;
};

} // namespace engine
} // namespace revscan
