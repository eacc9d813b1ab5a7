#include "engine/ScanEngine.h"
#include "common/StringUtils.h"
#include "analytics/TechnicalIndicators.h"
#include "common/DateUtils.h"
#include "common/Logger.h"
#include "common/WorkerPool.h"
#include "data/SymbolUniverse.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <future>
#include <stdexcept>

namespace revscan {
namespace engine {

namespace {
using analytics::TechnicalIndicators;

nlohmann::json priceSeriesJson(const std::vector<PriceBar>& bars) {
    nlohmann::json series = nlohmann::json::array();
    for (const auto& bar : bars) {
        series.push_back({{"date", bar.date}, {"close", bar.close}});
    }
    return series;
}

// Sparse projections: only dates where the indicator is defined
nlohmann::json rsiSeriesJson(const std::vector<PriceBar>& bars, const analytics::Series& rsi) {
    nlohmann::json series = nlohmann::json::array();
    for (size_t i = 0; i < bars.size() && i < rsi.size(); ++i) {
        if (rsi[i]) {
            series.push_back({{"date", bars[i].date}, {"rsi", TechnicalIndicators::round(*rsi[i], 2)}});
        }
    }
    return series;
}

nlohmann::json macdSeriesJson(const std::vector<PriceBar>& bars, const TechnicalIndicators::MACDResult& macd) {
    nlohmann::json series = nlohmann::json::array();
    for (size_t i = 0; i < bars.size(); ++i) {
        nlohmann::json entry = {{"date", bars[i].date}};
        if (i < macd.macd_line.size() && macd.macd_line[i]) {
            entry["macd"] = TechnicalIndicators::round(*macd.macd_line[i], 4);
        }
        if (i < macd.signal_line.size() && macd.signal_line[i]) {
            entry["signal"] = TechnicalIndicators::round(*macd.signal_line[i], 4);
        }
        if (i < macd.histogram.size() && macd.histogram[i]) {
            entry["histogram"] = TechnicalIndicators::round(*macd.histogram[i], 4);
        }
        if (entry.size() > 1) {
            series.push_back(std::move(entry));
        }
    }
    return series;
}

core::FundamentalRow fundamentalRow(SymbolId symbol_id, const FundamentalSnapshot& snapshot) {
    core::FundamentalRow row;
    row.symbol_id = symbol_id;
    row.name = snapshot.name;
    row.cmp = snapshot.cmp;
    row.pe = snapshot.pe;
    row.roce = snapshot.roce;
    row.bv = snapshot.bv;
    row.debt = snapshot.debt;
    row.industry = snapshot.industry;
    return row;
}

core::TechnicalRow technicalRow(const SymbolOk& ok) {
    core::TechnicalRow row;
    row.symbol_id = ok.symbol.id;
    row.rsi14 = ok.signals.latest_rsi;
    row.macd = ok.signals.latest_macd;
    row.macd_signal = ok.signals.latest_signal;
    row.sma20 = ok.signals.latest_sma20;
    row.close = ok.signals.latest_close;
    row.signals = ok.signals.toJson();
    row.price_series = priceSeriesJson(ok.bars);
    row.rsi_series = rsiSeriesJson(ok.bars, ok.series.rsi);
    row.macd_series = macdSeriesJson(ok.bars, ok.series.macd);
    return row;
}

core::RecommendationRow recommendationRow(SymbolId symbol_id, bool recommended, double score, std::string reason) {
    core::RecommendationRow row;
    row.symbol_id = symbol_id;
    row.recommended = recommended;
    row.score = score;
    row.reason = std::move(reason);
    return row;
}

core::ScanLogRow logRow(SymbolId symbol_id, ScanLogStatus status, std::string message) {
    core::ScanLogRow row;
    row.symbol_id = symbol_id;
    row.status = status;
    row.message = std::move(message);
    return row;
}

std::string joinErrors(const std::vector<std::string>& errors, int limit) {
    std::string joined;
    const size_t count = std::min(errors.size(), static_cast<size_t>(std::max(0, limit)));
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) joined += "; ";
        joined += errors[i];
    }
    return joined;
}
}

nlohmann::json ScanProgress::toJson() const {
    return {
        {"total", total},
        {"to_process", to_process},
        {"skipped", skipped},
        {"completed", completed},
        {"current_symbol", current_symbol ? nlohmann::json(*current_symbol) : nlohmann::json(nullptr)},
        {"errors", errors},
    };
}

ScanEngine::ScanEngine(std::shared_ptr<core::IScanStore> store,
                       std::shared_ptr<core::IMarketDataSource> source,
                       ScanConfig config)
    : store_(std::move(store))
    , source_(std::move(source))
    , config_(config)
{
    if (!store_ || !source_) {
        throw std::invalid_argument("ScanEngine requires a store and a market data source");
    }
}

ScanEngine::~ScanEngine() {
    waitForBackgroundScan();
}

bool ScanEngine::tryAcquireRunning() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (running_) {
        return false;
    }
    running_ = true;
    return true;
}

void ScanEngine::releaseRunning() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    running_ = false;
    active_scan_.reset();
    scanner_lock_.reset();
}

void ScanEngine::holdScannerLock(std::unique_ptr<core::ScannerLock> lock) {
    std::lock_guard<std::mutex> guard(state_mutex_);
    scanner_lock_ = std::move(lock);
}

bool ScanEngine::holdsScannerLock() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return scanner_lock_ != nullptr;
}

void ScanEngine::setActiveScan(ScanId scan_id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    active_scan_ = scan_id;
}

bool ScanEngine::isRunning() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return running_;
}

std::optional<ScanId> ScanEngine::activeScanId() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return active_scan_;
}

int ScanEngine::reconcileOrphanedScans() {
    // Running rows are orphans only when nobody else holds the scanner lock
    std::unique_ptr<core::ScannerLock> claim;
    if (!holdsScannerLock()) {
        claim = store_->tryLockScanner();
        if (!claim) {
            LOG_INFO("Scanner lock held elsewhere, running scans left untouched");
            return 0;
        }
    }

    const auto active = activeScanId();
    int reconciled = 0;
    for (const auto& scan : store_->findScansByStatus(ScanStatus::RUNNING)) {
        if (active && scan.id == *active) {
            continue;
        }
        store_->finalizeScan(scan.id, core::ScanFinalization{ScanStatus::FAILED, std::string(kInterruptedMessage)});
        LOG_WARN("Scan {} was left running by an earlier process, marked failed", scan.id);
        ++reconciled;
    }
    return reconciled;
}

std::optional<ScanId> ScanEngine::beginScan() {
    if (!tryAcquireRunning()) {
        LOG_WARN("Scan start rejected: a scan is already running");
        return std::nullopt;
    }

    try {
        auto scanner_lock = store_->tryLockScanner();
        if (!scanner_lock) {
            LOG_WARN("Scan start rejected: another process is scanning this store");
            releaseRunning();
            return std::nullopt;
        }
        holdScannerLock(std::move(scanner_lock));

        reconcileOrphanedScans();
        const core::ScanRow scan = store_->createScan();
        setActiveScan(scan.id);
        LOG_INFO("=== SCAN STARTED scan_id={} ===", scan.id);
        return scan.id;
    } catch (const std::exception& e) {
        LOG_ERROR("Scan could not be created: {}", e.what());
        releaseRunning();
        throw;
    }
}

std::optional<ScanId> ScanEngine::startScan() {
    const auto scan_id = beginScan();
    if (!scan_id) {
        return std::nullopt;
    }

    RunningGuard guard(this);
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (background_.joinable()) {
        background_.join();
    }
    background_ = std::thread([this, id = *scan_id, guard = std::move(guard)]() mutable {
        try {
            executeScan(id);
        } catch (const std::exception& e) {
            LOG_ERROR("Background scan {} aborted: {}", id, e.what());
        }
    });
    return scan_id;
}

std::optional<ScanId> ScanEngine::runScan() {
    const auto scan_id = beginScan();
    if (!scan_id) {
        return std::nullopt;
    }

    RunningGuard guard(this);
    executeScan(*scan_id);
    return scan_id;
}

void ScanEngine::waitForBackgroundScan() {
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (background_.joinable()) {
        background_.join();
    }
}

void ScanEngine::executeScan(ScanId scan_id) {
    try {
        performScan(scan_id);
    } catch (const std::exception& e) {
        LOG_ERROR("SCAN {} CRASHED: {}", scan_id, e.what());
        markProgressFinished(scan_id);
        try {
            store_->finalizeScan(scan_id, core::ScanFinalization{ScanStatus::FAILED, std::string(e.what())});
        } catch (const std::exception& inner) {
            LOG_ERROR("Scan {} could not be marked failed: {}", scan_id, inner.what());
        }
        throw;
    }
    LOG_INFO("=== SCAN FINISHED scan_id={} ===", scan_id);
}

void ScanEngine::performScan(ScanId scan_id) {
    const auto symbols = store_->listSymbols();
    LOG_INFO("Scan {}: {} symbols in store", scan_id, symbols.size());

    if (symbols.empty()) {
        LOG_WARN("Scan {}: no symbols to scan, reload the universe first", scan_id);
        publishProgress(scan_id, 0, 0, 0);
        store_->commitScan(scan_id, core::ScanBatch{}, core::ScanFinalization{ScanStatus::COMPLETED, std::nullopt});
        markProgressFinished(scan_id);
        return;
    }

    // Partition: symbols refreshed earlier today replay their last snapshot
    const std::string today = utils::todayUtc();
    core::ScanBatch batch;
    std::vector<SymbolRef> work;
    int skipped = 0;

    for (const auto& symbol : symbols) {
        const auto tech = store_->latestTechnical(symbol.id);
        const auto fund = store_->latestFundamental(symbol.id);
        const bool tech_today = tech && utils::isSameDay(tech->computed_at, today);
        const bool fund_today = fund && utils::isSameDay(fund->fetched_at, today);

        if (!tech_today && !fund_today) {
            work.emplace_back(symbol.id, symbol.symbol);
            continue;
        }

        std::optional<core::RecommendationRow> rec;
        if (tech) {
            rec = store_->recommendationFor(tech->scan_id, symbol.id);
        } else if (fund) {
            rec = store_->recommendationFor(fund->scan_id, symbol.id);
        }

        if (fund) {
            core::FundamentalRow copy = *fund;
            copy.id = 0;
            copy.fetched_at.clear();
            batch.fundamentals.push_back(std::move(copy));
        }
        if (tech) {
            core::TechnicalRow copy = *tech;
            copy.id = 0;
            copy.computed_at.clear();
            batch.technicals.push_back(std::move(copy));
        }
        if (rec) {
            core::RecommendationRow copy = *rec;
            copy.id = 0;
            copy.created_at.clear();
            batch.recommendations.push_back(std::move(copy));
        } else {
            batch.recommendations.push_back(recommendationRow(symbol.id, false, 0.0, kSkipDefaultReason));
        }
        batch.logs.push_back(logRow(symbol.id, ScanLogStatus::SKIPPED, kSkipMessage));

        Logger::getInstance().logScanResult(scan_id, symbol.symbol, "skipped", rec ? rec->score : 0.0);
        ++skipped;
    }

    LOG_INFO("Scan {}: {} symbols to process, {} skipped (already pulled today)",
             scan_id, work.size(), skipped);

    auto progress = publishProgress(scan_id, static_cast<int>(symbols.size()),
                                    static_cast<int>(work.size()), skipped);

    std::vector<SymbolOutcome> outcomes;
    outcomes.reserve(work.size());
    if (!work.empty()) {
        const size_t width = static_cast<size_t>(std::max(1, config_.concurrency_limit));
        LOG_INFO("Scan {}: processing with concurrency={}", scan_id, width);

        // Destroyed in reverse: the pipeline pool drains before the pipeline goes away
        WorkerPool fetch_pool(width);
        SymbolPipeline pipeline(source_, fetch_pool, config_);
        WorkerPool pipeline_pool(width);

        std::vector<std::future<SymbolOutcome>> pending;
        pending.reserve(work.size());
        for (const auto& ref : work) {
            pending.push_back(pipeline_pool.submit([&pipeline, progress, ref]() {
                {
                    std::lock_guard<std::mutex> lock(progress->current_mutex);
                    progress->current_symbol = ref.symbol;
                }
                SymbolOutcome outcome = pipeline.run(ref);
                progress->completed.fetch_add(1);
                if (std::holds_alternative<SymbolError>(outcome)) {
                    progress->errors.fetch_add(1);
                }
                return outcome;
            }));
        }
        for (auto& f : pending) {
            outcomes.push_back(f.get());
        }
    }

    std::vector<std::string> errors;
    for (const auto& outcome : outcomes) {
        if (const auto* ok = std::get_if<SymbolOk>(&outcome)) {
            batch.fundamentals.push_back(fundamentalRow(ok->symbol.id, ok->fundamentals));
            batch.technicals.push_back(technicalRow(*ok));
            batch.recommendations.push_back(
                recommendationRow(ok->symbol.id, ok->score.recommended, ok->score.score, ok->score.reason));
            Logger::getInstance().logScanResult(scan_id, ok->symbol.symbol,
                                                ok->score.recommended ? "recommended" : "ok", ok->score.score);

        } else if (const auto* ignored = std::get_if<SymbolIgnored>(&outcome)) {
            batch.fundamentals.push_back(fundamentalRow(ignored->symbol.id, ignored->fundamentals));
            core::TechnicalRow tech;
            tech.symbol_id = ignored->symbol.id;
            tech.price_series = priceSeriesJson(ignored->bars);
            batch.technicals.push_back(std::move(tech));
            batch.recommendations.push_back(recommendationRow(ignored->symbol.id, false, 0.0, "Insufficient data"));
            batch.logs.push_back(logRow(ignored->symbol.id, ScanLogStatus::IGNORED, ignored->reason));
            Logger::getInstance().logScanResult(scan_id, ignored->symbol.symbol, "ignored", 0.0);

        } else if (const auto* error = std::get_if<SymbolError>(&outcome)) {
            core::TechnicalRow tech;
            tech.symbol_id = error->symbol.id;
            batch.technicals.push_back(std::move(tech));
            batch.recommendations.push_back(recommendationRow(error->symbol.id, false, 0.0, ""));
            batch.logs.push_back(logRow(error->symbol.id, ScanLogStatus::ERROR, error->message));
            errors.push_back(error->symbol.symbol + ": " + error->message);
            Logger::getInstance().logScanResult(scan_id, error->symbol.symbol, "error", 0.0);
        }
    }

    core::ScanFinalization finalization;
    finalization.status = ScanStatus::COMPLETED;
    if (!errors.empty()) {
        finalization.error_message = joinErrors(errors, config_.error_summary_limit);
        LOG_WARN("Scan {} had {} errors: {}", scan_id, errors.size(), *finalization.error_message);
    }

    LOG_INFO("Scan {}: persisting {} recommendations", scan_id, batch.recommendations.size());
    store_->commitScan(scan_id, batch, finalization);

    progress->completed.store(progress->to_process);
    markProgressFinished(scan_id);
    LOG_INFO("Scan {} COMPLETED: {} processed, {} skipped, {} errors",
             scan_id, outcomes.size(), skipped, errors.size());
}

std::shared_ptr<ScanEngine::ProgressState> ScanEngine::publishProgress(
    ScanId scan_id, int total, int to_process, int skipped
) {
    auto state = std::make_shared<ProgressState>();
    state->total = total;
    state->to_process = to_process;
    state->skipped = skipped;

    std::lock_guard<std::mutex> lock(progress_mutex_);
    pruneProgressLocked();
    progress_[scan_id] = state;
    return state;
}

void ScanEngine::markProgressFinished(ScanId scan_id) {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    auto it = progress_.find(scan_id);
    if (it == progress_.end()) {
        return;
    }
    {
        std::lock_guard<std::mutex> current_lock(it->second->current_mutex);
        it->second->current_symbol.reset();
    }
    it->second->finished_at = std::chrono::steady_clock::now();
}

void ScanEngine::pruneProgressLocked() const {
    const auto now = std::chrono::steady_clock::now();
    const auto grace = std::chrono::seconds(std::max(0, config_.progress_grace_seconds));
    for (auto it = progress_.begin(); it != progress_.end();) {
        if (it->second->finished_at && now - *it->second->finished_at >= grace) {
            it = progress_.erase(it);
        } else {
            ++it;
        }
    }
}

std::optional<ScanProgress> ScanEngine::progress(ScanId scan_id) const {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    pruneProgressLocked();
    auto it = progress_.find(scan_id);
    if (it == progress_.end()) {
        return std::nullopt;
    }

    const ProgressState& state = *it->second;
    ScanProgress snapshot;
    snapshot.total = state.total;
    snapshot.to_process = state.to_process;
    snapshot.skipped = state.skipped;
    snapshot.completed = state.completed.load();
    snapshot.errors = state.errors.load();
    snapshot.finished = state.finished_at.has_value();
    {
        std::lock_guard<std::mutex> current_lock(state.current_mutex);
        snapshot.current_symbol = state.current_symbol;
    }
    return snapshot;
}

core::UpsertResult ScanEngine::reloadSymbols(const std::string& symbols_file) {
    const auto symbols = data::SymbolUniverse::readFile(symbols_file);
    LOG_INFO("Parsed {} symbols from {}", symbols.size(), symbols_file);
    const auto result = store_->upsertSymbols(symbols);
    LOG_INFO("Reload complete: {} added, {} total", result.added, result.total);
    return result;
}

core::RowCounts ScanEngine::deleteSymbolFromScan(ScanId scan_id, const std::string& symbol) {
    if (!store_->getScan(scan_id)) {
        throw core::NotFoundError("Scan not found");
    }
    const std::string ticker = utils::toUpper(symbol);
    const auto row = store_->findSymbol(ticker);
    if (!row) {
        throw core::NotFoundError("Symbol not found");
    }

    const auto deleted = store_->deleteSymbolFromScan(scan_id, row->id);
    LOG_INFO("Deleted {} from scan {}: {} fundamentals, {} technicals, {} recommendations, {} logs",
             ticker, scan_id, deleted.fundamentals, deleted.technicals,
             deleted.recommendations, deleted.logs);
    return deleted;
}

ClearResult ScanEngine::clearAll(const std::string& symbols_file) {
    if (!tryAcquireRunning()) {
        throw std::runtime_error("Cannot clear the store while a scan is running");
    }
    RunningGuard guard(this);
    const auto claim = store_->tryLockScanner();
    if (!claim) {
        throw std::runtime_error("Cannot clear the store while another process is scanning it");
    }

    ClearResult result;
    result.deleted = store_->clearAll();
    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        progress_.clear();
    }
    LOG_WARN("Store cleared: {} scans, {} symbols, {} recommendations removed",
             result.deleted.scans, result.deleted.symbols, result.deleted.recommendations);

    if (std::filesystem::exists(symbols_file)) {
        result.reloaded = reloadSymbols(symbols_file);
    } else {
        LOG_WARN("{} not found; symbols table left empty after clear", symbols_file);
    }
    return result;
}

} // namespace engine
} // namespace revscan
