#pragma once

#include "core/contracts/IMarketDataSource.h"
#include "core/contracts/IScanStore.h"
#include "engine/ScanConfig.h"
#include "engine/SymbolPipeline.h"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace revscan {
namespace engine {

// Read-only view of one scan's live counters
struct ScanProgress {
    int total = 0;
    int to_process = 0;
    int skipped = 0;
    int completed = 0;
    std::optional<std::string> current_symbol;
    int errors = 0;
    bool finished = false;

    nlohmann::json toJson() const;
};

struct ClearResult {
    core::RowCounts deleted;
    std::optional<core::UpsertResult> reloaded;  // empty when the symbols file is missing
};

// Runs scans against a store. At most one scan is active per store, across
// engines and processes: the engine holds the store's scanner lock while a
// scan runs, and a second start is rejected, not queued.
class ScanEngine {
public:
    static constexpr const char* kSkipMessage = "Already pulled today";
    static constexpr const char* kSkipDefaultReason = "Skipped (already pulled today)";
    static constexpr const char* kInterruptedMessage = "interrupted (process exited while running)";

    ScanEngine(std::shared_ptr<core::IScanStore> store,
               std::shared_ptr<core::IMarketDataSource> source,
               ScanConfig config);
    ~ScanEngine();

    ScanEngine(const ScanEngine&) = delete;
    ScanEngine& operator=(const ScanEngine&) = delete;

    // Creates the scan row and runs it on a background thread.
    // Empty when a scan is already running (nothing is written).
    std::optional<ScanId> startScan();

    // Same, but runs on the calling thread. Store write failures propagate.
    std::optional<ScanId> runScan();

    // Blocks until the background scan (if any) has returned
    void waitForBackgroundScan();

    bool isRunning() const;
    std::optional<ScanId> activeScanId() const;

    // Live counters; kept `progress_grace_seconds` after the scan finishes
    std::optional<ScanProgress> progress(ScanId scan_id) const;

    // Marks scans left `running` by an earlier process as failed. Does nothing
    // while another holder of the scanner lock may still be writing them.
    int reconcileOrphanedScans();

    core::UpsertResult reloadSymbols(const std::string& symbols_file);

    // Removes one symbol's rows from one scan. Throws core::NotFoundError
    // for an unknown scan or symbol.
    core::RowCounts deleteSymbolFromScan(ScanId scan_id, const std::string& symbol);

    // Wipes every table, then reloads the symbols file when present.
    // Throws std::runtime_error while a scan is running here or elsewhere.
    ClearResult clearAll(const std::string& symbols_file);

    const ScanConfig& config() const { return config_; }

private:
    class RunningGuard {
    public:
        explicit RunningGuard(ScanEngine* engine) : engine_(engine) {}
        RunningGuard(RunningGuard&& other) noexcept : engine_(other.engine_) { other.engine_ = nullptr; }
        RunningGuard(const RunningGuard&) = delete;
        RunningGuard& operator=(const RunningGuard&) = delete;
        RunningGuard& operator=(RunningGuard&&) = delete;
        ~RunningGuard() {
            if (engine_) engine_->releaseRunning();
        }

    private:
        ScanEngine* engine_;
    };

    struct ProgressState {
        int total = 0;
        int to_process = 0;
        int skipped = 0;
        std::atomic<int> completed{0};
        std::atomic<int> errors{0};
        mutable std::mutex current_mutex;
        std::optional<std::string> current_symbol;
        std::optional<std::chrono::steady_clock::time_point> finished_at;
    };

    bool tryAcquireRunning();
    void releaseRunning();
    void setActiveScan(ScanId scan_id);
    void holdScannerLock(std::unique_ptr<core::ScannerLock> lock);
    bool holdsScannerLock() const;

    // Pre-acquired running slot -> created scan row (slot released on failure)
    std::optional<ScanId> beginScan();

    void executeScan(ScanId scan_id);
    void performScan(ScanId scan_id);

    std::shared_ptr<ProgressState> publishProgress(ScanId scan_id, int total, int to_process, int skipped);
    void markProgressFinished(ScanId scan_id);
    void pruneProgressLocked() const;

    std::shared_ptr<core::IScanStore> store_;
    std::shared_ptr<core::IMarketDataSource> source_;
    ScanConfig config_;

    mutable std::mutex state_mutex_;
    bool running_ = false;
    std::optional<ScanId> active_scan_;
    std::unique_ptr<core::ScannerLock> scanner_lock_;

    mutable std::mutex progress_mutex_;
    mutable std::map<ScanId, std::shared_ptr<ProgressState>> progress_;

    std::mutex thread_mutex_;
    std::thread background_;
};

} // namespace engine
} // namespace revscan
