#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace revscan {
namespace core {

using RowId = long long;

// Lookup of a scan or symbol that does not exist
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& what) : std::runtime_error(what) {}
};

struct SymbolRow {
    SymbolId id = 0;
    std::string symbol;
    std::string created_at;
};

struct ScanRow {
    ScanId id = 0;
    std::string started_at;
    std::optional<std::string> finished_at;
    ScanStatus status = ScanStatus::RUNNING;
    std::optional<std::string> error_message;
};

struct FundamentalRow {
    RowId id = 0;
    ScanId scan_id = 0;
    SymbolId symbol_id = 0;
    std::optional<std::string> name;
    std::optional<double> cmp;
    std::optional<double> pe;
    std::optional<double> roce;
    std::optional<double> bv;
    std::optional<double> debt;
    std::optional<std::string> industry;
    std::string fetched_at;   // assigned on commit when empty
};

// Persisted indicator snapshot: latest readings, the signal flags and the
// chart projections (price, rsi and macd series)
struct TechnicalRow {
    RowId id = 0;
    ScanId scan_id = 0;
    SymbolId symbol_id = 0;
    std::optional<double> rsi14;
    std::optional<double> macd;
    std::optional<double> macd_signal;
    std::optional<double> sma20;
    std::optional<double> close;
    nlohmann::json signals = nlohmann::json::object();
    nlohmann::json price_series = nlohmann::json::array();
    nlohmann::json rsi_series = nlohmann::json::array();
    nlohmann::json macd_series = nlohmann::json::array();
    std::string computed_at;  // assigned on commit when empty
};

struct RecommendationRow {
    RowId id = 0;
    ScanId scan_id = 0;
    SymbolId symbol_id = 0;
    bool recommended = false;
    double score = 0.0;
    std::string reason;
    std::string created_at;
};

struct ScanLogRow {
    RowId id = 0;
    ScanId scan_id = 0;
    std::optional<SymbolId> symbol_id;
    ScanLogStatus status = ScanLogStatus::ERROR;
    std::string message;
    std::string created_at;
};

// Everything one scan writes, applied in a single commit
struct ScanBatch {
    std::vector<FundamentalRow> fundamentals;
    std::vector<TechnicalRow> technicals;
    std::vector<RecommendationRow> recommendations;
    std::vector<ScanLogRow> logs;
};

struct ScanFinalization {
    ScanStatus status = ScanStatus::COMPLETED;
    std::optional<std::string> error_message;
};

struct UpsertResult {
    int added = 0;
    int total = 0;
};

struct RowCounts {
    int fundamentals = 0;
    int technicals = 0;
    int recommendations = 0;
    int logs = 0;
    int scans = 0;
    int symbols = 0;
};

// Claim on running a scan against a store, shared by every process that
// opens it. Released on destruction.
class ScannerLock {
public:
    virtual ~ScannerLock() = default;
};

// Storage the scan engine and reporter run against. Query-latest results are
// ordered by timestamp, then by row id.
class IScanStore {
public:
    virtual ~IScanStore() = default;

    virtual UpsertResult upsertSymbols(const std::vector<std::string>& symbols) = 0;
    virtual std::vector<SymbolRow> listSymbols() const = 0;
    virtual std::optional<SymbolRow> findSymbol(const std::string& symbol) const = 0;

    virtual ScanRow createScan() = 0;
    virtual std::optional<ScanRow> getScan(ScanId scan_id) const = 0;
    virtual std::optional<ScanRow> latestScan() const = 0;
    virtual std::vector<ScanRow> listScans() const = 0;
    virtual std::vector<ScanRow> findScansByStatus(ScanStatus status) const = 0;

    virtual std::optional<FundamentalRow> latestFundamental(SymbolId symbol_id) const = 0;
    virtual std::optional<TechnicalRow> latestTechnical(SymbolId symbol_id) const = 0;

    virtual std::optional<FundamentalRow> fundamentalFor(ScanId scan_id, SymbolId symbol_id) const = 0;
    virtual std::optional<TechnicalRow> technicalFor(ScanId scan_id, SymbolId symbol_id) const = 0;
    virtual std::optional<RecommendationRow> recommendationFor(ScanId scan_id, SymbolId symbol_id) const = 0;

    virtual std::vector<FundamentalRow> fundamentalsForScan(ScanId scan_id) const = 0;
    virtual std::vector<TechnicalRow> technicalsForScan(ScanId scan_id) const = 0;
    virtual std::vector<RecommendationRow> recommendationsForScan(ScanId scan_id) const = 0;
    virtual std::vector<ScanLogRow> logsForScan(ScanId scan_id) const = 0;

    // All rows plus the scan finalization in one write.
    // Throws std::runtime_error when the write fails.
    virtual void commitScan(ScanId scan_id, const ScanBatch& batch, const ScanFinalization& finalization) = 0;
    virtual void finalizeScan(ScanId scan_id, const ScanFinalization& finalization) = 0;

    virtual RowCounts deleteSymbolFromScan(ScanId scan_id, SymbolId symbol_id) = 0;
    virtual RowCounts clearAll() = 0;

    // nullptr when another holder already runs a scan on this store
    virtual std::unique_ptr<ScannerLock> tryLockScanner() = 0;
};

} // namespace core
} // namespace revscan
