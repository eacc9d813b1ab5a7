#pragma once

#include <filesystem>
#include <cstdint>
#include <mutex>
#include <optional>

#include <nlohmann/json.hpp>

#include "core/contracts/IScanStore.h"

namespace revscan {
namespace core {

// Whole store in one JSON document. Every mutation reloads the file under
// "<file>.write.lock", is applied to a copy, written to "<file>.tmp" and
// renamed over the original; the in-memory copy only changes once the write
// succeeded. Reads pick up writes made by other instances. The scanner claim
// is a flock on "<file>.lock".
class ScanStoreJson : public IScanStore {
public:
    explicit ScanStoreJson(std::filesystem::path file_path);

    UpsertResult upsertSymbols(const std::vector<std::string>& symbols) override;
    std::vector<SymbolRow> listSymbols() const override;
    std::optional<SymbolRow> findSymbol(const std::string& symbol) const override;

    ScanRow createScan() override;
    std::optional<ScanRow> getScan(ScanId scan_id) const override;
    std::optional<ScanRow> latestScan() const override;
    std::vector<ScanRow> listScans() const override;
    std::vector<ScanRow> findScansByStatus(ScanStatus status) const override;

    std::optional<FundamentalRow> latestFundamental(SymbolId symbol_id) const override;
    std::optional<TechnicalRow> latestTechnical(SymbolId symbol_id) const override;

    std::optional<FundamentalRow> fundamentalFor(ScanId scan_id, SymbolId symbol_id) const override;
    std::optional<TechnicalRow> technicalFor(ScanId scan_id, SymbolId symbol_id) const override;
    std::optional<RecommendationRow> recommendationFor(ScanId scan_id, SymbolId symbol_id) const override;

    std::vector<FundamentalRow> fundamentalsForScan(ScanId scan_id) const override;
    std::vector<TechnicalRow> technicalsForScan(ScanId scan_id) const override;
    std::vector<RecommendationRow> recommendationsForScan(ScanId scan_id) const override;
    std::vector<ScanLogRow> logsForScan(ScanId scan_id) const override;

    void commitScan(ScanId scan_id, const ScanBatch& batch, const ScanFinalization& finalization) override;
    void finalizeScan(ScanId scan_id, const ScanFinalization& finalization) override;

    RowCounts deleteSymbolFromScan(ScanId scan_id, SymbolId symbol_id) override;
    RowCounts clearAll() override;

    std::unique_ptr<ScannerLock> tryLockScanner() override;

    const std::filesystem::path& path() const { return file_path_; }

private:
    template<typename Mutation>
    auto mutate(Mutation&& mutation);

    void persist(const nlohmann::json& document) const;

    // Reloads the document when the file changed since it was last seen
    void refreshLocked() const;
    void rememberFileStamp() const;
    std::filesystem::path sidePath(const char* suffix) const;

    static nlohmann::json readDocument(const std::filesystem::path& file_path);

    static nlohmann::json emptyDocument();
    static long long nextId(nlohmann::json& document, const char* table);

    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    mutable nlohmann::json document_;
    mutable std::optional<std::filesystem::file_time_type> file_stamp_;
    mutable std::uintmax_t file_size_ = 0;
};

} // namespace core
} // namespace revscan
