#include "core/state/ScanStoreJson.h"
#include "core/state/FileLock.h"
#include "common/DateUtils.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace revscan {
namespace core {

namespace {
const char* const kTables[] = {
    "symbols", "scans", "fundamentals", "technicals", "recommendations", "scan_logs"
};

template<typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

template<typename T>
std::optional<T> optionalFromJson(const nlohmann::json& row, const char* key) {
    auto it = row.find(key);
    if (it == row.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

std::string stampOrNow(const std::string& value) {
    return value.empty() ? utils::nowIsoUtc() : value;
}

// ---- symbols ----
nlohmann::json toJson(const SymbolRow& row) {
    return {{"id", row.id}, {"symbol", row.symbol}, {"created_at", row.created_at}};
}

SymbolRow symbolFromJson(const nlohmann::json& j) {
    SymbolRow row;
    row.id = j.value("id", 0LL);
    row.symbol = j.value("symbol", "");
    row.created_at = j.value("created_at", "");
    return row;
}

// ---- scans ----
nlohmann::json toJson(const ScanRow& row) {
    return {
        {"id", row.id},
        {"started_at", row.started_at},
        {"finished_at", optionalToJson(row.finished_at)},
        {"status", toString(row.status)},
        {"error_message", optionalToJson(row.error_message)},
    };
}

ScanRow scanFromJson(const nlohmann::json& j) {
    ScanRow row;
    row.id = j.value("id", 0LL);
    row.started_at = j.value("started_at", "");
    row.finished_at = optionalFromJson<std::string>(j, "finished_at");
    row.status = scanStatusFromString(j.value("status", "running"));
    row.error_message = optionalFromJson<std::string>(j, "error_message");
    return row;
}

// ---- fundamentals ----
nlohmann::json toJson(const FundamentalRow& row) {
    return {
        {"id", row.id},
        {"scan_id", row.scan_id},
        {"symbol_id", row.symbol_id},
        {"name", optionalToJson(row.name)},
        {"cmp", optionalToJson(row.cmp)},
        {"pe", optionalToJson(row.pe)},
        {"roce", optionalToJson(row.roce)},
        {"bv", optionalToJson(row.bv)},
        {"debt", optionalToJson(row.debt)},
        {"industry", optionalToJson(row.industry)},
        {"fetched_at", row.fetched_at},
    };
}

FundamentalRow fundamentalFromJson(const nlohmann::json& j) {
    FundamentalRow row;
    row.id = j.value("id", 0LL);
    row.scan_id = j.value("scan_id", 0LL);
    row.symbol_id = j.value("symbol_id", 0LL);
    row.name = optionalFromJson<std::string>(j, "name");
    row.cmp = optionalFromJson<double>(j, "cmp");
    row.pe = optionalFromJson<double>(j, "pe");
    row.roce = optionalFromJson<double>(j, "roce");
    row.bv = optionalFromJson<double>(j, "bv");
    row.debt = optionalFromJson<double>(j, "debt");
    row.industry = optionalFromJson<std::string>(j, "industry");
    row.fetched_at = j.value("fetched_at", "");
    return row;
}

// ---- technicals ----
nlohmann::json toJson(const TechnicalRow& row) {
    return {
        {"id", row.id},
        {"scan_id", row.scan_id},
        {"symbol_id", row.symbol_id},
        {"rsi14", optionalToJson(row.rsi14)},
        {"macd", optionalToJson(row.macd)},
        {"macd_signal", optionalToJson(row.macd_signal)},
        {"sma20", optionalToJson(row.sma20)},
        {"close", optionalToJson(row.close)},
        {"signals", row.signals},
        {"price_series", row.price_series},
        {"rsi_series", row.rsi_series},
        {"macd_series", row.macd_series},
        {"computed_at", row.computed_at},
    };
}

TechnicalRow technicalFromJson(const nlohmann::json& j) {
    TechnicalRow row;
    row.id = j.value("id", 0LL);
    row.scan_id = j.value("scan_id", 0LL);
    row.symbol_id = j.value("symbol_id", 0LL);
    row.rsi14 = optionalFromJson<double>(j, "rsi14");
    row.macd = optionalFromJson<double>(j, "macd");
    row.macd_signal = optionalFromJson<double>(j, "macd_signal");
    row.sma20 = optionalFromJson<double>(j, "sma20");
    row.close = optionalFromJson<double>(j, "close");
    row.signals = j.value("signals", nlohmann::json::object());
    row.price_series = j.value("price_series", nlohmann::json::array());
    row.rsi_series = j.value("rsi_series", nlohmann::json::array());
    row.macd_series = j.value("macd_series", nlohmann::json::array());
    row.computed_at = j.value("computed_at", "");
    return row;
}

// ---- recommendations ----
nlohmann::json toJson(const RecommendationRow& row) {
    return {
        {"id", row.id},
        {"scan_id", row.scan_id},
        {"symbol_id", row.symbol_id},
        {"recommended", row.recommended},
        {"score", row.score},
        {"reason", row.reason},
        {"created_at", row.created_at},
    };
}

RecommendationRow recommendationFromJson(const nlohmann::json& j) {
    RecommendationRow row;
    row.id = j.value("id", 0LL);
    row.scan_id = j.value("scan_id", 0LL);
    row.symbol_id = j.value("symbol_id", 0LL);
    row.recommended = j.value("recommended", false);
    row.score = j.value("score", 0.0);
    row.reason = j.value("reason", "");
    row.created_at = j.value("created_at", "");
    return row;
}

// ---- scan logs ----
nlohmann::json toJson(const ScanLogRow& row) {
    return {
        {"id", row.id},
        {"scan_id", row.scan_id},
        {"symbol_id", optionalToJson(row.symbol_id)},
        {"status", toString(row.status)},
        {"message", row.message},
        {"created_at", row.created_at},
    };
}

ScanLogRow scanLogFromJson(const nlohmann::json& j) {
    ScanLogRow row;
    row.id = j.value("id", 0LL);
    row.scan_id = j.value("scan_id", 0LL);
    row.symbol_id = optionalFromJson<SymbolId>(j, "symbol_id");
    row.status = scanLogStatusFromString(j.value("status", "error"));
    row.message = j.value("message", "");
    row.created_at = j.value("created_at", "");
    return row;
}

bool matches(const nlohmann::json& row, ScanId scan_id, SymbolId symbol_id) {
    return row.value("scan_id", 0LL) == scan_id && row.value("symbol_id", 0LL) == symbol_id;
}

// Most recent row of one symbol by (timestamp, id)
template<typename Row, typename Convert>
std::optional<Row> latestFor(const nlohmann::json& table, SymbolId symbol_id,
                             const char* stamp_key, Convert convert) {
    const nlohmann::json* best = nullptr;
    for (const auto& row : table) {
        if (row.value("symbol_id", 0LL) != symbol_id) {
            continue;
        }
        if (!best) {
            best = &row;
            continue;
        }
        const std::string stamp = row.value(stamp_key, "");
        const std::string best_stamp = best->value(stamp_key, "");
        if (stamp > best_stamp ||
            (stamp == best_stamp && row.value("id", 0LL) > best->value("id", 0LL))) {
            best = &row;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return convert(*best);
}

template<typename Row, typename Convert>
std::optional<Row> firstFor(const nlohmann::json& table, ScanId scan_id, SymbolId symbol_id, Convert convert) {
    for (const auto& row : table) {
        if (matches(row, scan_id, symbol_id)) {
            return convert(row);
        }
    }
    return std::nullopt;
}

template<typename Row, typename Convert>
std::vector<Row> allForScan(const nlohmann::json& table, ScanId scan_id, Convert convert) {
    std::vector<Row> rows;
    for (const auto& row : table) {
        if (row.value("scan_id", 0LL) == scan_id) {
            rows.push_back(convert(row));
        }
    }
    return rows;
}

template<typename Predicate>
int eraseRows(nlohmann::json& table, Predicate predicate) {
    nlohmann::json kept = nlohmann::json::array();
    int removed = 0;
    for (auto& row : table) {
        if (predicate(row)) {
            ++removed;
        } else {
            kept.push_back(std::move(row));
        }
    }
    table = std::move(kept);
    return removed;
}

nlohmann::json* findScanRow(nlohmann::json& document, ScanId scan_id) {
    for (auto& row : document["scans"]) {
        if (row.value("id", 0LL) == scan_id) {
            return &row;
        }
    }
    return nullptr;
}

class FileScannerLock : public ScannerLock {
public:
    explicit FileScannerLock(FileLock lock) : lock_(std::move(lock)) {}

private:
    FileLock lock_;
};

void applyFinalization(nlohmann::json& scan, const ScanFinalization& finalization) {
    scan["finished_at"] = utils::nowIsoUtc();
    scan["status"] = toString(finalization.status);
    scan["error_message"] = optionalToJson(finalization.error_message);
}
}

ScanStoreJson::ScanStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path))
    , document_(readDocument(file_path_))
{
    rememberFileStamp();
    LOG_INFO("Store loaded from {} ({} symbols, {} scans)", file_path_.string(),
             document_["symbols"].size(), document_["scans"].size());
}

nlohmann::json ScanStoreJson::readDocument(const std::filesystem::path& file_path) {
    nlohmann::json document = emptyDocument();
    if (!std::filesystem::exists(file_path)) {
        return document;
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open store file: " + file_path.string());
    }

    nlohmann::json raw;
    try {
        in >> raw;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Corrupt store file " + file_path.string() + ": " + e.what());
    }
    if (!raw.is_object()) {
        throw std::runtime_error("Corrupt store file " + file_path.string() + ": not an object");
    }

    for (const char* table : kTables) {
        if (raw.contains(table) && raw[table].is_array()) {
            document[table] = raw[table];
        }
        if (raw.contains("next_ids") && raw["next_ids"].contains(table)) {
            document["next_ids"][table] = raw["next_ids"][table];
        }
    }
    return document;
}

std::filesystem::path ScanStoreJson::sidePath(const char* suffix) const {
    auto path = file_path_;
    path += suffix;
    return path;
}

void ScanStoreJson::rememberFileStamp() const {
    std::error_code ec;
    const auto stamp = std::filesystem::last_write_time(file_path_, ec);
    if (ec) {
        file_stamp_.reset();
        return;
    }
    const auto size = std::filesystem::file_size(file_path_, ec);
    file_stamp_ = stamp;
    file_size_ = ec ? 0 : size;
}

void ScanStoreJson::refreshLocked() const {
    std::error_code ec;
    const auto stamp = std::filesystem::last_write_time(file_path_, ec);
    if (ec) {
        return;
    }
    const auto size = std::filesystem::file_size(file_path_, ec);
    if (ec || (file_stamp_ && *file_stamp_ == stamp && file_size_ == size)) {
        return;
    }
    LOG_DEBUG("Store file {} changed on disk, reloading", file_path_.string());
    document_ = readDocument(file_path_);
    file_stamp_ = stamp;
    file_size_ = size;
}

nlohmann::json ScanStoreJson::emptyDocument() {
    nlohmann::json document;
    document["schema_version"] = 1;
    document["next_ids"] = nlohmann::json::object();
    for (const char* table : kTables) {
        document[table] = nlohmann::json::array();
        document["next_ids"][table] = 1;
    }
    return document;
}

long long ScanStoreJson::nextId(nlohmann::json& document, const char* table) {
    const long long id = document["next_ids"].value(table, 1LL);
    document["next_ids"][table] = id + 1;
    return id;
}

template<typename Mutation>
auto ScanStoreJson::mutate(Mutation&& mutation) {
    std::lock_guard<std::mutex> lock(mutex_);
    const FileLock write_lock = FileLock::acquire(sidePath(".write.lock"));
    nlohmann::json working = readDocument(file_path_);
    auto result = mutation(working);
    persist(working);
    document_ = std::move(working);
    rememberFileStamp();
    return result;
}

void ScanStoreJson::persist(const nlohmann::json& document) const {
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path());
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Cannot write store file: " + tmp_path.string());
        }
        out << document.dump(2);
        if (!out.good()) {
            throw std::runtime_error("Failed writing store file: " + tmp_path.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, file_path_, ec);
    if (ec) {
        throw std::runtime_error("Cannot replace store file " + file_path_.string() + ": " + ec.message());
    }
}

UpsertResult ScanStoreJson::upsertSymbols(const std::vector<std::string>& symbols) {
    return mutate([&](nlohmann::json& document) {
        UpsertResult result;
        auto& table = document["symbols"];
        for (const auto& symbol : symbols) {
            const bool exists = std::any_of(table.begin(), table.end(), [&](const nlohmann::json& row) {
                return row.value("symbol", "") == symbol;
            });
            if (exists) {
                continue;
            }
            SymbolRow row;
            row.id = nextId(document, "symbols");
            row.symbol = symbol;
            row.created_at = utils::nowIsoUtc();
            table.push_back(toJson(row));
            ++result.added;
        }
        result.total = static_cast<int>(table.size());
        return result;
    });
}

std::vector<SymbolRow> ScanStoreJson::listSymbols() const {
    std::lock_guard<std::mutex> lock(mutex_);
    refreshLocked();
    std::vector<SymbolRow> rows;
    for (const auto& row : document_["symbols"]) {
        rows.push_back(symbolFromJson(row));
    }
    return rows;
}

std::optional<SymbolRow> ScanStoreJson::findSymbol(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    refreshLocked();
    for (const auto& row : document_["symbols"]) {
        if (row.value("symbol", "") == symbol) {
            return symbolFromJson(row);
        }
    }
    return std::nullopt;
}

ScanRow ScanStoreJson::createScan() {
    return mutate([&](nlohmann::json& document) {
        ScanRow row;
        row.id = nextId(document, "scans");
        row.started_at = utils::nowIsoUtc();
        row.status = ScanStatus::RUNNING;
        document["scans"].push_back(toJson(row));
        return row;
    });
}

std::optional<ScanRow> ScanStoreJson::getScan(ScanId scan_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    refreshLocked();
    for (const auto& row : document_["scans"]) {
        if (row.value("id", 0LL) == scan_id) {
            return scanFromJson(row);
        }
    }
    return std::nullopt;
}

std::optional<ScanRow> ScanStoreJson::latestScan() const {
    std::lock_guard<std::mutex> lock(mutex_);
    refreshLocked();
    const nlohmann::json* best = nullptr;
    for (const auto& row : document_["scans"]) {
        if (!best || row.value("id", 0LL) > best->value("id", 0LL)) {
            best = &row;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return scanFromJson(*best);
}

std::vector<ScanRow> ScanStoreJson::listScans() const {
    std::lock_guard<std::mutex> lock(mutex_);
    refreshLocked();
    std::vector<ScanRow> rows;
    for (const auto& row : document_["scans"]) {
        rows.push_back(scanFromJson(row));
    }
    return rows;
}

std::vector<ScanRow> ScanStoreJson::findScansByStatus(ScanStatus status) const {
    std::vector<ScanRow> rows = listScans();
    rows.erase(std::remove_if(rows.begin(), rows.end(),
                              [status](const ScanRow& row) { return row.status != status; }),
               rows.end());
    return rows;
}

std::optional<FundamentalRow> ScanStoreJson::latestFundamental(SymbolId symbol_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    refreshLocked();
    return latestFor<FundamentalRow>(document_["fundamentals"], symbol_id, "fetched_at", fundamentalFromJson);
}

std::optional<TechnicalRow> ScanStoreJson::latestTechnical(SymbolId symbol_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    refreshLocked();
    return latestFor<TechnicalRow>(document_["technicals"], symbol_id, "computed_at", technicalFromJson);
}

std::optional<FundamentalRow> ScanStoreJson::fundamentalFor(ScanId scan_id, SymbolId symbol_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    refreshLocked();
    return firstFor<FundamentalRow>(document_["fundamentals"], scan_id, symbol_id, fundamentalFromJson);
}

std::optional<TechnicalRow> ScanStoreJson::technicalFor(ScanId scan_id, SymbolId symbol_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    refreshLocked();
    return firstFor<TechnicalRow>(document_["technicals"], scan_id, symbol_id, technicalFromJson);
}

std::optional<RecommendationRow> ScanStoreJson::recommendationFor(ScanId scan_id, SymbolId symbol_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    refreshLocked();
    return firstFor<RecommendationRow>(document_["recommendations"], scan_id, symbol_id, recommendationFromJson);
}

std::vector<FundamentalRow> ScanStoreJson::fundamentalsForScan(ScanId scan_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    refreshLocked();
    return allForScan<FundamentalRow>(document_["fundamentals"], scan_id, fundamentalFromJson);
}

std::vector<TechnicalRow> ScanStoreJson::technicalsForScan(ScanId scan_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    refreshLocked();
    return allForScan<TechnicalRow>(document_["technicals"], scan_id, technicalFromJson);
}

std::vector<RecommendationRow> ScanStoreJson::recommendationsForScan(ScanId scan_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    refreshLocked();
    return allForScan<RecommendationRow>(document_["recommendations"], scan_id, recommendationFromJson);
}

std::vector<ScanLogRow> ScanStoreJson::logsForScan(ScanId scan_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    refreshLocked();
    return allForScan<ScanLogRow>(document_["scan_logs"], scan_id, scanLogFromJson);
}

void ScanStoreJson::commitScan(ScanId scan_id, const ScanBatch& batch, const ScanFinalization& finalization) {
    mutate([&](nlohmann::json& document) {
        nlohmann::json* scan = findScanRow(document, scan_id);
        if (!scan) {
            throw std::runtime_error("Unknown scan id " + std::to_string(scan_id));
        }

        for (FundamentalRow row : batch.fundamentals) {
            row.id = nextId(document, "fundamentals");
            row.scan_id = scan_id;
            row.fetched_at = stampOrNow(row.fetched_at);
            document["fundamentals"].push_back(toJson(row));
        }
        for (TechnicalRow row : batch.technicals) {
            row.id = nextId(document, "technicals");
            row.scan_id = scan_id;
            row.computed_at = stampOrNow(row.computed_at);
            document["technicals"].push_back(toJson(row));
        }
        for (RecommendationRow row : batch.recommendations) {
            row.id = nextId(document, "recommendations");
            row.scan_id = scan_id;
            row.created_at = stampOrNow(row.created_at);
            document["recommendations"].push_back(toJson(row));
        }
        for (ScanLogRow row : batch.logs) {
            row.id = nextId(document, "scan_logs");
            row.scan_id = scan_id;
            row.created_at = stampOrNow(row.created_at);
            document["scan_logs"].push_back(toJson(row));
        }

        applyFinalization(*scan, finalization);
        return true;
    });
}

void ScanStoreJson::finalizeScan(ScanId scan_id, const ScanFinalization& finalization) {
    mutate([&](nlohmann::json& document) {
        nlohmann::json* scan = findScanRow(document, scan_id);
        if (!scan) {
            throw std::runtime_error("Unknown scan id " + std::to_string(scan_id));
        }
        applyFinalization(*scan, finalization);
        return true;
    });
}

RowCounts ScanStoreJson::deleteSymbolFromScan(ScanId scan_id, SymbolId symbol_id) {
    return mutate([&](nlohmann::json& document) {
        auto same_pair = [&](const nlohmann::json& row) {
            return row.value("scan_id", 0LL) == scan_id &&
                   optionalFromJson<SymbolId>(row, "symbol_id") == symbol_id;
        };
        RowCounts counts;
        counts.fundamentals = eraseRows(document["fundamentals"], same_pair);
        counts.technicals = eraseRows(document["technicals"], same_pair);
        counts.recommendations = eraseRows(document["recommendations"], same_pair);
        counts.logs = eraseRows(document["scan_logs"], same_pair);
        return counts;
    });
}

RowCounts ScanStoreJson::clearAll() {
    return mutate([&](nlohmann::json& document) {
        RowCounts counts;
        counts.logs = static_cast<int>(document["scan_logs"].size());
        counts.recommendations = static_cast<int>(document["recommendations"].size());
        counts.technicals = static_cast<int>(document["technicals"].size());
        counts.fundamentals = static_cast<int>(document["fundamentals"].size());
        counts.scans = static_cast<int>(document["scans"].size());
        counts.symbols = static_cast<int>(document["symbols"].size());
        for (const char* table : kTables) {
            document[table] = nlohmann::json::array();
        }
        return counts;
    });
}

std::unique_ptr<ScannerLock> ScanStoreJson::tryLockScanner() {
    auto lock = FileLock::tryAcquire(sidePath(".lock"));
    if (!lock) {
        return nullptr;
    }
    return std::make_unique<FileScannerLock>(std::move(*lock));
}

} // namespace core
} // namespace revscan
