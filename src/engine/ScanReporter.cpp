#include "engine/ScanReporter.h"
#include "common/StringUtils.h"
#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>

namespace revscan {
namespace engine {

namespace {
template<typename T>
nlohmann::json orNull(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json orNull(const std::string& value) {
    return value.empty() ? nlohmann::json(nullptr) : nlohmann::json(value);
}

const char* divergenceLabel(const nlohmann::json& signals, const char* key) {
    const bool fired = signals.is_object() && signals.value(key, false);
    return fired ? "Bullish" : "Bearing";
}

void putFundamentals(nlohmann::json& out, const std::optional<core::FundamentalRow>& fund) {
    out["stock_name"] = fund ? orNull(fund->name) : nlohmann::json(nullptr);
    out["cmp"] = fund ? orNull(fund->cmp) : nlohmann::json(nullptr);
    out["pe"] = fund ? orNull(fund->pe) : nlohmann::json(nullptr);
    out["roce"] = fund ? orNull(fund->roce) : nlohmann::json(nullptr);
    out["bv"] = fund ? orNull(fund->bv) : nlohmann::json(nullptr);
    out["debt"] = fund ? orNull(fund->debt) : nlohmann::json(nullptr);
    out["industry"] = fund ? orNull(fund->industry) : nlohmann::json(nullptr);
}

void putLatestReadings(nlohmann::json& out, const std::optional<core::TechnicalRow>& tech) {
    out["rsi14"] = tech ? orNull(tech->rsi14) : nlohmann::json(nullptr);
    out["macd"] = tech ? orNull(tech->macd) : nlohmann::json(nullptr);
    out["macd_signal"] = tech ? orNull(tech->macd_signal) : nlohmann::json(nullptr);
    out["sma20"] = tech ? orNull(tech->sma20) : nlohmann::json(nullptr);
    out["close"] = tech ? orNull(tech->close) : nlohmann::json(nullptr);
}

void putScanHeader(nlohmann::json& out, const core::ScanRow& scan) {
    out["scan_id"] = scan.id;
    out["scan_status"] = toString(scan.status);
    out["started_at"] = orNull(scan.started_at);
    out["finished_at"] = orNull(scan.finished_at);
}
}

ScanReporter::ScanReporter(std::shared_ptr<const core::IScanStore> store, const ScanEngine& engine)
    : store_(std::move(store))
    , engine_(engine)
{
    if (!store_) {
        throw std::invalid_argument("ScanReporter requires a store");
    }
}

nlohmann::json ScanReporter::scanSummary(ScanId scan_id) const {
    const auto scan = store_->getScan(scan_id);
    if (!scan) {
        throw core::NotFoundError("Scan not found");
    }

    const auto recs = store_->recommendationsForScan(scan_id);
    const auto recommended = std::count_if(recs.begin(), recs.end(),
                                           [](const core::RecommendationRow& r) { return r.recommended; });
    const auto progress = engine_.progress(scan_id);

    return {
        {"scan_id", scan->id},
        {"status", toString(scan->status)},
        {"started_at", orNull(scan->started_at)},
        {"finished_at", orNull(scan->finished_at)},
        {"error_message", orNull(scan->error_message)},
        {"total_symbols", recs.size()},
        {"recommended_count", recommended},
        {"progress", progress ? progress->toJson() : nlohmann::json(nullptr)},
    };
}

nlohmann::json ScanReporter::latestRecommendations(bool only_recommended) const {
    const char* rows_key = only_recommended ? "recommendations" : "results";
    const auto scan = store_->latestScan();
    if (!scan) {
        return {{"scan_id", nullptr}, {"scan_status", nullptr}, {rows_key, nlohmann::json::array()}};
    }

    std::map<SymbolId, std::string> names;
    for (const auto& row : store_->listSymbols()) {
        names[row.id] = row.symbol;
    }

    auto recs = store_->recommendationsForScan(scan->id);
    std::stable_sort(recs.begin(), recs.end(),
                     [](const core::RecommendationRow& a, const core::RecommendationRow& b) {
                         return a.score > b.score;
                     });

    nlohmann::json rows = nlohmann::json::array();
    for (const auto& rec : recs) {
        if (only_recommended && !rec.recommended) {
            continue;
        }
        auto name = names.find(rec.symbol_id);
        if (name == names.end()) {
            continue;
        }

        const auto fund = store_->fundamentalFor(scan->id, rec.symbol_id);
        const auto tech = store_->technicalFor(scan->id, rec.symbol_id);
        const nlohmann::json signals = tech ? tech->signals : nlohmann::json::object();

        nlohmann::json row;
        row["symbol"] = name->second;
        putFundamentals(row, fund);
        if (!only_recommended) {
            putLatestReadings(row, tech);
        }
        row["rsi_divergence"] = divergenceLabel(signals, "rsi_divergence");
        row["macd_divergence"] = divergenceLabel(signals, "macd_divergence");
        if (!only_recommended) {
            row["recommended"] = rec.recommended;
        }
        row["score"] = rec.score;
        row["reason"] = rec.reason;
        row["created_at"] = orNull(rec.created_at);
        rows.push_back(std::move(row));
    }

    nlohmann::json out;
    putScanHeader(out, *scan);
    out[rows_key] = std::move(rows);
    return out;
}

nlohmann::json ScanReporter::symbolDetails(const std::string& symbol, std::optional<ScanId> scan_id) const {
    const auto sym = store_->findSymbol(utils::toUpper(symbol));
    if (!sym) {
        throw core::NotFoundError("Symbol not found");
    }
    if (!scan_id) {
        const auto latest = store_->latestScan();
        if (!latest) {
            throw core::NotFoundError("No scans available");
        }
        scan_id = latest->id;
    }

    const auto fund = store_->fundamentalFor(*scan_id, sym->id);
    const auto tech = store_->technicalFor(*scan_id, sym->id);
    const auto rec = store_->recommendationFor(*scan_id, sym->id);

    nlohmann::json out;
    out["symbol"] = sym->symbol;
    out["scan_id"] = *scan_id;
    putFundamentals(out, fund);
    putLatestReadings(out, tech);
    out["signals"] = tech ? tech->signals : nlohmann::json::object();
    out["price_series"] = tech ? tech->price_series : nlohmann::json::array();
    out["rsi_series"] = tech ? tech->rsi_series : nlohmann::json::array();
    out["macd_series"] = tech ? tech->macd_series : nlohmann::json::array();
    out["recommended"] = rec ? rec->recommended : false;
    out["score"] = rec ? rec->score : 0.0;
    out["reason"] = rec ? rec->reason : std::string();
    out["created_at"] = rec ? orNull(rec->created_at) : nlohmann::json(nullptr);
    return out;
}

nlohmann::json ScanReporter::scanLogs(std::optional<ScanId> scan_id) const {
    std::optional<core::ScanRow> scan;
    if (scan_id) {
        scan = store_->getScan(*scan_id);
        if (!scan) {
            throw core::NotFoundError("Scan not found");
        }
    } else {
        scan = store_->latestScan();
        if (!scan) {
            return {{"scan_id", nullptr}, {"scan_status", nullptr}, {"logs", nlohmann::json::array()}};
        }
    }

    std::map<SymbolId, std::string> names;
    for (const auto& row : store_->listSymbols()) {
        names[row.id] = row.symbol;
    }

    auto logs = store_->logsForScan(scan->id);
    std::stable_sort(logs.begin(), logs.end(),
                     [](const core::ScanLogRow& a, const core::ScanLogRow& b) {
                         return a.created_at < b.created_at;
                     });

    nlohmann::json rows = nlohmann::json::array();
    for (const auto& log : logs) {
        nlohmann::json symbol = nullptr;
        if (log.symbol_id) {
            auto it = names.find(*log.symbol_id);
            if (it != names.end()) {
                symbol = it->second;
            }
        }
        rows.push_back({
            {"status", toString(log.status)},
            {"symbol", symbol},
            {"message", log.message},
            {"created_at", orNull(log.created_at)},
        });
    }

    return {
        {"scan_id", scan->id},
        {"scan_status", toString(scan->status)},
        {"logs", std::move(rows)},
    };
}

nlohmann::json ScanReporter::activeScan() const {
    const auto active = engine_.activeScanId();
    if (!active) {
        return {{"running", false}, {"scan_id", nullptr}, {"progress", nullptr}};
    }
    const auto progress = engine_.progress(*active);
    return {
        {"running", true},
        {"scan_id", *active},
        {"progress", progress ? progress->toJson() : nlohmann::json(nullptr)},
    };
}

} // namespace engine
} // namespace revscan
