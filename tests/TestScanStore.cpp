#include "common/DateUtils.h"
#include "core/state/ScanStoreJson.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace revscan;
using namespace revscan::core;

#define EXPECT(cond, msg)                                                        \
    do {                                                                         \
        if (!(cond)) {                                                           \
            std::cerr << "[TEST] " << msg << " (line " << __LINE__ << ")\n";     \
            return 1;                                                            \
        }                                                                        \
    } while (0)

namespace {
ScanBatch batchFor(SymbolId symbol_id, double score) {
    ScanBatch batch;

    FundamentalRow fund;
    fund.symbol_id = symbol_id;
    fund.name = "Tata Consultancy Services";
    fund.cmp = 3852.4;
    batch.fundamentals.push_back(fund);

    TechnicalRow tech;
    tech.symbol_id = symbol_id;
    tech.rsi14 = 24.5;
    tech.close = 3852.4;
    tech.signals = {{"rsi_oversold", true}, {"macd_crossover", false}};
    tech.price_series = nlohmann::json::array({{{"date", "2024-06-14"}, {"close", 3852.4}}});
    batch.technicals.push_back(tech);

    RecommendationRow rec;
    rec.symbol_id = symbol_id;
    rec.recommended = score > 0;
    rec.score = score;
    rec.reason = score > 0 ? "RSI(14)=24.5 (oversold) + bullish MACD crossover" : "";
    batch.recommendations.push_back(rec);

    ScanLogRow log;
    log.symbol_id = symbol_id;
    log.status = ScanLogStatus::IGNORED;
    log.message = "Insufficient price data (12 bars, need \xE2\x89\xA5" "30)";
    batch.logs.push_back(log);
    return batch;
}
}

int main() {
    std::cout << "[TEST] Starting ScanStore Test..." << std::endl;

    const auto dir = std::filesystem::temp_directory_path() / "revscan_test_store";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    const auto path = dir / "store.json";
    const std::string today = utils::todayUtc();

    ScanId first_scan = 0;
    SymbolId tcs_id = 0;
    {
        ScanStoreJson store(path);
        EXPECT(store.listSymbols().empty() && !store.latestScan(), "fresh store is empty");

        auto up = store.upsertSymbols({"TCS", "INFY", "TCS"});
        EXPECT(up.added == 2 && up.total == 2, "first upsert, added=" << up.added << " total=" << up.total);
        up = store.upsertSymbols({"TCS", "WIPRO"});
        EXPECT(up.added == 1 && up.total == 3, "second upsert adds only WIPRO");
        EXPECT(std::filesystem::exists(path), "store written to disk");

        const auto tcs = store.findSymbol("TCS");
        EXPECT(tcs && tcs->id > 0 && utils::isSameDay(tcs->created_at, today), "symbol row");
        tcs_id = tcs->id;

        const auto scan = store.createScan();
        first_scan = scan.id;
        EXPECT(scan.status == ScanStatus::RUNNING && !scan.finished_at, "new scan is running");
        EXPECT(store.findScansByStatus(ScanStatus::RUNNING).size() == 1, "one running scan");

        store.commitScan(scan.id, batchFor(tcs_id, 8.5), ScanFinalization{ScanStatus::COMPLETED, std::string("WIPRO: timeout")});

        const auto done = store.getScan(scan.id);
        EXPECT(done && done->status == ScanStatus::COMPLETED, "scan finalized");
        EXPECT(done->finished_at && done->error_message && *done->error_message == "WIPRO: timeout", "finalization fields");
        EXPECT(store.findScansByStatus(ScanStatus::RUNNING).empty(), "nothing left running");

        const auto fund = store.fundamentalFor(scan.id, tcs_id);
        EXPECT(fund && fund->name && *fund->name == "Tata Consultancy Services" && !fund->pe, "fundamental row");
        EXPECT(utils::isSameDay(fund->fetched_at, today), "fetched_at stamped on commit");

        const auto tech = store.technicalFor(scan.id, tcs_id);
        EXPECT(tech && tech->rsi14 && *tech->rsi14 == 24.5 && !tech->macd, "technical row");
        EXPECT(tech->signals.value("rsi_oversold", false), "signals object kept");
        EXPECT(tech->price_series.size() == 1 && tech->rsi_series.empty(), "series kept");

        const auto rec = store.recommendationFor(scan.id, tcs_id);
        EXPECT(rec && rec->recommended && rec->score == 8.5, "recommendation row");

        const auto logs = store.logsForScan(scan.id);
        EXPECT(logs.size() == 1 && logs[0].status == ScanLogStatus::IGNORED, "log row");
        EXPECT(logs[0].symbol_id && *logs[0].symbol_id == tcs_id, "log symbol");
    }

    // Reopen from disk: rows survive and ids continue
    {
        ScanStoreJson store(path);
        EXPECT(store.listSymbols().size() == 3, "symbols reloaded");
        EXPECT(store.recommendationsForScan(first_scan).size() == 1, "recommendations reloaded");

        const auto second = store.createScan();
        EXPECT(second.id == first_scan + 1, "scan ids continue after reload");
        EXPECT(store.latestScan()->id == second.id, "latest scan is the newest");

        // Older explicit stamp does not become "latest"
        auto batch = batchFor(tcs_id, 0.0);
        batch.technicals[0].computed_at = "2000-01-01T00:00:00Z";
        batch.technicals[0].rsi14 = 55.0;
        batch.fundamentals[0].fetched_at = "2000-01-01T00:00:00Z";
        store.commitScan(second.id, batch, ScanFinalization{});

        const auto latest_tech = store.latestTechnical(tcs_id);
        EXPECT(latest_tech && latest_tech->scan_id == first_scan, "latest technical by timestamp");
        const auto latest_fund = store.latestFundamental(tcs_id);
        EXPECT(latest_fund && latest_fund->scan_id == first_scan, "latest fundamental by timestamp");
        EXPECT(!store.latestTechnical(9999), "unknown symbol has no technicals");

        // Failed commit leaves everything untouched
        bool threw = false;
        try {
            store.commitScan(424242, batchFor(tcs_id, 1.0), ScanFinalization{});
        } catch (const std::runtime_error&) {
            threw = true;
        }
        EXPECT(threw, "unknown scan id throws");
        EXPECT(store.technicalsForScan(424242).empty(), "no rows for unknown scan");
        EXPECT(store.technicalsForScan(second.id).size() == 1, "second scan rows intact");

        const auto deleted = store.deleteSymbolFromScan(second.id, tcs_id);
        EXPECT(deleted.fundamentals == 1 && deleted.technicals == 1 && deleted.recommendations == 1 &&
                   deleted.logs == 1,
               "per-scan symbol delete counts");
        EXPECT(store.recommendationsForScan(first_scan).size() == 1, "other scans untouched");

        store.finalizeScan(second.id, ScanFinalization{ScanStatus::FAILED, std::string("boom")});
        EXPECT(store.getScan(second.id)->status == ScanStatus::FAILED, "finalizeScan");

        const auto cleared = store.clearAll();
        EXPECT(cleared.scans == 2 && cleared.symbols == 3 && cleared.recommendations == 1, "clearAll counts");
        EXPECT(store.listSymbols().empty() && store.listScans().empty(), "tables emptied");
        EXPECT(store.createScan().id == first_scan + 2, "ids are never reused");
    }

    // Two instances on one file: each write starts from what is on disk
    {
        const auto shared = dir / "shared.json";
        ScanStoreJson a(shared);
        ScanStoreJson b(shared);

        a.upsertSymbols({"AAA"});
        const auto added = b.upsertSymbols({"BBB"});
        EXPECT(added.added == 1 && added.total == 2, "second writer keeps the first writer's symbol");
        EXPECT(a.findSymbol("BBB") && a.listSymbols().size() == 2, "reader sees the other writer");
        EXPECT(a.findSymbol("AAA")->id != a.findSymbol("BBB")->id, "distinct ids across writers");

        const auto first = a.createScan();
        const auto second = b.createScan();
        EXPECT(second.id == first.id + 1, "scan ids continue across writers");
        a.finalizeScan(first.id, ScanFinalization{ScanStatus::COMPLETED, std::nullopt});
        EXPECT(b.getScan(first.id)->status == ScanStatus::COMPLETED, "finalization visible");
        EXPECT(b.getScan(second.id)->status == ScanStatus::RUNNING, "other scan untouched");

        auto held = a.tryLockScanner();
        EXPECT(held != nullptr, "scanner lock free");
        EXPECT(b.tryLockScanner() == nullptr, "scanner lock exclusive across instances");
        EXPECT(a.tryLockScanner() == nullptr, "scanner lock not re-entrant");
        held.reset();
        EXPECT(b.tryLockScanner() != nullptr, "scanner lock released with its holder");
    }

    // A corrupt file is reported, not silently replaced
    {
        const auto bad = dir / "corrupt.json";
        {
            std::ofstream out(bad);
            out << "{ not json";
        }
        bool threw = false;
        try {
            ScanStoreJson store(bad);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        EXPECT(threw, "corrupt store file throws");
    }

    std::filesystem::remove_all(dir, ec);
    std::cout << "[TEST] ScanStore PASSED" << std::endl;
    return 0;
}
