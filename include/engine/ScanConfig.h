#pragma once

#include <string>

namespace revscan {
namespace engine {

// Scan orchestration settings
struct ScanConfig {
    int concurrency_limit;          // simultaneous symbol pipelines
    int history_months;             // months of daily closes requested per symbol
    int lookback;                   // trailing sessions inspected by the detector
    int min_bars;                   // below this a symbol is ignored
    int progress_grace_seconds;     // finished progress stays pollable this long
    int error_summary_limit;        // symbol errors joined into the scan row

    ScanConfig()
        : concurrency_limit(8)
        , history_months(9)
        , lookback(5)
        , min_bars(30)
        , progress_grace_seconds(30)
        , error_summary_limit(10)
    {}
};

struct StorageConfig {
    std::string store_path = "data/scanner_store.json";
    std::string symbols_file = "symbols.txt";
};

} // namespace engine
} // namespace revscan
