#pragma once

#include <string>
#include <vector>

namespace revscan {
namespace data {

// Market-data acquisition settings (primary page source, secondary chart
// source, retry policy and politeness delays)
struct SourceConfig {
    std::string primary_base_url = "https://www.google.com/finance";
    std::string secondary_base_url = "https://query1.finance.yahoo.com";

    // Listing suffixes tried in order against the primary source
    std::vector<std::string> exchange_suffixes{":NSE", ":BOM", ""};
    // Ticker suffixes tried in order against the secondary source
    std::vector<std::string> secondary_suffixes{".NS", ".BO", ""};

    int retries = 2;
    int backoff_ms = 500;               // doubles each attempt
    int request_timeout_seconds = 8;
    int probe_timeout_seconds = 5;
    int fundamentals_throttle_ms = 300;
    int history_throttle_ms = 200;

    size_t primary_min_bars = 60;
    size_t secondary_min_rows = 20;
    int secondary_workers = 4;

    bool force_offline = false;
};

} // namespace data
} // namespace revscan
