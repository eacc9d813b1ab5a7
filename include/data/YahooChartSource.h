#pragma once

#include "common/Types.h"
#include "data/SourceConfig.h"
#include "network/IHttpClient.h"
#include <ctime>
#include <memory>
#include <string>
#include <vector>

namespace revscan {
namespace data {

// Secondary price-history source (daily chart JSON). Blocking; callers
// dispatch it onto a worker pool.
class YahooChartSource {
public:
    YahooChartSource(std::shared_ptr<network::IHttpClient> http, SourceConfig config);

    // Tries each ticker suffix in order and keeps the first one that returns
    // at least `secondary_min_rows` closes. Empty when none does.
    std::vector<PriceBar> fetchPriceHistory(const std::string& symbol, int months);

    // Null closes are skipped. Throws nlohmann::json::exception on malformed input.
    static std::vector<PriceBar> parseChart(const std::string& body);

    std::string chartUrl(const std::string& ticker, std::time_t period1, std::time_t period2) const;

private:
    std::shared_ptr<network::IHttpClient> http_;
    SourceConfig config_;
};

} // namespace data
} // namespace revscan
