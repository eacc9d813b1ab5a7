#pragma once

#include "common/WorkerPool.h"
#include "core/contracts/IMarketDataSource.h"
#include "data/GoogleFinanceSource.h"
#include "data/NetworkProbe.h"
#include "data/SourceConfig.h"
#include "data/YahooChartSource.h"
#include "network/IHttpClient.h"
#include <memory>
#include <string>
#include <vector>

namespace revscan {
namespace data {

// Source fallback chain.
//   fundamentals: primary page, else synthetic
//   history:      primary page (>= primary_min_bars), else secondary chart
//                 source on its own worker pool, else synthetic
// A dead network probe sends everything straight to synthetic data.
class MarketDataService : public core::IMarketDataSource {
public:
    MarketDataService(std::shared_ptr<network::IHttpClient> http,
                      SourceConfig config,
                      std::shared_ptr<NetworkProbe> probe = nullptr);

    FundamentalSnapshot fetchFundamentals(const std::string& symbol) override;
    std::vector<PriceBar> fetchPriceHistory(const std::string& symbol, int months) override;

    // Ascending by date, first occurrence of a duplicate date kept
    static std::vector<PriceBar> normalize(std::vector<PriceBar> bars);

private:
    SourceConfig config_;
    std::shared_ptr<NetworkProbe> probe_;
    GoogleFinanceSource primary_;
    YahooChartSource secondary_;
    WorkerPool secondary_pool_;
};

} // namespace data
} // namespace revscan
