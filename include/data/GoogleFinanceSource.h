#pragma once

#include "common/Types.h"
#include "data/SourceConfig.h"
#include "network/IHttpClient.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace revscan {
namespace data {

// Primary source: scrapes the public quote page. Fundamentals always come
// from here; price history only when the page embeds enough chart data.
class GoogleFinanceSource {
public:
    GoogleFinanceSource(std::shared_ptr<network::IHttpClient> http, SourceConfig config);

    // Empty when every listing suffix exhausted its retries
    std::optional<FundamentalSnapshot> fetchFundamentals(const std::string& symbol);

    // Empty when no page could be fetched. A fetched page with no
    // recognizable chart data gives an empty vector.
    std::optional<std::vector<PriceBar>> fetchPriceHistory(const std::string& symbol);

    static FundamentalSnapshot parseFundamentals(const std::string& symbol, const std::string& html);
    static std::vector<PriceBar> parsePriceHistory(const std::string& html);

    std::string quoteUrl(const std::string& symbol, const std::string& suffix) const;

private:
    std::optional<network::HttpResponse> fetchWithRetry(const std::string& url);
    std::optional<network::HttpResponse> fetchQuotePage(const std::string& symbol);
    void throttle(int milliseconds) const;

    std::shared_ptr<network::IHttpClient> http_;
    SourceConfig config_;
};

} // namespace data
} // namespace revscan
