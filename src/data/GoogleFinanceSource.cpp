#include "data/GoogleFinanceSource.h"
#include "data/HtmlScraper.h"
#include "common/DateUtils.h"
#include "common/Logger.h"
#include "common/StringUtils.h"
#include <cctype>
#include <chrono>
#include <initializer_list>
#include <map>
#include <regex>
#include <stdexcept>
#include <thread>

namespace revscan {
namespace data {

namespace {
// First non-empty value among the given label spellings
std::optional<std::string> lookup(const std::map<std::string, std::string>& kv,
                                  std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = kv.find(key);
        if (it != kv.end() && !it->second.empty()) {
            return it->second;
        }
    }
    return std::nullopt;
}

std::optional<double> lookupNumber(const std::map<std::string, std::string>& kv,
                                   std::initializer_list<const char*> keys) {
    auto text = lookup(kv, keys);
    return text ? HtmlScraper::parseNumber(*text) : std::nullopt;
}

std::string formatOptional(const std::optional<double>& value) {
    return value ? std::to_string(*value) : "N/A";
}

// Backoff doubles per attempt up to 2^kMaxBackoffShift times the base delay
constexpr int kMaxBackoffShift = 6;

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

// `"YYYY-MM-DD"` starting at pos (pos is the opening quote)
bool isQuotedDate(const std::string& text, size_t pos) {
    if (pos + 11 >= text.size() || text[pos] != '"' || text[pos + 11] != '"') {
        return false;
    }
    for (size_t i = 1; i <= 10; ++i) {
        const char c = text[pos + i];
        if (i == 5 || i == 8) {
            if (c != '-') return false;
        } else if (!isDigit(c)) {
            return false;
        }
    }
    return true;
}

// Each quoted date followed by `"close": <n>` before the next '}'. One pass:
// the next close key and next brace are cached and only advanced forward.
void collectDatedCloses(const std::string& script, std::vector<PriceBar>& bars) {
    static const std::string kCloseKey = "\"close\":";
    size_t next_key = script.find(kCloseKey);
    size_t next_brace = script.find('}');

    size_t pos = script.find('"');
    while (pos != std::string::npos && next_key != std::string::npos) {
        if (!isQuotedDate(script, pos)) {
            pos = script.find('"', pos + 1);
            continue;
        }

        const size_t date_end = pos + 12;
        if (next_key < date_end) {
            next_key = script.find(kCloseKey, date_end);
        }
        if (next_brace != std::string::npos && next_brace < date_end) {
            next_brace = script.find('}', date_end);
        }
        if (next_key == std::string::npos) {
            break;
        }
        if (next_brace != std::string::npos && next_brace < next_key) {
            pos = script.find('"', pos + 1);
            continue;
        }

        size_t cursor = next_key + kCloseKey.size();
        while (cursor < script.size() && std::isspace(static_cast<unsigned char>(script[cursor]))) {
            ++cursor;
        }
        const size_t number_begin = cursor;
        while (cursor < script.size() && (isDigit(script[cursor]) || script[cursor] == '.')) {
            ++cursor;
        }
        if (cursor == number_begin) {
            pos = script.find('"', pos + 1);
            continue;
        }

        if (auto close = HtmlScraper::parseNumber(script.substr(number_begin, cursor - number_begin))) {
            bars.emplace_back(script.substr(pos + 1, 10), *close);
        }
        pos = script.find('"', cursor);
    }
}
}

GoogleFinanceSource::GoogleFinanceSource(std::shared_ptr<network::IHttpClient> http, SourceConfig config)
    : http_(std::move(http))
    , config_(std::move(config))
{
    if (!http_) {
        throw std::invalid_argument("GoogleFinanceSource requires an HTTP client");
    }
}

std::string GoogleFinanceSource::quoteUrl(const std::string& symbol, const std::string& suffix) const {
    return config_.primary_base_url + "/quote/" + network::encodeUrlComponent(symbol) + suffix;
}

void GoogleFinanceSource::throttle(int milliseconds) const {
    if (milliseconds > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
    }
}

std::optional<network::HttpResponse> GoogleFinanceSource::fetchWithRetry(const std::string& url) {
    const int attempts = config_.retries < 1 ? 1 : config_.retries;
    for (int attempt = 0; attempt < attempts; ++attempt) {
        try {
            auto response = http_->get(url, config_.request_timeout_seconds, network::defaultBrowserHeaders());
            if (response.isOk()) {
                return response;
            }
            LOG_WARN("HTTP {} for {} (attempt {}/{})", response.status_code, url, attempt + 1, attempts);
        } catch (const std::exception& e) {
            LOG_WARN("Request error for {} (attempt {}/{}): {}", url, attempt + 1, attempts, e.what());
        }

        if (attempt + 1 < attempts) {
            const int shift = attempt < kMaxBackoffShift ? attempt : kMaxBackoffShift;
            throttle(config_.backoff_ms * (1 << shift));
        }
    }
    LOG_ERROR("All {} attempts failed for {}", attempts, url);
    return std::nullopt;
}

std::optional<network::HttpResponse> GoogleFinanceSource::fetchQuotePage(const std::string& symbol) {
    for (const auto& suffix : config_.exchange_suffixes) {
        const std::string url = quoteUrl(symbol, suffix);
        LOG_DEBUG("[{}] trying {}", symbol, url);
        auto response = fetchWithRetry(url);
        if (response) {
            return response;
        }
    }
    return std::nullopt;
}

std::optional<FundamentalSnapshot> GoogleFinanceSource::fetchFundamentals(const std::string& symbol) {
    LOG_INFO("[{}] Fetching fundamentals", symbol);
    auto page = fetchQuotePage(symbol);
    if (!page) {
        LOG_ERROR("[{}] All quote URLs failed for fundamentals", symbol);
        return std::nullopt;
    }

    FundamentalSnapshot snapshot = parseFundamentals(symbol, page->body);
    LOG_INFO("[{}] Fundamentals: name={} cmp={} pe={} roce={} bv={} debt={} industry={}",
             symbol, snapshot.name.value_or("N/A"), formatOptional(snapshot.cmp),
             formatOptional(snapshot.pe), formatOptional(snapshot.roce),
             formatOptional(snapshot.bv), formatOptional(snapshot.debt),
             snapshot.industry.value_or("N/A"));
    if (!snapshot.cmp) {
        LOG_WARN("[{}] CMP not found, price selector may have changed", symbol);
    }

    throttle(config_.fundamentals_throttle_ms);
    return snapshot;
}

FundamentalSnapshot GoogleFinanceSource::parseFundamentals(const std::string& symbol, const std::string& html) {
    FundamentalSnapshot snapshot;
    snapshot.symbol = symbol;

    // Name: dedicated element, else "<SYM> Share Price - <Company> Stock ..." title
    if (auto name = HtmlScraper::selectFirstText(html, "div.zzDege")) {
        snapshot.name = *name;
    } else if (auto title = HtmlScraper::title(html)) {
        const auto dash = title->find('-');
        if (dash == std::string::npos) {
            snapshot.name = utils::trim(*title);
        } else {
            const auto next_dash = title->find('-', dash + 1);
            std::string part = utils::trim(title->substr(
                dash + 1, next_dash == std::string::npos ? std::string::npos : next_dash - dash - 1));
            const auto stock_pos = part.find("Stock");
            if (stock_pos != std::string::npos) {
                part = utils::trim(part.substr(0, stock_pos));
            }
            snapshot.name = part;
        }
    }

    // Price
    if (auto price = HtmlScraper::selectFirstText(html, "div.YMlKec.fxKbKc")) {
        snapshot.cmp = HtmlScraper::parseNumber(*price);
    } else if (auto attr = HtmlScraper::firstAttribute(html, "data-last-price")) {
        snapshot.cmp = HtmlScraper::parseNumber(*attr);
    }

    const auto kv = HtmlScraper::keyValuePairs(html);
    snapshot.pe = lookupNumber(kv, {"p/e ratio", "pe ratio", "p/e"});
    snapshot.bv = lookupNumber(kv, {"book value", "book value per share"});
    snapshot.roce = lookupNumber(kv, {"roce", "return on capital employed"});
    snapshot.debt = lookupNumber(kv, {"total debt", "debt", "net debt"});

    if (auto industry = HtmlScraper::selectFirstText(html, "a.py3Ok")) {
        snapshot.industry = *industry;
    } else {
        snapshot.industry = lookup(kv, {"industry", "sector"});
    }
    return snapshot;
}

std::optional<std::vector<PriceBar>> GoogleFinanceSource::fetchPriceHistory(const std::string& symbol) {
    LOG_INFO("[{}] Fetching price history from quote page", symbol);
    auto page = fetchQuotePage(symbol);
    if (!page) {
        LOG_WARN("[{}] All quote URLs failed for price history", symbol);
        return std::nullopt;
    }

    auto bars = parsePriceHistory(page->body);
    LOG_INFO("[{}] Chart extraction: {} bars", symbol, bars.size());
    if (!bars.empty()) {
        LOG_DEBUG("[{}] date range {} -> {}", symbol, bars.front().date, bars.back().date);
    }

    throttle(config_.history_throttle_ms);
    return bars;
}

std::vector<PriceBar> GoogleFinanceSource::parsePriceHistory(const std::string& html) {
    std::vector<PriceBar> bars;

    // [[timestamp,open,high,low,close] tuples
    static const std::regex tuple_re(R"(\[\[(\d{10,13}),[\d.]+,[\d.]+,[\d.]+,([\d.]+)\])");
    for (std::sregex_iterator it(html.begin(), html.end(), tuple_re), end; it != end; ++it) {
        long long ts = std::stoll((*it)[1].str());
        if (ts > 1000000000000LL) {
            ts /= 1000;
        }
        auto close = HtmlScraper::parseNumber((*it)[2].str());
        if (close) {
            bars.emplace_back(utils::formatDate(static_cast<std::time_t>(ts)), *close);
        }
    }
    if (!bars.empty()) {
        return bars;
    }

    // "YYYY-MM-DD" ... "close": n objects inside script blocks
    for (const auto& script : HtmlScraper::scriptBodies(html)) {
        collectDatedCloses(script, bars);
    }
    return bars;
}

} // namespace data
} // namespace revscan
