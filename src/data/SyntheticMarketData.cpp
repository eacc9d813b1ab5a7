#include "data/SyntheticMarketData.h"
#include "common/StringUtils.h"
#include "common/DateUtils.h"
#include "common/Logger.h"
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <random>

namespace revscan {
namespace data {

namespace {
struct Profile {
    const char* name;
    double cmp;
    double pe;
    double roce;
    double bv;
    double debt;
    const char* industry;
};

const std::map<std::string, Profile>& knownProfiles() {
    static const std::map<std::string, Profile> profiles = {
        {"TCS",   {"Tata Consultancy Services", 3852.40, 28.54, 52.3, 285.20, 12000.0, "IT Services"}},
        {"INFY",  {"Infosys Limited", 1523.75, 25.18, 36.82, 220.45, 3800.0, "IT Services"}},
        {"NMDC",  {"NMDC Limited", 127.30, 8.42, 22.10, 95.60, 4200.0, "Mining & Minerals"}},
        {"TECHM", {"Tech Mahindra Limited", 1342.90, 32.05, 14.50, 380.10, 9100.0, "IT Services"}},
        {"WIPRO", {"Wipro Limited", 452.15, 22.78, 18.92, 130.80, 6200.0, "IT Services"}},
    };
    return profiles;
}

const Profile kDefaultProfile{nullptr, 500.0, 18.0, 15.0, 120.0, 2500.0, "General"};

// Where the decline starts (fraction of the series) and how deep it goes
struct ReversalShape {
    double dip_start_frac;
    double dip_depth;
};

const std::map<std::string, ReversalShape>& reversalShapes() {
    static const std::map<std::string, ReversalShape> shapes = {
        {"NMDC",  {0.78, 0.22}},
        {"WIPRO", {0.82, 0.16}},
    };
    return shapes;
}

constexpr int kBounceSessions = 3;
constexpr double kBounceFactor = 1.5;

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

const Profile& profileFor(const std::string& symbol) {
    const auto& profiles = knownProfiles();
    auto it = profiles.find(utils::toUpper(symbol));
    return it != profiles.end() ? it->second : kDefaultProfile;
}

// Geometric random walk, `count` closes starting at `start`
std::vector<double> randomWalk(std::mt19937_64& rng, double start, int count, double vol, double drift) {
    std::vector<double> closes;
    if (count <= 0) {
        return closes;
    }
    closes.reserve(static_cast<size_t>(count));
    closes.push_back(round2(start));
    std::normal_distribution<double> gauss(0.0, 1.0);
    for (int i = 1; i < count; ++i) {
        const double ret = drift + vol * gauss(rng);
        closes.push_back(round2(closes.back() * (1.0 + ret)));
    }
    return closes;
}

// Mild uptrend, a straight decline, then a short bounce at the very end
std::vector<double> declineAndBounce(std::mt19937_64& rng, double start, int count, const ReversalShape& shape) {
    const int dip_idx = static_cast<int>(count * shape.dip_start_frac);
    const int decline = std::max(5, count - dip_idx - kBounceSessions);

    std::vector<double> closes = randomWalk(rng, start, count - decline - kBounceSessions, 0.008, 0.0003);
    const double peak = closes.back();
    const double daily_drop = peak * shape.dip_depth / decline;

    for (int i = 0; i < decline; ++i) {
        closes.push_back(round2(closes.back() - daily_drop));
    }
    for (int i = 0; i < kBounceSessions; ++i) {
        closes.push_back(round2(closes.back() + daily_drop * kBounceFactor));
    }
    return closes;
}
}

uint64_t SyntheticMarketData::seedFor(const std::string& symbol, const std::string& salt) {
    const std::string key = symbol + ":" + salt;
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(key.data()), key.size(), digest);

    uint64_t seed = 0;
    for (int i = 0; i < 8; ++i) {
        seed = (seed << 8) | digest[i];
    }
    return seed;
}

bool SyntheticMarketData::hasReversalProfile(const std::string& symbol) {
    return reversalShapes().count(utils::toUpper(symbol)) > 0;
}

FundamentalSnapshot SyntheticMarketData::fundamentals(const std::string& symbol) {
    const Profile& p = profileFor(symbol);

    FundamentalSnapshot snapshot;
    snapshot.symbol = symbol;
    snapshot.name = p.name ? std::string(p.name) : symbol + " (mock)";
    snapshot.cmp = p.cmp;
    snapshot.pe = p.pe;
    snapshot.roce = p.roce;
    snapshot.bv = p.bv;
    snapshot.debt = p.debt;
    snapshot.industry = std::string(p.industry);

    LOG_INFO("[{}] Using synthetic fundamentals: name={} cmp={:.2f} pe={:.2f}",
             symbol, *snapshot.name, *snapshot.cmp, *snapshot.pe);
    return snapshot;
}

std::vector<PriceBar> SyntheticMarketData::priceHistory(const std::string& symbol, int months,
                                                        const std::string& end_date) {
    const int count = std::max(months * 22, 60);
    const auto dates = utils::businessDaysEnding(end_date, count);
    if (dates.empty()) {
        LOG_WARN("[{}] Synthetic history: bad end date '{}'", symbol, end_date);
        return {};
    }

    std::mt19937_64 rng(seedFor(symbol, "prices"));
    const double start = profileFor(symbol).cmp * 0.92;

    std::vector<double> closes;
    auto shape = reversalShapes().find(utils::toUpper(symbol));
    if (shape != reversalShapes().end()) {
        closes = declineAndBounce(rng, start, count, shape->second);
    } else {
        closes = randomWalk(rng, start, count, 0.012, 0.0002);
    }

    std::vector<PriceBar> bars;
    bars.reserve(dates.size());
    for (size_t i = 0; i < dates.size() && i < closes.size(); ++i) {
        bars.emplace_back(dates[i], closes[i]);
    }

    LOG_INFO("[{}] Using synthetic price history: {} bars {} -> {} last_close={:.2f}",
             symbol, bars.size(), bars.front().date, bars.back().date, bars.back().close);
    return bars;
}

std::vector<PriceBar> SyntheticMarketData::priceHistory(const std::string& symbol, int months) {
    return priceHistory(symbol, months, utils::todayUtc());
}

} // namespace data
} // namespace revscan
