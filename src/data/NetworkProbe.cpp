#include "data/NetworkProbe.h"
#include "common/Logger.h"
#include <stdexcept>

namespace revscan {
namespace data {

NetworkProbe::NetworkProbe(std::shared_ptr<network::IHttpClient> http, SourceConfig config)
    : http_(std::move(http))
    , config_(std::move(config)) {}

bool NetworkProbe::isAvailable() {
    std::call_once(once_, [this] {
        probe();
        probed_.store(true);
    });
    return available_;
}

void NetworkProbe::probe() {
    if (config_.force_offline) {
        LOG_INFO("Network probe skipped: offline mode forced, using synthetic data");
        available_ = false;
        return;
    }
    if (!http_) {
        available_ = false;
        return;
    }

    const std::string url = config_.primary_base_url + "/";
    try {
        LOG_INFO("Checking network connectivity ({}s timeout)", config_.probe_timeout_seconds);
        auto response = http_->get(url, config_.probe_timeout_seconds, network::defaultBrowserHeaders());
        available_ = response.isOk();
        LOG_INFO("Network check: {} (HTTP {})", available_ ? "OK" : "FAIL", response.status_code);
    } catch (const std::exception& e) {
        available_ = false;
        LOG_WARN("Network check failed ({}), using synthetic data", e.what());
    }
}

} // namespace data
} // namespace revscan
