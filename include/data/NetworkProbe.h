#pragma once

#include "data/SourceConfig.h"
#include "network/IHttpClient.h"
#include <atomic>
#include <memory>
#include <mutex>

namespace revscan {
namespace data {

// One short request to the primary homepage, made on first use. The answer
// is kept for the lifetime of the object (one instance per process).
class NetworkProbe {
public:
    NetworkProbe(std::shared_ptr<network::IHttpClient> http, SourceConfig config);

    bool isAvailable();

    // Safe to poll from any thread; true once the answer is known
    bool hasProbed() const { return probed_.load(); }

private:
    void probe();

    std::shared_ptr<network::IHttpClient> http_;
    SourceConfig config_;
    std::once_flag once_;
    bool available_ = false;
    std::atomic<bool> probed_{false};
};

} // namespace data
} // namespace revscan
