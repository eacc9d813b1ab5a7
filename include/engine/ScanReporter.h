#pragma once

#include "core/contracts/IScanStore.h"
#include "engine/ScanEngine.h"
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace revscan {
namespace engine {

// Read-side views over the store, rendered as JSON documents.
// Unknown scans and symbols throw core::NotFoundError.
class ScanReporter {
public:
    ScanReporter(std::shared_ptr<const core::IScanStore> store, const ScanEngine& engine);

    nlohmann::json scanSummary(ScanId scan_id) const;

    // Latest scan only. only_recommended=false adds the indicator readings
    // and the recommended flag for every scanned symbol.
    nlohmann::json latestRecommendations(bool only_recommended) const;

    // Defaults to the latest scan
    nlohmann::json symbolDetails(const std::string& symbol, std::optional<ScanId> scan_id = std::nullopt) const;

    nlohmann::json scanLogs(std::optional<ScanId> scan_id = std::nullopt) const;

    nlohmann::json activeScan() const;

private:
    std::shared_ptr<const core::IScanStore> store_;
    const ScanEngine& engine_;
};

} // namespace engine
} // namespace revscan
