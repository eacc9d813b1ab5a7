#include "common/Types.h"

namespace revscan {

std::string toString(ScanStatus status) {
    switch (status) {
        case ScanStatus::RUNNING: return "running";
        case ScanStatus::COMPLETED: return "completed";
        case ScanStatus::FAILED: return "failed";
    }
    return "running";
}

ScanStatus scanStatusFromString(const std::string& value) {
    if (value == "completed") return ScanStatus::COMPLETED;
    if (value == "failed") return ScanStatus::FAILED;
    return ScanStatus::RUNNING;
}

std::string toString(ScanLogStatus status) {
    switch (status) {
        case ScanLogStatus::SKIPPED: return "skipped";
        case ScanLogStatus::IGNORED: return "ignored";
        case ScanLogStatus::ERROR: return "error";
    }
    return "error";
}

ScanLogStatus scanLogStatusFromString(const std::string& value) {
    if (value == "skipped") return ScanLogStatus::SKIPPED;
    if (value == "ignored") return ScanLogStatus::IGNORED;
    return ScanLogStatus::ERROR;
}

std::vector<double> extractCloses(const std::vector<PriceBar>& bars) {
    std::vector<double> closes;
    closes.reserve(bars.size());
    for (const auto& bar : bars) {
        closes.push_back(bar.close);
    }
    return closes;
}

} // namespace revscan
