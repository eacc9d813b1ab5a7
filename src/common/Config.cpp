#include "common/Config.h"
#include "common/PathUtils.h"
#include "common/StringUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace revscan {

namespace {
std::string normalizeLevel(const std::string& raw) {
    const std::string level = utils::trim(utils::toLower(raw));

    // spdlog spells it "warning"
    if (level == "warning") {
        return "warn";
    }
    return level;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? utils::trim(value) : "";
}

constexpr int kMaxRetries = 10;

int atLeast(int value, int floor) {
    return value < floor ? floor : value;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    try {
        const auto config_path = utils::PathUtils::resolveRelativePath(path);

        std::cerr << "Config path: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cerr << "Warning: config file not found: " << config_path << std::endl;
            std::cerr << "Using defaults." << std::endl;
        } else {
            std::ifstream file(config_path);
            if (!file.is_open()) {
                std::cerr << "Warning: cannot open config file, using defaults." << std::endl;
            } else {
                nlohmann::json j;
                file >> j;

                // Sections are parsed into copies and committed together, so
                // a bad value anywhere leaves every setting untouched
                engine::ScanConfig scan = scan_config_;
                data::SourceConfig sources = source_config_;
                engine::StorageConfig storage = storage_config_;
                std::string level = log_level_;
                std::string log_dir = log_dir_;

                if (j.contains("scanner")) {
                    const auto& s = j.at("scanner");
                    scan.concurrency_limit = atLeast(s.value("concurrency_limit", scan.concurrency_limit), 1);
                    scan.history_months = atLeast(s.value("history_months", scan.history_months), 1);
                    scan.lookback = atLeast(s.value("lookback", scan.lookback), 1);
                    scan.min_bars = atLeast(s.value("min_bars", scan.min_bars), 1);
                    scan.progress_grace_seconds = atLeast(s.value("progress_grace_seconds", scan.progress_grace_seconds), 0);
                    scan.error_summary_limit = atLeast(s.value("error_summary_limit", scan.error_summary_limit), 1);
                }

                if (j.contains("sources")) {
                    const auto& s = j.at("sources");
                    sources.primary_base_url = s.value("primary_base_url", sources.primary_base_url);
                    sources.secondary_base_url = s.value("secondary_base_url", sources.secondary_base_url);
                    if (s.contains("exchange_suffixes")) {
                        sources.exchange_suffixes = s.at("exchange_suffixes").get<std::vector<std::string>>();
                    }
                    if (s.contains("secondary_suffixes")) {
                        sources.secondary_suffixes = s.at("secondary_suffixes").get<std::vector<std::string>>();
                    }
                    sources.retries = std::min(atLeast(s.value("retries", sources.retries), 1), kMaxRetries);
                    sources.backoff_ms = atLeast(s.value("backoff_ms", sources.backoff_ms), 0);
                    sources.request_timeout_seconds = atLeast(s.value("request_timeout_seconds", sources.request_timeout_seconds), 1);
                    sources.probe_timeout_seconds = atLeast(s.value("probe_timeout_seconds", sources.probe_timeout_seconds), 1);
                    sources.fundamentals_throttle_ms = atLeast(s.value("fundamentals_throttle_ms", sources.fundamentals_throttle_ms), 0);
                    sources.history_throttle_ms = atLeast(s.value("history_throttle_ms", sources.history_throttle_ms), 0);
                    sources.primary_min_bars = s.value("primary_min_bars", sources.primary_min_bars);
                    sources.secondary_min_rows = s.value("secondary_min_rows", sources.secondary_min_rows);
                    sources.secondary_workers = atLeast(s.value("secondary_workers", sources.secondary_workers), 1);
                    sources.force_offline = s.value("force_offline", sources.force_offline);
                }

                if (j.contains("storage")) {
                    const auto& s = j.at("storage");
                    storage.store_path = s.value("store_path", storage.store_path);
                    storage.symbols_file = s.value("symbols_file", storage.symbols_file);
                }

                if (j.contains("logging")) {
                    const auto& l = j.at("logging");
                    level = normalizeLevel(l.value("level", level));
                    log_dir = l.value("log_dir", log_dir);
                }

                scan_config_ = std::move(scan);
                source_config_ = std::move(sources);
                storage_config_ = std::move(storage);
                log_level_ = std::move(level);
                log_dir_ = std::move(log_dir);

                std::cerr << "Config loaded" << std::endl;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    }

    const std::string offline = readEnvVar("REVSCAN_OFFLINE");
    if (offline == "1" || offline == "true") {
        source_config_.force_offline = true;
        std::cerr << "REVSCAN_OFFLINE set: network sources disabled" << std::endl;
    }

    std::cerr << "Scanner: concurrency=" << scan_config_.concurrency_limit
              << ", months=" << scan_config_.history_months
              << ", offline=" << (source_config_.force_offline ? "yes" : "no") << std::endl;
}

} // namespace revscan
