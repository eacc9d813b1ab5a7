#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/ScanConfig.h"
#include "data/SourceConfig.h"

namespace revscan {

class Config {
public:
    static Config& getInstance();
    void load(const std::string& config_path);

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }

    engine::ScanConfig getScanConfig() const { return scan_config_; }
    data::SourceConfig getSourceConfig() const { return source_config_; }
    engine::StorageConfig getStorageConfig() const { return storage_config_; }

    void setForceOffline(bool v) { source_config_.force_offline = v; }

private:
    Config() = default;

    std::string log_level_ = "info";
    std::string log_dir_ = "logs";

    engine::ScanConfig scan_config_;
    data::SourceConfig source_config_;
    engine::StorageConfig storage_config_;
};

} // namespace revscan
