#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "core/state/ScanStoreJson.h"
#include "data/MarketDataService.h"
#include "engine/ScanEngine.h"
#include "engine/ScanReporter.h"
#include "network/CurlHttpClient.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace revscan;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitBusy = 2;

void printUsage() {
    std::cerr <<
        "Usage: revscan [--config PATH] <command>\n"
        "\n"
        "Commands:\n"
        "  reload                          load symbols file into the store\n"
        "  scan                            run a full scan and print its summary\n"
        "  status <scan_id>                scan status, counts and progress\n"
        "  active                          whether a scan is running\n"
        "  latest [--all]                  latest scan recommendations (--all: every symbol)\n"
        "  details <SYMBOL> [scan_id]      indicators, signals and chart series\n"
        "  logs [scan_id]                  skip/ignore/error log of a scan\n"
        "  delete-symbol <scan_id> <SYM>   remove one symbol's rows from a scan\n"
        "  clear --confirm                 wipe the store and reload symbols\n";
}

void printJson(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

ScanId parseScanId(const std::string& text) {
    size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid scan id: " + text);
    }
    if (consumed != text.size() || value <= 0) {
        throw std::invalid_argument("invalid scan id: " + text);
    }
    return value;
}

std::string resolvePath(const std::string& path) {
    return utils::PathUtils::resolveRelativePath(path).string();
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/config.json";
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return kExitOk;
        }
        args.push_back(arg);
    }

    if (args.empty()) {
        printUsage();
        return kExitError;
    }
    const std::string command = args[0];

    try {
        auto& config = Config::getInstance();
        config.load(config_path);
        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

        const auto storage = config.getStorageConfig();
        const std::string symbols_file = resolvePath(storage.symbols_file);

        auto store = std::make_shared<core::ScanStoreJson>(resolvePath(storage.store_path));
        auto http = std::make_shared<network::CurlHttpClient>();
        auto source = std::make_shared<data::MarketDataService>(http, config.getSourceConfig());

        engine::ScanEngine engine(store, source, config.getScanConfig());
        engine::ScanReporter reporter(store, engine);

        if (command == "reload") {
            const auto result = engine.reloadSymbols(symbols_file);
            printJson({{"added", result.added}, {"total", result.total}});

        } else if (command == "scan") {
            const auto scan_id = engine.runScan();
            if (!scan_id) {
                printJson({{"error", "A scan is already running"}});
                return kExitBusy;
            }
            printJson(reporter.scanSummary(*scan_id));

        } else if (command == "status" && args.size() >= 2) {
            printJson(reporter.scanSummary(parseScanId(args[1])));

        } else if (command == "active") {
            printJson(reporter.activeScan());

        } else if (command == "latest") {
            const bool all = args.size() >= 2 && args[1] == "--all";
            printJson(reporter.latestRecommendations(!all));

        } else if (command == "details" && args.size() >= 2) {
            std::optional<ScanId> scan_id;
            if (args.size() >= 3) {
                scan_id = parseScanId(args[2]);
            }
            printJson(reporter.symbolDetails(args[1], scan_id));

        } else if (command == "logs") {
            std::optional<ScanId> scan_id;
            if (args.size() >= 2) {
                scan_id = parseScanId(args[1]);
            }
            printJson(reporter.scanLogs(scan_id));

        } else if (command == "delete-symbol" && args.size() >= 3) {
            const ScanId scan_id = parseScanId(args[1]);
            const auto deleted = engine.deleteSymbolFromScan(scan_id, args[2]);
            printJson({
                {"scan_id", scan_id},
                {"symbol", args[2]},
                {"deleted", {
                    {"fundamentals", deleted.fundamentals},
                    {"technicals", deleted.technicals},
                    {"recommendations", deleted.recommendations},
                    {"logs", deleted.logs},
                }},
            });

        } else if (command == "clear") {
            if (args.size() < 2 || args[1] != "--confirm") {
                std::cerr << "Refusing to clear without --confirm" << std::endl;
                return kExitError;
            }
            const auto result = engine.clearAll(symbols_file);
            nlohmann::json out = {
                {"status", "cleared"},
                {"deleted", {
                    {"fundamentals", result.deleted.fundamentals},
                    {"technicals", result.deleted.technicals},
                    {"recommendations", result.deleted.recommendations},
                    {"logs", result.deleted.logs},
                    {"scans", result.deleted.scans},
                    {"symbols", result.deleted.symbols},
                }},
            };
            if (result.reloaded) {
                out["symbols_reloaded"] = {{"added", result.reloaded->added}, {"total", result.reloaded->total}};
            } else {
                out["symbols_reloaded"] = nullptr;
            }
            printJson(out);

        } else {
            printUsage();
            return kExitError;
        }

    } catch (const core::NotFoundError& e) {
        printJson({{"error", e.what()}});
        return kExitError;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitError;
    }

    return kExitOk;
}
