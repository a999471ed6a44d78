#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include "Config.h"
#include "ErrorCodes.h"
#include "Logger.h"
#include "Orchestrator.h"
#include "PathUtils.h"
#include "RunOptions.h"
#include "RunReport.h"
#include "SignalWatcher.h"

using namespace ParaCopy;

namespace {
    int reportError(const Core::ErrorInfo& error) {
        std::cerr << "Error: " << error.toString() << std::endl;
        if (error.code == Core::ErrorCode::TARGET_PATH_DOES_NOT_EXIST) {
            std::cerr << "Create it first or pass --create-target." << std::endl;
        }
        return Core::ErrorRegistry::exitStatus(error.code);
    }
}

int main(int argc, char* argv[]) {
    // --- Configuration: defaults < config file < command line ---
    Config fileConfig;
    std::string configPath = RunOptions::configPathFromArguments(argc, argv);
    if (!configPath.empty()) {
        if (!fileConfig.loadFromFile(configPath)) {
            return reportError(Err(Core::ErrorCode::INVALID_CONFIGURATION, "cannot read " + configPath));
        }
    } else {
        // Optional; missing default files are not an error
        auto defaults = PathUtils::getDefaultConfigPaths();
        if (fileConfig.loadLayered(defaults)) {
            for (const auto& path : defaults) {
                std::error_code ec;
                if (std::filesystem::is_regular_file(path, ec)) {
                    configPath += (configPath.empty() ? "" : ", ") + path;
                }
            }
        }
    }

    auto rejected = fileConfig.validate(RunOptions::configSchema());
    if (!rejected.empty()) {
        std::string keys;
        for (const auto& key : rejected) {
            keys += (keys.empty() ? "" : ", ") + key;
        }
        return reportError(Err(Core::ErrorCode::INVALID_CONFIGURATION, "bad value for " + keys));
    }

    auto parsed = RunOptions::parseArguments(argc, argv, RunOptions::fromConfig(fileConfig));
    if (!parsed) {
        std::cerr << "Run '" << argv[0] << " --help' for usage." << std::endl;
        return reportError(parsed.error());
    }
    RunOptions options = parsed.value();

    if (options.showHelp) {
        std::cout << RunOptions::usage(argv[0]);
        return 0;
    }

    auto valid = options.validate();
    if (!valid) {
        std::cerr << "Run '" << argv[0] << " --help' for usage." << std::endl;
        return reportError(valid.error());
    }

    // --- Logging ---
    auto& logger = Logger::instance();
    try {
        PathUtils::ensureDirectory(options.logDir);
    } catch (const std::runtime_error& e) {
        return reportError(Err(Core::ErrorCode::INVALID_CONFIGURATION, e.what()));
    }
    logger.setLogFile((std::filesystem::path(options.logDir) / "paracopy.log").string());
    logger.setLevel(options.level());
    logger.setMaxFileSize(100); // 100MB max log file size
    logger.setComponent("ParaCopy");

    logger.info("=== ParaCopy Starting ===", "ParaCopy");
    if (!configPath.empty()) {
        logger.info("Configuration loaded from " + configPath, "ParaCopy");
    }

    // --- Run ---
    Orchestrator orchestrator(options);

    Result<RunSummary> result = Err(Core::ErrorCode::INTERNAL_ERROR, "run did not complete");
    {
        SignalWatcher watcher([&](int signal) {
            logger.warn("Received signal " + std::to_string(signal) +
                        ", stopping after in-flight transfers", "ParaCopy");
            orchestrator.requestStop();
        });
        try {
            result = orchestrator.run();
        } catch (const std::exception& e) {
            return reportError(Err(Core::ErrorCode::INTERNAL_ERROR, e.what()));
        }
    }

    if (!result) {
        return reportError(result.error());
    }

    const RunSummary& summary = result.value();
    if (!options.summaryFile.empty() && !RunReport::write(summary, options.summaryFile)) {
        std::cerr << "Warning: run summary was not written to " << options.summaryFile << std::endl;
    }

    int status = Core::ErrorRegistry::exitStatus(summary.status);
    logger.info("=== ParaCopy finished: " + Core::ErrorInfo::getErrorCodeString(summary.status) +
                " (exit " + std::to_string(status) + ") ===", "ParaCopy");
    return status;
}
