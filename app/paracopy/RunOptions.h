#pragma once

#include "Config.h"
#include "ITransferExecutor.h"
#include "Logger.h"
#include "Result.h"

#include <cstddef>
#include <string>
#include <unordered_map>

namespace ParaCopy {

/**
 * @brief Settings for one paracopy run
 *
 * Built from defaults, then a Config file, then the command line, each
 * layer overriding the previous one.
 */
struct RunOptions {
    std::string source;
    std::string target;
    std::size_t threads = 1;
    bool execute = false;           // false = dry run
    bool move = false;
    bool fast = false;              // size+mtime instead of content comparison
    std::string logLevel = "INFO";
    std::string logDir = ".";
    bool createTarget = false;
    std::string queueFile = "paracopy.queue";
    std::string executor = "rsync";
    std::string rsyncBinary = "rsync";
    int retriesPerRun = 0;
    int maxAttempts = 0;            // 0 = unbounded
    std::string summaryFile;
    std::string configFile;
    bool releaseQuarantined = false;
    bool showHelp = false;

    RunOptions();

    static RunOptions fromConfig(const Config& config);

    /**
     * @brief Apply command line arguments on top of base
     * @return INVALID_CONFIGURATION for unknown options, missing or malformed values
     */
    static Result<RunOptions> parseArguments(int argc, char* argv[], RunOptions base = {});

    /**
     * @brief Value of --config if present, else empty
     */
    static std::string configPathFromArguments(int argc, char* argv[]);

    /**
     * @brief Validators for every key fromConfig() reads
     */
    static std::unordered_map<std::string, Config::Validator> configSchema();

    static std::string usage(const std::string& program);

    /**
     * @brief Checks that need no filesystem access
     */
    VoidResult validate() const;

    TransferOptions transferOptions() const;
    LogLevel level() const;
};

} // namespace ParaCopy
