#include "RunOptions.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace ParaCopy {

namespace {

bool isNonNegativeInt(const std::string&, const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        std::stoi(value);
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

bool isPositiveInt(const std::string& key, const std::string& value) {
    return isNonNegativeInt(key, value) && std::stoi(value) > 0;
}

bool isBool(const std::string&, const std::string& value) {
    static const char* accepted[] = {"1", "0", "true", "false", "yes", "no", "on", "off"};
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const char* candidate : accepted) {
        if (lowered == candidate) {
            return true;
        }
    }
    return false;
}

bool isNotEmpty(const std::string&, const std::string& value) {
    return !value.empty();
}

int parseCount(const std::string& option, const std::string& value) {
    if (!isNonNegativeInt(option, value)) {
        throw std::invalid_argument(option + " expects a non-negative number, got '" + value + "'");
    }
    return std::stoi(value);
}

} // namespace

RunOptions::RunOptions() = default;

RunOptions RunOptions::fromConfig(const Config& config) {
    RunOptions options;
    options.source = config.get("source", options.source);
    options.target = config.get("target", options.target);
    options.threads = config.getSize("threads", options.threads);
    options.execute = config.getBool("execute", options.execute);
    options.move = config.getBool("move", options.move);
    options.fast = config.getBool("fast", options.fast);
    options.logLevel = config.get("log_level", options.logLevel);
    options.logDir = config.get("log_dir", options.logDir);
    options.createTarget = config.getBool("create_target", options.createTarget);
    options.queueFile = config.get("queue_file", options.queueFile);
    options.executor = config.get("executor", options.executor);
    options.rsyncBinary = config.get("rsync_binary", options.rsyncBinary);
    options.retriesPerRun = config.getInt("retries_per_run", options.retriesPerRun);
    options.maxAttempts = config.getInt("max_attempts", options.maxAttempts);
    options.summaryFile = config.get("summary_file", options.summaryFile);
    return options;
}

std::unordered_map<std::string, Config::Validator> RunOptions::configSchema() {
    return {
        {"source", isNotEmpty},
        {"target", isNotEmpty},
        {"threads", isPositiveInt},
        {"execute", isBool},
        {"move", isBool},
        {"fast", isBool},
        {"log_level", [](const std::string&, const std::string& value) {
            return Logger::parseLevel(value).has_value();
        }},
        {"log_dir", isNotEmpty},
        {"create_target", isBool},
        {"queue_file", isNotEmpty},
        {"executor", [](const std::string&, const std::string& value) {
            return value == "rsync" || value == "local";
        }},
        {"rsync_binary", isNotEmpty},
        {"retries_per_run", isNonNegativeInt},
        {"max_attempts", isNonNegativeInt},
    };
}

std::string RunOptions::configPathFromArguments(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            return argv[i + 1];
        }
    }
    return "";
}

Result<RunOptions> RunOptions::parseArguments(int argc, char* argv[], RunOptions base) {
    RunOptions options = std::move(base);

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            auto value = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw std::invalid_argument(arg + " expects a value");
                }
                return argv[++i];
            };

            if (arg == "--source" || arg == "-s") {
                options.source = value();
            }
            else if (arg == "--target" || arg == "-t") {
                options.target = value();
            }
            else if (arg == "--threads" || arg == "-n") {
                options.threads = static_cast<std::size_t>(parseCount(arg, value()));
            }
            else if (arg == "--execute" || arg == "-x") {
                options.execute = true;
            }
            else if (arg == "--move") {
                options.move = true;
            }
            else if (arg == "--fast") {
                options.fast = true;
            }
            else if (arg == "--log" || arg == "-l") {
                options.logLevel = value();
            }
            else if (arg == "--log-dir") {
                options.logDir = value();
            }
            else if (arg == "--create-target") {
                options.createTarget = true;
            }
            else if (arg == "--queue" || arg == "-q") {
                options.queueFile = value();
            }
            else if (arg == "--executor") {
                options.executor = value();
            }
            else if (arg == "--rsync") {
                options.rsyncBinary = value();
            }
            else if (arg == "--retries") {
                options.retriesPerRun = parseCount(arg, value());
            }
            else if (arg == "--max-attempts") {
                options.maxAttempts = parseCount(arg, value());
            }
            else if (arg == "--summary") {
                options.summaryFile = value();
            }
            else if (arg == "--config") {
                options.configFile = value();
            }
            else if (arg == "--release-quarantined") {
                options.releaseQuarantined = true;
            }
            else if (arg == "--help" || arg == "-h") {
                options.showHelp = true;
            }
            else {
                throw std::invalid_argument("unknown option " + arg);
            }
        }
    } catch (const std::invalid_argument& e) {
        return Err(Core::ErrorCode::INVALID_CONFIGURATION, e.what());
    }

    return options;
}

VoidResult RunOptions::validate() const {
    if (source.empty() || target.empty()) {
        return Err(Core::ErrorCode::INVALID_CONFIGURATION, "both --source and --target are required");
    }
    if (threads == 0) {
        return Err(Core::ErrorCode::INVALID_CONFIGURATION, "--threads must be at least 1");
    }
    if (executor != "rsync" && executor != "local") {
        return Err(Core::ErrorCode::INVALID_CONFIGURATION, "unknown executor '" + executor + "'");
    }
    if (!Logger::parseLevel(logLevel)) {
        return Err(Core::ErrorCode::INVALID_CONFIGURATION, "unknown log level '" + logLevel + "'");
    }
    if (queueFile.empty()) {
        return Err(Core::ErrorCode::INVALID_CONFIGURATION, "queue file path is empty");
    }
    if (retriesPerRun < 0 || maxAttempts < 0) {
        return Err(Core::ErrorCode::INVALID_CONFIGURATION, "retry limits must not be negative");
    }
    return Ok();
}

TransferOptions RunOptions::transferOptions() const {
    TransferOptions options;
    options.dryRun = !execute;
    options.move = move;
    options.compare = fast ? CompareMode::Fast : CompareMode::Checksum;
    return options;
}

LogLevel RunOptions::level() const {
    return Logger::parseLevel(logLevel).value_or(LogLevel::INFO);
}

std::string RunOptions::usage(const std::string& program) {
    std::ostringstream out;
    out << "ParaCopy - resumable parallel copy of a directory tree\n"
        << "\nUsage: " << program << " --source <DIR> --target <DIR> [OPTIONS]\n"
        << "\nOptions:\n"
        << "  -s, --source <DIR>         Source tree\n"
        << "  -t, --target <DIR>         Target tree (same final folder name as source)\n"
        << "  -n, --threads <N>          Concurrent transfers (default: 1)\n"
        << "  -x, --execute              Really copy (default is a dry run)\n"
        << "      --move                 Remove each source file once transferred\n"
        << "      --fast                 Compare size and time instead of content\n"
        << "  -l, --log <LEVEL>          DEBUG, INFO, WARN, ERROR or CRITICAL (default: INFO)\n"
        << "      --log-dir <DIR>        Directory for paracopy.log (default: .)\n"
        << "      --create-target        Create the target directory if missing\n"
        << "  -q, --queue <FILE>         Resume queue file (default: paracopy.queue)\n"
        << "      --executor <NAME>      rsync or local (default: rsync)\n"
        << "      --rsync <PATH>         rsync binary (default: rsync)\n"
        << "      --retries <N>          Extra attempts per item within a run (default: 0)\n"
        << "      --max-attempts <N>     Quarantine items after N failed attempts (0 = never)\n"
        << "      --release-quarantined  Return quarantined items to the queue\n"
        << "      --summary <FILE>       Write a JSON run summary\n"
        << "      --config <FILE>        key=value configuration file\n"
        << "  -h, --help                 Show this help message\n";
    return out.str();
}

} // namespace ParaCopy
