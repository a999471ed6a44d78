#include "Orchestrator.h"
#include "LocalCopyExecutor.h"
#include "LoggerMacros.h"
#include "PathEnumerator.h"
#include "PathUtils.h"
#include "QueueStore.h"
#include "RsyncExecutor.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace ParaCopy {

namespace fs = std::filesystem;

namespace {

const char* COMPONENT = "Orchestrator";

std::string banner(const std::string& label) {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream out;
    out << " ======================================== " << std::setw(6) << label << ": "
        << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

} // namespace

std::string toString(RunState state) {
    switch (state) {
        case RunState::Idle: return "Idle";
        case RunState::Validating: return "Validating";
        case RunState::Building: return "Building";
        case RunState::Dispatching: return "Dispatching";
        case RunState::Drained: return "Drained";
        case RunState::Failed: return "Failed";
        default: return "Unknown";
    }
}

Orchestrator::Orchestrator(RunOptions options, ExecutorFactory factory)
    : options_(std::move(options)), factory_(std::move(factory)) {
    if (!factory_) {
        factory_ = defaultFactory(options_);
    }
}

std::string Orchestrator::queuePathFor(const RunOptions& options) {
    return options.execute ? options.queueFile : options.queueFile + ".dryrun";
}

Orchestrator::ExecutorFactory Orchestrator::defaultFactory(const RunOptions& options) {
    if (options.executor == "local") {
        return [](const fs::path& source, const fs::path& target) -> std::unique_ptr<ITransferExecutor> {
            return std::make_unique<LocalCopyExecutor>(source, target);
        };
    }
    std::string binary = options.rsyncBinary;
    return [binary](const fs::path& source, const fs::path& target) -> std::unique_ptr<ITransferExecutor> {
        return std::make_unique<RsyncExecutor>(source, target, binary);
    };
}

Result<RunSummary> Orchestrator::run() {
    auto& logger = Logger::instance();
    logger.info(banner("start"), COMPONENT);

    RunSummary summary;
    summary.started = std::chrono::system_clock::now();

    setState(RunState::Validating);
    auto valid = options_.validate();
    if (!valid) {
        return fail(valid.error());
    }
    auto roots = validateRoots();
    if (!roots) {
        return fail(roots.error());
    }

    const fs::path source(options_.source);
    const fs::path target(options_.target);
    summary.source = options_.source;
    summary.target = options_.target;
    summary.queueFile = queuePathFor(options_);
    summary.executor = options_.executor;
    summary.dryRun = !options_.execute;

    logger.info("Source = " + summary.source, COMPONENT);
    logger.info("Target = " + summary.target, COMPONENT);
    logger.info("Threads = " + std::to_string(options_.threads), COMPONENT);
    if (summary.dryRun) {
        logger.info("Dry run: nothing on the target will be modified", COMPONENT);
    }

    QueueStoreOptions storeOptions;
    storeOptions.retriesPerRun = options_.retriesPerRun;
    storeOptions.maxAttempts = options_.maxAttempts;

    std::unique_ptr<QueueStore> store;
    try {
        store = std::make_unique<QueueStore>(summary.queueFile, storeOptions);
        if (options_.releaseQuarantined) {
            store->releaseQuarantined();
        }

        if (store->load().empty()) {
            setState(RunState::Building);
            SCOPED_TIMER_COMP("Queue build", COMPONENT);

            EnumeratorOptions enumeratorOptions;
            enumeratorOptions.excludePatterns = EnumeratorOptions::defaultExcludePatterns();
            PathEnumerator enumerator(source, enumeratorOptions);
            store->initialize(enumerator);
            if (enumerator.skippedCount() > 0) {
                logger.warn(std::to_string(enumerator.skippedCount()) + " special file(s) not queued", COMPONENT);
            }
            logger.info(banner("listed"), COMPONENT);
        } else {
            summary.resumed = true;
        }
        summary.queued = store->pendingCount();
    } catch (const Core::ParaCopyError& e) {
        return fail(e.info());
    }

    auto executor = factory_(source, target);
    Dispatcher dispatcher(*store, *executor, options_.transferOptions(), options_.threads);

    bool startDispatch = false;
    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        if (!stopRequested_) {
            activeDispatcher_ = &dispatcher;
            startDispatch = true;
        }
    }

    setState(RunState::Dispatching);
    if (startDispatch) {
        try {
            summary.dispatch = dispatcher.run();
        } catch (const Core::QueuePersistenceError& e) {
            std::lock_guard<std::mutex> lock(stopMutex_);
            activeDispatcher_ = nullptr;
            return fail(e.info());
        }
        std::lock_guard<std::mutex> lock(stopMutex_);
        activeDispatcher_ = nullptr;
    } else {
        logger.warn("Stop requested before dispatch; nothing was transferred", COMPONENT);
        summary.dispatch.interrupted = true;
    }

    try {
        summary.remaining = store->records();
    } catch (const Core::QueuePersistenceError& e) {
        return fail(e.info());
    }
    for (const auto& item : summary.remaining) {
        if (item.quarantined) {
            ++summary.dispatch.quarantined;
        } else {
            ++summary.dispatch.pending;
        }
    }
    summary.finished = std::chrono::system_clock::now();

    // A stop that arrives after the last item drained changes nothing
    if (!summary.remaining.empty()) {
        summary.status = summary.dispatch.interrupted ? Core::ErrorCode::INTERRUPTED
                                                      : Core::ErrorCode::ITEMS_REMAINING;
    }

    setState(RunState::Drained);

    logger.info("Transferred " + std::to_string(summary.dispatch.succeeded) + " item(s) (" +
                std::to_string(summary.dispatch.unchanged) + " unchanged), " +
                std::to_string(summary.dispatch.failed) + " failed attempt(s) in " +
                std::to_string(summary.dispatch.elapsed.count()) + "ms", COMPONENT);
    if (!summary.remaining.empty()) {
        logger.warn(std::to_string(summary.dispatch.pending) + " item(s) pending, " +
                    std::to_string(summary.dispatch.quarantined) + " quarantined in " + summary.queueFile,
                    COMPONENT);
    }
    logger.info(banner("end"), COMPONENT);
    return summary;
}

void Orchestrator::requestStop() {
    std::lock_guard<std::mutex> lock(stopMutex_);
    stopRequested_ = true;
    if (activeDispatcher_ != nullptr) {
        activeDispatcher_->requestStop();
    }
}

VoidResult Orchestrator::validateRoots() {
    auto& logger = Logger::instance();
    const fs::path source(options_.source);
    const fs::path target(options_.target);

    std::error_code ec;
    if (!fs::is_directory(source, ec)) {
        return Err(Core::ErrorCode::SOURCE_PATH_DOES_NOT_EXIST, options_.source);
    }

    if (!fs::exists(target, ec)) {
        if (!options_.createTarget) {
            return Err(Core::ErrorCode::TARGET_PATH_DOES_NOT_EXIST, options_.target);
        }
        if (options_.execute) {
            fs::create_directories(target, ec);
            if (ec) {
                return Err(Core::ErrorCode::TARGET_PATH_DOES_NOT_EXIST,
                           options_.target + " could not be created: " + ec.message());
            }
            logger.info("Created target " + options_.target, COMPONENT);
        } else {
            logger.info("Dry run: target " + options_.target + " would be created", COMPONENT);
        }
    } else if (!fs::is_directory(target, ec)) {
        return Err(Core::ErrorCode::TARGET_PATH_DOES_NOT_EXIST, options_.target + " is not a directory");
    }

    if (PathUtils::leafName(source) != PathUtils::leafName(target)) {
        return Err(Core::ErrorCode::SOURCE_TARGET_MISMATCH,
                   "source '" + options_.source + "', target '" + options_.target + "'");
    }
    std::error_code sourceEc;
    std::error_code targetEc;
    auto resolvedSource = fs::weakly_canonical(source, sourceEc);
    auto resolvedTarget = fs::weakly_canonical(target, targetEc);
    if (!sourceEc && !targetEc && resolvedSource == resolvedTarget) {
        return Err(Core::ErrorCode::INVALID_CONFIGURATION, "source and target are the same directory");
    }
    return Ok();
}

Core::ErrorInfo Orchestrator::fail(Core::ErrorInfo error) {
    setState(RunState::Failed);
    auto& logger = Logger::instance();
    logger.error(error.toString(), COMPONENT);
    logger.info(banner("end"), COMPONENT);
    return error;
}

void Orchestrator::setState(RunState state) {
    RunState previous = state_.exchange(state);
    LOG_DEBUG_COMP_IF("State " + toString(previous) + " -> " + toString(state), COMPONENT);
}

} // namespace ParaCopy
