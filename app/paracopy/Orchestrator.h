#pragma once

#include "Dispatcher.h"
#include "ITransferExecutor.h"
#include "Result.h"
#include "RunOptions.h"
#include "WorkItem.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ParaCopy {

enum class RunState {
    Idle,
    Validating,
    Building,
    Dispatching,
    Drained,
    Failed
};

std::string toString(RunState state);

/**
 * @brief Outcome of a run that reached the dispatch phase
 */
struct RunSummary {
    std::string source;
    std::string target;
    std::string queueFile;
    std::string executor;
    bool dryRun{true};
    bool resumed{false};            // work came from an existing queue file
    std::size_t queued{0};          // dispatchable items when dispatch began
    DispatchSummary dispatch;
    std::vector<WorkItem> remaining;    // durable records left after the run
    std::chrono::system_clock::time_point started;
    std::chrono::system_clock::time_point finished;

    // SUCCESS, ITEMS_REMAINING or INTERRUPTED
    Core::ErrorCode status{Core::ErrorCode::SUCCESS};
};

/**
 * @brief Drives one run: validate, load or build the queue, dispatch
 *
 * Fatal conditions (invalid configuration, missing roots, enumeration or
 * persistence failure) come back as an error and leave the state Failed.
 * Everything else ends Drained with a RunSummary, including runs that left
 * items pending.
 */
class Orchestrator {
public:
    using ExecutorFactory = std::function<std::unique_ptr<ITransferExecutor>(
        const std::filesystem::path& source, const std::filesystem::path& target)>;

    explicit Orchestrator(RunOptions options, ExecutorFactory factory = nullptr);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    Result<RunSummary> run();

    /**
     * @brief Graceful stop from any thread (signal watcher)
     *
     * Before dispatch starts the run ends without dispatching; during
     * dispatch no new items are handed out.
     */
    void requestStop();

    RunState state() const { return state_.load(); }

    /**
     * @brief Queue file a run with these options works on
     *
     * Dry runs use "<queue>.dryrun" so simulated completions never remove
     * work from the real queue.
     */
    static std::string queuePathFor(const RunOptions& options);

    static ExecutorFactory defaultFactory(const RunOptions& options);

private:
    VoidResult validateRoots();
    Core::ErrorInfo fail(Core::ErrorInfo error);
    void setState(RunState state);

    RunOptions options_;
    ExecutorFactory factory_;
    std::atomic<RunState> state_{RunState::Idle};

    std::mutex stopMutex_;
    bool stopRequested_{false};
    Dispatcher* activeDispatcher_{nullptr};
};

} // namespace ParaCopy
