#include "Dispatcher.h"
#include "ErrorCodes.h"
#include "LoggerMacros.h"
#include "ThreadPool.h"

#include <exception>
#include <future>
#include <stdexcept>
#include <vector>

namespace ParaCopy {

namespace {

const char* COMPONENT = "Dispatcher";

// INFO progress line every this many finished attempts
constexpr std::size_t PROGRESS_INTERVAL = 1000;

} // namespace

Dispatcher::Dispatcher(IWorkQueue& queue, ITransferExecutor& executor, TransferOptions options,
                       std::size_t threadCount)
    : queue_(queue), executor_(executor), options_(options), threadCount_(threadCount) {
    if (threadCount_ == 0) {
        throw std::invalid_argument("Dispatcher needs at least one worker");
    }
}

DispatchSummary Dispatcher::run() {
    auto& logger = Logger::instance();
    logger.info("Dispatching with " + std::to_string(threadCount_) + " worker(s) via " +
                executor_.name() + (options_.dryRun ? " (dry run)" : ""), COMPONENT);

    const auto start = std::chrono::steady_clock::now();
    std::exception_ptr firstError;
    {
        ThreadPool pool(threadCount_);
        std::vector<std::future<void>> workers;
        workers.reserve(threadCount_);
        for (std::size_t i = 0; i < threadCount_; ++i) {
            workers.push_back(pool.enqueue([this, i]() { workerLoop(i); }));
        }

        // Collect every worker before rethrowing so none outlives run()
        for (auto& worker : workers) {
            try {
                worker.get();
            } catch (const std::exception& e) {
                logger.critical(std::string("Worker stopped: ") + e.what(), COMPONENT);
                if (!firstError) {
                    firstError = std::current_exception();
                }
            }
        }
    }

    DispatchSummary summary;
    summary.succeeded = succeeded_.load();
    summary.unchanged = unchanged_.load();
    summary.failed = failed_.load();
    summary.interrupted = stopRequested_.load();
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (firstError) {
        std::rethrow_exception(firstError);
    }
    return summary;
}

void Dispatcher::requestStop() {
    if (!stopRequested_.exchange(true)) {
        Logger::instance().warn("Stop requested; finishing in-flight transfers", COMPONENT);
    }
    queue_.close();
}

void Dispatcher::workerLoop(std::size_t workerId) {
    const std::string worker = "worker " + std::to_string(workerId);
    try {
        while (auto item = queue_.dequeue()) {
            LOG_DEBUG_COMP_IF(worker + " took " + item->relativePath, COMPONENT);

            TransferOutcome outcome;
            try {
                outcome = executor_.transfer(*item, options_);
            } catch (const std::exception& e) {
                outcome = TransferOutcome::failed(std::string("executor threw: ") + e.what());
            }

            if (outcome.ok()) {
                queue_.markDone(*item);
                ++succeeded_;
                if (!outcome.changed) {
                    ++unchanged_;
                }
            } else {
                LOG_ERROR_COMP(Core::ErrorInfo(Core::ErrorCode::TRANSFER_FAILED,
                                               item->relativePath, outcome.cause).toString(), COMPONENT);
                queue_.markFailed(*item, outcome.cause);
                ++failed_;
            }
            recordCompletion();
        }
    } catch (const std::exception&) {
        // Typically Core::QueuePersistenceError: no worker may continue
        queue_.close();
        throw;
    }
    LOG_DEBUG_COMP_IF(worker + " finished", COMPONENT);
}

void Dispatcher::recordCompletion() {
    std::size_t done = ++completed_;
    if (done % PROGRESS_INTERVAL == 0) {
        LOG_INFO_COMP_IF("Progress: " + std::to_string(done) + " attempt(s), " +
                         std::to_string(succeeded_.load()) + " succeeded, " +
                         std::to_string(failed_.load()) + " failed", COMPONENT);
    }
}

} // namespace ParaCopy
