#pragma once

#include "ITransferExecutor.h"
#include "IWorkQueue.h"

#include <atomic>
#include <chrono>
#include <cstddef>

namespace ParaCopy {

struct DispatchSummary {
    std::size_t succeeded{0};
    std::size_t unchanged{0};       // succeeded without modifying the target
    std::size_t failed{0};          // failed attempts, not distinct items
    std::size_t pending{0};         // filled in by the owner of the queue
    std::size_t quarantined{0};     // filled in by the owner of the queue
    std::chrono::milliseconds elapsed{0};
    bool interrupted{false};
};

/**
 * @brief Bounded pool of workers draining an IWorkQueue
 *
 * Each worker loops dequeue -> transfer -> markDone / markFailed until the
 * queue has nothing left to hand out. Items are handed out first-come; there
 * is no ordering guarantee between workers.
 */
class Dispatcher {
public:
    Dispatcher(IWorkQueue& queue, ITransferExecutor& executor, TransferOptions options,
               std::size_t threadCount);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /**
     * @brief Run all workers to completion (blocking)
     *
     * @throws Core::QueuePersistenceError if any worker could not record an
     *         outcome; the queue is closed, the other workers finish their
     *         current item, and the error is rethrown once all have stopped
     */
    DispatchSummary run();

    /**
     * @brief Stop handing out work; in-flight transfers finish normally
     *
     * Safe to call from any thread while run() is active.
     */
    void requestStop();

    bool stopRequested() const { return stopRequested_.load(); }

private:
    void workerLoop(std::size_t workerId);
    void recordCompletion();

    IWorkQueue& queue_;
    ITransferExecutor& executor_;
    TransferOptions options_;
    std::size_t threadCount_;

    std::atomic<bool> stopRequested_{false};
    std::atomic<std::size_t> succeeded_{0};
    std::atomic<std::size_t> unchanged_{0};
    std::atomic<std::size_t> failed_{0};
    std::atomic<std::size_t> completed_{0};
};

} // namespace ParaCopy
