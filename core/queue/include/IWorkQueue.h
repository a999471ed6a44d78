#pragma once

#include "WorkItem.h"

#include <optional>
#include <string>

namespace ParaCopy {

/**
 * @brief The capability workers hold on the queue
 *
 * Workers never touch storage; they take items and report outcomes.
 * Implementations must be safe to call from several threads at once.
 */
class IWorkQueue {
public:
    virtual ~IWorkQueue() = default;

    /**
     * @brief Take the next pending item, marking it InProgress
     * @return std::nullopt once nothing is pending or in flight, or after close()
     */
    virtual std::optional<WorkItem> dequeue() = 0;

    /**
     * @brief Durably record a completed transfer
     * @throws Core::QueuePersistenceError if the record cannot be removed
     */
    virtual void markDone(const WorkItem& item) = 0;

    /**
     * @brief Durably record a failed attempt and return the item to Pending
     * @throws Core::QueuePersistenceError if the record cannot be updated
     */
    virtual void markFailed(const WorkItem& item, const std::string& cause) = 0;

    /**
     * @brief Stop handing out work; blocked dequeue() calls return std::nullopt
     */
    virtual void close() = 0;
};

} // namespace ParaCopy
