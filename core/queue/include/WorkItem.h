#pragma once

#include <string>
#include <utility>

namespace ParaCopy {

enum class WorkStatus {
    Pending,
    InProgress,
    Done,
    Failed
};

std::string toString(WorkStatus status);

/**
 * @brief One file transfer job
 *
 * relativePath is the join key between the source and target trees and is
 * unique within a queue. Only Pending records are ever durable; the other
 * states live in memory for the duration of a run.
 */
struct WorkItem {
    std::string relativePath;
    WorkStatus status{WorkStatus::Pending};
    int attempts{0};        // failed attempts recorded durably
    std::string lastError;
    bool quarantined{false};  // durable, no longer dispatched

    WorkItem() = default;
    explicit WorkItem(std::string path, int attemptCount = 0)
        : relativePath(std::move(path)), attempts(attemptCount) {}
};

} // namespace ParaCopy
