#pragma once

#include "DatabaseManager.h"
#include "IWorkQueue.h"
#include "WorkItem.h"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ParaCopy {

class PathEnumerator;

struct QueueStoreOptions {
    // Extra dispatches of a failed item within the same run. Past this the
    // item stays durably Pending for the next run.
    int retriesPerRun = 0;
    // Durable failed attempts after which an item is quarantined: kept in
    // the queue file but no longer dispatched. 0 = retry forever.
    int maxAttempts = 0;
};

/**
 * @brief Durable queue of pending transfers backed by a SQLite file
 *
 * The work_queue table holds one row per Pending item in build order and is
 * the only record of progress across restarts: a row disappears exactly when
 * its transfer has been confirmed. InProgress state is never written, so a
 * crash leaves in-flight items Pending.
 *
 * Threading:
 * - mutex_ guards the in-memory pending list and in-flight map
 * - writeMutex_ serializes every statement on the connection, so durable
 *   writes from concurrent workers never interleave
 */
class QueueStore : public IWorkQueue {
public:
    explicit QueueStore(std::string path, QueueStoreOptions options = {});
    ~QueueStore() override = default;

    QueueStore(const QueueStore&) = delete;
    QueueStore& operator=(const QueueStore&) = delete;

    /**
     * @brief Read durable state and make its dispatchable items available
     * @return every durable record in build order, quarantined ones included;
     *         empty means there is nothing to resume
     */
    std::vector<WorkItem> load();

    /**
     * @brief Every durable record in build order, without touching the
     *        in-memory dispatch state
     */
    std::vector<WorkItem> records();

    /**
     * @brief Persist the full item set in one transaction
     *
     * Duplicate paths collapse to their first occurrence.
     * @return number of records written
     * @throws Core::QueueStoreError if the queue already holds records
     * @throws Core::QueuePersistenceError if the write fails (nothing is kept)
     */
    std::size_t initialize(const std::vector<std::string>& relativePaths);

    /**
     * @brief Persist everything the enumerator yields in one transaction
     *
     * An Core::EnumerationError thrown mid-walk propagates after the
     * transaction is rolled back, leaving the queue empty.
     */
    std::size_t initialize(PathEnumerator& enumerator);

    std::optional<WorkItem> dequeue() override;
    void markDone(const WorkItem& item) override;
    void markFailed(const WorkItem& item, const std::string& cause) override;
    void close() override;

    /**
     * @brief Clear the quarantine flag and attempt count of every record
     * @return number of records released
     */
    std::size_t releaseQuarantined();

    std::size_t pendingCount() const;
    std::size_t inFlightCount() const;
    std::size_t durableCount();
    std::size_t quarantinedCount();

    const std::string& path() const { return path_; }

private:
    std::size_t initializeFrom(const std::function<std::optional<std::string>()>& nextPath);
    std::size_t countRows(const std::string& sql);
    WorkItem takeInFlight(const std::string& relativePath);

    std::string path_;
    QueueStoreOptions options_;

    std::mutex writeMutex_;
    DatabaseManager db_;
    std::unique_ptr<PreparedStatement> deleteStmt_;
    std::unique_ptr<PreparedStatement> failStmt_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<WorkItem> pending_;
    std::unordered_map<std::string, WorkItem> inFlight_;
    std::unordered_map<std::string, int> runFailures_;
    bool closed_{false};
};

} // namespace ParaCopy
