#include "QueueStore.h"
#include "ErrorCodes.h"
#include "LoggerMacros.h"
#include "PathEnumerator.h"

#include <cstdint>
#include <stdexcept>

namespace ParaCopy {

namespace {

const char* COMPONENT = "QueueStore";

std::vector<DatabaseManager::Migration> schema() {
    return {
        {1, "work_queue table",
         "CREATE TABLE IF NOT EXISTS work_queue ("
         "  seq INTEGER PRIMARY KEY AUTOINCREMENT,"
         "  relative_path TEXT NOT NULL UNIQUE,"
         "  attempts INTEGER NOT NULL DEFAULT 0,"
         "  last_error TEXT NOT NULL DEFAULT '',"
         "  quarantined INTEGER NOT NULL DEFAULT 0"
         ");"}
    };
}

} // namespace

QueueStore::QueueStore(std::string path, QueueStoreOptions options)
    : path_(std::move(path)), options_(options), db_(path_) {
    try {
        db_.initialize(schema());
        deleteStmt_ = db_.prepare("DELETE FROM work_queue WHERE relative_path = ?;");
        failStmt_ = db_.prepare(
            "UPDATE work_queue SET attempts = ?, last_error = ?, quarantined = ? WHERE relative_path = ?;");
    } catch (const DatabaseError& e) {
        throw Core::QueuePersistenceError("Cannot open queue file " + path_ + ": " + e.what());
    }
}

std::vector<WorkItem> QueueStore::load() {
    std::vector<WorkItem> all = records();
    std::deque<WorkItem> dispatchable;
    for (const auto& record : all) {
        if (!record.quarantined) {
            dispatchable.push_back(record);
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!inFlight_.empty()) {
            throw std::logic_error("QueueStore::load() called while items are in flight");
        }
        pending_ = std::move(dispatchable);
        runFailures_.clear();
    }

    auto& logger = Logger::instance();
    if (all.empty()) {
        logger.info("No resume state in " + path_, COMPONENT);
    } else {
        logger.info("Resuming " + std::to_string(all.size()) + " pending item(s) from " + path_, COMPONENT);
    }
    return all;
}

std::vector<WorkItem> QueueStore::records() {
    std::vector<WorkItem> result;
    std::lock_guard<std::mutex> writeLock(writeMutex_);
    try {
        auto stmt = db_.prepare(
            "SELECT relative_path, attempts, last_error, quarantined FROM work_queue ORDER BY seq;");
        while (stmt->step()) {
            WorkItem item(stmt->getColumnString(0), stmt->getColumnInt(1));
            item.lastError = stmt->getColumnString(2);
            item.quarantined = stmt->getColumnInt(3) != 0;
            result.push_back(std::move(item));
        }
    } catch (const DatabaseError& e) {
        throw Core::QueuePersistenceError("Cannot read queue file " + path_ + ": " + e.what());
    }
    return result;
}

std::size_t QueueStore::initialize(const std::vector<std::string>& relativePaths) {
    std::size_t index = 0;
    return initializeFrom([&]() -> std::optional<std::string> {
        if (index >= relativePaths.size()) {
            return std::nullopt;
        }
        return relativePaths[index++];
    });
}

std::size_t QueueStore::initialize(PathEnumerator& enumerator) {
    return initializeFrom([&]() { return enumerator.next(); });
}

std::size_t QueueStore::initializeFrom(const std::function<std::optional<std::string>()>& nextPath) {
    auto& logger = Logger::instance();
    std::vector<WorkItem> inserted;
    std::size_t duplicates = 0;

    {
        std::lock_guard<std::mutex> writeLock(writeMutex_);
        try {
            std::int64_t existing = 0;
            {
                auto count = db_.prepare("SELECT COUNT(*) FROM work_queue;");
                if (count->step()) {
                    existing = count->getColumnInt64(0);
                }
            }
            if (existing > 0) {
                throw Core::QueueStoreError(Core::ErrorCode::QUEUE_ALREADY_INITIALIZED,
                    path_ + " already holds " + std::to_string(existing) + " record(s)");
            }

            // Rolled back on any exception, including an enumeration failure
            auto txn = db_.beginTransaction();
            auto insertStmt = db_.prepare("INSERT OR IGNORE INTO work_queue (relative_path) VALUES (?);");
            while (auto path = nextPath()) {
                insertStmt->bind(1, *path);
                insertStmt->step();
                if (db_.changes() == 1) {
                    inserted.emplace_back(std::move(*path));
                } else {
                    ++duplicates;
                    logger.warn("Duplicate path ignored: " + *path, COMPONENT);
                }
                insertStmt->reset();
            }
            insertStmt.reset();
            txn->commit();
        } catch (const DatabaseError& e) {
            throw Core::QueuePersistenceError("Cannot build queue in " + path_ + ": " + e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.assign(inserted.begin(), inserted.end());
        runFailures_.clear();
    }
    cv_.notify_all();

    logger.info("Queue built with " + std::to_string(inserted.size()) + " item(s)" +
                (duplicates > 0 ? " (" + std::to_string(duplicates) + " duplicate(s) collapsed)" : ""),
                COMPONENT);
    return inserted.size();
}

std::optional<WorkItem> QueueStore::dequeue() {
    std::unique_lock<std::mutex> lock(mutex_);
    // A failing in-flight item may come back, so only give up once nothing is in flight
    cv_.wait(lock, [this]() {
        return closed_ || !pending_.empty() || inFlight_.empty();
    });

    if (closed_ || pending_.empty()) {
        return std::nullopt;
    }

    WorkItem item = std::move(pending_.front());
    pending_.pop_front();
    item.status = WorkStatus::InProgress;
    inFlight_.emplace(item.relativePath, item);
    return item;
}

void QueueStore::markDone(const WorkItem& item) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inFlight_.find(item.relativePath) == inFlight_.end()) {
            throw std::logic_error("markDone for item not in flight: " + item.relativePath);
        }
    }

    int removed = 0;
    {
        std::lock_guard<std::mutex> writeLock(writeMutex_);
        try {
            deleteStmt_->bind(1, item.relativePath);
            deleteStmt_->step();
            removed = db_.changes();
            deleteStmt_->reset();
        } catch (const DatabaseError& e) {
            deleteStmt_->reset();
            throw Core::QueuePersistenceError("Cannot record completion of " + item.relativePath + ": " + e.what());
        }
    }
    if (removed != 1) {
        Logger::instance().warn("Completed item had no durable record: " + item.relativePath, COMPONENT);
    }

    takeInFlight(item.relativePath);
    cv_.notify_all();
}

void QueueStore::markFailed(const WorkItem& item, const std::string& cause) {
    int attempts = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = inFlight_.find(item.relativePath);
        if (it == inFlight_.end()) {
            throw std::logic_error("markFailed for item not in flight: " + item.relativePath);
        }
        attempts = it->second.attempts + 1;
    }
    bool quarantine = options_.maxAttempts > 0 && attempts >= options_.maxAttempts;

    {
        std::lock_guard<std::mutex> writeLock(writeMutex_);
        try {
            failStmt_->bind(1, attempts);
            failStmt_->bind(2, cause);
            failStmt_->bind(3, quarantine ? 1 : 0);
            failStmt_->bind(4, item.relativePath);
            failStmt_->step();
            failStmt_->reset();
        } catch (const DatabaseError& e) {
            failStmt_->reset();
            throw Core::QueuePersistenceError("Cannot record failure of " + item.relativePath + ": " + e.what());
        }
    }

    auto& logger = Logger::instance();
    {
        // Leaving flight and re-entering pending happen under one lock so a
        // waiting worker never sees both empty in between
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = inFlight_.find(item.relativePath);
        WorkItem failed = std::move(it->second);
        inFlight_.erase(it);
        failed.attempts = attempts;
        failed.lastError = cause;
        failed.status = WorkStatus::Pending;

        int failuresThisRun = ++runFailures_[failed.relativePath];
        if (quarantine) {
            logger.error("Quarantined after " + std::to_string(attempts) + " attempt(s): " +
                         failed.relativePath, COMPONENT);
        } else if (failuresThisRun <= options_.retriesPerRun && !closed_) {
            pending_.push_back(std::move(failed));
        } else {
            LOG_DEBUG_COMP_IF("Left pending for a later run: " + failed.relativePath, COMPONENT);
        }
    }
    cv_.notify_all();
}

void QueueStore::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

std::size_t QueueStore::releaseQuarantined() {
    std::lock_guard<std::mutex> writeLock(writeMutex_);
    try {
        db_.execute("UPDATE work_queue SET quarantined = 0, attempts = 0 WHERE quarantined = 1;");
    } catch (const DatabaseError& e) {
        throw Core::QueuePersistenceError("Cannot release quarantined items: " + std::string(e.what()));
    }
    auto released = static_cast<std::size_t>(db_.changes());
    if (released > 0) {
        Logger::instance().info("Released " + std::to_string(released) + " quarantined item(s)", COMPONENT);
    }
    return released;
}

std::size_t QueueStore::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::size_t QueueStore::inFlightCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inFlight_.size();
}

std::size_t QueueStore::durableCount() {
    return countRows("SELECT COUNT(*) FROM work_queue;");
}

std::size_t QueueStore::quarantinedCount() {
    return countRows("SELECT COUNT(*) FROM work_queue WHERE quarantined = 1;");
}

std::size_t QueueStore::countRows(const std::string& sql) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);
    try {
        auto stmt = db_.prepare(sql);
        return stmt->step() ? static_cast<std::size_t>(stmt->getColumnInt64(0)) : 0;
    } catch (const DatabaseError& e) {
        throw Core::QueuePersistenceError("Cannot read queue file " + path_ + ": " + e.what());
    }
}

WorkItem QueueStore::takeInFlight(const std::string& relativePath) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = inFlight_.find(relativePath);
    if (it == inFlight_.end()) {
        throw std::logic_error("Item not in flight: " + relativePath);
    }
    WorkItem item = std::move(it->second);
    inFlight_.erase(it);
    return item;
}

} // namespace ParaCopy
