#pragma once

#include <stdexcept>
#include <string>
#include <unordered_map>

namespace ParaCopy {
namespace Core {

enum class ErrorCode : int {
    // Configuration Errors (1000-1999)
    INVALID_CONFIGURATION = 1000,
    SOURCE_PATH_DOES_NOT_EXIST = 1001,
    TARGET_PATH_DOES_NOT_EXIST = 1002,
    SOURCE_TARGET_MISMATCH = 1003,

    // Enumeration Errors (2000-2999)
    ENUMERATION_FAILED = 2000,

    // Transfer Errors (3000-3999)
    TRANSFER_FAILED = 3000,
    TRANSFER_LAUNCH_FAILED = 3001,

    // Queue Errors (4000-4999)
    QUEUE_PERSISTENCE_FAILED = 4000,
    QUEUE_ALREADY_INITIALIZED = 4001,
    ITEMS_REMAINING = 4002,

    // System Errors (5000-5999)
    INTERRUPTED = 5000,
    INTERNAL_ERROR = 5001,

    // Success
    SUCCESS = 0
};

class ErrorInfo {
public:
    ErrorCode code;
    std::string message;
    std::string details;

    ErrorInfo(ErrorCode code, const std::string& message, const std::string& details = "")
        : code(code), message(message), details(details) {}

    std::string toString() const;
    std::string toJson() const;
    static std::string getErrorCodeString(ErrorCode code);
};

class ErrorRegistry {
private:
    static const std::unordered_map<ErrorCode, std::string>& messages();

public:
    static std::string getMessage(ErrorCode code);
    static ErrorInfo createError(ErrorCode code, const std::string& details = "");

    /**
     * @brief Process exit status reported for a terminal error code
     */
    static int exitStatus(ErrorCode code);
};

/**
 * @brief Base for fatal conditions raised as exceptions
 */
class ParaCopyError : public std::runtime_error {
public:
    ParaCopyError(ErrorCode code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    ErrorCode code() const noexcept { return code_; }
    ErrorInfo info() const { return ErrorRegistry::createError(code_, what()); }

private:
    ErrorCode code_;
};

/**
 * @brief Source tree could not be walked; the build phase is abandoned
 */
class EnumerationError : public ParaCopyError {
public:
    explicit EnumerationError(const std::string& what)
        : ParaCopyError(ErrorCode::ENUMERATION_FAILED, what) {}
};

/**
 * @brief Durable queue state could not be written; dispatching must stop
 */
class QueuePersistenceError : public ParaCopyError {
public:
    explicit QueuePersistenceError(const std::string& what)
        : ParaCopyError(ErrorCode::QUEUE_PERSISTENCE_FAILED, what) {}
};

/**
 * @brief Queue misuse, e.g. initializing a queue that already holds work
 */
class QueueStoreError : public ParaCopyError {
public:
    QueueStoreError(ErrorCode code, const std::string& what)
        : ParaCopyError(code, what) {}
};

} // namespace Core
} // namespace ParaCopy
