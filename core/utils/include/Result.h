#pragma once

#include "ErrorCodes.h"

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace ParaCopy {

/**
 * @brief Result type for explicit error handling
 *
 * Carries either a value or a Core::ErrorInfo. Used where a failure is an
 * expected outcome the caller reports (validation, run status) rather than
 * a fatal condition.
 *
 * Usage:
 *   Result<RunOptions> options = RunOptions::parseArguments(argc, argv, RunOptions::fromConfig(config));
 *   if (!options) {
 *       logger.error(options.error().toString());
 *   }
 */
template<typename T, typename E = Core::ErrorInfo>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(const E& error) : data_(error) {}
    Result(E&& error) : data_(std::move(error)) {}

    bool isOk() const { return std::holds_alternative<T>(data_); }
    bool isError() const { return std::holds_alternative<E>(data_); }

    explicit operator bool() const { return isOk(); }

    // Access value (throws if error)
    T& value() {
        if (isError()) {
            throw std::runtime_error("Called value() on Error result: " +
                std::get<E>(data_).toString());
        }
        return std::get<T>(data_);
    }

    const T& value() const {
        if (isError()) {
            throw std::runtime_error("Called value() on Error result: " +
                std::get<E>(data_).toString());
        }
        return std::get<T>(data_);
    }

    // Access error (throws if ok)
    const E& error() const {
        if (isOk()) {
            throw std::runtime_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

private:
    std::variant<T, E> data_;
};

// Specialization for void (no value, only success/error)
template<typename E>
class Result<void, E> {
public:
    Result() : data_(OkType{}) {}
    Result(const E& error) : data_(error) {}
    Result(E&& error) : data_(std::move(error)) {}

    bool isOk() const { return std::holds_alternative<OkType>(data_); }
    bool isError() const { return std::holds_alternative<E>(data_); }

    explicit operator bool() const { return isOk(); }

    const E& error() const {
        if (isOk()) {
            throw std::runtime_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

private:
    struct OkType {};
    std::variant<OkType, E> data_;
};

using VoidResult = Result<void>;

inline VoidResult Ok() {
    return VoidResult();
}

inline Core::ErrorInfo Err(Core::ErrorCode code, const std::string& details = "") {
    return Core::ErrorRegistry::createError(code, details);
}

} // namespace ParaCopy
