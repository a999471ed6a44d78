/**
 * @file LoggerMacros.h
 * @brief Conditional logging macros
 *
 * The *_IF macros skip message construction when the level is disabled:
 *   LOG_DEBUG_COMP_IF("Dequeued " + item.relativePath, "Dispatcher");
 */

#pragma once

#include "Logger.h"

#include <chrono>
#include <string>

namespace ParaCopy {

#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::ParaCopy::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

#define LOG_INFO_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::ParaCopy::Logger::instance(); \
        if (logger__.isInfoEnabled()) { \
            logger__.info(msg, component); \
        } \
    } while(0)

#define LOG_WARN_COMP(msg, component) ::ParaCopy::Logger::instance().warn(msg, component)
#define LOG_ERROR_COMP(msg, component) ::ParaCopy::Logger::instance().error(msg, component)

// Logs elapsed time at INFO on destruction
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& name, const std::string& component = "Timing")
        : name_(name), component_(component), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto end = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start_).count();

        auto& logger = Logger::instance();
        if (logger.isInfoEnabled()) {
            logger.info(name_ + " took " + std::to_string(duration) + "ms", component_);
        }
    }

private:
    std::string name_;
    std::string component_;
    std::chrono::steady_clock::time_point start_;
};

#define SCOPED_TIMER_COMP(name, component) ::ParaCopy::ScopedTimer timer__(name, component)

} // namespace ParaCopy
