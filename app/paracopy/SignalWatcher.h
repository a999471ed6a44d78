#pragma once

#include <atomic>
#include <functional>
#include <thread>

namespace ParaCopy {

/**
 * @brief Turns SIGINT/SIGTERM into a call on an ordinary thread
 *
 * The handler only sets a flag; a watcher thread polls it and runs onStop
 * with the signal number. A second signal gets the default disposition.
 * The destructor stops and joins the watcher, so leaving the owning scope
 * by any path is safe.
 */
class SignalWatcher {
public:
    using StopHandler = std::function<void(int signal)>;

    explicit SignalWatcher(StopHandler onStop);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    void watch();

    StopHandler onStop_;
    std::atomic<bool> finished_{false};
    std::thread watcher_;
};

} // namespace ParaCopy
