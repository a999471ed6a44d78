#include "SignalWatcher.h"

#include <chrono>
#include <csignal>

namespace ParaCopy {

namespace {

// Signal-safe: only sig_atomic_t flags are touched in the handler
volatile sig_atomic_t signalReceived = 0;
volatile sig_atomic_t receivedSignalNum = 0;

void signalHandler(int signal) {
    receivedSignalNum = signal;
    signalReceived = 1;
    // A second Ctrl-C kills the process outright
    std::signal(signal, SIG_DFL);
}

} // namespace

SignalWatcher::SignalWatcher(StopHandler onStop) : onStop_(std::move(onStop)) {
    signalReceived = 0;
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    watcher_ = std::thread([this]() { watch(); });
}

SignalWatcher::~SignalWatcher() {
    finished_ = true;
    if (watcher_.joinable()) watcher_.join();
}

void SignalWatcher::watch() {
    while (!finished_) {
        if (signalReceived) {
            onStop_(receivedSignalNum);
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

} // namespace ParaCopy
