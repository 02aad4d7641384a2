#pragma once

#include <atomic>
#include <chrono>

namespace xvh {

class AppState {
public:
    AppState() : running_(true) {}

    // Only touches an atomic flag, so it may be called from a signal handler.
    void shutdown() { running_ = false; }
    bool is_running() const { return running_; }

    // Sleeps for up to `interval`, returning early once shutdown() is called.
    // Returns false if the application is shutting down.
    bool wait_for(std::chrono::milliseconds interval) const;

private:
    std::atomic<bool> running_;
};

} // namespace xvh
