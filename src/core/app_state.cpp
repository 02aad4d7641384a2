#include "app_state.hpp"
#include <algorithm>
#include <thread>

namespace xvh {

bool AppState::wait_for(std::chrono::milliseconds interval) const {
    constexpr std::chrono::milliseconds slice(100);
    auto deadline = std::chrono::steady_clock::now() + interval;
    while (running_) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(slice, remaining));
    }
    return running_;
}

} // namespace xvh
