/**
 * @file timing_controller.cpp
 * @brief Replay pacing implementation
 */

#include "timing_controller.hpp"

#include <algorithm>
#include <thread>

namespace glos {

TimingController::TimingController(double speed, const std::atomic<bool>& paused)
    : speed_(std::max(speed, TIMING_MIN_SPEED))
    , paused_(paused)
    , session_start_(std::chrono::steady_clock::now())
{
}

void TimingController::reset() {
    session_start_ = std::chrono::steady_clock::now();
    has_origin_ = false;
    origin_ns_ = 0;
}

void TimingController::wait_while_paused() {
    if (!paused_.load(std::memory_order_relaxed)) {
        return;
    }
    auto pause_start = std::chrono::steady_clock::now();
    while (paused_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(TIMING_PAUSE_POLL);
    }
    // Shift the schedule so resuming does not burst to catch up
    session_start_ += std::chrono::steady_clock::now() - pause_start;
}

uint64_t TimingController::wait_for(uint64_t timestamp_ns, ReplayStats& stats) {
    wait_while_paused();

    if (!has_origin_) {
        origin_ns_ = timestamp_ns;
        has_origin_ = true;
    }

    // Timestamps before the origin are due immediately
    uint64_t recorded_offset = timestamp_ns > origin_ns_ ? timestamp_ns - origin_ns_ : 0;
    auto real_offset = std::chrono::nanoseconds(
        static_cast<int64_t>(static_cast<double>(recorded_offset) / speed_));
    auto target = session_start_ + real_offset;

    auto now = std::chrono::steady_clock::now();
    if (now < target) {
        std::this_thread::sleep_until(target);
        auto actual = std::chrono::steady_clock::now();
        if (actual <= target) {
            return 0;
        }
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(actual - target).count());
    }

    uint64_t lag_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(now - target).count());
    if (lag_ns > TIMING_UNDERRUN_THRESHOLD_NS) {
        stats.increment_underruns();
    }
    return lag_ns;
}

} // namespace glos
