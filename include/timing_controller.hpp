/**
 * @file timing_controller.hpp
 * @brief Paces replay so block timestamps map to wall-clock send times
 */

#ifndef GLOS_TIMING_CONTROLLER_HPP
#define GLOS_TIMING_CONTROLLER_HPP

#include "stats.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace glos {

constexpr double TIMING_MIN_SPEED = 0.01;
constexpr auto TIMING_PAUSE_POLL = std::chrono::milliseconds(20);
constexpr uint64_t TIMING_UNDERRUN_THRESHOLD_NS = 1000000;  // 1 ms

/**
 * @brief Maps recorded time to real time at a speed multiplier
 *
 * The first timestamp seen after construction or reset() becomes the
 * origin. Block k is due at session start + (ts_k - origin) / speed.
 */
class TimingController {
public:
    /**
     * @param speed Playback multiplier, clamped to TIMING_MIN_SPEED
     * @param paused Flag polled while waiting; time spent paused is not
     *        counted against the schedule
     */
    TimingController(double speed, const std::atomic<bool>& paused);

    /**
     * @brief Block until the timestamp is due
     * @return Timing error in ns (oversleep, or lag when already late)
     *
     * Lag above 1 ms is counted as an underrun in stats.
     */
    uint64_t wait_for(uint64_t timestamp_ns, ReplayStats& stats);

    /**
     * @brief Start a new schedule (next timestamp becomes the origin)
     */
    void reset();

    double speed() const { return speed_; }

private:
    void wait_while_paused();

    double speed_;
    const std::atomic<bool>& paused_;
    std::chrono::steady_clock::time_point session_start_;
    uint64_t origin_ns_ = 0;
    bool has_origin_ = false;
};

} // namespace glos

#endif // GLOS_TIMING_CONTROLLER_HPP
