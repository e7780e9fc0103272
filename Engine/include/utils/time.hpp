/**
 * @file time.hpp
 * @brief Steady-clock helpers for operation latency and deadlines
 */

#pragma once

#include <chrono>

namespace Omnidb {

/**
 * @brief Measures how long one adapter operation took.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    Timer() : start_(Clock::now()) {}

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    TimePoint started() const { return start_; }

    /**
     * @brief Whole milliseconds until deadline, never less than floor.
     *
     * Drivers take their timeout as a positive number, so an already-passed
     * deadline still yields floor and the driver fails fast on its own.
     */
    static long long ms_until(TimePoint deadline, long long floor = 1) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        return left > floor ? left : floor;
    }

private:
    TimePoint start_;
};

} // namespace Omnidb
