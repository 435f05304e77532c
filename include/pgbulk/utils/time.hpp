#pragma once

#include <chrono>
#include <cstdio>
#include <string>

namespace PgBulk {

/**
 * @brief Steady-clock stopwatch for phase timings.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;

    Timer() : start_(Clock::now()) {}

    void reset() {
        start_ = Clock::now();
    }

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    /**
     * @brief Elapsed time rendered as "850 ms" or "12.40 s".
     */
    std::string elapsed_str() const {
        double ms = elapsed_ms();
        char buf[32];
        if (ms < 1000.0) {
            std::snprintf(buf, sizeof(buf), "%.0f ms", ms);
        } else {
            std::snprintf(buf, sizeof(buf), "%.2f s", ms / 1000.0);
        }
        return buf;
    }

private:
    Clock::time_point start_;
};

} // namespace PgBulk
