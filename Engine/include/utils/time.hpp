#pragma once

#include <chrono>

namespace Runestream {

/**
 * @brief Steady-clock stopwatch used for assembly statistics.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;

    Timer() : start_(Clock::now()) {}

    /**
     * @brief Elapsed milliseconds (fractional) since construction.
     */
    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

private:
    Clock::time_point start_;
};

} // namespace Runestream
