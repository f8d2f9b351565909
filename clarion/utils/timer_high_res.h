#pragma once

#include <chrono>
#include <cstdint>

namespace clarion::timer {

/// \brief  Minimal timer used to report stage timings. Starts a clock when constructed.
class TimerHighRes {
public:
    TimerHighRes() : m_start_time(std::chrono::high_resolution_clock::now()) {}

    int64_t GetElapsedMilliseconds() const {
        const auto now = std::chrono::high_resolution_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - m_start_time).count();
    }

    double GetElapsedSeconds() const {
        const auto now = std::chrono::high_resolution_clock::now();
        return std::chrono::duration<double>(now - m_start_time).count();
    }

private:
    std::chrono::time_point<std::chrono::high_resolution_clock> m_start_time;
};

}  // namespace clarion::timer
