#pragma once
#include <chrono>

namespace SoftRaster
{

    class Timer
    {
    public:
        Timer() { Reset(); }

        void Reset() { m_start = std::chrono::steady_clock::now(); }

        // Returns elapsed time in seconds
        float Elapsed() const { return std::chrono::duration<float>( std::chrono::steady_clock::now() - m_start ).count(); }

        // Returns elapsed time in milliseconds
        float ElapsedMillis() const { return std::chrono::duration<float, std::milli>( std::chrono::steady_clock::now() - m_start ).count(); }

        // Returns milliseconds since the last call (or construction) and restarts the timer.
        float Lap()
        {
            auto  now = std::chrono::steady_clock::now();
            float ms  = std::chrono::duration<float, std::milli>( now - m_start ).count();
            m_start   = now;
            return ms;
        }

    private:
        std::chrono::time_point<std::chrono::steady_clock> m_start;
    };
} // namespace SoftRaster
