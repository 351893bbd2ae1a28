#pragma once

#include <chrono>
#include <functional>

using ProgressClock = std::function<std::chrono::steady_clock::time_point()>;

inline ProgressClock steadyProgressClock()
{
    return []() {
        return std::chrono::steady_clock::now();
    };
}
