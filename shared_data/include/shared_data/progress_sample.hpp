#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace SharedData
{
    struct ProgressSample
    {
        /// Lines observed since the previous sample.
        std::uint64_t lines{0};
        std::chrono::steady_clock::time_point timestamp{};
        std::optional<std::uint64_t> total{std::nullopt};
        /// Count that a display should show after applying this sample.
        std::uint64_t cumulative{0};
        bool isFinal{false};
    };
}
