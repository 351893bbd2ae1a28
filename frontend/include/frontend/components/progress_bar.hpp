#pragma once

#include <shared_data/progress_sample.hpp>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

/**
 * @brief Single line console progress display for sampled transfer progress.
 */
class ProgressBar
{
  public:
    struct Settings
    {
        std::string description{"running s5cmd"};
        std::chrono::seconds reportInterval{5};
        int width{30};
        std::FILE* stream{stderr};
    };
    explicit ProgressBar(Settings settings);

    /**
     * @brief Applies a sample and redraws. The final sample ends the line.
     */
    void update(SharedData::ProgressSample const& sample);

    std::string render() const;

    std::uint64_t current() const;

    /**
     * @brief Get the maximum value of the progress bar, if known.
     */
    std::optional<std::uint64_t> max() const;

  private:
    Settings settings_;
    std::uint64_t current_;
    std::optional<std::uint64_t> max_;
    std::chrono::steady_clock::time_point start_;
};
