#pragma once

#include <backend/process/process_output.hpp>
#include <backend/transfer/progress_clock.hpp>
#include <shared_data/progress_sample.hpp>
#include <shared_data/transfer_error.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>

/**
 * @brief Turns the line stream of a running transfer into time sampled progress.
 *
 * Every line counts as one unit of work. A sample is emitted when at least reportInterval passed since the previous
 * one, once when the exit of the process is first noticed, and once more when the stream closes. The sum of all
 * sample line counts equals the number of lines read.
 */
class ProgressAggregator
{
  public:
    struct Options
    {
        std::optional<std::uint64_t> expectedTotal{std::nullopt};
        std::chrono::milliseconds reportInterval{std::chrono::seconds{5}};
        ProgressClock clock{steadyProgressClock()};
    };

    /**
     * @param output Borrowed for the lifetime of the aggregator.
     */
    ProgressAggregator(IProcessOutput& output, Options options);

    /**
     * @brief Reads until the next sample is due.
     *
     * @return The next sample, std::nullopt after the final sample was returned, or StreamReadError.
     */
    std::expected<std::optional<SharedData::ProgressSample>, SharedData::TransferError> next();

    /**
     * @brief Drains the stream, hands every sample to the sink and waits for the process.
     *
     * @return The exit code of the process.
     */
    std::expected<int, SharedData::TransferError>
    run(std::function<void(SharedData::ProgressSample const&)> const& sink);

    std::uint64_t observedLines() const;
    std::optional<int> exitCode() const;

  private:
    SharedData::ProgressSample makeSample(std::chrono::steady_clock::time_point now, bool isFinal);
    std::expected<SharedData::ProgressSample, SharedData::TransferError> finish();

  private:
    IProcessOutput* output_;
    Options options_;
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point lastReport_;
    std::uint64_t pendingLines_;
    std::uint64_t observedLines_;
    std::optional<int> exitCode_;
    bool exitObserved_;
    bool finished_;
};
