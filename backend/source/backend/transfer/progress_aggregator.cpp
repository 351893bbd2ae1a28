#include <backend/transfer/progress_aggregator.hpp>

#include <log/log.hpp>

#include <algorithm>

using SharedData::ProgressSample;
using SharedData::TransferError;

ProgressAggregator::ProgressAggregator(IProcessOutput& output, Options options)
    : output_{&output}
    , options_{std::move(options)}
    , start_{options_.clock()}
    , lastReport_{start_}
    , pendingLines_{0}
    , observedLines_{0}
    , exitCode_{std::nullopt}
    , exitObserved_{false}
    , finished_{false}
{}

ProgressSample ProgressAggregator::makeSample(std::chrono::steady_clock::time_point now, bool isFinal)
{
    ProgressSample sample{
        .lines = pendingLines_,
        .timestamp = now,
        .total = options_.expectedTotal,
        .cumulative = observedLines_,
        .isFinal = isFinal,
    };
    pendingLines_ = 0;
    lastReport_ = now;
    return sample;
}

std::expected<ProgressSample, TransferError> ProgressAggregator::finish()
{
    finished_ = true;
    const auto now = options_.clock();
    auto sample = makeSample(now, true);

    // A run that ends within the first interval may have printed less than it did.
    if (now - start_ < options_.reportInterval)
        sample.cumulative = std::max(observedLines_, options_.expectedTotal.value_or(0));

    const auto exitCode = output_->wait();
    if (!exitCode.has_value())
        return std::unexpected(exitCode.error());
    exitCode_ = *exitCode;

    Log::debug(
        "ProgressAggregator: stream closed after {} lines, exit code {}.", observedLines_, *exitCode_);
    return sample;
}

std::expected<std::optional<ProgressSample>, TransferError> ProgressAggregator::next()
{
    if (finished_)
        return std::nullopt;

    while (true)
    {
        auto line = output_->readLine();
        if (!line.has_value())
        {
            finished_ = true;
            Log::error("ProgressAggregator: {}", line.error().toString());
            if (const auto waited = output_->wait(); waited.has_value())
                exitCode_ = *waited;
            else
                Log::warn("ProgressAggregator: waiting after read failure failed: {}", waited.error().toString());
            return std::unexpected(line.error());
        }

        if (!line->has_value())
        {
            auto sample = finish();
            if (!sample.has_value())
                return std::unexpected(sample.error());
            return std::optional<ProgressSample>{*sample};
        }

        ++pendingLines_;
        ++observedLines_;

        const auto now = options_.clock();
        if (now - lastReport_ >= options_.reportInterval)
            return std::optional<ProgressSample>{makeSample(now, false)};

        // Lines still buffered after the exit are counted by the final sample.
        if (!exitObserved_ && output_->hasExited())
        {
            exitObserved_ = true;
            return std::optional<ProgressSample>{makeSample(now, false)};
        }
    }
}

std::expected<int, TransferError>
ProgressAggregator::run(std::function<void(ProgressSample const&)> const& sink)
{
    while (true)
    {
        auto sample = next();
        if (!sample.has_value())
            return std::unexpected(sample.error());
        if (!sample->has_value())
            break;
        if (sink)
            sink(**sample);
    }
    return *exitCode_;
}

std::uint64_t ProgressAggregator::observedLines() const
{
    return observedLines_;
}

std::optional<int> ProgressAggregator::exitCode() const
{
    return exitCode_;
}
