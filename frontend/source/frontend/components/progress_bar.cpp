#include <frontend/components/progress_bar.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <algorithm>

ProgressBar::ProgressBar(Settings settings)
    : settings_{std::move(settings)}
    , current_{0}
    , max_{std::nullopt}
    , start_{std::chrono::steady_clock::now()}
{}

void ProgressBar::update(SharedData::ProgressSample const& sample)
{
    current_ = sample.isFinal ? sample.cumulative : current_ + sample.lines;
    max_ = sample.total;

    fmt::print(settings_.stream, "\r{}", render());
    if (sample.isFinal)
        fmt::print(settings_.stream, "\n");
    std::fflush(settings_.stream);
}

std::string ProgressBar::render() const
{
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - start_);
    const auto prefix = fmt::format("[interval={}] {}", settings_.reportInterval, settings_.description);

    if (!max_ || *max_ == 0)
        return fmt::format("{}: {} [{:%T}]", prefix, current_, elapsed);

    const auto shown = std::min(current_, *max_);
    const auto filled = static_cast<int>(settings_.width * shown / *max_);
    return fmt::format(
        "{}: {:3}%|{}{}| {}/{} [{:%T}]",
        prefix,
        100 * shown / *max_,
        std::string(filled, '#'),
        std::string(settings_.width - filled, ' '),
        current_,
        *max_,
        elapsed);
}

std::uint64_t ProgressBar::current() const
{
    return current_;
}

std::optional<std::uint64_t> ProgressBar::max() const
{
    return max_;
}
