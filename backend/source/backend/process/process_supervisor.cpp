#include <backend/process/process_supervisor.hpp>

#include <log/log.hpp>

#include <algorithm>

using SharedData::TransferError;
using SharedData::TransferErrorType;

namespace
{
    TransferError interruptedError(int signal)
    {
        return TransferError{
            .type = TransferErrorType::Interrupted,
            .extraInfo = "Stopped by signal " + std::to_string(signal),
        };
    }
}

ProcessSupervisor::ProcessSupervisor(std::shared_ptr<ToolResolver> resolver)
    : resolver_{std::move(resolver)}
    , processesGuard_{}
    , processes_{}
    , interruptSignal_{0}
{}

std::expected<std::shared_ptr<Process>, TransferError>
ProcessSupervisor::launch(std::vector<std::string> const& arguments, bool captureOutput)
{
    if (const auto signal = interrupted())
        return std::unexpected(interruptedError(*signal));

    const auto tool = resolver_->resolve();
    if (!tool.has_value())
        return std::unexpected(tool.error());

    auto process = std::make_shared<Process>();
    {
        std::scoped_lock lock{processesGuard_};
        std::erase_if(processes_, [](auto const& weak) {
            return weak.expired();
        });
        processes_.push_back(process);
    }

    if (auto result = process->spawn(*tool, arguments, captureOutput); !result.has_value())
        return std::unexpected(result.error());

    // interrupt() may have run before the child could be signaled.
    if (const auto signal = interrupted())
        process->signal(*signal);

    return process;
}

std::expected<void, TransferError> ProcessSupervisor::run(std::vector<std::string> const& arguments)
{
    auto process = launch(arguments, false);
    if (!process.has_value())
        return std::unexpected(process.error());

    const auto exitCode = (*process)->wait();
    if (!exitCode.has_value())
        return std::unexpected(exitCode.error());

    return finish(*exitCode, arguments.empty() ? std::string{} : arguments.front());
}

void ProcessSupervisor::interrupt(int signal)
{
    interruptSignal_ = signal;

    std::scoped_lock lock{processesGuard_};
    for (auto const& weak : processes_)
    {
        if (auto process = weak.lock())
            process->signal(signal);
    }
}

std::optional<int> ProcessSupervisor::interrupted() const
{
    const int signal = interruptSignal_;
    if (signal == 0)
        return std::nullopt;
    return signal;
}

std::expected<void, TransferError> ProcessSupervisor::finish(int exitCode, std::string const& subcommand) const
{
    if (const auto signal = interrupted())
    {
        Log::warn("Transfer tool '{}' was interrupted (exit code {}).", subcommand, exitCode);
        return std::unexpected(interruptedError(*signal));
    }
    return checkExitCode(exitCode, subcommand);
}

std::shared_ptr<ToolResolver> const& ProcessSupervisor::resolver() const
{
    return resolver_;
}

std::expected<void, TransferError> checkExitCode(int exitCode, std::string const& subcommand)
{
    if (exitCode == 0)
        return {};

    Log::error("Transfer tool '{}' exited with code {}.", subcommand, exitCode);
    return std::unexpected(TransferError{
        .type = TransferErrorType::ToolFailed,
        .exitCode = exitCode,
        .extraInfo = "Transfer tool subcommand '" + subcommand + "' failed",
    });
}
