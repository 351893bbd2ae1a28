#include <backend/process/process.hpp>
#include <backend/process/boost_process.hpp>

#include <log/log.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <istream>
#include <system_error>

#include <signal.h>
#include <sys/types.h>

namespace bp = boost::process;

using SharedData::TransferError;
using SharedData::TransferErrorType;

struct Process::Implementation
{
    std::unique_ptr<bp::child> child{};
    bp::ipstream output{};
    ProcessState state{ProcessState::Created};
    std::optional<int> exitCode{std::nullopt};
    bool captureOutput{false};
    // 0 while there is no child that may be signaled.
    std::atomic<pid_t> pid{0};

    void recordExit()
    {
        pid = 0;
        exitCode = child->exit_code();
        state = ProcessState::Completed;
        Log::debug("Process {} exited with code {}.", child->id(), *exitCode);
    }
};

Process::Process()
    : impl_{std::make_unique<Implementation>()}
{}

Process::~Process()
{
    if (!impl_->child || impl_->state != ProcessState::Running)
        return;

    std::error_code ec;
    if (impl_->child->running(ec))
    {
        Log::warn("Process {} is still running on destruction, terminating it.", impl_->child->id());
        impl_->child->terminate(ec);
    }
    impl_->child->wait(ec);
    impl_->pid = 0;
}

std::expected<void, TransferError> Process::spawn(
    std::filesystem::path const& executable,
    std::vector<std::string> const& arguments,
    bool captureOutput)
{
    if (impl_->state != ProcessState::Created)
    {
        return std::unexpected(TransferError{
            .type = TransferErrorType::ImplementationError,
            .extraInfo = "A process object can only be spawned once",
        });
    }

    impl_->captureOutput = captureOutput;

    std::error_code ec;
    if (captureOutput)
    {
        impl_->child = std::make_unique<bp::child>(
            bp::exe = executable.string(), bp::args = arguments, (bp::std_out & bp::std_err) > impl_->output, ec);
    }
    else
    {
        impl_->child = std::make_unique<bp::child>(bp::exe = executable.string(), bp::args = arguments, ec);
    }

    if (ec || !impl_->child->valid())
    {
        impl_->state = ProcessState::StartFailed;
        Log::error("Failed to start '{}': {}", executable.string(), ec.message());
        return std::unexpected(TransferError{
            .type = TransferErrorType::StartFailed,
            .extraInfo = fmt::format("Starting '{}': {}", executable.string(), ec.message()),
        });
    }

    impl_->state = ProcessState::Running;
    impl_->pid = impl_->child->id();
    Log::debug("Started process {}: {} {}", impl_->child->id(), executable.string(), fmt::join(arguments, " "));
    return {};
}

std::expected<std::optional<std::string>, TransferError> Process::readLine()
{
    if (!impl_->captureOutput || !impl_->child)
    {
        return std::unexpected(TransferError{
            .type = TransferErrorType::ImplementationError,
            .extraInfo = "Output of this process is not captured",
        });
    }

    std::string line;
    if (std::getline(impl_->output, line))
        return line;

    if (impl_->output.bad())
    {
        return std::unexpected(TransferError{
            .type = TransferErrorType::StreamReadError,
            .extraInfo = "Reading the output pipe of the transfer tool failed",
        });
    }
    return std::nullopt;
}

bool Process::hasExited()
{
    if (impl_->state == ProcessState::Completed || impl_->state == ProcessState::StartFailed)
        return true;
    if (!impl_->child)
        return false;

    std::error_code ec;
    const bool running = impl_->child->running(ec);
    if (ec || !running)
    {
        impl_->pid = 0;
        return true;
    }
    return false;
}

std::expected<int, TransferError> Process::wait()
{
    if (impl_->state == ProcessState::Completed)
        return *impl_->exitCode;

    if (!impl_->child || impl_->state != ProcessState::Running)
    {
        return std::unexpected(TransferError{
            .type = TransferErrorType::ImplementationError,
            .extraInfo = "Cannot wait for a process that was never started",
        });
    }

    std::error_code ec;
    impl_->child->wait(ec);
    if (ec)
    {
        Log::error("Waiting for process {} failed: {}", impl_->child->id(), ec.message());
        return std::unexpected(TransferError{
            .type = TransferErrorType::ToolFailed,
            .extraInfo = fmt::format("Waiting for the transfer tool failed: {}", ec.message()),
        });
    }

    impl_->recordExit();
    return *impl_->exitCode;
}

void Process::signal(int signal)
{
    const pid_t pid = impl_->pid;
    if (pid <= 0)
        return;

    if (::kill(pid, signal) != 0)
        Log::warn("Sending signal {} to process {} failed: {}", signal, pid, std::strerror(errno));
    else
        Log::debug("Sent signal {} to process {}.", signal, pid);
}

ProcessState Process::state() const
{
    return impl_->state;
}

std::optional<int> Process::exitCode() const
{
    return impl_->exitCode;
}

bool Process::capturesOutput() const
{
    return impl_->captureOutput;
}
