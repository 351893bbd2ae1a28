#pragma once

#include <backend/process/process.hpp>
#include <backend/tool/tool_resolver.hpp>
#include <shared_data/transfer_error.hpp>

#include <atomic>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Launches the external transfer tool. Makes sure the tool is available before every launch.
 *
 * Keeps track of the processes it launched so that an interruption of this program can be passed on to them.
 */
class ProcessSupervisor
{
  public:
    explicit ProcessSupervisor(std::shared_ptr<ToolResolver> resolver);

    /**
     * @brief Starts the tool with the given arguments.
     *
     * @param captureOutput See Process::spawn. The caller must drain the output of a capturing process.
     * @return ToolUnavailable, StartFailed, Interrupted
     */
    std::expected<std::shared_ptr<Process>, SharedData::TransferError>
    launch(std::vector<std::string> const& arguments, bool captureOutput);

    /**
     * @brief Runs the tool to completion with its output going to the standard streams of this process.
     *
     * @return ToolFailed with the exit code if the tool did not succeed, Interrupted after interrupt().
     */
    std::expected<void, SharedData::TransferError> run(std::vector<std::string> const& arguments);

    /**
     * @brief Forwards the signal to every running tool and refuses later launches. Safe to call from another thread.
     */
    void interrupt(int signal);

    /**
     * @return The signal passed to interrupt(), if any.
     */
    std::optional<int> interrupted() const;

    /**
     * @brief Like checkExitCode, but reports Interrupted once interrupt() was called.
     */
    std::expected<void, SharedData::TransferError> finish(int exitCode, std::string const& subcommand) const;

    std::shared_ptr<ToolResolver> const& resolver() const;

  private:
    std::shared_ptr<ToolResolver> resolver_;
    std::mutex processesGuard_;
    std::vector<std::weak_ptr<Process>> processes_;
    std::atomic<int> interruptSignal_;
};

/**
 * @brief Turns a non zero exit code into a ToolFailed error.
 */
std::expected<void, SharedData::TransferError> checkExitCode(int exitCode, std::string const& subcommand);
