#pragma once

#include <backend/process/process_output.hpp>
#include <shared_data/transfer_error.hpp>

#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class ProcessState
{
    Created,
    Running,
    Completed,
    StartFailed
};

class Process : public IProcessOutput
{
  public:
    Process();
    ~Process() override;
    Process(Process const&) = delete;
    Process& operator=(Process const&) = delete;
    Process(Process&&) = delete;
    Process& operator=(Process&&) = delete;

    /**
     * @brief Starts the executable and returns while it runs (state Running).
     *
     * Without output capture the child inherits the standard streams of this process. With output capture stdout and
     * stderr are merged into one pipe that is read through readLine.
     *
     * @return StartFailed if the executable could not be launched.
     */
    std::expected<void, SharedData::TransferError> spawn(
        std::filesystem::path const& executable,
        std::vector<std::string> const& arguments,
        bool captureOutput);

    std::expected<std::optional<std::string>, SharedData::TransferError> readLine() override;
    bool hasExited() override;
    std::expected<int, SharedData::TransferError> wait() override;

    /**
     * @brief Sends a signal to the child. Does nothing if it is not running. Safe to call from another thread.
     */
    void signal(int signal);

    ProcessState state() const;
    std::optional<int> exitCode() const;
    bool capturesOutput() const;

  private:
    struct Implementation;
    std::unique_ptr<Implementation> impl_;
};
