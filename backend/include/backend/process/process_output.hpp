#pragma once

#include <shared_data/transfer_error.hpp>

#include <expected>
#include <optional>
#include <string>

/**
 * @brief The merged, line oriented output of a running subprocess. Consumers borrow it for the duration of
 * reading and must drain it, otherwise the child may block on a full pipe.
 */
class IProcessOutput
{
  public:
    IProcessOutput() = default;
    virtual ~IProcessOutput() = default;
    IProcessOutput(IProcessOutput const&) = delete;
    IProcessOutput& operator=(IProcessOutput const&) = delete;
    IProcessOutput(IProcessOutput&&) = delete;
    IProcessOutput& operator=(IProcessOutput&&) = delete;

    /**
     * @brief Blocks until the next line (without terminator) is available.
     *
     * @return std::nullopt once the stream is closed, StreamReadError if reading failed.
     */
    virtual std::expected<std::optional<std::string>, SharedData::TransferError> readLine() = 0;

    /**
     * @brief Non blocking check whether the process has exited.
     */
    virtual bool hasExited() = 0;

    /**
     * @brief Blocks until the process has exited.
     *
     * @return The exit code.
     */
    virtual std::expected<int, SharedData::TransferError> wait() = 0;
};
