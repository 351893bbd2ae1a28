#pragma once

#include <shared_data/transfer_error.hpp>

#include <expected>
#include <filesystem>

/**
 * @brief Acquires the external transfer executable and places it at a given path.
 */
class ToolInstaller
{
  public:
    ToolInstaller() = default;
    virtual ~ToolInstaller() = default;
    ToolInstaller(ToolInstaller const&) = delete;
    ToolInstaller& operator=(ToolInstaller const&) = delete;
    ToolInstaller(ToolInstaller&&) = delete;
    ToolInstaller& operator=(ToolInstaller&&) = delete;

    virtual std::expected<void, SharedData::TransferError> install(std::filesystem::path const& target) = 0;
};
