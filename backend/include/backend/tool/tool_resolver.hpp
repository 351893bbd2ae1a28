#pragma once

#include <backend/tool/tool_installer.hpp>
#include <shared_data/transfer_error.hpp>

#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>

/**
 * @brief Owns the lazily established location of the external transfer executable.
 *
 * The first successful resolution is cached. A later resolve only repeats the check and installation when the cached
 * path stopped being an executable file. Concurrent first resolutions are serialized.
 */
class ToolResolver
{
  public:
    ToolResolver(std::filesystem::path toolPath, std::shared_ptr<ToolInstaller> installer);

    /**
     * @brief Returns the process wide resolver for the given tool path, creating it on first use.
     * An installer passed for an already registered path is ignored.
     */
    static std::shared_ptr<ToolResolver>
    shared(std::filesystem::path const& toolPath, std::shared_ptr<ToolInstaller> installer);

    /**
     * @return The executable path, or ToolUnavailable when neither the check nor one installation attempt succeed.
     */
    std::expected<std::filesystem::path, SharedData::TransferError> resolve();

    std::filesystem::path const& toolPath() const;

    static bool isExecutableFile(std::filesystem::path const& path);

  private:
    std::filesystem::path toolPath_;
    std::shared_ptr<ToolInstaller> installer_;
    std::mutex guard_;
    bool resolved_;
};
