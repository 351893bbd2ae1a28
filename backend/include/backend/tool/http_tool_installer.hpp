#pragma once

#include <backend/download/downloader.hpp>
#include <backend/tool/tool_installer.hpp>
#include <persistence/state/installer_options.hpp>

#include <memory>
#include <optional>
#include <string>

/**
 * @brief Installs the transfer tool by downloading the build that matches the machine architecture.
 */
class HttpToolInstaller : public ToolInstaller
{
  public:
    HttpToolInstaller(std::shared_ptr<Downloader> downloader, Persistence::InstallerOptions options);

    std::expected<void, SharedData::TransferError> install(std::filesystem::path const& target) override;

    /**
     * @brief Looks up the download url for a machine name as reported by uname (e.g. x86_64).
     */
    std::optional<std::string> urlForMachine(std::string const& machine) const;

    static std::string currentMachine();

  private:
    std::shared_ptr<Downloader> downloader_;
    Persistence::InstallerOptions options_;
};
