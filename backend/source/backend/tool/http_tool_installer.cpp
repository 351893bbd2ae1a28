#include <backend/tool/http_tool_installer.hpp>

#include <log/log.hpp>

#include <system_error>

#include <sys/utsname.h>

using SharedData::TransferError;
using SharedData::TransferErrorType;

HttpToolInstaller::HttpToolInstaller(std::shared_ptr<Downloader> downloader, Persistence::InstallerOptions options)
    : downloader_{std::move(downloader)}
    , options_{std::move(options)}
{
    options_.useDefaultsFrom(Persistence::InstallerOptions::defaults());
}

std::string HttpToolInstaller::currentMachine()
{
    struct utsname name{};
    if (::uname(&name) != 0)
        return {};
    return name.machine;
}

std::optional<std::string> HttpToolInstaller::urlForMachine(std::string const& machine) const
{
    if (!options_.downloadUrls)
        return std::nullopt;

    auto iter = options_.downloadUrls->find(machine);
    if (iter == options_.downloadUrls->end())
        return std::nullopt;
    return iter->second;
}

std::expected<void, TransferError> HttpToolInstaller::install(std::filesystem::path const& target)
{
    const auto machine = currentMachine();
    const auto url = urlForMachine(machine);
    if (!url)
    {
        return std::unexpected(TransferError{
            .type = TransferErrorType::ToolUnavailable,
            .extraInfo = "No transfer tool download configured for architecture '" + machine + "'",
        });
    }

    std::error_code ec;
    if (target.has_parent_path())
        std::filesystem::create_directories(target.parent_path(), ec);

    auto partial = target;
    partial += ".download";

    Log::info("HttpToolInstaller: downloading '{}' to '{}'.", *url, target.string());
    if (auto result = downloader_->download(*url, partial); !result.has_value())
        return std::unexpected(result.error());

    std::filesystem::rename(partial, target, ec);
    if (ec)
    {
        const auto message = ec.message();
        std::filesystem::remove(partial, ec);
        return std::unexpected(TransferError{
            .type = TransferErrorType::ToolUnavailable,
            .extraInfo = "Could not move the downloaded tool into place: " + message,
        });
    }

    std::filesystem::permissions(
        target,
        std::filesystem::perms::owner_all | std::filesystem::perms::group_read | std::filesystem::perms::group_exec |
            std::filesystem::perms::others_read | std::filesystem::perms::others_exec,
        std::filesystem::perm_options::replace,
        ec);
    if (ec)
    {
        return std::unexpected(TransferError{
            .type = TransferErrorType::ToolUnavailable,
            .extraInfo = "Could not mark the tool executable: " + ec.message(),
        });
    }
    return {};
}
