#include <backend/tool/tool_resolver.hpp>

#include <log/log.hpp>

#include <map>
#include <system_error>

#include <unistd.h>

using SharedData::TransferError;
using SharedData::TransferErrorType;

ToolResolver::ToolResolver(std::filesystem::path toolPath, std::shared_ptr<ToolInstaller> installer)
    : toolPath_{std::move(toolPath)}
    , installer_{std::move(installer)}
    , guard_{}
    , resolved_{false}
{}

std::shared_ptr<ToolResolver>
ToolResolver::shared(std::filesystem::path const& toolPath, std::shared_ptr<ToolInstaller> installer)
{
    static std::mutex registryGuard;
    static std::map<std::filesystem::path, std::shared_ptr<ToolResolver>> registry;

    std::scoped_lock lock{registryGuard};
    auto iter = registry.find(toolPath);
    if (iter != registry.end())
        return iter->second;

    auto resolver = std::make_shared<ToolResolver>(toolPath, std::move(installer));
    registry.emplace(toolPath, resolver);
    return resolver;
}

bool ToolResolver::isExecutableFile(std::filesystem::path const& path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec)
        return false;
    return ::access(path.c_str(), X_OK) == 0;
}

std::expected<std::filesystem::path, TransferError> ToolResolver::resolve()
{
    std::scoped_lock lock{guard_};

    if (isExecutableFile(toolPath_))
    {
        if (!resolved_)
            Log::debug("ToolResolver: using transfer tool at '{}'.", toolPath_.string());
        resolved_ = true;
        return toolPath_;
    }

    if (resolved_)
        Log::warn("ToolResolver: transfer tool at '{}' disappeared, reinstalling.", toolPath_.string());
    resolved_ = false;

    if (!installer_)
    {
        return std::unexpected(TransferError{
            .type = TransferErrorType::ToolUnavailable,
            .extraInfo = "No executable at '" + toolPath_.string() + "' and no installer configured",
        });
    }

    Log::info("ToolResolver: transfer tool not found at '{}', installing.", toolPath_.string());
    const auto installResult = installer_->install(toolPath_);
    if (!installResult.has_value())
        Log::error("ToolResolver: installation failed: {}", installResult.error().toString());

    if (!isExecutableFile(toolPath_))
    {
        return std::unexpected(TransferError{
            .type = TransferErrorType::ToolUnavailable,
            .extraInfo = "No executable at '" + toolPath_.string() + "' after installation attempt",
        });
    }

    Log::info("ToolResolver: installed transfer tool at '{}'.", toolPath_.string());
    resolved_ = true;
    return toolPath_;
}

std::filesystem::path const& ToolResolver::toolPath() const
{
    return toolPath_;
}
