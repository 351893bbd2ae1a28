#pragma once

#include <persistence/state_core.hpp>

#include <map>
#include <optional>
#include <string>

namespace Persistence
{
    struct InstallerOptions
    {
        /// Machine architecture (as reported by uname) -> download url of the transfer tool.
        std::optional<std::map<std::string, std::string>> downloadUrls{std::nullopt};

        void useDefaultsFrom(InstallerOptions const& other);

        static InstallerOptions defaults();
    };
    void to_json(nlohmann::json& j, InstallerOptions const& options);
    void from_json(nlohmann::json const& j, InstallerOptions& options);
}
