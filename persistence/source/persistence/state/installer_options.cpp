#include <persistence/state/installer_options.hpp>

namespace Persistence
{
    void InstallerOptions::useDefaultsFrom(InstallerOptions const& other)
    {
        if (!downloadUrls)
            downloadUrls = other.downloadUrls;
    }

    InstallerOptions InstallerOptions::defaults()
    {
        return InstallerOptions{
            .downloadUrls =
                std::map<std::string, std::string>{
                    {"x86_64",
                     "https://huggingface.co/kiriyamaX/s5cmd-backup/resolve/main/s5cmd_2.2.2_Linux-64bit/s5cmd"},
                    {"aarch64",
                     "https://huggingface.co/kiriyamaX/s5cmd-backup/resolve/main/s5cmd_2.2.2_Linux-arm64/s5cmd"},
                },
        };
    }

    void to_json(nlohmann::json& j, InstallerOptions const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, downloadUrls);
    }
    void from_json(nlohmann::json const& j, InstallerOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, downloadUrls);
    }
}
