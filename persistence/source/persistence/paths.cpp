#include <persistence/paths.hpp>

#include <cstdlib>

namespace Persistence
{
    std::filesystem::path homeDirectory()
    {
        if (char const* home = std::getenv("HOME"); home != nullptr && *home != '\0')
            return home;
        return std::filesystem::current_path();
    }

    std::filesystem::path defaultConfigPath()
    {
        if (char const* configHome = std::getenv("XDG_CONFIG_HOME"); configHome != nullptr && *configHome != '\0')
            return std::filesystem::path{configHome} / "s5run" / "config.json";
        return homeDirectory() / ".config" / "s5run" / "config.json";
    }

    std::filesystem::path expandHome(std::string const& path)
    {
        if (path == "~")
            return homeDirectory();
        if (path.starts_with("~/"))
            return homeDirectory() / path.substr(2);
        return path;
    }
}
