#pragma once

#include <filesystem>
#include <string>

namespace Persistence
{
    /**
     * @brief $HOME, or the current directory when HOME is not set.
     */
    std::filesystem::path homeDirectory();

    /**
     * @brief $XDG_CONFIG_HOME/s5run/config.json, falling back to ~/.config/s5run/config.json.
     */
    std::filesystem::path defaultConfigPath();

    /**
     * @brief Replaces a leading "~" with the home directory.
     */
    std::filesystem::path expandHome(std::string const& path);
}
