#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace Test
{
    /**
     * @brief Writes an executable /bin/sh script.
     */
    inline void writeScript(std::filesystem::path const& path, std::string const& body)
    {
        std::filesystem::create_directories(path.parent_path());
        {
            std::ofstream writer{path, std::ios_base::binary | std::ios_base::trunc};
            writer << "#!/bin/sh\n" << body << "\n";
        }
        std::filesystem::permissions(
            path,
            std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
                std::filesystem::perms::group_exec,
            std::filesystem::perm_options::replace);
    }

    inline std::string readWholeFile(std::filesystem::path const& path)
    {
        std::ifstream reader{path, std::ios_base::binary};
        return {std::istreambuf_iterator<char>{reader}, std::istreambuf_iterator<char>{}};
    }
}
