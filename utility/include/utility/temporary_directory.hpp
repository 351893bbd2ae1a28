#pragma once

#include <filesystem>

namespace Utility
{
    /**
     * @brief Creates a uniquely named directory below a base directory and removes it (recursively) on destruction.
     */
    class TemporaryDirectory
    {
      public:
        TemporaryDirectory();

        /**
         * @param basePath Directory in which the unique directory is created. Created if missing.
         * @param removeBase Also try to remove the base directory on destruction (only succeeds when empty).
         */
        TemporaryDirectory(std::filesystem::path basePath, bool removeBase);
        ~TemporaryDirectory();

        TemporaryDirectory(TemporaryDirectory const&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory const&) = delete;

        TemporaryDirectory(TemporaryDirectory&&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

        std::filesystem::path const& path() const;

      private:
        std::filesystem::path basePath_;
        std::filesystem::path path_;
        bool removeBase_;
    };
}
