#include <utility/temporary_directory.hpp>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>

namespace Utility
{
    TemporaryDirectory::TemporaryDirectory()
        : TemporaryDirectory{std::filesystem::temp_directory_path() / "s5run_tmpdir", true}
    {}

    TemporaryDirectory::TemporaryDirectory(std::filesystem::path basePath, bool removeBase)
        : basePath_{std::move(basePath)}
        , path_{}
        , removeBase_{removeBase}
    {
        std::error_code ec;
        std::filesystem::create_directories(basePath_, ec);
        if (ec)
            throw std::runtime_error("Could not create temporary base directory " + basePath_.string() + ": " + ec.message());

        std::string dirNameAsString{(basePath_ / "dirXXXXXX").string()};
        if (mkdtemp(dirNameAsString.data()) == nullptr || !std::filesystem::is_directory(dirNameAsString))
            throw std::runtime_error("Could not setup temporary directory in: " + basePath_.string());

        path_ = dirNameAsString;
    }

    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code error;
        std::filesystem::remove_all(path_, error);
        if (removeBase_)
            std::filesystem::remove(basePath_, error);
    }

    std::filesystem::path const& TemporaryDirectory::path() const
    {
        return path_;
    }
}
