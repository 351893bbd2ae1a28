#include <backend/transfer/scratch_file.hpp>

#include <log/log.hpp>

#include <system_error>
#include <utility>

ScratchFile::ScratchFile()
    : path_{}
    , owned_{false}
{}

ScratchFile::ScratchFile(std::filesystem::path path)
    : path_{std::move(path)}
    , owned_{true}
{}

ScratchFile::~ScratchFile()
{
    remove();
}

ScratchFile::ScratchFile(ScratchFile&& other) noexcept
    : path_{std::move(other.path_)}
    , owned_{std::exchange(other.owned_, false)}
{}

ScratchFile& ScratchFile::operator=(ScratchFile&& other) noexcept
{
    if (this != &other)
    {
        remove();
        path_ = std::move(other.path_);
        owned_ = std::exchange(other.owned_, false);
    }
    return *this;
}

std::filesystem::path const& ScratchFile::path() const
{
    return path_;
}

std::filesystem::path ScratchFile::release()
{
    owned_ = false;
    return path_;
}

void ScratchFile::remove()
{
    if (!owned_)
        return;
    owned_ = false;

    std::error_code ec;
    if (!std::filesystem::remove(path_, ec) && ec)
    {
        Log::error("ScratchFile: failed to remove '{}': {}", path_.string(), ec.message());
        return;
    }
    Log::debug("ScratchFile: removed '{}'.", path_.string());
}

bool ScratchFile::owns() const
{
    return owned_;
}
