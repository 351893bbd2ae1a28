#pragma once

#include <filesystem>

/**
 * @brief Owns a file in the scratch directory and removes it on destruction unless released.
 * Removal failures are logged.
 */
class ScratchFile
{
  public:
    ScratchFile();
    explicit ScratchFile(std::filesystem::path path);
    ~ScratchFile();
    ScratchFile(ScratchFile const&) = delete;
    ScratchFile& operator=(ScratchFile const&) = delete;
    ScratchFile(ScratchFile&& other) noexcept;
    ScratchFile& operator=(ScratchFile&& other) noexcept;

    std::filesystem::path const& path() const;

    /**
     * @brief Gives up ownership, the file stays where it is.
     */
    std::filesystem::path release();

    /**
     * @brief Removes the file now. Does nothing when it was already removed or released.
     */
    void remove();

    bool owns() const;

  private:
    std::filesystem::path path_;
    bool owned_;
};
