#pragma once

#include <shared_data/transfer_error.hpp>

#include <expected>
#include <filesystem>
#include <string>

/**
 * @brief Fetches a remote http(s) resource into a local file.
 */
class Downloader
{
  public:
    Downloader() = default;
    virtual ~Downloader() = default;
    Downloader(Downloader const&) = delete;
    Downloader& operator=(Downloader const&) = delete;
    Downloader(Downloader&&) = delete;
    Downloader& operator=(Downloader&&) = delete;

    /**
     * @brief Downloads url into localPath, replacing an existing file.
     *
     * @return DownloadError on failure. No partial file is left behind in that case.
     */
    virtual std::expected<void, SharedData::TransferError>
    download(std::string const& url, std::filesystem::path const& localPath) = 0;
};
