#pragma once

#include <backend/download/downloader.hpp>

#include <chrono>
#include <string>

/**
 * @brief Downloader over libcurl. Follows redirects and treats http status codes >= 400 as failure.
 */
class HttpDownloader : public Downloader
{
  public:
    struct Options
    {
        long maxRedirects{5};
        std::chrono::seconds connectTimeout{60};
        std::string userAgent{"s5run"};
    };

    HttpDownloader();
    explicit HttpDownloader(Options options);
    ~HttpDownloader() override = default;

    std::expected<void, SharedData::TransferError>
    download(std::string const& url, std::filesystem::path const& localPath) override;

  private:
    Options options_;
};
