#include <backend/download/http_downloader.hpp>

#include <log/log.hpp>

#include <curl/curl.h>

#include <array>
#include <cstdio>
#include <memory>
#include <mutex>
#include <system_error>

using SharedData::TransferError;
using SharedData::TransferErrorType;

namespace
{
    void initializeCurlOnce()
    {
        static std::once_flag once;
        std::call_once(once, []() {
            curl_global_init(CURL_GLOBAL_DEFAULT);
        });
    }

    std::size_t writeToFile(char* data, std::size_t size, std::size_t count, void* userData)
    {
        return std::fwrite(data, size, count, static_cast<std::FILE*>(userData));
    }

    TransferError downloadError(std::string const& url, std::string const& reason)
    {
        return TransferError{
            .type = TransferErrorType::DownloadError,
            .extraInfo = "Downloading '" + url + "' failed: " + reason,
        };
    }
}

HttpDownloader::HttpDownloader()
    : HttpDownloader{Options{}}
{}

HttpDownloader::HttpDownloader(Options options)
    : options_{std::move(options)}
{
    initializeCurlOnce();
}

std::expected<void, TransferError>
HttpDownloader::download(std::string const& url, std::filesystem::path const& localPath)
{
    const auto removePartial = [&localPath]() {
        std::error_code ec;
        std::filesystem::remove(localPath, ec);
        if (ec)
            Log::warn("HttpDownloader: could not remove partial file '{}': {}", localPath.string(), ec.message());
    };

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle{curl_easy_init(), &curl_easy_cleanup};
    if (!handle)
        return std::unexpected(downloadError(url, "could not create a curl handle"));

    std::unique_ptr<std::FILE, decltype(&std::fclose)> file{std::fopen(localPath.c_str(), "wb"), &std::fclose};
    if (!file)
        return std::unexpected(downloadError(url, "could not open '" + localPath.string() + "' for writing"));

    std::array<char, CURL_ERROR_SIZE> errorBuffer{};
    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_MAXREDIRS, options_.maxRedirects);
    curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connectTimeout.count()));
    curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, options_.userAgent.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, &writeToFile);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, file.get());
    curl_easy_setopt(handle.get(), CURLOPT_ERRORBUFFER, errorBuffer.data());
    curl_easy_setopt(handle.get(), CURLOPT_FAILONERROR, 0L);

    Log::info("HttpDownloader: downloading '{}' to '{}'.", url, localPath.string());
    const CURLcode result = curl_easy_perform(handle.get());

    long status = 0;
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);

    const bool closedCleanly = std::fclose(file.release()) == 0;

    if (result != CURLE_OK)
    {
        removePartial();
        const std::string reason = errorBuffer[0] != '\0' ? std::string{errorBuffer.data()}
                                                           : std::string{curl_easy_strerror(result)};
        return std::unexpected(downloadError(url, reason));
    }
    if (status >= 400)
    {
        removePartial();
        return std::unexpected(downloadError(url, "http status " + std::to_string(status)));
    }
    if (!closedCleanly)
    {
        removePartial();
        return std::unexpected(downloadError(url, "could not finish writing '" + localPath.string() + "'"));
    }

    Log::debug("HttpDownloader: finished '{}' with status {}.", url, status);
    return {};
}
