#pragma once

#include <backend/download/downloader.hpp>

#include <gmock/gmock.h>

namespace Test
{
    class DownloaderMock : public Downloader
    {
      public:
        MOCK_METHOD(
            (std::expected<void, SharedData::TransferError>),
            download,
            (std::string const& url, std::filesystem::path const& localPath),
            (override));
    };
}
