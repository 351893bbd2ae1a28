#pragma once

#include "fake_tool.hpp"

#include <backend/mocks/tool_installer_mock.hpp>
#include <backend/tool/http_tool_installer.hpp>
#include <backend/tool/tool_resolver.hpp>
#include <backend/mocks/downloader_mock.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <map>
#include <memory>

extern std::filesystem::path programDirectory;

namespace Test
{
    class ToolResolverTests : public ::testing::Test
    {
      protected:
        std::filesystem::path toolPath() const
        {
            return isolateDirectory_.path() / "bin" / "s5cmd";
        }

      protected:
        Utility::TemporaryDirectory isolateDirectory_{programDirectory / "temp", true};
        std::shared_ptr<::testing::StrictMock<ToolInstallerMock>> installer_ =
            std::make_shared<::testing::StrictMock<ToolInstallerMock>>();
    };

    TEST_F(ToolResolverTests, PresentToolIsUsedWithoutInstalling)
    {
        writeScript(toolPath(), "exit 0");
        ToolResolver resolver{toolPath(), installer_};

        const auto resolved = resolver.resolve();
        ASSERT_TRUE(resolved.has_value());
        EXPECT_EQ(*resolved, toolPath());
    }

    TEST_F(ToolResolverTests, MissingToolIsInstalledOnce)
    {
        EXPECT_CALL(*installer_, install(toolPath()))
            .WillOnce([](std::filesystem::path const& target) -> std::expected<void, SharedData::TransferError> {
                writeScript(target, "exit 0");
                return {};
            });
        ToolResolver resolver{toolPath(), installer_};

        ASSERT_TRUE(resolver.resolve().has_value());
        ASSERT_TRUE(resolver.resolve().has_value());
    }

    TEST_F(ToolResolverTests, FailedInstallationIsNotRetried)
    {
        EXPECT_CALL(*installer_, install(toolPath()))
            .WillOnce(::testing::Return(std::unexpected(SharedData::TransferError{
                .type = SharedData::TransferErrorType::DownloadError,
            })));
        ToolResolver resolver{toolPath(), installer_};

        const auto resolved = resolver.resolve();
        ASSERT_FALSE(resolved.has_value());
        EXPECT_EQ(resolved.error().type, SharedData::TransferErrorType::ToolUnavailable);
    }

    TEST_F(ToolResolverTests, InstallerThatLeavesNoExecutableIsUnavailable)
    {
        EXPECT_CALL(*installer_, install(toolPath()))
            .WillOnce([](std::filesystem::path const& target) -> std::expected<void, SharedData::TransferError> {
                std::filesystem::create_directories(target.parent_path());
                std::ofstream{target} << "not executable";
                return {};
            });
        ToolResolver resolver{toolPath(), installer_};

        const auto resolved = resolver.resolve();
        ASSERT_FALSE(resolved.has_value());
        EXPECT_EQ(resolved.error().type, SharedData::TransferErrorType::ToolUnavailable);
    }

    TEST_F(ToolResolverTests, NoInstallerMeansUnavailable)
    {
        ToolResolver resolver{toolPath(), nullptr};
        const auto resolved = resolver.resolve();
        ASSERT_FALSE(resolved.has_value());
        EXPECT_EQ(resolved.error().type, SharedData::TransferErrorType::ToolUnavailable);
    }

    TEST_F(ToolResolverTests, SharedResolverIsOnePerPath)
    {
        const auto first = ToolResolver::shared(toolPath(), installer_);
        const auto second = ToolResolver::shared(toolPath(), nullptr);
        const auto other = ToolResolver::shared(toolPath().parent_path() / "other", nullptr);
        EXPECT_EQ(first.get(), second.get());
        EXPECT_NE(first.get(), other.get());
    }

    TEST_F(ToolResolverTests, HttpInstallerPlacesAnExecutable)
    {
        auto downloader = std::make_shared<::testing::StrictMock<DownloaderMock>>();
        Persistence::InstallerOptions options{
            .downloadUrls = std::map<std::string, std::string>{
                {HttpToolInstaller::currentMachine(), "https://example.com/s5cmd"},
            }};
        HttpToolInstaller installer{downloader, options};

        EXPECT_CALL(*downloader, download("https://example.com/s5cmd", ::testing::_))
            .WillOnce([](std::string const&, std::filesystem::path const& localPath)
                          -> std::expected<void, SharedData::TransferError> {
                std::ofstream{localPath} << "#!/bin/sh\nexit 0\n";
                return {};
            });

        ASSERT_TRUE(installer.install(toolPath()).has_value());
        EXPECT_TRUE(ToolResolver::isExecutableFile(toolPath()));
        EXPECT_FALSE(std::filesystem::exists(toolPath().string() + ".download"));
    }

    TEST_F(ToolResolverTests, HttpInstallerRejectsUnknownArchitecture)
    {
        auto downloader = std::make_shared<::testing::StrictMock<DownloaderMock>>();
        HttpToolInstaller installer{
            downloader, Persistence::InstallerOptions{.downloadUrls = std::map<std::string, std::string>{}}};

        EXPECT_FALSE(installer.urlForMachine("sparc64"));
        const auto result = installer.install(toolPath());
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, SharedData::TransferErrorType::ToolUnavailable);
    }

    TEST_F(ToolResolverTests, HttpInstallerKnowsDefaultArchitectures)
    {
        HttpToolInstaller installer{nullptr, Persistence::InstallerOptions{}};
        EXPECT_TRUE(installer.urlForMachine("x86_64"));
        EXPECT_TRUE(installer.urlForMachine("aarch64"));
    }
}
