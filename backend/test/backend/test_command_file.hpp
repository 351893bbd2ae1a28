#pragma once

#include <backend/transfer/command_file.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <fstream>
#include <iterator>
#include <set>
#include <string>

extern std::filesystem::path programDirectory;

namespace Test
{
    class CommandFileTests : public ::testing::Test
    {
      protected:
        std::string readFile(std::filesystem::path const& path) const
        {
            std::ifstream reader{path, std::ios_base::binary};
            return {std::istreambuf_iterator<char>{reader}, std::istreambuf_iterator<char>{}};
        }

        std::size_t filesInScratch() const
        {
            std::size_t count = 0;
            if (!std::filesystem::exists(isolateDirectory_.path()))
                return count;
            for ([[maybe_unused]] auto const& entry : std::filesystem::directory_iterator{isolateDirectory_.path()})
                ++count;
            return count;
        }

      protected:
        Utility::TemporaryDirectory isolateDirectory_{programDirectory / "temp", true};
    };

    TEST_F(CommandFileTests, OneLinePerRequestInOrder)
    {
        auto batch = SharedData::TransferBatch::intoDirectory({"s3://b/x.csv", "s3://b/y.csv"}, "/tmp/out");
        ASSERT_TRUE(batch.has_value());

        auto file = CommandFile::generate(*batch, isolateDirectory_.path());
        ASSERT_TRUE(file.has_value()) << file.error().toString();

        EXPECT_EQ(readFile(file->path()), "cp s3://b/x.csv /tmp/out/x.csv\ncp s3://b/y.csv /tmp/out/y.csv\n");
        EXPECT_EQ(file->lineCount(), 2);
    }

    TEST_F(CommandFileTests, TrailingSlashOfDestinationIsNotDoubled)
    {
        const SharedData::TransferRequest request{"s3://b/dir/file.bin", "/data/"};
        EXPECT_EQ(CommandFile::commandLine(request), "cp s3://b/dir/file.bin /data/file.bin\n");
    }

    TEST_F(CommandFileTests, NameContainsFingerprint)
    {
        auto batch = SharedData::TransferBatch::intoDirectory({"s3://b/a.txt"}, "/dest");
        ASSERT_TRUE(batch.has_value());

        auto file = CommandFile::generate(*batch, isolateDirectory_.path());
        ASSERT_TRUE(file.has_value()) << file.error().toString();

        const auto name = file->path().filename().string();
        EXPECT_TRUE(name.starts_with("s5cmd_commands_"));
        EXPECT_TRUE(name.ends_with("_eda57e71.txt"));
        EXPECT_EQ(file->fingerprint(), "eda57e71");
        EXPECT_EQ(file->path().parent_path(), isolateDirectory_.path());
    }

    TEST_F(CommandFileTests, FileIsRemovedWithTheObject)
    {
        auto batch = SharedData::TransferBatch::intoDirectory({"s3://b/a.txt"}, "/dest");
        ASSERT_TRUE(batch.has_value());

        std::filesystem::path path{};
        {
            auto file = CommandFile::generate(*batch, isolateDirectory_.path());
            ASSERT_TRUE(file.has_value());
            path = file->path();
            EXPECT_TRUE(std::filesystem::exists(path));
        }
        EXPECT_FALSE(std::filesystem::exists(path));
        EXPECT_EQ(filesInScratch(), 0);
    }

    TEST_F(CommandFileTests, MovedFromObjectDoesNotRemoveTheFile)
    {
        auto batch = SharedData::TransferBatch::intoDirectory({"s3://b/a.txt"}, "/dest");
        ASSERT_TRUE(batch.has_value());

        auto file = CommandFile::generate(*batch, isolateDirectory_.path());
        ASSERT_TRUE(file.has_value());
        {
            CommandFile moved{std::move(*file)};
            EXPECT_TRUE(std::filesystem::exists(moved.path()));
        }
        EXPECT_EQ(filesInScratch(), 0);
    }

    TEST_F(CommandFileTests, IdenticalBatchesInTheSameSecondGetDistinctFiles)
    {
        auto batch = SharedData::TransferBatch::intoDirectory({"s3://b/a.txt"}, "/dest");
        ASSERT_TRUE(batch.has_value());

        auto first = CommandFile::generate(*batch, isolateDirectory_.path());
        auto second = CommandFile::generate(*batch, isolateDirectory_.path());
        ASSERT_TRUE(first.has_value());
        ASSERT_TRUE(second.has_value());
        EXPECT_NE(first->path(), second->path());
        EXPECT_EQ(filesInScratch(), 2);
    }

    TEST_F(CommandFileTests, FileNameNumbersRetries)
    {
        EXPECT_EQ(CommandFile::fileName("20240115-103000", "eda57e71"), "s5cmd_commands_20240115-103000_eda57e71.txt");
        EXPECT_EQ(
            CommandFile::fileName("20240115-103000", "eda57e71", 2), "s5cmd_commands_20240115-103000_eda57e71_2.txt");
    }
}
