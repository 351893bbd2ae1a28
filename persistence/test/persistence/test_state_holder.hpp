#pragma once

#include <persistence/state_holder.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <fstream>
#include <string>

extern std::filesystem::path programDirectory;

namespace Persistence::Test
{
    class StateHolderTests : public ::testing::Test
    {
      protected:
        std::filesystem::path configPath() const
        {
            return isolateDirectory_.path() / "config" / "config.json";
        }

        void writeConfig(std::string const& content)
        {
            std::filesystem::create_directories(configPath().parent_path());
            std::ofstream{configPath(), std::ios_base::binary} << content;
        }

        nlohmann::json readConfig() const
        {
            std::ifstream reader{configPath(), std::ios_base::binary};
            return nlohmann::json::parse(reader);
        }

        bool loadInto(StateHolder& holder)
        {
            bool loaded = false;
            holder.load([&loaded](bool success, StateHolder&) {
                loaded = success;
            });
            return loaded;
        }

      protected:
        Utility::TemporaryDirectory isolateDirectory_{programDirectory / "temp", true};
    };

    TEST_F(StateHolderTests, MissingConfigIsCreatedWithDefaults)
    {
        StateHolder holder{configPath()};
        ASSERT_TRUE(loadInto(holder));

        auto const& options = holder.stateCache().runnerOptions;
        ASSERT_TRUE(options.toolPath.has_value());
        EXPECT_EQ(options.simplifiedOutput, true);
        EXPECT_EQ(options.runReportInterval, 5);
        EXPECT_EQ(options.syncReportInterval, 10);
        ASSERT_TRUE(holder.stateCache().installerOptions.downloadUrls.has_value());
        EXPECT_TRUE(holder.stateCache().installerOptions.downloadUrls->contains("x86_64"));

        ASSERT_TRUE(std::filesystem::exists(configPath()));
        const auto written = readConfig();
        EXPECT_EQ(written["runnerOptions"]["listReportInterval"], 5);
    }

    TEST_F(StateHolderTests, UserValuesArePreservedAndGapsFilled)
    {
        writeConfig(R"({
            // comments are allowed
            "runnerOptions": { "toolPath": "/opt/s5cmd", "runReportInterval": 2 },
            "logLevel": "debug"
        })");

        StateHolder holder{configPath()};
        ASSERT_TRUE(loadInto(holder));

        auto const& state = holder.stateCache();
        EXPECT_EQ(state.runnerOptions.toolPath, "/opt/s5cmd");
        EXPECT_EQ(state.runnerOptions.runReportInterval, 2);
        EXPECT_EQ(state.runnerOptions.copyReportInterval, 10);
        EXPECT_EQ(state.logLevel, Log::Level::Debug);
    }

    TEST_F(StateHolderTests, UnparsableConfigIsBackedUpAndReplaced)
    {
        writeConfig("{ this is not json");

        StateHolder holder{configPath()};
        ASSERT_TRUE(loadInto(holder));
        EXPECT_TRUE(holder.stateCache().runnerOptions.toolPath.has_value());

        bool backupFound = false;
        for (auto const& entry : std::filesystem::directory_iterator(configPath().parent_path()))
        {
            if (entry.path().filename().string().starts_with("config.json.backup_"))
                backupFound = true;
        }
        EXPECT_TRUE(backupFound);
        EXPECT_NO_THROW(readConfig());
    }

    TEST_F(StateHolderTests, LogFileIsOptional)
    {
        writeConfig(R"({ "logFile": "/var/log/s5run.log" })");

        StateHolder holder{configPath()};
        ASSERT_TRUE(loadInto(holder));
        EXPECT_EQ(holder.stateCache().logFile, "/var/log/s5run.log");
    }

    TEST(RunnerOptionsTests, UseDefaultsFromOnlyFillsUnsetMembers)
    {
        RunnerOptions options{.toolPath = "/custom", .syncReportInterval = 1};
        options.useDefaultsFrom(RunnerOptions::defaults());
        EXPECT_EQ(options.toolPath, "/custom");
        EXPECT_EQ(options.syncReportInterval, 1);
        EXPECT_EQ(options.listReportInterval, 5);
    }
}
