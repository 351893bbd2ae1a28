#include "test_fingerprint.hpp"
#include "test_command_file.hpp"
#include "test_progress_aggregator.hpp"
#include "test_listing_parser.hpp"
#include "test_locator_normalization.hpp"
#include "test_process.hpp"
#include "test_tool_resolver.hpp"
#include "test_http_downloader.hpp"
#include "test_transfer_runner.hpp"

#include <log/log.hpp>

#include <gtest/gtest.h>

#include <filesystem>

std::filesystem::path programDirectory;

int main(int argc, char** argv)
{
    Log::setLevel(Log::Level::Off);

    // The fake tool scripts refer to absolute paths.
    programDirectory = std::filesystem::absolute(std::filesystem::path{argv[0]}).parent_path();

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
