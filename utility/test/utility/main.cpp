#include "test_temporary_directory.hpp"
#include "test_digest.hpp"
#include "test_string.hpp"
#include "test_format_bytes.hpp"

#include <gtest/gtest.h>

#include <filesystem>

std::filesystem::path programDirectory;

int main(int argc, char** argv)
{
    programDirectory = std::filesystem::path{argv[0]}.parent_path();

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
