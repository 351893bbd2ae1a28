#pragma once

#include <utility/algorithm/string.hpp>

#include <gtest/gtest.h>

namespace Utility::Test
{
    TEST(StringAlgorithmTests, TrimRemovesSurroundingWhitespaceAndNewlines)
    {
        EXPECT_EQ(Algorithm::trim("  a b  \r\n"), "a b");
        EXPECT_EQ(Algorithm::trim("\t\n"), "");
        EXPECT_EQ(Algorithm::trim(""), "");
    }

    TEST(StringAlgorithmTests, ToLowerCase)
    {
        EXPECT_EQ(Algorithm::toLowerCase("WaRnInG"), "warning");
    }

    TEST(StringAlgorithmTests, LastSegment)
    {
        EXPECT_EQ(Algorithm::lastSegment("s3://bucket/dir/file.txt"), "file.txt");
        EXPECT_EQ(Algorithm::lastSegment("file.txt"), "file.txt");
        EXPECT_EQ(Algorithm::lastSegment("dir/"), "");
    }

    TEST(StringAlgorithmTests, CodePointCount)
    {
        EXPECT_EQ(Algorithm::codePointCount(""), 0);
        EXPECT_EQ(Algorithm::codePointCount("abc"), 3);
        EXPECT_EQ(Algorithm::codePointCount("\xc3\xa4"), 1);
        EXPECT_EQ(Algorithm::codePointCount("s3://b/\xe6\x97\xa5\xe6\x9c\xac.txt"), 13);
        EXPECT_EQ(Algorithm::codePointCount("\xf0\x9f\x93\x81"), 1);
    }
}
