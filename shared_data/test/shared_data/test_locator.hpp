#pragma once

#include <shared_data/locator.hpp>

#include <gtest/gtest.h>

namespace SharedData::Test
{
    TEST(LocatorTests, ObjectStorageUrisAreRecognized)
    {
        const auto locator = classifyLocator("s3://bucket/key/file.txt");
        ASSERT_TRUE(isObjectStorage(locator));
        EXPECT_EQ(locatorString(locator), "s3://bucket/key/file.txt");
    }

    TEST(LocatorTests, HttpAndHttpsUrlsAreRemote)
    {
        EXPECT_TRUE(isRemote(classifyLocator("http://example.com/a.txt")));
        EXPECT_TRUE(isRemote(classifyLocator("https://example.com/a.txt")));
    }

    TEST(LocatorTests, EverythingElseIsLocal)
    {
        EXPECT_TRUE(isLocal(classifyLocator("/tmp/file.txt")));
        EXPECT_TRUE(isLocal(classifyLocator("relative/dir/")));
        EXPECT_TRUE(isLocal(classifyLocator("ftp://host/file")));
        EXPECT_TRUE(isLocal(classifyLocator("")));
    }

    TEST(LocatorTests, BaseNameIsFinalPathSegment)
    {
        EXPECT_EQ(locatorBaseName(classifyLocator("s3://b/x.csv")), "x.csv");
        EXPECT_EQ(locatorBaseName(classifyLocator("/tmp/dir/y.csv")), "y.csv");
        EXPECT_EQ(locatorBaseName(classifyLocator("plain.txt")), "plain.txt");
    }

    TEST(LocatorTests, BaseNameOfUrlIgnoresQueryAndFragment)
    {
        EXPECT_EQ(locatorBaseName(classifyLocator("https://example.com/files/list.txt?download=1#top")), "list.txt");
        EXPECT_EQ(locatorBaseName(classifyLocator("https://example.com")), "");
    }

    TEST(LocatorTests, KindNames)
    {
        EXPECT_EQ(locatorKindName(classifyLocator("s3://b/")), "object storage");
        EXPECT_EQ(locatorKindName(classifyLocator("https://a/b")), "remote");
        EXPECT_EQ(locatorKindName(classifyLocator("/a")), "local");
    }
}
