#pragma once

#include <backend/transfer/fingerprint.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>

namespace Test
{
    TEST(FingerprintTests, SingleSourceHasKnownValue)
    {
        const auto fingerprint = batchFingerprint({"s3://b/a.txt"});
        ASSERT_TRUE(fingerprint.has_value());
        EXPECT_EQ(*fingerprint, "eda57e71");
    }

    TEST(FingerprintTests, IsDeterministicAndHex)
    {
        const std::vector<std::string> sources{"s3://b/x.csv", "s3://b/longer.csv", "s3://b/z"};
        const auto first = batchFingerprint(sources);
        const auto second = batchFingerprint(sources);
        ASSERT_TRUE(first.has_value());
        ASSERT_TRUE(second.has_value());
        EXPECT_EQ(*first, *second);
        EXPECT_EQ(*first, "b1ed22c7");
        ASSERT_EQ(first->size(), 8);
        EXPECT_TRUE(std::all_of(first->begin(), first->end(), [](char c) {
            return std::isxdigit(static_cast<unsigned char>(c)) != 0 && !std::isupper(static_cast<unsigned char>(c));
        }));
    }

    TEST(FingerprintTests, BatchesWithSameShapeCollide)
    {
        const auto first = batchFingerprint({"s3://b/x.csv", "s3://b/y.csv"});
        const auto second = batchFingerprint({"s3://c/p.txt", "s3://c/q.txt"});
        ASSERT_TRUE(first.has_value());
        ASSERT_TRUE(second.has_value());
        EXPECT_EQ(*first, "2b091abc");
        EXPECT_EQ(*first, *second);
    }

    TEST(FingerprintTests, LengthsCountCharactersNotBytes)
    {
        // "s3://b/\u00e4.txt" has as many characters as "s3://b/a.txt".
        const auto fingerprint = batchFingerprint({"s3://b/\xc3\xa4.txt"});
        ASSERT_TRUE(fingerprint.has_value());
        EXPECT_EQ(*fingerprint, "eda57e71");
    }

    TEST(FingerprintTests, EmptyInputIsRejected)
    {
        const auto fingerprint = batchFingerprint({});
        ASSERT_FALSE(fingerprint.has_value());
        EXPECT_EQ(fingerprint.error().type, SharedData::TransferErrorType::EmptyInput);
    }
}
