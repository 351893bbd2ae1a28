#pragma once

#include <shared_data/transfer_error.hpp>

#include <gtest/gtest.h>

namespace SharedData::Test
{
    TEST(TransferErrorTests, ToStringWithoutDetails)
    {
        EXPECT_EQ(TransferError{.type = TransferErrorType::EmptyInput}.toString(), "EmptyInput");
    }

    TEST(TransferErrorTests, ToStringWithExtraInfo)
    {
        const TransferError error{.type = TransferErrorType::ToolUnavailable, .extraInfo = "not executable"};
        EXPECT_EQ(error.toString(), "ToolUnavailable: not executable.");
    }

    TEST(TransferErrorTests, ToStringWithExitCode)
    {
        const TransferError error{.type = TransferErrorType::ToolFailed, .exitCode = 3, .extraInfo = "run"};
        EXPECT_EQ(error.toString(), "ToolFailed: exit code 3. run.");
    }
}
