#pragma once

#include <backend/process/process_output.hpp>

#include <gmock/gmock.h>

namespace Test
{
    class ProcessOutputMock : public IProcessOutput
    {
      public:
        MOCK_METHOD(
            (std::expected<std::optional<std::string>, SharedData::TransferError>),
            readLine,
            (),
            (override));
        MOCK_METHOD(bool, hasExited, (), (override));
        MOCK_METHOD((std::expected<int, SharedData::TransferError>), wait, (), (override));
    };
}
