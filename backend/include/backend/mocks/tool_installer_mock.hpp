#pragma once

#include <backend/tool/tool_installer.hpp>

#include <gmock/gmock.h>

namespace Test
{
    class ToolInstallerMock : public ToolInstaller
    {
      public:
        MOCK_METHOD(
            (std::expected<void, SharedData::TransferError>),
            install,
            (std::filesystem::path const& target),
            (override));
    };
}
