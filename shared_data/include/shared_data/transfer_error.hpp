#pragma once

#include <shared_data/transfer_error_type.hpp>

#include <optional>
#include <string>

namespace SharedData
{
    struct TransferError
    {
        TransferErrorType type;
        // Set when the external tool ran and exited unsuccessfully.
        std::optional<int> exitCode = std::nullopt;
        std::optional<std::string> extraInfo = std::nullopt;

        std::string toString() const;
    };
}
