#include <shared_data/transfer_error.hpp>

#include <fmt/format.h>

namespace SharedData
{
    std::string TransferError::toString() const
    {
        const auto enumString = transferErrorTypeToString(type);
        if (exitCode.has_value())
        {
            if (extraInfo)
                return fmt::format("{}: exit code {}. {}.", enumString, *exitCode, *extraInfo);
            else
                return fmt::format("{}: exit code {}.", enumString, *exitCode);
        }
        if (extraInfo)
            return fmt::format("{}: {}.", enumString, *extraInfo);
        return enumString;
    }
}
