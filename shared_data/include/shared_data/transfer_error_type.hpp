#pragma once

#include <string>

namespace SharedData
{
    enum class TransferErrorType
    {
        ImplementationError, // This should never occur, it indicates a bug in the program.
        EmptyInput,
        ToolUnavailable,
        UnsupportedOperation,
        StreamReadError,
        DownloadError,
        StartFailed,
        ToolFailed,
        CommandFileError,
        InvalidLocator,
        Interrupted
    };

    inline std::string transferErrorTypeToString(TransferErrorType type)
    {
        switch (type)
        {
            case TransferErrorType::ImplementationError:
                return "ImplementationError";
            case TransferErrorType::EmptyInput:
                return "EmptyInput";
            case TransferErrorType::ToolUnavailable:
                return "ToolUnavailable";
            case TransferErrorType::UnsupportedOperation:
                return "UnsupportedOperation";
            case TransferErrorType::StreamReadError:
                return "StreamReadError";
            case TransferErrorType::DownloadError:
                return "DownloadError";
            case TransferErrorType::StartFailed:
                return "StartFailed";
            case TransferErrorType::ToolFailed:
                return "ToolFailed";
            case TransferErrorType::CommandFileError:
                return "CommandFileError";
            case TransferErrorType::InvalidLocator:
                return "InvalidLocator";
            case TransferErrorType::Interrupted:
                return "Interrupted";
        }
        return "INVALID_ENUM_VALUE";
    }
}
