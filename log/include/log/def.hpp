#pragma once

namespace Log
{
    constexpr char const* defaultLoggerName = "s5run";
    constexpr char const* defaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
}
