#pragma once

#include <utility/algorithm/string.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace Log
{
    enum class Level
    {
        Trace,
        Debug,
        Info,
        Warning,
        Error,
        Critical,
        Off
    };

    /**
     * @brief Parses a level name case insensitively. "warn" is accepted as an alias for "warning".
     *
     * @param str The level name.
     * @return std::optional<Level> nullopt when the name is unknown.
     */
    inline std::optional<Level> tryLevelFromString(std::string_view str)
    {
        const std::string lowered = Utility::Algorithm::toLowerCase(std::string{str});

        if (lowered == "trace")
            return Level::Trace;
        if (lowered == "debug")
            return Level::Debug;
        if (lowered == "info")
            return Level::Info;
        if (lowered == "warning" || lowered == "warn")
            return Level::Warning;
        if (lowered == "error")
            return Level::Error;
        if (lowered == "critical")
            return Level::Critical;
        if (lowered == "off")
            return Level::Off;
        return std::nullopt;
    }

    inline Level levelFromString(std::string_view str)
    {
        return tryLevelFromString(str).value_or(Level::Info);
    }

    inline std::string levelToString(Level lvl)
    {
        switch (lvl)
        {
            case Level::Trace:
                return "trace";
            case Level::Debug:
                return "debug";
            case Level::Info:
                return "info";
            case Level::Warning:
                return "warning";
            case Level::Error:
                return "error";
            case Level::Critical:
                return "critical";
            case Level::Off:
                return "off";
            default:
                return "info";
        }
    }
}
