#pragma once

#include <log/level.hpp>
#include <log/def.hpp>
#include <log/logger.hpp>

#include <string>
#include <string_view>

namespace Log
{
    namespace Detail
    {
        extern Logger logger;
    }

    /**
     * @brief Log a message.
     *
     * @tparam Args Format template arguments.
     * @param level Log level.
     * @param fmt Format string.
     * @param args Format string arguments.
     */
    template <typename... Args>
    void log(Log::Level level, std::string_view fmt, Args&&... args)
    {
        Detail::logger.log(level, fmt, std::forward<Args>(args)...);
    }

    /**
     * @brief Sets up the process wide logger (stderr and optional log file).
     *
     * @param options
     */
    void setup(LoggerOptions const& options);

    /**
     * @brief Set the log level.
     *
     * @param level
     */
    inline void setLevel(Log::Level level)
    {
        Detail::logger.setLevel(level);
    }

    /**
     * @brief Get the log level.
     *
     * @return Log::Level
     */
    inline Log::Level level()
    {
        return Detail::logger.level();
    }

    inline void flush()
    {
        Detail::logger.flush();
    }

    template <typename... Args>
    inline void trace(std::string_view fmt, Args&&... args)
    {
        return log(Log::Level::Trace, std::move(fmt), std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void debug(std::string_view fmt, Args&&... args)
    {
        return log(Log::Level::Debug, std::move(fmt), std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void info(std::string_view fmt, Args&&... args)
    {
        return log(Log::Level::Info, std::move(fmt), std::forward<Args>(args)...);
    }

    /**
     * @brief Convenience function to log at warn level. Advisories go through here.
     */
    template <typename... Args>
    inline void warn(std::string_view fmt, Args&&... args)
    {
        return log(Log::Level::Warning, std::move(fmt), std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void error(std::string_view fmt, Args&&... args)
    {
        return log(Log::Level::Error, std::move(fmt), std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void critical(std::string_view fmt, Args&&... args)
    {
        return log(Log::Level::Critical, std::move(fmt), std::forward<Args>(args)...);
    }
}
