#pragma once

#include <log/level.hpp>
#include <log/def.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace Log
{
    inline spdlog::level::level_enum toSpdlogLevel(Level lvl)
    {
        switch (lvl)
        {
            case Level::Trace:
                return spdlog::level::trace;
            case Level::Debug:
                return spdlog::level::debug;
            case Level::Info:
                return spdlog::level::info;
            case Level::Warning:
                return spdlog::level::warn;
            case Level::Error:
                return spdlog::level::err;
            case Level::Critical:
                return spdlog::level::critical;
            case Level::Off:
                return spdlog::level::off;
            default:
                return spdlog::level::info;
        }
    }

    inline Level fromSpdlogLevel(spdlog::level::level_enum lvl)
    {
        switch (lvl)
        {
            case spdlog::level::trace:
                return Level::Trace;
            case spdlog::level::debug:
                return Level::Debug;
            case spdlog::level::info:
                return Level::Info;
            case spdlog::level::warn:
                return Level::Warning;
            case spdlog::level::err:
                return Level::Error;
            case spdlog::level::critical:
                return Level::Critical;
            case spdlog::level::off:
                return Level::Off;
            default:
                return Level::Info;
        }
    }

    struct LoggerOptions
    {
        Level level{Level::Info};
        std::optional<std::filesystem::path> logFile{std::nullopt};
        bool colored{true};
        std::string pattern{defaultPattern};
    };

    class Logger
    {
      public:
        Logger()
            : guard_{}
            , logger_{}
        {}

        /**
         * @brief Replaces the sinks of this logger. Writes to stderr and, if set, appends to the log file.
         *
         * @param options
         */
        void setup(LoggerOptions const& options);

        void setLevel(Log::Level level)
        {
            std::scoped_lock lock{guard_};
            if (logger_)
                logger_->set_level(toSpdlogLevel(level));
            else
                spdlog::set_level(toSpdlogLevel(level));
        }

        Log::Level level() const
        {
            std::scoped_lock lock{guard_};
            if (logger_)
                return fromSpdlogLevel(logger_->level());
            return fromSpdlogLevel(spdlog::get_level());
        }

        template <typename... Args>
        void log(Log::Level level, std::string_view fmt, Args&&... args)
        {
            const std::string buf = spdlog::fmt_lib::format(spdlog::fmt_lib::runtime(fmt), std::forward<Args>(args)...);
            logImpl(level, buf);
        }

        void logImpl(Log::Level level, std::string const& msg)
        {
            decltype(logger_) target;
            {
                std::scoped_lock lock{guard_};
                target = logger_;
            }
            if (target)
                target->log(toSpdlogLevel(level), msg);
            else
                spdlog::log(toSpdlogLevel(level), msg);
        }

        void flush()
        {
            std::scoped_lock lock{guard_};
            if (logger_)
                logger_->flush();
        }

      private:
        mutable std::mutex guard_;
        // Before setup, the spdlog default logger is used.
        std::shared_ptr<spdlog::logger> logger_;
    };
}
