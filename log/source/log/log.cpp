#include <log/log.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <vector>

namespace Log
{
    namespace Detail
    {
        Logger logger{};
    }

    void Logger::setup(LoggerOptions const& options)
    {
        std::vector<spdlog::sink_ptr> sinks{};
        if (options.colored)
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        else
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());

        if (options.logFile)
        {
            try
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.logFile->string(), false));
            }
            catch (spdlog::spdlog_ex const& exc)
            {
                spdlog::error("Cannot open log file '{}': {}", options.logFile->string(), exc.what());
            }
        }

        auto newLogger = std::make_shared<spdlog::logger>(defaultLoggerName, sinks.begin(), sinks.end());
        newLogger->set_pattern(options.pattern);
        newLogger->set_level(toSpdlogLevel(options.level));
        newLogger->flush_on(spdlog::level::warn);

        std::scoped_lock lock{guard_};
        logger_ = std::move(newLogger);
    }

    void setup(LoggerOptions const& options)
    {
        Detail::logger.setup(options);
    }
}
