#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

/**
 * @brief Process-wide logger for the verification pipeline, backed by spdlog
 */
class Logger
{
public:
    enum class Level
    {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    static void init(const std::string &log_level = "INFO")
    {
        bool valid = true;
        getLogger()->set_level(parseLevel(log_level, valid));
    }

    static void setLevel(const std::string &log_level)
    {
        bool valid = true;
        auto level = parseLevel(log_level, valid);
        if (!valid)
        {
            warn("Invalid log level: " + log_level + ", defaulting to INFO");
        }
        getLogger()->set_level(level);
        info("Log level changed to: " + (valid ? log_level : std::string("INFO")));
    }

    static bool isValidLevel(const std::string &log_level)
    {
        bool valid = true;
        parseLevel(log_level, valid);
        return valid;
    }

    static void trace(const std::string &message)
    {
        log(Level::TRACE, message);
    }

    static void debug(const std::string &message)
    {
        log(Level::DEBUG, message);
    }

    static void info(const std::string &message)
    {
        log(Level::INFO, message);
    }

    static void warn(const std::string &message)
    {
        log(Level::WARN, message);
    }

    static void error(const std::string &message)
    {
        log(Level::ERROR, message);
    }

private:
    static std::shared_ptr<spdlog::logger> getLogger()
    {
        static auto logger = []
        {
            auto existing = spdlog::get("proof_verifier");
            return existing ? existing : spdlog::stdout_color_mt("proof_verifier");
        }();
        return logger;
    }

    static spdlog::level::level_enum parseLevel(const std::string &log_level, bool &valid)
    {
        valid = true;
        if (log_level == "TRACE")
            return spdlog::level::trace;
        if (log_level == "DEBUG")
            return spdlog::level::debug;
        if (log_level == "INFO")
            return spdlog::level::info;
        if (log_level == "WARN")
            return spdlog::level::warn;
        if (log_level == "ERROR")
            return spdlog::level::err;
        valid = false;
        return spdlog::level::info;
    }

    static void log(Level level, const std::string &message)
    {
        auto logger = getLogger();
        switch (level)
        {
        case Level::TRACE:
            logger->trace(message);
            break;
        case Level::DEBUG:
            logger->debug(message);
            break;
        case Level::INFO:
            logger->info(message);
            break;
        case Level::WARN:
            logger->warn(message);
            break;
        case Level::ERROR:
            logger->error(message);
            break;
        }
    }
};
