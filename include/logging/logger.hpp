#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>

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

    enum class Format
    {
        TEXT,
        JSON
    };

    static void init(const std::string &log_level = "INFO")
    {
        getLogger()->set_level(parseLevel(log_level));
    }

    static void setLevel(const std::string &log_level)
    {
        auto logger = getLogger();
        if (!isKnownLevel(log_level))
        {
            warn("Invalid log level: " + log_level + ", defaulting to INFO");
        }
        logger->set_level(parseLevel(log_level));
        info("Log level changed to: " + log_level);
    }

    /**
     * @brief Select how batch events are rendered ("json" or "text")
     */
    static void setFormat(const std::string &format)
    {
        formatRef() = (format == "json" || format == "JSON") ? Format::JSON : Format::TEXT;
    }

    static Format getFormat()
    {
        return formatRef();
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

    /**
     * @brief Emit one structured batch event
     *
     * JSON format writes a single object per line with timestamp, level, event_type,
     * file_path and message plus any extra keys. Text format writes
     * "LEVEL: message file=... key=value" for the counters operators look at.
     */
    static void event(Level level, const std::string &event_type, const std::string &message,
                      const std::string &file_path = "", const nlohmann::json &extra = nlohmann::json::object())
    {
        if (formatRef() == Format::JSON)
        {
            nlohmann::json payload = {
                {"timestamp", utcTimestamp()},
                {"level", levelName(level)},
                {"event_type", event_type},
                {"file_path", file_path.empty() ? nlohmann::json(nullptr) : nlohmann::json(file_path)},
                {"message", message}};
            if (extra.is_object())
            {
                for (auto it = extra.begin(); it != extra.end(); ++it)
                    payload[it.key()] = it.value();
            }
            log(level, payload.dump(-1, ' ', true));
            return;
        }

        std::string line = message;
        if (!file_path.empty())
            line += " file=" + file_path;
        if (extra.is_object())
        {
            for (const char *key : {"total_files", "processed", "skipped", "failed", "duration_seconds"})
            {
                if (extra.contains(key))
                    line += std::string(" ") + key + "=" + extra[key].dump();
            }
        }
        log(level, line);
    }

    static std::string utcTimestamp()
    {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm_utc{};
        gmtime_r(&now, &tm_utc);
        std::ostringstream ss;
        ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S+00:00");
        return ss.str();
    }

private:
    static std::shared_ptr<spdlog::logger> getLogger()
    {
        static auto logger = spdlog::stdout_color_mt("reel_curator");
        return logger;
    }

    static Format &formatRef()
    {
        static Format format = Format::TEXT;
        return format;
    }

    static bool isKnownLevel(const std::string &log_level)
    {
        return log_level == "TRACE" || log_level == "DEBUG" || log_level == "INFO" ||
               log_level == "WARN" || log_level == "ERROR";
    }

    static spdlog::level::level_enum parseLevel(const std::string &log_level)
    {
        if (log_level == "TRACE")
            return spdlog::level::trace;
        else if (log_level == "DEBUG")
            return spdlog::level::debug;
        else if (log_level == "WARN")
            return spdlog::level::warn;
        else if (log_level == "ERROR")
            return spdlog::level::err;
        return spdlog::level::info;
    }

    static const char *levelName(Level level)
    {
        switch (level)
        {
        case Level::TRACE:
            return "trace";
        case Level::DEBUG:
            return "debug";
        case Level::INFO:
            return "info";
        case Level::WARN:
            return "warning";
        case Level::ERROR:
            return "error";
        }
        return "info";
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
