#ifndef TIZENCTL_LOGGER_HPP
#define TIZENCTL_LOGGER_HPP

#include <string>
#include <utility>
#include <fmt/format.h>

enum class LogLevel {
    Error = 0,
    Warning = 1,
    Info = 2,
    Debug = 3
};

// Logging sink handed to every component. Formatting uses the same "{}"
// placeholders as brls::Logger.
class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(LogLevel level, const std::string& message) = 0;

    template <typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        log(LogLevel::Error, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void warning(fmt::format_string<Args...> format, Args&&... args) {
        log(LogLevel::Warning, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        log(LogLevel::Info, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        log(LogLevel::Debug, fmt::format(format, std::forward<Args>(args)...));
    }

    // Never returns nullptr; falls back to a shared silent logger
    static Logger* orSilent(Logger* logger);
};

class SilentLogger : public Logger {
public:
    void log(LogLevel, const std::string&) override {}
};

// Forwards to brls::Logger, whose level and output are owned by the application
class BorealisLogger : public Logger {
public:
    void log(LogLevel level, const std::string& message) override;

    static void setLevel(LogLevel level);
};

#endif
