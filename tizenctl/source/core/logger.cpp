#include "core/logger.hpp"

#include <borealis/core/logger.hpp>

Logger* Logger::orSilent(Logger* logger) {
    static SilentLogger silent;
    return logger ? logger : &silent;
}

void BorealisLogger::log(LogLevel level, const std::string& message) {
    switch (level) {
        case LogLevel::Error:
            brls::Logger::error("{}", message);
            break;
        case LogLevel::Warning:
            brls::Logger::warning("{}", message);
            break;
        case LogLevel::Info:
            brls::Logger::info("{}", message);
            break;
        case LogLevel::Debug:
            brls::Logger::debug("{}", message);
            break;
    }
}

void BorealisLogger::setLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Error:
            brls::Logger::setLogLevel(brls::LogLevel::LOG_ERROR);
            break;
        case LogLevel::Warning:
            brls::Logger::setLogLevel(brls::LogLevel::LOG_WARNING);
            break;
        case LogLevel::Info:
            brls::Logger::setLogLevel(brls::LogLevel::LOG_INFO);
            break;
        case LogLevel::Debug:
            brls::Logger::setLogLevel(brls::LogLevel::LOG_DEBUG);
            break;
    }
}
