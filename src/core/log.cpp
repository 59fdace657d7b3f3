#include "terratile/core/log.hpp"

#include <cctype>
#include <iostream>
#include <mutex>
#include <string>

namespace terratile {

namespace {

std::mutex& logMutex() {
    static std::mutex mutex;
    return mutex;
}

LogLevel& currentLevel() {
    static LogLevel level = LogLevel::Info;
    return level;
}

Log::Sink& currentSink() {
    static Log::Sink sink;
    return sink;
}

}  // namespace

std::optional<LogLevel> parseLogLevel(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    return std::nullopt;
}

std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
    }
    return "UNKNOWN";
}

void Log::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(logMutex());
    currentLevel() = level;
}

LogLevel Log::level() {
    std::lock_guard<std::mutex> lock(logMutex());
    return currentLevel();
}

bool Log::enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(Log::level());
}

void Log::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(logMutex());
    currentSink() = std::move(sink);
}

void Log::debug(std::string_view channel, std::string_view message) {
    write(LogLevel::Debug, channel, message);
}

void Log::info(std::string_view channel, std::string_view message) {
    write(LogLevel::Info, channel, message);
}

void Log::warn(std::string_view channel, std::string_view message) {
    write(LogLevel::Warning, channel, message);
}

void Log::error(std::string_view channel, std::string_view message) {
    write(LogLevel::Error, channel, message);
}

void Log::write(LogLevel level, std::string_view channel, std::string_view message) {
    std::lock_guard<std::mutex> lock(logMutex());
    if (static_cast<int>(level) < static_cast<int>(currentLevel())) {
        return;
    }

    if (currentSink()) {
        currentSink()(level, channel, message);
        return;
    }

    switch (level) {
        case LogLevel::Debug:
        case LogLevel::Info:
            std::cout << "[" << channel << "] " << message << "\n";
            break;
        case LogLevel::Warning:
            std::cerr << "[" << channel << "] WARNING: " << message << "\n";
            break;
        case LogLevel::Error:
            std::cerr << "[" << channel << "] ERROR: " << message << "\n";
            break;
    }
}

}  // namespace terratile
