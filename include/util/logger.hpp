#pragma once

#include "util/result.hpp"

#include <cstdarg>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vfsup {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Ordered key/value pairs attached to a structured event.
using EventMetadata = std::vector<std::pair<std::string, std::string>>;

bool ParseLogLevel(std::string_view text, LogLevel& out);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Console (stderr) output can be switched off while a spinner owns the terminal.
    void SetConsoleEnabled(bool enabled);

    // Every record at or above the current level is also appended to the file,
    // one JSON object per line.
    Result OpenLogFile(const std::string& path);
    void CloseLogFile();
    std::string LogFilePath() const;

    // printf-style logging
    void Log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void VLog(LogLevel lvl, const char* fmt, va_list ap);
    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);

    void LogEvent(LogLevel lvl, std::string_view message, const EventMetadata& metadata);

private:
    Logger() = default;

    void Write(LogLevel lvl,
               const char* file,
               int line,
               const std::string& message,
               const EventMetadata* metadata);
};

#define LogDebug(...) ::vfsup::Logger::Instance().LogWithSource(::vfsup::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::vfsup::Logger::Instance().LogWithSource(::vfsup::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::vfsup::Logger::Instance().LogWithSource(::vfsup::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::vfsup::Logger::Instance().LogWithSource(::vfsup::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace vfsup
