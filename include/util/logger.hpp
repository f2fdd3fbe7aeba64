#pragma once

#include <cstdarg>
#include <string>
#include <string_view>

namespace nimage {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// "debug", "info", "warn", "error", "none". Returns false on anything else.
bool ParseLogLevel(std::string_view s, LogLevel& out);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

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

private:
    Logger() = default;
};

#define LogDebug(...) ::nimage::Logger::Instance().LogWithSource(::nimage::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::nimage::Logger::Instance().LogWithSource(::nimage::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::nimage::Logger::Instance().LogWithSource(::nimage::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::nimage::Logger::Instance().LogWithSource(::nimage::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace nimage
