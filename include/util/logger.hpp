#pragma once

#include <cstdarg>
#include <string>

namespace uplink {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn"/"warning", "error", "none" (any case).
bool ParseLogLevel(const std::string& s, LogLevel& out);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Mirror every emitted line into `path` (append mode). Empty path closes
    // the mirror. Returns false if the file cannot be opened.
    bool SetLogFile(const std::string& path);

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

#define LogDebug(...) ::uplink::Logger::Instance().LogWithSource(::uplink::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::uplink::Logger::Instance().LogWithSource(::uplink::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::uplink::Logger::Instance().LogWithSource(::uplink::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::uplink::Logger::Instance().LogWithSource(::uplink::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace uplink
