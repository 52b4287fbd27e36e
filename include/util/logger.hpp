#pragma once

#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string_view>

namespace codepush {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

inline constexpr const char* kLogLevelEnv = "CODEPUSH_LOG_LEVEL";

// debug|info|warn|warning|error|none, any case.
std::optional<LogLevel> ParseLogLevel(std::string_view name);

// Process-wide diagnostics on stderr:
//   [2024-05-01 12:00:00] [WARN] [push.cpp:42] message
class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;
    bool Enabled(LogLevel lvl) const;

    void SetStream(std::FILE* stream);

    // Warn by default, overridden by CODEPUSH_LOG_LEVEL, then by --verbose.
    void Configure(bool verbose);

    void LogWithSource(LogLevel lvl, const char* file, int line, const char* fmt, ...)
        __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl, const char* file, int line, const char* fmt, va_list ap);

private:
    Logger() = default;

    mutable std::mutex mu_;
    LogLevel level_ = LogLevel::Warn;
    std::FILE* stream_ = stderr;
};

#define LogDebug(...) ::codepush::Logger::Instance().LogWithSource(::codepush::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::codepush::Logger::Instance().LogWithSource(::codepush::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::codepush::Logger::Instance().LogWithSource(::codepush::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::codepush::Logger::Instance().LogWithSource(::codepush::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace codepush
