#include "util/logger.hpp"

#include "codepush/progress_sinks.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string>

namespace codepush {

namespace {

const char* LevelTag(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "LOG";
    }
}

std::string_view SourceFileName(const char* file) {
    if (!file) return {};
    std::string_view path(file);
    const auto cut = path.find_last_of("/\\");
    return cut == std::string_view::npos ? path : path.substr(cut + 1);
}

} // namespace

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "none") return LogLevel::None;
    return std::nullopt;
}

Logger& Logger::Instance() {
    static Logger inst;
    return inst;
}

void Logger::SetLevel(LogLevel lvl) {
    std::lock_guard<std::mutex> lk(mu_);
    level_ = lvl;
}

LogLevel Logger::Level() const {
    std::lock_guard<std::mutex> lk(mu_);
    return level_;
}

bool Logger::Enabled(LogLevel lvl) const {
    std::lock_guard<std::mutex> lk(mu_);
    return level_ != LogLevel::None && lvl >= level_;
}

void Logger::SetStream(std::FILE* stream) {
    std::lock_guard<std::mutex> lk(mu_);
    stream_ = stream ? stream : stderr;
}

void Logger::Configure(bool verbose) {
    SetLevel(LogLevel::Warn);

    const char* env = std::getenv(kLogLevelEnv);
    if (env && *env) {
        if (auto lvl = ParseLogLevel(env)) {
            SetLevel(*lvl);
        } else {
            LogWarn("unknown %s '%s', using warn", kLogLevelEnv, env);
        }
    }
    if (verbose) SetLevel(LogLevel::Debug);
}

void Logger::LogWithSource(LogLevel lvl, const char* file, int line, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, file, line, fmt, ap);
    va_end(ap);
}

void Logger::VLogWithSource(LogLevel lvl, const char* file, int line, const char* fmt, va_list ap) {
    std::lock_guard<std::mutex> lk(mu_);
    if (level_ == LogLevel::None || lvl < level_) return;

    ClearProgressLine();

    char ts[32] = "";
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    if (localtime_r(&now, &tm)) std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);

    if (ts[0]) std::fprintf(stream_, "[%s] ", ts);
    std::fprintf(stream_, "[%s] ", LevelTag(lvl));

    const auto src = SourceFileName(file);
    if (!src.empty() && line > 0) {
        std::fprintf(stream_, "[%.*s:%d] ", static_cast<int>(src.size()), src.data(), line);
    }
    std::vfprintf(stream_, fmt, ap);
    std::fputc('\n', stream_);
    std::fflush(stream_);
}

} // namespace codepush
