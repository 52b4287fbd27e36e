#include "codepush/output.hpp"

#include "codepush/progress_sinks.hpp"

#include <vector>

namespace codepush {

void IOutput::VEmit(NoticeKind kind, const char* fmt, va_list ap) {
    va_list copy;
    va_copy(copy, ap);
    const int n = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (n < 0) {
        Emit(kind, fmt);
        return;
    }
    std::vector<char> buf(static_cast<size_t>(n) + 1);
    std::vsnprintf(buf.data(), buf.size(), fmt, ap);
    Emit(kind, std::string(buf.data(), static_cast<size_t>(n)));
}

void IOutput::Step(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VEmit(NoticeKind::Step, fmt, ap);
    va_end(ap);
}

void IOutput::Info(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VEmit(NoticeKind::Info, fmt, ap);
    va_end(ap);
}

void IOutput::Warning(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VEmit(NoticeKind::Warning, fmt, ap);
    va_end(ap);
}

void ConsoleOutput::Emit(NoticeKind kind, const std::string& msg) {
    ClearProgressLine();
    switch (kind) {
        case NoticeKind::Step:
            std::fprintf(stream_, "-> %s\n", msg.c_str());
            break;
        case NoticeKind::Info:
            std::fprintf(stream_, "   %s\n", msg.c_str());
            break;
        case NoticeKind::Warning:
            std::fprintf(stream_, "WARNING %s\n", msg.c_str());
            break;
    }
    std::fflush(stream_);
}

} // namespace codepush
