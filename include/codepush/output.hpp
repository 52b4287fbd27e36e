#pragma once

#include <cstdarg>
#include <cstdio>
#include <string>

namespace codepush {

enum class NoticeKind {
    Step,
    Info,
    Warning,
};

// Human-facing progress notices emitted by the workflows. Rendering is the
// sink's business; workflows never write to the terminal directly.
class IOutput {
public:
    virtual ~IOutput() = default;
    virtual void Emit(NoticeKind kind, const std::string& msg) = 0;

    void Step(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void Info(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void Warning(const char* fmt, ...) __attribute__((format(printf, 2, 3)));

private:
    void VEmit(NoticeKind kind, const char* fmt, va_list ap);
};

class NullOutput final : public IOutput {
public:
    void Emit(NoticeKind, const std::string&) override {}
};

// "-> step", "   info", "WARNING msg" lines.
class ConsoleOutput final : public IOutput {
public:
    explicit ConsoleOutput(std::FILE* stream = stderr) : stream_(stream) {}
    void Emit(NoticeKind kind, const std::string& msg) override;

private:
    std::FILE* stream_;
};

} // namespace codepush
