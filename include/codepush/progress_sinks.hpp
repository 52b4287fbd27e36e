#pragma once

#include "codepush/progress.hpp"

#include <cstdio>

namespace codepush {

// Redraws one status line, e.g. "   upload  42% (1.2 MB of 3.0 MB)".
// Repaints only when the whole percentage changes.
class ConsoleProgressSink final : public IProgress {
public:
    explicit ConsoleProgressSink(std::FILE* stream = stderr) : stream_(stream) {}

    void OnProgress(const TransferProgress& p) override;

private:
    std::FILE* stream_;
    int last_pct_ = -1;
};

// Log and notice writers end an unfinished progress line before printing.
bool IsProgressLineActive();
void ClearProgressLine();

} // namespace codepush
