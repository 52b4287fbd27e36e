#include "codepush/progress_sinks.hpp"

#include "util/format.hpp"

#include <atomic>
#include <string>

namespace codepush {

namespace {
std::atomic<std::FILE*> g_active_line{nullptr};
} // namespace

void ConsoleProgressSink::OnProgress(const TransferProgress& p) {
    const std::string sent = FormatBytes(static_cast<std::int64_t>(p.sent));
    const int label_len = static_cast<int>(p.label.size());

    if (p.total == 0) {
        std::fprintf(stream_, "\r   %.*s %s", label_len, p.label.data(), sent.c_str());
        std::fflush(stream_);
        g_active_line = stream_;
        return;
    }

    const int pct = p.sent >= p.total ? 100 : static_cast<int>(p.sent * 100 / p.total);
    if (pct == last_pct_) return;
    last_pct_ = pct;

    const std::string total = FormatBytes(static_cast<std::int64_t>(p.total));
    std::fprintf(stream_, "\r   %.*s %3d%% (%s of %s)", label_len, p.label.data(), pct,
                 sent.c_str(), total.c_str());
    if (pct == 100) {
        std::fputc('\n', stream_);
        g_active_line = nullptr;
    } else {
        g_active_line = stream_;
    }
    std::fflush(stream_);
}

bool IsProgressLineActive() { return g_active_line.load() != nullptr; }

void ClearProgressLine() {
    if (std::FILE* s = g_active_line.exchange(nullptr)) std::fputc('\n', s);
}

} // namespace codepush
