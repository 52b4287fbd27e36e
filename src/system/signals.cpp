#include "system/signals.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <string>

namespace codepush {

std::atomic_bool g_cancel{false};

namespace {

void OnTerminate(int sig) {
    if (g_cancel.exchange(true)) std::signal(sig, SIG_DFL);
}

} // namespace

Result InstallSignalHandlers() {
    struct sigaction sa{};
    sa.sa_handler = OnTerminate;
    sigemptyset(&sa.sa_mask);

    for (int sig : {SIGINT, SIGTERM}) {
        if (::sigaction(sig, &sa, nullptr) != 0) {
            const int e = errno;
            return Result::Fail(e, std::string("sigaction(") + strsignal(sig) + ") failed: " +
                                       std::strerror(e));
        }
    }
    return Result::Ok();
}

} // namespace codepush
