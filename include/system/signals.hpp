#pragma once

#include "util/result.hpp"

#include <atomic>

namespace codepush {

// Raised by SIGINT/SIGTERM; main turns it into a stop request.
extern std::atomic_bool g_cancel;

// Routes SIGINT and SIGTERM to g_cancel. A second signal restores the
// default disposition so a stuck process can still be killed.
Result InstallSignalHandlers();

} // namespace codepush
