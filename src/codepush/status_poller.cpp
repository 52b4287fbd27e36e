#include "codepush/status_poller.hpp"

#include "util/logger.hpp"

#include <condition_variable>
#include <mutex>

namespace codepush {

namespace {

// Returns false when the stop token fired before the interval elapsed.
bool SleepUnlessStopped(std::chrono::milliseconds d, const std::stop_token& stop) {
    std::mutex mu;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lk(mu);
    cv.wait_for(lk, stop, d, [] { return false; });
    return !stop.stop_requested();
}

Result Cancelled() {
    return Result::Fail(kErrCancelled, "waiting for package processing cancelled");
}

} // namespace

std::string FormatWait(std::chrono::milliseconds d) {
    const auto ms = d.count();
    if (ms % 1000 == 0) return std::to_string(ms / 1000) + "s";
    return std::to_string(ms) + "ms";
}

Result PollPackageStatus(IStatusChecker& client,
                         const PackageRef& ref,
                         const PollConfig& cfg,
                         PackageStatus& out,
                         std::stop_token stop) {
    if (cfg.max_attempts < 1) {
        return Result::Fail(kErrValidation, "poll max attempts must be at least 1");
    }

    for (int attempt = 0; attempt < cfg.max_attempts; ++attempt) {
        if (stop.stop_requested()) return Cancelled();

        PackageStatus status;
        auto r = client.GetPackageStatus(ref.app_id, ref.deployment_id, ref.package_id, status);
        if (!r.ok) {
            if (stop.stop_requested()) return Cancelled();
            return r.Wrap("checking package status");
        }

        LogDebug("package %s status=%s (attempt %d/%d)",
                 ref.package_id.c_str(),
                 status.status.c_str(),
                 attempt + 1,
                 cfg.max_attempts);

        if (status.status == kStatusDone) {
            out = std::move(status);
            return Result::Ok();
        }
        if (status.status == kStatusFailed) {
            return Result::Fail(kErrRemote, "package processing failed: " + status.status_reason);
        }

        if (attempt < cfg.max_attempts - 1) {
            if (!SleepUnlessStopped(cfg.interval, stop)) return Cancelled();
        }
    }

    const auto total_wait = cfg.interval * cfg.max_attempts;
    return Result::Fail(kErrTimeout, "package processing timed out after " + FormatWait(total_wait));
}

} // namespace codepush
