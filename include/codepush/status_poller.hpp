#pragma once

#include "codepush/client.hpp"
#include "codepush/types.hpp"
#include "util/result.hpp"

#include <chrono>
#include <stop_token>
#include <string>

namespace codepush {

// Queries the package status up to cfg.max_attempts times, sleeping
// cfg.interval between non-terminal answers.
//
//   done       -> Ok, `out` holds the final status
//   failed     -> kErrRemote carrying the server's reason
//   exhausted  -> kErrTimeout reporting max_attempts * interval
//   query error-> returned immediately, no further attempts
//   stop       -> kErrCancelled, the pending sleep is cut short
Result PollPackageStatus(IStatusChecker& client,
                         const PackageRef& ref,
                         const PollConfig& cfg,
                         PackageStatus& out,
                         std::stop_token stop = {});

// "120s", "2500ms"
std::string FormatWait(std::chrono::milliseconds d);

} // namespace codepush
