#pragma once

#include "codepush/client.hpp"
#include "codepush/output.hpp"
#include "codepush/progress.hpp"
#include "codepush/types.hpp"
#include "util/result.hpp"

#include <stop_token>

namespace codepush {

Result ValidatePushOptions(const PushOptions& opts);

// Publishes a bundle directory as a new release:
// resolve deployment -> zip -> request upload slot -> upload -> poll.
// The temporary archive is removed on every exit path.
class ReleasePublisher {
public:
    ReleasePublisher(IDeploymentLister& lister,
                     IReleaseUploader& uploader,
                     IStatusChecker& status_checker,
                     PollConfig poll_config = kDefaultPollConfig);
    explicit ReleasePublisher(Client& client, PollConfig poll_config = kDefaultPollConfig);

    void SetProgressSink(IProgress* sink) { progress_sink_ = sink; }
    void SetStopToken(std::stop_token stop) { stop_ = std::move(stop); }

    Result Run(const PushOptions& opts, IOutput& out, PushResult& result);

private:
    struct UploadedBundle {
        std::string package_id;
        std::int64_t file_size_bytes = 0;
        std::string sha256;
    };

    Result UploadBundle(const PushOptions& opts,
                        const std::string& deployment_id,
                        IOutput& out,
                        UploadedBundle& uploaded);

    IDeploymentLister& lister_;
    IReleaseUploader& uploader_;
    IStatusChecker& status_checker_;
    PollConfig poll_config_;
    IProgress* progress_sink_ = nullptr;
    std::stop_token stop_;
};

} // namespace codepush
