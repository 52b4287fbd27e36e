#pragma once

#include "codepush/client.hpp"
#include "codepush/output.hpp"
#include "codepush/types.hpp"
#include "util/result.hpp"

namespace codepush {

Result ValidateRollbackOptions(const RollbackOptions& opts);

// Re-releases an earlier package. Without a target label the server picks
// the release before the current one.
class ReleaseRollback {
public:
    ReleaseRollback(IDeploymentLister& deployments, IPackageLister& packages, IRollbackInvoker& invoker);
    explicit ReleaseRollback(Client& client);

    Result Run(const RollbackOptions& opts, IOutput& out, RollbackResult& result);

private:
    IDeploymentLister& deployments_;
    IPackageLister& packages_;
    IRollbackInvoker& invoker_;
};

} // namespace codepush
