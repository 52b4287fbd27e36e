#pragma once

#include "codepush/client.hpp"
#include "codepush/output.hpp"
#include "codepush/types.hpp"
#include "util/result.hpp"

namespace codepush {

// Source and destination are compared as given, before resolution.
Result ValidatePromoteOptions(const PromoteOptions& opts);

// Copies a release (latest or labelled) from one deployment to another.
class ReleasePromoter {
public:
    ReleasePromoter(IDeploymentLister& deployments, IPackageLister& packages, IPromoteInvoker& invoker);
    explicit ReleasePromoter(Client& client);

    Result Run(const PromoteOptions& opts, IOutput& out, PromoteResult& result);

private:
    IDeploymentLister& deployments_;
    IPackageLister& packages_;
    IPromoteInvoker& invoker_;
};

} // namespace codepush
