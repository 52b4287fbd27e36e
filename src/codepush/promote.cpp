#include "codepush/promote.hpp"

#include "codepush/deployment_resolver.hpp"
#include "codepush/package_resolver.hpp"
#include "codepush/validation.hpp"

namespace codepush {

Result ValidatePromoteOptions(const PromoteOptions& opts) {
    auto base = ValidateBaseOptions(opts.app_id, opts.token);
    if (!base.ok) return base;

    if (opts.source_deployment.empty()) {
        return Result::Fail(kErrValidation,
                            "source deployment is required: set --source-deployment or "
                            "CODEPUSH_DEPLOYMENT");
    }
    if (opts.dest_deployment.empty()) {
        return Result::Fail(kErrValidation,
                            "destination deployment is required: set --destination-deployment");
    }
    if (opts.source_deployment == opts.dest_deployment) {
        return Result::Fail(kErrValidation, "source and destination deployments must be different");
    }
    return Result::Ok();
}

ReleasePromoter::ReleasePromoter(IDeploymentLister& deployments,
                                 IPackageLister& packages,
                                 IPromoteInvoker& invoker)
    : deployments_(deployments), packages_(packages), invoker_(invoker) {}

ReleasePromoter::ReleasePromoter(Client& client) : ReleasePromoter(client, client, client) {}

Result ReleasePromoter::Run(const PromoteOptions& opts, IOutput& out, PromoteResult& result) {
    auto valid = ValidatePromoteOptions(opts);
    if (!valid.ok) return valid;

    std::string source_id;
    auto src_result =
        ResolveDeployment(deployments_, opts.app_id, opts.source_deployment, out, source_id);
    if (!src_result.ok) return src_result.Wrap("resolving source deployment");

    std::string dest_id;
    auto dst_result = ResolveDeployment(deployments_, opts.app_id, opts.dest_deployment, out, dest_id);
    if (!dst_result.ok) return dst_result.Wrap("resolving destination deployment");

    PromoteRequest req;
    req.target_deployment_id = dest_id;
    req.app_version = opts.app_version;
    req.description = opts.description;
    req.mandatory = opts.mandatory;
    req.disabled = opts.disabled;
    req.rollout = opts.rollout;

    if (!opts.label.empty()) {
        ResolvedPackage target;
        auto pkg_result =
            ResolvePackageLabel(packages_, opts.app_id, source_id, opts.label, out, target);
        if (!pkg_result.ok) return pkg_result;
        req.package_id = target.id;
    }

    out.Step("Promoting from %s to %s", opts.source_deployment.c_str(), opts.dest_deployment.c_str());
    Package pkg;
    auto promote_result = invoker_.Promote(opts.app_id, source_id, req, pkg);
    if (!promote_result.ok) return promote_result.Wrap("promote failed");

    result = PromoteResult{
        .package_id = pkg.id,
        .app_id = opts.app_id,
        .source_deployment_id = source_id,
        .dest_deployment_id = dest_id,
        .label = pkg.label,
        .app_version = pkg.app_version,
        .description = pkg.description,
    };
    return Result::Ok();
}

} // namespace codepush
