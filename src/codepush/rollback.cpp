#include "codepush/rollback.hpp"

#include "codepush/deployment_resolver.hpp"
#include "codepush/package_resolver.hpp"
#include "codepush/validation.hpp"

namespace codepush {

Result ValidateRollbackOptions(const RollbackOptions& opts) {
    auto base = ValidateBaseOptions(opts.app_id, opts.token);
    if (!base.ok) return base;
    return RequireDeployment(opts.deployment);
}

ReleaseRollback::ReleaseRollback(IDeploymentLister& deployments,
                                 IPackageLister& packages,
                                 IRollbackInvoker& invoker)
    : deployments_(deployments), packages_(packages), invoker_(invoker) {}

ReleaseRollback::ReleaseRollback(Client& client) : ReleaseRollback(client, client, client) {}

Result ReleaseRollback::Run(const RollbackOptions& opts, IOutput& out, RollbackResult& result) {
    auto valid = ValidateRollbackOptions(opts);
    if (!valid.ok) return valid;

    std::string deployment_id;
    auto dep_result = ResolveDeployment(deployments_, opts.app_id, opts.deployment, out, deployment_id);
    if (!dep_result.ok) return dep_result;

    RollbackRequest req;
    if (!opts.target_label.empty()) {
        ResolvedPackage target;
        auto pkg_result = ResolvePackageLabel(
            packages_, opts.app_id, deployment_id, opts.target_label, out, target);
        if (!pkg_result.ok) return pkg_result;
        req.package_id = target.id;
    }

    out.Step("Rolling back deployment");
    Package pkg;
    auto rb_result = invoker_.Rollback(opts.app_id, deployment_id, req, pkg);
    if (!rb_result.ok) return rb_result.Wrap("rollback failed");

    result = RollbackResult{
        .package_id = pkg.id,
        .app_id = opts.app_id,
        .deployment_id = deployment_id,
        .label = pkg.label,
        .app_version = pkg.app_version,
    };
    return Result::Ok();
}

} // namespace codepush
