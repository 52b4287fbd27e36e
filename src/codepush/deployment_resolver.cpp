#include "codepush/deployment_resolver.hpp"

#include "util/logger.hpp"
#include "util/uuid.hpp"

#include <vector>

namespace codepush {

Result ResolveDeployment(IDeploymentLister& client,
                         const std::string& app_id,
                         const std::string& name_or_id,
                         IOutput& out,
                         std::string& out_deployment_id) {
    if (IsUuid(name_or_id)) {
        out_deployment_id = name_or_id;
        return Result::Ok();
    }

    out.Step("Resolving deployment \"%s\"", name_or_id.c_str());
    std::vector<Deployment> deployments;
    auto list_result = client.ListDeployments(app_id, deployments);
    if (!list_result.ok) return list_result.Wrap("listing deployments");

    LogDebug("%zu deployments listed for app %s", deployments.size(), app_id.c_str());
    for (const auto& d : deployments) {
        if (d.name == name_or_id) {
            out.Info("Resolved to %s", d.id.c_str());
            out_deployment_id = d.id;
            return Result::Ok();
        }
    }

    return Result::Fail(kErrResolution,
                        "deployment \"" + name_or_id +
                            "\" not found: check the deployment name or use a deployment UUID");
}

} // namespace codepush
