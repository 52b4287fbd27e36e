#include "codepush/package_resolver.hpp"

#include <vector>

namespace codepush {

Result ResolvePackageLabel(IPackageLister& client,
                           const std::string& app_id,
                           const std::string& deployment_id,
                           const std::string& label,
                           IOutput& out,
                           ResolvedPackage& resolved) {
    out.Step("Resolving release label \"%s\"", label.c_str());
    std::vector<Package> packages;
    auto list_result = client.ListPackages(app_id, deployment_id, packages);
    if (!list_result.ok) return list_result.Wrap("listing packages");

    for (const auto& p : packages) {
        if (p.label == label) {
            out.Info("Resolved label \"%s\" to package ID %s", label.c_str(), p.id.c_str());
            resolved = {p.id, p.label};
            return Result::Ok();
        }
    }

    return Result::Fail(kErrResolution,
                        "release label \"" + label + "\" not found in deployment");
}

Result ResolvePackageOrLatest(IPackageLister& client,
                              const std::string& app_id,
                              const std::string& deployment_id,
                              const std::string& label,
                              IOutput& out,
                              ResolvedPackage& resolved) {
    if (!label.empty()) {
        return ResolvePackageLabel(client, app_id, deployment_id, label, out, resolved);
    }

    out.Step("Resolving latest release");
    std::vector<Package> packages;
    auto list_result = client.ListPackages(app_id, deployment_id, packages);
    if (!list_result.ok) return list_result.Wrap("listing packages");

    if (packages.empty()) {
        return Result::Fail(kErrResolution,
                            "no releases found in deployment: push a release first");
    }

    const Package& latest = packages.back();
    out.Info("Resolved latest release: %s (%s)", latest.label.c_str(), latest.id.c_str());
    resolved = {latest.id, latest.label};
    return Result::Ok();
}

} // namespace codepush
