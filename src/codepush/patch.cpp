#include "codepush/patch.hpp"

#include "codepush/deployment_resolver.hpp"
#include "codepush/package_resolver.hpp"
#include "codepush/validation.hpp"

#include <charconv>
#include <cmath>

namespace codepush {

std::optional<int> ParseRollout(std::string_view s) {
    if (!s.empty() && s.front() == '+') s.remove_prefix(1);
    if (s.empty()) return std::nullopt;

    int v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    if (v < 1 || v > 100) return std::nullopt;
    return v;
}

std::optional<bool> ParseBool(std::string_view s) {
    if (s == "1" || s == "t" || s == "T" || s == "TRUE" || s == "true" || s == "True") {
        return true;
    }
    if (s == "0" || s == "f" || s == "F" || s == "FALSE" || s == "false" || s == "False") {
        return false;
    }
    return std::nullopt;
}

Result ValidatePatchOptions(const PatchOptions& opts) {
    auto base = ValidateBaseOptions(opts.app_id, opts.token);
    if (!base.ok) return base;

    auto dep = RequireDeployment(opts.deployment);
    if (!dep.ok) return dep;

    if (opts.rollout.empty() && opts.mandatory.empty() && opts.disabled.empty() &&
        opts.description.empty() && opts.app_version.empty()) {
        return Result::Fail(kErrValidation,
                            "at least one change is required: set --rollout, --mandatory, "
                            "--disabled, --description, or --app-version");
    }
    return Result::Ok();
}

std::expected<PatchRequest, std::string> BuildPatchRequest(const PatchOptions& opts) {
    PatchRequest req;

    if (!opts.rollout.empty()) {
        auto v = ParseRollout(opts.rollout);
        if (!v) {
            return std::unexpected("rollout must be between 1 and 100, got \"" + opts.rollout + "\"");
        }
        req.rollout = *v;
    }

    if (!opts.mandatory.empty()) {
        auto v = ParseBool(opts.mandatory);
        if (!v) {
            return std::unexpected("mandatory must be true or false, got \"" + opts.mandatory + "\"");
        }
        req.mandatory = *v;
    }

    if (!opts.disabled.empty()) {
        auto v = ParseBool(opts.disabled);
        if (!v) {
            return std::unexpected("disabled must be true or false, got \"" + opts.disabled + "\"");
        }
        req.disabled = *v;
    }

    if (!opts.description.empty()) req.description = opts.description;
    if (!opts.app_version.empty()) req.app_version = opts.app_version;

    return req;
}

ReleasePatcher::ReleasePatcher(IDeploymentLister& deployments,
                               IPackageLister& packages,
                               IPackagePatcher& patcher)
    : deployments_(deployments), packages_(packages), patcher_(patcher) {}

ReleasePatcher::ReleasePatcher(Client& client) : ReleasePatcher(client, client, client) {}

Result ReleasePatcher::Run(const PatchOptions& opts, IOutput& out, PatchResult& result) {
    auto valid = ValidatePatchOptions(opts);
    if (!valid.ok) return valid;

    std::string deployment_id;
    auto dep_result = ResolveDeployment(deployments_, opts.app_id, opts.deployment, out, deployment_id);
    if (!dep_result.ok) return dep_result;

    ResolvedPackage target;
    auto pkg_result =
        ResolvePackageOrLatest(packages_, opts.app_id, deployment_id, opts.label, out, target);
    if (!pkg_result.ok) return pkg_result;

    auto req = BuildPatchRequest(opts);
    if (!req) return Result::Fail(kErrValidation, req.error());

    out.Step("Patching release %s", target.label.c_str());
    Package pkg;
    auto patch_result = patcher_.PatchPackage(opts.app_id, deployment_id, target.id, *req, pkg);
    if (!patch_result.ok) return patch_result.Wrap("patch failed");

    result = PatchResult{
        .package_id = pkg.id,
        .app_id = opts.app_id,
        .deployment_id = deployment_id,
        .label = pkg.label,
        .app_version = pkg.app_version,
        .mandatory = pkg.mandatory,
        .disabled = pkg.disabled,
        .rollout = static_cast<int>(std::lround(pkg.rollout)),
        .description = pkg.description,
    };
    return Result::Ok();
}

} // namespace codepush
