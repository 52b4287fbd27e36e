#pragma once

#include "codepush/client.hpp"
#include "codepush/output.hpp"
#include "codepush/types.hpp"
#include "util/result.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace codepush {

// Integer in [1, 100]; a leading '+' is accepted.
std::optional<int> ParseRollout(std::string_view s);

// 1/t/T/TRUE/true/True and 0/f/F/FALSE/false/False.
std::optional<bool> ParseBool(std::string_view s);

Result ValidatePatchOptions(const PatchOptions& opts);

// Converts the string-typed options into a partial update. Fields left empty
// in `opts` stay disengaged in the request.
std::expected<PatchRequest, std::string> BuildPatchRequest(const PatchOptions& opts);

// Updates metadata of an existing release (by label, or the latest one).
class ReleasePatcher {
public:
    ReleasePatcher(IDeploymentLister& deployments, IPackageLister& packages, IPackagePatcher& patcher);
    explicit ReleasePatcher(Client& client);

    Result Run(const PatchOptions& opts, IOutput& out, PatchResult& result);

private:
    IDeploymentLister& deployments_;
    IPackageLister& packages_;
    IPackagePatcher& patcher_;
};

} // namespace codepush
