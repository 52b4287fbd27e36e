#pragma once

#include "codepush/output.hpp"
#include "codepush/types.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace codepush {

nlohmann::json ToJson(const Deployment& d);
nlohmann::json ToJson(const Package& p);
nlohmann::json ToJson(const PackageStatus& s);
nlohmann::json ToJson(const PushResult& r);
nlohmann::json ToJson(const PatchResult& r);
nlohmann::json ToJson(const RollbackResult& r);
nlohmann::json ToJson(const PromoteResult& r);

using EnvVars = std::vector<std::pair<std::string, std::string>>;

// Variables published to later CI steps after each workflow.
EnvVars ExportedVars(const PushResult& r);
EnvVars ExportedVars(const PatchResult& r);
EnvVars ExportedVars(const RollbackResult& r);
EnvVars ExportedVars(const PromoteResult& r);

// On a Bitrise build: writes codepush-<op>-summary.json to the deploy
// directory and exports `vars` through envman. Does nothing elsewhere.
// Failures are reported as warnings on `out`.
void ExportCiSummary(const std::string& op,
                     const nlohmann::json& summary,
                     const EnvVars& vars,
                     IOutput& out);

} // namespace codepush
