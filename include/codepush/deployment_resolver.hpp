#pragma once

#include "codepush/client.hpp"
#include "codepush/output.hpp"
#include "util/result.hpp"

#include <string>

namespace codepush {

// Maps a deployment name or UUID to a deployment id. A syntactically valid
// UUID is returned as-is without contacting the server; a name is looked up
// by exact, case-sensitive match in the deployment listing.
Result ResolveDeployment(IDeploymentLister& client,
                         const std::string& app_id,
                         const std::string& name_or_id,
                         IOutput& out,
                         std::string& out_deployment_id);

} // namespace codepush
