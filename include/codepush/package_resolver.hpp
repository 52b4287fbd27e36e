#pragma once

#include "codepush/client.hpp"
#include "codepush/output.hpp"
#include "util/result.hpp"

#include <string>

namespace codepush {

struct ResolvedPackage {
    std::string id;
    std::string label;
};

// Finds the package whose label equals `label` exactly.
Result ResolvePackageLabel(IPackageLister& client,
                           const std::string& app_id,
                           const std::string& deployment_id,
                           const std::string& label,
                           IOutput& out,
                           ResolvedPackage& resolved);

// Resolves `label` when given, otherwise the latest release. The listing is
// assumed to be in ascending creation order; latest is its last element.
Result ResolvePackageOrLatest(IPackageLister& client,
                              const std::string& app_id,
                              const std::string& deployment_id,
                              const std::string& label,
                              IOutput& out,
                              ResolvedPackage& resolved);

} // namespace codepush
