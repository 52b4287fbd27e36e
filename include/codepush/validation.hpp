#pragma once

#include "util/result.hpp"

#include <string>

namespace codepush {

// Checks the fields every remote operation needs. Messages name the flag or
// environment variable that supplies the value.
Result ValidateBaseOptions(const std::string& app_id, const std::string& token);

Result RequireDeployment(const std::string& deployment);

} // namespace codepush
