#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

// Bitrise CI integration: build detection and artifact/env export.
namespace codepush::ci {

bool IsBitriseEnvironment();

// Writes `data` to $BITRISE_DEPLOY_DIR/<filename>, creating the directory.
Result WriteToDeployDir(const std::string& filename, std::string_view data, std::string& out_path);

// Runs `envman add --key K --value V`. Ok without doing anything when envman
// is not on PATH.
Result ExportEnvVar(const std::string& key, const std::string& value);

// First executable named `name` on $PATH, or empty.
std::string FindOnPath(const std::string& name);

} // namespace codepush::ci
