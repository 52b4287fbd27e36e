#pragma once

#include <string>

namespace codepush::cli {

// Returns `flag_value` when set, else the environment variable `env_key`.
std::string ResolveFlag(const std::string& flag_value, const char* env_key);

// --app-id, then CODEPUSH_APP_ID, then .codepush.json in `project_dir`.
// An unreadable project file is logged and skipped.
std::string ResolveAppId(const std::string& flag_value, const std::string& project_dir);

// BITRISE_API_TOKEN, then the token stored under `config_dir`.
std::string ResolveToken(const std::string& config_dir);

// CODEPUSH_API_URL or the public endpoint.
std::string ResolveApiUrl();

} // namespace codepush::cli
