#pragma once

#include "util/result.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace codepush {

inline constexpr const char kProjectConfigFileName[] = ".codepush.json";
inline constexpr const char kUserConfigDirName[] = "codepush";
inline constexpr const char kUserConfigFileName[] = "config.json";

// Per-project settings stored next to the sources.
struct ProjectConfig {
    std::string app_id;

    // Reads <dir>/.codepush.json. A missing file yields Ok with `out` reset.
    static Result LoadFromDir(const std::string& dir, std::optional<ProjectConfig>& out);
};

// $XDG_CONFIG_HOME/codepush, else $HOME/.config/codepush. Empty when neither
// variable is set.
std::string UserConfigDir();

// Reads the "token" field of <config_dir>/config.json. A missing file yields
// Ok with an empty token.
Result LoadStoredToken(const std::string& config_dir, std::string& token);

// <config_dir>/config.json.
std::string StoredTokenPath(const std::string& config_dir);

// Writes {"token": ...} to <config_dir>/config.json, creating the directory
// with mode 0700 and the file with mode 0600.
Result SaveStoredToken(const std::string& config_dir, const std::string& token);

// Deletes <config_dir>/config.json. A missing file is not an error.
Result RemoveStoredToken(const std::string& config_dir);

// Parses `path` as a JSON object. Open failures carry the errno.
Result LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out);

} // namespace codepush
