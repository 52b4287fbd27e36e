#include "cli/credentials.hpp"

#include "http/http_client.hpp"
#include "util/logger.hpp"
#include "util/project_config.hpp"

#include <cstdlib>
#include <optional>

namespace codepush::cli {

std::string ResolveFlag(const std::string& flag_value, const char* env_key) {
    if (!flag_value.empty()) return flag_value;
    const char* v = std::getenv(env_key);
    return v ? std::string(v) : std::string();
}

std::string ResolveAppId(const std::string& flag_value, const std::string& project_dir) {
    std::string app_id = ResolveFlag(flag_value, "CODEPUSH_APP_ID");
    if (!app_id.empty()) return app_id;

    std::optional<ProjectConfig> cfg;
    auto r = ProjectConfig::LoadFromDir(project_dir, cfg);
    if (!r.ok) {
        LogWarn("ignoring project config: %s", r.msg.c_str());
        return {};
    }
    if (cfg) {
        LogDebug("app ID from %s", kProjectConfigFileName);
        return cfg->app_id;
    }
    return {};
}

std::string ResolveToken(const std::string& config_dir) {
    const char* env = std::getenv("BITRISE_API_TOKEN");
    if (env && *env) return env;

    std::string token;
    auto r = LoadStoredToken(config_dir, token);
    if (!r.ok) {
        LogWarn("cannot load stored token: %s", r.msg.c_str());
        return {};
    }
    return token;
}

std::string ResolveApiUrl() {
    const char* v = std::getenv("CODEPUSH_API_URL");
    if (v && *v) return v;
    return http::kDefaultBaseUrl;
}

} // namespace codepush::cli
