#include "util/project_config.hpp"

#include "codepush/wire.hpp"
#include "io/fd.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace codepush {

namespace {

bool GetString(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

bool FileMissing(const std::string& path) {
    std::error_code ec;
    return !fs::exists(path, ec) && !ec;
}

} // namespace

Result LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out) {
    std::ifstream is(path);
    if (!is.good()) {
        const int e = errno != 0 ? errno : EIO;
        return Result::Fail(e, "cannot open " + path + ": " + std::strerror(e));
    }

    try {
        is >> out;
    } catch (const nlohmann::json::exception& e) {
        return Result::Fail(kErrValidation, "invalid JSON in " + path + ": " + e.what());
    }

    if (!out.is_object()) {
        return Result::Fail(kErrValidation, "root must be JSON object: " + path);
    }
    return Result::Ok();
}

Result ProjectConfig::LoadFromDir(const std::string& dir, std::optional<ProjectConfig>& out) {
    out.reset();
    const std::string path = (fs::path(dir) / kProjectConfigFileName).string();
    if (FileMissing(path)) return Result::Ok();

    nlohmann::json j;
    auto r = LoadJsonObjectFromFile(path, j);
    if (!r.ok) return r.Wrap(std::string("reading ") + kProjectConfigFileName);

    ProjectConfig cfg;
    if (j.contains("app_id") && !GetString(j, "app_id", cfg.app_id)) {
        return Result::Fail(kErrValidation,
                            std::string("parsing ") + kProjectConfigFileName + ": app_id must be a string");
    }
    out = std::move(cfg);
    return Result::Ok();
}

std::string UserConfigDir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return (fs::path(xdg) / kUserConfigDirName).string();
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return (fs::path(home) / ".config" / kUserConfigDirName).string();
    }
    return {};
}

Result LoadStoredToken(const std::string& config_dir, std::string& token) {
    token.clear();
    if (config_dir.empty()) {
        return Result::Fail(kErrValidation, "determining config directory: HOME is not set");
    }
    const std::string path = StoredTokenPath(config_dir);
    if (FileMissing(path)) return Result::Ok();

    nlohmann::json j;
    auto r = LoadJsonObjectFromFile(path, j);
    if (!r.ok) return r.Wrap("reading config file");

    (void)GetString(j, "token", token);
    return Result::Ok();
}

std::string StoredTokenPath(const std::string& config_dir) {
    return (fs::path(config_dir) / kUserConfigFileName).string();
}

Result SaveStoredToken(const std::string& config_dir, const std::string& token) {
    if (config_dir.empty()) {
        return Result::Fail(kErrValidation, "determining config directory: HOME is not set");
    }
    std::error_code ec;
    fs::create_directories(config_dir, ec);
    if (ec) {
        return Result::Fail(ec.value(), "creating config directory: " + ec.message());
    }
    if (::chmod(config_dir.c_str(), 0700) != 0) {
        const int e = errno;
        return Result::Fail(e, "creating config directory: " + std::string(std::strerror(e)));
    }

    const std::string path = StoredTokenPath(config_dir);
    Fd fd;
    auto r = Fd::Open(path, O_WRONLY | O_CREAT | O_TRUNC, 0600, fd);
    if (!r.ok) return r.Wrap("writing config file");
    // An existing file keeps its mode through O_TRUNC.
    if (::fchmod(fd.Get(), 0600) != 0) {
        const int e = errno;
        return Result::Fail(e, "writing config file: " + std::string(std::strerror(e)));
    }
    r = fd.WriteAll(wire::DumpJson(nlohmann::json{{"token", token}}, 2) + "\n");
    if (!r.ok) return r.Wrap("writing config file " + path);
    return Result::Ok();
}

Result RemoveStoredToken(const std::string& config_dir) {
    if (config_dir.empty()) {
        return Result::Fail(kErrValidation, "determining config directory: HOME is not set");
    }
    const std::string path = StoredTokenPath(config_dir);
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        const int e = errno;
        return Result::Fail(e, "removing " + path + ": " + std::strerror(e));
    }
    return Result::Ok();
}

} // namespace codepush
