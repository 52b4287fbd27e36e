#include "util/ci_env.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace codepush::ci {

namespace {

bool EnvSet(const char* key) {
    const char* v = std::getenv(key);
    return v && *v;
}

} // namespace

bool IsBitriseEnvironment() {
    return EnvSet("BITRISE_BUILD_NUMBER") || EnvSet("BITRISE_DEPLOY_DIR");
}

Result WriteToDeployDir(const std::string& filename, std::string_view data, std::string& out_path) {
    const char* deploy_dir = std::getenv("BITRISE_DEPLOY_DIR");
    if (!deploy_dir || !*deploy_dir) {
        return Result::Fail(kErrValidation, "BITRISE_DEPLOY_DIR is not set");
    }

    std::error_code ec;
    fs::create_directories(deploy_dir, ec);
    if (ec) {
        return Result::Fail(ec.value(), "failed to create deploy directory: " + ec.message());
    }

    const std::string path = (fs::path(deploy_dir) / filename).string();
    Fd fd;
    auto open_result = Fd::Open(path, O_WRONLY | O_CREAT | O_TRUNC, 0644, fd);
    if (!open_result.ok) return open_result.Wrap("failed to write to deploy directory");

    auto write_result = fd.WriteAll(data);
    if (!write_result.ok) return write_result.Wrap("failed to write to deploy directory");

    out_path = path;
    return Result::Ok();
}

std::string FindOnPath(const std::string& name) {
    const char* path_env = std::getenv("PATH");
    if (!path_env) return {};

    std::string_view rest(path_env);
    while (true) {
        const auto colon = rest.find(':');
        std::string dir(rest.substr(0, colon));
        if (dir.empty()) dir = ".";
        const std::string candidate = (fs::path(dir) / name).string();
        if (::access(candidate.c_str(), X_OK) == 0) return candidate;
        if (colon == std::string_view::npos) break;
        rest.remove_prefix(colon + 1);
    }
    return {};
}

Result ExportEnvVar(const std::string& key, const std::string& value) {
    const std::string envman = FindOnPath("envman");
    if (envman.empty()) {
        LogDebug("envman not found on PATH, skipping export of %s", key.c_str());
        return Result::Ok();
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int e = errno;
        return Result::Fail(e, "envman export " + key + ": fork: " + std::strerror(e));
    }
    if (pid == 0) {
        const char* argv[] = {envman.c_str(), "add", "--key", key.c_str(), "--value", value.c_str(),
                              nullptr};
        ::execv(envman.c_str(), const_cast<char* const*>(argv));
        ::_exit(127);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        const int e = errno;
        return Result::Fail(e, "envman export " + key + ": waitpid: " + std::strerror(e));
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return Result::Fail(kErrIo, "envman export " + key + ": exit status " +
                                        std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1));
    }
    return Result::Ok();
}

} // namespace codepush::ci
