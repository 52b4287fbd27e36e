#include "codepush/summary.hpp"

#include "codepush/wire.hpp"
#include "util/ci_env.hpp"

namespace codepush {

using json = nlohmann::json;

json ToJson(const Deployment& d) {
    json j{{"id", d.id}, {"name", d.name}};
    if (!d.created_at.empty()) j["created_at"] = d.created_at;
    if (!d.key.empty()) j["key"] = d.key;
    return j;
}

json ToJson(const PackageStatus& s) {
    json j{{"package_id", s.package_id}, {"status", s.status}};
    if (!s.status_reason.empty()) j["status_reason"] = s.status_reason;
    return j;
}

json ToJson(const Package& p) {
    json j{
        {"id", p.id},
        {"label", p.label},
        {"app_version", p.app_version},
        {"description", p.description},
        {"mandatory", p.mandatory},
        {"disabled", p.disabled},
        {"rollout", p.rollout},
        {"deployment_id", p.deployment_id},
        {"file_size_bytes", p.file_size_bytes},
    };
    if (!p.created_at.empty()) j["created_at"] = p.created_at;
    if (!p.hash.empty()) j["hash"] = p.hash;
    if (!p.file_name.empty()) j["file_name"] = p.file_name;
    if (p.created_by) {
        j["created_by"] = json{
            {"id", p.created_by->id},
            {"email", p.created_by->email},
            {"username", p.created_by->username},
            {"avatar_url", p.created_by->avatar_url},
        };
    }
    return j;
}

json ToJson(const PushResult& r) {
    return json{
        {"package_id", r.package_id},
        {"app_id", r.app_id},
        {"deployment_id", r.deployment_id},
        {"app_version", r.app_version},
        {"status", r.status},
        {"file_size_bytes", r.file_size_bytes},
        {"sha256", r.sha256},
    };
}

json ToJson(const PatchResult& r) {
    return json{
        {"package_id", r.package_id},
        {"app_id", r.app_id},
        {"deployment_id", r.deployment_id},
        {"label", r.label},
        {"app_version", r.app_version},
        {"mandatory", r.mandatory},
        {"disabled", r.disabled},
        {"rollout", r.rollout},
        {"description", r.description},
    };
}

json ToJson(const RollbackResult& r) {
    return json{
        {"package_id", r.package_id},
        {"app_id", r.app_id},
        {"deployment_id", r.deployment_id},
        {"label", r.label},
        {"app_version", r.app_version},
    };
}

json ToJson(const PromoteResult& r) {
    return json{
        {"package_id", r.package_id},
        {"app_id", r.app_id},
        {"source_deployment_id", r.source_deployment_id},
        {"dest_deployment_id", r.dest_deployment_id},
        {"label", r.label},
        {"app_version", r.app_version},
        {"description", r.description},
    };
}

EnvVars ExportedVars(const PushResult& r) {
    return {{"CODEPUSH_PACKAGE_ID", r.package_id}, {"CODEPUSH_APP_VERSION", r.app_version}};
}

EnvVars ExportedVars(const PatchResult& r) {
    return {{"CODEPUSH_PACKAGE_ID", r.package_id},
            {"CODEPUSH_LABEL", r.label},
            {"CODEPUSH_APP_VERSION", r.app_version}};
}

EnvVars ExportedVars(const RollbackResult& r) {
    return {{"CODEPUSH_PACKAGE_ID", r.package_id}, {"CODEPUSH_APP_VERSION", r.app_version}};
}

EnvVars ExportedVars(const PromoteResult& r) {
    return {{"CODEPUSH_PACKAGE_ID", r.package_id}, {"CODEPUSH_APP_VERSION", r.app_version}};
}

void ExportCiSummary(const std::string& op,
                     const json& summary,
                     const EnvVars& vars,
                     IOutput& out) {
    if (!ci::IsBitriseEnvironment()) return;

    const std::string filename = "codepush-" + op + "-summary.json";
    std::string path;
    auto write_result = ci::WriteToDeployDir(filename, wire::DumpJson(summary, 2) + "\n", path);
    if (write_result.ok) {
        out.Info("Summary exported to: %s", path.c_str());
    } else {
        out.Warning("failed to export %s: %s", filename.c_str(), write_result.msg.c_str());
    }

    for (const auto& [key, value] : vars) {
        auto export_result = ci::ExportEnvVar(key, value);
        if (!export_result.ok) {
            out.Warning("failed to export %s: %s", key.c_str(), export_result.msg.c_str());
        }
    }
}

} // namespace codepush
