#pragma once

#include "codepush/progress.hpp"
#include "io/io.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace codepush {

struct Deployment {
    std::string id;
    std::string name;
    std::string created_at;
    std::string key;
};

struct PackageCreator {
    std::string id;
    std::string email;
    std::string username;
    std::string avatar_url;
};

struct Package {
    std::string id;
    std::string label;
    std::string app_version;
    std::string description;
    bool mandatory = false;
    bool disabled = false;
    double rollout = 0.0;
    std::string deployment_id;
    std::int64_t file_size_bytes = 0;
    std::string created_at;
    std::string hash;
    std::string file_name;
    std::optional<PackageCreator> created_by;
};

inline constexpr const char kStatusProcessing[] = "processing";
inline constexpr const char kStatusDone[] = "done";
inline constexpr const char kStatusFailed[] = "failed";

struct PackageStatus {
    std::string package_id;
    std::string status;
    std::string status_reason;
};

// Account that owns an API token.
struct UserInfo {
    std::string username;
    std::string email;
};

// Identifies one package within a deployment.
struct PackageRef {
    std::string app_id;
    std::string deployment_id;
    std::string package_id;
};

struct UploadSlot {
    std::string url;
    std::string method;
    std::map<std::string, std::string> headers;
};

struct UploadUrlRequest {
    std::string app_version;
    std::string file_name;
    std::int64_t file_size_bytes = 0;
    std::string description;
    bool mandatory = false;
    bool disabled = false;
    int rollout = 100;
};

struct UploadFileRequest {
    std::string url;
    std::string method;
    std::map<std::string, std::string> headers;
    IReader* body = nullptr;
    std::int64_t content_length = 0;
    IProgress* progress = nullptr;
};

struct PollConfig {
    int max_attempts = 60;
    std::chrono::milliseconds interval{2000};
};

inline constexpr PollConfig kDefaultPollConfig{60, std::chrono::milliseconds(2000)};

// Only engaged fields are sent to the server.
struct PatchRequest {
    std::optional<int> rollout;
    std::optional<bool> mandatory;
    std::optional<bool> disabled;
    std::optional<std::string> description;
    std::optional<std::string> app_version;
};

struct RollbackRequest {
    std::string package_id; // empty => server picks the previous release
};

// Overrides are opaque strings; empty fields are omitted on the wire.
struct PromoteRequest {
    std::string target_deployment_id;
    std::string package_id;
    std::string app_version;
    std::string description;
    std::string disabled;
    std::string mandatory;
    std::string rollout;
};

struct CreateDeploymentRequest {
    std::string name;
};

struct RenameDeploymentRequest {
    std::string name;
};

struct PushOptions {
    std::string app_id;
    std::string deployment;
    std::string token;
    std::string app_version;
    std::string description;
    bool mandatory = false;
    bool disabled = false;
    int rollout = 100;
    std::string bundle_path;
};

struct PushResult {
    std::string package_id;
    std::string app_id;
    std::string deployment_id;
    std::string app_version;
    std::string status;
    std::int64_t file_size_bytes = 0;
    std::string sha256;
};

struct PatchOptions {
    std::string app_id;
    std::string deployment;
    std::string token;
    std::string label;       // empty => latest
    std::string rollout;     // "1".."100"
    std::string mandatory;   // "true"/"false"
    std::string disabled;    // "true"/"false"
    std::string description;
    std::string app_version;
};

struct PatchResult {
    std::string package_id;
    std::string app_id;
    std::string deployment_id;
    std::string label;
    std::string app_version;
    bool mandatory = false;
    bool disabled = false;
    int rollout = 0;
    std::string description;
};

struct RollbackOptions {
    std::string app_id;
    std::string deployment;
    std::string token;
    std::string target_label;
};

struct RollbackResult {
    std::string package_id;
    std::string app_id;
    std::string deployment_id;
    std::string label;
    std::string app_version;
};

struct PromoteOptions {
    std::string app_id;
    std::string source_deployment;
    std::string dest_deployment;
    std::string token;
    std::string label;
    std::string app_version;
    std::string description;
    std::string mandatory;
    std::string disabled;
    std::string rollout;
};

struct PromoteResult {
    std::string package_id;
    std::string app_id;
    std::string source_deployment_id;
    std::string dest_deployment_id;
    std::string label;
    std::string app_version;
    std::string description;
};

} // namespace codepush
