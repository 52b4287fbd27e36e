#pragma once

#include "codepush/types.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

// JSON and query-string encoding for the release management API.
namespace codepush::wire {

std::expected<Deployment, std::string> ParseDeployment(std::string_view body);
std::expected<std::vector<Deployment>, std::string> ParseDeploymentList(std::string_view body);
std::expected<Package, std::string> ParsePackage(std::string_view body);
std::expected<std::vector<Package>, std::string> ParsePackageList(std::string_view body);
std::expected<PackageStatus, std::string> ParsePackageStatus(std::string_view body);
std::expected<UploadSlot, std::string> ParseUploadSlot(std::string_view body);
// Reads the "data" object of the account endpoint.
std::expected<UserInfo, std::string> ParseUserInfo(std::string_view body);

// Serializes `j`; bytes that are not valid UTF-8 become U+FFFD instead of
// throwing. `indent` < 0 gives the compact form.
std::string DumpJson(const nlohmann::json& j, int indent = -1);

std::string EncodeCreateDeployment(const CreateDeploymentRequest& req);
std::string EncodeRenameDeployment(const RenameDeploymentRequest& req);
// Disengaged fields are left out of the object.
std::string EncodePatchRequest(const PatchRequest& req);
std::string EncodeRollbackRequest(const RollbackRequest& req);
std::string EncodePromoteRequest(const PromoteRequest& req);

// application/x-www-form-urlencoded escaping: unreserved bytes pass through,
// space becomes '+', everything else is %XX.
std::string QueryEscape(std::string_view s);

// Parameters sorted by key. `rollout` is sent only for partial rollouts
// (1..99); `mandatory`/`disabled` only when true.
std::string BuildUploadUrlQuery(const UploadUrlRequest& req);

} // namespace codepush::wire
