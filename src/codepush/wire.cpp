#include "codepush/wire.hpp"

#include <map>

namespace codepush::wire {

using json = nlohmann::json;

namespace {

// Missing and null keys leave `out` untouched; a wrong type is an error.
bool GetString(const json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_string()) {
        err = std::string("field '") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetBool(const json& j, const char* key, bool& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_boolean()) {
        err = std::string("field '") + key + "' must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool GetNumber(const json& j, const char* key, double& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_number()) {
        err = std::string("field '") + key + "' must be a number";
        return false;
    }
    out = it->get<double>();
    return true;
}

bool GetInt64(const json& j, const char* key, std::int64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!(it->is_number_integer() || it->is_number_unsigned())) {
        err = std::string("field '") + key + "' must be an integer";
        return false;
    }
    out = it->get<std::int64_t>();
    return true;
}

std::expected<json, std::string> ParseObject(std::string_view body) {
    json j = json::parse(body.begin(), body.end(), nullptr, false);
    if (j.is_discarded()) {
        return std::unexpected("decoding response: invalid JSON");
    }
    if (!j.is_object()) {
        return std::unexpected("decoding response: expected a JSON object");
    }
    return j;
}

std::expected<Deployment, std::string> DeploymentFromJson(const json& j) {
    if (!j.is_object()) return std::unexpected("deployment must be an object");
    Deployment d;
    std::string err;
    if (!GetString(j, "id", d.id, err) || !GetString(j, "name", d.name, err) ||
        !GetString(j, "created_at", d.created_at, err) || !GetString(j, "key", d.key, err)) {
        return std::unexpected(err);
    }
    return d;
}

std::expected<PackageCreator, std::string> CreatorFromJson(const json& j) {
    if (!j.is_object()) return std::unexpected("created_by must be an object");
    PackageCreator c;
    std::string err;
    if (!GetString(j, "id", c.id, err) || !GetString(j, "email", c.email, err) ||
        !GetString(j, "username", c.username, err) ||
        !GetString(j, "avatar_url", c.avatar_url, err)) {
        return std::unexpected(err);
    }
    return c;
}

std::expected<Package, std::string> PackageFromJson(const json& j) {
    if (!j.is_object()) return std::unexpected("package must be an object");
    Package p;
    std::string err;
    const bool ok = GetString(j, "id", p.id, err) && GetString(j, "label", p.label, err) &&
                    GetString(j, "app_version", p.app_version, err) &&
                    GetString(j, "description", p.description, err) &&
                    GetBool(j, "mandatory", p.mandatory, err) &&
                    GetBool(j, "disabled", p.disabled, err) &&
                    GetNumber(j, "rollout", p.rollout, err) &&
                    GetString(j, "deployment_id", p.deployment_id, err) &&
                    GetInt64(j, "file_size_bytes", p.file_size_bytes, err) &&
                    GetString(j, "created_at", p.created_at, err) &&
                    GetString(j, "hash", p.hash, err) &&
                    GetString(j, "file_name", p.file_name, err);
    if (!ok) return std::unexpected(err);

    auto it = j.find("created_by");
    if (it != j.end() && !it->is_null()) {
        auto creator = CreatorFromJson(*it);
        if (!creator) return std::unexpected(creator.error());
        p.created_by = std::move(*creator);
    }
    return p;
}

template <typename T, typename Fn>
std::expected<std::vector<T>, std::string> ItemsFromBody(std::string_view body, Fn&& from_json) {
    auto j = ParseObject(body);
    if (!j) return std::unexpected(j.error());

    std::vector<T> out;
    auto it = j->find("items");
    if (it == j->end() || it->is_null()) return out;
    if (!it->is_array()) {
        return std::unexpected("decoding response: 'items' must be an array");
    }
    out.reserve(it->size());
    for (const auto& item : *it) {
        auto v = from_json(item);
        if (!v) return std::unexpected("decoding response: " + v.error());
        out.push_back(std::move(*v));
    }
    return out;
}

} // namespace

std::expected<Deployment, std::string> ParseDeployment(std::string_view body) {
    auto j = ParseObject(body);
    if (!j) return std::unexpected(j.error());
    auto d = DeploymentFromJson(*j);
    if (!d) return std::unexpected("decoding response: " + d.error());
    return d;
}

std::expected<std::vector<Deployment>, std::string> ParseDeploymentList(std::string_view body) {
    return ItemsFromBody<Deployment>(body, DeploymentFromJson);
}

std::expected<Package, std::string> ParsePackage(std::string_view body) {
    auto j = ParseObject(body);
    if (!j) return std::unexpected(j.error());
    auto p = PackageFromJson(*j);
    if (!p) return std::unexpected("decoding response: " + p.error());
    return p;
}

std::expected<std::vector<Package>, std::string> ParsePackageList(std::string_view body) {
    return ItemsFromBody<Package>(body, PackageFromJson);
}

std::expected<PackageStatus, std::string> ParsePackageStatus(std::string_view body) {
    auto j = ParseObject(body);
    if (!j) return std::unexpected(j.error());

    PackageStatus s;
    std::string err;
    if (!GetString(*j, "package_id", s.package_id, err) || !GetString(*j, "status", s.status, err) ||
        !GetString(*j, "status_reason", s.status_reason, err)) {
        return std::unexpected("decoding response: " + err);
    }
    return s;
}

std::expected<UploadSlot, std::string> ParseUploadSlot(std::string_view body) {
    auto j = ParseObject(body);
    if (!j) return std::unexpected(j.error());

    UploadSlot slot;
    std::string err;
    if (!GetString(*j, "url", slot.url, err) || !GetString(*j, "method", slot.method, err)) {
        return std::unexpected("decoding response: " + err);
    }

    auto it = j->find("headers");
    if (it != j->end() && !it->is_null()) {
        if (!it->is_object()) {
            return std::unexpected("decoding response: 'headers' must be an object");
        }
        for (const auto& [name, value] : it->items()) {
            if (!value.is_string()) {
                return std::unexpected("decoding response: header '" + name + "' must be a string");
            }
            slot.headers[name] = value.get<std::string>();
        }
    }
    return slot;
}

std::expected<UserInfo, std::string> ParseUserInfo(std::string_view body) {
    auto j = ParseObject(body);
    if (!j) return std::unexpected(j.error());

    UserInfo user;
    auto it = j->find("data");
    if (it == j->end() || it->is_null()) return user;
    if (!it->is_object()) return std::unexpected("decoding response: 'data' must be an object");
    std::string err;
    if (!GetString(*it, "username", user.username, err) || !GetString(*it, "email", user.email, err)) {
        return std::unexpected("decoding response: " + err);
    }
    return user;
}

std::string DumpJson(const json& j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

std::string EncodeCreateDeployment(const CreateDeploymentRequest& req) {
    return DumpJson(json{{"name", req.name}});
}

std::string EncodeRenameDeployment(const RenameDeploymentRequest& req) {
    return DumpJson(json{{"name", req.name}});
}

std::string EncodePatchRequest(const PatchRequest& req) {
    json j = json::object();
    if (req.rollout) j["rollout"] = *req.rollout;
    if (req.mandatory) j["mandatory"] = *req.mandatory;
    if (req.disabled) j["disabled"] = *req.disabled;
    if (req.description) j["description"] = *req.description;
    if (req.app_version) j["app_version"] = *req.app_version;
    return DumpJson(j);
}

std::string EncodeRollbackRequest(const RollbackRequest& req) {
    json j = json::object();
    if (!req.package_id.empty()) j["package_id"] = req.package_id;
    return DumpJson(j);
}

std::string EncodePromoteRequest(const PromoteRequest& req) {
    json j = json::object();
    j["target_deployment_id"] = req.target_deployment_id;
    if (!req.package_id.empty()) j["package_id"] = req.package_id;
    if (!req.app_version.empty()) j["app_version"] = req.app_version;
    if (!req.description.empty()) j["description"] = req.description;
    if (!req.disabled.empty()) j["disabled"] = req.disabled;
    if (!req.mandatory.empty()) j["mandatory"] = req.mandatory;
    if (!req.rollout.empty()) j["rollout"] = req.rollout;
    return DumpJson(j);
}

std::string QueryEscape(std::string_view s) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                                (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
                                c == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string BuildUploadUrlQuery(const UploadUrlRequest& req) {
    std::map<std::string, std::string> params;
    params["app_version"] = req.app_version;
    params["file_name"] = req.file_name;
    params["file_size_bytes"] = std::to_string(req.file_size_bytes);
    if (!req.description.empty()) params["description"] = req.description;
    if (req.mandatory) params["mandatory"] = "true";
    if (req.disabled) params["disabled"] = "true";
    if (req.rollout > 0 && req.rollout < 100) params["rollout"] = std::to_string(req.rollout);

    std::string out;
    for (const auto& [key, value] : params) {
        if (!out.empty()) out.push_back('&');
        out += QueryEscape(key);
        out.push_back('=');
        out += QueryEscape(value);
    }
    return out;
}

} // namespace codepush::wire
