#include "http/http_client.hpp"

#include "codepush/wire.hpp"
#include "util/logger.hpp"

#include <curl/curl.h>

#include <cstring>
#include <memory>

namespace codepush::http {

namespace {

constexpr long kConnectTimeoutSec = 30;

struct CurlEasyDeleter {
    void operator()(CURL* h) const noexcept {
        if (h) curl_easy_cleanup(h);
    }
};
using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlSlistDeleter {
    void operator()(curl_slist* l) const noexcept {
        if (l) curl_slist_free_all(l);
    }
};
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

struct Transfer {
    std::string* response = nullptr;
    IReader* upload = nullptr;
    bool read_failed = false;
    IProgress* progress = nullptr;
    std::uint64_t upload_total = 0;
    std::stop_token stop;
};

size_t WriteCallback(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    const size_t n = size * nmemb;
    t->response->append(data, n);
    return n;
}

size_t ReadCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    const ssize_t n = t->upload->Read(
        std::span<uint8_t>(reinterpret_cast<uint8_t*>(buffer), size * nitems));
    if (n < 0) {
        t->read_failed = true;
        return CURL_READFUNC_ABORT;
    }
    return static_cast<size_t>(n);
}

int XferInfoCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t ulnow) {
    auto* t = static_cast<Transfer*>(userdata);
    if (t->stop.stop_requested()) return 1;
    if (t->progress && t->upload_total > 0) {
        t->progress->OnProgress(TransferProgress{
            .label = "upload",
            .sent = static_cast<std::uint64_t>(ulnow),
            .total = t->upload_total,
        });
    }
    return 0;
}

bool IsSuccess(long status) {
    return status >= 200 && status < 300;
}

std::string DeploymentsPath(const std::string& app_id) {
    return "/connected-apps/" + app_id + "/code-push/deployments";
}

std::string DeploymentPath(const std::string& app_id, const std::string& deployment_id) {
    return DeploymentsPath(app_id) + "/" + deployment_id;
}

std::string PackagePath(const std::string& app_id,
                        const std::string& deployment_id,
                        const std::string& package_id) {
    return DeploymentPath(app_id, deployment_id) + "/packages/" + package_id;
}

// Transport outcome of curl_easy_perform, before the status code is inspected.
Result PerformTransfer(CURL* h, const Transfer& t, const std::string& what) {
    const CURLcode rc = curl_easy_perform(h);
    if (rc == CURLE_OK) return Result::Ok();
    if (rc == CURLE_ABORTED_BY_CALLBACK && t.stop.stop_requested()) {
        return Result::Fail(kErrCancelled, "sending request to " + what + ": cancelled");
    }
    if (t.read_failed) {
        return Result::Fail(kErrIo, "sending request to " + what + ": reading request body failed");
    }
    return Result::Fail(kErrTransport,
                        "sending request to " + what + ": " + curl_easy_strerror(rc));
}

template <typename T>
Result Decoded(std::expected<T, std::string> parsed, T& out) {
    if (!parsed) return Result::Fail(kErrTransport, parsed.error());
    out = std::move(*parsed);
    return Result::Ok();
}

} // namespace

CurlGlobal::CurlGlobal() {
    ok_ = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
}

CurlGlobal::~CurlGlobal() {
    if (ok_) curl_global_cleanup();
}

HttpClient::HttpClient(std::string base_url, std::string token, std::string account_url)
    : base_url_(std::move(base_url)), token_(std::move(token)), account_url_(std::move(account_url)) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

Result HttpClient::Exchange(const char* method,
                            const std::string& url,
                            const std::string& token,
                            const std::string* json_body,
                            std::string& response_body,
                            long& status) {
    CurlEasyPtr h(curl_easy_init());
    if (!h) return Result::Fail(kErrTransport, "creating request: curl_easy_init failed");

    CurlSlistPtr headers;
    auto add_header = [&headers](const std::string& line) {
        headers.reset(curl_slist_append(headers.release(), line.c_str()));
    };
    add_header("Authorization: " + token);
    add_header("Accept: application/json");
    if (json_body) add_header("Content-Type: application/json");

    Transfer t;
    t.response = &response_body;
    t.stop = stop_;
    response_body.clear();

    curl_easy_setopt(h.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(h.get(), CURLOPT_CUSTOMREQUEST, method);
    curl_easy_setopt(h.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h.get(), CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSec);
    curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &t);
    curl_easy_setopt(h.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h.get(), CURLOPT_XFERINFOFUNCTION, XferInfoCallback);
    curl_easy_setopt(h.get(), CURLOPT_XFERINFODATA, &t);
    if (json_body) {
        curl_easy_setopt(h.get(), CURLOPT_POSTFIELDS, json_body->c_str());
        curl_easy_setopt(h.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(json_body->size()));
    }

    LogDebug("%s %s", method, url.c_str());
    auto transfer_result = PerformTransfer(h.get(), t, url);
    if (!transfer_result.ok) return transfer_result;

    status = 0;
    curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &status);
    LogDebug("%s %s -> HTTP %ld (%zu bytes)", method, url.c_str(), status, response_body.size());
    return Result::Ok();
}

Result HttpClient::Send(const char* method,
                        const std::string& path,
                        const std::string* json_body,
                        std::string& response_body) {
    long status = 0;
    auto r = Exchange(method, base_url_ + path, token_, json_body, response_body, status);
    if (!r.ok) return r;
    if (!IsSuccess(status)) {
        return Result::Fail(kErrTransport,
                            "API returned HTTP " + std::to_string(status) + ": " + response_body);
    }
    return Result::Ok();
}

Result HttpClient::ListDeployments(const std::string& app_id, std::vector<Deployment>& out) {
    std::string body;
    auto r = Send("GET", DeploymentsPath(app_id), nullptr, body);
    if (r.ok) r = Decoded(wire::ParseDeploymentList(body), out);
    return r.Wrap("listing deployments");
}

Result HttpClient::CreateDeployment(const std::string& app_id,
                                    const CreateDeploymentRequest& req,
                                    Deployment& out) {
    const std::string payload = wire::EncodeCreateDeployment(req);
    std::string body;
    auto r = Send("POST", DeploymentsPath(app_id), &payload, body);
    if (r.ok) r = Decoded(wire::ParseDeployment(body), out);
    return r.Wrap("creating deployment");
}

Result HttpClient::GetDeployment(const std::string& app_id,
                                 const std::string& deployment_id,
                                 Deployment& out) {
    std::string body;
    auto r = Send("GET", DeploymentPath(app_id, deployment_id), nullptr, body);
    if (r.ok) r = Decoded(wire::ParseDeployment(body), out);
    return r.Wrap("getting deployment");
}

Result HttpClient::RenameDeployment(const std::string& app_id,
                                    const std::string& deployment_id,
                                    const RenameDeploymentRequest& req,
                                    Deployment& out) {
    const std::string payload = wire::EncodeRenameDeployment(req);
    std::string body;
    auto r = Send("PATCH", DeploymentPath(app_id, deployment_id), &payload, body);
    if (r.ok) r = Decoded(wire::ParseDeployment(body), out);
    return r.Wrap("renaming deployment");
}

Result HttpClient::DeleteDeployment(const std::string& app_id, const std::string& deployment_id) {
    std::string body;
    return Send("DELETE", DeploymentPath(app_id, deployment_id), nullptr, body)
        .Wrap("deleting deployment");
}

Result HttpClient::ListPackages(const std::string& app_id,
                                const std::string& deployment_id,
                                std::vector<Package>& out) {
    std::string body;
    auto r = Send("GET", DeploymentPath(app_id, deployment_id) + "/packages", nullptr, body);
    if (r.ok) r = Decoded(wire::ParsePackageList(body), out);
    return r.Wrap("listing packages");
}

Result HttpClient::GetPackage(const std::string& app_id,
                              const std::string& deployment_id,
                              const std::string& package_id,
                              Package& out) {
    std::string body;
    auto r = Send("GET", PackagePath(app_id, deployment_id, package_id), nullptr, body);
    if (r.ok) r = Decoded(wire::ParsePackage(body), out);
    return r.Wrap("getting package");
}

Result HttpClient::DeletePackage(const std::string& app_id,
                                 const std::string& deployment_id,
                                 const std::string& package_id) {
    std::string body;
    return Send("DELETE", PackagePath(app_id, deployment_id, package_id), nullptr, body)
        .Wrap("deleting package");
}

Result HttpClient::GetPackageStatus(const std::string& app_id,
                                    const std::string& deployment_id,
                                    const std::string& package_id,
                                    PackageStatus& out) {
    std::string body;
    auto r = Send("GET", PackagePath(app_id, deployment_id, package_id) + "/status", nullptr, body);
    if (r.ok) r = Decoded(wire::ParsePackageStatus(body), out);
    return r.Wrap("getting package status");
}

Result HttpClient::GetUploadUrl(const std::string& app_id,
                                const std::string& deployment_id,
                                const std::string& package_id,
                                const UploadUrlRequest& req,
                                UploadSlot& out) {
    const std::string path = PackagePath(app_id, deployment_id, package_id) + "/upload-url?" +
                             wire::BuildUploadUrlQuery(req);
    std::string body;
    auto r = Send("GET", path, nullptr, body);
    if (r.ok) r = Decoded(wire::ParseUploadSlot(body), out);
    return r.Wrap("getting upload URL");
}

Result HttpClient::UploadFile(const UploadFileRequest& req) {
    if (!req.body) return Result::Fail(kErrValidation, "upload body is required");
    if (req.url.empty()) return Result::Fail(kErrValidation, "upload URL is empty");

    CurlEasyPtr h(curl_easy_init());
    if (!h) return Result::Fail(kErrTransport, "creating upload request: curl_easy_init failed");

    CurlSlistPtr headers;
    for (const auto& [name, value] : req.headers) {
        const std::string line = name + ": " + value;
        headers.reset(curl_slist_append(headers.release(), line.c_str()));
    }
    // No 100-continue round trip for presigned storage URLs.
    headers.reset(curl_slist_append(headers.release(), "Expect:"));

    const std::string method = req.method.empty() ? "PUT" : req.method;
    std::string response;
    Transfer t;
    t.response = &response;
    t.upload = req.body;
    t.progress = req.progress;
    t.upload_total = req.content_length > 0 ? static_cast<std::uint64_t>(req.content_length) : 0;
    t.stop = stop_;

    curl_easy_setopt(h.get(), CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(h.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(h.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(h.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(req.content_length));
    curl_easy_setopt(h.get(), CURLOPT_READFUNCTION, ReadCallback);
    curl_easy_setopt(h.get(), CURLOPT_READDATA, &t);
    curl_easy_setopt(h.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h.get(), CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSec);
    curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &t);
    curl_easy_setopt(h.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h.get(), CURLOPT_XFERINFOFUNCTION, XferInfoCallback);
    curl_easy_setopt(h.get(), CURLOPT_XFERINFODATA, &t);

    LogDebug("%s upload of %lld bytes", method.c_str(), (long long)req.content_length);
    auto transfer_result = PerformTransfer(h.get(), t, "upload URL");
    if (!transfer_result.ok) return transfer_result.Wrap("uploading file");

    long status = 0;
    curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &status);
    if (!IsSuccess(status)) {
        return Result::Fail(kErrTransport,
                            "upload failed with HTTP " + std::to_string(status) + ": " + response);
    }
    return Result::Ok();
}

Result HttpClient::PatchPackage(const std::string& app_id,
                                const std::string& deployment_id,
                                const std::string& package_id,
                                const PatchRequest& req,
                                Package& out) {
    const std::string payload = wire::EncodePatchRequest(req);
    std::string body;
    auto r = Send("PATCH", PackagePath(app_id, deployment_id, package_id), &payload, body);
    if (r.ok) r = Decoded(wire::ParsePackage(body), out);
    return r.Wrap("patching package");
}

Result HttpClient::Rollback(const std::string& app_id,
                            const std::string& deployment_id,
                            const RollbackRequest& req,
                            Package& out) {
    const std::string payload = wire::EncodeRollbackRequest(req);
    std::string body;
    auto r = Send("POST", DeploymentPath(app_id, deployment_id) + "/rollback", &payload, body);
    if (r.ok) r = Decoded(wire::ParsePackage(body), out);
    return r.Wrap("rolling back deployment");
}

Result HttpClient::Promote(const std::string& app_id,
                           const std::string& deployment_id,
                           const PromoteRequest& req,
                           Package& out) {
    const std::string payload = wire::EncodePromoteRequest(req);
    std::string body;
    auto r = Send("POST", DeploymentPath(app_id, deployment_id) + "/promote", &payload, body);
    if (r.ok) r = Decoded(wire::ParsePackage(body), out);
    return r.Wrap("promoting deployment");
}

Result HttpClient::GetCurrentUser(const std::string& token, UserInfo& out) {
    std::string body;
    long status = 0;
    auto r = Exchange("GET", account_url_, token, nullptr, body, status);
    if (!r.ok) return r.Wrap("validating token");
    if (status == 401) {
        return Result::Fail(kErrRemote, "invalid token: the API returned 401 Unauthorized");
    }
    if (!IsSuccess(status)) {
        return Result::Fail(kErrRemote,
                            "token validation failed: the API returned HTTP " + std::to_string(status));
    }
    auto user = wire::ParseUserInfo(body);
    if (user) {
        out = std::move(*user);
    } else {
        LogDebug("account response not decoded: %s", user.error().c_str());
        out = UserInfo{};
    }
    return Result::Ok();
}

} // namespace codepush::http
