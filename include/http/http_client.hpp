#pragma once

#include "codepush/client.hpp"

#include <stop_token>
#include <string>

namespace codepush::http {

inline constexpr const char kDefaultBaseUrl[] = "https://api.bitrise.io/release-management";
inline constexpr const char kDefaultAccountUrl[] = "https://api.bitrise.io/v0.1/me";
// Where users create personal access tokens.
inline constexpr const char kTokenGenerationUrl[] = "https://app.bitrise.io/me/account/security";

// Process-wide libcurl init/cleanup. Construct one in main before any client.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    bool ok() const { return ok_; }

private:
    bool ok_{false};
};

// Client backed by the release management REST API over libcurl.
// One easy handle per request; not safe for concurrent use.
class HttpClient final : public Client, public ITokenValidator {
public:
    HttpClient(std::string base_url, std::string token,
               std::string account_url = kDefaultAccountUrl);

    // Aborts in-flight transfers once a stop is requested.
    void SetStopToken(std::stop_token stop) { stop_ = std::move(stop); }

    Result ListDeployments(const std::string& app_id, std::vector<Deployment>& out) override;
    Result CreateDeployment(const std::string& app_id,
                            const CreateDeploymentRequest& req,
                            Deployment& out) override;
    Result GetDeployment(const std::string& app_id,
                         const std::string& deployment_id,
                         Deployment& out) override;
    Result RenameDeployment(const std::string& app_id,
                            const std::string& deployment_id,
                            const RenameDeploymentRequest& req,
                            Deployment& out) override;
    Result DeleteDeployment(const std::string& app_id, const std::string& deployment_id) override;

    Result ListPackages(const std::string& app_id,
                        const std::string& deployment_id,
                        std::vector<Package>& out) override;
    Result GetPackage(const std::string& app_id,
                      const std::string& deployment_id,
                      const std::string& package_id,
                      Package& out) override;
    Result DeletePackage(const std::string& app_id,
                         const std::string& deployment_id,
                         const std::string& package_id) override;
    Result GetPackageStatus(const std::string& app_id,
                            const std::string& deployment_id,
                            const std::string& package_id,
                            PackageStatus& out) override;

    Result GetUploadUrl(const std::string& app_id,
                        const std::string& deployment_id,
                        const std::string& package_id,
                        const UploadUrlRequest& req,
                        UploadSlot& out) override;
    Result UploadFile(const UploadFileRequest& req) override;

    Result PatchPackage(const std::string& app_id,
                        const std::string& deployment_id,
                        const std::string& package_id,
                        const PatchRequest& req,
                        Package& out) override;
    Result Rollback(const std::string& app_id,
                    const std::string& deployment_id,
                    const RollbackRequest& req,
                    Package& out) override;
    Result Promote(const std::string& app_id,
                   const std::string& deployment_id,
                   const PromoteRequest& req,
                   Package& out) override;

    Result GetCurrentUser(const std::string& token, UserInfo& out) override;

private:
    // One request to an absolute URL. Fails only on transport errors; the
    // HTTP status is left in `status`.
    Result Exchange(const char* method,
                    const std::string& url,
                    const std::string& token,
                    const std::string* json_body,
                    std::string& response_body,
                    long& status);

    // Sends an API request. `json_body` may be null. Non-2xx responses fail
    // with the status code and response body.
    Result Send(const char* method,
                const std::string& path,
                const std::string* json_body,
                std::string& response_body);

    std::string base_url_;
    std::string token_;
    std::string account_url_;
    std::stop_token stop_;
};

} // namespace codepush::http
