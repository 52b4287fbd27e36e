#pragma once

#include "codepush/types.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace codepush {

// Each workflow depends only on the capabilities it calls. Client bundles all
// of them for the production HTTP implementation and for test doubles.

class IDeploymentLister {
public:
    virtual ~IDeploymentLister() = default;
    virtual Result ListDeployments(const std::string& app_id, std::vector<Deployment>& out) = 0;
};

class IDeploymentAdmin {
public:
    virtual ~IDeploymentAdmin() = default;
    virtual Result CreateDeployment(const std::string& app_id,
                                    const CreateDeploymentRequest& req,
                                    Deployment& out) = 0;
    virtual Result GetDeployment(const std::string& app_id,
                                 const std::string& deployment_id,
                                 Deployment& out) = 0;
    virtual Result RenameDeployment(const std::string& app_id,
                                    const std::string& deployment_id,
                                    const RenameDeploymentRequest& req,
                                    Deployment& out) = 0;
    virtual Result DeleteDeployment(const std::string& app_id, const std::string& deployment_id) = 0;
};

class IPackageLister {
public:
    virtual ~IPackageLister() = default;
    virtual Result ListPackages(const std::string& app_id,
                                const std::string& deployment_id,
                                std::vector<Package>& out) = 0;
};

class IPackageAdmin {
public:
    virtual ~IPackageAdmin() = default;
    virtual Result GetPackage(const std::string& app_id,
                              const std::string& deployment_id,
                              const std::string& package_id,
                              Package& out) = 0;
    virtual Result DeletePackage(const std::string& app_id,
                                 const std::string& deployment_id,
                                 const std::string& package_id) = 0;
};

class IStatusChecker {
public:
    virtual ~IStatusChecker() = default;
    virtual Result GetPackageStatus(const std::string& app_id,
                                    const std::string& deployment_id,
                                    const std::string& package_id,
                                    PackageStatus& out) = 0;
};

class IReleaseUploader {
public:
    virtual ~IReleaseUploader() = default;
    virtual Result GetUploadUrl(const std::string& app_id,
                                const std::string& deployment_id,
                                const std::string& package_id,
                                const UploadUrlRequest& req,
                                UploadSlot& out) = 0;
    virtual Result UploadFile(const UploadFileRequest& req) = 0;
};

class IPackagePatcher {
public:
    virtual ~IPackagePatcher() = default;
    virtual Result PatchPackage(const std::string& app_id,
                                const std::string& deployment_id,
                                const std::string& package_id,
                                const PatchRequest& req,
                                Package& out) = 0;
};

class IRollbackInvoker {
public:
    virtual ~IRollbackInvoker() = default;
    virtual Result Rollback(const std::string& app_id,
                            const std::string& deployment_id,
                            const RollbackRequest& req,
                            Package& out) = 0;
};

class IPromoteInvoker {
public:
    virtual ~IPromoteInvoker() = default;
    virtual Result Promote(const std::string& app_id,
                           const std::string& deployment_id,
                           const PromoteRequest& req,
                           Package& out) = 0;
};

class Client : public IDeploymentLister,
               public IDeploymentAdmin,
               public IPackageLister,
               public IPackageAdmin,
               public IStatusChecker,
               public IReleaseUploader,
               public IPackagePatcher,
               public IRollbackInvoker,
               public IPromoteInvoker {
public:
    ~Client() override = default;
};

// Resolves the account behind an API token. Independent of the client's own
// token so a candidate token can be checked before it is stored.
class ITokenValidator {
public:
    virtual ~ITokenValidator() = default;
    virtual Result GetCurrentUser(const std::string& token, UserInfo& out) = 0;
};

} // namespace codepush
