#include "codepush/push.hpp"

#include "codepush/archiver.hpp"
#include "codepush/deployment_resolver.hpp"
#include "codepush/status_poller.hpp"
#include "codepush/validation.hpp"
#include "io/file_reader.hpp"
#include "io/scoped_file.hpp"
#include "util/logger.hpp"
#include "util/sha256.hpp"
#include "util/uuid.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace codepush {

Result ValidatePushOptions(const PushOptions& opts) {
    auto base = ValidateBaseOptions(opts.app_id, opts.token);
    if (!base.ok) return base;

    auto dep = RequireDeployment(opts.deployment);
    if (!dep.ok) return dep;

    if (opts.app_version.empty()) {
        return Result::Fail(kErrValidation, "app version is required: set --app-version");
    }
    if (opts.bundle_path.empty()) {
        return Result::Fail(kErrValidation,
                            "bundle path is required: provide it as the push argument");
    }
    if (opts.rollout < 1 || opts.rollout > 100) {
        return Result::Fail(kErrValidation,
                            "rollout must be between 1 and 100, got " + std::to_string(opts.rollout));
    }

    std::error_code ec;
    const auto st = fs::status(opts.bundle_path, ec);
    if (ec || !fs::exists(st)) {
        return Result::Fail(kErrValidation, "bundle path does not exist: " + opts.bundle_path);
    }
    if (!fs::is_directory(st)) {
        return Result::Fail(kErrValidation, "bundle path is not a directory: " + opts.bundle_path);
    }
    return Result::Ok();
}

ReleasePublisher::ReleasePublisher(IDeploymentLister& lister,
                                   IReleaseUploader& uploader,
                                   IStatusChecker& status_checker,
                                   PollConfig poll_config)
    : lister_(lister),
      uploader_(uploader),
      status_checker_(status_checker),
      poll_config_(poll_config) {}

ReleasePublisher::ReleasePublisher(Client& client, PollConfig poll_config)
    : ReleasePublisher(client, client, client, poll_config) {}

Result ReleasePublisher::Run(const PushOptions& opts, IOutput& out, PushResult& result) {
    auto valid = ValidatePushOptions(opts);
    if (!valid.ok) return valid;

    std::string deployment_id;
    auto resolve_result = ResolveDeployment(lister_, opts.app_id, opts.deployment, out, deployment_id);
    if (!resolve_result.ok) return resolve_result;

    UploadedBundle uploaded;
    auto upload_result = UploadBundle(opts, deployment_id, out, uploaded);
    if (!upload_result.ok) return upload_result;

    out.Step("Processing package");
    PackageStatus status;
    const PackageRef ref{opts.app_id, deployment_id, uploaded.package_id};
    auto poll_result = PollPackageStatus(status_checker_, ref, poll_config_, status, stop_);
    if (!poll_result.ok) return poll_result;

    result = PushResult{
        .package_id = uploaded.package_id,
        .app_id = opts.app_id,
        .deployment_id = deployment_id,
        .app_version = opts.app_version,
        .status = status.status,
        .file_size_bytes = uploaded.file_size_bytes,
        .sha256 = uploaded.sha256,
    };
    LogInfo("published package %s to deployment %s",
            result.package_id.c_str(),
            result.deployment_id.c_str());
    return Result::Ok();
}

Result ReleasePublisher::UploadBundle(const PushOptions& opts,
                                      const std::string& deployment_id,
                                      IOutput& out,
                                      UploadedBundle& uploaded) {
    out.Step("Packaging bundle: %s", opts.bundle_path.c_str());
    std::string zip_path;
    auto zip_result = ArchiveDirectory(opts.bundle_path, zip_path);
    if (!zip_result.ok) return zip_result.Wrap("packaging bundle");
    ScopedFile archive(zip_path);

    std::error_code ec;
    const auto size = fs::file_size(archive.Path(), ec);
    if (ec) {
        return Result::Fail(ec.value(), "reading zip file info: " + ec.message());
    }
    const auto file_size = static_cast<std::int64_t>(size);
    out.Info("Package size: %lld bytes", (long long)file_size);

    std::string digest;
    auto hash_result = Sha256HexFile(archive.Path(), digest);
    if (!hash_result.ok) return hash_result.Wrap("hashing package");
    LogDebug("package sha256=%s", digest.c_str());

    std::string package_id;
    auto id_result = GenerateUuidV4String(package_id);
    if (!id_result.ok) return id_result.Wrap("generating package ID");

    out.Step("Requesting upload URL");
    UploadUrlRequest slot_request;
    slot_request.app_version = opts.app_version;
    slot_request.file_name = fs::path(archive.Path()).filename().string();
    slot_request.file_size_bytes = file_size;
    slot_request.description = opts.description;
    slot_request.mandatory = opts.mandatory;
    slot_request.disabled = opts.disabled;
    slot_request.rollout = opts.rollout;

    UploadSlot slot;
    auto slot_result =
        uploader_.GetUploadUrl(opts.app_id, deployment_id, package_id, slot_request, slot);
    if (!slot_result.ok) return slot_result.Wrap("requesting upload URL");

    out.Step("Uploading package");
    {
        FileReader body;
        auto open_result = FileReader::Open(archive.Path(), body);
        if (!open_result.ok) return open_result.Wrap("uploading package: opening zip for upload");

        UploadFileRequest upload;
        upload.url = slot.url;
        upload.method = slot.method;
        upload.headers = slot.headers;
        upload.body = &body;
        upload.content_length = file_size;
        upload.progress = progress_sink_;

        auto send_result = uploader_.UploadFile(upload);
        if (!send_result.ok) return send_result.Wrap("uploading package");
    }

    uploaded.package_id = std::move(package_id);
    uploaded.file_size_bytes = file_size;
    uploaded.sha256 = std::move(digest);
    return Result::Ok();
}

} // namespace codepush
