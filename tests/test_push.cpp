#include <gtest/gtest.h>

#include "codepush/push.hpp"
#include "testing.hpp"
#include "util/sha256.hpp"
#include "util/uuid.hpp"

#include <filesystem>
#include <memory>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

using testutil::FakeClient;
using testutil::RecordingOutput;

constexpr codepush::PollConfig kFastPoll{.max_attempts = 5, .interval = 1ms};

class PushTest : public ::testing::Test {
  protected:
    void SetUp() override {
        bundle_ = tmp_.Join("build");
        testutil::WriteFile(bundle_ + "/index.android.bundle", "console.log('hi');\n");

        client_.on_list_deployments = testutil::ListsDeployments({
            {.id = "dep-staging", .name = "Staging"},
        });
        client_.on_get_upload_url = [](const codepush::UploadUrlRequest&, codepush::UploadSlot& slot) {
            slot.url = "https://storage.example.com/upload?sig=abc";
            slot.method = "PUT";
            slot.headers = {{"Content-Type", "application/zip"}};
            return codepush::Result::Ok();
        };
        auto calls = std::make_shared<int>(0);
        client_.on_get_package_status = [calls](const std::string& id, codepush::PackageStatus& out) {
            out.package_id = id;
            out.status = ++*calls < 2 ? codepush::kStatusProcessing : codepush::kStatusDone;
            return codepush::Result::Ok();
        };
    }

    codepush::PushOptions Options() const {
        codepush::PushOptions opts;
        opts.app_id = testutil::kAppId;
        opts.deployment = "Staging";
        opts.token = "secret";
        opts.app_version = "1.2.0";
        opts.bundle_path = bundle_;
        return opts;
    }

    testutil::TemporaryDirectory tmp_;
    std::string bundle_;
    FakeClient client_;
    RecordingOutput out_;
};

TEST_F(PushTest, PublishesAndWaitsForProcessing) {
    auto opts = Options();
    opts.mandatory = true;

    codepush::ReleasePublisher publisher(client_, kFastPoll);
    codepush::PushResult result;
    auto r = publisher.Run(opts, out_, result);
    ASSERT_TRUE(r.ok) << r.msg;

    EXPECT_EQ(result.app_id, testutil::kAppId);
    EXPECT_EQ(result.deployment_id, "dep-staging");
    EXPECT_EQ(result.app_version, "1.2.0");
    EXPECT_EQ(result.status, codepush::kStatusDone);
    EXPECT_TRUE(codepush::IsUuid(result.package_id)) << result.package_id;
    EXPECT_EQ(client_.last_package_id, result.package_id);

    const auto& req = client_.last_upload_url_request;
    EXPECT_EQ(req.app_version, "1.2.0");
    EXPECT_EQ(req.file_name, "build.zip");
    EXPECT_TRUE(req.mandatory);
    EXPECT_FALSE(req.disabled);
    EXPECT_EQ(req.rollout, 100);
    EXPECT_EQ(req.file_size_bytes, result.file_size_bytes);

    EXPECT_EQ(client_.Calls("UploadFile"), 1);
    EXPECT_EQ(static_cast<std::int64_t>(client_.uploaded_body.size()), result.file_size_bytes);
    EXPECT_EQ(result.sha256,
              codepush::Sha256Hex(std::span<const std::uint8_t>(
                  reinterpret_cast<const std::uint8_t*>(client_.uploaded_body.data()),
                  client_.uploaded_body.size())));
    EXPECT_EQ(client_.Calls("GetPackageStatus"), 2);

    EXPECT_TRUE(out_.Contains(codepush::NoticeKind::Step, "Packaging bundle"));
    EXPECT_TRUE(out_.Contains(codepush::NoticeKind::Step, "Uploading package"));
    EXPECT_TRUE(out_.Contains(codepush::NoticeKind::Step, "Processing package"));
}

TEST_F(PushTest, TemporaryArchiveIsRemoved) {
    codepush::ReleasePublisher publisher(client_, kFastPoll);
    codepush::PushResult result;
    ASSERT_TRUE(publisher.Run(Options(), out_, result).ok);
    EXPECT_FALSE(fs::exists(bundle_ + ".zip"));
}

TEST_F(PushTest, ArchiveIsRemovedWhenUploadFails) {
    client_.on_upload_file = [](const codepush::UploadFileRequest&, const std::string&) {
        return codepush::Result::Fail(codepush::kErrTransport, "upload failed with HTTP 403: denied");
    };

    codepush::ReleasePublisher publisher(client_, kFastPoll);
    codepush::PushResult result;
    auto r = publisher.Run(Options(), out_, result);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.msg, "uploading package: upload failed with HTTP 403: denied");
    EXPECT_FALSE(fs::exists(bundle_ + ".zip"));
    EXPECT_EQ(client_.Calls("GetPackageStatus"), 0);
}

TEST_F(PushTest, UploadUsesSlotDetails) {
    codepush::UploadFileRequest seen;
    client_.on_upload_file = [&seen](const codepush::UploadFileRequest& req, const std::string&) {
        seen.url = req.url;
        seen.method = req.method;
        seen.headers = req.headers;
        seen.content_length = req.content_length;
        return codepush::Result::Ok();
    };

    codepush::ReleasePublisher publisher(client_, kFastPoll);
    codepush::PushResult result;
    ASSERT_TRUE(publisher.Run(Options(), out_, result).ok);
    EXPECT_EQ(seen.url, "https://storage.example.com/upload?sig=abc");
    EXPECT_EQ(seen.method, "PUT");
    EXPECT_EQ(seen.headers.at("Content-Type"), "application/zip");
    EXPECT_EQ(seen.content_length, result.file_size_bytes);
}

TEST_F(PushTest, ProcessingFailureIsReported) {
    client_.on_get_package_status = [](const std::string&, codepush::PackageStatus& out) {
        out.status = codepush::kStatusFailed;
        out.status_reason = "hermes compile error";
        return codepush::Result::Ok();
    };

    codepush::ReleasePublisher publisher(client_, kFastPoll);
    codepush::PushResult result;
    auto r = publisher.Run(Options(), out_, result);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.err, codepush::kErrRemote);
    EXPECT_NE(r.msg.find("hermes compile error"), std::string::npos);
}

TEST_F(PushTest, UnknownDeploymentStopsBeforePackaging) {
    auto opts = Options();
    opts.deployment = "Nightly";

    codepush::ReleasePublisher publisher(client_, kFastPoll);
    codepush::PushResult result;
    auto r = publisher.Run(opts, out_, result);
    ASSERT_FALSE(r.ok);
    EXPECT_NE(r.msg.find("\"Nightly\""), std::string::npos);
    EXPECT_EQ(client_.Calls("GetUploadUrl"), 0);
    EXPECT_FALSE(fs::exists(bundle_ + ".zip"));
}

TEST(PushValidationTests, RejectsIncompleteOptions) {
    testutil::TemporaryDirectory tmp;
    codepush::PushOptions opts;
    opts.app_id = testutil::kAppId;
    opts.token = "secret";
    opts.deployment = "Staging";
    opts.app_version = "1.0.0";
    opts.bundle_path = tmp.Path();

    EXPECT_TRUE(codepush::ValidatePushOptions(opts).ok);

    auto no_app = opts;
    no_app.app_id.clear();
    EXPECT_NE(codepush::ValidatePushOptions(no_app).msg.find("--app-id"), std::string::npos);

    auto no_token = opts;
    no_token.token.clear();
    EXPECT_NE(codepush::ValidatePushOptions(no_token).msg.find("BITRISE_API_TOKEN"),
              std::string::npos);

    auto no_version = opts;
    no_version.app_version.clear();
    EXPECT_NE(codepush::ValidatePushOptions(no_version).msg.find("--app-version"),
              std::string::npos);

    auto bad_rollout = opts;
    bad_rollout.rollout = 0;
    EXPECT_NE(codepush::ValidatePushOptions(bad_rollout).msg.find("between 1 and 100"),
              std::string::npos);

    auto missing = opts;
    missing.bundle_path = tmp.Join("missing");
    EXPECT_NE(codepush::ValidatePushOptions(missing).msg.find("does not exist"), std::string::npos);
}

} // namespace
