#include <gtest/gtest.h>

#include "cli/commands.hpp"
#include "testing.hpp"
#include "util/project_config.hpp"

#include <cstdio>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <sys/stat.h>

namespace {

using testutil::FakeClient;
using testutil::RecordingOutput;

// Collects everything written to a FILE* in memory.
class CapturedStream {
  public:
    CapturedStream() : stream_(::open_memstream(&buf_, &size_)) {}
    ~CapturedStream() {
        if (stream_) std::fclose(stream_);
        std::free(buf_);
    }
    CapturedStream(const CapturedStream&) = delete;
    CapturedStream& operator=(const CapturedStream&) = delete;

    std::FILE* get() const { return stream_; }

    std::string str() {
        std::fflush(stream_);
        return std::string(buf_, size_);
    }

  private:
    char* buf_ = nullptr;
    size_t size_ = 0;
    std::FILE* stream_;
};

class Argv {
  public:
    Argv(std::initializer_list<const char*> args) {
        for (const char* a : args) storage_.emplace_back(a);
        for (auto& s : storage_) ptrs_.push_back(s.data());
        ptrs_.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return ptrs_.data(); }

  private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

// Read-only FILE* over a fixed string.
class InputStream {
  public:
    explicit InputStream(std::string data) : data_(std::move(data)) {
        stream_ = ::fmemopen(data_.data(), data_.size(), "r");
    }
    ~InputStream() {
        if (stream_) std::fclose(stream_);
    }
    InputStream(const InputStream&) = delete;
    InputStream& operator=(const InputStream&) = delete;

    std::FILE* get() const { return stream_; }

  private:
    std::string data_;
    std::FILE* stream_ = nullptr;
};

class FakeValidator final : public codepush::ITokenValidator {
  public:
    codepush::Result GetCurrentUser(const std::string& token, codepush::UserInfo& out) override {
        tokens.push_back(token);
        if (!result.ok) return result;
        out = user;
        return codepush::Result::Ok();
    }

    codepush::Result result = codepush::Result::Ok();
    codepush::UserInfo user{.username = "alice", .email = "alice@example.com"};
    std::vector<std::string> tokens;
};

codepush::Package MakePackage(std::string id, std::string label, std::string description = "") {
    codepush::Package p;
    p.id = std::move(id);
    p.label = std::move(label);
    p.app_version = "1.0.0";
    p.description = std::move(description);
    p.rollout = 100;
    return p;
}

class CommandsTest : public ::testing::Test {
  protected:
    codepush::cli::CommandContext Context(bool json = false) {
        codepush::cli::CommandContext ctx{
            .app_id = testutil::kAppId,
            .token = "secret",
            .client = client_,
            .out = out_,
        };
        ctx.json = json;
        ctx.json_stream = stdout_.get();
        ctx.text_stream = stderr_.get();
        ctx.validator = &validator_;
        ctx.config_dir = config_.Join("codepush");
        ctx.input = nullptr;
        return ctx;
    }

    std::string StoredConfigPath() const { return config_.Join("codepush/config.json"); }

    testutil::ScopedEnv no_deployment_{"CODEPUSH_DEPLOYMENT", nullptr};
    testutil::ScopedEnv no_build_{"BITRISE_BUILD_NUMBER", nullptr};
    testutil::ScopedEnv no_deploy_dir_{"BITRISE_DEPLOY_DIR", nullptr};
    testutil::ScopedEnv no_token_{"BITRISE_API_TOKEN", nullptr};
    testutil::TemporaryDirectory config_;
    FakeValidator validator_;
    FakeClient client_;
    RecordingOutput out_;
    CapturedStream stdout_;
    CapturedStream stderr_;
};

TEST_F(CommandsTest, DeploymentListAsJson) {
    client_.on_list_deployments = testutil::ListsDeployments({
        {.id = "d1", .name = "Staging"},
        {.id = "d2", .name = "Production"},
    });
    auto ctx = Context(true);
    Argv args{"deployment", "list"};

    EXPECT_EQ(codepush::cli::RunDeployment(ctx, args.argc(), args.argv()), codepush::cli::kExitOk);
    const auto j = nlohmann::json::parse(stdout_.str());
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[1].at("name"), "Production");
}

TEST_F(CommandsTest, DeploymentRenameResolvesName) {
    client_.on_list_deployments = testutil::ListsDeployments({{.id = "d1", .name = "Staging"}});
    std::string renamed_to;
    client_.on_rename_deployment = [&renamed_to](const std::string& id,
                                                 const codepush::RenameDeploymentRequest& req,
                                                 codepush::Deployment& out) {
        renamed_to = req.name;
        out = {.id = id, .name = req.name};
        return codepush::Result::Ok();
    };
    auto ctx = Context();
    Argv args{"deployment", "rename", "Staging", "--name", "QA"};

    EXPECT_EQ(codepush::cli::RunDeployment(ctx, args.argc(), args.argv()), codepush::cli::kExitOk);
    EXPECT_EQ(renamed_to, "QA");
    EXPECT_EQ(client_.last_deployment_id, "d1");
    EXPECT_NE(stderr_.str().find("QA"), std::string::npos);
}

TEST_F(CommandsTest, DeploymentUnknownSubcommandIsUsageError) {
    auto ctx = Context();
    Argv args{"deployment", "frobnicate"};
    EXPECT_EQ(codepush::cli::RunDeployment(ctx, args.argc(), args.argv()), codepush::cli::kExitUsage);
}

TEST_F(CommandsTest, PushRolloutMustBeNumeric) {
    auto ctx = Context();
    Argv args{"push", "build", "--deployment", "Staging", "--app-version", "1.0", "--rollout", "half"};
    EXPECT_EQ(codepush::cli::RunPush(ctx, args.argc(), args.argv()), codepush::cli::kExitUsage);
}

TEST_F(CommandsTest, PushWithoutDeploymentFails) {
    testutil::TemporaryDirectory tmp;
    auto ctx = Context();
    Argv args{"push", tmp.Path().c_str(), "--app-version", "1.0"};
    EXPECT_EQ(codepush::cli::RunPush(ctx, args.argc(), args.argv()), codepush::cli::kExitFailure);
    EXPECT_NE(stderr_.str().find("deployment is required"), std::string::npos);
    EXPECT_EQ(client_.Calls("ListDeployments"), 0);
}

TEST_F(CommandsTest, RollbackReportsResult) {
    client_.on_rollback = [](const std::string&, const codepush::RollbackRequest&, codepush::Package& out) {
        out.id = "pkg-9";
        out.label = "v9";
        out.app_version = "4.0.0";
        return codepush::Result::Ok();
    };
    auto ctx = Context(true);
    Argv args{"rollback", "--deployment", testutil::kProductionId};

    EXPECT_EQ(codepush::cli::RunRollback(ctx, args.argc(), args.argv()), codepush::cli::kExitOk);
    const auto j = nlohmann::json::parse(stdout_.str());
    EXPECT_EQ(j.at("package_id"), "pkg-9");
    EXPECT_EQ(j.at("deployment_id"), testutil::kProductionId);
}

TEST_F(CommandsTest, PromoteDefaultsSourceFromEnvironment) {
    testutil::ScopedEnv source("CODEPUSH_DEPLOYMENT", "Production");
    auto ctx = Context();
    Argv args{"promote", "--destination-deployment", "Production"};

    EXPECT_EQ(codepush::cli::RunPromote(ctx, args.argc(), args.argv()), codepush::cli::kExitFailure);
    EXPECT_NE(stderr_.str().find("must be different"), std::string::npos);
}

TEST_F(CommandsTest, PatchUnknownOptionIsUsageError) {
    auto ctx = Context();
    Argv args{"patch", "--bogus"};
    EXPECT_EQ(codepush::cli::RunPatch(ctx, args.argc(), args.argv()), codepush::cli::kExitUsage);
}

TEST_F(CommandsTest, DeploymentHistoryKeepsMostRecentReleases) {
    client_.on_list_packages = testutil::ListsPackages({
        MakePackage("p1", "v1"),
        MakePackage("p2", "v2"),
        MakePackage("p3", "v3"),
    });
    auto ctx = Context(true);
    Argv args{"deployment", "history", testutil::kStagingId, "--limit", "2"};

    EXPECT_EQ(codepush::cli::RunDeployment(ctx, args.argc(), args.argv()), codepush::cli::kExitOk);
    const auto j = nlohmann::json::parse(stdout_.str());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0].at("label"), "v2");
    EXPECT_EQ(j[1].at("label"), "v3");
    EXPECT_EQ(client_.last_deployment_id, testutil::kStagingId);
}

TEST_F(CommandsTest, DeploymentHistoryLimitZeroShowsAll) {
    std::vector<codepush::Package> items;
    for (int i = 1; i <= 12; ++i) items.push_back(MakePackage("p" + std::to_string(i), "v" + std::to_string(i)));
    client_.on_list_packages = testutil::ListsPackages(items);
    auto ctx = Context(true);
    Argv all{"deployment", "history", testutil::kStagingId, "--limit", "0"};

    EXPECT_EQ(codepush::cli::RunDeployment(ctx, all.argc(), all.argv()), codepush::cli::kExitOk);
    EXPECT_EQ(nlohmann::json::parse(stdout_.str()).size(), 12u);
}

TEST_F(CommandsTest, DeploymentHistoryDefaultsToTenAndTruncatesDescription) {
    std::vector<codepush::Package> items;
    for (int i = 1; i <= 12; ++i) items.push_back(MakePackage("p" + std::to_string(i), "v" + std::to_string(i)));
    items.back().description = "Fixes the crash on the settings screen when offline";
    client_.on_list_packages = testutil::ListsPackages(items);
    auto ctx = Context();
    Argv args{"deployment", "history", testutil::kStagingId};

    EXPECT_EQ(codepush::cli::RunDeployment(ctx, args.argc(), args.argv()), codepush::cli::kExitOk);
    const std::string text = stderr_.str();
    EXPECT_NE(text.find("LABEL"), std::string::npos);
    EXPECT_EQ(text.find("v2 "), std::string::npos);
    EXPECT_NE(text.find("v3 "), std::string::npos);
    EXPECT_NE(text.find("Fixes the crash on the sett..."), std::string::npos);
    EXPECT_EQ(text.find("when offline"), std::string::npos);
}

TEST_F(CommandsTest, DeploymentHistoryWithoutReleases) {
    client_.on_list_packages = testutil::ListsPackages({});
    auto ctx = Context();
    Argv args{"deployment", "history", testutil::kStagingId};

    EXPECT_EQ(codepush::cli::RunDeployment(ctx, args.argc(), args.argv()), codepush::cli::kExitOk);
    EXPECT_TRUE(out_.Contains(codepush::NoticeKind::Info, "No releases found."));
}

TEST_F(CommandsTest, DeploymentLimitIsOnlyForHistory) {
    auto ctx = Context();
    Argv args{"deployment", "info", testutil::kStagingId, "--limit", "3"};
    EXPECT_EQ(codepush::cli::RunDeployment(ctx, args.argc(), args.argv()), codepush::cli::kExitUsage);
}

TEST_F(CommandsTest, DeploymentClearRequiresConfirmation) {
    auto ctx = Context();
    Argv args{"deployment", "clear", "Staging"};

    EXPECT_EQ(codepush::cli::RunDeployment(ctx, args.argc(), args.argv()), codepush::cli::kExitFailure);
    EXPECT_NE(stderr_.str().find("permanently delete all releases from \"Staging\"; use --yes to confirm"),
              std::string::npos);
    EXPECT_EQ(client_.Calls("ListDeployments"), 0);
    EXPECT_EQ(client_.Calls("ListPackages"), 0);
}

TEST_F(CommandsTest, DeploymentClearDeletesEveryRelease) {
    client_.on_list_packages = testutil::ListsPackages({MakePackage("p1", "v1"), MakePackage("p2", "v2")});
    client_.on_delete_package = [](const std::string&) { return codepush::Result::Ok(); };
    auto ctx = Context(true);
    Argv args{"deployment", "clear", testutil::kStagingId, "--yes"};

    EXPECT_EQ(codepush::cli::RunDeployment(ctx, args.argc(), args.argv()), codepush::cli::kExitOk);
    EXPECT_EQ(client_.deleted_package_ids, (std::vector<std::string>{"p1", "p2"}));
    const auto j = nlohmann::json::parse(stdout_.str());
    EXPECT_EQ(j.at("deployment"), testutil::kStagingId);
    EXPECT_EQ(j.at("deleted"), 2);
}

TEST_F(CommandsTest, DeploymentClearStopsAtFirstFailure) {
    client_.on_list_packages = testutil::ListsPackages({MakePackage("p1", "v1"), MakePackage("p2", "v2")});
    client_.on_delete_package = [](const std::string&) {
        return codepush::Result::Fail(codepush::kErrTransport, "API returned HTTP 500: boom");
    };
    auto ctx = Context();
    Argv args{"deployment", "clear", testutil::kStagingId, "-y"};

    EXPECT_EQ(codepush::cli::RunDeployment(ctx, args.argc(), args.argv()), codepush::cli::kExitFailure);
    EXPECT_EQ(client_.Calls("DeletePackage"), 1);
    EXPECT_NE(stderr_.str().find("deleting package v1: API returned HTTP 500"), std::string::npos);
}

TEST_F(CommandsTest, DeploymentClearWithNothingToDelete) {
    client_.on_list_packages = testutil::ListsPackages({});
    auto ctx = Context();
    Argv args{"deployment", "clear", testutil::kStagingId, "--yes"};

    EXPECT_EQ(codepush::cli::RunDeployment(ctx, args.argc(), args.argv()), codepush::cli::kExitOk);
    EXPECT_TRUE(out_.Contains(codepush::NoticeKind::Info, "No packages to delete."));
}

TEST_F(CommandsTest, DeploymentRemoveRequiresConfirmation) {
    auto ctx = Context();
    Argv args{"deployment", "remove", testutil::kStagingId};

    EXPECT_EQ(codepush::cli::RunDeployment(ctx, args.argc(), args.argv()), codepush::cli::kExitFailure);
    EXPECT_NE(stderr_.str().find("use --yes to confirm"), std::string::npos);
    EXPECT_EQ(client_.Calls("DeleteDeployment"), 0);
}

TEST_F(CommandsTest, DeploymentRemoveWithConfirmation) {
    client_.on_delete_deployment = [](const std::string&) { return codepush::Result::Ok(); };
    auto ctx = Context();
    Argv args{"deployment", "remove", testutil::kStagingId, "--yes"};

    EXPECT_EQ(codepush::cli::RunDeployment(ctx, args.argc(), args.argv()), codepush::cli::kExitOk);
    EXPECT_EQ(client_.last_deployment_id, testutil::kStagingId);
}

TEST_F(CommandsTest, PackageInfoDefaultsToLatestRelease) {
    testutil::ScopedEnv deployment("CODEPUSH_DEPLOYMENT", testutil::kStagingId);
    client_.on_list_packages = testutil::ListsPackages({MakePackage("p1", "v1"), MakePackage("p2", "v2")});
    client_.on_get_package = [](const std::string& id, codepush::Package& out) {
        out = MakePackage(id, "v2", "Hotfix");
        out.rollout = 50;
        out.file_size_bytes = 2048;
        out.created_by = codepush::PackageCreator{.email = "dev@example.com"};
        return codepush::Result::Ok();
    };
    auto ctx = Context();
    Argv args{"package", "info"};

    EXPECT_EQ(codepush::cli::RunPackage(ctx, args.argc(), args.argv()), codepush::cli::kExitOk);
    EXPECT_EQ(client_.last_package_id, "p2");
    const std::string text = stderr_.str();
    EXPECT_NE(text.find("Package: v2"), std::string::npos);
    EXPECT_NE(text.find("50%"), std::string::npos);
    EXPECT_NE(text.find("Hotfix"), std::string::npos);
    EXPECT_NE(text.find("dev@example.com"), std::string::npos);
}

TEST_F(CommandsTest, PackageStatusByLabel) {
    client_.on_list_packages = testutil::ListsPackages({MakePackage("p1", "v1"), MakePackage("p2", "v2")});
    client_.on_get_package_status = [](const std::string& id, codepush::PackageStatus& out) {
        out = {.package_id = id, .status = "failed", .status_reason = "invalid archive"};
        return codepush::Result::Ok();
    };
    auto ctx = Context(true);
    Argv args{"package", "status", testutil::kStagingId, "--label", "v1"};

    EXPECT_EQ(codepush::cli::RunPackage(ctx, args.argc(), args.argv()), codepush::cli::kExitOk);
    const auto j = nlohmann::json::parse(stdout_.str());
    EXPECT_EQ(j.at("package_id"), "p1");
    EXPECT_EQ(j.at("status"), "failed");
    EXPECT_EQ(j.at("status_reason"), "invalid archive");
}

TEST_F(CommandsTest, PackageWithoutDeploymentFails) {
    auto ctx = Context();
    Argv args{"package", "info"};

    EXPECT_EQ(codepush::cli::RunPackage(ctx, args.argc(), args.argv()), codepush::cli::kExitFailure);
    EXPECT_NE(stderr_.str().find("deployment is required"), std::string::npos);
}

TEST_F(CommandsTest, PackageRemoveRequiresLabel) {
    auto ctx = Context();
    Argv args{"package", "remove", testutil::kStagingId, "--yes"};

    EXPECT_EQ(codepush::cli::RunPackage(ctx, args.argc(), args.argv()), codepush::cli::kExitFailure);
    EXPECT_NE(stderr_.str().find("label is required: set --label to identify the package to delete"),
              std::string::npos);
    EXPECT_EQ(client_.Calls("ListPackages"), 0);
}

TEST_F(CommandsTest, PackageRemoveRequiresConfirmation) {
    auto ctx = Context();
    Argv args{"package", "remove", testutil::kStagingId, "--label", "v1"};

    EXPECT_EQ(codepush::cli::RunPackage(ctx, args.argc(), args.argv()), codepush::cli::kExitFailure);
    EXPECT_NE(stderr_.str().find("use --yes to confirm"), std::string::npos);
    EXPECT_EQ(client_.Calls("DeletePackage"), 0);
}

TEST_F(CommandsTest, PackageRemoveDeletesResolvedLabel) {
    client_.on_list_packages = testutil::ListsPackages({MakePackage("p1", "v1"), MakePackage("p2", "v2")});
    client_.on_delete_package = [](const std::string&) { return codepush::Result::Ok(); };
    auto ctx = Context(true);
    Argv args{"package", "remove", testutil::kStagingId, "--label", "v1", "--yes"};

    EXPECT_EQ(codepush::cli::RunPackage(ctx, args.argc(), args.argv()), codepush::cli::kExitOk);
    EXPECT_EQ(client_.deleted_package_ids, (std::vector<std::string>{"p1"}));
    const auto j = nlohmann::json::parse(stdout_.str());
    EXPECT_EQ(j.at("deleted"), "p1");
    EXPECT_EQ(j.at("label"), "v1");
}

TEST_F(CommandsTest, PackageRemoveUnknownLabelDeletesNothing) {
    client_.on_list_packages = testutil::ListsPackages({MakePackage("p1", "v1")});
    auto ctx = Context();
    Argv args{"package", "remove", testutil::kStagingId, "--label", "v9", "--yes"};

    EXPECT_EQ(codepush::cli::RunPackage(ctx, args.argc(), args.argv()), codepush::cli::kExitFailure);
    EXPECT_NE(stderr_.str().find("\"v9\" not found"), std::string::npos);
    EXPECT_EQ(client_.Calls("DeletePackage"), 0);
}

TEST_F(CommandsTest, AuthLoginStoresValidatedToken) {
    auto ctx = Context();
    Argv args{"auth", "login", "--token", "tok-123"};

    EXPECT_EQ(codepush::cli::RunAuth(ctx, args.argc(), args.argv()), codepush::cli::kExitOk);
    EXPECT_EQ(validator_.tokens, (std::vector<std::string>{"tok-123"}));
    EXPECT_TRUE(out_.Contains(codepush::NoticeKind::Info, "Logged in as alice (alice@example.com)"));
    EXPECT_TRUE(out_.Contains(codepush::NoticeKind::Info, "Token saved to: " + StoredConfigPath()));

    std::string stored;
    ASSERT_TRUE(codepush::LoadStoredToken(ctx.config_dir, stored).ok);
    EXPECT_EQ(stored, "tok-123");

    struct stat st{};
    ASSERT_EQ(::stat(StoredConfigPath().c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
    ASSERT_EQ(::stat(ctx.config_dir.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0700u);
}

TEST_F(CommandsTest, AuthLoginReadsTokenFromInput) {
    InputStream in("  tok-from-stdin \n");
    auto ctx = Context(true);
    ctx.input = in.get();
    Argv args{"auth", "login"};

    EXPECT_EQ(codepush::cli::RunAuth(ctx, args.argc(), args.argv()), codepush::cli::kExitOk);
    EXPECT_EQ(validator_.tokens, (std::vector<std::string>{"tok-from-stdin"}));
    const auto j = nlohmann::json::parse(stdout_.str());
    EXPECT_EQ(j.at("username"), "alice");
    EXPECT_EQ(j.at("config_path"), StoredConfigPath());
}

TEST_F(CommandsTest, AuthLoginWithoutTokenFails) {
    InputStream in("\n");
    auto ctx = Context();
    ctx.input = in.get();
    Argv args{"auth", "login"};

    EXPECT_EQ(codepush::cli::RunAuth(ctx, args.argc(), args.argv()), codepush::cli::kExitFailure);
    EXPECT_NE(stderr_.str().find("token is required: set --token or BITRISE_API_TOKEN"), std::string::npos);
    EXPECT_TRUE(validator_.tokens.empty());
}

TEST_F(CommandsTest, AuthLoginRejectedTokenIsNotStored) {
    validator_.result = codepush::Result::Fail(codepush::kErrRemote,
                                               "invalid token: the API returned 401 Unauthorized");
    auto ctx = Context();
    Argv args{"auth", "login", "--token", "bad"};

    EXPECT_EQ(codepush::cli::RunAuth(ctx, args.argc(), args.argv()), codepush::cli::kExitFailure);
    const std::string text = stderr_.str();
    EXPECT_NE(text.find("401 Unauthorized"), std::string::npos);
    EXPECT_NE(text.find("Generate a new token at: https://app.bitrise.io/me/account/security"),
              std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(StoredConfigPath()));
}

TEST_F(CommandsTest, AuthRevokeDeletesStoredToken) {
    ASSERT_TRUE(codepush::SaveStoredToken(config_.Join("codepush"), "tok-123").ok);
    auto ctx = Context();
    Argv args{"auth", "revoke"};

    EXPECT_EQ(codepush::cli::RunAuth(ctx, args.argc(), args.argv()), codepush::cli::kExitOk);
    EXPECT_FALSE(std::filesystem::exists(StoredConfigPath()));
    EXPECT_TRUE(out_.Contains(codepush::NoticeKind::Info, "Token revoked successfully"));

    // Nothing stored any more: still fine.
    EXPECT_EQ(codepush::cli::RunAuth(ctx, args.argc(), args.argv()), codepush::cli::kExitOk);
}

TEST_F(CommandsTest, AuthUnknownSubcommandIsUsageError) {
    auto ctx = Context();
    Argv args{"auth", "whoami"};
    EXPECT_EQ(codepush::cli::RunAuth(ctx, args.argc(), args.argv()), codepush::cli::kExitUsage);
}

} // namespace
