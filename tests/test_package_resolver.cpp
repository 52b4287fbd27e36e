#include <gtest/gtest.h>

#include "codepush/package_resolver.hpp"
#include "testing.hpp"

namespace {

using testutil::FakeClient;
using testutil::RecordingOutput;

std::vector<codepush::Package> ThreeReleases() {
    return {
        {.id = "pkg-1", .label = "v1"},
        {.id = "pkg-2", .label = "v2"},
        {.id = "pkg-3", .label = "v3"},
    };
}

TEST(PackageResolverTests, LabelMatchesExactly) {
    FakeClient client;
    client.on_list_packages = testutil::ListsPackages(ThreeReleases());
    RecordingOutput out;

    codepush::ResolvedPackage pkg;
    auto r = codepush::ResolvePackageLabel(client, testutil::kAppId, "dep-1", "v2", out, pkg);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(pkg.id, "pkg-2");
    EXPECT_EQ(pkg.label, "v2");
    EXPECT_EQ(client.last_deployment_id, "dep-1");
}

TEST(PackageResolverTests, UnknownLabelNamesTheLabel) {
    FakeClient client;
    client.on_list_packages = testutil::ListsPackages(ThreeReleases());
    RecordingOutput out;

    codepush::ResolvedPackage pkg;
    auto r = codepush::ResolvePackageLabel(client, testutil::kAppId, "dep-1", "v9", out, pkg);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.err, codepush::kErrResolution);
    EXPECT_NE(r.msg.find("\"v9\""), std::string::npos);
}

TEST(PackageResolverTests, LatestIsLastListed) {
    FakeClient client;
    client.on_list_packages = testutil::ListsPackages(ThreeReleases());
    RecordingOutput out;

    codepush::ResolvedPackage pkg;
    auto r = codepush::ResolvePackageOrLatest(client, testutil::kAppId, "dep-1", "", out, pkg);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(pkg.id, "pkg-3");
    EXPECT_EQ(pkg.label, "v3");
}

TEST(PackageResolverTests, LatestOnEmptyDeploymentFails) {
    FakeClient client;
    client.on_list_packages = testutil::ListsPackages({});
    RecordingOutput out;

    codepush::ResolvedPackage pkg;
    auto r = codepush::ResolvePackageOrLatest(client, testutil::kAppId, "dep-1", "", out, pkg);
    ASSERT_FALSE(r.ok);
    EXPECT_NE(r.msg.find("no releases found"), std::string::npos);
}

TEST(PackageResolverTests, ListingFailureIsWrapped) {
    FakeClient client;
    RecordingOutput out;

    codepush::ResolvedPackage pkg;
    auto r = codepush::ResolvePackageOrLatest(client, testutil::kAppId, "dep-1", "v1", out, pkg);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.msg.rfind("listing packages: ", 0), 0u) << r.msg;
}

} // namespace
