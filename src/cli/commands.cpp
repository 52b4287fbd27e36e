#include "cli/commands.hpp"

#include "cli/command_util.hpp"
#include "cli/credentials.hpp"
#include "codepush/patch.hpp"
#include "codepush/promote.hpp"
#include "codepush/push.hpp"
#include "codepush/rollback.hpp"
#include "codepush/summary.hpp"
#include "util/format.hpp"

#include <getopt.h>

namespace codepush::cli {

namespace {

void PrintPushUsage(std::FILE* s) {
    std::fprintf(s,
        "Usage:\n"
        "   codepush push <bundle-dir> --deployment <name|id> --app-version <version> [options]\n"
        "\n"
        "Options:\n"
        "  -d, --deployment       Deployment name or UUID (env: CODEPUSH_DEPLOYMENT)\n"
        "  -a, --app-version      Target binary version (e.g. 1.0.0)\n"
        "  -m, --description      Release notes\n"
        "      --mandatory        Mark the update as mandatory\n"
        "      --disabled         Upload the release disabled\n"
        "  -r, --rollout          Rollout percentage 1-100 (default 100)\n"
        "  -h, --help             Show this help\n");
}

void PrintPatchUsage(std::FILE* s) {
    std::fprintf(s,
        "Usage:\n"
        "   codepush patch --deployment <name|id> [--label <label>] [changes]\n"
        "\n"
        "Options:\n"
        "  -d, --deployment       Deployment name or UUID (env: CODEPUSH_DEPLOYMENT)\n"
        "  -l, --label            Release label (default: latest release)\n"
        "  -r, --rollout          Rollout percentage 1-100\n"
        "      --mandatory        true or false\n"
        "      --disabled         true or false\n"
        "  -m, --description      Release notes\n"
        "  -a, --app-version      Target binary version\n"
        "  -h, --help             Show this help\n");
}

void PrintRollbackUsage(std::FILE* s) {
    std::fprintf(s,
        "Usage:\n"
        "   codepush rollback --deployment <name|id> [--target-release <label>]\n"
        "\n"
        "Options:\n"
        "  -d, --deployment       Deployment name or UUID (env: CODEPUSH_DEPLOYMENT)\n"
        "  -t, --target-release   Label to roll back to (default: previous release)\n"
        "  -h, --help             Show this help\n");
}

void PrintPromoteUsage(std::FILE* s) {
    std::fprintf(s,
        "Usage:\n"
        "   codepush promote --source-deployment <name|id> --destination-deployment <name|id> [options]\n"
        "\n"
        "Options:\n"
        "  -s, --source-deployment       Source (env: CODEPUSH_DEPLOYMENT)\n"
        "  -t, --destination-deployment  Destination\n"
        "  -l, --label                   Release label in source (default: latest)\n"
        "  -a, --app-version             Override target binary version\n"
        "  -m, --description             Override release notes\n"
        "      --mandatory               Override mandatory flag (true/false)\n"
        "      --disabled                Override disabled flag (true/false)\n"
        "  -r, --rollout                 Override rollout percentage\n"
        "  -h, --help                    Show this help\n");
}

} // namespace

void PrintUsage(std::FILE* stream, const char* prog) {
    std::fprintf(stream,
        "Usage:\n"
        "   %s [--app-id <id>] [--json] [--verbose] <command> [options]\n"
        "\n"
        "Commands:\n"
        "  push         Package and publish a bundle directory as a new release\n"
        "  patch        Update metadata of an existing release\n"
        "  rollback     Roll a deployment back to an earlier release\n"
        "  promote      Copy a release from one deployment to another\n"
        "  deployment   Manage deployments (list, add, info, rename, remove, history, clear)\n"
        "  package      Inspect or delete a release (info, status, remove)\n"
        "  auth         Store or revoke the API token (login, revoke)\n"
        "  version      Print the version\n"
        "  help         Show this help\n"
        "\n"
        "Global options:\n"
        "      --app-id           Connected app UUID (env: CODEPUSH_APP_ID)\n"
        "      --json             Print results as JSON on stdout\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n"
        "\n"
        "Environment:\n"
        "  BITRISE_API_TOKEN      API token\n"
        "  CODEPUSH_API_URL       API base URL\n"
        "  CODEPUSH_LOG_LEVEL     debug|info|warn|error|none\n",
        prog);
}

int RunPush(CommandContext& ctx, int argc, char** argv) {
    PushOptions opts;
    opts.app_id = ctx.app_id;
    opts.token = ctx.token;
    std::string deployment_flag;

    static const option long_opts[] = {
        {"deployment", required_argument, nullptr, 'd'},
        {"app-version", required_argument, nullptr, 'a'},
        {"description", required_argument, nullptr, 'm'},
        {"mandatory", no_argument, nullptr, 'M'},
        {"disabled", no_argument, nullptr, 'X'},
        {"rollout", required_argument, nullptr, 'r'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    ResetGetopt();
    int c;
    while ((c = getopt_long(argc, argv, "hd:a:m:r:", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'h':
                PrintPushUsage(ctx.text_stream);
                return kExitOk;
            case 'd':
                deployment_flag = optarg;
                break;
            case 'a':
                opts.app_version = optarg;
                break;
            case 'm':
                opts.description = optarg;
                break;
            case 'M':
                opts.mandatory = true;
                break;
            case 'X':
                opts.disabled = true;
                break;
            case 'r':
                if (!ParseIntArg(optarg, opts.rollout)) {
                    return UsageError(ctx, "invalid --rollout: %s", optarg);
                }
                break;
            default:
                PrintPushUsage(ctx.text_stream);
                return kExitUsage;
        }
    }
    if (optind < argc) opts.bundle_path = argv[optind++];
    if (optind < argc) return UsageError(ctx, "unexpected argument: %s", argv[optind]);
    opts.deployment = ResolveFlag(deployment_flag, kDeploymentEnv);

    ReleasePublisher publisher(ctx.client, ctx.poll);
    publisher.SetProgressSink(ctx.progress);
    publisher.SetStopToken(ctx.stop);

    PushResult result;
    auto r = publisher.Run(opts, ctx.out, result);
    if (!r.ok) return Fail(ctx, r);

    ExportCiSummary("push", ToJson(result), ExportedVars(result), ctx.out);
    if (ctx.json) {
        PrintJson(ctx.json_stream, ToJson(result));
    } else {
        PrintFields(ctx.text_stream, "Release published",
                    {{"Package ID", result.package_id},
                     {"Deployment", result.deployment_id},
                     {"App version", result.app_version},
                     {"Status", result.status},
                     {"Size", FormatBytes(result.file_size_bytes)},
                     {"SHA-256", result.sha256}});
    }
    return kExitOk;
}

int RunPatch(CommandContext& ctx, int argc, char** argv) {
    PatchOptions opts;
    opts.app_id = ctx.app_id;
    opts.token = ctx.token;
    std::string deployment_flag;

    static const option long_opts[] = {
        {"deployment", required_argument, nullptr, 'd'},
        {"label", required_argument, nullptr, 'l'},
        {"rollout", required_argument, nullptr, 'r'},
        {"mandatory", required_argument, nullptr, 'M'},
        {"disabled", required_argument, nullptr, 'X'},
        {"description", required_argument, nullptr, 'm'},
        {"app-version", required_argument, nullptr, 'a'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    ResetGetopt();
    int c;
    while ((c = getopt_long(argc, argv, "hd:l:r:m:a:", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'h':
                PrintPatchUsage(ctx.text_stream);
                return kExitOk;
            case 'd':
                deployment_flag = optarg;
                break;
            case 'l':
                opts.label = optarg;
                break;
            case 'r':
                opts.rollout = optarg;
                break;
            case 'M':
                opts.mandatory = optarg;
                break;
            case 'X':
                opts.disabled = optarg;
                break;
            case 'm':
                opts.description = optarg;
                break;
            case 'a':
                opts.app_version = optarg;
                break;
            default:
                PrintPatchUsage(ctx.text_stream);
                return kExitUsage;
        }
    }
    if (optind < argc) return UsageError(ctx, "unexpected argument: %s", argv[optind]);
    opts.deployment = ResolveFlag(deployment_flag, kDeploymentEnv);

    ReleasePatcher patcher(ctx.client);
    PatchResult result;
    auto r = patcher.Run(opts, ctx.out, result);
    if (!r.ok) return Fail(ctx, r);

    ExportCiSummary("patch", ToJson(result), ExportedVars(result), ctx.out);
    if (ctx.json) {
        PrintJson(ctx.json_stream, ToJson(result));
    } else {
        PrintFields(ctx.text_stream, "Release patched",
                    {{"Package ID", result.package_id},
                     {"Label", result.label},
                     {"App version", result.app_version},
                     {"Mandatory", YesNo(result.mandatory)},
                     {"Disabled", YesNo(result.disabled)},
                     {"Rollout", std::to_string(result.rollout) + "%"},
                     {"Description", result.description}});
    }
    return kExitOk;
}

int RunRollback(CommandContext& ctx, int argc, char** argv) {
    RollbackOptions opts;
    opts.app_id = ctx.app_id;
    opts.token = ctx.token;
    std::string deployment_flag;

    static const option long_opts[] = {
        {"deployment", required_argument, nullptr, 'd'},
        {"target-release", required_argument, nullptr, 't'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    ResetGetopt();
    int c;
    while ((c = getopt_long(argc, argv, "hd:t:", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'h':
                PrintRollbackUsage(ctx.text_stream);
                return kExitOk;
            case 'd':
                deployment_flag = optarg;
                break;
            case 't':
                opts.target_label = optarg;
                break;
            default:
                PrintRollbackUsage(ctx.text_stream);
                return kExitUsage;
        }
    }
    if (optind < argc) return UsageError(ctx, "unexpected argument: %s", argv[optind]);
    opts.deployment = ResolveFlag(deployment_flag, kDeploymentEnv);

    ReleaseRollback rollback(ctx.client);
    RollbackResult result;
    auto r = rollback.Run(opts, ctx.out, result);
    if (!r.ok) return Fail(ctx, r);

    ExportCiSummary("rollback", ToJson(result), ExportedVars(result), ctx.out);
    if (ctx.json) {
        PrintJson(ctx.json_stream, ToJson(result));
    } else {
        PrintFields(ctx.text_stream, "Rollback complete",
                    {{"Package ID", result.package_id},
                     {"Label", result.label},
                     {"App version", result.app_version}});
    }
    return kExitOk;
}

int RunPromote(CommandContext& ctx, int argc, char** argv) {
    PromoteOptions opts;
    opts.app_id = ctx.app_id;
    opts.token = ctx.token;
    std::string source_flag;

    static const option long_opts[] = {
        {"source-deployment", required_argument, nullptr, 's'},
        {"destination-deployment", required_argument, nullptr, 't'},
        {"label", required_argument, nullptr, 'l'},
        {"app-version", required_argument, nullptr, 'a'},
        {"description", required_argument, nullptr, 'm'},
        {"mandatory", required_argument, nullptr, 'M'},
        {"disabled", required_argument, nullptr, 'X'},
        {"rollout", required_argument, nullptr, 'r'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    ResetGetopt();
    int c;
    while ((c = getopt_long(argc, argv, "hs:t:l:a:m:r:", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'h':
                PrintPromoteUsage(ctx.text_stream);
                return kExitOk;
            case 's':
                source_flag = optarg;
                break;
            case 't':
                opts.dest_deployment = optarg;
                break;
            case 'l':
                opts.label = optarg;
                break;
            case 'a':
                opts.app_version = optarg;
                break;
            case 'm':
                opts.description = optarg;
                break;
            case 'M':
                opts.mandatory = optarg;
                break;
            case 'X':
                opts.disabled = optarg;
                break;
            case 'r':
                opts.rollout = optarg;
                break;
            default:
                PrintPromoteUsage(ctx.text_stream);
                return kExitUsage;
        }
    }
    if (optind < argc) return UsageError(ctx, "unexpected argument: %s", argv[optind]);
    opts.source_deployment = ResolveFlag(source_flag, kDeploymentEnv);

    ReleasePromoter promoter(ctx.client);
    PromoteResult result;
    auto r = promoter.Run(opts, ctx.out, result);
    if (!r.ok) return Fail(ctx, r);

    ExportCiSummary("promote", ToJson(result), ExportedVars(result), ctx.out);
    if (ctx.json) {
        PrintJson(ctx.json_stream, ToJson(result));
    } else {
        PrintFields(ctx.text_stream, "Release promoted",
                    {{"Package ID", result.package_id},
                     {"Label", result.label},
                     {"App version", result.app_version},
                     {"Source", result.source_deployment_id},
                     {"Destination", result.dest_deployment_id}});
    }
    return kExitOk;
}

} // namespace codepush::cli
