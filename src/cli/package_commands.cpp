#include "cli/commands.hpp"

#include "cli/command_util.hpp"
#include "cli/credentials.hpp"
#include "codepush/deployment_resolver.hpp"
#include "codepush/package_resolver.hpp"
#include "codepush/summary.hpp"
#include "codepush/validation.hpp"
#include "util/format.hpp"

#include <cstdio>
#include <getopt.h>
#include <nlohmann/json.hpp>
#include <vector>

namespace codepush::cli {

namespace {

void PrintPackageUsage(std::FILE* s) {
    std::fprintf(s,
        "Usage:\n"
        "   codepush package info [<deployment>] [--label <label>]\n"
        "   codepush package status [<deployment>] [--label <label>]\n"
        "   codepush package remove [<deployment>] --label <label> --yes\n"
        "\n"
        "The deployment defaults to CODEPUSH_DEPLOYMENT.\n"
        "\n"
        "Options:\n"
        "  -l, --label            Release label (default: latest release; required for remove)\n"
        "  -y, --yes              Confirm deletion (remove)\n"
        "  -h, --help             Show this help\n");
}

Fields PackageFields(const Package& p) {
    char rollout[16];
    std::snprintf(rollout, sizeof(rollout), "%.0f%%", p.rollout);

    Fields f{{"ID", p.id},
             {"App version", p.app_version},
             {"Mandatory", YesNo(p.mandatory)},
             {"Disabled", YesNo(p.disabled)},
             {"Rollout", rollout}};
    if (!p.description.empty()) f.emplace_back("Description", p.description);
    f.emplace_back("Size", FormatBytes(p.file_size_bytes));
    if (!p.hash.empty()) f.emplace_back("Hash", p.hash);
    if (!p.created_at.empty()) f.emplace_back("Created", p.created_at);
    if (p.created_by && !p.created_by->email.empty()) f.emplace_back("Created by", p.created_by->email);
    return f;
}

} // namespace

int RunPackage(CommandContext& ctx, int argc, char** argv) {
    if (argc < 2) {
        PrintPackageUsage(ctx.text_stream);
        return kExitUsage;
    }
    const std::string sub = argv[1];
    if (sub == "help" || sub == "--help" || sub == "-h") {
        PrintPackageUsage(ctx.text_stream);
        return kExitOk;
    }
    if (sub != "info" && sub != "status" && sub != "remove") {
        return UsageError(ctx, "unknown package command: %s", sub.c_str());
    }

    static const option long_opts[] = {
        {"label", required_argument, nullptr, 'l'},
        {"yes", no_argument, nullptr, 'y'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    const int sub_argc = argc - 1;
    char** sub_argv = argv + 1;

    std::string label;
    bool yes = false;
    ResetGetopt();
    int c;
    while ((c = getopt_long(sub_argc, sub_argv, "hl:y", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'h':
                PrintPackageUsage(ctx.text_stream);
                return kExitOk;
            case 'l':
                label = optarg;
                break;
            case 'y':
                yes = true;
                break;
            default:
                PrintPackageUsage(ctx.text_stream);
                return kExitUsage;
        }
    }
    std::vector<std::string> args(sub_argv + optind, sub_argv + sub_argc);
    if (args.size() > 1) return UsageError(ctx, "unexpected argument: %s", args[1].c_str());
    if (yes && sub != "remove") {
        return UsageError(ctx, "--yes is only valid for package remove, not %s", sub.c_str());
    }

    if (sub == "remove") {
        if (label.empty()) {
            return Fail(ctx, Result::Fail(kErrValidation,
                                          "label is required: set --label to identify the package to delete"));
        }
        auto confirmed = RequireConfirmation(yes, "This will permanently delete release \"" + label + "\"");
        if (!confirmed.ok) return Fail(ctx, confirmed);
    }

    const std::string deployment = ResolveFlag(args.empty() ? std::string() : args[0], kDeploymentEnv);
    auto base = ValidateBaseOptions(ctx.app_id, ctx.token);
    if (!base.ok) return Fail(ctx, base);
    auto has_deployment = RequireDeployment(deployment);
    if (!has_deployment.ok) return Fail(ctx, has_deployment);

    std::string deployment_id;
    auto r = ResolveDeployment(ctx.client, ctx.app_id, deployment, ctx.out, deployment_id);
    if (!r.ok) return Fail(ctx, r);

    ResolvedPackage pkg;
    r = sub == "remove" ? ResolvePackageLabel(ctx.client, ctx.app_id, deployment_id, label, ctx.out, pkg)
                        : ResolvePackageOrLatest(ctx.client, ctx.app_id, deployment_id, label, ctx.out, pkg);
    if (!r.ok) return Fail(ctx, r);

    if (sub == "info") {
        Package p;
        r = ctx.client.GetPackage(ctx.app_id, deployment_id, pkg.id, p);
        if (!r.ok) return Fail(ctx, r);
        if (ctx.json) {
            PrintJson(ctx.json_stream, ToJson(p));
        } else {
            const std::string title = "Package: " + (p.label.empty() ? pkg.label : p.label);
            PrintFields(ctx.text_stream, title.c_str(), PackageFields(p));
        }
        return kExitOk;
    }

    if (sub == "status") {
        PackageStatus s;
        r = ctx.client.GetPackageStatus(ctx.app_id, deployment_id, pkg.id, s);
        if (!r.ok) return Fail(ctx, r);
        if (ctx.json) {
            PrintJson(ctx.json_stream, ToJson(s));
        } else {
            Fields f{{"Package", pkg.label}, {"Status", s.status}};
            if (!s.status_reason.empty()) f.emplace_back("Reason", s.status_reason);
            PrintFields(ctx.text_stream, "Package status", f);
        }
        return kExitOk;
    }

    r = ctx.client.DeletePackage(ctx.app_id, deployment_id, pkg.id);
    if (!r.ok) return Fail(ctx, r);
    if (ctx.json) {
        PrintJson(ctx.json_stream, nlohmann::json{{"deleted", pkg.id}, {"label", pkg.label}});
    } else {
        ctx.out.Info("Package \"%s\" deleted", pkg.label.c_str());
    }
    return kExitOk;
}

} // namespace codepush::cli
