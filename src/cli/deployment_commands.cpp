#include "cli/commands.hpp"

#include "cli/command_util.hpp"
#include "codepush/deployment_resolver.hpp"
#include "codepush/summary.hpp"
#include "codepush/validation.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <getopt.h>
#include <nlohmann/json.hpp>
#include <vector>

namespace codepush::cli {

namespace {

constexpr int kDefaultHistoryLimit = 10;
constexpr size_t kHistoryDescriptionWidth = 30;

void PrintDeploymentUsage(std::FILE* s) {
    std::fprintf(s,
        "Usage:\n"
        "   codepush deployment list\n"
        "   codepush deployment add <name>\n"
        "   codepush deployment info <name|id>\n"
        "   codepush deployment rename <name|id> --name <new-name>\n"
        "   codepush deployment remove <name|id> --yes\n"
        "   codepush deployment history <name|id> [--limit <n>]\n"
        "   codepush deployment clear <name|id> --yes\n"
        "\n"
        "Options:\n"
        "  -n, --name             New name (rename)\n"
        "      --limit            Number of most recent releases, 0 for all (history, default 10)\n"
        "  -y, --yes              Confirm a destructive operation (remove, clear)\n"
        "  -h, --help             Show this help\n");
}

Fields DeploymentFields(const Deployment& d) {
    Fields f{{"Name", d.name}, {"ID", d.id}};
    if (!d.key.empty()) f.emplace_back("Key", d.key);
    if (!d.created_at.empty()) f.emplace_back("Created", d.created_at);
    return f;
}

int ShowDeployment(CommandContext& ctx, const char* title, const Deployment& d) {
    if (ctx.json) {
        PrintJson(ctx.json_stream, ToJson(d));
    } else {
        PrintFields(ctx.text_stream, title, DeploymentFields(d));
    }
    return kExitOk;
}

struct DeploymentArgs {
    std::string new_name;
    int limit = kDefaultHistoryLimit;
    bool limit_set = false;
    bool yes = false;
    std::vector<std::string> positional;
};

int ListDeploymentsCommand(CommandContext& ctx) {
    std::vector<Deployment> items;
    auto r = ctx.client.ListDeployments(ctx.app_id, items);
    if (!r.ok) return Fail(ctx, r);
    if (ctx.json) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& d : items) arr.push_back(ToJson(d));
        PrintJson(ctx.json_stream, arr);
        return kExitOk;
    }
    if (items.empty()) {
        ctx.out.Info("No deployments found");
        return kExitOk;
    }
    std::vector<std::vector<std::string>> rows;
    for (const auto& d : items) rows.push_back({d.name, d.id});
    PrintTable(ctx.text_stream, {"NAME", "ID"}, rows);
    return kExitOk;
}

int HistoryCommand(CommandContext& ctx, const std::string& deployment_id, int limit) {
    std::vector<Package> items;
    auto r = ctx.client.ListPackages(ctx.app_id, deployment_id, items);
    if (!r.ok) return Fail(ctx, r);

    // Ascending creation order: the most recent releases are at the end.
    if (limit > 0 && items.size() > static_cast<size_t>(limit)) {
        items.erase(items.begin(), items.end() - limit);
    }

    if (ctx.json) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& p : items) arr.push_back(ToJson(p));
        PrintJson(ctx.json_stream, arr);
        return kExitOk;
    }
    if (items.empty()) {
        ctx.out.Info("No releases found.");
        return kExitOk;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& p : items) {
        char rollout[16];
        std::snprintf(rollout, sizeof(rollout), "%.0f%%", p.rollout);
        rows.push_back({p.label, p.app_version, YesNo(p.mandatory), rollout, YesNo(p.disabled),
                        Truncate(p.description, kHistoryDescriptionWidth), p.created_at});
    }
    PrintTable(ctx.text_stream,
               {"LABEL", "APP VERSION", "MANDATORY", "ROLLOUT", "DISABLED", "DESCRIPTION", "CREATED"},
               rows);
    return kExitOk;
}

int ClearCommand(CommandContext& ctx, const std::string& deployment_id, const std::string& name) {
    std::vector<Package> items;
    auto r = ctx.client.ListPackages(ctx.app_id, deployment_id, items);
    if (!r.ok) return Fail(ctx, r);

    size_t deleted = 0;
    for (const auto& p : items) {
        r = ctx.client.DeletePackage(ctx.app_id, deployment_id, p.id);
        if (!r.ok) return Fail(ctx, r.Wrap("deleting package " + p.label));
        ++deleted;
        LogDebug("deleted package %s (%s)", p.label.c_str(), p.id.c_str());
    }

    if (ctx.json) {
        PrintJson(ctx.json_stream, nlohmann::json{{"deployment", deployment_id}, {"deleted", deleted}});
    } else if (deleted == 0) {
        ctx.out.Info("No packages to delete.");
    } else {
        ctx.out.Info("Deleted %zu package(s) from \"%s\"", deleted, name.c_str());
    }
    return kExitOk;
}

} // namespace

int RunDeployment(CommandContext& ctx, int argc, char** argv) {
    if (argc < 2) {
        PrintDeploymentUsage(ctx.text_stream);
        return kExitUsage;
    }
    const std::string sub = argv[1];
    if (sub == "help" || sub == "--help" || sub == "-h") {
        PrintDeploymentUsage(ctx.text_stream);
        return kExitOk;
    }

    enum : int { kOptLimit = 1000 };
    static const option long_opts[] = {
        {"name", required_argument, nullptr, 'n'},
        {"limit", required_argument, nullptr, kOptLimit},
        {"yes", no_argument, nullptr, 'y'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    // argv[1] becomes argv[0] of the nested command.
    const int sub_argc = argc - 1;
    char** sub_argv = argv + 1;

    DeploymentArgs a;
    ResetGetopt();
    int c;
    while ((c = getopt_long(sub_argc, sub_argv, "hn:y", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'h':
                PrintDeploymentUsage(ctx.text_stream);
                return kExitOk;
            case 'n':
                a.new_name = optarg;
                break;
            case kOptLimit:
                if (!ParseIntArg(optarg, a.limit) || a.limit < 0) {
                    return UsageError(ctx, "invalid --limit: %s", optarg);
                }
                a.limit_set = true;
                break;
            case 'y':
                a.yes = true;
                break;
            default:
                PrintDeploymentUsage(ctx.text_stream);
                return kExitUsage;
        }
    }
    a.positional.assign(sub_argv + optind, sub_argv + sub_argc);

    const bool wants_arg = sub == "add" || sub == "info" || sub == "rename" || sub == "remove" ||
                           sub == "history" || sub == "clear";
    if (sub != "list" && !wants_arg) {
        return UsageError(ctx, "unknown deployment command: %s", sub.c_str());
    }
    if (wants_arg && a.positional.size() != 1) {
        return UsageError(ctx, "deployment %s takes exactly one argument", sub.c_str());
    }
    if (sub == "list" && !a.positional.empty()) {
        return UsageError(ctx, "unexpected argument: %s", a.positional.front().c_str());
    }
    if (!a.new_name.empty() && sub != "rename") {
        return UsageError(ctx, "--name is only valid for deployment rename, not %s", sub.c_str());
    }
    if (sub == "rename" && a.new_name.empty()) {
        return UsageError(ctx, "%s", "--name is required for rename");
    }
    if (a.limit_set && sub != "history") {
        return UsageError(ctx, "--limit is only valid for deployment history, not %s", sub.c_str());
    }

    if (sub == "remove") {
        auto confirmed = RequireConfirmation(
            a.yes, "This will permanently delete deployment \"" + a.positional[0] + "\" and all its releases");
        if (!confirmed.ok) return Fail(ctx, confirmed);
    }
    if (sub == "clear") {
        auto confirmed = RequireConfirmation(
            a.yes, "This will permanently delete all releases from \"" + a.positional[0] + "\"");
        if (!confirmed.ok) return Fail(ctx, confirmed);
    }

    auto base = ValidateBaseOptions(ctx.app_id, ctx.token);
    if (!base.ok) return Fail(ctx, base);

    if (sub == "list") return ListDeploymentsCommand(ctx);

    if (sub == "add") {
        Deployment created;
        auto r = ctx.client.CreateDeployment(ctx.app_id, CreateDeploymentRequest{a.positional[0]}, created);
        if (!r.ok) return Fail(ctx, r);
        return ShowDeployment(ctx, "Deployment created", created);
    }

    const std::string& name = a.positional[0];
    std::string deployment_id;
    auto resolved = ResolveDeployment(ctx.client, ctx.app_id, name, ctx.out, deployment_id);
    if (!resolved.ok) return Fail(ctx, resolved);

    if (sub == "info") {
        Deployment d;
        auto r = ctx.client.GetDeployment(ctx.app_id, deployment_id, d);
        if (!r.ok) return Fail(ctx, r);
        return ShowDeployment(ctx, "Deployment", d);
    }

    if (sub == "rename") {
        Deployment d;
        auto r = ctx.client.RenameDeployment(ctx.app_id, deployment_id,
                                             RenameDeploymentRequest{a.new_name}, d);
        if (!r.ok) return Fail(ctx, r);
        return ShowDeployment(ctx, "Deployment renamed", d);
    }

    if (sub == "history") return HistoryCommand(ctx, deployment_id, a.limit);
    if (sub == "clear") return ClearCommand(ctx, deployment_id, name);

    auto r = ctx.client.DeleteDeployment(ctx.app_id, deployment_id);
    if (!r.ok) return Fail(ctx, r);
    if (ctx.json) {
        PrintJson(ctx.json_stream, nlohmann::json{{"id", deployment_id}, {"deleted", true}});
    } else {
        ctx.out.Info("Deployment %s removed", name.c_str());
    }
    return kExitOk;
}

} // namespace codepush::cli
