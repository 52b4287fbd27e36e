#include "cli/commands.hpp"
#include "cli/credentials.hpp"
#include "codepush/output.hpp"
#include "codepush/progress_sinks.hpp"
#include "http/http_client.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"
#include "util/project_config.hpp"

#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <getopt.h>
#include <stop_token>
#include <string>
#include <thread>

namespace {

constexpr auto kCancelPollInterval = std::chrono::milliseconds(100);

enum GlobalOpt : int {
    kOptAppId = 1000,
    kOptJson,
};

std::string CurrentDir() {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        LogWarn("cannot determine working directory: %s", ec.message().c_str());
        return ".";
    }
    return cwd.string();
}

} // namespace

int main(int argc, char** argv) {
    namespace cli = codepush::cli;
    if (auto r = codepush::InstallSignalHandlers(); !r.ok) {
        LogWarn("%s", r.msg.c_str());
    }

    std::string app_id_flag;
    bool json = false;
    bool verbose = false;

    static option long_opts[] = {
        {"app-id", required_argument, nullptr, kOptAppId},
        {"json", no_argument, nullptr, kOptJson},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    // '+' stops at the first non-option: the subcommand owns the rest.
    int c;
    while ((c = getopt_long(argc, argv, "+hv", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'h':
                cli::PrintUsage(stdout, argv[0]);
                return cli::kExitOk;
            case 'v':
                verbose = true;
                break;
            case kOptAppId:
                app_id_flag = optarg;
                break;
            case kOptJson:
                json = true;
                break;
            default:
                cli::PrintUsage(stderr, argv[0]);
                return cli::kExitUsage;
        }
    }

    if (optind >= argc) {
        cli::PrintUsage(stderr, argv[0]);
        return cli::kExitUsage;
    }

    const std::string command = argv[optind];
    const int sub_argc = argc - optind;
    char** sub_argv = argv + optind;

    if (command == "help") {
        cli::PrintUsage(stdout, argv[0]);
        return cli::kExitOk;
    }
    if (command == "version") {
        if (json) {
            std::printf("{\n  \"version\": \"%s\"\n}\n", cli::kVersion);
        } else {
            std::printf("codepush %s\n", cli::kVersion);
        }
        return cli::kExitOk;
    }

    using Handler = int (*)(cli::CommandContext&, int, char**);
    Handler handler = nullptr;
    if (command == "push") handler = cli::RunPush;
    else if (command == "patch") handler = cli::RunPatch;
    else if (command == "rollback") handler = cli::RunRollback;
    else if (command == "promote") handler = cli::RunPromote;
    else if (command == "deployment") handler = cli::RunDeployment;
    else if (command == "package") handler = cli::RunPackage;
    else if (command == "auth") handler = cli::RunAuth;

    if (!handler) {
        std::fprintf(stderr, "ERROR: unknown command: %s\n\n", command.c_str());
        cli::PrintUsage(stderr, argv[0]);
        return cli::kExitUsage;
    }

    codepush::Logger::Instance().Configure(verbose);

    codepush::http::CurlGlobal curl;
    if (!curl.ok()) {
        std::fprintf(stderr, "ERROR: libcurl initialization failed\n");
        return cli::kExitFailure;
    }

    std::stop_source cancel;
    std::jthread watcher([&cancel](std::stop_token self) {
        while (!self.stop_requested()) {
            if (codepush::g_cancel.load(std::memory_order_relaxed)) {
                LogWarn("interrupted, cancelling");
                cancel.request_stop();
                return;
            }
            std::this_thread::sleep_for(kCancelPollInterval);
        }
    });

    const std::string config_dir = codepush::UserConfigDir();
    const std::string token = cli::ResolveToken(config_dir);
    codepush::http::HttpClient client(cli::ResolveApiUrl(), token);
    client.SetStopToken(cancel.get_token());

    codepush::ConsoleOutput out(stderr);
    codepush::ConsoleProgressSink progress;

    cli::CommandContext ctx{
        .app_id = cli::ResolveAppId(app_id_flag, CurrentDir()),
        .token = token,
        .client = client,
        .out = out,
        .progress = json ? nullptr : &progress,
        .stop = cancel.get_token(),
        .json = json,
        .validator = &client,
        .config_dir = config_dir,
    };

    return handler(ctx, sub_argc, sub_argv);
}
