#pragma once

#include "codepush/client.hpp"
#include "codepush/output.hpp"
#include "codepush/progress.hpp"
#include "codepush/types.hpp"

#include <cstdio>
#include <stop_token>
#include <string>

namespace codepush::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;

inline constexpr const char kVersion[] = "0.1.0";

// Everything a subcommand needs besides its own arguments.
struct CommandContext {
    std::string app_id;
    std::string token;
    Client& client;
    IOutput& out;
    IProgress* progress = nullptr;
    std::stop_token stop;
    PollConfig poll = kDefaultPollConfig;
    bool json = false;
    std::FILE* json_stream = stdout;
    std::FILE* text_stream = stderr;
    // auth only: checks a candidate token, and where it is stored.
    ITokenValidator* validator = nullptr;
    std::string config_dir;
    std::FILE* input = stdin;
};

// Each handler parses argv (argv[0] is the subcommand name) with getopt_long
// and returns a process exit code.
int RunPush(CommandContext& ctx, int argc, char** argv);
int RunPatch(CommandContext& ctx, int argc, char** argv);
int RunRollback(CommandContext& ctx, int argc, char** argv);
int RunPromote(CommandContext& ctx, int argc, char** argv);
int RunDeployment(CommandContext& ctx, int argc, char** argv);
int RunPackage(CommandContext& ctx, int argc, char** argv);
int RunAuth(CommandContext& ctx, int argc, char** argv);

void PrintUsage(std::FILE* stream, const char* prog);

} // namespace codepush::cli
