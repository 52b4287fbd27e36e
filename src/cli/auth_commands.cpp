#include "cli/commands.hpp"

#include "cli/command_util.hpp"
#include "cli/credentials.hpp"
#include "http/http_client.hpp"
#include "util/logger.hpp"
#include "util/project_config.hpp"

#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <nlohmann/json.hpp>
#include <termios.h>
#include <unistd.h>

namespace codepush::cli {

namespace {

constexpr const char* kTokenEnv = "BITRISE_API_TOKEN";

void PrintAuthUsage(std::FILE* s) {
    std::fprintf(s,
        "Usage:\n"
        "   codepush auth login [--token <token>]\n"
        "   codepush auth revoke\n"
        "\n"
        "login validates the token and stores it in the user config directory.\n"
        "Without --token or BITRISE_API_TOKEN the token is read from stdin.\n"
        "\n"
        "Options:\n"
        "  -t, --token            API token\n"
        "  -h, --help             Show this help\n");
}

// Turns terminal echo off for its lifetime; no-op when `fd` is not a tty.
class EchoOff {
public:
    explicit EchoOff(int fd) : fd_(fd) {
        if (!::isatty(fd_) || ::tcgetattr(fd_, &saved_) != 0) return;
        termios quiet = saved_;
        quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        active_ = ::tcsetattr(fd_, TCSAFLUSH, &quiet) == 0;
    }
    ~EchoOff() {
        if (active_) ::tcsetattr(fd_, TCSAFLUSH, &saved_);
    }
    EchoOff(const EchoOff&) = delete;
    EchoOff& operator=(const EchoOff&) = delete;

private:
    int fd_;
    termios saved_{};
    bool active_{false};
};

std::string TrimSpace(std::string s) {
    const char* ws = " \t\r\n";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

// One line from `in`, trimmed. Prompts on `prompt_stream` when `in` is a terminal.
std::string ReadTokenLine(std::FILE* in, std::FILE* prompt_stream) {
    const int fd = ::fileno(in);
    const bool tty = fd >= 0 && ::isatty(fd);
    if (tty) {
        std::fprintf(prompt_stream, "Generate a token at %s\nAPI token: ", http::kTokenGenerationUrl);
        std::fflush(prompt_stream);
    }

    std::string line;
    {
        EchoOff quiet(fd);
        char* buf = nullptr;
        size_t cap = 0;
        const ssize_t n = ::getline(&buf, &cap, in);
        if (n > 0) line.assign(buf, static_cast<size_t>(n));
        std::free(buf);
    }
    if (tty) std::fprintf(prompt_stream, "\n");
    return TrimSpace(std::move(line));
}

int Login(CommandContext& ctx, int argc, char** argv) {
    static const option long_opts[] = {
        {"token", required_argument, nullptr, 't'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    std::string token_flag;
    ResetGetopt();
    int c;
    while ((c = getopt_long(argc, argv, "ht:", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'h':
                PrintAuthUsage(ctx.text_stream);
                return kExitOk;
            case 't':
                token_flag = optarg;
                break;
            default:
                PrintAuthUsage(ctx.text_stream);
                return kExitUsage;
        }
    }
    if (optind < argc) return UsageError(ctx, "unexpected argument: %s", argv[optind]);

    std::string token = TrimSpace(ResolveFlag(token_flag, kTokenEnv));
    if (token.empty() && ctx.input) token = ReadTokenLine(ctx.input, ctx.text_stream);
    if (token.empty()) {
        return Fail(ctx, Result::Fail(kErrValidation, "token is required: set --token or BITRISE_API_TOKEN"));
    }
    if (!ctx.validator) {
        return Fail(ctx, Result::Fail(kErrValidation, "token validation is not available"));
    }

    ctx.out.Step("Validating token");
    UserInfo user;
    auto r = ctx.validator->GetCurrentUser(token, user);
    if (!r.ok) {
        Fail(ctx, r);
        std::fprintf(ctx.text_stream, "\n  Generate a new token at: %s\n", http::kTokenGenerationUrl);
        return kExitFailure;
    }

    r = SaveStoredToken(ctx.config_dir, token);
    if (!r.ok) return Fail(ctx, r.Wrap("saving token"));
    const std::string path = StoredTokenPath(ctx.config_dir);
    LogDebug("token stored in %s", path.c_str());

    if (ctx.json) {
        PrintJson(ctx.json_stream, nlohmann::json{
                                       {"username", user.username},
                                       {"email", user.email},
                                       {"config_path", path},
                                   });
        return kExitOk;
    }
    if (!user.username.empty() && !user.email.empty()) {
        ctx.out.Info("Logged in as %s (%s)", user.username.c_str(), user.email.c_str());
    } else if (!user.username.empty() || !user.email.empty()) {
        ctx.out.Info("Logged in as %s", user.username.empty() ? user.email.c_str() : user.username.c_str());
    } else {
        ctx.out.Info("Token is valid");
    }
    ctx.out.Info("Token saved to: %s", path.c_str());
    return kExitOk;
}

int Revoke(CommandContext& ctx, int argc, char** argv) {
    if (argc > 1) {
        const std::string arg = argv[1];
        if (arg == "--help" || arg == "-h") {
            PrintAuthUsage(ctx.text_stream);
            return kExitOk;
        }
        return UsageError(ctx, "unexpected argument: %s", argv[1]);
    }

    auto r = RemoveStoredToken(ctx.config_dir);
    if (!r.ok) return Fail(ctx, r.Wrap("revoking token"));

    const char* env = std::getenv(kTokenEnv);
    const bool env_set = env && *env;
    if (ctx.json) {
        PrintJson(ctx.json_stream, nlohmann::json{
                                       {"revoked", true},
                                       {"config_path", StoredTokenPath(ctx.config_dir)},
                                   });
        return kExitOk;
    }
    ctx.out.Info("Token revoked successfully");
    if (env_set) ctx.out.Warning("%s is still set and takes precedence over the stored token", kTokenEnv);
    return kExitOk;
}

} // namespace

int RunAuth(CommandContext& ctx, int argc, char** argv) {
    if (argc < 2) {
        PrintAuthUsage(ctx.text_stream);
        return kExitUsage;
    }
    const std::string sub = argv[1];
    if (sub == "help" || sub == "--help" || sub == "-h") {
        PrintAuthUsage(ctx.text_stream);
        return kExitOk;
    }
    if (sub == "login") return Login(ctx, argc - 1, argv + 1);
    if (sub == "revoke") return Revoke(ctx, argc - 1, argv + 1);
    return UsageError(ctx, "unknown auth command: %s", sub.c_str());
}

} // namespace codepush::cli
