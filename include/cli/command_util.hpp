#pragma once

#include "cli/commands.hpp"
#include "util/result.hpp"

#include <cstdio>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

// Helpers shared by the subcommand handlers.
namespace codepush::cli {

using Fields = std::vector<std::pair<std::string, std::string>>;

inline constexpr const char kDeploymentEnv[] = "CODEPUSH_DEPLOYMENT";

// glibc: optind = 0 forces a full rescan of a new argv.
void ResetGetopt();

// Whole-string base-10 parse.
bool ParseIntArg(const char* s, int& out);

std::string YesNo(bool v);

// Cuts `s` to `max` bytes, the last three replaced by "...".
std::string Truncate(const std::string& s, size_t max);

// Title line followed by aligned "key  value" rows.
void PrintFields(std::FILE* s, const char* title, const Fields& fields);

void PrintJson(std::FILE* s, const nlohmann::json& j);

// Left-aligned columns sized to the widest cell.
void PrintTable(std::FILE* s,
                const std::vector<std::string>& header,
                const std::vector<std::vector<std::string>>& rows);

// Prints "ERROR: <msg>" and returns kExitFailure.
int Fail(const CommandContext& ctx, const Result& r);

// Prints "ERROR: " + fmt(arg) and returns kExitUsage.
int UsageError(const CommandContext& ctx, const char* fmt, const char* arg);

// Destructive operations run only with --yes; there is no interactive prompt.
Result RequireConfirmation(bool confirmed, const std::string& what);

} // namespace codepush::cli
