#include "cli/command_util.hpp"

#include "codepush/wire.hpp"

#include <algorithm>
#include <charconv>
#include <getopt.h>

namespace codepush::cli {

void ResetGetopt() {
    optind = 0;
}

bool ParseIntArg(const char* s, int& out) {
    const char* end = s + std::char_traits<char>::length(s);
    const auto [ptr, ec] = std::from_chars(s, end, out);
    return ec == std::errc{} && ptr == end && ptr != s;
}

std::string YesNo(bool v) {
    return v ? "yes" : "no";
}

std::string Truncate(const std::string& s, size_t max) {
    if (s.size() <= max) return s;
    if (max <= 3) return s.substr(0, max);
    return s.substr(0, max - 3) + "...";
}

void PrintFields(std::FILE* s, const char* title, const Fields& fields) {
    size_t width = 0;
    for (const auto& [key, value] : fields) width = std::max(width, key.size());

    std::fprintf(s, "\n%s\n", title);
    for (const auto& [key, value] : fields) {
        std::fprintf(s, "  %-*s  %s\n", static_cast<int>(width), key.c_str(), value.c_str());
    }
}

void PrintJson(std::FILE* s, const nlohmann::json& j) {
    std::fprintf(s, "%s\n", wire::DumpJson(j, 2).c_str());
}

void PrintTable(std::FILE* s,
                const std::vector<std::string>& header,
                const std::vector<std::vector<std::string>>& rows) {
    std::vector<size_t> widths(header.size());
    for (size_t i = 0; i < header.size(); ++i) widths[i] = header[i].size();
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size() && i < widths.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    auto print_row = [&](const std::vector<std::string>& cells) {
        for (size_t i = 0; i < cells.size() && i < widths.size(); ++i) {
            if (i + 1 == cells.size()) {
                std::fprintf(s, "%s", cells[i].c_str());
            } else {
                std::fprintf(s, "%-*s  ", static_cast<int>(widths[i]), cells[i].c_str());
            }
        }
        std::fprintf(s, "\n");
    };
    print_row(header);
    for (const auto& row : rows) print_row(row);
}

int Fail(const CommandContext& ctx, const Result& r) {
    std::fprintf(ctx.text_stream, "ERROR: %s\n", r.msg.c_str());
    return kExitFailure;
}

int UsageError(const CommandContext& ctx, const char* fmt, const char* arg) {
    std::fprintf(ctx.text_stream, "ERROR: ");
    std::fprintf(ctx.text_stream, fmt, arg);
    std::fprintf(ctx.text_stream, "\n");
    return kExitUsage;
}

Result RequireConfirmation(bool confirmed, const std::string& what) {
    if (confirmed) return Result::Ok();
    return Result::Fail(kErrValidation, what + "; use --yes to confirm");
}

} // namespace codepush::cli
