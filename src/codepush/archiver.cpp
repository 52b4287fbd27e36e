#include "codepush/archiver.hpp"

#include "io/file_reader.hpp"
#include "io/scoped_file.hpp"
#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <memory>
#include <sys/stat.h>
#include <vector>

namespace fs = std::filesystem;

namespace codepush {

namespace {

struct SourceEntry {
    std::string name; // relative, forward slashes
    fs::path path;
    bool is_dir = false;
};

struct ArchiveWriteFree {
    void operator()(archive* a) const { archive_write_free(a); }
};
struct ArchiveEntryFree {
    void operator()(archive_entry* e) const { archive_entry_free(e); }
};

using ArchiveWriterPtr = std::unique_ptr<archive, ArchiveWriteFree>;
using ArchiveEntryPtr = std::unique_ptr<archive_entry, ArchiveEntryFree>;

std::string ArchiveError(archive* a) {
    const char* em = archive_error_string(a);
    return em ? em : "unknown";
}

fs::path CleanAbsolute(const std::string& p, std::error_code& ec) {
    fs::path abs = fs::absolute(fs::path(p), ec);
    if (ec) return {};
    abs = abs.lexically_normal();
    if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path()) {
        abs = abs.parent_path();
    }
    return abs;
}

Result CollectEntries(const fs::path& root, std::vector<SourceEntry>& out) {
    std::error_code ec;
    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        return Result::Fail(ec.value(), "walking " + root.string() + ": " + ec.message());
    }

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return Result::Fail(ec.value(), "walking " + root.string() + ": " + ec.message());
        }
        const fs::path& p = it->path();
        const std::string rel = p.lexically_relative(root).generic_string();

        // The walk does not descend into linked directories, so such a link
        // would silently drop a subtree from the bundle.
        std::error_code sec;
        const auto link_status = it->symlink_status(sec);
        if (sec) {
            return Result::Fail(sec.value(), "stat " + p.string() + ": " + sec.message());
        }
        if (fs::is_directory(link_status)) {
            out.push_back({rel, p, true});
            continue;
        }
        const auto target_status = it->status(sec);
        if (!sec && fs::is_regular_file(target_status)) {
            out.push_back({rel, p, false});
            continue;
        }
        if (fs::is_symlink(link_status)) {
            if (!sec && fs::is_directory(target_status)) {
                return Result::Fail(kErrValidation,
                                    p.string() + ": symbolic link to a directory is not supported");
            }
            return Result::Fail(kErrValidation, p.string() + ": broken symbolic link");
        }
        return Result::Fail(kErrValidation, p.string() + ": not a regular file or directory");
    }
    if (ec) {
        return Result::Fail(ec.value(), "walking " + root.string() + ": " + ec.message());
    }

    std::sort(out.begin(), out.end(), [](const SourceEntry& a, const SourceEntry& b) {
        return a.name < b.name;
    });
    return Result::Ok();
}

Result WriteEntry(archive* ar, const SourceEntry& src) {
    struct stat st{};
    if (::stat(src.path.c_str(), &st) != 0) {
        return Result::Fail(errno, "stat " + src.path.string() + " failed");
    }

    ArchiveEntryPtr hdr(archive_entry_new());
    if (!hdr) return Result::Fail(kErrIo, "archive_entry_new failed");

    if (src.is_dir) {
        archive_entry_set_pathname(hdr.get(), (src.name + "/").c_str());
        archive_entry_set_filetype(hdr.get(), AE_IFDIR);
        archive_entry_set_perm(hdr.get(), st.st_mode & 07777);
        archive_entry_set_size(hdr.get(), 0);
    } else {
        archive_entry_set_pathname(hdr.get(), src.name.c_str());
        archive_entry_set_filetype(hdr.get(), AE_IFREG);
        archive_entry_set_perm(hdr.get(), st.st_mode & 07777);
        archive_entry_set_size(hdr.get(), static_cast<la_int64_t>(st.st_size));
    }
    archive_entry_set_mtime(hdr.get(), st.st_mtime, 0);

    if (archive_write_header(ar, hdr.get()) != ARCHIVE_OK) {
        return Result::Fail(kErrIo, "creating entry " + src.name + ": " + ArchiveError(ar));
    }
    if (src.is_dir) return Result::Ok();

    FileReader reader;
    auto open_result = FileReader::Open(src.path.string(), reader);
    if (!open_result.ok) return open_result;

    std::uint64_t written = 0;
    auto copy_result = ForEachChunk(
        reader,
        [&](std::span<const std::uint8_t> chunk) {
            if (archive_write_data(ar, chunk.data(), chunk.size()) < 0) {
                return Result::Fail(kErrIo, "writing entry " + src.name + ": " + ArchiveError(ar));
            }
            return Result::Ok();
        },
        &written);
    if (!copy_result.ok) return copy_result.Wrap("archiving " + src.path.string());
    if (written != static_cast<std::uint64_t>(st.st_size)) {
        return Result::Fail(kErrIo, src.path.string() + " changed size while archiving");
    }
    return Result::Ok();
}

} // namespace

Result ArchiveDirectory(const std::string& source_dir, std::string& out_archive_path) {
    std::error_code ec;
    const fs::path root = CleanAbsolute(source_dir, ec);
    if (ec) {
        return Result::Fail(ec.value(), "resolving directory path: " + ec.message());
    }

    const auto st = fs::status(root, ec);
    if (ec || !fs::exists(st)) {
        return Result::Fail(kErrValidation, "source directory does not exist: " + root.string());
    }
    if (!fs::is_directory(st)) {
        return Result::Fail(kErrValidation, "source path is not a directory: " + root.string());
    }

    std::vector<SourceEntry> entries;
    auto walk_result = CollectEntries(root, entries);
    if (!walk_result.ok) return walk_result.Wrap("adding files to zip");

    const std::string zip_path = root.string() + ".zip";

    // Declared before the writer so the partial archive is removed only after
    // libarchive has closed it.
    ScopedFile guard;
    ArchiveWriterPtr ar(archive_write_new());
    if (!ar) return Result::Fail(kErrIo, "archive_write_new failed");
    if (archive_write_set_format_zip(ar.get()) != ARCHIVE_OK) {
        return Result::Fail(kErrIo, "archive_write_set_format_zip: " + ArchiveError(ar.get()));
    }
    if (archive_write_open_filename(ar.get(), zip_path.c_str()) != ARCHIVE_OK) {
        return Result::Fail(kErrIo, "creating zip file: " + ArchiveError(ar.get()));
    }
    guard = ScopedFile(zip_path);

    for (const auto& entry : entries) {
        LogDebug("zip: %s%s", entry.name.c_str(), entry.is_dir ? "/" : "");
        auto r = WriteEntry(ar.get(), entry);
        if (!r.ok) return r.Wrap("adding files to zip");
    }

    if (archive_write_close(ar.get()) != ARCHIVE_OK) {
        return Result::Fail(kErrIo, "finalizing zip file: " + ArchiveError(ar.get()));
    }

    out_archive_path = guard.Release();
    LogDebug("created %s with %zu entries", out_archive_path.c_str(), entries.size());
    return Result::Ok();
}

} // namespace codepush
