#pragma once

#include "util/result.hpp"

#include <string>

namespace codepush {

// Packs every file and directory under source_dir into "<source_dir>.zip",
// written next to the directory. Entry names are relative to source_dir with
// forward slashes; directories are stored explicitly with a trailing slash.
// Entries are emitted in sorted order. A link to a file is stored with the
// target's contents; links to directories, broken links and special files
// fail the whole archive.
//
// The caller owns the returned archive and must remove it. On failure no
// archive is left behind.
Result ArchiveDirectory(const std::string& source_dir, std::string& out_archive_path);

} // namespace codepush
