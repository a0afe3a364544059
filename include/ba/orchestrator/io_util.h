#pragma once

#include <filesystem>
#include <string_view>

#include "ba/error.h"

namespace ba::orchestrator {

// Appends one complete record to the target with a single write() on an
// O_APPEND descriptor, then flushes it to disk. The file is created when it
// does not exist. Throws ba::Error (IO) carrying `error_code` on failure.
void AppendRecord(const std::filesystem::path& target, std::string_view record, int error_code);

// Creates an empty file when none exists. Existing contents are left alone.
void EnsureFileExists(const std::filesystem::path& target, int error_code);

// Renames `target` to `<target>.~N~` with the next free N and returns the new
// name.
std::filesystem::path BackupExisting(const std::filesystem::path& target);

// Moves `source` into `dest_dir`, keeping its file name. An existing file of the
// same name is first renamed to `<name>.~N~` with the next free N, matching
// `mv --backup=numbered`. Falls back to copy+remove across filesystems.
// Returns the final location.
std::filesystem::path MoveWithNumberedBackup(const std::filesystem::path& source,
                                             const std::filesystem::path& dest_dir);

}  // namespace ba::orchestrator
