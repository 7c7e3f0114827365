#pragma once

#include <strata/result.hpp>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace strata {

enum class EntryKind { File, Directory, Symlink };

struct TreeEntry {
    std::string path;          // relative, '/'-separated
    EntryKind kind;
};

// All entries below root (files, directories, symlinks; links not followed),
// sorted by path. Entries under `exclude` are skipped.
Result<std::vector<TreeEntry>> list_tree(const std::filesystem::path& root,
                                         const std::vector<std::filesystem::path>& exclude = {});

// Kind of an existing entry without following symlinks
Result<EntryKind> entry_kind(const std::filesystem::path& path);

// Copy one entry. Symlinks are recreated, files copied with their mode,
// directories created. Parent directories are created as needed and an
// existing destination is replaced.
Status copy_entry(const std::filesystem::path& from, const std::filesystem::path& to);

// Recursive copy of the contents of `from` into `to`
Status copy_tree(const std::filesystem::path& from, const std::filesystem::path& to,
                 const std::vector<std::filesystem::path>& exclude = {});

// Remove a path recursively; missing paths are fine
Status remove_path(const std::filesystem::path& path);

// Remove then recreate an empty directory
Status reset_dir(const std::filesystem::path& path);

// Content digest used for conflict checks and ownership records:
// sha256 of a file, "link:<target>" for symlinks, "dir" for directories
Result<std::string> entry_digest(const std::filesystem::path& path);

// True when the two entries would conflict if merged into one tree:
// different kinds, different symlink targets, or different file bytes
Result<bool> entries_collide(const std::filesystem::path& a, const std::filesystem::path& b);

// Snapshot of a tree as path -> digest, for before/after comparisons
Result<std::map<std::string, std::string>> snapshot_tree(const std::filesystem::path& root);

Status write_file(const std::filesystem::path& path, const std::string& content);

} // namespace strata
