#pragma once

#include <strata/result.hpp>
#include <string>
#include <vector>
#include <filesystem>

namespace strata {

// Match a glob pattern against a relative path (both '/'-separated).
// Supports: * (any chars except /), ? (single char except /),
//           ** (zero or more path segments), [abc], [a-z], [!0-9]
bool glob_match(const std::string& pattern, const std::string& path);

// True if the pattern contains any glob metacharacter
bool glob_has_magic(const std::string& pattern);

// Expand a pattern against the tree rooted at root_dir. Matches files,
// directories and symlinks; results are relative to root_dir and sorted.
Result<std::vector<std::string>> glob_expand(
    const std::string& pattern,
    const std::filesystem::path& root_dir);

} // namespace strata
