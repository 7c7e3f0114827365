#pragma once

#include <strata/result.hpp>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace strata {

// Ordered include/exclude list. Entries starting with '-' exclude; a
// leading '\' escapes a literal '-'. A pattern selecting a directory
// selects everything below it.
class Fileset {
public:
    Fileset() = default;
    Fileset(std::vector<std::string> entries, std::string name = "");

    const std::string& name() const { return name_; }
    const std::vector<std::string>& entries() const { return entries_; }
    std::vector<std::string> includes() const;
    std::vector<std::string> excludes() const;

    // Merge the stage fileset into a prime fileset that is "*" or only
    // excludes. Fails when this includes something `other` excludes.
    Status combine(const Fileset& other);

    // Absolute paths are rejected
    Status validate() const;

    bool matches(const std::string& rel_path) const;

private:
    std::vector<std::string> entries_;
    std::string name_;
};

// Files and directories of `root` selected by a fileset. Parent
// directories of every selected entry are included in `dirs`.
struct Selection {
    std::set<std::string> files;   // regular files and symlinks
    std::set<std::string> dirs;
};

Result<Selection> select_files(const Fileset& fileset, const std::filesystem::path& root);

// Restrict an existing selection (e.g. a part's staged files) to a fileset
Selection filter_selection(const Fileset& fileset, const Selection& from);

} // namespace strata
