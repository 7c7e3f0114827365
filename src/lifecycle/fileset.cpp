#include <strata/fileset.hpp>
#include <strata/fsutil.hpp>
#include <strata/glob.hpp>
#include <algorithm>

namespace fs = std::filesystem;

namespace strata {

Fileset::Fileset(std::vector<std::string> entries, std::string name)
    : entries_(std::move(entries)), name_(std::move(name)) {}

static std::string strip_entry(const std::string& e) {
    if (!e.empty() && (e[0] == '-' || e[0] == '\\')) return e.substr(1);
    return e;
}

std::vector<std::string> Fileset::includes() const {
    std::vector<std::string> out;
    for (const auto& e : entries_) {
        if (!e.empty() && e[0] != '-') out.push_back(strip_entry(e));
    }
    if (out.empty()) out.push_back("*");
    return out;
}

std::vector<std::string> Fileset::excludes() const {
    std::vector<std::string> out;
    for (const auto& e : entries_) {
        if (!e.empty() && e[0] == '-') out.push_back(e.substr(1));
    }
    return out;
}

Status Fileset::combine(const Fileset& other) {
    bool to_combine = false;
    auto star = std::find(entries_.begin(), entries_.end(), "*");
    if (star != entries_.end()) {
        to_combine = true;
        entries_.erase(star);
    }

    std::vector<std::string> mine;
    for (const auto& e : entries_) {
        if (!e.empty() && e[0] != '-') mine.push_back(strip_entry(e));
    }
    std::string contradicting;
    for (const auto& ex : other.excludes()) {
        if (std::find(mine.begin(), mine.end(), ex) != mine.end()) {
            if (!contradicting.empty()) contradicting += ", ";
            contradicting += ex;
        }
    }
    if (!contradicting.empty()) {
        return StrataError{StrataError::PropertyValidation,
            "fileset '" + name_ + "' includes entries excluded by '" + other.name_
            + "': " + contradicting};
    }

    if (!entries_.empty() && std::all_of(entries_.begin(), entries_.end(),
            [](const std::string& e) { return !e.empty() && e[0] == '-'; })) {
        to_combine = true;
    }

    if (to_combine) {
        for (const auto& e : other.entries_) {
            if (std::find(entries_.begin(), entries_.end(), e) == entries_.end()) {
                entries_.push_back(e);
            }
        }
    }
    return ok_status();
}

Status Fileset::validate() const {
    for (const auto& e : entries_) {
        auto p = strip_entry(e);
        if (!p.empty() && p[0] == '/') {
            return StrataError{StrataError::PropertyValidation,
                "fileset '" + name_ + "': path '" + p + "' must be relative"};
        }
    }
    return ok_status();
}

// True if the pattern matches the path or one of its ancestors
static bool matches_or_ancestor(const std::string& pattern, const std::string& path) {
    std::string cur = path;
    while (true) {
        if (glob_match(pattern, cur)) return true;
        auto slash = cur.rfind('/');
        if (slash == std::string::npos) return false;
        cur.resize(slash);
    }
}

bool Fileset::matches(const std::string& rel_path) const {
    bool included = false;
    for (const auto& inc : includes()) {
        if (matches_or_ancestor(inc, rel_path)) { included = true; break; }
    }
    if (!included) return false;
    for (const auto& ex : excludes()) {
        if (matches_or_ancestor(ex, rel_path)) return false;
    }
    return true;
}

static void add_parents(const std::string& path, std::set<std::string>& dirs) {
    std::string cur = path;
    for (auto slash = cur.rfind('/'); slash != std::string::npos && slash > 0;
         slash = cur.rfind('/')) {
        cur.resize(slash);
        dirs.insert(cur);
    }
}

Result<Selection> select_files(const Fileset& fileset, const fs::path& root) {
    STRATA_TRY(fileset.validate());
    auto entries = list_tree(root);
    if (entries.is_err()) return std::move(entries).error();

    Selection sel;
    for (const auto& e : entries.value()) {
        if (!fileset.matches(e.path)) continue;
        if (e.kind == EntryKind::Directory) {
            sel.dirs.insert(e.path);
        } else {
            sel.files.insert(e.path);
        }
        add_parents(e.path, sel.dirs);
    }
    return Result<Selection>::ok(std::move(sel));
}

Selection filter_selection(const Fileset& fileset, const Selection& from) {
    Selection sel;
    for (const auto& f : from.files) {
        if (fileset.matches(f)) {
            sel.files.insert(f);
            add_parents(f, sel.dirs);
        }
    }
    for (const auto& d : from.dirs) {
        if (fileset.matches(d)) {
            sel.dirs.insert(d);
            add_parents(d, sel.dirs);
        }
    }
    return sel;
}

} // namespace strata
