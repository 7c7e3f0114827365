#include <strata/fsutil.hpp>
#include <strata/hash.hpp>
#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

namespace strata {

static bool is_under(const fs::path& p, const fs::path& root) {
    auto pit = p.begin();
    for (auto rit = root.begin(); rit != root.end(); ++rit, ++pit) {
        if (rit->empty()) continue;
        if (pit == p.end() || *pit != *rit) return false;
    }
    return true;
}

Result<EntryKind> entry_kind(const fs::path& path) {
    std::error_code ec;
    auto st = fs::symlink_status(path, ec);
    if (ec || !fs::exists(st)) {
        return StrataError{StrataError::NotFound, "no such entry: " + path.string()};
    }
    if (fs::is_symlink(st)) return Result<EntryKind>::ok(EntryKind::Symlink);
    if (fs::is_directory(st)) return Result<EntryKind>::ok(EntryKind::Directory);
    return Result<EntryKind>::ok(EntryKind::File);
}

Result<std::vector<TreeEntry>> list_tree(const fs::path& root,
                                         const std::vector<fs::path>& exclude) {
    std::vector<TreeEntry> out;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Result<std::vector<TreeEntry>>::ok(std::move(out));
    }

    std::vector<fs::path> excluded;
    for (const auto& e : exclude) {
        excluded.push_back(fs::weakly_canonical(e, ec).lexically_normal());
    }
    fs::path canon_root = fs::weakly_canonical(root, ec).lexically_normal();

    auto it = fs::recursive_directory_iterator(root, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        auto rel = it->path().lexically_relative(root);
        bool skip = false;
        for (const auto& x : excluded) {
            if (is_under((canon_root / rel).lexically_normal(), x)) { skip = true; break; }
        }
        auto kind = entry_kind(it->path());
        if (kind.is_err()) continue;  // vanished while iterating
        if (skip) {
            if (kind.value() == EntryKind::Directory) it.disable_recursion_pending();
            continue;
        }
        out.push_back(TreeEntry{rel.generic_string(), kind.value()});
    }
    if (ec) {
        return StrataError{StrataError::IO,
            "cannot list " + root.string() + ": " + ec.message()};
    }
    std::sort(out.begin(), out.end(),
              [](const TreeEntry& a, const TreeEntry& b) { return a.path < b.path; });
    return Result<std::vector<TreeEntry>>::ok(std::move(out));
}

Status copy_entry(const fs::path& from, const fs::path& to) {
    auto kind = entry_kind(from);
    if (kind.is_err()) return std::move(kind).error();

    std::error_code ec;
    if (to.has_parent_path()) {
        fs::create_directories(to.parent_path(), ec);
        if (ec) {
            return StrataError{StrataError::IO,
                "cannot create " + to.parent_path().string() + ": " + ec.message()};
        }
    }

    auto existing = entry_kind(to);
    if (existing.is_ok()) {
        bool both_dirs = existing.value() == EntryKind::Directory
                      && kind.value() == EntryKind::Directory;
        if (!both_dirs) {
            fs::remove_all(to, ec);
            if (ec) {
                return StrataError{StrataError::IO,
                    "cannot replace " + to.string() + ": " + ec.message()};
            }
        }
    }

    switch (kind.value()) {
        case EntryKind::Symlink: {
            auto target = fs::read_symlink(from, ec);
            if (!ec) fs::create_symlink(target, to, ec);
            break;
        }
        case EntryKind::Directory: {
            fs::create_directory(to, ec);
            if (ec) break;
            auto perms = fs::status(from, ec).permissions();
            if (!ec) fs::permissions(to, perms, ec);
            break;
        }
        case EntryKind::File:
            fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
            break;
    }
    if (ec) {
        return StrataError{StrataError::IO,
            "cannot copy " + from.string() + " to " + to.string() + ": " + ec.message()};
    }
    return ok_status();
}

Status copy_tree(const fs::path& from, const fs::path& to,
                 const std::vector<fs::path>& exclude) {
    auto entries = list_tree(from, exclude);
    if (entries.is_err()) return std::move(entries).error();
    std::error_code ec;
    fs::create_directories(to, ec);
    if (ec) {
        return StrataError{StrataError::IO, "cannot create " + to.string() + ": " + ec.message()};
    }
    for (const auto& e : entries.value()) {
        STRATA_TRY(copy_entry(from / e.path, to / e.path));
    }
    return ok_status();
}

Status remove_path(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        return StrataError{StrataError::IO, "cannot remove " + path.string() + ": " + ec.message()};
    }
    return ok_status();
}

Status reset_dir(const fs::path& path) {
    STRATA_TRY(remove_path(path));
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return StrataError{StrataError::IO, "cannot create " + path.string() + ": " + ec.message()};
    }
    return ok_status();
}

Result<std::string> entry_digest(const fs::path& path) {
    auto kind = entry_kind(path);
    if (kind.is_err()) return std::move(kind).error();
    switch (kind.value()) {
        case EntryKind::Symlink: {
            std::error_code ec;
            auto target = fs::read_symlink(path, ec);
            if (ec) {
                return StrataError{StrataError::IO, "cannot read link " + path.string()};
            }
            return Result<std::string>::ok("link:" + target.string());
        }
        case EntryKind::Directory:
            return Result<std::string>::ok("dir");
        case EntryKind::File:
            break;
    }
    return hash_file(path);
}

Result<bool> entries_collide(const fs::path& a, const fs::path& b) {
    auto da = entry_digest(a);
    if (da.is_err()) return std::move(da).error();
    auto db = entry_digest(b);
    if (db.is_err()) return std::move(db).error();
    return Result<bool>::ok(da.value() != db.value());
}

Result<std::map<std::string, std::string>> snapshot_tree(const fs::path& root) {
    std::map<std::string, std::string> out;
    auto entries = list_tree(root);
    if (entries.is_err()) return std::move(entries).error();
    for (const auto& e : entries.value()) {
        auto d = entry_digest(root / e.path);
        if (d.is_err()) return std::move(d).error();
        out[e.path] = std::move(d).value();
    }
    return Result<std::map<std::string, std::string>>::ok(std::move(out));
}

Status write_file(const fs::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return StrataError{StrataError::IO, "cannot write " + path.string()};
    }
    out << content;
    if (!out) {
        return StrataError{StrataError::IO, "short write to " + path.string()};
    }
    return ok_status();
}

} // namespace strata
