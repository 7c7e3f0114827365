#include <strata/layout.hpp>
#include <strata/fsutil.hpp>
#include <strata/glob.hpp>
#include <strata/log.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <map>
#include <set>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace strata {

// ---------------------------------------------------------------------------
// MergeLock
// ---------------------------------------------------------------------------

Result<MergeLock> MergeLock::acquire(const fs::path& lock_file) {
    std::error_code ec;
    fs::create_directories(lock_file.parent_path(), ec);
    int fd = ::open(lock_file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return StrataError{StrataError::IO,
            "cannot open lock file " + lock_file.string() + ": " + strerror(errno)};
    }
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        log::info("waiting for lock %s", lock_file.c_str());
        if (::flock(fd, LOCK_EX) != 0) {
            int err = errno;
            ::close(fd);
            return StrataError{StrataError::IO,
                "cannot lock " + lock_file.string() + ": " + strerror(err)};
        }
    }
    return Result<MergeLock>::ok(MergeLock(fd));
}

MergeLock::MergeLock(MergeLock&& o) noexcept : fd_(o.fd_) {
    o.fd_ = -1;
}

MergeLock& MergeLock::operator=(MergeLock&& o) noexcept {
    if (this != &o) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = o.fd_;
        o.fd_ = -1;
    }
    return *this;
}

MergeLock::~MergeLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

// ---------------------------------------------------------------------------
// Collisions
// ---------------------------------------------------------------------------

static bool has_suffix(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size()
        && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// pkg-config files differ legitimately in their prefix= line
static Result<bool> pkgconfig_collide(const fs::path& a, const fs::path& b) {
    std::ifstream fa(a), fb(b);
    if (!fa || !fb) {
        return StrataError{StrataError::IO, "cannot read " + a.string() + " or " + b.string()};
    }
    std::string la, lb;
    while (true) {
        bool ga = static_cast<bool>(std::getline(fa, la));
        bool gb = static_cast<bool>(std::getline(fb, lb));
        if (!ga || !gb) return Result<bool>::ok(ga != gb);
        if (la.rfind("prefix=", 0) == 0 && lb.rfind("prefix=", 0) == 0) continue;
        if (la != lb) return Result<bool>::ok(true);
    }
}

Result<bool> FilesystemLayout::paths_collide(const fs::path& a, const fs::path& b) {
    auto ka = entry_kind(a);
    auto kb = entry_kind(b);
    if (ka.is_err() || kb.is_err()) return Result<bool>::ok(false);
    if (ka.value() != kb.value()) return Result<bool>::ok(true);
    if (ka.value() == EntryKind::Directory) return Result<bool>::ok(false);
    if (ka.value() == EntryKind::File && has_suffix(a.filename().string(), ".pc")) {
        return pkgconfig_collide(a, b);
    }
    return entries_collide(a, b);
}

// ---------------------------------------------------------------------------
// FilesystemLayout
// ---------------------------------------------------------------------------

FilesystemLayout::FilesystemLayout(ProjectInfo info, StateStore& store)
    : info_(std::move(info)), dirs_(info_.work_dir), store_(store) {}

PartDirs FilesystemLayout::part_dirs(const Part& part) const {
    return PartDirs(dirs_, part.name, part.source.subdir);
}

fs::path FilesystemLayout::area_dir(Area area) const {
    return area == Area::Stage ? dirs_.stage : dirs_.prime;
}

static Status make_dirs(const std::vector<fs::path>& paths) {
    for (const auto& p : paths) {
        std::error_code ec;
        fs::create_directories(p, ec);
        if (ec) {
            return StrataError{StrataError::IO, "cannot create " + p.string() + ": " + ec.message()};
        }
    }
    return ok_status();
}

Status FilesystemLayout::ensure_project_dirs() const {
    return make_dirs({dirs_.parts, dirs_.stage, dirs_.prime, dirs_.state});
}

Status FilesystemLayout::ensure_part_dirs(const Part& part) const {
    auto d = part_dirs(part);
    return make_dirs({d.src, d.build, d.install, d.run});
}

Result<MergeLock> FilesystemLayout::lock(Area area) const {
    return MergeLock::acquire(dirs_.state / (std::string(area_name(area)) + ".lock"));
}

bool FilesystemLayout::overwrite_allowed(const std::string& a, const std::string& b) const {
    const auto& allowed = info_.overwrite_parts;
    return std::find(allowed.begin(), allowed.end(), a) != allowed.end()
        || std::find(allowed.begin(), allowed.end(), b) != allowed.end();
}

Status FilesystemLayout::check_conflicts(Area area, const Part& part,
                                         const Selection& sel, const MergeSource& source) {
    const fs::path target = area_dir(area);
    // other part -> conflicting paths
    std::map<std::string, std::vector<std::string>> conflicts;
    std::set<std::string> checked;

    auto against_owner = [&](const std::string& path) -> Status {
        auto owner = store_.owner_of(area, path);
        if (owner.is_err()) return std::move(owner).error();
        if (!owner.value() || owner.value()->part == part.name) return ok_status();
        if (!overwrite_allowed(part.name, owner.value()->part)) {
            conflicts[owner.value()->part].push_back(path);
        }
        return ok_status();
    };

    // An existing non-directory where this part needs a directory
    auto check_dir = [&](const std::string& path) -> Status {
        if (!checked.insert(path).second) return ok_status();
        std::error_code ec;
        auto st = fs::symlink_status(target / path, ec);
        if (!fs::exists(st) || fs::is_directory(st)) return ok_status();
        return against_owner(path);
    };

    auto check_ancestors = [&](const std::string& path) -> Status {
        for (auto slash = path.rfind('/'); slash != std::string::npos && slash > 0;
             slash = path.rfind('/', slash - 1)) {
            STRATA_TRY(check_dir(path.substr(0, slash)));
        }
        return ok_status();
    };

    for (const auto& path : sel.dirs) {
        STRATA_TRY(check_ancestors(path));
        STRATA_TRY(check_dir(path));
    }

    for (const auto& path : sel.files) {
        STRATA_TRY(check_ancestors(path));
        if (!checked.insert(path).second) continue;
        fs::path dst = target / path;
        std::error_code ec;
        if (!fs::exists(fs::symlink_status(dst, ec))) continue;

        auto collide = paths_collide(source.root / path, dst);
        if (collide.is_err()) return std::move(collide).error();
        if (collide.value()) STRATA_TRY(against_owner(path));
    }

    if (conflicts.empty()) return ok_status();

    const auto& [other, paths] = *conflicts.begin();
    std::string list;
    for (const auto& p : paths) {
        list += "\n    ";
        list += p;
    }
    StrataError err{StrataError::Conflict,
        "parts '" + other + "' and '" + part.name + "' have the following files in common "
        "with different contents:" + list,
        "add one of the parts to [stage] overwrite or exclude the files from its fileset"};
    err.part = part.name;
    err.step = area == Area::Stage ? "stage" : "prime";
    return err;
}

Status FilesystemLayout::merge(Area area, const Part& part, Step step,
                               const Selection& sel, const MergeSource& source) {
    STRATA_TRY(check_conflicts(area, part, sel, source));

    std::vector<OwnershipRecord> records;
    auto add = [&](const std::string& path) -> Status {
        fs::path src = source.root / path;
        auto kind = entry_kind(src);
        if (kind.is_err()) return std::move(kind).error();
        auto digest = entry_digest(src);
        if (digest.is_err()) return std::move(digest).error();
        OwnershipRecord r;
        r.area = area;
        r.path = path;
        r.part = part.name;
        r.step = source.origin == Step::Overlay ? Step::Overlay : step;
        r.kind = kind.value();
        r.digest = std::move(digest).value();
        records.push_back(std::move(r));
        return ok_status();
    };
    for (const auto& d : sel.dirs) STRATA_TRY(add(d));
    for (const auto& f : sel.files) STRATA_TRY(add(f));

    STRATA_TRY(store_.claim(records));

    const fs::path target = area_dir(area);
    for (const auto& d : sel.dirs) {
        STRATA_TRY(copy_entry(source.root / d, target / d));
    }
    for (const auto& f : sel.files) {
        STRATA_TRY(copy_entry(source.root / f, target / f));
    }
    log::debug("%s: merged %zu files, %zu dirs into %s", part.name.c_str(),
               sel.files.size(), sel.dirs.size(), area_name(area));
    return ok_status();
}

Status FilesystemLayout::adopt(Area area, const Part& part, Step step,
                               const std::vector<std::string>& paths) {
    std::vector<OwnershipRecord> records;
    const fs::path target = area_dir(area);
    for (const auto& path : paths) {
        auto kind = entry_kind(target / path);
        if (kind.is_err()) continue;  // deleted by the script
        auto digest = entry_digest(target / path);
        if (digest.is_err()) return std::move(digest).error();
        OwnershipRecord r;
        r.area = area;
        r.path = path;
        r.part = part.name;
        r.step = step;
        r.kind = kind.value();
        r.digest = std::move(digest).value();
        records.push_back(std::move(r));
    }
    return store_.claim(records);
}

Result<Selection> FilesystemLayout::claimed(Area area, const std::string& part) {
    auto recs = store_.owned_by(area, part);
    if (recs.is_err()) return std::move(recs).error();
    Selection sel;
    for (const auto& r : recs.value()) {
        if (r.kind == EntryKind::Directory) {
            sel.dirs.insert(r.path);
        } else {
            sel.files.insert(r.path);
        }
    }
    return Result<Selection>::ok(std::move(sel));
}

Status FilesystemLayout::fix_permissions(const Selection& primed) const {
    const fs::path root = dirs_.prime;
    auto apply = [&](const std::string& path) -> Status {
        fs::path p = root / path;
        std::error_code ec;
        auto st = fs::symlink_status(p, ec);
        if (ec || fs::is_symlink(st) || !fs::exists(st)) return ok_status();

        auto perms = st.permissions();
        if (info_.normalize_permissions) {
            perms &= ~(fs::perms::group_write | fs::perms::others_write);
        }
        for (const auto& rule : info_.permissions) {
            if (glob_match(rule.path, path)) {
                perms = static_cast<fs::perms>(rule.mode) & fs::perms::mask;
            }
        }
        fs::permissions(p, perms, fs::perm_options::replace, ec);
        if (ec) {
            return StrataError{StrataError::IO,
                "cannot set permissions on " + p.string() + ": " + ec.message()};
        }
        return ok_status();
    };
    for (const auto& d : primed.dirs) STRATA_TRY(apply(d));
    for (const auto& f : primed.files) STRATA_TRY(apply(f));
    return ok_status();
}

fs::path FilesystemLayout::restore_source(const OwnershipRecord& rec) const {
    PartDirs d(dirs_, rec.part);
    return (rec.step == Step::Overlay ? d.layer : d.install) / rec.path;
}

Status FilesystemLayout::clean_area(Area area, const Part& part) {
    auto recs = store_.owned_by(area, part.name);
    if (recs.is_err()) return std::move(recs).error();
    if (recs.value().empty()) return ok_status();

    const fs::path target = area_dir(area);
    std::vector<std::string> released;
    std::vector<std::string> dirs;

    for (const auto& rec : recs.value()) {
        released.push_back(rec.path);
        if (rec.kind == EntryKind::Directory) {
            dirs.push_back(rec.path);
            continue;
        }

        auto hist = store_.history(area, rec.path);
        if (hist.is_err()) return std::move(hist).error();
        const auto& h = hist.value();
        if (h.empty() || h.front().part != part.name) {
            continue;  // another part owns the current content
        }

        fs::path dst = target / rec.path;
        std::error_code ec;
        if (!fs::exists(fs::symlink_status(dst, ec))) {
            log::warn("%s: %s/%s is already gone", part.name.c_str(),
                      area_name(area), rec.path.c_str());
        } else {
            STRATA_TRY(remove_path(dst));
        }

        // Hand the path back to the previous owner
        if (h.size() > 1) {
            const auto& prev = h[1];
            fs::path from = restore_source(prev);
            if (fs::exists(fs::symlink_status(from, ec))) {
                log::debug("%s: restoring %s from '%s'", area_name(area),
                           rec.path.c_str(), prev.part.c_str());
                STRATA_TRY(copy_entry(from, dst));
                if (area == Area::Prime) {
                    Selection one;
                    one.files.insert(rec.path);
                    STRATA_TRY(fix_permissions(one));
                }
            } else {
                log::warn("%s: cannot restore %s, '%s' no longer provides it",
                          area_name(area), rec.path.c_str(), prev.part.c_str());
            }
        }
    }

    STRATA_TRY(store_.release(area, part.name, released));

    // Deepest first so parents can become empty
    std::sort(dirs.rbegin(), dirs.rend());
    for (const auto& d : dirs) {
        auto hist = store_.history(area, d);
        if (hist.is_err()) return std::move(hist).error();
        if (!hist.value().empty()) continue;

        fs::path p = target / d;
        std::error_code ec;
        if (fs::is_directory(fs::symlink_status(p, ec)) && fs::is_empty(p, ec)) {
            fs::remove(p, ec);
            if (ec) {
                return StrataError{StrataError::IO,
                    "cannot remove " + p.string() + ": " + ec.message()};
            }
        }
    }
    return ok_status();
}

Status FilesystemLayout::clean_step(const Part& part, Step step) {
    auto d = part_dirs(part);
    switch (step) {
        case Step::Pull:
            return remove_path(d.src);
        case Step::Overlay:
            return remove_path(d.layer);
        case Step::Build:
            STRATA_TRY(remove_path(d.build));
            return remove_path(d.install);
        case Step::Stage: {
            auto lk = lock(Area::Stage);
            if (lk.is_err()) return std::move(lk).error();
            return clean_area(Area::Stage, part);
        }
        case Step::Prime: {
            auto lk = lock(Area::Prime);
            if (lk.is_err()) return std::move(lk).error();
            return clean_area(Area::Prime, part);
        }
    }
    return ok_status();
}

} // namespace strata
