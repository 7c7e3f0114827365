#include <strata/overlay.hpp>
#include <strata/fsutil.hpp>
#include <strata/hash.hpp>
#include <strata/log.hpp>

#include <map>

namespace fs = std::filesystem;

namespace strata {

bool is_whiteout(const std::string& filename) {
    return filename.rfind(kWhiteoutPrefix, 0) == 0;
}

static std::string parent_of(const std::string& rel) {
    auto slash = rel.rfind('/');
    return slash == std::string::npos ? "" : rel.substr(0, slash);
}

static std::string base_of(const std::string& rel) {
    auto slash = rel.rfind('/');
    return slash == std::string::npos ? rel : rel.substr(slash + 1);
}

static fs::path join(const fs::path& root, const std::string& dir, const std::string& name) {
    return dir.empty() ? root / name : root / dir / name;
}

OverlayManager::OverlayManager(ProjectDirs dirs, fs::path base)
    : dirs_(std::move(dirs)), base_(std::move(base)) {}

Result<std::string> OverlayManager::base_identity() const {
    if (base_.empty()) return Result<std::string>::ok("none");
    std::error_code ec;
    if (!fs::is_directory(base_, ec)) {
        return StrataError{StrataError::NotFound,
            "overlay base " + base_.string() + " is not a directory",
            "set [overlay] base to an existing directory"};
    }
    auto h = hash_tree(base_);
    if (h.is_err()) return std::move(h).error();
    return Result<std::string>::ok("base:" + h.value());
}

fs::path OverlayManager::view_root(const std::string& part) const {
    return dirs_.overlay / part;
}

Status OverlayManager::materialize(const std::vector<fs::path>& layers,
                                   const fs::path& dest) const {
    STRATA_TRY(reset_dir(dest));
    if (!base_.empty()) {
        STRATA_TRY(copy_tree(base_, dest));
    }
    for (const auto& layer : layers) {
        STRATA_TRY(apply(layer, dest));
    }
    return ok_status();
}

Status OverlayManager::apply(const fs::path& layer_dir, const fs::path& target) {
    auto entries = list_tree(layer_dir);
    if (entries.is_err()) return std::move(entries).error();

    // Opaque directories first, then whiteouts, then content
    for (const auto& e : entries.value()) {
        if (base_of(e.path) != kOpaqueMarker) continue;
        fs::path dir = target / parent_of(e.path);
        auto children = list_tree(dir);
        if (children.is_err()) return std::move(children).error();
        for (const auto& c : children.value()) {
            if (c.path.find('/') != std::string::npos) continue;
            STRATA_TRY(remove_path(dir / c.path));
        }
    }
    for (const auto& e : entries.value()) {
        std::string name = base_of(e.path);
        if (!is_whiteout(name) || name == kOpaqueMarker) continue;
        fs::path victim = join(target, parent_of(e.path),
                               name.substr(std::string(kWhiteoutPrefix).size()));
        log::trace("overlay: whiteout %s", victim.c_str());
        STRATA_TRY(remove_path(victim));
    }
    for (const auto& e : entries.value()) {
        if (is_whiteout(base_of(e.path))) continue;
        STRATA_TRY(copy_entry(layer_dir / e.path, target / e.path));
    }
    return ok_status();
}

Status OverlayManager::capture(const fs::path& lower, const fs::path& upper,
                               const fs::path& layer_dir) const {
    auto before = snapshot_tree(lower);
    if (before.is_err()) return std::move(before).error();
    auto after = snapshot_tree(upper);
    if (after.is_err()) return std::move(after).error();
    const auto& lo = before.value();
    const auto& up = after.value();

    STRATA_TRY(reset_dir(layer_dir));

    size_t changed = 0;
    for (const auto& [path, digest] : up) {
        auto it = lo.find(path);
        if (it != lo.end() && it->second == digest) continue;
        STRATA_TRY(copy_entry(upper / path, layer_dir / path));
        ++changed;
    }

    // An entry needs its own whiteout only when its parent survives as a
    // directory; otherwise the parent's removal already hides it.
    auto parent_is_dir = [&](const std::string& path) {
        std::string parent = parent_of(path);
        if (parent.empty()) return true;
        auto it = up.find(parent);
        return it != up.end() && it->second == "dir";
    };

    size_t removed = 0;
    for (const auto& [path, digest] : lo) {
        if (up.count(path) || !parent_is_dir(path)) continue;
        std::string parent = parent_of(path);
        fs::path marker = join(layer_dir, parent, kWhiteoutPrefix + base_of(path));
        STRATA_TRY(write_file(marker, ""));
        ++removed;
    }
    log::debug("overlay: captured %zu changed, %zu removed entries into %s",
               changed, removed, layer_dir.c_str());
    return ok_status();
}

} // namespace strata
