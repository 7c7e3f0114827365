#pragma once

#include <strata/config.hpp>
#include <strata/dirs.hpp>
#include <strata/fileset.hpp>
#include <strata/part.hpp>
#include <strata/result.hpp>
#include <strata/state_store.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace strata {

// Exclusive advisory lock (flock) held for the lifetime of the object
class MergeLock {
public:
    static Result<MergeLock> acquire(const std::filesystem::path& lock_file);

    MergeLock(MergeLock&& o) noexcept;
    MergeLock& operator=(MergeLock&& o) noexcept;
    MergeLock(const MergeLock&) = delete;
    MergeLock& operator=(const MergeLock&) = delete;
    ~MergeLock();

private:
    explicit MergeLock(int fd) : fd_(fd) {}
    int fd_ = -1;
};

// Where a merge reads its entries from
struct MergeSource {
    std::filesystem::path root;
    Step origin = Step::Build;   // Build = install dir, Overlay = layer dir
};

// Owns the on-disk layout and every write into the shared stage and
// prime areas, keeping the ownership records in the state store in step.
class FilesystemLayout {
public:
    FilesystemLayout(ProjectInfo info, StateStore& store);

    const ProjectDirs& dirs() const { return dirs_; }
    PartDirs part_dirs(const Part& part) const;
    std::filesystem::path area_dir(Area area) const;

    Status ensure_project_dirs() const;
    Status ensure_part_dirs(const Part& part) const;

    // Merge `sel` from `source` into the area on behalf of `part`. All
    // conflicts are found before anything is written; ownership is
    // recorded before files are copied.
    Status merge(Area area, const Part& part, Step step,
                 const Selection& sel, const MergeSource& source);

    // Conflicting paths against current owners, grouped into one error
    Status check_conflicts(Area area, const Part& part,
                           const Selection& sel, const MergeSource& source);

    // Take ownership of paths a step script created or changed in an area
    Status adopt(Area area, const Part& part, Step step,
                 const std::vector<std::string>& paths);

    // The part's claimed files and directories in an area
    Result<Selection> claimed(Area area, const std::string& part);

    // Permission normalization and configured rules over primed paths
    Status fix_permissions(const Selection& primed) const;

    // Undo a part's contribution to an area. Paths owned by the part are
    // removed or restored from the previous owner; emptied directories
    // nobody claims are removed.
    Status clean_area(Area area, const Part& part);

    // Remove the outputs of one step of a part
    Status clean_step(const Part& part, Step step);

    Result<MergeLock> lock(Area area) const;

    // True when merging a over b would produce a different tree
    static Result<bool> paths_collide(const std::filesystem::path& a,
                                      const std::filesystem::path& b);

private:
    bool overwrite_allowed(const std::string& a, const std::string& b) const;
    std::filesystem::path restore_source(const OwnershipRecord& rec) const;

    ProjectInfo info_;
    ProjectDirs dirs_;
    StateStore& store_;
};

} // namespace strata
