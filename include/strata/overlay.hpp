#pragma once

#include <strata/dirs.hpp>
#include <strata/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace strata {

// Whiteout markers inside a layer directory
constexpr const char* kWhiteoutPrefix = ".wh.";
constexpr const char* kOpaqueMarker = ".wh..wh..opq";

bool is_whiteout(const std::string& filename);

// Copy-on-write layers for layered builds. A layer holds the entries a
// part added or changed relative to the layers below it, plus whiteout
// files for entries it removed. Lower layers are never written.
class OverlayManager {
public:
    OverlayManager(ProjectDirs dirs, std::filesystem::path base);

    const std::filesystem::path& base() const { return base_; }

    // "base:<tree digest>", or "none" without a base
    Result<std::string> base_identity() const;

    // Scratch directory for a part's views: overlay/<part>
    std::filesystem::path view_root(const std::string& part) const;

    // dest = base + layers applied in order
    Status materialize(const std::vector<std::filesystem::path>& layers,
                       const std::filesystem::path& dest) const;

    // Record in layer_dir how upper differs from lower
    Status capture(const std::filesystem::path& lower,
                   const std::filesystem::path& upper,
                   const std::filesystem::path& layer_dir) const;

    // Merge a layer down onto target, honouring whiteouts
    static Status apply(const std::filesystem::path& layer_dir,
                        const std::filesystem::path& target);

private:
    ProjectDirs dirs_;
    std::filesystem::path base_;
};

} // namespace strata
