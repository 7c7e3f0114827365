#pragma once

#include <strata/result.hpp>
#include <strata/log.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace strata {

// A prime-time permission fixup: entries matching `path` get `mode`
struct PermissionRule {
    std::string path;
    unsigned mode = 0;
};

// Immutable project-wide record handed to planning, execution and plugins
struct ProjectInfo {
    std::filesystem::path project_dir;
    std::filesystem::path work_dir;
    int parallel_build_count = 1;
    std::string target_arch;
    std::map<std::string, std::string> options;
    int step_timeout = 0;
    std::vector<std::string> overwrite_parts;
    bool normalize_permissions = true;
    std::vector<PermissionRule> permissions;
    bool layered = false;
    std::filesystem::path overlay_base;
    // Variables step scripts may set with `strata_ctl set`, with their
    // initial values
    std::map<std::string, std::string> project_vars;
    std::string project_vars_part;   // empty = any part may set them
};

// Layered configuration: global < project
// Later layers override earlier ones field by field.
struct Config {
    std::optional<std::string> work_dir;
    std::optional<int> parallel_build_count;
    std::optional<std::string> target_arch;
    std::map<std::string, std::string> options;
    std::map<std::string, std::string> project_vars;
    std::optional<std::string> project_vars_part;

    std::optional<log::Level> log_level;
    std::optional<std::string> log_color;  // auto | always | never

    std::optional<int> build_timeout;
    std::optional<std::vector<std::string>> stage_overwrite;
    std::optional<bool> normalize_permissions;
    std::optional<std::vector<PermissionRule>> permissions;

    std::optional<bool> overlay_enabled;
    std::optional<std::string> overlay_base;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    // Overlay another config on top (other's explicitly set values win)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);

    // Resolve into the record used by the lifecycle. Relative paths are
    // taken relative to project_dir.
    ProjectInfo project_info(const std::filesystem::path& project_dir) const;

    // Apply [log] settings to the process-wide logger
    void apply_logging() const;
};

// ~/.config/strata/config.toml, or "" when HOME is unset
std::string global_config_path();

// Parse an octal mode string such as "755" or "0644"
Result<unsigned> parse_mode(const std::string& text);

} // namespace strata
