#pragma once

#include <strata/result.hpp>
#include <strata/step.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace strata {

using PropertyValue = std::variant<std::string, bool, int64_t, std::vector<std::string>>;
using PropertyMap = std::map<std::string, PropertyValue>;

// Human-readable rendering: strings raw, lists as "[a, b]"
std::string property_to_string(const PropertyValue& value);

// Type name used in validation messages ("string", "boolean", ...)
const char* property_type_name(const PropertyValue& value);

// Typed lookups. Missing keys yield nullopt; so do keys of another type,
// which plugins reject earlier in validate_properties().
std::optional<std::string> get_string(const PropertyMap& props, const std::string& key);
std::optional<bool> get_bool(const PropertyMap& props, const std::string& key);
std::optional<int64_t> get_int(const PropertyMap& props, const std::string& key);
std::optional<std::vector<std::string>> get_list(const PropertyMap& props, const std::string& key);

struct SourceSpec {
    std::string location;   // path (relative to the project) or URL; empty = no source
    std::string type;       // "local", "git", or empty to detect from location
    std::string commit;
    std::string tag;
    std::string branch;
    std::string subdir;     // build inside this subdirectory of the pulled tree

    bool empty() const { return location.empty(); }
};

enum class OverrideMode { Replace, Prepend, Append };

const char* override_mode_name(OverrideMode mode);

// User script attached to a step
struct StepOverride {
    std::string script;
    OverrideMode mode = OverrideMode::Replace;
};

struct Part {
    std::string name;
    std::vector<std::string> after;
    std::string plugin;                     // empty = same as name
    PropertyMap properties;                 // plugin properties
    SourceSpec source;
    std::map<Step, StepOverride> overrides;
    std::vector<std::pair<std::string, std::string>> build_environment;
    std::map<std::string, std::string> organize;
    std::vector<std::string> stage_files{"*"};
    std::vector<std::string> prime_files{"*"};
    std::vector<std::string> overlay_files{"*"};

    const std::string& plugin_name() const { return plugin.empty() ? name : plugin; }

    const StepOverride* override_for(Step step) const;

    // The subset of the part definition whose change invalidates `step`.
    // plugin_pull_properties names the plugin properties that affect Pull.
    PropertyMap properties_of_interest(
        Step step,
        const std::vector<std::string>& plugin_pull_properties = {},
        bool layered = false) const;
};

// Part names: non-empty, no '/', no whitespace, not starting with '.'
Status validate_part_name(const std::string& name);

} // namespace strata
