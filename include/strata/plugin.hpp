#pragma once

#include <strata/dirs.hpp>
#include <strata/part.hpp>
#include <strata/result.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace strata {

// Immutable view of a part handed to plugins
struct PluginContext {
    std::string part_name;
    PropertyMap properties;
    PartDirs dirs;
    std::filesystem::path stage_dir;
    int parallel_build_count = 1;
    std::string target_arch;
    std::map<std::string, std::string> options;
};

using EnvironmentList = std::vector<std::pair<std::string, std::string>>;

// Expected shape of one plugin property
struct PropertySpec {
    std::string name;
    size_t type_index;     // index into PropertyValue
    bool required = false;
};

// Build-system backend. Plugins turn a part into shell commands; they do
// not run anything or touch the state store or the shared areas.
class Plugin {
public:
    virtual ~Plugin() = default;

    virtual Status validate_properties(const PropertyMap& props) const = 0;

    // Plugin properties whose change should re-pull the part
    virtual std::vector<std::string> pull_properties() const { return {}; }

    // Commands that fetch sources. Empty means the source handler pulls.
    virtual std::vector<std::string> pull_commands(const PluginContext&) const { return {}; }

    virtual std::vector<std::string> build_commands(const PluginContext& ctx) const = 0;

    virtual EnvironmentList build_environment(const PluginContext&) const { return {}; }

    // Host packages the build commands expect to find
    virtual std::vector<std::string> build_packages(const PluginContext&) const { return {}; }

    virtual bool requires_source() const { return false; }

    // Build in an empty build tree instead of a copy of the sources
    virtual bool out_of_source_build() const { return false; }

protected:
    // Rejects unknown keys, wrong types and missing required keys
    static Status check_schema(const PropertyMap& props,
                               const std::vector<PropertySpec>& schema,
                               const std::string& plugin_name);
};

using PluginHandle = std::shared_ptr<const Plugin>;
using PluginFactory = std::function<PluginHandle()>;

class PluginRegistry {
public:
    // Registry preloaded with nil, dump, make, cmake and autotools
    static PluginRegistry with_builtins();

    // Add a plugin, replacing any existing one with the same name
    void register_plugin(const std::string& name, PluginFactory factory);
    void unregister_plugin(const std::string& name);

    bool has(const std::string& name) const;
    std::vector<std::string> names() const;

    // Fails with UnknownPlugin
    Result<PluginHandle> resolve(const std::string& name) const;

private:
    std::map<std::string, PluginFactory> factories_;
};

// Built-in plugin factories
PluginHandle make_nil_plugin();
PluginHandle make_dump_plugin();
PluginHandle make_make_plugin();
PluginHandle make_cmake_plugin();
PluginHandle make_autotools_plugin();

} // namespace strata
