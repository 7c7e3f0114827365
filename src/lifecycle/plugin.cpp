#include <strata/plugin.hpp>
#include <strata/log.hpp>

namespace strata {

static const char* type_index_name(size_t index) {
    switch (index) {
        case 0: return "string";
        case 1: return "boolean";
        case 2: return "integer";
        case 3: return "list";
    }
    return "unknown";
}

Status Plugin::check_schema(const PropertyMap& props,
                            const std::vector<PropertySpec>& schema,
                            const std::string& plugin_name) {
    for (const auto& [key, value] : props) {
        const PropertySpec* spec = nullptr;
        for (const auto& s : schema) {
            if (s.name == key) { spec = &s; break; }
        }
        if (!spec) {
            return StrataError{StrataError::PropertyValidation,
                "unexpected property '" + key + "' for plugin '" + plugin_name + "'"};
        }
        if (value.index() != spec->type_index) {
            return StrataError{StrataError::PropertyValidation,
                "property '" + key + "' must be a " + type_index_name(spec->type_index)
                + ", got " + property_type_name(value)};
        }
    }
    for (const auto& s : schema) {
        if (s.required && props.find(s.name) == props.end()) {
            return StrataError{StrataError::PropertyValidation,
                "missing required property '" + s.name + "' for plugin '" + plugin_name + "'"};
        }
    }
    return ok_status();
}

PluginRegistry PluginRegistry::with_builtins() {
    PluginRegistry reg;
    reg.register_plugin("nil", make_nil_plugin);
    reg.register_plugin("dump", make_dump_plugin);
    reg.register_plugin("make", make_make_plugin);
    reg.register_plugin("cmake", make_cmake_plugin);
    reg.register_plugin("autotools", make_autotools_plugin);
    return reg;
}

void PluginRegistry::register_plugin(const std::string& name, PluginFactory factory) {
    if (factories_.count(name)) {
        log::debug("plugin '%s' replaced", name.c_str());
    }
    factories_[name] = std::move(factory);
}

void PluginRegistry::unregister_plugin(const std::string& name) {
    factories_.erase(name);
}

bool PluginRegistry::has(const std::string& name) const {
    return factories_.count(name) > 0;
}

std::vector<std::string> PluginRegistry::names() const {
    std::vector<std::string> out;
    for (const auto& [name, _] : factories_) out.push_back(name);
    return out;
}

Result<PluginHandle> PluginRegistry::resolve(const std::string& name) const {
    auto it = factories_.find(name);
    if (it == factories_.end()) {
        std::string known;
        for (const auto& [n, _] : factories_) {
            if (!known.empty()) known += ", ";
            known += n;
        }
        return StrataError{StrataError::UnknownPlugin,
            "plugin '" + name + "' is not registered",
            "available plugins: " + known};
    }
    auto plugin = it->second();
    if (!plugin) {
        return StrataError{StrataError::UnknownPlugin,
            "plugin factory for '" + name + "' returned nothing"};
    }
    return Result<PluginHandle>::ok(std::move(plugin));
}

} // namespace strata
