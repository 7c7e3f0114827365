#include <strata/part.hpp>
#include <algorithm>
#include <cctype>

namespace strata {

std::string property_to_string(const PropertyValue& value) {
    if (auto s = std::get_if<std::string>(&value)) return *s;
    if (auto b = std::get_if<bool>(&value)) return *b ? "true" : "false";
    if (auto i = std::get_if<int64_t>(&value)) return std::to_string(*i);
    const auto& list = std::get<std::vector<std::string>>(value);
    std::string out = "[";
    for (size_t i = 0; i < list.size(); ++i) {
        if (i > 0) out += ", ";
        out += list[i];
    }
    out += "]";
    return out;
}

const char* property_type_name(const PropertyValue& value) {
    switch (value.index()) {
        case 0: return "string";
        case 1: return "boolean";
        case 2: return "integer";
        case 3: return "list";
    }
    return "unknown";
}

template<typename T>
static std::optional<T> get_typed(const PropertyMap& props, const std::string& key) {
    auto it = props.find(key);
    if (it == props.end()) return std::nullopt;
    if (auto v = std::get_if<T>(&it->second)) return *v;
    return std::nullopt;
}

std::optional<std::string> get_string(const PropertyMap& props, const std::string& key) {
    return get_typed<std::string>(props, key);
}

std::optional<bool> get_bool(const PropertyMap& props, const std::string& key) {
    return get_typed<bool>(props, key);
}

std::optional<int64_t> get_int(const PropertyMap& props, const std::string& key) {
    return get_typed<int64_t>(props, key);
}

std::optional<std::vector<std::string>> get_list(const PropertyMap& props,
                                                 const std::string& key) {
    return get_typed<std::vector<std::string>>(props, key);
}

const char* override_mode_name(OverrideMode mode) {
    switch (mode) {
        case OverrideMode::Replace: return "replace";
        case OverrideMode::Prepend: return "prepend";
        case OverrideMode::Append:  return "append";
    }
    return "unknown";
}

const StepOverride* Part::override_for(Step step) const {
    auto it = overrides.find(step);
    return it == overrides.end() ? nullptr : &it->second;
}

static void put_override(PropertyMap& out, const Part& part, Step step) {
    std::string key = std::string("override-") + step_name(step);
    if (auto ov = part.override_for(step)) {
        out[key] = std::string(override_mode_name(ov->mode)) + ":" + ov->script;
    }
}

PropertyMap Part::properties_of_interest(
    Step step,
    const std::vector<std::string>& plugin_pull_properties,
    bool layered) const
{
    PropertyMap out;
    switch (step) {
        case Step::Pull:
            out["plugin"] = plugin_name();
            out["source"] = source.location;
            out["source-type"] = source.type;
            out["source-commit"] = source.commit;
            out["source-tag"] = source.tag;
            out["source-branch"] = source.branch;
            for (const auto& key : plugin_pull_properties) {
                auto it = properties.find(key);
                if (it != properties.end()) out[key] = it->second;
            }
            put_override(out, *this, Step::Pull);
            break;

        case Step::Overlay:
            out["overlay"] = overlay_files;
            put_override(out, *this, Step::Overlay);
            break;

        case Step::Build: {
            out["after"] = after;
            out["plugin"] = plugin_name();
            out["source-subdir"] = source.subdir;
            for (const auto& [key, value] : properties) {
                out[key] = value;
            }
            std::vector<std::string> env;
            for (const auto& [k, v] : build_environment) env.push_back(k + "=" + v);
            out["build-environment"] = env;
            std::vector<std::string> org;
            for (const auto& [k, v] : organize) org.push_back(k + "=" + v);
            out["organize"] = org;
            put_override(out, *this, Step::Build);
            break;
        }

        case Step::Stage:
            out["stage"] = stage_files;
            if (layered) out["overlay"] = overlay_files;
            put_override(out, *this, Step::Stage);
            break;

        case Step::Prime:
            out["prime"] = prime_files;
            put_override(out, *this, Step::Prime);
            break;
    }
    return out;
}

Status validate_part_name(const std::string& name) {
    if (name.empty()) {
        return StrataError{StrataError::InvalidArg, "empty part name"};
    }
    if (name[0] == '.') {
        return StrataError{StrataError::InvalidArg,
            "invalid part name '" + name + "'",
            "part names cannot start with '.'"};
    }
    for (char c : name) {
        if (c == '/' || std::isspace(static_cast<unsigned char>(c))) {
            return StrataError{StrataError::InvalidArg,
                "invalid character in part name '" + name + "'",
                "part names cannot contain '/' or whitespace"};
        }
    }
    return ok_status();
}

} // namespace strata
