#include <strata/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace strata {

Result<unsigned> parse_mode(const std::string& text) {
    if (text.empty() || text.size() > 4) {
        return StrataError{StrataError::Config,
            "invalid file mode '" + text + "'", "use an octal mode such as \"755\""};
    }
    unsigned mode = 0;
    for (char c : text) {
        if (c < '0' || c > '7') {
            return StrataError{StrataError::Config,
                "invalid file mode '" + text + "'", "use an octal mode such as \"755\""};
        }
        mode = mode * 8 + static_cast<unsigned>(c - '0');
    }
    return Result<unsigned>::ok(mode);
}

static Result<std::vector<std::string>> string_list(const toml::node& node,
                                                    const std::string& key) {
    std::vector<std::string> out;
    auto arr = node.as_array();
    if (!arr) {
        return StrataError{StrataError::Config, "'" + key + "' must be an array of strings"};
    }
    for (const auto& el : *arr) {
        auto s = el.value<std::string>();
        if (!s) {
            return StrataError{StrataError::Config, "'" + key + "' must be an array of strings"};
        }
        out.push_back(*s);
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return StrataError{StrataError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [project]
    if (auto project = doc["project"].as_table()) {
        if (auto v = (*project)["work_dir"].value<std::string>())
            cfg.work_dir = *v;
        if (auto v = (*project)["parallel_build_count"].value<int64_t>()) {
            if (*v < 1) {
                return StrataError{StrataError::Config,
                    "parallel_build_count must be at least 1"};
            }
            cfg.parallel_build_count = static_cast<int>(*v);
        }
        if (auto v = (*project)["target_arch"].value<std::string>())
            cfg.target_arch = *v;
        if (auto v = (*project)["vars_part"].value<std::string>())
            cfg.project_vars_part = *v;
    }

    // [project_vars]
    if (auto vars = doc["project_vars"].as_table()) {
        for (const auto& [key, val] : *vars) {
            auto s = val.value<std::string>();
            if (!s) {
                return StrataError{StrataError::Config,
                    "project variable '" + std::string(key) + "' must be a string"};
            }
            cfg.project_vars[std::string(key)] = *s;
        }
    }

    // [options]
    if (auto options = doc["options"].as_table()) {
        for (const auto& [key, val] : *options) {
            if (auto s = val.value<std::string>()) {
                cfg.options[std::string(key)] = *s;
            } else if (auto b = val.value<bool>()) {
                cfg.options[std::string(key)] = *b ? "true" : "false";
            } else if (auto i = val.value<int64_t>()) {
                cfg.options[std::string(key)] = std::to_string(*i);
            } else {
                return StrataError{StrataError::Config,
                    "option '" + std::string(key) + "' must be a string, bool or integer"};
            }
        }
    }

    // [log]
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.log_level = lvl.value();
        }
        if (auto v = (*lg)["color"].value<std::string>()) {
            if (*v != "auto" && *v != "always" && *v != "never") {
                return StrataError{StrataError::Config,
                    "invalid log color '" + *v + "'", "expected auto, always or never"};
            }
            cfg.log_color = *v;
        }
    }

    // [build]
    if (auto build = doc["build"].as_table()) {
        if (auto v = (*build)["timeout"].value<int64_t>()) {
            if (*v < 0) {
                return StrataError{StrataError::Config, "build timeout cannot be negative"};
            }
            cfg.build_timeout = static_cast<int>(*v);
        }
    }

    // [stage]
    if (auto stage = doc["stage"].as_table()) {
        if (auto node = stage->get("overwrite")) {
            auto list = string_list(*node, "stage.overwrite");
            if (list.is_err()) return std::move(list).error();
            cfg.stage_overwrite = std::move(list).value();
        }
    }

    // [prime]
    if (auto prime = doc["prime"].as_table()) {
        if (auto v = (*prime)["normalize_permissions"].value<bool>())
            cfg.normalize_permissions = *v;
    }

    // [[permissions]]
    if (auto perms = doc["permissions"].as_array()) {
        std::vector<PermissionRule> rules;
        for (const auto& el : *perms) {
            auto tbl = el.as_table();
            if (!tbl) {
                return StrataError{StrataError::Config,
                    "each [[permissions]] entry must be a table"};
            }
            auto path = (*tbl)["path"].value<std::string>();
            auto mode = (*tbl)["mode"].value<std::string>();
            if (!path || !mode) {
                return StrataError{StrataError::Config,
                    "[[permissions]] entries need 'path' and 'mode'"};
            }
            auto m = parse_mode(*mode);
            if (m.is_err()) return std::move(m).error();
            rules.push_back(PermissionRule{*path, m.value()});
        }
        cfg.permissions = std::move(rules);
    }

    // [overlay]
    if (auto overlay = doc["overlay"].as_table()) {
        if (auto v = (*overlay)["enabled"].value<bool>())
            cfg.overlay_enabled = *v;
        if (auto v = (*overlay)["base"].value<std::string>())
            cfg.overlay_base = *v;
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return StrataError{StrataError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        cfg.error().hint = "in " + path;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.work_dir) work_dir = other.work_dir;
    if (other.parallel_build_count) parallel_build_count = other.parallel_build_count;
    if (other.target_arch) target_arch = other.target_arch;
    for (const auto& [k, v] : other.options) {
        options[k] = v;
    }
    for (const auto& [k, v] : other.project_vars) {
        project_vars[k] = v;
    }
    if (other.project_vars_part) project_vars_part = other.project_vars_part;
    if (other.log_level) log_level = other.log_level;
    if (other.log_color) log_color = other.log_color;
    if (other.build_timeout) build_timeout = other.build_timeout;
    if (other.stage_overwrite) stage_overwrite = other.stage_overwrite;
    if (other.normalize_permissions) normalize_permissions = other.normalize_permissions;
    if (other.permissions) permissions = other.permissions;
    if (other.overlay_enabled) overlay_enabled = other.overlay_enabled;
    if (other.overlay_base) overlay_base = other.overlay_base;
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

static std::string host_arch() {
#if defined(__x86_64__)
    return "amd64";
#elif defined(__aarch64__)
    return "arm64";
#elif defined(__arm__)
    return "armhf";
#elif defined(__riscv)
    return "riscv64";
#elif defined(__powerpc64__)
    return "ppc64el";
#elif defined(__s390x__)
    return "s390x";
#else
    return "unknown";
#endif
}

ProjectInfo Config::project_info(const fs::path& project_dir) const {
    ProjectInfo info;
    info.project_dir = project_dir;

    fs::path wd = work_dir.value_or(".");
    info.work_dir = wd.is_absolute() ? wd : (project_dir / wd).lexically_normal();

    if (parallel_build_count) {
        info.parallel_build_count = *parallel_build_count;
    } else {
        unsigned hc = std::thread::hardware_concurrency();
        info.parallel_build_count = hc > 0 ? static_cast<int>(hc) : 1;
    }
    info.target_arch = target_arch.value_or(host_arch());
    info.options = options;
    info.step_timeout = build_timeout.value_or(0);
    info.overwrite_parts = stage_overwrite.value_or(std::vector<std::string>{});
    info.normalize_permissions = normalize_permissions.value_or(true);
    info.permissions = permissions.value_or(std::vector<PermissionRule>{});
    info.layered = overlay_enabled.value_or(false);
    if (overlay_base) {
        fs::path base = *overlay_base;
        info.overlay_base = base.is_absolute() ? base : (project_dir / base).lexically_normal();
    }
    info.project_vars = project_vars;
    info.project_vars_part = project_vars_part.value_or("");
    return info;
}

void Config::apply_logging() const {
    if (log_level) log::set_level(*log_level);
    if (log_color == "always") {
        log::set_color_enabled(true);
    } else if (log_color == "never") {
        log::set_color_enabled(false);
    } else {
        log::set_color_enabled(isatty(fileno(log::get_stream())) != 0);
    }
}

std::string global_config_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::string(xdg) + "/strata/config.toml";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/strata/config.toml";
}

} // namespace strata
