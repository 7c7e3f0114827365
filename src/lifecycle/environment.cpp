#include <strata/environment.hpp>
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace strata {

std::string shell_quote(const std::string& s) {
    if (!s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c))
                || c == '_' || c == '-' || c == '.' || c == '/' || c == '=' || c == ':'
                || c == ',' || c == '+' || c == '@';
        })) {
        return s;
    }
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

static std::string double_quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\' || c == '`') out += '\\';
        out += c;
    }
    out += "\"";
    return out;
}

static std::string join_paths(const std::vector<fs::path>& paths, const std::string& tail) {
    std::string out;
    for (const auto& p : paths) {
        if (!out.empty()) out += ":";
        out += p.string();
    }
    if (!tail.empty()) out += (out.empty() ? "" : ":") + tail;
    return out;
}

static std::string option_var(const std::string& key) {
    std::string out = "STRATA_OPT_";
    for (char c : key) {
        out += std::isalnum(static_cast<unsigned char>(c))
            ? static_cast<char>(std::toupper(static_cast<unsigned char>(c)))
            : '_';
    }
    return out;
}

EnvironmentList step_environment(const Part& part,
                                 Step step,
                                 const PluginContext& ctx,
                                 const ProjectInfo& info,
                                 const Plugin* plugin,
                                 const fs::path& overlay_view) {
    const auto& d = ctx.dirs;
    const fs::path& stage = ctx.stage_dir;
    EnvironmentList env{
        {"STRATA_PART_NAME", part.name},
        {"STRATA_STEP_NAME", step_name(step)},
        {"STRATA_ARCH_TRIPLET", ctx.target_arch},
        {"STRATA_TARGET_ARCH", ctx.target_arch},
        {"STRATA_PARALLEL_BUILD_COUNT", std::to_string(ctx.parallel_build_count)},
        {"STRATA_PROJECT_DIR", info.project_dir.string()},
        {"STRATA_PART_SRC", d.src.string()},
        {"STRATA_PART_SRC_WORK", d.src_work.string()},
        {"STRATA_PART_BUILD", d.build.string()},
        {"STRATA_PART_BUILD_WORK", d.build_work.string()},
        {"STRATA_PART_INSTALL", d.install.string()},
        {"STRATA_STAGE", stage.string()},
        {"STRATA_PRIME", (info.work_dir / "prime").string()},
    };
    if (info.layered && !overlay_view.empty()) {
        env.emplace_back("STRATA_OVERLAY", overlay_view.string());
    }
    for (const auto& [key, value] : ctx.options) {
        env.emplace_back(option_var(key), value);
    }

    std::vector<fs::path> bins;
    for (const auto& root : {d.install, stage}) {
        bins.push_back(root / "usr" / "sbin");
        bins.push_back(root / "usr" / "bin");
        bins.push_back(root / "sbin");
        bins.push_back(root / "bin");
    }
    env.emplace_back("PATH", join_paths(bins, "$PATH"));

    std::string includes = "-isystem " + (stage / "include").string()
                         + " -isystem " + (stage / "usr" / "include").string();
    env.emplace_back("CPPFLAGS", includes);
    env.emplace_back("CFLAGS", includes);
    env.emplace_back("CXXFLAGS", includes);
    env.emplace_back("LDFLAGS", "-L" + (stage / "lib").string()
                              + " -L" + (stage / "usr" / "lib").string());
    env.emplace_back("PKG_CONFIG_PATH", join_paths({
        stage / "lib" / "pkgconfig",
        stage / "usr" / "lib" / "pkgconfig",
        stage / "usr" / "share" / "pkgconfig",
    }, ""));

    if (step == Step::Build && plugin) {
        for (auto& kv : plugin->build_environment(ctx)) env.push_back(std::move(kv));
    }
    if (step == Step::Build) {
        for (const auto& kv : part.build_environment) env.push_back(kv);
    }
    return env;
}

std::string environment_script(const EnvironmentList& env) {
    std::string out;
    for (const auto& [name, value] : env) {
        out += "export " + name + "=" + double_quote(value) + "\n";
    }
    return out;
}

} // namespace strata
