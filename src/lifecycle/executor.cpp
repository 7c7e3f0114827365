#include <strata/executor.hpp>
#include <strata/environment.hpp>
#include <strata/fileset.hpp>
#include <strata/fsutil.hpp>
#include <strata/glob.hpp>
#include <strata/log.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace strata {

static std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& l : lines) {
        out += l;
        out += "\n";
    }
    return out;
}

static void list_outputs(const std::vector<TreeEntry>& entries, StepOutcome& out) {
    for (const auto& e : entries) {
        if (e.kind == EntryKind::Directory) {
            out.directories.push_back(e.path);
        } else {
            out.files.push_back(e.path);
        }
    }
}

StepExecutor::StepExecutor(const PartGraph& graph, const ProjectInfo& info,
                           FilesystemLayout& layout, const OverlayManager& overlay,
                           const SourceRegistry& sources,
                           const std::map<std::string, std::string>& project_vars)
    : graph_(graph), info_(info), layout_(layout), overlay_(overlay), sources_(sources),
      project_vars_(project_vars) {}

PluginContext StepExecutor::plugin_context(const Part& part) const {
    return PluginContext{
        part.name,
        part.properties,
        layout_.part_dirs(part),
        layout_.dirs().stage,
        info_.parallel_build_count,
        info_.target_arch,
        info_.options,
    };
}

fs::path StepExecutor::log_path(const Part& part, Step step) const {
    return layout_.part_dirs(part).run / (std::string(step_name(step)) + ".log");
}

std::vector<fs::path> StepExecutor::layers_below(const std::string& part) const {
    std::vector<fs::path> out;
    for (const auto& name : graph_.topological_order()) {
        if (name == part) break;
        out.push_back(layout_.part_dirs(graph_.part(name)).layer);
    }
    return out;
}

Result<StepOutcome> StepExecutor::run(const Part& part, Step step, const CancelToken* cancel,
                                      bool update) {
    STRATA_TRY(layout_.ensure_project_dirs());
    STRATA_TRY(layout_.ensure_part_dirs(part));
    STRATA_TRY(remove_path(log_path(part, step)));
    vars_set_.clear();

    Result<StepOutcome> r = StrataError{StrataError::InvalidArg, "unknown step"};
    switch (step) {
        case Step::Pull:
            log::info("%s %s", update ? "Updating sources for" : "Pulling", part.name.c_str());
            r = pull(part, cancel, update);
            break;
        case Step::Overlay:
            log::info("Overlaying %s", part.name.c_str());
            r = overlay(part, cancel);
            break;
        case Step::Build:
            log::info("%s %s", update ? "Updating build for" : "Building", part.name.c_str());
            r = build(part, cancel, update);
            break;
        case Step::Stage:
            log::info("Staging %s", part.name.c_str());
            r = merge_step(part, Step::Stage, cancel);
            break;
        case Step::Prime:
            log::info("Priming %s", part.name.c_str());
            r = merge_step(part, Step::Prime, cancel);
            break;
    }
    if (r.is_err()) return std::move(r).at(part.name, step_name(step));
    r.value().project_vars = std::move(vars_set_);
    vars_set_.clear();
    return r;
}

Status StepExecutor::run_script(const Part& part, Step step, const std::string& name,
                                const std::string& body, const fs::path& cwd,
                                const CancelToken* cancel, const fs::path& overlay_view) {
    auto ctx = plugin_context(part);
    const Plugin* plugin = graph_.plugin(part.name).get();
    auto env = step_environment(part, step, ctx, info_, plugin, overlay_view);

    fs::path script = ctx.dirs.run / (name + ".sh");
    fs::path ctl_file = ctx.dirs.run / (name + ".ctl");
    STRATA_TRY(remove_path(ctl_file));
    STRATA_TRY(write_file(script, "#!/bin/sh\nset -e\n\n" + environment_script(env)
                                  + "\n" + ctl_prologue(ctl_file) + "\n" + body));

    std::error_code ec;
    fs::create_directories(cwd, ec);

    CommandOptions opts;
    opts.working_dir = cwd.string();
    opts.timeout_seconds = info_.step_timeout;
    opts.cancel = cancel;
    opts.log_file = log_path(part, step);

    log::debug("%s: running %s in %s", part.name.c_str(), script.c_str(), cwd.c_str());
    auto r = run_command({"/bin/sh", script.string()}, opts);
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return StrataError{StrataError::StepExecution,
            "script '" + name + "' exited with status " + std::to_string(r.value().exit_code),
            "see " + opts.log_file.string()};
    }
    return read_ctl_file(part, ctl_file);
}

std::string StepExecutor::ctl_prologue(const fs::path& ctl_file) const {
    std::map<std::string, std::string> current = project_vars_;
    for (const auto& [k, v] : vars_set_) current[k] = v;

    std::string out;
    out += "STRATA_CTL_FILE=" + shell_quote(ctl_file.string()) + "\n";
    out += "export STRATA_CTL_FILE\n";
    out += "strata_ctl() {\n";
    out += "    case \"$1\" in\n";
    out += "        set)\n";
    out += "            case \"$2\" in\n";
    out += "                ?*=*) printf 'set %s\\n' \"$2\" >> \"$STRATA_CTL_FILE\" ;;\n";
    out += "                *) echo \"strata_ctl: set expects NAME=VALUE\" >&2; return 2 ;;\n";
    out += "            esac ;;\n";
    out += "        get)\n";
    out += "            if [ -f \"$STRATA_CTL_FILE\" ] && grep -q \"^set $2=\" \"$STRATA_CTL_FILE\"; then\n";
    out += "                sed -n \"s/^set $2=//p\" \"$STRATA_CTL_FILE\" | tail -n 1\n";
    out += "                return 0\n";
    out += "            fi\n";
    out += "            case \"$2\" in\n";
    for (const auto& [k, v] : current) {
        out += "                " + shell_quote(k) + ") printf '%s\\n' " + shell_quote(v) + " ;;\n";
    }
    out += "                *) echo \"strata_ctl: unknown project variable '$2'\" >&2; return 1 ;;\n";
    out += "            esac ;;\n";
    out += "        *) echo \"strata_ctl: unknown command '$1'\" >&2; return 2 ;;\n";
    out += "    esac\n";
    out += "}\n";
    return out;
}

Status StepExecutor::read_ctl_file(const Part& part, const fs::path& ctl_file) {
    std::error_code ec;
    if (!fs::exists(ctl_file, ec)) return ok_status();

    std::ifstream in(ctl_file);
    if (!in) {
        return StrataError{StrataError::IO, "cannot read " + ctl_file.string()};
    }
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        auto eq = line.find('=');
        if (line.compare(0, 4, "set ") != 0 || eq == std::string::npos || eq == 4) {
            return StrataError{StrataError::StepExecution,
                "malformed strata_ctl request '" + line + "'"};
        }
        std::string name = line.substr(4, eq - 4);
        if (!project_vars_.count(name)) {
            return StrataError{StrataError::StepExecution,
                "unknown project variable '" + name + "'",
                "declare it under [project_vars]"};
        }
        if (!info_.project_vars_part.empty() && info_.project_vars_part != part.name) {
            return StrataError{StrataError::StepExecution,
                "project variable '" + name + "' can only be set by part '"
                + info_.project_vars_part + "'"};
        }
        vars_set_[name] = line.substr(eq + 1);
        log::debug("%s: project variable %s set", part.name.c_str(), name.c_str());
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Pull
// ---------------------------------------------------------------------------

Result<StepOutcome> StepExecutor::pull(const Part& part, const CancelToken* cancel,
                                       bool update) {
    auto dirs = layout_.part_dirs(part);
    const StepOverride* ov = part.override_for(Step::Pull);
    auto commands = graph_.plugin(part.name)->pull_commands(plugin_context(part));

    bool in_place = false;
    if (update && !ov && commands.empty()) {
        auto handler = sources_.resolve(part.source);
        if (handler.is_err()) return std::move(handler).error();
        in_place = handler.value() && handler.value()->supports_update();
    }
    if (in_place) {
        std::error_code ec;
        fs::create_directories(dirs.src, ec);
    } else {
        STRATA_TRY(reset_dir(dirs.src));
    }

    StepOutcome out;
    if (ov && ov->mode == OverrideMode::Prepend) {
        STRATA_TRY(run_script(part, Step::Pull, "pull-prepend", ov->script, dirs.src, cancel));
    }

    if (ov && ov->mode == OverrideMode::Replace) {
        STRATA_TRY(run_script(part, Step::Pull, "pull", ov->script, dirs.src, cancel));
    } else {
        if (!commands.empty()) {
            STRATA_TRY(run_script(part, Step::Pull, "pull", join_lines(commands),
                                  dirs.src, cancel));
        } else {
            auto handler = sources_.resolve(part.source);
            if (handler.is_err()) return std::move(handler).error();
            if (handler.value()) {
                auto snap = handler.value()->pull(part, info_, dirs.src, cancel);
                if (snap.is_err()) return std::move(snap).error();
                out.source_identity = snap.value().identity;
                out.details = std::move(snap.value().details);
            }
        }
    }

    if (ov && ov->mode == OverrideMode::Append) {
        STRATA_TRY(run_script(part, Step::Pull, "pull-append", ov->script, dirs.src, cancel));
    }
    return Result<StepOutcome>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Overlay
// ---------------------------------------------------------------------------

Result<StepOutcome> StepExecutor::overlay(const Part& part, const CancelToken* cancel) {
    auto dirs = layout_.part_dirs(part);
    fs::path root = overlay_.view_root(part.name);
    fs::path lower = root / "lower";
    fs::path upper = root / "upper";

    STRATA_TRY(overlay_.materialize(layers_below(part.name), lower));
    STRATA_TRY(reset_dir(upper));
    STRATA_TRY(copy_tree(lower, upper));

    if (const StepOverride* ov = part.override_for(Step::Overlay)) {
        STRATA_TRY(run_script(part, Step::Overlay, "overlay", ov->script, upper, cancel, upper));
    }

    STRATA_TRY(overlay_.capture(lower, upper, dirs.layer));
    STRATA_TRY(remove_path(root));

    auto entries = list_tree(dirs.layer);
    if (entries.is_err()) return std::move(entries).error();
    StepOutcome out;
    list_outputs(entries.value(), out);
    return Result<StepOutcome>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Build
// ---------------------------------------------------------------------------

Result<StepOutcome> StepExecutor::build(const Part& part, const CancelToken* cancel,
                                        bool update) {
    auto dirs = layout_.part_dirs(part);
    const auto& plugin = graph_.plugin(part.name);

    // An update keeps the previous build tree, objects and all
    if (!update) STRATA_TRY(reset_dir(dirs.build));
    STRATA_TRY(reset_dir(dirs.install));
    if (!plugin->out_of_source_build()) {
        STRATA_TRY(copy_tree(dirs.src, dirs.build));
    }

    fs::path view;
    if (info_.layered) {
        auto layers = layers_below(part.name);
        layers.push_back(dirs.layer);
        view = overlay_.view_root(part.name) / "view";
        STRATA_TRY(overlay_.materialize(layers, view));
    }

    std::string body;
    const StepOverride* ov = part.override_for(Step::Build);
    if (ov && ov->mode == OverrideMode::Prepend) body += ov->script + "\n";
    if (ov && ov->mode == OverrideMode::Replace) {
        body += ov->script + "\n";
    } else {
        body += join_lines(plugin->build_commands(plugin_context(part)));
    }
    if (ov && ov->mode == OverrideMode::Append) body += ov->script + "\n";

    auto status = run_script(part, Step::Build, "build", body, dirs.build_work, cancel, view);
    if (!view.empty()) {
        STRATA_TRY(remove_path(overlay_.view_root(part.name)));
    }
    STRATA_TRY(status);
    STRATA_TRY(organize(part));

    auto entries = list_tree(dirs.install);
    if (entries.is_err()) return std::move(entries).error();
    StepOutcome out;
    list_outputs(entries.value(), out);
    return Result<StepOutcome>::ok(std::move(out));
}

Status StepExecutor::organize(const Part& part) {
    if (part.organize.empty()) return ok_status();
    fs::path install = layout_.part_dirs(part).install;

    // Literal keys before globs
    std::vector<std::string> keys;
    for (const auto& kv : part.organize) keys.push_back(kv.first);
    std::stable_sort(keys.begin(), keys.end(), [](const std::string& a, const std::string& b) {
        return !glob_has_magic(a) && glob_has_magic(b);
    });

    for (const auto& key : keys) {
        std::string dest = part.organize.at(key);
        while (!dest.empty() && dest.front() == '/') dest.erase(0, 1);
        bool into = !dest.empty() && dest.back() == '/';
        fs::path dst = install / dest;

        auto matches = glob_expand(key, install);
        if (matches.is_err()) return std::move(matches).error();
        const auto& found = matches.value();

        for (const auto& m : found) {
            fs::path src = install / m;
            std::error_code ec;

            if (!glob_has_magic(key) && fs::is_directory(fs::symlink_status(src, ec))) {
                STRATA_TRY(copy_tree(src, dst));
                STRATA_TRY(remove_path(src));
                continue;
            }

            bool dst_is_dir = into || fs::is_directory(fs::symlink_status(dst, ec));
            fs::path target = dst_is_dir ? dst / src.filename() : dst;
            if (fs::exists(fs::symlink_status(target, ec))) {
                if (!dst_is_dir && found.size() > 1) {
                    return StrataError{StrataError::StepExecution,
                        "multiple files to be organized into '" + dest + "'",
                        "if this is supposed to be a directory, end it with a slash"};
                }
                return StrataError{StrataError::StepExecution,
                    "trying to organize file '" + key + "' to '" + dest
                    + "', but '" + fs::relative(target, install).string() + "' already exists"};
            }

            fs::create_directories(target.parent_path(), ec);
            fs::rename(src, target, ec);
            if (ec) {
                return StrataError{StrataError::IO,
                    "cannot organize " + m + " to " + dest + ": " + ec.message()};
            }
            log::debug("%s: organized %s -> %s", part.name.c_str(), m.c_str(),
                       fs::relative(target, install).c_str());
        }
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Stage / Prime
// ---------------------------------------------------------------------------

static Selection without_whiteouts(const Selection& sel) {
    Selection out;
    out.dirs = sel.dirs;
    for (const auto& f : sel.files) {
        auto slash = f.rfind('/');
        std::string name = slash == std::string::npos ? f : f.substr(slash + 1);
        if (!is_whiteout(name)) out.files.insert(f);
    }
    return out;
}

Result<StepOutcome> StepExecutor::merge_step(const Part& part, Step step,
                                             const CancelToken* cancel) {
    const Area area = step == Step::Stage ? Area::Stage : Area::Prime;
    const fs::path area_dir = layout_.area_dir(area);
    auto dirs = layout_.part_dirs(part);

    auto lock = layout_.lock(area);
    if (lock.is_err()) return std::move(lock).error();

    // Re-merging starts from a clean slate for this part
    STRATA_TRY(layout_.clean_area(area, part));

    const StepOverride* ov = part.override_for(step);

    auto run_override = [&](const std::string& name) -> Status {
        auto before = snapshot_tree(area_dir);
        if (before.is_err()) return std::move(before).error();
        STRATA_TRY(run_script(part, step, name, ov->script, area_dir, cancel));
        auto after = snapshot_tree(area_dir);
        if (after.is_err()) return std::move(after).error();

        std::vector<std::string> touched;
        for (const auto& [path, digest] : after.value()) {
            auto it = before.value().find(path);
            if (it == before.value().end() || it->second != digest) touched.push_back(path);
        }
        return layout_.adopt(area, part, step, touched);
    };

    auto builtin = [&]() -> Status {
        if (step == Step::Stage) {
            Fileset stage_set(part.stage_files, "stage");
            STRATA_TRY(stage_set.validate());
            if (info_.layered) {
                Fileset overlay_set(part.overlay_files, "overlay");
                STRATA_TRY(overlay_set.validate());
                auto layer_sel = select_files(overlay_set, dirs.layer);
                if (layer_sel.is_err()) return std::move(layer_sel).error();
                STRATA_TRY(layout_.merge(area, part, step, without_whiteouts(layer_sel.value()),
                                         MergeSource{dirs.layer, Step::Overlay}));
            }
            auto sel = select_files(stage_set, dirs.install);
            if (sel.is_err()) return std::move(sel).error();
            return layout_.merge(area, part, step, sel.value(),
                                 MergeSource{dirs.install, Step::Build});
        }

        Fileset prime_set(part.prime_files, "prime");
        STRATA_TRY(prime_set.validate());
        STRATA_TRY(prime_set.combine(Fileset(part.stage_files, "stage")));
        auto staged = layout_.claimed(Area::Stage, part.name);
        if (staged.is_err()) return std::move(staged).error();
        Selection sel = filter_selection(prime_set, staged.value());
        STRATA_TRY(layout_.merge(area, part, step, sel,
                                 MergeSource{layout_.dirs().stage, Step::Build}));
        return layout_.fix_permissions(sel);
    };

    const std::string name = step_name(step);
    if (ov && ov->mode == OverrideMode::Prepend) {
        STRATA_TRY(run_override(name + "-prepend"));
    }
    if (!ov || ov->mode != OverrideMode::Replace) {
        STRATA_TRY(builtin());
    } else {
        STRATA_TRY(run_override(name));
    }
    if (ov && ov->mode == OverrideMode::Append) {
        STRATA_TRY(run_override(name + "-append"));
    }

    auto claimed = layout_.claimed(area, part.name);
    if (claimed.is_err()) return std::move(claimed).error();
    StepOutcome out;
    out.files.assign(claimed.value().files.begin(), claimed.value().files.end());
    out.directories.assign(claimed.value().dirs.begin(), claimed.value().dirs.end());
    return Result<StepOutcome>::ok(std::move(out));
}

} // namespace strata
