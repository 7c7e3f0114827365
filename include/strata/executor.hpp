#pragma once

#include <strata/config.hpp>
#include <strata/layout.hpp>
#include <strata/overlay.hpp>
#include <strata/part_graph.hpp>
#include <strata/plugin.hpp>
#include <strata/process.hpp>
#include <strata/source.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace strata {

// What a step produced, recorded into its StepState
struct StepOutcome {
    std::vector<std::string> files;
    std::vector<std::string> directories;
    std::map<std::string, std::string> details;
    // Identity of the sources a pull actually fetched
    std::optional<std::string> source_identity;
    // Project variables the step's scripts set through strata_ctl
    std::map<std::string, std::string> project_vars;
};

// Runs one lifecycle step of one part inside the managed directories.
// Knows nothing about planning or step state.
class StepExecutor {
public:
    StepExecutor(const PartGraph& graph, const ProjectInfo& info,
                 FilesystemLayout& layout, const OverlayManager& overlay,
                 const SourceRegistry& sources,
                 const std::map<std::string, std::string>& project_vars);

    // With `update`, pull refreshes the existing src tree when the source
    // handler allows it and build keeps its build tree
    Result<StepOutcome> run(const Part& part, Step step, const CancelToken* cancel,
                            bool update = false);

    PluginContext plugin_context(const Part& part) const;

    // parts/<name>/run/<step>.log
    std::filesystem::path log_path(const Part& part, Step step) const;

private:
    Result<StepOutcome> pull(const Part& part, const CancelToken* cancel, bool update);
    Result<StepOutcome> overlay(const Part& part, const CancelToken* cancel);
    Result<StepOutcome> build(const Part& part, const CancelToken* cancel, bool update);
    Result<StepOutcome> merge_step(const Part& part, Step step, const CancelToken* cancel);

    // Write run/<name>.sh (environment prologue plus body) and run it
    Status run_script(const Part& part, Step step, const std::string& name,
                      const std::string& body, const std::filesystem::path& cwd,
                      const CancelToken* cancel,
                      const std::filesystem::path& overlay_view = {});

    // Shell function strata_ctl for scripts: `set NAME=VALUE`, `get NAME`
    std::string ctl_prologue(const std::filesystem::path& ctl_file) const;
    Status read_ctl_file(const Part& part, const std::filesystem::path& ctl_file);

    Status organize(const Part& part);

    // Layer directories of every part below `part`, bottom first
    std::vector<std::filesystem::path> layers_below(const std::string& part) const;

    const PartGraph& graph_;
    const ProjectInfo& info_;
    FilesystemLayout& layout_;
    const OverlayManager& overlay_;
    const SourceRegistry& sources_;
    const std::map<std::string, std::string>& project_vars_;
    std::map<std::string, std::string> vars_set_;   // by the step in progress
};

} // namespace strata
