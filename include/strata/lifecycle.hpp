#pragma once

#include <strata/action.hpp>
#include <strata/callbacks.hpp>
#include <strata/config.hpp>
#include <strata/executor.hpp>
#include <strata/layout.hpp>
#include <strata/overlay.hpp>
#include <strata/part_graph.hpp>
#include <strata/planner.hpp>
#include <strata/plugin.hpp>
#include <strata/process.hpp>
#include <strata/source.hpp>
#include <strata/state_store.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace strata {

enum class ActionStatus { Succeeded, Failed, Cancelled, NotStarted };

const char* action_status_name(ActionStatus status);

struct ActionResult {
    Action action;
    ActionStatus status = ActionStatus::NotStarted;
    std::optional<StrataError> error;
};

// Per-action outcome of an execute() call, in action order
struct ExecutionReport {
    std::vector<ActionResult> results;
    // A prologue or epilogue failure, which belongs to no single action
    std::optional<StrataError> error;

    bool ok() const;
    size_t count(ActionStatus status) const;

    // The first error, or ok when every action succeeded
    Status status() const;
};

// Command-level entry point: owns the graph, the state store and the
// on-disk layout for one project and runs planned actions against them.
class LifecycleManager {
public:
    // All validation happens here, before anything on disk is touched:
    // part names and dependencies, plugins and their properties, sources.
    static Result<std::unique_ptr<LifecycleManager>> create(
        std::vector<Part> parts,
        ProjectInfo info,
        PluginRegistry plugins = PluginRegistry::with_builtins(),
        SourceRegistry sources = SourceRegistry::with_builtins());

    LifecycleManager(const LifecycleManager&) = delete;
    LifecycleManager& operator=(const LifecycleManager&) = delete;

    const PartGraph& graph() const { return graph_; }
    const ProjectInfo& info() const { return info_; }
    const ProjectDirs& dirs() const { return layout_.dirs(); }

    CallbackRegistry& callbacks() { return callbacks_; }

    // Declared project variables with the values steps have set so far
    const std::map<std::string, std::string>& project_vars() const { return project_vars_; }

    Result<std::vector<Action>> plan(Step target,
                                     const std::vector<std::string>& names = {},
                                     bool rerun = false);

    // Runs actions in order and stops at the first failure or cancellation.
    // State is written after each successful action only. Prologue callbacks
    // run first; epilogue callbacks run last, even after a failure.
    ExecutionReport execute(const std::vector<Action>& actions,
                            const CancelToken* cancel = nullptr);

    // Remove the outputs of `step` and every later step of the named parts
    // (all parts when empty) and invalidate everything downstream
    Status clean(Step step = Step::Pull, const std::vector<std::string>& names = {});

    // Drop the recorded state of (part, step) and all its consumers
    Status invalidate(const std::string& part, Step step);

    Result<std::optional<StepState>> get_state(const std::string& part, Step step);

    Result<std::optional<DirtyReport>> explain(const std::string& part, Step step);

    // Host packages the named parts' plugins expect, sorted and unique
    Result<std::vector<std::string>> build_packages(const std::vector<std::string>& names = {}) const;

private:
    LifecycleManager(PartGraph graph, ProjectInfo info, SourceRegistry sources);

    Status execute_action(const Action& action, const CancelToken* cancel);
    StepInfo step_info(const Part& part, Step step) const;
    Status restore_project_vars();
    Status check_prerequisites(const Part& part, Step step);
    Status clean_part(const Part& part, Step from);
    Status invalidate_closure(const std::string& part, Step step);
    Status check_step(Step step) const;
    Status check_part(const std::string& name) const;

    PartGraph graph_;
    ProjectInfo info_;
    SourceRegistry sources_;
    CallbackRegistry callbacks_;
    std::map<std::string, std::string> project_vars_;
    StateStore store_;
    OverlayManager overlay_;
    FilesystemLayout layout_;
    ActionPlanner planner_;
    StepExecutor executor_;
};

} // namespace strata
