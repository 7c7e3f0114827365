#pragma once

#include <strata/config.hpp>
#include <strata/dirs.hpp>
#include <strata/result.hpp>
#include <strata/step.hpp>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace strata {

// What a step callback gets to see about the step being run
struct StepInfo {
    std::string part_name;
    Step step;
    const ProjectInfo& project;
    PartDirs dirs;
    const std::map<std::string, std::string>& project_vars;
};

using StepCallback = std::function<Status(const StepInfo&)>;
using ExecutionCallback = std::function<Status(const ProjectInfo&)>;

enum class HookPoint { PreStep, PostStep };

// Application hooks around execute(). Callbacks run in registration order;
// an error from a step callback fails the action it surrounds.
class CallbackRegistry {
public:
    // `steps` limits the hook to those steps; empty means every step.
    // Names are unique per hook point (Duplicate otherwise).
    Status register_pre_step(const std::string& name, StepCallback fn,
                             std::vector<Step> steps = {});
    Status register_post_step(const std::string& name, StepCallback fn,
                              std::vector<Step> steps = {});

    // Run once before the first and once after the last action of execute()
    Status register_prologue(const std::string& name, ExecutionCallback fn);
    Status register_epilogue(const std::string& name, ExecutionCallback fn);

    void unregister_all();
    bool empty() const;

    Status run_step_hooks(HookPoint point, const StepInfo& info) const;
    Status run_prologue(const ProjectInfo& info) const;
    Status run_epilogue(const ProjectInfo& info) const;

private:
    struct StepHook {
        std::string name;
        HookPoint point;
        std::vector<Step> steps;
        StepCallback fn;
    };
    struct ExecutionHook {
        std::string name;
        ExecutionCallback fn;
    };

    Status add_step_hook(StepHook hook);
    static Status add_execution_hook(std::vector<ExecutionHook>& hooks, const char* kind,
                                     ExecutionHook hook);
    static Status run_execution_hooks(const std::vector<ExecutionHook>& hooks,
                                      const char* kind, const ProjectInfo& info);

    std::vector<StepHook> step_hooks_;
    std::vector<ExecutionHook> prologue_;
    std::vector<ExecutionHook> epilogue_;
};

const char* hook_point_name(HookPoint point);

} // namespace strata
