#include <strata/callbacks.hpp>
#include <strata/log.hpp>

#include <algorithm>

namespace strata {

const char* hook_point_name(HookPoint point) {
    switch (point) {
        case HookPoint::PreStep:  return "pre-step";
        case HookPoint::PostStep: return "post-step";
    }
    return "unknown";
}

Status CallbackRegistry::register_pre_step(const std::string& name, StepCallback fn,
                                           std::vector<Step> steps) {
    return add_step_hook(StepHook{name, HookPoint::PreStep, std::move(steps), std::move(fn)});
}

Status CallbackRegistry::register_post_step(const std::string& name, StepCallback fn,
                                            std::vector<Step> steps) {
    return add_step_hook(StepHook{name, HookPoint::PostStep, std::move(steps), std::move(fn)});
}

Status CallbackRegistry::register_prologue(const std::string& name, ExecutionCallback fn) {
    return add_execution_hook(prologue_, "prologue", ExecutionHook{name, std::move(fn)});
}

Status CallbackRegistry::register_epilogue(const std::string& name, ExecutionCallback fn) {
    return add_execution_hook(epilogue_, "epilogue", ExecutionHook{name, std::move(fn)});
}

Status CallbackRegistry::add_step_hook(StepHook hook) {
    if (!hook.fn) {
        return StrataError{StrataError::InvalidArg,
            std::string(hook_point_name(hook.point)) + " callback '" + hook.name + "' is empty"};
    }
    for (const auto& h : step_hooks_) {
        if (h.point == hook.point && h.name == hook.name) {
            return StrataError{StrataError::Duplicate,
                std::string(hook_point_name(hook.point)) + " callback '" + hook.name
                + "' is already registered"};
        }
    }
    log::debug("registered %s callback '%s'", hook_point_name(hook.point), hook.name.c_str());
    step_hooks_.push_back(std::move(hook));
    return ok_status();
}

Status CallbackRegistry::add_execution_hook(std::vector<ExecutionHook>& hooks, const char* kind,
                                            ExecutionHook hook) {
    if (!hook.fn) {
        return StrataError{StrataError::InvalidArg,
            std::string(kind) + " callback '" + hook.name + "' is empty"};
    }
    for (const auto& h : hooks) {
        if (h.name == hook.name) {
            return StrataError{StrataError::Duplicate,
                std::string(kind) + " callback '" + hook.name + "' is already registered"};
        }
    }
    hooks.push_back(std::move(hook));
    return ok_status();
}

void CallbackRegistry::unregister_all() {
    step_hooks_.clear();
    prologue_.clear();
    epilogue_.clear();
}

bool CallbackRegistry::empty() const {
    return step_hooks_.empty() && prologue_.empty() && epilogue_.empty();
}

Status CallbackRegistry::run_step_hooks(HookPoint point, const StepInfo& info) const {
    for (const auto& h : step_hooks_) {
        if (h.point != point) continue;
        if (!h.steps.empty()
            && std::find(h.steps.begin(), h.steps.end(), info.step) == h.steps.end()) {
            continue;
        }
        log::debug("%s: %s callback '%s'", info.part_name.c_str(), hook_point_name(point),
                   h.name.c_str());
        auto st = h.fn(info);
        if (st.is_err()) {
            StrataError err = std::move(st).error();
            err.message = std::string(hook_point_name(point)) + " callback '" + h.name
                        + "' failed: " + err.message;
            return err;
        }
    }
    return ok_status();
}

Status CallbackRegistry::run_execution_hooks(const std::vector<ExecutionHook>& hooks,
                                             const char* kind, const ProjectInfo& info) {
    for (const auto& h : hooks) {
        log::debug("%s callback '%s'", kind, h.name.c_str());
        auto st = h.fn(info);
        if (st.is_err()) {
            StrataError err = std::move(st).error();
            err.message = std::string(kind) + " callback '" + h.name + "' failed: " + err.message;
            return err;
        }
    }
    return ok_status();
}

Status CallbackRegistry::run_prologue(const ProjectInfo& info) const {
    return run_execution_hooks(prologue_, "prologue", info);
}

Status CallbackRegistry::run_epilogue(const ProjectInfo& info) const {
    return run_execution_hooks(epilogue_, "epilogue", info);
}

} // namespace strata
