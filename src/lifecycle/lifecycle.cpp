#include <strata/lifecycle.hpp>
#include <strata/log.hpp>

#include <algorithm>
#include <cctype>
#include <set>

namespace fs = std::filesystem;

namespace strata {

const char* action_status_name(ActionStatus status) {
    switch (status) {
        case ActionStatus::Succeeded:  return "succeeded";
        case ActionStatus::Failed:     return "failed";
        case ActionStatus::Cancelled:  return "cancelled";
        case ActionStatus::NotStarted: return "not-started";
    }
    return "unknown";
}

bool ExecutionReport::ok() const {
    return !error && count(ActionStatus::Succeeded) == results.size();
}

size_t ExecutionReport::count(ActionStatus status) const {
    return static_cast<size_t>(std::count_if(results.begin(), results.end(),
        [status](const ActionResult& r) { return r.status == status; }));
}

Status ExecutionReport::status() const {
    for (const auto& r : results) {
        if (r.error) return *r.error;
    }
    if (error) return *error;
    return ok_status();
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

static const char kProjectVarPrefix[] = "project-var.";

static bool valid_var_name(const std::string& name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0]))) return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

LifecycleManager::LifecycleManager(PartGraph graph, ProjectInfo info, SourceRegistry sources)
    : graph_(std::move(graph)),
      info_(std::move(info)),
      sources_(std::move(sources)),
      project_vars_(info_.project_vars),
      overlay_(ProjectDirs(info_.work_dir), info_.layered ? info_.overlay_base : fs::path()),
      layout_(info_, store_),
      planner_(graph_, store_, info_, sources_, overlay_),
      executor_(graph_, info_, layout_, overlay_, sources_, project_vars_) {}

Result<std::unique_ptr<LifecycleManager>> LifecycleManager::create(
    std::vector<Part> parts, ProjectInfo info, PluginRegistry plugins, SourceRegistry sources)
{
    if (info.work_dir.empty()) {
        return StrataError{StrataError::Config, "no work directory configured"};
    }
    if (info.parallel_build_count < 1) {
        return StrataError{StrataError::Config,
            "parallel_build_count must be at least 1, got "
            + std::to_string(info.parallel_build_count)};
    }

    for (const auto& [name, _] : info.project_vars) {
        if (!valid_var_name(name)) {
            return StrataError{StrataError::Config,
                "invalid project variable name '" + name + "'",
                "use letters, digits and underscores, not starting with a digit"};
        }
    }

    auto graph = PartGraph::build(std::move(parts), plugins);
    if (graph.is_err()) return std::move(graph).error();

    if (!info.project_vars_part.empty() && !graph.value().has(info.project_vars_part)) {
        return StrataError{StrataError::Config,
            "project variables part '" + info.project_vars_part + "' is not a part"};
    }

    for (const auto& name : graph.value().topological_order()) {
        const Part& part = graph.value().part(name);
        STRATA_TRY_AT(sources.resolve(part.source), name, "pull");
    }

    if (info.layered && !info.overlay_base.empty()) {
        std::error_code ec;
        if (!fs::is_directory(info.overlay_base, ec)) {
            return StrataError{StrataError::NotFound,
                "overlay base " + info.overlay_base.string() + " is not a directory",
                "set [overlay] base to an existing directory"};
        }
    }

    std::unique_ptr<LifecycleManager> mgr(new LifecycleManager(
        std::move(graph).value(), std::move(info), std::move(sources)));

    STRATA_TRY(mgr->layout_.ensure_project_dirs());
    STRATA_TRY(mgr->store_.open((mgr->layout_.dirs().state / "strata.db").string()));
    STRATA_TRY(mgr->restore_project_vars());
    log::debug("lifecycle: %zu parts, work dir %s", mgr->graph_.size(),
               mgr->info_.work_dir.c_str());
    return Result<std::unique_ptr<LifecycleManager>>::ok(std::move(mgr));
}

// Values set by earlier runs are kept in the details of the step that set
// them; replaying them by serial leaves the latest one in place.
Status LifecycleManager::restore_project_vars() {
    if (project_vars_.empty()) return ok_status();
    auto keys = store_.keys();
    if (keys.is_err()) return std::move(keys).error();

    std::vector<StepState> states;
    for (const auto& key : keys.value()) {
        auto st = store_.get(key.part, key.step);
        if (st.is_err()) return std::move(st).error();
        if (st.value()) states.push_back(std::move(*st.value()));
    }
    std::sort(states.begin(), states.end(), [](const StepState& a, const StepState& b) {
        return a.serial < b.serial;
    });

    const std::string prefix = kProjectVarPrefix;
    for (const auto& state : states) {
        for (const auto& [key, value] : state.details) {
            if (key.compare(0, prefix.size(), prefix) != 0) continue;
            std::string name = key.substr(prefix.size());
            if (project_vars_.count(name)) project_vars_[name] = value;
        }
    }
    return ok_status();
}

Status LifecycleManager::check_step(Step step) const {
    if (step == Step::Overlay && !info_.layered) {
        return StrataError{StrataError::InvalidArg,
            "the overlay step is only available in layered builds",
            "enable [overlay] in the project configuration"};
    }
    return ok_status();
}

Status LifecycleManager::check_part(const std::string& name) const {
    if (!graph_.has(name)) {
        return StrataError{StrataError::NotFound, "no part named '" + name + "'"};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

Result<std::vector<Action>> LifecycleManager::plan(Step target,
                                                   const std::vector<std::string>& names,
                                                   bool rerun) {
    return planner_.plan(target, names, rerun);
}

Result<std::optional<StepState>> LifecycleManager::get_state(const std::string& part, Step step) {
    STRATA_TRY(check_part(part));
    return store_.get(part, step);
}

Result<std::optional<DirtyReport>> LifecycleManager::explain(const std::string& part, Step step) {
    return planner_.explain(part, step);
}

Result<std::vector<std::string>> LifecycleManager::build_packages(
    const std::vector<std::string>& names) const
{
    const auto& selected = names.empty() ? graph_.topological_order() : names;
    std::set<std::string> packages;
    for (const auto& name : selected) {
        STRATA_TRY(check_part(name));
        const Part& part = graph_.part(name);
        for (auto& pkg : graph_.plugin(name)->build_packages(executor_.plugin_context(part))) {
            packages.insert(std::move(pkg));
        }
    }
    return Result<std::vector<std::string>>::ok(
        std::vector<std::string>(packages.begin(), packages.end()));
}

// ---------------------------------------------------------------------------
// Execution
// ---------------------------------------------------------------------------

ExecutionReport LifecycleManager::execute(const std::vector<Action>& actions,
                                          const CancelToken* cancel) {
    ExecutionReport report;
    for (const auto& a : actions) {
        ActionResult r;
        r.action = a;
        report.results.push_back(std::move(r));
    }

    auto prologue = callbacks_.run_prologue(info_);
    if (prologue.is_err()) {
        log::error("%s", prologue.error().format().c_str());
        report.error = std::move(prologue).error();
        auto epilogue = callbacks_.run_epilogue(info_);
        if (epilogue.is_err()) log::error("%s", epilogue.error().format().c_str());
        return report;
    }

    for (auto& r : report.results) {
        if (cancel && cancel->is_cancelled()) {
            r.status = ActionStatus::Cancelled;
            r.error = StrataError{StrataError::Cancelled, "cancelled before start"};
            r.error->at(r.action.part_name, step_name(r.action.step));
            log::warn("cancelled: %s not started", r.action.str().c_str());
            break;
        }

        log::debug("execute: %s", r.action.str().c_str());
        auto st = execute_action(r.action, cancel);
        if (st.is_ok()) {
            r.status = ActionStatus::Succeeded;
            continue;
        }

        StrataError err = std::move(st).error();
        err.at(r.action.part_name, step_name(r.action.step));
        r.status = err.code == StrataError::Cancelled ? ActionStatus::Cancelled
                                                      : ActionStatus::Failed;
        log::error("%s", err.format().c_str());
        r.error = std::move(err);
        break;
    }

    auto epilogue = callbacks_.run_epilogue(info_);
    if (epilogue.is_err()) {
        log::error("%s", epilogue.error().format().c_str());
        report.error = std::move(epilogue).error();
    }
    return report;
}

StepInfo LifecycleManager::step_info(const Part& part, Step step) const {
    return StepInfo{part.name, step, info_, layout_.part_dirs(part), project_vars_};
}

Status LifecycleManager::check_prerequisites(const Part& part, Step step) {
    auto require = [&](const std::string& name, Step needed) -> Status {
        auto st = store_.get(name, needed);
        if (st.is_err()) return std::move(st).error();
        if (st.value()) return ok_status();
        return StrataError{StrataError::StepExecution,
            "cannot " + std::string(step_name(step)) + " '" + part.name + "': '"
            + StepKey{name, needed}.str() + "' is not done",
            "plan the step to schedule its prerequisites"};
    };

    if (auto prev = previous_step(step, info_.layered)) {
        STRATA_TRY(require(part.name, *prev));
    }
    if (auto need = dependency_prerequisite_step(step)) {
        for (const auto& dep : graph_.dependencies_of(part.name)) {
            STRATA_TRY(require(dep, *need));
        }
    }
    if (step == Step::Overlay) {
        if (auto below = graph_.layer_below(part.name)) {
            STRATA_TRY(require(*below, Step::Overlay));
        }
    }
    return ok_status();
}

Status LifecycleManager::execute_action(const Action& action, const CancelToken* cancel) {
    STRATA_TRY(check_part(action.part_name));
    STRATA_TRY(check_step(action.step));
    const Part& part = graph_.part(action.part_name);

    STRATA_TRY(check_prerequisites(part, action.step));

    if (action.type == ActionType::Rerun) {
        STRATA_TRY(clean_part(part, action.step));
        STRATA_TRY(invalidate_closure(part.name, action.step));
    } else {
        // A failed run or update must not leave the old state looking valid
        STRATA_TRY(store_.invalidate(part.name, action.step));
    }

    STRATA_TRY(callbacks_.run_step_hooks(HookPoint::PreStep, step_info(part, action.step)));

    auto outcome = executor_.run(part, action.step, cancel,
                                 action.type == ActionType::Update);
    if (outcome.is_err()) return std::move(outcome).error();
    StepOutcome& out = outcome.value();

    for (const auto& [name, value] : out.project_vars) {
        project_vars_[name] = value;
        out.details[kProjectVarPrefix + name] = value;
    }

    STRATA_TRY(callbacks_.run_step_hooks(HookPoint::PostStep, step_info(part, action.step)));

    if (out.source_identity) {
        planner_.set_source_identity(part.name, *out.source_identity);
    }
    auto inputs = planner_.fingerprint_inputs(part.name, action.step,
                                              planner_.stored_fingerprints());
    if (inputs.is_err()) return std::move(inputs).error();

    StepState state;
    state.part = part.name;
    state.step = action.step;
    state.fingerprint = StateStore::fingerprint_inputs(inputs.value());
    state.properties = std::move(inputs.value().properties);
    state.options = std::move(inputs.value().options);
    state.source_identity = std::move(inputs.value().source_identity);
    state.upstream = std::move(inputs.value().upstream);
    state.files = std::move(out.files);
    state.directories = std::move(out.directories);
    state.details = std::move(out.details);
    STRATA_TRY(store_.put(state));

    log::debug("%s recorded (%zu files)", state.key().str().c_str(), state.files.size());
    return ok_status();
}

// ---------------------------------------------------------------------------
// Clean / invalidate
// ---------------------------------------------------------------------------

Status LifecycleManager::clean_part(const Part& part, Step from) {
    std::vector<Step> steps{from};
    for (Step s : next_steps(from, info_.layered)) steps.push_back(s);

    for (auto it = steps.rbegin(); it != steps.rend(); ++it) {
        log::debug("cleaning %s:%s", part.name.c_str(), step_name(*it));
        STRATA_TRY(layout_.clean_step(part, *it));
        STRATA_TRY(store_.invalidate(part.name, *it));
    }
    return ok_status();
}

Status LifecycleManager::invalidate_closure(const std::string& part, Step step) {
    for (const auto& key : planner_.invalidation_closure(part, step)) {
        STRATA_TRY(store_.invalidate(key.part, key.step));
    }
    return ok_status();
}

Status LifecycleManager::clean(Step step, const std::vector<std::string>& names) {
    STRATA_TRY(check_step(step));
    for (const auto& name : names) STRATA_TRY(check_part(name));

    std::set<std::string> selected(names.begin(), names.end());
    const auto& order = graph_.topological_order();
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        if (!names.empty() && !selected.count(*it)) continue;
        log::info("Cleaning %s (from %s)", it->c_str(), step_name(step));
        STRATA_TRY(clean_part(graph_.part(*it), step));
        STRATA_TRY(invalidate_closure(*it, step));
    }
    return ok_status();
}

Status LifecycleManager::invalidate(const std::string& part, Step step) {
    STRATA_TRY(check_part(part));
    STRATA_TRY(check_step(step));
    return invalidate_closure(part, step);
}

} // namespace strata
