#include <strata/planner.hpp>
#include <strata/log.hpp>

#include <algorithm>
#include <deque>
#include <set>
#include <sstream>

namespace strata {

ActionPlanner::ActionPlanner(const PartGraph& graph, StateStore& store,
                             const ProjectInfo& info, const SourceRegistry& sources,
                             const OverlayManager& overlay)
    : graph_(graph), store_(store), info_(info), sources_(sources), overlay_(overlay) {}

// ---------------------------------------------------------------------------
// Step wiring
// ---------------------------------------------------------------------------

std::vector<StepKey> ActionPlanner::upstream_keys(const std::string& part, Step step) const {
    std::vector<StepKey> out;
    switch (step) {
        case Step::Pull:
            break;
        case Step::Overlay:
            out.push_back({part, Step::Pull});
            if (auto below = graph_.layer_below(part)) {
                out.push_back({*below, Step::Overlay});
            }
            break;
        case Step::Build:
            out.push_back({part, info_.layered ? Step::Overlay : Step::Pull});
            for (const auto& dep : graph_.dependencies_of(part)) {
                out.push_back({dep, Step::Stage});
            }
            break;
        case Step::Stage:
            out.push_back({part, Step::Build});
            break;
        case Step::Prime:
            out.push_back({part, Step::Stage});
            break;
    }
    return out;
}

std::vector<StepKey> ActionPlanner::consumers(const StepKey& key) const {
    std::vector<StepKey> out;
    switch (key.step) {
        case Step::Pull:
            out.push_back({key.part, info_.layered ? Step::Overlay : Step::Build});
            break;
        case Step::Overlay:
            out.push_back({key.part, Step::Build});
            if (auto above = graph_.layer_above(key.part)) {
                out.push_back({*above, Step::Overlay});
            }
            break;
        case Step::Build:
            out.push_back({key.part, Step::Stage});
            break;
        case Step::Stage:
            out.push_back({key.part, Step::Prime});
            for (const auto& dependent : graph_.dependents_of(key.part)) {
                out.push_back({dependent, Step::Build});
            }
            break;
        case Step::Prime:
            break;
    }
    return out;
}

std::vector<StepKey> ActionPlanner::invalidation_closure(const std::string& part, Step step) const {
    std::set<StepKey> seen{{part, step}};
    std::deque<StepKey> queue{{part, step}};
    while (!queue.empty()) {
        StepKey k = queue.front();
        queue.pop_front();
        for (auto& c : consumers(k)) {
            if (seen.insert(c).second) queue.push_back(std::move(c));
        }
    }
    std::vector<StepKey> out(seen.begin(), seen.end());
    std::sort(out.begin(), out.end(), [&](const StepKey& a, const StepKey& b) {
        size_t ra = graph_.rank(a.part), rb = graph_.rank(b.part);
        return ra != rb ? ra < rb : a.step < b.step;
    });
    return out;
}

// ---------------------------------------------------------------------------
// Fingerprints
// ---------------------------------------------------------------------------

void ActionPlanner::set_source_identity(const std::string& part, const std::string& identity) {
    source_ids_[part] = identity;
}

void ActionPlanner::reset_identities() {
    source_ids_.clear();
    base_id_.reset();
}

Result<std::string> ActionPlanner::source_identity(const std::string& part) {
    auto it = source_ids_.find(part);
    if (it != source_ids_.end()) return Result<std::string>::ok(it->second);
    auto id = sources_.identity(graph_.part(part), info_);
    if (id.is_err()) return std::move(id).at(part, "pull");
    source_ids_[part] = id.value();
    return id;
}

bool ActionPlanner::can_update_source(const std::string& part) const {
    const Part& p = graph_.part(part);
    if (p.override_for(Step::Pull)) return false;
    auto handler = sources_.resolve(p.source);
    return handler.is_ok() && handler.value() && handler.value()->supports_update();
}

Result<std::string> ActionPlanner::base_identity() {
    if (base_id_) return Result<std::string>::ok(*base_id_);
    auto id = overlay_.base_identity();
    if (id.is_err()) return std::move(id).error();
    base_id_ = id.value();
    return id;
}

static std::string octal(unsigned mode) {
    std::ostringstream out;
    out << std::oct << mode;
    return out.str();
}

Result<FingerprintInputs> ActionPlanner::fingerprint_inputs(const std::string& part, Step step,
                                                            const FingerprintLookup& lookup) {
    const Part& p = graph_.part(part);
    const auto& plugin = graph_.plugin(part);

    FingerprintInputs in;
    in.step = step;
    in.properties = p.properties_of_interest(step, plugin->pull_properties(), info_.layered);

    switch (step) {
        case Step::Pull: {
            auto id = source_identity(part);
            if (id.is_err()) return std::move(id).error();
            in.source_identity = std::move(id).value();
            break;
        }
        case Step::Overlay: {
            auto id = base_identity();
            if (id.is_err()) return std::move(id).error();
            in.source_identity = std::move(id).value();
            break;
        }
        case Step::Build:
            in.options = info_.options;
            in.options["strata.target-arch"] = info_.target_arch;
            break;
        case Step::Stage:
            break;
        case Step::Prime:
            in.options["strata.normalize-permissions"] =
                info_.normalize_permissions ? "true" : "false";
            for (size_t i = 0; i < info_.permissions.size(); ++i) {
                const auto& rule = info_.permissions[i];
                in.options["strata.permissions." + std::to_string(i)] =
                    rule.path + "=" + octal(rule.mode);
            }
            break;
    }

    for (const auto& key : upstream_keys(part, step)) {
        auto fp = lookup(key);
        if (fp.is_err()) return std::move(fp).error();
        in.upstream[key.str()] = std::move(fp).value();
    }
    return Result<FingerprintInputs>::ok(std::move(in));
}

Result<Fingerprint> ActionPlanner::expected_fingerprint(const std::string& part, Step step,
                                                        const FingerprintLookup& lookup) {
    auto in = fingerprint_inputs(part, step, lookup);
    if (in.is_err()) return std::move(in).error();
    return Result<Fingerprint>::ok(StateStore::fingerprint_inputs(in.value()));
}

FingerprintLookup ActionPlanner::stored_fingerprints() {
    return [this](const StepKey& key) -> Result<std::string> {
        auto st = store_.get(key.part, key.step);
        if (st.is_err()) return std::move(st).error();
        if (!st.value()) return Result<std::string>::ok("");
        return Result<std::string>::ok(st.value()->fingerprint.value);
    };
}

// What differs between a recorded state and the current inputs
static DirtyReport diff_state(const StepKey& key, const StepState& state,
                              const FingerprintInputs& in, const Fingerprint& fp) {
    DirtyReport r;
    r.key = key;

    std::set<std::string> props;
    for (const auto& kv : state.properties) props.insert(kv.first);
    for (const auto& kv : in.properties) props.insert(kv.first);
    for (const auto& name : props) {
        auto a = state.properties.find(name);
        auto b = in.properties.find(name);
        if (a == state.properties.end() || b == in.properties.end() || a->second != b->second) {
            r.changed_properties.push_back(name);
        }
    }

    std::set<std::string> opts;
    for (const auto& kv : state.options) opts.insert(kv.first);
    for (const auto& kv : in.options) opts.insert(kv.first);
    for (const auto& name : opts) {
        auto a = state.options.find(name);
        auto b = in.options.find(name);
        if (a == state.options.end() || b == in.options.end() || a->second != b->second) {
            r.changed_options.push_back(name);
        }
    }

    r.source_changed = state.source_identity != in.source_identity;

    for (const auto& [dep, value] : in.upstream) {
        auto it = state.upstream.find(dep);
        if (value.empty() && !r.invalidated_by) {
            auto colon = dep.rfind(':');
            auto step = parse_step(dep.substr(colon + 1));
            if (step.is_ok()) r.invalidated_by = StepKey{dep.substr(0, colon), step.value()};
        }
        if (it == state.upstream.end() || it->second != value) {
            r.changed_dependencies.push_back(dep);
        }
    }
    for (const auto& kv : state.upstream) {
        if (!in.upstream.count(kv.first)) r.changed_dependencies.push_back(kv.first);
    }

    if (fp.inputs_hash != state.fingerprint.inputs_hash) {
        r.reason = ActionReason::PropertiesChanged;
    } else if (r.invalidated_by && r.invalidated_by->part == key.part) {
        r.reason = ActionReason::DownstreamInvalidated;
    } else {
        r.reason = ActionReason::DependencyChanged;
    }
    return r;
}

// ---------------------------------------------------------------------------
// Planning
// ---------------------------------------------------------------------------

Result<std::map<std::string, Step>> ActionPlanner::required_levels(
    Step target, const std::vector<std::string>& names,
    std::map<std::string, std::string>& required_by) const
{
    std::map<std::string, Step> level;
    std::deque<std::string> work;

    const auto& selected = names.empty() ? graph_.topological_order() : names;
    for (const auto& name : selected) {
        if (!graph_.has(name)) {
            return StrataError{StrataError::NotFound,
                "no part named '" + name + "'",
                "check the part names passed to the command"};
        }
        if (level.emplace(name, target).second) work.push_back(name);
    }

    auto lift = [&](const std::string& part, Step need, const std::string& why) {
        auto it = level.find(part);
        if (it != level.end() && it->second >= need) return;
        level[part] = need;
        required_by[part] = why;
        work.push_back(part);
    };

    while (!work.empty()) {
        std::string part = work.front();
        work.pop_front();
        Step at = level[part];

        if (auto need = dependency_prerequisite_step(at)) {
            std::string why = "required to " + std::string(step_name(at)) + " '" + part + "'";
            for (const auto& dep : graph_.dependencies_of(part)) {
                lift(dep, *need, why);
            }
        }
        if (info_.layered && at >= Step::Overlay) {
            if (auto below = graph_.layer_below(part)) {
                lift(*below, Step::Overlay, "required to overlay '" + part + "'");
            }
        }
    }

    // Named parts keep no "required by" note
    if (!names.empty()) {
        for (const auto& name : names) required_by.erase(name);
    } else {
        required_by.clear();
    }
    return Result<std::map<std::string, Step>>::ok(std::move(level));
}

Result<std::vector<Action>> ActionPlanner::plan(Step target,
                                                const std::vector<std::string>& names,
                                                bool rerun) {
    if (target == Step::Overlay && !info_.layered) {
        return StrataError{StrataError::InvalidArg,
            "the overlay step is only available in layered builds",
            "enable [overlay] in the project configuration"};
    }
    reset_identities();

    std::map<std::string, std::string> required_by;
    auto levels = required_levels(target, names, required_by);
    if (levels.is_err()) return std::move(levels).error();

    std::set<std::string> named(names.begin(), names.end());
    if (names.empty()) named.insert(graph_.topological_order().begin(),
                                    graph_.topological_order().end());

    // Fingerprints planned actions will record
    std::map<StepKey, Fingerprint> planned;
    // Keys made dirty by an earlier action; the first marking wins
    std::map<StepKey, std::pair<ActionReason, std::string>> dirty;
    std::set<StepKey> updates;

    FingerprintLookup stored = stored_fingerprints();
    FingerprintLookup lookup = [&](const StepKey& key) -> Result<std::string> {
        auto it = planned.find(key);
        if (it != planned.end()) return Result<std::string>::ok(it->second.value);
        return stored(key);
    };

    std::vector<Action> actions;
    for (const auto& part : graph_.topological_order()) {
        auto lv = levels.value().find(part);
        if (lv == levels.value().end()) continue;

        for (Step step : all_steps(info_.layered)) {
            if (step > lv->second) break;
            StepKey key{part, step};

            auto in = fingerprint_inputs(part, step, lookup);
            if (in.is_err()) return std::move(in).error();
            Fingerprint expected = StateStore::fingerprint_inputs(in.value());

            Action action;
            action.part_name = part;
            action.step = step;

            auto marked = dirty.find(key);
            if (rerun && step == target && named.count(part)) {
                action.type = ActionType::Rerun;
                action.reason = ActionReason::Forced;
                action.message = "rerun requested";
            } else if (marked != dirty.end()) {
                action.reason = marked->second.first;
                action.message = marked->second.second;
                // A build whose only change is an updated pull rebuilds in place
                if (step == Step::Build && previous_step(step, info_.layered) == Step::Pull
                    && updates.count(StepKey{part, Step::Pull})) {
                    auto state = store_.get(part, step);
                    if (state.is_err()) return std::move(state).error();
                    if (state.value() &&
                        state.value()->fingerprint.inputs_hash == expected.inputs_hash) {
                        action.type = ActionType::Update;
                    }
                }
            } else {
                auto state = store_.get(part, step);
                if (state.is_err()) return std::move(state).error();
                if (!state.value()) {
                    action.reason = ActionReason::NeverRun;
                    auto why = required_by.find(part);
                    if (why != required_by.end()) action.message = why->second;
                } else if (state.value()->fingerprint == expected) {
                    continue;
                } else {
                    auto report = diff_state(key, *state.value(), in.value(), expected);
                    action.reason = report.reason;
                    action.message = report.details();
                    if (step == Step::Pull && report.source_changed
                        && report.changed_properties.empty() && report.changed_options.empty()
                        && report.changed_dependencies.empty() && can_update_source(part)) {
                        action.type = ActionType::Update;
                    }
                }
            }

            log::debug("plan: %s", action.str().c_str());
            planned[key] = expected;
            if (action.type == ActionType::Update) updates.insert(key);
            for (auto& c : consumers(key)) {
                if (dirty.count(c)) continue;
                ActionReason r = c.part == part ? ActionReason::DownstreamInvalidated
                                                : ActionReason::DependencyChanged;
                dirty.emplace(std::move(c), std::make_pair(r, "'" + key.str() + "' changed"));
            }
            actions.push_back(std::move(action));
        }
    }
    return Result<std::vector<Action>>::ok(std::move(actions));
}

Result<std::optional<DirtyReport>> ActionPlanner::explain(const std::string& part, Step step) {
    if (!graph_.has(part)) {
        return StrataError{StrataError::NotFound, "no part named '" + part + "'"};
    }
    if (step == Step::Overlay && !info_.layered) {
        return StrataError{StrataError::InvalidArg,
            "the overlay step is only available in layered builds"};
    }
    reset_identities();

    StepKey key{part, step};
    auto state = store_.get(part, step);
    if (state.is_err()) return std::move(state).error();

    FingerprintLookup lookup = stored_fingerprints();
    if (!state.value()) {
        DirtyReport r;
        r.key = key;
        r.reason = ActionReason::NeverRun;
        for (const auto& up : upstream_keys(part, step)) {
            auto fp = lookup(up);
            if (fp.is_err()) return std::move(fp).error();
            if (fp.value().empty()) {
                r.invalidated_by = up;
                break;
            }
        }
        return Result<std::optional<DirtyReport>>::ok(std::move(r));
    }

    auto in = fingerprint_inputs(part, step, lookup);
    if (in.is_err()) return std::move(in).error();
    Fingerprint fp = StateStore::fingerprint_inputs(in.value());
    if (fp == state.value()->fingerprint) {
        return Result<std::optional<DirtyReport>>::ok(std::nullopt);
    }
    return Result<std::optional<DirtyReport>>::ok(
        diff_state(key, *state.value(), in.value(), fp));
}

} // namespace strata
