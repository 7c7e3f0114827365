#pragma once

#include <strata/state_store.hpp>
#include <strata/step.hpp>
#include <optional>
#include <string>
#include <vector>

namespace strata {

enum class ActionType {
    Run,
    Rerun,   // outputs of the step and later steps are cleaned first
    Update   // incremental: pull refreshes src in place, build keeps its tree
};

enum class ActionReason {
    NeverRun,
    PropertiesChanged,
    DependencyChanged,
    DownstreamInvalidated,
    Forced
};

const char* action_type_name(ActionType type);
const char* action_reason_name(ActionReason reason);

// One planned step execution. Never persisted.
struct Action {
    std::string part_name;
    Step step = Step::Pull;
    ActionType type = ActionType::Run;
    ActionReason reason = ActionReason::NeverRun;
    std::string message;

    StepKey key() const { return StepKey{part_name, step}; }

    // "build a (properties-changed: 'make-parameters' changed)"
    std::string str() const;
};

// Answer to "why is this step dirty"
struct DirtyReport {
    StepKey key;
    ActionReason reason = ActionReason::NeverRun;
    std::vector<std::string> changed_properties;
    std::vector<std::string> changed_options;
    bool source_changed = false;
    std::vector<std::string> changed_dependencies;   // upstream keys
    std::optional<StepKey> invalidated_by;            // missing upstream state

    // "a:build: property 'make-parameters' changed"
    std::string summary() const;
    // summary() without the key
    std::string details() const;
};

} // namespace strata
