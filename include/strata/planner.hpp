#pragma once

#include <strata/action.hpp>
#include <strata/config.hpp>
#include <strata/overlay.hpp>
#include <strata/part_graph.hpp>
#include <strata/source.hpp>
#include <strata/state_store.hpp>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace strata {

// Fingerprint of an upstream key, or "" when it has no valid state
using FingerprintLookup = std::function<Result<std::string>(const StepKey&)>;

// Turns a target step and a part selection into the ordered list of step
// executions needed, consulting the recorded state of every step.
class ActionPlanner {
public:
    ActionPlanner(const PartGraph& graph, StateStore& store, const ProjectInfo& info,
                  const SourceRegistry& sources, const OverlayManager& overlay);

    // Actions to bring `names` (all parts when empty) up to `target`.
    // With rerun, the target step of each named part is forced.
    Result<std::vector<Action>> plan(Step target,
                                     const std::vector<std::string>& names = {},
                                     bool rerun = false);

    // The key and every key consuming it, transitively, in planning order
    std::vector<StepKey> invalidation_closure(const std::string& part, Step step) const;

    // nullopt when the recorded state is valid
    Result<std::optional<DirtyReport>> explain(const std::string& part, Step step);

    // Keys whose fingerprints feed (part, step)
    std::vector<StepKey> upstream_keys(const std::string& part, Step step) const;

    // Keys that directly consume (part, step)
    std::vector<StepKey> consumers(const StepKey& key) const;

    Result<FingerprintInputs> fingerprint_inputs(const std::string& part, Step step,
                                                 const FingerprintLookup& lookup);

    Result<Fingerprint> expected_fingerprint(const std::string& part, Step step,
                                             const FingerprintLookup& lookup);

    // Lookup over the state store
    FingerprintLookup stored_fingerprints();

    // Record the identity a pull actually fetched
    void set_source_identity(const std::string& part, const std::string& identity);

    // Drop memoised source and base identities
    void reset_identities();

private:
    Result<std::string> source_identity(const std::string& part);
    Result<std::string> base_identity();
    bool can_update_source(const std::string& part) const;
    Result<std::map<std::string, Step>> required_levels(
        Step target, const std::vector<std::string>& names,
        std::map<std::string, std::string>& required_by) const;

    const PartGraph& graph_;
    StateStore& store_;
    const ProjectInfo& info_;
    const SourceRegistry& sources_;
    const OverlayManager& overlay_;

    std::map<std::string, std::string> source_ids_;
    std::optional<std::string> base_id_;
};

} // namespace strata
