#pragma once

#include <strata/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace strata {

// Lifecycle steps, in execution order. Overlay only takes part in
// layered builds.
enum class Step { Pull = 0, Overlay = 1, Build = 2, Stage = 3, Prime = 4 };

const char* step_name(Step step);
Result<Step> parse_step(const std::string& name);

// All steps that apply to a project, in order
std::vector<Step> all_steps(bool layered);

// Steps strictly before / after `step`
std::vector<Step> previous_steps(Step step, bool layered);
std::vector<Step> next_steps(Step step, bool layered);

// The step every dependency must have completed before a dependent part
// can run `step`, or nullopt when `step` needs nothing from dependencies.
std::optional<Step> dependency_prerequisite_step(Step step);

// Same-part predecessor of `step`, or nullopt for Pull
std::optional<Step> previous_step(Step step, bool layered);

} // namespace strata
