#include <strata/step.hpp>

namespace strata {

static const Step kSteps[] = {Step::Pull, Step::Overlay, Step::Build, Step::Stage, Step::Prime};

const char* step_name(Step step) {
    switch (step) {
        case Step::Pull:    return "pull";
        case Step::Overlay: return "overlay";
        case Step::Build:   return "build";
        case Step::Stage:   return "stage";
        case Step::Prime:   return "prime";
    }
    return "unknown";
}

Result<Step> parse_step(const std::string& name) {
    for (Step s : kSteps) {
        if (name == step_name(s)) return Result<Step>::ok(s);
    }
    return StrataError{StrataError::InvalidArg,
        "unknown step '" + name + "'",
        "expected one of: pull, overlay, build, stage, prime"};
}

std::vector<Step> all_steps(bool layered) {
    std::vector<Step> out;
    for (Step s : kSteps) {
        if (s == Step::Overlay && !layered) continue;
        out.push_back(s);
    }
    return out;
}

std::vector<Step> previous_steps(Step step, bool layered) {
    std::vector<Step> out;
    for (Step s : all_steps(layered)) {
        if (s < step) out.push_back(s);
    }
    return out;
}

std::vector<Step> next_steps(Step step, bool layered) {
    std::vector<Step> out;
    for (Step s : all_steps(layered)) {
        if (s > step) out.push_back(s);
    }
    return out;
}

std::optional<Step> dependency_prerequisite_step(Step step) {
    switch (step) {
        case Step::Pull:
        case Step::Overlay:
            // Overlay ordering follows the layer stack, not dependencies
            return std::nullopt;
        case Step::Build:
        case Step::Stage:
            return Step::Stage;
        case Step::Prime:
            return Step::Prime;
    }
    return std::nullopt;
}

std::optional<Step> previous_step(Step step, bool layered) {
    auto prev = previous_steps(step, layered);
    if (prev.empty()) return std::nullopt;
    return prev.back();
}

} // namespace strata
