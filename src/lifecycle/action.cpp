#include <strata/action.hpp>

namespace strata {

const char* action_type_name(ActionType type) {
    switch (type) {
        case ActionType::Run:   return "run";
        case ActionType::Rerun: return "rerun";
        case ActionType::Update: return "update";
    }
    return "unknown";
}

const char* action_reason_name(ActionReason reason) {
    switch (reason) {
        case ActionReason::NeverRun:              return "never-run";
        case ActionReason::PropertiesChanged:     return "properties-changed";
        case ActionReason::DependencyChanged:     return "dependency-changed";
        case ActionReason::DownstreamInvalidated: return "downstream-invalidated";
        case ActionReason::Forced:                return "forced";
    }
    return "unknown";
}

std::string Action::str() const {
    std::string out = std::string(step_name(step)) + " " + part_name;
    if (type == ActionType::Rerun) out = "re" + out;
    if (type == ActionType::Update) out = "update " + out;
    out += " (";
    out += action_reason_name(reason);
    if (!message.empty()) out += ": " + message;
    out += ")";
    return out;
}

static std::string quoted_list(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += "'" + items[i] + "'";
    }
    return out;
}

std::string DirtyReport::summary() const {
    return key.str() + ": " + details();
}

std::string DirtyReport::details() const {
    std::vector<std::string> parts;
    if (reason == ActionReason::NeverRun) parts.push_back("never run");
    if (!changed_properties.empty()) {
        parts.push_back((changed_properties.size() == 1 ? "property " : "properties ")
                        + quoted_list(changed_properties) + " changed");
    }
    if (!changed_options.empty()) {
        parts.push_back((changed_options.size() == 1 ? "option " : "options ")
                        + quoted_list(changed_options) + " changed");
    }
    if (source_changed) parts.push_back("source changed");
    if (!changed_dependencies.empty()) {
        parts.push_back("upstream " + quoted_list(changed_dependencies) + " changed");
    }
    if (invalidated_by) {
        parts.push_back("'" + invalidated_by->str() + "' is not valid");
    }
    if (parts.empty()) parts.push_back(action_reason_name(reason));

    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += "; ";
        out += parts[i];
    }
    return out;
}

} // namespace strata
