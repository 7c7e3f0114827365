#include <strata/error.hpp>

namespace strata {

const char* StrataError::code_name(Code c) {
    switch (c) {
        case IO:                 return "IO";
        case Parse:              return "Parse";
        case Config:             return "Config";
        case NotFound:           return "NotFound";
        case Duplicate:          return "Duplicate";
        case InvalidArg:         return "InvalidArg";
        case Cycle:              return "Cycle";
        case UnknownDependency:  return "UnknownDependency";
        case UnknownPlugin:      return "UnknownPlugin";
        case PropertyValidation: return "PropertyValidation";
        case StepExecution:      return "StepExecution";
        case Conflict:           return "Conflict";
        case StateCorruption:    return "StateCorruption";
        case Cancelled:          return "Cancelled";
    }
    return "Unknown";
}

StrataError& StrataError::at(const std::string& part_name,
                             const std::string& step_name) {
    if (part.empty()) part = part_name;
    if (step.empty()) step = step_name;
    return *this;
}

std::string StrataError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!part.empty()) {
        result += "\n  --> part '";
        result += part;
        result += "'";
        if (!step.empty()) {
            result += ", step '";
            result += step;
            result += "'";
        }
    }

    return result;
}

} // namespace strata
