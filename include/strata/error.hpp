#pragma once

#include <string>

namespace strata {

struct StrataError {
    enum Code {
        IO,
        Parse,
        Config,
        NotFound,
        Duplicate,
        InvalidArg,
        Cycle,
        UnknownDependency,
        UnknownPlugin,
        PropertyValidation,
        StepExecution,
        Conflict,
        StateCorruption,
        Cancelled
    };

    Code code = IO;
    std::string message;
    std::string hint;
    // Context of a lifecycle failure, empty when not tied to a part
    std::string part;
    std::string step;

    StrataError() = default;
    StrataError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    StrataError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    // Attach part/step context, keeping any context already present
    StrataError& at(const std::string& part_name, const std::string& step_name);

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace strata
