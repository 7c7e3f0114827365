#pragma once

#include <strata/error.hpp>
#include <variant>

namespace strata {

// Outcome of a lifecycle operation: a value, or the StrataError that stopped
// it. Planning, state access and step handlers all return one of these and
// hand failures up with STRATA_TRY until execute() records them per action.
template<typename T>
class Result {
    std::variant<T, StrataError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit so a handler can `return StrataError{...}` from any Result<T>
    Result(StrataError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(StrataError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<StrataError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    StrataError& error() & { return std::get<StrataError>(data_); }
    const StrataError& error() const& { return std::get<StrataError>(data_); }
    StrataError&& error() && { return std::get<StrataError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Names the part and step an error happened in. Inner context wins,
    // and an ok result is left alone.
    Result& at(const std::string& part, const std::string& step) & {
        if (is_err()) error().at(part, step);
        return *this;
    }
    Result&& at(const std::string& part, const std::string& step) && {
        if (is_err()) error().at(part, step);
        return std::move(*this);
    }

    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define STRATA_TRY(expr) \
    do { \
        auto _strata_result = (expr); \
        if (_strata_result.is_err()) return std::move(_strata_result).error(); \
    } while(0)

// STRATA_TRY that tags the error with the part and step being worked on
#define STRATA_TRY_AT(expr, part, step) \
    do { \
        auto _strata_result = (expr); \
        if (_strata_result.is_err()) \
            return std::move(_strata_result.error().at((part), (step))); \
    } while(0)

} // namespace strata
