#pragma once

#include "scopefix/errors.h"
#include "scopefix/routine.h"
#include "scopefix/stack_trace.h"

#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace scopefix::detail {

enum class ErrorKind {
    FixtureFailure,
    Failure,
    Inconclusive,
    StdException,
    Unknown,
};

struct ErrorDescription {
    ErrorKind                  kind = ErrorKind::Unknown;
    std::string                type_name;
    std::string                message; // raw message, no type prefix
    std::optional<stack_trace> trace;
};

// The error a nested_exception wraps, or `error` itself.
std::exception_ptr unwrap_one_level(const std::exception_ptr &error);

ErrorDescription describe_error(const std::exception_ptr &error);

// "type: message" for `error` and every error nested below it, joined by " ---> ".
std::string exception_message(const std::exception_ptr &error);

std::string demangle(const char *name);
std::string strip_nested_wrapper(std::string name);

std::string format_setup_failure(const fixture_routine &routine, const ErrorDescription &error);
std::string format_teardown_failure(const fixture_routine &routine, std::string_view error_text, const std::optional<stack_trace> &trace);
std::string format_duplicate_routine(const fixture_routine &existing, std::string_view kind);

// Never throws: a failed stderr write loses the line, nothing else.
void log_line(bool enabled, std::string_view message) noexcept;

} // namespace scopefix::detail
