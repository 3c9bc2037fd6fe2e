#include "diagnostics.h"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <typeinfo>

#include <fmt/format.h>

#if defined(__GNUC__) || defined(__clang__)
#  include <cxxabi.h>
#  define SCOPEFIX_HAVE_CXXABI 1
#else
#  define SCOPEFIX_HAVE_CXXABI 0
#endif

namespace scopefix::detail {
namespace {

constexpr std::size_t kMaxNestingDepth = 32;

std::string current_unknown_type_name() {
#if SCOPEFIX_HAVE_CXXABI
    if (const std::type_info *type = abi::__cxa_current_exception_type()) {
        return demangle(type->name());
    }
#endif
    return "unknown";
}

std::optional<stack_trace> trace_of(const assertion_error &e) {
    if (!e.trace() || e.trace()->empty())
        return std::nullopt;
    return *e.trace();
}

} // namespace

// throw_with_nested() wraps the thrown type in an implementation type
// (libstdc++ and libc++ name it differently); report the type the user threw.
std::string strip_nested_wrapper(std::string name) {
    constexpr std::string_view kWrappers[] = {"std::_Nested_exception<", "std::__1::__nested<", "std::__nested<"};
    for (const auto wrapper : kWrappers) {
        if (name.starts_with(wrapper) && name.ends_with(">")) {
            return name.substr(wrapper.size(), name.size() - wrapper.size() - 1);
        }
    }
    return name;
}

std::string demangle(const char *name) {
    if (!name)
        return {};
#if SCOPEFIX_HAVE_CXXABI
    int                                         status = 0;
    std::unique_ptr<char, decltype(&std::free)> out(abi::__cxa_demangle(name, nullptr, nullptr, &status), &std::free);
    if (status == 0 && out) {
        return strip_nested_wrapper(out.get());
    }
#endif
    return name;
}

std::exception_ptr unwrap_one_level(const std::exception_ptr &error) {
    if (!error)
        return error;
    try {
        std::rethrow_exception(error);
    } catch (const std::nested_exception &nested) {
        if (auto inner = nested.nested_ptr()) {
            return inner;
        }
    } catch (...) {
        // not a wrapper; the error is its own real error
    }
    return error;
}

ErrorDescription describe_error(const std::exception_ptr &error) {
    ErrorDescription out;
    if (!error) {
        out.type_name = "unknown";
        out.message   = "unknown exception";
        return out;
    }
    try {
        std::rethrow_exception(error);
    } catch (const fixture_failure &e) {
        out.kind      = ErrorKind::FixtureFailure;
        out.type_name = demangle(typeid(e).name());
        out.message   = e.what();
        out.trace     = e.trace();
    } catch (const inconclusive &e) {
        out.kind      = ErrorKind::Inconclusive;
        out.type_name = demangle(typeid(e).name());
        out.message   = e.what();
        out.trace     = trace_of(e);
    } catch (const failure &e) {
        out.kind      = ErrorKind::Failure;
        out.type_name = demangle(typeid(e).name());
        out.message   = e.what();
        out.trace     = trace_of(e);
    } catch (const std::exception &e) {
        out.kind      = ErrorKind::StdException;
        out.type_name = demangle(typeid(e).name());
        out.message   = e.what();
    } catch (...) {
        out.kind      = ErrorKind::Unknown;
        out.type_name = current_unknown_type_name();
        out.message   = "unknown exception";
    }
    return out;
}

std::string exception_message(const std::exception_ptr &error) {
    std::string        out;
    std::exception_ptr current = error;
    for (std::size_t depth = 0; current && depth < kMaxNestingDepth; ++depth) {
        const auto desc = describe_error(current);
        if (!out.empty())
            out.append(" ---> ");
        out.append(fmt::format("{}: {}", desc.type_name, desc.message));

        const auto inner = unwrap_one_level(current);
        if (inner == current)
            break;
        current = inner;
    }
    return out;
}

std::string format_setup_failure(const fixture_routine &routine, const ErrorDescription &error) {
    return fmt::format("Scope setup method {}.{} threw exception. {}: {}. Aborting test execution.", routine.declaring_type,
                       routine.name, error.type_name, error.message);
}

std::string format_teardown_failure(const fixture_routine &routine, std::string_view error_text, const std::optional<stack_trace> &trace) {
    return fmt::format("Scope teardown method {}.{} failed. Error Message: {}. StackTrace: {}", routine.short_type_name(), routine.name,
                       error_text, trace ? trace->to_string() : std::string{});
}

std::string format_duplicate_routine(const fixture_routine &existing, std::string_view kind) {
    return fmt::format("{}: cannot define more than one scope {} routine inside a scope (already declared: {})", existing.declaring_type,
                       kind, existing.name);
}

void log_line(bool enabled, std::string_view message) noexcept {
    if (!enabled)
        return;
    try {
        fmt::print(stderr, "scopefix: {}\n", message);
    } catch (const std::exception &) {
        // stderr closed or full; the line is dropped
    }
}

} // namespace scopefix::detail
