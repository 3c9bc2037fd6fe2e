#pragma once

#include "scopefix/stack_trace.h"

#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace scopefix {

// Exceptions thrown by and around fixture routines.
//
// Routines report problems by throwing. `failure` and `inconclusive` are the
// assertion-style errors: they capture a stack trace when constructed and the
// coordinator treats their message as already user-facing. Everything a
// routine throws is translated into `fixture_failure` (setup, strict teardown)
// or a diagnostic string (lenient teardown) before it reaches the caller.

// Registration mistakes: a second setup/teardown routine for the same scope,
// a routine without a callable, registration while a run is active.
class config_error : public std::logic_error {
  public:
    explicit config_error(const std::string &message) : std::logic_error(message) {}
};

// Common base of the assertion-style errors.
class assertion_error : public std::runtime_error {
  public:
    const std::shared_ptr<const stack_trace> &trace() const noexcept { return trace_; }

  protected:
    explicit assertion_error(const std::string &message);

  private:
    std::shared_ptr<const stack_trace> trace_;
};

// A routine asserted something that did not hold.
class failure : public assertion_error {
  public:
    explicit failure(const std::string &message) : assertion_error(message) {}
};

// A routine could not decide; tests in the scope are reported inconclusive
// instead of failed.
class inconclusive : public assertion_error {
  public:
    explicit inconclusive(const std::string &message) : assertion_error(message) {}
};

enum class FixtureOutcome {
    Failed,
    Inconclusive,
};

std::string_view to_string(FixtureOutcome outcome);

// Classified failure of a setup routine or of a strict teardown. Copies share
// one immutable record, so copying never throws.
class fixture_failure : public std::runtime_error {
  public:
    fixture_failure(FixtureOutcome outcome, const std::string &message, std::optional<stack_trace> trace,
                    std::exception_ptr cause);

    FixtureOutcome                    outcome() const noexcept { return details_->outcome; }
    std::string_view                  message() const noexcept { return what(); }
    const std::optional<stack_trace> &trace() const noexcept { return details_->trace; }
    std::exception_ptr                cause() const noexcept { return details_->cause; }

  private:
    struct Details {
        FixtureOutcome             outcome = FixtureOutcome::Failed;
        std::optional<stack_trace> trace;
        std::exception_ptr         cause;
    };
    std::shared_ptr<const Details> details_;
};

// Throw helpers for routine bodies.
[[noreturn]] void fail(const std::string &message);
[[noreturn]] void skip(const std::string &reason);

} // namespace scopefix
