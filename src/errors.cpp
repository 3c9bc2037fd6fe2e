#include "scopefix/errors.h"

#include <memory>
#include <string>
#include <utility>

namespace scopefix {

// Skip the assertion_error constructor and stack_trace::capture itself.
assertion_error::assertion_error(const std::string &message)
    : std::runtime_error(message), trace_(std::make_shared<const stack_trace>(stack_trace::capture(1))) {}

std::string_view to_string(FixtureOutcome outcome) {
    switch (outcome) {
    case FixtureOutcome::Failed: return "Failed";
    case FixtureOutcome::Inconclusive: return "Inconclusive";
    }
    return "Failed";
}

fixture_failure::fixture_failure(FixtureOutcome outcome, const std::string &message, std::optional<stack_trace> trace,
                                 std::exception_ptr cause)
    : std::runtime_error(message), details_(std::make_shared<const Details>(Details{
                                       .outcome = outcome,
                                       .trace   = std::move(trace),
                                       .cause   = std::move(cause),
                                   })) {}

void fail(const std::string &message) { throw failure(message); }

void skip(const std::string &reason) { throw inconclusive(reason); }

} // namespace scopefix
