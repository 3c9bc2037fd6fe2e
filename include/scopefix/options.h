#pragma once

namespace scopefix {

enum class TeardownContract {
    Lenient, // failures become diagnostic strings
    Strict,  // failures are raised as fixture_failure
};

struct coordinator_options {
    bool log_failures        = true; // print "scopefix: ..." lines to stderr
    bool include_stack_trace = true; // append captured traces to teardown diagnostics
};

struct session_options {
    coordinator_options coordinator{};
    TeardownContract    teardown_contract = TeardownContract::Lenient;
};

// Applies SCOPEFIX_QUIET, SCOPEFIX_STRICT_TEARDOWN and SCOPEFIX_NO_STACK_TRACE.
// A variable counts as set when it is present and non-empty.
void apply_env_overrides(session_options &opts);

} // namespace scopefix
