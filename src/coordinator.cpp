#include "scopefix/coordinator.h"

#include "diagnostics.h"

#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace {

using scopefix::detail::ErrorKind;

struct TeardownReport {
    std::string                          message;
    std::exception_ptr                   real_error;
    std::optional<scopefix::stack_trace> trace;
};

// Sets the run flag on every exit path of the setup slow path, including
// when the routine or the classification throws.
struct PublishSetupRan {
    std::atomic<bool> &running;
    std::atomic<bool> &has_run;

    PublishSetupRan(std::atomic<bool> &running_flag, std::atomic<bool> &has_run_flag) : running(running_flag), has_run(has_run_flag) {
        running.store(true, std::memory_order_relaxed);
    }
    ~PublishSetupRan() {
        running.store(false, std::memory_order_relaxed);
        has_run.store(true, std::memory_order_release);
    }
};

std::exception_ptr invoke_routine(const scopefix::fixture_routine &routine, scopefix::execution_context *context) {
    try {
        routine.invoke(context);
    } catch (...) { return std::current_exception(); }
    return nullptr;
}

// A fixture_failure is passed through unchanged; anything else is unwrapped
// one level and classified.
std::exception_ptr classify_setup_failure(const scopefix::fixture_routine &routine, const std::exception_ptr &raised) {
    if (scopefix::detail::describe_error(raised).kind == ErrorKind::FixtureFailure) {
        return raised;
    }

    const auto real    = scopefix::detail::unwrap_one_level(raised);
    auto       error   = scopefix::detail::describe_error(real);
    const auto outcome = error.kind == ErrorKind::Inconclusive ? scopefix::FixtureOutcome::Inconclusive : scopefix::FixtureOutcome::Failed;
    const auto message = scopefix::detail::format_setup_failure(routine, error);
    return std::make_exception_ptr(scopefix::fixture_failure(outcome, message, std::move(error.trace), real));
}

TeardownReport describe_teardown_failure(const scopefix::fixture_routine &routine, const std::exception_ptr &raised, bool include_trace) {
    TeardownReport report;
    report.real_error = scopefix::detail::unwrap_one_level(raised);

    auto        error = scopefix::detail::describe_error(report.real_error);
    std::string error_text;
    if (error.kind == ErrorKind::Failure || error.kind == ErrorKind::Inconclusive) {
        error_text = error.message;
    } else {
        error_text = scopefix::detail::exception_message(report.real_error);
    }
    report.trace   = std::move(error.trace);
    report.message = scopefix::detail::format_teardown_failure(routine, error_text, include_trace ? report.trace : std::nullopt);
    return report;
}

} // namespace

namespace scopefix {

void lifecycle_coordinator::set_setup(fixture_routine routine) {
    if (!routine) {
        throw config_error(fmt::format("scope setup routine {}.{} has no callable", routine.declaring_type, routine.name));
    }
    std::lock_guard<std::mutex> lk(mtx_);
    if (setup_) {
        const std::string msg = detail::format_duplicate_routine(setup_, "setup");
        detail::log_line(options_.log_failures, msg);
        throw config_error(msg);
    }
    setup_ = std::move(routine);
    setup_configured_.store(true, std::memory_order_release);
}

void lifecycle_coordinator::set_teardown(fixture_routine routine) {
    if (!routine) {
        throw config_error(fmt::format("scope teardown routine {}.{} has no callable", routine.declaring_type, routine.name));
    }
    std::lock_guard<std::mutex> lk(mtx_);
    if (teardown_) {
        const std::string msg = detail::format_duplicate_routine(teardown_, "teardown");
        detail::log_line(options_.log_failures, msg);
        throw config_error(msg);
    }
    teardown_ = std::move(routine);
}

void lifecycle_coordinator::ensure_setup_ran(execution_context *context) {
    if (!setup_configured_.load(std::memory_order_acquire)) {
        return;
    }
    if (!context) {
        throw std::invalid_argument("execution context cannot be null");
    }

    if (!setup_has_run_.load(std::memory_order_acquire)) {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!setup_has_run_.load(std::memory_order_relaxed)) {
            run_setup_locked(context);
        }
    }

    // Immutable once setup_has_run_ is observed.
    if (setup_failure_) {
        std::rethrow_exception(setup_failure_);
    }
}

void lifecycle_coordinator::run_setup_locked(execution_context *context) {
    PublishSetupRan publish(setup_running_, setup_has_run_);

    const auto raised = invoke_routine(setup_, context);
    if (!raised) {
        return;
    }
    try {
        setup_failure_ = classify_setup_failure(setup_, raised);
    } catch (...) { setup_failure_ = std::current_exception(); }

    try {
        std::rethrow_exception(setup_failure_);
    } catch (const std::exception &e) { detail::log_line(options_.log_failures, e.what()); } catch (...) {
        detail::log_line(options_.log_failures, fmt::format("scope setup method {}.{} failed", setup_.declaring_type, setup_.name));
    }
}

std::optional<std::string> lifecycle_coordinator::run_teardown() noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!teardown_) {
        return std::nullopt;
    }

    const auto raised = invoke_routine(teardown_, nullptr);
    if (!raised) {
        return std::nullopt;
    }
    auto report = describe_teardown_failure(teardown_, raised, options_.include_stack_trace);
    detail::log_line(options_.log_failures, report.message);
    return std::move(report.message);
}

void lifecycle_coordinator::run_teardown_strict() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!teardown_) {
        return;
    }

    const auto raised = invoke_routine(teardown_, nullptr);
    if (!raised) {
        return;
    }
    auto report = describe_teardown_failure(teardown_, raised, options_.include_stack_trace);
    detail::log_line(options_.log_failures, report.message);
    throw fixture_failure(FixtureOutcome::Failed, report.message, std::move(report.trace), report.real_error);
}

bool lifecycle_coordinator::has_setup() const { return setup_configured_.load(std::memory_order_acquire); }

bool lifecycle_coordinator::has_teardown() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<bool>(teardown_);
}

std::exception_ptr lifecycle_coordinator::setup_failure() const {
    if (!setup_has_run()) {
        return nullptr;
    }
    return setup_failure_;
}

SetupState lifecycle_coordinator::state() const {
    if (setup_has_run()) {
        return setup_failure_ ? SetupState::Failed : SetupState::Succeeded;
    }
    if (setup_running_.load(std::memory_order_relaxed)) {
        return SetupState::Running;
    }
    return SetupState::NotRun;
}

} // namespace scopefix
