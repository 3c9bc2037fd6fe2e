#pragma once

#include "scopefix/context.h"
#include "scopefix/errors.h"
#include "scopefix/options.h"
#include "scopefix/routine.h"

#include <atomic>
#include <exception>
#include <mutex>
#include <optional>
#include <string>

namespace scopefix {

enum class SetupState {
    NotRun,
    Running,
    Succeeded,
    Failed,
};

// Setup/teardown coordination for one scope.
//
// Any number of worker threads may call ensure_setup_ran() before running a
// test of the scope. The setup routine runs exactly once; callers that arrive
// while it runs block on the coordinator's mutex, callers that arrive later
// take a lock-free path. A failed setup is classified once and the same
// exception object is rethrown to every caller, the routine is never retried.
//
// Teardown has no run-once gate: every run_teardown()/run_teardown_strict()
// call invokes the routine again. Teardown and the setup slow path share the
// mutex, so a teardown never overlaps an in-flight setup.
class lifecycle_coordinator {
  public:
    lifecycle_coordinator() = default;
    explicit lifecycle_coordinator(coordinator_options options) : options_(options) {}

    lifecycle_coordinator(const lifecycle_coordinator &)            = delete;
    lifecycle_coordinator &operator=(const lifecycle_coordinator &) = delete;

    // Throws config_error if a setup routine is already set or `routine` is empty.
    void set_setup(fixture_routine routine);
    // Throws config_error if a teardown routine is already set or `routine` is empty.
    void set_teardown(fixture_routine routine);

    // Returns normally once setup has succeeded (or when there is nothing to
    // set up). Throws std::invalid_argument for a null context and
    // fixture_failure when setup failed, now or on an earlier call.
    void ensure_setup_ran(execution_context *context);

    // Lenient teardown: never throws, returns a diagnostic when the routine failed.
    std::optional<std::string> run_teardown() noexcept;
    // Strict teardown: throws fixture_failure (outcome Failed) when the routine failed.
    void run_teardown_strict();

    bool               has_setup() const;
    bool               has_teardown() const;
    bool               setup_has_run() const noexcept { return setup_has_run_.load(std::memory_order_acquire); }
    std::exception_ptr setup_failure() const;
    SetupState         state() const;

  private:
    void run_setup_locked(execution_context *context);

    coordinator_options options_{};
    mutable std::mutex  mtx_;
    fixture_routine     setup_;
    fixture_routine     teardown_;
    std::atomic<bool>   setup_configured_{false};
    std::atomic<bool>   setup_running_{false};
    std::atomic<bool>   setup_has_run_{false};
    std::exception_ptr  setup_failure_; // written once under mtx_ before setup_has_run_ is published
};

} // namespace scopefix
