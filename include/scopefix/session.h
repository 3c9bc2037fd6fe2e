#pragma once

#include "scopefix/coordinator.h"
#include "scopefix/options.h"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace scopefix {

// Owns one lifecycle_coordinator per scope for the duration of a single run.
// Create one session per run and drop it afterwards; nothing here is global,
// so a host process can run several sessions back to back.
class fixture_session {
  public:
    fixture_session() = default;
    explicit fixture_session(session_options options) : options_(options) {}

    fixture_session(const fixture_session &)            = delete;
    fixture_session &operator=(const fixture_session &) = delete;

    // Get or create. References stay valid for the session's lifetime.
    lifecycle_coordinator &coordinator(std::string_view scope);
    // nullptr for a scope that was never created.
    lifecycle_coordinator *find(std::string_view scope);

    // Throw config_error on duplicates and while a run is active.
    void register_setup(std::string_view scope, fixture_routine routine);
    void register_teardown(std::string_view scope, fixture_routine routine);

    // Enter the run gate. Fails (appending to `errors`) on re-entry from the
    // owning thread or when another thread holds the gate.
    bool begin_run(std::vector<std::string> &errors);

    // Forwards to the scope's coordinator; a scope without a coordinator has
    // nothing to set up.
    void ensure_setup_ran(std::string_view scope, execution_context *context);

    // Tears every scope down in reverse creation order and releases the gate.
    // Lenient contract: diagnostics are appended to `errors` as warnings and
    // the call still succeeds. Strict contract: any teardown failure makes
    // the call return false.
    bool end_run(std::vector<std::string> &errors);

    bool                     run_active() const;
    std::vector<std::string> scopes() const;
    const session_options   &options() const { return options_; }

  private:
    struct ScopeEntry {
        std::string                            name;
        std::unique_ptr<lifecycle_coordinator> coordinator;
    };

    struct RunGate {
        bool            active = false;
        std::thread::id owner{};
    };

    void reject_if_running_locked(std::string_view scope, std::string_view what) const; // gate_mtx_ held

    session_options         options_{};
    mutable std::mutex      scopes_mtx_;
    std::vector<ScopeEntry> scopes_; // creation order
    mutable std::mutex      gate_mtx_;
    RunGate                 gate_;
};

} // namespace scopefix
