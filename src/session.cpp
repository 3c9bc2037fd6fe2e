#include "scopefix/session.h"

#include "diagnostics.h"

#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace scopefix {

lifecycle_coordinator &fixture_session::coordinator(std::string_view scope) {
    std::lock_guard<std::mutex> lk(scopes_mtx_);
    for (auto &entry : scopes_) {
        if (entry.name == scope)
            return *entry.coordinator;
    }
    scopes_.push_back(ScopeEntry{
        .name        = std::string(scope),
        .coordinator = std::make_unique<lifecycle_coordinator>(options_.coordinator),
    });
    return *scopes_.back().coordinator;
}

lifecycle_coordinator *fixture_session::find(std::string_view scope) {
    std::lock_guard<std::mutex> lk(scopes_mtx_);
    for (auto &entry : scopes_) {
        if (entry.name == scope)
            return entry.coordinator.get();
    }
    return nullptr;
}

void fixture_session::reject_if_running_locked(std::string_view scope, std::string_view what) const {
    if (!gate_.active)
        return;
    const std::string msg = fmt::format("scope '{}' cannot register a {} routine while a run is active", scope, what);
    detail::log_line(options_.coordinator.log_failures, msg);
    throw config_error(msg);
}

// The gate stays locked until the routine is stored, so begin_run() cannot
// slip in between the check and the registration.
void fixture_session::register_setup(std::string_view scope, fixture_routine routine) {
    std::lock_guard<std::mutex> lk(gate_mtx_);
    reject_if_running_locked(scope, "setup");
    coordinator(scope).set_setup(std::move(routine));
}

void fixture_session::register_teardown(std::string_view scope, fixture_routine routine) {
    std::lock_guard<std::mutex> lk(gate_mtx_);
    reject_if_running_locked(scope, "teardown");
    coordinator(scope).set_teardown(std::move(routine));
}

bool fixture_session::begin_run(std::vector<std::string> &errors) {
    std::lock_guard<std::mutex> lk(gate_mtx_);
    if (gate_.active) {
        if (gate_.owner == std::this_thread::get_id()) {
            errors.emplace_back("fixture session run re-entry from the same thread is not supported");
        } else {
            errors.emplace_back("fixture session run is already active in another thread");
        }
        return false;
    }
    gate_.active = true;
    gate_.owner  = std::this_thread::get_id();
    return true;
}

void fixture_session::ensure_setup_ran(std::string_view scope, execution_context *context) {
    if (auto *c = find(scope)) {
        c->ensure_setup_ran(context);
    }
}

bool fixture_session::end_run(std::vector<std::string> &errors) {
    {
        std::lock_guard<std::mutex> lk(gate_mtx_);
        if (!gate_.active) {
            errors.emplace_back("fixture session teardown requires an active run");
            return false;
        }
        if (gate_.owner != std::this_thread::get_id()) {
            errors.emplace_back("fixture session run release attempted from non-owner thread");
            return false;
        }
    }

    // Releases the gate on every exit path, including an escaping exception.
    struct ReleaseGate {
        std::mutex &mtx;
        RunGate    &gate;
        ~ReleaseGate() {
            std::lock_guard<std::mutex> lk(mtx);
            gate.active = false;
            gate.owner  = std::thread::id{};
        }
    };
    ReleaseGate release{gate_mtx_, gate_};

    std::vector<lifecycle_coordinator *> work;
    {
        std::lock_guard<std::mutex> lk(scopes_mtx_);
        work.reserve(scopes_.size());
        for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
            work.push_back(it->coordinator.get());
        }
    }

    bool teardown_ok = true;
    for (auto *c : work) {
        if (!c->has_teardown())
            continue;
        if (options_.teardown_contract == TeardownContract::Lenient) {
            if (auto diagnostic = c->run_teardown()) {
                errors.push_back(std::move(*diagnostic));
            }
            continue;
        }
        try {
            c->run_teardown_strict();
        } catch (const fixture_failure &e) {
            errors.emplace_back(e.what());
            teardown_ok = false;
        } catch (const std::exception &e) {
            errors.emplace_back(std::string("scope teardown threw std::exception: ") + e.what());
            teardown_ok = false;
        }
    }
    return teardown_ok;
}

bool fixture_session::run_active() const {
    std::lock_guard<std::mutex> lk(gate_mtx_);
    return gate_.active;
}

std::vector<std::string> fixture_session::scopes() const {
    std::lock_guard<std::mutex> lk(scopes_mtx_);
    std::vector<std::string>    names;
    names.reserve(scopes_.size());
    for (const auto &entry : scopes_) {
        names.push_back(entry.name);
    }
    return names;
}

} // namespace scopefix
