#include "scopefix/session.h"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

#include <fmt/core.h>

// Several workers run tests from two scopes in parallel. "storage" sets up
// once and tears down cleanly, "gpu" reports its setup as inconclusive and
// every worker sees the same cached failure.
int main() {
    scopefix::session_options opts;
    scopefix::apply_env_overrides(opts);
    scopefix::fixture_session session(opts);

    std::atomic<int> storage_setups{0};
    session.register_setup("storage", scopefix::make_setup_routine("storage::Assembly", "init", [&](scopefix::execution_context &ctx) {
        storage_setups.fetch_add(1);
        ctx.write_line("storage mounted");
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }));
    session.register_teardown("storage", scopefix::make_teardown_routine("storage::Assembly", "cleanup", [] {}));
    session.register_setup("gpu", scopefix::make_setup_routine("gpu::Assembly", "init",
                                                               [](scopefix::execution_context &) { scopefix::skip("no device found"); }));

    std::vector<std::string> errors;
    if (!session.begin_run(errors)) {
        for (const auto &e : errors)
            fmt::print(stderr, "{}\n", e);
        return EXIT_FAILURE;
    }

    scopefix::execution_context storage_ctx("storage");
    scopefix::execution_context gpu_ctx("gpu");
    std::atomic<int>            passed{0};
    std::atomic<int>            inconclusive{0};
    std::vector<std::thread>    workers;
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([&, i] {
            const bool  on_gpu = (i % 2) == 1;
            const char *scope  = on_gpu ? "gpu" : "storage";
            try {
                session.ensure_setup_ran(scope, on_gpu ? &gpu_ctx : &storage_ctx);
                passed.fetch_add(1);
            } catch (const scopefix::fixture_failure &f) {
                if (f.outcome() == scopefix::FixtureOutcome::Inconclusive)
                    inconclusive.fetch_add(1);
            }
        });
    }
    for (auto &t : workers)
        t.join();

    const bool teardown_ok = session.end_run(errors);
    for (const auto &e : errors)
        fmt::print(stderr, "warning: {}\n", e);

    fmt::print("storage setups: {}, passed: {}, inconclusive: {}\n", storage_setups.load(), passed.load(), inconclusive.load());
    return teardown_ok && storage_setups.load() == 1 ? EXIT_SUCCESS : EXIT_FAILURE;
}
