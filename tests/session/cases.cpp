#include "scopefix/session.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

scopefix::session_options quiet(scopefix::TeardownContract contract = scopefix::TeardownContract::Lenient) {
    scopefix::session_options opts;
    opts.coordinator.log_failures = false;
    opts.teardown_contract        = contract;
    return opts;
}

} // namespace

TEST(FixtureSession, CoordinatorIsCreatedOncePerScope) {
    scopefix::fixture_session session(quiet());
    auto                     &a = session.coordinator("alpha");
    auto                     &b = session.coordinator("beta");
    EXPECT_EQ(&a, &session.coordinator("alpha"));
    EXPECT_NE(&a, &b);
    EXPECT_EQ(session.find("gamma"), nullptr);
    EXPECT_EQ(session.scopes(), (std::vector<std::string>{"alpha", "beta"}));
}

TEST(FixtureSession, UnknownScopeHasNothingToSetUp) {
    scopefix::fixture_session   session(quiet());
    scopefix::execution_context ctx("missing");
    EXPECT_NO_THROW(session.ensure_setup_ran("missing", &ctx));
    EXPECT_TRUE(session.scopes().empty());
}

TEST(FixtureSession, RegistrationIsRejectedWhileRunActive) {
    scopefix::fixture_session session(quiet());
    session.register_setup("alpha", scopefix::make_setup_routine("alpha::Assembly", "init", [](scopefix::execution_context &) {}));

    std::vector<std::string> errors;
    ASSERT_TRUE(session.begin_run(errors));
    EXPECT_TRUE(session.run_active());
    EXPECT_THROW(session.register_teardown("alpha", scopefix::make_teardown_routine("alpha::Assembly", "cleanup", [] {})),
                 scopefix::config_error);
    EXPECT_TRUE(session.end_run(errors));
    EXPECT_TRUE(errors.empty());
    EXPECT_FALSE(session.run_active());

    EXPECT_NO_THROW(session.register_teardown("alpha", scopefix::make_teardown_routine("alpha::Assembly", "cleanup", [] {})));
}

TEST(FixtureSession, RunGateRejectsReentry) {
    scopefix::fixture_session session(quiet());
    std::vector<std::string>  errors;
    ASSERT_TRUE(session.begin_run(errors));
    EXPECT_FALSE(session.begin_run(errors));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors.front().find("same thread"), std::string::npos);

    std::vector<std::string> other_errors;
    bool                     other_ok = true;
    std::thread              other([&] { other_ok = session.begin_run(other_errors); });
    other.join();
    EXPECT_FALSE(other_ok);
    ASSERT_EQ(other_errors.size(), 1u);
    EXPECT_NE(other_errors.front().find("another thread"), std::string::npos);

    errors.clear();
    EXPECT_TRUE(session.end_run(errors));
}

TEST(FixtureSession, EndRunRequiresActiveRun) {
    scopefix::fixture_session session(quiet());
    std::vector<std::string>  errors;
    EXPECT_FALSE(session.end_run(errors));
    EXPECT_EQ(errors.size(), 1u);
}

TEST(FixtureSession, TeardownRunsInReverseCreationOrder) {
    scopefix::fixture_session session(quiet());
    std::vector<std::string>  order;
    session.register_teardown("alpha", scopefix::make_teardown_routine("alpha::Assembly", "cleanup", [&] { order.push_back("alpha"); }));
    session.register_teardown("beta", scopefix::make_teardown_routine("beta::Assembly", "cleanup", [&] { order.push_back("beta"); }));
    session.coordinator("gamma");

    std::vector<std::string> errors;
    ASSERT_TRUE(session.begin_run(errors));
    EXPECT_TRUE(session.end_run(errors));
    EXPECT_EQ(order, (std::vector<std::string>{"beta", "alpha"}));
}

TEST(FixtureSession, LenientTeardownFailureIsWarning) {
    scopefix::fixture_session session(quiet());
    bool                      alpha_ran = false;
    session.register_teardown("alpha", scopefix::make_teardown_routine("alpha::Assembly", "cleanup", [&] { alpha_ran = true; }));
    session.register_teardown("beta", scopefix::make_teardown_routine("beta::Assembly", "cleanup",
                                                                      [] { throw std::runtime_error("disk full"); }));

    std::vector<std::string> errors;
    ASSERT_TRUE(session.begin_run(errors));
    EXPECT_TRUE(session.end_run(errors));
    EXPECT_TRUE(alpha_ran);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors.front().find("disk full"), std::string::npos);
}

TEST(FixtureSession, StrictTeardownFailureFailsRun) {
    scopefix::fixture_session session(quiet(scopefix::TeardownContract::Strict));
    bool                      alpha_ran = false;
    session.register_teardown("alpha", scopefix::make_teardown_routine("alpha::Assembly", "cleanup", [&] { alpha_ran = true; }));
    session.register_teardown("beta", scopefix::make_teardown_routine("beta::Assembly", "cleanup",
                                                                      [] { throw std::runtime_error("disk full"); }));

    std::vector<std::string> errors;
    ASSERT_TRUE(session.begin_run(errors));
    EXPECT_FALSE(session.end_run(errors));
    EXPECT_TRUE(alpha_ran);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors.front().find("disk full"), std::string::npos);
    EXPECT_FALSE(session.run_active());
}

TEST(FixtureSession, SetupFailureStaysWithItsScope) {
    scopefix::fixture_session session(quiet());
    session.register_setup("alpha", scopefix::make_setup_routine("alpha::Assembly", "init",
                                                                 [](scopefix::execution_context &) { scopefix::skip("no gpu"); }));
    session.register_setup("beta", scopefix::make_setup_routine("beta::Assembly", "init", [](scopefix::execution_context &) {}));

    scopefix::execution_context alpha_ctx("alpha");
    scopefix::execution_context beta_ctx("beta");
    EXPECT_THROW(session.ensure_setup_ran("alpha", &alpha_ctx), scopefix::fixture_failure);
    EXPECT_NO_THROW(session.ensure_setup_ran("beta", &beta_ctx));
    EXPECT_EQ(session.coordinator("alpha").state(), scopefix::SetupState::Failed);
    EXPECT_EQ(session.coordinator("beta").state(), scopefix::SetupState::Succeeded);
}

TEST(SessionOptions, EnvironmentOverrides) {
    ::setenv("SCOPEFIX_QUIET", "1", 1);
    ::setenv("SCOPEFIX_STRICT_TEARDOWN", "1", 1);
    ::setenv("SCOPEFIX_NO_STACK_TRACE", "", 1);

    scopefix::session_options opts;
    scopefix::apply_env_overrides(opts);
    EXPECT_FALSE(opts.coordinator.log_failures);
    EXPECT_EQ(opts.teardown_contract, scopefix::TeardownContract::Strict);
    EXPECT_TRUE(opts.coordinator.include_stack_trace);

    ::unsetenv("SCOPEFIX_QUIET");
    ::unsetenv("SCOPEFIX_STRICT_TEARDOWN");
    ::unsetenv("SCOPEFIX_NO_STACK_TRACE");
}

TEST(FixtureSession, RegistrationRacingBeginRunIsAllOrNothing) {
    for (int round = 0; round < 200; ++round) {
        scopefix::fixture_session session(quiet());
        int                       calls      = 0;
        bool                      registered = false;

        std::thread registrar([&] {
            try {
                session.register_setup("alpha", scopefix::make_setup_routine("alpha::Assembly", "init",
                                                                             [&](scopefix::execution_context &) { ++calls; }));
                registered = true;
            } catch (const scopefix::config_error &) {
            }
        });

        std::vector<std::string>    errors;
        scopefix::execution_context ctx("alpha");
        EXPECT_TRUE(session.begin_run(errors));
        session.ensure_setup_ran("alpha", &ctx);
        const int calls_seen_by_run = calls;
        registrar.join();

        // A registration that succeeded finished before the run began, so the
        // run must have executed it; one that lost the race was rejected.
        EXPECT_EQ(calls_seen_by_run, registered ? 1 : 0) << "round " << round;
        EXPECT_TRUE(session.end_run(errors));
    }
}
