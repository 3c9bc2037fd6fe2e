#pragma once

#include "scopefix/context.h"

#include <functional>
#include <future>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace scopefix {

// Handle for a setup or teardown routine found by discovery. Setup routines
// receive the execution context, teardown routines receive nullptr.
struct fixture_routine {
    std::string                              declaring_type; // fully qualified, e.g. "suite::Assembly"
    std::string                              name;
    std::function<void(execution_context *)> invoke;

    explicit operator bool() const { return static_cast<bool>(invoke); }

    // Last "::" component of declaring_type.
    std::string_view short_type_name() const;
};

namespace detail {

template <class T> struct is_future : std::false_type {};
template <> struct is_future<std::future<void>> : std::true_type {};
template <> struct is_future<std::shared_future<void>> : std::true_type {};

// Runs `fn` to completion on the calling thread. A future result is waited on
// and get() rethrows whatever the asynchronous body threw.
template <class F, class... Args> void invoke_synchronously(F &fn, Args &&...args) {
    using Result = std::invoke_result_t<F &, Args...>;
    if constexpr (std::is_void_v<Result>) {
        std::invoke(fn, std::forward<Args>(args)...);
    } else {
        static_assert(is_future<std::decay_t<Result>>::value,
                      "fixture routines must return void, std::future<void> or std::shared_future<void>");
        auto pending = std::invoke(fn, std::forward<Args>(args)...);
        pending.get();
    }
}

} // namespace detail

template <class F> fixture_routine make_setup_routine(std::string declaring_type, std::string name, F &&fn) {
    return fixture_routine{
        .declaring_type = std::move(declaring_type),
        .name           = std::move(name),
        .invoke         = [f = std::forward<F>(fn)](execution_context *ctx) mutable { detail::invoke_synchronously(f, *ctx); },
    };
}

template <class F> fixture_routine make_teardown_routine(std::string declaring_type, std::string name, F &&fn) {
    return fixture_routine{
        .declaring_type = std::move(declaring_type),
        .name           = std::move(name),
        .invoke         = [f = std::forward<F>(fn)](execution_context *) mutable { detail::invoke_synchronously(f); },
    };
}

} // namespace scopefix
