#pragma once

#include <concepts/effect.hpp>
#include <stepwise/future.hpp>

#include <type_traits>
#include <utility>

namespace stepwise {

// Effect context without effects: an action is its own value.
// Transducers over this context are the pure kernel.
struct identity_effect {
    static constexpr bool performs_effects = false;

    template<typename T>
    using action = T;

    template<typename T>
    static auto pure(T value) -> T {
        return value;
    }

    template<typename T, typename F>
    static auto bind(T value, F&& continuation) -> std::invoke_result_t<F, T> {
        return std::forward<F>(continuation)(std::move(value));
    }

    template<typename T, typename F>
    static auto map(T value, F&& transform) -> std::invoke_result_t<F, T> {
        return std::forward<F>(transform)(std::move(value));
    }

    template<typename T>
    static auto run(T value) -> T {
        return value;
    }
};

// Effect context backed by folly futures.
//
// A step may suspend on I/O or fail; failure travels in the future's
// exception channel and is rethrown unchanged by run().
struct future_effect {
    static constexpr bool performs_effects = true;

    template<typename T>
    using action = Future<T>;

    template<typename T>
    static auto pure(T value) -> Future<T> {
        return FutureFactory::makeFuture(std::move(value));
    }

    template<typename T, typename F>
    static auto bind(Future<T> pending, F&& continuation) -> std::invoke_result_t<F, T> {
        return std::move(pending).thenFuture(std::forward<F>(continuation));
    }

    template<typename T, typename F>
    static auto map(Future<T> pending, F&& transform) -> Future<std::invoke_result_t<F, T>> {
        return std::move(pending).thenValue(std::forward<F>(transform));
    }

    template<typename T>
    static auto run(Future<T> pending) -> T {
        return std::move(pending).get();
    }
};

static_assert(effect_context<identity_effect>, "identity_effect must satisfy effect_context concept");
static_assert(effect_context<future_effect>, "future_effect must satisfy effect_context concept");

} // namespace stepwise
