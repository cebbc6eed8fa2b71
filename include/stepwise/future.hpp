#pragma once

#include <exception>
#include <type_traits>
#include <utility>

#include <folly/futures/Future.h>
#include <folly/ExceptionWrapper.h>
#include <folly/Try.h>

namespace stepwise {

/**
 * @brief Outcome of an operation that may fail without throwing
 *
 * decode_transducer() returns one: either the restored transducer or the
 * decode_exception that stopped it. The exception keeps its dynamic type,
 * so holds<decode_exception>() and rethrow() see the concrete class.
 */
template<typename T>
class Try {
public:
    using value_type = T;

    template<typename U = T>
    requires std::constructible_from<T, U&&>
    explicit Try(U&& value) : _outcome(T(std::forward<U>(value))) {}

    explicit Try(std::exception_ptr failure) : _outcome(folly::exception_wrapper(std::move(failure))) {}

    // Throws the held exception when there is no value
    auto value() -> T& { return _outcome.value(); }
    auto value() const -> const T& { return _outcome.value(); }

    auto has_value() const -> bool { return _outcome.hasValue(); }
    auto has_exception() const -> bool { return _outcome.hasException(); }

    // Null when a value is held
    auto exception() const -> std::exception_ptr {
        if (!_outcome.hasException()) {
            return nullptr;
        }
        return _outcome.exception().to_exception_ptr();
    }

    template<typename Ex>
    auto holds() const -> bool {
        return _outcome.hasException() && _outcome.exception().template is_compatible_with<Ex>();
    }

    auto rethrow() const -> void {
        if (_outcome.hasException()) {
            _outcome.exception().throw_exception();
        }
    }

private:
    folly::Try<T> _outcome;
};

/**
 * @brief Pending result of an effectful step
 *
 * Move-only. thenValue() and thenFuture() consume the receiver; a
 * continuation on an already fulfilled future runs inline.
 */
template<typename T>
class Future {
public:
    using value_type = T;

    explicit Future(folly::Future<T> pending) : _pending(std::move(pending)) {}

    Future(Future&&) noexcept = default;
    Future& operator=(Future&&) noexcept = default;
    Future(const Future&) = delete;
    Future& operator=(const Future&) = delete;

    // Blocks; a failed future rethrows its exception unchanged
    auto get() -> T {
        return std::move(_pending).get();
    }

    template<typename F>
    auto thenValue(F&& func) -> Future<std::invoke_result_t<F, T>> {
        return Future<std::invoke_result_t<F, T>>(std::move(_pending).thenValue(std::forward<F>(func)));
    }

    // `func` returns a Future; the nesting is flattened
    template<typename F>
    auto thenFuture(F&& func) -> std::invoke_result_t<F, T> {
        using inner_type = typename std::invoke_result_t<F, T>::value_type;
        return Future<inner_type>(std::move(_pending).thenValue(
            [func = std::forward<F>(func)](T value) mutable {
                return func(std::move(value)).release();
            }));
    }

    auto release() && -> folly::Future<T> {
        return std::move(_pending);
    }

private:
    folly::Future<T> _pending;
};

// Ready and failed futures
class FutureFactory {
public:
    FutureFactory() = delete;

    template<typename T>
    static auto makeFuture(T&& value) -> Future<std::decay_t<T>> {
        return Future<std::decay_t<T>>(folly::makeFuture(std::forward<T>(value)));
    }

    template<typename T>
    static auto makeExceptionalFuture(std::exception_ptr failure) -> Future<T> {
        return Future<T>(folly::makeFuture<T>(folly::exception_wrapper(std::move(failure))));
    }
};

} // namespace stepwise
