#pragma once

#include <stepwise/checkpoint.hpp>
#include <stepwise/exceptions.hpp>

#include <boost/json.hpp>

#include <concepts>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace stepwise {

/**
 * @brief Discrete event stream element
 *
 * At every step a blip either occurred, carrying a payload, or did not.
 * A blip<T> stream is the output of transducers that only emit something
 * at isolated steps.
 */
template<typename T>
class blip {
public:
    using value_type = T;

    // No occurrence
    blip() = default;

    explicit blip(T payload)
        : _payload(std::move(payload)) {}

    [[nodiscard]] auto occurred() const noexcept -> bool {
        return _payload.has_value();
    }

    explicit operator bool() const noexcept {
        return occurred();
    }

    // Throws std::logic_error when nothing occurred
    auto payload() const -> const T& {
        if (!_payload) {
            throw std::logic_error("Payload requested from a blip that did not occur");
        }
        return *_payload;
    }

    auto as_optional() const -> const std::optional<T>& {
        return _payload;
    }

    // Transform the payload of an occurrence
    template<typename F>
    auto map(F&& function) const -> blip<std::decay_t<std::invoke_result_t<F, const T&>>> {
        using U = std::decay_t<std::invoke_result_t<F, const T&>>;
        if (!_payload) {
            return blip<U>{};
        }
        return blip<U>(std::forward<F>(function)(*_payload));
    }

    auto operator==(const blip& other) const -> bool = default;

private:
    std::optional<T> _payload;
};

template<typename T>
auto no_blip() -> blip<T> {
    return blip<T>{};
}

template<typename T>
auto emit(T payload) -> blip<std::decay_t<T>> {
    return blip<std::decay_t<T>>(std::move(payload));
}

// Occurs when either input occurs; simultaneous occurrences are combined
// with `combine(a, b)`
template<typename T, typename F>
auto merge(F&& combine, const blip<T>& a, const blip<T>& b) -> blip<T> {
    if (!a.occurred()) {
        return b;
    }
    if (!b.occurred()) {
        return a;
    }
    return blip<T>(std::forward<F>(combine)(a.payload(), b.payload()));
}

// Simultaneous occurrences keep the left payload
template<typename T>
auto merge_left(const blip<T>& a, const blip<T>& b) -> blip<T> {
    return a.occurred() ? a : b;
}

// Simultaneous occurrences keep the right payload
template<typename T>
auto merge_right(const blip<T>& a, const blip<T>& b) -> blip<T> {
    return b.occurred() ? b : a;
}

// `function(payload)` for an occurrence, `fallback` otherwise
template<typename T, typename R, typename F>
auto destructure(R fallback, F&& function, const blip<T>& b) -> R {
    if (!b.occurred()) {
        return fallback;
    }
    return std::forward<F>(function)(b.payload());
}

// Output operator for blip (for testing and logging)
template<typename T>
requires requires(std::ostream& os, const T& value) { os << value; }
auto operator<<(std::ostream& os, const blip<T>& b) -> std::ostream& {
    if (!b.occurred()) {
        return os << "no_blip";
    }
    return os << "blip(" << b.payload() << ")";
}

// Blips may be part of checkpointed state
template<typename T>
struct state_codec<blip<T>> {
    static auto kind() -> std::string { return "blip<" + state_codec<T>::kind() + ">"; }

    static auto encode(const blip<T>& value) -> boost::json::value {
        if (!value.occurred()) {
            return nullptr;
        }
        boost::json::array wrapped;
        wrapped.push_back(state_codec<T>::encode(value.payload()));
        return wrapped;
    }

    static auto decode(const boost::json::value& encoded) -> blip<T> {
        if (encoded.is_null()) {
            return blip<T>{};
        }
        if (!encoded.is_array() || encoded.get_array().size() != 1) {
            throw decode_exception("Malformed blip state value for " + kind());
        }
        return blip<T>(state_codec<T>::decode(encoded.get_array()[0]));
    }
};

} // namespace stepwise
