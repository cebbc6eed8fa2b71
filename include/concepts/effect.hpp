#pragma once

#include <concepts>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

#include <boost/json/value.hpp>

namespace stepwise {

// Concept for effect contexts (the environment a transducer step runs in)
//
// An effect context names an action type constructor and supplies the four
// operations the kernel needs:
//   pure(x)      - lift a plain value into an action
//   bind(a, k)   - sequence an action with a continuation returning an action
//   map(a, f)    - transform the value an action yields
//   run(a)       - execute an action and obtain its value
// and states whether running an action may perform effects at all.
//
// Failures belong to the action type (a future's exception channel, for
// example). The kernel never inspects them.
template<typename E>
concept effect_context = requires(
    typename E::template action<int> a,
    std::function<typename E::template action<long>(int)> continuation,
    std::function<long(int)> transform
) {
    // Lift a value
    { E::pure(0) } -> std::same_as<typename E::template action<int>>;

    // Sequence two actions
    { E::bind(std::move(a), continuation) } -> std::same_as<typename E::template action<long>>;

    // Map over the yielded value
    { E::map(std::move(a), transform) } -> std::same_as<typename E::template action<long>>;

    // Run to obtain the value (blocking for asynchronous contexts)
    { E::run(std::move(a)) } -> std::same_as<int>;

    { E::performs_effects } -> std::convertible_to<bool>;
};

// Concept for state codecs used by explicit-state transducers
//
// A codec turns a state value into a JSON value and back, and names the kind
// of state it writes so that a checkpoint read against the wrong template is
// detected instead of misinterpreted.
template<typename C, typename S>
concept state_codec_type = requires(const S& state, const boost::json::value& encoded) {
    { C::kind() } -> std::convertible_to<std::string>;
    { C::encode(state) } -> std::same_as<boost::json::value>;
    { C::decode(encoded) } -> std::same_as<S>;
};

} // namespace stepwise
