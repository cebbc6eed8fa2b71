#pragma once

#include <stepwise/checkpoint.hpp>
#include <stepwise/effect.hpp>
#include <stepwise/transducer.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace stepwise {

namespace detail {

template<typename E, typename A, typename B, typename S>
auto make_leaf(
    typename leaf_state_machine<E, A, B, S>::pure_step pure_step,
    typename leaf_state_machine<E, A, B, S>::effect_step effect_step,
    std::optional<state_codec_functions<S>> codec,
    S initial
) -> basic_transducer<E, A, B> {
    using machine_type = leaf_state_machine<E, A, B, S>;
    auto behavior = std::make_shared<const typename machine_type::behavior>(typename machine_type::behavior{
        std::move(pure_step), std::move(effect_step), std::move(codec), initial});
    return basic_transducer<E, A, B>::from_machine(
        std::make_shared<machine_type>(std::move(behavior), std::move(initial)));
}

template<typename E, typename A, typename B>
auto make_stateless_pure(std::function<B(const A&)> function) -> basic_transducer<E, A, B> {
    return basic_transducer<E, A, B>(typename basic_transducer<E, A, B>::node_type(
        stateless_pure_node<A, B>{std::make_shared<const std::function<B(const A&)>>(std::move(function))}));
}

template<typename E, typename A, typename B>
auto make_stateless_effect(std::function<action_of<E, B>(const A&)> function) -> basic_transducer<E, A, B> {
    return basic_transducer<E, A, B>(typename basic_transducer<E, A, B>::node_type(
        stateless_effect_node<E, A, B>{
            std::make_shared<const std::function<action_of<E, B>(const A&)>>(std::move(function))}));
}

template<typename F, typename A, typename S>
using state_step_result_t = std::decay_t<std::invoke_result_t<F&, const A&, const S&>>;

} // namespace detail

//=============================================================================
// Stateless constructors
//=============================================================================

// Ignores its input and produces `value` every step
template<typename A, typename E = identity_effect, typename B>
auto make_const(B value) -> basic_transducer<E, A, B> {
    return detail::make_stateless_pure<E, A, B>([value = std::move(value)](const A&) { return value; });
}

// Runs `produce` every step, ignoring the input
template<typename E, typename A, typename B>
auto make_const_m(std::function<detail::action_of<E, B>()> produce) -> basic_transducer<E, A, B> {
    return detail::make_stateless_effect<E, A, B>([produce = std::move(produce)](const A&) { return produce(); });
}

// Applies a pure function to every input
template<typename A, typename E = identity_effect, typename F>
auto make_func(F function) -> basic_transducer<E, A, std::decay_t<std::invoke_result_t<F&, const A&>>> {
    using B = std::decay_t<std::invoke_result_t<F&, const A&>>;
    return detail::make_stateless_pure<E, A, B>(std::move(function));
}

// Applies an effectful function to every input
template<typename E, typename A, typename B>
auto make_func_m(std::function<detail::action_of<E, B>(const A&)> function) -> basic_transducer<E, A, B> {
    return detail::make_stateless_effect<E, A, B>(std::move(function));
}

// Passes every input through unchanged
template<typename A, typename E = identity_effect>
auto identity() -> basic_transducer<E, A, A> {
    return detail::make_stateless_pure<E, A, A>([](const A& input) { return input; });
}

//=============================================================================
// Explicit-state constructors
//=============================================================================

/**
 * @brief Transducer over an explicit state S
 *
 * `step(input, state)` returns the result and the next state. The state is
 * written with state_codec<S> when checkpointing, so a restored transducer
 * resumes where the saved one stopped.
 */
template<typename A, typename E = identity_effect, typename F, typename S>
requires has_state_codec<S>
auto make_state(F step, S initial)
    -> basic_transducer<E, A, typename detail::state_step_result_t<F, A, S>::first_type> {
    using B = typename detail::state_step_result_t<F, A, S>::first_type;
    return detail::make_leaf<E, A, B, S>(std::move(step), {}, codec_functions<S>(), std::move(initial));
}

// make_state that checkpoints nothing; a restored copy starts from `initial`
template<typename A, typename E = identity_effect, typename F, typename S>
auto make_state_(F step, S initial)
    -> basic_transducer<E, A, typename detail::state_step_result_t<F, A, S>::first_type> {
    using B = typename detail::state_step_result_t<F, A, S>::first_type;
    return detail::make_leaf<E, A, B, S>(std::move(step), {}, std::nullopt, std::move(initial));
}

// make_state with a caller-supplied codec, for state types without a
// state_codec specialization
template<typename A, typename E = identity_effect, typename F, typename S>
auto make_state_with(state_codec_functions<S> codec, F step, S initial)
    -> basic_transducer<E, A, typename detail::state_step_result_t<F, A, S>::first_type> {
    using B = typename detail::state_step_result_t<F, A, S>::first_type;
    return detail::make_leaf<E, A, B, S>(std::move(step), {}, std::move(codec), std::move(initial));
}

// Explicit state with an effectful step
template<typename E, typename A, typename B, typename S>
requires has_state_codec<S>
auto make_state_m(std::function<detail::action_of<E, std::pair<B, S>>(const A&, const S&)> step, S initial)
    -> basic_transducer<E, A, B> {
    return detail::make_leaf<E, A, B, S>({}, std::move(step), codec_functions<S>(), std::move(initial));
}

template<typename E, typename A, typename B, typename S>
auto make_state_m_(std::function<detail::action_of<E, std::pair<B, S>>(const A&, const S&)> step, S initial)
    -> basic_transducer<E, A, B> {
    return detail::make_leaf<E, A, B, S>({}, std::move(step), std::nullopt, std::move(initial));
}

//=============================================================================
// Accumulators
//=============================================================================

// Folds every input into the accumulator and produces the updated value
template<typename A, typename E = identity_effect, typename F, typename S>
requires has_state_codec<S>
auto make_accum(F fold, S initial) -> basic_transducer<E, A, S> {
    return make_state<A, E>(
        [fold = std::move(fold)](const A& input, const S& accumulated) {
            S next = fold(accumulated, input);
            return std::pair<S, S>{next, next};
        },
        std::move(initial));
}

template<typename A, typename E = identity_effect, typename F, typename S>
auto make_accum_(F fold, S initial) -> basic_transducer<E, A, S> {
    return make_state_<A, E>(
        [fold = std::move(fold)](const A& input, const S& accumulated) {
            S next = fold(accumulated, input);
            return std::pair<S, S>{next, next};
        },
        std::move(initial));
}

// Like make_accum, but produces the accumulator as it was before the input
template<typename A, typename E = identity_effect, typename F, typename S>
requires has_state_codec<S>
auto make_accum_delayed(F fold, S initial) -> basic_transducer<E, A, S> {
    return make_state<A, E>(
        [fold = std::move(fold)](const A& input, const S& accumulated) {
            return std::pair<S, S>{accumulated, fold(accumulated, input)};
        },
        std::move(initial));
}

template<typename A, typename E = identity_effect, typename F, typename S>
auto make_accum_delayed_(F fold, S initial) -> basic_transducer<E, A, S> {
    return make_state_<A, E>(
        [fold = std::move(fold)](const A& input, const S& accumulated) {
            return std::pair<S, S>{accumulated, fold(accumulated, input)};
        },
        std::move(initial));
}

// Accumulator whose fold runs in the effect context
template<typename E, typename A, typename S>
requires has_state_codec<S>
auto make_accum_m(std::function<detail::action_of<E, S>(const S&, const A&)> fold, S initial)
    -> basic_transducer<E, A, S> {
    return make_state_m<E, A, S, S>(
        [fold = std::move(fold)](const A& input, const S& accumulated) {
            return E::map(fold(accumulated, input), [](S next) { return std::pair<S, S>{next, next}; });
        },
        std::move(initial));
}

template<typename E, typename A, typename S>
auto make_accum_m_(std::function<detail::action_of<E, S>(const S&, const A&)> fold, S initial)
    -> basic_transducer<E, A, S> {
    return make_state_m_<E, A, S, S>(
        [fold = std::move(fold)](const A& input, const S& accumulated) {
            return E::map(fold(accumulated, input), [](S next) { return std::pair<S, S>{next, next}; });
        },
        std::move(initial));
}

//=============================================================================
// General transducers
//=============================================================================

/**
 * @brief Transducer defined by an arbitrary step closure
 *
 * @param step Produces the result and the successor (in the effect context)
 * @param save Writes the state this transducer carries
 * @param load Reads a checkpoint written by `save` and rebuilds the
 *             transducer it describes
 */
template<typename A, typename B, typename E = identity_effect>
auto make_general(
    std::function<detail::action_of<E, output<E, A, B>>(const A&)> step,
    std::function<void(checkpoint_writer&)> save,
    std::function<basic_transducer<E, A, B>(checkpoint_reader&)> load
) -> basic_transducer<E, A, B> {
    if constexpr (E::performs_effects) {
        return detail::make_general_transducer<E, A, B>({}, std::move(step), std::move(save), std::move(load));
    } else {
        return detail::make_general_transducer<E, A, B>(std::move(step), {}, std::move(save), std::move(load));
    }
}

// General transducer that checkpoints nothing; a restored copy behaves like
// a freshly built one
template<typename A, typename B, typename E = identity_effect>
auto make_general_(std::function<detail::action_of<E, output<E, A, B>>(const A&)> step)
    -> basic_transducer<E, A, B> {
    auto load = [step](checkpoint_reader&) { return make_general_<A, B, E>(step); };
    return make_general<A, B, E>(std::move(step), [](checkpoint_writer&) {}, std::move(load));
}

} // namespace stepwise
