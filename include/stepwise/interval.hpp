#pragma once

#include <stepwise/blip.hpp>
#include <stepwise/checkpoint.hpp>
#include <stepwise/composition.hpp>
#include <stepwise/constructors.hpp>
#include <stepwise/transducer.hpp>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace stepwise {

// Present means "on" with a value, absent means "off"
template<typename T>
using interval = std::optional<T>;

namespace detail {

// Steps the inner machine only on present inputs; absent inputs leave its
// state untouched
template<typename E, typename A, typename B>
class gate_state_machine final : public state_machine<E, interval<A>, interval<B>> {
public:
    using ptr = typename state_machine<E, interval<A>, interval<B>>::ptr;
    using step_result = typename state_machine<E, interval<A>, interval<B>>::step_result;
    using inner_ptr = typename state_machine<E, A, B>::ptr;

    explicit gate_state_machine(inner_ptr inner)
        : _inner(std::move(inner)) {}

    [[nodiscard]] auto effectful() const noexcept -> bool override {
        return _inner->effectful();
    }

    auto advance(const interval<A>& input) const -> step_result override {
        if (!input) {
            return {interval<B>{}, this->shared_from_this()};
        }
        auto stepped = _inner->advance(*input);
        return {interval<B>(std::move(stepped.first)), std::make_shared<gate_state_machine>(std::move(stepped.second))};
    }

    auto advance_m(const interval<A>& input) const -> action_of<E, step_result> override {
        if (!input || !effectful()) {
            return E::pure(advance(input));
        }
        return E::map(_inner->advance_m(*input), [](typename state_machine<E, A, B>::step_result stepped) {
            return step_result{
                interval<B>(std::move(stepped.first)),
                std::make_shared<gate_state_machine>(std::move(stepped.second))};
        });
    }

    auto save(checkpoint_writer& out) const -> void override {
        _inner->save(out);
    }

    auto load(checkpoint_reader& in) const -> ptr override {
        return std::make_shared<gate_state_machine>(_inner->load(in));
    }

private:
    inner_ptr _inner;
};

// Countdown codecs write the same kinds as the plain state codecs. A
// negative count would never reach zero, so it does not decode.
inline auto countdown_codec() -> state_codec_functions<std::int64_t> {
    auto plain = codec_functions<std::int64_t>();
    return {plain._kind, plain._encode, [](const boost::json::value& encoded) {
        auto remaining = state_codec<std::int64_t>::decode(encoded);
        if (remaining < 0) {
            throw decode_exception("Countdown state must not be negative, got " + std::to_string(remaining));
        }
        return remaining;
    }};
}

template<typename A>
auto held_countdown_codec() -> state_codec_functions<std::pair<interval<A>, std::int64_t>> {
    auto plain = codec_functions<std::pair<interval<A>, std::int64_t>>();
    return {plain._kind, plain._encode, [decode = plain._decode](const boost::json::value& encoded) {
        auto state = decode(encoded);
        if (state.second < 0) {
            throw decode_exception("Countdown state must not be negative, got " + std::to_string(state.second));
        }
        return state;
    }};
}

template<typename A>
auto hold_for_step(std::int64_t steps) {
    return [steps](const blip<A>& input, const std::pair<interval<A>, std::int64_t>& state) {
        using state_t = std::pair<interval<A>, std::int64_t>;
        state_t next;
        if (input.occurred()) {
            next = state_t{input.payload(), steps};
        } else if (state.second == 0) {
            next = state_t{std::nullopt, 0};
        } else {
            next = state_t{state.first, state.second - 1};
        }
        return std::pair<interval<A>, state_t>{next.first, next};
    };
}

} // namespace detail

//=============================================================================
// Basic intervals
//=============================================================================

// Always off
template<typename A, typename B, typename E = identity_effect>
auto off() -> basic_transducer<E, A, interval<B>> {
    return make_const<A, E>(interval<B>{});
}

// Always on, passing the input through
template<typename A, typename E = identity_effect>
auto to_on() -> basic_transducer<E, A, interval<A>> {
    return make_func<A, E>([](const A& input) { return interval<A>(input); });
}

// Collapses an interval, using `fallback` while off
template<typename A, typename E = identity_effect>
auto from_interval(A fallback) -> basic_transducer<E, interval<A>, A> {
    return make_func<interval<A>, E>([fallback = std::move(fallback)](const interval<A>& input) {
        return input.value_or(fallback);
    });
}

// Collapses an interval, applying `function` while on and using `fallback`
// while off
template<typename A, typename E = identity_effect, typename B, typename F>
auto from_interval_with(B fallback, F function) -> basic_transducer<E, interval<A>, B> {
    return make_func<interval<A>, E>(
        [fallback = std::move(fallback), function = std::move(function)](const interval<A>& input) -> B {
            if (!input) {
                return fallback;
            }
            return function(*input);
        });
}

// On for the first `steps` steps, off afterwards. Negative counts are 0.
template<typename A, typename E = identity_effect>
auto on_for(std::int64_t steps) -> basic_transducer<E, A, interval<A>> {
    return make_state_with<A, E>(
        detail::countdown_codec(),
        [](const A& input, const std::int64_t& remaining) {
            if (remaining == 0) {
                return std::pair<interval<A>, std::int64_t>{std::nullopt, 0};
            }
            return std::pair<interval<A>, std::int64_t>{input, remaining - 1};
        },
        std::max<std::int64_t>(0, steps));
}

// Off for the first `steps` steps, on afterwards. Negative counts are 0.
template<typename A, typename E = identity_effect>
auto off_for(std::int64_t steps) -> basic_transducer<E, A, interval<A>> {
    return make_state_with<A, E>(
        detail::countdown_codec(),
        [](const A& input, const std::int64_t& remaining) {
            if (remaining == 0) {
                return std::pair<interval<A>, std::int64_t>{input, 0};
            }
            return std::pair<interval<A>, std::int64_t>{std::nullopt, remaining - 1};
        },
        std::max<std::int64_t>(0, steps));
}

// On exactly when `predicate(input)` holds
template<typename A, typename E = identity_effect, typename P>
auto when(P predicate) -> basic_transducer<E, A, interval<A>> {
    return make_func<A, E>([predicate = std::move(predicate)](const A& input) -> interval<A> {
        if (predicate(input)) {
            return input;
        }
        return std::nullopt;
    });
}

// On exactly when `predicate(input)` does not hold
template<typename A, typename E = identity_effect, typename P>
auto unless(P predicate) -> basic_transducer<E, A, interval<A>> {
    return make_func<A, E>([predicate = std::move(predicate)](const A& input) -> interval<A> {
        if (predicate(input)) {
            return std::nullopt;
        }
        return input;
    });
}

//=============================================================================
// Blip-triggered intervals
//=============================================================================

// Off until the blip stream first occurs, on from that step onwards
template<typename A, typename T, typename E = identity_effect>
auto after() -> basic_transducer<E, std::pair<A, blip<T>>, interval<A>> {
    return make_state<std::pair<A, blip<T>>, E>(
        [](const std::pair<A, blip<T>>& input, const bool& on) {
            if (on || input.second.occurred()) {
                return std::pair<interval<A>, bool>{input.first, true};
            }
            return std::pair<interval<A>, bool>{std::nullopt, false};
        },
        false);
}

// On until the blip stream first occurs, off from that step onwards
template<typename A, typename T, typename E = identity_effect>
auto before() -> basic_transducer<E, std::pair<A, blip<T>>, interval<A>> {
    return make_state<std::pair<A, blip<T>>, E>(
        [](const std::pair<A, blip<T>>& input, const bool& done) {
            if (done || input.second.occurred()) {
                return std::pair<interval<A>, bool>{std::nullopt, true};
            }
            return std::pair<interval<A>, bool>{input.first, false};
        },
        false);
}

/**
 * @brief Toggles between off and on with two blip streams
 *
 * Starts off. An occurrence on the start stream switches on (including the
 * current step); an occurrence on the stop stream switches off. The stop
 * stream wins when both occur on the same step.
 */
template<typename A, typename S, typename T, typename E = identity_effect>
auto between() -> basic_transducer<E, std::pair<A, std::pair<blip<S>, blip<T>>>, interval<A>> {
    using input_t = std::pair<A, std::pair<blip<S>, blip<T>>>;
    return make_state<input_t, E>(
        [](const input_t& input, const bool& on) {
            if (input.second.second.occurred()) {
                return std::pair<interval<A>, bool>{std::nullopt, false};
            }
            if (input.second.first.occurred() || on) {
                return std::pair<interval<A>, bool>{input.first, true};
            }
            return std::pair<interval<A>, bool>{std::nullopt, false};
        },
        false);
}

// Off until the first occurrence, then on with the most recent payload
template<typename A, typename E = identity_effect>
auto hold() -> basic_transducer<E, blip<A>, interval<A>> {
    return make_accum<blip<A>, E>(
        [](const interval<A>& held, const blip<A>& input) {
            return input.occurred() ? interval<A>(input.payload()) : held;
        },
        interval<A>{});
}

template<typename A, typename E = identity_effect>
auto hold_() -> basic_transducer<E, blip<A>, interval<A>> {
    return make_accum_<blip<A>, E>(
        [](const interval<A>& held, const blip<A>& input) {
            return input.occurred() ? interval<A>(input.payload()) : held;
        },
        interval<A>{});
}

// Like hold, but the held payload expires `steps` steps after its
// occurrence unless a new one arrives
template<typename A, typename E = identity_effect>
auto hold_for(std::int64_t steps) -> basic_transducer<E, blip<A>, interval<A>> {
    auto clamped = std::max<std::int64_t>(0, steps);
    return make_state_with<blip<A>, E>(
        detail::held_countdown_codec<A>(),
        detail::hold_for_step<A>(clamped),
        std::pair<interval<A>, std::int64_t>{std::nullopt, clamped});
}

template<typename A, typename E = identity_effect>
auto hold_for_(std::int64_t steps) -> basic_transducer<E, blip<A>, interval<A>> {
    auto clamped = std::max<std::int64_t>(0, steps);
    return make_state_<blip<A>, E>(
        detail::hold_for_step<A>(clamped),
        std::pair<interval<A>, std::int64_t>{std::nullopt, clamped});
}

//=============================================================================
// Choosing between intervals
//=============================================================================

// `f` while it is on, otherwise `g`. Both always step.
template<typename E, typename A, typename B>
auto or_else(const basic_transducer<E, A, interval<B>>& f, const basic_transducer<E, A, interval<B>>& g)
    -> basic_transducer<E, A, interval<B>> {
    return parallel(f, g, [](const interval<B>& preferred, const interval<B>& fallback) {
        return preferred ? preferred : fallback;
    });
}

// `f`'s value while it is on, otherwise `g`'s result. Both always step.
template<typename E, typename A, typename B>
auto or_default(const basic_transducer<E, A, interval<B>>& f, const basic_transducer<E, A, B>& g)
    -> basic_transducer<E, A, B> {
    return parallel(f, g, [](const interval<B>& preferred, const B& fallback) {
        return preferred ? *preferred : fallback;
    });
}

// First candidate that is on; off when none is. Every candidate steps on
// every input.
template<typename E, typename A, typename B>
auto choose_interval(const std::vector<basic_transducer<E, A, interval<B>>>& candidates)
    -> basic_transducer<E, A, interval<B>> {
    if (candidates.empty()) {
        return off<A, B, E>();
    }
    auto chosen = candidates.back();
    for (auto it = std::next(candidates.rbegin()); it != candidates.rend(); ++it) {
        chosen = or_else(*it, chosen);
    }
    return chosen;
}

// First candidate that is on, otherwise the fallback's result
template<typename E, typename A, typename B>
auto choose(const basic_transducer<E, A, B>& fallback, const std::vector<basic_transducer<E, A, interval<B>>>& candidates)
    -> basic_transducer<E, A, B> {
    auto chosen = fallback;
    for (auto it = candidates.rbegin(); it != candidates.rend(); ++it) {
        chosen = or_default(*it, chosen);
    }
    return chosen;
}

//=============================================================================
// Gating
//=============================================================================

/**
 * @brief Runs `inner` only while the input interval is on
 *
 * Off steps produce off and leave `inner` frozen. The result is
 * explicit-state when `inner` is stateless or explicit-state.
 */
template<typename E, typename A, typename B>
auto during(const basic_transducer<E, A, B>& inner) -> basic_transducer<E, interval<A>, interval<B>> {
    using result_t = basic_transducer<E, interval<A>, interval<B>>;
    return std::visit([&inner](const auto& node) -> result_t {
        using node_t = std::decay_t<decltype(node)>;
        if constexpr (node_t::shape == transducer_shape::stateless_pure) {
            return detail::make_stateless_pure<E, interval<A>, interval<B>>(
                [function = node._function](const interval<A>& input) -> interval<B> {
                    if (!input) {
                        return std::nullopt;
                    }
                    return (*function)(*input);
                });
        } else if constexpr (node_t::shape == transducer_shape::stateless_effect) {
            return detail::make_stateless_effect<E, interval<A>, interval<B>>(
                [function = node._function](const interval<A>& input) -> detail::action_of<E, interval<B>> {
                    if (!input) {
                        return E::pure(interval<B>{});
                    }
                    return E::map((*function)(*input), [](B result) { return interval<B>(std::move(result)); });
                });
        } else if constexpr (detail::is_stateful_node_v<node_t>) {
            return result_t::from_machine(std::make_shared<detail::gate_state_machine<E, A, B>>(node._machine));
        } else {
            using output_t = output<E, interval<A>, interval<B>>;
            std::function<output_t(const interval<A>&)> pure_step;
            std::function<detail::action_of<E, output_t>(const interval<A>&)> effect_step;
            if (!inner.effectful()) {
                pure_step = [inner](const interval<A>& input) {
                    if (!input) {
                        return output_t{std::nullopt, during(inner)};
                    }
                    auto stepped = inner.step_pure(*input);
                    return output_t{interval<B>(stepped.result()), during(stepped.next())};
                };
            } else {
                effect_step = [inner](const interval<A>& input) -> detail::action_of<E, output_t> {
                    if (!input) {
                        return E::pure(output_t{std::nullopt, during(inner)});
                    }
                    return E::map(inner.step(*input), [](output<E, A, B> stepped) {
                        return output_t{interval<B>(stepped.result()), during(stepped.next())};
                    });
                };
            }
            return detail::make_general_transducer<E, interval<A>, interval<B>>(
                std::move(pure_step),
                std::move(effect_step),
                [inner](checkpoint_writer& out) { inner.save(out); },
                [inner](checkpoint_reader& in) { return during(inner.load(in)); });
        }
    }, inner.node());
}

// during() for an interval-producing inner transducer, flattened
template<typename E, typename A, typename B>
auto bind_interval(const basic_transducer<E, A, interval<B>>& inner) -> basic_transducer<E, interval<A>, interval<B>> {
    return map_output(during(inner), [](const interval<interval<B>>& nested) -> interval<B> {
        if (!nested) {
            return std::nullopt;
        }
        return *nested;
    });
}

} // namespace stepwise
