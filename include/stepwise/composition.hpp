#pragma once

#include <stepwise/checkpoint.hpp>
#include <stepwise/constructors.hpp>
#include <stepwise/effect.hpp>
#include <stepwise/transducer.hpp>
#include <stepwise/types.hpp>

#include <functional>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace stepwise {

template<typename E, typename A, typename X, typename B>
auto compose(const basic_transducer<E, X, B>& g, const basic_transducer<E, A, X>& f) -> basic_transducer<E, A, B>;

template<typename E, typename A, typename B>
auto to_general(const basic_transducer<E, A, B>& t) -> basic_transducer<E, A, B>;

namespace detail {

template<typename C, typename B1, typename B2>
using combiner_ptr = std::shared_ptr<const std::function<C(const B1&, const B2&)>>;

template<typename E, typename A, typename B1, typename B2, typename C>
auto parallel_with(
    const basic_transducer<E, A, B1>& f,
    const basic_transducer<E, A, B2>& g,
    combiner_ptr<C, B1, B2> combine
) -> basic_transducer<E, A, C>;

template<typename E, typename A1, typename A2, typename B1, typename B2>
auto choice_of(const basic_transducer<E, A1, B1>& f, const basic_transducer<E, A2, B2>& g)
    -> basic_transducer<E, std::variant<A1, A2>, std::variant<B1, B2>>;

// Explicit-state view of a stateless or explicit-state transducer
template<typename E, typename A, typename B>
auto as_machine(const basic_transducer<E, A, B>& t) -> typename state_machine<E, A, B>::ptr {
    using machine_ptr = typename state_machine<E, A, B>::ptr;
    return std::visit([](const auto& node) -> machine_ptr {
        using node_t = std::decay_t<decltype(node)>;
        if constexpr (node_t::shape == transducer_shape::stateless_pure) {
            return std::make_shared<function_state_machine<E, A, B>>(node._function, nullptr);
        } else if constexpr (node_t::shape == transducer_shape::stateless_effect) {
            return std::make_shared<function_state_machine<E, A, B>>(nullptr, node._function);
        } else if constexpr (is_stateful_node_v<node_t>) {
            return node._machine;
        } else {
            throw std::logic_error("General transducer has no explicit-state machine");
        }
    }, t.node());
}

// Stateless step lifted into the effect context
template<typename E, typename A, typename B>
auto lift_stateless(const basic_transducer<E, A, B>& t)
    -> std::shared_ptr<const std::function<action_of<E, B>(const A&)>> {
    using lifted_t = std::function<action_of<E, B>(const A&)>;
    return std::visit([](const auto& node) -> std::shared_ptr<const lifted_t> {
        using node_t = std::decay_t<decltype(node)>;
        if constexpr (node_t::shape == transducer_shape::stateless_pure) {
            return std::make_shared<const lifted_t>([function = node._function](const A& input) {
                return E::pure((*function)(input));
            });
        } else if constexpr (node_t::shape == transducer_shape::stateless_effect) {
            return node._function;
        } else {
            throw std::logic_error("Only stateless transducers can be lifted");
        }
    }, t.node());
}

// General transducer driving an explicit-state machine; successors stay
// general and the checkpoint layout is the machine's own
template<typename E, typename A, typename B>
auto general_over_machine(typename state_machine<E, A, B>::ptr machine) -> basic_transducer<E, A, B> {
    using output_t = output<E, A, B>;
    using step_result = typename state_machine<E, A, B>::step_result;
    std::function<output_t(const A&)> pure_step;
    std::function<action_of<E, output_t>(const A&)> effect_step;

    if (!machine->effectful()) {
        pure_step = [machine](const A& input) {
            auto stepped = machine->advance(input);
            return output_t{std::move(stepped.first), general_over_machine<E, A, B>(std::move(stepped.second))};
        };
    } else {
        effect_step = [machine](const A& input) {
            return E::map(machine->advance_m(input), [](step_result stepped) {
                return output_t{std::move(stepped.first), general_over_machine<E, A, B>(std::move(stepped.second))};
            });
        };
    }

    return make_general_transducer<E, A, B>(
        std::move(pure_step),
        std::move(effect_step),
        [machine](checkpoint_writer& out) { machine->save(out); },
        [machine](checkpoint_reader& in) { return general_over_machine<E, A, B>(machine->load(in)); });
}

// Sequential composition with general operands. The two successors are
// recomposed after every step.
template<typename E, typename A, typename X, typename B>
auto compose_general(const basic_transducer<E, X, B>& g, const basic_transducer<E, A, X>& f)
    -> basic_transducer<E, A, B> {
    using output_t = output<E, A, B>;
    std::function<output_t(const A&)> pure_step;
    std::function<action_of<E, output_t>(const A&)> effect_step;

    if (!f.effectful() && !g.effectful()) {
        pure_step = [f, g](const A& input) {
            auto first = f.step_pure(input);
            auto second = g.step_pure(first.result());
            return output_t{std::move(second._result), compose(second.next(), first.next())};
        };
    } else {
        effect_step = [f, g](const A& input) {
            return E::bind(f.step(input), [g](output<E, A, X> first) {
                auto pending = g.step(first.result());
                return E::map(std::move(pending), [f_next = first.next()](output<E, X, B> second) {
                    return output_t{std::move(second._result), compose(second.next(), f_next)};
                });
            });
        };
    }

    return make_general_transducer<E, A, B>(
        std::move(pure_step),
        std::move(effect_step),
        [f, g](checkpoint_writer& out) {
            f.save(out);
            g.save(out);
        },
        [f, g](checkpoint_reader& in) {
            auto f_loaded = f.load(in);
            auto g_loaded = g.load(in);
            return compose(g_loaded, f_loaded);
        });
}

template<typename E, typename A, typename B1, typename B2, typename C>
auto parallel_general(
    const basic_transducer<E, A, B1>& f,
    const basic_transducer<E, A, B2>& g,
    combiner_ptr<C, B1, B2> combine
) -> basic_transducer<E, A, C> {
    using output_t = output<E, A, C>;
    std::function<output_t(const A&)> pure_step;
    std::function<action_of<E, output_t>(const A&)> effect_step;

    if (!f.effectful() && !g.effectful()) {
        pure_step = [f, g, combine](const A& input) {
            auto left = f.step_pure(input);
            auto right = g.step_pure(input);
            return output_t{(*combine)(left.result(), right.result()), parallel_with(left.next(), right.next(), combine)};
        };
    } else {
        effect_step = [f, g, combine](const A& input) {
            return E::bind(f.step(input), [g, combine, input](output<E, A, B1> left) {
                auto pending = g.step(input);
                return E::map(std::move(pending), [combine, left = std::move(left)](output<E, A, B2> right) {
                    return output_t{
                        (*combine)(left.result(), right.result()),
                        parallel_with(left.next(), right.next(), combine)};
                });
            });
        };
    }

    return make_general_transducer<E, A, C>(
        std::move(pure_step),
        std::move(effect_step),
        [f, g](checkpoint_writer& out) {
            f.save(out);
            g.save(out);
        },
        [f, g, combine](checkpoint_reader& in) {
            auto f_loaded = f.load(in);
            auto g_loaded = g.load(in);
            return parallel_with(f_loaded, g_loaded, combine);
        });
}

template<typename E, typename A1, typename A2, typename B1, typename B2>
auto choice_general(const basic_transducer<E, A1, B1>& f, const basic_transducer<E, A2, B2>& g)
    -> basic_transducer<E, std::variant<A1, A2>, std::variant<B1, B2>> {
    using input_t = std::variant<A1, A2>;
    using result_t = std::variant<B1, B2>;
    using output_t = output<E, input_t, result_t>;
    std::function<output_t(const input_t&)> pure_step;
    std::function<action_of<E, output_t>(const input_t&)> effect_step;

    if (!f.effectful() && !g.effectful()) {
        pure_step = [f, g](const input_t& input) {
            if (input.index() == 0) {
                auto stepped = f.step_pure(std::get<0>(input));
                return output_t{result_t(std::in_place_index<0>, stepped.result()), choice_of(stepped.next(), g)};
            }
            auto stepped = g.step_pure(std::get<1>(input));
            return output_t{result_t(std::in_place_index<1>, stepped.result()), choice_of(f, stepped.next())};
        };
    } else {
        effect_step = [f, g](const input_t& input) -> action_of<E, output_t> {
            if (input.index() == 0) {
                return E::map(f.step(std::get<0>(input)), [g](output<E, A1, B1> stepped) {
                    return output_t{result_t(std::in_place_index<0>, stepped.result()), choice_of(stepped.next(), g)};
                });
            }
            return E::map(g.step(std::get<1>(input)), [f](output<E, A2, B2> stepped) {
                return output_t{result_t(std::in_place_index<1>, stepped.result()), choice_of(f, stepped.next())};
            });
        };
    }

    return make_general_transducer<E, input_t, result_t>(
        std::move(pure_step),
        std::move(effect_step),
        [f, g](checkpoint_writer& out) {
            f.save(out);
            g.save(out);
        },
        [f, g](checkpoint_reader& in) {
            auto f_loaded = f.load(in);
            auto g_loaded = g.load(in);
            return choice_of(f_loaded, g_loaded);
        });
}

template<typename E, typename A, typename B1, typename B2, typename C>
auto parallel_with(
    const basic_transducer<E, A, B1>& f,
    const basic_transducer<E, A, B2>& g,
    combiner_ptr<C, B1, B2> combine
) -> basic_transducer<E, A, C> {
    using result_t = basic_transducer<E, A, C>;
    return std::visit([&f, &g, &combine](const auto& f_node, const auto& g_node) -> result_t {
        using f_t = std::decay_t<decltype(f_node)>;
        using g_t = std::decay_t<decltype(g_node)>;
        if constexpr (is_general_node_v<f_t> || is_general_node_v<g_t>) {
            return parallel_general(to_general(f), to_general(g), combine);
        } else if constexpr (f_t::shape == transducer_shape::stateless_pure && g_t::shape == transducer_shape::stateless_pure) {
            return make_stateless_pure<E, A, C>(
                [left = f_node._function, right = g_node._function, combine](const A& input) {
                    return (*combine)((*left)(input), (*right)(input));
                });
        } else if constexpr (is_stateless_node_v<f_t> && is_stateless_node_v<g_t>) {
            return make_stateless_effect<E, A, C>(
                [left = lift_stateless(f), right = lift_stateless(g), combine](const A& input) {
                    return E::bind((*left)(input), [right, combine, input](B1 left_result) {
                        return E::map((*right)(input), [combine, left_result = std::move(left_result)](B2 right_result) {
                            return (*combine)(left_result, right_result);
                        });
                    });
                });
        } else {
            return result_t::from_machine(
                std::make_shared<parallel_state_machine<E, A, B1, B2, C>>(as_machine(f), as_machine(g), combine));
        }
    }, f.node(), g.node());
}

template<typename E, typename A1, typename A2, typename B1, typename B2>
auto choice_of(const basic_transducer<E, A1, B1>& f, const basic_transducer<E, A2, B2>& g)
    -> basic_transducer<E, std::variant<A1, A2>, std::variant<B1, B2>> {
    using input_t = std::variant<A1, A2>;
    using output_value_t = std::variant<B1, B2>;
    using result_t = basic_transducer<E, input_t, output_value_t>;
    return std::visit([&f, &g](const auto& f_node, const auto& g_node) -> result_t {
        using f_t = std::decay_t<decltype(f_node)>;
        using g_t = std::decay_t<decltype(g_node)>;
        if constexpr (is_general_node_v<f_t> || is_general_node_v<g_t>) {
            return choice_general(to_general(f), to_general(g));
        } else if constexpr (f_t::shape == transducer_shape::stateless_pure && g_t::shape == transducer_shape::stateless_pure) {
            return make_stateless_pure<E, input_t, output_value_t>(
                [left = f_node._function, right = g_node._function](const input_t& input) {
                    if (input.index() == 0) {
                        return output_value_t(std::in_place_index<0>, (*left)(std::get<0>(input)));
                    }
                    return output_value_t(std::in_place_index<1>, (*right)(std::get<1>(input)));
                });
        } else if constexpr (is_stateless_node_v<f_t> && is_stateless_node_v<g_t>) {
            return make_stateless_effect<E, input_t, output_value_t>(
                [left = lift_stateless(f), right = lift_stateless(g)](const input_t& input) -> action_of<E, output_value_t> {
                    if (input.index() == 0) {
                        return E::map((*left)(std::get<0>(input)), [](B1 result) {
                            return output_value_t(std::in_place_index<0>, std::move(result));
                        });
                    }
                    return E::map((*right)(std::get<1>(input)), [](B2 result) {
                        return output_value_t(std::in_place_index<1>, std::move(result));
                    });
                });
        } else {
            return result_t::from_machine(
                std::make_shared<choice_state_machine<E, A1, A2, B1, B2>>(as_machine(f), as_machine(g)));
        }
    }, f.node(), g.node());
}

// Pure-kernel machine running inside another effect context
template<typename E, typename A, typename B>
class hoisted_state_machine final : public state_machine<E, A, B> {
public:
    using ptr = typename state_machine<E, A, B>::ptr;
    using step_result = typename state_machine<E, A, B>::step_result;
    using inner_ptr = typename state_machine<identity_effect, A, B>::ptr;

    explicit hoisted_state_machine(inner_ptr inner)
        : _inner(std::move(inner)) {}

    [[nodiscard]] auto effectful() const noexcept -> bool override {
        return false;
    }

    auto advance(const A& input) const -> step_result override {
        auto stepped = _inner->advance_m(input);
        return {std::move(stepped.first), std::make_shared<hoisted_state_machine>(std::move(stepped.second))};
    }

    auto advance_m(const A& input) const -> action_of<E, step_result> override {
        return E::pure(advance(input));
    }

    auto save(checkpoint_writer& out) const -> void override {
        _inner->save(out);
    }

    auto load(checkpoint_reader& in) const -> ptr override {
        return std::make_shared<hoisted_state_machine>(_inner->load(in));
    }

private:
    inner_ptr _inner;
};

// Machine from context E1 whose actions are carried into E2 by `morphism`
template<typename E1, typename E2, typename A, typename B, typename M>
class morphed_state_machine final : public state_machine<E2, A, B> {
public:
    using ptr = typename state_machine<E2, A, B>::ptr;
    using step_result = typename state_machine<E2, A, B>::step_result;
    using inner_ptr = typename state_machine<E1, A, B>::ptr;
    using inner_step_result = typename state_machine<E1, A, B>::step_result;

    morphed_state_machine(inner_ptr inner, M morphism)
        : _inner(std::move(inner))
        , _morphism(std::move(morphism)) {}

    [[nodiscard]] auto effectful() const noexcept -> bool override {
        return _inner->effectful();
    }

    auto advance(const A& input) const -> step_result override {
        auto stepped = _inner->advance(input);
        return {std::move(stepped.first), rewrap(std::move(stepped.second))};
    }

    auto advance_m(const A& input) const -> action_of<E2, step_result> override {
        if (!_inner->effectful()) {
            return E2::pure(advance(input));
        }
        return E2::map(_morphism(_inner->advance_m(input)), [morphism = _morphism](inner_step_result stepped) {
            return step_result{
                std::move(stepped.first),
                std::make_shared<morphed_state_machine>(std::move(stepped.second), morphism)};
        });
    }

    auto save(checkpoint_writer& out) const -> void override {
        _inner->save(out);
    }

    auto load(checkpoint_reader& in) const -> ptr override {
        return rewrap(_inner->load(in));
    }

private:
    auto rewrap(inner_ptr next) const -> ptr {
        return std::make_shared<morphed_state_machine>(std::move(next), _morphism);
    }

    inner_ptr _inner;
    M _morphism;
};

} // namespace detail

//=============================================================================
// Sequential composition
//=============================================================================

/**
 * @brief Sequential composition `g after f`
 *
 * Each step feeds the input to `f` and f's result to `g`. The variant of the
 * composite is chosen from the operands:
 *   - stateless pure with stateless pure: stateless pure
 *   - stateless with stateless, one effectful: stateless effectful
 *   - stateless or explicit-state otherwise: explicit state (pair of states)
 *   - any general operand: general
 */
template<typename E, typename A, typename X, typename B>
auto compose(const basic_transducer<E, X, B>& g, const basic_transducer<E, A, X>& f) -> basic_transducer<E, A, B> {
    using result_t = basic_transducer<E, A, B>;
    return std::visit([&g, &f](const auto& g_node, const auto& f_node) -> result_t {
        using g_t = std::decay_t<decltype(g_node)>;
        using f_t = std::decay_t<decltype(f_node)>;
        if constexpr (detail::is_general_node_v<g_t> || detail::is_general_node_v<f_t>) {
            return detail::compose_general(to_general(g), to_general(f));
        } else if constexpr (g_t::shape == transducer_shape::stateless_pure && f_t::shape == transducer_shape::stateless_pure) {
            return detail::make_stateless_pure<E, A, B>(
                [second = g_node._function, first = f_node._function](const A& input) {
                    return (*second)((*first)(input));
                });
        } else if constexpr (detail::is_stateless_node_v<g_t> && detail::is_stateless_node_v<f_t>) {
            return detail::make_stateless_effect<E, A, B>(
                [second = detail::lift_stateless(g), first = detail::lift_stateless(f)](const A& input) {
                    return E::bind((*first)(input), [second](X intermediate) { return (*second)(intermediate); });
                });
        } else {
            return result_t::from_machine(std::make_shared<detail::sequence_state_machine<E, A, X, B>>(
                detail::as_machine(f), detail::as_machine(g)));
        }
    }, g.node(), f.node());
}

// Pipeline order: `f >> g` feeds f's results to g
template<typename E, typename A, typename X, typename B>
auto operator>>(const basic_transducer<E, A, X>& f, const basic_transducer<E, X, B>& g) -> basic_transducer<E, A, B> {
    return compose(g, f);
}

// Composition order: `g << f` is compose(g, f)
template<typename E, typename A, typename X, typename B>
auto operator<<(const basic_transducer<E, X, B>& g, const basic_transducer<E, A, X>& f) -> basic_transducer<E, A, B> {
    return compose(g, f);
}

// Same behavior and checkpoint layout, represented as a general transducer
template<typename E, typename A, typename B>
auto to_general(const basic_transducer<E, A, B>& t) -> basic_transducer<E, A, B> {
    if (t.shape() == transducer_shape::general) {
        return t;
    }
    return detail::general_over_machine<E, A, B>(detail::as_machine(t));
}

//=============================================================================
// Parallel composition and choice
//=============================================================================

// Runs `f` and `g` on every input (f first) and combines their results
template<typename E, typename A, typename B1, typename B2, typename F>
auto parallel(const basic_transducer<E, A, B1>& f, const basic_transducer<E, A, B2>& g, F combine)
    -> basic_transducer<E, A, std::decay_t<std::invoke_result_t<F&, const B1&, const B2&>>> {
    using C = std::decay_t<std::invoke_result_t<F&, const B1&, const B2&>>;
    return detail::parallel_with<E, A, B1, B2, C>(
        f, g, std::make_shared<const std::function<C(const B1&, const B2&)>>(std::move(combine)));
}

// Routes index-0 inputs to `f` and index-1 inputs to `g`; only the selected
// branch steps
template<typename E, typename A1, typename A2, typename B1, typename B2>
auto choice(const basic_transducer<E, A1, B1>& f, const basic_transducer<E, A2, B2>& g)
    -> basic_transducer<E, std::variant<A1, A2>, std::variant<B1, B2>> {
    return detail::choice_of(f, g);
}

//=============================================================================
// Derived combinators
//=============================================================================

// Pre-process inputs with `function` before they reach `t`
template<typename A2, typename E, typename A, typename B, typename F>
auto map_input(const basic_transducer<E, A, B>& t, F function) -> basic_transducer<E, A2, B> {
    return compose(t, detail::make_stateless_pure<E, A2, A>(std::move(function)));
}

// Post-process the results of `t` with `function`
template<typename E, typename A, typename B, typename F>
auto map_output(const basic_transducer<E, A, B>& t, F function)
    -> basic_transducer<E, A, std::decay_t<std::invoke_result_t<F&, const B&>>> {
    using C = std::decay_t<std::invoke_result_t<F&, const B&>>;
    return compose(detail::make_stateless_pure<E, B, C>(std::move(function)), t);
}

template<typename A2, typename E, typename A, typename B, typename Pre, typename Post>
auto dimap(const basic_transducer<E, A, B>& t, Pre pre, Post post)
    -> basic_transducer<E, A2, std::decay_t<std::invoke_result_t<Post&, const B&>>> {
    return map_output(map_input<A2>(t, std::move(pre)), std::move(post));
}

// Runs `f` on the first and `g` on the second component of a pair input
template<typename E, typename A1, typename A2, typename B1, typename B2>
auto split(const basic_transducer<E, A1, B1>& f, const basic_transducer<E, A2, B2>& g)
    -> basic_transducer<E, std::pair<A1, A2>, std::pair<B1, B2>> {
    using input_t = std::pair<A1, A2>;
    return parallel(
        map_input<input_t>(f, [](const input_t& input) { return input.first; }),
        map_input<input_t>(g, [](const input_t& input) { return input.second; }),
        [](const B1& left, const B2& right) { return std::pair<B1, B2>{left, right}; });
}

// Runs `f` and `g` on the same input and pairs their results
template<typename E, typename A, typename B1, typename B2>
auto fanout(const basic_transducer<E, A, B1>& f, const basic_transducer<E, A, B2>& g)
    -> basic_transducer<E, A, std::pair<B1, B2>> {
    return parallel(f, g, [](const B1& left, const B2& right) { return std::pair<B1, B2>{left, right}; });
}

// Applies `t` to the first component, passing the second through
template<typename C, typename E, typename A, typename B>
auto first(const basic_transducer<E, A, B>& t) -> basic_transducer<E, std::pair<A, C>, std::pair<B, C>> {
    return split(t, identity<C, E>());
}

template<typename C, typename E, typename A, typename B>
auto second(const basic_transducer<E, A, B>& t) -> basic_transducer<E, std::pair<C, A>, std::pair<C, B>> {
    return split(identity<C, E>(), t);
}

// Applies `t` to index-0 inputs, passing index-1 inputs through
template<typename C, typename E, typename A, typename B>
auto left(const basic_transducer<E, A, B>& t)
    -> basic_transducer<E, std::variant<A, C>, std::variant<B, C>> {
    return choice(t, identity<C, E>());
}

template<typename C, typename E, typename A, typename B>
auto right(const basic_transducer<E, A, B>& t)
    -> basic_transducer<E, std::variant<C, A>, std::variant<C, B>> {
    return choice(identity<C, E>(), t);
}

//=============================================================================
// Changing effect context
//=============================================================================

/**
 * @brief Lift a pure-kernel transducer into effect context E2
 *
 * Stateless steps keep their function, explicit state is wrapped so that it
 * still checkpoints the same way, and general transducers are lifted
 * together with their successors and load blueprint.
 */
template<typename E2, typename A, typename B>
auto generalize(const transducer<A, B>& t) -> basic_transducer<E2, A, B> {
    using result_t = basic_transducer<E2, A, B>;
    using node_type = typename result_t::node_type;
    return std::visit([](const auto& node) -> result_t {
        using node_t = std::decay_t<decltype(node)>;
        if constexpr (detail::is_stateless_node_v<node_t>) {
            // identity_effect actions are plain values, so either function
            // is already a pure step
            return result_t(node_type(detail::stateless_pure_node<A, B>{node._function}));
        } else if constexpr (detail::is_stateful_node_v<node_t>) {
            return result_t::from_machine(std::make_shared<detail::hoisted_state_machine<E2, A, B>>(node._machine));
        } else {
            auto behavior = node._behavior;
            return detail::make_general_transducer<E2, A, B>(
                [behavior](const A& input) {
                    auto stepped = behavior->run(input);
                    return output<E2, A, B>{std::move(stepped._result), generalize<E2>(stepped._next)};
                },
                {},
                [behavior](checkpoint_writer& out) { behavior->_save(out); },
                [behavior](checkpoint_reader& in) { return generalize<E2>(behavior->_load(in)); });
        }
    }, t.node());
}


/**
 * @brief Move a transducer from effect context E1 to E2
 *
 * `morphism` turns an E1 action of any value type into the E2 action of the
 * same type, e.g. a generic lambda blocking on a future to leave
 * future_effect. Pure parts are not routed through it. Results and
 * checkpoint bytes are unchanged.
 */
template<typename E2, typename E1, typename A, typename B, typename M>
auto hoist(const basic_transducer<E1, A, B>& t, M morphism) -> basic_transducer<E2, A, B> {
    using result_t = basic_transducer<E2, A, B>;
    using node_type = typename result_t::node_type;
    return std::visit([&morphism](const auto& node) -> result_t {
        using node_t = std::decay_t<decltype(node)>;
        if constexpr (node_t::shape == transducer_shape::stateless_pure) {
            return result_t(node_type(detail::stateless_pure_node<A, B>{node._function}));
        } else if constexpr (node_t::shape == transducer_shape::stateless_effect) {
            return detail::make_stateless_effect<E2, A, B>([function = node._function, morphism](const A& input) {
                return morphism((*function)(input));
            });
        } else if constexpr (detail::is_stateful_node_v<node_t>) {
            return result_t::from_machine(
                std::make_shared<detail::morphed_state_machine<E1, E2, A, B, M>>(node._machine, morphism));
        } else {
            auto behavior = node._behavior;
            auto save = [behavior](checkpoint_writer& out) { behavior->_save(out); };
            auto load = [behavior, morphism](checkpoint_reader& in) {
                return hoist<E2>(behavior->_load(in), morphism);
            };
            if (behavior->_pure_step) {
                return detail::make_general_transducer<E2, A, B>(
                    [behavior, morphism](const A& input) {
                        auto stepped = behavior->_pure_step(input);
                        return output<E2, A, B>{std::move(stepped._result), hoist<E2>(stepped._next, morphism)};
                    },
                    {}, std::move(save), std::move(load));
            }
            return detail::make_general_transducer<E2, A, B>(
                {},
                [behavior, morphism](const A& input) {
                    return E2::map(morphism(behavior->_effect_step(input)), [morphism](output<E1, A, B> stepped) {
                        return output<E2, A, B>{std::move(stepped._result), hoist<E2>(stepped._next, morphism)};
                    });
                },
                std::move(save), std::move(load));
        }
    }, t.node());
}

} // namespace stepwise
