#pragma once

#include <concepts/effect.hpp>
#include <stepwise/checkpoint.hpp>
#include <stepwise/effect.hpp>
#include <stepwise/exceptions.hpp>
#include <stepwise/future.hpp>
#include <stepwise/types.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace stepwise {

template<effect_context E, typename A, typename B>
class basic_transducer;

// Result of one step: the produced value and the transducer to use next
template<typename E, typename A, typename B>
struct output;

// Encoder, decoder and kind name for a state type, captured by value so that
// explicit-state transducers stay self-describing after type erasure
template<typename S>
struct state_codec_functions {
    std::string _kind;
    std::function<boost::json::value(const S&)> _encode;
    std::function<S(const boost::json::value&)> _decode;

    auto kind() const -> const std::string& { return _kind; }
};

// Codec functions for a codec type (state_codec<S> unless given)
template<typename S, typename Codec = state_codec<S>>
requires state_codec_type<Codec, S>
auto codec_functions() -> state_codec_functions<S> {
    return {Codec::kind(), &Codec::encode, &Codec::decode};
}

namespace detail {

template<typename E, typename T>
using action_of = typename E::template action<T>;

[[noreturn]] inline auto throw_effectful_pure_step() -> void {
    throw std::logic_error("Effectful transducer stepped outside its effect context");
}

//=============================================================================
// Explicit state
//=============================================================================

/**
 * @brief Type-erased explicit state plus the behavior that advances it
 *
 * Machines are immutable. advance() and advance_m() return the produced
 * value together with a new machine; the receiver stays valid.
 *
 * Pure machines implement advance(); advance_m() lifts it. A machine for
 * which effectful() is true must only be advanced through advance_m().
 */
template<typename E, typename A, typename B>
class state_machine : public std::enable_shared_from_this<state_machine<E, A, B>> {
public:
    using ptr = std::shared_ptr<const state_machine>;
    using step_result = std::pair<B, ptr>;

    virtual ~state_machine() = default;

    [[nodiscard]] virtual auto effectful() const noexcept -> bool = 0;

    virtual auto advance(const A& input) const -> step_result = 0;
    virtual auto advance_m(const A& input) const -> action_of<E, step_result> = 0;

    // Append this machine's state(s) to a checkpoint, in composition order
    virtual auto save(checkpoint_writer& out) const -> void = 0;

    // Same behavior, state read from the checkpoint
    virtual auto load(checkpoint_reader& in) const -> ptr = 0;
};

// Leaf machine holding a concrete state value S
template<typename E, typename A, typename B, typename S>
class leaf_state_machine final : public state_machine<E, A, B> {
public:
    using ptr = typename state_machine<E, A, B>::ptr;
    using step_result = typename state_machine<E, A, B>::step_result;
    using pure_step = std::function<std::pair<B, S>(const A&, const S&)>;
    using effect_step = std::function<action_of<E, std::pair<B, S>>(const A&, const S&)>;

    // Shared by every successor of one constructed transducer
    struct behavior {
        pure_step _pure;
        effect_step _effect;
        // Empty for non-resuming transducers: nothing is saved and loading
        // yields the initial state
        std::optional<state_codec_functions<S>> _codec;
        S _initial;
    };

    leaf_state_machine(std::shared_ptr<const behavior> shared_behavior, S state)
        : _behavior(std::move(shared_behavior))
        , _state(std::move(state)) {}

    [[nodiscard]] auto effectful() const noexcept -> bool override {
        return static_cast<bool>(_behavior->_effect);
    }

    auto advance(const A& input) const -> step_result override {
        if (!_behavior->_pure) {
            throw_effectful_pure_step();
        }
        auto stepped = _behavior->_pure(input, _state);
        return {std::move(stepped.first), rebind(std::move(stepped.second))};
    }

    auto advance_m(const A& input) const -> action_of<E, step_result> override {
        if (!_behavior->_effect) {
            return E::pure(advance(input));
        }
        return E::map(_behavior->_effect(input, _state),
            [shared_behavior = _behavior](std::pair<B, S> stepped) {
                return step_result{
                    std::move(stepped.first),
                    std::make_shared<leaf_state_machine>(shared_behavior, std::move(stepped.second))};
            });
    }

    auto save(checkpoint_writer& out) const -> void override {
        if (_behavior->_codec) {
            out.write(_behavior->_codec->_kind, _behavior->_codec->_encode(_state));
        }
    }

    auto load(checkpoint_reader& in) const -> ptr override {
        if (!_behavior->_codec) {
            return rebind(_behavior->_initial);
        }
        const auto& codec = *_behavior->_codec;
        const auto& encoded = in.read(codec._kind);
        try {
            return rebind(codec._decode(encoded));
        } catch (const decode_exception&) {
            throw;
        } catch (const std::exception& e) {
            throw decode_exception("State decoder for " + codec._kind + " failed: " + e.what());
        }
    }

    [[nodiscard]] auto state() const -> const S& {
        return _state;
    }

private:
    auto rebind(S next_state) const -> ptr {
        return std::make_shared<leaf_state_machine>(_behavior, std::move(next_state));
    }

    std::shared_ptr<const behavior> _behavior;
    S _state;
};

// Stateless function viewed as a machine, so that it can be merged into an
// explicit-state composition
template<typename E, typename A, typename B>
class function_state_machine final : public state_machine<E, A, B> {
public:
    using ptr = typename state_machine<E, A, B>::ptr;
    using step_result = typename state_machine<E, A, B>::step_result;
    using pure_function = std::shared_ptr<const std::function<B(const A&)>>;
    using effect_function = std::shared_ptr<const std::function<action_of<E, B>(const A&)>>;

    function_state_machine(pure_function pure, effect_function effect)
        : _pure(std::move(pure))
        , _effect(std::move(effect)) {}

    [[nodiscard]] auto effectful() const noexcept -> bool override {
        return _effect != nullptr;
    }

    auto advance(const A& input) const -> step_result override {
        if (!_pure) {
            throw_effectful_pure_step();
        }
        return {(*_pure)(input), this->shared_from_this()};
    }

    auto advance_m(const A& input) const -> action_of<E, step_result> override {
        if (!_effect) {
            return E::pure(advance(input));
        }
        return E::map((*_effect)(input), [self = this->shared_from_this()](B result) {
            return step_result{std::move(result), self};
        });
    }

    auto save(checkpoint_writer&) const -> void override {}

    auto load(checkpoint_reader&) const -> ptr override {
        return this->shared_from_this();
    }

private:
    pure_function _pure;
    effect_function _effect;
};

// Sequential composition of two machines; the state is the pair of states
template<typename E, typename A, typename X, typename B>
class sequence_state_machine final : public state_machine<E, A, B> {
public:
    using ptr = typename state_machine<E, A, B>::ptr;
    using step_result = typename state_machine<E, A, B>::step_result;
    using first_ptr = typename state_machine<E, A, X>::ptr;
    using second_ptr = typename state_machine<E, X, B>::ptr;

    sequence_state_machine(first_ptr first, second_ptr second)
        : _first(std::move(first))
        , _second(std::move(second)) {}

    [[nodiscard]] auto effectful() const noexcept -> bool override {
        return _first->effectful() || _second->effectful();
    }

    auto advance(const A& input) const -> step_result override {
        auto first_step = _first->advance(input);
        auto second_step = _second->advance(first_step.first);
        return {std::move(second_step.first),
                std::make_shared<sequence_state_machine>(std::move(first_step.second), std::move(second_step.second))};
    }

    auto advance_m(const A& input) const -> action_of<E, step_result> override {
        if (!effectful()) {
            return E::pure(advance(input));
        }
        return E::bind(_first->advance_m(input),
            [second = _second](typename state_machine<E, A, X>::step_result first_step) {
                auto pending = second->advance_m(first_step.first);
                return E::map(std::move(pending),
                    [first_next = std::move(first_step.second)](typename state_machine<E, X, B>::step_result second_step) {
                        return step_result{
                            std::move(second_step.first),
                            std::make_shared<sequence_state_machine>(first_next, std::move(second_step.second))};
                    });
            });
    }

    auto save(checkpoint_writer& out) const -> void override {
        _first->save(out);
        _second->save(out);
    }

    auto load(checkpoint_reader& in) const -> ptr override {
        auto first = _first->load(in);
        auto second = _second->load(in);
        return std::make_shared<sequence_state_machine>(std::move(first), std::move(second));
    }

private:
    first_ptr _first;
    second_ptr _second;
};

// Both machines advance on the same input every step (left first), results
// are combined
template<typename E, typename A, typename B1, typename B2, typename C>
class parallel_state_machine final : public state_machine<E, A, C> {
public:
    using ptr = typename state_machine<E, A, C>::ptr;
    using step_result = typename state_machine<E, A, C>::step_result;
    using left_ptr = typename state_machine<E, A, B1>::ptr;
    using right_ptr = typename state_machine<E, A, B2>::ptr;
    using combiner = std::shared_ptr<const std::function<C(const B1&, const B2&)>>;

    parallel_state_machine(left_ptr left, right_ptr right, combiner combine)
        : _left(std::move(left))
        , _right(std::move(right))
        , _combine(std::move(combine)) {}

    [[nodiscard]] auto effectful() const noexcept -> bool override {
        return _left->effectful() || _right->effectful();
    }

    auto advance(const A& input) const -> step_result override {
        auto left_step = _left->advance(input);
        auto right_step = _right->advance(input);
        return {(*_combine)(left_step.first, right_step.first),
                std::make_shared<parallel_state_machine>(
                    std::move(left_step.second), std::move(right_step.second), _combine)};
    }

    auto advance_m(const A& input) const -> action_of<E, step_result> override {
        if (!effectful()) {
            return E::pure(advance(input));
        }
        return E::bind(_left->advance_m(input),
            [right = _right, combine = _combine, input](typename state_machine<E, A, B1>::step_result left_step) {
                auto pending = right->advance_m(input);
                return E::map(std::move(pending),
                    [combine, left_step = std::move(left_step)](typename state_machine<E, A, B2>::step_result right_step) mutable {
                        return step_result{
                            (*combine)(left_step.first, right_step.first),
                            std::make_shared<parallel_state_machine>(
                                std::move(left_step.second), std::move(right_step.second), combine)};
                    });
            });
    }

    auto save(checkpoint_writer& out) const -> void override {
        _left->save(out);
        _right->save(out);
    }

    auto load(checkpoint_reader& in) const -> ptr override {
        auto left = _left->load(in);
        auto right = _right->load(in);
        return std::make_shared<parallel_state_machine>(std::move(left), std::move(right), _combine);
    }

private:
    left_ptr _left;
    right_ptr _right;
    combiner _combine;
};

// Routes index-0 inputs to the left machine and index-1 inputs to the right
// one; the branch not selected is not advanced
template<typename E, typename A1, typename A2, typename B1, typename B2>
class choice_state_machine final : public state_machine<E, std::variant<A1, A2>, std::variant<B1, B2>> {
public:
    using input_type = std::variant<A1, A2>;
    using result_type = std::variant<B1, B2>;
    using ptr = typename state_machine<E, input_type, result_type>::ptr;
    using step_result = typename state_machine<E, input_type, result_type>::step_result;
    using left_ptr = typename state_machine<E, A1, B1>::ptr;
    using right_ptr = typename state_machine<E, A2, B2>::ptr;

    choice_state_machine(left_ptr left, right_ptr right)
        : _left(std::move(left))
        , _right(std::move(right)) {}

    [[nodiscard]] auto effectful() const noexcept -> bool override {
        return _left->effectful() || _right->effectful();
    }

    auto advance(const input_type& input) const -> step_result override {
        if (input.index() == 0) {
            auto stepped = _left->advance(std::get<0>(input));
            return {result_type(std::in_place_index<0>, std::move(stepped.first)),
                    std::make_shared<choice_state_machine>(std::move(stepped.second), _right)};
        }
        auto stepped = _right->advance(std::get<1>(input));
        return {result_type(std::in_place_index<1>, std::move(stepped.first)),
                std::make_shared<choice_state_machine>(_left, std::move(stepped.second))};
    }

    auto advance_m(const input_type& input) const -> action_of<E, step_result> override {
        if (!effectful()) {
            return E::pure(advance(input));
        }
        if (input.index() == 0) {
            return E::map(_left->advance_m(std::get<0>(input)),
                [right = _right](typename state_machine<E, A1, B1>::step_result stepped) {
                    return step_result{
                        result_type(std::in_place_index<0>, std::move(stepped.first)),
                        std::make_shared<choice_state_machine>(std::move(stepped.second), right)};
                });
        }
        return E::map(_right->advance_m(std::get<1>(input)),
            [left = _left](typename state_machine<E, A2, B2>::step_result stepped) {
                return step_result{
                    result_type(std::in_place_index<1>, std::move(stepped.first)),
                    std::make_shared<choice_state_machine>(left, std::move(stepped.second))};
            });
    }

    auto save(checkpoint_writer& out) const -> void override {
        _left->save(out);
        _right->save(out);
    }

    auto load(checkpoint_reader& in) const -> ptr override {
        auto left = _left->load(in);
        auto right = _right->load(in);
        return std::make_shared<choice_state_machine>(std::move(left), std::move(right));
    }

private:
    left_ptr _left;
    right_ptr _right;
};

//=============================================================================
// Variant alternatives
//=============================================================================

template<typename A, typename B>
struct stateless_pure_node {
    static constexpr transducer_shape shape = transducer_shape::stateless_pure;
    std::shared_ptr<const std::function<B(const A&)>> _function;
};

template<typename E, typename A, typename B>
struct stateless_effect_node {
    static constexpr transducer_shape shape = transducer_shape::stateless_effect;
    std::shared_ptr<const std::function<action_of<E, B>(const A&)>> _function;
};

template<typename E, typename A, typename B>
struct stateful_pure_node {
    static constexpr transducer_shape shape = transducer_shape::stateful_pure;
    typename state_machine<E, A, B>::ptr _machine;
};

template<typename E, typename A, typename B>
struct stateful_effect_node {
    static constexpr transducer_shape shape = transducer_shape::stateful_effect;
    typename state_machine<E, A, B>::ptr _machine;
};

template<typename E, typename A, typename B>
struct general_behavior;

template<typename E, typename A, typename B>
struct general_node {
    static constexpr transducer_shape shape = transducer_shape::general;
    std::shared_ptr<const general_behavior<E, A, B>> _behavior;
};

template<typename Node>
inline constexpr bool is_stateless_node_v =
    Node::shape == transducer_shape::stateless_pure || Node::shape == transducer_shape::stateless_effect;

template<typename Node>
inline constexpr bool is_stateful_node_v =
    Node::shape == transducer_shape::stateful_pure || Node::shape == transducer_shape::stateful_effect;

template<typename Node>
inline constexpr bool is_general_node_v = Node::shape == transducer_shape::general;

} // namespace detail

//=============================================================================
// Transducer
//=============================================================================

/**
 * @brief Immutable stream transducer over effect context E
 *
 * Consumes one A per step and produces one B plus a successor transducer.
 * The representation is one of five variants (see transducer_shape); the
 * composition functions pick the cheapest variant that is still correct.
 *
 * Copies are cheap: behavior and state are shared, never mutated.
 *
 * @tparam E Effect context the step runs in
 * @tparam A Input type
 * @tparam B Result type
 */
template<effect_context E, typename A, typename B>
class basic_transducer {
public:
    using effect_type = E;
    using input_type = A;
    using result_type = B;
    using output_type = output<E, A, B>;
    using action_type = detail::action_of<E, output_type>;
    using machine_ptr = typename detail::state_machine<E, A, B>::ptr;
    using node_type = std::variant<
        detail::stateless_pure_node<A, B>,
        detail::stateless_effect_node<E, A, B>,
        detail::stateful_pure_node<E, A, B>,
        detail::stateful_effect_node<E, A, B>,
        detail::general_node<E, A, B>
    >;

    explicit basic_transducer(node_type node)
        : _node(std::move(node)) {}

    // Wrap an explicit-state machine in the alternative matching its purity
    static auto from_machine(machine_ptr machine) -> basic_transducer {
        if (machine->effectful()) {
            return basic_transducer(node_type(detail::stateful_effect_node<E, A, B>{std::move(machine)}));
        }
        return basic_transducer(node_type(detail::stateful_pure_node<E, A, B>{std::move(machine)}));
    }

    [[nodiscard]] auto shape() const noexcept -> transducer_shape {
        return static_cast<transducer_shape>(_node.index());
    }

    [[nodiscard]] auto node() const noexcept -> const node_type& {
        return _node;
    }

    // True when built from an effectful constructor or composed with one
    [[nodiscard]] auto effectful() const -> bool;

    [[nodiscard]] auto stateless() const noexcept -> bool {
        return shape() == transducer_shape::stateless_pure || shape() == transducer_shape::stateless_effect;
    }

    // Feed one input; yields the result and the successor
    auto step(const A& input) const -> action_type;

    // Feed one input without going through the effect context.
    // Throws std::logic_error when the transducer is effectful and E performs
    // effects.
    auto step_pure(const A& input) const -> output_type;

    // Append the state of this transducer to a checkpoint
    auto save(checkpoint_writer& out) const -> void;

    // Transducer with this one's behavior and the state read from `in`.
    // Throws decode_exception on exhausted or mismatched input.
    auto load(checkpoint_reader& in) const -> basic_transducer;

private:
    node_type _node;
};

template<typename E, typename A, typename B>
struct output {
    B _result;
    basic_transducer<E, A, B> _next;

    auto result() const -> const B& { return _result; }
    auto next() const -> const basic_transducer<E, A, B>& { return _next; }
};

namespace detail {

/**
 * @brief Behavior of a general transducer
 *
 * Exactly one of the step closures is set. The load closure is the decoding
 * blueprint captured at construction: it reads the checkpoint and rebuilds
 * an equivalent transducer, recursing into sub-component templates.
 */
template<typename E, typename A, typename B>
struct general_behavior {
    using output_type = output<E, A, B>;

    std::function<output_type(const A&)> _pure_step;
    std::function<action_of<E, output_type>(const A&)> _effect_step;
    std::function<void(checkpoint_writer&)> _save;
    std::function<basic_transducer<E, A, B>(checkpoint_reader&)> _load;

    auto run(const A& input) const -> action_of<E, output_type> {
        if (_pure_step) {
            return E::pure(_pure_step(input));
        }
        return _effect_step(input);
    }
};

template<typename E, typename A, typename B>
auto make_general_transducer(
    std::function<output<E, A, B>(const A&)> pure_step,
    std::function<action_of<E, output<E, A, B>>(const A&)> effect_step,
    std::function<void(checkpoint_writer&)> save,
    std::function<basic_transducer<E, A, B>(checkpoint_reader&)> load
) -> basic_transducer<E, A, B> {
    auto behavior = std::make_shared<const general_behavior<E, A, B>>(general_behavior<E, A, B>{
        std::move(pure_step), std::move(effect_step), std::move(save), std::move(load)});
    return basic_transducer<E, A, B>(
        typename basic_transducer<E, A, B>::node_type(general_node<E, A, B>{std::move(behavior)}));
}

} // namespace detail

template<effect_context E, typename A, typename B>
auto basic_transducer<E, A, B>::effectful() const -> bool {
    switch (shape()) {
        case transducer_shape::stateless_pure:
        case transducer_shape::stateful_pure:
            return false;
        case transducer_shape::stateless_effect:
        case transducer_shape::stateful_effect:
            return true;
        case transducer_shape::general:
            return !std::get<detail::general_node<E, A, B>>(_node)._behavior->_pure_step;
    }
    return true;
}

template<effect_context E, typename A, typename B>
auto basic_transducer<E, A, B>::step(const A& input) const -> action_type {
    return std::visit([this, &input](const auto& node) -> action_type {
        using node_t = std::decay_t<decltype(node)>;
        if constexpr (node_t::shape == transducer_shape::stateless_pure) {
            return E::pure(output_type{(*node._function)(input), *this});
        } else if constexpr (node_t::shape == transducer_shape::stateless_effect) {
            return E::map((*node._function)(input), [self = *this](B result) {
                return output_type{std::move(result), self};
            });
        } else if constexpr (detail::is_stateful_node_v<node_t>) {
            return E::map(node._machine->advance_m(input), [](typename detail::state_machine<E, A, B>::step_result stepped) {
                return output_type{std::move(stepped.first), from_machine(std::move(stepped.second))};
            });
        } else {
            return node._behavior->run(input);
        }
    }, _node);
}

template<effect_context E, typename A, typename B>
auto basic_transducer<E, A, B>::step_pure(const A& input) const -> output_type {
    if constexpr (!E::performs_effects) {
        return E::run(step(input));
    } else {
        return std::visit([this, &input](const auto& node) -> output_type {
            using node_t = std::decay_t<decltype(node)>;
            if constexpr (node_t::shape == transducer_shape::stateless_pure) {
                return output_type{(*node._function)(input), *this};
            } else if constexpr (node_t::shape == transducer_shape::stateful_pure) {
                auto stepped = node._machine->advance(input);
                return output_type{std::move(stepped.first), from_machine(std::move(stepped.second))};
            } else if constexpr (detail::is_general_node_v<node_t>) {
                if (!node._behavior->_pure_step) {
                    detail::throw_effectful_pure_step();
                }
                return node._behavior->_pure_step(input);
            } else {
                detail::throw_effectful_pure_step();
            }
        }, _node);
    }
}

template<effect_context E, typename A, typename B>
auto basic_transducer<E, A, B>::save(checkpoint_writer& out) const -> void {
    std::visit([&out](const auto& node) {
        using node_t = std::decay_t<decltype(node)>;
        if constexpr (detail::is_stateful_node_v<node_t>) {
            node._machine->save(out);
        } else if constexpr (detail::is_general_node_v<node_t>) {
            node._behavior->_save(out);
        }
    }, _node);
}

template<effect_context E, typename A, typename B>
auto basic_transducer<E, A, B>::load(checkpoint_reader& in) const -> basic_transducer {
    return std::visit([this, &in](const auto& node) -> basic_transducer {
        using node_t = std::decay_t<decltype(node)>;
        if constexpr (detail::is_stateless_node_v<node_t>) {
            return *this;
        } else if constexpr (detail::is_stateful_node_v<node_t>) {
            return from_machine(node._machine->load(in));
        } else {
            return node._behavior->_load(in);
        }
    }, _node);
}

//=============================================================================
// Aliases
//=============================================================================

// Pure kernel transducer
template<typename A, typename B>
using transducer = basic_transducer<identity_effect, A, B>;

// Transducer whose steps run as folly futures
template<typename A, typename B>
using async_transducer = basic_transducer<future_effect, A, B>;

//=============================================================================
// Stepping helpers
//=============================================================================

// Result of one step, successor discarded
template<typename E, typename A, typename B>
auto evaluate(const basic_transducer<E, A, B>& t, const A& input) -> detail::action_of<E, B> {
    return E::map(t.step(input), [](output<E, A, B> out) { return std::move(out._result); });
}

// Successor after one step, result discarded
template<typename E, typename A, typename B>
auto execute(const basic_transducer<E, A, B>& t, const A& input) -> detail::action_of<E, basic_transducer<E, A, B>> {
    return E::map(t.step(input), [](output<E, A, B> out) { return std::move(out._next); });
}

// Step through every input in order (pure kernel only), collecting results
// and leaving the final successor in `t`
template<typename A, typename B>
auto step_all(transducer<A, B>& t, const std::vector<A>& inputs) -> std::vector<B> {
    std::vector<B> results;
    results.reserve(inputs.size());
    for (const auto& input : inputs) {
        auto out = t.step(input);
        results.push_back(std::move(out._result));
        t = std::move(out._next);
    }
    return results;
}

//=============================================================================
// Checkpointing
//=============================================================================

// Encode the state of `t`; stateless transducers encode to zero bytes
template<typename E, typename A, typename B>
auto encode_transducer(const basic_transducer<E, A, B>& t) -> std::vector<std::byte> {
    checkpoint_writer writer;
    t.save(writer);
    return writer.to_bytes();
}

// Rebuild `template_transducer` with the state stored in `data`.
// Stateless templates ignore `data`. Throws decode_exception when the
// checkpoint is malformed or was produced by a differently built transducer.
template<typename E, typename A, typename B>
auto restore_transducer(const basic_transducer<E, A, B>& template_transducer, const std::vector<std::byte>& data)
    -> basic_transducer<E, A, B> {
    if (template_transducer.stateless()) {
        return template_transducer;
    }
    auto reader = checkpoint_reader::from_bytes(data);
    auto restored = template_transducer.load(reader);
    if (!reader.exhausted()) {
        throw decode_exception(
            "Checkpoint has " + std::to_string(reader.remaining()) +
            " unread state entries; it does not match the template");
    }
    return restored;
}

// As restore_transducer, with the decode_exception captured in the result
template<typename E, typename A, typename B>
auto decode_transducer(const basic_transducer<E, A, B>& template_transducer, const std::vector<std::byte>& data)
    -> Try<basic_transducer<E, A, B>> {
    try {
        return Try<basic_transducer<E, A, B>>(restore_transducer(template_transducer, data));
    } catch (const decode_exception&) {
        return Try<basic_transducer<E, A, B>>(std::current_exception());
    }
}

} // namespace stepwise
