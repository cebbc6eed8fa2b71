#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace stepwise {

// Representational variants of a transducer, in variant index order
enum class transducer_shape : std::uint8_t {
    stateless_pure,
    stateless_effect,
    stateful_pure,
    stateful_effect,
    general
};

// Output operator for transducer_shape (for testing and logging)
inline auto operator<<(std::ostream& os, transducer_shape shape) -> std::ostream& {
    switch (shape) {
        case transducer_shape::stateless_pure:
            return os << "stateless_pure";
        case transducer_shape::stateless_effect:
            return os << "stateless_effect";
        case transducer_shape::stateful_pure:
            return os << "stateful_pure";
        case transducer_shape::stateful_effect:
            return os << "stateful_effect";
        case transducer_shape::general:
            return os << "general";
        default:
            return os << "unknown";
    }
}

// Driver configuration concept
template<typename T>
concept driver_configuration_type = requires(const T& config) {
    { config.checkpoint_key() } -> std::convertible_to<std::string>;
    { config.checkpoint_interval() } -> std::same_as<std::uint64_t>;
    { config.reset_on_decode_failure() } -> std::convertible_to<bool>;
    { config.max_checkpoint_bytes() } -> std::same_as<std::size_t>;
    { config.is_valid() } -> std::convertible_to<bool>;
};

// Default driver configuration
struct driver_configuration {
    // Store key the driver checkpoints under
    std::string _checkpoint_key{"default"};
    // Steps between automatic checkpoints; 0 disables them
    std::uint64_t _checkpoint_interval{0};
    // On a checkpoint that does not decode: start from the template (true)
    // or rethrow the decode_exception (false)
    bool _reset_on_decode_failure{true};
    std::size_t _max_checkpoint_bytes{16 * 1024 * 1024};

    auto checkpoint_key() const -> const std::string& { return _checkpoint_key; }
    auto checkpoint_interval() const -> std::uint64_t { return _checkpoint_interval; }
    auto reset_on_decode_failure() const -> bool { return _reset_on_decode_failure; }
    auto max_checkpoint_bytes() const -> std::size_t { return _max_checkpoint_bytes; }

    auto is_valid() const -> bool {
        return !_checkpoint_key.empty() && _max_checkpoint_bytes > 0;
    }
};

static_assert(driver_configuration_type<driver_configuration>,
    "driver_configuration must satisfy driver_configuration_type concept");

} // namespace stepwise
