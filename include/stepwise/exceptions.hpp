#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace stepwise {

// Base exception for all stepwise errors
class stepwise_exception : public std::runtime_error {
public:
    explicit stepwise_exception(const std::string& message)
        : std::runtime_error(message) {}
};

// Exception for malformed checkpoints or checkpoints that do not match the
// template they are decoded against
class decode_exception : public stepwise_exception {
public:
    explicit decode_exception(const std::string& message)
        : stepwise_exception(message) {}
};

// Exception for invalid driver configuration
class configuration_exception : public stepwise_exception {
public:
    explicit configuration_exception(const std::string& message)
        : stepwise_exception(message) {}
};

// Exception for a checkpoint larger than the configured limit
class checkpoint_size_exception : public stepwise_exception {
public:
    checkpoint_size_exception(std::size_t size, std::size_t limit)
        : stepwise_exception(
            "Checkpoint of " + std::to_string(size) + " bytes exceeds the limit of " +
            std::to_string(limit) + " bytes")
        , _size(size)
        , _limit(limit) {}

    [[nodiscard]] auto size() const noexcept -> std::size_t { return _size; }
    [[nodiscard]] auto limit() const noexcept -> std::size_t { return _limit; }

private:
    std::size_t _size;
    std::size_t _limit;
};

} // namespace stepwise
