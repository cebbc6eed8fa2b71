#pragma once

#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace stepwise {

// Checkpoint store concept
// Durable (or not) home for encoded transducer checkpoints, addressed by key
template<typename S>
concept checkpoint_store = requires(
    S store,
    std::string_view key,
    const std::vector<std::byte>& bytes
) {
    { store.save(key, bytes) } -> std::same_as<void>;
    { store.load(key) } -> std::same_as<std::optional<std::vector<std::byte>>>;
    { store.erase(key) } -> std::same_as<void>;
};

// In-memory checkpoint store for testing and development
class memory_checkpoint_store {
public:
    auto save(std::string_view key, const std::vector<std::byte>& bytes) -> void {
        _checkpoints[std::string(key)] = bytes;
    }

    auto load(std::string_view key) -> std::optional<std::vector<std::byte>> {
        auto it = _checkpoints.find(std::string(key));
        if (it != _checkpoints.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    auto erase(std::string_view key) -> void {
        _checkpoints.erase(std::string(key));
    }

    [[nodiscard]] auto contains(std::string_view key) const -> bool {
        return _checkpoints.find(std::string(key)) != _checkpoints.end();
    }

    [[nodiscard]] auto size() const -> std::size_t {
        return _checkpoints.size();
    }

private:
    std::unordered_map<std::string, std::vector<std::byte>> _checkpoints;
};

static_assert(checkpoint_store<memory_checkpoint_store>,
    "memory_checkpoint_store must satisfy checkpoint_store concept");

} // namespace stepwise
