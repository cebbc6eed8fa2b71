#pragma once

#include <concepts/effect.hpp>
#include <stepwise/exceptions.hpp>

#include <boost/json.hpp>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace stepwise {

// Checkpoint document layout:
//   {"format": "stepwise-checkpoint", "version": 1,
//    "states": [{"kind": <codec kind>, "value": <encoded state>}, ...]}
// A transducer without serialized state encodes to zero bytes.
inline constexpr std::string_view checkpoint_format_name = "stepwise-checkpoint";
inline constexpr std::int64_t checkpoint_format_version = 1;

//=============================================================================
// Value codecs
//=============================================================================

// Primary template is left undefined; a state type without a codec can only
// be used with the non-resuming constructors or make_state_with().
template<typename T, typename Enable = void>
struct state_codec;

template<>
struct state_codec<bool> {
    static auto kind() -> std::string { return "bool"; }

    static auto encode(const bool& value) -> boost::json::value {
        return boost::json::value(value);
    }

    static auto decode(const boost::json::value& encoded) -> bool {
        if (!encoded.is_bool()) {
            throw decode_exception("Expected boolean state value");
        }
        return encoded.get_bool();
    }
};

template<typename T>
struct state_codec<T, std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>>> {
    static auto kind() -> std::string {
        std::string prefix = std::is_floating_point_v<T> ? "float"
                           : std::is_signed_v<T>         ? "int"
                                                         : "uint";
        return prefix + std::to_string(sizeof(T) * 8);
    }

    static auto encode(const T& value) -> boost::json::value {
        if constexpr (std::is_floating_point_v<T>) {
            // JSON has no literal for these
            if (std::isnan(value)) {
                return boost::json::value("nan");
            }
            if (std::isinf(value)) {
                return boost::json::value(value < 0 ? "-inf" : "inf");
            }
            return boost::json::value(static_cast<double>(value));
        } else if constexpr (std::is_signed_v<T>) {
            return boost::json::value(static_cast<std::int64_t>(value));
        } else {
            return boost::json::value(static_cast<std::uint64_t>(value));
        }
    }

    static auto decode(const boost::json::value& encoded) -> T {
        if constexpr (std::is_floating_point_v<T>) {
            if (encoded.is_string()) {
                return decode_non_finite(encoded.get_string());
            }
        }
        if (!encoded.is_number()) {
            throw decode_exception("Expected numeric state value for " + kind());
        }
        boost::json::error_code ec;
        auto result = encoded.to_number<T>(ec);
        if (ec) {
            throw decode_exception("Numeric state value out of range for " + kind() + ": " + ec.message());
        }
        return result;
    }

private:
    static auto decode_non_finite(const boost::json::string& text) -> T {
        if (text == "nan") {
            return std::numeric_limits<T>::quiet_NaN();
        }
        if (text == "inf") {
            return std::numeric_limits<T>::infinity();
        }
        if (text == "-inf") {
            return -std::numeric_limits<T>::infinity();
        }
        throw decode_exception("Unknown non-finite state value for " + kind() + ": " + std::string(text.data(), text.size()));
    }
};

template<>
struct state_codec<std::string> {
    static auto kind() -> std::string { return "string"; }

    static auto encode(const std::string& value) -> boost::json::value {
        return boost::json::value(std::string_view(value));
    }

    static auto decode(const boost::json::value& encoded) -> std::string {
        if (!encoded.is_string()) {
            throw decode_exception("Expected string state value");
        }
        const auto& text = encoded.get_string();
        return std::string(text.data(), text.size());
    }
};

// Absent encodes as null, present as a one-element array so that nested
// optionals stay distinguishable
template<typename T>
struct state_codec<std::optional<T>> {
    static auto kind() -> std::string { return "optional<" + state_codec<T>::kind() + ">"; }

    static auto encode(const std::optional<T>& value) -> boost::json::value {
        if (!value.has_value()) {
            return nullptr;
        }
        boost::json::array wrapped;
        wrapped.push_back(state_codec<T>::encode(*value));
        return wrapped;
    }

    static auto decode(const boost::json::value& encoded) -> std::optional<T> {
        if (encoded.is_null()) {
            return std::nullopt;
        }
        if (!encoded.is_array() || encoded.get_array().size() != 1) {
            throw decode_exception("Malformed optional state value for " + kind());
        }
        return state_codec<T>::decode(encoded.get_array()[0]);
    }
};

template<typename T, typename U>
struct state_codec<std::pair<T, U>> {
    static auto kind() -> std::string {
        return "pair<" + state_codec<T>::kind() + "," + state_codec<U>::kind() + ">";
    }

    static auto encode(const std::pair<T, U>& value) -> boost::json::value {
        boost::json::array fields;
        fields.push_back(state_codec<T>::encode(value.first));
        fields.push_back(state_codec<U>::encode(value.second));
        return fields;
    }

    static auto decode(const boost::json::value& encoded) -> std::pair<T, U> {
        if (!encoded.is_array() || encoded.get_array().size() != 2) {
            throw decode_exception("Malformed pair state value for " + kind());
        }
        const auto& fields = encoded.get_array();
        return {state_codec<T>::decode(fields[0]), state_codec<U>::decode(fields[1])};
    }
};

template<typename T>
struct state_codec<std::vector<T>> {
    static auto kind() -> std::string { return "vector<" + state_codec<T>::kind() + ">"; }

    static auto encode(const std::vector<T>& value) -> boost::json::value {
        boost::json::array items;
        items.reserve(value.size());
        for (const auto& item : value) {
            items.push_back(state_codec<T>::encode(item));
        }
        return items;
    }

    static auto decode(const boost::json::value& encoded) -> std::vector<T> {
        if (!encoded.is_array()) {
            throw decode_exception("Malformed vector state value for " + kind());
        }
        std::vector<T> result;
        result.reserve(encoded.get_array().size());
        for (const auto& item : encoded.get_array()) {
            result.push_back(state_codec<T>::decode(item));
        }
        return result;
    }
};

// Whether a state_codec specialization exists for T
template<typename T>
concept has_state_codec = state_codec_type<state_codec<T>, T>;

//=============================================================================
// Checkpoint writer and reader
//=============================================================================

// Collects the states of a transducer's components in composition order
class checkpoint_writer {
public:
    auto write(std::string_view kind, boost::json::value encoded) -> void {
        boost::json::object entry;
        entry["kind"] = kind;
        entry["value"] = std::move(encoded);
        _states.push_back(std::move(entry));
    }

    template<typename S, typename Codec = state_codec<S>>
    requires state_codec_type<Codec, S>
    auto put(const S& state) -> void {
        write(Codec::kind(), Codec::encode(state));
    }

    [[nodiscard]] auto empty() const -> bool {
        return _states.empty();
    }

    [[nodiscard]] auto size() const -> std::size_t {
        return _states.size();
    }

    // Serialize into the checkpoint byte format
    [[nodiscard]] auto to_bytes() const -> std::vector<std::byte> {
        if (_states.empty()) {
            return {};
        }
        boost::json::object document;
        document["format"] = checkpoint_format_name;
        document["version"] = checkpoint_format_version;
        document["states"] = _states;
        auto text = boost::json::serialize(document);
        return {reinterpret_cast<const std::byte*>(text.data()),
                reinterpret_cast<const std::byte*>(text.data() + text.size())};
    }

private:
    boost::json::array _states;
};

// Hands out the states of a checkpoint in the order they were written
class checkpoint_reader {
public:
    checkpoint_reader() = default;

    explicit checkpoint_reader(boost::json::array states)
        : _states(std::move(states)) {}

    // Parse the checkpoint byte format; empty input yields an empty reader
    static auto from_bytes(const std::vector<std::byte>& data) -> checkpoint_reader {
        if (data.empty()) {
            return checkpoint_reader{};
        }

        std::string_view text(reinterpret_cast<const char*>(data.data()), data.size());
        boost::json::error_code ec;
        auto parsed = boost::json::parse(text, ec);
        if (ec) {
            throw decode_exception("Checkpoint is not a valid document: " + ec.message());
        }
        if (!parsed.is_object()) {
            throw decode_exception("Checkpoint document must be an object");
        }

        const auto& document = parsed.get_object();
        const auto* format = document.if_contains("format");
        if (format == nullptr || !format->is_string() || format->get_string() != checkpoint_format_name) {
            throw decode_exception("Checkpoint has an unknown format tag");
        }
        const auto* version = document.if_contains("version");
        if (version == nullptr || !version->is_int64() || version->get_int64() != checkpoint_format_version) {
            throw decode_exception("Checkpoint has an unsupported version");
        }
        const auto* states = document.if_contains("states");
        if (states == nullptr || !states->is_array()) {
            throw decode_exception("Checkpoint is missing its state list");
        }
        return checkpoint_reader{states->get_array()};
    }

    // Next encoded state, checked against the kind the template expects
    auto read(std::string_view kind) -> const boost::json::value& {
        if (_position >= _states.size()) {
            throw decode_exception("Checkpoint exhausted: expected state of kind " + std::string(kind));
        }
        const auto& entry = _states[_position];
        if (!entry.is_object()) {
            throw decode_exception("Malformed checkpoint entry at position " + std::to_string(_position));
        }
        const auto& fields = entry.get_object();
        const auto* found_kind = fields.if_contains("kind");
        const auto* value = fields.if_contains("value");
        if (found_kind == nullptr || !found_kind->is_string() || value == nullptr) {
            throw decode_exception("Malformed checkpoint entry at position " + std::to_string(_position));
        }
        if (found_kind->get_string() != kind) {
            throw decode_exception(
                "Checkpoint state kind mismatch at position " + std::to_string(_position) +
                ": expected " + std::string(kind) +
                ", found " + std::string(found_kind->get_string().data(), found_kind->get_string().size()));
        }
        ++_position;
        return *value;
    }

    template<typename S, typename Codec = state_codec<S>>
    requires state_codec_type<Codec, S>
    auto get() -> S {
        return Codec::decode(read(Codec::kind()));
    }

    [[nodiscard]] auto remaining() const -> std::size_t {
        return _states.size() - _position;
    }

    [[nodiscard]] auto exhausted() const -> bool {
        return remaining() == 0;
    }

private:
    boost::json::array _states;
    std::size_t _position{0};
};

} // namespace stepwise
