#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stepwise {

// Metrics concept: a metric is named, optionally given dimensions, fed with
// counts, durations or values, then emitted. Emitting starts the next metric.
template<typename M>
concept metrics = requires(
    M metric,
    std::string_view name,
    std::string_view dimension_name,
    std::string_view dimension_value,
    std::int64_t count,
    std::chrono::nanoseconds duration,
    double value
) {
    { metric.set_metric_name(name) } -> std::same_as<void>;
    { metric.add_dimension(dimension_name, dimension_value) } -> std::same_as<void>;

    { metric.add_one() } -> std::same_as<void>;
    { metric.add_count(count) } -> std::same_as<void>;
    { metric.add_duration(duration) } -> std::same_as<void>;
    { metric.add_value(value) } -> std::same_as<void>;

    { metric.emit() } -> std::same_as<void>;
};

// Discards everything
class noop_metrics {
public:
    auto set_metric_name([[maybe_unused]] std::string_view name) -> void {}
    auto add_dimension([[maybe_unused]] std::string_view dimension_name, [[maybe_unused]] std::string_view dimension_value) -> void {}
    auto add_one() -> void {}
    auto add_count([[maybe_unused]] std::int64_t count) -> void {}
    auto add_duration([[maybe_unused]] std::chrono::nanoseconds duration) -> void {}
    auto add_value([[maybe_unused]] double value) -> void {}
    auto emit() -> void {}
};

static_assert(metrics<noop_metrics>, "noop_metrics must satisfy metrics concept");

// Emitted metric as recorded by memory_metrics
struct metric_record {
    std::string _name;
    std::vector<std::pair<std::string, std::string>> _dimensions;
    std::int64_t _count{0};
    std::chrono::nanoseconds _duration{0};
    std::vector<double> _values;

    auto name() const -> const std::string& { return _name; }
    auto count() const -> std::int64_t { return _count; }
    auto duration() const -> std::chrono::nanoseconds { return _duration; }
    auto values() const -> const std::vector<double>& { return _values; }
};

// Keeps every emitted metric in memory. Copies share nothing.
class memory_metrics {
public:
    auto set_metric_name(std::string_view name) -> void {
        _pending._name = std::string(name);
    }

    auto add_dimension(std::string_view dimension_name, std::string_view dimension_value) -> void {
        _pending._dimensions.emplace_back(std::string(dimension_name), std::string(dimension_value));
    }

    auto add_one() -> void {
        ++_pending._count;
    }

    auto add_count(std::int64_t count) -> void {
        _pending._count += count;
    }

    auto add_duration(std::chrono::nanoseconds duration) -> void {
        _pending._duration += duration;
    }

    auto add_value(double value) -> void {
        _pending._values.push_back(value);
    }

    auto emit() -> void {
        _emitted.push_back(std::move(_pending));
        _pending = metric_record{};
    }

    [[nodiscard]] auto emitted() const -> const std::vector<metric_record>& {
        return _emitted;
    }

    // Sum of the counts of every emitted metric called `name`
    [[nodiscard]] auto total_count(std::string_view name) const -> std::int64_t {
        std::int64_t total = 0;
        for (const auto& record : _emitted) {
            if (record._name == name) {
                total += record._count;
            }
        }
        return total;
    }

private:
    metric_record _pending;
    std::vector<metric_record> _emitted;
};

static_assert(metrics<memory_metrics>, "memory_metrics must satisfy metrics concept");

} // namespace stepwise
