#pragma once

#include <stepwise/exceptions.hpp>
#include <stepwise/logger.hpp>
#include <stepwise/metrics.hpp>
#include <stepwise/persistence.hpp>
#include <stepwise/transducer.hpp>
#include <stepwise/types.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stepwise {

/**
 * @brief Keeps a running transducer, feeds it and checkpoints it
 *
 * The driver owns the current transducer. feed() steps it (blocking on the
 * effect context), keeps the successor and checkpoints into the store every
 * checkpoint_interval() steps. resume() restores the current transducer
 * from the store, decoding against the template the driver was built with.
 *
 * Not thread-safe.
 *
 * @tparam E Effect context
 * @tparam A Input type
 * @tparam B Result type
 * @tparam Store Checkpoint store
 * @tparam Logger Diagnostic logger
 * @tparam Metrics Metrics sink
 * @tparam Config Driver configuration
 */
template<
    typename E,
    typename A,
    typename B,
    typename Store,
    typename Logger,
    typename Metrics,
    typename Config = driver_configuration
>
requires
    checkpoint_store<Store> &&
    diagnostic_logger<Logger> &&
    metrics<Metrics> &&
    driver_configuration_type<Config>
class driver {
public:
    using transducer_type = basic_transducer<E, A, B>;

    // Throws configuration_exception when `config` is not valid
    driver(
        transducer_type template_transducer,
        Store store,
        Logger logger,
        Metrics metrics,
        Config config = Config{}
    );

    // Restore the current transducer from the store. Returns false when there
    // was no checkpoint, or when it did not decode and the configuration
    // asks for a reset; rethrows the decode_exception otherwise.
    auto resume() -> bool;

    // Step the current transducer once. On failure the current transducer is
    // unchanged and the exception propagates. An automatic checkpoint over
    // the size limit is skipped and logged; the step still counts.
    auto feed(const A& input) -> B;

    auto feed_all(const std::vector<A>& inputs) -> std::vector<B>;

    // Write the current state to the store; returns the checkpoint size.
    // Throws checkpoint_size_exception when the checkpoint is over the limit.
    auto checkpoint() -> std::size_t;

    // Back to the template; the stored checkpoint is erased
    auto reset() -> void;

    [[nodiscard]] auto current() const -> const transducer_type& { return _current; }
    [[nodiscard]] auto steps() const noexcept -> std::uint64_t { return _steps; }
    [[nodiscard]] auto store() -> Store& { return _store; }
    [[nodiscard]] auto logger() -> Logger& { return _logger; }
    [[nodiscard]] auto recorded_metrics() -> Metrics& { return _metrics; }
    [[nodiscard]] auto config() const -> const Config& { return _config; }

private:
    auto record(std::string_view name, std::int64_t count, std::chrono::steady_clock::duration elapsed) -> void;

    transducer_type _template;
    transducer_type _current;
    Store _store;
    Logger _logger;
    Metrics _metrics;
    Config _config;
    std::uint64_t _steps{0};
    std::uint64_t _steps_since_checkpoint{0};
};

namespace detail {

template<typename Config>
auto validated(Config config) -> Config {
    if (!config.is_valid()) {
        throw configuration_exception(
            "Invalid driver configuration: checkpoint key must be non-empty and the checkpoint size limit positive");
    }
    return config;
}

} // namespace detail

template<typename E, typename A, typename B, typename Store, typename Logger, typename Metrics, typename Config>
requires
    checkpoint_store<Store> &&
    diagnostic_logger<Logger> &&
    metrics<Metrics> &&
    driver_configuration_type<Config>
driver<E, A, B, Store, Logger, Metrics, Config>::driver(
    transducer_type template_transducer,
    Store store,
    Logger logger,
    Metrics metrics,
    Config config
)
    : _template{template_transducer}
    , _current{std::move(template_transducer)}
    , _store{std::move(store)}
    , _logger{std::move(logger)}
    , _metrics{std::move(metrics)}
    , _config{detail::validated(std::move(config))}
{
    std::ostringstream shape;
    shape << _template.shape();
    _logger.debug("Driver created", {
        {"checkpoint_key", _config.checkpoint_key()},
        {"checkpoint_interval", std::to_string(_config.checkpoint_interval())},
        {"shape", shape.str()}
    });
}

template<typename E, typename A, typename B, typename Store, typename Logger, typename Metrics, typename Config>
requires
    checkpoint_store<Store> &&
    diagnostic_logger<Logger> &&
    metrics<Metrics> &&
    driver_configuration_type<Config>
auto driver<E, A, B, Store, Logger, Metrics, Config>::resume() -> bool {
    auto saved = _store.load(_config.checkpoint_key());
    if (!saved.has_value()) {
        _logger.info("No checkpoint found, starting from template", {
            {"checkpoint_key", _config.checkpoint_key()}
        });
        _current = _template;
        _steps_since_checkpoint = 0;
        return false;
    }

    auto start = std::chrono::steady_clock::now();
    try {
        _current = restore_transducer(_template, *saved);
    } catch (const decode_exception& e) {
        _logger.warning("Checkpoint does not match template", {
            {"checkpoint_key", _config.checkpoint_key()},
            {"bytes", std::to_string(saved->size())},
            {"error", e.what()},
            {"policy", _config.reset_on_decode_failure() ? "reset" : "rethrow"}
        });
        record("stepwise.decode_failure", 1, std::chrono::steady_clock::now() - start);
        if (!_config.reset_on_decode_failure()) {
            throw;
        }
        _current = _template;
        _steps_since_checkpoint = 0;
        return false;
    }

    _steps_since_checkpoint = 0;
    record("stepwise.resume", 1, std::chrono::steady_clock::now() - start);
    _logger.info("Resumed from checkpoint", {
        {"checkpoint_key", _config.checkpoint_key()},
        {"bytes", std::to_string(saved->size())}
    });
    return true;
}

template<typename E, typename A, typename B, typename Store, typename Logger, typename Metrics, typename Config>
requires
    checkpoint_store<Store> &&
    diagnostic_logger<Logger> &&
    metrics<Metrics> &&
    driver_configuration_type<Config>
auto driver<E, A, B, Store, Logger, Metrics, Config>::feed(const A& input) -> B {
    auto start = std::chrono::steady_clock::now();
    auto out = E::run(_current.step(input));
    _current = std::move(out._next);
    ++_steps;
    ++_steps_since_checkpoint;
    record("stepwise.step", 1, std::chrono::steady_clock::now() - start);

    if (_config.checkpoint_interval() > 0 && _steps_since_checkpoint >= _config.checkpoint_interval()) {
        try {
            checkpoint();
        } catch (const checkpoint_size_exception& e) {
            // The previous checkpoint stays in the store; retry after another interval
            _steps_since_checkpoint = 0;
            record("stepwise.checkpoint_skipped", 1, std::chrono::steady_clock::now() - start);
            _logger.warning("Automatic checkpoint skipped", {
                {"checkpoint_key", _config.checkpoint_key()},
                {"bytes", std::to_string(e.size())},
                {"steps", std::to_string(_steps)}
            });
        }
    }
    return std::move(out._result);
}

template<typename E, typename A, typename B, typename Store, typename Logger, typename Metrics, typename Config>
requires
    checkpoint_store<Store> &&
    diagnostic_logger<Logger> &&
    metrics<Metrics> &&
    driver_configuration_type<Config>
auto driver<E, A, B, Store, Logger, Metrics, Config>::feed_all(const std::vector<A>& inputs) -> std::vector<B> {
    std::vector<B> results;
    results.reserve(inputs.size());
    for (const auto& input : inputs) {
        results.push_back(feed(input));
    }
    return results;
}

template<typename E, typename A, typename B, typename Store, typename Logger, typename Metrics, typename Config>
requires
    checkpoint_store<Store> &&
    diagnostic_logger<Logger> &&
    metrics<Metrics> &&
    driver_configuration_type<Config>
auto driver<E, A, B, Store, Logger, Metrics, Config>::checkpoint() -> std::size_t {
    auto start = std::chrono::steady_clock::now();
    auto bytes = encode_transducer(_current);
    if (bytes.size() > _config.max_checkpoint_bytes()) {
        _logger.error("Checkpoint exceeds size limit", {
            {"checkpoint_key", _config.checkpoint_key()},
            {"bytes", std::to_string(bytes.size())},
            {"limit", std::to_string(_config.max_checkpoint_bytes())}
        });
        throw checkpoint_size_exception(bytes.size(), _config.max_checkpoint_bytes());
    }

    _store.save(_config.checkpoint_key(), bytes);
    _steps_since_checkpoint = 0;
    record("stepwise.checkpoint", static_cast<std::int64_t>(bytes.size()), std::chrono::steady_clock::now() - start);
    _logger.debug("Checkpoint written", {
        {"checkpoint_key", _config.checkpoint_key()},
        {"bytes", std::to_string(bytes.size())},
        {"steps", std::to_string(_steps)}
    });
    return bytes.size();
}

template<typename E, typename A, typename B, typename Store, typename Logger, typename Metrics, typename Config>
requires
    checkpoint_store<Store> &&
    diagnostic_logger<Logger> &&
    metrics<Metrics> &&
    driver_configuration_type<Config>
auto driver<E, A, B, Store, Logger, Metrics, Config>::reset() -> void {
    _current = _template;
    _steps_since_checkpoint = 0;
    _store.erase(_config.checkpoint_key());
    _logger.info("Driver reset to template", {
        {"checkpoint_key", _config.checkpoint_key()},
        {"steps", std::to_string(_steps)}
    });
}

template<typename E, typename A, typename B, typename Store, typename Logger, typename Metrics, typename Config>
requires
    checkpoint_store<Store> &&
    diagnostic_logger<Logger> &&
    metrics<Metrics> &&
    driver_configuration_type<Config>
auto driver<E, A, B, Store, Logger, Metrics, Config>::record(
    std::string_view name,
    std::int64_t count,
    std::chrono::steady_clock::duration elapsed
) -> void {
    _metrics.set_metric_name(name);
    _metrics.add_count(count);
    _metrics.add_duration(std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed));
    _metrics.emit();
}

} // namespace stepwise
