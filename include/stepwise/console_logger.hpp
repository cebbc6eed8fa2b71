#pragma once

#include <stepwise/logger.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace stepwise {

// Logger writing one line per record:
//   <timestamp> <LEVEL> [<component>] <message> [key=value]...
// Records at error and above go to the error stream, the rest to the output
// stream. Thread-safe.
class console_logger {
public:
    explicit console_logger(
        log_level min_level = log_level::info,
        std::string component = "stepwise",
        std::ostream& out = std::cout,
        std::ostream& err = std::cerr
    )
        : _min_level(min_level)
        , _component(std::move(component))
        , _out(&out)
        , _err(&err) {}

    console_logger(console_logger&& other) noexcept
        : _min_level(other._min_level)
        , _component(std::move(other._component))
        , _out(other._out)
        , _err(other._err) {}

    auto operator=(console_logger&& other) noexcept -> console_logger& {
        if (this != &other) {
            _min_level = other._min_level;
            _component = std::move(other._component);
            _out = other._out;
            _err = other._err;
        }
        return *this;
    }

    console_logger(const console_logger&) = delete;
    auto operator=(const console_logger&) -> console_logger& = delete;

    auto log(log_level level, std::string_view message) -> void {
        write(level, message, nullptr);
    }

    auto log(log_level level, std::string_view message, const log_fields& fields) -> void {
        write(level, message, &fields);
    }

    auto trace(std::string_view message) -> void { log(log_level::trace, message); }
    auto debug(std::string_view message) -> void { log(log_level::debug, message); }
    auto info(std::string_view message) -> void { log(log_level::info, message); }
    auto warning(std::string_view message) -> void { log(log_level::warning, message); }
    auto error(std::string_view message) -> void { log(log_level::error, message); }
    auto critical(std::string_view message) -> void { log(log_level::critical, message); }

    auto trace(std::string_view message, const log_fields& fields) -> void { log(log_level::trace, message, fields); }
    auto debug(std::string_view message, const log_fields& fields) -> void { log(log_level::debug, message, fields); }
    auto info(std::string_view message, const log_fields& fields) -> void { log(log_level::info, message, fields); }
    auto warning(std::string_view message, const log_fields& fields) -> void { log(log_level::warning, message, fields); }
    auto error(std::string_view message, const log_fields& fields) -> void { log(log_level::error, message, fields); }
    auto critical(std::string_view message, const log_fields& fields) -> void { log(log_level::critical, message, fields); }

    auto set_min_level(log_level level) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        _min_level = level;
    }

    [[nodiscard]] auto min_level() const -> log_level {
        std::lock_guard<std::mutex> lock(_mutex);
        return _min_level;
    }

private:
    auto write(log_level level, std::string_view message, const log_fields* fields) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        if (level < _min_level) {
            return;
        }

        // Format the whole record first so a record is never interleaved
        // with output written outside the logger
        std::ostringstream line;
        line << timestamp() << ' ' << level << " [" << _component << "] " << message;
        if (fields != nullptr) {
            for (const auto& [key, value] : *fields) {
                line << " [" << key << '=' << value << ']';
            }
        }
        line << '\n';

        auto& stream = level >= log_level::error ? *_err : *_out;
        stream << line.str();
        stream.flush();
    }

    static auto timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto seconds = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm local{};
        localtime_r(&seconds, &local);

        std::ostringstream oss;
        oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << millis.count();
        return oss.str();
    }

    log_level _min_level;
    std::string _component;
    std::ostream* _out;
    std::ostream* _err;
    mutable std::mutex _mutex;
};

static_assert(diagnostic_logger<console_logger>,
    "console_logger must satisfy diagnostic_logger concept");

} // namespace stepwise
