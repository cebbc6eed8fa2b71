/**
 * @file checkpointed_pipeline.cpp
 * @brief Example of a checkpointed transducer pipeline
 *
 * Builds a small sensor-monitoring pipeline out of stateful transducers,
 * runs it through a driver, stops half way, and resumes it in a second
 * driver from the stored checkpoint.
 */

#include <stepwise/stepwise.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {
    constexpr int alert_threshold = 80;
    constexpr std::int64_t alert_hold_steps = 2;
    constexpr std::uint64_t example_checkpoint_interval = 3;
    constexpr const char* example_checkpoint_key = "sensor-pipeline";

    const std::vector<int> example_readings{61, 64, 85, 70, 66, 90, 91, 72, 60, 58};

    using average_state = std::pair<std::int64_t, std::int64_t>;

    // Mean of every reading seen so far
    auto running_average() -> stepwise::transducer<int, double> {
        return stepwise::make_state<int>(
            [](const int& reading, const average_state& totals) {
                average_state next{totals.first + reading, totals.second + 1};
                return std::pair<double, average_state>{
                    static_cast<double>(next.first) / static_cast<double>(next.second), next};
            },
            average_state{0, 0});
    }

    // "ALERT(<reading>)" for a couple of steps after a reading over the
    // threshold, "ok" otherwise
    auto alert_status() -> stepwise::transducer<int, std::string> {
        auto spikes = stepwise::make_func<int>([](const int& reading) {
            return reading > alert_threshold ? stepwise::emit(reading) : stepwise::no_blip<int>();
        });
        return spikes
            >> stepwise::hold_for<int>(alert_hold_steps)
            >> stepwise::from_interval_with<int>(
                std::string("ok"),
                [](const int& reading) { return "ALERT(" + std::to_string(reading) + ")"; });
    }

    auto monitor() -> stepwise::transducer<int, std::string> {
        return stepwise::parallel(running_average(), alert_status(), [](const double& average, const std::string& status) {
            return "avg=" + std::to_string(average) + " " + status;
        });
    }

    using monitor_driver = stepwise::driver<
        stepwise::identity_effect,
        int,
        std::string,
        stepwise::memory_checkpoint_store,
        stepwise::console_logger,
        stepwise::memory_metrics
    >;

    auto example_config() -> stepwise::driver_configuration {
        stepwise::driver_configuration config;
        config._checkpoint_key = example_checkpoint_key;
        config._checkpoint_interval = example_checkpoint_interval;
        return config;
    }
}

auto demonstrate_uninterrupted_run() -> std::vector<std::string> {
    std::cout << "=== Uninterrupted Run ===\n";
    auto pipeline = monitor();
    auto results = stepwise::step_all(pipeline, example_readings);
    for (std::size_t i = 0; i < results.size(); ++i) {
        std::cout << "  " << example_readings[i] << " -> " << results[i] << "\n";
    }
    return results;
}

auto demonstrate_resumed_run() -> std::vector<std::string> {
    std::cout << "\n=== Interrupted and Resumed Run ===\n";
    std::vector<std::string> results;
    auto split = example_readings.size() / 2;

    stepwise::memory_checkpoint_store survivor;
    {
        monitor_driver first(
            monitor(),
            stepwise::memory_checkpoint_store{},
            stepwise::console_logger(stepwise::log_level::info, "first-run"),
            stepwise::memory_metrics{},
            example_config());
        for (std::size_t i = 0; i < split; ++i) {
            results.push_back(first.feed(example_readings[i]));
        }
        first.checkpoint();
        survivor = first.store();
        std::cout << "  Stopped after " << first.steps() << " steps\n";
    }

    monitor_driver second(
        monitor(),
        survivor,
        stepwise::console_logger(stepwise::log_level::info, "second-run"),
        stepwise::memory_metrics{},
        example_config());
    if (!second.resume()) {
        std::cerr << "  No checkpoint to resume from\n";
    }
    for (std::size_t i = split; i < example_readings.size(); ++i) {
        results.push_back(second.feed(example_readings[i]));
    }
    std::cout << "  Resumed " << second.recorded_metrics().total_count("stepwise.resume")
              << " time(s), fed " << second.steps() << " more steps\n";
    return results;
}

auto main() -> int {
    std::cout << "Stepwise Checkpointed Pipeline Example\n";
    std::cout << "======================================\n\n";

    try {
        auto expected = demonstrate_uninterrupted_run();
        auto actual = demonstrate_resumed_run();

        if (actual != expected) {
            std::cerr << "\nResumed run diverged from the uninterrupted run\n";
            return 1;
        }
        std::cout << "\nResumed run matches the uninterrupted run\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Example failed: " << e.what() << "\n";
        return 1;
    }
}
