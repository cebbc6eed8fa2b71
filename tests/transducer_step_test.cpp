#define BOOST_TEST_MODULE TransducerStepTest
#include <boost/test/unit_test.hpp>

#include <stepwise/constructors.hpp>
#include <stepwise/transducer.hpp>
#include <stepwise/types.hpp>

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {
    constexpr int test_multiplier = 3;
    const std::vector<int> test_inputs{1, 2, 3, 4};

    auto running_sum() -> stepwise::transducer<int, int> {
        return stepwise::make_state<int>(
            [](const int& input, const int& sum) { return std::pair<int, int>{sum + input, sum + input}; },
            0);
    }

    auto counter_from(int start) -> stepwise::transducer<int, int> {
        return stepwise::make_general_<int, int>([start](const int& increment) {
            return stepwise::output<stepwise::identity_effect, int, int>{start + increment, counter_from(start + increment)};
        });
    }
}

BOOST_AUTO_TEST_CASE(test_make_const_ignores_input, * boost::unit_test::timeout(10)) {
    auto t = stepwise::make_const<int>(std::string("tick"));

    BOOST_CHECK_EQUAL(t.shape(), stepwise::transducer_shape::stateless_pure);
    auto results = stepwise::step_all(t, test_inputs);
    BOOST_CHECK_EQUAL(results.size(), test_inputs.size());
    for (const auto& result : results) {
        BOOST_CHECK_EQUAL(result, "tick");
    }
}

BOOST_AUTO_TEST_CASE(test_make_func_applies_function, * boost::unit_test::timeout(10)) {
    auto t = stepwise::make_func<int>([](const int& x) { return x * test_multiplier; });

    BOOST_CHECK_EQUAL(t.shape(), stepwise::transducer_shape::stateless_pure);
    BOOST_CHECK(t.stateless());
    BOOST_CHECK(!t.effectful());

    auto results = stepwise::step_all(t, test_inputs);
    std::vector<int> expected{3, 6, 9, 12};
    BOOST_CHECK_EQUAL_COLLECTIONS(results.begin(), results.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(test_identity_passes_input_through, * boost::unit_test::timeout(10)) {
    auto t = stepwise::identity<std::string>();
    auto out = t.step("unchanged");
    BOOST_CHECK_EQUAL(out.result(), "unchanged");
    BOOST_CHECK_EQUAL(out.next().shape(), stepwise::transducer_shape::stateless_pure);
}

BOOST_AUTO_TEST_CASE(test_make_state_threads_state, * boost::unit_test::timeout(10)) {
    auto t = running_sum();
    BOOST_CHECK_EQUAL(t.shape(), stepwise::transducer_shape::stateful_pure);
    BOOST_CHECK(!t.stateless());

    auto results = stepwise::step_all(t, test_inputs);
    std::vector<int> expected{1, 3, 6, 10};
    BOOST_CHECK_EQUAL_COLLECTIONS(results.begin(), results.end(), expected.begin(), expected.end());
    BOOST_CHECK_EQUAL(t.shape(), stepwise::transducer_shape::stateful_pure);
}

BOOST_AUTO_TEST_CASE(test_stepping_leaves_receiver_unchanged, * boost::unit_test::timeout(10)) {
    auto t = running_sum();
    auto first = t.step(5);
    auto again = t.step(5);
    BOOST_CHECK_EQUAL(first.result(), 5);
    BOOST_CHECK_EQUAL(again.result(), 5);

    // Two branches from the same successor evolve independently
    auto left = first.next().step(1);
    auto right = first.next().step(100);
    BOOST_CHECK_EQUAL(left.result(), 6);
    BOOST_CHECK_EQUAL(right.result(), 105);
    BOOST_CHECK_EQUAL(first.next().step(0).result(), 5);
}

BOOST_AUTO_TEST_CASE(test_accumulators, * boost::unit_test::timeout(10)) {
    auto plus = [](const int& acc, const int& x) { return acc + x; };

    auto accum = stepwise::make_accum<int>(plus, 0);
    auto accum_results = stepwise::step_all(accum, test_inputs);
    std::vector<int> accum_expected{1, 3, 6, 10};
    BOOST_CHECK_EQUAL_COLLECTIONS(accum_results.begin(), accum_results.end(), accum_expected.begin(), accum_expected.end());

    auto delayed = stepwise::make_accum_delayed<int>(plus, 0);
    auto delayed_results = stepwise::step_all(delayed, test_inputs);
    std::vector<int> delayed_expected{0, 1, 3, 6};
    BOOST_CHECK_EQUAL_COLLECTIONS(delayed_results.begin(), delayed_results.end(), delayed_expected.begin(), delayed_expected.end());

    auto accum_ = stepwise::make_accum_<int>(plus, 10);
    auto accum_results_ = stepwise::step_all(accum_, test_inputs);
    std::vector<int> accum_expected_{11, 13, 16, 20};
    BOOST_CHECK_EQUAL_COLLECTIONS(accum_results_.begin(), accum_results_.end(), accum_expected_.begin(), accum_expected_.end());

    auto delayed_ = stepwise::make_accum_delayed_<int>(plus, 10);
    auto delayed_results_ = stepwise::step_all(delayed_, test_inputs);
    std::vector<int> delayed_expected_{10, 11, 13, 16};
    BOOST_CHECK_EQUAL_COLLECTIONS(delayed_results_.begin(), delayed_results_.end(), delayed_expected_.begin(), delayed_expected_.end());
}

BOOST_AUTO_TEST_CASE(test_accumulator_with_different_input_type, * boost::unit_test::timeout(10)) {
    auto concat = stepwise::make_accum<char>(
        [](const std::string& acc, const char& c) { return acc + c; },
        std::string{});
    auto results = stepwise::step_all(concat, std::vector<char>{'a', 'b', 'c'});
    BOOST_CHECK_EQUAL(results.back(), "abc");
}

BOOST_AUTO_TEST_CASE(test_general_successor_comes_from_step, * boost::unit_test::timeout(10)) {
    auto t = counter_from(0);
    BOOST_CHECK_EQUAL(t.shape(), stepwise::transducer_shape::general);
    BOOST_CHECK(!t.effectful());

    auto results = stepwise::step_all(t, test_inputs);
    std::vector<int> expected{1, 3, 6, 10};
    BOOST_CHECK_EQUAL_COLLECTIONS(results.begin(), results.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(test_evaluate_and_execute, * boost::unit_test::timeout(10)) {
    auto t = running_sum();
    BOOST_CHECK_EQUAL(stepwise::evaluate(t, 7), 7);

    auto next = stepwise::execute(t, 7);
    BOOST_CHECK_EQUAL(stepwise::evaluate(next, 1), 8);
}

BOOST_AUTO_TEST_CASE(test_step_pure_matches_step, * boost::unit_test::timeout(10)) {
    auto t = running_sum();
    auto by_step = t.step(4);
    auto by_step_pure = t.step_pure(4);
    BOOST_CHECK_EQUAL(by_step.result(), by_step_pure.result());
    BOOST_CHECK_EQUAL(by_step.next().step(1).result(), by_step_pure.next().step(1).result());
}

BOOST_AUTO_TEST_CASE(test_effectful_constructors_in_identity_context, * boost::unit_test::timeout(10)) {
    auto func_m = stepwise::make_func_m<stepwise::identity_effect, int, int>([](const int& x) { return x + 1; });
    BOOST_CHECK_EQUAL(func_m.shape(), stepwise::transducer_shape::stateless_effect);
    BOOST_CHECK_EQUAL(func_m.step(1).result(), 2);

    auto const_m = stepwise::make_const_m<stepwise::identity_effect, int, int>([] { return 42; });
    BOOST_CHECK_EQUAL(const_m.step(0).result(), 42);

    auto state_m = stepwise::make_state_m<stepwise::identity_effect, int, int, int>(
        [](const int& x, const int& s) { return std::pair<int, int>{s * x, s + 1}; },
        1);
    BOOST_CHECK_EQUAL(state_m.shape(), stepwise::transducer_shape::stateful_effect);
    auto results = stepwise::step_all(state_m, std::vector<int>{10, 10, 10});
    std::vector<int> expected{10, 20, 30};
    BOOST_CHECK_EQUAL_COLLECTIONS(results.begin(), results.end(), expected.begin(), expected.end());

    auto accum_m = stepwise::make_accum_m<stepwise::identity_effect, int, int>(
        [](const int& acc, const int& x) { return acc * x; },
        1);
    auto accum_results = stepwise::step_all(accum_m, std::vector<int>{2, 3, 4});
    std::vector<int> accum_expected{2, 6, 24};
    BOOST_CHECK_EQUAL_COLLECTIONS(accum_results.begin(), accum_results.end(), accum_expected.begin(), accum_expected.end());
}

BOOST_AUTO_TEST_CASE(test_non_resuming_constructors_restart_from_initial_state, * boost::unit_test::timeout(10)) {
    auto state_ = stepwise::execute(stepwise::make_state_<int>(
        [](const int& input, const int& sum) { return std::pair<int, int>{sum + input, sum + input}; },
        100), 5);
    BOOST_CHECK_EQUAL(state_.shape(), stepwise::transducer_shape::stateful_pure);
    BOOST_CHECK(stepwise::encode_transducer(state_).empty());
    BOOST_CHECK_EQUAL(stepwise::evaluate(state_, 1), 106);
    auto restored = stepwise::restore_transducer(state_, stepwise::encode_transducer(state_));
    BOOST_CHECK_EQUAL(stepwise::evaluate(restored, 1), 101);

    auto state_m_ = stepwise::execute(stepwise::make_state_m_<stepwise::identity_effect, int, int, int>(
        [](const int& x, const int& s) { return std::pair<int, int>{s * x, s + 1}; },
        1), 10);
    BOOST_CHECK_EQUAL(state_m_.shape(), stepwise::transducer_shape::stateful_effect);
    BOOST_CHECK(stepwise::encode_transducer(state_m_).empty());
    BOOST_CHECK_EQUAL(state_m_.step(10).result(), 20);
    BOOST_CHECK_EQUAL(stepwise::restore_transducer(state_m_, {}).step(10).result(), 10);

    auto accum_m_ = stepwise::execute(stepwise::make_accum_m_<stepwise::identity_effect, int, int>(
        [](const int& acc, const int& x) { return acc * x; },
        1), 5);
    BOOST_CHECK(stepwise::encode_transducer(accum_m_).empty());
    BOOST_CHECK_EQUAL(accum_m_.step(2).result(), 10);
    BOOST_CHECK_EQUAL(stepwise::restore_transducer(accum_m_, {}).step(2).result(), 2);
}

BOOST_AUTO_TEST_CASE(test_shape_output_operator, * boost::unit_test::timeout(10)) {
    std::ostringstream oss;
    oss << stepwise::transducer_shape::stateless_pure << ' '
        << stepwise::transducer_shape::stateful_effect << ' '
        << stepwise::transducer_shape::general;
    BOOST_CHECK_EQUAL(oss.str(), "stateless_pure stateful_effect general");
}
