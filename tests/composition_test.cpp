#define BOOST_TEST_MODULE CompositionTest
#include <boost/test/unit_test.hpp>

#include <stepwise/composition.hpp>
#include <stepwise/constructors.hpp>
#include <stepwise/transducer.hpp>

#include <cstddef>
#include <random>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace {
    constexpr std::size_t property_test_iterations = 100;
    constexpr std::size_t max_stream_length = 40;
    constexpr int max_input_value = 1000;

    using shape = stepwise::transducer_shape;

    auto doubler() -> stepwise::transducer<int, int> {
        return stepwise::make_func<int>([](const int& x) { return x * 2; });
    }

    auto incrementer_m() -> stepwise::transducer<int, int> {
        return stepwise::make_func_m<stepwise::identity_effect, int, int>([](const int& x) { return x + 1; });
    }

    auto running_sum() -> stepwise::transducer<int, int> {
        return stepwise::make_accum<int>([](const int& acc, const int& x) { return acc + x; }, 0);
    }

    auto step_counter() -> stepwise::transducer<int, int> {
        return stepwise::make_accum<int>([](const int& count, const int&) { return count + 1; }, 0);
    }

    // Remembers the previous input
    auto previous() -> stepwise::transducer<int, int> {
        return stepwise::make_state<int>(
            [](const int& input, const int& last) { return std::pair<int, int>{last, input}; },
            0);
    }

    auto general_sum() -> stepwise::transducer<int, int> {
        return stepwise::to_general(running_sum());
    }

    auto generate_stream(std::mt19937& rng) -> std::vector<int> {
        std::uniform_int_distribution<std::size_t> length_dist(1, max_stream_length);
        std::uniform_int_distribution<int> value_dist(-max_input_value, max_input_value);
        std::vector<int> stream(length_dist(rng));
        for (auto& value : stream) {
            value = value_dist(rng);
        }
        return stream;
    }

    template<typename A, typename B>
    auto run(stepwise::transducer<A, B> t, const std::vector<A>& inputs) -> std::vector<B> {
        return stepwise::step_all(t, inputs);
    }
}

BOOST_AUTO_TEST_CASE(test_sequential_composition_shapes, * boost::unit_test::timeout(10)) {
    BOOST_CHECK_EQUAL(stepwise::compose(doubler(), doubler()).shape(), shape::stateless_pure);
    BOOST_CHECK_EQUAL(stepwise::compose(doubler(), incrementer_m()).shape(), shape::stateless_effect);
    BOOST_CHECK_EQUAL(stepwise::compose(incrementer_m(), doubler()).shape(), shape::stateless_effect);
    BOOST_CHECK_EQUAL(stepwise::compose(running_sum(), doubler()).shape(), shape::stateful_pure);
    BOOST_CHECK_EQUAL(stepwise::compose(doubler(), running_sum()).shape(), shape::stateful_pure);
    BOOST_CHECK_EQUAL(stepwise::compose(running_sum(), previous()).shape(), shape::stateful_pure);
    BOOST_CHECK_EQUAL(stepwise::compose(running_sum(), incrementer_m()).shape(), shape::stateful_effect);
    BOOST_CHECK_EQUAL(stepwise::compose(general_sum(), doubler()).shape(), shape::general);
    BOOST_CHECK_EQUAL(stepwise::compose(running_sum(), general_sum()).shape(), shape::general);
}

BOOST_AUTO_TEST_CASE(test_parallel_and_choice_shapes, * boost::unit_test::timeout(10)) {
    auto add = [](const int& a, const int& b) { return a + b; };
    BOOST_CHECK_EQUAL(stepwise::parallel(doubler(), doubler(), add).shape(), shape::stateless_pure);
    BOOST_CHECK_EQUAL(stepwise::parallel(doubler(), incrementer_m(), add).shape(), shape::stateless_effect);
    BOOST_CHECK_EQUAL(stepwise::parallel(doubler(), running_sum(), add).shape(), shape::stateful_pure);
    BOOST_CHECK_EQUAL(stepwise::parallel(general_sum(), doubler(), add).shape(), shape::general);

    BOOST_CHECK_EQUAL(stepwise::choice(doubler(), doubler()).shape(), shape::stateless_pure);
    BOOST_CHECK_EQUAL(stepwise::choice(incrementer_m(), doubler()).shape(), shape::stateless_effect);
    BOOST_CHECK_EQUAL(stepwise::choice(running_sum(), doubler()).shape(), shape::stateful_pure);
    BOOST_CHECK_EQUAL(stepwise::choice(doubler(), general_sum()).shape(), shape::general);
}

BOOST_AUTO_TEST_CASE(test_compose_feeds_results_forward, * boost::unit_test::timeout(10)) {
    // running_sum after doubler: sums of doubled inputs
    auto t = stepwise::compose(running_sum(), doubler());
    auto results = run(t, std::vector<int>{1, 2, 3});
    std::vector<int> expected{2, 6, 12};
    BOOST_CHECK_EQUAL_COLLECTIONS(results.begin(), results.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(test_pipeline_operators, * boost::unit_test::timeout(10)) {
    auto forward = doubler() >> running_sum() >> previous();
    auto backward = previous() << running_sum() << doubler();
    auto inputs = std::vector<int>{1, 2, 3, 4};
    auto forward_results = run(forward, inputs);
    auto backward_results = run(backward, inputs);
    std::vector<int> expected{0, 2, 6, 12};
    BOOST_CHECK_EQUAL_COLLECTIONS(forward_results.begin(), forward_results.end(), expected.begin(), expected.end());
    BOOST_CHECK_EQUAL_COLLECTIONS(backward_results.begin(), backward_results.end(), expected.begin(), expected.end());
}

/**
 * Property: composing with identity on either side does not change the
 * results of any transducer variant.
 */
BOOST_AUTO_TEST_CASE(property_identity_law, * boost::unit_test::timeout(60)) {
    std::mt19937 rng(std::random_device{}());
    std::vector<stepwise::transducer<int, int>> subjects{
        doubler(), incrementer_m(), running_sum(), previous(), general_sum()};

    std::size_t failures = 0;
    for (std::size_t i = 0; i < property_test_iterations; ++i) {
        auto inputs = generate_stream(rng);
        const auto& f = subjects[i % subjects.size()];

        auto plain = run(f, inputs);
        auto left = run(stepwise::compose(stepwise::identity<int>(), f), inputs);
        auto right = run(stepwise::compose(f, stepwise::identity<int>()), inputs);
        if (plain != left || plain != right) {
            ++failures;
            BOOST_TEST_MESSAGE("Iteration " << i << ": identity law violated for shape " << f.shape());
        }
    }
    BOOST_CHECK_EQUAL(failures, 0);
}

/**
 * Property: (h . g) . f and h . (g . f) produce the same results for every
 * input stream, whatever the variants involved.
 */
BOOST_AUTO_TEST_CASE(property_associativity, * boost::unit_test::timeout(60)) {
    std::mt19937 rng(std::random_device{}());
    std::vector<stepwise::transducer<int, int>> parts{
        doubler(), incrementer_m(), running_sum(), previous(), general_sum(), step_counter()};
    std::uniform_int_distribution<std::size_t> pick(0, parts.size() - 1);

    std::size_t failures = 0;
    for (std::size_t i = 0; i < property_test_iterations; ++i) {
        auto inputs = generate_stream(rng);
        const auto& f = parts[pick(rng)];
        const auto& g = parts[pick(rng)];
        const auto& h = parts[pick(rng)];

        auto grouped_left = stepwise::compose(stepwise::compose(h, g), f);
        auto grouped_right = stepwise::compose(h, stepwise::compose(g, f));
        if (run(grouped_left, inputs) != run(grouped_right, inputs)) {
            ++failures;
            BOOST_TEST_MESSAGE("Iteration " << i << ": associativity violated for shapes "
                << f.shape() << ", " << g.shape() << ", " << h.shape());
        }
    }
    BOOST_CHECK_EQUAL(failures, 0);
}

BOOST_AUTO_TEST_CASE(test_parallel_steps_both_branches, * boost::unit_test::timeout(10)) {
    auto both = stepwise::fanout(step_counter(), running_sum());
    auto results = run(both, std::vector<int>{5, 5, 5});
    BOOST_CHECK_EQUAL(results.back().first, 3);
    BOOST_CHECK_EQUAL(results.back().second, 15);

    auto general_both = stepwise::fanout(stepwise::to_general(step_counter()), running_sum());
    BOOST_CHECK_EQUAL(general_both.shape(), shape::general);
    auto general_results = run(general_both, std::vector<int>{5, 5, 5});
    BOOST_CHECK(general_results == results);
}

BOOST_AUTO_TEST_CASE(test_choice_steps_only_selected_branch, * boost::unit_test::timeout(10)) {
    using input_t = std::variant<int, int>;
    auto t = stepwise::choice(step_counter(), running_sum());

    std::vector<input_t> inputs{
        input_t(std::in_place_index<0>, 7),
        input_t(std::in_place_index<0>, 7),
        input_t(std::in_place_index<1>, 10),
        input_t(std::in_place_index<0>, 7),
        input_t(std::in_place_index<1>, 1)};
    auto results = run(t, inputs);

    BOOST_REQUIRE_EQUAL(results.size(), 5u);
    BOOST_CHECK_EQUAL(results[0].index(), 0u);
    BOOST_CHECK_EQUAL(std::get<0>(results[0]), 1);
    BOOST_CHECK_EQUAL(std::get<0>(results[1]), 2);
    BOOST_CHECK_EQUAL(results[2].index(), 1u);
    BOOST_CHECK_EQUAL(std::get<1>(results[2]), 10);
    // The counter was not stepped on the right-hand input
    BOOST_CHECK_EQUAL(std::get<0>(results[3]), 3);
    BOOST_CHECK_EQUAL(std::get<1>(results[4]), 11);

    auto general_t = stepwise::choice(stepwise::to_general(step_counter()), running_sum());
    BOOST_CHECK(run(general_t, inputs) == results);
}

BOOST_AUTO_TEST_CASE(test_split_first_second, * boost::unit_test::timeout(10)) {
    using pair_t = std::pair<int, int>;
    std::vector<pair_t> inputs{{1, 10}, {2, 20}, {3, 30}};

    auto both = run(stepwise::split(running_sum(), doubler()), inputs);
    BOOST_CHECK(both.back() == (pair_t{6, 60}));

    auto on_first = run(stepwise::first<int>(running_sum()), inputs);
    BOOST_CHECK(on_first.back() == (pair_t{6, 30}));

    auto on_second = run(stepwise::second<int>(running_sum()), inputs);
    BOOST_CHECK(on_second.back() == (pair_t{3, 60}));
}

BOOST_AUTO_TEST_CASE(test_left_right, * boost::unit_test::timeout(10)) {
    using input_t = std::variant<int, std::string>;
    auto t = stepwise::left<std::string>(running_sum());
    auto results = run(t, std::vector<input_t>{input_t(4), input_t(std::string("skip")), input_t(4)});
    BOOST_CHECK_EQUAL(std::get<0>(results[0]), 4);
    BOOST_CHECK_EQUAL(std::get<1>(results[1]), "skip");
    BOOST_CHECK_EQUAL(std::get<0>(results[2]), 8);

    using mirrored_t = std::variant<std::string, int>;
    auto r = stepwise::right<std::string>(running_sum());
    auto mirrored = run(r, std::vector<mirrored_t>{mirrored_t(3), mirrored_t(std::string("x")), mirrored_t(3)});
    BOOST_CHECK_EQUAL(std::get<1>(mirrored[2]), 6);
}

BOOST_AUTO_TEST_CASE(test_map_input_output_dimap, * boost::unit_test::timeout(10)) {
    auto lengths = stepwise::map_input<std::string>(running_sum(), [](const std::string& s) {
        return static_cast<int>(s.size());
    });
    auto length_results = run(lengths, std::vector<std::string>{"ab", "cde"});
    BOOST_CHECK_EQUAL(length_results.back(), 5);

    auto labelled = stepwise::map_output(running_sum(), [](const int& sum) { return "sum=" + std::to_string(sum); });
    auto labelled_results = run(labelled, std::vector<int>{1, 2});
    BOOST_CHECK_EQUAL(labelled_results.back(), "sum=3");

    auto both = stepwise::dimap<std::string>(
        running_sum(),
        [](const std::string& s) { return static_cast<int>(s.size()); },
        [](const int& sum) { return sum * 10; });
    auto both_results = run(both, std::vector<std::string>{"a", "bb"});
    BOOST_CHECK_EQUAL(both_results.back(), 30);
}

BOOST_AUTO_TEST_CASE(test_to_general_preserves_behavior_and_layout, * boost::unit_test::timeout(10)) {
    auto plain = stepwise::compose(running_sum(), previous());
    auto general = stepwise::to_general(plain);
    BOOST_CHECK_EQUAL(general.shape(), shape::general);
    BOOST_CHECK(stepwise::to_general(general).shape() == shape::general);

    std::vector<int> inputs{3, 1, 4, 1, 5};
    for (const auto& input : inputs) {
        auto plain_out = plain.step(input);
        auto general_out = general.step(input);
        BOOST_CHECK_EQUAL(plain_out.result(), general_out.result());
        plain = plain_out.next();
        general = general_out.next();
        BOOST_CHECK(stepwise::encode_transducer(plain) == stepwise::encode_transducer(general));
    }
}
