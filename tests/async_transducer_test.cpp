#define BOOST_TEST_MODULE AsyncTransducerTest
#include <boost/test/unit_test.hpp>

#include <stepwise/composition.hpp>
#include <stepwise/constructors.hpp>
#include <stepwise/effect.hpp>
#include <stepwise/future.hpp>
#include <stepwise/transducer.hpp>

#include <atomic>
#include <exception>
#include <memory>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

namespace {
    using stepwise::future_effect;
    using stepwise::FutureFactory;

    template<typename A, typename B>
    using async_t = stepwise::async_transducer<A, B>;

    auto running_sum() -> stepwise::transducer<int, int> {
        return stepwise::make_accum<int>([](const int& acc, const int& x) { return acc + x; }, 0);
    }

    // Doubles its input, counting how often it ran
    auto counted_doubler(std::shared_ptr<std::atomic<int>> calls) -> async_t<int, int> {
        return stepwise::make_func_m<future_effect, int, int>([calls](const int& x) {
            ++*calls;
            return FutureFactory::makeFuture(x * 2);
        });
    }

    auto failing() -> async_t<int, int> {
        return stepwise::make_func_m<future_effect, int, int>([](const int&) {
            return FutureFactory::makeExceptionalFuture<int>(
                std::make_exception_ptr(std::runtime_error("step failed")));
        });
    }

    template<typename A, typename B>
    auto run_all(async_t<A, B> t, const std::vector<A>& inputs) -> std::vector<B> {
        std::vector<B> results;
        for (const auto& input : inputs) {
            auto out = t.step(input).get();
            results.push_back(out.result());
            t = out.next();
        }
        return results;
    }
}

BOOST_AUTO_TEST_CASE(test_func_m_runs_in_future, * boost::unit_test::timeout(10)) {
    auto calls = std::make_shared<std::atomic<int>>(0);
    auto t = counted_doubler(calls);
    BOOST_CHECK_EQUAL(t.shape(), stepwise::transducer_shape::stateless_effect);
    BOOST_CHECK(t.effectful());

    auto out = t.step(21).get();
    BOOST_CHECK_EQUAL(out.result(), 42);
    BOOST_CHECK_EQUAL(calls->load(), 1);
}

BOOST_AUTO_TEST_CASE(test_state_m_threads_state, * boost::unit_test::timeout(10)) {
    auto t = stepwise::make_state_m<future_effect, int, int, int>(
        [](const int& x, const int& total) {
            return FutureFactory::makeFuture(std::pair<int, int>{total + x, total + x});
        },
        0);
    BOOST_CHECK_EQUAL(t.shape(), stepwise::transducer_shape::stateful_effect);

    auto results = run_all(t, std::vector<int>{1, 2, 3});
    std::vector<int> expected{1, 3, 6};
    BOOST_CHECK_EQUAL_COLLECTIONS(results.begin(), results.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(test_effectful_composed_with_pure, * boost::unit_test::timeout(10)) {
    auto calls = std::make_shared<std::atomic<int>>(0);
    auto t = counted_doubler(calls) >> stepwise::generalize<future_effect>(running_sum());
    BOOST_CHECK_EQUAL(t.shape(), stepwise::transducer_shape::stateful_effect);

    auto results = run_all(t, std::vector<int>{1, 2, 3});
    std::vector<int> expected{2, 6, 12};
    BOOST_CHECK_EQUAL_COLLECTIONS(results.begin(), results.end(), expected.begin(), expected.end());
    BOOST_CHECK_EQUAL(calls->load(), 3);

    auto plus_one = stepwise::make_func<int, future_effect>([](const int& x) { return x + 1; });
    auto stateless = plus_one >> counted_doubler(calls);
    BOOST_CHECK_EQUAL(stateless.shape(), stepwise::transducer_shape::stateless_effect);
    BOOST_CHECK_EQUAL(stateless.step(4).get().result(), 10);
}

BOOST_AUTO_TEST_CASE(test_failure_propagates_through_composition, * boost::unit_test::timeout(10)) {
    auto t = stepwise::generalize<future_effect>(running_sum()) >> failing();
    BOOST_CHECK_THROW(t.step(1).get(), std::runtime_error);

    // A failed step has no successor; the original is still usable
    auto healthy = stepwise::generalize<future_effect>(running_sum());
    BOOST_CHECK_EQUAL(healthy.step(5).get().result(), 5);
}

BOOST_AUTO_TEST_CASE(test_step_pure_rejects_effectful_transducers, * boost::unit_test::timeout(10)) {
    auto calls = std::make_shared<std::atomic<int>>(0);
    BOOST_CHECK_THROW(counted_doubler(calls).step_pure(1), std::logic_error);
    BOOST_CHECK_EQUAL(calls->load(), 0);

    auto pure = stepwise::generalize<future_effect>(running_sum());
    BOOST_CHECK(!pure.effectful());
    BOOST_CHECK_EQUAL(pure.step_pure(3).result(), 3);
}

BOOST_AUTO_TEST_CASE(test_generalize_keeps_results_and_checkpoints, * boost::unit_test::timeout(10)) {
    auto general = stepwise::to_general(running_sum() >> running_sum());
    std::vector<stepwise::transducer<int, int>> kernels{
        stepwise::make_func<int>([](const int& x) { return x - 1; }),
        running_sum(),
        running_sum() >> running_sum(),
        general,
    };
    const std::vector<int> inputs{3, 1, 4, 1, 5};

    for (const auto& kernel : kernels) {
        auto pure = kernel;
        auto expected = stepwise::step_all(pure, inputs);
        auto lifted = stepwise::generalize<future_effect>(kernel);
        BOOST_CHECK_EQUAL(lifted.shape() == stepwise::transducer_shape::general, kernel.shape() == stepwise::transducer_shape::general);
        auto actual = run_all(lifted, inputs);
        BOOST_CHECK_EQUAL_COLLECTIONS(actual.begin(), actual.end(), expected.begin(), expected.end());

        auto lifted_after = stepwise::generalize<future_effect>(kernel);
        for (const auto& input : inputs) {
            lifted_after = lifted_after.step(input).get().next();
        }
        BOOST_CHECK(stepwise::encode_transducer(lifted_after) == stepwise::encode_transducer(pure));

        // A lifted checkpoint restores into the lifted template
        auto restored = stepwise::restore_transducer(
            stepwise::generalize<future_effect>(kernel), stepwise::encode_transducer(pure));
        BOOST_CHECK_EQUAL(
            restored.step(10).get().result(),
            stepwise::evaluate(pure, 10));
    }
}

BOOST_AUTO_TEST_CASE(test_hoist_blocks_futures_into_pure_kernel, * boost::unit_test::timeout(10)) {
    auto block = [](auto pending) { return std::move(pending).get(); };
    auto calls = std::make_shared<std::atomic<int>>(0);
    auto summed = counted_doubler(calls) >> stepwise::generalize<future_effect>(running_sum());
    std::vector<async_t<int, int>> pipelines{
        counted_doubler(calls),
        summed,
        stepwise::to_general(summed),
    };
    const std::vector<int> inputs{3, 1, 4};

    for (const auto& pipeline : pipelines) {
        auto expected = run_all(pipeline, inputs);

        auto blocking = stepwise::hoist<stepwise::identity_effect>(pipeline, block);
        BOOST_CHECK_EQUAL(blocking.shape(), pipeline.shape());
        auto actual = stepwise::step_all(blocking, inputs);
        BOOST_CHECK_EQUAL_COLLECTIONS(actual.begin(), actual.end(), expected.begin(), expected.end());

        auto async_after = pipeline;
        for (const auto& input : inputs) {
            async_after = async_after.step(input).get().next();
        }
        BOOST_CHECK(stepwise::encode_transducer(blocking) == stepwise::encode_transducer(async_after));

        auto restored = stepwise::restore_transducer(
            stepwise::hoist<stepwise::identity_effect>(pipeline, block), stepwise::encode_transducer(async_after));
        BOOST_CHECK_EQUAL(stepwise::evaluate(restored, 10), async_after.step(10).get().result());
    }
}

BOOST_AUTO_TEST_CASE(test_hoist_lifts_identity_actions_into_futures, * boost::unit_test::timeout(10)) {
    auto lift = [](auto value) { return FutureFactory::makeFuture(std::move(value)); };
    auto incremented = stepwise::make_func_m<stepwise::identity_effect, int, int>([](const int& x) { return x + 1; });
    auto t = stepwise::hoist<future_effect>(incremented >> running_sum(), lift);
    BOOST_CHECK(t.effectful());

    auto results = run_all(t, std::vector<int>{1, 2, 3});
    std::vector<int> expected{2, 5, 9};
    BOOST_CHECK_EQUAL_COLLECTIONS(results.begin(), results.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(test_parallel_runs_both_effects, * boost::unit_test::timeout(10)) {
    auto left_calls = std::make_shared<std::atomic<int>>(0);
    auto right_calls = std::make_shared<std::atomic<int>>(0);
    auto t = stepwise::parallel(
        counted_doubler(left_calls),
        counted_doubler(right_calls) >> stepwise::generalize<future_effect>(running_sum()),
        [](const int& a, const int& b) { return a + b; });

    auto results = run_all(t, std::vector<int>{1, 2});
    std::vector<int> expected{4, 10};
    BOOST_CHECK_EQUAL_COLLECTIONS(results.begin(), results.end(), expected.begin(), expected.end());
    BOOST_CHECK_EQUAL(left_calls->load(), 2);
    BOOST_CHECK_EQUAL(right_calls->load(), 2);
}

BOOST_AUTO_TEST_CASE(test_choice_runs_selected_effect_only, * boost::unit_test::timeout(10)) {
    auto left_calls = std::make_shared<std::atomic<int>>(0);
    auto right_calls = std::make_shared<std::atomic<int>>(0);
    auto t = stepwise::choice(counted_doubler(left_calls), counted_doubler(right_calls));

    using input_t = std::variant<int, int>;
    auto out = t.step(input_t(std::in_place_index<1>, 5)).get();
    BOOST_CHECK_EQUAL(out.result().index(), 1U);
    BOOST_CHECK_EQUAL(std::get<1>(out.result()), 10);
    BOOST_CHECK_EQUAL(left_calls->load(), 0);
    BOOST_CHECK_EQUAL(right_calls->load(), 1);
}

BOOST_AUTO_TEST_CASE(test_async_checkpoint_round_trip, * boost::unit_test::timeout(10)) {
    auto make = [] {
        return stepwise::make_state_m<future_effect, int, int, int>(
            [](const int& x, const int& count) {
                return FutureFactory::makeFuture(std::pair<int, int>{x * count, count + 1});
            },
            1);
    };

    auto t = make();
    t = t.step(0).get().next();
    t = t.step(0).get().next();

    auto restored = stepwise::restore_transducer(make(), stepwise::encode_transducer(t));
    BOOST_CHECK_EQUAL(restored.step(10).get().result(), 30);
}
