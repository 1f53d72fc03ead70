/**
 * @file test_runtime.cpp
 * @brief Tests for ReactiveRuntime, running effects through the scheduler end to end.
 */

#include <catch2/catch_test_macros.hpp>

#include <ripple/runtime/reactive_runtime.h>
#include <ripple/util/errors.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace ripple;

namespace {
    const Key COUNT{std::string{"count"}};

    /**
     * A runtime driven by a MicrotaskQueue, effects created through it are queued as jobs.
     */
    struct QueuedRuntime {
        MicrotaskQueue::s_ptr queue{new MicrotaskQueue()};
        reactive_runtime_s_ptr runtime;
        target_s_ptr target{new Target(TargetKind::OBJECT, "state")};

        explicit QueuedRuntime(RuntimeConfig config = {}) : runtime{new ReactiveRuntime(config, queue.get())} {}

        effect_s_ptr queued_effect(std::function<void()> fn) {
            EffectOptions options;
            options.scheduler = runtime->queue_job_scheduler();
            return runtime->effect(std::move(fn), std::move(options));
        }

        void read(const Key &key = COUNT) { runtime->track(*target, TrackOpType::GET, key); }

        void write(const Key &key = COUNT) { runtime->trigger(*target, TriggerOpType::SET, key); }
    };
} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("ReactiveRuntime - defaults to a microtask queue and a logging handler", "[runtime]") {
    reactive_runtime_s_ptr runtime{new ReactiveRuntime()};

    CHECK(dynamic_cast_ref<MicrotaskQueue>(runtime->executor()).get() != nullptr);
    CHECK(dynamic_cast_ref<LoggingErrorHandler>(runtime->error_handler()).get() != nullptr);
    CHECK(runtime->config().recursion_limit == DEFAULT_RECURSION_LIMIT);
    CHECK(runtime->config().check_recursive_updates);
    CHECK(runtime->next_effect_id() == 0);
    CHECK(runtime->scheduler().flush_state() == Scheduler::FlushState::IDLE);
}

TEST_CASE("ReactiveRuntime - runtimes do not share tracking state", "[runtime]") {
    reactive_runtime_s_ptr first{new ReactiveRuntime()};
    reactive_runtime_s_ptr second{new ReactiveRuntime()};
    target_s_ptr target{new Target()};

    auto effect = first->effect([&] {
        CHECK(second->tracking().active_effect() == nullptr);
        second->track(*target, TrackOpType::GET, COUNT);
    });

    CHECK_FALSE(target->is_observed());
    CHECK(effect->effect_id() == 0);
    CHECK(second->effect([] {})->effect_id() == 0);
}

// ============================================================================
// Scheduled effects
// ============================================================================

TEST_CASE("ReactiveRuntime - writes in one tick re-run a queued effect once", "[runtime]") {
    QueuedRuntime r;
    int runs = 0;
    auto effect = r.queued_effect([&] {
        ++runs;
        r.read();
    });

    r.write();
    r.write();
    r.write();

    CHECK(runs == 1);
    CHECK(r.runtime->scheduler().queue_size() == 1);
    CHECK(r.queue->size() == 1);

    r.queue->run_pending();
    CHECK(runs == 2);
}

TEST_CASE("ReactiveRuntime - queued effects run in creation order", "[runtime]") {
    QueuedRuntime r;
    const Key first_key{std::string{"first"}};
    const Key second_key{std::string{"second"}};
    std::vector<std::string> order;

    auto first = r.queued_effect([&] {
        order.emplace_back("first");
        r.read(first_key);
    });
    auto second = r.queued_effect([&] {
        order.emplace_back("second");
        r.read(second_key);
    });
    order.clear();

    r.write(second_key);
    r.write(first_key);
    r.queue->run_pending();

    CHECK(order == std::vector<std::string>{"first", "second"});
}

TEST_CASE("ReactiveRuntime - a stopped effect leaves a queued run harmless", "[runtime]") {
    QueuedRuntime r;
    int runs = 0;
    auto effect = r.queued_effect([&] {
        ++runs;
        r.read();
    });

    r.write();
    r.runtime->stop(*effect);
    r.queue->run_pending();

    CHECK(runs == 1);
}

TEST_CASE("ReactiveRuntime - pre-flush callbacks see state before effects re-run", "[runtime]") {
    QueuedRuntime r;
    std::vector<std::string> order;
    auto effect = r.queued_effect([&] {
        order.emplace_back("effect");
        r.read();
    });
    order.clear();

    r.write();
    r.runtime->queue_pre_flush_cb(make_job([&] { order.emplace_back("watcher"); }, std::nullopt, false, "watcher"));
    r.runtime->queue_post_flush_cb(make_job([&] { order.emplace_back("rendered"); }, std::nullopt, false, "rendered"));
    r.queue->run_pending();

    CHECK(order == std::vector<std::string>{"watcher", "effect", "rendered"});
}

TEST_CASE("ReactiveRuntime - shrinking a sequence re-runs an indexed reader once", "[runtime]") {
    QueuedRuntime r;
    target_s_ptr items{new Target(TargetKind::SEQUENCE, "items")};
    int runs = 0;
    auto effect = r.queued_effect([&] {
        ++runs;
        r.runtime->track(*items, TrackOpType::GET, LENGTH_KEY);
        r.runtime->track(*items, TrackOpType::GET, Key{std::int64_t{5}});
    });

    r.runtime->trigger(*items, TriggerOpType::SET, LENGTH_KEY, std::int64_t{3}, std::int64_t{6});
    CHECK(r.runtime->scheduler().queue_size() == 1);

    r.queue->run_pending();
    CHECK(runs == 2);
}

TEST_CASE("ReactiveRuntime - next_tick waits for the effects of a write", "[runtime]") {
    QueuedRuntime r;
    int value = 0;
    int seen = -1;
    auto effect = r.queued_effect([&] {
        r.read();
        ++value;
    });

    r.write();
    r.runtime->next_tick([&] { seen = value; });
    r.queue->run_pending();

    CHECK(seen == 2);
}

// ============================================================================
// Errors
// ============================================================================

TEST_CASE("ReactiveRuntime - a replaced error handler receives effect failures", "[runtime]") {
    QueuedRuntime r;
    std::vector<std::string> messages;
    std::vector<Job *> jobs;
    r.runtime->set_error_handler(new FunctionErrorHandler(
        [&](std::exception_ptr error, Job *job, const void *, ErrorCode) {
            messages.push_back(describe_exception(error));
            jobs.push_back(job);
        }));

    bool fail = false;
    auto effect = r.queued_effect([&] {
        r.read();
        if (fail) { throw std::runtime_error("effect failed"); }
    });
    int other_runs = 0;
    auto other = r.queued_effect([&] {
        ++other_runs;
        r.read();
    });

    fail = true;
    r.write();
    CHECK_NOTHROW(r.queue->run_pending());

    CHECK(messages == std::vector<std::string>{"effect failed"});
    REQUIRE(jobs.size() == 1);
    CHECK(jobs[0] == effect.get());
    CHECK(other_runs == 2);
    CHECK(effect->active());
}

TEST_CASE("ReactiveRuntime - an effect writing its own input hits the recursion limit", "[runtime]") {
    QueuedRuntime r{RuntimeConfig{.recursion_limit = 10}};
    int runs = 0;
    EffectOptions options{.allow_recurse = true};
    options.scheduler = r.runtime->queue_job_scheduler();
    auto effect = r.runtime->effect([&] {
        ++runs;
        r.read();
        r.write();
    }, std::move(options));

    auto tick = r.runtime->next_tick();
    CHECK_THROWS_AS(r.queue->run_pending(), RecursionLimitError);

    CHECK(runs == 12);
    CHECK(tick->is_rejected());
    CHECK_FALSE(r.runtime->scheduler().has_pending_work());
}
