/**
 * @file test_trigger.cpp
 * @brief Unit tests for the key resolution and dispatch performed by trigger.
 */

#include <catch2/catch_test_macros.hpp>

#include <ripple/reactivity/dependency_graph.h>
#include <ripple/runtime/reactive_runtime.h>

#include <cstdint>
#include <limits>
#include <stdexcept>

using namespace ripple;

namespace {
    Key index(std::int64_t i) { return Key{i}; }

    Key name(std::string n) { return Key{std::move(n)}; }

    /**
     * Creates effects that each read one key of a target and counts how often each one runs.
     */
    struct Watchers {
        reactive_runtime_s_ptr runtime{new ReactiveRuntime()};
        target_s_ptr target;
        std::vector<effect_s_ptr> effects;
        std::vector<int> runs;

        explicit Watchers(TargetKind kind) : target{new Target(kind, "watched")} {}

        std::size_t watch(Key key, TrackOpType type = TrackOpType::GET) {
            auto slot = runs.size();
            runs.push_back(0);
            effects.push_back(runtime->effect([this, slot, key = std::move(key), type] {
                ++runs[slot];
                runtime->track(*target, type, key);
            }));
            return slot;
        }

        // Runs after creation, excluding the initial run.
        [[nodiscard]] int reruns(std::size_t slot) const { return runs[slot] - 1; }

        void trigger(TriggerOpType type, std::optional<Key> key = std::nullopt, std::any new_value = {}) {
            runtime->trigger(*target, type, key, new_value);
        }
    };
} // namespace

// ============================================================================
// Dispatch
// ============================================================================

TEST_CASE("trigger - no-op on a target that was never observed", "[reactivity][trigger]") {
    reactive_runtime_s_ptr runtime{new ReactiveRuntime()};
    target_s_ptr target{new Target(TargetKind::SEQUENCE)};

    CHECK_NOTHROW(runtime->trigger(*target, TriggerOpType::SET, LENGTH_KEY, std::string{"not a length"}));
}

TEST_CASE("trigger - an effect subscribed under several keys runs once", "[reactivity][trigger]") {
    reactive_runtime_s_ptr runtime{new ReactiveRuntime()};
    target_s_ptr target{new Target(TargetKind::OBJECT)};
    int runs = 0;

    auto effect = runtime->effect([&] {
        ++runs;
        runtime->track(*target, TrackOpType::GET, name("a"));
        runtime->track(*target, TrackOpType::GET, name("b"));
        runtime->track(*target, TrackOpType::ITERATE, ITERATE_KEY);
    });

    runtime->trigger(*target, TriggerOpType::CLEAR);
    CHECK(runs == 2);
    runtime->trigger(*target, TriggerOpType::ADD, name("c"));
    CHECK(runs == 3);
}

TEST_CASE("trigger - notifications are computed before any effect runs", "[reactivity][trigger]") {
    reactive_runtime_s_ptr runtime{new ReactiveRuntime()};
    target_s_ptr target{new Target(TargetKind::OBJECT)};
    std::vector<std::string> order;
    bool late_subscribe = false;

    auto first = runtime->effect([&] {
        order.emplace_back("first");
        runtime->track(*target, TrackOpType::GET, name("a"));
    });
    auto second = runtime->effect([&] {
        order.emplace_back("second");
        if (late_subscribe) { runtime->track(*target, TrackOpType::GET, name("a")); }
    });

    order.clear();
    late_subscribe = true;
    runtime->trigger(*target, TriggerOpType::SET, name("a"));

    // second was not subscribed when the write happened
    CHECK(order == std::vector<std::string>{"first"});
}

TEST_CASE("trigger - on_trigger receives the write before the effect runs", "[reactivity][trigger]") {
    reactive_runtime_s_ptr runtime{new ReactiveRuntime()};
    target_s_ptr target{new Target(TargetKind::OBJECT, "state")};
    std::vector<std::string> order;
    std::vector<DebuggerEvent> events;

    EffectOptions options;
    options.on_trigger = [&](const DebuggerEvent &event) {
        order.emplace_back("hook");
        events.push_back(event);
    };
    auto effect = runtime->effect([&] {
        order.emplace_back("run");
        runtime->track(*target, TrackOpType::GET, name("a"));
    }, std::move(options));

    order.clear();
    runtime->trigger(*target, TriggerOpType::SET, name("a"), std::int64_t{2}, std::int64_t{1});

    CHECK(order == std::vector<std::string>{"hook", "run"});
    REQUIRE(events.size() == 1);
    CHECK_FALSE(events[0].is_track());
    CHECK(std::get<TriggerOpType>(events[0].type) == TriggerOpType::SET);
    CHECK(events[0].key == name("a"));
    CHECK(std::any_cast<std::int64_t>(events[0].new_value) == 2);
    CHECK(std::any_cast<std::int64_t>(events[0].old_value) == 1);
    CHECK_FALSE(events[0].old_target.has_value());
}

// ============================================================================
// Key resolution
// ============================================================================

TEST_CASE("trigger - CLEAR notifies every key", "[reactivity][trigger]") {
    Watchers w{TargetKind::MAP};
    auto a = w.watch(name("a"));
    auto b = w.watch(name("b"));
    auto iterate = w.watch(ITERATE_KEY, TrackOpType::ITERATE);

    w.trigger(TriggerOpType::CLEAR);

    CHECK(w.reruns(a) == 1);
    CHECK(w.reruns(b) == 1);
    CHECK(w.reruns(iterate) == 1);
}

TEST_CASE("trigger - SET on an object notifies only the key", "[reactivity][trigger]") {
    Watchers w{TargetKind::OBJECT};
    auto a = w.watch(name("a"));
    auto b = w.watch(name("b"));
    auto iterate = w.watch(ITERATE_KEY, TrackOpType::ITERATE);

    w.trigger(TriggerOpType::SET, name("a"));

    CHECK(w.reruns(a) == 1);
    CHECK(w.reruns(b) == 0);
    CHECK(w.reruns(iterate) == 0);
}

TEST_CASE("trigger - SET on a map also notifies iteration", "[reactivity][trigger]") {
    Watchers w{TargetKind::MAP};
    auto a = w.watch(name("a"));
    auto iterate = w.watch(ITERATE_KEY, TrackOpType::ITERATE);
    auto keys = w.watch(MAP_KEY_ITERATE_KEY, TrackOpType::ITERATE);

    w.trigger(TriggerOpType::SET, name("a"));

    CHECK(w.reruns(a) == 1);
    CHECK(w.reruns(iterate) == 1);
    CHECK(w.reruns(keys) == 0);
}

TEST_CASE("trigger - ADD and DELETE on a map notify both iteration keys", "[reactivity][trigger]") {
    Watchers w{TargetKind::MAP};
    auto iterate = w.watch(ITERATE_KEY, TrackOpType::ITERATE);
    auto keys = w.watch(MAP_KEY_ITERATE_KEY, TrackOpType::ITERATE);
    auto other = w.watch(name("other"));

    w.trigger(TriggerOpType::ADD, name("new"));
    w.trigger(TriggerOpType::DELETE, name("new"));

    CHECK(w.reruns(iterate) == 2);
    CHECK(w.reruns(keys) == 2);
    CHECK(w.reruns(other) == 0);
}

TEST_CASE("trigger - ADD on an object or set notifies ITERATE only", "[reactivity][trigger]") {
    for (auto kind: {TargetKind::OBJECT, TargetKind::SET}) {
        Watchers w{kind};
        auto iterate = w.watch(ITERATE_KEY, TrackOpType::ITERATE);
        auto keys = w.watch(MAP_KEY_ITERATE_KEY, TrackOpType::ITERATE);

        w.trigger(TriggerOpType::ADD, name("x"));

        CHECK(w.reruns(iterate) == 1);
        CHECK(w.reruns(keys) == 0);
    }
}

TEST_CASE("trigger - ADD of an index on a sequence notifies the length", "[reactivity][trigger]") {
    Watchers w{TargetKind::SEQUENCE};
    auto length = w.watch(LENGTH_KEY);
    auto iterate = w.watch(ITERATE_KEY, TrackOpType::ITERATE);
    auto added = w.watch(index(3));

    w.trigger(TriggerOpType::ADD, index(3));

    CHECK(w.reruns(length) == 1);
    CHECK(w.reruns(added) == 1);
    CHECK(w.reruns(iterate) == 0);
}

TEST_CASE("trigger - ADD of a named key on a sequence leaves the length alone", "[reactivity][trigger]") {
    Watchers w{TargetKind::SEQUENCE};
    auto length = w.watch(LENGTH_KEY);

    w.trigger(TriggerOpType::ADD, name("extra"));

    CHECK(w.reruns(length) == 0);
}

TEST_CASE("trigger - DELETE on a sequence notifies only the index", "[reactivity][trigger]") {
    Watchers w{TargetKind::SEQUENCE};
    auto length = w.watch(LENGTH_KEY);
    auto removed = w.watch(index(1));

    w.trigger(TriggerOpType::DELETE, index(1));

    CHECK(w.reruns(length) == 0);
    CHECK(w.reruns(removed) == 1);
}

TEST_CASE("trigger - shrinking a sequence notifies length and truncated indices", "[reactivity][trigger]") {
    Watchers w{TargetKind::SEQUENCE};
    auto first = w.watch(index(0));
    auto fourth = w.watch(index(3));
    auto fifth = w.watch(index(4));
    auto length = w.watch(LENGTH_KEY);

    w.trigger(TriggerOpType::SET, LENGTH_KEY, std::int64_t{2});

    CHECK(w.reruns(length) == 1);
    CHECK(w.reruns(fourth) == 1);
    CHECK(w.reruns(fifth) == 1);
    CHECK(w.reruns(first) == 0);
}

TEST_CASE("trigger - the boundary index of a truncation is notified", "[reactivity][trigger]") {
    Watchers w{TargetKind::SEQUENCE};
    auto below = w.watch(index(1));
    auto at = w.watch(index(2));

    w.trigger(TriggerOpType::SET, LENGTH_KEY, 2);

    CHECK(w.reruns(below) == 0);
    CHECK(w.reruns(at) == 1);
}

TEST_CASE("trigger - a sequence length must be an integer", "[reactivity][trigger]") {
    Watchers w{TargetKind::SEQUENCE};
    w.watch(LENGTH_KEY);

    CHECK_THROWS_AS(w.trigger(TriggerOpType::SET, LENGTH_KEY, std::string{"two"}), std::invalid_argument);
    CHECK_THROWS_AS(w.trigger(TriggerOpType::SET, LENGTH_KEY), std::invalid_argument);
    CHECK_THROWS_AS(w.trigger(TriggerOpType::SET, LENGTH_KEY, std::numeric_limits<std::uint64_t>::max()),
                    std::invalid_argument);
}

TEST_CASE("trigger - a length key on a non sequence is a plain key", "[reactivity][trigger]") {
    Watchers w{TargetKind::OBJECT};
    auto length = w.watch(LENGTH_KEY);
    auto other = w.watch(index(5));

    w.trigger(TriggerOpType::SET, LENGTH_KEY, std::string{"anything"});

    CHECK(w.reruns(length) == 1);
    CHECK(w.reruns(other) == 0);
}

TEST_CASE("collect_effects - the active effect is left out unless it allows recursion", "[reactivity][trigger]") {
    reactive_runtime_s_ptr runtime{new ReactiveRuntime()};
    target_s_ptr target{new Target()};
    std::size_t collected_plain = 99;
    std::size_t collected_recursive = 99;

    auto plain = runtime->effect([&] {
        runtime->track(*target, TrackOpType::GET, name("a"));
        collected_plain = collect_effects(runtime->tracking(), *target, TriggerOpType::SET, name("a"), {}).size();
    });
    auto recursive = runtime->effect([&] {
        runtime->track(*target, TrackOpType::GET, name("b"));
        collected_recursive = collect_effects(runtime->tracking(), *target, TriggerOpType::SET, name("b"), {}).size();
    }, EffectOptions{.allow_recurse = true});

    CHECK(collected_plain == 0);
    CHECK(collected_recursive == 1);
}

TEST_CASE("integer_value - reads the common integer types", "[reactivity][trigger]") {
    CHECK(integer_value(std::any{3}) == 3);
    CHECK(integer_value(std::any{std::int64_t{4}}) == 4);
    CHECK(integer_value(std::any{5u}) == 5);
    CHECK(integer_value(std::any{9ull}) == 9);
    CHECK(integer_value(std::any{static_cast<unsigned long long>(std::numeric_limits<std::int64_t>::max())}) ==
          std::numeric_limits<std::int64_t>::max());
    CHECK_FALSE(integer_value(std::any{std::numeric_limits<unsigned long long>::max()}).has_value());
    CHECK_FALSE(integer_value(std::any{std::numeric_limits<unsigned long>::max()}).has_value());
    CHECK_FALSE(integer_value(std::any{2.5}).has_value());
    CHECK_FALSE(integer_value(std::any{}).has_value());
}
