#include <ripple/reactivity/dependency_graph.h>
#include <ripple/util/errors.h>

#include <cstddef>
#include <limits>
#include <unordered_set>

namespace ripple {
    namespace {
        /**
         * Accumulates the notification set, keeping first-found order and skipping duplicates.
         */
        struct EffectCollector {
            explicit EffectCollector(const TrackingContext &context) : _active{context.active_effect()} {}

            void add(const Dep *dep) {
                if (dep == nullptr) { return; }
                for (const auto &effect: dep->subscribers()) {
                    if (effect.get() != _active || effect->options().allow_recurse) {
                        if (_seen.insert(effect.get()).second) { _effects.push_back(effect); }
                    }
                }
            }

            std::vector<effect_s_ptr> take() { return std::move(_effects); }

        private:
            effect_ptr _active;
            std::unordered_set<const Effect *> _seen;
            std::vector<effect_s_ptr> _effects;
        };
    } // namespace

    void track(TrackingContext &context, Target &target, TrackOpType type, const Key &key) {
        if (!context.is_tracking()) { return; }
        Effect &effect = *context.active_effect();
        Dep &dep = target.ensure_dep(key);
        if (dep.add(effect)) {
            effect.record_dependency(dep);
            if (effect.has_capability(EffectCapability::ON_TRACK)) {
                effect.notify_track(DebuggerEvent{
                    .effect = &effect,
                    .target = &target,
                    .type = type,
                    .key = key,
                });
            }
        }
    }

    namespace {
        template <typename T>
        std::optional<std::int64_t> checked_signed(T value) {
            if (value > static_cast<T>(std::numeric_limits<std::int64_t>::max())) { return std::nullopt; }
            return static_cast<std::int64_t>(value);
        }
    } // namespace

    std::optional<std::int64_t> integer_value(const std::any &value) {
        if (auto v = std::any_cast<std::int64_t>(&value)) { return *v; }
        if (auto v = std::any_cast<int>(&value)) { return *v; }
        if (auto v = std::any_cast<long>(&value)) { return static_cast<std::int64_t>(*v); }
        if (auto v = std::any_cast<long long>(&value)) { return static_cast<std::int64_t>(*v); }
        if (auto v = std::any_cast<unsigned>(&value)) { return static_cast<std::int64_t>(*v); }
        if (auto v = std::any_cast<unsigned long>(&value)) { return checked_signed(*v); }
        if (auto v = std::any_cast<unsigned long long>(&value)) { return checked_signed(*v); }
        return std::nullopt;
    }

    std::vector<effect_s_ptr> collect_effects(const TrackingContext &context, const Target &target,
                                              TriggerOpType type, const std::optional<Key> &key,
                                              const std::any &new_value) {
        EffectCollector effects{context};

        if (type == TriggerOpType::CLEAR) {
            // collection being cleared, every key of the target is affected
            target.for_each_dep([&effects](const Key &, const Dep &dep) { effects.add(&dep); });
        } else if (key.has_value() && target.is_sequence() && is_pseudo_key(*key, LENGTH_KEY)) {
            auto new_length{integer_value(new_value)};
            if (!new_length.has_value()) {
                throw_error<std::invalid_argument>("The new length of {} must be an integer", target.to_string());
            }
            // Shrinking a sequence removes the elements at and beyond the new length.
            target.for_each_dep([&effects, length = *new_length](const Key &k, const Dep &dep) {
                auto index = std::get_if<std::int64_t>(&k);
                if (is_pseudo_key(k, LENGTH_KEY) || (index != nullptr && *index >= length)) { effects.add(&dep); }
            });
        } else {
            // SET | ADD | DELETE
            if (key.has_value()) { effects.add(target.find_dep(*key)); }

            // also run for the iteration keys when the shape of the target changes
            switch (type) {
                case TriggerOpType::ADD:
                    if (!target.is_sequence()) {
                        effects.add(target.find_dep(ITERATE_KEY));
                        if (target.is_map()) { effects.add(target.find_dep(MAP_KEY_ITERATE_KEY)); }
                    } else if (key.has_value() && is_integer_key(*key)) {
                        // new index added to the sequence, the length changes
                        effects.add(target.find_dep(LENGTH_KEY));
                    }
                    break;
                case TriggerOpType::DELETE:
                    if (!target.is_sequence()) {
                        effects.add(target.find_dep(ITERATE_KEY));
                        if (target.is_map()) { effects.add(target.find_dep(MAP_KEY_ITERATE_KEY)); }
                    }
                    break;
                case TriggerOpType::SET:
                    // entry iteration exposes the values of a map
                    if (target.is_map()) { effects.add(target.find_dep(ITERATE_KEY)); }
                    break;
                case TriggerOpType::CLEAR:
                    break;
            }
        }
        return effects.take();
    }

    void trigger(TrackingContext &context, Target &target, TriggerOpType type, const std::optional<Key> &key,
                 const std::any &new_value, const std::any &old_value, const std::any &old_target) {
        // never been tracked
        if (!target.is_observed()) { return; }

        auto effects{collect_effects(context, target, type, key, new_value)};

        for (auto &effect: effects) {
            if (effect->has_capability(EffectCapability::ON_TRIGGER)) {
                effect->notify_trigger(DebuggerEvent{
                    .effect = effect.get(),
                    .target = &target,
                    .type = type,
                    .key = key,
                    .new_value = new_value,
                    .old_value = old_value,
                    .old_target = old_target,
                });
            }
            if (effect->has_capability(EffectCapability::SCHEDULER)) {
                effect->schedule();
            } else {
                effect->run();
            }
        }
    }
} // namespace ripple
