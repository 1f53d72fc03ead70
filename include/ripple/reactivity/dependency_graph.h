#ifndef RIPPLE_REACTIVITY_DEPENDENCY_GRAPH_H
#define RIPPLE_REACTIVITY_DEPENDENCY_GRAPH_H

#include <ripple/reactivity/operations.h>
#include <ripple/reactivity/target.h>
#include <ripple/reactivity/tracking_context.h>

#include <any>
#include <optional>
#include <vector>

namespace ripple {
    /**
     * Records that the active effect read key of target.
     * Does nothing when tracking is paused or no effect is active.
     */
    RIPPLE_EXPORT void track(TrackingContext &context, Target &target, TrackOpType type, const Key &key);

    /**
     * Computes the effects to notify for a write, before any of them is run. Each effect appears once, in the order
     * it was first found, and the active effect is left out unless it allows recursion.
     *
     * @throws std::invalid_argument when the length of a sequence is written with a new value that is not an integer
     */
    [[nodiscard]] RIPPLE_EXPORT std::vector<effect_s_ptr> collect_effects(const TrackingContext &context,
                                                                          const Target &target, TriggerOpType type,
                                                                          const std::optional<Key> &key,
                                                                          const std::any &new_value);

    /**
     * Notifies the effects that depend on the written key of target. Effects with a scheduler are handed to it,
     * the rest run inline.
     */
    RIPPLE_EXPORT void trigger(TrackingContext &context, Target &target, TriggerOpType type,
                               const std::optional<Key> &key = std::nullopt, const std::any &new_value = {},
                               const std::any &old_value = {}, const std::any &old_target = {});

    /**
     * Reads an integer length from a trigger value, empty when it is not an integer or does not fit in 64 bits.
     */
    [[nodiscard]] RIPPLE_EXPORT std::optional<std::int64_t> integer_value(const std::any &value);
} // namespace ripple

#endif // RIPPLE_REACTIVITY_DEPENDENCY_GRAPH_H
