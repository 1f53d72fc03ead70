#ifndef RIPPLE_REACTIVITY_TRACKING_CONTEXT_H
#define RIPPLE_REACTIVITY_TRACKING_CONTEXT_H

#include <ripple/ripple_base.h>

#include <vector>

namespace ripple {
    /**
     * Tracks the effect that is currently collecting dependencies and whether reads should be tracked at all.
     *
     * Effects running inside other effects are kept on a stack, so finishing the inner effect re-activates the
     * outer one. The tracking flag is a save/restore stack: pause_tracking and enable_tracking push the current
     * flag, reset_tracking restores the last pushed value (or true when the stack is empty).
     *
     * NOTE: The context is confined to a single thread, it is owned by one ReactiveRuntime.
     */
    class RIPPLE_EXPORT TrackingContext {
    public:
        [[nodiscard]] bool should_track() const { return _should_track; }

        [[nodiscard]] effect_ptr active_effect() const { return _active_effect; }

        /**
         * True if tracking is enabled and an effect is collecting dependencies.
         */
        [[nodiscard]] bool is_tracking() const { return _should_track && _active_effect != nullptr; }

        /**
         * True if the effect is anywhere on the effect stack.
         */
        [[nodiscard]] bool is_running(const Effect &effect) const;

        [[nodiscard]] std::size_t depth() const { return _effect_stack.size(); }

        [[nodiscard]] std::size_t track_stack_depth() const { return _track_stack.size(); }

        void pause_tracking();

        void enable_tracking();

        void reset_tracking();

        void push_effect(Effect &effect);

        void pop_effect();

    private:
        std::vector<effect_ptr> _effect_stack;
        effect_ptr _active_effect{nullptr};
        bool _should_track{true};
        std::vector<bool> _track_stack;
    };

    /**
     * Makes the effect the active effect with tracking enabled for the life-time of the scope. The previous active
     * effect and tracking state are restored on exit, including when the effect throws.
     */
    struct RIPPLE_EXPORT ActiveEffectScope {
        ActiveEffectScope(TrackingContext &context, Effect &effect);

        ~ActiveEffectScope() noexcept;

        ActiveEffectScope(const ActiveEffectScope &) = delete;

        ActiveEffectScope &operator=(const ActiveEffectScope &) = delete;

    private:
        TrackingContext &_context;
    };

    /**
     * Suspends tracking for the life-time of the scope, used around composite operations whose internal reads must
     * not subscribe the running effect.
     */
    struct RIPPLE_EXPORT TrackingPause {
        explicit TrackingPause(TrackingContext &context);

        ~TrackingPause() noexcept;

        TrackingPause(const TrackingPause &) = delete;

        TrackingPause &operator=(const TrackingPause &) = delete;

    private:
        TrackingContext &_context;
    };
} // namespace ripple

#endif // RIPPLE_REACTIVITY_TRACKING_CONTEXT_H
