#ifndef RIPPLE_REACTIVITY_EFFECT_H
#define RIPPLE_REACTIVITY_EFFECT_H

#include <ripple/reactivity/operations.h>
#include <ripple/scheduler/job.h>

#include <any>
#include <functional>
#include <optional>
#include <variant>
#include <vector>

namespace ripple {
    /**
     * Describes a read (on_track) or a write (on_trigger) observed by an effect, handed to the debug hooks.
     */
    struct RIPPLE_EXPORT DebuggerEvent {
        effect_ptr effect{nullptr};
        target_ptr target{nullptr};
        std::variant<TrackOpType, TriggerOpType> type{TrackOpType::GET};
        std::optional<Key> key;
        std::any new_value;
        std::any old_value;
        std::any old_target;

        [[nodiscard]] bool is_track() const { return std::holds_alternative<TrackOpType>(type); }

        [[nodiscard]] std::string to_string() const;
    };

    struct RIPPLE_EXPORT EffectOptions {
        using scheduler_fn = std::function<void(Effect &)>;
        using debugger_hook = std::function<void(const DebuggerEvent &)>;

        /**
         * Do not run the effect on creation, the caller runs it when ready.
         */
        bool lazy{false};
        /**
         * When present the effect is handed to the scheduler on trigger instead of running inline.
         */
        scheduler_fn scheduler;
        debugger_hook on_track;
        debugger_hook on_trigger;
        std::function<void()> on_stop;
        /**
         * Allow the effect to be notified by writes it performs itself while running.
         */
        bool allow_recurse{false};
    };

    /**
     * The optional parts of EffectOptions, resolved once when the effect is constructed.
     */
    enum class EffectCapability : std::uint8_t {
        NONE = 0,
        SCHEDULER = 1 << 0,
        ON_TRACK = 1 << 1,
        ON_TRIGGER = 1 << 2,
        ON_STOP = 1 << 3,
    };

    constexpr EffectCapability operator|(EffectCapability lhs, EffectCapability rhs) {
        return static_cast<EffectCapability>(static_cast<std::uint8_t>(lhs) | static_cast<std::uint8_t>(rhs));
    }

    constexpr EffectCapability operator&(EffectCapability lhs, EffectCapability rhs) {
        return static_cast<EffectCapability>(static_cast<std::uint8_t>(lhs) & static_cast<std::uint8_t>(rhs));
    }

    [[nodiscard]] RIPPLE_EXPORT EffectCapability resolve_capabilities(const EffectOptions &options);

    /**
     * A reactive computation.
     *
     * Every run starts by un-subscribing the effect from all the Deps collected in the previous run and then
     * executes the wrapped function with the effect as the active effect, so the Deps subscribed afterwards are
     * exactly the ones read by this run. An effect is also a Job, which is how a scheduler defers it; its job id is
     * its effect id, so deferred effects run in creation order.
     */
    struct RIPPLE_EXPORT Effect final : Job {
        using ptr = effect_ptr;
        using s_ptr = effect_s_ptr;

        Effect(ReactiveRuntime &runtime, job_id_t effect_id, std::function<void()> fn, EffectOptions options);

        ~Effect() override;

        Effect(const Effect &) = delete;

        Effect &operator=(const Effect &) = delete;

        /**
         * Runs the effect, collecting its dependencies. Returns without doing anything if the effect is already
         * running further up the stack. Once stopped, an effect with a scheduler no longer runs, one without runs
         * the raw function.
         */
        void run() override;

        /**
         * Removes all subscriptions, fires on_stop and marks the effect inactive. Calling stop more than once has no
         * further effect.
         */
        void stop();

        [[nodiscard]] bool active() const { return _active; }

        [[nodiscard]] job_id_t effect_id() const { return _effect_id; }

        [[nodiscard]] const std::function<void()> &raw() const { return _fn; }

        [[nodiscard]] const EffectOptions &options() const { return _options; }

        [[nodiscard]] EffectCapability capabilities() const { return _capabilities; }

        [[nodiscard]] bool has_capability(EffectCapability capability) const {
            return (_capabilities & capability) != EffectCapability::NONE;
        }

        [[nodiscard]] const std::vector<dep_ptr> &deps() const { return _deps; }

        [[nodiscard]] ReactiveRuntime &runtime() const { return *_runtime; }

        [[nodiscard]] std::string label() const override;

        /**
         * Un-subscribes the effect from every Dep it belongs to.
         */
        void cleanup();

        // Book-keeping for the reverse link, used by track and by Target when it releases its Deps.
        void record_dependency(Dep &dep);

        void forget_dependency(const Dep &dep);

        void notify_track(const DebuggerEvent &event) const;

        void notify_trigger(const DebuggerEvent &event) const;

        void schedule();

    private:
        reactive_runtime_s_ptr _runtime;
        job_id_t _effect_id;
        std::function<void()> _fn;
        EffectOptions _options;
        EffectCapability _capabilities;
        bool _active{true};
        std::vector<dep_ptr> _deps;
    };
} // namespace ripple

#endif // RIPPLE_REACTIVITY_EFFECT_H
