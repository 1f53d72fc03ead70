#ifndef RIPPLE_RUNTIME_REACTIVE_RUNTIME_H
#define RIPPLE_RUNTIME_REACTIVE_RUNTIME_H

#include <ripple/reactivity/dependency_graph.h>
#include <ripple/reactivity/effect.h>
#include <ripple/reactivity/tracking_context.h>
#include <ripple/runtime/deferred_executor.h>
#include <ripple/runtime/error_handling.h>
#include <ripple/runtime/runtime_config.h>
#include <ripple/scheduler/scheduler.h>

#include <any>
#include <functional>
#include <optional>
#include <vector>

namespace ripple {
    /**
     * The context object tying the reactive core together. A runtime owns the tracking state, the scheduler and its
     * queues, the executor the flushes are deferred on and the error handler, so two runtimes never see each
     * other's effects or jobs.
     *
     * The runtime is the entry point for instrumentation (track and trigger), for defining effects and for
     * scheduling work. Effects keep their runtime alive.
     */
    struct RIPPLE_EXPORT ReactiveRuntime : nb::intrusive_base {
        using ptr = reactive_runtime_ptr;
        using s_ptr = reactive_runtime_s_ptr;

        /**
         * @param config the recursion guard settings
         * @param executor where flushes are deferred to, a MicrotaskQueue when not supplied
         * @param error_handler receives job failures, a LoggingErrorHandler when not supplied
         */
        explicit ReactiveRuntime(RuntimeConfig config = {}, deferred_executor_s_ptr executor = {},
                                 error_handler_s_ptr error_handler = {});

        ReactiveRuntime(const ReactiveRuntime &) = delete;

        ReactiveRuntime &operator=(const ReactiveRuntime &) = delete;

        /**
         * Creates an effect wrapping fn, running it straight away unless the options ask for a lazy effect.
         */
        effect_s_ptr effect(std::function<void()> fn, EffectOptions options = {});

        /**
         * Creates a new effect around the raw function of an existing effect.
         */
        effect_s_ptr effect(const Effect &source, EffectOptions options = {});

        void stop(Effect &effect);

        /**
         * An effect scheduler that queues the effect as a job on this runtime.
         */
        [[nodiscard]] EffectOptions::scheduler_fn queue_job_scheduler();

        // Instrumentation

        void track(Target &target, TrackOpType type, const Key &key);

        void trigger(Target &target, TriggerOpType type, const std::optional<Key> &key = std::nullopt,
                     const std::any &new_value = {}, const std::any &old_value = {},
                     const std::any &old_target = {});

        void pause_tracking() { _tracking.pause_tracking(); }

        void enable_tracking() { _tracking.enable_tracking(); }

        void reset_tracking() { _tracking.reset_tracking(); }

        [[nodiscard]] TrackingContext &tracking() { return _tracking; }

        [[nodiscard]] const TrackingContext &tracking() const { return _tracking; }

        // Scheduling

        void queue_job(job_s_ptr job) { _scheduler->queue_job(std::move(job)); }

        void invalidate_job(const Job &job) { _scheduler->invalidate_job(job); }

        void queue_pre_flush_cb(job_s_ptr cb) { _scheduler->queue_pre_flush_cb(std::move(cb)); }

        void queue_post_flush_cb(job_s_ptr cb) { _scheduler->queue_post_flush_cb(std::move(cb)); }

        void queue_post_flush_cbs(std::vector<job_s_ptr> cbs) { _scheduler->queue_post_flush_cbs(std::move(cbs)); }

        void flush_pre_flush_cbs(Job *parent_job = nullptr) { _scheduler->flush_pre_flush_cbs(parent_job); }

        void flush_post_flush_cbs() { _scheduler->flush_post_flush_cbs(); }

        [[nodiscard]] completion_s_ptr next_tick() { return _scheduler->next_tick(); }

        completion_s_ptr next_tick(std::function<void()> fn) { return _scheduler->next_tick(std::move(fn)); }

        [[nodiscard]] Scheduler &scheduler() { return *_scheduler; }

        [[nodiscard]] const Scheduler &scheduler() const { return *_scheduler; }

        [[nodiscard]] const deferred_executor_s_ptr &executor() const { return _executor; }

        [[nodiscard]] const error_handler_s_ptr &error_handler() const { return _scheduler->error_handler(); }

        void set_error_handler(error_handler_s_ptr error_handler) {
            _scheduler->set_error_handler(std::move(error_handler));
        }

        void add_flush_observer(flush_observer_s_ptr observer) { _scheduler->add_flush_observer(std::move(observer)); }

        void remove_flush_observer(const flush_observer_s_ptr &observer) { _scheduler->remove_flush_observer(observer); }

        [[nodiscard]] const RuntimeConfig &config() const { return _config; }

        /**
         * The id the next effect created on this runtime will receive.
         */
        [[nodiscard]] job_id_t next_effect_id() const { return _next_effect_id; }

    private:
        RuntimeConfig _config;
        deferred_executor_s_ptr _executor;
        TrackingContext _tracking;
        scheduler_s_ptr _scheduler;
        job_id_t _next_effect_id{0};
    };
} // namespace ripple

#endif // RIPPLE_RUNTIME_REACTIVE_RUNTIME_H
