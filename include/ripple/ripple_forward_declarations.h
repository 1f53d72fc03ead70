#ifndef RIPPLE_FORWARD_DECLARATIONS_H
#define RIPPLE_FORWARD_DECLARATIONS_H

#include <cstdint>
#include <nanobind/intrusive/ref.h>

namespace nb = nanobind;

namespace ripple {
    using job_id_t = std::uint64_t;

    // Target - keeps nb::ref, the dependency map is attached to the target
    struct Target;
    using target_ptr = Target*;
    using target_s_ptr = nb::ref<Target>;

    // Dep - owned by its Target, raw pointer only
    class Dep;
    using dep_ptr = Dep*;

    // Job - keeps nb::ref, queues hold counted references
    struct Job;
    using job_ptr = Job*;
    using job_s_ptr = nb::ref<Job>;

    // Effect - keeps nb::ref, Deps hold counted references
    struct Effect;
    using effect_ptr = Effect*;
    using effect_s_ptr = nb::ref<Effect>;

    // TrackingContext - owned by the runtime, raw pointer only
    class TrackingContext;
    using tracking_context_ptr = TrackingContext*;

    struct Scheduler;
    using scheduler_ptr = Scheduler*;
    using scheduler_s_ptr = nb::ref<Scheduler>;

    struct ReactiveRuntime;
    using reactive_runtime_ptr = ReactiveRuntime*;
    using reactive_runtime_s_ptr = nb::ref<ReactiveRuntime>;

    struct DeferredExecutor;
    using deferred_executor_s_ptr = nb::ref<DeferredExecutor>;

    struct Completion;
    using completion_s_ptr = nb::ref<Completion>;

    struct ErrorHandler;
    using error_handler_s_ptr = nb::ref<ErrorHandler>;

    struct FlushLifeCycleObserver;
    using flush_observer_ptr = FlushLifeCycleObserver*;
    using flush_observer_s_ptr = nb::ref<FlushLifeCycleObserver>;
} // namespace ripple

#endif // RIPPLE_FORWARD_DECLARATIONS_H
