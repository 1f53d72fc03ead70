/*
 * Expose the runtime to python
 */
#include <ripple/python/ripple_python.h>
#include <ripple/runtime/reactive_runtime.h>

using namespace nb::literals;

namespace {
    using namespace ripple;

    // Hooks receive a copy of the event, Python may keep it beyond the call.
    EffectOptions::debugger_hook wrap_hook(std::optional<nb::callable> fn) {
        if (!fn) { return {}; }
        return [fn = std::move(*fn)](const DebuggerEvent &event) { fn(DebuggerEvent{event}); };
    }

    EffectOptions make_options(ReactiveRuntime &runtime, bool lazy, nb::object scheduler,
                               std::optional<nb::callable> on_track, std::optional<nb::callable> on_trigger,
                               std::optional<std::function<void()>> on_stop, bool allow_recurse) {
        EffectOptions options{.lazy = lazy, .allow_recurse = allow_recurse};
        if (nb::isinstance<nb::bool_>(scheduler)) {
            // scheduler=True queues the effect as a job on the runtime
            if (nb::cast<bool>(scheduler)) { options.scheduler = runtime.queue_job_scheduler(); }
        } else if (!scheduler.is_none()) {
            auto fn{nb::borrow<nb::callable>(scheduler)};
            options.scheduler = [fn](Effect &effect) { fn(effect_s_ptr{&effect}); };
        }
        options.on_track = wrap_hook(std::move(on_track));
        options.on_trigger = wrap_hook(std::move(on_trigger));
        if (on_stop) { options.on_stop = std::move(*on_stop); }
        return options;
    }
} // namespace

void export_runtime(nb::module_ &m) {
    using namespace ripple;

    nb::class_<RuntimeConfig>(m, "RuntimeConfig")
            .def(nb::init<>())
            .def("__init__",
                 [](RuntimeConfig *self, std::size_t recursion_limit, bool check_recursive_updates) {
                     new(self) RuntimeConfig{recursion_limit, check_recursive_updates};
                 }, "recursion_limit"_a = DEFAULT_RECURSION_LIMIT, "check_recursive_updates"_a = true)
            .def_rw("recursion_limit", &RuntimeConfig::recursion_limit)
            .def_rw("check_recursive_updates", &RuntimeConfig::check_recursive_updates);

    nb::class_<Scheduler, nb::intrusive_base>(m, "Scheduler")
            .def_prop_ro("flush_state", &Scheduler::flush_state)
            .def_prop_ro("is_flushing", &Scheduler::is_flushing)
            .def_prop_ro("is_flush_pending", &Scheduler::is_flush_pending)
            .def_prop_ro("flush_index", &Scheduler::flush_index)
            .def_prop_ro("queue_size", &Scheduler::queue_size)
            .def_prop_ro("pending_pre_flush_count", &Scheduler::pending_pre_flush_count)
            .def_prop_ro("pending_post_flush_count", &Scheduler::pending_post_flush_count)
            .def_prop_ro("has_pending_work", &Scheduler::has_pending_work)
            .def("is_queued", &Scheduler::is_queued, "job"_a);

    nb::class_<ReactiveRuntime, nb::intrusive_base>(m, "ReactiveRuntime")
            .def(nb::init<RuntimeConfig, deferred_executor_s_ptr, error_handler_s_ptr>(),
                 "config"_a = RuntimeConfig{}, nb::arg("executor").none() = nb::none(),
                 nb::arg("error_handler").none() = nb::none())
            .def("effect",
                 [](ReactiveRuntime &self, nb::object fn, bool lazy, nb::object scheduler,
                    std::optional<nb::callable> on_track, std::optional<nb::callable> on_trigger,
                    std::optional<std::function<void()>> on_stop, bool allow_recurse) {
                     auto options{make_options(self, lazy, std::move(scheduler), std::move(on_track),
                                               std::move(on_trigger), std::move(on_stop), allow_recurse)};
                     if (nb::isinstance<Effect>(fn)) {
                         return self.effect(nb::cast<const Effect &>(fn), std::move(options));
                     }
                     return self.effect(nb::cast<std::function<void()>>(fn), std::move(options));
                 },
                 "fn"_a, "lazy"_a = false, nb::arg("scheduler").none() = nb::none(), "on_track"_a = nb::none(),
                 "on_trigger"_a = nb::none(), "on_stop"_a = nb::none(), "allow_recurse"_a = false,
                 "Creates an effect around fn (a callable, or an existing effect whose function is re-used).\n"
                 "\n"
                 "Args:\n"
                 "    lazy: Do not run the effect on creation\n"
                 "    scheduler: Called with the effect when it is triggered, True queues it as a job\n"
                 "    on_track: Called with a DebuggerEvent for every new dependency\n"
                 "    on_trigger: Called with a DebuggerEvent before the effect is notified\n"
                 "    on_stop: Called once when the effect is stopped\n"
                 "    allow_recurse: Allow the effect to be notified by its own writes")
            .def("stop", &ReactiveRuntime::stop, "effect"_a)
            .def("track", &ReactiveRuntime::track, "target"_a, "type"_a, "key"_a)
            .def("trigger",
                 [](ReactiveRuntime &self, Target &target, TriggerOpType type, std::optional<Key> key,
                    nb::object new_value, nb::object old_value, nb::object old_target) {
                     self.trigger(target, type, key, python::to_any(new_value), python::to_any(old_value),
                                  python::to_any(old_target));
                 },
                 "target"_a, "type"_a, "key"_a = nb::none(), nb::arg("new_value").none() = nb::none(),
                 nb::arg("old_value").none() = nb::none(), nb::arg("old_target").none() = nb::none())
            .def("pause_tracking", &ReactiveRuntime::pause_tracking)
            .def("enable_tracking", &ReactiveRuntime::enable_tracking)
            .def("reset_tracking", &ReactiveRuntime::reset_tracking)
            .def_prop_ro("should_track", [](const ReactiveRuntime &self) { return self.tracking().should_track(); })
            .def_prop_ro("active_effect",
                         [](const ReactiveRuntime &self) { return effect_s_ptr{self.tracking().active_effect()}; })
            .def("queue_job", &ReactiveRuntime::queue_job, "job"_a)
            .def("invalidate_job", &ReactiveRuntime::invalidate_job, "job"_a)
            .def("queue_pre_flush_cb", &ReactiveRuntime::queue_pre_flush_cb, "cb"_a)
            .def("queue_post_flush_cb", &ReactiveRuntime::queue_post_flush_cb, "cb"_a)
            .def("queue_post_flush_cbs", &ReactiveRuntime::queue_post_flush_cbs, "cbs"_a)
            .def("flush_pre_flush_cbs", &ReactiveRuntime::flush_pre_flush_cbs,
                 nb::arg("parent_job").none() = nb::none())
            .def("flush_post_flush_cbs", &ReactiveRuntime::flush_post_flush_cbs)
            .def("next_tick", [](ReactiveRuntime &self, std::optional<std::function<void()>> fn) {
                return fn ? self.next_tick(std::move(*fn)) : self.next_tick();
            }, "fn"_a = nb::none())
            .def_prop_ro("scheduler", [](ReactiveRuntime &self) { return scheduler_s_ptr{&self.scheduler()}; })
            .def_prop_ro("executor", &ReactiveRuntime::executor)
            .def_prop_rw("error_handler", &ReactiveRuntime::error_handler, &ReactiveRuntime::set_error_handler)
            .def("add_flush_observer", &ReactiveRuntime::add_flush_observer, "observer"_a)
            .def("remove_flush_observer", &ReactiveRuntime::remove_flush_observer, "observer"_a)
            .def_prop_ro("config", &ReactiveRuntime::config)
            .def_prop_ro("next_effect_id", &ReactiveRuntime::next_effect_id);
}
