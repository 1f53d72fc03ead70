#include <ripple/runtime/reactive_runtime.h>

namespace ripple {
    ReactiveRuntime::ReactiveRuntime(RuntimeConfig config, deferred_executor_s_ptr executor,
                                     error_handler_s_ptr error_handler)
        : _config{config}, _executor{executor ? std::move(executor) : deferred_executor_s_ptr{new MicrotaskQueue()}},
          _scheduler{new Scheduler(_executor, error_handler ? std::move(error_handler)
                                                            : error_handler_s_ptr{new LoggingErrorHandler()},
                                   _config)} {}

    effect_s_ptr ReactiveRuntime::effect(std::function<void()> fn, EffectOptions options) {
        auto lazy{options.lazy};
        effect_s_ptr result{new Effect(*this, _next_effect_id++, std::move(fn), std::move(options))};
        if (!lazy) { result->run(); }
        return result;
    }

    effect_s_ptr ReactiveRuntime::effect(const Effect &source, EffectOptions options) {
        return effect(source.raw(), std::move(options));
    }

    void ReactiveRuntime::stop(Effect &effect) { effect.stop(); }

    EffectOptions::scheduler_fn ReactiveRuntime::queue_job_scheduler() {
        // Effects hold their runtime, a raw pointer cannot outlive it.
        return [runtime = this](Effect &effect) { runtime->queue_job(&effect); };
    }

    void ReactiveRuntime::track(Target &target, TrackOpType type, const Key &key) {
        ripple::track(_tracking, target, type, key);
    }

    void ReactiveRuntime::trigger(Target &target, TriggerOpType type, const std::optional<Key> &key,
                                  const std::any &new_value, const std::any &old_value, const std::any &old_target) {
        ripple::trigger(_tracking, target, type, key, new_value, old_value, old_target);
    }
} // namespace ripple
