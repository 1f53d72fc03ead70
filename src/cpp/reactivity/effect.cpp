#include <ripple/reactivity/dep.h>
#include <ripple/reactivity/effect.h>
#include <ripple/reactivity/target.h>
#include <ripple/reactivity/tracking_context.h>
#include <ripple/runtime/reactive_runtime.h>

#include <algorithm>

namespace ripple {
    std::string DebuggerEvent::to_string() const {
        auto op{std::visit([](auto t) { return std::string{ripple::to_string(t)}; }, type)};
        return fmt::format("{}:{} key={} effect={} target={}", is_track() ? "track" : "trigger", op,
                           ripple::to_string(key), effect != nullptr ? effect->label() : std::string{"<none>"},
                           target != nullptr ? target->to_string() : std::string{"<none>"});
    }

    EffectCapability resolve_capabilities(const EffectOptions &options) {
        auto capabilities{EffectCapability::NONE};
        if (options.scheduler) { capabilities = capabilities | EffectCapability::SCHEDULER; }
        if (options.on_track) { capabilities = capabilities | EffectCapability::ON_TRACK; }
        if (options.on_trigger) { capabilities = capabilities | EffectCapability::ON_TRIGGER; }
        if (options.on_stop) { capabilities = capabilities | EffectCapability::ON_STOP; }
        return capabilities;
    }

    Effect::Effect(ReactiveRuntime &runtime, job_id_t effect_id, std::function<void()> fn, EffectOptions options)
        : Job(effect_id, options.allow_recurse), _runtime{&runtime}, _effect_id{effect_id}, _fn{std::move(fn)},
          _options{std::move(options)}, _capabilities{resolve_capabilities(_options)} {}

    Effect::~Effect() = default;

    void Effect::run() {
        if (!_active) {
            // A stopped effect with a scheduler is dead, without one it still behaves as a plain function.
            if (!has_capability(EffectCapability::SCHEDULER) && _fn) { _fn(); }
            return;
        }
        auto &tracking{_runtime->tracking()};
        if (tracking.is_running(*this)) { return; }

        // Cleanup may release the last reference held by a Dep.
        effect_s_ptr self{this};
        cleanup();
        ActiveEffectScope scope{tracking, *this};
        if (_fn) { _fn(); }
    }

    void Effect::stop() {
        if (!_active) { return; }
        effect_s_ptr self{this};
        cleanup();
        if (has_capability(EffectCapability::ON_STOP)) { _options.on_stop(); }
        _active = false;
    }

    std::string Effect::label() const { return fmt::format("Effect#{}", _effect_id); }

    void Effect::cleanup() {
        if (_deps.empty()) { return; }
        effect_s_ptr self{this};
        auto deps{std::move(_deps)};
        _deps.clear();
        for (auto dep: deps) { dep->remove(*this); }
    }

    void Effect::record_dependency(Dep &dep) { _deps.push_back(&dep); }

    void Effect::forget_dependency(const Dep &dep) { std::erase(_deps, &dep); }

    void Effect::notify_track(const DebuggerEvent &event) const {
        if (has_capability(EffectCapability::ON_TRACK)) { _options.on_track(event); }
    }

    void Effect::notify_trigger(const DebuggerEvent &event) const {
        if (has_capability(EffectCapability::ON_TRIGGER)) { _options.on_trigger(event); }
    }

    void Effect::schedule() {
        if (has_capability(EffectCapability::SCHEDULER)) {
            _options.scheduler(*this);
        } else {
            run();
        }
    }
} // namespace ripple
