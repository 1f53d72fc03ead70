#include <ripple/reactivity/tracking_context.h>

#include <algorithm>

namespace ripple {
    bool TrackingContext::is_running(const Effect &effect) const {
        return std::find(_effect_stack.begin(), _effect_stack.end(), &effect) != _effect_stack.end();
    }

    void TrackingContext::pause_tracking() {
        _track_stack.push_back(_should_track);
        _should_track = false;
    }

    void TrackingContext::enable_tracking() {
        _track_stack.push_back(_should_track);
        _should_track = true;
    }

    void TrackingContext::reset_tracking() {
        if (_track_stack.empty()) {
            _should_track = true;
            return;
        }
        _should_track = _track_stack.back();
        _track_stack.pop_back();
    }

    void TrackingContext::push_effect(Effect &effect) {
        _effect_stack.push_back(&effect);
        _active_effect = &effect;
    }

    void TrackingContext::pop_effect() {
        if (!_effect_stack.empty()) { _effect_stack.pop_back(); }
        _active_effect = _effect_stack.empty() ? nullptr : _effect_stack.back();
    }

    ActiveEffectScope::ActiveEffectScope(TrackingContext &context, Effect &effect) : _context{context} {
        _context.enable_tracking();
        _context.push_effect(effect);
    }

    ActiveEffectScope::~ActiveEffectScope() noexcept {
        _context.pop_effect();
        _context.reset_tracking();
    }

    TrackingPause::TrackingPause(TrackingContext &context) : _context{context} { _context.pause_tracking(); }

    TrackingPause::~TrackingPause() noexcept { _context.reset_tracking(); }
} // namespace ripple
