#include <ripple/reactivity/dep.h>

#include <algorithm>

namespace ripple {
    Dep::~Dep() { release(); }

    bool Dep::add(Effect &effect) {
        if (contains(effect)) { return false; }
        _subscribers.emplace_back(&effect);
        return true;
    }

    bool Dep::remove(const Effect &effect) {
        auto it{std::find_if(_subscribers.begin(), _subscribers.end(),
                             [&effect](const effect_s_ptr &e) { return e.get() == &effect; })};
        if (it == _subscribers.end()) { return false; }
        // Move the reference out before erasing, the erase must not be the point where the effect is released.
        effect_s_ptr released{std::move(*it)};
        _subscribers.erase(it);
        return true;
    }

    bool Dep::contains(const Effect &effect) const {
        return std::any_of(_subscribers.begin(), _subscribers.end(),
                           [&effect](const effect_s_ptr &e) { return e.get() == &effect; });
    }

    void Dep::release() {
        auto subscribers{std::move(_subscribers)};
        _subscribers.clear();
        for (auto &effect: subscribers) { effect->forget_dependency(*this); }
    }
} // namespace ripple
