#include <ripple/reactivity/target.h>

namespace ripple {
    Target::Target(TargetKind kind, std::string label) : _kind{kind}, _label{std::move(label)} {}

    Target::~Target() { release_dependencies(); }

    Dep *Target::find_dep(const Key &key) const {
        auto it{_dep_index.find(key)};
        return it == _dep_index.end() ? nullptr : _deps[it->second].second.get();
    }

    Dep &Target::ensure_dep(const Key &key) {
        _observed = true;
        auto [it, inserted] = _dep_index.try_emplace(key, _deps.size());
        if (inserted) { _deps.emplace_back(key, std::make_unique<Dep>()); }
        return *_deps[it->second].second;
    }

    void Target::release_dependencies() {
        // Unlink first so the effects do not see a half destroyed map while their references are dropped.
        auto deps{std::move(_deps)};
        _deps.clear();
        _dep_index.clear();
        _observed = false;
        for (auto &[_, dep]: deps) { dep->release(); }
    }

    std::string Target::to_string() const {
        if (_label.empty()) {
            return fmt::format("Target[{}]@{:p}", ripple::to_string(_kind), static_cast<const void *>(this));
        }
        return fmt::format("Target[{}:{}]", ripple::to_string(_kind), _label);
    }
} // namespace ripple
