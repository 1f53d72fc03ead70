#ifndef RIPPLE_REACTIVITY_TARGET_H
#define RIPPLE_REACTIVITY_TARGET_H

#include <ripple/reactivity/dep.h>
#include <ripple/reactivity/operations.h>

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ripple {
    /**
     * An observed compound value.
     *
     * The instrumentation layer owns (or derives from) a Target for every observed structure and reports reads and
     * writes against it through track and trigger. The target carries its own key to Dep map, created on the first
     * tracked read, so the dependency graph does not need to keep targets alive. The map is released explicitly
     * with release_dependencies, or when the target is destroyed.
     *
     * Keys are kept in the order they were first tracked, notifications that span keys (clear, length changes)
     * follow that order.
     */
    struct RIPPLE_EXPORT Target : nb::intrusive_base {
        using ptr = target_ptr;
        using s_ptr = target_s_ptr;
        using dep_entry = std::pair<Key, std::unique_ptr<Dep>>;

        explicit Target(TargetKind kind = TargetKind::OBJECT, std::string label = {});

        ~Target() override;

        Target(const Target &) = delete;

        Target &operator=(const Target &) = delete;

        [[nodiscard]] TargetKind kind() const { return _kind; }

        [[nodiscard]] bool is_sequence() const { return _kind == TargetKind::SEQUENCE; }

        [[nodiscard]] bool is_map() const { return _kind == TargetKind::MAP; }

        [[nodiscard]] const std::string &label() const { return _label; }

        /**
         * True once a read of this target has been tracked (and the dependencies have not been released since).
         */
        [[nodiscard]] bool is_observed() const { return _observed; }

        /**
         * @return the Dep for the key or nullptr when the key was never tracked
         */
        [[nodiscard]] Dep *find_dep(const Key &key) const;

        /**
         * @return the Dep for the key, creating it if required
         */
        Dep &ensure_dep(const Key &key);

        [[nodiscard]] std::size_t dep_count() const { return _deps.size(); }

        template<typename Op>
        void for_each_dep(Op op) const {
            for (const auto &[key, dep]: _deps) { op(key, *dep); }
        }

        /**
         * Unlinks every subscribed effect and drops the key to Dep map, the target is no longer observed after this.
         */
        void release_dependencies();

        [[nodiscard]] std::string to_string() const;

    private:
        TargetKind _kind;
        std::string _label;
        bool _observed{false};
        std::vector<dep_entry> _deps;
        std::unordered_map<Key, std::size_t> _dep_index;
    };
} // namespace ripple

#endif // RIPPLE_REACTIVITY_TARGET_H
