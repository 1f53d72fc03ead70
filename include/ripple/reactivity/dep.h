#ifndef RIPPLE_REACTIVITY_DEP_H
#define RIPPLE_REACTIVITY_DEP_H

#include <ripple/reactivity/effect.h>

#include <vector>

namespace ripple {
    /**
     * The set of effects subscribed to one (target, key) pair.
     *
     * Membership is unique, adding an effect that is already subscribed is a no-op. Subscribers are kept in
     * subscription order and are held by counted reference, an effect stays alive for as long as something it
     * reads is observed, or until it is stopped.
     */
    class RIPPLE_EXPORT Dep {
    public:
        Dep() = default;

        ~Dep();

        Dep(const Dep &) = delete;

        Dep &operator=(const Dep &) = delete;

        /**
         * @return true if the effect was not subscribed before this call
         */
        bool add(Effect &effect);

        /**
         * @return true if the effect was subscribed
         */
        bool remove(const Effect &effect);

        [[nodiscard]] bool contains(const Effect &effect) const;

        [[nodiscard]] bool empty() const { return _subscribers.empty(); }

        [[nodiscard]] std::size_t size() const { return _subscribers.size(); }

        [[nodiscard]] const std::vector<effect_s_ptr> &subscribers() const { return _subscribers; }

        template<typename Op>
        void apply(Op op) const {
            for (const auto &effect: _subscribers) { op(*effect); }
        }

        /**
         * Drops every subscriber, also removing this Dep from the subscribers' own dependency lists.
         */
        void release();

    private:
        std::vector<effect_s_ptr> _subscribers;
    };
} // namespace ripple

#endif // RIPPLE_REACTIVITY_DEP_H
