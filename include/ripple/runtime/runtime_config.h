#ifndef RIPPLE_RUNTIME_CONFIG_H
#define RIPPLE_RUNTIME_CONFIG_H

#include <cstddef>

namespace ripple {
    inline constexpr std::size_t DEFAULT_RECURSION_LIMIT = 100;

    /**
     * Settings of a ReactiveRuntime, fixed when the runtime is constructed.
     */
    struct RuntimeConfig {
        /**
         * The number of times one job or callback may run within one flush cycle before the cycle fails with a
         * RecursionLimitError.
         */
        std::size_t recursion_limit{DEFAULT_RECURSION_LIMIT};
        /**
         * Count job invocations per cycle and enforce recursion_limit.
         */
        bool check_recursive_updates{true};
    };
} // namespace ripple

#endif // RIPPLE_RUNTIME_CONFIG_H
