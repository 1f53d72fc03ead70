#ifndef RIPPLE_RUNTIME_FLUSH_OBSERVER_H
#define RIPPLE_RUNTIME_FLUSH_OBSERVER_H

#include <ripple/ripple_base.h>

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace ripple {
    enum class FlushPhase : std::uint8_t { PRE_FLUSH = 0, MAIN = 1, POST_FLUSH = 2 };

    [[nodiscard]] RIPPLE_EXPORT std::string_view to_string(FlushPhase phase);

    // FlushLifeCycleObserver - externally managed observer, keeps nb::intrusive_base
    struct FlushLifeCycleObserver : nb::intrusive_base {
        using ptr = flush_observer_ptr;
        using s_ptr = flush_observer_s_ptr;

        virtual void on_before_flush(std::size_t /*queued_jobs*/) {
        };

        virtual void on_after_flush() {
        };

        virtual void on_before_job(const Job &, FlushPhase) {
        };

        virtual void on_after_job(const Job &, FlushPhase) {
        };

        virtual void on_job_invalidated(const Job &) {
        };
    };
} // namespace ripple

#endif // RIPPLE_RUNTIME_FLUSH_OBSERVER_H
