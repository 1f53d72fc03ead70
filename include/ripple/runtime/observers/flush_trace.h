#pragma once

#include <ripple/runtime/observers/flush_observer.h>

#include <cstddef>
#include <optional>
#include <string>

namespace ripple {

    /**
     * @brief Logs out the different steps as the scheduler flushes its queues.
     *
     * This is voluminous but can be helpful tracing down unexpected update ordering or effects that keep
     * re-scheduling themselves.
     */
    class RIPPLE_EXPORT FlushTrace : public FlushLifeCycleObserver {
    public:
        /**
         * @brief Construct a new Flush Trace object
         *
         * @param filter Used to restrict which jobs are reported (substring match on the job label)
         * @param flush Log the start and end of each flush cycle
         * @param pre Log pre-flush callbacks
         * @param main Log main queue jobs
         * @param post Log post-flush callbacks
         */
        explicit FlushTrace(const std::optional<std::string> &filter = std::nullopt, bool flush = true,
                            bool pre = true, bool main = true, bool post = true);

        void on_before_flush(std::size_t queued_jobs) override;

        void on_after_flush() override;

        void on_before_job(const Job &job, FlushPhase phase) override;

        void on_after_job(const Job &job, FlushPhase phase) override;

        void on_job_invalidated(const Job &job) override;

        [[nodiscard]] std::size_t cycle() const { return _cycle; }

        // Static configuration
        static void set_use_logger(bool value);

    private:
        std::optional<std::string> _filter;
        bool _flush;
        bool _pre;
        bool _main;
        bool _post;
        std::size_t _cycle{0};

        static bool _use_logger;

        void _print(const std::string &msg) const;

        [[nodiscard]] bool _should_log_phase(FlushPhase phase) const;

        [[nodiscard]] bool _should_log_job(const Job &job) const;
    };

} // namespace ripple
