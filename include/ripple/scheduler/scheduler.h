#ifndef RIPPLE_SCHEDULER_SCHEDULER_H
#define RIPPLE_SCHEDULER_SCHEDULER_H

#include <ripple/runtime/deferred_executor.h>
#include <ripple/runtime/error_handling.h>
#include <ripple/runtime/observers/flush_observer.h>
#include <ripple/runtime/runtime_config.h>
#include <ripple/scheduler/job.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ripple {
    /**
     * Batches jobs and callbacks into one ordered flush per scheduled tick.
     *
     * There are three queues:
     * * pre-flush callbacks, drained until empty before the main queue runs;
     * * the main queue, sorted by job id and run in index order, each job isolated so a failure is reported to the
     *   error handler without stopping the rest;
     * * post-flush callbacks, run once the main queue is done.
     *
     * Queueing anything while idle defers exactly one flush task on the executor, later requests join that flush.
     * When a flush leaves new main jobs or post-flush callbacks behind it flushes again straight away, sharing the
     * recursion counts of the cycle.
     *
     * NOTE: The scheduler is confined to a single thread, re-entrant calls from the jobs themselves are expected.
     */
    struct RIPPLE_EXPORT Scheduler : nb::intrusive_base {
        using s_ptr = scheduler_s_ptr;

        enum class FlushState : std::uint8_t { IDLE = 0, PENDING = 1, FLUSHING = 2 };

        struct SeenEntry {
            job_s_ptr job;
            std::size_t count{0};
        };

        using count_map_t = std::unordered_map<const Job *, SeenEntry>;

        Scheduler(deferred_executor_s_ptr executor, error_handler_s_ptr error_handler, RuntimeConfig config = {});

        /**
         * Adds the job to the main queue unless it is already waiting to run, or it is the job currently draining
         * the pre-flush callbacks.
         */
        void queue_job(job_s_ptr job);

        /**
         * Cancels a queued job that has not run yet, its slot is left empty so in-flight indices stay valid.
         */
        void invalidate_job(const Job &job);

        void queue_pre_flush_cb(job_s_ptr cb);

        void queue_post_flush_cb(job_s_ptr cb);

        /**
         * Queues a batch of post-flush callbacks without checking for duplicates, the caller guarantees each
         * callback is queued once.
         */
        void queue_post_flush_cbs(std::vector<job_s_ptr> cbs);

        /**
         * Runs the pending pre-flush callbacks until none are left. While they run, parent_job cannot be queued.
         */
        void flush_pre_flush_cbs(Job *parent_job = nullptr);

        /**
         * Runs the pending post-flush callbacks. When called while post-flush callbacks are already running, the
         * pending callbacks are appended to the running batch instead.
         */
        void flush_post_flush_cbs();

        /**
         * @return a completion resolved once the pending (or running) flush has finished, or an already resolved
         *         completion when nothing is scheduled
         */
        [[nodiscard]] completion_s_ptr next_tick();

        /**
         * @return the completion of fn, which runs after the pending (or running) flush has finished
         */
        completion_s_ptr next_tick(std::function<void()> fn);

        [[nodiscard]] FlushState flush_state() const { return _state; }

        [[nodiscard]] bool is_flushing() const { return _state == FlushState::FLUSHING; }

        [[nodiscard]] bool is_flush_pending() const { return _state == FlushState::PENDING; }

        [[nodiscard]] std::size_t flush_index() const { return _flush_index; }

        /**
         * The number of main queue slots, including invalidated and already executed slots of a running flush.
         */
        [[nodiscard]] std::size_t queue_size() const { return _queue.size(); }

        [[nodiscard]] bool is_queued(const Job &job) const;

        [[nodiscard]] std::size_t pending_pre_flush_count() const { return _pending_pre.size(); }

        [[nodiscard]] std::size_t pending_post_flush_count() const { return _pending_post.size(); }

        [[nodiscard]] bool has_pending_work() const;

        [[nodiscard]] const RuntimeConfig &config() const { return _config; }

        [[nodiscard]] const deferred_executor_s_ptr &executor() const { return _executor; }

        [[nodiscard]] const error_handler_s_ptr &error_handler() const { return _error_handler; }

        void set_error_handler(error_handler_s_ptr error_handler);

        void add_flush_observer(flush_observer_s_ptr observer);

        void remove_flush_observer(const flush_observer_s_ptr &observer);

    private:
        friend struct PreFlushScope;
        friend struct PostFlushScope;

        void _queue_flush();

        void _queue_cb(job_s_ptr cb, bool active, const std::vector<job_s_ptr> &active_queue,
                       std::vector<job_s_ptr> &pending_queue, std::size_t index);

        void _run_scheduled_flush(const completion_s_ptr &completion);

        void _flush_jobs(count_map_t &seen);

        void _flush_pre_flush_cbs(count_map_t *seen, Job *parent_job);

        void _flush_post_flush_cbs(count_map_t *seen);

        void _check_recursive_updates(count_map_t &seen, Job &job) const;

        void _run_callback(Job &cb, FlushPhase phase);

        void _run_job(Job &job);

        [[nodiscard]] std::size_t _pending_from() const;

        deferred_executor_s_ptr _executor;
        error_handler_s_ptr _error_handler;
        RuntimeConfig _config;
        std::vector<flush_observer_s_ptr> _observers;

        FlushState _state{FlushState::IDLE};
        completion_s_ptr _current_flush;
        completion_s_ptr _resolved;

        std::vector<job_s_ptr> _queue;
        std::size_t _flush_index{0};
        bool _main_running{false};

        std::vector<job_s_ptr> _pending_pre;
        std::vector<job_s_ptr> _active_pre;
        bool _pre_active{false};
        std::size_t _pre_flush_index{0};
        Job *_current_pre_flush_parent{nullptr};

        std::vector<job_s_ptr> _pending_post;
        std::vector<job_s_ptr> _active_post;
        bool _post_active{false};
        std::size_t _post_flush_index{0};
    };

    [[nodiscard]] RIPPLE_EXPORT std::string_view to_string(Scheduler::FlushState state);
} // namespace ripple

#endif // RIPPLE_SCHEDULER_SCHEDULER_H
