#ifndef RIPPLE_RUNTIME_DEFERRED_EXECUTOR_H
#define RIPPLE_RUNTIME_DEFERRED_EXECUTOR_H

#include <ripple/ripple_base.h>

#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <vector>

namespace ripple {
    /**
     * The host's deferral primitive. Deferred tasks run later on the same thread, in the order they were deferred,
     * after the currently executing code has returned to the host.
     */
    struct RIPPLE_EXPORT DeferredExecutor : nb::intrusive_base {
        using s_ptr = deferred_executor_s_ptr;
        using task_t = std::function<void()>;

        virtual void defer(task_t task) = 0;
    };

    /**
     * A single threaded task queue standing in for a micro-task queue.
     *
     * Nothing runs until the host reaches a checkpoint and calls run_pending, which drains the queue including the
     * tasks deferred while draining. An exception raised by a task propagates out of run_pending, the tasks behind
     * it stay queued for the next checkpoint.
     */
    struct RIPPLE_EXPORT MicrotaskQueue final : DeferredExecutor {
        using s_ptr = nb::ref<MicrotaskQueue>;

        void defer(task_t task) override;

        /**
         * Runs queued tasks until the queue is empty.
         * @return the number of tasks run
         */
        std::size_t run_pending();

        /**
         * Runs at most one queued task.
         * @return true if a task was run
         */
        bool run_one();

        [[nodiscard]] std::size_t size() const { return _tasks.size(); }

        [[nodiscard]] bool empty() const { return _tasks.empty(); }

    private:
        std::deque<task_t> _tasks;
    };

    /**
     * A promise-like signal for work that completes in a later task, used to answer next-tick queries.
     *
     * Continuations registered with then run as separate deferred tasks once the completion is resolved, never
     * synchronously inside then or resolve. A continuation that throws rejects the completion returned by then; a
     * rejected completion skips its continuations and passes the error on to their completions.
     */
    struct RIPPLE_EXPORT Completion : nb::intrusive_base {
        using s_ptr = completion_s_ptr;

        enum class State : std::uint8_t { PENDING = 0, RESOLVED = 1, REJECTED = 2 };

        explicit Completion(deferred_executor_s_ptr executor);

        static s_ptr resolved(deferred_executor_s_ptr executor);

        [[nodiscard]] State state() const { return _state; }

        [[nodiscard]] bool is_pending() const { return _state == State::PENDING; }

        [[nodiscard]] bool is_resolved() const { return _state == State::RESOLVED; }

        [[nodiscard]] bool is_rejected() const { return _state == State::REJECTED; }

        [[nodiscard]] const std::exception_ptr &error() const { return _error; }

        /**
         * Rethrows the error of a rejected completion, does nothing otherwise.
         */
        void rethrow_if_failed() const;

        s_ptr then(std::function<void()> fn);

        void resolve();

        void reject(std::exception_ptr error);

    private:
        struct Continuation {
            std::function<void()> fn;
            s_ptr completion;
        };

        void _schedule(Continuation continuation);

        deferred_executor_s_ptr _executor;
        State _state{State::PENDING};
        std::exception_ptr _error;
        std::vector<Continuation> _continuations;
    };
} // namespace ripple

#endif // RIPPLE_RUNTIME_DEFERRED_EXECUTOR_H
