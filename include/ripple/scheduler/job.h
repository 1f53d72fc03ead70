#ifndef RIPPLE_SCHEDULER_JOB_H
#define RIPPLE_SCHEDULER_JOB_H

#include <ripple/ripple_base.h>

#include <functional>
#include <limits>
#include <optional>
#include <string>

namespace ripple {
    /**
     * A unit of deferred work.
     *
     * Jobs are identified by object identity, queueing the same job twice before it runs results in a single
     * execution. The optional id orders the main queue (lower ids run first, jobs without an id run last).
     *
     * By default a job cannot re-queue itself while it is running, since the dedup search includes the slot that is
     * currently being executed. Jobs that set allow_recurse are searched from the next slot onwards, so they can
     * schedule themselves again; it is then the responsibility of the job to stabilise.
     */
    struct RIPPLE_EXPORT Job : nb::intrusive_base {
        using ptr = job_ptr;
        using s_ptr = job_s_ptr;

        explicit Job(std::optional<job_id_t> id = std::nullopt, bool allow_recurse = false);

        ~Job() override = default;

        virtual void run() = 0;

        void operator()() { run(); }

        [[nodiscard]] const std::optional<job_id_t> &id() const { return _id; }

        void set_id(std::optional<job_id_t> id) { _id = id; }

        [[nodiscard]] bool allow_recurse() const { return _allow_recurse; }

        void set_allow_recurse(bool allow_recurse) { _allow_recurse = allow_recurse; }

        /**
         * A human readable name for the job, used in traces and error reports.
         */
        [[nodiscard]] virtual std::string label() const;

    private:
        std::optional<job_id_t> _id;
        bool _allow_recurse;
    };

    /**
     * A job wrapping a callable.
     */
    struct RIPPLE_EXPORT FunctionJob final : Job {
        using s_ptr = nb::ref<FunctionJob>;

        explicit FunctionJob(std::function<void()> fn, std::optional<job_id_t> id = std::nullopt,
                             bool allow_recurse = false, std::string label = {});

        void run() override;

        [[nodiscard]] std::string label() const override;

    private:
        std::function<void()> _fn;
        std::string _label;
    };

    RIPPLE_EXPORT job_s_ptr make_job(std::function<void()> fn, std::optional<job_id_t> id = std::nullopt,
                                     bool allow_recurse = false, std::string label = {});

    /**
     * The sort key used to order jobs, jobs without an id sort after every job with one.
     */
    [[nodiscard]] inline job_id_t job_sort_key(const Job *job) {
        if (job == nullptr || !job->id().has_value()) { return std::numeric_limits<job_id_t>::max(); }
        return *job->id();
    }
} // namespace ripple

#endif // RIPPLE_SCHEDULER_JOB_H
