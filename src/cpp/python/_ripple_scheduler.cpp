/*
 * Expose the jobs, the executor and the flush observers to python
 */
#include <ripple/python/ripple_python.h>
#include <ripple/runtime/deferred_executor.h>
#include <ripple/runtime/error_handling.h>
#include <ripple/runtime/observers/flush_observer.h>
#include <ripple/runtime/observers/flush_trace.h>
#include <ripple/scheduler/job.h>
#include <ripple/scheduler/scheduler.h>
#include <ripple/util/errors.h>

using namespace nb::literals;

namespace ripple {
    struct PyJob : Job {
        NB_TRAMPOLINE(Job, 2);

        void run() override { NB_OVERRIDE_PURE(run); }

        std::string label() const override { NB_OVERRIDE(label); }
    };

    struct PyDeferredExecutor : DeferredExecutor {
        NB_TRAMPOLINE(DeferredExecutor, 1);

        void defer(task_t task) override { NB_OVERRIDE_PURE(defer, task); }
    };

    struct PyFlushLifeCycleObserver : FlushLifeCycleObserver {
        NB_TRAMPOLINE(FlushLifeCycleObserver, 5);

        void on_before_flush(std::size_t queued_jobs) override { NB_OVERRIDE(on_before_flush, queued_jobs); }

        void on_after_flush() override { NB_OVERRIDE(on_after_flush); }

        void on_before_job(const Job &job, FlushPhase phase) override {
            NB_OVERRIDE(on_before_job, job, phase);
        }

        void on_after_job(const Job &job, FlushPhase phase) override {
            NB_OVERRIDE(on_after_job, job, phase);
        }

        void on_job_invalidated(const Job &job) override {
            NB_OVERRIDE(on_job_invalidated, job);
        }
    };
} // namespace ripple

void export_scheduler(nb::module_ &m) {
    using namespace ripple;

    nb::class_<Job, PyJob, nb::intrusive_base>(m, "Job")
            .def(nb::init<std::optional<job_id_t>, bool>(), "id"_a = nb::none(), "allow_recurse"_a = false)
            .def("run", &Job::run)
            .def("__call__", &Job::run)
            .def_prop_rw("id", [](const Job &self) { return self.id(); }, &Job::set_id)
            .def_prop_rw("allow_recurse", &Job::allow_recurse, &Job::set_allow_recurse)
            .def("label", &Job::label)
            .def("__str__", &Job::label)
            .def("__repr__", &Job::label);

    m.def("make_job", &make_job, "fn"_a, "id"_a = nb::none(), "allow_recurse"_a = false, "label"_a = "",
          "Wraps a callable as a job that can be queued on a runtime.");

    nb::enum_<FlushPhase>(m, "FlushPhase")
            .value("PRE_FLUSH", FlushPhase::PRE_FLUSH)
            .value("MAIN", FlushPhase::MAIN)
            .value("POST_FLUSH", FlushPhase::POST_FLUSH);

    nb::enum_<Scheduler::FlushState>(m, "FlushState")
            .value("IDLE", Scheduler::FlushState::IDLE)
            .value("PENDING", Scheduler::FlushState::PENDING)
            .value("FLUSHING", Scheduler::FlushState::FLUSHING);

    nb::enum_<ErrorCode>(m, "ErrorCode").value("SCHEDULER", ErrorCode::SCHEDULER);

    nb::class_<DeferredExecutor, PyDeferredExecutor, nb::intrusive_base>(m, "DeferredExecutor")
            .def(nb::init<>())
            .def("defer", &DeferredExecutor::defer, "task"_a);

    nb::class_<MicrotaskQueue, DeferredExecutor>(m, "MicrotaskQueue")
            .def(nb::init<>())
            .def("run_pending", &MicrotaskQueue::run_pending)
            .def("run_one", &MicrotaskQueue::run_one)
            .def_prop_ro("size", &MicrotaskQueue::size)
            .def_prop_ro("empty", &MicrotaskQueue::empty)
            .def("__len__", &MicrotaskQueue::size);

    nb::enum_<Completion::State>(m, "CompletionState")
            .value("PENDING", Completion::State::PENDING)
            .value("RESOLVED", Completion::State::RESOLVED)
            .value("REJECTED", Completion::State::REJECTED);

    nb::class_<Completion, nb::intrusive_base>(m, "Completion")
            .def(nb::init<deferred_executor_s_ptr>(), "executor"_a)
            .def_prop_ro("state", &Completion::state)
            .def_prop_ro("is_pending", &Completion::is_pending)
            .def_prop_ro("is_resolved", &Completion::is_resolved)
            .def_prop_ro("is_rejected", &Completion::is_rejected)
            .def_prop_ro("error_message",
                         [](const Completion &self) -> std::optional<std::string> {
                             if (!self.error()) { return std::nullopt; }
                             return describe_exception(self.error());
                         })
            .def("rethrow_if_failed", &Completion::rethrow_if_failed)
            .def("then", &Completion::then, "fn"_a)
            .def("resolve", &Completion::resolve);

    nb::class_<ErrorHandler, nb::intrusive_base>(m, "ErrorHandler");

    nb::class_<LoggingErrorHandler, ErrorHandler>(m, "LoggingErrorHandler").def(nb::init<>());

    nb::class_<FunctionErrorHandler, ErrorHandler>(m, "FunctionErrorHandler",
                                                   "Reports job failures to a callable taking (message, job, code).")
            .def("__init__", [](FunctionErrorHandler *self, nb::callable fn) {
                new(self) FunctionErrorHandler(
                    [fn = std::move(fn)](std::exception_ptr error, Job *job, const void *, ErrorCode code) {
                        fn(describe_exception(error), job_s_ptr{job}, code);
                    });
            }, "fn"_a);

    nb::class_<FlushLifeCycleObserver, PyFlushLifeCycleObserver, nb::intrusive_base>(m, "FlushLifeCycleObserver")
            .def(nb::init<>())
            .def("on_before_flush", &FlushLifeCycleObserver::on_before_flush)
            .def("on_after_flush", &FlushLifeCycleObserver::on_after_flush)
            .def("on_before_job", &FlushLifeCycleObserver::on_before_job)
            .def("on_after_job", &FlushLifeCycleObserver::on_after_job)
            .def("on_job_invalidated", &FlushLifeCycleObserver::on_job_invalidated);

    nb::class_<FlushTrace, FlushLifeCycleObserver>(m, "FlushTrace",
        "Logs out the different steps as the scheduler flushes its queues.\n"
        "\n"
        "This is voluminous but can be helpful tracing down unexpected update ordering.")
            .def(nb::init<const std::optional<std::string> &, bool, bool, bool, bool>(),
                 "filter"_a = std::nullopt,
                 "flush"_a = true,
                 "pre"_a = true,
                 "main"_a = true,
                 "post"_a = true,
                 "Construct a new FlushTrace.\n"
                 "\n"
                 "Args:\n"
                 "    filter: Used to restrict which jobs are reported (substring match on the job label)\n"
                 "    flush: Log the start and end of each flush cycle\n"
                 "    pre: Log pre-flush callbacks\n"
                 "    main: Log main queue jobs\n"
                 "    post: Log post-flush callbacks")
            .def_prop_ro("cycle", &FlushTrace::cycle)
            .def_static("set_use_logger", &FlushTrace::set_use_logger, "value"_a);
}
