/**
 * @file test_flush_trace.cpp
 * @brief Tests for the flush life-cycle notifications and the FlushTrace observer.
 */

#include <catch2/catch_test_macros.hpp>

#include <ripple/runtime/observers/flush_trace.h>
#include <ripple/scheduler/scheduler.h>

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace ripple;

namespace {
    using strings = std::vector<std::string>;

    struct RecordingObserver : FlushLifeCycleObserver {
        strings events;

        void on_before_flush(std::size_t queued_jobs) override {
            events.push_back(fmt::format("begin {}", queued_jobs));
        }

        void on_after_flush() override { events.emplace_back("end"); }

        void on_before_job(const Job &job, FlushPhase phase) override {
            events.push_back(fmt::format("{} {}", to_string(phase), job.label()));
        }

        void on_after_job(const Job &job, FlushPhase phase) override {
            events.push_back(fmt::format("{} {} done", to_string(phase), job.label()));
        }

        void on_job_invalidated(const Job &job) override {
            events.push_back(fmt::format("invalidated {}", job.label()));
        }
    };

    struct ObservedScheduler {
        MicrotaskQueue::s_ptr queue{new MicrotaskQueue()};
        scheduler_s_ptr scheduler{new Scheduler(queue.get(), new LoggingErrorHandler())};

        job_s_ptr job(const std::string &label, std::optional<job_id_t> id = std::nullopt) {
            return make_job([] {}, id, false, label);
        }
    };

    // Redirects std::cout for the life of the scope.
    struct CaptureStdout {
        std::ostringstream buffer;
        std::streambuf *previous;

        CaptureStdout() : previous{std::cout.rdbuf(buffer.rdbuf())} {}

        ~CaptureStdout() { std::cout.rdbuf(previous); }
    };
} // namespace

// ============================================================================
// FlushLifeCycleObserver
// ============================================================================

TEST_CASE("FlushLifeCycleObserver - sees every phase of a cycle", "[observers]") {
    ObservedScheduler s;
    nb::ref<RecordingObserver> observer{new RecordingObserver()};
    s.scheduler->add_flush_observer(observer.get());

    s.scheduler->queue_post_flush_cb(s.job("post"));
    s.scheduler->queue_job(s.job("main-2", 2));
    s.scheduler->queue_job(s.job("main-1", 1));
    s.scheduler->queue_pre_flush_cb(s.job("pre"));
    s.queue->run_pending();

    CHECK(observer->events == strings{
              "begin 2",
              "pre pre", "pre pre done",
              "main main-1", "main main-1 done",
              "main main-2", "main main-2 done",
              "post post", "post post done",
              "end"
          });
}

TEST_CASE("FlushLifeCycleObserver - is told about invalidated jobs", "[observers]") {
    ObservedScheduler s;
    nb::ref<RecordingObserver> observer{new RecordingObserver()};
    s.scheduler->add_flush_observer(observer.get());

    auto cancelled = s.job("cancelled");
    s.scheduler->queue_job(cancelled);
    s.scheduler->invalidate_job(*cancelled);
    // Not queued any more, nothing to report.
    s.scheduler->invalidate_job(*cancelled);
    s.queue->run_pending();

    CHECK(observer->events == strings{"invalidated cancelled", "begin 1", "end"});
}

TEST_CASE("FlushLifeCycleObserver - observers are registered once and can be removed", "[observers]") {
    ObservedScheduler s;
    nb::ref<RecordingObserver> observer{new RecordingObserver()};
    s.scheduler->add_flush_observer(observer.get());
    s.scheduler->add_flush_observer(observer.get());

    s.scheduler->queue_job(s.job("first"));
    s.queue->run_pending();
    CHECK(observer->events == strings{"begin 1", "main first", "main first done", "end"});

    s.scheduler->remove_flush_observer(observer.get());
    observer->events.clear();
    s.scheduler->queue_job(s.job("second"));
    s.queue->run_pending();
    CHECK(observer->events.empty());
}

// ============================================================================
// FlushTrace
// ============================================================================

TEST_CASE("FlushTrace - counts cycles and prints the jobs it runs", "[observers][trace]") {
    ObservedScheduler s;
    FlushTrace::set_use_logger(false);
    nb::ref<FlushTrace> trace{new FlushTrace()};
    s.scheduler->add_flush_observer(trace.get());

    std::string output;
    {
        CaptureStdout capture;
        s.scheduler->queue_job(s.job("render", 1));
        s.queue->run_pending();
        s.scheduler->queue_job(s.job("render", 1));
        s.queue->run_pending();
        output = capture.buffer.str();
    }
    FlushTrace::set_use_logger(true);

    CHECK(trace->cycle() == 2);
    CHECK(output.find("[flush 1] >> Starting flush with 1 queued job(s)") != std::string::npos);
    CHECK(output.find("[flush 1] [main] Running: render") != std::string::npos);
    CHECK(output.find("[flush 2] << Finished flush") != std::string::npos);
}

TEST_CASE("FlushTrace - the filter and phase switches restrict the output", "[observers][trace]") {
    ObservedScheduler s;
    FlushTrace::set_use_logger(false);
    nb::ref<FlushTrace> trace{new FlushTrace(std::string{"keep"}, false, true, true, false)};
    s.scheduler->add_flush_observer(trace.get());

    std::string output;
    {
        CaptureStdout capture;
        s.scheduler->queue_pre_flush_cb(s.job("keep-pre"));
        s.scheduler->queue_job(s.job("keep-main"));
        s.scheduler->queue_job(s.job("skip-main"));
        s.scheduler->queue_post_flush_cb(s.job("keep-post"));
        s.queue->run_pending();
        output = capture.buffer.str();
    }
    FlushTrace::set_use_logger(true);

    CHECK(trace->cycle() == 1);
    CHECK(output.find("[pre] Running: keep-pre") != std::string::npos);
    CHECK(output.find("[main] Completed: keep-main") != std::string::npos);
    CHECK(output.find("skip-main") == std::string::npos);
    CHECK(output.find("keep-post") == std::string::npos);
    CHECK(output.find("Starting flush") == std::string::npos);
}
