#include <ripple/runtime/observers/flush_trace.h>
#include <ripple/scheduler/job.h>

#include <iostream>

namespace ripple {

    // Static member initialization
    bool FlushTrace::_use_logger = true;

    std::string_view to_string(FlushPhase phase) {
        switch (phase) {
            case FlushPhase::PRE_FLUSH: return "pre";
            case FlushPhase::MAIN: return "main";
            case FlushPhase::POST_FLUSH: return "post";
        }
        return "unknown";
    }

    FlushTrace::FlushTrace(const std::optional<std::string> &filter, bool flush, bool pre, bool main, bool post)
        : _filter(filter), _flush(flush), _pre(pre), _main(main), _post(post) {
    }

    void FlushTrace::set_use_logger(bool value) {
        _use_logger = value;
    }

    void FlushTrace::_print(const std::string &msg) const {
        std::string formatted = fmt::format("[flush {}] {}", _cycle, msg);
        if (_use_logger) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }
    }

    bool FlushTrace::_should_log_phase(FlushPhase phase) const {
        switch (phase) {
            case FlushPhase::PRE_FLUSH: return _pre;
            case FlushPhase::MAIN: return _main;
            case FlushPhase::POST_FLUSH: return _post;
        }
        return false;
    }

    bool FlushTrace::_should_log_job(const Job &job) const {
        if (!_filter.has_value()) {
            return true;
        }
        return job.label().find(_filter.value()) != std::string::npos;
    }

    void FlushTrace::on_before_flush(std::size_t queued_jobs) {
        ++_cycle;
        if (_flush) {
            _print(fmt::format(">> Starting flush with {} queued job(s)", queued_jobs));
        }
    }

    void FlushTrace::on_after_flush() {
        if (_flush) {
            _print("<< Finished flush");
        }
    }

    void FlushTrace::on_before_job(const Job &job, FlushPhase phase) {
        if (_should_log_phase(phase) && _should_log_job(job)) {
            _print(fmt::format("[{}] Running: {}", to_string(phase), job.label()));
        }
    }

    void FlushTrace::on_after_job(const Job &job, FlushPhase phase) {
        if (_should_log_phase(phase) && _should_log_job(job)) {
            _print(fmt::format("[{}] Completed: {}", to_string(phase), job.label()));
        }
    }

    void FlushTrace::on_job_invalidated(const Job &job) {
        if (_main && _should_log_job(job)) {
            _print(fmt::format("[main] Invalidated: {}", job.label()));
        }
    }

} // namespace ripple
