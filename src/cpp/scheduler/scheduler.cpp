#include <ripple/scheduler/scheduler.h>
#include <ripple/util/errors.h>

#include <algorithm>
#include <unordered_set>

namespace ripple {
    namespace {
        bool contains_job(const std::vector<job_s_ptr> &jobs, const Job &job, std::size_t from) {
            if (from >= jobs.size()) { return false; }
            return std::any_of(jobs.begin() + static_cast<std::ptrdiff_t>(from), jobs.end(),
                               [&job](const job_s_ptr &j) { return j.get() == &job; });
        }

        std::vector<job_s_ptr> dedup(std::vector<job_s_ptr> jobs) {
            std::unordered_set<const Job *> seen;
            std::vector<job_s_ptr> result;
            result.reserve(jobs.size());
            for (auto &job: jobs) {
                if (job && seen.insert(job.get()).second) { result.emplace_back(std::move(job)); }
            }
            return result;
        }

        void sort_by_id(std::vector<job_s_ptr> &jobs) {
            std::stable_sort(jobs.begin(), jobs.end(), [](const job_s_ptr &lhs, const job_s_ptr &rhs) {
                return job_sort_key(lhs.get()) < job_sort_key(rhs.get());
            });
        }
    } // namespace

    // Installs a batch of pre-flush callbacks as the active batch, restoring the enclosing batch on exit so nested
    // drains leave the outer drain intact.
    struct PreFlushScope {
        PreFlushScope(Scheduler &scheduler, Job *parent_job)
            : _scheduler{scheduler}, _active{std::move(scheduler._active_pre)}, _was_active{scheduler._pre_active},
              _index{scheduler._pre_flush_index}, _parent{scheduler._current_pre_flush_parent} {
            _scheduler._current_pre_flush_parent = parent_job;
            _scheduler._active_pre = dedup(std::move(_scheduler._pending_pre));
            _scheduler._pending_pre.clear();
            _scheduler._pre_active = true;
            _scheduler._pre_flush_index = 0;
        }

        ~PreFlushScope() {
            _scheduler._active_pre = std::move(_active);
            _scheduler._pre_active = _was_active;
            _scheduler._pre_flush_index = _index;
            _scheduler._current_pre_flush_parent = _parent;
        }

        PreFlushScope(const PreFlushScope &) = delete;
        PreFlushScope &operator=(const PreFlushScope &) = delete;

    private:
        Scheduler &_scheduler;
        std::vector<job_s_ptr> _active;
        bool _was_active;
        std::size_t _index;
        Job *_parent;
    };

    struct PostFlushScope {
        PostFlushScope(Scheduler &scheduler, std::vector<job_s_ptr> batch) : _scheduler{scheduler} {
            _scheduler._active_post = std::move(batch);
            _scheduler._post_active = true;
            _scheduler._post_flush_index = 0;
        }

        ~PostFlushScope() {
            _scheduler._active_post.clear();
            _scheduler._post_active = false;
            _scheduler._post_flush_index = 0;
        }

        PostFlushScope(const PostFlushScope &) = delete;
        PostFlushScope &operator=(const PostFlushScope &) = delete;

    private:
        Scheduler &_scheduler;
    };

    std::string_view to_string(Scheduler::FlushState state) {
        switch (state) {
            case Scheduler::FlushState::IDLE: return "IDLE";
            case Scheduler::FlushState::PENDING: return "PENDING";
            case Scheduler::FlushState::FLUSHING: return "FLUSHING";
        }
        return "UNKNOWN";
    }

    Scheduler::Scheduler(deferred_executor_s_ptr executor, error_handler_s_ptr error_handler, RuntimeConfig config)
        : _executor{std::move(executor)}, _error_handler{std::move(error_handler)}, _config{config} {
        if (!_executor) { throw_error<std::invalid_argument>("Scheduler requires a deferred executor"); }
        if (!_error_handler) { throw_error<std::invalid_argument>("Scheduler requires an error handler"); }
    }

    void Scheduler::queue_job(job_s_ptr job) {
        if (!job) { throw_error<std::invalid_argument>("Cannot queue a null job"); }
        // While flushing, the running slot is part of the dedup search unless the job may re-queue itself.
        auto from{is_flushing() && job->allow_recurse() ? _flush_index + 1 : _flush_index};
        if (_queue.empty() || !contains_job(_queue, *job, from)) {
            if (job.get() != _current_pre_flush_parent) {
                _queue.emplace_back(std::move(job));
                _queue_flush();
            }
        }
    }

    void Scheduler::invalidate_job(const Job &job) {
        auto from{_pending_from()};
        if (from >= _queue.size()) { return; }
        auto it{std::find_if(_queue.begin() + static_cast<std::ptrdiff_t>(from), _queue.end(),
                             [&job](const job_s_ptr &j) { return j.get() == &job; })};
        if (it == _queue.end()) { return; }
        job_s_ptr removed{std::move(*it)};
        *it = job_s_ptr{};
        for (const auto &observer: _observers) { observer->on_job_invalidated(*removed); }
    }

    void Scheduler::queue_pre_flush_cb(job_s_ptr cb) {
        if (!cb) { throw_error<std::invalid_argument>("Cannot queue a null pre-flush callback"); }
        _queue_cb(std::move(cb), _pre_active, _active_pre, _pending_pre, _pre_flush_index);
    }

    void Scheduler::queue_post_flush_cb(job_s_ptr cb) {
        if (!cb) { throw_error<std::invalid_argument>("Cannot queue a null post-flush callback"); }
        _queue_cb(std::move(cb), _post_active, _active_post, _pending_post, _post_flush_index);
    }

    void Scheduler::queue_post_flush_cbs(std::vector<job_s_ptr> cbs) {
        for (auto &cb: cbs) {
            if (cb) { _pending_post.emplace_back(std::move(cb)); }
        }
        _queue_flush();
    }

    void Scheduler::flush_pre_flush_cbs(Job *parent_job) { _flush_pre_flush_cbs(nullptr, parent_job); }

    void Scheduler::flush_post_flush_cbs() { _flush_post_flush_cbs(nullptr); }

    completion_s_ptr Scheduler::next_tick() {
        if (_current_flush) { return _current_flush; }
        if (!_resolved) { _resolved = Completion::resolved(_executor); }
        return _resolved;
    }

    completion_s_ptr Scheduler::next_tick(std::function<void()> fn) { return next_tick()->then(std::move(fn)); }

    bool Scheduler::is_queued(const Job &job) const {
        return contains_job(_queue, job, _pending_from());
    }

    bool Scheduler::has_pending_work() const {
        auto from{_pending_from()};
        auto main_pending{from < _queue.size() &&
                          std::any_of(_queue.begin() + static_cast<std::ptrdiff_t>(from), _queue.end(),
                                      [](const job_s_ptr &j) { return static_cast<bool>(j); })};
        return main_pending || !_pending_pre.empty() || !_pending_post.empty();
    }

    std::size_t Scheduler::_pending_from() const {
        // Only the main loop consumes slots, the pre and post phases leave every slot pending.
        return _main_running ? _flush_index + 1 : 0;
    }

    void Scheduler::set_error_handler(error_handler_s_ptr error_handler) {
        if (!error_handler) { throw_error<std::invalid_argument>("Scheduler requires an error handler"); }
        _error_handler = std::move(error_handler);
    }

    void Scheduler::add_flush_observer(flush_observer_s_ptr observer) {
        if (!observer) { return; }
        if (std::find(_observers.begin(), _observers.end(), observer) == _observers.end()) {
            _observers.emplace_back(std::move(observer));
        }
    }

    void Scheduler::remove_flush_observer(const flush_observer_s_ptr &observer) {
        std::erase(_observers, observer);
    }

    void Scheduler::_queue_flush() {
        if (_state != FlushState::IDLE) { return; }
        _state = FlushState::PENDING;
        _current_flush = new Completion(_executor);
        s_ptr self{this};
        completion_s_ptr completion{_current_flush};
        _executor->defer([self, completion]() { self->_run_scheduled_flush(completion); });
    }

    void Scheduler::_queue_cb(job_s_ptr cb, bool active, const std::vector<job_s_ptr> &active_queue,
                              std::vector<job_s_ptr> &pending_queue, std::size_t index) {
        auto from{cb->allow_recurse() ? index + 1 : index};
        if (!active || !contains_job(active_queue, *cb, from)) { pending_queue.emplace_back(std::move(cb)); }
        _queue_flush();
    }

    void Scheduler::_run_scheduled_flush(const completion_s_ptr &completion) {
        count_map_t seen;
        try {
            _flush_jobs(seen);
        } catch (...) {
            completion->reject(std::current_exception());
            throw;
        }
        completion->resolve();
    }

    void Scheduler::_flush_jobs(count_map_t &seen) {
        _state = FlushState::FLUSHING;
        for (const auto &observer: _observers) { observer->on_before_flush(_queue.size()); }

        std::exception_ptr failure;
        try {
            _flush_pre_flush_cbs(&seen, nullptr);
            sort_by_id(_queue);
            _main_running = true;
            for (_flush_index = 0; _flush_index < _queue.size(); ++_flush_index) {
                // The slot may be emptied while the job runs, hold a reference for the duration.
                job_s_ptr job{_queue[_flush_index]};
                if (!job) { continue; }
                if (_config.check_recursive_updates) { _check_recursive_updates(seen, *job); }
                _run_job(*job);
            }
        } catch (...) {
            failure = std::current_exception();
        }

        _main_running = false;
        _flush_index = 0;
        _queue.clear();

        try {
            _flush_post_flush_cbs(&seen);
        } catch (...) {
            if (!failure) { failure = std::current_exception(); }
        }

        _state = FlushState::IDLE;
        _current_flush.reset();
        for (const auto &observer: _observers) { observer->on_after_flush(); }

        if (failure) {
            // Work queued by the failed cycle starts a cycle of its own.
            if (!_queue.empty() || !_pending_post.empty() || !_pending_pre.empty()) { _queue_flush(); }
            std::rethrow_exception(failure);
        }

        if (!_queue.empty() || !_pending_post.empty()) { _flush_jobs(seen); }
    }

    void Scheduler::_flush_pre_flush_cbs(count_map_t *seen, Job *parent_job) {
        count_map_t local_seen;
        if (seen == nullptr) { seen = &local_seen; }
        while (!_pending_pre.empty()) {
            PreFlushScope scope{*this, parent_job};
            for (_pre_flush_index = 0; _pre_flush_index < _active_pre.size(); ++_pre_flush_index) {
                job_s_ptr cb{_active_pre[_pre_flush_index]};
                if (_config.check_recursive_updates) { _check_recursive_updates(*seen, *cb); }
                _run_callback(*cb, FlushPhase::PRE_FLUSH);
            }
        }
    }

    void Scheduler::_flush_post_flush_cbs(count_map_t *seen) {
        if (_pending_post.empty()) { return; }
        auto batch{dedup(std::move(_pending_post))};
        _pending_post.clear();

        if (_post_active) {
            // Already draining, join the running batch.
            for (auto &cb: batch) { _active_post.emplace_back(std::move(cb)); }
            return;
        }

        count_map_t local_seen;
        if (seen == nullptr) { seen = &local_seen; }
        sort_by_id(batch);
        PostFlushScope scope{*this, std::move(batch)};
        for (_post_flush_index = 0; _post_flush_index < _active_post.size(); ++_post_flush_index) {
            job_s_ptr cb{_active_post[_post_flush_index]};
            if (_config.check_recursive_updates) { _check_recursive_updates(*seen, *cb); }
            _run_callback(*cb, FlushPhase::POST_FLUSH);
        }
    }

    void Scheduler::_check_recursive_updates(count_map_t &seen, Job &job) const {
        auto [it, inserted]{seen.try_emplace(&job, SeenEntry{job_s_ptr{&job}, 1})};
        if (inserted) { return; }
        if (it->second.count > _config.recursion_limit) {
            throw_error<RecursionLimitError>(job.label(), _config.recursion_limit);
        }
        ++it->second.count;
    }

    void Scheduler::_run_callback(Job &cb, FlushPhase phase) {
        for (const auto &observer: _observers) { observer->on_before_job(cb, phase); }
        cb.run();
        for (const auto &observer: _observers) { observer->on_after_job(cb, phase); }
    }

    void Scheduler::_run_job(Job &job) {
        for (const auto &observer: _observers) { observer->on_before_job(job, FlushPhase::MAIN); }
        // Hold the handler, it may be replaced by the job.
        error_handler_s_ptr handler{_error_handler};
        call_with_error_handling(job, *handler, ErrorCode::SCHEDULER);
        for (const auto &observer: _observers) { observer->on_after_job(job, FlushPhase::MAIN); }
    }
} // namespace ripple
