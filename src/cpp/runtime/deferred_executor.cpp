#include <ripple/runtime/deferred_executor.h>
#include <ripple/util/errors.h>

namespace ripple {
    void MicrotaskQueue::defer(task_t task) { _tasks.emplace_back(std::move(task)); }

    std::size_t MicrotaskQueue::run_pending() {
        std::size_t count{0};
        while (run_one()) { ++count; }
        return count;
    }

    bool MicrotaskQueue::run_one() {
        if (_tasks.empty()) { return false; }
        auto task{std::move(_tasks.front())};
        _tasks.pop_front();
        task();
        return true;
    }

    Completion::Completion(deferred_executor_s_ptr executor) : _executor{std::move(executor)} {
        if (!_executor) { throw_error<std::invalid_argument>("A Completion requires an executor"); }
    }

    Completion::s_ptr Completion::resolved(deferred_executor_s_ptr executor) {
        s_ptr completion{new Completion(std::move(executor))};
        completion->resolve();
        return completion;
    }

    void Completion::rethrow_if_failed() const {
        if (_state == State::REJECTED && _error) { std::rethrow_exception(_error); }
    }

    Completion::s_ptr Completion::then(std::function<void()> fn) {
        s_ptr next{new Completion(_executor)};
        Continuation continuation{std::move(fn), next};
        if (_state == State::PENDING) {
            _continuations.emplace_back(std::move(continuation));
        } else {
            _schedule(std::move(continuation));
        }
        return next;
    }

    void Completion::resolve() {
        if (_state != State::PENDING) { return; }
        _state = State::RESOLVED;
        auto continuations{std::move(_continuations)};
        _continuations.clear();
        for (auto &continuation: continuations) { _schedule(std::move(continuation)); }
    }

    void Completion::reject(std::exception_ptr error) {
        if (_state != State::PENDING) { return; }
        _state = State::REJECTED;
        _error = std::move(error);
        auto continuations{std::move(_continuations)};
        _continuations.clear();
        for (auto &continuation: continuations) { _schedule(std::move(continuation)); }
    }

    void Completion::_schedule(Continuation continuation) {
        s_ptr self{this};
        _executor->defer([self, continuation = std::move(continuation)]() {
            if (self->is_rejected()) {
                continuation.completion->reject(self->error());
                return;
            }
            if (continuation.fn) {
                try {
                    continuation.fn();
                } catch (...) {
                    continuation.completion->reject(std::current_exception());
                    return;
                }
            }
            continuation.completion->resolve();
        });
    }
} // namespace ripple
