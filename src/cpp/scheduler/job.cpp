#include <ripple/scheduler/job.h>

namespace ripple {
    Job::Job(std::optional<job_id_t> id, bool allow_recurse) : _id{id}, _allow_recurse{allow_recurse} {}

    std::string Job::label() const {
        if (_id.has_value()) { return fmt::format("Job[id={}]@{:p}", *_id, static_cast<const void *>(this)); }
        return fmt::format("Job@{:p}", static_cast<const void *>(this));
    }

    FunctionJob::FunctionJob(std::function<void()> fn, std::optional<job_id_t> id, bool allow_recurse,
                             std::string label)
        : Job(id, allow_recurse), _fn{std::move(fn)}, _label{std::move(label)} {}

    void FunctionJob::run() {
        if (_fn) { _fn(); }
    }

    std::string FunctionJob::label() const { return _label.empty() ? Job::label() : _label; }

    job_s_ptr make_job(std::function<void()> fn, std::optional<job_id_t> id, bool allow_recurse, std::string label) {
        return new FunctionJob(std::move(fn), id, allow_recurse, std::move(label));
    }
} // namespace ripple
