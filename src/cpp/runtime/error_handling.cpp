#include <ripple/runtime/error_handling.h>
#include <ripple/scheduler/job.h>
#include <ripple/util/errors.h>

namespace ripple {
    std::string_view to_string(ErrorCode code) {
        switch (code) {
            case ErrorCode::SCHEDULER: return "scheduler flush";
        }
        return "unknown";
    }

    void LoggingErrorHandler::handle_error(std::exception_ptr error, Job *job, const void *, ErrorCode code) {
        fmt::print(stderr, "Unhandled error during execution of {}\n  job: {}\n  error: {}\n", to_string(code),
                   job != nullptr ? job->label() : std::string{"<none>"}, describe_exception(error));
    }

    FunctionErrorHandler::FunctionErrorHandler(handler_fn fn) : _fn{std::move(fn)} {}

    void FunctionErrorHandler::handle_error(std::exception_ptr error, Job *job, const void *instance, ErrorCode code) {
        _fn(std::move(error), job, instance, code);
    }

    void call_with_error_handling(Job &job, ErrorHandler &handler, ErrorCode code) {
        try {
            job.run();
        } catch (const RecursionLimitError &) {
            // Recursion limit failures abort the cycle, they are never routed to the handler.
            throw;
        } catch (...) {
            handler.handle_error(std::current_exception(), &job, nullptr, code);
        }
    }
} // namespace ripple
