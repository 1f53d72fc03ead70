#ifndef RIPPLE_RUNTIME_ERROR_HANDLING_H
#define RIPPLE_RUNTIME_ERROR_HANDLING_H

#include <ripple/ripple_base.h>

#include <cstdint>
#include <exception>
#include <functional>
#include <string_view>

namespace ripple {
    /**
     * Where a routed error was raised.
     */
    enum class ErrorCode : std::uint8_t { SCHEDULER = 0 };

    [[nodiscard]] RIPPLE_EXPORT std::string_view to_string(ErrorCode code);

    /**
     * Receives the errors raised by queued jobs. The flush carries on with the remaining jobs after the handler
     * returns, a handler that wants to abort the cycle can throw.
     *
     * The instance is the execution context the job belongs to, the scheduler always reports nullptr.
     */
    struct RIPPLE_EXPORT ErrorHandler : nb::intrusive_base {
        using s_ptr = error_handler_s_ptr;

        virtual void handle_error(std::exception_ptr error, Job *job, const void *instance, ErrorCode code) = 0;
    };

    /**
     * The default handler, reports the error to stderr.
     */
    struct RIPPLE_EXPORT LoggingErrorHandler final : ErrorHandler {
        void handle_error(std::exception_ptr error, Job *job, const void *instance, ErrorCode code) override;
    };

    struct RIPPLE_EXPORT FunctionErrorHandler final : ErrorHandler {
        using handler_fn = std::function<void(std::exception_ptr, Job *, const void *, ErrorCode)>;

        explicit FunctionErrorHandler(handler_fn fn);

        void handle_error(std::exception_ptr error, Job *job, const void *instance, ErrorCode code) override;

    private:
        handler_fn _fn;
    };

    /**
     * Runs the job, routing anything it throws to the handler.
     */
    RIPPLE_EXPORT void call_with_error_handling(Job &job, ErrorHandler &handler, ErrorCode code);
} // namespace ripple

#endif // RIPPLE_RUNTIME_ERROR_HANDLING_H
