#ifndef RIPPLE_UTIL_ERRORS
#define RIPPLE_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <cstddef>
#include <exception>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace ripple {

    template<typename Error = std::runtime_error, typename... Ts>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] constexpr auto throw_error(Ts&&... args) {
        throw Error{std::forward<Ts>(args)...};
    }

    // Overload (I) - takes error msg and appends the source location
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        throw Error{fmt::format(
            "{}\nFile: {}({}:{}): {}", msg, loc.file_name(), loc.line(), loc.column(), loc.function_name()
        )};
    }

    // Overload (II) - direct formatting of error msg from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

    /**
     * Raised out of a flush cycle when a job or callback has been invoked more often than the configured limit
     * within one cycle. This indicates an effect that mutates its own dependencies and so keeps re-scheduling itself.
     */
    struct RecursionLimitError : std::runtime_error {
        RecursionLimitError(std::string job_label, std::size_t limit)
            : std::runtime_error{fmt::format(
                  "Maximum recursive updates exceeded for job '{}' (limit {}). "
                  "This means you have a reactive effect that is mutating its own dependencies and thus "
                  "recursively triggering itself.", job_label, limit)},
              job_label{std::move(job_label)}, limit{limit} {}

        std::string job_label;
        std::size_t limit;
    };

    /**
     * Extracts a printable message from a captured exception, used when reporting errors that have been routed away
     * from the throw site.
     */
    inline std::string describe_exception(const std::exception_ptr &error) {
        if (!error) { return "<no exception>"; }
        try {
            std::rethrow_exception(error);
        } catch (const std::exception &e) {
            return e.what();
        } catch (...) {
            return "unknown exception";
        }
    }

} // namespace ripple

#endif // RIPPLE_UTIL_ERRORS
