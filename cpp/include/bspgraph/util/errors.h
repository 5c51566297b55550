#ifndef BSPGRAPH_UTIL_ERRORS
#define BSPGRAPH_UTIL_ERRORS

#include <bspgraph/bspgraph_base.h>

#include <concepts>
#include <exception>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace bspgraph {

    // Overload (I) - takes the error msg and appends the source location
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] void throw_error(std::string_view msg,
                                  std::source_location loc = std::source_location::current()) {
        throw Error{fmt::format("{}\nFile: {}({}:{}): {}", msg, loc.file_name(), loc.line(), loc.column(),
                                loc.function_name())};
    }

    // Overload (II) - direct formatting of the error msg from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] void throw_error(fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

    /**
     * Where an error happened. Every field is optional, only the populated ones are rendered. The coordinator
     * enriches errors raised by lower layers with the superstep and node before they reach the caller, so a failure
     * can be diagnosed without re-running the graph.
     */
    struct BSPGRAPH_EXPORT ErrorContext {
        std::optional<superstep_t> superstep;
        std::optional<std::string> node;
        std::optional<std::string> channel;

        // Fields already set on this context win over the ones in other.
        [[nodiscard]] ErrorContext merged_with(const ErrorContext &other) const;

        [[nodiscard]] bool empty() const;

        [[nodiscard]] std::string to_string() const;
    };

    struct BSPGRAPH_EXPORT BspGraphError : std::runtime_error {
        BspGraphError(std::string_view category, std::string message, ErrorContext context);

        [[nodiscard]] const std::string &message() const;

        [[nodiscard]] const ErrorContext &context() const;

        [[nodiscard]] std::optional<superstep_t> superstep() const;

        [[nodiscard]] const std::optional<std::string> &node() const;

    private:
        std::string _message;
        ErrorContext _context;
    };

    struct BSPGRAPH_EXPORT ChannelError : BspGraphError {
        enum class Kind { EMPTY_CHANNEL, INVALID_UPDATE, SERIALIZATION_ERROR, INVALID_OPERATION };

        ChannelError(Kind kind, std::string message, ErrorContext context = {});

        [[nodiscard]] Kind kind() const;

        [[nodiscard]] ChannelError with_context(const ErrorContext &context) const;

        static ChannelError empty_channel(const std::string &channel);

        static ChannelError invalid_update(const std::string &channel, std::string reason);

        static ChannelError serialization_error(const std::string &channel, std::string reason);

        static ChannelError invalid_operation(const std::string &channel, std::string reason);

    private:
        Kind _kind;
    };

    struct BSPGRAPH_EXPORT GraphValidationError : BspGraphError {
        enum class Kind { CONTROL_EDGE_CYCLE, DUPLICATE_WRITER, DUPLICATE_NAME, UNKNOWN_CHANNEL, UNKNOWN_NODE, INVALID_EDGE };

        GraphValidationError(Kind kind, std::string message, ErrorContext context = {});

        [[nodiscard]] Kind kind() const;

    private:
        Kind _kind;
    };

    struct BSPGRAPH_EXPORT SchedulerError : BspGraphError {
        enum class Kind { QUEUE_FULL, TASK_TIMEOUT, TASK_PANIC, TASK_CANCELLED, NOT_RUNNING };

        SchedulerError(Kind kind, std::string message, ErrorContext context = {});

        [[nodiscard]] Kind kind() const;

        [[nodiscard]] SchedulerError with_context(const ErrorContext &context) const;

    private:
        Kind _kind;
    };

    struct BSPGRAPH_EXPORT CheckpointError : BspGraphError {
        enum class Kind { NOT_FOUND, SAVE_FAILED, LOAD_FAILED, INVALID_DATA };

        CheckpointError(Kind kind, std::string message, ErrorContext context = {});

        [[nodiscard]] Kind kind() const;

        [[nodiscard]] CheckpointError with_context(const ErrorContext &context) const;

    private:
        Kind _kind;
    };

    struct BSPGRAPH_EXPORT CoordinatorError : BspGraphError {
        enum class Kind { LIMIT_EXCEEDED, ABORTED, INVALID_STATE };

        CoordinatorError(Kind kind, std::string message, ErrorContext context = {},
                         std::exception_ptr cause = nullptr);

        [[nodiscard]] Kind kind() const;

        // The error that caused an abort, null for the other kinds.
        [[nodiscard]] std::exception_ptr cause() const;

        /**
         * The cause as E, or nullopt when there is no cause or it is of a different type:
         * err.cause_as<SchedulerError>().
         */
        template<typename E>
        [[nodiscard]] std::optional<E> cause_as() const {
            if (!_cause) { return std::nullopt; }
            try {
                std::rethrow_exception(_cause);
            } catch (const E &e) {
                return e;
            } catch (const std::exception &) {
                return std::nullopt;
            }
        }

        static CoordinatorError aborted(std::exception_ptr cause, ErrorContext context);

    private:
        Kind _kind;
        std::exception_ptr _cause;
    };

    [[nodiscard]] BSPGRAPH_EXPORT std::string_view to_string(ChannelError::Kind kind);

    [[nodiscard]] BSPGRAPH_EXPORT std::string_view to_string(GraphValidationError::Kind kind);

    [[nodiscard]] BSPGRAPH_EXPORT std::string_view to_string(SchedulerError::Kind kind);

    [[nodiscard]] BSPGRAPH_EXPORT std::string_view to_string(CheckpointError::Kind kind);

    [[nodiscard]] BSPGRAPH_EXPORT std::string_view to_string(CoordinatorError::Kind kind);

    // Message of an arbitrary exception_ptr, for logging.
    [[nodiscard]] BSPGRAPH_EXPORT std::string describe_exception(const std::exception_ptr &error);

} // namespace bspgraph

#endif // BSPGRAPH_UTIL_ERRORS
