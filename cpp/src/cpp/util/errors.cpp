#include <bspgraph/util/errors.h>

#include <vector>

namespace bspgraph {

    ErrorContext ErrorContext::merged_with(const ErrorContext &other) const {
        return ErrorContext{
            superstep ? superstep : other.superstep,
            node ? node : other.node,
            channel ? channel : other.channel,
        };
    }

    bool ErrorContext::empty() const { return !superstep && !node && !channel; }

    std::string ErrorContext::to_string() const {
        std::vector<std::string> parts;
        if (superstep) { parts.push_back(fmt::format("superstep={}", *superstep)); }
        if (node) { parts.push_back(fmt::format("node='{}'", *node)); }
        if (channel) { parts.push_back(fmt::format("channel='{}'", *channel)); }
        return fmt::format("{}", fmt::join(parts, ", "));
    }

    namespace {
        std::string render(std::string_view category, const std::string &message, const ErrorContext &context) {
            if (context.empty()) { return fmt::format("{}: {}", category, message); }
            return fmt::format("{}: {} [{}]", category, message, context.to_string());
        }
    } // namespace

    BspGraphError::BspGraphError(std::string_view category, std::string message, ErrorContext context)
        : std::runtime_error{render(category, message, context)}, _message{std::move(message)},
          _context{std::move(context)} {
    }

    const std::string &BspGraphError::message() const { return _message; }

    const ErrorContext &BspGraphError::context() const { return _context; }

    std::optional<superstep_t> BspGraphError::superstep() const { return _context.superstep; }

    const std::optional<std::string> &BspGraphError::node() const { return _context.node; }

    ChannelError::ChannelError(Kind kind, std::string message, ErrorContext context)
        : BspGraphError{to_string(kind), std::move(message), std::move(context)}, _kind{kind} {
    }

    ChannelError::Kind ChannelError::kind() const { return _kind; }

    ChannelError ChannelError::with_context(const ErrorContext &context) const {
        return ChannelError{_kind, message(), this->context().merged_with(context)};
    }

    ChannelError ChannelError::empty_channel(const std::string &channel) {
        return ChannelError{Kind::EMPTY_CHANNEL, "channel has no value", ErrorContext{{}, {}, channel}};
    }

    ChannelError ChannelError::invalid_update(const std::string &channel, std::string reason) {
        return ChannelError{Kind::INVALID_UPDATE, std::move(reason), ErrorContext{{}, {}, channel}};
    }

    ChannelError ChannelError::serialization_error(const std::string &channel, std::string reason) {
        return ChannelError{Kind::SERIALIZATION_ERROR, std::move(reason), ErrorContext{{}, {}, channel}};
    }

    ChannelError ChannelError::invalid_operation(const std::string &channel, std::string reason) {
        return ChannelError{Kind::INVALID_OPERATION, std::move(reason), ErrorContext{{}, {}, channel}};
    }

    GraphValidationError::GraphValidationError(Kind kind, std::string message, ErrorContext context)
        : BspGraphError{to_string(kind), std::move(message), std::move(context)}, _kind{kind} {
    }

    GraphValidationError::Kind GraphValidationError::kind() const { return _kind; }

    SchedulerError::SchedulerError(Kind kind, std::string message, ErrorContext context)
        : BspGraphError{to_string(kind), std::move(message), std::move(context)}, _kind{kind} {
    }

    SchedulerError::Kind SchedulerError::kind() const { return _kind; }

    SchedulerError SchedulerError::with_context(const ErrorContext &context) const {
        return SchedulerError{_kind, message(), this->context().merged_with(context)};
    }

    CheckpointError::CheckpointError(Kind kind, std::string message, ErrorContext context)
        : BspGraphError{to_string(kind), std::move(message), std::move(context)}, _kind{kind} {
    }

    CheckpointError::Kind CheckpointError::kind() const { return _kind; }

    CheckpointError CheckpointError::with_context(const ErrorContext &context) const {
        return CheckpointError{_kind, message(), this->context().merged_with(context)};
    }

    CoordinatorError::CoordinatorError(Kind kind, std::string message, ErrorContext context,
                                       std::exception_ptr cause)
        : BspGraphError{to_string(kind), std::move(message), std::move(context)}, _kind{kind},
          _cause{std::move(cause)} {
    }

    CoordinatorError::Kind CoordinatorError::kind() const { return _kind; }

    std::exception_ptr CoordinatorError::cause() const { return _cause; }

    CoordinatorError CoordinatorError::aborted(std::exception_ptr cause, ErrorContext context) {
        auto reason = fmt::format("superstep aborted: {}", describe_exception(cause));
        return CoordinatorError{Kind::ABORTED, std::move(reason), std::move(context), std::move(cause)};
    }

    std::string_view to_string(ChannelError::Kind kind) {
        switch (kind) {
            case ChannelError::Kind::EMPTY_CHANNEL: return "EmptyChannel";
            case ChannelError::Kind::INVALID_UPDATE: return "InvalidUpdate";
            case ChannelError::Kind::SERIALIZATION_ERROR: return "SerializationError";
            case ChannelError::Kind::INVALID_OPERATION: return "InvalidOperation";
        }
        return "ChannelError";
    }

    std::string_view to_string(GraphValidationError::Kind kind) {
        switch (kind) {
            case GraphValidationError::Kind::CONTROL_EDGE_CYCLE: return "ControlEdgeCycle";
            case GraphValidationError::Kind::DUPLICATE_WRITER: return "DuplicateWriter";
            case GraphValidationError::Kind::DUPLICATE_NAME: return "DuplicateName";
            case GraphValidationError::Kind::UNKNOWN_CHANNEL: return "UnknownChannel";
            case GraphValidationError::Kind::UNKNOWN_NODE: return "UnknownNode";
            case GraphValidationError::Kind::INVALID_EDGE: return "InvalidEdge";
        }
        return "GraphValidationError";
    }

    std::string_view to_string(SchedulerError::Kind kind) {
        switch (kind) {
            case SchedulerError::Kind::QUEUE_FULL: return "QueueFull";
            case SchedulerError::Kind::TASK_TIMEOUT: return "TaskTimeout";
            case SchedulerError::Kind::TASK_PANIC: return "TaskPanic";
            case SchedulerError::Kind::TASK_CANCELLED: return "TaskCancelled";
            case SchedulerError::Kind::NOT_RUNNING: return "NotRunning";
        }
        return "SchedulerError";
    }

    std::string_view to_string(CheckpointError::Kind kind) {
        switch (kind) {
            case CheckpointError::Kind::NOT_FOUND: return "NotFound";
            case CheckpointError::Kind::SAVE_FAILED: return "SaveFailed";
            case CheckpointError::Kind::LOAD_FAILED: return "LoadFailed";
            case CheckpointError::Kind::INVALID_DATA: return "InvalidData";
        }
        return "CheckpointError";
    }

    std::string_view to_string(CoordinatorError::Kind kind) {
        switch (kind) {
            case CoordinatorError::Kind::LIMIT_EXCEEDED: return "LimitExceeded";
            case CoordinatorError::Kind::ABORTED: return "Aborted";
            case CoordinatorError::Kind::INVALID_STATE: return "InvalidState";
        }
        return "CoordinatorError";
    }

    std::string describe_exception(const std::exception_ptr &error) {
        if (!error) { return "<no error>"; }
        try {
            std::rethrow_exception(error);
        } catch (const std::exception &e) {
            return e.what();
        } catch (...) {
            return "<non-standard exception>";
        }
    }

} // namespace bspgraph
