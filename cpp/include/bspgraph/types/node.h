#ifndef BSPGRAPH_TYPES_NODE_H
#define BSPGRAPH_TYPES_NODE_H

#include <bspgraph/runtime/admission_gate.h>
#include <bspgraph/runtime/cancellation.h>
#include <bspgraph/types/channel_registry.h>

#include <functional>
#include <future>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bspgraph {
    struct NodeContext;

    // A request to run node with arg as its own task in the next superstep.
    struct Send {
        std::string node;
        Value arg;

        friend bool operator==(const Send &, const Send &) = default;
    };

    /**
     * What a compute unit returns: the channel writes (in the order they were produced), the nodes to activate in
     * the next superstep, and per-task fan-out requests.
     */
    struct BSPGRAPH_EXPORT NodeOutput {
        std::vector<std::pair<std::string, Value>> writes{};
        std::vector<std::string> next{};
        std::vector<Send> sends{};

        NodeOutput &write(std::string channel, Value value);

        NodeOutput &goto_node(std::string node);

        NodeOutput &send(std::string node, Value arg);
    };

    using node_fn_t = std::function<NodeOutput(NodeContext &)>;

    struct BSPGRAPH_EXPORT NodeSpec {
        std::string name;
        node_fn_t fn;
        // Channels the node may read. Tasks are ordered after the writers of these channels.
        std::vector<std::string> reads{};
        // Channels the node may write. Writes to other channels are rejected.
        std::vector<std::string> writes{};
        // A change to any of these channels activates the node in the next superstep.
        std::vector<std::string> triggers{};
        int64_t priority{0};
        // Relative to the start of the execute phase the task runs in.
        std::optional<engine_time_delta_t> deadline{};

        [[nodiscard]] bool declares_read(std::string_view channel) const;

        [[nodiscard]] bool declares_write(std::string_view channel) const;
    };

    /**
     * The view of the world a compute unit gets for one task: a read-only snapshot of its declared input channels,
     * settled for the current superstep, the optional send argument, and the cancellation signal of the execute
     * phase. Nothing in the context refers to live channel state.
     */
    struct BSPGRAPH_EXPORT NodeContext {
        NodeContext(const NodeSpec &node, superstep_t superstep, channel_values_t snapshot, std::optional<Value> arg,
                    CancellationToken cancellation, AdmissionPermit *permit = nullptr);

        [[nodiscard]] const std::string &node() const { return _node.name; }

        [[nodiscard]] superstep_t superstep() const { return _superstep; }

        /**
         * The value of a declared input. Reading an undeclared channel raises ChannelError(INVALID_OPERATION), a
         * declared channel without a value raises ChannelError(EMPTY_CHANNEL).
         */
        [[nodiscard]] const Value &read(std::string_view channel) const;

        [[nodiscard]] std::optional<Value> read_optional(std::string_view channel) const;

        [[nodiscard]] const channel_values_t &snapshot() const { return _snapshot; }

        [[nodiscard]] const std::optional<Value> &arg() const { return _arg; }

        [[nodiscard]] const CancellationToken &cancellation() const { return _cancellation; }

        [[nodiscard]] bool is_cancelled() const { return _cancellation.is_cancelled(); }

        /**
         * Cooperative sleep. The admission permit is handed back while sleeping. Returns false when woken by
         * cancellation.
         */
        template<typename Rep, typename Period>
        bool sleep_for(std::chrono::duration<Rep, Period> duration) {
            bool completed{false};
            bool resumed = suspend([&] { completed = _cancellation.sleep_for(duration); });
            return completed && resumed;
        }

        /**
         * Waits for external work without holding an admission permit. Raises SchedulerError(TASK_CANCELLED) when
         * the execute phase is cancelled while waiting.
         */
        template<typename T>
        T await(std::future<T> future) {
            bool ready{false};
            suspend([&] {
                while (!_cancellation.is_cancelled()) {
                    if (future.wait_for(AWAIT_POLL_INTERVAL) == std::future_status::ready) {
                        ready = true;
                        return;
                    }
                }
            });
            // Not ready means the wait was cut short by cancellation.
            if (!ready || _cancellation.is_cancelled()) { _cancellation.throw_if_cancelled(); }
            return future.get();
        }

    private:
        static constexpr auto AWAIT_POLL_INTERVAL = std::chrono::milliseconds(2);

        template<typename Fn>
        bool suspend(Fn &&fn) {
            if (_permit == nullptr) {
                std::forward<Fn>(fn)();
                return true;
            }
            return _permit->suspend(_cancellation, std::forward<Fn>(fn));
        }

        const NodeSpec &_node;
        superstep_t _superstep;
        channel_values_t _snapshot;
        std::optional<Value> _arg;
        CancellationToken _cancellation;
        AdmissionPermit *_permit;
    };

} // namespace bspgraph

#endif  // BSPGRAPH_TYPES_NODE_H
