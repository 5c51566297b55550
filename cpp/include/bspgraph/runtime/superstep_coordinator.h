#ifndef BSPGRAPH_RUNTIME_SUPERSTEP_COORDINATOR_H
#define BSPGRAPH_RUNTIME_SUPERSTEP_COORDINATOR_H

#include <bspgraph/runtime/checkpointer.h>
#include <bspgraph/runtime/observers/superstep_observer.h>
#include <bspgraph/runtime/scheduler.h>
#include <bspgraph/runtime/stream.h>
#include <bspgraph/types/graph.h>

#include <ankerl/unordered_dense.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bspgraph {

    enum class CoordinatorState {
        IDLE = 0,
        READ_PHASE = 1,
        EXECUTE_PHASE = 2,
        WRITE_PHASE = 3,
        CHECKPOINT_PHASE = 4,
        PAUSED = 5,
        TERMINATED = 6,
        ABORTED = 7,
    };

    [[nodiscard]] BSPGRAPH_EXPORT std::string_view to_string(CoordinatorState state);

    enum class FailurePolicy {
        // The first failed task cancels its siblings and aborts the superstep.
        FAIL_FAST = 0,
        // Failures are recorded, the remaining tasks continue and their writes are applied.
        BEST_EFFORT = 1,
    };

    struct SuperstepRetryConfig {
        // Attempts per superstep, including the first.
        size_t max_attempts{1};
        engine_time_delta_t backoff{0};
    };

    struct CoordinatorConfig {
        superstep_t max_supersteps{25};
        // Wall clock limit for each execute phase.
        std::optional<engine_time_delta_t> execute_timeout{};
        FailurePolicy failure_policy{FailurePolicy::FAIL_FAST};
        // Only meaningful with a checkpointer. A paused execution is always checkpointed.
        bool checkpoint_every_superstep{true};
        SuperstepRetryConfig superstep_retry{};

        // Raises std::invalid_argument.
        void validate() const;
    };

    // Decides on the committed values whether an interrupt fires.
    using interrupt_condition_t = std::function<bool(const channel_values_t &)>;

    struct TaskFailure {
        superstep_t superstep;
        std::string node;
        SchedulerError::Kind kind;
        std::string message;
        std::exception_ptr error;
    };

    struct ExecutionResult {
        std::string execution_id;
        // TERMINATED on quiescence, PAUSED after an interrupt.
        CoordinatorState status;
        superstep_t supersteps;
        channel_values_t values;
        std::vector<TaskFailure> failures;
        std::vector<CheckpointError> checkpoint_errors;
        std::optional<std::string> last_checkpoint_id;
    };

    /**
     * Drives one execution of a compiled graph through its supersteps:
     *
     * * Read: the pending tasks are planned against the committed channel values.
     * * Execute: ready tasks go to the scheduler; as tasks complete their dependents are released with a snapshot
     *   that includes the writes of the tasks they waited on.
     * * Write: the writes are applied to a staged copy of the channels in completion order and committed in one
     *   step. Any failure discards the staged copy.
     * * Checkpoint: the committed tracked channels are handed to the checkpointer with a new generation.
     *
     * The loop stops when no task is pending (TERMINATED), when an interrupt request matches a node that ran in the
     * superstep (PAUSED), or with a CoordinatorError. One coordinator drives one execution at a time and is not
     * re-entrant; request_interrupt may be called from any thread.
     */
    struct BSPGRAPH_EXPORT SuperstepCoordinator {
        SuperstepCoordinator(compiled_graph_s_ptr graph, scheduler_s_ptr scheduler, CoordinatorConfig config = {},
                             checkpointer_s_ptr checkpointer = nullptr);

        [[nodiscard]] const CompiledGraph &graph() const { return *_graph; }

        [[nodiscard]] const CoordinatorConfig &config() const { return _config; }

        void set_stream_sink(stream_sink_s_ptr sink);

        void add_observer(superstep_observer_s_ptr observer);

        /**
         * Starts a new execution: input is applied as superstep 0, the entry nodes run from superstep 1. Raises
         * CoordinatorError(LIMIT_EXCEEDED) when max_supersteps is reached with work pending and
         * CoordinatorError(ABORTED) when a superstep fails; committed state is left as of the last good superstep.
         * A sink or observer that throws after a commit also aborts, the committed superstep stands. Reusing an
         * execution id continues the generations already stored for it.
         */
        ExecutionResult invoke(const std::string &execution_id, const channel_values_t &input = {});

        /**
         * Continues a paused execution at the next superstep. A coordinator that did not pause the execution itself
         * loads the latest checkpoint of execution_id from the checkpointer.
         */
        ExecutionResult resume(const std::string &execution_id);

        /**
         * One-shot: the next superstep in which node runs ends with the execution paused. With a condition the
         * interrupt only fires once the condition holds on the values committed by such a superstep, until then it
         * stays armed. Requesting again for the same node replaces the condition.
         */
        void request_interrupt(const std::string &node, interrupt_condition_t condition = {});

        void cancel_interrupt(const std::string &node);

        // Committed values while paused, raises CoordinatorError(INVALID_STATE) otherwise.
        [[nodiscard]] channel_values_t get_snapshot(const std::string &execution_id) const;

        // Committed values, raises CoordinatorError(INVALID_STATE) while a superstep is in progress.
        [[nodiscard]] channel_values_t current_values() const;

        // The tasks that will run in the next superstep, as node names.
        [[nodiscard]] std::vector<std::string> pending_nodes() const;

        [[nodiscard]] CoordinatorState state() const { return _state.load(); }

        [[nodiscard]] superstep_t superstep() const { return _superstep; }

        [[nodiscard]] const std::string &execution_id() const { return _execution_id; }

    private:
        struct TaskRun;
        struct SuperstepOutcome;

        using Router = CompiledGraph::Router;

        ExecutionResult run_loop();

        ExecutionResult make_result(CoordinatorState status);

        // Executes the pending tasks and commits their writes, returns the tasks for the next superstep.
        SuperstepOutcome run_superstep(superstep_t superstep);

        bool execute_phase(superstep_t superstep, SuperstepPlan &plan, std::vector<TaskRun> &runs,
                           std::exception_ptr &cause);

        [[nodiscard]] channel_values_t settled_snapshot(const SuperstepPlan &plan, const std::vector<TaskRun> &runs,
                                                        size_t index) const;

        SuperstepOutcome write_phase(superstep_t superstep, const SuperstepPlan &plan,
                                     const std::vector<TaskRun> &runs);

        void checkpoint_phase(superstep_t superstep, std::string_view status);

        // Node indices chosen by the routers, END dropped. Raises GraphValidationError for a bad target.
        [[nodiscard]] std::vector<node_index_t> route(superstep_t superstep, const std::string &source,
                                                      const channel_values_t &values,
                                                      const std::vector<Router> &routers) const;

        void emit_events(superstep_t superstep, const SuperstepPlan &plan, const std::vector<TaskRun> &runs,
                         const std::vector<size_t> &order);

        [[noreturn]] void abort(superstep_t superstep, std::exception_ptr cause);

        void set_state(CoordinatorState state) { _state = state; }

        [[nodiscard]] bool is_running() const;

        // Unwinding out of a phase leaves the coordinator ABORTED rather than running.
        void leave_running_state();

        [[nodiscard]] Value pending_to_value() const;

        void pending_from_value(const Value &pending);

        // Raises whatever a condition raises.
        [[nodiscard]] std::vector<std::string> take_interrupts(const std::vector<std::string> &executed);

        // Calls fn on every observer, an observer that throws aborts the execution at superstep.
        template<typename Fn>
        void notify(superstep_t superstep, Fn &&fn);

        compiled_graph_s_ptr _graph;
        scheduler_s_ptr _scheduler;
        CoordinatorConfig _config;
        checkpointer_s_ptr _checkpointer;
        stream_sink_s_ptr _sink;
        std::vector<superstep_observer_s_ptr> _observers;

        std::atomic<CoordinatorState> _state{CoordinatorState::IDLE};
        std::string _execution_id;
        ChannelRegistry _registry;
        std::vector<PlannedTask> _pending;
        superstep_t _superstep{0};
        generation_t _generation{0};
        std::vector<TaskFailure> _failures;
        std::vector<CheckpointError> _checkpoint_errors;
        std::optional<std::string> _last_checkpoint_id;

        mutable std::mutex _interrupt_mutex;
        ankerl::unordered_dense::map<std::string, interrupt_condition_t> _interrupts;
    };

} // namespace bspgraph

#endif  // BSPGRAPH_RUNTIME_SUPERSTEP_COORDINATOR_H
