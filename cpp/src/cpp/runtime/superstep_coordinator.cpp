#include <bspgraph/runtime/superstep_coordinator.h>
#include <bspgraph/util/errors.h>
#include <bspgraph/util/scope.h>

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace bspgraph {

    std::string_view to_string(CoordinatorState state) {
        switch (state) {
            case CoordinatorState::IDLE: return "idle";
            case CoordinatorState::READ_PHASE: return "read_phase";
            case CoordinatorState::EXECUTE_PHASE: return "execute_phase";
            case CoordinatorState::WRITE_PHASE: return "write_phase";
            case CoordinatorState::CHECKPOINT_PHASE: return "checkpoint_phase";
            case CoordinatorState::PAUSED: return "paused";
            case CoordinatorState::TERMINATED: return "terminated";
            case CoordinatorState::ABORTED: return "aborted";
        }
        return "unknown";
    }

    void CoordinatorConfig::validate() const {
        if (max_supersteps < 1) { throw_error<std::invalid_argument>("max_supersteps must be at least 1, got {}", max_supersteps); }
        if (execute_timeout && *execute_timeout <= engine_time_delta_t::zero()) {
            throw_error<std::invalid_argument>("execute_timeout must be positive, got {}", *execute_timeout);
        }
        if (superstep_retry.max_attempts < 1) {
            throw_error<std::invalid_argument>("superstep_retry.max_attempts must be at least 1, got {}",
                                               superstep_retry.max_attempts);
        }
        if (superstep_retry.backoff < engine_time_delta_t::zero()) {
            throw_error<std::invalid_argument>("superstep_retry.backoff must not be negative, got {}",
                                               superstep_retry.backoff);
        }
    }

    struct SuperstepCoordinator::TaskRun {
        std::optional<NodeOutput> output{};
        TaskStatus status{TaskStatus::CANCELLED};
        bool submitted{false};
        bool completed{false};
        size_t completion_rank{0};

        [[nodiscard]] bool succeeded() const { return completed && status == TaskStatus::SUCCEEDED && output; }
    };

    struct SuperstepCoordinator::SuperstepOutcome {
        std::vector<PlannedTask> next;
        std::vector<std::string> changed;
        // Names of the nodes with at least one successful task, in declaration order.
        std::vector<std::string> executed;
    };

    namespace {
        monotonic_clock::duration to_monotonic(engine_time_delta_t d) {
            return std::chrono::duration_cast<monotonic_clock::duration>(d);
        }

        // Successful tasks in the order they completed.
        template<typename Runs>
        std::vector<size_t> completion_order(const Runs &runs) {
            std::vector<size_t> order;
            for (size_t i = 0; i < runs.size(); ++i) {
                if (runs[i].succeeded()) { order.push_back(i); }
            }
            std::sort(order.begin(), order.end(),
                      [&](size_t a, size_t b) { return runs[a].completion_rank < runs[b].completion_rank; });
            return order;
        }
    } // namespace

    template<typename Fn>
    void SuperstepCoordinator::notify(superstep_t superstep, Fn &&fn) {
        try {
            for (auto &o: _observers) { fn(*o); }
        } catch (const std::exception &) {
            abort(superstep, std::current_exception());
        }
    }

    SuperstepCoordinator::SuperstepCoordinator(compiled_graph_s_ptr graph, scheduler_s_ptr scheduler,
                                               CoordinatorConfig config, checkpointer_s_ptr checkpointer)
        : _graph{std::move(graph)}, _scheduler{std::move(scheduler)}, _config{std::move(config)},
          _checkpointer{std::move(checkpointer)} {
        if (!_graph) { throw std::invalid_argument("SuperstepCoordinator requires a compiled graph"); }
        if (!_scheduler) { throw std::invalid_argument("SuperstepCoordinator requires a scheduler"); }
        _config.validate();
        _registry = _graph->create_registry();
    }

    void SuperstepCoordinator::set_stream_sink(stream_sink_s_ptr sink) { _sink = std::move(sink); }

    void SuperstepCoordinator::add_observer(superstep_observer_s_ptr observer) {
        if (observer) { _observers.push_back(std::move(observer)); }
    }

    bool SuperstepCoordinator::is_running() const {
        switch (state()) {
            case CoordinatorState::READ_PHASE:
            case CoordinatorState::EXECUTE_PHASE:
            case CoordinatorState::WRITE_PHASE:
            case CoordinatorState::CHECKPOINT_PHASE: return true;
            default: return false;
        }
    }

    void SuperstepCoordinator::leave_running_state() {
        if (is_running()) { set_state(CoordinatorState::ABORTED); }
    }

    ExecutionResult SuperstepCoordinator::invoke(const std::string &execution_id, const channel_values_t &input) {
        if (is_running()) {
            throw CoordinatorError{CoordinatorError::Kind::INVALID_STATE,
                                   fmt::format("execution '{}' is in progress", _execution_id)};
        }
        if (execution_id.empty()) { throw std::invalid_argument("execution id must not be empty"); }
        if (!_scheduler->is_started()) { start_component(*_scheduler); }

        // A reused id continues after the checkpoints already stored for it, so its saves stay ordered.
        generation_t generation{0};
        if (_checkpointer) {
            if (auto latest = _checkpointer->list(execution_id, 1); !latest.empty()) {
                generation = latest.front().generation;
            }
        }

        _execution_id = execution_id;
        _registry = _graph->create_registry();
        _pending.clear();
        _superstep = 0;
        _generation = generation;
        _failures.clear();
        _checkpoint_errors.clear();
        _last_checkpoint_id.reset();

        // Superstep 0: the input is applied like a write phase, then the entry nodes are planned.
        set_state(CoordinatorState::WRITE_PHASE);
        auto guard = make_scope_exit([this] { leave_running_state(); });
        std::vector<std::string> changed;
        try {
            auto staged = _registry;
            for (const auto &[name, value]: input) {
                if (!staged.contains(name)) {
                    throw ChannelError{ChannelError::Kind::INVALID_OPERATION, "input names an unknown channel",
                                       ErrorContext{0, {}, name}};
                }
                try {
                    if (staged.at(name).update(std::vector<Value>{value})) { changed.push_back(name); }
                } catch (const ChannelError &e) { throw e.with_context(ErrorContext{0, {}, {}}); }
            }
            std::vector<bool> activated(_graph->nodes().size(), false);
            for (auto n: _graph->entry_nodes()) { activated[n] = true; }
            for (auto n: route(0, START, staged.values(), _graph->entry_routers())) { activated[n] = true; }
            for (const auto &c: changed) {
                if (!staged.at(c).is_available()) { continue; }
                for (auto n: _graph->triggered_by(c)) { activated[n] = true; }
            }
            for (node_index_t n = 0; n < activated.size(); ++n) {
                if (activated[n]) { _pending.push_back(PlannedTask{n}); }
            }
            _registry.swap(staged);
        } catch (const std::exception &) {
            abort(0, std::current_exception());
        }
        notify(0, [&](SuperstepObserver &o) { o.on_after_write_phase(0, changed); });

        if (_checkpointer && _config.checkpoint_every_superstep) {
            checkpoint_phase(0, _pending.empty() ? "completed" : "running");
        }
        return run_loop();
    }

    ExecutionResult SuperstepCoordinator::resume(const std::string &execution_id) {
        if (is_running()) {
            throw CoordinatorError{CoordinatorError::Kind::INVALID_STATE,
                                   fmt::format("execution '{}' is in progress", _execution_id)};
        }
        if (state() == CoordinatorState::PAUSED && _execution_id == execution_id) {
            auto guard = make_scope_exit([this] { leave_running_state(); });
            return run_loop();
        }

        if (!_checkpointer) {
            throw CoordinatorError{CoordinatorError::Kind::INVALID_STATE,
                                   fmt::format("execution '{}' is not paused here and there is no checkpointer",
                                               execution_id)};
        }
        auto record = _checkpointer->load(execution_id);
        if (!record) {
            throw CoordinatorError{CoordinatorError::Kind::INVALID_STATE,
                                   fmt::format("no checkpoint found for execution '{}'", execution_id)};
        }
        if (!_scheduler->is_started()) { start_component(*_scheduler); }

        auto registry = _graph->create_registry();
        superstep_t superstep;
        try {
            registry.restore(record->channels);
            superstep = record->metadata.metadata.at("superstep").as_int();
            _pending.clear();
            pending_from_value(record->metadata.metadata.at("pending"));
        } catch (const std::exception &e) {
            _pending.clear();
            throw CheckpointError{CheckpointError::Kind::INVALID_DATA,
                                  fmt::format("checkpoint '{}' cannot be resumed: {}",
                                              record->metadata.checkpoint_id, e.what())};
        }

        _execution_id = execution_id;
        _registry.swap(registry);
        _superstep = superstep;
        _generation = record->generation;
        _failures.clear();
        _checkpoint_errors.clear();
        _last_checkpoint_id = record->metadata.checkpoint_id;
        set_state(CoordinatorState::IDLE);
        auto guard = make_scope_exit([this] { leave_running_state(); });
        return run_loop();
    }

    void SuperstepCoordinator::request_interrupt(const std::string &node, interrupt_condition_t condition) {
        // Validates the name.
        (void)_graph->node_index(node);
        std::lock_guard lock(_interrupt_mutex);
        _interrupts.insert_or_assign(node, std::move(condition));
    }

    void SuperstepCoordinator::cancel_interrupt(const std::string &node) {
        std::lock_guard lock(_interrupt_mutex);
        _interrupts.erase(node);
    }

    std::vector<std::string> SuperstepCoordinator::take_interrupts(const std::vector<std::string> &executed) {
        // Conditions run outside the lock so they may request or cancel interrupts themselves.
        std::vector<std::pair<std::string, interrupt_condition_t>> armed;
        {
            std::lock_guard lock(_interrupt_mutex);
            for (const auto &node: executed) {
                if (auto it = _interrupts.find(node); it != _interrupts.end()) { armed.emplace_back(node, it->second); }
            }
        }
        std::optional<channel_values_t> values;
        std::vector<std::string> hit;
        for (const auto &[node, condition]: armed) {
            if (condition) {
                if (!values) { values = _registry.values(); }
                if (!condition(*values)) { continue; }
            }
            hit.push_back(node);
        }
        std::lock_guard lock(_interrupt_mutex);
        for (const auto &node: hit) { _interrupts.erase(node); }
        return hit;
    }

    channel_values_t SuperstepCoordinator::get_snapshot(const std::string &execution_id) const {
        if (state() != CoordinatorState::PAUSED || execution_id != _execution_id) {
            throw CoordinatorError{CoordinatorError::Kind::INVALID_STATE,
                                   fmt::format("execution '{}' is not paused (state {})", execution_id,
                                               to_string(state())),
                                   ErrorContext{_superstep, {}, {}}};
        }
        return _registry.values();
    }

    channel_values_t SuperstepCoordinator::current_values() const {
        if (is_running()) {
            throw CoordinatorError{CoordinatorError::Kind::INVALID_STATE,
                                   fmt::format("values are not settled during {}", to_string(state())),
                                   ErrorContext{_superstep, {}, {}}};
        }
        return _registry.values();
    }

    std::vector<std::string> SuperstepCoordinator::pending_nodes() const {
        std::vector<std::string> result;
        for (const auto &t: _pending) { result.push_back(_graph->node(t.node).name); }
        return result;
    }

    ExecutionResult SuperstepCoordinator::make_result(CoordinatorState status) {
        return ExecutionResult{_execution_id, status, _superstep, _registry.values(), _failures, _checkpoint_errors,
                               _last_checkpoint_id};
    }

    ExecutionResult SuperstepCoordinator::run_loop() {
        while (true) {
            if (_pending.empty()) {
                for (auto &channel: _registry) { channel.finish(); }
                set_state(CoordinatorState::TERMINATED);
                notify(_superstep, [&](SuperstepObserver &o) { o.on_terminate(_superstep); });
                return make_result(CoordinatorState::TERMINATED);
            }
            if (_superstep >= _config.max_supersteps) {
                set_state(CoordinatorState::ABORTED);
                CoordinatorError error{CoordinatorError::Kind::LIMIT_EXCEEDED,
                                       fmt::format("reached {} supersteps with [{}] still pending",
                                                   _config.max_supersteps, fmt::join(pending_nodes(), ", ")),
                                       ErrorContext{_superstep, {}, {}}};
                for (auto &o: _observers) { o->on_abort(_superstep, error); }
                throw error;
            }

            auto superstep = _superstep + 1;
            auto outcome = run_superstep(superstep);
            _superstep = superstep;
            _pending = std::move(outcome.next);

            std::vector<std::string> interrupted;
            try {
                interrupted = take_interrupts(outcome.executed);
            } catch (const std::exception &) {
                abort(superstep, std::current_exception());
            }
            std::string_view status = _pending.empty() ? "completed" : interrupted.empty() ? "running" : "paused";
            if (_checkpointer && (_config.checkpoint_every_superstep || !interrupted.empty())) {
                checkpoint_phase(superstep, status);
            }
            if (!interrupted.empty()) {
                set_state(CoordinatorState::PAUSED);
                notify(superstep, [&](SuperstepObserver &o) {
                    for (const auto &node: interrupted) { o.on_interrupt(superstep, node); }
                });
                return make_result(CoordinatorState::PAUSED);
            }
        }
    }

    SuperstepCoordinator::SuperstepOutcome SuperstepCoordinator::run_superstep(superstep_t superstep) {
        const auto attempts = _config.superstep_retry.max_attempts;
        for (size_t attempt = 1;; ++attempt) {
            set_state(CoordinatorState::READ_PHASE);
            notify(superstep, [&](SuperstepObserver &o) { o.on_before_superstep(_execution_id, superstep); });
            auto plan = _graph->resolver().plan(_pending);
            if (!_observers.empty()) {
                std::vector<std::string> planned;
                for (const auto &t: plan.tasks()) { planned.push_back(_graph->node(t.node).name); }
                notify(superstep, [&](SuperstepObserver &o) { o.on_after_read_phase(superstep, planned); });
            }

            std::vector<TaskRun> runs(plan.size());
            std::exception_ptr cause;
            set_state(CoordinatorState::EXECUTE_PHASE);
            if (execute_phase(superstep, plan, runs, cause)) { return write_phase(superstep, plan, runs); }
            if (attempt >= attempts) { abort(superstep, cause); }
            if (_config.superstep_retry.backoff > engine_time_delta_t::zero()) {
                std::this_thread::sleep_for(_config.superstep_retry.backoff);
            }
        }
    }

    bool SuperstepCoordinator::execute_phase(superstep_t superstep, SuperstepPlan &plan, std::vector<TaskRun> &runs,
                                             std::exception_ptr &cause) {
        auto batch = _scheduler->create_batch();
        const auto phase_start = monotonic_clock::now();
        std::optional<monotonic_time_t> deadline;
        if (_config.execute_timeout) { deadline = phase_start + to_monotonic(*_config.execute_timeout); }

        ankerl::unordered_dense::map<task_id_t, size_t> index_of;
        size_t next_rank{0};

        auto cancel_and_drain = [&](std::string reason) {
            batch->cancel(std::move(reason));
            batch->drain();
        };

        auto submit = [&](size_t i) {
            const auto &task = plan.task(i);
            const auto &spec = _graph->node(task.node);
            TaskRequest request{
                spec.name,
                [this, &spec, &runs, i, superstep, snapshot = settled_snapshot(plan, runs, i),
                    arg = task.arg](TaskExecution &execution) {
                    for (auto &o: _observers) { o->on_before_task(superstep, spec.name); }
                    NodeContext context{spec, superstep, snapshot, arg, execution.cancellation, &execution.permit};
                    runs[i].output = spec.fn(context);
                },
                spec.priority,
                spec.deadline ? std::optional{phase_start + to_monotonic(*spec.deadline)} : std::nullopt,
            };
            runs[i].submitted = true;
            index_of.emplace(_scheduler->submit(batch, std::move(request)), i);
        };

        try {
            for (auto i: plan.initially_ready()) { submit(i); }
            while (!plan.all_complete()) {
                auto completion = batch->wait_next(deadline);
                if (!completion) {
                    if (!deadline || monotonic_clock::now() < *deadline) {
                        throw std::logic_error("execute phase stalled with no task outstanding");
                    }
                    cancel_and_drain("execute phase timed out");
                    std::vector<std::string> outstanding;
                    for (size_t i = 0; i < runs.size(); ++i) {
                        if (!runs[i].submitted || runs[i].completed) { continue; }
                        const auto &name = _graph->node(plan.task(i).node).name;
                        outstanding.push_back(name);
                        _failures.push_back(TaskFailure{superstep, name, SchedulerError::Kind::TASK_TIMEOUT,
                                                        "execute phase timed out", nullptr});
                    }
                    cause = std::make_exception_ptr(SchedulerError{
                        SchedulerError::Kind::TASK_TIMEOUT,
                        fmt::format("execute phase exceeded {} with [{}] unfinished", *_config.execute_timeout,
                                    fmt::join(outstanding, ", ")),
                        ErrorContext{superstep, outstanding.empty() ? std::nullopt : std::optional{outstanding.front()},
                                     {}}});
                    return false;
                }

                auto i = index_of.at(completion->id);
                auto &run = runs[i];
                run.completed = true;
                run.status = completion->status;
                run.completion_rank = next_rank++;
                const auto &name = _graph->node(plan.task(i).node).name;
                for (auto &o: _observers) { o->on_after_task(superstep, name, *completion); }

                if (completion->status != TaskStatus::SUCCEEDED) {
                    run.output.reset();
                    auto kind = completion->status == TaskStatus::CANCELLED ? SchedulerError::Kind::TASK_CANCELLED
                                                                            : SchedulerError::Kind::TASK_PANIC;
                    auto message = describe_exception(completion->error);
                    _failures.push_back(TaskFailure{superstep, name, kind, message, completion->error});
                    if (_config.failure_policy == FailurePolicy::FAIL_FAST) {
                        cancel_and_drain(fmt::format("task '{}' failed", name));
                        cause = std::make_exception_ptr(SchedulerError{
                            SchedulerError::Kind::TASK_PANIC, fmt::format("task '{}' failed: {}", name, message),
                            ErrorContext{superstep, name, {}}});
                        return false;
                    }
                }
                for (auto released: plan.complete(i)) { submit(released); }
            }
        } catch (const std::exception &) {
            cause = std::current_exception();
            cancel_and_drain("superstep aborted");
            return false;
        }
        return true;
    }

    channel_values_t SuperstepCoordinator::settled_snapshot(const SuperstepPlan &plan, const std::vector<TaskRun> &runs,
                                                            size_t index) const {
        const auto &spec = _graph->node(plan.task(index).node);
        std::vector<size_t> predecessors;
        for (auto d: plan.dependencies(index)) {
            if (runs[d].succeeded()) { predecessors.push_back(d); }
        }
        std::sort(predecessors.begin(), predecessors.end(),
                  [&](size_t a, size_t b) { return runs[a].completion_rank < runs[b].completion_rank; });

        channel_values_t snapshot;
        for (const auto &channel: spec.reads) {
            std::vector<Value> pending_writes;
            for (auto p: predecessors) {
                for (const auto &[target, value]: runs[p].output->writes) {
                    if (target == channel) { pending_writes.push_back(value); }
                }
            }
            const auto &committed = _registry.at(channel);
            if (pending_writes.empty()) {
                if (auto v = committed.peek(); v) { snapshot.insert_or_assign(channel, std::move(*v)); }
                continue;
            }
            // Preview of the predecessors' writes on a copy, the committed channel is untouched.
            auto preview = committed;
            preview.update(pending_writes);
            if (auto v = preview.peek(); v) { snapshot.insert_or_assign(channel, std::move(*v)); }
        }
        return snapshot;
    }

    SuperstepCoordinator::SuperstepOutcome SuperstepCoordinator::write_phase(superstep_t superstep,
                                                                             const SuperstepPlan &plan,
                                                                             const std::vector<TaskRun> &runs) {
        set_state(CoordinatorState::WRITE_PHASE);
        const auto order = completion_order(runs);
        const auto node_count = _graph->nodes().size();
        SuperstepOutcome outcome;
        auto staged = _registry;

        try {
            ankerl::unordered_dense::set<std::string> consumed;
            for (auto i: order) {
                for (const auto &channel: _graph->node(plan.task(i).node).reads) {
                    if (consumed.insert(channel).second) { staged.at(channel).consume(); }
                }
            }

            std::map<std::string, std::vector<Value>, std::less<>> writes;
            std::map<std::string, std::vector<size_t>, std::less<>> writer_tasks;
            for (auto i: order) {
                const auto &spec = _graph->node(plan.task(i).node);
                for (const auto &[channel, value]: runs[i].output->writes) {
                    if (!spec.declares_write(channel)) {
                        throw ChannelError{ChannelError::Kind::INVALID_UPDATE,
                                           "node wrote a channel it does not declare",
                                           ErrorContext{superstep, spec.name, channel}};
                    }
                    writes[channel].push_back(value);
                    auto &tasks = writer_tasks[channel];
                    if (tasks.empty() || tasks.back() != i) { tasks.push_back(i); }
                }
            }
            for (const auto &[channel, tasks]: writer_tasks) {
                if (tasks.size() > 1 && !staged.at(channel).accepts_multiple_writers()) {
                    throw ChannelError{ChannelError::Kind::INVALID_UPDATE,
                                       fmt::format("{} tasks wrote a single-writer channel", tasks.size()),
                                       ErrorContext{superstep, {}, channel}};
                }
            }

            static const std::vector<Value> no_writes;
            for (auto &channel: staged) {
                auto it = writes.find(channel.name());
                try {
                    if (channel.update(it == writes.end() ? no_writes : it->second)) {
                        outcome.changed.push_back(channel.name());
                    }
                } catch (const ChannelError &e) {
                    std::optional<std::string> writer;
                    if (auto w = writer_tasks.find(channel.name()); w != writer_tasks.end() && w->second.size() == 1) {
                        writer = _graph->node(plan.task(w->second.front()).node).name;
                    }
                    throw e.with_context(ErrorContext{superstep, writer, {}});
                }
            }

            // The next superstep is decided on the staged values so a bad route aborts before anything commits.
            std::vector<bool> ran(node_count, false);
            for (auto i: order) { ran[plan.task(i).node] = true; }
            std::vector<bool> activated(node_count, false);
            std::vector<PlannedTask> sends;
            const auto values = staged.values();

            auto lookup = [&](const std::string &target, const std::string &source) -> std::optional<node_index_t> {
                if (target == END) { return std::nullopt; }
                if (auto n = _graph->find_node(target); n) { return n; }
                throw GraphValidationError{GraphValidationError::Kind::UNKNOWN_NODE,
                                           fmt::format("'{}' activated unknown node '{}'", source, target),
                                           ErrorContext{superstep, source, {}}};
            };

            for (node_index_t n = 0; n < node_count; ++n) {
                if (!ran[n]) { continue; }
                for (auto s: _graph->successors(n)) { activated[s] = true; }
                for (auto s: route(superstep, _graph->node(n).name, values, _graph->routers(n))) { activated[s] = true; }
            }
            for (auto i: order) {
                const auto &source = _graph->node(plan.task(i).node).name;
                for (const auto &target: runs[i].output->next) {
                    if (auto n = lookup(target, source); n) { activated[*n] = true; }
                }
                for (const auto &send: runs[i].output->sends) {
                    if (auto n = lookup(send.node, source); n) { sends.push_back(PlannedTask{*n, send.arg}); }
                }
            }
            // A channel that was cleared does not trigger.
            for (const auto &channel: outcome.changed) {
                if (!staged.at(channel).is_available()) { continue; }
                for (auto n: _graph->triggered_by(channel)) { activated[n] = true; }
            }

            for (node_index_t n = 0; n < node_count; ++n) {
                if (activated[n]) { outcome.next.push_back(PlannedTask{n}); }
                if (ran[n]) { outcome.executed.push_back(_graph->node(n).name); }
            }
            outcome.next.insert(outcome.next.end(), std::make_move_iterator(sends.begin()),
                                std::make_move_iterator(sends.end()));
        } catch (const std::exception &) {
            abort(superstep, std::current_exception());
        }

        _registry.swap(staged);
        // Committed: a failing sink or observer ends the execution after this superstep.
        _superstep = superstep;
        try {
            emit_events(superstep, plan, runs, order);
        } catch (const std::exception &) {
            abort(superstep, std::current_exception());
        }
        notify(superstep, [&](SuperstepObserver &o) { o.on_after_write_phase(superstep, outcome.changed); });
        return outcome;
    }

    void SuperstepCoordinator::emit_events(superstep_t superstep, const SuperstepPlan &plan,
                                           const std::vector<TaskRun> &runs, const std::vector<size_t> &order) {
        if (!_sink) { return; }
        const auto node_count = _graph->nodes().size();
        std::vector<Value::map_t> deltas(node_count);
        std::vector<bool> ran(node_count, false);
        for (auto i: order) {
            auto n = plan.task(i).node;
            ran[n] = true;
            for (const auto &[channel, value]: runs[i].output->writes) {
                auto &entry = deltas[n][channel];
                if (entry.is_none()) { entry = Value::list(); }
                entry.as_list().push_back(value);
            }
        }
        for (node_index_t n = 0; n < node_count; ++n) {
            if (!ran[n]) { continue; }
            _sink->emit(StreamEvent{superstep, _graph->node(n).name, Value{std::move(deltas[n])}});
        }
    }

    std::vector<node_index_t> SuperstepCoordinator::route(superstep_t superstep, const std::string &source,
                                                          const channel_values_t &values,
                                                          const std::vector<Router> &routers) const {
        std::vector<node_index_t> result;
        for (const auto &router: routers) {
            for (const auto &target: router.fn(values)) {
                if (!router.allowed_targets.empty() &&
                    std::find(router.allowed_targets.begin(), router.allowed_targets.end(), target) ==
                    router.allowed_targets.end()) {
                    throw GraphValidationError{GraphValidationError::Kind::INVALID_EDGE,
                                               fmt::format("router of '{}' returned '{}' which is not an allowed target",
                                                           source, target),
                                               ErrorContext{superstep, source, {}}};
                }
                if (target == END) { continue; }
                auto n = _graph->find_node(target);
                if (!n) {
                    throw GraphValidationError{GraphValidationError::Kind::UNKNOWN_NODE,
                                               fmt::format("router of '{}' returned unknown node '{}'", source, target),
                                               ErrorContext{superstep, source, {}}};
                }
                result.push_back(*n);
            }
        }
        return result;
    }

    void SuperstepCoordinator::checkpoint_phase(superstep_t superstep, std::string_view status) {
        set_state(CoordinatorState::CHECKPOINT_PHASE);
        auto metadata = Value::map({
            {"superstep", superstep},
            {"status", std::string{status}},
            {"pending", pending_to_value()},
        });
        std::optional<std::string> id;
        try {
            id = _checkpointer->save(_execution_id, _generation + 1, _registry.checkpoint(), metadata);
        } catch (const CheckpointError &e) {
            // Persistence failed, the committed state stands.
            _checkpoint_errors.push_back(e.with_context(ErrorContext{superstep, {}, {}}));
        } catch (const std::exception &e) {
            _checkpoint_errors.push_back(
                CheckpointError{CheckpointError::Kind::SAVE_FAILED, e.what(), ErrorContext{superstep, {}, {}}});
        }
        if (!id) {
            notify(superstep,
                   [&](SuperstepObserver &o) { o.on_checkpoint_error(superstep, _checkpoint_errors.back()); });
            return;
        }
        ++_generation;
        _last_checkpoint_id = id;
        notify(superstep, [&](SuperstepObserver &o) { o.on_checkpoint(superstep, *id); });
    }

    Value SuperstepCoordinator::pending_to_value() const {
        Value::list_t result;
        for (const auto &t: _pending) {
            Value::map_t entry{{"node", Value{_graph->node(t.node).name}}};
            if (t.arg) { entry.emplace("arg", *t.arg); }
            result.emplace_back(std::move(entry));
        }
        return Value{std::move(result)};
    }

    void SuperstepCoordinator::pending_from_value(const Value &pending) {
        for (const auto &entry: pending.as_list()) {
            PlannedTask task{_graph->node_index(entry.at("node").as_string())};
            if (auto *arg = entry.find("arg"); arg != nullptr) { task.arg = *arg; }
            _pending.push_back(std::move(task));
        }
    }

    void SuperstepCoordinator::abort(superstep_t superstep, std::exception_ptr cause) {
        set_state(CoordinatorState::ABORTED);
        ErrorContext context{superstep, {}, {}};
        if (cause) {
            try {
                std::rethrow_exception(cause);
            } catch (const BspGraphError &e) {
                context.node = e.node();
            } catch (const std::exception &) {
                // No node to report.
            }
        }
        auto error = CoordinatorError::aborted(cause, context);
        for (auto &o: _observers) { o->on_abort(superstep, error); }
        throw error;
    }

} // namespace bspgraph
