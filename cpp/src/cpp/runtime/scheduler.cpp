#include <bspgraph/runtime/scheduler.h>
#include <bspgraph/util/errors.h>
#include <bspgraph/util/scope.h>

#include <algorithm>
#include <stdexcept>

namespace bspgraph {

    namespace {
        // Wakes idle workers periodically so a missed notification never strands a task.
        constexpr auto IDLE_RESCAN_INTERVAL = std::chrono::milliseconds(10);

        struct WorkerIdentity {
            const WorkStealingScheduler *scheduler{nullptr};
            size_t index{0};
        };

        thread_local WorkerIdentity current_worker{};
    } // namespace

    void SchedulerConfig::validate() const {
        if (num_workers == 0) { throw std::invalid_argument("SchedulerConfig.num_workers must be at least 1"); }
        if (max_queued_tasks == 0) { throw std::invalid_argument("SchedulerConfig.max_queued_tasks must be at least 1"); }
        if (urgency.short_threshold <= engine_time_delta_t::zero() ||
            urgency.long_threshold <= urgency.short_threshold) {
            throw_error<std::invalid_argument>(
                "Urgency thresholds must satisfy 0 < short ({}) < long ({})", urgency.short_threshold,
                urgency.long_threshold);
        }
        if (urgency.long_boost < 0 || urgency.short_boost < urgency.long_boost ||
            urgency.max_boost < urgency.short_boost) {
            throw_error<std::invalid_argument>("Urgency boosts must satisfy 0 <= long ({}) <= short ({}) <= max ({})",
                                               urgency.long_boost, urgency.short_boost, urgency.max_boost);
        }
    }

    int64_t urgency_boost(const UrgencyConfig &config, std::optional<monotonic_time_t> deadline,
                          monotonic_time_t now) {
        if (!deadline) { return 0; }
        auto remaining = std::chrono::duration_cast<engine_time_delta_t>(*deadline - now);
        if (remaining <= engine_time_delta_t::zero()) { return config.max_boost; }
        if (remaining >= config.long_threshold) { return 0; }
        auto interpolate = [](int64_t from, int64_t to, double fraction) {
            return from + static_cast<int64_t>(static_cast<double>(to - from) * fraction);
        };
        if (remaining < config.short_threshold) {
            double fraction = 1.0 - static_cast<double>(remaining.count()) /
                                    static_cast<double>(config.short_threshold.count());
            return interpolate(config.short_boost, config.max_boost, fraction);
        }
        double fraction = static_cast<double>((config.long_threshold - remaining).count()) /
                          static_cast<double>((config.long_threshold - config.short_threshold).count());
        return interpolate(config.long_boost, config.short_boost, fraction);
    }

    std::string_view to_string(TaskStatus status) {
        switch (status) {
            case TaskStatus::SUCCEEDED: return "succeeded";
            case TaskStatus::FAILED: return "failed";
            case TaskStatus::CANCELLED: return "cancelled";
        }
        return "unknown";
    }

    void TaskBatch::cancel(std::string reason) { _source.cancel(std::move(reason)); }

    std::optional<TaskCompletion> TaskBatch::wait_next(std::optional<monotonic_time_t> deadline) {
        std::unique_lock lock(_mutex);
        auto available = [this] { return !_completions.empty() || _finished == _submitted; };
        if (deadline) {
            if (!_cv.wait_until(lock, *deadline, available)) { return std::nullopt; }
        } else {
            _cv.wait(lock, available);
        }
        if (_completions.empty()) { return std::nullopt; }
        auto completion = std::move(_completions.front());
        _completions.pop_front();
        return completion;
    }

    void TaskBatch::drain() {
        std::unique_lock lock(_mutex);
        _cv.wait(lock, [this] { return _finished == _submitted; });
        _completions.clear();
    }

    size_t TaskBatch::submitted() const {
        std::lock_guard lock(_mutex);
        return _submitted;
    }

    size_t TaskBatch::outstanding() const {
        std::lock_guard lock(_mutex);
        return _submitted - _finished;
    }

    void TaskBatch::on_submitted() {
        std::lock_guard lock(_mutex);
        ++_submitted;
    }

    void TaskBatch::on_completed(TaskCompletion completion) {
        {
            std::lock_guard lock(_mutex);
            _completions.push_back(std::move(completion));
            ++_finished;
        }
        _cv.notify_all();
    }

    WorkStealingScheduler::WorkStealingScheduler(SchedulerConfig config)
        : _config{(config.validate(), config)}, _gate{_config.effective_max_concurrent_tasks()} {
    }

    WorkStealingScheduler::~WorkStealingScheduler() {
        try {
            stop_component(*this);
        } catch (const std::exception &e) {
            fmt::print(stderr, "Warning: exception stopping scheduler: {}\n", e.what());
        }
    }

    void WorkStealingScheduler::initialise() {}

    void WorkStealingScheduler::start() {
        _workers.clear();
        for (size_t i = 0; i < _config.num_workers; ++i) { _workers.push_back(std::make_unique<Worker>()); }
        _running = true;
        for (size_t i = 0; i < _workers.size(); ++i) {
            _workers[i]->thread = std::thread([this, i] { worker_loop(i); });
        }
    }

    void WorkStealingScheduler::stop() {
        _running = false;
        notify_workers();
        for (auto &w: _workers) {
            if (w->thread.joinable()) { w->thread.join(); }
        }
        // Anything left in a queue never started, report it as cancelled so no batch waits forever.
        for (auto &w: _workers) {
            for (auto &task: w->queue.drain()) {
                --_queued;
                task.batch->on_completed(TaskCompletion{
                    task.id, task.request.name, TaskStatus::CANCELLED,
                    std::make_exception_ptr(SchedulerError{SchedulerError::Kind::TASK_CANCELLED, "scheduler stopped"}),
                });
            }
        }
    }

    void WorkStealingScheduler::dispose() { _workers.clear(); }

    task_batch_s_ptr WorkStealingScheduler::create_batch() const { return std::make_shared<TaskBatch>(); }

    task_id_t WorkStealingScheduler::submit(const task_batch_s_ptr &batch, TaskRequest request) {
        if (!_running) { throw SchedulerError{SchedulerError::Kind::NOT_RUNNING, "scheduler is not started"}; }
        if (!batch) { throw std::invalid_argument("submit requires a batch"); }
        if (!request.fn) { throw_error<std::invalid_argument>("Task '{}' has no function", request.name); }
        if (_queued.fetch_add(1) >= _config.max_queued_tasks) {
            --_queued;
            throw SchedulerError{SchedulerError::Kind::QUEUE_FULL,
                                 fmt::format("{} tasks already queued", _config.max_queued_tasks)};
        }
        auto id = _next_id++;
        auto target = current_worker.scheduler == this ? current_worker.index
                                                       : _round_robin++ % _workers.size();
        batch->on_submitted();
        _workers[target]->queue.push(QueuedTask{id, _next_sequence++, std::move(request), batch});
        notify_workers();
        return id;
    }

    std::vector<WorkerStatistics> WorkStealingScheduler::statistics() const {
        std::vector<WorkerStatistics> result;
        result.reserve(_workers.size());
        for (const auto &w: _workers) { result.push_back(WorkerStatistics{w->processed.load(), w->stolen.load()}); }
        return result;
    }

    void WorkStealingScheduler::reset_statistics() {
        for (auto &w: _workers) {
            w->processed = 0;
            w->stolen = 0;
        }
    }

    void WorkStealingScheduler::notify_workers() {
        {
            std::lock_guard lock(_ready_mutex);
            ++_push_generation;
        }
        // Every worker is woken: the owner of the queue may be the only one able to take a single task.
        _ready_cv.notify_all();
    }

    int64_t WorkStealingScheduler::rank(const QueuedTask &task, monotonic_time_t now) const {
        return task.request.priority + urgency_boost(_config.urgency, task.request.deadline, now);
    }

    std::optional<WorkStealingScheduler::QueuedTask> WorkStealingScheduler::next_task(size_t index) {
        auto now = monotonic_clock::now();
        auto by_rank = [this, now](const QueuedTask &t) { return rank(t, now); };
        if (auto task = _workers[index]->queue.pop(by_rank); task) { return task; }
        // Victims are visited starting after this worker so thieves spread out.
        for (size_t offset = 1; offset < _workers.size(); ++offset) {
            auto victim = (index + offset) % _workers.size();
            if (auto task = _workers[victim]->queue.steal(by_rank); task) {
                ++_workers[index]->stolen;
                return task;
            }
        }
        return std::nullopt;
    }

    void WorkStealingScheduler::worker_loop(size_t index) {
        current_worker = WorkerIdentity{this, index};
        auto reset_identity = make_scope_exit([] { current_worker = WorkerIdentity{}; });
        while (_running) {
            uint64_t generation;
            {
                std::lock_guard lock(_ready_mutex);
                generation = _push_generation;
            }
            if (auto task = next_task(index); task) {
                --_queued;
                execute(std::move(*task), index);
                continue;
            }
            std::unique_lock lock(_ready_mutex);
            _ready_cv.wait_for(lock, IDLE_RESCAN_INTERVAL,
                               [this, generation] { return !_running || _push_generation != generation; });
        }
    }

    void WorkStealingScheduler::execute(QueuedTask task, size_t index) {
        auto token = task.batch->token();
        auto started = monotonic_clock::now();
        TaskCompletion completion{task.id, task.request.name, TaskStatus::SUCCEEDED, nullptr, index};

        auto cancelled_before_start = [&] {
            completion.status = TaskStatus::CANCELLED;
            completion.error = std::make_exception_ptr(
                SchedulerError{SchedulerError::Kind::TASK_CANCELLED,
                               fmt::format("task '{}' cancelled before start: {}", task.request.name, token.reason())});
            task.batch->on_completed(std::move(completion));
        };

        if (token.is_cancelled() || !_gate.acquire(token)) {
            cancelled_before_start();
            return;
        }

        {
            AdmissionPermit permit{_gate};
            ++_workers[index]->processed;
            TaskExecution execution{token, permit, index};
            try {
                task.request.fn(execution);
            } catch (const SchedulerError &e) {
                completion.status = e.kind() == SchedulerError::Kind::TASK_CANCELLED ? TaskStatus::CANCELLED
                                                                                    : TaskStatus::FAILED;
                completion.error = std::current_exception();
            } catch (...) {
                completion.status = TaskStatus::FAILED;
                completion.error = std::current_exception();
            }
        }
        if (completion.status == TaskStatus::SUCCEEDED && token.is_cancelled()) {
            // Finished after the batch was abandoned, the result must not be used.
            completion.status = TaskStatus::CANCELLED;
            completion.error = std::make_exception_ptr(
                SchedulerError{SchedulerError::Kind::TASK_CANCELLED,
                               fmt::format("task '{}' completed after cancellation: {}", task.request.name,
                                           token.reason())});
        }
        completion.elapsed = std::chrono::duration_cast<engine_time_delta_t>(monotonic_clock::now() - started);
        task.batch->on_completed(std::move(completion));
    }

} // namespace bspgraph
