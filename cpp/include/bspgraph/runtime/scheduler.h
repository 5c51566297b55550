#ifndef BSPGRAPH_RUNTIME_SCHEDULER_H
#define BSPGRAPH_RUNTIME_SCHEDULER_H

#include <bspgraph/runtime/admission_gate.h>
#include <bspgraph/runtime/cancellation.h>
#include <bspgraph/runtime/work_stealing_deque.h>
#include <bspgraph/util/lifecycle.h>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace bspgraph {

    /**
     * Deadline urgency. A task without a deadline gets no boost. With one, the boost is 0 while more than
     * long_threshold remains, rises linearly from long_boost to short_boost between the two thresholds, from
     * short_boost to max_boost below short_threshold, and is max_boost once the deadline has passed.
     */
    struct UrgencyConfig {
        engine_time_delta_t short_threshold{std::chrono::milliseconds(100)};
        engine_time_delta_t long_threshold{std::chrono::milliseconds(1000)};
        int64_t long_boost{10};
        int64_t short_boost{100};
        int64_t max_boost{1000};
    };

    struct SchedulerConfig {
        size_t num_workers{4};
        // Tasks executing at once, 0 means one per worker.
        size_t max_concurrent_tasks{0};
        // Tasks waiting in the worker queues before submit raises QUEUE_FULL.
        size_t max_queued_tasks{10'000};
        UrgencyConfig urgency{};

        // Raises std::invalid_argument.
        void validate() const;

        [[nodiscard]] size_t effective_max_concurrent_tasks() const {
            return max_concurrent_tasks == 0 ? num_workers : max_concurrent_tasks;
        }
    };

    [[nodiscard]] BSPGRAPH_EXPORT int64_t urgency_boost(const UrgencyConfig &config,
                                                        std::optional<monotonic_time_t> deadline,
                                                        monotonic_time_t now);

    // What a running task can reach: its cancellation signal and its admission permit.
    struct TaskExecution {
        CancellationToken cancellation;
        AdmissionPermit &permit;
        size_t worker;
    };

    using task_fn_t = std::function<void(TaskExecution &)>;

    struct TaskRequest {
        std::string name;
        task_fn_t fn;
        int64_t priority{0};
        std::optional<monotonic_time_t> deadline{};
    };

    enum class TaskStatus {
        SUCCEEDED = 0,
        FAILED = 1,
        // Cancelled before or while running.
        CANCELLED = 2,
    };

    [[nodiscard]] BSPGRAPH_EXPORT std::string_view to_string(TaskStatus status);

    struct TaskCompletion {
        task_id_t id;
        std::string name;
        TaskStatus status;
        // The exception raised by the task, set for FAILED and CANCELLED.
        std::exception_ptr error{};
        std::optional<size_t> worker{};
        engine_time_delta_t elapsed{};
    };

    /**
     * The tasks of one execute phase. Completions are queued in the order tasks finish; cancelling the batch
     * signals every outstanding task of the batch and prevents queued ones from starting.
     */
    struct BSPGRAPH_EXPORT TaskBatch {
        TaskBatch() = default;

        TaskBatch(const TaskBatch &) = delete;

        TaskBatch &operator=(const TaskBatch &) = delete;

        [[nodiscard]] CancellationToken token() const { return _source.token(); }

        void cancel(std::string reason);

        [[nodiscard]] bool is_cancelled() const { return _source.is_cancelled(); }

        /**
         * Blocks for the next completion. Returns nullopt when the deadline passes first, or immediately when
         * nothing is outstanding and no completion is queued.
         */
        [[nodiscard]] std::optional<TaskCompletion> wait_next(std::optional<monotonic_time_t> deadline = std::nullopt);

        // Blocks until every submitted task has completed, discarding queued completions.
        void drain();

        [[nodiscard]] size_t submitted() const;

        [[nodiscard]] size_t outstanding() const;

    private:
        friend WorkStealingScheduler;

        void on_submitted();

        void on_completed(TaskCompletion completion);

        CancellationSource _source;
        mutable std::mutex _mutex;
        std::condition_variable _cv;
        std::deque<TaskCompletion> _completions;
        size_t _submitted{0};
        size_t _finished{0};
    };

    struct WorkerStatistics {
        size_t processed{0};
        size_t stolen{0};
    };

    /**
     * A fixed pool of worker threads, each with its own local queue. Submissions from outside the pool are spread
     * round-robin over the queues, a worker submitting work pushes onto its own queue. Idle workers steal. The
     * admission gate bounds how many tasks execute at once, independent of the number of workers.
     *
     * The scheduler is a life-cycle component: start spawns the workers, stop cancels anything still queued and
     * joins them.
     */
    struct BSPGRAPH_EXPORT WorkStealingScheduler : ComponentLifeCycle {
        using s_ptr = std::shared_ptr<WorkStealingScheduler>;

        explicit WorkStealingScheduler(SchedulerConfig config = {});

        ~WorkStealingScheduler() override;

        [[nodiscard]] const SchedulerConfig &config() const { return _config; }

        [[nodiscard]] task_batch_s_ptr create_batch() const;

        /**
         * Queues a task. Raises SchedulerError(NOT_RUNNING) when the scheduler is not started and
         * SchedulerError(QUEUE_FULL) when max_queued_tasks are already waiting.
         */
        task_id_t submit(const task_batch_s_ptr &batch, TaskRequest request);

        [[nodiscard]] size_t num_workers() const { return _config.num_workers; }

        [[nodiscard]] size_t queued() const { return _queued.load(); }

        [[nodiscard]] std::vector<WorkerStatistics> statistics() const;

        void reset_statistics();

        [[nodiscard]] const AdmissionGate &admission_gate() const { return _gate; }

    protected:
        void initialise() override;

        void start() override;

        void stop() override;

        void dispose() override;

    private:
        struct QueuedTask {
            task_id_t id;
            uint64_t sequence;
            TaskRequest request;
            task_batch_s_ptr batch;
        };

        struct Worker {
            WorkStealingDeque<QueuedTask> queue;
            std::atomic<size_t> processed{0};
            std::atomic<size_t> stolen{0};
            std::thread thread;
        };

        void worker_loop(size_t index);

        std::optional<QueuedTask> next_task(size_t index);

        void execute(QueuedTask task, size_t index);

        void notify_workers();

        [[nodiscard]] int64_t rank(const QueuedTask &task, monotonic_time_t now) const;

        SchedulerConfig _config;
        AdmissionGate _gate;
        std::vector<std::unique_ptr<Worker>> _workers;

        std::atomic<bool> _running{false};
        std::atomic<size_t> _queued{0};
        std::atomic<task_id_t> _next_id{1};
        std::atomic<uint64_t> _next_sequence{0};
        std::atomic<size_t> _round_robin{0};

        // Shared readiness notification, the generation moves on every push.
        std::mutex _ready_mutex;
        std::condition_variable _ready_cv;
        uint64_t _push_generation{0};
    };

} // namespace bspgraph

#endif  // BSPGRAPH_RUNTIME_SCHEDULER_H
