/**
 * Tests for the work stealing scheduler and the primitives under it: the deque, cancellation and the admission
 * gate.
 */

#include <catch2/catch_test_macros.hpp>
#include <bspgraph/runtime/scheduler.h>
#include <bspgraph/util/errors.h>
#include <bspgraph/util/lifecycle.h>

#include <atomic>
#include <future>
#include <numeric>
#include <thread>

using namespace bspgraph;
using namespace std::chrono_literals;

namespace {
    std::vector<TaskCompletion> collect(TaskBatch &batch) {
        std::vector<TaskCompletion> result;
        while (auto c = batch.wait_next(monotonic_clock::now() + 5s)) { result.push_back(std::move(*c)); }
        return result;
    }

    // The context is declared after the scheduler so it stops the workers before the scheduler is released.
    struct StartedScheduler {
        explicit StartedScheduler(SchedulerConfig config)
            : scheduler{std::make_shared<WorkStealingScheduler>(config)}, context{*scheduler} {}

        WorkStealingScheduler::s_ptr scheduler;
        StartStopContext context;
    };
}

// ============================================================================
// Deque
// ============================================================================

TEST_CASE("WorkStealingDeque - owner takes the highest rank, newest first", "[scheduler][deque]") {
    WorkStealingDeque<std::pair<int, int>> deque;
    std::vector<std::pair<int, int>> items{{1, 0}, {5, 1}, {5, 2}, {3, 3}};
    for (auto item: items) { deque.push(item); }
    auto rank = [](const std::pair<int, int> &p) { return static_cast<int64_t>(p.first); };

    REQUIRE(deque.pop(rank)->second == 2);
    REQUIRE(deque.steal(rank)->second == 1);
    REQUIRE(deque.pop(rank)->second == 3);
    // A thief never takes the last item.
    REQUIRE_FALSE(deque.steal(rank).has_value());
    REQUIRE(deque.size() == 1);
    REQUIRE(deque.drain().size() == 1);
    REQUIRE(deque.empty());
}

// ============================================================================
// Cancellation and admission
// ============================================================================

TEST_CASE("CancellationSource - first reason wins and sleepers wake", "[scheduler][cancellation]") {
    CancellationSource source;
    auto token = source.token();
    REQUIRE_FALSE(CancellationToken{}.is_cancelled());
    REQUIRE(token.sleep_for(1ms));

    std::thread canceller([&] {
        std::this_thread::sleep_for(20ms);
        source.cancel("first");
        source.cancel("second");
    });
    auto started = monotonic_clock::now();
    REQUIRE_FALSE(token.sleep_for(10s));
    canceller.join();
    REQUIRE(monotonic_clock::now() - started < 5s);
    REQUIRE(token.reason() == "first");

    try {
        token.throw_if_cancelled();
        FAIL("not cancelled");
    } catch (const SchedulerError &e) {
        REQUIRE(e.kind() == SchedulerError::Kind::TASK_CANCELLED);
    }
}

TEST_CASE("AdmissionGate - permits are bounded", "[scheduler][admission]") {
    REQUIRE_THROWS_AS(AdmissionGate{0}, std::invalid_argument);

    AdmissionGate gate{2};
    REQUIRE(gate.try_acquire());
    {
        // The permit adopts the acquired slot.
        AdmissionPermit permit{gate};
        REQUIRE(permit.held());
        REQUIRE(gate.in_use() == 1);
        // Bypass the permit to fill the gate.
        REQUIRE(gate.try_acquire());
        REQUIRE_FALSE(gate.try_acquire());
        gate.release();

        bool ran{false};
        REQUIRE(permit.suspend(CancellationToken{}, [&] {
            ran = true;
            REQUIRE(gate.in_use() == 0);
        }));
        REQUIRE(ran);
        REQUIRE(gate.in_use() == 1);
    }
    REQUIRE(gate.in_use() == 0);
    REQUIRE(gate.peak_in_use() == 2);
    REQUIRE_THROWS_AS(gate.release(), std::logic_error);

    CancellationSource source;
    REQUIRE(gate.try_acquire());
    REQUIRE(gate.try_acquire());
    source.cancel();
    REQUIRE_FALSE(gate.acquire(source.token()));
}

// ============================================================================
// Scheduler
// ============================================================================

TEST_CASE("urgency_boost - interpolates towards the deadline", "[scheduler][urgency]") {
    UrgencyConfig config;
    auto now = monotonic_clock::now();
    REQUIRE(urgency_boost(config, std::nullopt, now) == 0);
    REQUIRE(urgency_boost(config, now + 2s, now) == 0);
    REQUIRE(urgency_boost(config, now + 550ms, now) == 55);
    REQUIRE(urgency_boost(config, now + 100ms, now) == 100);
    REQUIRE(urgency_boost(config, now + 50ms, now) == 550);
    REQUIRE(urgency_boost(config, now - 1ms, now) == 1000);
}

TEST_CASE("SchedulerConfig - validation", "[scheduler]") {
    REQUIRE_THROWS_AS(WorkStealingScheduler{SchedulerConfig{.num_workers = 0}}, std::invalid_argument);
    SchedulerConfig inverted;
    inverted.urgency.long_threshold = inverted.urgency.short_threshold;
    REQUIRE_THROWS_AS(inverted.validate(), std::invalid_argument);
    REQUIRE(SchedulerConfig{.num_workers = 3}.effective_max_concurrent_tasks() == 3);
}

TEST_CASE("WorkStealingScheduler - submit requires a started scheduler", "[scheduler]") {
    auto scheduler = std::make_shared<WorkStealingScheduler>();
    auto batch = scheduler->create_batch();
    try {
        scheduler->submit(batch, TaskRequest{"t", [](TaskExecution &) {}});
        FAIL("submit accepted");
    } catch (const SchedulerError &e) {
        REQUIRE(e.kind() == SchedulerError::Kind::NOT_RUNNING);
    }
}

TEST_CASE("StartStopContext - runs the scheduler for the scope", "[scheduler][lifecycle]") {
    auto scheduler = std::make_shared<WorkStealingScheduler>(SchedulerConfig{.num_workers = 2});
    {
        StartStopContext context{*scheduler};
        REQUIRE(scheduler->is_started());
        REQUIRE_FALSE(scheduler->is_starting());
        REQUIRE_FALSE(scheduler->is_stopping());

        auto batch = scheduler->create_batch();
        scheduler->submit(batch, TaskRequest{"t", [](TaskExecution &) {}});
        REQUIRE(collect(*batch).size() == 1);
    }
    REQUIRE_FALSE(scheduler->is_started());

    // A stopped scheduler starts again cleanly.
    StartStopContext again{*scheduler};
    REQUIRE(scheduler->is_started());
}

TEST_CASE("WorkStealingScheduler - bounds concurrency with the admission gate", "[scheduler]") {
    StartedScheduler s{SchedulerConfig{.num_workers = 4, .max_concurrent_tasks = 2}};
    auto batch = s.scheduler->create_batch();
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    auto started = monotonic_clock::now();
    for (int i = 0; i < 20; ++i) {
        s.scheduler->submit(batch, TaskRequest{fmt::format("t{}", i), [&](TaskExecution &) {
            auto now_running = ++running;
            auto seen = peak.load();
            while (now_running > seen && !peak.compare_exchange_weak(seen, now_running)) {}
            std::this_thread::sleep_for(10ms);
            --running;
        }});
    }
    auto completions = collect(*batch);
    auto elapsed = monotonic_clock::now() - started;

    REQUIRE(completions.size() == 20);
    for (const auto &c: completions) { REQUIRE(c.status == TaskStatus::SUCCEEDED); }
    REQUIRE(peak.load() <= 2);
    REQUIRE(s.scheduler->admission_gate().peak_in_use() <= 2);
    REQUIRE(elapsed >= 90ms);

    auto stats = s.scheduler->statistics();
    REQUIRE(stats.size() == 4);
    auto processed = std::accumulate(stats.begin(), stats.end(), size_t{0},
                                     [](size_t acc, const WorkerStatistics &w) { return acc + w.processed; });
    REQUIRE(processed == 20);
}

TEST_CASE("WorkStealingScheduler - task failures are reported", "[scheduler]") {
    StartedScheduler s{SchedulerConfig{.num_workers = 2}};
    auto batch = s.scheduler->create_batch();
    s.scheduler->submit(batch, TaskRequest{"boom", [](TaskExecution &) { throw std::runtime_error("boom"); }});
    auto completions = collect(*batch);

    REQUIRE(completions.size() == 1);
    REQUIRE(completions[0].status == TaskStatus::FAILED);
    REQUIRE(describe_exception(completions[0].error).find("boom") != std::string::npos);
}

TEST_CASE("WorkStealingScheduler - queue bound and cancellation before start", "[scheduler]") {
    StartedScheduler s{SchedulerConfig{.num_workers = 1, .max_queued_tasks = 2}};
    auto batch = s.scheduler->create_batch();

    std::promise<void> started;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    s.scheduler->submit(batch, TaskRequest{"blocker", [&, release_future](TaskExecution &) {
        started.set_value();
        release_future.wait();
    }});
    started.get_future().wait();

    std::atomic<bool> queued_ran{false};
    auto mark = [&](TaskExecution &) { queued_ran = true; };
    s.scheduler->submit(batch, TaskRequest{"queued1", mark});
    s.scheduler->submit(batch, TaskRequest{"queued2", mark});
    try {
        s.scheduler->submit(batch, TaskRequest{"overflow", mark});
        FAIL("queue bound ignored");
    } catch (const SchedulerError &e) {
        REQUIRE(e.kind() == SchedulerError::Kind::QUEUE_FULL);
    }

    batch->cancel("test");
    release.set_value();
    auto completions = collect(*batch);

    REQUIRE(completions.size() == 3);
    REQUIRE_FALSE(queued_ran.load());
    for (const auto &c: completions) { REQUIRE(c.status == TaskStatus::CANCELLED); }
    REQUIRE(batch->outstanding() == 0);
}

TEST_CASE("WorkStealingScheduler - wait_next honours its deadline", "[scheduler]") {
    StartedScheduler s{SchedulerConfig{.num_workers = 1}};
    auto batch = s.scheduler->create_batch();
    s.scheduler->submit(batch, TaskRequest{"slow", [](TaskExecution &execution) {
        (void)execution.cancellation.sleep_for(10s);
    }});
    REQUIRE_FALSE(batch->wait_next(monotonic_clock::now() + 20ms).has_value());
    batch->cancel("timeout");
    batch->drain();
    REQUIRE(batch->outstanding() == 0);
}

TEST_CASE("WorkStealingScheduler - equal work spreads evenly over the workers", "[scheduler]") {
    StartedScheduler s{SchedulerConfig{.num_workers = 4}};
    // Let every worker reach its idle wait before the burst.
    std::this_thread::sleep_for(20ms);

    auto batch = s.scheduler->create_batch();
    for (int i = 0; i < 40; ++i) {
        s.scheduler->submit(batch, TaskRequest{fmt::format("t{}", i), [](TaskExecution &) {
            std::this_thread::sleep_for(10ms);
        }});
    }
    REQUIRE(collect(*batch).size() == 40);

    for (const auto &w: s.scheduler->statistics()) {
        REQUIRE(w.processed >= 8);
        REQUIRE(w.processed <= 12);
    }
}
