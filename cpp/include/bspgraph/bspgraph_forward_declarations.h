#ifndef BSPGRAPH_FORWARD_DECLARATIONS_H
#define BSPGRAPH_FORWARD_DECLARATIONS_H

#include <cstdint>
#include <memory>
#include <string>

namespace bspgraph {
    struct Value;

    struct Channel;
    using channel_ptr = Channel *;

    struct ChannelRegistry;

    struct NodeSpec;
    using node_spec_ptr = const NodeSpec *;

    struct CompiledGraph;
    using compiled_graph_s_ptr = std::shared_ptr<const CompiledGraph>;

    struct DependencyResolver;
    struct SuperstepPlan;

    struct CancellationToken;
    struct AdmissionGate;
    struct TaskBatch;
    using task_batch_s_ptr = std::shared_ptr<TaskBatch>;

    struct WorkStealingScheduler;
    using scheduler_s_ptr = std::shared_ptr<WorkStealingScheduler>;

    struct Checkpointer;
    using checkpointer_s_ptr = std::shared_ptr<Checkpointer>;

    struct StreamSink;
    using stream_sink_s_ptr = std::shared_ptr<StreamSink>;

    struct SuperstepObserver;
    using superstep_observer_s_ptr = std::shared_ptr<SuperstepObserver>;

    struct SuperstepCoordinator;

    using task_id_t = uint64_t;
    using superstep_t = int64_t;
    using generation_t = int64_t;
} // namespace bspgraph

#endif  // BSPGRAPH_FORWARD_DECLARATIONS_H
