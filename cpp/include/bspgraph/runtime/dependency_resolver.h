#ifndef BSPGRAPH_RUNTIME_DEPENDENCY_RESOLVER_H
#define BSPGRAPH_RUNTIME_DEPENDENCY_RESOLVER_H

#include <bspgraph/types/node.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bspgraph {

    using node_index_t = size_t;
    using edge_t = std::pair<node_index_t, node_index_t>;

    // A node activation for one superstep, sends carry an argument.
    struct PlannedTask {
        node_index_t node;
        std::optional<Value> arg{};

        friend bool operator==(const PlannedTask &, const PlannedTask &) = default;
    };

    /**
     * Tracks the tasks of one superstep through the execute phase. A task becomes ready once every task it depends
     * on has completed; complete() reports the tasks that became ready as a result.
     */
    struct BSPGRAPH_EXPORT SuperstepPlan {
        explicit SuperstepPlan(std::vector<PlannedTask> tasks, std::vector<std::vector<size_t>> dependencies);

        [[nodiscard]] size_t size() const { return _tasks.size(); }

        [[nodiscard]] const PlannedTask &task(size_t index) const { return _tasks[index]; }

        [[nodiscard]] const std::vector<PlannedTask> &tasks() const { return _tasks; }

        [[nodiscard]] const std::vector<size_t> &dependencies(size_t index) const { return _dependencies[index]; }

        // Tasks with no dependencies, in task order.
        [[nodiscard]] std::vector<size_t> initially_ready() const;

        // Marks the task complete and returns the tasks it released, in task order.
        std::vector<size_t> complete(size_t index);

        [[nodiscard]] bool is_complete(size_t index) const { return _completed[index]; }

        [[nodiscard]] size_t completed_count() const { return _completed_count; }

        [[nodiscard]] bool all_complete() const { return _completed_count == _tasks.size(); }

    private:
        std::vector<PlannedTask> _tasks;
        std::vector<std::vector<size_t>> _dependencies;
        std::vector<std::vector<size_t>> _dependents;
        std::vector<size_t> _unresolved;
        std::vector<bool> _completed;
        size_t _completed_count{0};
    };

    /**
     * Derives the ordering between nodes from the control edges and from the read and write sets.
     *
     * Control edges must be acyclic, a cycle raises GraphValidationError(CONTROL_EDGE_CYCLE) naming the nodes on it.
     * A data edge A -> B is implied whenever B reads a channel A writes. Data edges are considered in node declaration
     * order and one that would close a cycle is skipped: such a pair is ordered by the supersteps, not inside one.
     *
     * Within a superstep, a task depends on every other active task whose node reaches its node.
     */
    struct BSPGRAPH_EXPORT DependencyResolver {
        DependencyResolver(const std::vector<NodeSpec> &nodes, std::vector<edge_t> control_edges);

        [[nodiscard]] size_t node_count() const { return _names.size(); }

        [[nodiscard]] bool reaches(node_index_t from, node_index_t to) const;

        [[nodiscard]] const std::vector<edge_t> &control_edges() const { return _control_edges; }

        [[nodiscard]] const std::vector<edge_t> &data_edges() const { return _data_edges; }

        // Data edges that were skipped because they would have closed a cycle.
        [[nodiscard]] const std::vector<edge_t> &deferred_edges() const { return _deferred_edges; }

        // Nodes in an order consistent with every kept edge, ties by declaration order.
        [[nodiscard]] const std::vector<node_index_t> &topological_order() const { return _order; }

        [[nodiscard]] SuperstepPlan plan(std::vector<PlannedTask> tasks) const;

    private:
        void add_edge(node_index_t from, node_index_t to);

        [[nodiscard]] std::vector<node_index_t> find_control_cycle() const;

        std::vector<std::string> _names;
        std::vector<edge_t> _control_edges;
        std::vector<edge_t> _data_edges;
        std::vector<edge_t> _deferred_edges;
        // _reach[a][b] is true when a path a -> b exists over the kept edges.
        std::vector<std::vector<bool>> _reach;
        std::vector<node_index_t> _order;
    };

} // namespace bspgraph

#endif  // BSPGRAPH_RUNTIME_DEPENDENCY_RESOLVER_H
