#ifndef BSPGRAPH_TYPES_GRAPH_H
#define BSPGRAPH_TYPES_GRAPH_H

#include <bspgraph/runtime/dependency_resolver.h>

#include <ankerl/unordered_dense.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace bspgraph {

    // Picks the nodes to run next from the committed channel values. END may be returned to stop the branch.
    using router_fn_t = std::function<std::vector<std::string>(const channel_values_t &)>;

    struct ConditionalEdge {
        std::string source;
        router_fn_t router;
        // Nodes the router may return, empty allows any node.
        std::vector<std::string> allowed_targets{};
    };

    /**
     * Builder for a graph: channels, nodes and the edges between them. Nothing is validated until compile(), which
     * either returns an immutable CompiledGraph or raises GraphValidationError; a graph that fails validation never
     * runs.
     */
    struct BSPGRAPH_EXPORT StateGraph {
        StateGraph &add_channel(ChannelSpec spec);

        StateGraph &add_node(NodeSpec spec);

        /**
         * A direct edge. The target runs in the superstep after the source; when both run in the same superstep the
         * source completes first. START and END stand for the entry and exit of the graph.
         */
        StateGraph &add_edge(std::string from, std::string to);

        StateGraph &add_conditional_edges(std::string source, router_fn_t router,
                                          std::vector<std::string> allowed_targets = {});

        // Same as add_edge(START, node).
        StateGraph &set_entry_point(std::string node);

        // Same as add_edge(node, END).
        StateGraph &set_finish_point(std::string node);

        [[nodiscard]] compiled_graph_s_ptr compile() const;

        [[nodiscard]] const std::vector<ChannelSpec> &channels() const { return _channels; }

        [[nodiscard]] const std::vector<NodeSpec> &nodes() const { return _nodes; }

        [[nodiscard]] const std::vector<std::pair<std::string, std::string>> &edges() const { return _edges; }

        [[nodiscard]] const std::vector<ConditionalEdge> &conditional_edges() const { return _conditional_edges; }

    private:
        std::vector<ChannelSpec> _channels;
        std::vector<NodeSpec> _nodes;
        std::vector<std::pair<std::string, std::string>> _edges;
        std::vector<ConditionalEdge> _conditional_edges;
    };

    /**
     * A validated graph. Shared between coordinators, never mutated after construction.
     */
    struct BSPGRAPH_EXPORT CompiledGraph {
        struct Router {
            router_fn_t fn;
            std::vector<std::string> allowed_targets;
        };

        // Validates graph, raising GraphValidationError.
        explicit CompiledGraph(const StateGraph &graph);

        [[nodiscard]] const std::vector<NodeSpec> &nodes() const { return _nodes; }

        [[nodiscard]] const NodeSpec &node(node_index_t index) const { return _nodes.at(index); }

        [[nodiscard]] std::optional<node_index_t> find_node(std::string_view name) const;

        // Raises GraphValidationError(UNKNOWN_NODE).
        [[nodiscard]] node_index_t node_index(std::string_view name) const;

        [[nodiscard]] const std::vector<ChannelSpec> &channels() const { return _channels; }

        [[nodiscard]] ChannelRegistry create_registry() const { return ChannelRegistry{_channels}; }

        [[nodiscard]] const std::vector<node_index_t> &entry_nodes() const { return _entry_nodes; }

        // Direct edge targets, END excluded.
        [[nodiscard]] const std::vector<node_index_t> &successors(node_index_t node) const { return _successors[node]; }

        [[nodiscard]] const std::vector<Router> &routers(node_index_t node) const { return _routers[node]; }

        // Conditional edges out of START, evaluated once the input has been applied.
        [[nodiscard]] const std::vector<Router> &entry_routers() const { return _entry_routers; }

        // Nodes activated by a change to the channel.
        [[nodiscard]] const std::vector<node_index_t> &triggered_by(std::string_view channel) const;

        // Nodes declaring a write to the channel, in declaration order.
        [[nodiscard]] std::vector<node_index_t> writers(std::string_view channel) const;

        [[nodiscard]] const DependencyResolver &resolver() const { return *_resolver; }

    private:
        std::vector<ChannelSpec> _channels;
        std::vector<NodeSpec> _nodes;
        ankerl::unordered_dense::map<std::string, node_index_t> _node_index;
        std::vector<node_index_t> _entry_nodes;
        std::vector<std::vector<node_index_t>> _successors;
        std::vector<std::vector<Router>> _routers;
        std::vector<Router> _entry_routers;
        ankerl::unordered_dense::map<std::string, std::vector<node_index_t>> _triggers;
        std::optional<DependencyResolver> _resolver;
    };

} // namespace bspgraph

#endif  // BSPGRAPH_TYPES_GRAPH_H
