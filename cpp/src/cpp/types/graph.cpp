#include <bspgraph/types/graph.h>
#include <bspgraph/util/errors.h>

#include <algorithm>
#include <stdexcept>

namespace bspgraph {

    StateGraph &StateGraph::add_channel(ChannelSpec spec) {
        _channels.push_back(std::move(spec));
        return *this;
    }

    StateGraph &StateGraph::add_node(NodeSpec spec) {
        if (!spec.fn) { throw_error<std::invalid_argument>("Node '{}' has no compute function", spec.name); }
        _nodes.push_back(std::move(spec));
        return *this;
    }

    StateGraph &StateGraph::add_edge(std::string from, std::string to) {
        _edges.emplace_back(std::move(from), std::move(to));
        return *this;
    }

    StateGraph &StateGraph::add_conditional_edges(std::string source, router_fn_t router,
                                                  std::vector<std::string> allowed_targets) {
        if (!router) { throw_error<std::invalid_argument>("Conditional edges from '{}' have no router", source); }
        _conditional_edges.push_back(ConditionalEdge{std::move(source), std::move(router), std::move(allowed_targets)});
        return *this;
    }

    StateGraph &StateGraph::set_entry_point(std::string node) { return add_edge(START, std::move(node)); }

    StateGraph &StateGraph::set_finish_point(std::string node) { return add_edge(std::move(node), END); }

    compiled_graph_s_ptr StateGraph::compile() const { return std::make_shared<const CompiledGraph>(*this); }

    namespace {
        [[noreturn]] void invalid(GraphValidationError::Kind kind, std::string message, ErrorContext context = {}) {
            throw GraphValidationError{kind, std::move(message), std::move(context)};
        }
    } // namespace

    CompiledGraph::CompiledGraph(const StateGraph &graph) : _channels{graph.channels()}, _nodes{graph.nodes()} {
        using Kind = GraphValidationError::Kind;

        ankerl::unordered_dense::set<std::string> channel_names;
        for (const auto &c: _channels) {
            if (!channel_names.insert(c.name).second) {
                invalid(Kind::DUPLICATE_NAME, fmt::format("channel '{}' is declared more than once", c.name),
                        ErrorContext{{}, {}, c.name});
            }
        }

        for (node_index_t i = 0; i < _nodes.size(); ++i) {
            const auto &n = _nodes[i];
            if (n.name.empty() || n.name == START || n.name == END) {
                invalid(Kind::INVALID_EDGE, fmt::format("'{}' is not a valid node name", n.name));
            }
            if (!_node_index.emplace(n.name, i).second) {
                invalid(Kind::DUPLICATE_NAME, fmt::format("node '{}' is declared more than once", n.name),
                        ErrorContext{{}, n.name, {}});
            }
            for (const auto *declared: {&n.reads, &n.writes, &n.triggers}) {
                for (const auto &channel: *declared) {
                    if (!channel_names.contains(channel)) {
                        invalid(Kind::UNKNOWN_CHANNEL, "node refers to an undeclared channel",
                                ErrorContext{{}, n.name, channel});
                    }
                }
            }
            for (const auto &channel: n.triggers) { _triggers[channel].push_back(i); }
        }

        _successors.resize(_nodes.size());
        _routers.resize(_nodes.size());
        std::vector<edge_t> control_edges;

        auto lookup = [this](const std::string &name, const char *role) {
            if (auto index = find_node(name); index) { return *index; }
            invalid(Kind::UNKNOWN_NODE, fmt::format("edge {} '{}' is not a node", role, name),
                    ErrorContext{{}, name, {}});
        };

        for (const auto &[from, to]: graph.edges()) {
            if (to == START) { invalid(Kind::INVALID_EDGE, fmt::format("edge '{}' -> START is not allowed", from)); }
            if (from == END) { invalid(Kind::INVALID_EDGE, fmt::format("edge END -> '{}' is not allowed", to)); }
            if (from == START) {
                if (to == END) { invalid(Kind::INVALID_EDGE, "edge START -> END is not allowed"); }
                auto target = lookup(to, "target");
                if (std::find(_entry_nodes.begin(), _entry_nodes.end(), target) == _entry_nodes.end()) {
                    _entry_nodes.push_back(target);
                }
                continue;
            }
            auto source = lookup(from, "source");
            if (to == END) { continue; }
            auto target = lookup(to, "target");
            if (std::find(_successors[source].begin(), _successors[source].end(), target) == _successors[source].end()) {
                _successors[source].push_back(target);
            }
            control_edges.emplace_back(source, target);
        }

        for (const auto &edge: graph.conditional_edges()) {
            for (const auto &target: edge.allowed_targets) {
                if (target == START) { invalid(Kind::INVALID_EDGE, "a router may not target START"); }
                if (target != END) { (void)lookup(target, "target"); }
            }
            Router router{edge.router, edge.allowed_targets};
            if (edge.source == START) {
                _entry_routers.push_back(std::move(router));
                continue;
            }
            if (edge.source == END) { invalid(Kind::INVALID_EDGE, "conditional edges cannot leave END"); }
            _routers[lookup(edge.source, "source")].push_back(std::move(router));
        }

        if (_entry_nodes.empty() && _entry_routers.empty()) {
            invalid(Kind::INVALID_EDGE, "graph has no entry point, add an edge from START");
        }

        for (const auto &c: _channels) {
            auto writing = writers(c.name);
            if (writing.size() > 1 && !c.create().accepts_multiple_writers()) {
                std::vector<std::string> names;
                for (auto w: writing) { names.push_back(_nodes[w].name); }
                invalid(Kind::DUPLICATE_WRITER,
                        fmt::format("channel accepts a single writer but is written by [{}]", fmt::join(names, ", ")),
                        ErrorContext{{}, {}, c.name});
            }
        }

        _resolver.emplace(_nodes, std::move(control_edges));
    }

    std::optional<node_index_t> CompiledGraph::find_node(std::string_view name) const {
        auto it = _node_index.find(std::string{name});
        if (it == _node_index.end()) { return std::nullopt; }
        return it->second;
    }

    node_index_t CompiledGraph::node_index(std::string_view name) const {
        if (auto index = find_node(name); index) { return *index; }
        throw GraphValidationError{GraphValidationError::Kind::UNKNOWN_NODE, "no node with this name",
                                   ErrorContext{{}, std::string{name}, {}}};
    }

    const std::vector<node_index_t> &CompiledGraph::triggered_by(std::string_view channel) const {
        static const std::vector<node_index_t> none;
        auto it = _triggers.find(std::string{channel});
        return it == _triggers.end() ? none : it->second;
    }

    std::vector<node_index_t> CompiledGraph::writers(std::string_view channel) const {
        std::vector<node_index_t> result;
        for (node_index_t i = 0; i < _nodes.size(); ++i) {
            if (_nodes[i].declares_write(channel)) { result.push_back(i); }
        }
        return result;
    }

} // namespace bspgraph
