#include <bspgraph/runtime/dependency_resolver.h>
#include <bspgraph/util/errors.h>

#include <algorithm>
#include <queue>
#include <stdexcept>

namespace bspgraph {

    SuperstepPlan::SuperstepPlan(std::vector<PlannedTask> tasks, std::vector<std::vector<size_t>> dependencies)
        : _tasks{std::move(tasks)}, _dependencies{std::move(dependencies)}, _dependents(_tasks.size()),
          _unresolved(_tasks.size(), 0), _completed(_tasks.size(), false) {
        if (_dependencies.size() != _tasks.size()) {
            throw_error<std::invalid_argument>("SuperstepPlan has {} tasks but {} dependency lists", _tasks.size(),
                                               _dependencies.size());
        }
        for (size_t i = 0; i < _tasks.size(); ++i) {
            for (auto d: _dependencies[i]) {
                if (d >= _tasks.size() || d == i) {
                    throw_error<std::invalid_argument>("Task {} has an invalid dependency {}", i, d);
                }
                _dependents[d].push_back(i);
            }
            _unresolved[i] = _dependencies[i].size();
        }
    }

    std::vector<size_t> SuperstepPlan::initially_ready() const {
        std::vector<size_t> result;
        for (size_t i = 0; i < _tasks.size(); ++i) {
            if (_dependencies[i].empty()) { result.push_back(i); }
        }
        return result;
    }

    std::vector<size_t> SuperstepPlan::complete(size_t index) {
        if (index >= _tasks.size()) { throw_error<std::out_of_range>("No task {} in a plan of {}", index, _tasks.size()); }
        if (_completed[index]) { throw_error<std::logic_error>("Task {} completed twice", index); }
        _completed[index] = true;
        ++_completed_count;
        std::vector<size_t> released;
        for (auto d: _dependents[index]) {
            if (--_unresolved[d] == 0) { released.push_back(d); }
        }
        std::sort(released.begin(), released.end());
        return released;
    }

    DependencyResolver::DependencyResolver(const std::vector<NodeSpec> &nodes, std::vector<edge_t> control_edges)
        : _reach(nodes.size(), std::vector<bool>(nodes.size(), false)) {
        _names.reserve(nodes.size());
        for (const auto &n: nodes) { _names.push_back(n.name); }

        for (const auto &[from, to]: control_edges) {
            if (from >= nodes.size() || to >= nodes.size()) {
                throw_error<std::invalid_argument>("Control edge ({}, {}) refers to a node outside [0, {})", from, to,
                                                   nodes.size());
            }
            if (std::find(_control_edges.begin(), _control_edges.end(), edge_t{from, to}) == _control_edges.end()) {
                _control_edges.emplace_back(from, to);
            }
        }

        if (auto cycle = find_control_cycle(); !cycle.empty()) {
            std::vector<std::string> names;
            for (auto n: cycle) { names.push_back(_names[n]); }
            names.push_back(_names[cycle.front()]);
            throw GraphValidationError{GraphValidationError::Kind::CONTROL_EDGE_CYCLE,
                                       fmt::format("control edges form a cycle: {}", fmt::join(names, " -> ")),
                                       ErrorContext{{}, _names[cycle.front()], {}}};
        }

        for (const auto &[from, to]: _control_edges) { add_edge(from, to); }

        for (node_index_t writer = 0; writer < nodes.size(); ++writer) {
            for (const auto &channel: nodes[writer].writes) {
                for (node_index_t reader = 0; reader < nodes.size(); ++reader) {
                    if (reader == writer || !nodes[reader].declares_read(channel)) { continue; }
                    edge_t edge{writer, reader};
                    if (std::find(_data_edges.begin(), _data_edges.end(), edge) != _data_edges.end() ||
                        std::find(_deferred_edges.begin(), _deferred_edges.end(), edge) != _deferred_edges.end()) {
                        continue;
                    }
                    if (reaches(reader, writer)) {
                        _deferred_edges.push_back(edge);
                        continue;
                    }
                    add_edge(writer, reader);
                    _data_edges.push_back(edge);
                }
            }
        }

        // Kahn's algorithm, lowest declaration index first.
        std::vector<std::vector<node_index_t>> successors(nodes.size());
        std::vector<size_t> in_degree(nodes.size(), 0);
        for (const auto *edges: {&_control_edges, &_data_edges}) {
            for (const auto &[from, to]: *edges) {
                successors[from].push_back(to);
                ++in_degree[to];
            }
        }
        std::priority_queue<node_index_t, std::vector<node_index_t>, std::greater<>> ready;
        for (node_index_t i = 0; i < nodes.size(); ++i) {
            if (in_degree[i] == 0) { ready.push(i); }
        }
        while (!ready.empty()) {
            auto n = ready.top();
            ready.pop();
            _order.push_back(n);
            for (auto s: successors[n]) {
                if (--in_degree[s] == 0) { ready.push(s); }
            }
        }
    }

    bool DependencyResolver::reaches(node_index_t from, node_index_t to) const { return _reach[from][to]; }

    void DependencyResolver::add_edge(node_index_t from, node_index_t to) {
        if (_reach[from][to]) { return; }
        const auto n = _reach.size();
        for (size_t x = 0; x < n; ++x) {
            if (x != from && !_reach[x][from]) { continue; }
            _reach[x][to] = true;
            for (size_t y = 0; y < n; ++y) {
                if (_reach[to][y]) { _reach[x][y] = true; }
            }
        }
    }

    std::vector<node_index_t> DependencyResolver::find_control_cycle() const {
        const auto n = _names.size();
        std::vector<std::vector<node_index_t>> successors(n);
        for (const auto &[from, to]: _control_edges) { successors[from].push_back(to); }

        enum class Mark { UNVISITED, ACTIVE, DONE };
        std::vector<Mark> marks(n, Mark::UNVISITED);
        std::vector<node_index_t> path;

        // Iterative depth first search, the active path is kept to report the cycle.
        for (node_index_t root = 0; root < n; ++root) {
            if (marks[root] != Mark::UNVISITED) { continue; }
            std::vector<std::pair<node_index_t, size_t>> stack{{root, 0}};
            marks[root] = Mark::ACTIVE;
            path.push_back(root);
            while (!stack.empty()) {
                auto &[node, next_child] = stack.back();
                if (next_child == successors[node].size()) {
                    marks[node] = Mark::DONE;
                    path.pop_back();
                    stack.pop_back();
                    continue;
                }
                auto child = successors[node][next_child++];
                if (marks[child] == Mark::ACTIVE) {
                    auto start = std::find(path.begin(), path.end(), child);
                    return {start, path.end()};
                }
                if (marks[child] == Mark::UNVISITED) {
                    marks[child] = Mark::ACTIVE;
                    path.push_back(child);
                    stack.emplace_back(child, 0);
                }
            }
        }
        return {};
    }

    SuperstepPlan DependencyResolver::plan(std::vector<PlannedTask> tasks) const {
        std::vector<std::vector<size_t>> dependencies(tasks.size());
        for (size_t i = 0; i < tasks.size(); ++i) {
            if (tasks[i].node >= _names.size()) {
                throw_error<std::invalid_argument>("Planned task refers to unknown node index {}", tasks[i].node);
            }
            for (size_t j = 0; j < tasks.size(); ++j) {
                if (tasks[j].node == tasks[i].node) { continue; }
                if (reaches(tasks[j].node, tasks[i].node)) { dependencies[i].push_back(j); }
            }
        }
        return SuperstepPlan{std::move(tasks), std::move(dependencies)};
    }

} // namespace bspgraph
