#include <bspgraph/types/node.h>
#include <bspgraph/util/errors.h>

#include <algorithm>

namespace bspgraph {

    NodeOutput &NodeOutput::write(std::string channel, Value value) {
        writes.emplace_back(std::move(channel), std::move(value));
        return *this;
    }

    NodeOutput &NodeOutput::goto_node(std::string node) {
        next.push_back(std::move(node));
        return *this;
    }

    NodeOutput &NodeOutput::send(std::string node, Value arg) {
        sends.push_back(Send{std::move(node), std::move(arg)});
        return *this;
    }

    bool NodeSpec::declares_read(std::string_view channel) const {
        return std::find(reads.begin(), reads.end(), channel) != reads.end();
    }

    bool NodeSpec::declares_write(std::string_view channel) const {
        return std::find(writes.begin(), writes.end(), channel) != writes.end();
    }

    NodeContext::NodeContext(const NodeSpec &node, superstep_t superstep, channel_values_t snapshot,
                             std::optional<Value> arg, CancellationToken cancellation, AdmissionPermit *permit)
        : _node{node}, _superstep{superstep}, _snapshot{std::move(snapshot)}, _arg{std::move(arg)},
          _cancellation{std::move(cancellation)}, _permit{permit} {
    }

    const Value &NodeContext::read(std::string_view channel) const {
        if (!_node.declares_read(channel)) {
            throw ChannelError{ChannelError::Kind::INVALID_OPERATION, "channel is not a declared read of the node",
                               ErrorContext{_superstep, _node.name, std::string{channel}}};
        }
        if (auto it = _snapshot.find(channel); it != _snapshot.end()) { return it->second; }
        throw ChannelError{ChannelError::Kind::EMPTY_CHANNEL, "channel has no value",
                           ErrorContext{_superstep, _node.name, std::string{channel}}};
    }

    std::optional<Value> NodeContext::read_optional(std::string_view channel) const {
        if (!_node.declares_read(channel)) {
            throw ChannelError{ChannelError::Kind::INVALID_OPERATION, "channel is not a declared read of the node",
                               ErrorContext{_superstep, _node.name, std::string{channel}}};
        }
        if (auto it = _snapshot.find(channel); it != _snapshot.end()) { return it->second; }
        return std::nullopt;
    }

} // namespace bspgraph
