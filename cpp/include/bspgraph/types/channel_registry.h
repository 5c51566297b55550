#ifndef BSPGRAPH_TYPES_CHANNEL_REGISTRY_H
#define BSPGRAPH_TYPES_CHANNEL_REGISTRY_H

#include <bspgraph/types/channel.h>

#include <ankerl/unordered_dense.h>

#include <memory>
#include <string>
#include <vector>

namespace bspgraph {

    // Channel name to value, the read-only view handed to node compute units and routers.
    using channel_values_t = Value::map_t;

    // Channel name to Channel::checkpoint(), the payload given to the Checkpointer.
    using channel_checkpoints_t = Value::map_t;

    /**
     * The channels of one compiled graph, addressed by unique name and kept in declaration order. The registry is a
     * value type: the coordinator stages a write phase on a copy and commits it with swap, so a failure part way
     * through a write phase never leaves the committed registry partially updated.
     */
    struct BSPGRAPH_EXPORT ChannelRegistry {
        using specs_s_ptr = std::shared_ptr<const std::vector<ChannelSpec>>;

        ChannelRegistry() = default;

        // Raises GraphValidationError(DUPLICATE_NAME) when two specs share a name.
        explicit ChannelRegistry(std::vector<ChannelSpec> specs);

        [[nodiscard]] size_t size() const { return _channels.size(); }

        [[nodiscard]] bool contains(std::string_view name) const;

        // Raises ChannelError(INVALID_OPERATION) for an unknown name.
        [[nodiscard]] Channel &at(std::string_view name);

        [[nodiscard]] const Channel &at(std::string_view name) const;

        [[nodiscard]] std::vector<std::string> names() const;

        [[nodiscard]] const std::vector<ChannelSpec> &specs() const;

        // Values of every channel that currently holds one.
        [[nodiscard]] channel_values_t values() const;

        // Values of the named channels that currently hold one. Unknown names are skipped.
        [[nodiscard]] channel_values_t values(const std::vector<std::string> &names) const;

        // Checkpoints of the tracked channels.
        [[nodiscard]] channel_checkpoints_t checkpoint() const;

        /**
         * Restores every tracked channel found in the map; channels absent from it, and untracked channels, are reset
         * to their initial state. Either every channel is restored or, on error, none is.
         */
        void restore(const channel_checkpoints_t &checkpoints);

        // Every channel back to its initial state.
        void reset();

        void swap(ChannelRegistry &other) noexcept;

        [[nodiscard]] auto begin() { return _channels.begin(); }
        [[nodiscard]] auto end() { return _channels.end(); }
        [[nodiscard]] auto begin() const { return _channels.begin(); }
        [[nodiscard]] auto end() const { return _channels.end(); }

    private:
        [[nodiscard]] const Channel *find(std::string_view name) const;

        specs_s_ptr _specs;
        std::vector<Channel> _channels;
        ankerl::unordered_dense::map<std::string, size_t> _index;
    };

} // namespace bspgraph

#endif  // BSPGRAPH_TYPES_CHANNEL_REGISTRY_H
