#include <bspgraph/types/channel_registry.h>
#include <bspgraph/util/errors.h>

namespace bspgraph {

    ChannelRegistry::ChannelRegistry(std::vector<ChannelSpec> specs)
        : _specs{std::make_shared<const std::vector<ChannelSpec>>(std::move(specs))} {
        _channels.reserve(_specs->size());
        for (const auto &spec: *_specs) {
            if (!_index.emplace(spec.name, _channels.size()).second) {
                throw GraphValidationError{GraphValidationError::Kind::DUPLICATE_NAME,
                                           fmt::format("channel '{}' is declared more than once", spec.name),
                                           ErrorContext{{}, {}, spec.name}};
            }
            _channels.push_back(spec.create());
        }
    }

    const Channel *ChannelRegistry::find(std::string_view name) const {
        auto it = _index.find(std::string{name});
        return it == _index.end() ? nullptr : &_channels[it->second];
    }

    bool ChannelRegistry::contains(std::string_view name) const { return find(name) != nullptr; }

    Channel &ChannelRegistry::at(std::string_view name) {
        return const_cast<Channel &>(std::as_const(*this).at(name));
    }

    const Channel &ChannelRegistry::at(std::string_view name) const {
        if (auto *c = find(name); c != nullptr) { return *c; }
        throw ChannelError::invalid_operation(std::string{name}, "no channel with this name is registered");
    }

    std::vector<std::string> ChannelRegistry::names() const {
        std::vector<std::string> result;
        result.reserve(_channels.size());
        for (const auto &c: _channels) { result.push_back(c.name()); }
        return result;
    }

    const std::vector<ChannelSpec> &ChannelRegistry::specs() const {
        static const std::vector<ChannelSpec> empty;
        return _specs ? *_specs : empty;
    }

    channel_values_t ChannelRegistry::values() const {
        channel_values_t result;
        for (const auto &c: _channels) {
            if (auto v = c.peek(); v) { result.emplace(c.name(), std::move(*v)); }
        }
        return result;
    }

    channel_values_t ChannelRegistry::values(const std::vector<std::string> &names) const {
        channel_values_t result;
        for (const auto &name: names) {
            auto *c = find(name);
            if (c == nullptr) { continue; }
            if (auto v = c->peek(); v) { result.insert_or_assign(name, std::move(*v)); }
        }
        return result;
    }

    channel_checkpoints_t ChannelRegistry::checkpoint() const {
        channel_checkpoints_t result;
        for (const auto &c: _channels) {
            if (c.is_tracked()) { result.emplace(c.name(), c.checkpoint()); }
        }
        return result;
    }

    void ChannelRegistry::restore(const channel_checkpoints_t &checkpoints) {
        for (const auto &[name, _]: checkpoints) {
            auto *c = find(name);
            if (c == nullptr) {
                throw ChannelError::serialization_error(name, "checkpoint names a channel that is not registered");
            }
            if (!c->is_tracked()) {
                throw ChannelError::serialization_error(name, "checkpoint contains an untracked channel");
            }
        }
        std::vector<Channel> staged;
        staged.reserve(_channels.size());
        for (const auto &spec: specs()) {
            auto channel = spec.create();
            if (auto it = checkpoints.find(spec.name); it != checkpoints.end()) { channel.restore(it->second); }
            staged.push_back(std::move(channel));
        }
        _channels = std::move(staged);
    }

    void ChannelRegistry::reset() {
        std::vector<Channel> fresh;
        fresh.reserve(_channels.size());
        for (const auto &spec: specs()) { fresh.push_back(spec.create()); }
        _channels = std::move(fresh);
    }

    void ChannelRegistry::swap(ChannelRegistry &other) noexcept {
        std::swap(_specs, other._specs);
        std::swap(_channels, other._channels);
        std::swap(_index, other._index);
    }

} // namespace bspgraph
