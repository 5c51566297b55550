#include <bspgraph/types/channel.h>
#include <bspgraph/util/errors.h>

#include <algorithm>
#include <stdexcept>

namespace bspgraph {

    std::string_view to_string(ChannelKind kind) {
        switch (kind) {
            case ChannelKind::LAST_VALUE: return "last_value";
            case ChannelKind::BINARY_OPERATOR: return "binary_operator";
            case ChannelKind::TOPIC: return "topic";
            case ChannelKind::EPHEMERAL_VALUE: return "ephemeral_value";
            case ChannelKind::ANY_VALUE: return "any_value";
            case ChannelKind::UNTRACKED_VALUE: return "untracked_value";
            case ChannelKind::NAMED_BARRIER_VALUE: return "named_barrier_value";
            case ChannelKind::DYNAMIC_BARRIER_VALUE: return "dynamic_barrier_value";
        }
        return "unknown";
    }

    namespace {
        // Checkpoint helpers, the variant tag is added by Channel::checkpoint.
        Value single_value_checkpoint(const std::optional<Value> &value) {
            Value::map_t result;
            if (value) { result.emplace("value", *value); }
            return Value{std::move(result)};
        }

        std::optional<Value> single_value_restore(const Value &checkpoint) {
            if (auto *v = checkpoint.find("value"); v != nullptr) { return *v; }
            return std::nullopt;
        }

        Value names_to_value(const std::set<std::string> &names) {
            Value::list_t result;
            result.reserve(names.size());
            for (const auto &n: names) { result.emplace_back(n); }
            return Value{std::move(result)};
        }

        std::set<std::string> names_from_value(const Value &value) {
            std::set<std::string> result;
            for (const auto &item: value.as_list()) { result.insert(item.as_string()); }
            return result;
        }

        const std::string &participant_name(const std::string &channel, const Value &value) {
            if (!value.is_string()) {
                throw ChannelError::invalid_update(
                    channel, fmt::format("barrier updates must be participant names, got {}", value));
            }
            return value.as_string();
        }
    } // namespace

    namespace channels {
        bool LastValue::update(const std::string &name, const std::vector<Value> &values) {
            if (values.empty()) { return false; }
            if (expected_kind) {
                for (const auto &v: values) {
                    if (v.kind() != *expected_kind) {
                        throw ChannelError::invalid_update(
                            name, fmt::format("expected a {} value, got {} ({})", *expected_kind, v.kind(), v));
                    }
                }
            }
            value = values.back();
            return true;
        }

        Value LastValue::checkpoint() const { return single_value_checkpoint(value); }

        void LastValue::restore(const std::string &, const Value &checkpoint) {
            value = single_value_restore(checkpoint);
        }

        bool BinaryOperator::update(const std::string &, const std::vector<Value> &values) {
            if (values.empty()) { return false; }
            auto acc = value;
            for (const auto &v: values) { acc = acc ? reducer(*acc, v) : v; }
            value = std::move(acc);
            return true;
        }

        Value BinaryOperator::checkpoint() const { return single_value_checkpoint(value); }

        void BinaryOperator::restore(const std::string &, const Value &checkpoint) {
            value = single_value_restore(checkpoint);
        }

        bool Topic::is_live(const TopicMessage &message, engine_time_t now) const {
            return !config.ttl || now - message.published_at <= *config.ttl;
        }

        std::optional<Value> Topic::peek() const {
            auto now = engine_now();
            Value::list_t result;
            for (const auto &m: messages) {
                if (is_live(m, now)) { result.push_back(m.value); }
            }
            if (result.empty()) { return std::nullopt; }
            return Value{std::move(result)};
        }

        bool Topic::expire(engine_time_t now) {
            if (!config.ttl) { return false; }
            auto before = messages.size();
            // Messages are in publication order, so expired ones are always at the front.
            while (!messages.empty() && !is_live(messages.front(), now)) { messages.pop_front(); }
            return messages.size() != before;
        }

        bool Topic::update(const std::string &, const std::vector<Value> &values) {
            bool changed{false};
            if (!config.accumulate && !messages.empty()) {
                messages.clear();
                changed = true;
            }
            auto now = engine_now();
            changed = expire(now) || changed;
            for (const auto &v: values) {
                messages.push_back(TopicMessage{v, next_sequence++, now});
                changed = true;
            }
            if (config.max_size > 0) {
                while (messages.size() > config.max_size) { messages.pop_front(); }
            }
            return changed;
        }

        Value Topic::checkpoint() const {
            Value::list_t msgs;
            for (const auto &m: messages) {
                msgs.push_back(Value::map({
                    {"value", m.value},
                    {"sequence", static_cast<int64_t>(m.sequence)},
                    {"published_at", to_micros(m.published_at)},
                }));
            }
            Value::map_t subs;
            for (const auto &[subscriber, cursor]: cursors) { subs.emplace(subscriber, static_cast<int64_t>(cursor)); }
            return Value::map({
                {"messages", Value{std::move(msgs)}},
                {"next_sequence", static_cast<int64_t>(next_sequence)},
                {"cursors", Value{std::move(subs)}},
            });
        }

        void Topic::restore(const std::string &, const Value &checkpoint) {
            std::deque<TopicMessage> restored;
            for (const auto &m: checkpoint.at("messages").as_list()) {
                restored.push_back(TopicMessage{m.at("value"), static_cast<uint64_t>(m.at("sequence").as_int()),
                                                from_micros(m.at("published_at").as_int())});
            }
            std::map<std::string, uint64_t> restored_cursors;
            for (const auto &[subscriber, cursor]: checkpoint.at("cursors").as_map()) {
                restored_cursors.emplace(subscriber, static_cast<uint64_t>(cursor.as_int()));
            }
            next_sequence = static_cast<uint64_t>(checkpoint.at("next_sequence").as_int());
            messages = std::move(restored);
            cursors = std::move(restored_cursors);
        }

        void Topic::subscribe(const std::string &subscriber) { cursors.try_emplace(subscriber, next_sequence); }

        std::vector<TopicMessage> Topic::poll(const std::string &name, const std::string &subscriber,
                                              size_t max_messages) {
            auto it = cursors.find(subscriber);
            if (it == cursors.end()) {
                throw ChannelError::invalid_operation(name, fmt::format("'{}' is not subscribed", subscriber));
            }
            auto now = engine_now();
            expire(now);
            std::vector<TopicMessage> result;
            for (const auto &m: messages) {
                if (m.sequence < it->second) { continue; }
                if (max_messages > 0 && result.size() >= max_messages) { break; }
                result.push_back(m);
            }
            if (config.delivery == DeliveryMode::AT_MOST_ONCE && !result.empty()) {
                it->second = result.back().sequence + 1;
            }
            return result;
        }

        void Topic::ack(const std::string &name, const std::string &subscriber, uint64_t sequence) {
            auto it = cursors.find(subscriber);
            if (it == cursors.end()) {
                throw ChannelError::invalid_operation(name, fmt::format("'{}' is not subscribed", subscriber));
            }
            if (sequence >= next_sequence) {
                throw ChannelError::invalid_operation(
                    name, fmt::format("cannot ack sequence {} which was never published", sequence));
            }
            it->second = std::max(it->second, sequence + 1);
        }

        bool Topic::unsubscribe(const std::string &subscriber) { return cursors.erase(subscriber) > 0; }

        bool EphemeralValue::update(const std::string &name, const std::vector<Value> &values) {
            if (values.empty()) {
                if (!value) { return false; }
                value.reset();
                return true;
            }
            if (guard && values.size() > 1) {
                throw ChannelError::invalid_update(
                    name, fmt::format("ephemeral channel received {} values in one superstep", values.size()));
            }
            value = values.back();
            return true;
        }

        Value EphemeralValue::checkpoint() const { return single_value_checkpoint(value); }

        void EphemeralValue::restore(const std::string &, const Value &checkpoint) {
            value = single_value_restore(checkpoint);
        }

        bool AnyValue::update(const std::string &, const std::vector<Value> &values) {
            if (values.empty()) { return false; }
            value = values.back();
            return true;
        }

        Value AnyValue::checkpoint() const { return single_value_checkpoint(value); }

        void AnyValue::restore(const std::string &, const Value &checkpoint) { value = single_value_restore(checkpoint); }

        bool UntrackedValue::update(const std::string &, const std::vector<Value> &values) {
            if (values.empty()) { return false; }
            value = values.back();
            return true;
        }

        Value UntrackedValue::checkpoint() const { return single_value_checkpoint(value); }

        void UntrackedValue::restore(const std::string &, const Value &checkpoint) {
            value = single_value_restore(checkpoint);
        }

        std::optional<Value> NamedBarrierValue::peek() const {
            if (satisfied()) { return Value{true}; }
            return std::nullopt;
        }

        bool NamedBarrierValue::update(const std::string &name, const std::vector<Value> &values) {
            bool changed{false};
            for (const auto &v: values) {
                const auto &participant = participant_name(name, v);
                if (!participants.contains(participant)) {
                    throw ChannelError::invalid_update(
                        name, fmt::format("'{}' is not a participant of this barrier", participant));
                }
                changed = arrived.insert(participant).second || changed;
            }
            return changed;
        }

        Value NamedBarrierValue::checkpoint() const { return Value::map({{"arrived", names_to_value(arrived)}}); }

        void NamedBarrierValue::restore(const std::string &name, const Value &checkpoint) {
            auto restored = names_from_value(checkpoint.at("arrived"));
            for (const auto &p: restored) {
                if (!participants.contains(p)) {
                    throw ChannelError::serialization_error(
                        name, fmt::format("checkpoint names unknown participant '{}'", p));
                }
            }
            arrived = std::move(restored);
        }

        bool NamedBarrierValue::satisfied() const { return arrived.size() == participants.size(); }

        // arrived is a subset of participants, update and restore both reject anyone else.
        size_t NamedBarrierValue::remaining() const { return participants.size() - arrived.size(); }

        std::optional<Value> DynamicBarrierValue::peek() const {
            if (satisfied()) { return Value{true}; }
            return std::nullopt;
        }

        bool DynamicBarrierValue::update(const std::string &name, const std::vector<Value> &values) {
            bool changed{false};
            for (const auto &v: values) {
                if (auto *count = v.find("participants"); count != nullptr) {
                    if (!count->is_int() || count->as_int() < 0) {
                        throw ChannelError::invalid_update(
                            name, fmt::format("participant count must be a non-negative integer, got {}", *count));
                    }
                    participants = static_cast<size_t>(count->as_int());
                    arrived.clear();
                    changed = true;
                    continue;
                }
                const auto &participant = participant_name(name, v);
                if (!participants) {
                    throw ChannelError::invalid_update(
                        name, fmt::format("'{}' arrived before the participant count was set", participant));
                }
                if (arrived.contains(participant)) { continue; }
                if (arrived.size() >= *participants) {
                    throw ChannelError::invalid_update(
                        name, fmt::format("barrier is full, '{}' exceeds {} participants", participant,
                                          *participants));
                }
                arrived.insert(participant);
                changed = true;
            }
            return changed;
        }

        Value DynamicBarrierValue::checkpoint() const {
            Value::map_t result;
            if (participants) { result.emplace("participants", static_cast<int64_t>(*participants)); }
            result.emplace("arrived", names_to_value(arrived));
            return Value{std::move(result)};
        }

        void DynamicBarrierValue::restore(const std::string &name, const Value &checkpoint) {
            std::optional<size_t> restored_count;
            if (auto *count = checkpoint.find("participants"); count != nullptr) {
                if (!count->is_int() || count->as_int() < 0) {
                    throw ChannelError::serialization_error(
                        name, fmt::format("participant count must be a non-negative integer, got {}", *count));
                }
                restored_count = static_cast<size_t>(count->as_int());
            }
            auto restored = names_from_value(checkpoint.at("arrived"));
            if (!restored.empty() && !restored_count) {
                throw ChannelError::serialization_error(name, "checkpoint has arrivals but no participant count");
            }
            if (restored_count && restored.size() > *restored_count) {
                throw ChannelError::serialization_error(
                    name, fmt::format("checkpoint has {} arrivals for {} participants", restored.size(),
                                      *restored_count));
            }
            arrived = std::move(restored);
            participants = restored_count;
        }

        bool DynamicBarrierValue::satisfied() const { return participants && arrived.size() >= *participants; }

        size_t DynamicBarrierValue::remaining() const {
            if (!participants || arrived.size() >= *participants) { return 0; }
            return *participants - arrived.size();
        }
    } // namespace channels

    Channel::Channel(std::string name, state_t state) : _name{std::move(name)}, _state{std::move(state)} {
        if (_name.empty()) { throw_error<std::invalid_argument>("Channel name must not be empty"); }
        if (_name == START || _name == END) {
            throw_error<std::invalid_argument>("'{}' is a reserved name and cannot be used for a channel", _name);
        }
    }

    template<typename T>
    T &Channel::expect_variant(std::string_view operation) {
        if (auto *s = std::get_if<T>(&_state); s != nullptr) { return *s; }
        throw ChannelError::invalid_operation(
            _name, fmt::format("{} is not supported by a {} channel", operation, kind()));
    }

    template<typename T>
    const T &Channel::expect_variant(std::string_view operation) const {
        if (auto *s = std::get_if<T>(&_state); s != nullptr) { return *s; }
        throw ChannelError::invalid_operation(
            _name, fmt::format("{} is not supported by a {} channel", operation, kind()));
    }

    std::optional<Value> Channel::peek() const {
        return std::visit([](const auto &s) { return s.peek(); }, _state);
    }

    Value Channel::get() const {
        if (auto v = peek(); v) { return std::move(*v); }
        switch (kind()) {
            case ChannelKind::NAMED_BARRIER_VALUE:
                throw ChannelError{ChannelError::Kind::EMPTY_CHANNEL,
                                   fmt::format("barrier not satisfied, {} participant(s) outstanding",
                                               std::get<channels::NamedBarrierValue>(_state).remaining()),
                                   ErrorContext{{}, {}, _name}};
            case ChannelKind::DYNAMIC_BARRIER_VALUE: {
                const auto &s = std::get<channels::DynamicBarrierValue>(_state);
                auto reason = s.participants
                                  ? fmt::format("barrier not satisfied, {} participant(s) outstanding", s.remaining())
                                  : std::string{"barrier participant count has not been set"};
                throw ChannelError{ChannelError::Kind::EMPTY_CHANNEL, std::move(reason), ErrorContext{{}, {}, _name}};
            }
            default:
                throw ChannelError::empty_channel(_name);
        }
    }

    bool Channel::update(const std::vector<Value> &values) {
        return std::visit([&](auto &s) { return s.update(_name, values); }, _state);
    }

    Value Channel::checkpoint() const {
        auto result = std::visit([](const auto &s) { return s.checkpoint(); }, _state);
        result.as_map().insert_or_assign("kind", Value{to_string(kind())});
        return result;
    }

    void Channel::restore(const Value &checkpoint) {
        auto *tag = checkpoint.find("kind");
        if (tag == nullptr || !tag->is_string()) {
            throw ChannelError::serialization_error(_name, fmt::format("checkpoint has no kind tag: {}", checkpoint));
        }
        if (tag->as_string() != to_string(kind())) {
            throw ChannelError::serialization_error(
                _name, fmt::format("cannot restore a {} checkpoint into a {} channel", tag->as_string(), kind()));
        }
        // Restore into a copy so a malformed checkpoint leaves this channel untouched.
        auto staged = _state;
        try {
            std::visit([&](auto &s) { s.restore(_name, checkpoint); }, staged);
        } catch (const ChannelError &) {
            throw;
        } catch (const std::exception &e) {
            throw ChannelError::serialization_error(_name, fmt::format("malformed checkpoint: {}", e.what()));
        }
        _state = std::move(staged);
    }

    bool Channel::consume() {
        return std::visit(
            [](auto &s) -> bool {
                using T = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<T, channels::EphemeralValue>) {
                    if (!s.value) { return false; }
                    s.value.reset();
                    return true;
                } else if constexpr (std::is_same_v<T, channels::NamedBarrierValue> ||
                                     std::is_same_v<T, channels::DynamicBarrierValue>) {
                    if (!s.reset_on_satisfy || !s.satisfied()) { return false; }
                    s.arrived.clear();
                    return true;
                } else {
                    return false;
                }
            },
            _state);
    }

    bool Channel::finish() {
        if (auto *s = std::get_if<channels::EphemeralValue>(&_state); s != nullptr && s->value) {
            s->value.reset();
            return true;
        }
        return false;
    }

    bool Channel::accepts_multiple_writers() const {
        switch (kind()) {
            case ChannelKind::BINARY_OPERATOR:
            case ChannelKind::TOPIC:
            case ChannelKind::ANY_VALUE:
            case ChannelKind::NAMED_BARRIER_VALUE:
            case ChannelKind::DYNAMIC_BARRIER_VALUE: return true;
            default: return false;
        }
    }

    void Channel::subscribe(const std::string &subscriber) { expect_variant<channels::Topic>("subscribe").subscribe(subscriber); }

    std::vector<TopicMessage> Channel::poll(const std::string &subscriber, size_t max_messages) {
        return expect_variant<channels::Topic>("poll").poll(_name, subscriber, max_messages);
    }

    void Channel::ack(const std::string &subscriber, uint64_t sequence) {
        expect_variant<channels::Topic>("ack").ack(_name, subscriber, sequence);
    }

    bool Channel::unsubscribe(const std::string &subscriber) {
        return expect_variant<channels::Topic>("unsubscribe").unsubscribe(subscriber);
    }

    bool Channel::barrier_satisfied() const {
        if (auto *s = std::get_if<channels::NamedBarrierValue>(&_state); s != nullptr) { return s->satisfied(); }
        return expect_variant<channels::DynamicBarrierValue>("barrier_satisfied").satisfied();
    }

    size_t Channel::remaining_participants() const {
        if (auto *s = std::get_if<channels::NamedBarrierValue>(&_state); s != nullptr) { return s->remaining(); }
        const auto &dynamic = expect_variant<channels::DynamicBarrierValue>("remaining_participants");
        if (!dynamic.participants) {
            throw ChannelError::invalid_operation(_name, "participant count has not been set");
        }
        return dynamic.remaining();
    }

    void Channel::set_participants(size_t count) {
        auto &s = expect_variant<channels::DynamicBarrierValue>("set_participants");
        s.participants = count;
        s.arrived.clear();
    }

    ChannelSpec ChannelSpec::last_value(std::string name, std::optional<ValueKind> expected_kind) {
        return ChannelSpec{std::move(name), channels::LastValue{expected_kind}};
    }

    ChannelSpec ChannelSpec::last_value_with_default(std::string name, Value default_value) {
        return ChannelSpec{std::move(name), channels::LastValue{std::nullopt, std::move(default_value)}};
    }

    ChannelSpec ChannelSpec::binary_operator(std::string name, Reducer reducer, std::optional<Value> seed) {
        auto value = seed;
        return ChannelSpec{std::move(name), channels::BinaryOperator{std::move(reducer), std::move(seed), std::move(value)}};
    }

    ChannelSpec ChannelSpec::topic(std::string name, TopicConfig config) {
        return ChannelSpec{std::move(name), channels::Topic{config}};
    }

    ChannelSpec ChannelSpec::ephemeral(std::string name, bool guard) {
        return ChannelSpec{std::move(name), channels::EphemeralValue{guard}};
    }

    ChannelSpec ChannelSpec::any_value(std::string name) { return ChannelSpec{std::move(name), channels::AnyValue{}}; }

    ChannelSpec ChannelSpec::untracked(std::string name) {
        return ChannelSpec{std::move(name), channels::UntrackedValue{}};
    }

    ChannelSpec ChannelSpec::named_barrier(std::string name, std::set<std::string> participants, bool reset_on_satisfy) {
        if (participants.empty()) {
            throw_error<std::invalid_argument>("Named barrier '{}' needs at least one participant", name);
        }
        return ChannelSpec{std::move(name), channels::NamedBarrierValue{std::move(participants), reset_on_satisfy}};
    }

    ChannelSpec ChannelSpec::dynamic_barrier(std::string name, bool reset_on_satisfy) {
        return ChannelSpec{std::move(name), channels::DynamicBarrierValue{reset_on_satisfy}};
    }

} // namespace bspgraph
