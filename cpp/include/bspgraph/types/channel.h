#ifndef BSPGRAPH_TYPES_CHANNEL_H
#define BSPGRAPH_TYPES_CHANNEL_H

#include <bspgraph/types/reducer.h>
#include <bspgraph/types/value.h>

#include <deque>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace bspgraph {

    enum class ChannelKind {
        LAST_VALUE = 0,
        BINARY_OPERATOR = 1,
        TOPIC = 2,
        EPHEMERAL_VALUE = 3,
        ANY_VALUE = 4,
        UNTRACKED_VALUE = 5,
        NAMED_BARRIER_VALUE = 6,
        DYNAMIC_BARRIER_VALUE = 7,
    };

    [[nodiscard]] BSPGRAPH_EXPORT std::string_view to_string(ChannelKind kind);

    enum class DeliveryMode {
        // poll advances the subscriber cursor, nothing is redelivered.
        AT_MOST_ONCE = 0,
        // poll redelivers until the subscriber acks.
        AT_LEAST_ONCE = 1,
    };

    struct TopicConfig {
        // 0 means unbounded, otherwise the oldest messages are dropped to make room.
        size_t max_size{0};
        std::optional<engine_time_delta_t> ttl{};
        DeliveryMode delivery{DeliveryMode::AT_LEAST_ONCE};
        // When false the queue is cleared at the start of every write phase.
        bool accumulate{true};
    };

    struct TopicMessage {
        Value value;
        uint64_t sequence;
        engine_time_t published_at;

        friend bool operator==(const TopicMessage &, const TopicMessage &) = default;
    };

    /*
     * The channel variants. Each one carries its configuration together with its state and implements the
     * primitive operations, Channel dispatches to them. The name is passed in so errors can report it.
     */
    namespace channels {
        struct LastValue {
            std::optional<ValueKind> expected_kind{};
            std::optional<Value> value{};

            [[nodiscard]] std::optional<Value> peek() const { return value; }

            bool update(const std::string &name, const std::vector<Value> &values);

            [[nodiscard]] Value checkpoint() const;

            void restore(const std::string &name, const Value &checkpoint);
        };

        struct BinaryOperator {
            Reducer reducer;
            std::optional<Value> seed{};
            std::optional<Value> value{};

            [[nodiscard]] std::optional<Value> peek() const { return value; }

            bool update(const std::string &name, const std::vector<Value> &values);

            [[nodiscard]] Value checkpoint() const;

            void restore(const std::string &name, const Value &checkpoint);
        };

        struct Topic {
            TopicConfig config{};
            std::deque<TopicMessage> messages{};
            uint64_t next_sequence{0};
            // Subscriber name to the first sequence number not yet consumed.
            std::map<std::string, uint64_t> cursors{};

            [[nodiscard]] std::optional<Value> peek() const;

            bool update(const std::string &name, const std::vector<Value> &values);

            [[nodiscard]] Value checkpoint() const;

            void restore(const std::string &name, const Value &checkpoint);

            void subscribe(const std::string &subscriber);

            [[nodiscard]] std::vector<TopicMessage> poll(const std::string &name, const std::string &subscriber,
                                                         size_t max_messages);

            void ack(const std::string &name, const std::string &subscriber, uint64_t sequence);

            bool unsubscribe(const std::string &subscriber);

            // Drops expired messages, returns true when any were removed.
            bool expire(engine_time_t now);

        private:
            [[nodiscard]] bool is_live(const TopicMessage &message, engine_time_t now) const;
        };

        struct EphemeralValue {
            bool guard{true};
            std::optional<Value> value{};

            [[nodiscard]] std::optional<Value> peek() const { return value; }

            bool update(const std::string &name, const std::vector<Value> &values);

            [[nodiscard]] Value checkpoint() const;

            void restore(const std::string &name, const Value &checkpoint);
        };

        struct AnyValue {
            std::optional<Value> value{};

            [[nodiscard]] std::optional<Value> peek() const { return value; }

            bool update(const std::string &name, const std::vector<Value> &values);

            [[nodiscard]] Value checkpoint() const;

            void restore(const std::string &name, const Value &checkpoint);
        };

        struct UntrackedValue {
            std::optional<Value> value{};

            [[nodiscard]] std::optional<Value> peek() const { return value; }

            bool update(const std::string &name, const std::vector<Value> &values);

            [[nodiscard]] Value checkpoint() const;

            void restore(const std::string &name, const Value &checkpoint);
        };

        struct NamedBarrierValue {
            std::set<std::string> participants{};
            bool reset_on_satisfy{true};
            std::set<std::string> arrived{};

            [[nodiscard]] std::optional<Value> peek() const;

            bool update(const std::string &name, const std::vector<Value> &values);

            [[nodiscard]] Value checkpoint() const;

            void restore(const std::string &name, const Value &checkpoint);

            [[nodiscard]] bool satisfied() const;

            [[nodiscard]] size_t remaining() const;
        };

        struct DynamicBarrierValue {
            bool reset_on_satisfy{true};
            std::optional<size_t> participants{};
            std::set<std::string> arrived{};

            [[nodiscard]] std::optional<Value> peek() const;

            /**
             * Each update is either a participant name (string) or {"participants": n} which sets the expected
             * count and clears the arrivals. Arrivals before the count is known are rejected.
             */
            bool update(const std::string &name, const std::vector<Value> &values);

            [[nodiscard]] Value checkpoint() const;

            void restore(const std::string &name, const Value &checkpoint);

            [[nodiscard]] bool satisfied() const;

            [[nodiscard]] size_t remaining() const;
        };
    } // namespace channels

    /**
     * A named unit of graph state. The variant is chosen at construction and never changes; it decides how a batch
     * of updates merges into the state, whether several writers may target the channel in one superstep and
     * whether the channel takes part in checkpoints.
     *
     * Channels are only mutated by the coordinator during a write phase. They are regular values: copying a
     * channel copies its state, which is how the write phase stages changes before committing them.
     */
    struct BSPGRAPH_EXPORT Channel {
        using state_t = std::variant<channels::LastValue, channels::BinaryOperator, channels::Topic,
                                     channels::EphemeralValue, channels::AnyValue, channels::UntrackedValue,
                                     channels::NamedBarrierValue, channels::DynamicBarrierValue>;

        Channel(std::string name, state_t state);

        [[nodiscard]] const std::string &name() const { return _name; }

        [[nodiscard]] ChannelKind kind() const { return static_cast<ChannelKind>(_state.index()); }

        /**
         * The current value. Raises ChannelError(EMPTY_CHANNEL) when the channel was never written and has no
         * default, and for a barrier that is not yet satisfied.
         */
        [[nodiscard]] Value get() const;

        // The current value or nullopt, never throws EMPTY_CHANNEL.
        [[nodiscard]] std::optional<Value> peek() const;

        [[nodiscard]] bool is_available() const { return peek().has_value(); }

        /**
         * Applies an ordered batch of updates, returning true when the state changed. An empty batch is how the
         * coordinator tells a channel that a superstep passed without writes to it.
         */
        bool update(const std::vector<Value> &values);

        // Serializable snapshot, a map tagged with the variant in its "kind" field.
        [[nodiscard]] Value checkpoint() const;

        /**
         * Replaces the state from a checkpoint() result. A checkpoint of a different variant, or a malformed one,
         * raises ChannelError(SERIALIZATION_ERROR) and leaves the channel unchanged.
         */
        void restore(const Value &checkpoint);

        // Called after a task read this channel. Returns true when the state changed.
        bool consume();

        // Called once the execution terminates. Returns true when the state changed.
        bool finish();

        [[nodiscard]] bool accepts_multiple_writers() const;

        [[nodiscard]] bool is_tracked() const { return kind() != ChannelKind::UNTRACKED_VALUE; }

        // Topic operations
        void subscribe(const std::string &subscriber);

        [[nodiscard]] std::vector<TopicMessage> poll(const std::string &subscriber, size_t max_messages = 0);

        void ack(const std::string &subscriber, uint64_t sequence);

        bool unsubscribe(const std::string &subscriber);

        // Barrier operations
        [[nodiscard]] bool barrier_satisfied() const;

        [[nodiscard]] size_t remaining_participants() const;

        void set_participants(size_t count);

        [[nodiscard]] const state_t &state() const { return _state; }

    private:
        template<typename T>
        T &expect_variant(std::string_view operation);

        template<typename T>
        [[nodiscard]] const T &expect_variant(std::string_view operation) const;

        std::string _name;
        state_t _state;
    };

    /**
     * A schema entry: the name and the initial state of a channel. Compiling a graph turns the declared specs into
     * a ChannelRegistry, create() always yields a fresh channel.
     */
    struct BSPGRAPH_EXPORT ChannelSpec {
        std::string name;
        Channel::state_t initial;

        [[nodiscard]] Channel create() const { return Channel{name, initial}; }

        static ChannelSpec last_value(std::string name, std::optional<ValueKind> expected_kind = std::nullopt);

        // A LastValue that starts out holding a default.
        static ChannelSpec last_value_with_default(std::string name, Value default_value);

        static ChannelSpec binary_operator(std::string name, Reducer reducer,
                                           std::optional<Value> seed = std::nullopt);

        static ChannelSpec topic(std::string name, TopicConfig config = {});

        static ChannelSpec ephemeral(std::string name, bool guard = true);

        static ChannelSpec any_value(std::string name);

        static ChannelSpec untracked(std::string name);

        static ChannelSpec named_barrier(std::string name, std::set<std::string> participants,
                                         bool reset_on_satisfy = true);

        static ChannelSpec dynamic_barrier(std::string name, bool reset_on_satisfy = true);
    };

} // namespace bspgraph

template<>
struct fmt::formatter<bspgraph::ChannelKind> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(bspgraph::ChannelKind kind, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(bspgraph::to_string(kind), ctx);
    }
};

#endif  // BSPGRAPH_TYPES_CHANNEL_H
