/**
 * Unit tests for the channel variants and the built-in reducers.
 */

#include <catch2/catch_test_macros.hpp>
#include <bspgraph/types/channel.h>
#include <bspgraph/util/errors.h>

#include <functional>
#include <limits>
#include <thread>

using namespace bspgraph;

namespace {
    ChannelError::Kind error_kind(const std::function<void()> &fn) {
        try {
            fn();
        } catch (const ChannelError &e) {
            return e.kind();
        }
        FAIL("expected a ChannelError");
        return ChannelError::Kind::INVALID_OPERATION;
    }

    std::vector<Value> values(std::initializer_list<Value> items) { return std::vector<Value>(items); }
}

// ============================================================================
// Reducers
// ============================================================================

TEST_CASE("Reducers - numeric", "[reducer]") {
    auto sum = reducers::sum();
    REQUIRE(sum(Value{2}, Value{3}) == Value{5});
    REQUIRE(sum(Value{2}, Value{0.5}) == Value{2.5});
    REQUIRE(reducers::max()(Value{2}, Value{7}) == Value{7});
    REQUIRE(reducers::min()(Value{2}, Value{7}) == Value{2});
}

TEST_CASE("Reducers - collections", "[reducer]") {
    REQUIRE(reducers::append()(Value{}, Value{1}) == Value::list({1}));
    REQUIRE(reducers::append()(Value::list({1}), Value::list({2, 3})) == Value::list({1, 2, 3}));
    REQUIRE(reducers::merge()(Value::map({{"a", 1}, {"b", 1}}), Value::map({{"b", 2}})) ==
            Value::map({{"a", 1}, {"b", 2}}));
}

TEST_CASE("Reducers - failures are reported as invalid updates", "[reducer]") {
    REQUIRE(error_kind([] { (void)reducers::sum()(Value{1}, Value{"x"}); }) == ChannelError::Kind::INVALID_UPDATE);
    auto failing = reducers::custom("failing", [](const Value &, const Value &) -> Value {
        throw std::runtime_error("boom");
    });
    REQUIRE(error_kind([&] { (void)failing(Value{1}, Value{2}); }) == ChannelError::Kind::INVALID_UPDATE);
}

TEST_CASE("Reducers - integer sum rejects overflow", "[reducer]") {
    constexpr auto max = std::numeric_limits<int64_t>::max();
    constexpr auto min = std::numeric_limits<int64_t>::min();
    auto sum = reducers::sum();
    REQUIRE(sum(Value{max - 1}, Value{1}) == Value{max});
    REQUIRE(error_kind([&] { (void)sum(Value{max}, Value{1}); }) == ChannelError::Kind::INVALID_UPDATE);
    REQUIRE(error_kind([&] { (void)sum(Value{min}, Value{-1}); }) == ChannelError::Kind::INVALID_UPDATE);

    auto total = ChannelSpec::binary_operator("total", reducers::sum(), Value{max}).create();
    REQUIRE(error_kind([&] { total.update(values({1})); }) == ChannelError::Kind::INVALID_UPDATE);
    REQUIRE(total.get() == Value{max});
}

// ============================================================================
// LastValue
// ============================================================================

TEST_CASE("LastValue - empty until written", "[channel]") {
    auto c = ChannelSpec::last_value("x").create();
    REQUIRE_FALSE(c.is_available());
    REQUIRE(error_kind([&] { (void)c.get(); }) == ChannelError::Kind::EMPTY_CHANNEL);
    REQUIRE_FALSE(c.update({}));

    REQUIRE(c.update(values({1})));
    REQUIRE(c.get() == Value{1});
    REQUIRE(c.update(values({2, 3})));
    REQUIRE(c.get() == Value{3});
}

TEST_CASE("LastValue - default and expected kind", "[channel]") {
    auto with_default = ChannelSpec::last_value_with_default("x", Value{0}).create();
    REQUIRE(with_default.get() == Value{0});

    auto typed = ChannelSpec::last_value("x", ValueKind::INT).create();
    REQUIRE(error_kind([&] { typed.update(values({"text"})); }) == ChannelError::Kind::INVALID_UPDATE);
    REQUIRE_FALSE(typed.is_available());
    REQUIRE_FALSE(typed.accepts_multiple_writers());
}

// ============================================================================
// BinaryOperator
// ============================================================================

TEST_CASE("BinaryOperator - folds the seed with every update", "[channel]") {
    auto c = ChannelSpec::binary_operator("total", reducers::sum(), Value{10}).create();
    REQUIRE(c.get() == Value{10});
    REQUIRE(c.update(values({1, 2, 3})));
    REQUIRE(c.get() == Value{16});
    REQUIRE_FALSE(c.update({}));
    REQUIRE(c.accepts_multiple_writers());
}

TEST_CASE("BinaryOperator - order matters for a non-commutative reducer", "[channel]") {
    auto concat = reducers::custom("concat", [](const Value &acc, const Value &update) {
        return Value{acc.as_string() + update.as_string()};
    });
    auto ab = ChannelSpec::binary_operator("s", concat, Value{""}).create();
    auto ba = ab;
    ab.update(values({"a", "b"}));
    ba.update(values({"b", "a"}));
    REQUIRE(ab.get() == Value{"ab"});
    REQUIRE(ba.get() == Value{"ba"});

    auto commutative = ChannelSpec::binary_operator("n", reducers::sum(), Value{0}).create();
    auto reversed = commutative;
    commutative.update(values({4, 9}));
    reversed.update(values({9, 4}));
    REQUIRE(commutative.get() == reversed.get());
}

TEST_CASE("BinaryOperator - without a seed the first update starts the value", "[channel]") {
    auto c = ChannelSpec::binary_operator("m", reducers::max()).create();
    REQUIRE_FALSE(c.is_available());
    c.update(values({3, 8, 5}));
    REQUIRE(c.get() == Value{8});
}

// ============================================================================
// Topic
// ============================================================================

TEST_CASE("Topic - accumulates and bounds its queue", "[channel][topic]") {
    auto c = ChannelSpec::topic("events", TopicConfig{.max_size = 3}).create();
    REQUIRE_FALSE(c.is_available());
    c.update(values({1, 2}));
    c.update(values({3, 4}));
    REQUIRE(c.get() == Value::list({2, 3, 4}));
}

TEST_CASE("Topic - non accumulating topic keeps one superstep", "[channel][topic]") {
    auto c = ChannelSpec::topic("events", TopicConfig{.accumulate = false}).create();
    c.update(values({1, 2}));
    REQUIRE(c.update({}));
    REQUIRE_FALSE(c.is_available());
    c.update(values({3}));
    REQUIRE(c.get() == Value::list({3}));
}

TEST_CASE("Topic - expired messages are dropped", "[channel][topic]") {
    auto c = ChannelSpec::topic("events", TopicConfig{.ttl = std::chrono::milliseconds(5)}).create();
    c.update(values({1}));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    REQUIRE_FALSE(c.is_available());
}

TEST_CASE("Topic - at least once delivery redelivers until acked", "[channel][topic]") {
    auto c = ChannelSpec::topic("events").create();
    c.update(values({"before"}));
    c.subscribe("reader");
    c.update(values({"a", "b"}));

    auto first = c.poll("reader");
    REQUIRE(first.size() == 2);
    REQUIRE(first[0].value == Value{"a"});
    REQUIRE(c.poll("reader").size() == 2);

    c.ack("reader", first[0].sequence);
    auto rest = c.poll("reader");
    REQUIRE(rest.size() == 1);
    REQUIRE(rest[0].value == Value{"b"});

    REQUIRE(error_kind([&] { c.ack("reader", 100); }) == ChannelError::Kind::INVALID_OPERATION);
    REQUIRE(c.unsubscribe("reader"));
    REQUIRE(error_kind([&] { (void)c.poll("reader"); }) == ChannelError::Kind::INVALID_OPERATION);
}

TEST_CASE("Topic - at most once delivery advances on poll", "[channel][topic]") {
    auto c = ChannelSpec::topic("events", TopicConfig{.delivery = DeliveryMode::AT_MOST_ONCE}).create();
    c.subscribe("reader");
    c.update(values({1, 2, 3}));
    REQUIRE(c.poll("reader", 2).size() == 2);
    auto rest = c.poll("reader");
    REQUIRE(rest.size() == 1);
    REQUIRE(rest[0].value == Value{3});
    REQUIRE(c.poll("reader").empty());
}

// ============================================================================
// Ephemeral, Any and Untracked
// ============================================================================

TEST_CASE("EphemeralValue - cleared by an empty update and by consume", "[channel]") {
    auto c = ChannelSpec::ephemeral("signal").create();
    c.update(values({1}));
    REQUIRE(c.get() == Value{1});
    REQUIRE(c.update({}));
    REQUIRE_FALSE(c.is_available());

    c.update(values({2}));
    REQUIRE(c.consume());
    REQUIRE_FALSE(c.is_available());

    c.update(values({3}));
    REQUIRE(c.finish());
    REQUIRE_FALSE(c.is_available());
}

TEST_CASE("EphemeralValue - guard rejects several values", "[channel]") {
    auto guarded = ChannelSpec::ephemeral("signal").create();
    REQUIRE(error_kind([&] { guarded.update(values({1, 2})); }) == ChannelError::Kind::INVALID_UPDATE);

    auto unguarded = ChannelSpec::ephemeral("signal", false).create();
    unguarded.update(values({1, 2}));
    REQUIRE(unguarded.get() == Value{2});
}

TEST_CASE("AnyValue and UntrackedValue keep the last write", "[channel]") {
    auto any = ChannelSpec::any_value("any").create();
    any.update(values({1, 2}));
    REQUIRE(any.get() == Value{2});
    REQUIRE(any.accepts_multiple_writers());
    REQUIRE(any.is_tracked());

    auto untracked = ChannelSpec::untracked("scratch").create();
    untracked.update(values({"x"}));
    REQUIRE(untracked.get() == Value{"x"});
    REQUIRE_FALSE(untracked.is_tracked());
}

// ============================================================================
// Barriers
// ============================================================================

TEST_CASE("NamedBarrierValue - satisfied once every participant arrived", "[channel][barrier]") {
    auto c = ChannelSpec::named_barrier("join", {"a", "b"}).create();
    c.update(values({"a"}));
    REQUIRE_FALSE(c.barrier_satisfied());
    REQUIRE(c.remaining_participants() == 1);
    REQUIRE(error_kind([&] { (void)c.get(); }) == ChannelError::Kind::EMPTY_CHANNEL);

    c.update(values({"b"}));
    REQUIRE(c.barrier_satisfied());
    REQUIRE(c.get() == Value{true});

    REQUIRE(c.consume());
    REQUIRE_FALSE(c.barrier_satisfied());
}

TEST_CASE("NamedBarrierValue - rejects strangers", "[channel][barrier]") {
    auto c = ChannelSpec::named_barrier("join", {"a"}).create();
    REQUIRE(error_kind([&] { c.update(values({"z"})); }) == ChannelError::Kind::INVALID_UPDATE);
    REQUIRE(error_kind([&] { c.update(values({1})); }) == ChannelError::Kind::INVALID_UPDATE);
    REQUIRE_THROWS_AS(ChannelSpec::named_barrier("empty", {}), std::invalid_argument);
}

TEST_CASE("DynamicBarrierValue - participant count set at runtime", "[channel][barrier]") {
    auto c = ChannelSpec::dynamic_barrier("fan_in").create();
    REQUIRE(error_kind([&] { (void)c.remaining_participants(); }) == ChannelError::Kind::INVALID_OPERATION);
    REQUIRE(error_kind([&] { c.update(values({"w1"})); }) == ChannelError::Kind::INVALID_UPDATE);

    c.update(values({Value::map({{"participants", 2}})}));
    REQUIRE(c.remaining_participants() == 2);
    c.update(values({"w1", "w1"}));
    REQUIRE(c.remaining_participants() == 1);
    c.update(values({"w2"}));
    REQUIRE(c.barrier_satisfied());
    REQUIRE(error_kind([&] { c.update(values({"w3"})); }) == ChannelError::Kind::INVALID_UPDATE);

    c.set_participants(1);
    REQUIRE_FALSE(c.barrier_satisfied());
}

TEST_CASE("Barriers - restore rejects inconsistent arrivals", "[channel][barrier][checkpoint]") {
    auto checkpoint = [](ChannelKind kind, Value::map_t fields) {
        fields.insert_or_assign("kind", Value{to_string(kind)});
        return Value{std::move(fields)};
    };

    SECTION("named barrier") {
        auto c = ChannelSpec::named_barrier("join", {"a", "b"}).create();
        c.update(values({"a"}));
        REQUIRE(error_kind([&] {
            c.restore(checkpoint(ChannelKind::NAMED_BARRIER_VALUE, {{"arrived", Value::list({"a", "z"})}}));
        }) == ChannelError::Kind::SERIALIZATION_ERROR);
        REQUIRE(c.remaining_participants() == 1);
    }

    SECTION("dynamic barrier") {
        auto c = ChannelSpec::dynamic_barrier("fan_in").create();
        c.update(values({Value::map({{"participants", 2}}), "w1"}));

        auto kind = ChannelKind::DYNAMIC_BARRIER_VALUE;
        REQUIRE(error_kind([&] {
            c.restore(checkpoint(kind, {{"participants", -1}, {"arrived", Value::list()}}));
        }) == ChannelError::Kind::SERIALIZATION_ERROR);
        REQUIRE(error_kind([&] {
            c.restore(checkpoint(kind, {{"participants", 1}, {"arrived", Value::list({"x", "y", "z"})}}));
        }) == ChannelError::Kind::SERIALIZATION_ERROR);
        REQUIRE(error_kind([&] {
            c.restore(checkpoint(kind, {{"arrived", Value::list({"x"})}}));
        }) == ChannelError::Kind::SERIALIZATION_ERROR);
        REQUIRE(error_kind([&] {
            c.restore(checkpoint(kind, {{"participants", "two"}, {"arrived", Value::list()}}));
        }) == ChannelError::Kind::SERIALIZATION_ERROR);

        // The channel is untouched by the rejected checkpoints.
        REQUIRE(c.remaining_participants() == 1);
        c.restore(checkpoint(kind, {{"participants", 3}, {"arrived", Value::list({"x"})}}));
        REQUIRE(c.remaining_participants() == 2);
    }
}

// ============================================================================
// Common operations
// ============================================================================

TEST_CASE("Channel - variant specific operations fail on other variants", "[channel]") {
    auto c = ChannelSpec::last_value("x").create();
    REQUIRE(error_kind([&] { c.subscribe("r"); }) == ChannelError::Kind::INVALID_OPERATION);
    REQUIRE(error_kind([&] { (void)c.barrier_satisfied(); }) == ChannelError::Kind::INVALID_OPERATION);
    REQUIRE(error_kind([&] { c.set_participants(2); }) == ChannelError::Kind::INVALID_OPERATION);
}

TEST_CASE("Channel - reserved and empty names are rejected", "[channel]") {
    REQUIRE_THROWS_AS(ChannelSpec::last_value("").create(), std::invalid_argument);
    REQUIRE_THROWS_AS(ChannelSpec::last_value(START).create(), std::invalid_argument);
    REQUIRE_THROWS_AS(ChannelSpec::last_value(END).create(), std::invalid_argument);
}

TEST_CASE("Channel - checkpoint and restore every variant", "[channel][checkpoint]") {
    std::vector<std::pair<ChannelSpec, std::vector<Value>>> cases{
        {ChannelSpec::last_value("lv"), values({1})},
        {ChannelSpec::binary_operator("bo", reducers::sum(), Value{0}), values({1, 2})},
        {ChannelSpec::topic("tp"), values({"a", "b"})},
        {ChannelSpec::ephemeral("ep"), values({true})},
        {ChannelSpec::any_value("av"), values({2.5})},
        {ChannelSpec::untracked("uv"), values({"u"})},
        {ChannelSpec::named_barrier("nb", {"a", "b"}), values({"a"})},
        {ChannelSpec::dynamic_barrier("db"), values({Value::map({{"participants", 3}}), "x"})},
    };
    for (const auto &[spec, updates]: cases) {
        auto written = spec.create();
        written.update(updates);
        if (written.kind() == ChannelKind::TOPIC) { written.subscribe("reader"); }

        auto restored = spec.create();
        restored.restore(written.checkpoint());
        INFO(spec.name);
        REQUIRE(restored.kind() == written.kind());
        REQUIRE(restored.peek() == written.peek());
        REQUIRE(restored.checkpoint() == written.checkpoint());
    }
}

TEST_CASE("Channel - restore rejects a checkpoint of another variant", "[channel][checkpoint]") {
    auto source = ChannelSpec::any_value("x").create();
    source.update(values({1}));
    auto target = ChannelSpec::last_value("x").create();
    target.update(values({7}));

    REQUIRE(error_kind([&] { target.restore(source.checkpoint()); }) == ChannelError::Kind::SERIALIZATION_ERROR);
    REQUIRE(error_kind([&] { target.restore(Value{1}); }) == ChannelError::Kind::SERIALIZATION_ERROR);
    REQUIRE(target.get() == Value{7});

    auto topic = ChannelSpec::topic("t").create();
    REQUIRE(error_kind([&] { topic.restore(Value::map({{"kind", "topic"}})); }) ==
            ChannelError::Kind::SERIALIZATION_ERROR);
}
