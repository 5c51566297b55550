#include <catch2/catch_test_macros.hpp>
#include <bspgraph/runtime/checkpointer.h>
#include <bspgraph/util/errors.h>

#include <functional>

using namespace bspgraph;

namespace {
    channel_checkpoints_t channels(int64_t counter) {
        return {{"counter", Value::map({{"kind", "last_value"}, {"value", counter}})}};
    }

    CheckpointError::Kind checkpoint_error(const std::function<void()> &fn) {
        try {
            fn();
        } catch (const CheckpointError &e) {
            return e.kind();
        }
        FAIL("expected a CheckpointError");
        return CheckpointError::Kind::INVALID_DATA;
    }
}

TEST_CASE("InMemoryCheckpointer - save and load", "[checkpoint]") {
    InMemoryCheckpointer checkpointer;
    REQUIRE_FALSE(checkpointer.load("run").has_value());

    auto first = checkpointer.save("run", 1, channels(1), Value::map({{"superstep", 1}}));
    auto second = checkpointer.save("run", 2, channels(2), Value::map({{"superstep", 2}}));
    REQUIRE(first == InMemoryCheckpointer::make_checkpoint_id("run", 1));
    REQUIRE(first != second);

    auto latest = checkpointer.load("run");
    REQUIRE(latest.has_value());
    REQUIRE(latest->generation == 2);
    REQUIRE(latest->channels == channels(2));
    REQUIRE(latest->metadata.checkpoint_id == second);
    REQUIRE(latest->metadata.metadata.at("superstep") == Value{2});

    auto named = checkpointer.load("run", first);
    REQUIRE(named->channels == channels(1));
    REQUIRE_FALSE(checkpointer.load("run", std::string{"ckpt-run-99"}).has_value());
    REQUIRE_FALSE(checkpointer.load("other").has_value());
}

TEST_CASE("InMemoryCheckpointer - generations must increase", "[checkpoint]") {
    InMemoryCheckpointer checkpointer;
    checkpointer.save("run", 3, channels(1), Value{});
    REQUIRE(checkpoint_error([&] { checkpointer.save("run", 3, channels(2), Value{}); }) ==
            CheckpointError::Kind::SAVE_FAILED);
    REQUIRE(checkpoint_error([&] { checkpointer.save("", 1, channels(2), Value{}); }) ==
            CheckpointError::Kind::SAVE_FAILED);
    // Executions are independent.
    checkpointer.save("other", 1, channels(1), Value{});
    REQUIRE(checkpointer.size("run") == 1);
    REQUIRE(checkpointer.size("other") == 1);
}

TEST_CASE("InMemoryCheckpointer - list and remove", "[checkpoint]") {
    InMemoryCheckpointer checkpointer;
    for (generation_t g = 1; g <= 4; ++g) { checkpointer.save("run", g, channels(g), Value{}); }

    auto all = checkpointer.list("run");
    REQUIRE(all.size() == 4);
    REQUIRE(all.front().generation == 4);
    REQUIRE(all.back().generation == 1);
    REQUIRE(checkpointer.list("run", 2).size() == 2);
    REQUIRE(checkpointer.list("missing").empty());

    checkpointer.remove("run", all.front().checkpoint_id);
    REQUIRE(checkpointer.load("run")->generation == 3);
    REQUIRE(checkpoint_error([&] { checkpointer.remove("run", all.front().checkpoint_id); }) ==
            CheckpointError::Kind::NOT_FOUND);

    checkpointer.clear();
    REQUIRE(checkpointer.size("run") == 0);
}
