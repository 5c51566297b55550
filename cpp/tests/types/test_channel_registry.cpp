#include <catch2/catch_test_macros.hpp>
#include <bspgraph/types/channel_registry.h>
#include <bspgraph/util/errors.h>

using namespace bspgraph;

namespace {
    ChannelRegistry make_registry() {
        return ChannelRegistry{{
            ChannelSpec::last_value("counter"),
            ChannelSpec::binary_operator("total", reducers::sum(), Value{0}),
            ChannelSpec::untracked("scratch"),
        }};
    }
}

TEST_CASE("ChannelRegistry - lookup", "[registry]") {
    auto registry = make_registry();
    REQUIRE(registry.size() == 3);
    REQUIRE(registry.contains("total"));
    REQUIRE(registry.names() == std::vector<std::string>{"counter", "total", "scratch"});
    REQUIRE_THROWS_AS(registry.at("missing"), ChannelError);
}

TEST_CASE("ChannelRegistry - duplicate names are rejected", "[registry]") {
    try {
        ChannelRegistry{{ChannelSpec::last_value("a"), ChannelSpec::any_value("a")}};
        FAIL("duplicate channel accepted");
    } catch (const GraphValidationError &e) {
        REQUIRE(e.kind() == GraphValidationError::Kind::DUPLICATE_NAME);
    }
}

TEST_CASE("ChannelRegistry - values skip empty channels", "[registry]") {
    auto registry = make_registry();
    REQUIRE(registry.values() == channel_values_t{{"total", Value{0}}});

    registry.at("counter").update({Value{4}});
    REQUIRE(registry.values({"counter"}) == channel_values_t{{"counter", Value{4}}});
}

TEST_CASE("ChannelRegistry - checkpoint covers tracked channels only", "[registry][checkpoint]") {
    auto registry = make_registry();
    registry.at("counter").update({Value{1}});
    registry.at("total").update({Value{5}});
    registry.at("scratch").update({Value{"tmp"}});

    auto checkpoint = registry.checkpoint();
    REQUIRE(checkpoint.contains("counter"));
    REQUIRE(checkpoint.contains("total"));
    REQUIRE_FALSE(checkpoint.contains("scratch"));

    auto restored = make_registry();
    restored.at("scratch").update({Value{"other"}});
    restored.restore(checkpoint);
    REQUIRE(restored.at("counter").get() == Value{1});
    REQUIRE(restored.at("total").get() == Value{5});
    // Untracked state is not carried across a restore.
    REQUIRE_FALSE(restored.at("scratch").is_available());
}

TEST_CASE("ChannelRegistry - restore is all or nothing", "[registry][checkpoint]") {
    auto registry = make_registry();
    registry.at("counter").update({Value{9}});

    auto bad = make_registry().checkpoint();
    bad.insert_or_assign("total", Value::map({{"kind", "last_value"}}));
    REQUIRE_THROWS_AS(registry.restore(bad), ChannelError);
    REQUIRE(registry.at("counter").get() == Value{9});

    auto unknown = channel_checkpoints_t{{"nope", Value::map({{"kind", "any_value"}})}};
    REQUIRE_THROWS_AS(registry.restore(unknown), ChannelError);

    auto untracked = channel_checkpoints_t{{"scratch", Value::map({{"kind", "untracked_value"}})}};
    REQUIRE_THROWS_AS(registry.restore(untracked), ChannelError);
    REQUIRE(registry.at("counter").get() == Value{9});
}

TEST_CASE("ChannelRegistry - copies are independent", "[registry]") {
    auto registry = make_registry();
    auto staged = registry;
    staged.at("total").update({Value{3}});
    REQUIRE(registry.at("total").get() == Value{0});

    registry.swap(staged);
    REQUIRE(registry.at("total").get() == Value{3});

    registry.reset();
    REQUIRE(registry.at("total").get() == Value{0});
}
