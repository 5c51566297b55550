#include <catch2/catch_test_macros.hpp>
#include <bspgraph/types/graph.h>
#include <bspgraph/util/errors.h>

using namespace bspgraph;

namespace {
    NodeOutput noop(NodeContext &) { return {}; }

    NodeSpec node(std::string name, std::vector<std::string> reads = {}, std::vector<std::string> writes = {}) {
        return NodeSpec{std::move(name), noop, std::move(reads), std::move(writes)};
    }

    GraphValidationError::Kind compile_error(const StateGraph &graph) {
        try {
            (void)graph.compile();
        } catch (const GraphValidationError &e) {
            return e.kind();
        }
        FAIL("graph compiled");
        return GraphValidationError::Kind::INVALID_EDGE;
    }
}

TEST_CASE("StateGraph - compiles a valid graph", "[graph]") {
    StateGraph graph;
    graph.add_channel(ChannelSpec::last_value("x"))
         .add_node(node("a", {}, {"x"}))
         .add_node(node("b", {"x"}))
         .set_entry_point("a")
         .add_edge("a", "b")
         .set_finish_point("b");

    auto compiled = graph.compile();
    REQUIRE(compiled->nodes().size() == 2);
    REQUIRE(compiled->entry_nodes() == std::vector<node_index_t>{0});
    REQUIRE(compiled->successors(0) == std::vector<node_index_t>{1});
    REQUIRE(compiled->successors(1).empty());
    REQUIRE(compiled->node_index("b") == 1);
    REQUIRE_FALSE(compiled->find_node("c").has_value());
    REQUIRE(compiled->writers("x") == std::vector<node_index_t>{0});
    REQUIRE(compiled->resolver().reaches(0, 1));
}

TEST_CASE("StateGraph - validation errors", "[graph]") {
    StateGraph graph;
    graph.add_channel(ChannelSpec::last_value("x")).add_node(node("a")).set_entry_point("a");

    SECTION("control edge cycle") {
        graph.add_node(node("b")).add_edge("a", "b").add_edge("b", "a");
        REQUIRE(compile_error(graph) == GraphValidationError::Kind::CONTROL_EDGE_CYCLE);
    }
    SECTION("unknown channel") {
        graph.add_node(node("b", {"missing"}));
        REQUIRE(compile_error(graph) == GraphValidationError::Kind::UNKNOWN_CHANNEL);
    }
    SECTION("unknown node") {
        graph.add_edge("a", "nowhere");
        REQUIRE(compile_error(graph) == GraphValidationError::Kind::UNKNOWN_NODE);
    }
    SECTION("duplicate node") {
        graph.add_node(node("a"));
        REQUIRE(compile_error(graph) == GraphValidationError::Kind::DUPLICATE_NAME);
    }
    SECTION("duplicate channel") {
        graph.add_channel(ChannelSpec::any_value("x"));
        REQUIRE(compile_error(graph) == GraphValidationError::Kind::DUPLICATE_NAME);
    }
    SECTION("two writers on a single writer channel") {
        graph.add_node(node("w1", {}, {"x"})).add_node(node("w2", {}, {"x"}));
        REQUIRE(compile_error(graph) == GraphValidationError::Kind::DUPLICATE_WRITER);
    }
    SECTION("edge into START") {
        graph.add_edge("a", START);
        REQUIRE(compile_error(graph) == GraphValidationError::Kind::INVALID_EDGE);
    }
}

TEST_CASE("StateGraph - a graph needs an entry point", "[graph]") {
    StateGraph graph;
    graph.add_node(node("a"));
    REQUIRE(compile_error(graph) == GraphValidationError::Kind::INVALID_EDGE);
}

TEST_CASE("StateGraph - several writers are fine on a reducing channel", "[graph]") {
    StateGraph graph;
    graph.add_channel(ChannelSpec::binary_operator("total", reducers::sum(), Value{0}))
         .add_node(node("w1", {}, {"total"}))
         .add_node(node("w2", {}, {"total"}))
         .set_entry_point("w1")
         .set_entry_point("w2");
    REQUIRE(graph.compile()->writers("total").size() == 2);
}

TEST_CASE("StateGraph - nodes need a compute function", "[graph]") {
    StateGraph graph;
    REQUIRE_THROWS_AS(graph.add_node(NodeSpec{"a", nullptr}), std::invalid_argument);
    REQUIRE_THROWS_AS(graph.add_conditional_edges("a", nullptr), std::invalid_argument);
}
