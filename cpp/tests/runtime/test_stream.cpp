#include <catch2/catch_test_macros.hpp>
#include <bspgraph/runtime/stream.h>

#include <atomic>
#include <thread>

using namespace bspgraph;
using namespace std::chrono_literals;

namespace {
    StreamEvent event(superstep_t superstep) { return StreamEvent{superstep, "node", Value::map()}; }
}

TEST_CASE("BoundedEventStream - delivers in order", "[stream]") {
    BoundedEventStream stream{4};
    stream.emit(event(1));
    stream.emit(event(2));
    REQUIRE(stream.size() == 2);
    REQUIRE(stream.next()->superstep == 1);
    REQUIRE(stream.try_next()->superstep == 2);
    REQUIRE_FALSE(stream.try_next().has_value());
    REQUIRE_THROWS_AS(BoundedEventStream{0}, std::invalid_argument);
}

TEST_CASE("BoundedEventStream - a full stream blocks the producer", "[stream]") {
    BoundedEventStream stream{1};
    stream.emit(event(1));

    std::atomic<bool> emitted{false};
    std::thread producer([&] {
        stream.emit(event(2));
        emitted = true;
    });
    std::this_thread::sleep_for(30ms);
    REQUIRE_FALSE(emitted.load());

    REQUIRE(stream.next()->superstep == 1);
    REQUIRE(stream.next()->superstep == 2);
    producer.join();
    REQUIRE(emitted.load());
    REQUIRE(stream.blocked_emits() == 1);
}

TEST_CASE("BoundedEventStream - close drains then ends", "[stream]") {
    BoundedEventStream stream{2};
    stream.emit(event(1));
    stream.close();
    REQUIRE(stream.is_closed());
    REQUIRE_THROWS_AS(stream.emit(event(2)), std::logic_error);
    REQUIRE(stream.next()->superstep == 1);
    REQUIRE_FALSE(stream.next().has_value());
}

TEST_CASE("CollectingStreamSink - keeps every event", "[stream]") {
    CollectingStreamSink sink;
    sink.emit(event(1));
    sink.emit(event(2));
    REQUIRE(sink.events().size() == 2);
    REQUIRE(sink.events()[1] == event(2));
}
