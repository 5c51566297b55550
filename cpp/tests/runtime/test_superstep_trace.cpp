#include <catch2/catch_test_macros.hpp>
#include <bspgraph/runtime/observers/superstep_trace.h>
#include <bspgraph/util/scope.h>

#include <cstdio>
#include <string>

using namespace bspgraph;

namespace {
    std::string read_all(FILE *file) {
        std::rewind(file);
        std::string result;
        char buffer[256];
        while (auto n = std::fread(buffer, 1, sizeof(buffer), file)) { result.append(buffer, n); }
        return result;
    }
}

TEST_CASE("SuperstepTrace - writes the enabled events", "[trace]") {
    FILE *out = std::tmpfile();
    REQUIRE(out != nullptr);
    auto close = make_scope_exit([out] { std::fclose(out); });

    SuperstepTrace trace{std::nullopt, true, true, false, true, out};
    trace.on_before_superstep("run-1", 3);
    trace.on_before_task(3, "worker");
    trace.on_after_write_phase(3, {"counter"});
    trace.on_checkpoint(3, "ckpt-run-1-3");
    trace.on_terminate(3);

    auto text = read_all(out);
    REQUIRE(text.find("[superstep 3] run-1 starting") != std::string::npos);
    REQUIRE(text.find("worker running") != std::string::npos);
    REQUIRE(text.find("checkpoint ckpt-run-1-3") != std::string::npos);
    REQUIRE(text.find("terminated") != std::string::npos);
    // Write phase logging is off.
    REQUIRE(text.find("changed") == std::string::npos);
}

TEST_CASE("SuperstepTrace - filters task events by node name", "[trace]") {
    FILE *out = std::tmpfile();
    REQUIRE(out != nullptr);
    auto close = make_scope_exit([out] { std::fclose(out); });

    SuperstepTrace trace{std::string{"inc"}, false, true, false, false, out};
    trace.on_before_task(1, "increment");
    trace.on_before_task(1, "start");
    trace.on_before_superstep("run", 1);

    auto text = read_all(out);
    REQUIRE(text.find("increment running") != std::string::npos);
    REQUIRE(text.find("start running") == std::string::npos);
    REQUIRE(text.find("starting") == std::string::npos);
}
