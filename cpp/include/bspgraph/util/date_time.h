#ifndef BSPGRAPH_DATE_TIME_H
#define BSPGRAPH_DATE_TIME_H

#include <chrono>
#include <cstdint>

namespace bspgraph {
    // Wall clock, used for anything that is persisted (topic publish times, checkpoint creation).
    using engine_clock = std::chrono::system_clock;
    using engine_time_t = std::chrono::time_point<engine_clock, std::chrono::microseconds>;
    using engine_time_delta_t = std::chrono::microseconds;

    // Monotonic clock, used for deadlines and timeouts inside a single process.
    using monotonic_clock = std::chrono::steady_clock;
    using monotonic_time_t = monotonic_clock::time_point;

    inline engine_time_t engine_now() noexcept {
        return std::chrono::time_point_cast<std::chrono::microseconds>(engine_clock::now());
    }

    constexpr int64_t to_micros(engine_time_t t) noexcept { return t.time_since_epoch().count(); }

    constexpr engine_time_t from_micros(int64_t us) noexcept { return engine_time_t{engine_time_delta_t{us}}; }

    template<typename Rep, typename Period>
    constexpr int64_t to_millis(std::chrono::duration<Rep, Period> d) noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    }
} // namespace bspgraph

#endif  // BSPGRAPH_DATE_TIME_H
