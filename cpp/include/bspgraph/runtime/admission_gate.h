#ifndef BSPGRAPH_RUNTIME_ADMISSION_GATE_H
#define BSPGRAPH_RUNTIME_ADMISSION_GATE_H

#include <bspgraph/runtime/cancellation.h>

#include <condition_variable>
#include <mutex>
#include <utility>

namespace bspgraph {

    /**
     * Counting gate capping the number of tasks executing at once across the whole scheduler. The number of permits
     * is independent of the number of worker threads; a task that suspends on external work hands its permit back
     * so another task can use it.
     */
    struct BSPGRAPH_EXPORT AdmissionGate {
        explicit AdmissionGate(size_t permits);

        AdmissionGate(const AdmissionGate &) = delete;

        AdmissionGate &operator=(const AdmissionGate &) = delete;

        // Blocks until a permit is free. Returns false, without a permit, when the token is cancelled first.
        [[nodiscard]] bool acquire(const CancellationToken &token);

        [[nodiscard]] bool try_acquire();

        void release();

        [[nodiscard]] size_t capacity() const { return _capacity; }

        [[nodiscard]] size_t in_use() const;

        // High-water mark of in_use since construction or the last reset_peak.
        [[nodiscard]] size_t peak_in_use() const;

        void reset_peak();

    private:
        const size_t _capacity;
        mutable std::mutex _mutex;
        std::condition_variable _cv;
        size_t _in_use{0};
        size_t _peak{0};
    };

    // Holds a permit for the scope, released on destruction unless already released.
    struct BSPGRAPH_EXPORT AdmissionPermit {
        AdmissionPermit() = default;

        explicit AdmissionPermit(AdmissionGate &gate) : _gate{&gate} {}

        AdmissionPermit(AdmissionPermit &&other) noexcept : _gate{std::exchange(other._gate, nullptr)} {}

        AdmissionPermit &operator=(AdmissionPermit &&) = delete;

        ~AdmissionPermit() { release(); }

        [[nodiscard]] bool held() const { return _gate != nullptr; }

        void release();

        /**
         * Gives the permit back for the duration of fn and re-acquires it afterwards. Returns false when the
         * token was cancelled before the permit could be re-acquired, in which case no permit is held.
         */
        template<typename Fn>
        bool suspend(const CancellationToken &token, Fn &&fn) {
            auto *gate = _gate;
            release();
            std::forward<Fn>(fn)();
            if (gate == nullptr) { return true; }
            if (!gate->acquire(token)) { return false; }
            _gate = gate;
            return true;
        }

    private:
        AdmissionGate *_gate{nullptr};
    };

} // namespace bspgraph

#endif  // BSPGRAPH_RUNTIME_ADMISSION_GATE_H
