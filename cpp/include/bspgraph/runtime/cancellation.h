#ifndef BSPGRAPH_RUNTIME_CANCELLATION_H
#define BSPGRAPH_RUNTIME_CANCELLATION_H

#include <bspgraph/bspgraph_base.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace bspgraph {
    struct CancellationSource;

    /**
     * Read side of a cancellation signal. Every task execution receives one; compute units check it at their own
     * yield points (or sleep through sleep_for, which wakes early on cancellation). Tokens are cheap to copy and all
     * copies observe the same signal.
     */
    struct BSPGRAPH_EXPORT CancellationToken {
        // A token that is never cancelled.
        CancellationToken();

        [[nodiscard]] bool is_cancelled() const;

        // Why the signal was raised, empty while not cancelled.
        [[nodiscard]] std::string reason() const;

        // Raises SchedulerError(TASK_CANCELLED) when cancelled.
        void throw_if_cancelled() const;

        /**
         * Blocks for up to duration. Returns true when the full duration elapsed and false when the wait was cut short
         * by cancellation.
         */
        template<typename Rep, typename Period>
        bool sleep_for(std::chrono::duration<Rep, Period> duration) const {
            return wait_until(monotonic_clock::now() +
                              std::chrono::duration_cast<monotonic_clock::duration>(duration));
        }

        // As sleep_for, with an absolute deadline.
        bool wait_until(monotonic_time_t deadline) const;

    private:
        struct State {
            mutable std::mutex mutex;
            std::condition_variable cv;
            bool cancelled{false};
            std::string reason;
        };

        explicit CancellationToken(std::shared_ptr<State> state);

        std::shared_ptr<State> _state;

        friend CancellationSource;
    };

    // Write side, owned by whoever may abort the work (a TaskBatch).
    struct BSPGRAPH_EXPORT CancellationSource {
        CancellationSource();

        [[nodiscard]] CancellationToken token() const;

        // Idempotent, the first reason wins.
        void cancel(std::string reason = "cancelled");

        [[nodiscard]] bool is_cancelled() const;

    private:
        std::shared_ptr<CancellationToken::State> _state;
    };

} // namespace bspgraph

#endif  // BSPGRAPH_RUNTIME_CANCELLATION_H
