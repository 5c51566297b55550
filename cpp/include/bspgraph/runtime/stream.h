#ifndef BSPGRAPH_RUNTIME_STREAM_H
#define BSPGRAPH_RUNTIME_STREAM_H

#include <bspgraph/types/value.h>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bspgraph {

    // One node's applied writes for a committed superstep.
    struct StreamEvent {
        superstep_t superstep;
        std::string node;
        // Channel name to the values the node wrote there, in write order.
        Value deltas;

        friend bool operator==(const StreamEvent &, const StreamEvent &) = default;
    };

    /**
     * Consumer of the coordinator's event stream. emit may block, which suspends the coordinator until the consumer
     * catches up; events are never dropped.
     */
    struct BSPGRAPH_EXPORT StreamSink {
        using s_ptr = std::shared_ptr<StreamSink>;

        virtual ~StreamSink() = default;

        virtual void emit(StreamEvent event) = 0;
    };

    /**
     * A bounded blocking queue of events between the coordinator and a consumer thread. emit waits while the queue
     * is full; next waits for an event and returns nullopt once the stream is closed and drained.
     */
    struct BSPGRAPH_EXPORT BoundedEventStream : StreamSink {
        explicit BoundedEventStream(size_t capacity);

        // Raises std::logic_error when the stream was closed.
        void emit(StreamEvent event) override;

        [[nodiscard]] std::optional<StreamEvent> next();

        [[nodiscard]] std::optional<StreamEvent> try_next();

        void close();

        [[nodiscard]] bool is_closed() const;

        [[nodiscard]] size_t size() const;

        [[nodiscard]] size_t capacity() const { return _capacity; }

        // Number of emit calls that had to wait for room.
        [[nodiscard]] size_t blocked_emits() const;

    private:
        const size_t _capacity;
        mutable std::mutex _mutex;
        std::condition_variable _not_empty;
        std::condition_variable _not_full;
        std::deque<StreamEvent> _events;
        bool _closed{false};
        size_t _blocked_emits{0};
    };

    // Collects every event, for tests and post-run inspection.
    struct BSPGRAPH_EXPORT CollectingStreamSink : StreamSink {
        void emit(StreamEvent event) override;

        [[nodiscard]] std::vector<StreamEvent> events() const;

    private:
        mutable std::mutex _mutex;
        std::vector<StreamEvent> _events;
    };

} // namespace bspgraph

#endif  // BSPGRAPH_RUNTIME_STREAM_H
