#include <bspgraph/runtime/stream.h>

#include <stdexcept>

namespace bspgraph {

    BoundedEventStream::BoundedEventStream(size_t capacity) : _capacity{capacity} {
        if (capacity == 0) { throw std::invalid_argument("BoundedEventStream capacity must be at least 1"); }
    }

    void BoundedEventStream::emit(StreamEvent event) {
        std::unique_lock lock(_mutex);
        if (_events.size() >= _capacity && !_closed) { ++_blocked_emits; }
        _not_full.wait(lock, [this] { return _events.size() < _capacity || _closed; });
        if (_closed) { throw std::logic_error("emit on a closed event stream"); }
        _events.push_back(std::move(event));
        _not_empty.notify_one();
    }

    std::optional<StreamEvent> BoundedEventStream::next() {
        std::unique_lock lock(_mutex);
        _not_empty.wait(lock, [this] { return !_events.empty() || _closed; });
        if (_events.empty()) { return std::nullopt; }
        auto event = std::move(_events.front());
        _events.pop_front();
        _not_full.notify_one();
        return event;
    }

    std::optional<StreamEvent> BoundedEventStream::try_next() {
        std::lock_guard lock(_mutex);
        if (_events.empty()) { return std::nullopt; }
        auto event = std::move(_events.front());
        _events.pop_front();
        _not_full.notify_one();
        return event;
    }

    void BoundedEventStream::close() {
        std::lock_guard lock(_mutex);
        _closed = true;
        _not_empty.notify_all();
        _not_full.notify_all();
    }

    bool BoundedEventStream::is_closed() const {
        std::lock_guard lock(_mutex);
        return _closed;
    }

    size_t BoundedEventStream::size() const {
        std::lock_guard lock(_mutex);
        return _events.size();
    }

    size_t BoundedEventStream::blocked_emits() const {
        std::lock_guard lock(_mutex);
        return _blocked_emits;
    }

    void CollectingStreamSink::emit(StreamEvent event) {
        std::lock_guard lock(_mutex);
        _events.push_back(std::move(event));
    }

    std::vector<StreamEvent> CollectingStreamSink::events() const {
        std::lock_guard lock(_mutex);
        return _events;
    }

} // namespace bspgraph
