#include <bspgraph/runtime/cancellation.h>
#include <bspgraph/util/errors.h>

namespace bspgraph {

    CancellationToken::CancellationToken() : _state{std::make_shared<State>()} {}

    CancellationToken::CancellationToken(std::shared_ptr<State> state) : _state{std::move(state)} {}

    bool CancellationToken::is_cancelled() const {
        std::lock_guard lock(_state->mutex);
        return _state->cancelled;
    }

    std::string CancellationToken::reason() const {
        std::lock_guard lock(_state->mutex);
        return _state->reason;
    }

    void CancellationToken::throw_if_cancelled() const {
        std::lock_guard lock(_state->mutex);
        if (_state->cancelled) { throw SchedulerError{SchedulerError::Kind::TASK_CANCELLED, _state->reason}; }
    }

    bool CancellationToken::wait_until(monotonic_time_t deadline) const {
        std::unique_lock lock(_state->mutex);
        return !_state->cv.wait_until(lock, deadline, [this] { return _state->cancelled; });
    }

    CancellationSource::CancellationSource() : _state{std::make_shared<CancellationToken::State>()} {}

    CancellationToken CancellationSource::token() const { return CancellationToken{_state}; }

    void CancellationSource::cancel(std::string reason) {
        std::lock_guard lock(_state->mutex);
        if (_state->cancelled) { return; }
        _state->cancelled = true;
        _state->reason = std::move(reason);
        _state->cv.notify_all();
    }

    bool CancellationSource::is_cancelled() const {
        std::lock_guard lock(_state->mutex);
        return _state->cancelled;
    }

} // namespace bspgraph
