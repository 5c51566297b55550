#include <bspgraph/runtime/admission_gate.h>

#include <algorithm>
#include <stdexcept>

namespace bspgraph {

    namespace {
        // Cancellation is observed by polling between waits on the gate.
        constexpr auto CANCELLATION_POLL_INTERVAL = std::chrono::milliseconds(2);
    } // namespace

    AdmissionGate::AdmissionGate(size_t permits) : _capacity{permits} {
        if (permits == 0) { throw std::invalid_argument("AdmissionGate requires at least one permit"); }
    }

    bool AdmissionGate::acquire(const CancellationToken &token) {
        std::unique_lock lock(_mutex);
        while (_in_use >= _capacity) {
            if (token.is_cancelled()) { return false; }
            _cv.wait_for(lock, CANCELLATION_POLL_INTERVAL);
        }
        if (token.is_cancelled()) { return false; }
        ++_in_use;
        _peak = std::max(_peak, _in_use);
        return true;
    }

    bool AdmissionGate::try_acquire() {
        std::lock_guard lock(_mutex);
        if (_in_use >= _capacity) { return false; }
        ++_in_use;
        _peak = std::max(_peak, _in_use);
        return true;
    }

    void AdmissionGate::release() {
        {
            std::lock_guard lock(_mutex);
            if (_in_use == 0) { throw std::logic_error("AdmissionGate released more permits than acquired"); }
            --_in_use;
        }
        _cv.notify_one();
    }

    size_t AdmissionGate::in_use() const {
        std::lock_guard lock(_mutex);
        return _in_use;
    }

    size_t AdmissionGate::peak_in_use() const {
        std::lock_guard lock(_mutex);
        return _peak;
    }

    void AdmissionGate::reset_peak() {
        std::lock_guard lock(_mutex);
        _peak = _in_use;
    }

    void AdmissionPermit::release() {
        if (_gate == nullptr) { return; }
        std::exchange(_gate, nullptr)->release();
    }

} // namespace bspgraph
