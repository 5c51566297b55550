#include <bspgraph/util/lifecycle.h>

#include <cstdio>
#include <exception>

namespace bspgraph {
    bool ComponentLifeCycle::is_started() const { return _started; }

    bool ComponentLifeCycle::is_starting() const { return _transitioning && !_started; }

    bool ComponentLifeCycle::is_stopping() const { return _transitioning && _started; }

    struct TransitionGuard {
        explicit TransitionGuard(ComponentLifeCycle &component) : _component{component} {
            _component._transitioning = true;
        }

        ~TransitionGuard() { _component._transitioning = false; }

    private:
        ComponentLifeCycle &_component;
    };

    void initialise_component(ComponentLifeCycle &component) { component.initialise(); }

    /*
     * NOTE the LifeCycle methods are expected to be called from the owning thread, so the simple guard clauses
     * used here are sufficient to ensure we don't accidentally start/stop more than once.
     */

    void start_component(ComponentLifeCycle &component) {
        if (component.is_started() || component.is_starting()) { return; }
        TransitionGuard guard{component};
        component.start();
        // A throwing start leaves the started flag false, the guard still clears the transition.
        component._started = true;
    }

    void stop_component(ComponentLifeCycle &component) {
        if (!component.is_started() || component.is_stopping()) { return; }
        TransitionGuard guard{component};
        component.stop();
        component._started = false;
    }

    void dispose_component(ComponentLifeCycle &component) { component.dispose(); }

    StartStopContext::StartStopContext(ComponentLifeCycle &component) : _component{component} {
        start_component(_component);
    }

    StartStopContext::~StartStopContext() noexcept {
        try {
            stop_component(_component);
        } catch (const std::exception &e) {
            fmt::print(stderr, "Warning: exception during stop_component: {}\n", e.what());
        }
    }
} // namespace bspgraph
