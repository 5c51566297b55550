#ifndef BSPGRAPH_LIFECYCLE_H
#define BSPGRAPH_LIFECYCLE_H

#include <bspgraph/bspgraph_base.h>

#include <atomic>

namespace bspgraph {
    struct ComponentLifeCycle;

    void BSPGRAPH_EXPORT initialise_component(ComponentLifeCycle &component);

    void BSPGRAPH_EXPORT start_component(ComponentLifeCycle &component);

    void BSPGRAPH_EXPORT stop_component(ComponentLifeCycle &component);

    void BSPGRAPH_EXPORT dispose_component(ComponentLifeCycle &component);

    struct TransitionGuard;

    /**
     * Starts the component in the constructor and stops it in the destructor. Errors raised by stop are logged to
     * stderr, call stop_component explicitly when they need to propagate.
     */
    struct BSPGRAPH_EXPORT StartStopContext {
        explicit StartStopContext(ComponentLifeCycle &component);

        ~StartStopContext() noexcept;

    private:
        ComponentLifeCycle &_component;
    };

    /**
     * The Life-cycle and associated method calls are as follows:
     *
     * * The component is constructed, configuration is supplied at this point.
     *
     * * initialise is called once, prior to the first start.
     *
     * * start is called prior to normal operation, for the scheduler this spawns the worker threads.
     *
     * * stop is called once normal operation is expected to cease, threads are joined here. Outstanding work is
     *   cancelled.
     *
     * * dispose is called once the component is no longer required.
     *
     * NOTE: start and stop can be called numerous times during the life-time of the component. The component must be
     *       able to start again cleanly after stop has been called.
     */
    struct BSPGRAPH_EXPORT ComponentLifeCycle {
        virtual ~ComponentLifeCycle() = default;

        /**
         * The componented is started (true) or stopped (false).
         * By default, this is stopped.
         */
        [[nodiscard]] bool is_started() const;

        [[nodiscard]] bool is_starting() const;

        [[nodiscard]] bool is_stopping() const;

    protected:
        virtual void initialise() = 0;

        virtual void start() = 0;

        virtual void stop() = 0;

        virtual void dispose() = 0;

    private:
        // Read from worker threads, written by the owning thread.
        std::atomic<bool> _started{false};
        std::atomic<bool> _transitioning{false};

        friend TransitionGuard;

        friend void initialise_component(ComponentLifeCycle &component);

        friend void start_component(ComponentLifeCycle &component);

        friend void stop_component(ComponentLifeCycle &component);

        friend void dispose_component(ComponentLifeCycle &component);
    };
} // namespace bspgraph

#endif  // BSPGRAPH_LIFECYCLE_H
