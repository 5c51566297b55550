#ifndef BSPGRAPH_SUPERSTEP_OBSERVER_H
#define BSPGRAPH_SUPERSTEP_OBSERVER_H

#include <bspgraph/runtime/scheduler.h>
#include <bspgraph/util/errors.h>

#include <string>
#include <vector>

namespace bspgraph {

    /**
     * Hooks into the coordinator's phases. Every hook is a no-op by default. on_before_task and on_after_task are
     * called from worker threads, the rest from the thread driving the coordinator.
     */
    struct SuperstepObserver {
        using ptr = SuperstepObserver *;
        using s_ptr = std::shared_ptr<SuperstepObserver>;

        virtual ~SuperstepObserver() = default;

        virtual void on_before_superstep(const std::string &, superstep_t) {
        };

        virtual void on_after_read_phase(superstep_t, const std::vector<std::string> &) {
        };

        virtual void on_before_task(superstep_t, const std::string &) {
        };

        virtual void on_after_task(superstep_t, const std::string &, const TaskCompletion &) {
        };

        virtual void on_after_write_phase(superstep_t, const std::vector<std::string> &) {
        };

        virtual void on_checkpoint(superstep_t, const std::string &) {
        };

        virtual void on_checkpoint_error(superstep_t, const CheckpointError &) {
        };

        virtual void on_interrupt(superstep_t, const std::string &) {
        };

        virtual void on_abort(superstep_t, const CoordinatorError &) {
        };

        virtual void on_terminate(superstep_t) {
        };
    };

} // namespace bspgraph

#endif  // BSPGRAPH_SUPERSTEP_OBSERVER_H
