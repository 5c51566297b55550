#pragma once

#include <bspgraph/runtime/observers/superstep_observer.h>

#include <cstdio>
#include <mutex>
#include <optional>
#include <string>

namespace bspgraph {

    /**
     * @brief Logs the coordinator's progress, one line per event.
     *
     * Voluminous, but helpful when tracing down unexpected scheduling or write behaviour.
     */
    class SuperstepTrace : public SuperstepObserver {
    public:
        /**
         * @param filter Restricts task events to nodes whose name contains this substring
         * @param superstep Log superstep boundaries (read phase, termination, interrupts, aborts)
         * @param task Log task start and completion
         * @param write Log the channels changed by each write phase
         * @param checkpoint Log checkpoint saves and failures
         * @param out Destination stream, stderr by default
         */
        explicit SuperstepTrace(const std::optional<std::string> &filter = std::nullopt, bool superstep = true,
                                bool task = true, bool write = true, bool checkpoint = true, FILE *out = stderr);

        void on_before_superstep(const std::string &execution_id, superstep_t superstep) override;

        void on_after_read_phase(superstep_t superstep, const std::vector<std::string> &nodes) override;

        void on_before_task(superstep_t superstep, const std::string &node) override;

        void on_after_task(superstep_t superstep, const std::string &node, const TaskCompletion &completion) override;

        void on_after_write_phase(superstep_t superstep, const std::vector<std::string> &changed) override;

        void on_checkpoint(superstep_t superstep, const std::string &checkpoint_id) override;

        void on_checkpoint_error(superstep_t superstep, const CheckpointError &error) override;

        void on_interrupt(superstep_t superstep, const std::string &node) override;

        void on_abort(superstep_t superstep, const CoordinatorError &error) override;

        void on_terminate(superstep_t superstep) override;

    private:
        void _print(superstep_t superstep, const std::string &msg) const;

        [[nodiscard]] bool _should_log_node(const std::string &node) const;

        std::optional<std::string> _filter;
        bool _superstep;
        bool _task;
        bool _write;
        bool _checkpoint;
        FILE *_out;
        mutable std::mutex _mutex;
    };

} // namespace bspgraph
