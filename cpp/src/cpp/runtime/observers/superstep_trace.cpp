#include <bspgraph/runtime/observers/superstep_trace.h>

namespace bspgraph {

    SuperstepTrace::SuperstepTrace(const std::optional<std::string> &filter, bool superstep, bool task, bool write,
                                   bool checkpoint, FILE *out)
        : _filter(filter), _superstep(superstep), _task(task), _write(write), _checkpoint(checkpoint), _out(out) {
    }

    void SuperstepTrace::_print(superstep_t superstep, const std::string &msg) const {
        // Task events arrive from several workers at once.
        std::lock_guard lock(_mutex);
        fmt::print(_out, "[{}] [superstep {}] {}\n", to_micros(engine_now()), superstep, msg);
        std::fflush(_out);
    }

    bool SuperstepTrace::_should_log_node(const std::string &node) const {
        if (!_filter.has_value()) { return true; }
        return node.find(_filter.value()) != std::string::npos;
    }

    void SuperstepTrace::on_before_superstep(const std::string &execution_id, superstep_t superstep) {
        if (_superstep) { _print(superstep, fmt::format("{} starting", execution_id)); }
    }

    void SuperstepTrace::on_after_read_phase(superstep_t superstep, const std::vector<std::string> &nodes) {
        if (_superstep) { _print(superstep, fmt::format("planned [{}]", fmt::join(nodes, ", "))); }
    }

    void SuperstepTrace::on_before_task(superstep_t superstep, const std::string &node) {
        if (_task && _should_log_node(node)) { _print(superstep, fmt::format("{} running", node)); }
    }

    void SuperstepTrace::on_after_task(superstep_t superstep, const std::string &node,
                                       const TaskCompletion &completion) {
        if (!_task || !_should_log_node(node)) { return; }
        if (completion.status == TaskStatus::SUCCEEDED) {
            _print(superstep, fmt::format("{} {} in {}", node, to_string(completion.status), completion.elapsed));
        } else {
            _print(superstep, fmt::format("{} {}: {}", node, to_string(completion.status),
                                          describe_exception(completion.error)));
        }
    }

    void SuperstepTrace::on_after_write_phase(superstep_t superstep, const std::vector<std::string> &changed) {
        if (_write) { _print(superstep, fmt::format("changed [{}]", fmt::join(changed, ", "))); }
    }

    void SuperstepTrace::on_checkpoint(superstep_t superstep, const std::string &checkpoint_id) {
        if (_checkpoint) { _print(superstep, fmt::format("checkpoint {}", checkpoint_id)); }
    }

    void SuperstepTrace::on_checkpoint_error(superstep_t superstep, const CheckpointError &error) {
        if (_checkpoint) { _print(superstep, fmt::format("checkpoint failed: {}", error.what())); }
    }

    void SuperstepTrace::on_interrupt(superstep_t superstep, const std::string &node) {
        if (_superstep && _should_log_node(node)) { _print(superstep, fmt::format("interrupted after {}", node)); }
    }

    void SuperstepTrace::on_abort(superstep_t superstep, const CoordinatorError &error) {
        if (_superstep) { _print(superstep, fmt::format("aborted: {}", error.what())); }
    }

    void SuperstepTrace::on_terminate(superstep_t superstep) {
        if (_superstep) { _print(superstep, "terminated"); }
    }

} // namespace bspgraph
