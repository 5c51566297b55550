#ifndef BSPGRAPH_RUNTIME_CHECKPOINTER_H
#define BSPGRAPH_RUNTIME_CHECKPOINTER_H

#include <bspgraph/types/channel_registry.h>
#include <bspgraph/types/value_codec.h>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bspgraph {

    struct CheckpointMetadata {
        std::string checkpoint_id;
        std::string execution_id;
        generation_t generation;
        engine_time_t created_at;
        // Coordinator supplied: superstep, status and the pending tasks.
        Value metadata;
    };

    struct CheckpointRecord {
        channel_checkpoints_t channels;
        generation_t generation;
        CheckpointMetadata metadata;
    };

    /**
     * Persistence of channel checkpoints. The coordinator only depends on this interface, storage backends live
     * outside the engine. Implementations report failures with CheckpointError.
     */
    struct BSPGRAPH_EXPORT Checkpointer {
        using s_ptr = std::shared_ptr<Checkpointer>;

        virtual ~Checkpointer() = default;

        // Returns the id of the stored checkpoint.
        virtual std::string save(const std::string &execution_id, generation_t generation,
                                 const channel_checkpoints_t &channels, const Value &metadata) = 0;

        // The named checkpoint, or the latest one when no id is given. nullopt when there is none.
        [[nodiscard]] virtual std::optional<CheckpointRecord> load(
            const std::string &execution_id, const std::optional<std::string> &checkpoint_id = std::nullopt) = 0;

        // Newest first, limit 0 returns everything.
        [[nodiscard]] virtual std::vector<CheckpointMetadata> list(const std::string &execution_id,
                                                                   size_t limit = 0) = 0;

        // Raises CheckpointError(NOT_FOUND) for an unknown id.
        virtual void remove(const std::string &execution_id, const std::string &checkpoint_id) = 0;
    };

    /**
     * Keeps checkpoints in process memory as encoded bytes, so every load goes through the same decode path a
     * durable backend would. Thread safe.
     */
    struct BSPGRAPH_EXPORT InMemoryCheckpointer : Checkpointer {
        std::string save(const std::string &execution_id, generation_t generation,
                         const channel_checkpoints_t &channels, const Value &metadata) override;

        [[nodiscard]] std::optional<CheckpointRecord> load(
            const std::string &execution_id, const std::optional<std::string> &checkpoint_id = std::nullopt) override;

        [[nodiscard]] std::vector<CheckpointMetadata> list(const std::string &execution_id, size_t limit = 0) override;

        void remove(const std::string &execution_id, const std::string &checkpoint_id) override;

        [[nodiscard]] size_t size(const std::string &execution_id) const;

        void clear();

        static std::string make_checkpoint_id(const std::string &execution_id, generation_t generation);

    private:
        struct Entry {
            CheckpointMetadata metadata;
            bytes_t payload;
        };

        mutable std::mutex _mutex;
        // Per execution, in generation order.
        std::map<std::string, std::vector<Entry>> _entries;
    };

} // namespace bspgraph

#endif  // BSPGRAPH_RUNTIME_CHECKPOINTER_H
