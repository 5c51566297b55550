#include <bspgraph/runtime/checkpointer.h>
#include <bspgraph/util/errors.h>

#include <algorithm>

namespace bspgraph {

    std::string InMemoryCheckpointer::make_checkpoint_id(const std::string &execution_id, generation_t generation) {
        return fmt::format("ckpt-{}-{}", execution_id, generation);
    }

    std::string InMemoryCheckpointer::save(const std::string &execution_id, generation_t generation,
                                           const channel_checkpoints_t &channels, const Value &metadata) {
        if (execution_id.empty()) {
            throw CheckpointError{CheckpointError::Kind::SAVE_FAILED, "execution id must not be empty"};
        }
        auto payload = encode_value(Value::map({
            {"generation", generation},
            {"channels", Value{channels}},
            {"metadata", metadata},
        }));

        std::lock_guard lock(_mutex);
        auto &entries = _entries[execution_id];
        if (!entries.empty() && entries.back().metadata.generation >= generation) {
            throw CheckpointError{CheckpointError::Kind::SAVE_FAILED,
                                  fmt::format("generation {} is not after the latest stored generation {} of '{}'",
                                              generation, entries.back().metadata.generation, execution_id)};
        }
        auto id = make_checkpoint_id(execution_id, generation);
        entries.push_back(Entry{CheckpointMetadata{id, execution_id, generation, engine_now(), metadata},
                                std::move(payload)});
        return id;
    }

    std::optional<CheckpointRecord> InMemoryCheckpointer::load(const std::string &execution_id,
                                                               const std::optional<std::string> &checkpoint_id) {
        Entry entry;
        {
            std::lock_guard lock(_mutex);
            auto it = _entries.find(execution_id);
            if (it == _entries.end() || it->second.empty()) { return std::nullopt; }
            const auto &entries = it->second;
            if (!checkpoint_id) {
                entry = entries.back();
            } else {
                auto found = std::find_if(entries.begin(), entries.end(), [&](const Entry &e) {
                    return e.metadata.checkpoint_id == *checkpoint_id;
                });
                if (found == entries.end()) { return std::nullopt; }
                entry = *found;
            }
        }

        try {
            auto decoded = decode_value(entry.payload);
            auto generation = decoded.at("generation").as_int();
            if (generation != entry.metadata.generation) {
                throw CheckpointError{CheckpointError::Kind::INVALID_DATA,
                                      fmt::format("stored generation {} does not match its record {}", generation,
                                                  entry.metadata.generation)};
            }
            return CheckpointRecord{decoded.at("channels").as_map(), generation, std::move(entry.metadata)};
        } catch (const CheckpointError &) {
            throw;
        } catch (const std::exception &e) {
            throw CheckpointError{CheckpointError::Kind::LOAD_FAILED,
                                  fmt::format("checkpoint '{}' could not be decoded: {}",
                                              entry.metadata.checkpoint_id, e.what())};
        }
    }

    std::vector<CheckpointMetadata> InMemoryCheckpointer::list(const std::string &execution_id, size_t limit) {
        std::lock_guard lock(_mutex);
        std::vector<CheckpointMetadata> result;
        auto it = _entries.find(execution_id);
        if (it == _entries.end()) { return result; }
        for (auto e = it->second.rbegin(); e != it->second.rend(); ++e) {
            if (limit > 0 && result.size() >= limit) { break; }
            result.push_back(e->metadata);
        }
        return result;
    }

    void InMemoryCheckpointer::remove(const std::string &execution_id, const std::string &checkpoint_id) {
        std::lock_guard lock(_mutex);
        auto it = _entries.find(execution_id);
        if (it != _entries.end()) {
            auto erased = std::erase_if(it->second, [&](const Entry &e) {
                return e.metadata.checkpoint_id == checkpoint_id;
            });
            if (erased > 0) { return; }
        }
        throw CheckpointError{CheckpointError::Kind::NOT_FOUND,
                              fmt::format("no checkpoint '{}' for execution '{}'", checkpoint_id, execution_id)};
    }

    size_t InMemoryCheckpointer::size(const std::string &execution_id) const {
        std::lock_guard lock(_mutex);
        auto it = _entries.find(execution_id);
        return it == _entries.end() ? 0 : it->second.size();
    }

    void InMemoryCheckpointer::clear() {
        std::lock_guard lock(_mutex);
        _entries.clear();
    }

} // namespace bspgraph
