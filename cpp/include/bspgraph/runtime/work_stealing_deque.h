#ifndef BSPGRAPH_RUNTIME_WORK_STEALING_DEQUE_H
#define BSPGRAPH_RUNTIME_WORK_STEALING_DEQUE_H

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace bspgraph {

    /**
     * A worker's local queue. Entries keep their insertion sequence; selection takes the highest rank as computed by
     * the caller at the time of the pop, so deadline urgency is evaluated when a task is picked rather than when it
     * was queued.
     *
     * The owner takes the newest entry among equal ranks (locality), a thief the oldest. Stealing only succeeds when
     * the victim holds more than one entry so an owner is never left with nothing to run.
     *
     * A mutex per deque: there is no global lock on the dispatch path, contention is limited to an owner and its
     * thieves.
     */
    template<typename T>
    struct WorkStealingDeque {
        void push(T item) {
            std::lock_guard lock(_mutex);
            _items.push_back(std::move(item));
        }

        // rank(const T &) -> int64_t
        template<typename Rank>
        std::optional<T> pop(Rank &&rank) {
            std::lock_guard lock(_mutex);
            if (_items.empty()) { return std::nullopt; }
            return take(select(rank, true));
        }

        template<typename Rank>
        std::optional<T> steal(Rank &&rank) {
            std::lock_guard lock(_mutex);
            if (_items.size() <= 1) { return std::nullopt; }
            return take(select(rank, false));
        }

        // Removes and returns every entry, oldest first.
        std::deque<T> drain() {
            std::lock_guard lock(_mutex);
            return std::exchange(_items, {});
        }

        [[nodiscard]] size_t size() const {
            std::lock_guard lock(_mutex);
            return _items.size();
        }

        [[nodiscard]] bool empty() const { return size() == 0; }

    private:
        // Items are stored oldest first, so newest-wins is a >= scan and oldest-wins a > scan.
        template<typename Rank>
        size_t select(Rank &rank, bool prefer_newest) const {
            size_t best{0};
            int64_t best_rank{rank(_items[0])};
            for (size_t i = 1; i < _items.size(); ++i) {
                auto r = rank(_items[i]);
                if (r > best_rank || (prefer_newest && r == best_rank)) {
                    best = i;
                    best_rank = r;
                }
            }
            return best;
        }

        T take(size_t index) {
            auto it = _items.begin() + static_cast<std::ptrdiff_t>(index);
            T item = std::move(*it);
            _items.erase(it);
            return item;
        }

        mutable std::mutex _mutex;
        std::deque<T> _items;
    };

} // namespace bspgraph

#endif  // BSPGRAPH_RUNTIME_WORK_STEALING_DEQUE_H
