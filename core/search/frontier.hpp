#pragma once

#include <cstddef>
#include <cstdint>
#include <queue>
#include <vector>

namespace mazepath {

/// Min-priority queue of arena node indices.
/// Ordered by (priority, insertion sequence): among equal priorities the
/// node pushed first is popped first, which keeps searches reproducible.
class Frontier {
public:
    void push(size_t node_index, int priority);

    /// Remove and return the lowest-priority entry.
    /// Throws std::runtime_error when empty.
    size_t pop();

    bool empty() const { return heap_.empty(); }
    size_t size() const { return heap_.size(); }

    /// Drop all entries and restart the insertion sequence.
    void clear();

private:
    struct Entry {
        int priority;
        uint64_t sequence;
        size_t node_index;
    };

    // std::priority_queue is a max-heap, so "less" means "pops later".
    struct PopsLater {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.priority != b.priority) return a.priority > b.priority;
            return a.sequence > b.sequence;
        }
    };

    std::priority_queue<Entry, std::vector<Entry>, PopsLater> heap_;
    uint64_t next_sequence_ = 0;
};

} // namespace mazepath
