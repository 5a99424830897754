#include "search/frontier.hpp"

#include <stdexcept>

namespace mazepath {

void Frontier::push(size_t node_index, int priority) {
    heap_.push({priority, next_sequence_++, node_index});
}

size_t Frontier::pop() {
    if (heap_.empty()) {
        throw std::runtime_error("Frontier::pop on empty frontier");
    }
    size_t index = heap_.top().node_index;
    heap_.pop();
    return index;
}

void Frontier::clear() {
    heap_ = decltype(heap_)();
    next_sequence_ = 0;
}

} // namespace mazepath
