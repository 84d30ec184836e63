#include "BoundedBuffer.h"

#include <climits>
#include <stdexcept>

static int checkedCapacity(std::size_t capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("buffer capacity must be at least 1");
    }
    if (capacity > static_cast<std::size_t>(INT_MAX)) {
        throw std::invalid_argument("buffer capacity does not fit a semaphore count");
    }
    return static_cast<int>(capacity);
}

BoundedBuffer::BoundedBuffer(std::size_t capacity)
    : cap(capacity), empty(checkedCapacity(capacity)), full(0) {}

ProduceResult BoundedBuffer::tryProduce(const Unit& unit) {
    std::lock_guard<std::mutex> lock(mtx);

    ProduceResult result;
    // Only reachable without space if a stray release slipped in at shutdown
    if (q.size() >= cap) {
        result.accepted = false;
        result.size = q.size();
        return result;
    }

    q.push_back(unit);
    result.accepted = true;
    result.size = q.size();
    return result;
}

bool BoundedBuffer::tryConsume(Unit& out) {
    std::lock_guard<std::mutex> lock(mtx);
    if (q.empty()) {
        return false;
    }
    out = q.front();
    q.pop_front();
    return true;
}

std::size_t BoundedBuffer::size() {
    std::lock_guard<std::mutex> lock(mtx);
    return q.size();
}
