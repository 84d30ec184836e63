#ifndef BOUNDED_BUFFER_H
#define BOUNDED_BUFFER_H

#include <cstddef>
#include <deque>
#include <mutex>

#include "Semaphore.h"

/**
 * One produced piece, tagged with its producer and the timestep it was made at
*/
struct Unit {
    int producerId;
    long timestep;

    Unit() : producerId(-1), timestep(0) {}
    Unit(int id, long t) : producerId(id), timestep(t) {}
};

struct ProduceResult {
    bool accepted;
    std::size_t size; // buffer length seen under the lock, after the operation
};

/**
 * FIFO buffer of fixed capacity shared by producers and consumers.
 *
 * The buffer owns the two counting signals that gate it: emptySlots starts at
 * the capacity and filledSlots at zero. Callers take the matching signal
 * before touching the buffer and release the opposite one afterwards; the
 * try* methods only guard the contents with the buffer's own lock.
*/
class BoundedBuffer {
public:
    explicit BoundedBuffer(std::size_t capacity);
    BoundedBuffer(const BoundedBuffer&) = delete;
    BoundedBuffer& operator=(const BoundedBuffer&) = delete;

    // Appends at the tail. Caller must already hold an emptySlots token.
    ProduceResult tryProduce(const Unit& unit);

    // Removes the head into 'out'. Caller must already hold a filledSlots token.
    bool tryConsume(Unit& out);

    std::size_t size();
    std::size_t capacity() const { return cap; }

    Semaphore& emptySlots() { return empty; }
    Semaphore& filledSlots() { return full; }

private:
    std::size_t cap;
    std::deque<Unit> q;
    std::mutex mtx;
    Semaphore empty; // free slots
    Semaphore full;  // units ready to consume
};

#endif
