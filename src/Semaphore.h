#ifndef SEMAPHORE_H
#define SEMAPHORE_H

#include <condition_variable>
#include <mutex>

/**
 * Counting semaphore built from a mutex and a condition variable.
 * down() blocks while the count is zero, up() wakes a single waiter.
*/
class Semaphore {
public:
    explicit Semaphore(int initCount);

    // Waits until the count is positive, then decrements it
    void down();

    // Decrements the count only if it is positive, never blocks
    bool tryDown();

    // Increments the count and wakes one waiter
    void up();

    // Current count, taken under the semaphore's lock
    int count();

private:
    std::mutex mtx;
    std::condition_variable cv;
    int value;
};

#endif
