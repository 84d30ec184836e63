#include "Semaphore.h"

#include <stdexcept>

Semaphore::Semaphore(int initCount) : value(initCount) {
    if (initCount < 0) {
        throw std::invalid_argument("semaphore count cannot be negative");
    }
}

void Semaphore::down() {
    std::unique_lock<std::mutex> lock(mtx);
    while (value == 0) {
        cv.wait(lock);
    }
    value--;
}

bool Semaphore::tryDown() {
    std::unique_lock<std::mutex> lock(mtx);
    if (value == 0) {
        return false;
    }
    value--;
    return true;
}

void Semaphore::up() {
    std::unique_lock<std::mutex> lock(mtx);
    value++;
    cv.notify_one();
}

int Semaphore::count() {
    std::unique_lock<std::mutex> lock(mtx);
    return value;
}
