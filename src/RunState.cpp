#include "RunState.h"

#include <stdexcept>

RunState::RunState(long totalTimesteps) : current(0), total(totalTimesteps), running(true) {
    if (totalTimesteps < 1) {
        throw std::invalid_argument("total timesteps must be at least 1");
    }
}

bool RunState::claimTimestep(long& timestep) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!running || current >= total) {
        return false;
    }
    timestep = ++current;
    if (current == total) {
        reached.notify_all();
    }
    return true;
}

long RunState::currentTimestep() {
    std::lock_guard<std::mutex> lock(mtx);
    return current;
}

bool RunState::isRunning() {
    std::lock_guard<std::mutex> lock(mtx);
    return running;
}

bool RunState::shouldContinue() {
    std::lock_guard<std::mutex> lock(mtx);
    return running && current < total;
}

bool RunState::stop() {
    std::lock_guard<std::mutex> lock(mtx);
    if (!running) {
        return false;
    }
    running = false;
    reached.notify_all();
    return true;
}

void RunState::waitUntilComplete(std::chrono::milliseconds pollInterval) {
    std::unique_lock<std::mutex> lock(mtx);
    while (current < total) {
        reached.wait_for(lock, pollInterval);
    }
}
