#ifndef RUN_STATE_H
#define RUN_STATE_H

#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * Timestep counter and running flag shared by every worker of one run.
 * Guarded by its own lock, never taken while the buffer or stats lock is held.
*/
class RunState {
public:
    explicit RunState(long totalTimesteps);

    // Hands out the next timestep (1-based) while the run is live and the
    // target hasn't been reached. Returns false otherwise.
    bool claimTimestep(long& timestep);

    long currentTimestep();
    long totalTimesteps() const { return total; }
    bool isRunning();

    // running && currentTimestep < totalTimesteps
    bool shouldContinue();

    // Clears the running flag. Only the first call returns true.
    bool stop();

    // Blocks until the target timestep is reached, rechecking every poll
    // interval in case a notification is missed.
    void waitUntilComplete(std::chrono::milliseconds pollInterval);

private:
    std::mutex mtx;
    std::condition_variable reached;
    long current;
    const long total;
    bool running;
};

#endif
