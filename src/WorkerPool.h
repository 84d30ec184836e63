#ifndef WORKER_POOL_H
#define WORKER_POOL_H

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "LineState.h"

enum IterationOutcome {
    ITERATION_ACCEPTED, // unit appended / removed
    ITERATION_REJECTED, // defensive full/empty branch, counted as a wait
    ITERATION_STOPPED   // producer only: no timestep left, token given back
};

// One producer iteration. The caller already holds an emptySlots token.
IterationOutcome produceOnce(LineState& state, int producerId);

// One consumer iteration. The caller already holds a filledSlots token.
IterationOutcome consumeOnce(LineState& state);

struct ExitBoard;

/**
 * Producer and consumer threads of one run.
 *
 * Threads keep their own reference to the shared state, so a worker that
 * misses its join window can be detached without dangling.
*/
class WorkerPool {
public:
    explicit WorkerPool(std::shared_ptr<LineState> state);
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    ~WorkerPool();

    // Starts numProducers producer threads then numConsumers consumer threads
    void spawn();

    // Joins each worker, waiting at most perWorker for it to finish.
    // Workers that don't make it are detached. Returns how many were.
    int joinAll(std::chrono::milliseconds perWorker);

    std::size_t size() const { return threads.size(); }

private:
    std::shared_ptr<LineState> state;
    std::shared_ptr<ExitBoard> board;
    std::vector<std::thread> threads;
    std::vector<std::string> names;
};

#endif
