#ifndef PRODUCTION_LINE_H
#define PRODUCTION_LINE_H

#include <chrono>
#include <cstddef>
#include <memory>

#include "Config.h"
#include "LineState.h"
#include "Report.h"
#include "WorkerPool.h"

/**
 * Runs one simulation: spawns the workers, waits for the last timestep,
 * shuts the line down and reports what was observed.
 *
 * Shutdown releases emptySlots once per producer and filledSlots once per
 * consumer, so any worker parked on a signal wakes at least once and sees
 * the run has stopped. When every worker has joined, those wake tokens are
 * taken back, leaving emptySlots + size == capacity and filledSlots == size.
*/
class ProductionLine {
public:
    // Throws ConfigurationError before anything is allocated
    explicit ProductionLine(const LineConfig& config);
    ProductionLine(const ProductionLine&) = delete;
    ProductionLine& operator=(const ProductionLine&) = delete;
    ~ProductionLine();

    void start();

    // Blocks until totalTimesteps is reached, then stops and joins the workers
    void waitCompletion();

    Report report();

    std::size_t bufferSize() { return state->buffer.size(); }
    int emptySlotCount() { return state->buffer.emptySlots().count(); }
    int filledSlotCount() { return state->buffer.filledSlots().count(); }
    long currentTimestep() { return state->run.currentTimestep(); }
    bool isRunning() { return state->run.isRunning(); }
    int abandonedWorkers() const { return abandoned; }
    ProductionStats stats() { return state->stats.snapshot(); }

private:
    void shutdown();

    const LineConfig cfg;
    std::shared_ptr<LineState> state;
    WorkerPool pool;

    bool started;
    bool completed;
    int abandoned;
    std::chrono::steady_clock::time_point startTime;
    std::chrono::steady_clock::time_point endTime;
};

#endif
