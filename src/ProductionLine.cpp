#include "ProductionLine.h"

#include <iostream>
#include <stdexcept>

static const LineConfig& validated(const LineConfig& config) {
    validateConfig(config);
    return config;
}

ProductionLine::ProductionLine(const LineConfig& config)
    : cfg(validated(config)),
      state(std::make_shared<LineState>(cfg)),
      pool(state),
      started(false),
      completed(false),
      abandoned(0) {}

ProductionLine::~ProductionLine() {
    if (started && !completed) {
        shutdown();
    }
}

void ProductionLine::start() {
    if (started) {
        throw std::logic_error("production line already started");
    }

    std::cout << "Starting production line simulation..." << std::endl;
    std::cout << "  Buffer: " << cfg.bufferCapacity << " items" << std::endl;
    std::cout << "  Producers: " << cfg.numProducers << std::endl;
    std::cout << "  Consumers: " << cfg.numConsumers << std::endl;
    std::cout << "  Timesteps: " << cfg.totalTimesteps << std::endl;
    std::cout << "  Signal policy: " << signalPolicyName(cfg.signalPolicy) << std::endl;

    started = true;
    startTime = std::chrono::steady_clock::now();
    pool.spawn();

    std::cout << "Threads started, waiting for completion..." << std::endl;
}

void ProductionLine::waitCompletion() {
    if (!started) {
        throw std::logic_error("waitCompletion() called before start()");
    }
    if (completed) {
        return;
    }

    state->run.waitUntilComplete(std::chrono::milliseconds(cfg.pollIntervalMillis));
    shutdown();

    std::cout << "Simulation finished." << std::endl;
}

void ProductionLine::shutdown() {
    state->run.stop();

    // One wake per worker that may be parked on each signal
    for (int i = 0; i < cfg.numProducers; ++i) {
        state->buffer.emptySlots().up();
    }
    for (int i = 0; i < cfg.numConsumers; ++i) {
        state->buffer.filledSlots().up();
    }

    abandoned = pool.joinAll(std::chrono::milliseconds(cfg.joinTimeoutMillis));
    endTime = std::chrono::steady_clock::now();
    completed = true;

    if (abandoned > 0) {
        std::cerr << "WARNING: " << abandoned
                  << " worker(s) abandoned, shutdown wake tokens left in place" << std::endl;
        return;
    }

    // Every worker is gone and each one handed back any wake token it took
    for (int i = 0; i < cfg.numProducers; ++i) {
        state->buffer.emptySlots().tryDown();
    }
    for (int i = 0; i < cfg.numConsumers; ++i) {
        state->buffer.filledSlots().tryDown();
    }
}

Report ProductionLine::report() {
    ProductionStats stats = state->stats.snapshot();

    Report r;
    r.bufferCapacity = cfg.bufferCapacity;
    r.numProducers = cfg.numProducers;
    r.numConsumers = cfg.numConsumers;
    r.totalTimesteps = cfg.totalTimesteps;

    r.totalProduced = stats.totalProduced;
    r.totalConsumed = stats.totalConsumed;
    r.remainingInBuffer = state->buffer.size();
    r.producerWaits = stats.producerWaits;
    r.consumerWaits = stats.consumerWaits;
    r.bufferSnapshots = stats.bufferSnapshots;
    r.abandonedWorkers = abandoned;

    double elapsed = 0.0;
    if (completed) {
        elapsed = std::chrono::duration<double>(endTime - startTime).count();
    }
    r.elapsedSeconds = roundTo2(elapsed);
    if (elapsed > 0) {
        r.producedPerSecond = roundTo2(stats.totalProduced / elapsed);
        r.consumedPerSecond = roundTo2(stats.totalConsumed / elapsed);
    }
    return r;
}
