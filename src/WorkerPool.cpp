#include "WorkerPool.h"

#include <condition_variable>
#include <iostream>
#include <mutex>
#include <random>
#include <sstream>

// --- Worker exit tracking ---

struct ExitBoard {
    std::mutex mtx;
    std::condition_variable cv;
    std::vector<bool> done;

    void add() {
        std::lock_guard<std::mutex> lock(mtx);
        done.push_back(false);
    }

    void markFinished(std::size_t slot) {
        std::lock_guard<std::mutex> lock(mtx);
        done[slot] = true;
        cv.notify_all();
    }

    bool waitFor(std::size_t slot, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx);
        std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + timeout;
        while (!done[slot]) {
            if (cv.wait_until(lock, deadline) == std::cv_status::timeout) {
                return done[slot];
            }
        }
        return true;
    }
};

// Marks the slot finished however the worker leaves its loop
class FinishGuard {
public:
    FinishGuard(ExitBoard& b, std::size_t s) : board(b), slot(s) {}
    ~FinishGuard() { board.markFinished(slot); }

private:
    ExitBoard& board;
    std::size_t slot;
};

// --- Single iterations ---

IterationOutcome produceOnce(LineState& state, int producerId) {
    long timestep = 0;
    if (!state.run.claimTimestep(timestep)) {
        state.buffer.emptySlots().up(); // hand the slot back
        return ITERATION_STOPPED;
    }

    ProduceResult result = state.buffer.tryProduce(Unit(producerId, timestep));
    if (result.accepted) {
        state.stats.recordProduced(timestep, result.size);
        state.buffer.filledSlots().up();
        return ITERATION_ACCEPTED;
    }

    state.stats.recordProducerWait();
    if (state.config.signalPolicy == SIGNAL_UNCONDITIONAL) {
        state.buffer.filledSlots().up();
    }
    return ITERATION_REJECTED;
}

IterationOutcome consumeOnce(LineState& state) {
    Unit unit;
    if (state.buffer.tryConsume(unit)) {
        state.stats.recordConsumed();
        state.buffer.emptySlots().up();
        return ITERATION_ACCEPTED;
    }

    state.stats.recordConsumerWait();
    if (state.config.signalPolicy == SIGNAL_UNCONDITIONAL) {
        state.buffer.emptySlots().up();
    }
    return ITERATION_REJECTED;
}

// --- Worker loops ---

static void throttle(std::mt19937& rng, std::uniform_int_distribution<int>& delay) {
    int micros = delay(rng);
    if (micros > 0) {
        std::this_thread::sleep_for(std::chrono::microseconds(micros));
    }
}

// Takes a token, counting a wait when the worker has to park for it
static void acquire(Semaphore& signal, StatsCollector& stats, bool producer) {
    if (signal.tryDown()) {
        return;
    }
    if (producer) {
        stats.recordProducerWait();
    } else {
        stats.recordConsumerWait();
    }
    signal.down();
}

static void producerMain(std::shared_ptr<LineState> state, std::shared_ptr<ExitBoard> board,
                         std::size_t slot, int id) {
    FinishGuard guard(*board, slot);
    std::random_device rd;
    std::mt19937 rng(rd());
    std::uniform_int_distribution<int> delay(state->config.throttleMinMicros,
                                             state->config.throttleMaxMicros);

    while (state->run.shouldContinue()) {
        acquire(state->buffer.emptySlots(), state->stats, true);

        // Shutdown may have happened while parked
        if (!state->run.shouldContinue()) {
            state->buffer.emptySlots().up();
            break;
        }
        if (produceOnce(*state, id) == ITERATION_STOPPED) {
            break;
        }
        throttle(rng, delay);
    }
}

static void consumerMain(std::shared_ptr<LineState> state, std::shared_ptr<ExitBoard> board,
                         std::size_t slot) {
    FinishGuard guard(*board, slot);
    std::random_device rd;
    std::mt19937 rng(rd());
    std::uniform_int_distribution<int> delay(state->config.throttleMinMicros,
                                             state->config.throttleMaxMicros);

    while (state->run.shouldContinue()) {
        acquire(state->buffer.filledSlots(), state->stats, false);

        if (!state->run.shouldContinue()) {
            state->buffer.filledSlots().up();
            break;
        }
        consumeOnce(*state);
        throttle(rng, delay);
    }
}

// --- WorkerPool ---

WorkerPool::WorkerPool(std::shared_ptr<LineState> s) : state(s), board(new ExitBoard) {}

WorkerPool::~WorkerPool() {
    // Anything still attached here was never joined; it owns its state, let it go
    for (std::size_t i = 0; i < threads.size(); ++i) {
        if (threads[i].joinable()) {
            threads[i].detach();
        }
    }
}

void WorkerPool::spawn() {
    const LineConfig& config = state->config;
    threads.reserve(config.numProducers + config.numConsumers);

    for (int i = 0; i < config.numProducers; ++i) {
        std::ostringstream name;
        name << "Producer-" << i;
        board->add();
        names.push_back(name.str());
        threads.push_back(std::thread(producerMain, state, board, threads.size(), i));
    }
    for (int i = 0; i < config.numConsumers; ++i) {
        std::ostringstream name;
        name << "Consumer-" << i;
        board->add();
        names.push_back(name.str());
        threads.push_back(std::thread(consumerMain, state, board, threads.size()));
    }
}

int WorkerPool::joinAll(std::chrono::milliseconds perWorker) {
    int abandoned = 0;
    for (std::size_t i = 0; i < threads.size(); ++i) {
        if (!threads[i].joinable()) {
            continue;
        }
        if (board->waitFor(i, perWorker)) {
            threads[i].join();
        } else {
            std::cerr << "WARNING: " << names[i] << " did not finish within "
                      << perWorker.count() << " ms, abandoning it" << std::endl;
            threads[i].detach();
            abandoned++;
        }
    }
    return abandoned;
}
