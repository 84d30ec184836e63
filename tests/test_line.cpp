// ============================================================================
// Test Suite: ProductionLine end to end
// ============================================================================
// Reduced-scale runs with validation bypassed; invariants are checked at
// quiescence, right after waitCompletion() returns.
// ============================================================================

#include "ProductionLine.h"
#include "TestHarness.h"

#include <atomic>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <thread>

TestResults results;

static LineConfig reduced(std::size_t capacity, int producers, int consumers, long timesteps) {
    LineConfig config;
    config.bufferCapacity = capacity;
    config.numProducers = producers;
    config.numConsumers = consumers;
    config.totalTimesteps = timesteps;
    config.validate = false;
    return config;
}

static std::string counts(const Report& r) {
    std::ostringstream ss;
    ss << "produced=" << r.totalProduced << " consumed=" << r.totalConsumed
       << " remaining=" << r.remainingInBuffer;
    return ss.str();
}

void test_toy_run_conserves_units() {
    ProductionLine line(reduced(10, 2, 3, 100));
    line.start();
    line.waitCompletion();
    Report r = line.report();

    bool success = r.totalConsumed + static_cast<long>(r.remainingInBuffer) == r.totalProduced &&
                   r.remainingInBuffer <= 10 && r.totalProduced == 100 &&
                   line.currentTimestep() == 100 && !line.isRunning();
    results.report("test_toy_run_conserves_units", success, counts(r));
}

void test_signal_conservation_at_quiescence() {
    ProductionLine line(reduced(10, 2, 3, 100));
    line.start();
    line.waitCompletion();

    int size = static_cast<int>(line.bufferSize());
    bool success = line.abandonedWorkers() == 0 &&
                   line.emptySlotCount() + size == 10 &&
                   line.filledSlotCount() == size;
    std::ostringstream msg;
    msg << "empty=" << line.emptySlotCount() << " filled=" << line.filledSlotCount() << " size=" << size;
    results.report("test_signal_conservation_at_quiescence", success, msg.str());
}

void test_snapshots_bounded_and_on_cadence() {
    LineConfig config = reduced(8, 3, 4, 1000);
    ProductionLine line(config);
    line.start();
    line.waitCompletion();
    Report r = line.report();

    bool bounded = true;
    for (std::size_t i = 0; i < r.bufferSnapshots.size(); ++i) {
        if (r.bufferSnapshots[i] > config.bufferCapacity) bounded = false;
    }
    long expected = config.totalTimesteps / config.snapshotInterval();
    long got = static_cast<long>(r.bufferSnapshots.size());
    bool cadence = got >= expected - 1 && got <= expected + 1;

    std::ostringstream msg;
    msg << "snapshots=" << got << " expected=" << expected;
    results.report("test_snapshots_bounded_and_on_cadence", bounded && cadence, msg.str());
}

void test_counters_are_monotonic() {
    ProductionLine line(reduced(5, 3, 3, 2000));
    line.start();

    bool monotonic = true;
    ProductionStats last = line.stats();
    long lastStep = line.currentTimestep();
    while (line.currentTimestep() < 2000) {
        ProductionStats now = line.stats();
        long step = line.currentTimestep();
        if (now.totalProduced < last.totalProduced || now.totalConsumed < last.totalConsumed ||
            now.producerWaits < last.producerWaits || now.consumerWaits < last.consumerWaits ||
            step < lastStep || step > 2000) {
            monotonic = false;
        }
        last = now;
        lastStep = step;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    line.waitCompletion();

    results.report("test_counters_are_monotonic", monotonic, monotonic ? "" : "A counter went backwards");
}

void test_single_slot_buffer_records_waits() {
    ProductionLine line(reduced(1, 2, 2, 400));
    line.start();
    line.waitCompletion();
    Report r = line.report();

    std::ostringstream msg;
    msg << "producerWaits=" << r.producerWaits << " consumerWaits=" << r.consumerWaits;
    bool success = r.producerWaits > 0 && r.consumerWaits > 0 && r.remainingInBuffer <= 1 &&
                   r.totalConsumed + static_cast<long>(r.remainingInBuffer) == r.totalProduced;
    results.report("test_single_slot_buffer_records_waits", success, msg.str());
}

// Unconditional policy: the other side is signalled even on a defensive miss
void test_unconditional_policy_run_terminates() {
    LineConfig config = reduced(4, 3, 4, 300);
    config.signalPolicy = SIGNAL_UNCONDITIONAL;
    ProductionLine line(config);
    line.start();
    line.waitCompletion();
    Report r = line.report();

    bool success = !line.isRunning() && line.currentTimestep() == 300 &&
                   r.totalConsumed + static_cast<long>(r.remainingInBuffer) == r.totalProduced &&
                   r.remainingInBuffer <= 4;
    results.report("test_unconditional_policy_run_terminates", success, counts(r));
}

void test_validated_construction_rejects_small_buffer() {
    LineConfig config = reduced(1, 1, 1, 1000000);
    config.validate = true;
    bool threw = false;
    std::string what;
    try {
        ProductionLine line(config);
    } catch (const ConfigurationError& e) {
        threw = true;
        what = e.what();
    }
    bool success = threw && what.find("buffer capacity") != std::string::npos;
    results.report("test_validated_construction_rejects_small_buffer", success,
                   threw ? what : "Expected ConfigurationError");
}

void test_lifecycle_misuse() {
    ProductionLine line(reduced(4, 1, 1, 20));
    bool waitBeforeStart = false;
    try {
        line.waitCompletion();
    } catch (const std::logic_error&) {
        waitBeforeStart = true;
    }

    line.start();
    bool doubleStart = false;
    try {
        line.start();
    } catch (const std::logic_error&) {
        doubleStart = true;
    }
    line.waitCompletion();
    line.waitCompletion();

    bool success = waitBeforeStart && doubleStart && line.currentTimestep() == 20;
    results.report("test_lifecycle_misuse", success, success ? "" : "Lifecycle misuse not rejected");
}

void test_report_before_completion_has_no_rates() {
    ProductionLine line(reduced(4, 1, 1, 20));
    Report r = line.report();
    bool success = r.elapsedSeconds == 0 && r.producedPerSecond == 0 && r.consumedPerSecond == 0 &&
                   r.totalProduced == 0 && r.bufferCapacity == 4 && r.totalTimesteps == 20;
    results.report("test_report_before_completion_has_no_rates", success,
                   success ? "" : "Unstarted run reported activity");
}

// Dropping a running line must stop and join its workers
void test_destructor_shuts_down_running_line() {
    std::chrono::steady_clock::time_point begin = std::chrono::steady_clock::now();
    {
        ProductionLine line(reduced(4, 2, 2, 100000000L));
        line.start();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    double took = std::chrono::duration<double>(std::chrono::steady_clock::now() - begin).count();
    bool success = took < 5.0;
    results.report("test_destructor_shuts_down_running_line", success,
                   success ? "" : "Destructor did not stop the workers");
}

// Workers still sleeping through a long throttle miss a zero-length join window
void test_late_workers_are_abandoned() {
    LineConfig config = reduced(4, 2, 2, 2);
    config.throttleMinMicros = 2000000;
    config.throttleMaxMicros = 2000000;
    config.joinTimeoutMillis = 0;

    ProductionLine line(config);
    std::chrono::steady_clock::time_point begin = std::chrono::steady_clock::now();
    line.start();
    line.waitCompletion();
    double took = std::chrono::duration<double>(std::chrono::steady_clock::now() - begin).count();

    // let any iteration that was mid-flight at shutdown settle its counters
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    Report r = line.report();
    std::ostringstream text;
    printReport(r, text);

    bool success = line.abandonedWorkers() > 0 && r.abandonedWorkers == line.abandonedWorkers() &&
                   !line.isRunning() && took < 1.5 && r.totalProduced == 2 &&
                   r.totalConsumed + static_cast<long>(r.remainingInBuffer) == r.totalProduced &&
                   text.str().find("Abandoned workers") != std::string::npos;
    std::ostringstream msg;
    msg << "abandoned=" << line.abandonedWorkers() << " took=" << took << "s " << counts(r);
    results.report("test_late_workers_are_abandoned", success, msg.str());
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "ProductionLine Test Suite" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    test_toy_run_conserves_units();
    test_signal_conservation_at_quiescence();
    test_snapshots_bounded_and_on_cadence();
    test_counters_are_monotonic();
    test_single_slot_buffer_records_waits();
    test_unconditional_policy_run_terminates();
    test_validated_construction_rejects_small_buffer();
    test_lifecycle_misuse();
    test_report_before_completion_has_no_rates();
    test_destructor_shuts_down_running_line();
    test_late_workers_are_abandoned();

    results.summary("PRODUCTION LINE");
    return (results.failed == 0) ? 0 : 1;
}
