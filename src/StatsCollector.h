#ifndef STATS_COLLECTOR_H
#define STATS_COLLECTOR_H

#include <cstddef>
#include <mutex>
#include <vector>

struct ProductionStats {
    long totalProduced;
    long totalConsumed;
    long producerWaits;
    long consumerWaits;
    std::vector<std::size_t> bufferSnapshots;

    ProductionStats() : totalProduced(0), totalConsumed(0), producerWaits(0), consumerWaits(0) {}
};

/**
 * Run counters plus buffer occupancy snapshots, kept under a lock of their own
 * so bookkeeping never stretches the buffer's critical section.
 * Snapshots follow the timestep, not the wall clock.
*/
class StatsCollector {
public:
    explicit StatsCollector(long snapshotInterval);

    // Counts an accepted unit; snapshots bufferSize when timestep falls on the interval
    void recordProduced(long timestep, std::size_t bufferSize);
    void recordConsumed();
    void recordProducerWait();
    void recordConsumerWait();

    ProductionStats snapshot();
    long snapshotInterval() const { return interval; }

private:
    std::mutex mtx;
    ProductionStats stats;
    const long interval;
};

#endif
