#include "StatsCollector.h"

#include <stdexcept>

StatsCollector::StatsCollector(long snapshotInterval) : interval(snapshotInterval) {
    if (snapshotInterval < 1) {
        throw std::invalid_argument("snapshot interval must be at least 1");
    }
}

void StatsCollector::recordProduced(long timestep, std::size_t bufferSize) {
    std::lock_guard<std::mutex> lock(mtx);
    stats.totalProduced++;
    if (timestep % interval == 0) {
        stats.bufferSnapshots.push_back(bufferSize);
    }
}

void StatsCollector::recordConsumed() {
    std::lock_guard<std::mutex> lock(mtx);
    stats.totalConsumed++;
}

void StatsCollector::recordProducerWait() {
    std::lock_guard<std::mutex> lock(mtx);
    stats.producerWaits++;
}

void StatsCollector::recordConsumerWait() {
    std::lock_guard<std::mutex> lock(mtx);
    stats.consumerWaits++;
}

ProductionStats StatsCollector::snapshot() {
    std::lock_guard<std::mutex> lock(mtx);
    return stats;
}
