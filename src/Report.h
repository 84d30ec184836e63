#ifndef REPORT_H
#define REPORT_H

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

/**
 * Final state of one run. Serialized with the field names downstream
 * analysis tooling reads: configuracao, resultados, desempenho, buffer_snapshots.
*/
struct Report {
    // configuracao
    std::size_t bufferCapacity;
    int numProducers;
    int numConsumers;
    long totalTimesteps;

    // resultados
    long totalProduced;
    long totalConsumed;
    std::size_t remainingInBuffer;
    long producerWaits;
    long consumerWaits;

    // desempenho, rounded to 2 decimals; rates are 0 when no time elapsed
    double elapsedSeconds;
    double producedPerSecond;
    double consumedPerSecond;

    std::vector<std::size_t> bufferSnapshots;

    // not serialized, shown in the text report only
    int abandonedWorkers;

    Report()
        : bufferCapacity(0), numProducers(0), numConsumers(0), totalTimesteps(0),
          totalProduced(0), totalConsumed(0), remainingInBuffer(0), producerWaits(0),
          consumerWaits(0), elapsedSeconds(0), producedPerSecond(0), consumedPerSecond(0),
          abandonedWorkers(0) {}
};

double roundTo2(double value);

std::string toJson(const Report& report);

// Writes toJson() to 'filename', throws std::runtime_error if it can't be opened
void saveReport(const Report& report, const std::string& filename);

void printReport(const Report& report, std::ostream& os);

// Consumption efficiency, final occupancy and consumer/producer ratio
void printAnalysis(const Report& report, std::ostream& os);

// Text report followed by the analysis, written to 'filename'.
// Throws std::runtime_error if the file can't be opened.
void saveAnalysis(const Report& report, const std::string& filename);

// One row per run
void printComparison(const std::vector<Report>& reports, std::ostream& os);

#endif
