#include "Report.h"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

double roundTo2(double value) {
    return std::floor(value * 100.0 + 0.5) / 100.0;
}

// 1234567 -> "1,234,567"
static std::string grouped(long value) {
    std::string digits;
    {
        std::ostringstream ss;
        ss << (value < 0 ? -value : value);
        digits = ss.str();
    }
    std::string out;
    int n = 0;
    for (std::string::size_type i = digits.size(); i > 0; --i) {
        if (n > 0 && n % 3 == 0) out.insert(out.begin(), ',');
        out.insert(out.begin(), digits[i - 1]);
        n++;
    }
    if (value < 0) out.insert(out.begin(), '-');
    return out;
}

std::string toJson(const Report& report) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "{\n";
    oss << "  \"configuracao\": {\n";
    oss << "    \"capacidade_buffer\": " << report.bufferCapacity << ",\n";
    oss << "    \"num_produtores\": " << report.numProducers << ",\n";
    oss << "    \"num_consumidores\": " << report.numConsumers << ",\n";
    oss << "    \"total_timesteps\": " << report.totalTimesteps << "\n";
    oss << "  },\n";
    oss << "  \"resultados\": {\n";
    oss << "    \"total_produzido\": " << report.totalProduced << ",\n";
    oss << "    \"total_consumido\": " << report.totalConsumed << ",\n";
    oss << "    \"itens_restantes_buffer\": " << report.remainingInBuffer << ",\n";
    oss << "    \"esperas_produtores\": " << report.producerWaits << ",\n";
    oss << "    \"esperas_consumidores\": " << report.consumerWaits << "\n";
    oss << "  },\n";
    oss << "  \"desempenho\": {\n";
    oss << "    \"tempo_execucao_segundos\": " << report.elapsedSeconds << ",\n";
    oss << "    \"taxa_producao_por_segundo\": " << report.producedPerSecond << ",\n";
    oss << "    \"taxa_consumo_por_segundo\": " << report.consumedPerSecond << "\n";
    oss << "  },\n";
    oss << "  \"buffer_snapshots\": [";
    for (std::size_t i = 0; i < report.bufferSnapshots.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << report.bufferSnapshots[i];
    }
    oss << "]\n";
    oss << "}\n";
    return oss.str();
}

void saveReport(const Report& report, const std::string& filename) {
    std::ofstream file(filename.c_str());
    if (!file.is_open()) {
        throw std::runtime_error("could not open report file for writing: " + filename);
    }
    file << toJson(report);
    if (!file) {
        throw std::runtime_error("failed writing report file: " + filename);
    }
}

void printReport(const Report& report, std::ostream& os) {
    const std::string rule(70, '=');
    std::ios::fmtflags flags = os.flags();
    os << std::fixed << std::setprecision(2);

    os << "\n" << rule << "\n";
    os << "SIMULATION REPORT - PRODUCTION LINE\n";
    os << rule << "\n";

    os << "\n[CONFIGURATION]\n";
    os << "  Buffer capacity: " << grouped(static_cast<long>(report.bufferCapacity)) << "\n";
    os << "  Producers: " << grouped(report.numProducers) << "\n";
    os << "  Consumers: " << grouped(report.numConsumers) << "\n";
    os << "  Total timesteps: " << grouped(report.totalTimesteps) << "\n";

    os << "\n[RESULTS]\n";
    os << "  Total produced: " << grouped(report.totalProduced) << "\n";
    os << "  Total consumed: " << grouped(report.totalConsumed) << "\n";
    os << "  Left in buffer: " << grouped(static_cast<long>(report.remainingInBuffer)) << "\n";
    os << "  Producer waits: " << grouped(report.producerWaits) << "\n";
    os << "  Consumer waits: " << grouped(report.consumerWaits) << "\n";
    if (report.abandonedWorkers > 0) {
        os << "  Abandoned workers: " << report.abandonedWorkers << "\n";
    }

    os << "\n[PERFORMANCE]\n";
    os << "  Elapsed: " << report.elapsedSeconds << " seconds\n";
    os << "  Production rate: " << report.producedPerSecond << " items/second\n";
    os << "  Consumption rate: " << report.consumedPerSecond << " items/second\n";

    os << "\n" << rule << std::endl;
    os.flags(flags);
}

void printAnalysis(const Report& report, std::ostream& os) {
    double efficiency = report.totalProduced > 0
        ? 100.0 * report.totalConsumed / report.totalProduced : 0.0;
    double occupancy = report.bufferCapacity > 0
        ? 100.0 * report.remainingInBuffer / report.bufferCapacity : 0.0;
    double ratio = report.numProducers > 0
        ? static_cast<double>(report.numConsumers) / report.numProducers : 0.0;

    std::ios::fmtflags flags = os.flags();
    os << std::fixed << std::setprecision(2);
    os << "[ANALYSIS]\n";
    os << "  Consumption efficiency: " << efficiency << "%\n";
    os << "  Final buffer occupancy: " << occupancy << "%\n";
    os << "  Consumer/producer ratio: " << ratio << std::endl;
    os.flags(flags);
}

void saveAnalysis(const Report& report, const std::string& filename) {
    std::ofstream file(filename.c_str());
    if (!file.is_open()) {
        throw std::runtime_error("could not open analysis file for writing: " + filename);
    }
    printReport(report, file);
    printAnalysis(report, file);
    if (!file) {
        throw std::runtime_error("failed writing analysis file: " + filename);
    }
}

void printComparison(const std::vector<Report>& reports, std::ostream& os) {
    std::ios::fmtflags flags = os.flags();
    os << std::fixed << std::setprecision(2);

    os << std::left << std::setw(8) << "Config"
       << std::right
       << std::setw(10) << "Buffer"
       << std::setw(11) << "Producers"
       << std::setw(11) << "Consumers"
       << std::setw(12) << "Timesteps"
       << std::setw(12) << "Produced"
       << std::setw(12) << "Consumed"
       << std::setw(11) << "Remaining"
       << std::setw(10) << "Time (s)"
       << std::setw(13) << "Prod/s"
       << std::setw(13) << "Cons/s" << "\n";

    for (std::size_t i = 0; i < reports.size(); ++i) {
        const Report& r = reports[i];
        os << std::left << std::setw(8) << (i + 1)
           << std::right
           << std::setw(10) << r.bufferCapacity
           << std::setw(11) << r.numProducers
           << std::setw(11) << r.numConsumers
           << std::setw(12) << r.totalTimesteps
           << std::setw(12) << r.totalProduced
           << std::setw(12) << r.totalConsumed
           << std::setw(11) << r.remainingInBuffer
           << std::setw(10) << r.elapsedSeconds
           << std::setw(13) << r.producedPerSecond
           << std::setw(13) << r.consumedPerSecond << "\n";
    }
    os.flush();
    os.flags(flags);
}
