#ifndef CONFIG_H
#define CONFIG_H

#include <cstddef>
#include <stdexcept>
#include <string>

// Raised when a run is configured outside its allowed limits
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// Whether a worker signals the other side after a defensive full/empty miss
enum SignalPolicy {
    SIGNAL_ON_SUCCESS,
    SIGNAL_UNCONDITIONAL
};

// --- Production line limits (validated mode) ---
const std::size_t MIN_BUFFER_CAPACITY = 1000;
const int MIN_PRODUCERS = 200;
const long MIN_TIMESTEPS = 1000000;

struct LineConfig {
    std::size_t bufferCapacity;
    int numProducers;
    int numConsumers;
    long totalTimesteps;
    bool validate;

    SignalPolicy signalPolicy;
    int throttleMinMicros;
    int throttleMaxMicros;
    int joinTimeoutMillis;   // per worker
    int pollIntervalMillis;  // completion wait

    std::string reportFile;    // empty = don't save JSON
    std::string analysisFile;  // empty = don't save the text analysis

    LineConfig()
        : bufferCapacity(MIN_BUFFER_CAPACITY),
          numProducers(MIN_PRODUCERS),
          numConsumers(static_cast<int>(minConsumersFor(MIN_PRODUCERS))),
          totalTimesteps(MIN_TIMESTEPS),
          validate(true),
          signalPolicy(SIGNAL_ON_SUCCESS),
          throttleMinMicros(100),
          throttleMaxMicros(500),
          joinTimeoutMillis(1000),
          pollIntervalMillis(100) {}

    // ceil(1.1 * producers), in long so large producer counts can't overflow
    static long minConsumersFor(int producers) { return producers + (producers + 9L) / 10; }

    // Timesteps between two buffer snapshots
    long snapshotInterval() const;
};

// Builds the reduced-scale configuration used for quick runs (validation off)
LineConfig toyConfig();

// Throws ConfigurationError naming the first constraint that fails
void validateConfig(const LineConfig& config);

// Reads a "key = value" file. Unknown keys and bad values are errors.
LineConfig parseConfig(const std::string& filename);

const char* signalPolicyName(SignalPolicy policy);

#endif
