#include "Config.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>

long LineConfig::snapshotInterval() const {
    return std::max(1L, totalTimesteps / 100);
}

LineConfig toyConfig() {
    LineConfig config;
    config.bufferCapacity = 10;
    config.numProducers = 2;
    config.numConsumers = 3;
    config.totalTimesteps = 100;
    config.validate = false;
    config.reportFile = "relatorio_toy_problem.json";
    config.analysisFile = "analise_toy_problem.txt";
    return config;
}

static void fail(const std::string& msg) {
    throw ConfigurationError(msg);
}

void validateConfig(const LineConfig& config) {
    // Structural limits hold even when validation is bypassed
    if (config.bufferCapacity < 1) fail("buffer capacity must be at least 1");
    if (config.bufferCapacity > static_cast<std::size_t>(INT_MAX)) {
        fail("buffer capacity is too large for the slot semaphores");
    }
    if (config.numProducers < 1) fail("number of producers must be at least 1");
    if (config.numConsumers < 1) fail("number of consumers must be at least 1");
    if (config.totalTimesteps < 1) fail("number of timesteps must be at least 1");
    if (config.throttleMinMicros < 0 || config.throttleMaxMicros < config.throttleMinMicros) {
        fail("throttle range must satisfy 0 <= min <= max");
    }
    if (config.joinTimeoutMillis < 0) fail("join timeout cannot be negative");
    if (config.pollIntervalMillis < 1) fail("poll interval must be at least 1 ms");

    if (!config.validate) {
        return;
    }

    std::ostringstream msg;
    if (config.bufferCapacity < MIN_BUFFER_CAPACITY) {
        msg << "buffer capacity must be at least " << MIN_BUFFER_CAPACITY
            << " (got " << config.bufferCapacity << ")";
        fail(msg.str());
    }
    if (config.numProducers < MIN_PRODUCERS) {
        msg << "number of producers must be at least " << MIN_PRODUCERS
            << " (got " << config.numProducers << ")";
        fail(msg.str());
    }
    long minConsumers = LineConfig::minConsumersFor(config.numProducers);
    if (config.numConsumers < minConsumers) {
        msg << "number of consumers must be at least " << minConsumers
            << " for " << config.numProducers << " producers (got "
            << config.numConsumers << ")";
        fail(msg.str());
    }
    if (config.totalTimesteps < MIN_TIMESTEPS) {
        msg << "number of timesteps must be at least " << MIN_TIMESTEPS
            << " (got " << config.totalTimesteps << ")";
        fail(msg.str());
    }
}

const char* signalPolicyName(SignalPolicy policy) {
    return policy == SIGNAL_UNCONDITIONAL ? "unconditional" : "on_success";
}

// --- Config file parsing ---

static std::string trim(const std::string& s) {
    std::string::size_type begin = 0;
    std::string::size_type end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(begin, end - begin);
}

static std::string lower(std::string s) {
    for (std::string::size_type i = 0; i < s.size(); ++i) {
        s[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(s[i])));
    }
    return s;
}

// Removes carriage returns and comments, then trims
static std::string cleanLine(std::string line) {
    line.erase(std::remove(line.begin(), line.end(), '\r'), line.end());
    std::string::size_type hash = line.find('#');
    if (hash != std::string::npos) {
        line.erase(hash);
    }
    return trim(line);
}

static long parseNumber(const std::string& key, const std::string& value, int lineNo) {
    const char* begin = value.c_str();
    char* end = 0;
    errno = 0;
    long result = std::strtol(begin, &end, 10);
    if (value.empty() || *end != '\0') {
        std::ostringstream msg;
        msg << "line " << lineNo << ": '" << key << "' expects an integer, got '" << value << "'";
        throw ConfigurationError(msg.str());
    }
    if (errno == ERANGE) {
        std::ostringstream msg;
        msg << "line " << lineNo << ": '" << key << "' is out of range: " << value;
        throw ConfigurationError(msg.str());
    }
    return result;
}

// parseNumber narrowed to int, rejecting anything that doesn't fit
static int parseInt(const std::string& key, const std::string& value, int lineNo) {
    long result = parseNumber(key, value, lineNo);
    if (result < INT_MIN || result > INT_MAX) {
        std::ostringstream msg;
        msg << "line " << lineNo << ": '" << key << "' is out of range: " << value;
        throw ConfigurationError(msg.str());
    }
    return static_cast<int>(result);
}

static bool parseBool(const std::string& key, const std::string& value, int lineNo) {
    std::string v = lower(value);
    if (v == "true" || v == "yes" || v == "1" || v == "on") return true;
    if (v == "false" || v == "no" || v == "0" || v == "off") return false;
    std::ostringstream msg;
    msg << "line " << lineNo << ": '" << key << "' expects true/false, got '" << value << "'";
    throw ConfigurationError(msg.str());
}

LineConfig parseConfig(const std::string& filename) {
    std::ifstream file(filename.c_str());
    if (!file.is_open()) {
        throw ConfigurationError("could not open config file: " + filename);
    }

    LineConfig config;
    std::string line;
    int lineNo = 0;
    while (std::getline(file, line)) {
        lineNo++;
        line = cleanLine(line);
        if (line.empty()) continue;

        std::string::size_type eqPos = line.find('=');
        if (eqPos == std::string::npos) {
            std::ostringstream msg;
            msg << filename << ":" << lineNo << ": expected 'key = value'";
            throw ConfigurationError(msg.str());
        }
        std::string key = lower(trim(line.substr(0, eqPos)));
        std::string value = trim(line.substr(eqPos + 1));

        if (key == "buffer_capacity") {
            long n = parseNumber(key, value, lineNo);
            if (n < 0) fail("buffer capacity cannot be negative");
            config.bufferCapacity = static_cast<std::size_t>(n);
        } else if (key == "producers") {
            config.numProducers = parseInt(key, value, lineNo);
        } else if (key == "consumers") {
            config.numConsumers = parseInt(key, value, lineNo);
        } else if (key == "timesteps") {
            config.totalTimesteps = parseNumber(key, value, lineNo);
        } else if (key == "validate") {
            config.validate = parseBool(key, value, lineNo);
        } else if (key == "signal_policy") {
            std::string v = lower(value);
            if (v == "on_success") {
                config.signalPolicy = SIGNAL_ON_SUCCESS;
            } else if (v == "unconditional") {
                config.signalPolicy = SIGNAL_UNCONDITIONAL;
            } else {
                std::ostringstream msg;
                msg << "line " << lineNo << ": unknown signal_policy '" << value << "'";
                throw ConfigurationError(msg.str());
            }
        } else if (key == "throttle_min_us") {
            config.throttleMinMicros = parseInt(key, value, lineNo);
        } else if (key == "throttle_max_us") {
            config.throttleMaxMicros = parseInt(key, value, lineNo);
        } else if (key == "join_timeout_ms") {
            config.joinTimeoutMillis = parseInt(key, value, lineNo);
        } else if (key == "poll_interval_ms") {
            config.pollIntervalMillis = parseInt(key, value, lineNo);
        } else if (key == "report_file") {
            config.reportFile = value;
        } else if (key == "analysis_file") {
            config.analysisFile = value;
        } else {
            std::ostringstream msg;
            msg << filename << ":" << lineNo << ": unknown key '" << key << "'";
            throw ConfigurationError(msg.str());
        }
    }

    return config;
}
