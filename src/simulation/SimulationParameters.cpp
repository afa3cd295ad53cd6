#include "simulation/SimulationParameters.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace dissim {

namespace {

int parseInt(const std::string& key, const std::string& value) {
    size_t pos = 0;
    int result = 0;
    try {
        result = std::stoi(value, &pos);
    } catch (const std::logic_error&) {
        THROW_INVALID_PARAM("applySetting", "Expected an integer for '" + key + "'. Got: " + value);
    }
    if (pos != value.size()) {
        THROW_INVALID_PARAM("applySetting", "Expected an integer for '" + key + "'. Got: " + value);
    }
    return result;
}

double parseDouble(const std::string& key, const std::string& value) {
    size_t pos = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &pos);
    } catch (const std::logic_error&) {
        THROW_INVALID_PARAM("applySetting", "Expected a number for '" + key + "'. Got: " + value);
    }
    if (pos != value.size()) {
        THROW_INVALID_PARAM("applySetting", "Expected a number for '" + key + "'. Got: " + value);
    }
    return result;
}

std::uint64_t parseSeed(const std::string& value) {
    size_t pos = 0;
    unsigned long long result = 0;
    if (value.empty() || value[0] == '-') {
        THROW_INVALID_PARAM("applySetting", "Expected a non-negative integer for 'seed'. Got: " + value);
    }
    try {
        result = std::stoull(value, &pos);
    } catch (const std::logic_error&) {
        THROW_INVALID_PARAM("applySetting", "Expected a non-negative integer for 'seed'. Got: " + value);
    }
    if (pos != value.size()) {
        THROW_INVALID_PARAM("applySetting", "Expected a non-negative integer for 'seed'. Got: " + value);
    }
    return static_cast<std::uint64_t>(result);
}

bool parseBool(const std::string& key, const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    THROW_INVALID_PARAM("applySetting", "Expected a boolean for '" + key + "'. Got: " + value);
}

} // namespace

void applySetting(SimulationParameters& params, const std::string& key, const std::string& value) {
    if      (key == "graph_file") params.graph_file = value;
    else if (key == "output_file") params.output_file = value;
    else if (key == "summary_file") params.summary_file = value;
    else if (key == "patient0") {
        std::istringstream iss(value);
        std::string vertex;
        while (std::getline(iss, vertex, ';')) {
            if (!vertex.empty()) params.patient0.push_back(vertex);
        }
    }
    else if (key == "strategy") params.strategy = parseSelectionStrategy(value);
    else if (key == "centrality") params.centrality = parseCentralityMeasure(value);
    else if (key == "percent_to_vaccinate") params.percent_to_vaccinate = parseInt(key, value);
    else if (key == "model") params.model = parsePropagationModel(value);
    else if (key == "trials") params.trials = parseInt(key, value);
    else if (key == "rounds") params.rounds = parseInt(key, value);
    else if (key == "pb") params.pb = parseDouble(key, value);
    else if (key == "pd") params.pd = parseDouble(key, value);
    else if (key == "recovery") params.recovery_rule = parseRecoveryRule(value);
    else if (key == "mu") params.mu = parseDouble(key, value);
    else if (key == "sigma") params.sigma = parseDouble(key, value);
    else if (key == "min_t") params.min_t = parseInt(key, value);
    else if (key == "max_t") params.max_t = parseInt(key, value);
    else if (key == "seed") params.seed = parseSeed(value);
    else if (key == "parallel") params.parallel = parseBool(key, value);
    else if (key == "threads") params.threads = parseInt(key, value);
    else if (key == "log_level") {
        parseLogLevel(value);
        params.log_level = value;
    }
    else if (key == "log_file") params.log_file = value;
    else {
        THROW_INVALID_PARAM("applySetting", "Unknown setting '" + key + "'.");
    }
}

void SimulationParameters::validate() const {
    if (graph_file.empty()) {
        THROW_INVALID_PARAM("SimulationParameters::validate", "No graph file given.");
    }
    if (output_file.empty()) {
        THROW_INVALID_PARAM("SimulationParameters::validate", "No output file given.");
    }
    if (percent_to_vaccinate < constants::MIN_PERCENT_TO_VACCINATE || percent_to_vaccinate > constants::MAX_PERCENT_TO_VACCINATE) {
        THROW_INVALID_PARAM("SimulationParameters::validate", "Percent to vaccinate must be in [" +
                            std::to_string(constants::MIN_PERCENT_TO_VACCINATE) + ", " +
                            std::to_string(constants::MAX_PERCENT_TO_VACCINATE) + "]. Got: " +
                            std::to_string(percent_to_vaccinate));
    }
    if (strategy && !centrality) {
        THROW_INVALID_PARAM("SimulationParameters::validate", "Strategy '" + toString(*strategy) + "' requires a centrality measure.");
    }
    if (trials < 1) {
        THROW_INVALID_PARAM("SimulationParameters::validate", "Number of trials must be positive. Got: " + std::to_string(trials));
    }
    if (rounds < 1) {
        THROW_INVALID_PARAM("SimulationParameters::validate", "Number of rounds must be positive. Got: " + std::to_string(rounds));
    }
    if (!(pb >= 0.0 && pb <= 1.0)) {
        THROW_INVALID_PARAM("SimulationParameters::validate", "pb must be in [0, 1]. Got: " + std::to_string(pb));
    }
    recoveryParameters().validate();
    if (threads < 0) {
        THROW_INVALID_PARAM("SimulationParameters::validate", "Number of threads cannot be negative. Got: " + std::to_string(threads));
    }
}

RecoveryParameters SimulationParameters::recoveryParameters() const {
    RecoveryParameters recovery;
    recovery.rule = recovery_rule;
    recovery.pd = pd;
    recovery.mu = mu;
    recovery.sigma = sigma;
    recovery.min_t = min_t;
    recovery.max_t = max_t;
    return recovery;
}

} // namespace dissim
