#ifndef SIMULATION_PARAMETERS_HPP
#define SIMULATION_PARAMETERS_HPP

#include "centrality/CentralityMeasure.hpp"
#include "simulation/PropagationModel.hpp"
#include "simulation/RecoveryRule.hpp"
#include "simulation/SimulationConstants.hpp"
#include "vaccination/SelectionStrategy.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dissim {

/**
 * @brief Container for all settings of one simulation run.
 */
struct SimulationParameters {
    std::string graph_file;
    std::string output_file;
    std::string summary_file;                        ///< Empty: no summary CSV.

    std::vector<std::string> patient0;               ///< Empty: every non-vaccinated vertex.
    std::optional<SelectionStrategy> strategy;       ///< Unset: no vaccination.
    std::optional<CentralityMeasure> centrality;
    int percent_to_vaccinate = constants::DEFAULT_PERCENT_TO_VACCINATE;

    PropagationModel model = PropagationModel::SIR;
    int trials = constants::DEFAULT_NUM_TRIALS;
    int rounds = constants::DEFAULT_NUM_ROUNDS;
    double pb = constants::DEFAULT_PROPAGATION_PROBABILITY;
    double pd = constants::DEFAULT_RECOVERY_PROBABILITY;
    RecoveryRule recovery_rule = RecoveryRule::Bernoulli;
    double mu = constants::DEFAULT_RECOVERY_MEAN;        ///< Normal rule only.
    double sigma = constants::DEFAULT_RECOVERY_STDDEV;   ///< Normal rule only.
    int min_t = constants::DEFAULT_MIN_RECOVERY_TIME;    ///< Uniform rule only.
    int max_t = constants::DEFAULT_MAX_RECOVERY_TIME;    ///< Uniform rule only.
    std::uint64_t seed = constants::DEFAULT_RANDOM_SEED;

    bool parallel = false;
    int threads = 0;                                 ///< 0: OpenMP default.

    std::string log_level = "INFO";
    std::string log_file;                            ///< Empty: console only.

    /**
     * @brief Checks ranges and combinations of all settings.
     *
     * @throws InvalidParameterException If a value is out of range, the graph or
     *         output file name is empty, or a strategy has no centrality measure.
     */
    void validate() const;

    RecoveryParameters recoveryParameters() const;
};

/**
 * @brief Applies one named setting to @p params.
 *
 * Keys are the configuration-file names (graph_file, output_file,
 * summary_file, patient0, strategy, centrality, percent_to_vaccinate, model,
 * trials, rounds, pb, pd, recovery, mu, sigma, min_t, max_t, seed, parallel,
 * threads, log_level, log_file).
 * patient0 values may list several vertices separated by ';' and accumulate.
 *
 * @throws InvalidParameterException If the key is unknown or the value cannot be parsed.
 */
void applySetting(SimulationParameters& params, const std::string& key, const std::string& value);

} // namespace dissim

#endif // SIMULATION_PARAMETERS_HPP
