#ifndef SIMULATION_CONSTANTS_HPP
#define SIMULATION_CONSTANTS_HPP

#include <cstdint>

namespace dissim {
namespace constants {

    constexpr double SCORE_TIE_TOLERANCE = 1e-9;

    constexpr int DEFAULT_PERCENT_TO_VACCINATE = 50;
    constexpr int MIN_PERCENT_TO_VACCINATE = 1;
    constexpr int MAX_PERCENT_TO_VACCINATE = 99;

    constexpr int DEFAULT_NUM_TRIALS = 100;
    constexpr int DEFAULT_NUM_ROUNDS = 100;
    constexpr double DEFAULT_PROPAGATION_PROBABILITY = 0.05;
    constexpr double DEFAULT_RECOVERY_PROBABILITY = 0.05;
    constexpr double DEFAULT_RECOVERY_MEAN = 20.0;
    constexpr double DEFAULT_RECOVERY_STDDEV = 5.0;
    constexpr int DEFAULT_MIN_RECOVERY_TIME = 10;
    constexpr int DEFAULT_MAX_RECOVERY_TIME = 30;
    constexpr std::uint64_t DEFAULT_RANDOM_SEED = 42;

    constexpr int PROGRESS_LOG_INTERVAL = 25;

} // namespace constants
} // namespace dissim

#endif // SIMULATION_CONSTANTS_HPP
