#ifndef RECOVERY_RULE_HPP
#define RECOVERY_RULE_HPP

#include "simulation/SimulationConstants.hpp"
#include <string>

namespace dissim {

    /**
     * @brief How long an infected vertex stays infected.
     *
     * t is the number of rounds the vertex has been infected at the round
     * being decided (1 in the first round after infection).
     */
    enum class RecoveryRule {
        Bernoulli,  ///< Recovers with probability pd in every round, t is ignored.
        Normal,     ///< Recovers when u < Phi((t - mu) / sigma), u uniform in [0, 1).
        Uniform     ///< Recovers once t reaches a duration drawn at infection, uniform on {min_t, ..., max_t}.
    };

    /**
     * @brief Parses a rule name (case-insensitive).
     * @throws InvalidParameterException If the name is not bernoulli, normal or uniform.
     */
    RecoveryRule parseRecoveryRule(const std::string& name);

    std::string toString(RecoveryRule rule);

    /**
     * @brief A recovery rule together with the settings it reads.
     */
    struct RecoveryParameters {
        RecoveryRule rule = RecoveryRule::Bernoulli;
        double pd = constants::DEFAULT_RECOVERY_PROBABILITY;
        double mu = constants::DEFAULT_RECOVERY_MEAN;
        double sigma = constants::DEFAULT_RECOVERY_STDDEV;
        int min_t = constants::DEFAULT_MIN_RECOVERY_TIME;
        int max_t = constants::DEFAULT_MAX_RECOVERY_TIME;

        static RecoveryParameters bernoulli(double pd) {
            RecoveryParameters params;
            params.pd = pd;
            return params;
        }

        /**
         * @brief Checks the settings the selected rule reads.
         *
         * pd is always checked, since it is reported with every run.
         *
         * @throws InvalidParameterException If pd is outside [0, 1], sigma is not
         *         positive (Normal), or min_t < 1 or max_t < min_t (Uniform).
         */
        void validate() const;
    };

} // namespace dissim

#endif // RECOVERY_RULE_HPP
