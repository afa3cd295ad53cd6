#ifndef TRIAL_RESULT_HPP
#define TRIAL_RESULT_HPP

#include "simulation/HealthState.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace dissim {

    /**
     * @brief State counts after one round.
     */
    struct RoundSummary {
        int round = 0;
        int susceptible = 0;
        int infected = 0;
        int recovered = 0;
        int new_infections = 0;   ///< Susceptible vertices infected during this round.
        int new_recoveries = 0;   ///< Infected vertices that left the Infected state during this round.
    };

    /**
     * @brief Outcome of one trial of the propagation engine.
     *
     * Per-vertex states are indexed like the reduced graph the trial ran on.
     * round_summaries[0] describes the initial state, round_summaries[r] the
     * state after round r, so it holds rounds_executed + 1 entries.
     */
    struct TrialResult {
        int config_index = 0;
        int trial_index = 0;
        std::vector<std::string> seed_vertices;

        std::vector<HealthState> final_states;
        std::vector<RoundSummary> round_summaries;
        int rounds_executed = 0;
        int ever_infected = 0;    ///< Distinct vertices infected at any point, seeds included.

        /** @brief Final number of vertices in @p state. */
        int finalCount(HealthState state) const {
            if (round_summaries.empty()) return 0;
            const RoundSummary& last = round_summaries.back();
            switch (state) {
                case HealthState::Susceptible: return last.susceptible;
                case HealthState::Infected:    return last.infected;
                case HealthState::Recovered:   return last.recovered;
            }
            return 0;
        }

        /**
         * @brief Infected count at round @p round.
         *
         * Rounds after an early stop repeat the final count.
         */
        int infectedAtRound(int round) const {
            if (round_summaries.empty() || round < 0) return 0;
            size_t idx = std::min(static_cast<size_t>(round), round_summaries.size() - 1);
            return round_summaries[idx].infected;
        }

        /** @brief True if the trial ran out of infected vertices before the round limit. */
        bool diedOut() const {
            return finalCount(HealthState::Infected) == 0;
        }
    };

} // namespace dissim

#endif // TRIAL_RESULT_HPP
