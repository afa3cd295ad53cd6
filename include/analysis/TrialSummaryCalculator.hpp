#ifndef TRIAL_SUMMARY_CALCULATOR_HPP
#define TRIAL_SUMMARY_CALCULATOR_HPP

#include "simulation/TrialResult.hpp"
#include <string>
#include <vector>

namespace dissim {

    /**
     * @brief Aggregate outcome of all trials of one seed configuration.
     *
     * Attack size is the number of vertices Infected or Recovered at the end
     * of a trial. Variance is the population variance over trials.
     */
    struct TrialSummary {
        int config_index = 0;
        std::vector<std::string> seed_vertices;
        int num_trials = 0;
        double mean_attack_size = 0.0;
        double variance_attack_size = 0.0;
        double max_attack_size = 0.0;
        double median_attack_size = 0.0;
        double mean_rounds_executed = 0.0;
        double fraction_died_out = 0.0;   ///< Trials with no Infected vertex left at the end.
    };

    /**
     * @class TrialSummaryCalculator
     * @brief Summarises trial results per seed configuration.
     */
    class TrialSummaryCalculator {
    public:
        /**
         * @brief Groups @p results by config_index and summarises each group.
         *
         * @param results Trial results in any order.
         * @return std::vector<TrialSummary> One summary per configuration, ascending config_index.
         */
        static std::vector<TrialSummary> summarize(const std::vector<TrialResult>& results);

        /** @brief Infected plus Recovered at the end of a trial. */
        static int attackSize(const TrialResult& result);

    private:
        static double median(std::vector<double> values);
    };

} // namespace dissim

#endif // TRIAL_SUMMARY_CALCULATOR_HPP
