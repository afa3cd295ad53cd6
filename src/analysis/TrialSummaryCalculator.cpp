#include "analysis/TrialSummaryCalculator.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <map>

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>

namespace dissim {

namespace ba = boost::accumulators;

using AttackAccumulator = ba::accumulator_set<double, ba::stats<ba::tag::count, ba::tag::mean, ba::tag::variance, ba::tag::max>>;
using RoundsAccumulator = ba::accumulator_set<double, ba::stats<ba::tag::mean>>;

int TrialSummaryCalculator::attackSize(const TrialResult& result) {
    return result.finalCount(HealthState::Infected) + result.finalCount(HealthState::Recovered);
}

double TrialSummaryCalculator::median(std::vector<double> values) {
    if (values.empty()) return 0.0;
    const size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + mid, values.end());
    double upper = values[mid];
    if (values.size() % 2 == 1) return upper;
    double lower = *std::max_element(values.begin(), values.begin() + mid);
    return 0.5 * (lower + upper);
}

std::vector<TrialSummary> TrialSummaryCalculator::summarize(const std::vector<TrialResult>& results) {
    std::map<int, std::vector<const TrialResult*>> groups;
    for (const auto& result : results) {
        groups[result.config_index].push_back(&result);
    }

    std::vector<TrialSummary> summaries;
    summaries.reserve(groups.size());
    for (const auto& group : groups) {
        AttackAccumulator attack_acc;
        RoundsAccumulator rounds_acc;
        std::vector<double> attack_sizes;
        attack_sizes.reserve(group.second.size());
        int died_out = 0;

        for (const TrialResult* result : group.second) {
            const double attack = static_cast<double>(attackSize(*result));
            attack_acc(attack);
            rounds_acc(static_cast<double>(result->rounds_executed));
            attack_sizes.push_back(attack);
            if (result->diedOut()) ++died_out;
        }

        TrialSummary summary;
        summary.config_index = group.first;
        summary.seed_vertices = group.second.front()->seed_vertices;
        summary.num_trials = static_cast<int>(ba::count(attack_acc));
        summary.mean_attack_size = ba::mean(attack_acc);
        summary.variance_attack_size = ba::variance(attack_acc);
        summary.max_attack_size = ba::max(attack_acc);
        summary.median_attack_size = median(std::move(attack_sizes));
        summary.mean_rounds_executed = ba::mean(rounds_acc);
        summary.fraction_died_out = static_cast<double>(died_out) / summary.num_trials;
        summaries.push_back(std::move(summary));
    }

    Logger::getInstance().debug("TrialSummaryCalculator", "Summarised " + std::to_string(results.size()) +
                                " trials into " + std::to_string(summaries.size()) + " configurations.");
    return summaries;
}

} // namespace dissim
