#include "simulation/PropagationEngine.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <gsl/gsl_cdf.h>

namespace dissim {

PropagationEngine::PropagationEngine(PropagationModel model, double pb, double pd, int maxRounds)
    : PropagationEngine(model, pb, RecoveryParameters::bernoulli(pd), maxRounds)
{
}

PropagationEngine::PropagationEngine(PropagationModel model, double pb, const RecoveryParameters& recovery, int maxRounds)
    : model_(model), pb_(pb), recovery_(recovery), max_rounds_(maxRounds)
{
    if (!(pb >= 0.0 && pb <= 1.0)) {
        THROW_INVALID_PARAM("PropagationEngine::PropagationEngine", "Propagation probability pb must be in [0, 1]. Got: " + std::to_string(pb));
    }
    recovery_.validate();
    if (maxRounds < 1) {
        THROW_INVALID_PARAM("PropagationEngine::PropagationEngine", "Number of rounds must be positive. Got: " + std::to_string(maxRounds));
    }
}

TrialResult PropagationEngine::runTrial(const ContactGraph& graph,
                                        const std::vector<std::string>& seeds,
                                        PropagationModel model,
                                        double pb,
                                        double pd,
                                        int maxRounds,
                                        RandomStream& stream)
{
    PropagationEngine engine(model, pb, pd, maxRounds);
    return engine.runTrial(graph, seeds, stream);
}

std::vector<int> PropagationEngine::resolveSeeds(const ContactGraph& graph, const std::vector<std::string>& seeds) {
    if (seeds.empty()) {
        THROW_INVALID_SEED("PropagationEngine::resolveSeeds", "At least one seed vertex is required.");
    }
    std::vector<int> indices;
    indices.reserve(seeds.size());
    for (const auto& seed : seeds) {
        auto idx = graph.indexOf(seed);
        if (!idx) {
            THROW_INVALID_SEED("PropagationEngine::resolveSeeds", "Seed vertex '" + seed + "' is not in the graph (absent or vaccinated).");
        }
        indices.push_back(*idx);
    }
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
    return indices;
}

int PropagationEngine::drawRecoveryTime(RandomStream& stream) const {
    const int span = recovery_.max_t - recovery_.min_t + 1;
    const int offset = static_cast<int>(std::floor(stream.uniform() * span));
    return recovery_.min_t + std::min(offset, span - 1);
}

bool PropagationEngine::recovers(int time_infected, int recovery_time, RandomStream& stream) const {
    switch (recovery_.rule) {
        case RecoveryRule::Bernoulli:
            return stream.bernoulli(recovery_.pd);
        case RecoveryRule::Normal:
            return stream.uniform() < gsl_cdf_ugaussian_P((time_infected - recovery_.mu) / recovery_.sigma);
        case RecoveryRule::Uniform:
            return time_infected >= recovery_time;
    }
    return false;
}

RoundSummary PropagationEngine::summarize(const std::vector<HealthState>& states, int round) {
    RoundSummary summary;
    summary.round = round;
    for (HealthState s : states) {
        switch (s) {
            case HealthState::Susceptible: ++summary.susceptible; break;
            case HealthState::Infected:    ++summary.infected;    break;
            case HealthState::Recovered:   ++summary.recovered;   break;
        }
    }
    return summary;
}

TrialResult PropagationEngine::runTrial(const ContactGraph& graph,
                                        const std::vector<std::string>& seeds,
                                        RandomStream& stream) const
{
    const std::vector<int> seed_indices = resolveSeeds(graph, seeds);
    const int n = graph.numVertices();

    TrialResult result;
    for (int idx : seed_indices) {
        result.seed_vertices.push_back(graph.label(idx));
    }

    std::vector<HealthState> current(n, HealthState::Susceptible);
    std::vector<char> ever_infected(n, 0);
    std::vector<int> infected_since(n, 0);
    std::vector<int> recovery_time(n, 0);
    const bool fixed_durations = recovery_.rule == RecoveryRule::Uniform;
    for (int idx : seed_indices) {
        current[idx] = HealthState::Infected;
        ever_infected[idx] = 1;
        if (fixed_durations) recovery_time[idx] = drawRecoveryTime(stream);
    }
    result.round_summaries.push_back(summarize(current, 0));

    const HealthState after_recovery = (model_ == PropagationModel::SIR) ? HealthState::Recovered : HealthState::Susceptible;
    std::vector<HealthState> next;

    int round = 0;
    while (round < max_rounds_ && result.round_summaries.back().infected > 0) {
        ++round;
        next = current;
        int new_infections = 0;
        int new_recoveries = 0;

        // Spread: one draw per (infected, susceptible) edge, OR-combined per target
        for (int v = 0; v < n; ++v) {
            if (current[v] != HealthState::Infected) continue;
            for (int u : graph.neighbors(v)) {
                if (current[u] != HealthState::Susceptible) continue;
                if (stream.bernoulli(pb_) && next[u] == HealthState::Susceptible) {
                    next[u] = HealthState::Infected;
                    ever_infected[u] = 1;
                    infected_since[u] = round;
                    if (fixed_durations) recovery_time[u] = drawRecoveryTime(stream);
                    ++new_infections;
                }
            }
        }

        // Recovery takes effect next round; the vertex already spread in this one
        for (int v = 0; v < n; ++v) {
            if (current[v] != HealthState::Infected) continue;
            if (recovers(round - infected_since[v], recovery_time[v], stream)) {
                next[v] = after_recovery;
                ++new_recoveries;
            }
        }

        current.swap(next);
        RoundSummary summary = summarize(current, round);
        summary.new_infections = new_infections;
        summary.new_recoveries = new_recoveries;
        result.round_summaries.push_back(summary);
    }

    result.rounds_executed = round;
    result.final_states = std::move(current);
    result.ever_infected = static_cast<int>(std::count(ever_infected.begin(), ever_infected.end(), 1));
    return result;
}

} // namespace dissim
