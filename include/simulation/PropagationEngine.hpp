#ifndef PROPAGATION_ENGINE_HPP
#define PROPAGATION_ENGINE_HPP

#include "graph/ContactGraph.hpp"
#include "simulation/HealthState.hpp"
#include "simulation/PropagationModel.hpp"
#include "simulation/RandomStream.hpp"
#include "simulation/RecoveryRule.hpp"
#include "simulation/TrialResult.hpp"
#include <string>
#include <vector>

namespace dissim {

/**
 * @brief Discrete-time stochastic epidemic on a contact graph.
 *
 * Every round is synchronous: all decisions read the state at the end of
 * the previous round. Within a round:
 *  1. each Infected vertex v (index order) makes one Bernoulli(pb) draw per
 *     Susceptible neighbor u (ascending index); u is Infected next round if
 *     any of its draws succeeded;
 *  2. each Infected vertex (index order) applies the recovery rule; on
 *     success it is Recovered (SIR) or Susceptible (SIS) next round.
 * A vertex that recovers in round r still transmitted during round r.
 *
 * The Bernoulli rule makes one Bernoulli(pd) draw per vertex in step 2 and
 * the Normal rule one uniform draw. The Uniform rule draws a vertex's
 * duration when it becomes infected: seeds in index order before round 1,
 * other vertices at the success of their first transmission draw in step 1.
 * The trial stops when no vertex is Infected or after maxRounds rounds.
 */
class PropagationEngine {
public:
    /**
     * @brief Validates and stores the trial parameters.
     *
     * @param model     [in] Rule applied on recovery.
     * @param pb        [in] Per-edge, per-round transmission probability in [0, 1].
     * @param pd        [in] Per-round recovery probability in [0, 1].
     * @param maxRounds [in] Round limit, at least 1.
     *
     * @throws InvalidParameterException If a probability is outside [0, 1] or maxRounds < 1.
     */
    PropagationEngine(PropagationModel model, double pb, double pd, int maxRounds);

    /**
     * @brief Engine with an explicit recovery rule.
     *
     * @throws InvalidParameterException If pb is outside [0, 1], maxRounds < 1,
     *         or @p recovery fails RecoveryParameters::validate().
     */
    PropagationEngine(PropagationModel model, double pb, const RecoveryParameters& recovery, int maxRounds);

    /**
     * @brief Runs one trial to completion.
     *
     * @param graph  [in] The reduced graph; vaccinated vertices are already absent.
     * @param seeds  [in] Identifiers of the initially infected vertices. Duplicates collapse.
     * @param stream [in,out] Random source; consumed in the fixed order documented above.
     * @return TrialResult Final states, per-round summaries and rounds executed.
     *
     * @throws InvalidSeedException If @p seeds is empty or names a vertex absent from @p graph.
     */
    TrialResult runTrial(const ContactGraph& graph,
                         const std::vector<std::string>& seeds,
                         RandomStream& stream) const;

    /**
     * @brief Convenience overload building a temporary engine.
     */
    static TrialResult runTrial(const ContactGraph& graph,
                                const std::vector<std::string>& seeds,
                                PropagationModel model,
                                double pb,
                                double pd,
                                int maxRounds,
                                RandomStream& stream);

    /**
     * @brief Resolves seed identifiers to vertex indices.
     * @throws InvalidSeedException If the list is empty or a vertex is missing.
     */
    static std::vector<int> resolveSeeds(const ContactGraph& graph, const std::vector<std::string>& seeds);

    PropagationModel getModel() const { return model_; }
    double getPropagationProbability() const { return pb_; }
    double getRecoveryProbability() const { return recovery_.pd; }
    const RecoveryParameters& getRecoveryParameters() const { return recovery_; }
    int getMaxRounds() const { return max_rounds_; }

private:
    static RoundSummary summarize(const std::vector<HealthState>& states, int round);

    /** @brief Rounds to stay infected under the Uniform rule. */
    int drawRecoveryTime(RandomStream& stream) const;

    /** @brief Recovery decision for a vertex infected for @p time_infected rounds. */
    bool recovers(int time_infected, int recovery_time, RandomStream& stream) const;

    PropagationModel model_;
    double pb_;
    RecoveryParameters recovery_;
    int max_rounds_;
};

} // namespace dissim

#endif // PROPAGATION_ENGINE_HPP
