#ifndef TRIAL_ORCHESTRATOR_HPP
#define TRIAL_ORCHESTRATOR_HPP

#include "graph/ContactGraph.hpp"
#include "simulation/PropagationEngine.hpp"
#include "simulation/PropagationModel.hpp"
#include "simulation/TrialResult.hpp"
#include "vaccination/VaccinationPlan.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace dissim {

    /**
     * @brief Which vertices start infected.
     *
     * An explicit specification forms a single configuration holding every
     * listed vertex. An unspecified one yields one singleton configuration
     * per non-vaccinated vertex, in graph order.
     */
    struct SeedSpecification {
        std::vector<std::string> vertices;
        bool is_explicit = false;

        static SeedSpecification allVertices() { return SeedSpecification{}; }
        static SeedSpecification explicitSeeds(std::vector<std::string> seeds) {
            SeedSpecification spec;
            spec.vertices = std::move(seeds);
            spec.is_explicit = true;
            return spec;
        }
    };

    /**
     * @class TrialOrchestrator
     * @brief Runs every (seed configuration, trial) pair on the vaccinated graph.
     *
     * Trial t of seed set S draws from
     * RandomStream(deriveSeed(topSeed, seedSetKey(S), t)), so a run is
     * reproduced exactly by the same inputs, whether trials execute serially
     * or on OpenMP threads. A seed set gets the same trials whether it is
     * listed explicitly or enumerated among all vertices. Results come back
     * ordered by configuration, then trial index.
     */
    class TrialOrchestrator {
    public:
        /**
         * @param useParallel Run trials on OpenMP threads when compiled with OpenMP.
         * @param numThreads  Thread count; 0 uses the OpenMP default.
         * @throws InvalidParameterException If numThreads is negative.
         */
        explicit TrialOrchestrator(bool useParallel = false, int numThreads = 0);

        /**
         * @brief Runs all trials.
         *
         * All inputs are validated before the first trial: a bad seed or
         * parameter aborts the whole run.
         *
         * @param graph   Original contact graph.
         * @param plan    Vertices removed before every trial.
         * @param seeds   Seed specification.
         * @param model   SIR or SIS.
         * @param pb      Transmission probability in [0, 1].
         * @param pd      Recovery probability in [0, 1].
         * @param rounds  Round limit per trial, at least 1.
         * @param trials  Trials per seed configuration, at least 1.
         * @param topSeed Top-level random seed.
         * @return std::vector<TrialResult> One result per (configuration, trial), canonical order.
         *
         * @throws InvalidSeedException If an explicit seed is absent from the graph or vaccinated,
         *         or if every vertex is vaccinated.
         * @throws InvalidParameterException If pb, pd, rounds or trials are out of range.
         */
        std::vector<TrialResult> run(const ContactGraph& graph,
                                     const VaccinationPlan& plan,
                                     const SeedSpecification& seeds,
                                     PropagationModel model,
                                     double pb,
                                     double pd,
                                     int rounds,
                                     int trials,
                                     std::uint64_t topSeed) const;

        /**
         * @brief Runs all trials with a configured engine.
         *
         * @throws InvalidSeedException As above.
         * @throws InvalidParameterException If trials < 1.
         */
        std::vector<TrialResult> run(const ContactGraph& graph,
                                     const VaccinationPlan& plan,
                                     const SeedSpecification& seeds,
                                     const PropagationEngine& engine,
                                     int trials,
                                     std::uint64_t topSeed) const;

        /**
         * @brief Expands a seed specification into the ordered list of seed sets.
         *
         * @throws InvalidSeedException As for run().
         */
        static std::vector<std::vector<std::string>> buildSeedConfigurations(const ContactGraph& graph,
                                                                             const VaccinationPlan& plan,
                                                                             const SeedSpecification& seeds);

        bool isParallel() const { return use_parallel_; }

    private:
        bool use_parallel_;
        int num_threads_;
    };

} // namespace dissim

#endif // TRIAL_ORCHESTRATOR_HPP
