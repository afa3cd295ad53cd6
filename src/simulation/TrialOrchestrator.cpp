#include "simulation/TrialOrchestrator.hpp"
#include "simulation/PropagationEngine.hpp"
#include "simulation/RandomStream.hpp"
#include "simulation/SimulationConstants.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <exception>
#include <unordered_set>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace dissim {

TrialOrchestrator::TrialOrchestrator(bool useParallel, int numThreads)
    : use_parallel_(useParallel), num_threads_(numThreads)
{
    if (numThreads < 0) {
        THROW_INVALID_PARAM("TrialOrchestrator::TrialOrchestrator", "Number of threads cannot be negative. Got: " + std::to_string(numThreads));
    }
}

std::vector<std::vector<std::string>> TrialOrchestrator::buildSeedConfigurations(const ContactGraph& graph,
                                                                                 const VaccinationPlan& plan,
                                                                                 const SeedSpecification& seeds)
{
    std::vector<std::vector<std::string>> configurations;

    if (seeds.is_explicit) {
        if (seeds.vertices.empty()) {
            THROW_INVALID_SEED("TrialOrchestrator::buildSeedConfigurations", "An explicit seed specification must name at least one vertex.");
        }
        std::vector<std::string> seed_set;
        std::unordered_set<std::string> seen;
        for (const auto& seed : seeds.vertices) {
            if (!graph.hasVertex(seed)) {
                THROW_INVALID_SEED("TrialOrchestrator::buildSeedConfigurations", "No vertex with name '" + seed + "' found in graph.");
            }
            if (plan.contains(seed)) {
                THROW_INVALID_SEED("TrialOrchestrator::buildSeedConfigurations", "Seed vertex '" + seed + "' is vaccinated and cannot start an infection.");
            }
            if (seen.insert(seed).second) {
                seed_set.push_back(seed);
            }
        }
        configurations.push_back(std::move(seed_set));
        return configurations;
    }

    for (const auto& label : graph.labels()) {
        if (!plan.contains(label)) {
            configurations.push_back({label});
        }
    }
    if (configurations.empty()) {
        THROW_INVALID_SEED("TrialOrchestrator::buildSeedConfigurations", "Every vertex is vaccinated; no seed vertex is available.");
    }
    return configurations;
}

std::vector<TrialResult> TrialOrchestrator::run(const ContactGraph& graph,
                                                const VaccinationPlan& plan,
                                                const SeedSpecification& seeds,
                                                PropagationModel model,
                                                double pb,
                                                double pd,
                                                int rounds,
                                                int trials,
                                                std::uint64_t topSeed) const
{
    if (trials < 1) {
        THROW_INVALID_PARAM("TrialOrchestrator::run", "Number of trials must be positive. Got: " + std::to_string(trials));
    }
    const PropagationEngine engine(model, pb, pd, rounds);
    return run(graph, plan, seeds, engine, trials, topSeed);
}

std::vector<TrialResult> TrialOrchestrator::run(const ContactGraph& graph,
                                                const VaccinationPlan& plan,
                                                const SeedSpecification& seeds,
                                                const PropagationEngine& engine,
                                                int trials,
                                                std::uint64_t topSeed) const
{
    Logger& logger = Logger::getInstance();

    if (trials < 1) {
        THROW_INVALID_PARAM("TrialOrchestrator::run", "Number of trials must be positive. Got: " + std::to_string(trials));
    }
    const auto configurations = buildSeedConfigurations(graph, plan, seeds);
    std::vector<std::uint64_t> stream_keys;
    stream_keys.reserve(configurations.size());
    for (const auto& configuration : configurations) {
        stream_keys.push_back(RandomStream::seedSetKey(configuration));
    }
    const ContactGraph reduced = graph.withoutVertices(plan.members());

    logger.info("TrialOrchestrator", "Reduced graph has " + std::to_string(reduced.numVertices()) + " vertices and " +
                std::to_string(reduced.numEdges()) + " edges after vaccinating " + std::to_string(plan.size()) + ".");
    logger.info("TrialOrchestrator", "Starting " + std::to_string(trials) + " trials for each of " +
                std::to_string(configurations.size()) + " seed configurations...");

    const long long num_configs = static_cast<long long>(configurations.size());
    const long long total = num_configs * trials;
    std::vector<TrialResult> results(static_cast<size_t>(total));
    std::vector<std::exception_ptr> errors(static_cast<size_t>(total));

    int threads = 1;
#ifdef _OPENMP
    threads = (num_threads_ > 0) ? num_threads_ : omp_get_max_threads();
#endif

    #pragma omp parallel for schedule(dynamic) if(use_parallel_) num_threads(threads)
    for (long long slot = 0; slot < total; ++slot) {
        const int config = static_cast<int>(slot / trials);
        const int trial = static_cast<int>(slot % trials);
        try {
            if (trial % constants::PROGRESS_LOG_INTERVAL == 0) {
                logger.debug("TrialOrchestrator", "...starting trial " + std::to_string(trial) +
                             " with patient 0 at " + configurations[config].front() + "...");
            }
            RandomStream stream(RandomStream::deriveSeed(topSeed, stream_keys[config], static_cast<std::uint64_t>(trial)));
            TrialResult result = engine.runTrial(reduced, configurations[config], stream);
            result.config_index = config;
            result.trial_index = trial;
            results[static_cast<size_t>(slot)] = std::move(result);
        } catch (...) {
            // Exceptions cannot cross the OpenMP region; rethrown below in canonical order.
            errors[static_cast<size_t>(slot)] = std::current_exception();
        }
    }

    for (const auto& error : errors) {
        if (error) {
            logger.error("TrialOrchestrator", "A trial failed; aborting the run.");
            std::rethrow_exception(error);
        }
    }

    logger.info("TrialOrchestrator", "...done (" + std::to_string(total) + " trials" +
                (use_parallel_ ? ", " + std::to_string(threads) + " threads" : std::string()) + ").");
    return results;
}

} // namespace dissim
