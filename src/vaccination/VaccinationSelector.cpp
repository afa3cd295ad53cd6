#include "vaccination/VaccinationSelector.hpp"
#include "simulation/SimulationConstants.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace dissim {

    VaccinationSelector::VaccinationSelector(std::shared_ptr<ICentralityProvider> provider)
        : provider_(std::move(provider))
    {
        if (!provider_) {
            THROW_INVALID_PARAM("VaccinationSelector::VaccinationSelector", "Centrality provider cannot be null.");
        }
    }

    int VaccinationSelector::computeVaccinationCount(int percent, int num_vertices) {
        if (percent < constants::MIN_PERCENT_TO_VACCINATE || percent > constants::MAX_PERCENT_TO_VACCINATE) {
            THROW_INVALID_PARAM("VaccinationSelector::computeVaccinationCount",
                "Percent to vaccinate must be in [" + std::to_string(constants::MIN_PERCENT_TO_VACCINATE) + ", " +
                std::to_string(constants::MAX_PERCENT_TO_VACCINATE) + "]. Got: " + std::to_string(percent));
        }
        if (num_vertices < 0) {
            THROW_INVALID_PARAM("VaccinationSelector::computeVaccinationCount", "Number of vertices cannot be negative.");
        }
        if (num_vertices == 0) {
            return 0;
        }
        long k = std::lround(static_cast<double>(percent) * static_cast<double>(num_vertices) / 100.0);
        return static_cast<int>(std::clamp<long>(k, 0, num_vertices - 1));
    }

    std::vector<int> VaccinationSelector::rankVertices(const ContactGraph& graph, const Eigen::VectorXd& scores) {
        const int n = graph.numVertices();
        if (scores.size() != n) {
            THROW_INVALID_PARAM("VaccinationSelector::rankVertices",
                "Score vector size (" + std::to_string(scores.size()) + ") must match the number of vertices (" + std::to_string(n) + ").");
        }

        std::vector<int> order(n);
        std::iota(order.begin(), order.end(), 0);
        std::sort(order.begin(), order.end(), [&](int a, int b) {
            if (scores(a) != scores(b)) {
                return scores(a) > scores(b);
            }
            return graph.label(a) < graph.label(b);
        });
        if (n == 0) {
            return order;
        }

        // A tie group is every score within the tolerance of the group's first (highest) score
        const double tolerance = constants::SCORE_TIE_TOLERANCE * std::max(1.0, scores.cwiseAbs().maxCoeff());
        auto group_begin = order.begin();
        while (group_begin != order.end()) {
            const double top = scores(*group_begin);
            auto group_end = std::find_if(group_begin, order.end(),
                                          [&](int v) { return top - scores(v) > tolerance; });
            std::sort(group_begin, group_end, [&](int a, int b) { return graph.label(a) < graph.label(b); });
            group_begin = group_end;
        }
        return order;
    }

    VaccinationPlan VaccinationSelector::select(const ContactGraph& graph,
                                                CentralityMeasure measure,
                                                SelectionStrategy strategy,
                                                int k) const
    {
        if (k < 0 || k > graph.numVertices()) {
            THROW_INVALID_PARAM("VaccinationSelector::select",
                "Cannot select " + std::to_string(k) + " vertices from a graph with " + std::to_string(graph.numVertices()) + " vertices.");
        }

        Logger::getInstance().info("VaccinationSelector",
            "Selecting " + std::to_string(k) + " vertices to vaccinate (" + toString(strategy) + ", " + toString(measure) + ")...");

        VaccinationPlan plan;
        switch (strategy) {
            case SelectionStrategy::Batch:
                plan = selectBatch(graph, measure, k);
                break;
            case SelectionStrategy::Recursive:
                plan = selectRecursive(graph, measure, k);
                break;
        }

        Logger::getInstance().info("VaccinationSelector", "...done.");
        return plan;
    }

    VaccinationPlan VaccinationSelector::selectBatch(const ContactGraph& graph, CentralityMeasure measure, int k) const {
        VaccinationPlan plan;
        if (k == 0) {
            return plan;
        }

        Eigen::VectorXd scores = provider_->compute(graph, measure);
        std::vector<int> order = rankVertices(graph, scores);
        for (int i = 0; i < k; ++i) {
            plan.add(graph.label(order[i]));
        }
        return plan;
    }

    VaccinationPlan VaccinationSelector::selectRecursive(const ContactGraph& graph, CentralityMeasure measure, int k) const {
        VaccinationPlan plan;
        ContactGraph working = graph;

        for (int i = 0; i < k; ++i) {
            Eigen::VectorXd scores = provider_->compute(working, measure);
            std::vector<int> order = rankVertices(working, scores);
            const int best = order.front();

            Logger::getInstance().debug("VaccinationSelector",
                "Round " + std::to_string(i + 1) + ": removing '" + working.label(best) + "' (score " + std::to_string(scores(best)) + ")");

            plan.add(working.label(best));
            working = working.withoutVertex(best);
        }
        return plan;
    }

} // namespace dissim
