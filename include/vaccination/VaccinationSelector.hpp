#ifndef VACCINATION_SELECTOR_HPP
#define VACCINATION_SELECTOR_HPP

#include "centrality/interfaces/ICentralityProvider.hpp"
#include "centrality/CentralityMeasure.hpp"
#include "graph/ContactGraph.hpp"
#include "vaccination/SelectionStrategy.hpp"
#include "vaccination/VaccinationPlan.hpp"
#include <memory>
#include <vector>
#include <Eigen/Dense>

namespace dissim {

    /**
     * @class VaccinationSelector
     * @brief Chooses which vertices to vaccinate from a centrality ranking.
     *
     * Vertices are ranked by score descending; equal scores (within
     * constants::SCORE_TIE_TOLERANCE scaled by the largest |score|) are ordered by identifier ascending, so
     * a selection only depends on the graph and the measure.
     */
    class VaccinationSelector {
    public:
        /**
         * @param provider Source of centrality scores.
         * @throws InvalidParameterException If @p provider is null.
         */
        explicit VaccinationSelector(std::shared_ptr<ICentralityProvider> provider);

        /**
         * @brief Selects k vertices of @p graph to vaccinate.
         *
         * Batch ranks the full graph once. Recursive re-ranks a working copy
         * after each removal, so a vertex that only becomes central once a hub
         * is gone can still be chosen. The caller's graph is not modified.
         *
         * @param graph The contact graph.
         * @param measure Centrality measure used for ranking.
         * @param strategy Batch or recursive.
         * @param k Number of vertices to select, in [0, |V|].
         * @return VaccinationPlan Exactly k distinct vertices, in selection order.
         *
         * @throws InvalidParameterException If k is outside [0, |V|].
         */
        VaccinationPlan select(const ContactGraph& graph,
                               CentralityMeasure measure,
                               SelectionStrategy strategy,
                               int k) const;

        /**
         * @brief Number of vertices to vaccinate for a percentage of the graph.
         *
         * round(percent / 100 * n), clamped to [0, n - 1] so at least one
         * vertex remains to seed an infection.
         *
         * @throws InvalidParameterException If percent is outside [1, 99] or n is negative.
         */
        static int computeVaccinationCount(int percent, int num_vertices);

        /**
         * @brief Orders vertex indices by score descending, then identifier ascending.
         *
         * @throws InvalidParameterException If the score vector size does not match the graph.
         */
        static std::vector<int> rankVertices(const ContactGraph& graph, const Eigen::VectorXd& scores);

    private:
        VaccinationPlan selectBatch(const ContactGraph& graph, CentralityMeasure measure, int k) const;
        VaccinationPlan selectRecursive(const ContactGraph& graph, CentralityMeasure measure, int k) const;

        std::shared_ptr<ICentralityProvider> provider_;
    };

} // namespace dissim

#endif // VACCINATION_SELECTOR_HPP
