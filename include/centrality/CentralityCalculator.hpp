#ifndef CENTRALITY_CALCULATOR_HPP
#define CENTRALITY_CALCULATOR_HPP

#include "centrality/interfaces/ICentralityProvider.hpp"
#include "graph/ContactGraph.hpp"
#include <Eigen/Dense>

namespace dissim {

    /**
     * @brief Computes the supported centrality measures on a ContactGraph.
     *
     * Eigenvalue-based measures (eigenvector, spread) work on the dense
     * adjacency matrix with Eigen's self-adjoint solver; path-based measures
     * (closeness, betweenness) use breadth-first search over the adjacency
     * lists. Every measure returns all zeros on an edgeless graph.
     */
    class CentralityCalculator : public ICentralityProvider {
    public:
        Eigen::VectorXd compute(const ContactGraph& graph, CentralityMeasure measure) const override;

        /** @brief Number of neighbors of each vertex. */
        static Eigen::VectorXd degree(const ContactGraph& graph);

        /**
         * @brief Closeness restricted to reachable vertices, scaled by 1/n.
         *
         * For a vertex v with r reachable vertices at total distance d the
         * score is (r / d) / n, and 0 when nothing is reachable.
         */
        static Eigen::VectorXd closeness(const ContactGraph& graph);

        /** @brief Unnormalized shortest-path betweenness (Brandes), counting each unordered pair once. */
        static Eigen::VectorXd betweenness(const ContactGraph& graph);

        /**
         * @brief Unit eigenvector of the largest adjacency eigenvalue.
         *
         * The sign is chosen so that the entries sum to a non-negative value.
         */
        static Eigen::VectorXd eigenvector(const ContactGraph& graph);

        /** @brief Reduction of the largest adjacency eigenvalue caused by removing each vertex. */
        static Eigen::VectorXd spread(const ContactGraph& graph);

        /** @brief Largest eigenvalue of a symmetric matrix; 0 for an empty matrix. */
        static double largestEigenvalue(const Eigen::MatrixXd& adjacency);
    };

} // namespace dissim

#endif // CENTRALITY_CALCULATOR_HPP
