#ifndef I_CENTRALITY_PROVIDER_HPP
#define I_CENTRALITY_PROVIDER_HPP

#include "centrality/CentralityMeasure.hpp"
#include "graph/ContactGraph.hpp"
#include <Eigen/Dense>

namespace dissim {

/**
 * @brief Interface for computing vertex centrality scores.
 *
 * Implementations must be pure (the graph is never modified) and total:
 * the returned vector holds one score per vertex, indexed like the graph
 * it was computed on, with 0 for degenerate cases. Scores belong to that
 * graph snapshot only and must not be reused after vertices are removed.
 */
class ICentralityProvider {
public:
    virtual ~ICentralityProvider() = default;

    /**
     * @brief Computes scores for every vertex of @p graph.
     *
     * @param graph The graph snapshot.
     * @param measure The centrality measure to evaluate.
     * @return Eigen::VectorXd Scores of size graph.numVertices().
     */
    virtual Eigen::VectorXd compute(const ContactGraph& graph, CentralityMeasure measure) const = 0;
};

} // namespace dissim

#endif // I_CENTRALITY_PROVIDER_HPP
