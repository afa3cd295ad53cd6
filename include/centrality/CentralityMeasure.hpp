#ifndef CENTRALITY_MEASURE_HPP
#define CENTRALITY_MEASURE_HPP

#include <string>
#include <vector>

namespace dissim {

    /**
     * @brief Closed set of centrality measures available for vaccination selection.
     */
    enum class CentralityMeasure {
        Degree,
        Closeness,
        Betweenness,
        Eigenvector,
        Spread  ///< Drop in the largest adjacency eigenvalue when the vertex is removed.
    };

    /**
     * @brief Parses a centrality measure name (case-insensitive).
     * @throws InvalidParameterException If the name is not one of degree, closeness,
     *         betweenness, eigenvector or spread.
     */
    CentralityMeasure parseCentralityMeasure(const std::string& name);

    /** @brief Lower-case name of a measure, as accepted by parseCentralityMeasure. */
    std::string toString(CentralityMeasure measure);

    /** @brief All measures, in declaration order. */
    const std::vector<CentralityMeasure>& allCentralityMeasures();

} // namespace dissim

#endif // CENTRALITY_MEASURE_HPP
