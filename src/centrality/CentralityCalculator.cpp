#include "centrality/CentralityCalculator.hpp"
#include "exceptions/Exceptions.hpp"
#include <Eigen/Eigenvalues>
#include <vector>
#include <queue>
#include <stack>

namespace dissim {

Eigen::VectorXd CentralityCalculator::compute(const ContactGraph& graph, CentralityMeasure measure) const {
    if (graph.numEdges() == 0) {
        return Eigen::VectorXd::Zero(graph.numVertices());
    }

    switch (measure) {
        case CentralityMeasure::Degree:      return degree(graph);
        case CentralityMeasure::Closeness:   return closeness(graph);
        case CentralityMeasure::Betweenness: return betweenness(graph);
        case CentralityMeasure::Eigenvector: return eigenvector(graph);
        case CentralityMeasure::Spread:      return spread(graph);
    }
    THROW_INVALID_PARAM("CentralityCalculator::compute", "Unsupported centrality measure.");
}

Eigen::VectorXd CentralityCalculator::degree(const ContactGraph& graph) {
    const int n = graph.numVertices();
    Eigen::VectorXd scores(n);
    for (int v = 0; v < n; ++v) {
        scores(v) = static_cast<double>(graph.degree(v));
    }
    return scores;
}

Eigen::VectorXd CentralityCalculator::closeness(const ContactGraph& graph) {
    const int n = graph.numVertices();
    Eigen::VectorXd scores = Eigen::VectorXd::Zero(n);
    std::vector<int> distances(n);

    for (int s = 0; s < n; ++s) {
        std::fill(distances.begin(), distances.end(), -1);
        distances[s] = 0;
        std::queue<int> frontier;
        frontier.push(s);

        long long total_dist = 0;
        int reachable = 0;
        while (!frontier.empty()) {
            int u = frontier.front();
            frontier.pop();
            for (int v : graph.neighbors(u)) {
                if (distances[v] == -1) {
                    distances[v] = distances[u] + 1;
                    total_dist += distances[v];
                    ++reachable;
                    frontier.push(v);
                }
            }
        }

        if (total_dist > 0) {
            scores(s) = (static_cast<double>(reachable) / static_cast<double>(total_dist)) / static_cast<double>(n);
        }
    }
    return scores;
}

Eigen::VectorXd CentralityCalculator::betweenness(const ContactGraph& graph) {
    const int n = graph.numVertices();
    Eigen::VectorXd scores = Eigen::VectorXd::Zero(n);
    if (n <= 2) {
        return scores;
    }

    std::vector<int> distances(n);
    std::vector<double> sigma(n);
    std::vector<double> delta(n);

    for (int s = 0; s < n; ++s) {
        std::fill(distances.begin(), distances.end(), -1);
        std::fill(sigma.begin(), sigma.end(), 0.0);
        std::fill(delta.begin(), delta.end(), 0.0);

        std::stack<int> order;
        std::queue<int> frontier;
        distances[s] = 0;
        sigma[s] = 1.0;
        frontier.push(s);

        while (!frontier.empty()) {
            int u = frontier.front();
            frontier.pop();
            order.push(u);
            for (int v : graph.neighbors(u)) {
                if (distances[v] == -1) {
                    distances[v] = distances[u] + 1;
                    frontier.push(v);
                }
                if (distances[v] == distances[u] + 1) {
                    sigma[v] += sigma[u];
                }
            }
        }

        // Dependency accumulation in order of non-increasing distance
        while (!order.empty()) {
            int w = order.top();
            order.pop();
            for (int v : graph.neighbors(w)) {
                if (distances[v] == distances[w] - 1) {
                    delta[v] += (sigma[v] / sigma[w]) * (1.0 + delta[w]);
                }
            }
            if (w != s) {
                scores(w) += delta[w];
            }
        }
    }

    // Each unordered pair was counted from both endpoints
    return 0.5 * scores;
}

Eigen::VectorXd CentralityCalculator::eigenvector(const ContactGraph& graph) {
    const int n = graph.numVertices();
    if (n == 0) {
        return Eigen::VectorXd::Zero(0);
    }

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(graph.adjacencyMatrix());
    if (es.info() != Eigen::Success) {
        throw SimulationException("CentralityCalculator::eigenvector", "Eigen decomposition of the adjacency matrix did not converge.");
    }

    // Eigenvalues are sorted ascending; the last column belongs to the largest.
    Eigen::VectorXd v = es.eigenvectors().col(n - 1);
    if (v.sum() < 0.0) {
        v = -v;
    }
    return v;
}

double CentralityCalculator::largestEigenvalue(const Eigen::MatrixXd& adjacency) {
    if (adjacency.rows() == 0) {
        return 0.0;
    }
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(adjacency, Eigen::EigenvaluesOnly);
    if (es.info() != Eigen::Success) {
        throw SimulationException("CentralityCalculator::largestEigenvalue", "Eigenvalue computation did not converge.");
    }
    return es.eigenvalues()(adjacency.rows() - 1);
}

Eigen::VectorXd CentralityCalculator::spread(const ContactGraph& graph) {
    const int n = graph.numVertices();
    Eigen::VectorXd scores = Eigen::VectorXd::Zero(n);
    if (n == 0) {
        return scores;
    }

    const Eigen::MatrixXd adj = graph.adjacencyMatrix();
    const double full_largest = largestEigenvalue(adj);

    Eigen::MatrixXd minor(n - 1, n - 1);
    for (int i = 0; i < n; ++i) {
        // Copy the four blocks around row/column i
        if (n > 1) {
            const int before = i;
            const int after = n - i - 1;
            minor.topLeftCorner(before, before) = adj.topLeftCorner(before, before);
            minor.topRightCorner(before, after) = adj.topRightCorner(before, after);
            minor.bottomLeftCorner(after, before) = adj.bottomLeftCorner(after, before);
            minor.bottomRightCorner(after, after) = adj.bottomRightCorner(after, after);
        }
        scores(i) = full_largest - largestEigenvalue(minor);
    }
    return scores;
}

} // namespace dissim
