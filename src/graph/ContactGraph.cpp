#include "graph/ContactGraph.hpp"
#include <algorithm>

namespace dissim {

    ContactGraph ContactGraph::create(const std::vector<std::string>& labels,
                                      const std::vector<Edge>& edges)
    {
        ContactGraph graph;
        graph.labels_.reserve(labels.size());
        graph.adjacency_.resize(labels.size());

        for (size_t i = 0; i < labels.size(); ++i) {
            auto inserted = graph.index_.emplace(labels[i], static_cast<int>(i));
            if (!inserted.second) {
                THROW_GRAPH_INCONSISTENCY("ContactGraph::create", "Duplicate vertex identifier '" + labels[i] + "'.");
            }
            graph.labels_.push_back(labels[i]);
        }

        for (const auto& edge : edges) {
            auto src = graph.index_.find(edge.first);
            auto tar = graph.index_.find(edge.second);
            if (src == graph.index_.end() || tar == graph.index_.end()) {
                const std::string& missing = (src == graph.index_.end()) ? edge.first : edge.second;
                THROW_GRAPH_INCONSISTENCY("ContactGraph::create", "Edge (" + edge.first + ", " + edge.second + ") references unknown vertex '" + missing + "'.");
            }
            if (src->second == tar->second) {
                THROW_GRAPH_INCONSISTENCY("ContactGraph::create", "Self-loop on vertex '" + edge.first + "' is not allowed in a contact graph.");
            }
            graph.adjacency_[src->second].push_back(tar->second);
            graph.adjacency_[tar->second].push_back(src->second);
        }

        int degree_sum = 0;
        for (auto& nbrs : graph.adjacency_) {
            std::sort(nbrs.begin(), nbrs.end());
            nbrs.erase(std::unique(nbrs.begin(), nbrs.end()), nbrs.end());
            degree_sum += static_cast<int>(nbrs.size());
        }
        graph.num_edges_ = degree_sum / 2;
        return graph;
    }

    void ContactGraph::checkIndex(int index, const std::string& caller) const {
        if (index < 0 || index >= numVertices()) {
            THROW_INVALID_PARAM(caller, "Vertex index " + std::to_string(index) + " out of range [0, " + std::to_string(numVertices()) + ").");
        }
    }

    const std::string& ContactGraph::label(int index) const {
        checkIndex(index, "ContactGraph::label");
        return labels_[index];
    }

    std::optional<int> ContactGraph::indexOf(const std::string& label) const {
        auto it = index_.find(label);
        if (it == index_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    const std::vector<int>& ContactGraph::neighbors(int index) const {
        checkIndex(index, "ContactGraph::neighbors");
        return adjacency_[index];
    }

    bool ContactGraph::hasEdge(int u, int v) const {
        const auto& nbrs = neighbors(u);
        checkIndex(v, "ContactGraph::hasEdge");
        return std::binary_search(nbrs.begin(), nbrs.end(), v);
    }

    ContactGraph ContactGraph::withoutVertices(const std::unordered_set<std::string>& removed) const {
        const int n = numVertices();
        std::vector<int> new_index(n, -1);

        ContactGraph reduced;
        for (int i = 0; i < n; ++i) {
            if (removed.count(labels_[i]) > 0) continue;
            new_index[i] = static_cast<int>(reduced.labels_.size());
            reduced.index_.emplace(labels_[i], new_index[i]);
            reduced.labels_.push_back(labels_[i]);
        }

        // Old neighbor lists are sorted and the index map is monotone, so the
        // remapped lists stay sorted.
        reduced.adjacency_.resize(reduced.labels_.size());
        int degree_sum = 0;
        for (int i = 0; i < n; ++i) {
            if (new_index[i] < 0) continue;
            auto& nbrs = reduced.adjacency_[new_index[i]];
            for (int j : adjacency_[i]) {
                if (new_index[j] >= 0) {
                    nbrs.push_back(new_index[j]);
                }
            }
            degree_sum += static_cast<int>(nbrs.size());
        }
        reduced.num_edges_ = degree_sum / 2;
        return reduced;
    }

    ContactGraph ContactGraph::withoutVertex(int index) const {
        checkIndex(index, "ContactGraph::withoutVertex");
        return withoutVertices({labels_[index]});
    }

    Eigen::MatrixXd ContactGraph::adjacencyMatrix() const {
        const int n = numVertices();
        Eigen::MatrixXd adj = Eigen::MatrixXd::Zero(n, n);
        for (int i = 0; i < n; ++i) {
            for (int j : adjacency_[i]) {
                adj(i, j) = 1.0;
            }
        }
        return adj;
    }

} // namespace dissim
