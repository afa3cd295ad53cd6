#ifndef CONTACT_GRAPH_HPP
#define CONTACT_GRAPH_HPP

#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <optional>
#include <Eigen/Dense>
#include "exceptions/Exceptions.hpp"

namespace dissim {

    /**
     * @class ContactGraph
     * @brief Undirected, simple contact graph over uniquely labelled vertices.
     *
     * Vertices are indexed by their insertion order; every vertex keeps a
     * sorted list of neighbor indices. Instances are immutable once built:
     * vaccination derives a new graph (the induced subgraph on the retained
     * vertices) instead of editing this one, so a graph can be shared
     * read-only between trials.
     */
    class ContactGraph {
        public:
            using Edge = std::pair<std::string, std::string>;

            /** @brief Creates an empty graph. */
            ContactGraph() = default;

            /**
             * @brief Builds a graph from vertex identifiers and an edge list.
             *
             * Repeated edges (in either orientation) are stored once.
             *
             * @param labels Vertex identifiers, in the order that defines vertex indices.
             * @param edges Pairs of vertex identifiers.
             * @return ContactGraph The validated graph.
             *
             * @throws GraphInconsistencyException If an identifier is duplicated, an edge
             *         references an unknown vertex, or an edge is a self-loop.
             */
            static ContactGraph create(const std::vector<std::string>& labels,
                                       const std::vector<Edge>& edges);

            /** @brief Number of vertices. */
            int numVertices() const { return static_cast<int>(labels_.size()); }

            /** @brief Number of undirected edges. */
            int numEdges() const { return num_edges_; }

            bool empty() const { return labels_.empty(); }

            const std::string& label(int index) const;
            const std::vector<std::string>& labels() const { return labels_; }

            /**
             * @brief Looks up a vertex index by identifier.
             * @return std::optional<int> The index, or std::nullopt if the vertex is absent.
             */
            std::optional<int> indexOf(const std::string& label) const;

            bool hasVertex(const std::string& label) const { return index_.count(label) > 0; }

            /** @brief Neighbor indices of a vertex, sorted ascending. */
            const std::vector<int>& neighbors(int index) const;

            int degree(int index) const { return static_cast<int>(neighbors(index).size()); }

            bool hasEdge(int u, int v) const;

            /**
             * @brief Derives the induced subgraph on all vertices except the given ones.
             *
             * Retained vertices keep their relative order. Identifiers that are
             * not in the graph are ignored.
             *
             * @param removed Identifiers of the vertices to drop.
             * @return ContactGraph A new graph; this graph is left untouched.
             */
            ContactGraph withoutVertices(const std::unordered_set<std::string>& removed) const;

            /** @brief Derives the induced subgraph without the vertex at @p index. */
            ContactGraph withoutVertex(int index) const;

            /** @brief Dense symmetric 0/1 adjacency matrix, rows ordered by vertex index. */
            Eigen::MatrixXd adjacencyMatrix() const;

        private:
            void checkIndex(int index, const std::string& caller) const;

            std::vector<std::string> labels_;
            std::unordered_map<std::string, int> index_;
            std::vector<std::vector<int>> adjacency_;
            int num_edges_ = 0;
    };

} // namespace dissim

#endif // CONTACT_GRAPH_HPP
