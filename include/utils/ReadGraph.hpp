#ifndef READ_GRAPH_HPP
#define READ_GRAPH_HPP

#include <string>
#include "graph/ContactGraph.hpp"
#include "exceptions/GraphReadException.hpp"

namespace dissim {

/**
 * @brief Reads a contact graph, choosing the format from the file extension
 *
 * Files ending in ".gml" are parsed with readGmlGraph, anything else with
 * readEdgeListGraph.
 *
 * @param filename [std::string] The path to the graph file
 * @return ContactGraph The graph, vertices in file order
 *
 * @throws GraphReadException See the format-specific readers
 * @throws GraphInconsistencyException See the format-specific readers
 */
ContactGraph readGraph(const std::string& filename);

/**
 * @brief Reads an undirected graph in GML format
 *
 * Expects `graph [ node [ id <int> label "<name>" ] edge [ source <int> target <int> ] ]`.
 * The vertex identifier is the label, or the id when a node has no label.
 * Other keys, including nested lists such as `graphics [ ... ]`, are skipped.
 * Text after '#' up to the end of the line is a comment. Repeated edges are
 * ignored with a warning.
 *
 * @param filename [std::string] The path to the GML file
 * @return ContactGraph The graph
 *
 * @throws GraphReadException::FileOpenError If the file cannot be opened
 * @throws GraphReadException::SyntaxError If brackets are unbalanced, a string is unterminated or no graph block exists
 * @throws GraphReadException::MissingAttribute If a node lacks an id or an edge lacks a source or target
 * @throws GraphReadException::InvalidNumberFormat If an id, source or target is not an integer
 * @throws GraphInconsistencyException If ids or identifiers repeat, an edge names an unknown id, or an edge is a self-loop
 */
ContactGraph readGmlGraph(const std::string& filename);

/**
 * @brief Reads an undirected graph from a whitespace-separated edge list
 *
 * Each line holds `u v`; extra columns (such as weights) are ignored. A line
 * with a single token declares an isolated vertex. Lines starting with '#'
 * or '%' are comments. Vertices are numbered in order of first appearance.
 *
 * @param filename [std::string] The path to the edge-list file
 * @return ContactGraph The graph
 *
 * @throws GraphReadException::FileOpenError If the file cannot be opened
 * @throws GraphInconsistencyException If a line is a self-loop
 */
ContactGraph readEdgeListGraph(const std::string& filename);

} // namespace dissim
#endif // READ_GRAPH_HPP
