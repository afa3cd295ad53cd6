#include "utils/ReadGraph.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dissim {

namespace {

struct GmlToken {
    enum class Kind { Key, Scalar, String, Open, Close };
    Kind kind;
    std::string text;
    int line;
};

/// One `key value` pair of a GML list; a list value holds its own children.
struct GmlEntry {
    std::string key;
    std::string value;
    bool is_string = false;
    bool is_list = false;
    int line = 0;
    std::vector<GmlEntry> children;
};

const std::string kGmlFunc = "dissim::readGmlGraph";

std::vector<GmlToken> tokenizeGml(std::istream& in, const std::string& filename) {
    std::vector<GmlToken> tokens;
    std::string line;
    int line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        size_t i = 0;
        while (i < line.size()) {
            const char c = line[i];
            if (std::isspace(static_cast<unsigned char>(c))) { ++i; continue; }
            if (c == '#') break;
            if (c == '[') { tokens.push_back({GmlToken::Kind::Open, "[", line_number}); ++i; continue; }
            if (c == ']') { tokens.push_back({GmlToken::Kind::Close, "]", line_number}); ++i; continue; }
            if (c == '"') {
                size_t end = line.find('"', i + 1);
                std::string text;
                // Strings may span lines
                while (end == std::string::npos) {
                    text += line.substr(i + 1) + "\n";
                    if (!std::getline(in, line)) {
                        throw GraphReadException(GraphReadException::ErrorType::SyntaxError, kGmlFunc,
                            "unterminated string starting on line " + std::to_string(line_number) + " in " + filename);
                    }
                    ++line_number;
                    i = static_cast<size_t>(-1);
                    end = line.find('"');
                }
                text += line.substr(i + 1, end - i - 1);
                tokens.push_back({GmlToken::Kind::String, text, line_number});
                i = end + 1;
                continue;
            }
            size_t start = i;
            while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i])) &&
                   line[i] != '[' && line[i] != ']' && line[i] != '"') {
                ++i;
            }
            std::string word = line.substr(start, i - start);
            const bool is_key = std::isalpha(static_cast<unsigned char>(word[0])) || word[0] == '_';
            tokens.push_back({is_key ? GmlToken::Kind::Key : GmlToken::Kind::Scalar, word, line_number});
        }
    }
    return tokens;
}

std::vector<GmlEntry> parseGmlList(const std::vector<GmlToken>& tokens, size_t& pos, bool nested, const std::string& filename) {
    std::vector<GmlEntry> entries;
    while (pos < tokens.size()) {
        const GmlToken& key = tokens[pos];
        if (key.kind == GmlToken::Kind::Close) {
            if (!nested) {
                throw GraphReadException(GraphReadException::ErrorType::SyntaxError, kGmlFunc,
                    "unexpected ']' on line " + std::to_string(key.line) + " in " + filename);
            }
            ++pos;
            return entries;
        }
        if (key.kind != GmlToken::Kind::Key) {
            throw GraphReadException(GraphReadException::ErrorType::SyntaxError, kGmlFunc,
                "expected a key but found '" + key.text + "' on line " + std::to_string(key.line) + " in " + filename);
        }
        if (++pos >= tokens.size()) {
            throw GraphReadException(GraphReadException::ErrorType::SyntaxError, kGmlFunc,
                "key '" + key.text + "' has no value on line " + std::to_string(key.line) + " in " + filename);
        }

        GmlEntry entry;
        entry.key = key.text;
        entry.line = key.line;
        const GmlToken& value = tokens[pos];
        switch (value.kind) {
            case GmlToken::Kind::Open:
                ++pos;
                entry.is_list = true;
                entry.children = parseGmlList(tokens, pos, true, filename);
                break;
            case GmlToken::Kind::String:
                entry.is_string = true;
                entry.value = value.text;
                ++pos;
                break;
            case GmlToken::Kind::Scalar:
            case GmlToken::Kind::Key:
                entry.value = value.text;
                ++pos;
                break;
            case GmlToken::Kind::Close:
                throw GraphReadException(GraphReadException::ErrorType::SyntaxError, kGmlFunc,
                    "key '" + key.text + "' has no value on line " + std::to_string(key.line) + " in " + filename);
        }
        entries.push_back(std::move(entry));
    }
    if (nested) {
        throw GraphReadException(GraphReadException::ErrorType::SyntaxError, kGmlFunc,
            "unbalanced '[' (missing ']') in " + filename);
    }
    return entries;
}

const GmlEntry* findEntry(const std::vector<GmlEntry>& entries, const std::string& key) {
    for (const auto& entry : entries) {
        if (entry.key == key) return &entry;
    }
    return nullptr;
}

long long parseIntegerAttribute(const GmlEntry& entry, const std::string& filename) {
    if (entry.is_list) {
        throw GraphReadException(GraphReadException::ErrorType::InvalidNumberFormat, kGmlFunc,
            "'" + entry.key + "' on line " + std::to_string(entry.line) + " is a list, expected an integer in " + filename);
    }
    size_t pos = 0;
    long long result = 0;
    try {
        result = std::stoll(entry.value, &pos);
    } catch (const std::logic_error&) {
        throw GraphReadException(GraphReadException::ErrorType::InvalidNumberFormat, kGmlFunc,
            "'" + entry.key + "' on line " + std::to_string(entry.line) + ": '" + entry.value + "' in " + filename);
    }
    if (pos != entry.value.size()) {
        throw GraphReadException(GraphReadException::ErrorType::InvalidNumberFormat, kGmlFunc,
            "'" + entry.key + "' on line " + std::to_string(entry.line) + ": '" + entry.value + "' in " + filename);
    }
    return result;
}

} // namespace

ContactGraph readGraph(const std::string& filename) {
    if (FileUtils::getFileExtension(filename) == "gml") {
        return readGmlGraph(filename);
    }
    return readEdgeListGraph(filename);
}

ContactGraph readGmlGraph(const std::string& filename) {
    Logger& logger = Logger::getInstance();
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw GraphReadException(GraphReadException::ErrorType::FileOpenError, kGmlFunc, filename);
    }

    const std::vector<GmlToken> tokens = tokenizeGml(file, filename);
    size_t pos = 0;
    const std::vector<GmlEntry> document = parseGmlList(tokens, pos, false, filename);

    const GmlEntry* graph = findEntry(document, "graph");
    if (graph == nullptr || !graph->is_list) {
        throw GraphReadException(GraphReadException::ErrorType::SyntaxError, kGmlFunc, "no 'graph [ ... ]' block in " + filename);
    }

    std::vector<std::string> labels;
    std::unordered_map<long long, int> index_of_id;
    std::vector<ContactGraph::Edge> edges;
    std::set<std::pair<int, int>> seen_edges;

    for (const auto& entry : graph->children) {
        if (entry.key == "directed" && !entry.is_list && entry.value != "0") {
            logger.warning("ReadGraph", "Graph in " + filename + " is marked directed; edges are read as undirected.");
        } else if (entry.key == "node" && entry.is_list) {
            const GmlEntry* id = findEntry(entry.children, "id");
            if (id == nullptr) {
                throw GraphReadException(GraphReadException::ErrorType::MissingAttribute, kGmlFunc,
                    "node on line " + std::to_string(entry.line) + " has no id in " + filename);
            }
            const long long id_value = parseIntegerAttribute(*id, filename);
            if (index_of_id.count(id_value)) {
                THROW_GRAPH_INCONSISTENCY(kGmlFunc, "Duplicate node id " + std::to_string(id_value) +
                                          " on line " + std::to_string(entry.line) + " in " + filename);
            }
            const GmlEntry* label = findEntry(entry.children, "label");
            if (label != nullptr && label->is_list) {
                throw GraphReadException(GraphReadException::ErrorType::SyntaxError, kGmlFunc,
                    "node label on line " + std::to_string(label->line) + " is a list in " + filename);
            }
            index_of_id[id_value] = static_cast<int>(labels.size());
            labels.push_back(label != nullptr ? label->value : id->value);
        } else if (entry.key == "edge" && entry.is_list) {
            const GmlEntry* source = findEntry(entry.children, "source");
            const GmlEntry* target = findEntry(entry.children, "target");
            if (source == nullptr || target == nullptr) {
                throw GraphReadException(GraphReadException::ErrorType::MissingAttribute, kGmlFunc,
                    "edge on line " + std::to_string(entry.line) + " needs both source and target in " + filename);
            }
            const long long s = parseIntegerAttribute(*source, filename);
            const long long t = parseIntegerAttribute(*target, filename);
            auto s_it = index_of_id.find(s);
            auto t_it = index_of_id.find(t);
            if (s_it == index_of_id.end() || t_it == index_of_id.end()) {
                THROW_GRAPH_INCONSISTENCY(kGmlFunc, "Edge on line " + std::to_string(entry.line) +
                                          " references an unknown node id in " + filename);
            }
            const int u = s_it->second;
            const int v = t_it->second;
            if (!seen_edges.insert({std::min(u, v), std::max(u, v)}).second) {
                logger.warning("ReadGraph", "Ignoring repeated edge " + labels[u] + " -- " + labels[v] +
                               " on line " + std::to_string(entry.line) + " in " + filename);
                continue;
            }
            edges.emplace_back(labels[u], labels[v]);
        }
    }

    ContactGraph result = ContactGraph::create(labels, edges);
    logger.info("ReadGraph", "Read " + std::to_string(result.numVertices()) + " vertices and " +
                std::to_string(result.numEdges()) + " edges from " + filename);
    return result;
}

ContactGraph readEdgeListGraph(const std::string& filename) {
    Logger& logger = Logger::getInstance();
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw GraphReadException(GraphReadException::ErrorType::FileOpenError, "dissim::readEdgeListGraph", filename);
    }

    std::vector<std::string> labels;
    std::unordered_map<std::string, int> index_of;
    std::vector<ContactGraph::Edge> edges;
    std::set<std::pair<int, int>> seen_edges;

    auto vertexIndex = [&](const std::string& name) {
        auto it = index_of.find(name);
        if (it != index_of.end()) return it->second;
        const int idx = static_cast<int>(labels.size());
        index_of.emplace(name, idx);
        labels.push_back(name);
        return idx;
    };

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        std::istringstream iss(line);
        std::string u;
        if (!(iss >> u) || u[0] == '#' || u[0] == '%') continue;
        std::string v;
        const int ui = vertexIndex(u);
        if (!(iss >> v) || v[0] == '#' || v[0] == '%') continue;
        const int vi = vertexIndex(v);
        if (ui == vi) {
            THROW_GRAPH_INCONSISTENCY("dissim::readEdgeListGraph", "Self-loop on vertex '" + u + "' on line " +
                                      std::to_string(line_number) + " in " + filename);
        }
        if (!seen_edges.insert({std::min(ui, vi), std::max(ui, vi)}).second) {
            logger.warning("ReadGraph", "Ignoring repeated edge " + u + " -- " + v + " on line " +
                           std::to_string(line_number) + " in " + filename);
            continue;
        }
        edges.emplace_back(u, v);
    }

    ContactGraph result = ContactGraph::create(labels, edges);
    logger.info("ReadGraph", "Read " + std::to_string(result.numVertices()) + " vertices and " +
                std::to_string(result.numEdges()) + " edges from " + filename);
    return result;
}

} // namespace dissim
