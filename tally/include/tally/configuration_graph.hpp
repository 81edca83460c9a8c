#ifndef TALLY_CONFIGURATION_GRAPH_HPP
#define TALLY_CONFIGURATION_GRAPH_HPP

#include <tally/types.hpp>
#include <tally/rule.hpp>
#include <tally/rewriting.hpp>
#include <cstddef>
#include <limits>
#include <optional>
#include <unordered_map>
#include <vector>

namespace tally {

// Dense index into a graph's vertex arena
using VertexId = std::size_t;
constexpr VertexId INVALID_VERTEX = std::numeric_limits<VertexId>::max();

/**
 * Directed transition graph over strings.
 * Vertices live in an arena with stable dense ids assigned in insertion order;
 * adjacency is stored as id lists. Multi-edges collapse to one edge and each
 * successor list keeps first-insertion order.
 */
class ConfigurationGraph {
private:
    std::vector<String> vertices_;
    std::unordered_map<String, VertexId, StringHash> index_;
    std::vector<std::vector<VertexId>> successors_;
    std::size_t num_edges_ = 0;

    void check_vertex(VertexId id) const;

public:
    ConfigurationGraph() = default;

    // Returns the existing id if the string is already a vertex
    VertexId add_vertex(const String& string);

    // Returns false if the edge already existed
    bool add_edge(VertexId from, VertexId to);

    // Adds missing endpoints as vertices
    bool add_edge(const String& from, const String& to);

    std::optional<VertexId> find(const String& string) const;
    bool contains(const String& string) const { return index_.count(string) > 0; }
    bool has_edge(VertexId from, VertexId to) const;

    const String& vertex(VertexId id) const;
    const std::vector<VertexId>& successors(VertexId id) const;
    const std::vector<String>& vertices() const { return vertices_; }

    /**
     * Reverse adjacency: for each vertex, the vertices with an edge into it,
     * in ascending source id order.
     */
    std::vector<std::vector<VertexId>> predecessors() const;

    /**
     * Induced subgraph on `subset`. New ids follow the order of `subset`.
     */
    ConfigurationGraph subgraph(const std::vector<VertexId>& subset) const;

    std::size_t num_vertices() const { return vertices_.size(); }
    std::size_t num_edges() const { return num_edges_; }
    bool empty() const { return vertices_.empty(); }
};

/**
 * Materializes the configuration graph G_L of a rule set.
 */
class GraphBuilder {
private:
    RewritingEngine engine_;
    Alphabet alphabet_;
    std::size_t num_threads_;

public:
    /**
     * @param num_threads Worker count for per-vertex edge construction
     *                    (1 = serial, 0 = hardware concurrency).
     */
    GraphBuilder(const std::vector<Rule>& rules, const Alphabet& alphabet, std::size_t num_threads = 1);

    const RewritingEngine& engine() const { return engine_; }
    const Alphabet& alphabet() const { return alphabet_; }

    /**
     * Every string of length 0..max_length over the alphabet, shortest first,
     * then in alphabet order. Produces sum(|A|^k) strings, so keep max_length small.
     */
    std::vector<String> generate_strings(std::size_t max_length) const;

    /**
     * All strings up to max_length as vertices, with an edge for every
     * one-step rewrite whose result is also at most max_length long.
     * Longer successors are dropped from the graph, not from the relation.
     */
    ConfigurationGraph build_graph(std::size_t max_length) const;

    /**
     * BFS from the seeds without enumerating all strings. Strings first
     * reached at level `depth` are vertices but are not expanded; every edge
     * out of an expanded vertex is kept.
     */
    ConfigurationGraph build_incremental(const std::vector<String>& seeds, std::size_t depth) const;

    /**
     * Graph induced on the bounded-reach set of `start`: every one-step
     * rewrite between two reached strings becomes an edge.
     */
    ConfigurationGraph build_from_reach(const String& start, std::size_t depth,
                                        std::optional<std::size_t> width = std::nullopt) const;
};

} // namespace tally

#endif // TALLY_CONFIGURATION_GRAPH_HPP
