#ifndef TALLY_SCC_HPP
#define TALLY_SCC_HPP

#include <tally/configuration_graph.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace tally {

/**
 * One strongly connected component. Vertices are sorted by id.
 * An attractor has no edge leaving the component; normal forms are
 * singleton attractors.
 */
struct StronglyConnectedComponent {
    std::vector<VertexId> vertices;
    bool is_attractor = false;
    bool has_self_loop = false;

    std::size_t size() const { return vertices.size(); }

    // A single vertex without a self-loop carries no cycle
    bool is_trivial() const { return vertices.size() == 1 && !has_self_loop; }
};

/**
 * Partition of a graph's vertices into SCCs.
 * components are in Tarjan emission order (reverse topological order of the
 * condensation); component_of maps each vertex to its component index.
 */
struct SCCDecomposition {
    std::vector<StronglyConnectedComponent> components;
    std::vector<std::size_t> component_of;

    std::size_t size() const { return components.size(); }
    std::size_t largest_component_size() const;

    // Component indices, in emission order
    std::vector<std::size_t> attractors() const;
    std::vector<std::size_t> non_trivial() const;
};

/**
 * Tarjan's algorithm with an explicit (vertex, next child) work stack, so
 * recursion depth does not grow with path length. O(V + E), followed by an
 * O(E) pass marking attractors.
 */
class TarjanSCC {
private:
    const ConfigurationGraph& graph_;

public:
    explicit TarjanSCC(const ConfigurationGraph& graph) : graph_(graph) {}

    SCCDecomposition find_sccs() const;
};

/**
 * Basins of attraction over a fixed graph and decomposition.
 * The graph must outlive the analyzer.
 */
class AttractorAnalyzer {
private:
    const ConfigurationGraph& graph_;
    SCCDecomposition decomposition_;
    std::vector<std::size_t> attractors_;
    std::vector<std::vector<VertexId>> predecessors_;
    std::size_t num_threads_;

    std::vector<std::vector<VertexId>> basins_;
    bool basins_computed_ = false;

public:
    AttractorAnalyzer(const ConfigurationGraph& graph, std::size_t num_threads = 1);
    AttractorAnalyzer(const ConfigurationGraph& graph, SCCDecomposition decomposition,
                      std::size_t num_threads = 1);

    const SCCDecomposition& decomposition() const { return decomposition_; }

    // Component indices of the attractors, in emission order
    const std::vector<std::size_t>& attractors() const { return attractors_; }

    /**
     * Every vertex from which the component is reachable, the component's
     * own vertices included. Sorted by id.
     */
    std::vector<VertexId> find_basin(std::size_t component_index) const;

    /**
     * Basins of all attractors, aligned with attractors(). Computed once,
     * one job per attractor.
     */
    const std::vector<std::vector<VertexId>>& compute_all_basins();

    /**
     * For each vertex, the component index of the first attractor (in
     * emission order) whose basin contains it; nullopt if none does.
     */
    std::vector<std::optional<std::size_t>> classify_vertices();

    // All attractor components whose basin contains the vertex
    std::vector<std::size_t> basins_containing(VertexId vertex);
};

} // namespace tally

#endif // TALLY_SCC_HPP
