#include <tally/scc.hpp>
#include <tally/debug_log.hpp>
#include <tally/parallel.hpp>
#include <algorithm>
#include <deque>
#include <limits>
#include <stdexcept>
#include <string>

namespace tally {

std::size_t SCCDecomposition::largest_component_size() const {
    std::size_t largest = 0;
    for (const auto& component : components) {
        largest = std::max(largest, component.size());
    }
    return largest;
}

std::vector<std::size_t> SCCDecomposition::attractors() const {
    std::vector<std::size_t> result;
    for (std::size_t i = 0; i < components.size(); ++i) {
        if (components[i].is_attractor) {
            result.push_back(i);
        }
    }
    return result;
}

std::vector<std::size_t> SCCDecomposition::non_trivial() const {
    std::vector<std::size_t> result;
    for (std::size_t i = 0; i < components.size(); ++i) {
        if (!components[i].is_trivial()) {
            result.push_back(i);
        }
    }
    return result;
}

SCCDecomposition TarjanSCC::find_sccs() const {
    constexpr std::size_t UNVISITED = std::numeric_limits<std::size_t>::max();

    struct Frame {
        VertexId vertex;
        std::size_t next_child;
    };

    const std::size_t n = graph_.num_vertices();
    std::vector<std::size_t> index(n, UNVISITED);
    std::vector<std::size_t> lowlink(n, 0);
    std::vector<bool> on_stack(n, false);
    std::vector<VertexId> stack;
    std::vector<Frame> frames;
    std::size_t counter = 0;

    SCCDecomposition result;
    result.component_of.assign(n, 0);

    auto discover = [&](VertexId v) {
        index[v] = lowlink[v] = counter++;
        stack.push_back(v);
        on_stack[v] = true;
        frames.push_back({v, 0});
    };

    for (VertexId root = 0; root < n; ++root) {
        if (index[root] != UNVISITED) continue;
        discover(root);

        while (!frames.empty()) {
            VertexId v = frames.back().vertex;
            const auto& succ = graph_.successors(v);

            if (frames.back().next_child < succ.size()) {
                VertexId w = succ[frames.back().next_child++];
                if (index[w] == UNVISITED) {
                    discover(w);
                } else if (on_stack[w]) {
                    lowlink[v] = std::min(lowlink[v], index[w]);
                }
                continue;
            }

            frames.pop_back();

            if (lowlink[v] == index[v]) {
                StronglyConnectedComponent component;
                VertexId w;
                do {
                    w = stack.back();
                    stack.pop_back();
                    on_stack[w] = false;
                    result.component_of[w] = result.components.size();
                    component.vertices.push_back(w);
                } while (w != v);

                std::sort(component.vertices.begin(), component.vertices.end());
                result.components.push_back(std::move(component));
            }

            if (!frames.empty()) {
                VertexId parent = frames.back().vertex;
                lowlink[parent] = std::min(lowlink[parent], lowlink[v]);
            }
        }
    }

    // Attractor pass: any edge leaving the component disqualifies it
    for (std::size_t c = 0; c < result.components.size(); ++c) {
        auto& component = result.components[c];
        component.is_attractor = true;
        for (VertexId v : component.vertices) {
            for (VertexId w : graph_.successors(v)) {
                if (result.component_of[w] != c) {
                    component.is_attractor = false;
                }
                if (w == v) {
                    component.has_self_loop = true;
                }
            }
        }
    }

    TALLY_LOG(Info, "Tarjan: %zu vertices -> %zu components, largest %zu",
              n, result.components.size(), result.largest_component_size());
    return result;
}

AttractorAnalyzer::AttractorAnalyzer(const ConfigurationGraph& graph, std::size_t num_threads)
    : AttractorAnalyzer(graph, TarjanSCC(graph).find_sccs(), num_threads) {}

AttractorAnalyzer::AttractorAnalyzer(const ConfigurationGraph& graph, SCCDecomposition decomposition,
                                     std::size_t num_threads)
    : graph_(graph)
    , decomposition_(std::move(decomposition))
    , attractors_(decomposition_.attractors())
    , predecessors_(graph.predecessors())
    , num_threads_(num_threads) {
    if (decomposition_.component_of.size() != graph_.num_vertices()) {
        throw std::invalid_argument("SCC decomposition does not match graph ("
            + std::to_string(decomposition_.component_of.size()) + " vs "
            + std::to_string(graph_.num_vertices()) + " vertices)");
    }
    TALLY_LOG(Info, "AttractorAnalyzer: %zu attractors among %zu components",
              attractors_.size(), decomposition_.size());
}

std::vector<VertexId> AttractorAnalyzer::find_basin(std::size_t component_index) const {
    const auto& component = decomposition_.components.at(component_index);

    std::vector<bool> visited(graph_.num_vertices(), false);
    std::deque<VertexId> queue;
    for (VertexId v : component.vertices) {
        visited[v] = true;
        queue.push_back(v);
    }

    std::vector<VertexId> basin;
    while (!queue.empty()) {
        VertexId v = queue.front();
        queue.pop_front();
        basin.push_back(v);
        for (VertexId u : predecessors_[v]) {
            if (!visited[u]) {
                visited[u] = true;
                queue.push_back(u);
            }
        }
    }

    std::sort(basin.begin(), basin.end());
    return basin;
}

const std::vector<std::vector<VertexId>>& AttractorAnalyzer::compute_all_basins() {
    if (basins_computed_) {
        return basins_;
    }

    std::vector<std::vector<VertexId>> basins(attractors_.size());
    parallel_for(attractors_.size(), num_threads_, AnalysisJobType::BASIN_COMPUTATION,
        [this, &basins](std::size_t i) {
            basins[i] = find_basin(attractors_[i]);
        });

    basins_ = std::move(basins);
    basins_computed_ = true;
    return basins_;
}

std::vector<std::optional<std::size_t>> AttractorAnalyzer::classify_vertices() {
    const auto& basins = compute_all_basins();
    std::vector<std::optional<std::size_t>> classification(graph_.num_vertices());

    for (std::size_t i = 0; i < basins.size(); ++i) {
        for (VertexId v : basins[i]) {
            if (!classification[v]) {
                classification[v] = attractors_[i];
            }
        }
    }

    return classification;
}

std::vector<std::size_t> AttractorAnalyzer::basins_containing(VertexId vertex) {
    if (vertex >= graph_.num_vertices()) {
        throw std::out_of_range("Unknown vertex id " + std::to_string(vertex));
    }

    const auto& basins = compute_all_basins();
    std::vector<std::size_t> result;
    for (std::size_t i = 0; i < basins.size(); ++i) {
        if (std::binary_search(basins[i].begin(), basins[i].end(), vertex)) {
            result.push_back(attractors_[i]);
        }
    }
    return result;
}

} // namespace tally
