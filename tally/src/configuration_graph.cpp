#include <tally/configuration_graph.hpp>
#include <tally/debug_log.hpp>
#include <tally/parallel.hpp>
#include <algorithm>
#include <deque>
#include <stdexcept>
#include <string>

namespace tally {

void ConfigurationGraph::check_vertex(VertexId id) const {
    if (id >= vertices_.size()) {
        throw std::out_of_range("Unknown vertex id " + std::to_string(id));
    }
}

VertexId ConfigurationGraph::add_vertex(const String& string) {
    auto [it, inserted] = index_.emplace(string, vertices_.size());
    if (inserted) {
        vertices_.push_back(string);
        successors_.emplace_back();
    }
    return it->second;
}

bool ConfigurationGraph::add_edge(VertexId from, VertexId to) {
    check_vertex(from);
    check_vertex(to);

    auto& out = successors_[from];
    if (std::find(out.begin(), out.end(), to) != out.end()) {
        return false;
    }
    out.push_back(to);
    ++num_edges_;
    return true;
}

bool ConfigurationGraph::add_edge(const String& from, const String& to) {
    VertexId u = add_vertex(from);
    VertexId v = add_vertex(to);
    return add_edge(u, v);
}

std::optional<VertexId> ConfigurationGraph::find(const String& string) const {
    auto it = index_.find(string);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ConfigurationGraph::has_edge(VertexId from, VertexId to) const {
    check_vertex(from);
    const auto& out = successors_[from];
    return std::find(out.begin(), out.end(), to) != out.end();
}

const String& ConfigurationGraph::vertex(VertexId id) const {
    check_vertex(id);
    return vertices_[id];
}

const std::vector<VertexId>& ConfigurationGraph::successors(VertexId id) const {
    check_vertex(id);
    return successors_[id];
}

std::vector<std::vector<VertexId>> ConfigurationGraph::predecessors() const {
    std::vector<std::vector<VertexId>> reverse(vertices_.size());
    for (VertexId u = 0; u < successors_.size(); ++u) {
        for (VertexId v : successors_[u]) {
            reverse[v].push_back(u);
        }
    }
    return reverse;
}

ConfigurationGraph ConfigurationGraph::subgraph(const std::vector<VertexId>& subset) const {
    ConfigurationGraph result;
    std::unordered_map<VertexId, VertexId> remap;

    for (VertexId old_id : subset) {
        remap.emplace(old_id, result.add_vertex(vertex(old_id)));
    }

    for (VertexId old_id : subset) {
        for (VertexId succ : successors_[old_id]) {
            auto it = remap.find(succ);
            if (it != remap.end()) {
                result.add_edge(remap.at(old_id), it->second);
            }
        }
    }

    return result;
}

GraphBuilder::GraphBuilder(const std::vector<Rule>& rules, const Alphabet& alphabet, std::size_t num_threads)
    : engine_(rules), alphabet_(alphabet), num_threads_(num_threads) {}

std::vector<String> GraphBuilder::generate_strings(std::size_t max_length) const {
    std::vector<String> strings{String()};
    std::vector<String> frontier{String()};

    for (std::size_t length = 1; length <= max_length; ++length) {
        std::vector<String> next;
        next.reserve(frontier.size() * alphabet_.size());
        for (const auto& prefix : frontier) {
            for (const auto& symbol : alphabet_) {
                next.push_back(prefix.concat(String({symbol})));
            }
        }
        strings.insert(strings.end(), next.begin(), next.end());
        frontier = std::move(next);
    }

    return strings;
}

ConfigurationGraph GraphBuilder::build_graph(std::size_t max_length) const {
    std::vector<String> strings = generate_strings(max_length);
    TALLY_LOG(Info, "build_graph: %zu strings of length <= %zu", strings.size(), max_length);

    ConfigurationGraph graph;
    for (const auto& s : strings) {
        graph.add_vertex(s);
    }

    // Per-vertex successor lists are independent; merge afterwards in id order
    std::vector<std::vector<String>> successor_lists(strings.size());
    parallel_for(strings.size(), num_threads_, AnalysisJobType::EDGE_CONSTRUCTION,
        [this, &strings, &successor_lists, max_length](std::size_t i) {
            for (auto& application : engine_.all_applications(strings[i])) {
                if (application.result.size() <= max_length) {
                    successor_lists[i].push_back(std::move(application.result));
                }
            }
        });

    for (VertexId u = 0; u < successor_lists.size(); ++u) {
        for (const auto& succ : successor_lists[u]) {
            graph.add_edge(u, graph.add_vertex(succ));
        }
    }

    TALLY_LOG(Info, "build_graph: %zu vertices, %zu edges", graph.num_vertices(), graph.num_edges());
    return graph;
}

ConfigurationGraph GraphBuilder::build_incremental(const std::vector<String>& seeds, std::size_t depth) const {
    ConfigurationGraph graph;
    std::deque<std::pair<VertexId, std::size_t>> queue;

    for (const auto& seed : seeds) {
        bool fresh = !graph.contains(seed);
        VertexId id = graph.add_vertex(seed);
        if (fresh) {
            queue.emplace_back(id, 0);
        }
    }

    while (!queue.empty()) {
        auto [current, level] = queue.front();
        queue.pop_front();

        if (level >= depth) {
            continue;
        }

        // Copy: add_vertex may grow the arena
        String current_string = graph.vertex(current);
        for (auto& application : engine_.all_applications(current_string)) {
            bool fresh = !graph.contains(application.result);
            VertexId next = graph.add_vertex(application.result);
            graph.add_edge(current, next);
            if (fresh) {
                queue.emplace_back(next, level + 1);
            }
        }
    }

    TALLY_DEBUG_LOG("build_incremental: %zu seeds, depth %zu -> %zu vertices, %zu edges",
                    seeds.size(), depth, graph.num_vertices(), graph.num_edges());
    return graph;
}

ConfigurationGraph GraphBuilder::build_from_reach(const String& start, std::size_t depth,
                                                  std::optional<std::size_t> width) const {
    ConfigurationGraph graph;
    for (const auto& [level, strings] : engine_.bounded_reach(start, depth, width)) {
        for (const auto& s : strings) {
            graph.add_vertex(s);
        }
    }

    std::size_t reached = graph.num_vertices();
    for (VertexId u = 0; u < reached; ++u) {
        String current = graph.vertex(u);
        for (const auto& succ : engine_.successors(current)) {
            if (auto v = graph.find(succ)) {
                graph.add_edge(u, *v);
            }
        }
    }

    return graph;
}

} // namespace tally
