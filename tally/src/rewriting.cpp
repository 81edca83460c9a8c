#include <tally/rewriting.hpp>
#include <tally/debug_log.hpp>
#include <algorithm>
#include <deque>
#include <sstream>
#include <unordered_map>

namespace tally {

StringSet flatten_levels(const ReachLevels& levels) {
    StringSet all;
    for (const auto& [level, strings] : levels) {
        all.insert(strings.begin(), strings.end());
    }
    return all;
}

std::vector<std::size_t> RewritingEngine::find_positions(const String& string, const String& pattern) {
    std::vector<std::size_t> positions;
    if (pattern.size() > string.size()) {
        return positions;
    }

    for (std::size_t i = 0; i + pattern.size() <= string.size(); ++i) {
        if (string.matches_at(pattern, i)) {
            positions.push_back(i);
        }
    }

    return positions;
}

String RewritingEngine::apply_rule(const String& string, const Rule& rule, std::size_t position) {
    const auto& source = string.symbols();
    const auto& right = rule.right.symbols();

    std::vector<Symbol> symbols;
    symbols.reserve(source.size() - rule.left.size() + right.size());
    symbols.insert(symbols.end(), source.begin(), source.begin() + position);
    symbols.insert(symbols.end(), right.begin(), right.end());
    symbols.insert(symbols.end(), source.begin() + position + rule.left.size(), source.end());

    return String(std::move(symbols));
}

std::vector<Application> RewritingEngine::all_applications(const String& string) const {
    std::vector<Application> results;

    for (std::size_t r = 0; r < rules_.size(); ++r) {
        for (std::size_t pos : find_positions(string, rules_[r].left)) {
            results.push_back(Application{apply_rule(string, rules_[r], pos), r, pos});
        }
    }

    return results;
}

std::vector<String> RewritingEngine::successors(const String& string) const {
    std::vector<String> result;
    StringSet seen;
    for (auto& application : all_applications(string)) {
        if (seen.insert(application.result).second) {
            result.push_back(std::move(application.result));
        }
    }
    return result;
}

bool RewritingEngine::is_normal_form(const String& string) const {
    for (const auto& rule : rules_) {
        if (!find_positions(string, rule.left).empty()) {
            return false;
        }
    }
    return true;
}

ReachLevels RewritingEngine::bounded_reach(const String& start, std::size_t depth,
                                           std::optional<std::size_t> width) const {
    ReachLevels levels;
    levels[0].push_back(start);

    StringSet visited{start};
    std::deque<std::pair<String, std::size_t>> queue;
    queue.emplace_back(start, 0);

    while (!queue.empty()) {
        auto [current, level] = std::move(queue.front());
        queue.pop_front();

        if (level >= depth) {
            continue;
        }

        auto applications = all_applications(current);
        if (width && applications.size() > *width) {
            applications.resize(*width);
        }

        for (auto& application : applications) {
            if (visited.insert(application.result).second) {
                levels[level + 1].push_back(application.result);
                queue.emplace_back(std::move(application.result), level + 1);
            }
        }
    }

    TALLY_DEBUG_LOG("bounded_reach from %s: %zu levels, %zu strings",
                    start.to_string().c_str(), levels.size(), visited.size());
    return levels;
}

std::optional<std::vector<String>> RewritingEngine::reachable(const String& start, const String& target,
                                                              std::size_t depth,
                                                              std::optional<std::size_t> width) const {
    if (start == target) {
        return std::vector<String>{start};
    }

    // Parent links instead of per-node path copies
    std::unordered_map<String, String, StringHash> parent;
    StringSet visited{start};
    std::deque<std::pair<String, std::size_t>> queue;
    queue.emplace_back(start, 0);

    auto rebuild_path = [&](const String& last) {
        std::vector<String> path{last};
        String cursor = last;
        while (cursor != start) {
            cursor = parent.at(cursor);
            path.push_back(cursor);
        }
        std::reverse(path.begin(), path.end());
        return path;
    };

    while (!queue.empty()) {
        auto [current, level] = std::move(queue.front());
        queue.pop_front();

        if (level >= depth) {
            continue;
        }

        auto applications = all_applications(current);
        if (width && applications.size() > *width) {
            applications.resize(*width);
        }

        for (auto& application : applications) {
            if (application.result == target) {
                parent.emplace(application.result, current);
                return rebuild_path(application.result);
            }
            if (visited.insert(application.result).second) {
                parent.emplace(application.result, current);
                queue.emplace_back(std::move(application.result), level + 1);
            }
        }
    }

    return std::nullopt;
}

OmegaLimit RewritingEngine::omega_limit(const String& start, std::size_t max_steps) const {
    std::vector<String> visited;
    std::unordered_map<String, std::size_t, StringHash> first_seen;
    String current = start;

    for (std::size_t step = 0; step < max_steps; ++step) {
        first_seen.emplace(current, visited.size());
        visited.push_back(current);

        auto applications = all_applications(current);
        if (applications.empty()) {
            return OmegaLimit{{current}, OmegaKind::NormalForm};
        }

        current = std::move(applications.front().result);

        auto it = first_seen.find(current);
        if (it != first_seen.end()) {
            return OmegaLimit{std::vector<String>(visited.begin() + it->second, visited.end()),
                              OmegaKind::Cycle};
        }
    }

    TALLY_LOG(Debug, "omega_limit: no cycle within %zu steps from %s, returning trailing window",
              max_steps, start.to_string().c_str());

    std::size_t window = std::min(OMEGA_WINDOW, visited.size());
    return OmegaLimit{std::vector<String>(visited.end() - window, visited.end()),
                      OmegaKind::Approximation};
}

std::vector<String> RewritingEngine::normal_forms(const String& start, std::size_t depth,
                                                  std::optional<std::size_t> width) const {
    std::vector<String> result;
    for (const auto& [level, strings] : bounded_reach(start, depth, width)) {
        for (const auto& s : strings) {
            if (is_normal_form(s)) {
                result.push_back(s);
            }
        }
    }
    return result;
}

namespace debug {

std::string application_to_string(const RewritingEngine& engine, const Application& application) {
    std::ostringstream oss;
    oss << engine.rule(application.rule_index).to_string()
        << " @" << application.position
        << " => " << application.result.to_string();
    return oss.str();
}

std::string levels_to_string(const ReachLevels& levels) {
    std::ostringstream oss;
    for (const auto& [level, strings] : levels) {
        oss << level << ":";
        for (const auto& s : strings) {
            oss << " " << s.to_string();
        }
        oss << "\n";
    }
    return oss.str();
}

} // namespace debug

} // namespace tally
