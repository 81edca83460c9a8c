#include <tally/aho_corasick.hpp>
#include <tally/debug_log.hpp>
#include <algorithm>
#include <deque>
#include <stdexcept>

namespace tally {

AhoCorasick::AhoCorasick(const std::vector<String>& patterns) : nodes_(1) {
    for (const auto& pattern : patterns) {
        add_pattern(pattern);
    }
    build();
}

std::size_t AhoCorasick::add_pattern(const String& pattern) {
    if (pattern.empty()) {
        throw std::invalid_argument("AhoCorasick: empty pattern");
    }

    std::size_t node = 0;
    for (const auto& symbol : pattern.symbols()) {
        auto it = nodes_[node].children.find(symbol);
        if (it == nodes_[node].children.end()) {
            std::size_t child = nodes_.size();
            nodes_[node].children.emplace(symbol, child);
            nodes_.emplace_back();
            node = child;
        } else {
            node = it->second;
        }
    }

    std::size_t index = patterns_.size();
    patterns_.push_back(pattern);
    nodes_[node].outputs.push_back(index);
    built_ = false;
    return index;
}

void AhoCorasick::build() {
    // Outputs inherited in a previous build are recomputed from scratch
    for (auto& node : nodes_) {
        node.outputs.clear();
        node.fail = 0;
    }
    for (std::size_t i = 0; i < patterns_.size(); ++i) {
        std::size_t node = 0;
        for (const auto& symbol : patterns_[i].symbols()) {
            node = nodes_[node].children.at(symbol);
        }
        nodes_[node].outputs.push_back(i);
    }

    std::deque<std::size_t> queue;
    for (const auto& [symbol, child] : nodes_[0].children) {
        nodes_[child].fail = 0;
        queue.push_back(child);
    }

    while (!queue.empty()) {
        std::size_t current = queue.front();
        queue.pop_front();

        for (const auto& [symbol, child] : nodes_[current].children) {
            queue.push_back(child);

            std::size_t fallback = nodes_[current].fail;
            while (fallback != 0 && !nodes_[fallback].children.count(symbol)) {
                fallback = nodes_[fallback].fail;
            }
            auto it = nodes_[fallback].children.find(symbol);
            nodes_[child].fail = (it != nodes_[fallback].children.end() && it->second != child) ? it->second : 0;

            // BFS order guarantees the failure target is already complete
            const auto& inherited = nodes_[nodes_[child].fail].outputs;
            nodes_[child].outputs.insert(nodes_[child].outputs.end(), inherited.begin(), inherited.end());
        }
    }

    built_ = true;
    TALLY_DEBUG_LOG("AhoCorasick: %zu patterns, %zu nodes", patterns_.size(), nodes_.size());
}

std::vector<AhoCorasick::Match> AhoCorasick::search(const String& text) const {
    if (!built_) {
        throw std::logic_error("AhoCorasick::search called before build()");
    }

    std::vector<Match> matches;
    std::size_t node = 0;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const Symbol& symbol = text[i];
        while (node != 0 && !nodes_[node].children.count(symbol)) {
            node = nodes_[node].fail;
        }
        auto it = nodes_[node].children.find(symbol);
        node = it != nodes_[node].children.end() ? it->second : 0;

        for (std::size_t pattern_index : nodes_[node].outputs) {
            matches.push_back({i, pattern_index});
        }
    }

    return matches;
}

std::vector<std::vector<std::size_t>> AhoCorasick::find_all_positions(const String& text) const {
    std::vector<std::vector<std::size_t>> positions(patterns_.size());
    for (const auto& match : search(text)) {
        positions[match.pattern_index].push_back(match.end + 1 - patterns_[match.pattern_index].size());
    }
    return positions;
}

bool AhoCorasick::matches_any(const String& text) const {
    return !search(text).empty();
}

std::optional<std::size_t> OverlapDetector::find_suffix_prefix_overlap(const String& s1, const String& s2) {
    std::size_t max_length = std::min(s1.size(), s2.size());
    for (std::size_t length = max_length; length >= 1; --length) {
        if (s1.matches_at(s2.substr(0, length), s1.size() - length)) {
            return length;
        }
    }
    return std::nullopt;
}

std::vector<Overlap> OverlapDetector::find_all_overlaps(const std::vector<String>& patterns,
                                                        std::size_t min_length) {
    std::vector<Overlap> overlaps;
    for (std::size_t i = 0; i < patterns.size(); ++i) {
        for (std::size_t j = 0; j < patterns.size(); ++j) {
            if (i == j) continue;
            auto length = find_suffix_prefix_overlap(patterns[i], patterns[j]);
            if (length && *length >= min_length) {
                overlaps.push_back({i, j, *length, patterns[j].substr(0, *length)});
            }
        }
    }
    return overlaps;
}

std::size_t OverlapDetector::get_max_overlap(const std::vector<Rule>& rules) {
    std::vector<String> lefts;
    lefts.reserve(rules.size());
    for (const auto& rule : rules) {
        lefts.push_back(rule.left);
    }

    std::size_t max_overlap = 0;
    for (const auto& overlap : find_all_overlaps(lefts)) {
        max_overlap = std::max(max_overlap, overlap.length);
    }
    return max_overlap;
}

bool OverlapDetector::check_m_locality(const std::vector<Rule>& rules, std::size_t m) {
    return get_max_overlap(rules) <= m;
}

std::vector<String> OverlapDetector::superpositions(const String& s1, const String& s2) {
    std::vector<String> result;
    std::size_t max_length = std::min(s1.size(), s2.size());
    if (max_length < 2) {
        return result;
    }

    for (std::size_t length = max_length - 1; length >= 1; --length) {
        if (s1.matches_at(s2.substr(0, length), s1.size() - length)) {
            result.push_back(s1.concat(s2.substr(length, s2.size() - length)));
        }
    }
    return result;
}

std::vector<RuleInteraction> OverlapDetector::rule_interactions(const std::vector<Rule>& rules) {
    AhoCorasick automaton;
    for (const auto& rule : rules) {
        if (!rule.left.empty()) {
            automaton.add_pattern(rule.left);
        }
    }
    automaton.build();

    std::vector<bool> right_matches(rules.size());
    for (std::size_t i = 0; i < rules.size(); ++i) {
        right_matches[i] = automaton.matches_any(rules[i].right);
    }

    std::vector<RuleInteraction> interactions;
    for (std::size_t i = 0; i < rules.size(); ++i) {
        for (std::size_t j = i + 1; j < rules.size(); ++j) {
            if (right_matches[i] || right_matches[j]) {
                interactions.push_back({i, j, right_matches[i] && right_matches[j]});
            }
        }
    }
    return interactions;
}

} // namespace tally
