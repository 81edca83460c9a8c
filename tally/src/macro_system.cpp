#include <tally/macro_system.hpp>
#include <tally/aho_corasick.hpp>
#include <tally/debug_log.hpp>
#include <tally/rewriting.hpp>
#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <unordered_map>

namespace tally {

std::string PatternCandidate::to_string() const {
    char buffer[128];
    snprintf(buffer, sizeof(buffer), " (freq=%zu, stab=%.2f, score=%.2f)", frequency, stability, score);
    return "'" + pattern.to_string() + "'" + buffer;
}

Macro::Macro(const Symbol& sym, const String& def, Metadata meta, bool is_verified)
    : symbol(sym)
    , definition(def)
    , introduction(def, String({sym}), Metadata{{"macro", sym.value()}, {"kind", std::string("introduction")}})
    , elimination(String({sym}), def, Metadata{{"macro", sym.value()}, {"kind", std::string("elimination")}})
    , verified(is_verified)
    , metadata(std::move(meta)) {}

Macro Macro::create(const Symbol& symbol, const String& definition, Metadata metadata, bool verified) {
    if (symbol.value().empty()) {
        throw std::invalid_argument("Macro symbol must not be empty");
    }
    if (definition.empty()) {
        throw std::invalid_argument("Macro " + symbol.value() + " has an empty definition");
    }
    if (definition.contains_symbol(symbol)) {
        throw std::invalid_argument("Macro " + symbol.value() + " refers to itself: " + definition.to_string());
    }
    return Macro(symbol, definition, std::move(metadata), verified);
}

std::string Macro::to_string() const {
    return symbol.value() + " := " + definition.to_string() + (verified ? " ✓" : " ?");
}

// === FREQUENCY ANALYSIS ===

std::vector<String> FrequencyAnalyzer::extract_substrings(const String& string,
                                                          std::size_t min_len, std::size_t max_len) {
    std::vector<String> substrings;
    for (std::size_t length = std::max<std::size_t>(min_len, 1); length <= max_len; ++length) {
        if (length > string.size()) break;
        for (std::size_t i = 0; i + length <= string.size(); ++i) {
            substrings.push_back(string.substr(i, length));
        }
    }
    return substrings;
}

std::vector<PatternCandidate> FrequencyAnalyzer::analyze_scc(const std::vector<String>& members,
                                                             std::size_t min_len, std::size_t max_len) {
    std::vector<PatternCandidate> candidates;
    if (members.empty()) {
        return candidates;
    }

    // Counts in first-seen order
    std::unordered_map<String, std::size_t, StringHash> slot;
    std::vector<std::pair<String, std::size_t>> counts;
    for (const auto& member : members) {
        for (auto& substring : extract_substrings(member, min_len, max_len)) {
            auto [it, inserted] = slot.emplace(substring, counts.size());
            if (inserted) {
                counts.emplace_back(std::move(substring), 1);
            } else {
                counts[it->second].second++;
            }
        }
    }

    for (const auto& [pattern, frequency] : counts) {
        if (frequency < 2) continue;

        std::size_t containing = static_cast<std::size_t>(std::count_if(members.begin(), members.end(),
            [&pattern = pattern](const String& member) { return member.contains(pattern); }));

        PatternCandidate candidate;
        candidate.pattern = pattern;
        candidate.frequency = frequency;
        candidate.stability = static_cast<double>(containing) / static_cast<double>(members.size());
        candidate.score = static_cast<double>(frequency) * candidate.stability
                        * (1.0 + 0.1 * static_cast<double>(pattern.size()));
        candidates.push_back(std::move(candidate));
    }

    std::stable_sort(candidates.begin(), candidates.end(),
        [](const PatternCandidate& a, const PatternCandidate& b) { return a.score > b.score; });

    TALLY_DEBUG_LOG("analyze_scc: %zu members, %zu distinct substrings, %zu candidates",
                    members.size(), counts.size(), candidates.size());
    return candidates;
}

std::vector<PatternCandidate> FrequencyAnalyzer::analyze_scc(const ConfigurationGraph& graph,
                                                             const StronglyConnectedComponent& component,
                                                             std::size_t min_len, std::size_t max_len) {
    std::vector<String> members;
    members.reserve(component.size());
    for (VertexId v : component.vertices) {
        members.push_back(graph.vertex(v));
    }
    return analyze_scc(members, min_len, max_len);
}

// === LOCAL CONFLUENCE ===

LocalConfluenceChecker::LocalConfluenceChecker(std::size_t search_depth, std::size_t search_width,
                                               std::size_t max_critical_strings)
    : search_depth_(search_depth)
    , search_width_(search_width)
    , max_critical_strings_(max_critical_strings) {}

std::vector<String> LocalConfluenceChecker::critical_strings(const std::vector<Rule>& rules) {
    std::vector<String> result;
    StringSet seen;
    auto push = [&](String s) {
        if (seen.insert(s).second) {
            result.push_back(std::move(s));
        }
    };

    for (const auto& first : rules) {
        for (const auto& second : rules) {
            push(first.left.concat(second.left));
        }
    }
    for (const auto& rule : rules) {
        push(rule.left);
    }
    for (const auto& first : rules) {
        for (const auto& second : rules) {
            for (auto& glued : OverlapDetector::superpositions(first.left, second.left)) {
                push(std::move(glued));
            }
        }
    }

    return result;
}

ConfluenceResult LocalConfluenceChecker::analyze(const std::vector<Rule>& original_rules, const Macro& macro) const {
    std::vector<Rule> combined = original_rules;
    for (const auto& rule : macro.rules()) {
        combined.push_back(rule);
    }
    RewritingEngine engine(combined);

    ConfluenceResult result;
    std::vector<String> candidates = critical_strings(combined);
    if (candidates.size() > max_critical_strings_) {
        candidates.resize(max_critical_strings_);
    }

    for (const auto& candidate : candidates) {
        result.strings_tested++;

        auto applications = engine.all_applications(candidate);
        if (applications.size() < 2) continue;

        const String& first = applications[0].result;
        const String& second = applications[1].result;
        if (first == second) continue;

        result.divergent_pairs++;
        StringSet reach_first = flatten_levels(engine.bounded_reach(first, search_depth_, search_width_));
        bool joinable = false;
        for (const auto& [level, strings] : engine.bounded_reach(second, search_depth_, search_width_)) {
            for (const auto& s : strings) {
                if (reach_first.count(s)) {
                    joinable = true;
                    break;
                }
            }
            if (joinable) break;
        }

        if (!joinable) {
            result.confluent = false;
            result.counterexample = candidate;
            result.divergence = std::make_pair(first, second);
            TALLY_LOG(Debug, "Confluence fails for %s on %s: %s and %s do not join within depth %zu",
                      macro.symbol.value().c_str(), candidate.to_string().c_str(),
                      first.to_string().c_str(), second.to_string().c_str(), search_depth_);
            return result;
        }
    }

    return result;
}

// === BOUNDED BISIMULATION ===

BoundedBisimulation::BoundedBisimulation(std::size_t max_length, std::size_t max_depth,
                                         std::size_t width, std::size_t max_test_strings)
    : max_length_(max_length)
    , max_depth_(max_depth)
    , width_(width)
    , max_test_strings_(max_test_strings) {}

std::vector<String> BoundedBisimulation::generate_test_strings(std::size_t max_length) {
    std::vector<String> strings;
    std::size_t limit = std::min<std::size_t>(max_length, 5);

    for (std::size_t length = 1; length <= limit; ++length) {
        strings.push_back(String::from_str(std::string(length, '0')));
        if (length >= 2) {
            // Whole "0|" pairs only, so odd lengths repeat the previous pattern
            std::string alternating;
            for (std::size_t i = 0; i < length / 2; ++i) {
                alternating += "0|";
            }
            strings.push_back(String::from_str(alternating));
        }
    }

    return strings;
}

BisimulationResult BoundedBisimulation::analyze(const std::vector<Rule>& original_rules, const Macro& macro) const {
    std::vector<Rule> extended = original_rules;
    for (const auto& rule : macro.rules()) {
        extended.push_back(rule);
    }
    RewritingEngine engine_old(original_rules);
    RewritingEngine engine_new(extended);

    auto final_level = [this](const ReachLevels& levels) {
        StringSet result;
        auto it = levels.find(max_depth_);
        if (it != levels.end()) {
            result.insert(it->second.begin(), it->second.end());
        }
        return result;
    };

    BisimulationResult result;
    std::vector<String> tests = generate_test_strings(max_length_);
    if (tests.size() > max_test_strings_) {
        tests.resize(max_test_strings_);
    }

    for (const auto& test : tests) {
        result.strings_tested++;

        StringSet final_old = final_level(engine_old.bounded_reach(test, max_depth_, width_));
        StringSet final_new = final_level(engine_new.bounded_reach(test, max_depth_, width_));

        std::size_t difference = 0;
        for (const auto& s : final_old) {
            if (!final_new.count(s)) ++difference;
        }
        for (const auto& s : final_new) {
            if (!final_old.count(s)) ++difference;
        }

        result.old_final_size = final_old.size();
        result.new_final_size = final_new.size();
        result.symmetric_difference = difference;

        if (static_cast<double>(difference) > static_cast<double>(final_old.size()) * 0.5) {
            result.equivalent = false;
            result.counterexample = test;
            TALLY_LOG(Debug, "Bisimulation fails for %s on %s: |old|=%zu |new|=%zu |diff|=%zu",
                      macro.symbol.value().c_str(), test.to_string().c_str(),
                      final_old.size(), final_new.size(), difference);
            return result;
        }
    }

    return result;
}

} // namespace tally
