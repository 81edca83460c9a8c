#ifndef TALLY_MACRO_SYSTEM_HPP
#define TALLY_MACRO_SYSTEM_HPP

#include <tally/types.hpp>
#include <tally/rule.hpp>
#include <tally/configuration_graph.hpp>
#include <tally/scc.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tally {

/**
 * Frequent substring of an SCC, ranked for lifting.
 */
struct PatternCandidate {
    String pattern;
    std::size_t frequency = 0;
    double stability = 0.0;     // Fraction of SCC members containing the pattern
    double score = 0.0;

    std::string to_string() const;
};

/**
 * Synthesized symbol standing for a definition string.
 * Carries the introduction rule (definition -> symbol) and the elimination
 * rule (symbol -> definition).
 */
class Macro {
public:
    Symbol symbol;
    String definition;
    Rule introduction;
    Rule elimination;
    bool verified = false;
    Metadata metadata;

    /**
     * Throws std::invalid_argument if the definition is empty or contains
     * the macro's own symbol.
     */
    static Macro create(const Symbol& symbol, const String& definition,
                        Metadata metadata = {}, bool verified = false);

    // Elimination first; confluence sampling depends on this order
    std::vector<Rule> rules() const { return {elimination, introduction}; }

    // "A := 00| ✓" (or "?" when unverified)
    std::string to_string() const;

private:
    Macro(const Symbol& sym, const String& def, Metadata meta, bool is_verified);
};

class FrequencyAnalyzer {
public:
    /**
     * Every contiguous substring with length in [min_len, max_len], grouped
     * by length, then by start position.
     */
    static std::vector<String> extract_substrings(const String& string,
                                                  std::size_t min_len = 2, std::size_t max_len = 5);

    /**
     * Count substrings across all members, keep those seen at least twice and
     * rank by frequency * stability * (1 + 0.1 * length), highest first.
     * Equal scores keep first-seen order.
     */
    static std::vector<PatternCandidate> analyze_scc(const std::vector<String>& members,
                                                     std::size_t min_len = 2, std::size_t max_len = 4);

    static std::vector<PatternCandidate> analyze_scc(const ConfigurationGraph& graph,
                                                     const StronglyConnectedComponent& component,
                                                     std::size_t min_len = 2, std::size_t max_len = 4);
};

struct ConfluenceResult {
    bool confluent = true;
    std::size_t strings_tested = 0;
    std::size_t divergent_pairs = 0;      // Pairs that needed a joinability search
    std::optional<String> counterexample;
    std::optional<std::pair<String, String>> divergence;
};

/**
 * Local confluence of the rule set extended by a macro, sampled on
 * syntactic critical strings. A single unjoinable divergence fails the check.
 */
class LocalConfluenceChecker {
private:
    std::size_t search_depth_;
    std::size_t search_width_;
    std::size_t max_critical_strings_;

public:
    explicit LocalConfluenceChecker(std::size_t search_depth = 5, std::size_t search_width = 50,
                                    std::size_t max_critical_strings = 20);

    /**
     * Concatenations of every ordered pair of left-hand sides, then the
     * left-hand sides, then superpositions of overlapping left-hand sides.
     * Duplicates are dropped, keeping the first occurrence.
     */
    static std::vector<String> critical_strings(const std::vector<Rule>& rules);

    ConfluenceResult analyze(const std::vector<Rule>& original_rules, const Macro& macro) const;

    bool check(const std::vector<Rule>& original_rules, const Macro& macro) const {
        return analyze(original_rules, macro).confluent;
    }
};

struct BisimulationResult {
    bool equivalent = true;
    std::size_t strings_tested = 0;
    std::optional<String> counterexample;
    std::size_t old_final_size = 0;
    std::size_t new_final_size = 0;
    std::size_t symmetric_difference = 0;
};

/**
 * Compares the last BFS level (exactly max_depth) of the old and the
 * macro-extended system on short test strings. Fails when the symmetric
 * difference exceeds half the old level. A sampling heuristic, not a proof.
 */
class BoundedBisimulation {
private:
    std::size_t max_length_;
    std::size_t max_depth_;
    std::size_t width_;
    std::size_t max_test_strings_;

public:
    BoundedBisimulation(std::size_t max_length, std::size_t max_depth,
                        std::size_t width = 30, std::size_t max_test_strings = 10);

    /**
     * For each length 1..min(max_length, 5): the run of 0s, and from length 2
     * on the alternating 0|0|... prefix of that length.
     */
    static std::vector<String> generate_test_strings(std::size_t max_length);

    BisimulationResult analyze(const std::vector<Rule>& original_rules, const Macro& macro) const;

    bool check(const std::vector<Rule>& original_rules, const Macro& macro) const {
        return analyze(original_rules, macro).equivalent;
    }
};

} // namespace tally

#endif // TALLY_MACRO_SYSTEM_HPP
