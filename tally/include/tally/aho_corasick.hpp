#ifndef TALLY_AHO_CORASICK_HPP
#define TALLY_AHO_CORASICK_HPP

#include <tally/types.hpp>
#include <tally/rule.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tally {

/**
 * Multi-pattern matcher over symbol strings.
 * Nodes live in an arena; node 0 is the root. Patterns are added first, then
 * build() computes failure links and merges outputs along them. Adding a
 * pattern after build() invalidates the automaton until build() runs again.
 */
class AhoCorasick {
public:
    struct Match {
        std::size_t end;            // Index of the last matched symbol
        std::size_t pattern_index;

        bool operator==(const Match& other) const {
            return end == other.end && pattern_index == other.pattern_index;
        }
    };

private:
    struct Node {
        std::map<Symbol, std::size_t> children;
        std::size_t fail = 0;
        std::vector<std::size_t> outputs;   // Own patterns first, then inherited
    };

    std::vector<Node> nodes_;
    std::vector<String> patterns_;
    bool built_ = false;

public:
    AhoCorasick() : nodes_(1) {}
    explicit AhoCorasick(const std::vector<String>& patterns);

    // Returns the pattern index; duplicates get their own index
    std::size_t add_pattern(const String& pattern);
    void build();

    bool is_built() const { return built_; }
    const std::vector<String>& patterns() const { return patterns_; }
    const String& pattern(std::size_t index) const { return patterns_.at(index); }

    /**
     * All matches in one left-to-right scan, overlapping and nested ones
     * included. Ordered by end position; at one end position, longer
     * patterns come before the suffixes inherited through failure links.
     */
    std::vector<Match> search(const String& text) const;

    // Start positions of every occurrence, grouped per pattern index
    std::vector<std::vector<std::size_t>> find_all_positions(const String& text) const;

    // True if any pattern occurs in the text
    bool matches_any(const String& text) const;
};

/**
 * Suffix/prefix overlap: the last `length` symbols of `first` equal the first
 * `length` symbols of `second`.
 */
struct Overlap {
    std::size_t first;
    std::size_t second;
    std::size_t length;
    String overlap;
};

/**
 * Interaction between two rules, found by matching all left-hand sides inside
 * right-hand sides. In an overlap pair at least one of the two right sides
 * contains some left-hand side; in a critical pair both do.
 */
struct RuleInteraction {
    std::size_t first;
    std::size_t second;
    bool is_critical;
};

class OverlapDetector {
public:
    /**
     * Longest proper-or-full overlap of a suffix of s1 with a prefix of s2,
     * length 1..min(|s1|, |s2|). nullopt when none exists.
     */
    static std::optional<std::size_t> find_suffix_prefix_overlap(const String& s1, const String& s2);

    /**
     * Maximal overlaps of length >= min_length between every ordered pair of
     * distinct patterns (by index).
     */
    static std::vector<Overlap> find_all_overlaps(const std::vector<String>& patterns,
                                                  std::size_t min_length = 1);

    /**
     * True iff no suffix/prefix overlap between the left-hand sides of two
     * distinct rules is longer than m. Monotone in m.
     */
    static bool check_m_locality(const std::vector<Rule>& rules, std::size_t m);

    // Longest overlap between distinct left-hand sides, 0 if none
    static std::size_t get_max_overlap(const std::vector<Rule>& rules);

    /**
     * Strings formed by gluing s1 and s2 along every overlap of length
     * 1..min(|s1|, |s2|) - 1, longest overlap first. Full containment is
     * excluded.
     */
    static std::vector<String> superpositions(const String& s1, const String& s2);

    /**
     * Overlap and critical pairs between rules (i < j), using one automaton
     * over all left-hand sides.
     */
    static std::vector<RuleInteraction> rule_interactions(const std::vector<Rule>& rules);
};

} // namespace tally

#endif // TALLY_AHO_CORASICK_HPP
