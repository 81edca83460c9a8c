#ifndef TALLY_REWRITING_HPP
#define TALLY_REWRITING_HPP

#include <tally/types.hpp>
#include <tally/rule.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tally {

/**
 * One step of the nondeterministic relation: `result` is obtained by applying
 * rule `rule_index` at `position`.
 */
struct Application {
    String result;
    std::size_t rule_index;
    std::size_t position;
};

/**
 * Newly reached strings per BFS level, in discovery order.
 * A level with no new strings is absent.
 */
using ReachLevels = std::map<std::size_t, std::vector<String>>;

// Union of all levels
StringSet flatten_levels(const ReachLevels& levels);

enum class OmegaKind {
    Cycle,          // A revisited string was found; states is the cycle
    NormalForm,     // Trajectory stopped at a string with no applicable rule
    Approximation   // Step budget exhausted; states is the trailing window
};

/**
 * Limit set of the deterministic first-application trajectory.
 * Only `Cycle` and `NormalForm` are exact.
 */
struct OmegaLimit {
    std::vector<String> states;
    OmegaKind kind;

    bool is_exact() const { return kind != OmegaKind::Approximation; }
};

/**
 * Nondeterministic string rewriting engine.
 *
 * Every (rule, position) pair whose left-hand side matches contributes one
 * successor. Successor order is rule order, then position order, and is
 * reproducible; several analyses deliberately sample the first applications.
 * Rules with an empty left-hand side are the caller's responsibility.
 */
class RewritingEngine {
private:
    std::vector<Rule> rules_;

public:
    static constexpr std::size_t OMEGA_WINDOW = 100;

    RewritingEngine() = default;
    explicit RewritingEngine(std::vector<Rule> rules) : rules_(std::move(rules)) {}

    const std::vector<Rule>& rules() const { return rules_; }
    const Rule& rule(std::size_t index) const { return rules_.at(index); }

    /**
     * All start indices of `pattern` in `string`, overlapping occurrences included.
     */
    static std::vector<std::size_t> find_positions(const String& string, const String& pattern);

    /**
     * Splice `rule.right` in place of the left-hand side at `position`.
     * Result length is |string| - |left| + |right|.
     */
    static String apply_rule(const String& string, const Rule& rule, std::size_t position);

    /**
     * Full one-step image. Empty means `string` is a normal form.
     */
    std::vector<Application> all_applications(const String& string) const;

    // Distinct successor strings in application order
    std::vector<String> successors(const String& string) const;

    bool is_normal_form(const String& string) const;

    /**
     * Breadth-first exploration up to `depth` levels.
     *
     * When a string has more than `width` applications only the first `width`
     * are expanded. This is a sampling bound: with a width set, the result is
     * not guaranteed to contain every string reachable within `depth` steps.
     * Visited strings are never re-added, so cycles end the exploration.
     */
    ReachLevels bounded_reach(const String& start, std::size_t depth,
                              std::optional<std::size_t> width = std::nullopt) const;

    /**
     * Same search as bounded_reach, returning the first discovered path from
     * `start` to `target` (both inclusive), or nullopt when exhausted.
     */
    std::optional<std::vector<String>> reachable(const String& start, const String& target,
                                                 std::size_t depth,
                                                 std::optional<std::size_t> width = std::nullopt) const;

    /**
     * Follow the first application at every step until a string repeats,
     * no rule applies, or `max_steps` is reached.
     */
    OmegaLimit omega_limit(const String& start, std::size_t max_steps = 1000) const;

    /**
     * Reached strings (within the bounded exploration) with no applicable rule.
     */
    std::vector<String> normal_forms(const String& start, std::size_t depth,
                                     std::optional<std::size_t> width = std::nullopt) const;
};

namespace debug {
    std::string application_to_string(const RewritingEngine& engine, const Application& application);
    std::string levels_to_string(const ReachLevels& levels);
}

} // namespace tally

#endif // TALLY_REWRITING_HPP
