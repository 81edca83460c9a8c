#ifndef TALLY_RULE_HPP
#define TALLY_RULE_HPP

#include <tally/types.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace tally {

// Open metadata attached to rules and macros (provenance, frequency stats, ...)
using MetadataValue = std::variant<bool, std::int64_t, double, std::string>;
using Metadata = std::map<std::string, MetadataValue>;

std::string metadata_value_to_string(const MetadataValue& value);

/**
 * Rewriting rule: left -> right.
 * Identified by "left→right". Two rules are equal iff their (left, right) pair
 * matches; the metadata does not take part in identity.
 */
struct Rule {
    String left;
    String right;
    std::string id;
    Metadata metadata;

    Rule(const String& lhs, const String& rhs, Metadata meta = {});
    Rule(const String& lhs, const String& rhs, std::string rule_id, Metadata meta);

    static Rule from_str(std::string_view lhs, std::string_view rhs) {
        return Rule(String::from_str(lhs), String::from_str(rhs));
    }

    // Reversibility is opt-in through the "reversible" metadata flag
    bool is_reversible() const;

    // right -> left, tagged with the id of the rule it inverts
    Rule get_inverse() const;

    std::string to_string() const;

    bool operator==(const Rule& other) const {
        return left == other.left && right == other.right;
    }
    bool operator!=(const Rule& other) const { return !(*this == other); }
};

/**
 * Ordered rule collection with lookup by left-hand side and by id.
 */
class RuleSet {
private:
    std::vector<Rule> rules_;
    std::unordered_map<String, std::vector<std::size_t>, StringHash> rules_by_left_;
    std::unordered_map<std::string, std::size_t> rules_by_id_;

    void rebuild_indices();

public:
    RuleSet() = default;
    explicit RuleSet(const std::vector<Rule>& rules);

    void add_rule(const Rule& rule);

    // Returns false if the rule is not in the set
    bool remove_rule(const Rule& rule);

    const Rule* find(const std::string& id) const;
    std::vector<const Rule*> rules_with_left(const String& left) const;

    /**
     * All (rule index, position) pairs whose left-hand side occurs in the
     * string, overlapping occurrences included. Rule order, then position.
     */
    std::vector<std::pair<std::size_t, std::size_t>> find_applicable_rules(const String& string) const;

    const std::vector<Rule>& rules() const { return rules_; }
    const Rule& operator[](std::size_t index) const { return rules_[index]; }
    std::size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }
    std::vector<Rule>::const_iterator begin() const { return rules_.begin(); }
    std::vector<Rule>::const_iterator end() const { return rules_.end(); }
};

/**
 * Window of a string at one application position plus the rule applied there.
 * Used for overlap and critical-pair analysis only.
 */
struct Context {
    String string;
    std::size_t position = 0;
    std::optional<Rule> rule;
    std::optional<String> left_context;
    std::optional<String> right_context;

    /**
     * Build a context with up to `radius` symbols of surrounding text on each
     * side of the matched left-hand side.
     */
    static Context around(const String& string, std::size_t position,
                          const Rule& rule, std::size_t radius);

    // Substring covered by the rule's left-hand side, empty if out of range
    std::optional<String> extract_match() const;

    std::string to_string() const;
};

} // namespace tally

namespace std {
    template<>
    struct hash<tally::Rule> {
        std::size_t operator()(const tally::Rule& rule) const {
            std::size_t seed = rule.left.hash();
            seed ^= rule.right.hash() + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
            return seed;
        }
    };
}

#endif // TALLY_RULE_HPP
