#include <tally/rule.hpp>
#include <algorithm>
#include <sstream>

namespace tally {

std::string metadata_value_to_string(const MetadataValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        }
    }, value);
}

Rule::Rule(const String& lhs, const String& rhs, Metadata meta)
    : left(lhs), right(rhs)
    , id(lhs.to_string() + "→" + rhs.to_string())
    , metadata(std::move(meta)) {}

Rule::Rule(const String& lhs, const String& rhs, std::string rule_id, Metadata meta)
    : left(lhs), right(rhs), id(std::move(rule_id)), metadata(std::move(meta)) {}

bool Rule::is_reversible() const {
    auto it = metadata.find("reversible");
    if (it == metadata.end()) {
        return false;
    }
    const bool* flag = std::get_if<bool>(&it->second);
    return flag && *flag;
}

Rule Rule::get_inverse() const {
    Metadata meta = metadata;
    meta["inverse_of"] = id;
    return Rule(right, left, "inv_" + id, std::move(meta));
}

std::string Rule::to_string() const {
    return left.to_string() + " → " + right.to_string();
}

RuleSet::RuleSet(const std::vector<Rule>& rules) {
    for (const auto& rule : rules) {
        add_rule(rule);
    }
}

void RuleSet::add_rule(const Rule& rule) {
    rules_by_left_[rule.left].push_back(rules_.size());
    rules_by_id_[rule.id] = rules_.size();
    rules_.push_back(rule);
}

bool RuleSet::remove_rule(const Rule& rule) {
    auto it = std::find(rules_.begin(), rules_.end(), rule);
    if (it == rules_.end()) {
        return false;
    }
    rules_.erase(it);
    rebuild_indices();
    return true;
}

void RuleSet::rebuild_indices() {
    rules_by_left_.clear();
    rules_by_id_.clear();
    for (std::size_t i = 0; i < rules_.size(); ++i) {
        rules_by_left_[rules_[i].left].push_back(i);
        rules_by_id_[rules_[i].id] = i;
    }
}

const Rule* RuleSet::find(const std::string& id) const {
    auto it = rules_by_id_.find(id);
    return it != rules_by_id_.end() ? &rules_[it->second] : nullptr;
}

std::vector<const Rule*> RuleSet::rules_with_left(const String& left) const {
    std::vector<const Rule*> result;
    auto it = rules_by_left_.find(left);
    if (it != rules_by_left_.end()) {
        for (std::size_t index : it->second) {
            result.push_back(&rules_[index]);
        }
    }
    return result;
}

std::vector<std::pair<std::size_t, std::size_t>> RuleSet::find_applicable_rules(const String& string) const {
    std::vector<std::pair<std::size_t, std::size_t>> applicable;

    for (std::size_t r = 0; r < rules_.size(); ++r) {
        const String& left = rules_[r].left;
        if (left.size() > string.size()) {
            continue;
        }
        for (std::size_t pos = 0; pos + left.size() <= string.size(); ++pos) {
            if (string.matches_at(left, pos)) {
                applicable.emplace_back(r, pos);
            }
        }
    }

    return applicable;
}

Context Context::around(const String& string, std::size_t position,
                        const Rule& rule, std::size_t radius) {
    Context context;
    context.string = string;
    context.position = position;
    context.rule = rule;

    std::size_t left_start = position > radius ? position - radius : 0;
    context.left_context = string.substr(left_start, position - left_start);

    std::size_t match_end = std::min(string.size(), position + rule.left.size());
    context.right_context = string.substr(match_end, radius);

    return context;
}

std::optional<String> Context::extract_match() const {
    if (!rule) {
        return std::nullopt;
    }
    if (position + rule->left.size() > string.size()) {
        return std::nullopt;
    }
    return string.substr(position, rule->left.size());
}

std::string Context::to_string() const {
    return "Context[" + std::to_string(position) + "](" + string.to_string() + ")";
}

} // namespace tally
